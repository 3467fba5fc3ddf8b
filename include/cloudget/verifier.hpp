#ifndef CLOUDGET_VERIFIER_HPP
#define CLOUDGET_VERIFIER_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <tl/expected.hpp>

#include <cloudget/export.hpp>
#include <cloudget/enums.hpp>
#include <cloudget/errors.hpp>

namespace cloudget
{
    namespace fs = std::filesystem;

    enum class ExistingArtifact
    {
        // nothing at the output path
        kMISSING,
        // the file can be returned as is
        kREUSABLE,
        // the file has to be downloaded again
        kSTALE,
    };

    /** Decides whether a file already present at `path` is the download.
     * A known `expected_size` (non zero) must match. With a checksum the
     * content decides; without one a file of the right size is trusted, and a
     * file of unknown expected size is not.
     */
    CLOUDGET_API ExistingArtifact check_existing_artifact(const fs::path& path,
                                                          std::uint64_t expected_size,
                                                          const std::optional<Checksum>& checksum);

    /** Checks the size (if `expected_size` is non zero) and the checksum (if
     * given) of `path`. On mismatch the file is deleted and `CG_SIZE_MISMATCH`
     * or `CG_HASH_MISMATCH` is returned. Returns the computed digest, if any.
     */
    CLOUDGET_API tl::expected<std::optional<std::string>, DownloaderError> verify_artifact(
        const fs::path& path, std::uint64_t expected_size, const std::optional<Checksum>& checksum);
}

#endif
