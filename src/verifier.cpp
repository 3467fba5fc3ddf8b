#include <spdlog/spdlog.h>

#include <cloudget/utils.hpp>
#include <cloudget/verifier.hpp>

namespace cloudget
{
    namespace
    {
        void remove_artifact(const fs::path& path)
        {
            std::error_code ec;
            spdlog::info("Removing file {}", path.string());
            fs::remove(path, ec);
            if (ec)
            {
                spdlog::error("Could not remove {}: {}", path.string(), ec.message());
            }
        }

        tl::expected<std::string, DownloaderError> compute(const fs::path& path,
                                                           ChecksumType type)
        {
            try
            {
                return checksum(path, type);
            }
            catch (const std::runtime_error& e)
            {
                return tl::unexpected(
                    DownloaderError{ ErrorLevel::FATAL, ErrorCode::CG_FILE, e.what() });
            }
        }
    }

    ExistingArtifact check_existing_artifact(const fs::path& path,
                                             std::uint64_t expected_size,
                                             const std::optional<Checksum>& expected)
    {
        std::error_code ec;
        if (!fs::is_regular_file(path, ec))
        {
            return ExistingArtifact::kMISSING;
        }

        const auto size = fs::file_size(path, ec);
        if (ec)
        {
            return ExistingArtifact::kSTALE;
        }
        if (expected_size > 0 && size != expected_size)
        {
            spdlog::info("Existing file {} has size {} instead of {}, downloading again",
                         path.string(),
                         size,
                         expected_size);
            return ExistingArtifact::kSTALE;
        }

        if (expected)
        {
            auto digest = compute(path, expected->type);
            if (digest && checksum_equal(digest.value(), expected->checksum))
            {
                spdlog::info("Found already downloaded file {}", path.string());
                return ExistingArtifact::kREUSABLE;
            }
            spdlog::info("Existing file {} does not match the expected {}, downloading again",
                         path.string(),
                         checksum_name(expected->type));
            return ExistingArtifact::kSTALE;
        }

        if (expected_size > 0)
        {
            spdlog::info("Found already downloaded file {} (size matches)", path.string());
            return ExistingArtifact::kREUSABLE;
        }
        return ExistingArtifact::kSTALE;
    }

    tl::expected<std::optional<std::string>, DownloaderError> verify_artifact(
        const fs::path& path, std::uint64_t expected_size, const std::optional<Checksum>& expected)
    {
        std::error_code ec;
        const auto size = fs::file_size(path, ec);
        if (ec)
        {
            return tl::unexpected(DownloaderError{
                ErrorLevel::FATAL,
                ErrorCode::CG_FILE,
                fmt::format("Could not stat {}: {}", path.string(), ec.message()) });
        }

        if (expected_size > 0 && size != expected_size)
        {
            remove_artifact(path);
            return tl::unexpected(DownloaderError{
                ErrorLevel::FATAL,
                ErrorCode::CG_SIZE_MISMATCH,
                fmt::format("Filesize of {} ({}) does not match expected filesize ({})",
                            path.string(),
                            size,
                            expected_size) });
        }

        if (!expected)
        {
            return std::optional<std::string>();
        }

        auto digest = compute(path, expected->type);
        if (!digest)
        {
            return tl::unexpected(digest.error());
        }

        if (!checksum_equal(digest.value(), expected->checksum))
        {
            remove_artifact(path);
            return tl::unexpected(DownloaderError{
                ErrorLevel::FATAL,
                ErrorCode::CG_HASH_MISMATCH,
                fmt::format("{} of {} is {}, expected {}",
                            checksum_name(expected->type),
                            path.string(),
                            digest.value(),
                            expected->checksum) });
        }

        spdlog::debug("{} of {} matches", checksum_name(expected->type), path.string());
        return std::optional<std::string>(digest.value());
    }
}
