#ifndef CLOUDGET_REASSEMBLER_HPP
#define CLOUDGET_REASSEMBLER_HPP

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>

#include <tl/expected.hpp>

#include <cloudget/export.hpp>
#include <cloudget/chunk.hpp>
#include <cloudget/errors.hpp>
#include <cloudget/fileio.hpp>

namespace cloudget
{
    namespace fs = std::filesystem;

    /** Writes transfer data into `<artifact>.cgpart` and moves it onto the
     * artifact path once the download is verified.
     *
     * Ranged downloads `place()` every chunk at its absolute offset, so the
     * result does not depend on the order in which chunks complete. Whole-file
     * downloads `append()` as bytes arrive.
     */
    class CLOUDGET_API Reassembler
    {
    public:
        Reassembler(fs::path artifact, std::uint64_t expected_size);
        ~Reassembler();

        Reassembler(const Reassembler&) = delete;
        Reassembler& operator=(const Reassembler&) = delete;

        // Creates (truncates) the partial file, pre-sized to the expected size if known.
        tl::expected<void, DownloaderError> open();

        tl::expected<void, DownloaderError> place(const ChunkResult& result);

        tl::expected<void, DownloaderError> append(const char* data, std::size_t size);

        // Drops what `append()` wrote so far, a retried stream starts over.
        tl::expected<void, DownloaderError> restart_stream();

        tl::expected<void, DownloaderError> close();

        // Renames the partial file onto the artifact path.
        tl::expected<void, DownloaderError> commit();

        // Closes and removes the partial file. Safe to call more than once.
        void discard();

        std::uint64_t bytes_written() const;

        std::uint64_t expected_size() const noexcept
        {
            return m_expected_size;
        }

        const fs::path& artifact_path() const noexcept
        {
            return m_artifact;
        }

        const fs::path& part_path() const noexcept
        {
            return m_part;
        }

    private:
        DownloaderError file_error(const std::string& what, const std::error_code& ec) const;

        fs::path m_artifact;
        fs::path m_part;
        std::uint64_t m_expected_size;
        std::uint64_t m_bytes_written = 0;
        std::unique_ptr<FileIO> m_file;
        mutable std::mutex m_mutex;
    };

    CLOUDGET_API fs::path part_path_for(const fs::path& artifact);
}

#endif
