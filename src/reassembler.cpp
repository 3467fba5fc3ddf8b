#include <spdlog/spdlog.h>

#include <cloudget/enums.hpp>
#include <cloudget/reassembler.hpp>

namespace cloudget
{
    fs::path part_path_for(const fs::path& artifact)
    {
        fs::path part = artifact;
        part += PARTEXT;
        return part;
    }

    Reassembler::Reassembler(fs::path artifact, std::uint64_t expected_size)
        : m_artifact(std::move(artifact))
        , m_part(part_path_for(m_artifact))
        , m_expected_size(expected_size)
    {
    }

    Reassembler::~Reassembler()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_file)
        {
            std::error_code ec;
            m_file->close(ec);
        }
    }

    DownloaderError Reassembler::file_error(const std::string& what,
                                            const std::error_code& ec) const
    {
        return DownloaderError{ ErrorLevel::FATAL,
                                ErrorCode::CG_FILE,
                                fmt::format("{} {}: {}", what, m_part.string(), ec.message()) };
    }

    tl::expected<void, DownloaderError> Reassembler::open()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        spdlog::debug("Opening file {}", m_part.string());

        std::error_code ec;
        m_file = std::make_unique<FileIO>(m_part, FileIO::write_update_binary, ec);
        if (ec)
        {
            m_file.reset();
            return tl::unexpected(file_error("Could not open", ec));
        }

        if (m_expected_size > 0)
        {
            m_file->truncate(static_cast<std::int64_t>(m_expected_size), ec);
            if (ec)
            {
                return tl::unexpected(file_error("Could not pre-size", ec));
            }
        }
        m_bytes_written = 0;
        return {};
    }

    tl::expected<void, DownloaderError> Reassembler::place(const ChunkResult& result)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_file)
        {
            return tl::unexpected(DownloaderError{
                ErrorLevel::FATAL, ErrorCode::CG_FILE, "Partial file is not open" });
        }
        if (result.payload.empty())
        {
            return {};
        }
        if (m_expected_size > 0 && result.offset + result.payload.size() > m_expected_size)
        {
            return tl::unexpected(DownloaderError{
                ErrorLevel::FATAL,
                ErrorCode::CG_SIZE_MISMATCH,
                fmt::format("Chunk {} ends at byte {} past the expected size {}",
                            result.index,
                            result.offset + result.payload.size(),
                            m_expected_size),
                result.index });
        }

        std::error_code ec;
        m_file->write_at(static_cast<std::int64_t>(result.offset),
                         result.payload.data(),
                         result.payload.size(),
                         ec);
        if (ec)
        {
            return tl::unexpected(file_error("Could not write chunk to", ec));
        }
        m_bytes_written += result.payload.size();
        return {};
    }

    tl::expected<void, DownloaderError> Reassembler::append(const char* data, std::size_t size)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_file)
        {
            return tl::unexpected(DownloaderError{
                ErrorLevel::FATAL, ErrorCode::CG_FILE, "Partial file is not open" });
        }

        std::error_code ec;
        m_file->write_at(static_cast<std::int64_t>(m_bytes_written), data, size, ec);
        if (ec)
        {
            return tl::unexpected(file_error("Could not write to", ec));
        }
        m_bytes_written += size;
        return {};
    }

    tl::expected<void, DownloaderError> Reassembler::restart_stream()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_file)
        {
            return {};
        }

        // Truncate file - remove downloaded garbage (error html page etc.)
        std::error_code ec;
        m_file->truncate(0, ec);
        if (!ec && m_expected_size > 0)
        {
            m_file->truncate(static_cast<std::int64_t>(m_expected_size), ec);
        }
        if (ec)
        {
            return tl::unexpected(file_error("Could not truncate", ec));
        }
        m_bytes_written = 0;
        return {};
    }

    tl::expected<void, DownloaderError> Reassembler::close()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_file)
        {
            return {};
        }

        std::error_code ec;
        m_file->flush(ec);
        if (!ec)
        {
            m_file->close(ec);
        }
        m_file.reset();
        if (ec)
        {
            return tl::unexpected(file_error("Could not close", ec));
        }
        return {};
    }

    tl::expected<void, DownloaderError> Reassembler::commit()
    {
        auto closed = close();
        if (!closed)
        {
            return closed;
        }

        std::error_code ec;
        fs::rename(m_part, m_artifact, ec);
        if (ec)
        {
            return tl::unexpected(DownloaderError{ ErrorLevel::FATAL,
                                                   ErrorCode::CG_FILE,
                                                   fmt::format("Could not rename {} to {}: {}",
                                                               m_part.string(),
                                                               m_artifact.string(),
                                                               ec.message()) });
        }
        spdlog::debug("Moved {} to {}", m_part.string(), m_artifact.string());
        return {};
    }

    void Reassembler::discard()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::error_code ec;
        if (m_file)
        {
            m_file->close(ec);
            m_file.reset();
        }
        if (fs::exists(m_part, ec))
        {
            spdlog::info("Removing file {}", m_part.string());
            fs::remove(m_part, ec);
            if (ec)
            {
                spdlog::error("Could not remove {}: {}", m_part.string(), ec.message());
            }
        }
    }

    std::uint64_t Reassembler::bytes_written() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_bytes_written;
    }
}
