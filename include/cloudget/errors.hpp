#ifndef CLOUDGET_ERRORS_HPP
#define CLOUDGET_ERRORS_HPP

#include <optional>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <cloudget/export.hpp>
#include <cloudget/enums.hpp>

namespace cloudget
{
    // Name of the error kind as shown to users (e.g. "ChunkFetchFailed").
    CLOUDGET_API const char* to_string(ErrorCode code) noexcept;

    struct DownloaderError
    {
        ErrorLevel level;
        ErrorCode code;
        std::string reason;

        // Set when the error belongs to one byte range of a chunked transfer.
        std::optional<std::size_t> chunk_index = std::nullopt;

        bool is_fatal() const noexcept
        {
            return level == ErrorLevel::FATAL;
        }

        std::string message() const
        {
            if (chunk_index)
                return fmt::format("{} (chunk {}): {}", to_string(code), *chunk_index, reason);
            return fmt::format("{}: {}", to_string(code), reason);
        }

        void log() const
        {
            switch (level)
            {
                case ErrorLevel::FATAL:
                    spdlog::critical(message());
                    break;
                case ErrorLevel::SERIOUS:
                    spdlog::error(message());
                    break;
                default:
                    spdlog::warn(message());
            }
        }
    };
}

#endif
