#ifndef CLOUDGET_CHUNK_TARGET_HPP
#define CLOUDGET_CHUNK_TARGET_HPP

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <tl/expected.hpp>

extern "C"
{
#include <curl/curl.h>
}

#include <cloudget/export.hpp>
#include <cloudget/chunk.hpp>
#include <cloudget/enums.hpp>
#include <cloudget/errors.hpp>

namespace cloudget
{
    class Context;
    class CURLHandle;
    class ProgressTracker;
    class Reassembler;

    /** One transfer of a download: either a byte range kept in memory until it
     * completes, or the whole file streamed into the reassembler.
     *
     * A ChunkTarget owns its CURL easy handle for the duration of an attempt
     * and carries its retry state (attempt count, time of the next attempt).
     */
    class CLOUDGET_API ChunkTarget
    {
    public:
        using clock = std::chrono::steady_clock;

        static std::size_t write_callback(char* buffer,
                                          std::size_t size,
                                          std::size_t nitems,
                                          ChunkTarget* self);

        static int progress_callback(ChunkTarget* self,
                                     curl_off_t total_to_download,
                                     curl_off_t now_downloaded,
                                     curl_off_t total_to_upload,
                                     curl_off_t now_uploaded);

        // Ranged transfer of `range`. `final_of_plan` marks the last range of a
        // plan with more than one range.
        ChunkTarget(const Context& ctx,
                    std::string url,
                    ChunkRange range,
                    bool final_of_plan,
                    std::vector<std::string> headers = {});

        // Whole-file transfer streamed into `stream`.
        ChunkTarget(const Context& ctx,
                    std::string url,
                    Reassembler& stream,
                    std::vector<std::string> headers = {});

        ~ChunkTarget();

        ChunkTarget(const ChunkTarget&) = delete;
        ChunkTarget& operator=(const ChunkTarget&) = delete;

        void set_progress(ProgressTracker* progress);

        // Creates the CURL handle for the next attempt and adds it to `multi_handle`.
        tl::expected<void, DownloaderError> prepare_for_transfer(CURLM* multi_handle);

        /** Check the finished transfer.
         * Evaluates the CURL result and the protocol status code. The returned
         * error level tells what to do next:
         *  - INFO / SERIOUS: transient, the chunk may be retried,
         *  - FATAL: retrying cannot help (write error, range not satisfiable, ...).
         */
        tl::expected<void, DownloaderError> check_finished_transfer_status(CURLcode result,
                                                                           long http_status);

        // Removes the handle from `multi_handle` and releases it.
        void reset(CURLM* multi_handle);

        // Prepares another attempt after `error`. Returns false when the error is
        // fatal or the attempts are used up.
        bool set_retrying(const DownloaderError& error);

        void finalize_transfer();
        void set_failed();
        void set_cancelled();

        // The error reported for the whole download when this chunk gives up.
        DownloaderError terminal_error(const DownloaderError& last_error) const;

        // Moves the payload out of a finished ranged transfer.
        ChunkResult take_result();

        // Delay before attempt number `attempt + 1`, given `attempt` failed attempts.
        std::chrono::milliseconds retry_delay(std::size_t attempt) const;

        bool ready(clock::time_point now) const noexcept
        {
            return m_state == DownloadState::kWAITING && now >= m_next_attempt;
        }

        DownloadState state() const noexcept
        {
            return m_state;
        }

        std::size_t index() const noexcept
        {
            return m_range.index;
        }

        const ChunkRange& range() const noexcept
        {
            return m_range;
        }

        bool is_ranged() const noexcept
        {
            return m_ranged;
        }

        // True if the server answered 416 for the final range.
        bool unsatisfiable() const noexcept
        {
            return m_unsatisfiable;
        }

        std::size_t attempts() const noexcept
        {
            return m_attempts;
        }

        std::uint64_t bytes_received() const noexcept
        {
            return m_received;
        }

        clock::time_point next_attempt() const noexcept
        {
            return m_next_attempt;
        }

        const std::string& url() const noexcept
        {
            return m_url;
        }

        CURLHandle* curl_handle() const noexcept
        {
            return m_curl_handle.get();
        }

        const char* errorbuffer() const;

    private:
        const Context& m_ctx;
        std::string m_url;
        ChunkRange m_range;
        bool m_ranged;
        bool m_final_of_plan = false;
        std::vector<std::string> m_headers;

        Reassembler* m_stream = nullptr;
        ProgressTracker* m_progress = nullptr;

        std::unique_ptr<CURLHandle> m_curl_handle;
        std::vector<char> m_buffer;
        std::uint64_t m_received = 0;

        DownloadState m_state = DownloadState::kWAITING;
        std::size_t m_attempts = 0;
        clock::time_point m_next_attempt = clock::time_point::min();

        bool m_write_failed = false;
        bool m_range_overflow = false;
        bool m_unsatisfiable = false;
    };
}

#endif
