#ifndef CLOUDGET_DOWNLOADER_HPP
#define CLOUDGET_DOWNLOADER_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include <tl/expected.hpp>

extern "C"
{
#include <curl/curl.h>
}

#include <cloudget/export.hpp>
#include <cloudget/chunk_target.hpp>
#include <cloudget/errors.hpp>

namespace cloudget
{
    /** Runs a set of ChunkTargets on one CURL multi handle.
     *
     * All transfers are multiplexed on the calling thread. At most
     * `max_connections` transfers are in flight; waiting targets are started in
     * ascending index order as slots free up. The first chunk that gives up
     * cancels every other transfer and its error is returned.
     */
    class CLOUDGET_API Downloader
    {
    public:
        using clock = std::chrono::steady_clock;
        using chunk_done_callback
            = std::function<tl::expected<void, DownloaderError>(ChunkTarget&)>;

        explicit Downloader(std::size_t max_connections);
        ~Downloader();

        Downloader(const Downloader&) = delete;
        Downloader& operator=(const Downloader&) = delete;

        void add(std::unique_ptr<ChunkTarget> target);

        // Whole-session deadline, checked on every turn of the loop.
        void set_deadline(clock::time_point deadline);

        // Total number of retries shared by all chunks, 0 means unlimited.
        void set_retry_budget(std::size_t budget);

        // Called on the loop thread for every successfully finished target.
        void set_chunk_done_callback(chunk_done_callback callback);

        tl::expected<void, DownloaderError> download();

        std::size_t retries_used() const noexcept
        {
            return m_retries_used;
        }

        std::size_t max_connections() const noexcept
        {
            return m_max_connections;
        }

        const std::vector<std::unique_ptr<ChunkTarget>>& targets() const noexcept
        {
            return m_targets;
        }

    private:
        tl::expected<void, DownloaderError> prepare_next_transfers();
        tl::expected<void, DownloaderError> check_msgs();
        tl::expected<void, DownloaderError> check_interrupted() const;

        // Earliest time a waiting target may start, if any target is waiting.
        std::optional<clock::time_point> next_retry() const;
        bool has_pending() const;

        void cancel_all();

        CURLM* m_multi_handle;
        std::size_t m_max_connections;

        std::vector<std::unique_ptr<ChunkTarget>> m_targets;
        std::vector<ChunkTarget*> m_running_transfers;

        std::optional<clock::time_point> m_deadline;
        std::size_t m_retry_budget = 0;
        std::size_t m_retries_used = 0;
        chunk_done_callback m_chunk_done;
    };
}

#endif
