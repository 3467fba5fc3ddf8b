#include <algorithm>
#include <thread>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <cloudget/downloader.hpp>
#include <cloudget/utils.hpp>

#include "curl_internal.hpp"

namespace cloudget
{
    Downloader::Downloader(std::size_t max_connections)
        : m_max_connections(std::max<std::size_t>(1, max_connections))
    {
        m_multi_handle = curl_multi_init();
        if (!m_multi_handle)
        {
            throw curl_error("Could not initialize CURL multi handle");
        }
        curl_multi_setopt(
            m_multi_handle, CURLMOPT_MAX_TOTAL_CONNECTIONS, static_cast<long>(m_max_connections));
    }

    Downloader::~Downloader()
    {
        cancel_all();
        curl_multi_cleanup(m_multi_handle);
    }

    void Downloader::add(std::unique_ptr<ChunkTarget> target)
    {
        if (target)
            m_targets.push_back(std::move(target));
    }

    void Downloader::set_deadline(clock::time_point deadline)
    {
        m_deadline = deadline;
    }

    void Downloader::set_retry_budget(std::size_t budget)
    {
        m_retry_budget = budget;
    }

    void Downloader::set_chunk_done_callback(chunk_done_callback callback)
    {
        m_chunk_done = std::move(callback);
    }

    tl::expected<void, DownloaderError> Downloader::check_interrupted() const
    {
        if (is_sig_interrupted())
        {
            return tl::unexpected(DownloaderError{
                ErrorLevel::FATAL, ErrorCode::CG_INTERRUPTED, "Download interrupted by user" });
        }
        if (m_deadline && clock::now() >= *m_deadline)
        {
            return tl::unexpected(DownloaderError{
                ErrorLevel::FATAL,
                ErrorCode::CG_TIMEOUT,
                "Download did not complete before the session deadline" });
        }
        return {};
    }

    std::optional<Downloader::clock::time_point> Downloader::next_retry() const
    {
        std::optional<clock::time_point> next;
        for (const auto& target : m_targets)
        {
            if (target->state() != DownloadState::kWAITING)
                continue;
            if (!next || target->next_attempt() < *next)
                next = target->next_attempt();
        }
        return next;
    }

    bool Downloader::has_pending() const
    {
        return !m_running_transfers.empty() || next_retry().has_value();
    }

    tl::expected<void, DownloaderError> Downloader::prepare_next_transfers()
    {
        const auto now = clock::now();
        for (auto& target : m_targets)
        {
            if (m_running_transfers.size() >= m_max_connections)
                break;

            // Targets are kept in index order, so dispatch follows ascending ranges.
            if (!target->ready(now))
                continue;

            auto res = target->prepare_for_transfer(m_multi_handle);
            if (!res)
            {
                target->set_failed();
                return tl::unexpected(target->terminal_error(res.error()));
            }
            m_running_transfers.push_back(target.get());
        }
        return {};
    }

    tl::expected<void, DownloaderError> Downloader::check_msgs()
    {
        int msgs_in_queue;
        while (CURLMsg* msg = curl_multi_info_read(m_multi_handle, &msgs_in_queue))
        {
            if (msg->msg != CURLMSG_DONE)
            {
                // We are only interested in messages about finished transfers
                continue;
            }

            auto it = std::find_if(m_running_transfers.begin(),
                                   m_running_transfers.end(),
                                   [msg](ChunkTarget* target) {
                                       return target->curl_handle()
                                              && target->curl_handle()->handle()
                                                     == msg->easy_handle;
                                   });
            if (it == m_running_transfers.end())
            {
                return tl::unexpected(DownloaderError{ ErrorLevel::FATAL,
                                                       ErrorCode::CG_UNKNOWNERROR,
                                                       "Finished transfer has no owner" });
            }

            ChunkTarget* current_target = *it;
            const CURLcode curl_result = msg->data.result;

            long http_status = 0;
            curl_easy_getinfo(msg->easy_handle, CURLINFO_RESPONSE_CODE, &http_status);

            auto result = current_target->check_finished_transfer_status(curl_result, http_status);

            // Cleanup, `msg` is invalid from here on
            current_target->reset(m_multi_handle);
            m_running_transfers.erase(it);

            if (auto interrupted = check_interrupted(); !interrupted)
                return interrupted;

            if (!result)
            {
                result.error().log();

                const bool budget_left
                    = m_retry_budget == 0 || m_retries_used < m_retry_budget;
                if (budget_left && current_target->set_retrying(result.error()))
                {
                    m_retries_used++;
                    continue;
                }
                if (!budget_left && !result.error().is_fatal())
                {
                    spdlog::error("Retry budget of {} exhausted", m_retry_budget);
                }

                current_target->set_failed();
                return tl::unexpected(current_target->terminal_error(result.error()));
            }

            current_target->finalize_transfer();
            if (m_chunk_done)
            {
                auto done = m_chunk_done(*current_target);
                if (!done)
                {
                    current_target->set_failed();
                    return done;
                }
            }
        }

        // At this point, after handles of finished transfers were removed
        // from the multi_handle, we could add new waiting transfers.
        return prepare_next_transfers();
    }

    void Downloader::cancel_all()
    {
        for (auto* target : m_running_transfers)
        {
            target->reset(m_multi_handle);
        }
        m_running_transfers.clear();

        for (auto& target : m_targets)
        {
            target->set_cancelled();
        }
    }

    tl::expected<void, DownloaderError> Downloader::download()
    {
        int still_running = 0;
        const std::chrono::milliseconds max_wait(1000);

        auto fail = [this](DownloaderError error) -> tl::expected<void, DownloaderError>
        {
            cancel_all();
            return tl::unexpected(std::move(error));
        };

        if (auto res = check_interrupted(); !res)
            return fail(res.error());

        if (auto res = prepare_next_transfers(); !res)
            return fail(res.error());

        while (true)
        {
            CURLMcode code = curl_multi_perform(m_multi_handle, &still_running);
            if (code != CURLM_OK)
            {
                return fail(DownloaderError{
                    ErrorLevel::FATAL, ErrorCode::CG_CURLM, curl_multi_strerror(code) });
            }

            if (auto res = check_msgs(); !res)
                return fail(res.error());

            if (!has_pending())
                break;

            if (auto res = check_interrupted(); !res)
                return fail(res.error());

            // Wait for network activity, the next retry or the deadline, whichever
            // comes first, but no more than 1s.
            auto now = clock::now();
            auto wait = max_wait;
            auto retry = next_retry();
            if (retry && m_running_transfers.size() < m_max_connections)
            {
                wait = std::min(wait,
                                std::chrono::duration_cast<std::chrono::milliseconds>(
                                    std::max(*retry - now, clock::duration::zero())));
            }
            if (m_deadline)
            {
                wait = std::min(wait,
                                std::chrono::duration_cast<std::chrono::milliseconds>(
                                    std::max(*m_deadline - now, clock::duration::zero())));
            }

            if (m_running_transfers.empty())
            {
                std::this_thread::sleep_for(wait);
                if (auto res = prepare_next_transfers(); !res)
                    return fail(res.error());
                continue;
            }

            long curl_timeout = -1;
            code = curl_multi_timeout(m_multi_handle, &curl_timeout);
            if (code != CURLM_OK)
            {
                return fail(DownloaderError{
                    ErrorLevel::FATAL, ErrorCode::CG_CURLM, curl_multi_strerror(code) });
            }

            // No wait
            if (curl_timeout == 0)
                continue;

            if (curl_timeout > 0 && curl_timeout < wait.count())
                wait = std::chrono::milliseconds(curl_timeout);

            int numfds;
            code = curl_multi_wait(
                m_multi_handle, nullptr, 0, static_cast<int>(wait.count()), &numfds);
            if (code != CURLM_OK)
            {
                return fail(DownloaderError{
                    ErrorLevel::FATAL, ErrorCode::CG_CURLM, curl_multi_strerror(code) });
            }
        }

        for (const auto& target : m_targets)
        {
            if (target->state() != DownloadState::kFINISHED)
            {
                return fail(DownloaderError{ ErrorLevel::FATAL,
                                             ErrorCode::CG_UNKNOWNERROR,
                                             "Transfer loop ended with unfinished chunks",
                                             target->index() });
            }
        }

        spdlog::debug("All {} transfers finished, {} retries", m_targets.size(), m_retries_used);
        return {};
    }
}
