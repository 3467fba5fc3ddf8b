#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <cloudget/chunk_target.hpp>
#include <cloudget/context.hpp>
#include <cloudget/progress.hpp>
#include <cloudget/reassembler.hpp>
#include <cloudget/url.hpp>
#include <cloudget/utils.hpp>

#include "curl_internal.hpp"

namespace cloudget
{
    ChunkTarget::ChunkTarget(const Context& ctx,
                             std::string url,
                             ChunkRange range,
                             bool final_of_plan,
                             std::vector<std::string> headers)
        : m_ctx(ctx)
        , m_url(std::move(url))
        , m_range(range)
        , m_ranged(true)
        , m_final_of_plan(final_of_plan)
        , m_headers(std::move(headers))
    {
    }

    ChunkTarget::ChunkTarget(const Context& ctx,
                             std::string url,
                             Reassembler& stream,
                             std::vector<std::string> headers)
        : m_ctx(ctx)
        , m_url(std::move(url))
        , m_ranged(false)
        , m_headers(std::move(headers))
        , m_stream(&stream)
    {
        if (stream.expected_size() > 0)
            m_range.end = stream.expected_size() - 1;
    }

    ChunkTarget::~ChunkTarget() = default;

    void ChunkTarget::set_progress(ProgressTracker* progress)
    {
        m_progress = progress;
    }

    std::size_t ChunkTarget::write_callback(char* buffer,
                                            std::size_t size,
                                            std::size_t nitems,
                                            ChunkTarget* self)
    {
        const std::size_t all = size * nitems;

        if (!self->m_ranged)
        {
            auto res = self->m_stream->append(buffer, all);
            if (!res)
            {
                res.error().log();
                self->m_write_failed = true;
                return 0;
            }
            self->m_received += all;
            return all;
        }

        if (self->m_curl_handle)
        {
            long code = 0;
            curl_easy_getinfo(self->m_curl_handle->handle(), CURLINFO_RESPONSE_CODE, &code);

            // Error pages are not payload, the status check reports them.
            if (code != 0 && code != 200 && code != 206)
                return all;

            // A server that ignores the Range header answers 200 with the whole file.
            // For the first range the prefix is still usable, for any other range it is not.
            if (code == 200 && self->m_received == 0 && self->m_range.start > 0)
            {
                self->m_range_overflow = true;
                return 0;
            }
        }

        const std::uint64_t wanted = self->m_range.size();
        const std::uint64_t remaining = wanted - std::min<std::uint64_t>(wanted, self->m_received);
        if (all > remaining)
        {
            if (self->m_range.start > 0)
            {
                self->m_range_overflow = true;
                return 0;
            }
            // Keep the requested prefix, then stop the transfer (CURLE_WRITE_ERROR).
            self->m_buffer.insert(self->m_buffer.end(), buffer, buffer + remaining);
            self->m_received += remaining;
            return 0;
        }

        self->m_buffer.insert(self->m_buffer.end(), buffer, buffer + all);
        self->m_received += all;
        return all;
    }

    int ChunkTarget::progress_callback(ChunkTarget* self,
                                       curl_off_t /*total_to_download*/,
                                       curl_off_t now_downloaded,
                                       curl_off_t /*total_to_upload*/,
                                       curl_off_t /*now_uploaded*/)
    {
        if (self->m_state != DownloadState::kRUNNING)
            return 0;

        if (is_sig_interrupted())
            return 1;

        if (self->m_progress && now_downloaded > 0)
        {
            std::uint64_t done = static_cast<std::uint64_t>(now_downloaded);
            if (self->m_ranged)
                done = std::min(done, self->m_range.size());
            self->m_progress->update(self->index(), done);
        }
        return 0;
    }

    tl::expected<void, DownloaderError> ChunkTarget::prepare_for_transfer(CURLM* multi_handle)
    {
        try
        {
            m_curl_handle.reset(new CURLHandle(m_ctx));
            CURLHandle& h = *m_curl_handle;

            h.url(m_url, m_ctx.proxy_map);
            h.add_headers(m_headers);

            if (m_ranged)
            {
                // Bytes must arrive unmodified for the offsets to hold.
                const bool has_encoding
                    = std::any_of(m_headers.begin(),
                                  m_headers.end(),
                                  [](const std::string& header)
                                  { return starts_with(to_lower(header), "accept-encoding:"); });
                if (!has_encoding)
                    h.add_header("Accept-Encoding: identity");
                h.setopt(CURLOPT_RANGE, m_range.to_string());
                m_buffer.reserve(m_range.size());
            }

            h.setopt(CURLOPT_XFERINFOFUNCTION, &ChunkTarget::progress_callback);
            h.setopt(CURLOPT_XFERINFODATA, this);
            h.setopt(CURLOPT_NOPROGRESS, 0L);

            h.setopt(CURLOPT_WRITEFUNCTION, &ChunkTarget::write_callback);
            h.setopt(CURLOPT_WRITEDATA, this);
        }
        catch (const curl_error& e)
        {
            m_curl_handle.reset();
            return tl::unexpected(DownloaderError{ ErrorLevel::FATAL,
                                                   ErrorCode::CG_CURL,
                                                   e.what(),
                                                   m_ranged ? std::optional(index())
                                                            : std::nullopt });
        }

        m_buffer.clear();
        m_received = 0;
        m_write_failed = false;
        m_range_overflow = false;
        m_unsatisfiable = false;

        CURLMcode cm_rc = curl_multi_add_handle(multi_handle, m_curl_handle->handle());
        if (cm_rc != CURLM_OK)
        {
            m_curl_handle.reset();
            return tl::unexpected(DownloaderError{ ErrorLevel::FATAL,
                                                   ErrorCode::CG_CURLM,
                                                   curl_multi_strerror(cm_rc) });
        }

        m_attempts++;
        m_state = DownloadState::kRUNNING;
        if (m_ranged)
            spdlog::debug("Fetching chunk {} ({}), attempt {}", index(), m_range.to_string(), m_attempts);
        else
            spdlog::debug("Fetching {}, attempt {}", m_url, m_attempts);
        return {};
    }

    tl::expected<void, DownloaderError> ChunkTarget::check_finished_transfer_status(
        CURLcode result, long http_status)
    {
        const std::optional<std::size_t> chunk
            = m_ranged ? std::optional<std::size_t>(index()) : std::nullopt;

        if (m_write_failed)
        {
            return tl::unexpected(DownloaderError{
                ErrorLevel::FATAL, ErrorCode::CG_FILE, "Could not write received data", chunk });
        }

        // file:// transfers report no status
        const bool status_ok = http_status == 200 || http_status == 206
                               || (http_status == 0 && is_file_url(m_url));

        if (m_range_overflow && status_ok)
        {
            return tl::unexpected(DownloaderError{
                ErrorLevel::FATAL,
                ErrorCode::CG_BADSTATUS,
                fmt::format("Server ignored the range request for bytes {}", m_range.to_string()),
                chunk });
        }

        const bool range_complete = m_ranged && m_received == m_range.size();
        // The write callback stops the transfer once the range is full or overflows.
        const bool stopped_by_us
            = result == CURLE_WRITE_ERROR && m_ranged && (range_complete || m_range_overflow);

        if (result != CURLE_OK && !stopped_by_us)
        {
            std::string error = fmt::format("CURL error ({}): {} for {} [{}]",
                                            result,
                                            curl_easy_strerror(result),
                                            m_url,
                                            errorbuffer());
            switch (result)
            {
                case CURLE_ABORTED_BY_CALLBACK:
                case CURLE_BAD_FUNCTION_ARGUMENT:
                case CURLE_COULDNT_RESOLVE_PROXY:
                case CURLE_FILESIZE_EXCEEDED:
                case CURLE_INTERFACE_FAILED:
                case CURLE_NOT_BUILT_IN:
                case CURLE_OUT_OF_MEMORY:
                case CURLE_SSL_CACERT_BADFILE:
                case CURLE_SSL_CRL_BADFILE:
                case CURLE_WRITE_ERROR:
                case CURLE_UNSUPPORTED_PROTOCOL:
                    return tl::unexpected(
                        DownloaderError{ ErrorLevel::FATAL, ErrorCode::CG_CURL, error, chunk });
                case CURLE_OPERATION_TIMEDOUT:
                    return tl::unexpected(
                        DownloaderError{ ErrorLevel::SERIOUS, ErrorCode::CG_TIMEOUT, error, chunk });
                default:
                    return tl::unexpected(
                        DownloaderError{ ErrorLevel::INFO, ErrorCode::CG_CURL, error, chunk });
            }
        }

        if (http_status == 416)
        {
            if (m_ranged && m_final_of_plan)
            {
                spdlog::warn("Range {} of {} not satisfiable, treating final chunk {} as empty",
                             m_range.to_string(),
                             m_url,
                             index());
                m_buffer.clear();
                m_received = 0;
                m_unsatisfiable = true;
                return {};
            }
            return tl::unexpected(DownloaderError{
                ErrorLevel::FATAL,
                ErrorCode::CG_BADSTATUS,
                fmt::format("Range {} not satisfiable for {}", m_range.to_string(), m_url),
                chunk });
        }

        if (!status_ok)
        {
            return tl::unexpected(DownloaderError{
                ErrorLevel::INFO,
                ErrorCode::CG_BADSTATUS,
                fmt::format("Status code: {} for {}", http_status, m_url),
                chunk });
        }

        if (m_ranged && !range_complete)
        {
            return tl::unexpected(DownloaderError{
                ErrorLevel::INFO,
                ErrorCode::CG_BADSTATUS,
                fmt::format("Received {} of {} bytes for range {}",
                            m_received,
                            m_range.size(),
                            m_range.to_string()),
                chunk });
        }

        return {};
    }

    void ChunkTarget::reset(CURLM* multi_handle)
    {
        if (m_curl_handle)
        {
            curl_multi_remove_handle(multi_handle, m_curl_handle->handle());
            m_curl_handle.reset();
        }
    }

    std::chrono::milliseconds ChunkTarget::retry_delay(std::size_t attempt) const
    {
        const auto min = m_ctx.retry_backoff_min;
        const auto max = std::max(m_ctx.retry_backoff_max, min);
        if (attempt == 0)
            return min;

        const double factor = std::pow(static_cast<double>(m_ctx.retry_backoff_factor),
                                       static_cast<double>(attempt - 1));
        const double delay = static_cast<double>(min.count()) * factor;
        if (delay >= static_cast<double>(max.count()))
            return max;
        return std::max(min, std::chrono::milliseconds(static_cast<std::int64_t>(delay)));
    }

    bool ChunkTarget::set_retrying(const DownloaderError& error)
    {
        if (error.is_fatal() || m_attempts >= m_ctx.max_chunk_attempts)
            return false;

        if (m_stream)
        {
            auto res = m_stream->restart_stream();
            if (!res)
            {
                res.error().log();
                return false;
            }
        }

        const auto delay = retry_delay(m_attempts);
        spdlog::info("Retrying {} in {} ms (attempt {} of {}): {}",
                     m_ranged ? fmt::format("chunk {}", index()) : m_url,
                     delay.count(),
                     m_attempts + 1,
                     m_ctx.max_chunk_attempts,
                     error.reason);

        m_state = DownloadState::kWAITING;
        m_next_attempt = clock::now() + delay;
        m_buffer.clear();
        m_received = 0;
        if (m_progress)
            m_progress->restart(index());
        return true;
    }

    void ChunkTarget::finalize_transfer()
    {
        m_state = DownloadState::kFINISHED;
        if (m_progress)
            m_progress->update(index(), m_received);
    }

    void ChunkTarget::set_failed()
    {
        m_state = DownloadState::kFAILED;
    }

    void ChunkTarget::set_cancelled()
    {
        if (m_state == DownloadState::kWAITING || m_state == DownloadState::kRUNNING)
            m_state = DownloadState::kCANCELLED;
    }

    DownloaderError ChunkTarget::terminal_error(const DownloaderError& last_error) const
    {
        const std::optional<std::size_t> chunk
            = m_ranged ? std::optional<std::size_t>(index()) : std::nullopt;

        // Disk errors keep their identity, everything else is a failed fetch.
        if (last_error.code == ErrorCode::CG_FILE)
        {
            return DownloaderError{ ErrorLevel::FATAL, ErrorCode::CG_FILE, last_error.reason, chunk };
        }

        std::string what = m_ranged ? fmt::format("range {}", m_range.to_string()) : m_url;
        return DownloaderError{ ErrorLevel::FATAL,
                                ErrorCode::CG_CHUNK_FETCH_FAILED,
                                fmt::format("{} failed after {} attempt{}: {}",
                                            what,
                                            m_attempts,
                                            m_attempts == 1 ? "" : "s",
                                            last_error.reason),
                                chunk };
    }

    ChunkResult ChunkTarget::take_result()
    {
        ChunkResult result{ index(), m_range.start, std::move(m_buffer) };
        m_buffer = {};
        return result;
    }

    const char* ChunkTarget::errorbuffer() const
    {
        return m_curl_handle ? m_curl_handle->errorbuffer() : "";
    }
}
