#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

#include <cloudget/context.hpp>
#include <cloudget/metadata.hpp>
#include <cloudget/url.hpp>
#include <cloudget/utils.hpp>

#include "curl_internal.hpp"

namespace cloudget
{
    namespace
    {
        std::uint64_t parse_content_length(const std::string& value)
        {
            const std::string str = strip(value);
            if (str.empty()
                || !std::all_of(str.begin(),
                                str.end(),
                                [](unsigned char c) { return std::isdigit(c); }))
            {
                return 0;
            }
            try
            {
                return std::stoull(str);
            }
            catch (const std::out_of_range&)
            {
                return 0;
            }
        }

        DownloaderError probe_error(const std::string& reason)
        {
            return DownloaderError{ ErrorLevel::FATAL, ErrorCode::CG_PROBE_FAILED, reason };
        }
    }

    FileMetadata metadata_from_response(const Service& service,
                                        const std::string& url,
                                        const Response& response,
                                        const std::optional<std::string>& filename_hint)
    {
        FileMetadata metadata;
        metadata.url = url;

        if (auto length = response.get_header("content-length"))
        {
            metadata.size = parse_content_length(length.value());
        }

        if (auto ranges = response.get_header("accept-ranges"))
        {
            metadata.accept_ranges = to_lower(strip(ranges.value())) == "bytes";
        }

        if (auto modified = response.get_header("last-modified"))
        {
            metadata.last_modified = strip(modified.value());
        }

        if (filename_hint && !sanitize_filename(*filename_hint).empty())
        {
            metadata.filename = sanitize_filename(*filename_hint);
        }
        else
        {
            metadata.filename = service.extract_filename(url, &response.headers);
        }
        return metadata;
    }

    tl::expected<Response, DownloaderError> probe_request(const Context& ctx,
                                                          const Service& service,
                                                          const std::string& url)
    {
        spdlog::debug("Probing {}", url);

        Response response;
        try
        {
            CURLHandle h(ctx, url);
            h.nobody();
            h.add_headers(request_headers(ctx, service));
            response = h.perform();
        }
        catch (const curl_error& e)
        {
            return tl::unexpected(probe_error(fmt::format("{}: {}", url, e.what())));
        }

        // file:// has no status code, and announces its size only when asked for headers
        if (is_file_url(url) && !response.get_header("content-length"))
        {
            std::error_code ec;
            const auto size = fs::file_size(file_url_to_path(url), ec);
            if (!ec)
            {
                response.headers["content-length"] = std::to_string(size);
                response.headers["accept-ranges"] = "bytes";
            }
        }

        const bool ok = response.ok() || (response.http_status == 0 && is_file_url(url));
        if (!ok)
        {
            return tl::unexpected(
                probe_error(fmt::format("{} returned status code {}", url, response.http_status)));
        }
        return response;
    }

    tl::expected<FileMetadata, DownloaderError> probe(const Context& ctx,
                                                      const Service& service,
                                                      const PreparedUrl& prepared)
    {
        std::string url = prepared.url;
        auto response = probe_request(ctx, service, url);
        if (!response)
        {
            return tl::unexpected(response.error());
        }

        auto redirect = service.resolve_redirect(ctx, url, response.value());
        if (!redirect)
        {
            return tl::unexpected(redirect.error());
        }

        if (redirect.value() && redirect.value().value() != url)
        {
            url = redirect.value().value();
            spdlog::info("Following {} redirect to {}", service.display_name(), url);
            response = probe_request(ctx, service, url);
            if (!response)
            {
                return tl::unexpected(response.error());
            }
        }

        FileMetadata metadata
            = metadata_from_response(service, url, response.value(), prepared.filename);
        spdlog::info("Probed {}: {} ({} bytes, ranges {})",
                     url,
                     metadata.filename,
                     metadata.size,
                     metadata.accept_ranges ? "supported" : "not supported");
        return metadata;
    }
}
