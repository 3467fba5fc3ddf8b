#ifndef CLOUDGET_METADATA_HPP
#define CLOUDGET_METADATA_HPP

#include <cstdint>
#include <optional>
#include <string>

#include <tl/expected.hpp>

#include <cloudget/export.hpp>
#include <cloudget/curl.hpp>
#include <cloudget/errors.hpp>
#include <cloudget/service.hpp>

namespace cloudget
{
    class Context;

    // What a probe learns about a file. Never modified after the probe.
    struct FileMetadata
    {
        // URL the chunks are fetched from (after redirect resolution).
        std::string url;
        // 0 when the server does not announce a length.
        std::uint64_t size = 0;
        std::string filename;
        bool accept_ranges = false;
        std::optional<std::string> last_modified = std::nullopt;
    };

    /** Builds the metadata from the headers of a probe response.
     * `Content-Length` that is missing or not a number gives size 0,
     * `Accept-Ranges: bytes` enables ranges, the filename comes from
     * `filename_hint` if set, else from the service.
     */
    CLOUDGET_API FileMetadata
    metadata_from_response(const Service& service,
                           const std::string& url,
                           const Response& response,
                           const std::optional<std::string>& filename_hint = std::nullopt);

    // Headers-only request following redirects. Any transport error or non 2xx
    // status is a `CG_PROBE_FAILED` error; probes are not retried.
    CLOUDGET_API tl::expected<Response, DownloaderError> probe_request(const Context& ctx,
                                                                       const Service& service,
                                                                       const std::string& url);

    // Probe, let the service replace the URL once if it landed on an
    // interstitial page, then read the metadata.
    CLOUDGET_API tl::expected<FileMetadata, DownloaderError> probe(const Context& ctx,
                                                                   const Service& service,
                                                                   const PreparedUrl& prepared);
}

#endif
