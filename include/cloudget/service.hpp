#ifndef CLOUDGET_SERVICE_HPP
#define CLOUDGET_SERVICE_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>

#include <cloudget/export.hpp>
#include <cloudget/curl.hpp>
#include <cloudget/errors.hpp>

namespace cloudget
{
    class Context;

    inline constexpr const char* browser_user_agent
        = "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) "
          "Chrome/91.0.4472.124 Safari/537.36";

    // URL to probe and (optionally) the filename a service learned before probing.
    struct PreparedUrl
    {
        std::string url;
        std::optional<std::string> filename = std::nullopt;
    };

    /** A cloud share service.
     *
     * A service turns the URL a user copied from the browser into a URL that
     * serves the file bytes directly. The engine calls, in order:
     *  - `supports()` to pick the service,
     *  - `resolve()` to rewrite the share URL (no network),
     *  - `prepare()` for services that need an API call before the file is reachable,
     *  - `resolve_redirect()` after the probe, for interstitial pages,
     *  - `extract_filename()` with the probe headers.
     */
    class CLOUDGET_API Service
    {
    public:
        virtual ~Service() = default;

        virtual std::string_view name() const noexcept = 0;

        // Human readable name, e.g. "Google Drive".
        virtual std::string_view display_name() const noexcept = 0;

        virtual bool supports(const std::string& url) const = 0;

        virtual tl::expected<std::string, DownloaderError> resolve(
            const std::string& url) const = 0;

        // Content-Disposition first, then the service's URL heuristic, then the placeholder.
        std::string extract_filename(const std::string& url,
                                     const header_map_type* headers = nullptr) const;

        virtual std::string placeholder_filename() const = 0;

        // Extra request headers sent with the probe and every range request.
        virtual std::vector<std::string> default_headers() const;

        virtual tl::expected<PreparedUrl, DownloaderError> prepare(
            const Context& ctx, const std::string& resolved_url) const;

        // Returns a replacement URL when the probe landed on something other than the file.
        virtual tl::expected<std::optional<std::string>, DownloaderError> resolve_redirect(
            const Context& ctx, const std::string& url, const Response& probe) const;

    protected:
        virtual std::optional<std::string> filename_from_url(const std::string& url) const;

        static DownloaderError unsupported(const std::string& reason);
    };

    // filename="x" or filename*=UTF-8''x (percent-decoded).
    CLOUDGET_API std::optional<std::string> filename_from_content_disposition(
        const std::string& value);

    // Service headers, then the context's extra headers, then the context's
    // user agent unless the service already sets one.
    CLOUDGET_API std::vector<std::string> request_headers(const Context& ctx,
                                                          const Service& service);

    // Strips directory components and characters that are not valid in a file name.
    CLOUDGET_API std::string sanitize_filename(const std::string& name);
}

#endif
