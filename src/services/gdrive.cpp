#include <regex>

#include <spdlog/spdlog.h>

#include <cloudget/context.hpp>
#include <cloudget/services/gdrive.hpp>
#include <cloudget/url.hpp>
#include <cloudget/utils.hpp>

#include "../curl_internal.hpp"

namespace cloudget
{
    namespace
    {
        std::string unescape_html(std::string str)
        {
            replace_all(str, "&amp;", "&");
            replace_all(str, "&#39;", "'");
            replace_all(str, "&quot;", "\"");
            return str;
        }
    }

    std::string_view GoogleDriveService::name() const noexcept
    {
        return "gdrive";
    }

    std::string_view GoogleDriveService::display_name() const noexcept
    {
        return "Google Drive";
    }

    bool GoogleDriveService::supports(const std::string& url) const
    {
        const std::string lurl = to_lower(url);
        return contains(lurl, "drive.google.com") || contains(lurl, "docs.google.com");
    }

    tl::expected<std::string, DownloaderError> GoogleDriveService::resolve(
        const std::string& url) const
    {
        if (!supports(url))
        {
            return tl::unexpected(unsupported(fmt::format("Not a Google Drive URL: {}", url)));
        }

        auto file_id = extract_file_id(url);
        if (!file_id)
        {
            return tl::unexpected(unsupported(
                fmt::format("Could not extract file ID from Google Drive URL: {}", url)));
        }

        return fmt::format("https://drive.google.com/uc?export=download&id={}&confirm=t",
                           file_id.value());
    }

    std::string GoogleDriveService::placeholder_filename() const
    {
        return "google_drive_file";
    }

    std::vector<std::string> GoogleDriveService::default_headers() const
    {
        return { "Accept-Encoding: identity", fmt::format("User-Agent: {}", browser_user_agent) };
    }

    std::optional<std::string> GoogleDriveService::extract_file_id(const std::string& url)
    {
        static const std::regex patterns[] = {
            std::regex(R"(/file/d/([a-zA-Z0-9_-]+))"),
            std::regex(R"([?&]id=([a-zA-Z0-9_-]+))"),
            std::regex(R"(/open\?id=([a-zA-Z0-9_-]+))"),
            std::regex(R"(/d/([a-zA-Z0-9_-]+))"),
        };

        std::smatch match;
        for (const auto& re : patterns)
        {
            if (std::regex_search(url, match, re))
            {
                return match[1].str();
            }
        }
        return std::nullopt;
    }

    bool GoogleDriveService::is_interstitial(const Response& probe)
    {
        if (contains(probe.effective_url, "accounts.google.com"))
            return true;

        auto content_type = probe.get_header("content-type");
        return content_type && starts_with(to_lower(content_type.value()), "text/html");
    }

    std::optional<std::string> GoogleDriveService::find_confirmation_url(
        const std::string& html, const std::string& file_id)
    {
        static const std::regex form_re(R"re(action="([^"]*)"[^>]*>[\s\S]*?name="id")re");
        static const std::regex input_re(
            R"re(<input[^>]*type="hidden"[^>]*name="([^"]+)"[^>]*value="([^"]*)")re");
        static const std::regex confirm_re(R"re(&amp;confirm=([^&"]*))re");

        std::smatch match;
        if (std::regex_search(html, match, form_re))
        {
            std::string action = unescape_html(match[1].str());

            // The form submits its hidden fields as the query string.
            if (!contains(action, "?"))
            {
                std::string query;
                for (auto it = std::sregex_iterator(html.begin(), html.end(), input_re);
                     it != std::sregex_iterator();
                     ++it)
                {
                    if (!query.empty())
                        query += "&";
                    query += url_encode((*it)[1].str()) + "="
                             + url_encode(unescape_html((*it)[2].str()));
                }
                if (!query.empty())
                    action += "?" + query;
            }
            return action;
        }

        if (std::regex_search(html, match, confirm_re))
        {
            return fmt::format("https://drive.google.com/uc?export=download&confirm={}&id={}",
                               match[1].str(),
                               file_id);
        }
        return std::nullopt;
    }

    tl::expected<std::optional<std::string>, DownloaderError>
    GoogleDriveService::resolve_redirect(const Context& ctx,
                                         const std::string& url,
                                         const Response& probe) const
    {
        if (!is_interstitial(probe))
        {
            return std::optional<std::string>();
        }

        spdlog::info("Google Drive served a warning page, looking for the confirmation link");

        const std::string file_id = extract_file_id(url).value_or("");

        Response page;
        try
        {
            CURLHandle h(ctx, url);
            h.add_headers(request_headers(ctx, *this));
            page = h.perform();
        }
        catch (const curl_error& e)
        {
            return tl::unexpected(DownloaderError{
                ErrorLevel::FATAL,
                ErrorCode::CG_PROBE_FAILED,
                fmt::format("Could not fetch Google Drive warning page: {}", e.what()) });
        }

        auto confirmed = find_confirmation_url(page.content.value_or(""), file_id);
        if (!confirmed)
        {
            return tl::unexpected(DownloaderError{
                ErrorLevel::FATAL,
                ErrorCode::CG_NO_CONFIRM_TOKEN,
                fmt::format("No confirmation token found on the Google Drive page for {} "
                            "(the file may be private or over its download quota)",
                            url) });
        }

        spdlog::debug("Google Drive confirmation URL: {}", confirmed.value());
        return confirmed;
    }
}
