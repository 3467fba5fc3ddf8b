#include <algorithm>
#include <regex>

#include <spdlog/spdlog.h>

#include <cloudget/context.hpp>
#include <cloudget/service.hpp>
#include <cloudget/url.hpp>
#include <cloudget/utils.hpp>

namespace cloudget
{
    std::string Service::extract_filename(const std::string& url,
                                          const header_map_type* headers) const
    {
        if (headers)
        {
            auto it = headers->find("content-disposition");
            if (it != headers->end())
            {
                if (auto name = filename_from_content_disposition(it->second))
                {
                    const std::string sane = sanitize_filename(*name);
                    if (!sane.empty())
                        return sane;
                }
            }
        }

        if (auto name = filename_from_url(url))
        {
            const std::string sane = sanitize_filename(*name);
            if (!sane.empty())
                return sane;
        }
        return placeholder_filename();
    }

    std::vector<std::string> Service::default_headers() const
    {
        return {};
    }

    tl::expected<PreparedUrl, DownloaderError> Service::prepare(
        const Context&, const std::string& resolved_url) const
    {
        return PreparedUrl{ resolved_url };
    }

    tl::expected<std::optional<std::string>, DownloaderError> Service::resolve_redirect(
        const Context&, const std::string&, const Response&) const
    {
        return std::optional<std::string>();
    }

    std::optional<std::string> Service::filename_from_url(const std::string&) const
    {
        return std::nullopt;
    }

    DownloaderError Service::unsupported(const std::string& reason)
    {
        return DownloaderError{ ErrorLevel::FATAL, ErrorCode::CG_UNSUPPORTED_URL, reason };
    }

    std::optional<std::string> filename_from_content_disposition(const std::string& value)
    {
        static const std::regex plain_re(R"re(filename="?([^";\r\n]+)"?)re",
                                         std::regex::icase);
        static const std::regex ext_re(R"re(filename\*=UTF-8''([^;\r\n]+))re",
                                       std::regex::icase);

        std::smatch match;
        // filename* takes precedence over filename (RFC 6266)
        if (std::regex_search(value, match, ext_re))
        {
            return url_decode(strip(match[1].str()));
        }
        if (std::regex_search(value, match, plain_re))
        {
            return url_decode(strip(match[1].str()));
        }
        return std::nullopt;
    }

    std::vector<std::string> request_headers(const Context& ctx, const Service& service)
    {
        std::vector<std::string> headers = service.default_headers();
        headers.insert(
            headers.end(), ctx.additional_httpheaders.begin(), ctx.additional_httpheaders.end());

        const bool has_user_agent
            = std::any_of(headers.begin(),
                          headers.end(),
                          [](const std::string& h) { return starts_with(to_lower(h), "user-agent:"); });
        if (!has_user_agent && !ctx.user_agent.empty())
        {
            headers.push_back(fmt::format("User-Agent: {}", ctx.user_agent));
        }
        return headers;
    }

    std::string sanitize_filename(const std::string& name)
    {
        std::string res = name;
        auto slash = res.find_last_of("/\\");
        if (slash != std::string::npos)
            res = res.substr(slash + 1);

        res.erase(std::remove_if(res.begin(),
                                 res.end(),
                                 [](unsigned char c)
                                 { return c < 0x20 || c == ':' || c == '*' || c == '?' || c == '"'
                                          || c == '<' || c == '>' || c == '|'; }),
                  res.end());
        res = strip(res);
        if (res == "." || res == "..")
            return "";
        return res;
    }
}
