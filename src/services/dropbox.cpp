#include <spdlog/spdlog.h>

#include <cloudget/services/dropbox.hpp>
#include <cloudget/url.hpp>
#include <cloudget/utils.hpp>

namespace cloudget
{
    namespace
    {
        bool has_share_marker(const std::string& path)
        {
            return contains(path, "/s/") || contains(path, "/scl/fi/");
        }

        std::string url_path(const std::string& url)
        {
            try
            {
                return URLHandler(url).path();
            }
            catch (const std::invalid_argument&)
            {
                return "";
            }
        }
    }

    std::string_view DropboxService::name() const noexcept
    {
        return "dropbox";
    }

    std::string_view DropboxService::display_name() const noexcept
    {
        return "Dropbox";
    }

    bool DropboxService::supports(const std::string& url) const
    {
        return contains(to_lower(url), "dropbox.com");
    }

    tl::expected<std::string, DownloaderError> DropboxService::resolve(
        const std::string& url) const
    {
        if (!supports(url))
        {
            return tl::unexpected(unsupported(fmt::format("Not a Dropbox URL: {}", url)));
        }
        if (!has_share_marker(url_path(url)))
        {
            return tl::unexpected(
                unsupported(fmt::format("Unsupported Dropbox URL format: {}", url)));
        }

        std::string resolved = set_dropbox_download_flag(url);
        spdlog::debug("Dropbox: {} -> {}", url, resolved);
        return resolved;
    }

    std::string DropboxService::placeholder_filename() const
    {
        return "downloaded_file";
    }

    std::optional<std::string> DropboxService::filename_from_url(const std::string& url) const
    {
        const std::string path = url_decode(url_path(url));
        const auto parts = split(path, "/");

        if (contains(path, "/s/"))
        {
            // /s/<hash>/<name>
            if (parts.size() >= 4 && !parts.back().empty())
            {
                return parts.back();
            }
        }
        else if (contains(path, "/scl/fi/"))
        {
            for (auto it = parts.rbegin(); it != parts.rend(); ++it)
            {
                if (!it->empty() && contains(*it, "."))
                    return *it;
            }
        }
        return std::nullopt;
    }

    std::string set_dropbox_download_flag(const std::string& url)
    {
        URLHandler handler(url);
        const std::string query = handler.query();

        std::vector<std::string> params;
        if (!query.empty())
        {
            params = split(query, "&");
        }

        bool found = false;
        for (auto& param : params)
        {
            if (param == "dl" || starts_with(param, "dl="))
            {
                param = "dl=1";
                found = true;
            }
        }
        if (!found)
        {
            params.push_back("dl=1");
        }

        std::string new_query;
        for (const auto& param : params)
        {
            if (!new_query.empty())
                new_query += "&";
            new_query += param;
        }
        return handler.set_query(new_query).url();
    }
}
