#include <cloudget/services/direct.hpp>
#include <cloudget/url.hpp>
#include <cloudget/utils.hpp>

namespace cloudget
{
    std::string_view DirectService::name() const noexcept
    {
        return "direct";
    }

    std::string_view DirectService::display_name() const noexcept
    {
        return "Direct link";
    }

    bool DirectService::supports(const std::string& url) const
    {
        const std::string lurl = to_lower(url);
        return starts_with(lurl, "http://") || starts_with(lurl, "https://")
               || starts_with(lurl, "file://");
    }

    tl::expected<std::string, DownloaderError> DirectService::resolve(
        const std::string& url) const
    {
        if (!supports(url))
        {
            return tl::unexpected(unsupported(fmt::format("Unsupported URL scheme: {}", url)));
        }
        return url;
    }

    std::string DirectService::placeholder_filename() const
    {
        return "download";
    }

    std::optional<std::string> DirectService::filename_from_url(const std::string& url) const
    {
        std::string name = url_basename(url);
        if (name.empty())
            return std::nullopt;
        return name;
    }
}
