#ifndef CLOUDGET_SERVICES_DIRECT_HPP
#define CLOUDGET_SERVICES_DIRECT_HPP

#include <cloudget/service.hpp>

namespace cloudget
{
    // Catch-all for plain http(s):// and file:// URLs, fetched as they are.
    class CLOUDGET_API DirectService : public Service
    {
    public:
        std::string_view name() const noexcept override;
        std::string_view display_name() const noexcept override;

        bool supports(const std::string& url) const override;
        tl::expected<std::string, DownloaderError> resolve(const std::string& url) const override;
        std::string placeholder_filename() const override;

    protected:
        std::optional<std::string> filename_from_url(const std::string& url) const override;
    };
}

#endif
