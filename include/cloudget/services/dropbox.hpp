#ifndef CLOUDGET_SERVICES_DROPBOX_HPP
#define CLOUDGET_SERVICES_DROPBOX_HPP

#include <cloudget/service.hpp>

namespace cloudget
{
    // Shared links of the form
    //   https://www.dropbox.com/s/<hash>/<name>?dl=0
    //   https://www.dropbox.com/scl/fi/<id>/<name>?rlkey=<key>&dl=0
    // serve the file itself once the `dl` flag is set to 1.
    class CLOUDGET_API DropboxService : public Service
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

    // Sets `dl=1` in the query of `url`, keeping every other parameter in place.
    // Throws std::invalid_argument if `url` does not parse.
    CLOUDGET_API std::string set_dropbox_download_flag(const std::string& url);
}

#endif
