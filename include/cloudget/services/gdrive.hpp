#ifndef CLOUDGET_SERVICES_GDRIVE_HPP
#define CLOUDGET_SERVICES_GDRIVE_HPP

#include <cloudget/service.hpp>

namespace cloudget
{
    // drive.google.com / docs.google.com share links. Large files are served
    // behind a "can't scan this file for viruses" page which has to be scraped
    // for the confirmation form before the bytes are reachable.
    class CLOUDGET_API GoogleDriveService : public Service
    {
    public:
        std::string_view name() const noexcept override;
        std::string_view display_name() const noexcept override;

        bool supports(const std::string& url) const override;
        tl::expected<std::string, DownloaderError> resolve(const std::string& url) const override;
        std::string placeholder_filename() const override;
        std::vector<std::string> default_headers() const override;

        tl::expected<std::optional<std::string>, DownloaderError> resolve_redirect(
            const Context& ctx, const std::string& url, const Response& probe) const override;

        // `/file/d/<id>`, `[?&]id=<id>`, `/open?id=<id>`, `/d/<id>`, in that order.
        static std::optional<std::string> extract_file_id(const std::string& url);

        // True when the probe did not land on the file but on a sign-in or warning page.
        static bool is_interstitial(const Response& probe);

        // Scans the warning page for the download form (or a bare confirm token)
        // and returns the URL that serves the file.
        static std::optional<std::string> find_confirmation_url(const std::string& html,
                                                                const std::string& file_id);
    };
}

#endif
