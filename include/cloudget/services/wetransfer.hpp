#ifndef CLOUDGET_SERVICES_WETRANSFER_HPP
#define CLOUDGET_SERVICES_WETRANSFER_HPP

#include <nlohmann/json.hpp>

#include <cloudget/service.hpp>

namespace cloudget
{
    struct WeTransferInfo
    {
        std::string security_hash;
        std::string filename;
        std::uint64_t size = 0;
    };

    // we.tl short links and wetransfer.com/downloads pages. The file URL is
    // obtained from the public transfer API before probing.
    class CLOUDGET_API WeTransferService : public Service
    {
    public:
        explicit WeTransferService(std::string api_base = "https://wetransfer.com/api/v4/transfers");

        std::string_view name() const noexcept override;
        std::string_view display_name() const noexcept override;

        bool supports(const std::string& url) const override;
        tl::expected<std::string, DownloaderError> resolve(const std::string& url) const override;
        std::string placeholder_filename() const override;
        std::vector<std::string> default_headers() const override;

        tl::expected<PreparedUrl, DownloaderError> prepare(
            const Context& ctx, const std::string& resolved_url) const override;

        static std::optional<std::string> extract_transfer_id(const std::string& url);

        // Reads the `GET <api>/<id>` answer.
        static tl::expected<WeTransferInfo, DownloaderError> parse_transfer_info(
            const nlohmann::json& j);

        // Reads `direct_link` from the `POST <api>/<id>/download` answer.
        static tl::expected<std::string, DownloaderError> parse_direct_link(
            const nlohmann::json& j);

    private:
        std::string m_api_base;
    };
}

#endif
