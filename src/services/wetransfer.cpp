#include <optional>
#include <regex>

#include <spdlog/spdlog.h>

#include <cloudget/context.hpp>
#include <cloudget/services/wetransfer.hpp>
#include <cloudget/utils.hpp>

#include "../curl_internal.hpp"

namespace cloudget
{
    namespace
    {
        DownloaderError api_error(const std::string& reason)
        {
            return DownloaderError{ ErrorLevel::FATAL, ErrorCode::CG_PROBE_FAILED, reason };
        }

        // GET `url`, or POST `body` as JSON when given, and parse the JSON answer.
        tl::expected<nlohmann::json, DownloaderError> json_request(
            const Context& ctx,
            const std::string& url,
            const std::vector<std::string>& headers,
            const std::optional<std::string>& body,
            const std::string& what)
        {
            Response response;
            try
            {
                CURLHandle h(ctx, url);
                h.add_headers(headers);
                if (body)
                    h.post_json(*body);
                response = h.perform();
            }
            catch (const curl_error& e)
            {
                return tl::unexpected(api_error(fmt::format("{} failed: {}", what, e.what())));
            }

            if (response.http_status != 200)
            {
                return tl::unexpected(api_error(
                    fmt::format("{} returned status code {}", what, response.http_status)));
            }

            try
            {
                return response.json();
            }
            catch (const nlohmann::json::exception& e)
            {
                return tl::unexpected(
                    api_error(fmt::format("{} returned invalid JSON: {}", what, e.what())));
            }
        }
    }

    WeTransferService::WeTransferService(std::string api_base)
        : m_api_base(std::move(api_base))
    {
    }

    std::string_view WeTransferService::name() const noexcept
    {
        return "wetransfer";
    }

    std::string_view WeTransferService::display_name() const noexcept
    {
        return "WeTransfer";
    }

    bool WeTransferService::supports(const std::string& url) const
    {
        const std::string lurl = to_lower(url);
        return contains(lurl, "wetransfer.com") || contains(lurl, "we.tl");
    }

    tl::expected<std::string, DownloaderError> WeTransferService::resolve(
        const std::string& url) const
    {
        if (!supports(url))
        {
            return tl::unexpected(unsupported(fmt::format("Not a WeTransfer URL: {}", url)));
        }
        if (!extract_transfer_id(url))
        {
            return tl::unexpected(
                unsupported(fmt::format("No transfer ID found in WeTransfer URL: {}", url)));
        }
        return url;
    }

    std::string WeTransferService::placeholder_filename() const
    {
        return "wetransfer_file";
    }

    std::vector<std::string> WeTransferService::default_headers() const
    {
        return { "Accept-Encoding: identity", fmt::format("User-Agent: {}", browser_user_agent) };
    }

    std::optional<std::string> WeTransferService::extract_transfer_id(const std::string& url)
    {
        static const std::regex short_re(R"(we\.tl/([a-zA-Z0-9]+))");
        static const std::regex long_re(R"(wetransfer\.com/downloads/([a-zA-Z0-9]+))");

        std::smatch match;
        if (std::regex_search(url, match, short_re) || std::regex_search(url, match, long_re))
        {
            return match[1].str();
        }
        return std::nullopt;
    }

    tl::expected<WeTransferInfo, DownloaderError> WeTransferService::parse_transfer_info(
        const nlohmann::json& j)
    {
        if (!j.is_object() || !j.contains("files") || !j["files"].is_array()
            || j["files"].empty())
        {
            return tl::unexpected(api_error("No files found in transfer"));
        }

        WeTransferInfo info;
        info.security_hash = j.value("security_hash", "");
        const auto& first = j["files"][0];
        info.filename = first.value("name", "");
        info.size = first.value("size", std::uint64_t(0));

        if (j["files"].size() > 1)
        {
            spdlog::warn("Transfer contains {} files, the download is served as one archive",
                         j["files"].size());
        }
        return info;
    }

    tl::expected<std::string, DownloaderError> WeTransferService::parse_direct_link(
        const nlohmann::json& j)
    {
        std::string link = j.is_object() ? j.value("direct_link", "") : "";
        if (link.empty())
        {
            return tl::unexpected(api_error("No direct download link received"));
        }
        return link;
    }

    tl::expected<PreparedUrl, DownloaderError> WeTransferService::prepare(
        const Context& ctx, const std::string& resolved_url) const
    {
        auto transfer_id = extract_transfer_id(resolved_url);
        if (!transfer_id)
        {
            return tl::unexpected(unsupported(
                fmt::format("No transfer ID found in WeTransfer URL: {}", resolved_url)));
        }
        spdlog::info("WeTransfer transfer ID: {}", transfer_id.value());

        std::vector<std::string> headers = request_headers(ctx, *this);
        headers.push_back("Accept: application/json");
        headers.push_back("X-Requested-With: XMLHttpRequest");

        const std::string transfer_url = fmt::format("{}/{}", m_api_base, transfer_id.value());
        auto info_json
            = json_request(ctx, transfer_url, headers, std::nullopt, "Transfer info request");
        if (!info_json)
            return tl::unexpected(info_json.error());

        auto info = parse_transfer_info(info_json.value());
        if (!info)
            return tl::unexpected(info.error());

        nlohmann::json payload
            = { { "intent", "entire_transfer" }, { "security_hash", info->security_hash } };

        auto link_json = json_request(
            ctx, transfer_url + "/download", headers, payload.dump(), "Download link request");
        if (!link_json)
            return tl::unexpected(link_json.error());

        auto link = parse_direct_link(link_json.value());
        if (!link)
            return tl::unexpected(link.error());

        PreparedUrl prepared{ link.value() };
        if (!info->filename.empty())
            prepared.filename = info->filename;
        return prepared;
    }
}
