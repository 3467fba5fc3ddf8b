#ifndef CLOUDGET_SRC_CURL_INTERNAL_HPP
#define CLOUDGET_SRC_CURL_INTERNAL_HPP

#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/fmt/fmt.h>

#include <cloudget/export.hpp>
#include <cloudget/utils.hpp>
#include <cloudget/enums.hpp>
#include <cloudget/curl.hpp>

namespace cloudget
{
    class Context;
    using proxy_map_type = std::map<std::string, std::string>;

    class CLOUDGET_API curl_error : public std::runtime_error
    {
    public:
        explicit curl_error(const std::string& what = "download error");
    };

    class CLOUDGET_API CURLHandle
    {
    public:
        explicit CURLHandle(const Context& ctx);
        CURLHandle(const Context& ctx, const std::string& url);
        ~CURLHandle();

        CURLHandle& url(const std::string& url, const proxy_map_type& proxies);

        // Headers-only request (HEAD). Redirects are followed.
        CURLHandle& nobody();
        CURLHandle& post_json(const std::string& body);

        Response perform();

        template <class T>
        tl::expected<T, CURLcode> getinfo(CURLINFO option);

        CURL* handle();

        const char* errorbuffer() const noexcept
        {
            return m_errorbuffer;
        }

        CURLHandle& add_header(const std::string& header);
        CURLHandle& add_headers(const std::vector<std::string>& headers);

        template <class T>
        CURLHandle& setopt(CURLoption opt, const T& val);

        void set_default_callbacks();

        CURLHandle(CURLHandle&& rhs);
        CURLHandle& operator=(CURLHandle&& rhs);

    private:
        void init_handle(const Context& ctx);
        void finalize_transfer(Response& response);

        CURL* m_handle;
        curl_slist* p_headers = nullptr;
        char m_errorbuffer[CURL_ERROR_SIZE];
        std::string m_post_body;

        std::unique_ptr<Response> response;
    };

    template <class T>
    CURLHandle& CURLHandle::setopt(CURLoption opt, const T& val)
    {
        CURLcode ok;
        if constexpr (std::is_same<T, std::string>())
        {
            ok = curl_easy_setopt(m_handle, opt, val.c_str());
        }
        else if constexpr (std::is_same<T, bool>())
        {
            ok = curl_easy_setopt(m_handle, opt, val ? 1L : 0L);
        }
        else
        {
            ok = curl_easy_setopt(m_handle, opt, val);
        }
        if (ok != CURLE_OK)
        {
            throw curl_error(
                fmt::format("curl: curl_easy_setopt failed {}", curl_easy_strerror(ok)));
        }
        return *this;
    }

    std::optional<std::string> proxy_match(const proxy_map_type& ctx, const std::string& url);
}

namespace cloudget::details
{
    // Scoped initialization and termination of CURL.
    // This should never have more than one instance live at any time,
    // this object's constructor will throw an `std::runtime_error` if it's the case.
    class CURLSetup final
    {
    public:
        explicit CURLSetup(const std::optional<ssl_backend_t>& ssl_backend);
        ~CURLSetup();

        CURLSetup(CURLSetup&&) = delete;
        CURLSetup& operator=(CURLSetup&&) = delete;

        CURLSetup(const CURLSetup&) = delete;
        CURLSetup& operator=(const CURLSetup&) = delete;
    };
}
#endif
