#include <atomic>

#include <spdlog/spdlog.h>

#include <cloudget/context.hpp>
#include <cloudget/curl.hpp>
#include <cloudget/url.hpp>
#include <cloudget/utils.hpp>

#include "curl_internal.hpp"

namespace cloudget
{
    /**************
     * curl_error *
     **************/

    curl_error::curl_error(const std::string& what)
        : std::runtime_error(what)
    {
    }

    /**************
     * CURLHandle *
     **************/

    CURLHandle::CURLHandle(const Context& ctx)
        : m_handle(curl_easy_init())
    {
        if (m_handle == nullptr)
        {
            throw curl_error("Could not initialize CURL handle");
        }

        init_handle(ctx);
        // Set error buffer
        m_errorbuffer[0] = '\0';
        setopt(CURLOPT_ERRORBUFFER, m_errorbuffer);
    }

    void CURLHandle::init_handle(const Context& ctx)
    {
        setopt(CURLOPT_FOLLOWLOCATION, 1L);
        setopt(CURLOPT_NETRC, static_cast<long>(CURL_NETRC_OPTIONAL));
        setopt(CURLOPT_MAXREDIRS, 10L);
        setopt(CURLOPT_CONNECTTIMEOUT, ctx.connect_timeout);
        setopt(CURLOPT_LOW_SPEED_TIME, ctx.low_speed_time);
        setopt(CURLOPT_LOW_SPEED_LIMIT, ctx.low_speed_limit);
        setopt(CURLOPT_BUFFERSIZE, ctx.transfer_buffersize);
        setopt(CURLOPT_NOSIGNAL, 1L);

        if (ctx.disable_ssl)
        {
            spdlog::debug("SSL verification is disabled");
            setopt(CURLOPT_SSL_VERIFYHOST, 0L);
            setopt(CURLOPT_SSL_VERIFYPEER, 0L);

            // also disable proxy SSL verification
            setopt(CURLOPT_PROXY_SSL_VERIFYPEER, 0L);
            setopt(CURLOPT_PROXY_SSL_VERIFYHOST, 0L);
        }
        else
        {
            setopt(CURLOPT_SSL_VERIFYHOST, 2L);
            setopt(CURLOPT_SSL_VERIFYPEER, 1L);

            // Windows SSL backend doesn't support this
            CURLcode verifystatus = curl_easy_setopt(m_handle, CURLOPT_SSL_VERIFYSTATUS, 0L);
            if (verifystatus != CURLE_OK && verifystatus != CURLE_NOT_BUILT_IN)
                throw curl_error("Could not initialize CURL handle");

            if (!ctx.ssl_ca_info.empty())
            {
                setopt(CURLOPT_CAINFO, ctx.ssl_ca_info.string());
            }

            if (ctx.ssl_no_revoke)
            {
                setopt(CURLOPT_SSL_OPTIONS, static_cast<long>(CURLSSLOPT_NO_REVOKE));
            }
        }

        if (ctx.verbosity > 1)
            setopt(CURLOPT_VERBOSE, 1L);
    }

    CURLHandle::CURLHandle(const Context& ctx, const std::string& url)
        : CURLHandle(ctx)
    {
        this->url(url, ctx.proxy_map);
    }

    CURLHandle::~CURLHandle()
    {
        if (m_handle)
        {
            curl_easy_cleanup(m_handle);
        }
        if (p_headers)
        {
            curl_slist_free_all(p_headers);
        }
    }

    CURLHandle::CURLHandle(CURLHandle&& rhs)
        : m_handle(rhs.m_handle)
        , p_headers(rhs.p_headers)
        , m_post_body(std::move(rhs.m_post_body))
        , response(std::move(rhs.response))
    {
        rhs.m_handle = nullptr;
        rhs.p_headers = nullptr;
        std::copy(&rhs.m_errorbuffer[0], &rhs.m_errorbuffer[CURL_ERROR_SIZE], &m_errorbuffer[0]);
        if (m_handle)
            setopt(CURLOPT_ERRORBUFFER, m_errorbuffer);
    }

    CURLHandle& CURLHandle::operator=(CURLHandle&& rhs)
    {
        using std::swap;
        swap(m_handle, rhs.m_handle);
        swap(p_headers, rhs.p_headers);
        swap(m_errorbuffer, rhs.m_errorbuffer);
        swap(m_post_body, rhs.m_post_body);
        swap(response, rhs.response);
        if (m_handle)
            setopt(CURLOPT_ERRORBUFFER, m_errorbuffer);
        if (rhs.m_handle)
            rhs.setopt(CURLOPT_ERRORBUFFER, rhs.m_errorbuffer);
        return *this;
    }

    CURLHandle& CURLHandle::url(const std::string& url, const proxy_map_type& proxies)
    {
        setopt(CURLOPT_URL, url);
        const auto match = proxy_match(proxies, url);
        if (match)
        {
            setopt(CURLOPT_PROXY, match.value());
        }
        return *this;
    }

    CURLHandle& CURLHandle::nobody()
    {
        setopt(CURLOPT_NOBODY, 1L);
        return *this;
    }

    CURLHandle& CURLHandle::post_json(const std::string& body)
    {
        m_post_body = body;
        add_header("Content-Type: application/json");
        setopt(CURLOPT_POST, 1L);
        setopt(CURLOPT_POSTFIELDS, m_post_body.c_str());
        setopt(CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(m_post_body.size()));
        return *this;
    }

    Response CURLHandle::perform()
    {
        set_default_callbacks();
        CURLcode curl_result = curl_easy_perform(handle());
        if (curl_result != CURLE_OK)
        {
            throw curl_error(
                fmt::format("{} [{}]", curl_easy_strerror(curl_result), m_errorbuffer));
        }
        finalize_transfer(*response);
        Response result = std::move(*response);
        response.reset();
        return result;
    }

    void CURLHandle::finalize_transfer(Response& lresponse)
    {
        lresponse.fill_values(*this);
        if (!lresponse.ok())
        {
            spdlog::debug("Received {} from {}", lresponse.http_status, lresponse.effective_url);
        }
    }

    template <class T>
    tl::expected<T, CURLcode> CURLHandle::getinfo(CURLINFO option)
    {
        T val;
        CURLcode result = curl_easy_getinfo(m_handle, option, &val);
        if (result != CURLE_OK)
            return tl::unexpected(result);
        return val;
    }

    template tl::expected<long, CURLcode> CURLHandle::getinfo(CURLINFO option);
    template tl::expected<char*, CURLcode> CURLHandle::getinfo(CURLINFO option);

    template <>
    tl::expected<std::string, CURLcode> CURLHandle::getinfo(CURLINFO option)
    {
        auto res = getinfo<char*>(option);
        if (!res)
            return tl::unexpected(res.error());
        if (res.value() == nullptr)
            return std::string();
        return std::string(res.value());
    }

    CURL* CURLHandle::handle()
    {
        if (p_headers)
            setopt(CURLOPT_HTTPHEADER, p_headers);
        return m_handle;
    }

    CURLHandle& CURLHandle::add_header(const std::string& header)
    {
        curl_slist* headers = curl_slist_append(p_headers, header.c_str());
        if (!headers)
        {
            throw std::bad_alloc();
        }
        p_headers = headers;
        return *this;
    }

    CURLHandle& CURLHandle::add_headers(const std::vector<std::string>& headers)
    {
        for (auto& h : headers)
        {
            add_header(h);
        }
        return *this;
    }

    namespace
    {
        template <class T>
        std::size_t string_callback(char* buffer, std::size_t size, std::size_t nitems, T* string)
        {
            string->append(buffer, size * nitems);
            return size * nitems;
        }

        template <class T>
        std::size_t header_map_callback(char* buffer,
                                        std::size_t size,
                                        std::size_t nitems,
                                        T* header_map)
        {
            std::string_view header(buffer, size * nitems);
            // a new status line starts the headers of the next response in a redirect chain
            if (starts_with(header, "HTTP/"))
            {
                header_map->clear();
                return size * nitems;
            }
            auto kv = parse_header(header);
            if (!kv.first.empty())
            {
                (*header_map)[kv.first] = kv.second;
            }
            return size * nitems;
        }
    }

    void CURLHandle::set_default_callbacks()
    {
        response.reset(new Response);
        setopt(CURLOPT_HEADERFUNCTION, header_map_callback<header_map_type>);
        setopt(CURLOPT_HEADERDATA, &response->headers);

        setopt(CURLOPT_WRITEFUNCTION, string_callback<std::string>);
        response->content = std::string();
        setopt(CURLOPT_WRITEDATA, &response->content.value());
    }

    /************
     * Response *
     ************/

    bool Response::ok() const
    {
        return http_status / 100 == 2;
    }

    tl::expected<std::string, std::out_of_range> Response::get_header(
        const std::string& header) const
    {
        auto it = headers.find(to_lower(header));
        if (it != headers.end())
            return it->second;
        else
            return tl::unexpected(
                std::out_of_range(std::string("Could not find header ") + header));
    }

    nlohmann::json Response::json() const
    {
        try
        {
            return nlohmann::json::parse(content.value_or(""));
        }
        catch (const nlohmann::json::parse_error& e)
        {
            spdlog::error("Could not parse JSON\n{}", content.value_or(""));
            spdlog::error("Error message: {}", e.what());
            throw;
        }
    }

    void Response::fill_values(CURLHandle& handle)
    {
        http_status = handle.getinfo<long>(CURLINFO_RESPONSE_CODE).value_or(0);
        effective_url = handle.getinfo<std::string>(CURLINFO_EFFECTIVE_URL).value_or("");
    }

    std::optional<std::string> proxy_match(const proxy_map_type& proxies, const std::string& url)
    {
        // This is a reimplementation of requests.utils.select_proxy()
        // of the python requests library
        if (proxies.empty())
        {
            return std::nullopt;
        }

        std::string scheme, host;
        try
        {
            auto handler = URLHandler(url);
            scheme = handler.scheme();
            host = handler.host();
        }
        catch (const std::invalid_argument&)
        {
            return std::nullopt;
        }

        std::vector<std::string> options;
        if (host.empty())
        {
            options = {
                scheme,
                "all",
            };
        }
        else
        {
            options = { scheme + "://" + host, scheme, "all://" + host, "all" };
        }

        for (auto& option : options)
        {
            auto proxy = proxies.find(option);
            if (proxy != proxies.end())
            {
                return proxy->second;
            }
        }

        return std::nullopt;
    }

    namespace details
    {
        static std::atomic<bool> is_curl_setup_alive{ false };

        CURLSetup::CURLSetup(const std::optional<ssl_backend_t>& ssl_backend)
        {
            {
                bool expected = false;
                if (!is_curl_setup_alive.compare_exchange_strong(expected, true))
                    throw std::runtime_error(
                        "cloudget::CURLSetup created more than once - instance must be unique");
            }

            if (ssl_backend)
            {
                const auto res = curl_global_sslset(
                    static_cast<curl_sslbackend>(ssl_backend.value()), nullptr, nullptr);
                if (res != CURLSSLSET_OK)
                {
                    is_curl_setup_alive = false;
                    if (res == CURLSSLSET_UNKNOWN_BACKEND)
                        throw curl_error("unknown curl ssl backend");
                    else if (res == CURLSSLSET_NO_BACKENDS)
                        throw curl_error("no curl ssl backend available");
                    else if (res == CURLSSLSET_TOO_LATE)
                        throw curl_error("curl ssl backend set too late");
                    throw curl_error("failed to set curl ssl backend");
                }
            }

            if (curl_global_init(CURL_GLOBAL_ALL) != 0)
            {
                is_curl_setup_alive = false;
                throw curl_error("failed to initialize curl");
            }
        }

        CURLSetup::~CURLSetup()
        {
            curl_global_cleanup();
            is_curl_setup_alive = false;
        }
    }
}
