#ifndef CLOUDGET_CURL_HPP
#define CLOUDGET_CURL_HPP

#include <map>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

extern "C"
{
#include <curl/curl.h>
}

#include <cloudget/export.hpp>

namespace cloudget
{
    class CURLHandle;

    using header_map_type = std::map<std::string, std::string>;

    enum class ssl_backend_t
    {
        none = CURLSSLBACKEND_NONE,
        openssl = CURLSSLBACKEND_OPENSSL,
        gnutls = CURLSSLBACKEND_GNUTLS,
        wolfssl = CURLSSLBACKEND_WOLFSSL,
        schannel = CURLSSLBACKEND_SCHANNEL,
        securetransport = CURLSSLBACKEND_SECURETRANSPORT,
        mbedtls = CURLSSLBACKEND_MBEDTLS,
        bearssl = CURLSSLBACKEND_BEARSSL,
        rustls = CURLSSLBACKEND_RUSTLS,
    };

    // Result of a blocking request made with `CURLHandle::perform()`.
    struct CLOUDGET_API Response
    {
        // Lower-cased header names. Only the headers of the last response in a
        // redirect chain are kept.
        header_map_type headers;

        long http_status = 0;
        std::string effective_url;

        bool ok() const;

        tl::expected<std::string, std::out_of_range> get_header(const std::string& header) const;

        void fill_values(CURLHandle& handle);

        // Only filled when the body was requested (not for HEAD probes).
        std::optional<std::string> content;
        nlohmann::json json() const;
    };
}

#endif
