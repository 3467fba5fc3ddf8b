#ifndef CLOUDGET_URL_HPP
#define CLOUDGET_URL_HPP

#include <string>
#include <string_view>

extern "C"
{
#include <curl/curl.h>
}

#include <cloudget/export.hpp>
#include <cloudget/utils.hpp>

namespace cloudget
{
    // Thin wrapper around libcurl's URL API (CURLU).
    // Parsing failures throw `std::invalid_argument`.
    class CLOUDGET_API URLHandler
    {
    public:
        explicit URLHandler(const std::string& url = "");
        ~URLHandler();

        URLHandler(const URLHandler&);
        URLHandler& operator=(const URLHandler&);
        URLHandler(URLHandler&&);
        URLHandler& operator=(URLHandler&&);

        std::string url() const;

        std::string scheme() const;
        std::string host() const;
        std::string path() const;
        std::string query() const;
        std::string fragment() const;

        URLHandler& set_query(const std::string& query);

    private:
        std::string get_part(CURLUPart part, unsigned int flags = 0) const;
        void set_part(CURLUPart part, const std::string& value);

        CURLU* m_handle;
    };

    // Percent-decodes `str`. "+" is left untouched.
    CLOUDGET_API std::string url_decode(const std::string_view& str);

    // Percent-encodes everything except unreserved characters.
    CLOUDGET_API std::string url_encode(const std::string_view& str);

    CLOUDGET_API bool is_file_url(const std::string_view& url);

    // "file:///abs/path" for a local path.
    CLOUDGET_API std::string path_to_url(const fs::path& path);

    // Local path of a file:// URL.
    CLOUDGET_API fs::path file_url_to_path(const std::string& url);

    // The last non-empty segment of the (decoded) URL path, or an empty string.
    CLOUDGET_API std::string url_basename(const std::string& url);
}

#endif
