#include <stdexcept>

#include <spdlog/fmt/fmt.h>

#include <cloudget/url.hpp>

namespace cloudget
{
    URLHandler::URLHandler(const std::string& url)
        : m_handle(curl_url())
    {
        if (m_handle == nullptr)
        {
            throw std::runtime_error("Could not create CURLU handle");
        }
        if (!url.empty())
        {
            const CURLUcode uc = curl_url_set(m_handle, CURLUPART_URL, url.c_str(), 0);
            if (uc != CURLUE_OK)
            {
                curl_url_cleanup(m_handle);
                m_handle = nullptr;
                throw std::invalid_argument(fmt::format("Could not parse URL '{}'", url));
            }
        }
    }

    URLHandler::~URLHandler()
    {
        if (m_handle)
        {
            curl_url_cleanup(m_handle);
        }
    }

    URLHandler::URLHandler(const URLHandler& rhs)
        : m_handle(curl_url_dup(rhs.m_handle))
    {
    }

    URLHandler& URLHandler::operator=(const URLHandler& rhs)
    {
        URLHandler tmp(rhs);
        std::swap(m_handle, tmp.m_handle);
        return *this;
    }

    URLHandler::URLHandler(URLHandler&& rhs)
        : m_handle(rhs.m_handle)
    {
        rhs.m_handle = nullptr;
    }

    URLHandler& URLHandler::operator=(URLHandler&& rhs)
    {
        std::swap(m_handle, rhs.m_handle);
        return *this;
    }

    std::string URLHandler::get_part(CURLUPart part, unsigned int flags) const
    {
        char* value = nullptr;
        const CURLUcode uc = curl_url_get(m_handle, part, &value, flags);
        if (uc != CURLUE_OK || value == nullptr)
        {
            return "";
        }
        std::string res(value);
        curl_free(value);
        return res;
    }

    void URLHandler::set_part(CURLUPart part, const std::string& value)
    {
        const CURLUcode uc
            = curl_url_set(m_handle, part, value.empty() ? nullptr : value.c_str(), 0);
        if (uc != CURLUE_OK)
        {
            throw std::invalid_argument(fmt::format("Could not set URL part to '{}'", value));
        }
    }

    std::string URLHandler::url() const
    {
        return get_part(CURLUPART_URL);
    }

    std::string URLHandler::scheme() const
    {
        return get_part(CURLUPART_SCHEME);
    }

    std::string URLHandler::host() const
    {
        return get_part(CURLUPART_HOST);
    }

    std::string URLHandler::path() const
    {
        return get_part(CURLUPART_PATH);
    }

    std::string URLHandler::query() const
    {
        return get_part(CURLUPART_QUERY);
    }

    std::string URLHandler::fragment() const
    {
        return get_part(CURLUPART_FRAGMENT);
    }

    URLHandler& URLHandler::set_query(const std::string& query)
    {
        set_part(CURLUPART_QUERY, query);
        return *this;
    }

    std::string url_decode(const std::string_view& str)
    {
        std::string res;
        res.reserve(str.size());
        for (std::size_t i = 0; i < str.size(); ++i)
        {
            if (str[i] == '%' && i + 2 < str.size()
                && std::isxdigit(static_cast<unsigned char>(str[i + 1]))
                && std::isxdigit(static_cast<unsigned char>(str[i + 2])))
            {
                res.push_back(
                    static_cast<char>(std::stoi(std::string(str.substr(i + 1, 2)), nullptr, 16)));
                i += 2;
            }
            else
            {
                res.push_back(str[i]);
            }
        }
        return res;
    }

    std::string url_encode(const std::string_view& str)
    {
        std::string res;
        res.reserve(str.size() * 3);
        for (unsigned char c : str)
        {
            if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
            {
                res.push_back(static_cast<char>(c));
            }
            else
            {
                res += fmt::format("%{:02X}", c);
            }
        }
        return res;
    }

    bool is_file_url(const std::string_view& url)
    {
        return starts_with(url, "file://");
    }

    std::string path_to_url(const fs::path& path)
    {
        std::string abs = fs::absolute(path).lexically_normal().generic_string();
        if (!starts_with(abs, "/"))
        {
            // drive letter paths, "C:/x" -> "/C:/x"
            abs = "/" + abs;
        }
        std::string res = "file://";
        for (const auto& part : split(abs.substr(1), "/"))
        {
            res += "/";
            res += (ends_with(part, ":") ? part : url_encode(part));
        }
        return res;
    }

    fs::path file_url_to_path(const std::string& url)
    {
        std::string path = url_decode(URLHandler(url).path());
        // "/C:/x" -> "C:/x"
        if (path.size() > 2 && path[0] == '/' && path[2] == ':')
        {
            path = path.substr(1);
        }
        return fs::path(path);
    }

    std::string url_basename(const std::string& url)
    {
        std::string path;
        try
        {
            path = URLHandler(url).path();
        }
        catch (const std::invalid_argument&)
        {
            return "";
        }
        path = url_decode(path);
        auto parts = split(path, "/");
        for (auto it = parts.rbegin(); it != parts.rend(); ++it)
        {
            if (!it->empty())
                return *it;
        }
        return "";
    }
}
