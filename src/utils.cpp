#include <atomic>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <openssl/evp.h>
#include <spdlog/fmt/fmt.h>

#include <cloudget/utils.hpp>

namespace cloudget
{
    namespace
    {
        std::atomic<bool> sig_interrupted{ false };

        extern "C" void interrupt_handler(int)
        {
            sig_interrupted = true;
        }

        std::string digest_file(const fs::path& path, const EVP_MD* md)
        {
            unsigned char hash[EVP_MAX_MD_SIZE];
            unsigned int hash_len = 0;

            std::ifstream infile(path, std::ios::binary);
            if (!infile)
            {
                throw std::runtime_error("Could not open file for hashing: " + path.string());
            }

            EVP_MD_CTX* mdctx = EVP_MD_CTX_create();
            EVP_DigestInit_ex(mdctx, md, nullptr);

            constexpr std::size_t BUFSIZE = 32768;
            std::vector<char> buffer(BUFSIZE);

            while (infile)
            {
                infile.read(buffer.data(), BUFSIZE);
                size_t count = infile.gcount();
                if (!count)
                    break;
                EVP_DigestUpdate(mdctx, buffer.data(), count);
            }

            EVP_DigestFinal_ex(mdctx, hash, &hash_len);
            EVP_MD_CTX_destroy(mdctx);

            return hex_string(hash, hash_len);
        }
    }

    bool is_sig_interrupted()
    {
        return sig_interrupted;
    }

    void install_interrupt_handler()
    {
        std::signal(SIGINT, interrupt_handler);
#ifndef _WIN32
        std::signal(SIGTERM, interrupt_handler);
#endif
    }

    bool starts_with(const std::string_view& str, const std::string_view& prefix)
    {
        return str.size() >= prefix.size() && 0 == str.compare(0, prefix.size(), prefix);
    }

    bool ends_with(const std::string_view& str, const std::string_view& suffix)
    {
        return str.size() >= suffix.size()
               && 0 == str.compare(str.size() - suffix.size(), suffix.size(), suffix);
    }

    std::string string_transform(const std::string_view& input, int (*functor)(int))
    {
        std::string res(input);
        std::transform(
            res.begin(), res.end(), res.begin(), [&](unsigned char c) { return functor(c); });
        return res;
    }

    std::string to_upper(const std::string_view& input)
    {
        return string_transform(input, std::toupper);
    }

    std::string to_lower(const std::string_view& input)
    {
        return string_transform(input, std::tolower);
    }

    bool contains(const std::string_view& str, const std::string_view& sub_str)
    {
        return str.find(sub_str) != std::string::npos;
    }

    std::string strip(const std::string_view& input)
    {
        std::size_t begin = 0, end = input.size();
        while (begin < end && std::isspace(static_cast<unsigned char>(input[begin])))
            ++begin;
        while (end > begin && std::isspace(static_cast<unsigned char>(input[end - 1])))
            --end;
        return std::string(input.substr(begin, end - begin));
    }

    std::string sha256sum(const fs::path& path)
    {
        return digest_file(path, EVP_sha256());
    }

    std::string sha1sum(const fs::path& path)
    {
        return digest_file(path, EVP_sha1());
    }

    std::string sha512sum(const fs::path& path)
    {
        return digest_file(path, EVP_sha512());
    }

    std::string md5sum(const fs::path& path)
    {
        return digest_file(path, EVP_md5());
    }

    std::string checksum(const fs::path& path, ChecksumType type)
    {
        switch (type)
        {
            case ChecksumType::kSHA1:
                return sha1sum(path);
            case ChecksumType::kSHA512:
                return sha512sum(path);
            case ChecksumType::kMD5:
                return md5sum(path);
            case ChecksumType::kSHA256:
            default:
                return sha256sum(path);
        }
    }

    std::optional<ChecksumType> parse_checksum_type(const std::string_view& name)
    {
        const std::string lname = to_lower(name);
        if (lname == "sha256")
            return ChecksumType::kSHA256;
        if (lname == "sha1")
            return ChecksumType::kSHA1;
        if (lname == "sha512")
            return ChecksumType::kSHA512;
        if (lname == "md5")
            return ChecksumType::kMD5;
        return std::nullopt;
    }

    const char* checksum_name(ChecksumType type) noexcept
    {
        switch (type)
        {
            case ChecksumType::kSHA1:
                return "sha1";
            case ChecksumType::kSHA512:
                return "sha512";
            case ChecksumType::kMD5:
                return "md5";
            case ChecksumType::kSHA256:
            default:
                return "sha256";
        }
    }

    bool checksum_equal(const std::string_view& lhs, const std::string_view& rhs)
    {
        return to_lower(strip(lhs)) == to_lower(strip(rhs));
    }

    std::pair<std::string, std::string> parse_header(const std::string_view& header)
    {
        auto colon_idx = header.find(':');
        if (colon_idx != std::string_view::npos)
        {
            std::string_view key, value;
            key = header.substr(0, colon_idx);
            colon_idx++;
            // remove spaces
            while (colon_idx < header.size() && std::isspace(header[colon_idx]))
            {
                ++colon_idx;
            }

            // remove \r\n header ending
            value = header.substr(colon_idx);
            while (!value.empty() && (value.back() == '\n' || value.back() == '\r'))
            {
                value.remove_suffix(1);
            }
            // http headers are case insensitive!
            std::string lkey = to_lower(key);

            return std::make_pair(lkey, std::string(value));
        }
        return std::make_pair(std::string(), std::string(header));
    }

    std::string get_env(const char* var, const std::string& default_value)
    {
        const char* val = getenv(var);
        if (!val)
        {
            return default_value;
        }
        return val;
    }

    std::vector<std::string> split(const std::string_view& input,
                                   const std::string_view& sep,
                                   std::size_t max_split)
    {
        std::vector<std::string> result;
        std::size_t i = 0, j = 0, len = input.size(), n = sep.size();

        while (i + n <= len)
        {
            if (input[i] == sep[0] && input.substr(i, n) == sep)
            {
                if (max_split-- <= 0)
                    break;
                result.emplace_back(input.substr(j, i - j));
                i = j = i + n;
            }
            else
            {
                i++;
            }
        }
        result.emplace_back(input.substr(j, len - j));
        return result;
    }

    void replace_all(std::string& data, const std::string& search, const std::string& replace)
    {
        replace_all_impl<std::string>(data, search, replace);
    }

    std::optional<std::uint64_t> parse_size(const std::string_view& input)
    {
        const std::string str = to_upper(strip(input));
        if (str.empty())
            return std::nullopt;

        std::size_t pos = 0;
        while (pos < str.size() && (std::isdigit(static_cast<unsigned char>(str[pos])) || str[pos] == '.'))
        {
            ++pos;
        }
        if (pos == 0)
            return std::nullopt;

        double number = 0;
        try
        {
            number = std::stod(str.substr(0, pos));
        }
        catch (const std::exception&)
        {
            return std::nullopt;
        }

        std::string unit = strip(std::string_view(str).substr(pos));
        if (ends_with(unit, "IB"))
            unit.erase(unit.size() - 2, 1);  // "MIB" -> "MB"

        std::uint64_t multiplier = 1;
        if (unit.empty() || unit == "B")
            multiplier = 1;
        else if (unit == "K" || unit == "KB")
            multiplier = 1024ULL;
        else if (unit == "M" || unit == "MB")
            multiplier = 1024ULL * 1024;
        else if (unit == "G" || unit == "GB")
            multiplier = 1024ULL * 1024 * 1024;
        else if (unit == "T" || unit == "TB")
            multiplier = 1024ULL * 1024 * 1024 * 1024;
        else
            return std::nullopt;

        return static_cast<std::uint64_t>(number * static_cast<double>(multiplier));
    }

    std::string format_bytes(std::uint64_t bytes)
    {
        constexpr std::uint64_t unit = 1024;
        if (bytes < unit)
        {
            return fmt::format("{} B", bytes);
        }
        std::uint64_t div = unit;
        int exp = 0;
        for (std::uint64_t n = bytes / unit; n >= unit; n /= unit)
        {
            div *= unit;
            exp++;
        }
        return fmt::format("{:.1f} {}B", static_cast<double>(bytes) / div, "KMGTPE"[exp]);
    }
}
