#ifndef CLOUDGET_UTILS_HPP
#define CLOUDGET_UTILS_HPP

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <cloudget/export.hpp>
#include <cloudget/enums.hpp>

namespace cloudget
{
    namespace fs = std::filesystem;

    // Set by the SIGINT handler, polled by the transfer loop.
    CLOUDGET_API bool is_sig_interrupted();
    CLOUDGET_API void install_interrupt_handler();

    CLOUDGET_API bool starts_with(const std::string_view& str, const std::string_view& prefix);
    CLOUDGET_API bool ends_with(const std::string_view& str, const std::string_view& suffix);

    template <class B>
    inline std::string hex_string(const B& buffer, std::size_t size)
    {
        std::ostringstream oss;
        oss << std::hex;
        for (std::size_t i = 0; i < size; ++i)
        {
            oss << std::setw(2) << std::setfill('0') << static_cast<int>(buffer[i]);
        }
        return oss.str();
    }

    template <class B>
    inline std::string hex_string(const B& buffer)
    {
        return hex_string(buffer, buffer.size());
    }

    CLOUDGET_API std::string string_transform(const std::string_view& input,
                                              int (*functor)(int));
    CLOUDGET_API std::string to_upper(const std::string_view& input);
    CLOUDGET_API std::string to_lower(const std::string_view& input);
    CLOUDGET_API bool contains(const std::string_view& str, const std::string_view& sub_str);
    CLOUDGET_API std::string strip(const std::string_view& input);

    // Streaming digests, read in fixed 32 KiB blocks.
    CLOUDGET_API std::string sha256sum(const fs::path& path);
    CLOUDGET_API std::string sha1sum(const fs::path& path);
    CLOUDGET_API std::string sha512sum(const fs::path& path);
    CLOUDGET_API std::string md5sum(const fs::path& path);
    CLOUDGET_API std::string checksum(const fs::path& path, ChecksumType type);

    CLOUDGET_API std::optional<ChecksumType> parse_checksum_type(const std::string_view& name);
    CLOUDGET_API const char* checksum_name(ChecksumType type) noexcept;

    // Case-insensitive comparison of two hex digests.
    CLOUDGET_API bool checksum_equal(const std::string_view& lhs, const std::string_view& rhs);

    CLOUDGET_API std::pair<std::string, std::string> parse_header(
        const std::string_view& header);
    CLOUDGET_API std::string get_env(const char* var, const std::string& default_value);

    CLOUDGET_API
    std::vector<std::string> split(const std::string_view& input,
                                   const std::string_view& sep,
                                   std::size_t max_split = SIZE_MAX);

    template <class S>
    inline void replace_all_impl(S& data, const S& search, const S& replace)
    {
        std::size_t pos = data.find(search);
        while (pos != std::string::npos)
        {
            data.replace(pos, search.size(), replace);
            pos = data.find(search, pos + replace.size());
        }
    }

    CLOUDGET_API
    void replace_all(std::string& data, const std::string& search, const std::string& replace);

    // "2MB", "512KB", "1.5GiB", "4096" -> bytes. Units are powers of 1024.
    CLOUDGET_API std::optional<std::uint64_t> parse_size(const std::string_view& input);

    // 1536 -> "1.5 KB"
    CLOUDGET_API std::string format_bytes(std::uint64_t bytes);
}

#endif
