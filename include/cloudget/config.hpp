#ifndef CLOUDGET_CONFIG_HPP
#define CLOUDGET_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <tl/expected.hpp>

#include <cloudget/export.hpp>
#include <cloudget/enums.hpp>
#include <cloudget/errors.hpp>

namespace cloudget
{
    namespace fs = std::filesystem;

    class Context;

    // Per-download settings a configuration file can change. The command
    // line starts from these and overrides what it was given explicitly.
    struct DownloadDefaults
    {
        std::size_t connections = 8;
        std::int64_t chunk_size = 2 * 1024 * 1024;
        std::chrono::seconds timeout = std::chrono::seconds(300);
        std::size_t retry_budget = 0;
        fs::path output_dir = ".";
        bool resume = true;
        ChecksumType hash_type = ChecksumType::kSHA256;
        int verbosity = 0;
    };

    /** Reads a YAML configuration file.
     *
     * Engine-wide keys (`retries`, `ssl_verify`, `ca_info`, `user_agent`,
     * `headers`, `proxies`, `connect_timeout`) go into `ctx`, per-download keys
     * (`connections`, `chunk_size`, `timeout`, `retry_budget`, `output_dir`,
     * `resume`, `hash_algorithm`, `verbose`) into `defaults`. Unknown keys are
     * ignored with a warning. Any invalid value is a `CG_CONFIG` error and
     * leaves `ctx` and `defaults` untouched.
     */
    CLOUDGET_API tl::expected<void, DownloaderError> load_config(const fs::path& path,
                                                                 Context& ctx,
                                                                 DownloadDefaults& defaults);

    // Same as `load_config` for a YAML document held in memory.
    CLOUDGET_API tl::expected<void, DownloaderError> load_config_string(const std::string& yaml,
                                                                        Context& ctx,
                                                                        DownloadDefaults& defaults);

    // Path named by the CLOUDGET_CONFIG environment variable, if set.
    CLOUDGET_API std::optional<fs::path> default_config_path();
}

#endif
