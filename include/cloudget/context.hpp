#ifndef CLOUDGET_CONTEXT_HPP
#define CLOUDGET_CONTEXT_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include <cloudget/cloudget.hpp>
#include <cloudget/export.hpp>
#include <cloudget/curl.hpp>
#include <cloudget/service_registry.hpp>

namespace cloudget
{
    namespace fs = std::filesystem;

    using proxy_map_type = std::map<std::string, std::string>;

    // Options provided when starting a cloudget context.
    struct ContextOptions
    {
        // If set, specifies which SSL backend to use with CURL.
        std::optional<ssl_backend_t> ssl_backend;

        // Register dropbox, gdrive, wetransfer and direct on construction.
        bool register_default_services = true;
    };

    class CLOUDGET_API Context
    {
    public:
        int verbosity = 0;

        // ssl options
        bool disable_ssl = false;
        bool ssl_no_revoke = false;
        fs::path ssl_ca_info;

        // Per connection: give up on a connection that moves less than
        // `low_speed_limit` bytes/s for `low_speed_time` seconds.
        long connect_timeout = 30L;
        long low_speed_time = 30L;
        long low_speed_limit = 1000L;

        // This can improve throughput significantly
        // see https://github.com/curl/curl/issues/9601
        long transfer_buffersize = 100 * 1024;

        // Per chunk retry policy: delay = clamp(min * factor^(attempt - 1), min, max)
        std::size_t max_chunk_attempts = 3;
        std::size_t retry_backoff_factor = 2;
        std::chrono::milliseconds retry_backoff_min = std::chrono::seconds(1);
        std::chrono::milliseconds retry_backoff_max = std::chrono::seconds(10);

        std::string user_agent = "cloudget/" CLOUDGET_VERSION_STRING;
        std::vector<std::string> additional_httpheaders;
        proxy_map_type proxy_map;

        ServiceRegistry services;

        void set_verbosity(int v);
        void set_log_level(spdlog::level::level_enum);

        // Throws if another instance already exists: there can only be one at any time!
        Context(ContextOptions options = {});
        ~Context();

        Context(const Context&) = delete;
        Context& operator=(const Context&) = delete;
        Context(Context&&) = delete;
        Context& operator=(Context&&) = delete;

    private:
        struct Impl;
        std::unique_ptr<Impl> impl;  // Private implementation details
    };
}

#endif
