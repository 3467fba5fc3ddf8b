#include <functional>
#include <map>
#include <stdexcept>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <yaml-cpp/yaml.h>

#include <cloudget/config.hpp>
#include <cloudget/context.hpp>
#include <cloudget/download.hpp>
#include <cloudget/utils.hpp>

namespace cloudget
{
    namespace
    {
        class config_error : public std::runtime_error
        {
        public:
            using std::runtime_error::runtime_error;
        };

        // Engine settings read from the file, applied to the Context only
        // once the whole document is valid.
        struct ContextSettings
        {
            std::optional<std::size_t> retries;
            std::optional<bool> ssl_verify;
            std::optional<std::string> ca_info;
            std::optional<std::string> user_agent;
            std::optional<std::vector<std::string>> headers;
            std::optional<std::map<std::string, std::string>> proxies;
            std::optional<long> connect_timeout;
        };

        template <class T>
        T as(const YAML::Node& node, const std::string& key)
        {
            try
            {
                return node.as<T>();
            }
            catch (const YAML::Exception&)
            {
                throw config_error(fmt::format("invalid value for '{}'", key));
            }
        }

        long positive(const YAML::Node& node, const std::string& key)
        {
            const long value = as<long>(node, key);
            if (value <= 0)
                throw config_error(fmt::format("'{}' must be positive, got {}", key, value));
            return value;
        }

        bool is_bool_literal(const YAML::Node& node)
        {
            if (!node.IsScalar())
                return false;
            const std::string value = to_lower(node.Scalar());
            return value == "true" || value == "false" || value == "yes" || value == "no"
                   || value == "on" || value == "off";
        }

        void parse(const YAML::Node& root, ContextSettings& settings, DownloadDefaults& defaults)
        {
            if (!root || root.IsNull())
                return;
            if (!root.IsMap())
                throw config_error("top level must be a mapping");

            for (auto it = root.begin(); it != root.end(); ++it)
            {
                const std::string key = as<std::string>(it->first, "key");
                const YAML::Node& value = it->second;

                if (key == "connections")
                {
                    const long connections = as<long>(value, key);
                    if (connections < static_cast<long>(min_connections)
                        || connections > static_cast<long>(max_connections))
                    {
                        throw config_error(fmt::format("'connections' must be between {} and {}",
                                                       min_connections,
                                                       max_connections));
                    }
                    defaults.connections = static_cast<std::size_t>(connections);
                }
                else if (key == "chunk_size")
                {
                    auto size = parse_size(as<std::string>(value, key));
                    if (!size || *size == 0)
                    {
                        throw config_error(
                            fmt::format("invalid chunk size '{}'", value.as<std::string>()));
                    }
                    defaults.chunk_size = static_cast<std::int64_t>(*size);
                }
                else if (key == "timeout")
                {
                    defaults.timeout = std::chrono::seconds(positive(value, key));
                }
                else if (key == "retries")
                {
                    settings.retries = static_cast<std::size_t>(positive(value, key));
                }
                else if (key == "retry_budget")
                {
                    const long budget = as<long>(value, key);
                    if (budget < 0)
                        throw config_error("'retry_budget' must not be negative");
                    defaults.retry_budget = static_cast<std::size_t>(budget);
                }
                else if (key == "output_dir")
                {
                    defaults.output_dir = as<std::string>(value, key);
                }
                else if (key == "resume")
                {
                    defaults.resume = as<bool>(value, key);
                }
                else if (key == "hash_algorithm")
                {
                    const std::string name = as<std::string>(value, key);
                    auto type = parse_checksum_type(name);
                    if (!type)
                        throw config_error(fmt::format("unknown hash algorithm '{}'", name));
                    defaults.hash_type = *type;
                }
                else if (key == "verbose")
                {
                    if (is_bool_literal(value))
                        defaults.verbosity = as<bool>(value, key) ? 1 : 0;
                    else
                        defaults.verbosity = as<int>(value, key);
                }
                else if (key == "ssl_verify")
                {
                    settings.ssl_verify = as<bool>(value, key);
                }
                else if (key == "ca_info")
                {
                    settings.ca_info = as<std::string>(value, key);
                }
                else if (key == "user_agent")
                {
                    settings.user_agent = as<std::string>(value, key);
                }
                else if (key == "headers")
                {
                    if (!value.IsSequence())
                        throw config_error("'headers' must be a list");
                    settings.headers = as<std::vector<std::string>>(value, key);
                }
                else if (key == "proxies")
                {
                    if (!value.IsMap())
                        throw config_error("'proxies' must be a mapping");
                    settings.proxies = as<std::map<std::string, std::string>>(value, key);
                }
                else if (key == "connect_timeout")
                {
                    settings.connect_timeout = positive(value, key);
                }
                else
                {
                    spdlog::warn("Ignoring unknown configuration key '{}'", key);
                }
            }
        }

        void apply(const ContextSettings& settings, Context& ctx)
        {
            if (settings.retries)
                ctx.max_chunk_attempts = *settings.retries;
            if (settings.ssl_verify)
                ctx.disable_ssl = !*settings.ssl_verify;
            if (settings.ca_info)
                ctx.ssl_ca_info = *settings.ca_info;
            if (settings.user_agent)
                ctx.user_agent = *settings.user_agent;
            if (settings.headers)
            {
                ctx.additional_httpheaders.insert(ctx.additional_httpheaders.end(),
                                                  settings.headers->begin(),
                                                  settings.headers->end());
            }
            if (settings.proxies)
            {
                for (const auto& [key, proxy] : *settings.proxies)
                    ctx.proxy_map[key] = proxy;
            }
            if (settings.connect_timeout)
                ctx.connect_timeout = *settings.connect_timeout;
        }

        tl::expected<void, DownloaderError> load(const std::string& origin,
                                                 const std::function<YAML::Node()>& loader,
                                                 Context& ctx,
                                                 DownloadDefaults& defaults)
        {
            ContextSettings settings;
            DownloadDefaults parsed = defaults;
            try
            {
                parse(loader(), settings, parsed);
            }
            catch (const YAML::Exception& e)
            {
                return tl::unexpected(DownloaderError{
                    ErrorLevel::FATAL, ErrorCode::CG_CONFIG, fmt::format("{}: {}", origin, e.what()) });
            }
            catch (const config_error& e)
            {
                return tl::unexpected(DownloaderError{
                    ErrorLevel::FATAL, ErrorCode::CG_CONFIG, fmt::format("{}: {}", origin, e.what()) });
            }

            apply(settings, ctx);
            defaults = parsed;
            return {};
        }
    }

    tl::expected<void, DownloaderError> load_config(const fs::path& path,
                                                    Context& ctx,
                                                    DownloadDefaults& defaults)
    {
        spdlog::info("Loading configuration {}", path.string());
        std::error_code ec;
        if (!fs::is_regular_file(path, ec))
        {
            return tl::unexpected(
                DownloaderError{ ErrorLevel::FATAL,
                                 ErrorCode::CG_CONFIG,
                                 fmt::format("Configuration file {} not found", path.string()) });
        }
        return load(
            path.string(), [&path]() { return YAML::LoadFile(path.string()); }, ctx, defaults);
    }

    tl::expected<void, DownloaderError> load_config_string(const std::string& yaml,
                                                           Context& ctx,
                                                           DownloadDefaults& defaults)
    {
        return load(
            "configuration", [&yaml]() { return YAML::Load(yaml); }, ctx, defaults);
    }

    std::optional<fs::path> default_config_path()
    {
        const std::string path = get_env("CLOUDGET_CONFIG", "");
        if (path.empty())
            return std::nullopt;
        return fs::path(path);
    }
}
