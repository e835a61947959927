#include "app/DaemonConfig.hpp"

#include "utils/FS.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string_view>

#include <unistd.h>

namespace ft::app
{

namespace
{
constexpr char const *kServiceRoot = "/srv/torrent-downloader";

std::optional<int> parse_int_value(char const *key,
                                   std::optional<std::string> const &value)
{
    if (!value || value->empty())
    {
        return std::nullopt;
    }
    try
    {
        std::size_t consumed = 0;
        auto parsed = std::stoi(*value, &consumed);
        if (consumed != value->size())
        {
            throw std::invalid_argument("trailing characters");
        }
        return parsed;
    }
    catch (std::exception const &)
    {
        FT_LOG_WARN("ignoring {}={}: not an integer", key, *value);
        return std::nullopt;
    }
}

std::optional<bool> parse_bool_value(std::optional<std::string> const &value)
{
    if (!value)
    {
        return std::nullopt;
    }
    std::string lowered = *value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return lowered == "true" || lowered == "1" || lowered == "yes";
}

// Service directory when it can be created and written, else data root.
std::filesystem::path default_root()
{
    std::filesystem::path service_root(kServiceRoot);
    if (ft::utils::ensure_directory(service_root) &&
        ::access(service_root.c_str(), W_OK) == 0)
    {
        return service_root;
    }
    return ft::utils::data_root();
}
} // namespace

std::optional<std::string> read_process_env(char const *key)
{
    auto value = std::getenv(key);
    if (value == nullptr)
    {
        return std::nullopt;
    }
    return std::string(value);
}

DaemonConfig load_daemon_config(int argc, char *argv[],
                                EnvReader const &read_env)
{
    DaemonConfig config;
    auto &settings = config.orchestrator;
    auto &engine = settings.engine;

    std::optional<std::filesystem::path> root;
    auto path_or_default = [&](char const *key, char const *leaf)
    {
        if (auto value = read_env(key); value && !value->empty())
        {
            return std::filesystem::path(*value);
        }
        if (!root)
        {
            root = default_root();
        }
        return *root / leaf;
    };
    settings.download_dir = path_or_default("FT_DOWNLOAD_DIR", "downloads");
    settings.descriptor_dir = path_or_default("FT_TORRENT_DIR", "torrents");
    settings.temp_dir = path_or_default("FT_TEMP_DIR", "temp");

    if (auto value = parse_int_value("FT_MAX_DOWNLOAD_RATE",
                                     read_env("FT_MAX_DOWNLOAD_RATE")))
    {
        engine.max_download_rate = std::max(0, *value);
    }
    if (auto value = parse_int_value("FT_MAX_UPLOAD_RATE",
                                     read_env("FT_MAX_UPLOAD_RATE")))
    {
        engine.max_upload_rate = std::max(0, *value);
    }
    if (auto value = parse_int_value("FT_MAX_CONNECTIONS",
                                     read_env("FT_MAX_CONNECTIONS")))
    {
        engine.max_connections = std::max(1, *value);
    }
    if (auto value = parse_int_value("FT_LISTEN_PORT_START",
                                     read_env("FT_LISTEN_PORT_START")))
    {
        engine.listen_port = *value;
    }
    if (auto value = parse_bool_value(read_env("FT_DHT_ENABLED")))
    {
        engine.dht_enabled = *value;
    }
    if (auto value = parse_int_value("FT_MONITOR_INTERVAL_MS",
                                     read_env("FT_MONITOR_INTERVAL_MS")))
    {
        settings.monitor_interval =
            std::chrono::milliseconds(std::max(50, *value));
    }

    auto &server = config.server;
    if (auto bind = read_env("FT_HTTP_BIND"); bind && !bind->empty())
    {
        server.bind_url = *bind;
    }
    if (auto web = read_env("FT_WEB_DIR"); web && !web->empty())
    {
        std::error_code ec;
        if (std::filesystem::is_directory(*web, ec))
        {
            server.web_dir = std::filesystem::path(*web);
        }
        else
        {
            FT_LOG_WARN("could not mount web interface: {} is not a "
                        "directory",
                        *web);
        }
    }
    server.dispatch.require_auth =
        parse_bool_value(read_env("FT_REQUIRE_AUTH")).value_or(false);
    server.dispatch.api_key = read_env("FT_API_KEY").value_or("");
    if (server.dispatch.require_auth && server.dispatch.api_key.empty())
    {
        FT_LOG_WARN("FT_REQUIRE_AUTH is set without FT_API_KEY; every API "
                    "request will be rejected");
    }

    constexpr std::string_view kRunSecondsFlag = "--run-seconds=";
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg(argv[i]);
        if (arg.substr(0, kRunSecondsFlag.size()) == kRunSecondsFlag)
        {
            auto value = parse_int_value(
                "--run-seconds",
                std::string(arg.substr(kRunSecondsFlag.size())));
            config.run_seconds = std::max(0, value.value_or(0));
        }
    }
    return config;
}

} // namespace ft::app
