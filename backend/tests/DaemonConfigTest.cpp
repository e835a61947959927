#include "TestSupport.hpp"

#include "app/DaemonConfig.hpp"

#include <map>
#include <string>

#include <doctest/doctest.h>

using ft::app::load_daemon_config;

namespace
{

struct FakeEnv
{
    std::map<std::string, std::string> values;

    ft::app::EnvReader reader() const
    {
        return [this](char const *key) -> std::optional<std::string>
        {
            if (auto it = values.find(key); it != values.end())
            {
                return it->second;
            }
            return std::nullopt;
        };
    }
};

FakeEnv base_env(std::filesystem::path const &root)
{
    FakeEnv env;
    env.values["FT_DOWNLOAD_DIR"] = (root / "dl").string();
    env.values["FT_TORRENT_DIR"] = (root / "tor").string();
    env.values["FT_TEMP_DIR"] = (root / "tmp").string();
    return env;
}

} // namespace

TEST_CASE("environment overrides settings")
{
    auto root = ft::tests::make_temp_root("config-env");
    auto env = base_env(root);
    env.values["FT_MAX_DOWNLOAD_RATE"] = "1048576";
    env.values["FT_MAX_CONNECTIONS"] = "200";
    env.values["FT_LISTEN_PORT_START"] = "7000";
    env.values["FT_DHT_ENABLED"] = "false";
    env.values["FT_HTTP_BIND"] = "http://127.0.0.1:9999";
    env.values["FT_REQUIRE_AUTH"] = "TRUE";
    env.values["FT_API_KEY"] = "k";
    env.values["FT_MONITOR_INTERVAL_MS"] = "250";
    env.values["FT_WEB_DIR"] = root.string();

    char arg0[] = "fasttorrent";
    char *argv[] = {arg0};
    auto config = load_daemon_config(1, argv, env.reader());

    auto const &settings = config.orchestrator;
    CHECK(settings.download_dir == root / "dl");
    CHECK(settings.descriptor_dir == root / "tor");
    CHECK(settings.temp_dir == root / "tmp");
    CHECK(settings.engine.max_download_rate == 1048576);
    CHECK(settings.engine.max_connections == 200);
    CHECK(settings.engine.listen_port == 7000);
    CHECK_FALSE(settings.engine.dht_enabled);
    CHECK(settings.monitor_interval == std::chrono::milliseconds(250));
    CHECK(config.server.bind_url == "http://127.0.0.1:9999");
    CHECK(config.server.dispatch.require_auth);
    CHECK(config.server.dispatch.api_key == "k");
    REQUIRE(config.server.web_dir.has_value());
    CHECK(*config.server.web_dir == root);
    CHECK(config.run_seconds == 0);
}

TEST_CASE("malformed values keep defaults")
{
    auto root = ft::tests::make_temp_root("config-bad");
    auto env = base_env(root);
    env.values["FT_MAX_CONNECTIONS"] = "lots";
    env.values["FT_LISTEN_PORT_START"] = "68a1";
    env.values["FT_WEB_DIR"] = (root / "missing").string();

    char arg0[] = "fasttorrent";
    char *argv[] = {arg0};
    auto config = load_daemon_config(1, argv, env.reader());
    ft::engine::EngineSettings defaults;
    CHECK(config.orchestrator.engine.max_connections ==
          defaults.max_connections);
    CHECK(config.orchestrator.engine.listen_port == defaults.listen_port);
    CHECK(config.orchestrator.engine.dht_enabled);
    CHECK_FALSE(config.server.web_dir.has_value());
    CHECK_FALSE(config.server.dispatch.require_auth);
    CHECK(config.server.bind_url == "http://0.0.0.0:8080");
}

TEST_CASE("run-seconds flag")
{
    auto root = ft::tests::make_temp_root("config-args");
    auto env = base_env(root);
    char arg0[] = "fasttorrent";
    char arg1[] = "--verbose";
    char arg2[] = "--run-seconds=15";
    char *argv[] = {arg0, arg1, arg2};
    auto config = load_daemon_config(3, argv, env.reader());
    CHECK(config.run_seconds == 15);
}
