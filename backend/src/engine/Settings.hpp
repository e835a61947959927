#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace ft::engine
{

// Session-wide transfer engine configuration.
struct EngineSettings
{
    std::string listen_host{"0.0.0.0"};
    int listen_port = 6881;
    int max_download_rate = 0; // bytes/s, 0 = unlimited
    int max_upload_rate = 0;   // bytes/s, 0 = engine default ceiling
    int max_connections = 1000;
    bool dht_enabled = true;
    bool lsd_enabled = true;
    bool upnp_enabled = true;
    bool natpmp_enabled = true;
    std::vector<std::string> dht_routers{
        "router.bittorrent.com:6881", "router.utorrent.com:6881",
        "dht.transmissionbt.com:6881", "dht.libtorrent.org:25401"};
    int peer_turnover = 5;
    // Passed to the engine untouched.
    int peer_turnover_cutoff = 90;
    int peer_turnover_interval = 180;
    int alert_queue_size = 10000;
};

struct OrchestratorSettings
{
    std::filesystem::path download_dir{"downloads"};
    std::filesystem::path descriptor_dir{"torrents"};
    std::filesystem::path temp_dir{"temp"};
    std::chrono::milliseconds monitor_interval{500};
    unsigned idle_sleep_ms = 500;
    EngineSettings engine;
};

} // namespace ft::engine
