#include "engine/SettingsManager.hpp"

#include "utils/Log.hpp"
#include "utils/Version.hpp"

#include <libtorrent/alert.hpp>
#include <libtorrent/settings_pack.hpp>

#include <string>

namespace ft::engine
{

namespace
{
constexpr int kDefaultUploadCeiling = 100 * 1024 * 1024;

std::string join_routers(std::vector<std::string> const &routers)
{
    std::string joined;
    for (auto const &router : routers)
    {
        if (!joined.empty())
        {
            joined.push_back(',');
        }
        joined.append(router);
    }
    return joined;
}
} // namespace

libtorrent::settings_pack
SettingsManager::build_settings_pack(EngineSettings const &s)
{
    libtorrent::settings_pack pack;
    pack.set_int(libtorrent::settings_pack::alert_mask,
                 libtorrent::alert_category::all);
    pack.set_int(libtorrent::settings_pack::alert_queue_size,
                 s.alert_queue_size);
    pack.set_str(libtorrent::settings_pack::user_agent,
                 std::string("FastTorrent/") + ft::version::kSemanticVersion);
    pack.set_int(libtorrent::settings_pack::download_rate_limit,
                 s.max_download_rate > 0 ? s.max_download_rate : 0);
    pack.set_int(libtorrent::settings_pack::upload_rate_limit,
                 effective_upload_limit(s));
    pack.set_int(libtorrent::settings_pack::connections_limit,
                 s.max_connections);
    apply_network(s, pack);
    apply_throughput(s, pack);
    FT_LOG_DEBUG("session settings: listen {}:{} connections={} dht={}",
                 s.listen_host, s.listen_port, s.max_connections,
                 s.dht_enabled);
    return pack;
}

int SettingsManager::effective_upload_limit(EngineSettings const &s) noexcept
{
    return s.max_upload_rate > 0 ? s.max_upload_rate : kDefaultUploadCeiling;
}

void SettingsManager::apply_network(EngineSettings const &s,
                                    libtorrent::settings_pack &pack)
{
    using libtorrent::settings_pack;
    pack.set_str(settings_pack::listen_interfaces,
                 s.listen_host + ":" + std::to_string(s.listen_port));
    pack.set_bool(settings_pack::enable_dht, s.dht_enabled);
    if (s.dht_enabled && !s.dht_routers.empty())
    {
        pack.set_str(settings_pack::dht_bootstrap_nodes,
                     join_routers(s.dht_routers));
    }
    pack.set_bool(settings_pack::enable_lsd, s.lsd_enabled);
    pack.set_bool(settings_pack::enable_upnp, s.upnp_enabled);
    pack.set_bool(settings_pack::enable_natpmp, s.natpmp_enabled);
    pack.set_bool(settings_pack::announce_to_all_trackers, true);
    pack.set_bool(settings_pack::announce_to_all_tiers, true);
    pack.set_int(settings_pack::auto_manage_interval, 5);
    pack.set_int(settings_pack::max_failcount, 1);
    // prefer TCP when mixing transports
    pack.set_int(settings_pack::mixed_mode_algorithm,
                 settings_pack::prefer_tcp);
    pack.set_bool(settings_pack::enable_outgoing_utp, true);
    pack.set_bool(settings_pack::enable_incoming_utp, true);
    pack.set_bool(settings_pack::enable_outgoing_tcp, true);
    pack.set_bool(settings_pack::enable_incoming_tcp, true);
    pack.set_bool(settings_pack::rate_limit_ip_overhead, true);
}

void SettingsManager::apply_throughput(EngineSettings const &s,
                                       libtorrent::settings_pack &pack)
{
    using libtorrent::settings_pack;
    pack.set_int(settings_pack::aio_threads, 16);
    pack.set_int(settings_pack::checking_mem_usage, 4096);
    pack.set_int(settings_pack::max_queued_disk_bytes, 50 * 1024 * 1024);
    pack.set_int(settings_pack::send_buffer_watermark, 10 * 1024 * 1024);
    pack.set_int(settings_pack::send_buffer_low_watermark, 5 * 1024 * 1024);
    pack.set_int(settings_pack::send_buffer_watermark_factor, 150);
    pack.set_int(settings_pack::connection_speed, 1000);
    pack.set_int(settings_pack::connections_slack, 100);
    pack.set_int(settings_pack::unchoke_slots_limit, 100);
    pack.set_int(settings_pack::choking_algorithm,
                 settings_pack::fixed_slots_choker);
    pack.set_int(settings_pack::seed_choking_algorithm,
                 settings_pack::fastest_upload);
    pack.set_int(settings_pack::peer_turnover, s.peer_turnover);
    pack.set_int(settings_pack::peer_turnover_cutoff, s.peer_turnover_cutoff);
    pack.set_int(settings_pack::peer_turnover_interval,
                 s.peer_turnover_interval);
    pack.set_int(settings_pack::share_mode_target, 3);
    pack.set_bool(settings_pack::strict_super_seeding, false);
}

} // namespace ft::engine
