#include "engine/LibtorrentGateway.hpp"

#include "engine/SettingsManager.hpp"
#include "engine/TorrentUtils.hpp"
#include "utils/Log.hpp"

#include <libtorrent/add_torrent_params.hpp>
#include <libtorrent/announce_entry.hpp>
#include <libtorrent/bdecode.hpp>
#include <libtorrent/error_code.hpp>
#include <libtorrent/file_storage.hpp>
#include <libtorrent/magnet_uri.hpp>
#include <libtorrent/session_params.hpp>
#include <libtorrent/span.hpp>
#include <libtorrent/torrent_flags.hpp>
#include <libtorrent/torrent_info.hpp>
#include <libtorrent/torrent_status.hpp>

#include <array>
#include <exception>
#include <string_view>
#include <utility>

namespace ft::engine
{

namespace
{
constexpr int kBoostMaxConnections = 300;

constexpr std::array<std::string_view, 19> kPublicTrackers = {
    "udp://tracker.opentrackr.org:1337/announce",
    "udp://open.stealth.si:80/announce",
    "udp://tracker.torrent.eu.org:451/announce",
    "udp://tracker.bittor.pw:1337/announce",
    "udp://public.popcorn-tracker.org:6969/announce",
    "udp://tracker.dler.org:6969/announce",
    "udp://exodus.desync.com:6969/announce",
    "udp://open.demonii.com:1337/announce",
    "udp://tracker.openbittorrent.com:6969/announce",
    "udp://tracker.coppersurfer.tk:6969/announce",
    "udp://tracker.leechers-paradise.org:6969/announce",
    "udp://tracker.internetwarriors.net:1337/announce",
    "udp://9.rarbg.to:2710/announce",
    "udp://9.rarbg.me:2710/announce",
    "udp://tracker.cyberia.is:6969/announce",
    "udp://retracker.lanta-net.ru:2710/announce",
    "udp://bt.xxx-tracker.com:2710/announce",
    "http://tracker.openbittorrent.com:80/announce",
    "udp://opentor.org:2710/announce",
};

std::string state_name(libtorrent::torrent_status const &st)
{
    if (st.flags & libtorrent::torrent_flags::paused)
    {
        return "paused";
    }
    switch (st.state)
    {
    case libtorrent::torrent_status::checking_files:
        return "checking_files";
    case libtorrent::torrent_status::downloading_metadata:
        return "downloading_metadata";
    case libtorrent::torrent_status::downloading:
        return "downloading";
    case libtorrent::torrent_status::finished:
        return "finished";
    case libtorrent::torrent_status::seeding:
        return "seeding";
    case libtorrent::torrent_status::checking_resume_data:
        return "checking_resume_data";
    default:
        return "unknown";
    }
}

[[noreturn]] void raise_engine_failure(std::string_view action,
                                       std::exception const &ex)
{
    throw Error(ErrorCode::EngineFailure,
                std::string(action) + ": " + ex.what());
}
} // namespace

LibtorrentGateway::LibtorrentGateway(EngineSettings settings)
    : settings_(std::move(settings))
{
    auto pack = SettingsManager::build_settings_pack(settings_);
    libtorrent::session_params params(std::move(pack));
    session_ = std::make_unique<libtorrent::session>(std::move(params));
    FT_LOG_INFO("libtorrent session listening on {}:{}",
                settings_.listen_host, settings_.listen_port);
}

LibtorrentGateway::~LibtorrentGateway()
{
    // the session must go before the handle table it populated
    if (session_)
    {
        session_->pause();
        session_.reset();
    }
}

libtorrent::torrent_handle
LibtorrentGateway::handle_for(EngineHandle handle) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handles_.find(handle);
    if (it == handles_.end() || !it->second.is_valid())
    {
        throw Error(ErrorCode::EngineFailure, "engine handle is not valid");
    }
    return it->second;
}

EngineHandle LibtorrentGateway::submit(AddJobParams const &request)
{
    libtorrent::add_torrent_params params;
    libtorrent::error_code ec;

    if (!request.descriptor.empty())
    {
        libtorrent::span<char const> span(
            reinterpret_cast<char const *>(request.descriptor.data()),
            static_cast<std::ptrdiff_t>(request.descriptor.size()));
        auto node = libtorrent::bdecode(span, ec);
        if (ec)
        {
            throw Error(ErrorCode::NotADescriptorFile,
                        "Invalid torrent file: " + ec.message());
        }
        auto ti = std::make_shared<libtorrent::torrent_info>(node, ec);
        if (ec)
        {
            throw Error(ErrorCode::NotADescriptorFile,
                        "Invalid torrent file: " + ec.message());
        }
        params.ti = std::move(ti);
    }
    else if (request.magnet_uri)
    {
        libtorrent::parse_magnet_uri(*request.magnet_uri, params, ec);
        if (ec)
        {
            throw Error(ErrorCode::InvalidInput,
                        "Invalid magnet link: " + ec.message());
        }
    }
    else
    {
        throw Error(ErrorCode::InvalidInput, "nothing to submit");
    }

    params.save_path = request.save_path.string();
    params.storage_mode = request.storage == StorageMode::Allocate
                              ? libtorrent::storage_mode_allocate
                              : libtorrent::storage_mode_sparse;
    params.flags = libtorrent::torrent_flags_t{};
    if (request.auto_managed)
    {
        params.flags |= libtorrent::torrent_flags::auto_managed;
    }
    if (request.duplicate_is_error)
    {
        params.flags |= libtorrent::torrent_flags::duplicate_is_error;
    }
    if (request.sequential)
    {
        params.flags |= libtorrent::torrent_flags::sequential_download;
    }

    auto handle = session_->add_torrent(std::move(params), ec);
    if (ec)
    {
        throw Error(ErrorCode::EngineFailure,
                    "engine rejected job: " + ec.message());
    }
    FT_LOG_DEBUG("engine accepted job {}",
                 hash_from_handle(handle).value_or("(hash pending)"));
    std::lock_guard<std::mutex> lock(mutex_);
    auto const id = next_handle_++;
    handles_.emplace(id, std::move(handle));
    return id;
}

JobStats LibtorrentGateway::status(EngineHandle handle)
{
    auto h = handle_for(handle);
    try
    {
        auto const st = h.status();
        JobStats stats;
        stats.name = st.name;
        stats.state = state_name(st);
        stats.progress = static_cast<double>(st.progress);
        stats.download_rate = st.download_rate;
        stats.upload_rate = st.upload_rate;
        stats.num_peers = st.num_peers;
        stats.num_seeds = st.num_seeds;
        stats.total_wanted = st.total_wanted;
        stats.total_wanted_done = st.total_wanted_done;
        stats.all_time_upload = st.all_time_upload;
        stats.all_time_download = st.all_time_download;
        return stats;
    }
    catch (std::exception const &ex)
    {
        raise_engine_failure("status", ex);
    }
}

std::vector<ManifestEntry> LibtorrentGateway::file_manifest(
    EngineHandle handle)
{
    auto h = handle_for(handle);
    std::shared_ptr<libtorrent::torrent_info const> ti;
    try
    {
        ti = h.torrent_file();
    }
    catch (std::exception const &ex)
    {
        raise_engine_failure("file manifest", ex);
    }
    if (!ti)
    {
        throw Error(ErrorCode::EngineFailure,
                    "torrent metadata not yet available");
    }
    auto const &fs = ti->files();
    std::vector<ManifestEntry> manifest;
    manifest.reserve(static_cast<std::size_t>(fs.num_files()));
    for (auto const index : fs.file_range())
    {
        if (fs.pad_file_at(index))
        {
            continue;
        }
        manifest.push_back({fs.file_path(index), fs.file_size(index)});
    }
    return manifest;
}

void LibtorrentGateway::pause(EngineHandle handle)
{
    auto h = handle_for(handle);
    try
    {
        h.unset_flags(libtorrent::torrent_flags::auto_managed);
        h.pause();
    }
    catch (std::exception const &ex)
    {
        raise_engine_failure("pause", ex);
    }
}

void LibtorrentGateway::resume(EngineHandle handle)
{
    auto h = handle_for(handle);
    try
    {
        h.set_flags(libtorrent::torrent_flags::auto_managed);
        h.resume();
    }
    catch (std::exception const &ex)
    {
        raise_engine_failure("resume", ex);
    }
}

void LibtorrentGateway::remove(EngineHandle handle, bool delete_files)
{
    libtorrent::torrent_handle h;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handles_.find(handle);
        if (it == handles_.end())
        {
            throw Error(ErrorCode::EngineFailure,
                        "engine handle is not valid");
        }
        h = it->second;
        handles_.erase(it);
    }
    if (!h.is_valid())
    {
        return;
    }
    try
    {
        session_->remove_torrent(h, delete_files
                                        ? libtorrent::session_handle::delete_files
                                        : libtorrent::remove_flags_t{});
    }
    catch (std::exception const &ex)
    {
        raise_engine_failure("remove", ex);
    }
}

bool LibtorrentGateway::is_valid(EngineHandle handle)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handles_.find(handle);
    return it != handles_.end() && it->second.is_valid();
}

void LibtorrentGateway::set_upload_limit(EngineHandle handle,
                                         int bytes_per_second)
{
    auto h = handle_for(handle);
    try
    {
        h.set_upload_limit(bytes_per_second);
    }
    catch (std::exception const &ex)
    {
        raise_engine_failure("set upload limit", ex);
    }
}

void LibtorrentGateway::set_max_uploads(EngineHandle handle, int slots)
{
    auto h = handle_for(handle);
    try
    {
        h.set_max_uploads(slots);
    }
    catch (std::exception const &ex)
    {
        raise_engine_failure("set max uploads", ex);
    }
}

void LibtorrentGateway::set_wide_distribution(EngineHandle handle,
                                              bool enabled)
{
    auto h = handle_for(handle);
    try
    {
        if (enabled)
        {
            h.set_flags(libtorrent::torrent_flags::super_seeding);
        }
        else
        {
            h.unset_flags(libtorrent::torrent_flags::super_seeding);
        }
    }
    catch (std::exception const &ex)
    {
        raise_engine_failure("super seeding", ex);
    }
}

BestEffort LibtorrentGateway::apply_boost(EngineHandle handle)
{
    try
    {
        auto h = handle_for(handle);
        for (auto const tracker : kPublicTrackers)
        {
            libtorrent::announce_entry entry(tracker);
            entry.tier = 0;
            h.add_tracker(entry);
        }
        h.force_reannounce();
        h.set_max_connections(kBoostMaxConnections);
        h.set_max_uploads(-1);
        h.set_upload_limit(-1);
#if TORRENT_ABI_VERSION == 1
        h.set_priority(255);
#else
        h.queue_position_top();
#endif
        FT_LOG_INFO("speed boost applied: {} trackers, max connections {}",
                    kPublicTrackers.size(), kBoostMaxConnections);
        return {};
    }
    catch (std::exception const &ex)
    {
        return BestEffort::failure(ex.what());
    }
}

BestEffort LibtorrentGateway::enable_wide_distribution(EngineHandle handle)
{
    try
    {
        auto h = handle_for(handle);
        auto const st = h.status();
        if (st.progress < 1.0f)
        {
            return {};
        }
        h.set_flags(libtorrent::torrent_flags::super_seeding);
        h.force_reannounce();
        h.set_upload_limit(-1);
        h.set_max_uploads(-1);
        FT_LOG_INFO("super-seeding enabled for {}", st.name);
        return {};
    }
    catch (std::exception const &ex)
    {
        return BestEffort::failure(ex.what());
    }
}

bool LibtorrentGateway::dht_enabled() const
{
    return session_ && session_->is_dht_running();
}

void LibtorrentGateway::shutdown()
{
    if (session_)
    {
        FT_LOG_INFO("pausing libtorrent session");
        session_->pause();
    }
}

} // namespace ft::engine
