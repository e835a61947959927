#pragma once

#include "engine/EngineGateway.hpp"
#include "engine/Settings.hpp"

#include <libtorrent/session.hpp>
#include <libtorrent/torrent_handle.hpp>

#include <memory>
#include <mutex>
#include <unordered_map>

namespace ft::engine
{

// EngineGateway backed by a libtorrent session.
class LibtorrentGateway final : public EngineGateway
{
  public:
    explicit LibtorrentGateway(EngineSettings settings);
    ~LibtorrentGateway() override;
    LibtorrentGateway(LibtorrentGateway const &) = delete;
    LibtorrentGateway &operator=(LibtorrentGateway const &) = delete;

    EngineHandle submit(AddJobParams const &params) override;
    JobStats status(EngineHandle handle) override;
    std::vector<ManifestEntry> file_manifest(EngineHandle handle) override;

    void pause(EngineHandle handle) override;
    void resume(EngineHandle handle) override;
    void remove(EngineHandle handle, bool delete_files) override;
    bool is_valid(EngineHandle handle) override;

    void set_upload_limit(EngineHandle handle, int bytes_per_second) override;
    void set_max_uploads(EngineHandle handle, int slots) override;
    void set_wide_distribution(EngineHandle handle, bool enabled) override;

    BestEffort apply_boost(EngineHandle handle) override;
    BestEffort enable_wide_distribution(EngineHandle handle) override;

    bool dht_enabled() const override;
    void shutdown() override;

  private:
    libtorrent::torrent_handle handle_for(EngineHandle handle) const;

    EngineSettings settings_;
    std::unique_ptr<libtorrent::session> session_;
    mutable std::mutex mutex_;
    std::unordered_map<EngineHandle, libtorrent::torrent_handle> handles_;
    EngineHandle next_handle_ = 1;
};

} // namespace ft::engine
