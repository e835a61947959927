#pragma once

#include "engine/EngineGateway.hpp"
#include "engine/FileServer.hpp"
#include "engine/HttpFetcher.hpp"
#include "engine/Job.hpp"
#include "engine/Monitor.hpp"
#include "engine/Settings.hpp"
#include "utils/FS.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ft::engine
{

struct SubmitOptions
{
    std::optional<std::filesystem::path> save_path;
    bool sequential = false;
};

struct HealthReport
{
    std::size_t active_jobs = 0;
    bool dht_enabled = false;
    std::optional<ft::utils::DiskUsage> storage;
};

// Application context: owns the engine gateway and every job-layer
// component, and runs the monitor loop on the thread that calls run().
class Orchestrator
{
  public:
    Orchestrator(OrchestratorSettings settings,
                 std::unique_ptr<EngineGateway> engine,
                 std::unique_ptr<DescriptorFetcher> fetcher);
    ~Orchestrator();
    Orchestrator(Orchestrator const &) = delete;
    Orchestrator &operator=(Orchestrator const &) = delete;

    // Production wiring: libtorrent session plus libcurl fetcher.
    static std::unique_ptr<Orchestrator> create(OrchestratorSettings settings);

    void run();
    void stop() noexcept;
    bool is_running() const noexcept;

    // One monitor pass on the calling thread.
    void tick();
    // Ask the loop to push the job list without waiting for the next tick.
    void request_broadcast();
    void set_update_listener(Monitor::Listener listener);

    std::string submit(std::string const &locator,
                       SubmitOptions const &options);
    std::string submit_descriptor(std::vector<std::uint8_t> descriptor,
                                  SubmitOptions const &options);

    std::vector<JobRecord> list() const;
    JobRecord get(std::string const &id) const;
    void remove(std::string const &id, bool delete_files);
    void pause(std::string const &id);
    void resume(std::string const &id);
    BestEffort enable_wide_distribution(std::string const &id);

    std::vector<FileEntry> available_files(std::string const &id);
    ServedFile resolve_download(std::string const &id,
                                std::optional<std::string> const &selector);

    HealthReport health() const;
    OrchestratorSettings const &settings() const noexcept;

  private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ft::engine
