#pragma once

#include "engine/EngineGateway.hpp"
#include "engine/Errors.hpp"
#include "engine/HttpFetcher.hpp"
#include "engine/Orchestrator.hpp"

#include <cstdint>
#include <chrono>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <yyjson.h>

namespace ft::tests
{

// In-memory transfer engine. Handles are issued sequentially from 1.
class FakeEngine final : public engine::EngineGateway
{
  public:
    struct Job
    {
        engine::AddJobParams params;
        engine::JobStats stats;
        std::vector<engine::ManifestEntry> manifest;
        bool metadata_ready = true;
        bool paused = false;
        bool wide_distribution = false;
        int upload_limit = -1;
        int max_uploads = -1;
        int boosts = 0;
    };

    engine::EngineHandle submit(engine::AddJobParams const &params) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (reject_submit)
        {
            throw engine::Error(engine::ErrorCode::EngineFailure,
                                "engine rejected torrent");
        }
        auto handle = next_handle_++;
        jobs_[handle].params = params;
        jobs_[handle].stats.state = "downloading";
        return handle;
    }

    engine::JobStats status(engine::EngineHandle handle) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return job(handle).stats;
    }

    std::vector<engine::ManifestEntry>
    file_manifest(engine::EngineHandle handle) override
    {
        if (on_manifest)
        {
            on_manifest(handle);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        auto &entry = job(handle);
        if (!entry.metadata_ready)
        {
            throw engine::Error(engine::ErrorCode::EngineFailure,
                                "metadata not available");
        }
        return entry.manifest;
    }

    void pause(engine::EngineHandle handle) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        job(handle).paused = true;
    }

    void resume(engine::EngineHandle handle) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        job(handle).paused = false;
    }

    void remove(engine::EngineHandle handle, bool delete_files) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        job(handle);
        jobs_.erase(handle);
        removed.push_back({handle, delete_files});
    }

    bool is_valid(engine::EngineHandle handle) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return jobs_.count(handle) != 0;
    }

    void set_upload_limit(engine::EngineHandle handle, int limit) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        job(handle).upload_limit = limit;
    }

    void set_max_uploads(engine::EngineHandle handle, int slots) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        job(handle).max_uploads = slots;
    }

    void set_wide_distribution(engine::EngineHandle handle,
                               bool enabled) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        job(handle).wide_distribution = enabled;
    }

    engine::BestEffort apply_boost(engine::EngineHandle handle) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++job(handle).boosts;
        if (fail_boost)
        {
            return engine::BestEffort::failure("tracker list rejected");
        }
        return {};
    }

    engine::BestEffort
    enable_wide_distribution(engine::EngineHandle handle) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto &entry = job(handle);
        if (entry.stats.progress >= 1.0)
        {
            entry.wide_distribution = true;
        }
        return {};
    }

    bool dht_enabled() const override
    {
        return true;
    }

    void shutdown() override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shut_down = true;
    }

    // Test-side accessors.
    Job snapshot(engine::EngineHandle handle)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return job(handle);
    }

    void set_stats(engine::EngineHandle handle, engine::JobStats stats)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        job(handle).stats = std::move(stats);
    }

    void set_manifest(engine::EngineHandle handle,
                      std::vector<engine::ManifestEntry> manifest)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        job(handle).manifest = std::move(manifest);
    }

    void set_metadata_ready(engine::EngineHandle handle, bool ready)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        job(handle).metadata_ready = ready;
    }

    std::size_t job_count()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return jobs_.size();
    }

    bool reject_submit = false;
    bool fail_boost = false;
    bool shut_down = false;
    std::vector<std::pair<engine::EngineHandle, bool>> removed;
    // Runs before a manifest is handed out, without the engine lock held.
    std::function<void(engine::EngineHandle)> on_manifest;

  private:
    Job &job(engine::EngineHandle handle)
    {
        auto it = jobs_.find(handle);
        if (it == jobs_.end())
        {
            throw engine::Error(engine::ErrorCode::EngineFailure,
                                "invalid torrent handle");
        }
        return it->second;
    }

    std::mutex mutex_;
    std::map<engine::EngineHandle, Job> jobs_;
    engine::EngineHandle next_handle_ = 1;
};

// Replays queued responses in order and records every request.
class ScriptedFetcher final : public engine::DescriptorFetcher
{
  public:
    engine::FetchResponse get(engine::FetchRequest const &request) override
    {
        requests.push_back(request);
        if (responses.empty())
        {
            engine::FetchResponse missing;
            missing.transport_error = "no scripted response";
            return missing;
        }
        auto response = responses.front();
        responses.pop_front();
        return response;
    }

    void push(long status, std::string_view body)
    {
        engine::FetchResponse response;
        response.status = status;
        response.body.assign(body.begin(), body.end());
        responses.push_back(std::move(response));
    }

    std::deque<engine::FetchResponse> responses;
    std::vector<engine::FetchRequest> requests;
};

// Smallest bencoded dictionary the descriptor check accepts.
inline constexpr std::string_view kSampleDescriptor =
    "d8:announce9:udp://x:14:infod6:lengthi1e4:name4:testee";

inline std::vector<std::uint8_t> sample_descriptor()
{
    return {kSampleDescriptor.begin(), kSampleDescriptor.end()};
}

inline std::filesystem::path make_temp_root(std::string const &tag)
{
    auto root = std::filesystem::temp_directory_path() / "fasttest" / tag;
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
    std::filesystem::create_directories(root);
    return root;
}

inline void write_file(std::filesystem::path const &path,
                       std::string_view contents)
{
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
}

inline std::string read_file(std::filesystem::path const &path)
{
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in),
            std::istreambuf_iterator<char>()};
}

class JsonView
{
  public:
    explicit JsonView(std::string const &payload)
    {
        doc_ = yyjson_read(payload.data(), payload.size(), 0);
        if (doc_ == nullptr)
        {
            throw std::runtime_error("failed to parse JSON payload");
        }
        root_ = yyjson_doc_get_root(doc_);
    }

    ~JsonView()
    {
        if (doc_)
        {
            yyjson_doc_free(doc_);
        }
    }

    JsonView(JsonView const &) = delete;
    JsonView &operator=(JsonView const &) = delete;

    yyjson_val *root() const
    {
        return root_;
    }

    yyjson_val *member(char const *key) const
    {
        return yyjson_obj_get(root_, key);
    }

    std::string_view string(char const *key) const
    {
        auto *value = member(key);
        if (value == nullptr || !yyjson_is_str(value))
        {
            return {};
        }
        return {yyjson_get_str(value), yyjson_get_len(value)};
    }

  private:
    yyjson_doc *doc_ = nullptr;
    yyjson_val *root_ = nullptr;
};

// Orchestrator wired to the fakes above, rooted in a fresh temp directory.
struct OrchestratorHarness
{
    std::filesystem::path root;
    FakeEngine *engine = nullptr;
    ScriptedFetcher *fetcher = nullptr;
    std::unique_ptr<engine::Orchestrator> orchestrator;

    explicit OrchestratorHarness(std::string const &tag)
        : root(make_temp_root(tag))
    {
        engine::OrchestratorSettings settings;
        settings.download_dir = root / "downloads";
        settings.descriptor_dir = root / "torrents";
        settings.temp_dir = root / "temp";
        settings.monitor_interval = std::chrono::milliseconds(20);
        settings.idle_sleep_ms = 20;
        auto fake_engine = std::make_unique<FakeEngine>();
        auto fake_fetcher = std::make_unique<ScriptedFetcher>();
        engine = fake_engine.get();
        fetcher = fake_fetcher.get();
        orchestrator = std::make_unique<engine::Orchestrator>(
            settings, std::move(fake_engine), std::move(fake_fetcher));
    }

    // Marks the job's engine transfer as finished with the given files and
    // runs one monitor pass.
    void finish(std::string const &id,
                std::vector<engine::ManifestEntry> manifest)
    {
        auto handle = orchestrator->get(id).handle().value();
        engine::JobStats stats;
        stats.name = "finished";
        stats.state = "seeding";
        stats.progress = 1.0;
        engine->set_manifest(handle, std::move(manifest));
        engine->set_stats(handle, stats);
        orchestrator->tick();
    }
};

} // namespace ft::tests
