#include "engine/Orchestrator.hpp"

#include "engine/ArchiveCache.hpp"
#include "engine/AsyncTaskService.hpp"
#include "engine/CompletionDetector.hpp"
#include "engine/Errors.hpp"
#include "engine/IngestClassifier.hpp"
#include "engine/JobRegistry.hpp"
#include "engine/LibtorrentGateway.hpp"
#include "engine/SchedulerService.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <fstream>
#include <mutex>
#include <system_error>
#include <utility>

namespace ft::engine
{

namespace
{
void ensure_directories(OrchestratorSettings const &settings)
{
    for (auto const *dir : {&settings.download_dir, &settings.descriptor_dir,
                            &settings.temp_dir})
    {
        if (!ft::utils::ensure_directory(*dir))
        {
            FT_LOG_WARN("could not create directory {}", dir->string());
        }
    }
}
} // namespace

struct Orchestrator::Impl
{
    OrchestratorSettings settings;

    // Declared first so it outlives every component holding a reference.
    std::unique_ptr<EngineGateway> engine;
    std::unique_ptr<DescriptorFetcher> fetcher;

    ArchiveCache archives;
    JobRegistry registry;
    IngestClassifier classifier;
    AsyncTaskService archive_worker{"archive-worker"};
    CompletionDetector detector;
    Monitor monitor;
    FileServer file_server;

    std::mutex wake_mutex;
    std::condition_variable wake_cv;
    bool broadcast_requested = false;
    std::atomic_bool shutdown_requested{false};
    std::atomic_bool running{false};

    Impl(OrchestratorSettings s, std::unique_ptr<EngineGateway> e,
         std::unique_ptr<DescriptorFetcher> f)
        : settings(std::move(s)), engine(std::move(e)), fetcher(std::move(f)),
          archives(settings.temp_dir), registry(*engine, archives),
          classifier(*fetcher),
          detector(*engine, registry, archives,
                   [this](std::function<void()> task)
                   { archive_worker.submit(std::move(task)); }),
          monitor(*engine, registry, detector),
          file_server(*engine, registry, archives)
    {
        ensure_directories(settings);
        archive_worker.start();
    }

    ~Impl()
    {
        archive_worker.stop(true);
        if (engine)
        {
            engine->shutdown();
        }
    }

    void run()
    {
        running.store(true, std::memory_order_release);
        SchedulerService scheduler;
        scheduler.schedule(settings.monitor_interval,
                           [this]() { monitor.tick(); });
        FT_LOG_INFO("monitor running every {} ms",
                    settings.monitor_interval.count());

        while (!shutdown_requested.load(std::memory_order_acquire))
        {
            auto now = std::chrono::steady_clock::now();
            scheduler.tick(now);

            bool publish_now = false;
            {
                std::lock_guard<std::mutex> lock(wake_mutex);
                std::swap(publish_now, broadcast_requested);
            }
            if (publish_now)
            {
                monitor.publish();
            }

            auto const wait_ms = std::max<long long>(
                1, std::min<long long>(
                       settings.idle_sleep_ms,
                       scheduler.time_until_next_task(now).count()));
            std::unique_lock<std::mutex> lock(wake_mutex);
            wake_cv.wait_for(lock, std::chrono::milliseconds(wait_ms),
                             [this]
                             {
                                 return broadcast_requested ||
                                        shutdown_requested.load(
                                            std::memory_order_acquire);
                             });
        }
        running.store(false, std::memory_order_release);
        FT_LOG_INFO("monitor loop stopped");
    }

    std::filesystem::path resolve_save_path(SubmitOptions const &options)
    {
        auto path = options.save_path && !options.save_path->empty()
                        ? *options.save_path
                        : settings.download_dir;
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec)
        {
            throw Error(ErrorCode::InvalidInput,
                        "Cannot use save path " + path.string() + ": " +
                            ec.message());
        }
        return path;
    }

    std::optional<std::filesystem::path>
    store_descriptor(std::string const &id,
                     std::vector<std::uint8_t> const &bytes)
    {
        auto path = settings.descriptor_dir / (id + ".torrent");
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<char const *>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
        if (!out)
        {
            FT_LOG_WARN("could not store torrent file {}", path.string());
            std::error_code ec;
            std::filesystem::remove(path, ec);
            return std::nullopt;
        }
        return path;
    }

    std::string admit(std::string id, AddJobParams params, SourceKind source,
                      std::optional<std::filesystem::path> descriptor_path)
    {
        EngineHandle handle = kInvalidHandle;
        try
        {
            handle = engine->submit(params);
        }
        catch (Error const &)
        {
            if (descriptor_path)
            {
                std::error_code ec;
                std::filesystem::remove(*descriptor_path, ec);
            }
            throw;
        }

        JobRecord record;
        record.id = id;
        record.state = "queued";
        record.save_path = params.save_path;
        record.added_time = Clock::now();
        record.source = source;
        record.descriptor_path = std::move(descriptor_path);
        record.link = ActiveLink{handle};
        try
        {
            apply_stats(record, engine->status(handle));
        }
        catch (Error const &ex)
        {
            FT_LOG_DEBUG("initial status for {} unavailable: {}", id,
                         ex.what());
        }
        registry.add_active(std::move(record));

        if (auto boost = engine->apply_boost(handle); !boost.ok)
        {
            FT_LOG_WARN("failed to boost torrent speed: {}", boost.error);
        }
        FT_LOG_INFO("added torrent {} from {}", id, to_string(source));
        request_broadcast();
        return id;
    }

    void request_broadcast()
    {
        {
            std::lock_guard<std::mutex> lock(wake_mutex);
            broadcast_requested = true;
        }
        wake_cv.notify_one();
    }

    EngineHandle active_handle(std::string const &id)
    {
        auto record = registry.get(id);
        auto handle = record.handle();
        if (!handle)
        {
            throw Error(ErrorCode::NotFound, "Torrent not found");
        }
        return *handle;
    }
};

Orchestrator::Orchestrator(OrchestratorSettings settings,
                           std::unique_ptr<EngineGateway> engine,
                           std::unique_ptr<DescriptorFetcher> fetcher)
    : impl_(std::make_unique<Impl>(std::move(settings), std::move(engine),
                                   std::move(fetcher)))
{
}

Orchestrator::~Orchestrator() = default;

std::unique_ptr<Orchestrator> Orchestrator::create(OrchestratorSettings settings)
{
    auto engine = std::make_unique<LibtorrentGateway>(settings.engine);
    auto fetcher = std::make_unique<CurlFetcher>();
    return std::make_unique<Orchestrator>(std::move(settings), std::move(engine),
                                          std::move(fetcher));
}

void Orchestrator::run()
{
    impl_->run();
}

void Orchestrator::stop() noexcept
{
    impl_->shutdown_requested.store(true, std::memory_order_release);
    impl_->wake_cv.notify_all();
}

bool Orchestrator::is_running() const noexcept
{
    return impl_->running.load(std::memory_order_acquire);
}

void Orchestrator::tick()
{
    impl_->monitor.tick();
}

void Orchestrator::request_broadcast()
{
    impl_->request_broadcast();
}

void Orchestrator::set_update_listener(Monitor::Listener listener)
{
    impl_->monitor.set_listener(std::move(listener));
}

std::string Orchestrator::submit(std::string const &locator,
                                 SubmitOptions const &options)
{
    auto const classified = impl_->classifier.classify(locator);
    auto id = impl_->registry.issue_id();

    AddJobParams params;
    params.save_path = impl_->resolve_save_path(options);
    params.sequential = options.sequential;

    switch (classified.kind)
    {
    case LocatorKind::DirectLink:
        params.magnet_uri = classified.value;
        return impl_->admit(std::move(id), std::move(params),
                            SourceKind::Magnet, std::nullopt);
    case LocatorKind::ContentHash:
        params.magnet_uri = classified.value;
        return impl_->admit(std::move(id), std::move(params),
                            SourceKind::Hash, std::nullopt);
    case LocatorKind::DescriptorUrl:
    {
        params.descriptor =
            impl_->classifier.fetch_descriptor(classified.value);
        auto stored = impl_->store_descriptor(id, params.descriptor);
        return impl_->admit(std::move(id), std::move(params),
                            SourceKind::Url, std::move(stored));
    }
    }
    throw Error(ErrorCode::InvalidInput, "unsupported locator");
}

std::string Orchestrator::submit_descriptor(std::vector<std::uint8_t> descriptor,
                                            SubmitOptions const &options)
{
    IngestClassifier::validate_descriptor(descriptor);
    auto id = impl_->registry.issue_id();

    AddJobParams params;
    params.save_path = impl_->resolve_save_path(options);
    params.sequential = options.sequential;
    params.descriptor = std::move(descriptor);
    auto stored = impl_->store_descriptor(id, params.descriptor);
    return impl_->admit(std::move(id), std::move(params), SourceKind::File,
                        std::move(stored));
}

std::vector<JobRecord> Orchestrator::list() const
{
    return impl_->registry.merged_view();
}

JobRecord Orchestrator::get(std::string const &id) const
{
    return impl_->registry.get(id);
}

void Orchestrator::remove(std::string const &id, bool delete_files)
{
    {
        auto guard = impl_->monitor.exclusive();
        impl_->registry.remove(id, delete_files);
    }
    impl_->request_broadcast();
}

void Orchestrator::pause(std::string const &id)
{
    auto guard = impl_->monitor.exclusive();
    impl_->engine->pause(impl_->active_handle(id));
    FT_LOG_INFO("paused torrent {}", id);
}

void Orchestrator::resume(std::string const &id)
{
    auto guard = impl_->monitor.exclusive();
    impl_->engine->resume(impl_->active_handle(id));
    FT_LOG_INFO("resumed torrent {}", id);
}

BestEffort Orchestrator::enable_wide_distribution(std::string const &id)
{
    auto guard = impl_->monitor.exclusive();
    auto result = impl_->engine->enable_wide_distribution(
        impl_->active_handle(id));
    if (!result.ok)
    {
        FT_LOG_WARN("failed to enable super-seeding for {}: {}", id,
                    result.error);
    }
    return result;
}

std::vector<FileEntry> Orchestrator::available_files(std::string const &id)
{
    return impl_->file_server.available_files(id);
}

ServedFile
Orchestrator::resolve_download(std::string const &id,
                               std::optional<std::string> const &selector)
{
    return impl_->file_server.resolve(id, selector);
}

HealthReport Orchestrator::health() const
{
    HealthReport report;
    report.active_jobs = impl_->registry.active_count();
    report.dht_enabled = impl_->engine->dht_enabled();
    report.storage = ft::utils::disk_usage(impl_->settings.download_dir);
    if (!report.storage)
    {
        FT_LOG_ERROR("failed to read disk usage for {}",
                     impl_->settings.download_dir.string());
    }
    return report;
}

OrchestratorSettings const &Orchestrator::settings() const noexcept
{
    return impl_->settings;
}

} // namespace ft::engine
