#include "app/DaemonConfig.hpp"
#include "app/DaemonMain.hpp"
#include "engine/Orchestrator.hpp"
#include "rpc/Server.hpp"
#include "utils/Log.hpp"
#include "utils/Shutdown.hpp"
#include "utils/Version.hpp"

#include <chrono>
#include <cstdio>
#include <exception>
#include <memory>
#include <thread>
#include <utility>
#include <vector>

namespace ft::app
{

int daemon_main(int argc, char *argv[])
{
    try
    {
        ft::runtime::install_signal_handlers();

        auto config = load_daemon_config(argc, argv, &read_process_env);
        auto const &settings = config.orchestrator;
        FT_LOG_INFO("{} starting", ft::version::kDisplayVersion);
        FT_LOG_INFO("download dir {}, torrent dir {}, temp dir {}",
                    settings.download_dir.string(),
                    settings.descriptor_dir.string(),
                    settings.temp_dir.string());
        FT_LOG_INFO("engine: max connections {}, DHT {}, listen port {}",
                    settings.engine.max_connections,
                    settings.engine.dht_enabled ? "enabled" : "disabled",
                    settings.engine.listen_port);

        auto orchestrator = ft::engine::Orchestrator::create(settings);

        ft::rpc::Server server(*orchestrator, config.server);
        orchestrator->set_update_listener(
            [&server](std::vector<ft::engine::JobRecord> const &jobs)
            { server.publish(jobs); });
        if (!server.start())
        {
            ft::log::print_status("FastTorrent could not bind {}",
                                  server.bind_url());
            return 1;
        }

        std::thread engine_thread([&orchestrator] { orchestrator->run(); });

        ft::log::print_status("FastTorrent daemon running on {}; CTRL+C to "
                              "stop.",
                              server.bind_url());

        auto const deadline =
            std::chrono::steady_clock::now() +
            std::chrono::seconds(config.run_seconds);
        while (!ft::runtime::wait_for_shutdown(std::chrono::milliseconds(200)))
        {
            if (config.run_seconds > 0 &&
                std::chrono::steady_clock::now() >= deadline)
            {
                FT_LOG_INFO("Auto shutdown: run-seconds={} reached",
                            config.run_seconds);
                ft::runtime::request_shutdown();
            }
        }

        FT_LOG_INFO("Shutdown requested; stopping HTTP server and engine...");
        // 1. Stop accepting requests and pushing updates.
        server.stop();
        orchestrator->set_update_listener({});

        // 2. Stop the monitor loop.
        orchestrator->stop();
        if (engine_thread.joinable())
        {
            engine_thread.join();
        }

        // 3. Discard pending archive work and pause the engine.
        orchestrator.reset();

        ft::log::print_status("Shutdown complete.");
        FT_LOG_INFO("Shutdown complete.");
        return 0;
    }
    catch (std::exception const &ex)
    {
        std::fprintf(stderr, "FastTorrent daemon failed: %s\n", ex.what());
        FT_LOG_ERROR("FastTorrent daemon failed: {}", ex.what());
    }
    return 1;
}

} // namespace ft::app

int main(int argc, char *argv[])
{
    return ft::app::daemon_main(argc, argv);
}
