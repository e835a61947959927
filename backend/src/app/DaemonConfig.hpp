#pragma once

#include "engine/Settings.hpp"
#include "rpc/Server.hpp"

#include <functional>
#include <optional>
#include <string>

namespace ft::app
{

struct DaemonConfig
{
    engine::OrchestratorSettings orchestrator;
    rpc::ServerOptions server;
    // Stop automatically after this many seconds (0 = run until signalled).
    int run_seconds = 0;
};

using EnvReader = std::function<std::optional<std::string>(char const *)>;

// Reads FT_* variables through read_env and --run-seconds=N from argv.
// Malformed numeric values are logged and ignored.
DaemonConfig load_daemon_config(int argc, char *argv[],
                                EnvReader const &read_env);

std::optional<std::string> read_process_env(char const *key);

} // namespace ft::app
