#pragma once

namespace ft::app
{

// Runs the FastTorrent daemon (engine + monitor loop + HTTP server) until
// SIGINT/SIGTERM or --run-seconds elapses.
int daemon_main(int argc, char *argv[]);

} // namespace ft::app
