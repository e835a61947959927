#pragma once

#include <atomic>
#include <chrono>

namespace ft::runtime
{

void request_shutdown() noexcept;
bool should_shutdown() noexcept;

// Routes SIGINT/SIGTERM to request_shutdown().
void install_signal_handlers();

// Sleeps in short slices until shutdown is requested or the timeout elapses.
// Returns true when shutdown was requested.
bool wait_for_shutdown(std::chrono::milliseconds timeout);

} // namespace ft::runtime
