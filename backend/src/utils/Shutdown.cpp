#include "utils/Shutdown.hpp"

#include <algorithm>
#include <atomic>
#include <csignal>
#include <thread>

namespace ft::runtime {

namespace {
std::atomic_bool g_shutdown_requested{false};

void signal_handler(int) { request_shutdown(); }

constexpr auto kWaitSlice = std::chrono::milliseconds(100);
} // namespace

void request_shutdown() noexcept {
  g_shutdown_requested.store(true, std::memory_order_relaxed);
}

bool should_shutdown() noexcept {
  return g_shutdown_requested.load(std::memory_order_relaxed);
}

void install_signal_handlers() {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);
#if defined(SIGPIPE)
  std::signal(SIGPIPE, SIG_IGN);
#endif
}

bool wait_for_shutdown(std::chrono::milliseconds timeout) {
  auto const deadline = std::chrono::steady_clock::now() + timeout;
  while (!should_shutdown()) {
    auto const now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return false;
    }
    auto const remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::this_thread::sleep_for(std::min(remaining, kWaitSlice));
  }
  return true;
}

} // namespace ft::runtime
