#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace ft::engine {

// Single worker thread draining a FIFO of tasks.
class AsyncTaskService {
public:
  explicit AsyncTaskService(std::string name);
  AsyncTaskService(AsyncTaskService const &) = delete;
  AsyncTaskService &operator=(AsyncTaskService const &) = delete;
  ~AsyncTaskService();

  void start();
  // Queued tasks that have not started are dropped when discard_pending.
  void stop(bool discard_pending = true);
  bool is_running() const noexcept;
  std::size_t pending() const;
  void submit(std::function<void()> task);

private:
  void loop();

  std::string name_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::function<void()>> tasks_;
  std::thread worker_;
  std::atomic<bool> running_{false};
  std::atomic<bool> exit_requested_{false};
};

} // namespace ft::engine
