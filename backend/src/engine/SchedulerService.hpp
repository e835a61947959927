#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <queue>
#include <unordered_set>
#include <vector>

namespace ft::engine
{

// Fixed-interval periodic tasks driven by the owner's loop. Not thread-safe:
// schedule, cancel and tick belong to one thread.
class SchedulerService
{
  public:
    using Clock = std::chrono::steady_clock;
    using TaskId = std::size_t;
    using Callback = std::function<void()>;

    TaskId schedule(std::chrono::milliseconds interval, Callback callback);
    void cancel(TaskId id);

    // Runs every due task once. Returns how many ran.
    std::size_t tick(Clock::time_point now);

    // How long the loop may sleep before work is due.
    std::chrono::milliseconds time_until_next_task(Clock::time_point now) const;

    bool empty() const noexcept
    {
        return tasks_.empty();
    }

  private:
    struct Task
    {
        TaskId id;
        std::chrono::milliseconds interval;
        Clock::time_point next_run;
        Callback callback;

        bool operator>(const Task &other) const
        {
            return next_run > other.next_run;
        }
    };

    std::priority_queue<Task, std::vector<Task>, std::greater<Task>> tasks_;
    std::unordered_set<TaskId> cancelled_;
    TaskId next_id_ = 1;
};

} // namespace ft::engine
