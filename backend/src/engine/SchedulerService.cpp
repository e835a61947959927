#include "engine/SchedulerService.hpp"

#include "utils/Log.hpp"

#include <exception>

namespace ft::engine
{

auto SchedulerService::schedule(std::chrono::milliseconds interval,
                                Callback callback) -> TaskId
{
    TaskId id = next_id_++;
    auto next = Clock::now() + interval;
    tasks_.push({id, interval, next, std::move(callback)});
    return id;
}

void SchedulerService::cancel(TaskId id)
{
    cancelled_.insert(id);
}

std::size_t SchedulerService::tick(Clock::time_point now)
{
    std::size_t executed = 0;
    std::vector<Task> due;
    while (!tasks_.empty() && tasks_.top().next_run <= now)
    {
        due.push_back(tasks_.top());
        tasks_.pop();
    }
    for (auto &task : due)
    {
        if (cancelled_.erase(task.id) != 0)
        {
            continue;
        }
        if (task.callback)
        {
            try
            {
                task.callback();
            }
            catch (std::exception const &ex)
            {
                FT_LOG_WARN("scheduled task {} failed: {}", task.id,
                            ex.what());
            }
            ++executed;
        }
        // a slow tick never causes a burst of catch-up runs
        task.next_run = now + task.interval;
        tasks_.push(std::move(task));
    }
    return executed;
}

std::chrono::milliseconds
SchedulerService::time_until_next_task(Clock::time_point now) const
{
    if (tasks_.empty())
    {
        return std::chrono::hours(24);
    }
    auto next = tasks_.top().next_run;
    if (now >= next)
        return std::chrono::milliseconds(0);
    return std::chrono::duration_cast<std::chrono::milliseconds>(next - now);
}

} // namespace ft::engine
