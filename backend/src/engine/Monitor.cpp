#include "engine/Monitor.hpp"

#include "utils/Log.hpp"

#include <exception>
#include <utility>

namespace ft::engine
{

Monitor::Monitor(EngineGateway &engine, JobRegistry &registry,
                 CompletionDetector &detector)
    : engine_(engine), registry_(registry), detector_(detector)
{
}

void Monitor::set_listener(Listener listener)
{
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener_ = std::move(listener);
}

void Monitor::tick()
{
    std::lock_guard<std::mutex> tick_lock(tick_mutex_);
    for (auto const &[id, handle] : registry_.active_snapshot())
    {
        try
        {
            auto const stats = engine_.status(handle);
            registry_.update_stats(id, stats);
            if (stats.progress >= 1.0)
            {
                detector_.on_complete(id, stats);
            }
        }
        catch (std::exception const &ex)
        {
            FT_LOG_WARN("monitor: status of {} failed: {}", id, ex.what());
        }
    }
    publish();
}

std::unique_lock<std::mutex> Monitor::exclusive()
{
    return std::unique_lock<std::mutex>(tick_mutex_);
}

void Monitor::publish()
{
    Listener listener;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener = listener_;
    }
    if (!listener)
    {
        return;
    }
    try
    {
        listener(registry_.merged_view());
    }
    catch (std::exception const &ex)
    {
        FT_LOG_WARN("monitor: update listener failed: {}", ex.what());
    }
}

} // namespace ft::engine
