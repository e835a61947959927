#pragma once

#include "engine/CompletionDetector.hpp"
#include "engine/EngineGateway.hpp"
#include "engine/JobRegistry.hpp"

#include <functional>
#include <mutex>
#include <vector>

namespace ft::engine
{

class Monitor
{
  public:
    using Listener = std::function<void(std::vector<JobRecord> const &)>;

    Monitor(EngineGateway &engine, JobRegistry &registry,
            CompletionDetector &detector);

    void set_listener(Listener listener);

    // Polls every active job, finalizes finished ones, then hands the merged
    // view to the listener. Concurrent calls run one after the other.
    void tick();

    // Hands the current merged view to the listener without polling.
    void publish();

    // Blocks ticks while held; user mutations take it so they never land
    // inside a completion pass.
    std::unique_lock<std::mutex> exclusive();

  private:
    EngineGateway &engine_;
    JobRegistry &registry_;
    CompletionDetector &detector_;
    std::mutex tick_mutex_;
    std::mutex listener_mutex_;
    Listener listener_;
};

} // namespace ft::engine
