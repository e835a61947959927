#pragma once

#include "engine/ArchiveCache.hpp"
#include "engine/EngineGateway.hpp"
#include "engine/JobRegistry.hpp"

#include <functional>
#include <string>

namespace ft::engine
{

// One-way active -> completed transition for jobs the engine reports as
// fully downloaded.
class CompletionDetector
{
  public:
    // Runs work off the calling thread; empty means run inline.
    using Deferrer = std::function<void(std::function<void()>)>;

    CompletionDetector(EngineGateway &engine, JobRegistry &registry,
                       ArchiveCache &archives, Deferrer defer = {});

    // Returns true when this call performed the transition.
    bool on_complete(std::string const &id, JobStats const &stats);

  private:
    std::vector<FileEntry> snapshot_files(JobRecord const &record,
                                          EngineHandle handle);
    void quiesce(std::string const &id, EngineHandle handle);
    void prebuild_archive(JobRecord const &completed);

    EngineGateway &engine_;
    JobRegistry &registry_;
    ArchiveCache &archives_;
    Deferrer defer_;
};

} // namespace ft::engine
