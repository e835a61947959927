#pragma once

#include "engine/ArchiveCache.hpp"
#include "engine/EngineGateway.hpp"
#include "engine/Job.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace ft::engine
{

// Authoritative store of active and completed jobs. Every read and write
// goes through one mutex; a job id lives in exactly one of the two maps.
class JobRegistry
{
  public:
    JobRegistry(EngineGateway &engine, ArchiveCache &archives);
    JobRegistry(JobRegistry const &) = delete;
    JobRegistry &operator=(JobRegistry const &) = delete;

    // Returns a fresh UUIDv4 never handed out before by this registry.
    std::string issue_id();

    void add_active(JobRecord record);
    std::optional<JobRecord> find(std::string const &id) const;
    JobRecord get(std::string const &id) const; // throws NotFound
    bool contains(std::string const &id) const;
    bool is_completed(std::string const &id) const;
    std::optional<Clock::time_point> completed_at(std::string const &id) const;
    std::size_t active_count() const;

    std::vector<std::pair<std::string, EngineHandle>> active_snapshot() const;
    void update_stats(std::string const &id, JobStats const &stats);

    // Moves the job from active to completed. Returns false when the job
    // was already completed or is unknown.
    bool mark_completed(std::string const &id, JobRecord completed);

    // All records, newest submission first.
    std::vector<JobRecord> merged_view() const;

    // Erases the job from whichever map holds it, then releases its engine
    // handle or its files. Throws NotFound.
    void remove(std::string const &id, bool delete_files);

  private:
    void release_active(JobRecord const &record, bool delete_files);
    void release_completed(JobRecord const &record, bool delete_files);
    void delete_side_files(JobRecord const &record);

    EngineGateway &engine_;
    ArchiveCache &archives_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, JobRecord> active_;
    std::unordered_map<std::string, JobRecord> completed_;
    std::unordered_set<std::string> issued_ids_;
};

// Deletes empty directories from start upward, stopping at the first
// non-empty one and never touching the filesystem root.
void prune_empty_directories(std::filesystem::path const &start);

} // namespace ft::engine
