#pragma once

#include "engine/Job.hpp"

#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace ft::engine
{

struct ArchiveEntry
{
    std::filesystem::path path;
    std::string base_name;
    Clock::time_point freshness{};

    std::string download_name() const
    {
        return base_name + ".zip";
    }
};

// Per-job ZIP archives under the temp directory, reused while fresh.
class ArchiveCache
{
  public:
    explicit ArchiveCache(std::filesystem::path temp_dir);

    // Checked under the cache lock; false aborts the build with NotFound.
    using Guard = std::function<bool()>;

    // Reuses <temp>/<id>.zip when it is non-empty and not older than
    // freshness; otherwise rebuilds it. Throws Error(ArchiveBuildFailure).
    ArchiveEntry build_if_needed(std::string const &id,
                                 std::vector<FileEntry> const &files,
                                 std::string const &display_name,
                                 Clock::time_point freshness,
                                 Guard const &still_wanted = {});

    void remove(std::string const &id);
    std::filesystem::path archive_path(std::string const &id) const;

    static std::string sanitize_name(std::string_view name);

  private:
    bool is_fresh(std::filesystem::path const &path,
                  Clock::time_point freshness) const;
    void write_archive(std::filesystem::path const &target,
                       std::vector<FileEntry> const &files);

    std::filesystem::path temp_dir_;
    std::mutex mutex_;
};

} // namespace ft::engine
