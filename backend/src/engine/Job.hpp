#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ft::engine
{

using Clock = std::chrono::system_clock;

// Opaque reference to a job inside the transfer engine; 0 is never issued.
using EngineHandle = std::uint64_t;
constexpr EngineHandle kInvalidHandle = 0;

enum class SourceKind
{
    Magnet,
    Url,
    Hash,
    File,
};

char const *to_string(SourceKind kind) noexcept;

// One file of a job as declared by the engine's manifest.
struct ManifestEntry
{
    std::string relative_path;
    std::int64_t size = 0;
};

struct FileEntry
{
    std::string relative_path;
    std::filesystem::path absolute_path;
    std::int64_t size = 0;
};

// Raw per-job numbers reported by the engine.
struct JobStats
{
    std::string name;
    std::string state;
    double progress = 0.0; // 0..1
    std::int64_t download_rate = 0;
    std::int64_t upload_rate = 0;
    int num_peers = 0;
    int num_seeds = 0;
    std::int64_t total_wanted = 0;
    std::int64_t total_wanted_done = 0;
    std::int64_t all_time_upload = 0;
    std::int64_t all_time_download = 0;
};

struct ActiveLink
{
    EngineHandle handle = kInvalidHandle;
};

struct CompletedSnapshot
{
    std::vector<FileEntry> files;
};

struct JobRecord
{
    std::string id;
    std::string name;
    std::string state;
    double progress = 0.0; // percent
    std::int64_t download_rate = 0;
    std::int64_t upload_rate = 0;
    int num_peers = 0;
    int num_seeds = 0;
    std::int64_t total_size = 0;
    std::int64_t downloaded = 0;
    std::int64_t uploaded = 0;
    double ratio = 0.0;
    std::int64_t eta = -1;
    std::filesystem::path save_path;
    Clock::time_point added_time{};
    std::optional<Clock::time_point> completed_at;
    SourceKind source = SourceKind::Magnet;
    std::optional<std::filesystem::path> descriptor_path;
    std::variant<ActiveLink, CompletedSnapshot> link;

    bool is_completed() const noexcept
    {
        return std::holds_alternative<CompletedSnapshot>(link);
    }

    std::optional<EngineHandle> handle() const noexcept
    {
        if (auto const *active = std::get_if<ActiveLink>(&link))
        {
            return active->handle;
        }
        return std::nullopt;
    }
};

inline constexpr char const kCompletedState[] = "completed";

double compute_ratio(std::int64_t uploaded, std::int64_t downloaded) noexcept;
std::int64_t compute_eta(std::int64_t remaining,
                         std::int64_t download_rate) noexcept;

// Copies live engine numbers into an active record.
void apply_stats(JobRecord &record, JobStats const &stats);

// Builds the frozen record stored once a job finishes.
JobRecord make_completed_record(JobRecord const &active,
                                JobStats const &stats,
                                std::vector<FileEntry> files,
                                Clock::time_point completed_at);

// True for non-empty, non-absolute paths without empty or ".." segments.
bool relative_path_is_safe(std::string_view path) noexcept;

// Joins manifest entries onto the job's save root. Unsafe paths are dropped.
std::vector<FileEntry> resolve_manifest(
    std::filesystem::path const &save_path,
    std::vector<ManifestEntry> const &manifest);

double to_epoch_seconds(Clock::time_point tp) noexcept;

} // namespace ft::engine
