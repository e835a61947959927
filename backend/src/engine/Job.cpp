#include "engine/Job.hpp"

#include <algorithm>

namespace ft::engine
{

char const *to_string(SourceKind kind) noexcept
{
    switch (kind)
    {
    case SourceKind::Magnet:
        return "magnet";
    case SourceKind::Url:
        return "url";
    case SourceKind::Hash:
        return "hash";
    case SourceKind::File:
        return "file";
    }
    return "magnet";
}

double compute_ratio(std::int64_t uploaded, std::int64_t downloaded) noexcept
{
    return static_cast<double>(uploaded) /
           static_cast<double>(std::max<std::int64_t>(downloaded, 1));
}

std::int64_t compute_eta(std::int64_t remaining,
                         std::int64_t download_rate) noexcept
{
    if (download_rate <= 0)
    {
        return -1;
    }
    return std::max<std::int64_t>(remaining, 0) / download_rate;
}

void apply_stats(JobRecord &record, JobStats const &stats)
{
    if (!stats.name.empty())
    {
        record.name = stats.name;
    }
    record.state = stats.state;
    record.progress = stats.progress * 100.0;
    record.download_rate = stats.download_rate;
    record.upload_rate = stats.upload_rate;
    record.num_peers = stats.num_peers;
    record.num_seeds = stats.num_seeds;
    record.total_size = stats.total_wanted;
    record.downloaded = stats.total_wanted_done;
    record.uploaded = stats.all_time_upload;
    record.ratio = compute_ratio(stats.all_time_upload, stats.all_time_download);
    record.eta = compute_eta(stats.total_wanted - stats.total_wanted_done,
                             stats.download_rate);
}

JobRecord make_completed_record(JobRecord const &active,
                                JobStats const &stats,
                                std::vector<FileEntry> files,
                                Clock::time_point completed_at)
{
    JobRecord record = active;
    if (!stats.name.empty())
    {
        record.name = stats.name;
    }
    record.state = kCompletedState;
    record.progress = 100.0;
    record.download_rate = 0;
    record.upload_rate = 0;
    record.num_peers = 0;
    record.num_seeds = 0;
    record.total_size = stats.total_wanted;
    record.downloaded = stats.total_wanted;
    record.uploaded = stats.all_time_upload;
    record.ratio = compute_ratio(stats.all_time_upload, stats.all_time_download);
    record.eta = 0;
    record.completed_at = completed_at;
    record.link = CompletedSnapshot{std::move(files)};
    return record;
}

bool relative_path_is_safe(std::string_view path) noexcept
{
    if (path.empty() || path.front() == '/' || path.front() == '\\')
    {
        return false;
    }
    std::size_t start = 0;
    while (start <= path.size())
    {
        auto end = path.find_first_of("/\\", start);
        if (end == std::string_view::npos)
        {
            end = path.size();
        }
        auto const segment = path.substr(start, end - start);
        if (segment.empty() || segment == "..")
        {
            return false;
        }
        start = end + 1;
    }
    return true;
}

std::vector<FileEntry> resolve_manifest(
    std::filesystem::path const &save_path,
    std::vector<ManifestEntry> const &manifest)
{
    std::vector<FileEntry> files;
    files.reserve(manifest.size());
    for (auto const &entry : manifest)
    {
        if (!relative_path_is_safe(entry.relative_path))
        {
            continue;
        }
        FileEntry file;
        file.relative_path = entry.relative_path;
        file.absolute_path = save_path / entry.relative_path;
        file.size = entry.size;
        files.push_back(std::move(file));
    }
    return files;
}

double to_epoch_seconds(Clock::time_point tp) noexcept
{
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

} // namespace ft::engine
