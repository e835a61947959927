#include "engine/JobRegistry.hpp"

#include "engine/Errors.hpp"
#include "utils/Log.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstdint>
#include <random>
#include <system_error>

namespace ft::engine
{

namespace
{
std::string generate_uuid()
{
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<std::uint64_t> dis;

    std::uint64_t ab = dis(gen);
    std::uint64_t cd = dis(gen);

    // version 4, RFC 4122 variant
    ab = (ab & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    cd = (cd & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                       static_cast<std::uint32_t>(ab >> 32),
                       static_cast<std::uint32_t>((ab >> 16) & 0xFFFF),
                       static_cast<std::uint32_t>(ab & 0xFFFF),
                       static_cast<std::uint32_t>(cd >> 48),
                       cd & 0xFFFFFFFFFFFFULL);
}

Error not_found()
{
    return Error(ErrorCode::NotFound, "Torrent not found");
}
} // namespace

void prune_empty_directories(std::filesystem::path const &start)
{
    std::error_code ec;
    auto current = start.lexically_normal();
    while (!current.empty() && current != current.root_path() &&
           current.has_relative_path())
    {
        if (!std::filesystem::is_directory(current, ec))
        {
            current = current.parent_path();
            continue;
        }
        if (!std::filesystem::is_empty(current, ec) || ec)
        {
            break;
        }
        if (!std::filesystem::remove(current, ec) || ec)
        {
            break;
        }
        FT_LOG_DEBUG("removed empty directory {}", current.string());
        current = current.parent_path();
    }
}

JobRegistry::JobRegistry(EngineGateway &engine, ArchiveCache &archives)
    : engine_(engine), archives_(archives)
{
}

std::string JobRegistry::issue_id()
{
    std::lock_guard<std::mutex> lock(mutex_);
    while (true)
    {
        auto id = generate_uuid();
        if (issued_ids_.insert(id).second)
        {
            return id;
        }
    }
}

void JobRegistry::add_active(JobRecord record)
{
    std::lock_guard<std::mutex> lock(mutex_);
    issued_ids_.insert(record.id);
    auto id = record.id;
    active_.insert_or_assign(std::move(id), std::move(record));
}

std::optional<JobRecord> JobRegistry::find(std::string const &id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = active_.find(id); it != active_.end())
    {
        return it->second;
    }
    if (auto it = completed_.find(id); it != completed_.end())
    {
        return it->second;
    }
    return std::nullopt;
}

JobRecord JobRegistry::get(std::string const &id) const
{
    if (auto record = find(id))
    {
        return std::move(*record);
    }
    throw not_found();
}

bool JobRegistry::contains(std::string const &id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.count(id) != 0 || completed_.count(id) != 0;
}

bool JobRegistry::is_completed(std::string const &id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_.count(id) != 0;
}

std::optional<Clock::time_point>
JobRegistry::completed_at(std::string const &id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = completed_.find(id); it != completed_.end())
    {
        return it->second.completed_at;
    }
    return std::nullopt;
}

std::size_t JobRegistry::active_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

std::vector<std::pair<std::string, EngineHandle>>
JobRegistry::active_snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::pair<std::string, EngineHandle>> result;
    result.reserve(active_.size());
    for (auto const &[id, record] : active_)
    {
        if (auto handle = record.handle())
        {
            result.emplace_back(id, *handle);
        }
    }
    return result;
}

void JobRegistry::update_stats(std::string const &id, JobStats const &stats)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = active_.find(id); it != active_.end())
    {
        apply_stats(it->second, stats);
    }
}

bool JobRegistry::mark_completed(std::string const &id, JobRecord completed)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (completed_.count(id) != 0)
    {
        return false;
    }
    auto it = active_.find(id);
    if (it == active_.end())
    {
        return false;
    }
    active_.erase(it);
    completed.id = id;
    completed_.insert_or_assign(id, std::move(completed));
    return true;
}

std::vector<JobRecord> JobRegistry::merged_view() const
{
    std::vector<JobRecord> view;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        view.reserve(active_.size() + completed_.size());
        for (auto const &[id, record] : active_)
        {
            view.push_back(record);
        }
        for (auto const &[id, record] : completed_)
        {
            view.push_back(record);
        }
    }
    std::stable_sort(view.begin(), view.end(),
                     [](JobRecord const &a, JobRecord const &b)
                     { return a.added_time > b.added_time; });
    return view;
}

void JobRegistry::remove(std::string const &id, bool delete_files)
{
    JobRecord record;
    bool completed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto it = active_.find(id); it != active_.end())
        {
            record = std::move(it->second);
            active_.erase(it);
        }
        else if (auto done = completed_.find(id); done != completed_.end())
        {
            record = std::move(done->second);
            completed_.erase(done);
            completed = true;
        }
        else
        {
            throw not_found();
        }
    }
    if (completed)
    {
        release_completed(record, delete_files);
    }
    else
    {
        release_active(record, delete_files);
    }
}

void JobRegistry::release_active(JobRecord const &record, bool delete_files)
{
    if (auto handle = record.handle())
    {
        try
        {
            engine_.remove(*handle, delete_files);
        }
        catch (Error const &ex)
        {
            FT_LOG_WARN("engine removal of {} failed: {}", record.id,
                        ex.what());
        }
    }
    delete_side_files(record);
    FT_LOG_INFO("removed job {} (delete_files={})", record.id, delete_files);
}

void JobRegistry::release_completed(JobRecord const &record,
                                    bool delete_files)
{
    if (delete_files)
    {
        if (auto const *snapshot = std::get_if<CompletedSnapshot>(&record.link))
        {
            for (auto const &file : snapshot->files)
            {
                std::error_code ec;
                std::filesystem::remove(file.absolute_path, ec);
                if (ec)
                {
                    FT_LOG_WARN("failed to delete {}: {}",
                                file.absolute_path.string(), ec.message());
                    continue;
                }
                prune_empty_directories(file.absolute_path.parent_path());
            }
        }
        prune_empty_directories(record.save_path);
    }
    delete_side_files(record);
    FT_LOG_INFO("removed completed job {} (delete_files={})", record.id,
                delete_files);
}

void JobRegistry::delete_side_files(JobRecord const &record)
{
    archives_.remove(record.id);
    if (record.descriptor_path)
    {
        std::error_code ec;
        std::filesystem::remove(*record.descriptor_path, ec);
    }
}

} // namespace ft::engine
