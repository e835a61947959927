#include "engine/ArchiveCache.hpp"

#include "engine/Errors.hpp"
#include "engine/ZipWriter.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <exception>
#include <system_error>
#include <utility>

namespace ft::engine
{

namespace
{
constexpr std::string_view kForbiddenNameChars = "\\/:*?\"<>|";
constexpr char const kFallbackName[] = "download";
} // namespace

ArchiveCache::ArchiveCache(std::filesystem::path temp_dir)
    : temp_dir_(std::move(temp_dir))
{
}

std::filesystem::path ArchiveCache::archive_path(std::string const &id) const
{
    return temp_dir_ / (id + ".zip");
}

std::string ArchiveCache::sanitize_name(std::string_view name)
{
    std::string safe;
    safe.reserve(name.size());
    for (char ch : name)
    {
        if (kForbiddenNameChars.find(ch) == std::string_view::npos)
        {
            safe.push_back(ch);
        }
    }
    auto const not_space = [](unsigned char ch) { return !std::isspace(ch); };
    safe.erase(safe.begin(),
               std::find_if(safe.begin(), safe.end(), not_space));
    safe.erase(std::find_if(safe.rbegin(), safe.rend(), not_space).base(),
               safe.end());
    if (safe.empty())
    {
        return kFallbackName;
    }
    return safe;
}

bool ArchiveCache::is_fresh(std::filesystem::path const &path,
                            Clock::time_point freshness) const
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || ec)
    {
        return false;
    }
    auto const size = std::filesystem::file_size(path, ec);
    if (ec || size == 0)
    {
        return false;
    }
    auto const written = std::filesystem::last_write_time(path, ec);
    if (ec)
    {
        return false;
    }
    auto const written_sys = std::chrono::time_point_cast<Clock::duration>(
        std::chrono::file_clock::to_sys(written));
    return written_sys >= freshness;
}

void ArchiveCache::write_archive(std::filesystem::path const &target,
                                 std::vector<FileEntry> const &files)
{
    ZipWriter writer(target);
    for (auto const &file : files)
    {
        writer.add_file(file.absolute_path, file.relative_path);
    }
    writer.finish();
}

ArchiveEntry ArchiveCache::build_if_needed(std::string const &id,
                                           std::vector<FileEntry> const &files,
                                           std::string const &display_name,
                                           Clock::time_point freshness,
                                           Guard const &still_wanted)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (still_wanted && !still_wanted())
    {
        throw Error(ErrorCode::NotFound, "Torrent not found");
    }
    ArchiveEntry entry;
    entry.path = archive_path(id);
    entry.base_name = sanitize_name(display_name);
    entry.freshness = freshness;

    if (is_fresh(entry.path, freshness))
    {
        FT_LOG_DEBUG("reusing cached archive {}", entry.path.string());
        return entry;
    }

    std::error_code ec;
    std::filesystem::create_directories(temp_dir_, ec);
    auto partial = entry.path;
    partial += ".partial";
    try
    {
        write_archive(partial, files);
        std::filesystem::rename(partial, entry.path);
    }
    catch (std::exception const &ex)
    {
        std::filesystem::remove(partial, ec);
        std::filesystem::remove(entry.path, ec);
        FT_LOG_WARN("archive build failed for {}: {}", id, ex.what());
        throw Error(ErrorCode::ArchiveBuildFailure,
                    std::string("Failed to build archive: ") + ex.what());
    }
    FT_LOG_INFO("built archive {} ({} files)", entry.path.string(),
                files.size());
    return entry;
}

void ArchiveCache::remove(std::string const &id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    std::filesystem::remove(archive_path(id), ec);
    if (ec)
    {
        FT_LOG_WARN("failed to remove archive for {}: {}", id, ec.message());
    }
}

} // namespace ft::engine
