#include "engine/FileServer.hpp"

#include "engine/Errors.hpp"
#include "utils/Log.hpp"

#include <system_error>

namespace ft::engine
{

namespace
{
constexpr char const kNoFilesYet[] =
    "No files available yet. The torrent may still be downloading.";

ServedFile serve_single(FileEntry const &file)
{
    return {file.absolute_path, file.absolute_path.filename().string(),
            "application/octet-stream"};
}

std::vector<FileEntry> existing_only(std::vector<FileEntry> files)
{
    std::vector<FileEntry> existing;
    existing.reserve(files.size());
    for (auto &file : files)
    {
        std::error_code ec;
        if (std::filesystem::exists(file.absolute_path, ec) && !ec)
        {
            existing.push_back(std::move(file));
        }
    }
    return existing;
}
} // namespace

FileServer::FileServer(EngineGateway &engine, JobRegistry &registry,
                       ArchiveCache &archives)
    : engine_(engine), registry_(registry), archives_(archives)
{
}

std::vector<FileEntry> FileServer::files(std::string const &id)
{
    auto const record = registry_.get(id);
    if (auto const *snapshot = std::get_if<CompletedSnapshot>(&record.link))
    {
        return snapshot->files;
    }
    auto const handle = record.handle();
    if (!handle)
    {
        throw Error(ErrorCode::NotFound, "Torrent not found");
    }
    try
    {
        return resolve_manifest(record.save_path,
                                engine_.file_manifest(*handle));
    }
    catch (Error const &ex)
    {
        throw Error(ErrorCode::EngineFailure,
                    std::string("Could not read torrent metadata: ") +
                        ex.what());
    }
}

std::vector<FileEntry> FileServer::available_files(std::string const &id)
{
    auto existing = existing_only(files(id));
    if (existing.empty())
    {
        throw Error(ErrorCode::NotFound, kNoFilesYet);
    }
    return existing;
}

ServedFile FileServer::resolve(std::string const &id,
                               std::optional<std::string> const &selector)
{
    if (selector && !relative_path_is_safe(*selector))
    {
        throw Error(ErrorCode::InvalidPath, "Invalid file path");
    }

    auto const record = registry_.get(id);
    auto existing = available_files(id);

    if (selector)
    {
        auto const requested =
            std::filesystem::path(*selector).lexically_normal();
        for (auto const &file : existing)
        {
            if (std::filesystem::path(file.relative_path).lexically_normal() ==
                requested)
            {
                return serve_single(file);
            }
        }
        throw Error(ErrorCode::NotFound,
                    "Requested file not found in torrent contents");
    }

    if (existing.size() == 1)
    {
        return serve_single(existing.front());
    }

    auto const freshness = record.completed_at.value_or(record.added_time);
    auto archive = archives_.build_if_needed(
        id, existing, record.name, freshness,
        [this, &id] { return registry_.contains(id); });
    FT_LOG_DEBUG("serving archive {} for {}", archive.path.string(), id);
    return {archive.path, archive.download_name(), "application/zip"};
}

} // namespace ft::engine
