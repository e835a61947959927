#pragma once

#include "engine/ArchiveCache.hpp"
#include "engine/EngineGateway.hpp"
#include "engine/JobRegistry.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ft::engine
{

struct ServedFile
{
    std::filesystem::path path;
    std::string download_name;
    std::string content_type;
};

// Resolves downloadable content for a job without going through the
// monitor loop.
class FileServer
{
  public:
    FileServer(EngineGateway &engine, JobRegistry &registry,
               ArchiveCache &archives);

    // Declared files of the job: live manifest while active, the stored
    // snapshot once completed.
    std::vector<FileEntry> files(std::string const &id);

    // Declared files that exist on disk. Throws NotFound when none do.
    std::vector<FileEntry> available_files(std::string const &id);

    // selector is a relative path inside the job; without one, a sole file
    // is served directly and several are served as the cached archive.
    ServedFile resolve(std::string const &id,
                       std::optional<std::string> const &selector);

  private:
    EngineGateway &engine_;
    JobRegistry &registry_;
    ArchiveCache &archives_;
};

} // namespace ft::engine
