#pragma once

#include "engine/Errors.hpp"
#include "engine/Job.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ft::engine
{

enum class StorageMode
{
    Sparse,
    Allocate,
};

struct AddJobParams
{
    // Exactly one of these is populated.
    std::optional<std::string> magnet_uri;
    std::vector<std::uint8_t> descriptor;

    std::filesystem::path save_path;
    StorageMode storage = StorageMode::Sparse;
    bool auto_managed = true;
    bool sequential = false;
    bool duplicate_is_error = true;
};

// Narrow view of the transfer engine. Every call throws Error with
// ErrorCode::EngineFailure when the engine rejects it or the handle is stale.
class EngineGateway
{
  public:
    virtual ~EngineGateway() = default;

    virtual EngineHandle submit(AddJobParams const &params) = 0;
    virtual JobStats status(EngineHandle handle) = 0;
    // Fails while metadata is still unknown.
    virtual std::vector<ManifestEntry> file_manifest(EngineHandle handle) = 0;

    virtual void pause(EngineHandle handle) = 0;
    virtual void resume(EngineHandle handle) = 0;
    virtual void remove(EngineHandle handle, bool delete_files) = 0;
    virtual bool is_valid(EngineHandle handle) = 0;

    virtual void set_upload_limit(EngineHandle handle, int bytes_per_second) = 0;
    virtual void set_max_uploads(EngineHandle handle, int slots) = 0;
    virtual void set_wide_distribution(EngineHandle handle, bool enabled) = 0;

    virtual BestEffort apply_boost(EngineHandle handle) = 0;
    // No-op success unless the job is fully downloaded.
    virtual BestEffort enable_wide_distribution(EngineHandle handle) = 0;

    virtual bool dht_enabled() const = 0;
    virtual void shutdown() = 0;
};

} // namespace ft::engine
