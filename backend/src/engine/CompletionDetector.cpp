#include "engine/CompletionDetector.hpp"

#include "engine/Errors.hpp"
#include "utils/Log.hpp"

#include <exception>
#include <utility>

namespace ft::engine
{

CompletionDetector::CompletionDetector(EngineGateway &engine,
                                       JobRegistry &registry,
                                       ArchiveCache &archives, Deferrer defer)
    : engine_(engine), registry_(registry), archives_(archives),
      defer_(std::move(defer))
{
}

std::vector<FileEntry>
CompletionDetector::snapshot_files(JobRecord const &record,
                                   EngineHandle handle)
{
    try
    {
        return resolve_manifest(record.save_path,
                                engine_.file_manifest(handle));
    }
    catch (std::exception const &ex)
    {
        FT_LOG_WARN("no file manifest for {}: {}", record.id, ex.what());
        return {};
    }
}

void CompletionDetector::quiesce(std::string const &id, EngineHandle handle)
{
    auto const attempt = [&](char const *what, auto &&action)
    {
        try
        {
            action();
        }
        catch (std::exception const &ex)
        {
            FT_LOG_WARN("{} failed for {}: {}", what, id, ex.what());
        }
    };
    attempt("pause", [&] { engine_.pause(handle); });
    attempt("upload limit", [&] { engine_.set_upload_limit(handle, 0); });
    attempt("upload slots", [&] { engine_.set_max_uploads(handle, 0); });
    attempt("super seeding off",
            [&] { engine_.set_wide_distribution(handle, false); });
}

void CompletionDetector::prebuild_archive(JobRecord const &completed)
{
    auto const *snapshot = std::get_if<CompletedSnapshot>(&completed.link);
    if (snapshot == nullptr || snapshot->files.size() <= 1 ||
        !completed.completed_at)
    {
        return;
    }
    auto build = [this, id = completed.id, files = snapshot->files,
                  name = completed.name, at = *completed.completed_at]
    {
        try
        {
            archives_.build_if_needed(id, files, name, at,
                                      [this, &id]
                                      { return registry_.is_completed(id); });
        }
        catch (std::exception const &ex)
        {
            FT_LOG_WARN("failed to prebuild archive for {}: {}", id,
                        ex.what());
        }
    };
    if (defer_)
    {
        defer_(std::move(build));
    }
    else
    {
        build();
    }
}

bool CompletionDetector::on_complete(std::string const &id,
                                     JobStats const &stats)
{
    if (registry_.is_completed(id))
    {
        return false;
    }
    try
    {
        auto record = registry_.find(id);
        if (!record)
        {
            return false;
        }
        auto handle = record->handle();
        if (!handle)
        {
            return false;
        }

        auto files = snapshot_files(*record, *handle);
        quiesce(id, *handle);

        auto const snapshot_time = Clock::now();
        auto completed = make_completed_record(*record, stats,
                                               std::move(files), snapshot_time);

        if (engine_.is_valid(*handle))
        {
            try
            {
                engine_.remove(*handle, false);
            }
            catch (std::exception const &ex)
            {
                FT_LOG_WARN("failed to detach {} from engine: {}", id,
                            ex.what());
            }
        }

        if (!registry_.mark_completed(id, completed))
        {
            return false;
        }
        prebuild_archive(completed);
        FT_LOG_INFO("download complete, stopped seeding: {}", completed.name);
        return true;
    }
    catch (std::exception const &ex)
    {
        FT_LOG_ERROR("failed to finalize completed job {}: {}", id, ex.what());
        return false;
    }
}

} // namespace ft::engine
