#include "rpc/Serializer.hpp"

#include "utils/Json.hpp"
#include "utils/Version.hpp"

#include <cmath>
#include <cstdint>
#include <yyjson.h>

namespace ft::rpc
{

namespace
{
constexpr double kBytesPerGiB = 1024.0 * 1024.0 * 1024.0;

double round_to(double value, int digits)
{
    auto const scale = std::pow(10.0, digits);
    return std::round(value * scale) / scale;
}

yyjson_mut_val *job_object(yyjson_mut_doc *native,
                           engine::JobRecord const &job)
{
    auto *obj = yyjson_mut_obj(native);
    yyjson_mut_obj_add_strcpy(native, obj, "id", job.id.c_str());
    yyjson_mut_obj_add_strcpy(native, obj, "name", job.name.c_str());
    yyjson_mut_obj_add_strcpy(native, obj, "state", job.state.c_str());
    yyjson_mut_obj_add_real(native, obj, "progress", job.progress);
    yyjson_mut_obj_add_real(native, obj, "download_rate",
                            static_cast<double>(job.download_rate));
    yyjson_mut_obj_add_real(native, obj, "upload_rate",
                            static_cast<double>(job.upload_rate));
    yyjson_mut_obj_add_int(native, obj, "num_peers", job.num_peers);
    yyjson_mut_obj_add_int(native, obj, "num_seeds", job.num_seeds);
    yyjson_mut_obj_add_int(native, obj, "total_size", job.total_size);
    yyjson_mut_obj_add_int(native, obj, "downloaded", job.downloaded);
    yyjson_mut_obj_add_int(native, obj, "uploaded", job.uploaded);
    yyjson_mut_obj_add_real(native, obj, "ratio", job.ratio);
    yyjson_mut_obj_add_int(native, obj, "eta", job.eta);
    yyjson_mut_obj_add_strcpy(native, obj, "save_path",
                              job.save_path.string().c_str());
    yyjson_mut_obj_add_real(native, obj, "added_time",
                            engine::to_epoch_seconds(job.added_time));
    if (job.completed_at)
    {
        yyjson_mut_obj_add_real(native, obj, "completed_at",
                                engine::to_epoch_seconds(*job.completed_at));
    }
    else
    {
        yyjson_mut_obj_add_null(native, obj, "completed_at");
    }
    yyjson_mut_obj_add_str(native, obj, "source",
                           engine::to_string(job.source));
    return obj;
}

yyjson_mut_val *job_array(yyjson_mut_doc *native,
                          std::vector<engine::JobRecord> const &jobs)
{
    auto *arr = yyjson_mut_arr(native);
    for (auto const &job : jobs)
    {
        yyjson_mut_arr_append(arr, job_object(native, job));
    }
    return arr;
}
} // namespace

std::string serialize_job(engine::JobRecord const &job)
{
    ft::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }
    doc.set_root(job_object(doc.doc(), job));
    return doc.write();
}

std::string serialize_job_list(std::vector<engine::JobRecord> const &jobs)
{
    ft::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "[]";
    }
    doc.set_root(job_array(doc.doc(), jobs));
    return doc.write("[]");
}

std::string serialize_update(std::vector<engine::JobRecord> const &jobs)
{
    ft::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }

    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    doc.set_root(root);
    yyjson_mut_obj_add_str(native, root, "type", "update");
    yyjson_mut_obj_add_val(native, root, "torrents", job_array(native, jobs));
    return doc.write(R"({"type":"update","torrents":[]})");
}

std::string serialize_files(std::vector<engine::FileEntry> const &files)
{
    ft::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "[]";
    }

    auto *native = doc.doc();
    auto *arr = yyjson_mut_arr(native);
    doc.set_root(arr);
    for (auto const &file : files)
    {
        auto *entry = yyjson_mut_obj(native);
        yyjson_mut_obj_add_strcpy(native, entry, "relative_path",
                                  file.relative_path.c_str());
        yyjson_mut_obj_add_int(native, entry, "size", file.size);
        yyjson_mut_arr_append(arr, entry);
    }
    return doc.write("[]");
}

std::string serialize_submit(std::string const &id, std::string_view message)
{
    ft::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }

    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    doc.set_root(root);
    yyjson_mut_obj_add_bool(native, root, "success", true);
    yyjson_mut_obj_add_strcpy(native, root, "torrent_id", id.c_str());
    yyjson_mut_obj_add_strncpy(native, root, "message", message.data(),
                               message.size());
    return doc.write();
}

std::string serialize_action(std::string_view message)
{
    ft::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }

    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    doc.set_root(root);
    yyjson_mut_obj_add_bool(native, root, "success", true);
    yyjson_mut_obj_add_strncpy(native, root, "message", message.data(),
                               message.size());
    return doc.write();
}

std::string serialize_best_effort(engine::BestEffort const &result,
                                  std::string_view message)
{
    ft::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }

    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    doc.set_root(root);
    yyjson_mut_obj_add_bool(native, root, "success", result.ok);
    if (result.ok)
    {
        yyjson_mut_obj_add_strncpy(native, root, "message", message.data(),
                                   message.size());
    }
    else
    {
        yyjson_mut_obj_add_strcpy(native, root, "message",
                                  result.error.c_str());
    }
    return doc.write();
}

std::string serialize_health(engine::HealthReport const &report)
{
    ft::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }

    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    doc.set_root(root);
    yyjson_mut_obj_add_str(native, root, "status", "healthy");
    yyjson_mut_obj_add_uint(native, root, "active_torrents",
                            static_cast<std::uint64_t>(report.active_jobs));
    yyjson_mut_obj_add_bool(native, root, "dht_enabled", report.dht_enabled);

    auto *storage = yyjson_mut_obj(native);
    yyjson_mut_obj_add_val(native, root, "storage", storage);
    double total = 0.0;
    double used = 0.0;
    double free = 0.0;
    double used_percent = 0.0;
    if (report.storage && report.storage->total > 0)
    {
        total = static_cast<double>(report.storage->total);
        used = static_cast<double>(report.storage->used);
        free = static_cast<double>(report.storage->free);
        used_percent = round_to(used / total * 100.0, 1);
    }
    yyjson_mut_obj_add_real(native, storage, "total_gb",
                            round_to(total / kBytesPerGiB, 2));
    yyjson_mut_obj_add_real(native, storage, "used_gb",
                            round_to(used / kBytesPerGiB, 2));
    yyjson_mut_obj_add_real(native, storage, "free_gb",
                            round_to(free / kBytesPerGiB, 2));
    yyjson_mut_obj_add_real(native, storage, "used_percent", used_percent);
    return doc.write();
}

std::string serialize_info()
{
    ft::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }

    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    doc.set_root(root);
    yyjson_mut_obj_add_str(native, root, "message",
                           ft::version::kServiceName);
    yyjson_mut_obj_add_str(native, root, "status", "running");
    yyjson_mut_obj_add_str(native, root, "version",
                           ft::version::kSemanticVersion);
    return doc.write();
}

std::string serialize_error(std::string_view message,
                            std::optional<std::string_view> remediation)
{
    ft::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return R"({"detail":"error"})";
    }

    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    doc.set_root(root);
    yyjson_mut_obj_add_strncpy(native, root, "detail", message.data(),
                               message.size());
    if (remediation && !remediation->empty())
    {
        yyjson_mut_obj_add_strncpy(native, root, "remediation",
                                   remediation->data(), remediation->size());
    }
    return doc.write(R"({"detail":"error"})");
}

} // namespace ft::rpc
