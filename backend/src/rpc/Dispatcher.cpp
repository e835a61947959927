#include "rpc/Dispatcher.hpp"

#include "engine/Errors.hpp"
#include "rpc/Serializer.hpp"
#include "utils/Json.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <mongoose.h>
#include <yyjson.h>

namespace ft::rpc
{

namespace
{
constexpr std::string_view kTorrentsPrefix = "/api/torrents";
constexpr std::string_view kMultipartType = "multipart/form-data";
constexpr std::string_view kDescriptorSuffix = ".torrent";

bool iequals(std::string_view a, std::string_view b)
{
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(),
                      [](char x, char y)
                      {
                          return std::tolower(static_cast<unsigned char>(x)) ==
                                 std::tolower(static_cast<unsigned char>(y));
                      });
}

bool ends_with(std::string_view value, std::string_view suffix)
{
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(),
                         suffix) == 0;
}

HttpResponse json_response(int status, std::string body)
{
    HttpResponse response;
    response.status = status;
    response.body = std::move(body);
    return response;
}

HttpResponse error_response(int status, std::string_view message,
                            std::optional<std::string_view> remediation =
                                std::nullopt)
{
    return json_response(status, serialize_error(message, remediation));
}

HttpResponse error_response(engine::Error const &error)
{
    std::optional<std::string_view> remediation;
    if (error.remediation())
    {
        remediation = *error.remediation();
    }
    return error_response(engine::http_status_for(error.code()), error.what(),
                          remediation);
}

engine::SubmitOptions submit_options(std::optional<std::string> save_path,
                                     bool sequential)
{
    engine::SubmitOptions options;
    if (save_path && !save_path->empty())
    {
        options.save_path = std::filesystem::path(*save_path);
    }
    options.sequential = sequential;
    return options;
}

std::string to_std(struct mg_str value)
{
    if (value.buf == nullptr || value.len == 0)
    {
        return {};
    }
    return std::string(value.buf, value.len);
}

// Splits "/api/torrents/<id>[/<action>]" into id and action.
bool split_job_path(std::string_view path, std::string &id,
                    std::string &action)
{
    if (path.size() <= kTorrentsPrefix.size() + 1 ||
        path.substr(0, kTorrentsPrefix.size()) != kTorrentsPrefix ||
        path[kTorrentsPrefix.size()] != '/')
    {
        return false;
    }
    auto rest = path.substr(kTorrentsPrefix.size() + 1);
    auto slash = rest.find('/');
    if (slash == std::string_view::npos)
    {
        id.assign(rest);
        action.clear();
    }
    else
    {
        id.assign(rest.substr(0, slash));
        action.assign(rest.substr(slash + 1));
        if (action.find('/') != std::string::npos)
        {
            return false;
        }
    }
    return !id.empty();
}
} // namespace

std::optional<std::string> HttpRequest::header(std::string_view name) const
{
    for (auto const &[key, value] : headers)
    {
        if (iequals(key, name))
        {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<std::string> query_param(std::string_view query,
                                       char const *name)
{
    if (query.empty())
    {
        return std::nullopt;
    }
    std::string buffer(query.size() + 1, '\0');
    auto source = mg_str_n(query.data(), query.size());
    int len = mg_http_get_var(&source, name, buffer.data(), buffer.size());
    if (len <= 0)
    {
        return std::nullopt;
    }
    buffer.resize(static_cast<std::size_t>(len));
    return buffer;
}

bool parse_flag(std::optional<std::string> const &value)
{
    if (!value)
    {
        return false;
    }
    return iequals(*value, "true") || iequals(*value, "1") ||
           iequals(*value, "yes") || iequals(*value, "on");
}

Dispatcher::Dispatcher(engine::Orchestrator &orchestrator,
                       DispatcherOptions options)
    : orchestrator_(orchestrator), options_(std::move(options))
{
}

bool Dispatcher::handles(std::string_view path)
{
    return path == "/health" || path == "/api" ||
           path.substr(0, 5) == "/api/";
}

bool Dispatcher::authorized(HttpRequest const &request) const
{
    if (!options_.require_auth)
    {
        return true;
    }
    if (request.path == "/health")
    {
        return true;
    }
    auto key = request.header("X-API-Key");
    return key && !options_.api_key.empty() && *key == options_.api_key;
}

HttpResponse Dispatcher::dispatch(HttpRequest const &request)
{
    if (!authorized(request))
    {
        FT_LOG_INFO("request rejected; missing or invalid api key for {}",
                    request.path);
        return error_response(401, "Invalid or missing API key");
    }
    try
    {
        return route(request);
    }
    catch (engine::Error const &ex)
    {
        FT_LOG_DEBUG("{} {} failed: {} ({})", request.method, request.path,
                     ex.what(), engine::to_string(ex.code()));
        return error_response(ex);
    }
    catch (std::exception const &ex)
    {
        FT_LOG_WARN("{} {} raised: {}", request.method, request.path,
                    ex.what());
        return error_response(500, ex.what());
    }
}

HttpResponse Dispatcher::route(HttpRequest const &request)
{
    auto const &method = request.method;
    auto const &path = request.path;

    if (path == "/health")
    {
        if (method != "GET")
        {
            return error_response(405, "Method Not Allowed");
        }
        return handle_health();
    }
    if (path == "/api/info")
    {
        if (method != "GET")
        {
            return error_response(405, "Method Not Allowed");
        }
        return json_response(200, serialize_info());
    }
    if (path == "/api/download")
    {
        if (method != "POST")
        {
            return error_response(405, "Method Not Allowed");
        }
        return handle_download(request);
    }
    if (path == "/api/upload-torrent")
    {
        if (method != "POST")
        {
            return error_response(405, "Method Not Allowed");
        }
        return handle_upload(request);
    }
    if (path == kTorrentsPrefix)
    {
        if (method != "GET")
        {
            return error_response(405, "Method Not Allowed");
        }
        return handle_list();
    }

    std::string id;
    std::string action;
    if (split_job_path(path, id, action))
    {
        return route_job(request, id, action);
    }
    return error_response(404, "Not Found");
}

HttpResponse Dispatcher::route_job(HttpRequest const &request,
                                   std::string const &id,
                                   std::string_view action)
{
    auto const &method = request.method;
    if (action.empty())
    {
        if (method == "GET")
        {
            return json_response(200, serialize_job(orchestrator_.get(id)));
        }
        if (method == "DELETE")
        {
            bool delete_files =
                parse_flag(query_param(request.query, "delete_files"));
            orchestrator_.remove(id, delete_files);
            return json_response(200, serialize_action("Torrent removed"));
        }
        return error_response(405, "Method Not Allowed");
    }
    if (action == "files")
    {
        if (method != "GET")
        {
            return error_response(405, "Method Not Allowed");
        }
        return handle_files(id);
    }
    if (action == "download")
    {
        if (method != "GET")
        {
            return error_response(405, "Method Not Allowed");
        }
        return handle_file_download(request, id);
    }
    if (method != "POST")
    {
        return error_response(405, "Method Not Allowed");
    }
    if (action == "pause")
    {
        orchestrator_.pause(id);
        return json_response(200, serialize_action("Torrent paused"));
    }
    if (action == "resume")
    {
        orchestrator_.resume(id);
        return json_response(200, serialize_action("Torrent resumed"));
    }
    if (action == "wide-distribution")
    {
        auto result = orchestrator_.enable_wide_distribution(id);
        return json_response(
            200, serialize_best_effort(result, "Wide distribution enabled"));
    }
    return error_response(404, "Not Found");
}

HttpResponse Dispatcher::handle_download(HttpRequest const &request)
{
    auto doc = ft::json::Document::parse(request.body);
    if (!doc.is_valid() || !yyjson_is_obj(doc.root()))
    {
        return error_response(400, "Request body must be a JSON object");
    }
    auto *root = doc.root();
    auto locator = ft::json::string_field(root, "url");
    if (!locator || locator->empty())
    {
        locator = ft::json::string_field(root, "magnet");
    }
    if (!locator || locator->empty())
    {
        return error_response(400, "Missing 'url' or 'magnet' field");
    }
    auto options =
        submit_options(ft::json::string_field(root, "save_path"),
                       ft::json::bool_field(root, "sequential").value_or(false));
    auto id = orchestrator_.submit(*locator, options);
    return json_response(200,
                         serialize_submit(id, "Torrent added successfully"));
}

HttpResponse Dispatcher::handle_upload(HttpRequest const &request)
{
    std::string payload;
    auto content_type = request.header("Content-Type").value_or("");
    if (content_type.compare(0, kMultipartType.size(), kMultipartType) == 0)
    {
        auto body = mg_str_n(request.body.data(), request.body.size());
        struct mg_http_part part;
        std::size_t offset = 0;
        bool found = false;
        while ((offset = mg_http_next_multipart(body, offset, &part)) > 0)
        {
            if (to_std(part.name) != "file")
            {
                continue;
            }
            if (!ends_with(to_std(part.filename), kDescriptorSuffix))
            {
                return error_response(400,
                                      "Invalid file type. Must be .torrent");
            }
            payload = to_std(part.body);
            found = true;
            break;
        }
        if (!found)
        {
            return error_response(400, "Missing 'file' upload field");
        }
    }
    else
    {
        payload = request.body;
    }

    auto options =
        submit_options(query_param(request.query, "save_path"),
                       parse_flag(query_param(request.query, "sequential")));
    std::vector<std::uint8_t> descriptor(payload.begin(), payload.end());
    auto id = orchestrator_.submit_descriptor(std::move(descriptor), options);
    return json_response(
        200, serialize_submit(id, "Torrent file uploaded and added"));
}

HttpResponse Dispatcher::handle_list()
{
    auto response = json_response(200, serialize_job_list(orchestrator_.list()));
    response.headers.emplace_back("Cache-Control", "no-store");
    return response;
}

HttpResponse Dispatcher::handle_health()
{
    return json_response(200, serialize_health(orchestrator_.health()));
}

HttpResponse Dispatcher::handle_files(std::string const &id)
{
    return json_response(200,
                         serialize_files(orchestrator_.available_files(id)));
}

HttpResponse Dispatcher::handle_file_download(HttpRequest const &request,
                                              std::string const &id)
{
    auto served =
        orchestrator_.resolve_download(id, query_param(request.query, "file"));
    HttpResponse response;
    response.status = 200;
    response.content_type = served.content_type;
    response.file = served.path;
    response.download_name = served.download_name;
    return response;
}

} // namespace ft::rpc
