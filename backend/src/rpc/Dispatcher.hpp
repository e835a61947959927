#pragma once

#include "engine/Orchestrator.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ft::rpc
{

using HeaderList = std::vector<std::pair<std::string, std::string>>;

// Transport-independent copy of an HTTP request. Owns its bytes so it can
// be handled off the transport thread.
struct HttpRequest
{
    std::string method;
    std::string path;
    std::string query;
    HeaderList headers;
    std::string body;

    // Case-insensitive header lookup.
    std::optional<std::string> header(std::string_view name) const;
};

struct HttpResponse
{
    int status = 200;
    std::string content_type = "application/json";
    std::string body;
    HeaderList headers;
    // When set, the transport streams this file instead of body.
    std::optional<std::filesystem::path> file;
    std::string download_name;
};

struct DispatcherOptions
{
    bool require_auth = false;
    std::string api_key;
};

class Dispatcher
{
  public:
    Dispatcher(engine::Orchestrator &orchestrator,
               DispatcherOptions options = {});

    // True for paths this dispatcher answers (the REST surface and /health).
    static bool handles(std::string_view path);

    // Never throws; every failure becomes an error response.
    HttpResponse dispatch(HttpRequest const &request);

  private:
    bool authorized(HttpRequest const &request) const;
    HttpResponse route(HttpRequest const &request);
    HttpResponse route_job(HttpRequest const &request, std::string const &id,
                           std::string_view action);

    HttpResponse handle_download(HttpRequest const &request);
    HttpResponse handle_upload(HttpRequest const &request);
    HttpResponse handle_list();
    HttpResponse handle_health();
    HttpResponse handle_files(std::string const &id);
    HttpResponse handle_file_download(HttpRequest const &request,
                                      std::string const &id);

    engine::Orchestrator &orchestrator_;
    DispatcherOptions options_;
};

// Decoded query-string variable; nullopt when absent or empty.
std::optional<std::string> query_param(std::string_view query,
                                       char const *name);
// "true"/"1"/"yes"/"on" (any case) are true; anything else is false.
bool parse_flag(std::optional<std::string> const &value);

} // namespace ft::rpc
