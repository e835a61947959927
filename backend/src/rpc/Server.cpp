#include "rpc/Server.hpp"

#include "rpc/Serializer.hpp"
#include "utils/Log.hpp"
#include "utils/Shutdown.hpp"

#include <algorithm>
#include <cstring>
#include <exception>
#include <string_view>
#include <utility>

namespace ft::rpc
{

namespace
{
constexpr std::size_t kMaxHttpPayloadSize = 16u * 1024u * 1024u;
constexpr char const *kCorsHeaders =
    "Access-Control-Allow-Origin: *\r\n"
    "Access-Control-Allow-Credentials: true\r\n";

std::string to_std(struct mg_str value)
{
    if (value.buf == nullptr || value.len == 0)
    {
        return {};
    }
    return std::string(value.buf, value.len);
}

std::optional<std::string> header_value(struct mg_http_message *hm,
                                        char const *name)
{
    if (auto *header = mg_http_get_header(hm, name); header != nullptr)
    {
        return to_std(*header);
    }
    return std::nullopt;
}

HttpRequest copy_request(struct mg_http_message *hm)
{
    HttpRequest request;
    request.method = to_std(hm->method);
    request.path = to_std(hm->uri);
    request.query = to_std(hm->query);
    for (std::size_t i = 0; i < MG_MAX_HTTP_HEADERS; ++i)
    {
        auto const &header = hm->headers[i];
        if (header.name.len == 0)
        {
            break;
        }
        request.headers.emplace_back(to_std(header.name),
                                     to_std(header.value));
    }
    request.body = to_std(hm->body);
    return request;
}

std::string response_headers(HttpResponse const &response)
{
    std::string headers = kCorsHeaders;
    headers += "Content-Type: " + response.content_type + "\r\n";
    for (auto const &[name, value] : response.headers)
    {
        headers += name + ": " + value + "\r\n";
    }
    return headers;
}

std::string content_disposition(std::string name)
{
    std::replace_if(
        name.begin(), name.end(),
        [](char c) { return c == '"' || c == '\r' || c == '\n'; }, '_');
    return "Content-Disposition: attachment; filename=\"" + name + "\"\r\n";
}

void reply_json(struct mg_connection *conn, int code, std::string const &body)
{
    std::string headers = kCorsHeaders;
    headers += "Content-Type: application/json\r\n";
    mg_http_reply(conn, code, headers.c_str(), "%s", body.c_str());
}
} // namespace

Server::Server(engine::Orchestrator &orchestrator, ServerOptions options)
    : orchestrator_(orchestrator), options_(std::move(options)),
      dispatcher_(orchestrator_, options_.dispatch),
      broadcaster_([this](ClientId client, std::string const &payload)
                   { return send_ws_message(client, payload); })
{
    mg_mgr_init(&mgr_);
    mg_wakeup_init(&mgr_);
    mgr_.userdata = this;
}

Server::~Server()
{
    stop();
    destroying_.store(true, std::memory_order_release);
    ws_connections_.clear();
    active_requests_.clear();
    mg_mgr_free(&mgr_);
}

bool Server::start()
{
    if (running_.exchange(true))
    {
        return true;
    }
    listener_ = mg_http_listen(&mgr_, options_.bind_url.c_str(),
                               &Server::handle_event, this);
    if (listener_ == nullptr)
    {
        FT_LOG_ERROR("Failed to bind HTTP listener to {}", options_.bind_url);
        running_.store(false);
        return false;
    }
    FT_LOG_INFO("HTTP listener bound to {}, push channel at {}",
                options_.bind_url, options_.ws_path);
    if (options_.web_dir)
    {
        FT_LOG_INFO("serving web interface from {}",
                    options_.web_dir->string());
    }
    request_worker_.start();
    worker_ = std::thread(&Server::run_loop, this);
    FT_LOG_INFO("HTTP worker thread started");
    return true;
}

void Server::stop()
{
    running_.store(false, std::memory_order_release);
    mg_wakeup(&mgr_, 0, nullptr, 0);
    if (worker_.joinable())
    {
        FT_LOG_INFO("Stopping HTTP worker thread");
        worker_.join();
    }
    request_worker_.stop(true);
    if (listener_ != nullptr)
    {
        listener_->is_closing = 1;
        listener_ = nullptr;
    }
}

bool Server::is_running() const noexcept
{
    return running_.load(std::memory_order_acquire);
}

std::string const &Server::bind_url() const noexcept
{
    return options_.bind_url;
}

void Server::publish(std::vector<engine::JobRecord> jobs)
{
    broadcaster_.publish(std::move(jobs));
    mg_wakeup(&mgr_, 0, nullptr, 0);
}

void Server::run_loop()
{
    try
    {
        while (running_.load(std::memory_order_relaxed) &&
               !ft::runtime::should_shutdown())
        {
            mg_mgr_poll(&mgr_, 50);
            process_pending_tasks();
            broadcaster_.flush();
        }
    }
    catch (std::exception const &ex)
    {
        FT_LOG_ERROR("HTTP worker exception: {}", ex.what());
    }
    running_.store(false, std::memory_order_relaxed);
}

void Server::handle_event(struct mg_connection *conn, int ev, void *ev_data)
{
    if (conn == nullptr)
    {
        return;
    }
    auto *self = static_cast<Server *>(conn->fn_data);
    if (self == nullptr ||
        self->destroying_.load(std::memory_order_acquire))
    {
        return;
    }

    switch (ev)
    {
    case MG_EV_HTTP_MSG:
        self->handle_http_message(
            conn, static_cast<struct mg_http_message *>(ev_data));
        break;
    case MG_EV_WS_OPEN:
        self->handle_ws_open(conn);
        break;
    case MG_EV_WS_MSG:
        self->handle_ws_message(conn,
                                static_cast<struct mg_ws_message *>(ev_data));
        break;
    case MG_EV_CLOSE:
        self->handle_connection_closed(conn);
        break;
    case MG_EV_ERROR:
        FT_LOG_DEBUG("connection {} error: {}", conn->id,
                     static_cast<char const *>(ev_data));
        break;
    default:
        break;
    }
}

void Server::handle_http_message(struct mg_connection *conn,
                                 struct mg_http_message *hm)
{
    if (hm == nullptr)
    {
        return;
    }
    std::string_view uri(hm->uri.buf, hm->uri.len);
    std::string_view method(hm->method.buf, hm->method.len);
    FT_LOG_DEBUG("HTTP request {} {}", method, uri);

    if (method == "OPTIONS")
    {
        std::string headers = kCorsHeaders;
        headers += "Access-Control-Allow-Methods: GET, POST, DELETE, "
                   "OPTIONS\r\n"
                   "Access-Control-Allow-Headers: Content-Type, X-API-Key\r\n"
                   "Access-Control-Max-Age: 600\r\n";
        mg_http_reply(conn, 204, headers.c_str(), "");
        return;
    }

    if (uri == options_.ws_path)
    {
        mg_ws_upgrade(conn, hm, nullptr);
        return;
    }

    if (!Dispatcher::handles(uri))
    {
        serve_static(conn, hm);
        return;
    }

    if (hm->body.len > kMaxHttpPayloadSize)
    {
        FT_LOG_INFO("HTTP payload too large: {} bytes", hm->body.len);
        reply_json(conn, 413, serialize_error("payload too large"));
        return;
    }

    auto req_id = next_request_id_++;
    active_requests_[req_id] = {conn, header_value(hm, "Range")};
    request_worker_.submit(
        [this, req_id, request = copy_request(hm)]
        {
            auto response = dispatcher_.dispatch(request);
            enqueue_task([this, req_id, response = std::move(response)]
                         { send_response(req_id, response); });
        });
}

void Server::serve_static(struct mg_connection *conn,
                          struct mg_http_message *hm)
{
    std::string_view method(hm->method.buf, hm->method.len);
    if (!options_.web_dir || (method != "GET" && method != "HEAD"))
    {
        reply_json(conn, 404, serialize_error("Not Found"));
        return;
    }
    auto root = options_.web_dir->string();
    struct mg_http_serve_opts opts;
    std::memset(&opts, 0, sizeof(opts));
    opts.root_dir = root.c_str();
    opts.extra_headers = kCorsHeaders;
    mg_http_serve_dir(conn, hm, &opts);
}

void Server::handle_ws_open(struct mg_connection *conn)
{
    ws_connections_[conn->id] = conn;
    broadcaster_.add_client(conn->id, orchestrator_.list());
}

void Server::handle_ws_message(struct mg_connection * /*conn*/,
                               struct mg_ws_message * /*message*/)
{
    // Push channel is server-to-client only; client frames are ignored.
}

void Server::handle_connection_closed(struct mg_connection *conn)
{
    if (ws_connections_.erase(conn->id) > 0)
    {
        broadcaster_.remove_client(conn->id);
    }
    for (auto it = active_requests_.begin(); it != active_requests_.end();)
    {
        if (it->second.conn == conn)
        {
            it = active_requests_.erase(it);
        }
        else
        {
            ++it;
        }
    }
}

bool Server::send_ws_message(ClientId client, std::string const &payload)
{
    auto it = ws_connections_.find(client);
    if (it == ws_connections_.end() || it->second->is_closing)
    {
        return false;
    }
    return mg_ws_send(it->second, payload.data(), payload.size(),
                      WEBSOCKET_OP_TEXT) != 0;
}

void Server::enqueue_task(std::function<void()> task)
{
    {
        std::lock_guard<std::mutex> lock(tasks_mtx_);
        pending_tasks_.push_back(std::move(task));
    }
    mg_wakeup(&mgr_, 0, nullptr, 0);
}

void Server::process_pending_tasks()
{
    std::vector<std::function<void()>> tasks;
    {
        std::lock_guard<std::mutex> lock(tasks_mtx_);
        tasks.swap(pending_tasks_);
    }
    for (auto &task : tasks)
    {
        task();
    }
}

void Server::send_response(std::uint64_t req_id, HttpResponse const &response)
{
    auto it = active_requests_.find(req_id);
    if (it == active_requests_.end())
    {
        return;
    }
    auto active = std::move(it->second);
    active_requests_.erase(it);

    if (!response.file)
    {
        mg_http_reply(active.conn, response.status,
                      response_headers(response).c_str(), "%s",
                      response.body.c_str());
        return;
    }

    // The request message is gone by now; mongoose only needs the method
    // and range header to stream the file.
    struct mg_http_message hm;
    std::memset(&hm, 0, sizeof(hm));
    hm.method = mg_str("GET");
    if (active.range)
    {
        hm.headers[0].name = mg_str("Range");
        hm.headers[0].value = mg_str_n(active.range->data(),
                                       active.range->size());
    }

    std::string extra = kCorsHeaders;
    extra += content_disposition(response.download_name);
    auto extension = response.file->extension().string();
    std::string mime_types;
    if (extension.size() > 1)
    {
        mime_types = extension.substr(1) + "=" + response.content_type;
    }
    auto path = response.file->string();

    struct mg_http_serve_opts opts;
    std::memset(&opts, 0, sizeof(opts));
    opts.extra_headers = extra.c_str();
    opts.mime_types = mime_types.empty() ? nullptr : mime_types.c_str();
    mg_http_serve_file(active.conn, &hm, path.c_str(), &opts);
}

} // namespace ft::rpc
