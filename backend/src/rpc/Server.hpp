#pragma once

#include "engine/AsyncTaskService.hpp"
#include "engine/Job.hpp"
#include "engine/Orchestrator.hpp"
#include "rpc/Broadcaster.hpp"
#include "rpc/Dispatcher.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <mongoose.h>

namespace ft::rpc
{

struct ServerOptions
{
    std::string bind_url = "http://0.0.0.0:8080";
    std::string ws_path = "/ws";
    // Static web UI root; nothing is served outside the API when unset.
    std::optional<std::filesystem::path> web_dir;
    DispatcherOptions dispatch;
};

// HTTP + WebSocket front end. A single thread owns the mongoose manager and
// every connection; request handlers run on a separate worker so the poll
// loop never blocks on the engine or on archive builds.
class Server
{
  public:
    Server(engine::Orchestrator &orchestrator, ServerOptions options);
    ~Server();
    Server(Server const &) = delete;
    Server &operator=(Server const &) = delete;

    // Returns false when the listener could not be bound.
    bool start();
    void stop();
    bool is_running() const noexcept;
    std::string const &bind_url() const noexcept;

    // Thread-safe hand-off of the latest job list to the push channel.
    void publish(std::vector<engine::JobRecord> jobs);

  private:
    void run_loop();
    static void handle_event(struct mg_connection *conn, int ev,
                             void *ev_data);
    void handle_http_message(struct mg_connection *conn,
                             struct mg_http_message *hm);
    void handle_ws_open(struct mg_connection *conn);
    void handle_ws_message(struct mg_connection *conn,
                           struct mg_ws_message *message);
    void handle_connection_closed(struct mg_connection *conn);
    void serve_static(struct mg_connection *conn, struct mg_http_message *hm);
    bool send_ws_message(ClientId client, std::string const &payload);
    void process_pending_tasks();
    void enqueue_task(std::function<void()> task);
    void send_response(std::uint64_t req_id, HttpResponse const &response);

    engine::Orchestrator &orchestrator_;
    ServerOptions options_;
    Dispatcher dispatcher_;
    Broadcaster broadcaster_;
    engine::AsyncTaskService request_worker_{"request-worker"};
    mg_mgr mgr_;
    struct mg_connection *listener_ = nullptr;
    std::atomic_bool running_{false};
    std::atomic_bool destroying_{false};
    std::thread worker_;

    using RequestId = std::uint64_t;
    RequestId next_request_id_ = 1;
    struct ActiveRequest
    {
        struct mg_connection *conn = nullptr;
        // Kept so streamed downloads can honour partial requests.
        std::optional<std::string> range;
    };
    std::unordered_map<RequestId, ActiveRequest> active_requests_;
    std::unordered_map<ClientId, struct mg_connection *> ws_connections_;

    std::vector<std::function<void()>> pending_tasks_;
    std::mutex tasks_mtx_;
};

} // namespace ft::rpc
