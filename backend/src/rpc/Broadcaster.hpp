#pragma once

#include "engine/Job.hpp"

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ft::rpc
{

// Push-channel client identity (the transport's connection id).
using ClientId = unsigned long;

// Fan-out of job-list updates to connected WebSocket clients. The client set
// is only touched from the transport thread; publish() is the hand-off point
// for other threads.
class Broadcaster
{
  public:
    // Returns false when the frame could not be queued for the client.
    using Sender = std::function<bool(ClientId, std::string const &)>;

    explicit Broadcaster(Sender sender);

    // Registers the client and sends it the given list right away.
    void add_client(ClientId client,
                    std::vector<engine::JobRecord> const &jobs);
    void remove_client(ClientId client);
    std::size_t client_count() const noexcept;

    // Serializes once, sends to every client, then drops the ones whose send
    // failed.
    void broadcast(std::vector<engine::JobRecord> const &jobs);

    // Thread-safe: stores the latest list; older unflushed lists are replaced.
    void publish(std::vector<engine::JobRecord> jobs);
    // Transport thread: broadcasts the latest published list, if any.
    bool flush();

  private:
    void send_frame(std::string const &frame);

    Sender sender_;
    std::vector<ClientId> clients_;
    std::mutex pending_mutex_;
    std::optional<std::vector<engine::JobRecord>> pending_;
};

} // namespace ft::rpc
