#include "rpc/Broadcaster.hpp"

#include "rpc/Serializer.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <utility>

namespace ft::rpc
{

Broadcaster::Broadcaster(Sender sender) : sender_(std::move(sender))
{
}

void Broadcaster::add_client(ClientId client,
                             std::vector<engine::JobRecord> const &jobs)
{
    if (std::find(clients_.begin(), clients_.end(), client) != clients_.end())
    {
        return;
    }
    if (sender_ && !sender_(client, serialize_update(jobs)))
    {
        FT_LOG_DEBUG("ws client {} rejected initial update", client);
        return;
    }
    clients_.push_back(client);
    FT_LOG_DEBUG("ws client {} connected ({} total)", client,
                 clients_.size());
}

void Broadcaster::remove_client(ClientId client)
{
    auto it = std::remove(clients_.begin(), clients_.end(), client);
    if (it == clients_.end())
    {
        return;
    }
    clients_.erase(it, clients_.end());
    FT_LOG_DEBUG("ws client {} disconnected ({} left)", client,
                 clients_.size());
}

std::size_t Broadcaster::client_count() const noexcept
{
    return clients_.size();
}

void Broadcaster::broadcast(std::vector<engine::JobRecord> const &jobs)
{
    if (clients_.empty())
    {
        return;
    }
    send_frame(serialize_update(jobs));
}

void Broadcaster::send_frame(std::string const &frame)
{
    std::vector<ClientId> dead;
    for (auto client : clients_)
    {
        if (!sender_ || !sender_(client, frame))
        {
            dead.push_back(client);
        }
    }
    for (auto client : dead)
    {
        remove_client(client);
    }
}

void Broadcaster::publish(std::vector<engine::JobRecord> jobs)
{
    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_ = std::move(jobs);
}

bool Broadcaster::flush()
{
    std::optional<std::vector<engine::JobRecord>> jobs;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        jobs.swap(pending_);
    }
    if (!jobs)
    {
        return false;
    }
    broadcast(*jobs);
    return true;
}

} // namespace ft::rpc
