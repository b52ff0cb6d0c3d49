#include "sftpgate/server/connection_registry.hpp"

#include <spdlog/spdlog.h>

namespace sftpgate::server
{

    void ConnectionRegistry::add(const std::shared_ptr<Connection> &connection, std::function<void()> closer)
    {
        std::lock_guard lock(mutex_);
        connections_[connection->id()] = Entry{.connection = connection, .closer = std::move(closer)};
        spdlog::debug("{} connection added, num open connections: {}", connection->log_prefix(), connections_.size());
    }

    bool ConnectionRegistry::remove(const std::string &id)
    {
        std::lock_guard lock(mutex_);
        const auto removed = connections_.erase(id) > 0;
        if (removed)
        {
            spdlog::debug("connection {} removed, num open connections: {}", id, connections_.size());
        }
        return removed;
    }

    std::shared_ptr<Connection> ConnectionRegistry::find(const std::string &id) const
    {
        std::lock_guard lock(mutex_);
        const auto it = connections_.find(id);
        return it == connections_.end() ? nullptr : it->second.connection;
    }

    std::size_t ConnectionRegistry::count() const
    {
        std::lock_guard lock(mutex_);
        return connections_.size();
    }

    std::size_t ConnectionRegistry::count_for_user(const std::string &username) const
    {
        std::lock_guard lock(mutex_);
        std::size_t total = 0;
        for (const auto &[_, entry] : connections_)
        {
            if (entry.connection->user().username == username)
            {
                ++total;
            }
        }
        return total;
    }

    std::vector<ConnectionStatus> ConnectionRegistry::snapshot() const
    {
        std::lock_guard lock(mutex_);
        std::vector<ConnectionStatus> result;
        result.reserve(connections_.size());
        for (const auto &[id, entry] : connections_)
        {
            const auto &connection = *entry.connection;
            result.push_back(ConnectionStatus{
                .id = id,
                .username = connection.user().username,
                .protocol = connection.protocol(),
                .remote_address = connection.remote_address(),
                .command = connection.command(),
                .connected_at = connection.started(),
                .last_activity = connection.last_activity(),
                .transfers = connection.active_transfers(),
            });
        }
        return result;
    }

    void ConnectionRegistry::close_all()
    {
        std::vector<std::function<void()>> closers;
        {
            std::lock_guard lock(mutex_);
            for (const auto &[_, entry] : connections_)
            {
                if (entry.closer)
                {
                    closers.push_back(entry.closer);
                }
            }
        }
        for (const auto &closer : closers)
        {
            closer();
        }
    }

    ConnectionGuard::ConnectionGuard(ConnectionRegistry &registry, const std::shared_ptr<Connection> &connection,
                                     std::function<void()> closer)
        : registry_(registry), id_(connection->id())
    {
        registry_.add(connection, std::move(closer));
    }

    ConnectionGuard::~ConnectionGuard()
    {
        registry_.remove(id_);
    }

} // namespace sftpgate::server
