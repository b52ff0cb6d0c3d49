#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "sftpgate/server/connection.hpp"

namespace sftpgate::server
{

    struct ConnectionStatus
    {
        std::string id;
        std::string username;
        Protocol protocol{Protocol::Ssh};
        std::string remote_address;
        std::string command;
        std::chrono::system_clock::time_point connected_at;
        std::chrono::system_clock::time_point last_activity;
        std::vector<TransferStatus> transfers;
    };

    class ConnectionRegistry
    {
    public:
        // closer is invoked by close_all() to tear the session down.
        void add(const std::shared_ptr<Connection> &connection, std::function<void()> closer = {});
        bool remove(const std::string &id);

        std::shared_ptr<Connection> find(const std::string &id) const;
        std::size_t count() const;
        std::size_t count_for_user(const std::string &username) const;
        std::vector<ConnectionStatus> snapshot() const;

        void close_all();

    private:
        struct Entry
        {
            std::shared_ptr<Connection> connection;
            std::function<void()> closer;
        };

        mutable std::mutex mutex_;
        std::map<std::string, Entry> connections_;
    };

    // Keeps a connection registered for the lifetime of the guard.
    class ConnectionGuard
    {
    public:
        ConnectionGuard(ConnectionRegistry &registry, const std::shared_ptr<Connection> &connection,
                        std::function<void()> closer = {});
        ~ConnectionGuard();

        ConnectionGuard(const ConnectionGuard &) = delete;
        ConnectionGuard &operator=(const ConnectionGuard &) = delete;

    private:
        ConnectionRegistry &registry_;
        std::string id_;
    };

} // namespace sftpgate::server
