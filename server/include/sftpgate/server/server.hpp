#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <libssh/libssh.h>
#include <libssh/server.h>

#include "sftpgate/server/config.hpp"
#include "sftpgate/server/connection_registry.hpp"
#include "sftpgate/server/host_keys.hpp"
#include "sftpgate/server/quota.hpp"
#include "sftpgate/server/user_store.hpp"

namespace sftpgate::server
{

    class SshSession;

    class Server
    {
    public:
        // Loads users, host keys and trusted CAs; throws ConfigError.
        explicit Server(ServerConfig config);
        ~Server();

        Server(const Server &) = delete;
        Server &operator=(const Server &) = delete;

        // Blocks until SIGINT/SIGTERM or a fatal accept error.
        void run();

        const ConnectionRegistry &registry() const noexcept { return registry_; }

    private:
        void handle_connection(int fd);
        void handle_signal();
        void shutdown();

        ServerConfig config_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;
        std::thread signal_thread_;
        std::atomic<bool> stopping_{false};

        UserStore users_;
        QuotaTracker quota_;
        ConnectionRegistry registry_;
        CertificateChecker certificates_;
        std::vector<HostKey> host_keys_;
        ssh_bind bind_{nullptr};

        std::mutex sessions_mutex_;
        std::condition_variable sessions_cv_;
        std::vector<std::weak_ptr<SshSession>> sessions_;
        std::size_t active_sessions_{0};
    };

} // namespace sftpgate::server
