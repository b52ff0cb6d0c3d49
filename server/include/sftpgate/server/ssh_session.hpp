#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <libssh/libssh.h>
#include <libssh/server.h>

#include "sftpgate/server/channel.hpp"
#include "sftpgate/server/config.hpp"
#include "sftpgate/server/connection.hpp"
#include "sftpgate/server/connection_registry.hpp"
#include "sftpgate/server/host_keys.hpp"
#include "sftpgate/server/quota.hpp"
#include "sftpgate/server/user_store.hpp"

namespace sftpgate::server
{

    struct SessionServices
    {
        const ServerConfig &config;
        UserStore &users;
        QuotaTracker &quota;
        ConnectionRegistry &registry;
        const CertificateChecker &certificates;
    };

    // Channel over a libssh channel. libssh sessions are not thread safe, so every
    // call is made under the session mutex and reads poll with a short timeout.
    class SshChannel : public Channel
    {
    public:
        SshChannel(ssh_channel channel, std::mutex &session_mutex, const std::atomic<bool> &closing);
        ~SshChannel() override;

        SshChannel(const SshChannel &) = delete;
        SshChannel &operator=(const SshChannel &) = delete;

        // Reads fail once the connection has been idle longer than timeout.
        void set_idle_timeout(std::shared_ptr<Connection> connection, std::chrono::seconds timeout);

        std::size_t read(std::span<std::uint8_t> buffer) override;
        std::size_t write(std::span<const std::uint8_t> data) override;
        Writer &stderr_writer() override { return stderr_; }
        void send_exit_status(std::uint32_t status) override;
        void close_write() override;
        void close() override;

    private:
        class StderrWriter : public Writer
        {
        public:
            explicit StderrWriter(SshChannel &owner) : owner_(owner) {}
            std::size_t write(std::span<const std::uint8_t> data) override;

        private:
            SshChannel &owner_;
        };

        std::size_t write_stream(std::span<const std::uint8_t> data, bool is_stderr);
        [[noreturn]] void throw_channel_error(const char *operation) const;

        ssh_channel channel_;
        std::mutex &session_mutex_;
        const std::atomic<bool> &closing_;
        StderrWriter stderr_{*this};
        std::shared_ptr<Connection> connection_;
        std::chrono::seconds idle_timeout_{0};
        bool eof_sent_{false};
        bool closed_{false};
    };

    class SshSession
    {
    public:
        // Takes ownership of session, which must already be bound to its socket.
        SshSession(ssh_session session, std::string id, std::string remote_address, SessionServices services);
        ~SshSession();

        SshSession(const SshSession &) = delete;
        SshSession &operator=(const SshSession &) = delete;

        // Never throws; failures end this session only.
        void run();
        // Callable from any thread, unblocks pending channel I/O.
        void close();

        const std::string &id() const noexcept { return id_; }

    private:
        std::optional<User> authenticate();
        bool is_public_key_accepted(const User &user, ssh_key key) const;
        void serve_channels(const User &user);
        void serve_channel(ssh_channel channel, const User &user);
        void run_sftp(ssh_channel channel, const User &user);
        void run_exec(ssh_channel channel, const User &user, const std::string &command_line);
        std::shared_ptr<Connection> make_connection(Protocol protocol, const User &user);

        ssh_session session_;
        std::string id_;
        std::string remote_address_;
        SessionServices services_;
        std::mutex mutex_;
        std::atomic<bool> closing_{false};
        std::uint64_t channel_count_{0};
    };

} // namespace sftpgate::server
