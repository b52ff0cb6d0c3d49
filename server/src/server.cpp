#include "sftpgate/server/server.hpp"

#include <asio/ip/address.hpp>

#include <csignal>
#include <optional>
#include <system_error>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include "sftpgate/crypto.hpp"
#include "sftpgate/error_codes.hpp"
#include "sftpgate/server/listener.hpp"
#include "sftpgate/server/ssh_session.hpp"

namespace sftpgate::server
{

    namespace
    {

        class AsioListener : public Listener
        {
        public:
            AsioListener(asio::io_context &io_context, asio::ip::tcp::acceptor &acceptor,
                         const std::atomic<bool> &stopping)
                : io_context_(io_context), acceptor_(acceptor), stopping_(stopping)
            {
            }

            std::optional<int> accept() override
            {
                asio::ip::tcp::socket socket(io_context_);
                std::error_code ec;
                acceptor_.accept(socket, ec);
                if (stopping_.load())
                {
                    return std::nullopt;
                }
                if (ec)
                {
                    throw std::system_error(ec, "accept");
                }
                return socket.release();
            }

            void close() override
            {
                std::error_code ec;
                acceptor_.close(ec);
            }

        private:
            asio::io_context &io_context_;
            asio::ip::tcp::acceptor &acceptor_;
            const std::atomic<bool> &stopping_;
        };

        std::string peer_address(int fd)
        {
            sockaddr_storage storage{};
            socklen_t length = sizeof(storage);
            if (::getpeername(fd, reinterpret_cast<sockaddr *>(&storage), &length) != 0)
            {
                return "unknown";
            }
            char host[INET6_ADDRSTRLEN] = {};
            if (storage.ss_family == AF_INET)
            {
                const auto *addr = reinterpret_cast<const sockaddr_in *>(&storage);
                ::inet_ntop(AF_INET, &addr->sin_addr, host, sizeof(host));
                return std::string(host) + ":" + std::to_string(ntohs(addr->sin_port));
            }
            if (storage.ss_family == AF_INET6)
            {
                const auto *addr = reinterpret_cast<const sockaddr_in6 *>(&storage);
                ::inet_ntop(AF_INET6, &addr->sin6_addr, host, sizeof(host));
                return "[" + std::string(host) + "]:" + std::to_string(ntohs(addr->sin6_port));
            }
            return "unknown";
        }

    } // namespace

    Server::Server(ServerConfig config)
        : config_(std::move(config)),
          acceptor_(io_context_),
          signals_(io_context_),
          users_(config_.resolve(config_.users_file))
    {
        users_.load();
        users_.seed_quota(quota_);
        certificates_ = CertificateChecker::load(config_.trusted_user_ca_keys, config_.config_dir);
        host_keys_ = load_host_keys(config_.host_keys, config_.config_dir);
        if (host_keys_.empty())
        {
            throw Error(ErrorCode::ConfigError, "no host keys configured");
        }

        bind_ = ::ssh_bind_new();
        if (bind_ == nullptr)
        {
            throw Error(ErrorCode::GenericFailure, "unable to allocate the ssh bind");
        }
        for (auto &key : host_keys_)
        {
            // The bind takes ownership of an imported key.
            if (::ssh_bind_options_set(bind_, SSH_BIND_OPTIONS_IMPORT_KEY, key.private_key.get()) != SSH_OK)
            {
                throw Error(ErrorCode::ConfigError, "unable to use host key " + key.path.string() + ": " +
                                                        ::ssh_get_error(bind_));
            }
            (void)key.private_key.release();
        }

        const auto address = asio::ip::make_address(config_.address);
        const asio::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();

        spdlog::info("Listening on {}:{}, config dir {}", config_.address, config_.port, config_.config_dir.string());

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const std::error_code &ec, int /*signal*/)
                            {
        if (!ec) {
            handle_signal();
        } });
    }

    Server::~Server()
    {
        if (signal_thread_.joinable())
        {
            io_context_.stop();
            signal_thread_.join();
        }
        if (bind_ != nullptr)
        {
            ::ssh_bind_free(bind_);
        }
    }

    void Server::run()
    {
        signal_thread_ = std::thread([this]
                                     { io_context_.run(); });
        AsioListener listener(io_context_, acceptor_, stopping_);
        try
        {
            serve(listener, [this](int fd)
                  { handle_connection(fd); });
        }
        catch (const std::exception &)
        {
            shutdown();
            throw;
        }
        shutdown();
    }

    void Server::handle_connection(int fd)
    {
        ssh_session session = ::ssh_new();
        if (session == nullptr)
        {
            ::close(fd);
            throw Error(ErrorCode::GenericFailure, "unable to allocate an ssh session");
        }
        if (::ssh_bind_accept_fd(bind_, session, fd) != SSH_OK)
        {
            const std::string message = ::ssh_get_error(bind_);
            ::ssh_free(session);
            ::close(fd);
            throw Error(ErrorCode::GenericFailure, "unable to accept ssh connection: " + message);
        }

        const auto remote_address = peer_address(fd);
        auto ssh = std::make_shared<SshSession>(session, crypto::random_hex(6), remote_address,
                                                SessionServices{
                                                    .config = config_,
                                                    .users = users_,
                                                    .quota = quota_,
                                                    .registry = registry_,
                                                    .certificates = certificates_,
                                                });
        {
            std::lock_guard lock(sessions_mutex_);
            std::erase_if(sessions_, [](const std::weak_ptr<SshSession> &entry)
                          { return entry.expired(); });
            sessions_.push_back(ssh);
            ++active_sessions_;
        }
        spdlog::debug("Accepted connection {} from {}", ssh->id(), remote_address);
        std::thread([this, ssh]() mutable
                    {
            ssh->run();
            ssh.reset();
            std::lock_guard lock(sessions_mutex_);
            --active_sessions_;
            sessions_cv_.notify_all(); })
            .detach();
    }

    void Server::handle_signal()
    {
        stopping_.store(true);
        // Wakes up the blocking accept.
        ::shutdown(acceptor_.native_handle(), SHUT_RDWR);
        spdlog::info("Signal received, shutting down");
    }

    void Server::shutdown()
    {
        stopping_.store(true);
        io_context_.stop();
        if (signal_thread_.joinable())
        {
            signal_thread_.join();
        }

        registry_.close_all();
        std::unique_lock lock(sessions_mutex_);
        for (const auto &entry : sessions_)
        {
            if (auto session = entry.lock())
            {
                session->close();
            }
        }
        sessions_cv_.wait(lock, [this]
                          { return active_sessions_ == 0; });
        lock.unlock();

        users_.persist_usage(quota_);
        spdlog::info("Server stopped, quota usage saved to {}", users_.path().string());
    }

} // namespace sftpgate::server
