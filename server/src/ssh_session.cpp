#include "sftpgate/server/ssh_session.hpp"

#include <memory>
#include <type_traits>

#include <sys/socket.h>

#include <spdlog/spdlog.h>

#include "sftpgate/error_codes.hpp"
#include "sftpgate/server/command_line.hpp"
#include "sftpgate/server/sftp.hpp"
#include "sftpgate/server/ssh_command.hpp"
#include "sftpgate/server/ssh_keys.hpp"

namespace sftpgate::server
{

    namespace
    {

        constexpr int kPollTimeoutMs = 100;
        constexpr int kDefaultMaxAuthTries = 6;

        struct MessageFree
        {
            void operator()(ssh_message message) const { ::ssh_message_free(message); }
        };

        using MessagePtr = std::unique_ptr<std::remove_pointer_t<ssh_message>, MessageFree>;

        void deny_auth(ssh_message message)
        {
            ::ssh_message_auth_set_methods(message, SSH_AUTH_METHOD_PASSWORD | SSH_AUTH_METHOD_PUBLICKEY);
            ::ssh_message_reply_default(message);
        }

        std::string_view nullable(const char *text)
        {
            return text == nullptr ? std::string_view{} : std::string_view{text};
        }

    } // namespace

    SshChannel::SshChannel(ssh_channel channel, std::mutex &session_mutex, const std::atomic<bool> &closing)
        : channel_(channel), session_mutex_(session_mutex), closing_(closing)
    {
    }

    SshChannel::~SshChannel()
    {
        close();
        std::lock_guard lock(session_mutex_);
        ::ssh_channel_free(channel_);
    }

    void SshChannel::set_idle_timeout(std::shared_ptr<Connection> connection, std::chrono::seconds timeout)
    {
        connection_ = std::move(connection);
        idle_timeout_ = timeout;
    }

    std::size_t SshChannel::read(std::span<std::uint8_t> buffer)
    {
        if (buffer.empty())
        {
            return 0;
        }
        for (;;)
        {
            if (closing_.load())
            {
                throw Error(ErrorCode::GenericFailure, "connection closed");
            }
            {
                std::lock_guard lock(session_mutex_);
                const int count = ::ssh_channel_read_timeout(channel_, buffer.data(),
                                                             static_cast<std::uint32_t>(buffer.size()), 0,
                                                             kPollTimeoutMs);
                if (count == SSH_ERROR)
                {
                    throw_channel_error("read");
                }
                if (count > 0)
                {
                    if (connection_)
                    {
                        connection_->update_last_activity();
                    }
                    return static_cast<std::size_t>(count);
                }
                if (::ssh_channel_is_eof(channel_) != 0 || ::ssh_channel_is_closed(channel_) != 0)
                {
                    return 0;
                }
            }
            if (connection_ && idle_timeout_.count() > 0 &&
                std::chrono::system_clock::now() - connection_->last_activity() > idle_timeout_)
            {
                spdlog::info("{} idle timeout, closing channel", connection_->log_prefix());
                throw Error(ErrorCode::GenericFailure, "idle timeout");
            }
        }
    }

    std::size_t SshChannel::write(std::span<const std::uint8_t> data)
    {
        return write_stream(data, false);
    }

    std::size_t SshChannel::StderrWriter::write(std::span<const std::uint8_t> data)
    {
        return owner_.write_stream(data, true);
    }

    std::size_t SshChannel::write_stream(std::span<const std::uint8_t> data, bool is_stderr)
    {
        if (closing_.load())
        {
            throw Error(ErrorCode::GenericFailure, "connection closed");
        }
        std::lock_guard lock(session_mutex_);
        const auto size = static_cast<std::uint32_t>(data.size());
        const int count = is_stderr ? ::ssh_channel_write_stderr(channel_, data.data(), size)
                                    : ::ssh_channel_write(channel_, data.data(), size);
        if (count == SSH_ERROR)
        {
            throw_channel_error("write");
        }
        return static_cast<std::size_t>(count);
    }

    void SshChannel::send_exit_status(std::uint32_t status)
    {
        std::lock_guard lock(session_mutex_);
        if (closed_)
        {
            return;
        }
        if (::ssh_channel_request_send_exit_status(channel_, static_cast<int>(status)) != SSH_OK)
        {
            throw_channel_error("send exit status");
        }
    }

    void SshChannel::close_write()
    {
        std::lock_guard lock(session_mutex_);
        if (eof_sent_ || closed_)
        {
            return;
        }
        eof_sent_ = true;
        if (::ssh_channel_send_eof(channel_) != SSH_OK)
        {
            throw_channel_error("send eof");
        }
    }

    void SshChannel::close()
    {
        std::lock_guard lock(session_mutex_);
        if (closed_)
        {
            return;
        }
        closed_ = true;
        if (!eof_sent_)
        {
            eof_sent_ = true;
            ::ssh_channel_send_eof(channel_);
        }
        ::ssh_channel_close(channel_);
    }

    void SshChannel::throw_channel_error(const char *operation) const
    {
        const auto session = ::ssh_channel_get_session(channel_);
        throw Error(ErrorCode::GenericFailure,
                    std::string("channel ") + operation + " failed: " + std::string(nullable(::ssh_get_error(session))));
    }

    SshSession::SshSession(ssh_session session, std::string id, std::string remote_address, SessionServices services)
        : session_(session), id_(std::move(id)), remote_address_(std::move(remote_address)), services_(services)
    {
    }

    SshSession::~SshSession()
    {
        ::ssh_disconnect(session_);
        ::ssh_free(session_);
    }

    void SshSession::run()
    {
        try
        {
            if (::ssh_handle_key_exchange(session_) != SSH_OK)
            {
                throw Error(ErrorCode::GenericFailure,
                            "key exchange failed: " + std::string(nullable(::ssh_get_error(session_))));
            }
            spdlog::debug("[{}] key exchange done with {}, client {}", id_, remote_address_,
                          nullable(::ssh_get_clientbanner(session_)));
            const auto user = authenticate();
            if (!user)
            {
                spdlog::info("[{}] authentication failed for connection from {}", id_, remote_address_);
                return;
            }
            spdlog::info("[{}] user \"{}\" logged in from {}", id_, user->username, remote_address_);
            serve_channels(*user);
            spdlog::info("[{}] connection from {} closed", id_, remote_address_);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("[{}] connection from {} failed: {}", id_, remote_address_, ex.what());
        }
    }

    void SshSession::close()
    {
        if (closing_.exchange(true))
        {
            return;
        }
        const int fd = ::ssh_get_fd(session_);
        if (fd >= 0)
        {
            ::shutdown(fd, SHUT_RDWR);
        }
    }

    std::optional<User> SshSession::authenticate()
    {
        const int max_tries = services_.config.max_auth_tries > 0 ? services_.config.max_auth_tries
                                                                  : kDefaultMaxAuthTries;
        int failures = 0;
        while (failures < max_tries)
        {
            MessagePtr message(::ssh_message_get(session_));
            if (!message)
            {
                return std::nullopt;
            }
            if (::ssh_message_type(message.get()) != SSH_REQUEST_AUTH)
            {
                ::ssh_message_reply_default(message.get());
                continue;
            }
            const std::string username(nullable(::ssh_message_auth_user(message.get())));
            switch (::ssh_message_subtype(message.get()))
            {
            case SSH_AUTH_METHOD_PASSWORD:
            {
                auto user = services_.users.authenticate(username, std::string(nullable(
                                                                       ::ssh_message_auth_password(message.get()))));
                if (user)
                {
                    ::ssh_message_auth_reply_success(message.get(), 0);
                    return user;
                }
                spdlog::warn("[{}] password authentication failed for \"{}\" from {}", id_, username, remote_address_);
                ++failures;
                deny_auth(message.get());
                break;
            }
            case SSH_AUTH_METHOD_PUBLICKEY:
            {
                auto user = services_.users.find(username);
                const bool accepted = user && user->enabled &&
                                      is_public_key_accepted(*user, ::ssh_message_auth_pubkey(message.get()));
                const auto state = ::ssh_message_auth_publickey_state(message.get());
                if (accepted && state == SSH_PUBLICKEY_STATE_NONE)
                {
                    ::ssh_message_auth_reply_pk_ok_simple(message.get());
                    break;
                }
                if (accepted && state == SSH_PUBLICKEY_STATE_VALID)
                {
                    ::ssh_message_auth_reply_success(message.get(), 0);
                    return user;
                }
                spdlog::warn("[{}] public key authentication failed for \"{}\" from {}", id_, username,
                             remote_address_);
                ++failures;
                deny_auth(message.get());
                break;
            }
            default:
                deny_auth(message.get());
                break;
            }
        }
        spdlog::warn("[{}] too many authentication failures from {}", id_, remote_address_);
        return std::nullopt;
    }

    bool SshSession::is_public_key_accepted(const User &user, ssh_key key) const
    {
        if (key == nullptr)
        {
            return false;
        }
        try
        {
            const auto offered = public_key_from_ssh_key(key);
            if (offered.is_certificate())
            {
                if (services_.certificates.empty())
                {
                    return false;
                }
                const auto cert = services_.certificates.check_user_certificate(offered, user.username,
                                                                                std::chrono::system_clock::now());
                spdlog::debug("[{}] accepted certificate \"{}\" serial {} for \"{}\"", id_, cert.key_id, cert.serial,
                              user.username);
                return true;
            }
            for (const auto &line : user.public_keys)
            {
                try
                {
                    if (parse_authorized_key(line) == offered)
                    {
                        return true;
                    }
                }
                catch (const Error &error)
                {
                    spdlog::warn("[{}] invalid public key configured for \"{}\": {}", id_, user.username, error.what());
                }
            }
        }
        catch (const Error &error)
        {
            spdlog::warn("[{}] public key rejected for \"{}\": {}", id_, user.username, error.what());
        }
        return false;
    }

    void SshSession::serve_channels(const User &user)
    {
        for (;;)
        {
            MessagePtr message(::ssh_message_get(session_));
            if (!message)
            {
                return;
            }
            if (::ssh_message_type(message.get()) == SSH_REQUEST_CHANNEL_OPEN &&
                ::ssh_message_subtype(message.get()) == SSH_CHANNEL_SESSION)
            {
                ssh_channel channel = ::ssh_message_channel_request_open_reply_accept(message.get());
                message.reset();
                if (channel != nullptr)
                {
                    serve_channel(channel, user);
                }
                continue;
            }
            ::ssh_message_reply_default(message.get());
        }
    }

    void SshSession::serve_channel(ssh_channel channel, const User &user)
    {
        for (;;)
        {
            MessagePtr message(::ssh_message_get(session_));
            if (!message)
            {
                ::ssh_channel_free(channel);
                return;
            }
            if (::ssh_message_type(message.get()) != SSH_REQUEST_CHANNEL ||
                ::ssh_message_channel_request_channel(message.get()) != channel)
            {
                ::ssh_message_reply_default(message.get());
                continue;
            }
            switch (::ssh_message_subtype(message.get()))
            {
            case SSH_CHANNEL_REQUEST_SUBSYSTEM:
                if (nullable(::ssh_message_channel_request_subsystem(message.get())) == "sftp")
                {
                    ::ssh_message_channel_request_reply_success(message.get());
                    message.reset();
                    run_sftp(channel, user);
                    return;
                }
                ::ssh_message_reply_default(message.get());
                break;
            case SSH_CHANNEL_REQUEST_EXEC:
            {
                const std::string command_line(nullable(::ssh_message_channel_request_command(message.get())));
                ParsedCommand parsed;
                try
                {
                    parsed = parse_command_payload(command_line);
                }
                catch (const Error &error)
                {
                    spdlog::debug("[{}] unable to parse command \"{}\": {}", id_, command_line, error.what());
                    ::ssh_message_reply_default(message.get());
                    break;
                }
                if (classify_command(parsed.name).kind == CommandKind::Unsupported ||
                    !is_command_enabled(parsed.name, services_.config.enabled_ssh_commands))
                {
                    spdlog::debug("[{}] command \"{}\" is not enabled", id_, parsed.name);
                    ::ssh_message_reply_default(message.get());
                    break;
                }
                ::ssh_message_channel_request_reply_success(message.get());
                message.reset();
                run_exec(channel, user, command_line);
                return;
            }
            case SSH_CHANNEL_REQUEST_ENV:
                ::ssh_message_channel_request_reply_success(message.get());
                break;
            default:
                ::ssh_message_reply_default(message.get());
                break;
            }
        }
    }

    void SshSession::run_sftp(ssh_channel channel, const User &user)
    {
        auto connection = make_connection(Protocol::Sftp, user);
        ConnectionGuard guard(services_.registry, connection, [this]
                              { close(); });
        try
        {
            // The sftp session owns the channel from here on.
            SftpSubsystem subsystem(session_, channel, connection, mutex_, closing_);
            subsystem.serve(services_.config.idle_timeout);
        }
        catch (const Error &error)
        {
            spdlog::warn("{} sftp session ended with error: {}", connection->log_prefix(), error.what());
        }
    }

    void SshSession::run_exec(ssh_channel channel, const User &user, const std::string &command_line)
    {
        SshChannel session_channel(channel, mutex_, closing_);
        auto connection = make_connection(Protocol::Ssh, user);
        session_channel.set_idle_timeout(connection, services_.config.idle_timeout);
        try
        {
            dispatch_exec_command(connection, session_channel, services_.registry, parse_command_payload(command_line));
        }
        catch (const Error &error)
        {
            spdlog::debug("{} command \"{}\" failed: {}", connection->log_prefix(), command_line, error.what());
        }
    }

    std::shared_ptr<Connection> SshSession::make_connection(Protocol protocol, const User &user)
    {
        std::error_code ec;
        std::filesystem::create_directories(user.home_dir, ec);
        if (ec)
        {
            spdlog::warn("[{}] unable to create home dir {}: {}", id_, user.home_dir.string(), ec.message());
        }
        auto fs = std::make_shared<OsFilesystem>(user.home_dir, user.virtual_folders);
        auto connection = std::make_shared<Connection>(id_ + "_" + std::to_string(++channel_count_), protocol, user,
                                                       std::move(fs), services_.quota,
                                                       services_.config.upload_mode);
        connection->set_remote_address(remote_address_);
        connection->set_client_version(std::string(nullable(::ssh_get_clientbanner(session_))));
        return connection;
    }

} // namespace sftpgate::server
