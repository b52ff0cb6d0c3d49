#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <type_traits>
#include <vector>

#include <libssh/libssh.h>
#include <libssh/sftp.h>

#include "sftpgate/error_codes.hpp"
#include "sftpgate/server/connection.hpp"
#include "sftpgate/server/transfer.hpp"
#include "sftpgate/server/vfs.hpp"

namespace sftpgate::server
{

    namespace sftp
    {
        // SSH_FX_* status for an error.
        std::uint32_t status_from_error(ErrorCode code) noexcept;

        sftp_attributes_struct attributes_from_info(const FileInfo &info);

        // "ls -l" style line sent as the long name of directory entries.
        std::string long_name(const FileInfo &info);
    } // namespace sftp

    // SFTP requests after libssh decoded them. File data goes through Transfers
    // so quotas and atomic uploads behave as for SCP.
    class SftpServer
    {
    public:
        explicit SftpServer(std::shared_ptr<Connection> connection);
        ~SftpServer();

        SftpServer(const SftpServer &) = delete;
        SftpServer &operator=(const SftpServer &) = delete;

        // pflags are SSH_FXF_* bits. Returns the new handle.
        std::string open(const std::string &path, std::uint32_t pflags);
        // The handle is gone even when closing the transfer fails.
        void close(const std::string &handle);
        // Returns 0 at end of file.
        std::size_t read(const std::string &handle, std::uint64_t offset, std::span<std::uint8_t> buffer);
        void write(const std::string &handle, std::uint64_t offset, std::span<const std::uint8_t> data);

        FileInfo stat(const std::string &path, bool follow_links);
        FileInfo fstat(const std::string &handle);
        void setstat(const std::string &path, const sftp_attributes_struct &attrs);
        void fsetstat(const std::string &handle, const sftp_attributes_struct &attrs);

        std::string opendir(const std::string &path);
        // Next batch of entries, empty once the listing is exhausted.
        std::vector<FileInfo> readdir(const std::string &handle);

        void remove(const std::string &path);
        void mkdir(const std::string &path);
        void rmdir(const std::string &path);
        std::string realpath(const std::string &path) const;
        void rename(const std::string &source, const std::string &target);
        std::string readlink(const std::string &path);
        void symlink(const std::string &target, const std::string &link);

        std::size_t open_handles() const noexcept { return handles_.size(); }
        void close_all_handles();

        const Connection &connection() const noexcept { return *connection_; }

    private:
        struct Handle
        {
            std::unique_ptr<Transfer> transfer;
            std::string virtual_path;
            std::vector<FileInfo> entries;
            std::size_t next_entry{0};
        };

        std::unique_ptr<Transfer> open_for_read(const std::string &virtual_path);
        std::unique_ptr<Transfer> open_for_write(const std::string &virtual_path, std::uint32_t pflags);

        Handle &find_handle(const std::string &handle);
        std::string add_handle(Handle handle);
        void require(std::string_view permission, const std::string &virtual_path) const;
        std::optional<FileInfo> lstat_if_exists(const std::filesystem::path &path) const;

        std::shared_ptr<Connection> connection_;
        std::map<std::string, Handle> handles_;
        std::uint64_t next_handle_{1};
    };

    struct SftpSessionFree
    {
        void operator()(sftp_session session) const { ::sftp_free(session); }
    };

    using SftpSessionPtr = std::unique_ptr<std::remove_pointer_t<sftp_session>, SftpSessionFree>;

    // Runs the "sftp" subsystem on an accepted libssh channel.
    class SftpSubsystem
    {
    public:
        SftpSubsystem(ssh_session session, ssh_channel channel, std::shared_ptr<Connection> connection,
                      std::mutex &session_mutex, const std::atomic<bool> &closing);
        ~SftpSubsystem();

        SftpSubsystem(const SftpSubsystem &) = delete;
        SftpSubsystem &operator=(const SftpSubsystem &) = delete;

        // Serves requests until the client closes the channel; open handles are closed afterwards.
        void serve(std::chrono::seconds idle_timeout);

    private:
        bool wait_for_request(std::chrono::seconds idle_timeout);
        int process(sftp_client_message message);
        int dispatch(sftp_client_message message);
        int reply_handle(sftp_client_message message, const std::string &handle);
        int reply_info(sftp_client_message message, const FileInfo &info);
        int reply_single_name(sftp_client_message message, const std::string &name);

        ssh_channel channel_;
        std::shared_ptr<Connection> connection_;
        std::mutex &session_mutex_;
        const std::atomic<bool> &closing_;
        SftpServer server_;
        SftpSessionPtr sftp_;
    };

} // namespace sftpgate::server
