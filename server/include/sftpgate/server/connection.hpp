#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "sftpgate/server/config.hpp"
#include "sftpgate/server/quota.hpp"
#include "sftpgate/server/user.hpp"
#include "sftpgate/server/vfs.hpp"

namespace sftpgate::server
{

    class Transfer;

    enum class Protocol : std::uint8_t
    {
        Sftp,
        Scp,
        Ssh
    };

    std::string_view to_string(Protocol protocol) noexcept;

    enum class TransferType : std::uint8_t
    {
        Upload,
        Download
    };

    std::string_view to_string(TransferType type) noexcept;

    struct TransferStatus
    {
        std::uint64_t id{};
        TransferType type{TransferType::Upload};
        std::string virtual_path;
        std::uint64_t bytes{};
        std::chrono::system_clock::time_point started;
    };

    class Connection
    {
    public:
        Connection(std::string id, Protocol protocol, User user, std::shared_ptr<Filesystem> fs,
                   QuotaTracker &quota, UploadMode upload_mode = UploadMode::Standard);

        Connection(const Connection &) = delete;
        Connection &operator=(const Connection &) = delete;

        const std::string &id() const noexcept { return id_; }
        const User &user() const noexcept { return user_; }
        Filesystem &fs() const noexcept { return *fs_; }
        UploadMode upload_mode() const noexcept { return upload_mode_; }
        bool is_atomic_upload_enabled() const noexcept;

        Protocol protocol() const noexcept { return protocol_.load(); }
        void set_protocol(Protocol protocol) noexcept { protocol_.store(protocol); }

        void set_remote_address(std::string address);
        std::string remote_address() const;
        void set_client_version(std::string version);
        std::string client_version() const;
        void set_command(std::string command);
        std::string command() const;

        std::chrono::system_clock::time_point started() const noexcept { return started_; }
        void update_last_activity() noexcept;
        std::chrono::system_clock::time_point last_activity() const noexcept;

        std::uint64_t next_transfer_id() noexcept { return ++transfer_ids_; }
        void add_transfer(Transfer *transfer);
        void remove_transfer(const Transfer *transfer);
        std::size_t transfer_count() const;
        std::vector<TransferStatus> active_transfers() const;

        // Space check against the folder owning dir(virtual_path), or the user quota.
        QuotaCheckResult has_space(bool check_files, bool get_usage, std::string_view virtual_path) const;

        // 0 means unlimited; a negative value means no more bytes may be written.
        std::int64_t max_write_size(const QuotaCheckResult &quota, bool is_resume, std::int64_t file_size) const;

        void update_quota(std::string_view virtual_path, int files, std::int64_t size);

        std::string log_prefix() const;

    private:
        std::string id_;
        std::atomic<Protocol> protocol_;
        User user_;
        std::shared_ptr<Filesystem> fs_;
        QuotaTracker &quota_;
        UploadMode upload_mode_;
        std::chrono::system_clock::time_point started_;
        std::atomic<std::int64_t> last_activity_ns_;
        std::atomic<std::uint64_t> transfer_ids_{0};

        mutable std::mutex mutex_;
        std::string remote_address_;
        std::string client_version_;
        std::string command_;
        std::vector<Transfer *> transfers_;
    };

} // namespace sftpgate::server
