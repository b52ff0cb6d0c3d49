#include "sftpgate/server/connection.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "sftpgate/error_codes.hpp"
#include "sftpgate/server/transfer.hpp"
#include "sftpgate/server/vpath.hpp"

namespace sftpgate::server
{

    namespace
    {
        std::int64_t now_ns() noexcept
        {
            return std::chrono::duration_cast<std::chrono::nanoseconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                .count();
        }
    } // namespace

    std::string_view to_string(Protocol protocol) noexcept
    {
        switch (protocol)
        {
        case Protocol::Sftp:
            return "SFTP";
        case Protocol::Scp:
            return "SCP";
        case Protocol::Ssh:
            return "SSH";
        }
        return "unknown";
    }

    std::string_view to_string(TransferType type) noexcept
    {
        return type == TransferType::Upload ? "upload" : "download";
    }

    Connection::Connection(std::string id, Protocol protocol, User user, std::shared_ptr<Filesystem> fs,
                           QuotaTracker &quota, UploadMode upload_mode)
        : id_(std::move(id)),
          protocol_(protocol),
          user_(std::move(user)),
          fs_(std::move(fs)),
          quota_(quota),
          upload_mode_(upload_mode),
          started_(std::chrono::system_clock::now()),
          last_activity_ns_(now_ns())
    {
    }

    bool Connection::is_atomic_upload_enabled() const noexcept
    {
        return upload_mode_ != UploadMode::Standard && fs_->is_atomic_upload_supported();
    }

    void Connection::set_remote_address(std::string address)
    {
        std::lock_guard lock(mutex_);
        remote_address_ = std::move(address);
    }

    std::string Connection::remote_address() const
    {
        std::lock_guard lock(mutex_);
        return remote_address_;
    }

    void Connection::set_client_version(std::string version)
    {
        std::lock_guard lock(mutex_);
        client_version_ = std::move(version);
    }

    std::string Connection::client_version() const
    {
        std::lock_guard lock(mutex_);
        return client_version_;
    }

    void Connection::set_command(std::string command)
    {
        std::lock_guard lock(mutex_);
        command_ = std::move(command);
    }

    std::string Connection::command() const
    {
        std::lock_guard lock(mutex_);
        return command_;
    }

    void Connection::update_last_activity() noexcept
    {
        last_activity_ns_.store(now_ns());
    }

    std::chrono::system_clock::time_point Connection::last_activity() const noexcept
    {
        return std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::nanoseconds(last_activity_ns_.load())));
    }

    void Connection::add_transfer(Transfer *transfer)
    {
        std::lock_guard lock(mutex_);
        transfers_.push_back(transfer);
    }

    void Connection::remove_transfer(const Transfer *transfer)
    {
        std::lock_guard lock(mutex_);
        transfers_.erase(std::remove(transfers_.begin(), transfers_.end(), transfer), transfers_.end());
    }

    std::size_t Connection::transfer_count() const
    {
        std::lock_guard lock(mutex_);
        return transfers_.size();
    }

    std::vector<TransferStatus> Connection::active_transfers() const
    {
        std::lock_guard lock(mutex_);
        std::vector<TransferStatus> result;
        result.reserve(transfers_.size());
        for (const auto *transfer : transfers_)
        {
            result.push_back(transfer->status());
        }
        return result;
    }

    QuotaCheckResult Connection::has_space(bool check_files, bool get_usage, std::string_view virtual_path) const
    {
        QuotaCheckResult result;
        const auto folder = user_.virtual_folder_for_path(vpath::dir(virtual_path));
        if (folder && !folder->included_in_user_quota)
        {
            if (folder->has_no_quota_restrictions(check_files) && !get_usage)
            {
                return result;
            }
            const auto usage = quota_.folder_usage(folder->name);
            result.quota_size = folder->quota_size;
            result.quota_files = folder->quota_files;
            result.used_size = usage.size;
            result.used_files = usage.files;
        }
        else
        {
            if (user_.has_no_quota_restrictions(check_files) && !get_usage)
            {
                return result;
            }
            const auto usage = quota_.user_usage(user_.username);
            result.quota_size = user_.quota_size;
            result.quota_files = user_.quota_files;
            result.used_size = usage.size;
            result.used_files = usage.files;
        }

        if ((check_files && result.quota_files > 0 && result.used_files >= result.quota_files) ||
            (result.quota_size > 0 && result.used_size >= result.quota_size))
        {
            spdlog::debug("{} quota exceeded for path \"{}\", files: {}/{} size: {}/{}", log_prefix(), virtual_path,
                          result.used_files, result.quota_files, result.used_size, result.quota_size);
            result.has_space = false;
            return result;
        }
        result.allowed_size = result.remaining_size();
        result.allowed_files = result.remaining_files();
        return result;
    }

    std::int64_t Connection::max_write_size(const QuotaCheckResult &quota, bool is_resume,
                                            std::int64_t file_size) const
    {
        if (is_resume && !fs_->is_upload_resume_supported())
        {
            throw Error(ErrorCode::Unsupported, "resume is not supported on this filesystem");
        }
        auto max_write = quota.remaining_size();
        if (!is_resume && max_write > 0)
        {
            // An overwrite frees the space of the file it replaces.
            max_write += file_size;
        }

        const auto max_upload = user_.max_upload_file_size;
        if (max_upload > 0)
        {
            if (is_resume && file_size >= max_upload)
            {
                throw Error(ErrorCode::QuotaExceeded, "file size limit reached");
            }
            const auto allowed = is_resume ? max_upload - file_size : max_upload;
            if (max_write == 0 || allowed < max_write)
            {
                max_write = allowed;
            }
        }
        return max_write;
    }

    void Connection::update_quota(std::string_view virtual_path, int files, std::int64_t size)
    {
        const auto folder = user_.virtual_folder_for_path(vpath::dir(virtual_path));
        if (folder)
        {
            quota_.update_folder(folder->name, files, size);
            if (folder->included_in_user_quota)
            {
                quota_.update_user(user_.username, files, size);
            }
            return;
        }
        quota_.update_user(user_.username, files, size);
    }

    std::string Connection::log_prefix() const
    {
        return "[" + std::string(to_string(protocol())) + "_" + id_ + "]";
    }

} // namespace sftpgate::server
