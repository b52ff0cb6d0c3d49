#include "sftpgate/server/sftp.hpp"

#include <algorithm>
#include <array>
#include <ctime>
#include <span>
#include <vector>

#include <sys/stat.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "sftpgate/server/vpath.hpp"

namespace sftpgate::server
{

    namespace
    {

        constexpr std::uint32_t kMaxReadLength = 255 * 1024;
        constexpr std::size_t kReaddirBatch = 100;
        constexpr int kPollTimeoutMs = 100;

        std::uint32_t to_unix_seconds(std::chrono::system_clock::time_point time)
        {
            const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
            return seconds < 0 ? 0u : static_cast<std::uint32_t>(seconds);
        }

        std::chrono::system_clock::time_point from_unix_seconds(std::uint32_t seconds)
        {
            return std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
        }

        char type_char(const FileInfo &info)
        {
            if (info.is_dir())
            {
                return 'd';
            }
            if (info.is_symlink())
            {
                return 'l';
            }
            return '-';
        }

        std::string string_of(ssh_string value)
        {
            if (value == nullptr)
            {
                throw Error(ErrorCode::SyntaxError, "missing string field");
            }
            return std::string(::ssh_string_get_char(value), ::ssh_string_len(value));
        }

        std::string filename_of(sftp_client_message message)
        {
            const char *name = ::sftp_client_message_get_filename(message);
            if (name == nullptr)
            {
                throw Error(ErrorCode::SyntaxError, "missing file name");
            }
            return name;
        }

        std::string second_path_of(sftp_client_message message)
        {
            const char *path = ::sftp_client_message_get_data(message);
            if (path == nullptr)
            {
                throw Error(ErrorCode::SyntaxError, "missing target path");
            }
            return path;
        }

        const sftp_attributes_struct &attributes_of(sftp_client_message message)
        {
            if (message->attr == nullptr)
            {
                throw Error(ErrorCode::SyntaxError, "missing attributes");
            }
            return *message->attr;
        }

    } // namespace

    namespace sftp
    {

        std::uint32_t status_from_error(ErrorCode code) noexcept
        {
            switch (code)
            {
            case ErrorCode::Ok:
                return SSH_FX_OK;
            case ErrorCode::NotFound:
                return SSH_FX_NO_SUCH_FILE;
            case ErrorCode::PermissionDenied:
                return SSH_FX_PERMISSION_DENIED;
            case ErrorCode::Unsupported:
                return SSH_FX_OP_UNSUPPORTED;
            case ErrorCode::Eof:
                return SSH_FX_EOF;
            default:
                return SSH_FX_FAILURE;
            }
        }

        sftp_attributes_struct attributes_from_info(const FileInfo &info)
        {
            sftp_attributes_struct attrs{};
            attrs.flags = SSH_FILEXFER_ATTR_SIZE | SSH_FILEXFER_ATTR_UIDGID | SSH_FILEXFER_ATTR_PERMISSIONS |
                          SSH_FILEXFER_ATTR_ACMODTIME;
            attrs.size = info.size;
            attrs.uid = info.uid;
            attrs.gid = info.gid;
            attrs.permissions = info.mode;
            attrs.atime = to_unix_seconds(info.accessed);
            attrs.mtime = to_unix_seconds(info.modified);
            attrs.atime64 = attrs.atime;
            attrs.mtime64 = attrs.mtime;
            return attrs;
        }

        std::string long_name(const FileInfo &info)
        {
            constexpr std::array<char, 3> kRwx{'r', 'w', 'x'};
            std::string perms(10, '-');
            perms[0] = type_char(info);
            for (int i = 0; i < 9; ++i)
            {
                if ((info.mode & (0400u >> i)) != 0)
                {
                    perms[static_cast<std::size_t>(i) + 1] = kRwx[static_cast<std::size_t>(i % 3)];
                }
            }

            const auto modified = std::chrono::system_clock::to_time_t(info.modified);
            std::tm tm{};
            ::gmtime_r(&modified, &tm);
            char date[32] = {};
            std::strftime(date, sizeof(date), "%b %d %H:%M", &tm);
            return fmt::format("{} 1 {:<8} {:<8} {:>8} {} {}", perms, info.uid, info.gid, info.size, date, info.name);
        }

    } // namespace sftp

    SftpServer::SftpServer(std::shared_ptr<Connection> connection) : connection_(std::move(connection)) {}

    SftpServer::~SftpServer()
    {
        close_all_handles();
    }

    void SftpServer::close_all_handles()
    {
        auto handles = std::move(handles_);
        handles_.clear();
        for (auto &[name, handle] : handles)
        {
            if (!handle.transfer)
            {
                continue;
            }
            try
            {
                handle.transfer->close();
            }
            catch (const Error &error)
            {
                spdlog::warn("{} error closing handle for \"{}\": {}", connection_->log_prefix(), handle.virtual_path,
                             error.what());
            }
        }
    }

    std::string SftpServer::open(const std::string &path, std::uint32_t pflags)
    {
        connection_->update_last_activity();
        const auto virtual_path = vpath::clean(path);
        auto transfer = (pflags & SSH_FXF_WRITE) != 0 ? open_for_write(virtual_path, pflags)
                                                      : open_for_read(virtual_path);
        return add_handle(Handle{.transfer = std::move(transfer), .virtual_path = virtual_path});
    }

    std::unique_ptr<Transfer> SftpServer::open_for_read(const std::string &virtual_path)
    {
        const auto &user = connection_->user();
        require(permission::kDownload, vpath::dir(virtual_path));
        if (!user.is_file_allowed(virtual_path))
        {
            spdlog::warn("{} reading file \"{}\" is not allowed", connection_->log_prefix(), virtual_path);
            throw Error(ErrorCode::PermissionDenied);
        }
        auto &fs = connection_->fs();
        const auto real = fs.resolve_path(virtual_path);
        const auto info = fs.stat(real);
        if (info.is_dir())
        {
            throw Error(ErrorCode::GenericFailure, "cannot open a directory for reading");
        }
        auto opened = fs.open(real, 0);
        return std::make_unique<Transfer>(*connection_, TransferParams{
                                                            .file = std::move(opened.file),
                                                            .reader = std::move(opened.reader),
                                                            .cancel = std::move(opened.cancel),
                                                            .fs_path = real,
                                                            .request_path = virtual_path,
                                                            .type = TransferType::Download,
                                                        });
    }

    std::unique_ptr<Transfer> SftpServer::open_for_write(const std::string &virtual_path, std::uint32_t pflags)
    {
        const auto &user = connection_->user();
        auto &fs = connection_->fs();
        if (!user.is_file_allowed(virtual_path))
        {
            spdlog::warn("{} writing file \"{}\" is not allowed", connection_->log_prefix(), virtual_path);
            throw Error(ErrorCode::PermissionDenied);
        }
        const auto real = fs.resolve_path(virtual_path);
        const auto existing = lstat_if_exists(real);
        const bool is_new_file = !existing || existing->is_symlink();
        if (existing && existing->is_dir())
        {
            throw Error(ErrorCode::GenericFailure, "cannot open a directory for writing");
        }
        if (is_new_file)
        {
            require(permission::kUpload, vpath::dir(virtual_path));
        }
        else
        {
            if ((pflags & SSH_FXF_EXCL) != 0)
            {
                throw Error(ErrorCode::GenericFailure, "file already exists");
            }
            require(permission::kOverwrite, vpath::dir(virtual_path));
        }

        const bool is_resume = !is_new_file && (pflags & SSH_FXF_TRUNC) == 0;
        if (is_resume && !fs.is_upload_resume_supported())
        {
            throw Error(ErrorCode::Unsupported, "resume is not supported, open the file with the truncate flag");
        }
        const auto file_size = is_new_file ? std::int64_t{0} : static_cast<std::int64_t>(existing->size);

        const auto quota = connection_->has_space(is_new_file, false, virtual_path);
        if (!quota.has_space)
        {
            spdlog::warn("{} error uploading file \"{}\": quota exceeded", connection_->log_prefix(), virtual_path);
            throw Error(ErrorCode::QuotaExceeded, "denying file write due to quota limits");
        }
        const auto max_write_size = connection_->max_write_size(quota, is_resume, file_size);

        bool atomic = connection_->is_atomic_upload_enabled();
        if (atomic && is_resume && connection_->upload_mode() != UploadMode::AtomicWithResume)
        {
            atomic = false;
        }
        const auto file_path = atomic ? fs.atomic_upload_path(real) : real;
        if (atomic && is_resume)
        {
            fs.rename(real, file_path);
        }

        CreateResult created;
        try
        {
            created = fs.create(file_path, CreateOptions{.truncate = !is_resume,
                                                         .read = (pflags & SSH_FXF_READ) != 0});
        }
        catch (const Error &error)
        {
            if (atomic && is_resume)
            {
                fs.rename(file_path, real);
            }
            spdlog::error("{} error creating file \"{}\": {}", connection_->log_prefix(), real.string(), error.what());
            throw;
        }

        std::int64_t initial_size = 0;
        std::uint64_t min_write_offset = 0;
        if (is_resume)
        {
            initial_size = file_size;
            min_write_offset = static_cast<std::uint64_t>(file_size);
        }
        else if (!is_new_file)
        {
            if (fs.is_local() && !atomic)
            {
                connection_->update_quota(virtual_path, 0, -file_size);
            }
            else
            {
                initial_size = file_size;
            }
        }

        std::optional<Error> read_error;
        if (atomic || !fs.is_local())
        {
            read_error = Error(ErrorCode::Unsupported, "reading from this handle is not supported");
        }
        return std::make_unique<Transfer>(*connection_, TransferParams{
                                                            .file = std::move(created.file),
                                                            .writer = std::move(created.writer),
                                                            .cancel = std::move(created.cancel),
                                                            .fs_path = real,
                                                            .request_path = virtual_path,
                                                            .type = TransferType::Upload,
                                                            .min_write_offset = min_write_offset,
                                                            .initial_size = initial_size,
                                                            .max_write_size = max_write_size,
                                                            .is_new_file = is_new_file,
                                                            .read_error = std::move(read_error),
                                                        });
    }

    void SftpServer::close(const std::string &handle)
    {
        const auto it = handles_.find(handle);
        if (it == handles_.end())
        {
            throw Error(ErrorCode::GenericFailure, "invalid handle");
        }
        auto closing = std::move(it->second);
        handles_.erase(it);
        if (closing.transfer)
        {
            closing.transfer->close();
        }
    }

    std::size_t SftpServer::read(const std::string &handle, std::uint64_t offset, std::span<std::uint8_t> buffer)
    {
        auto &entry = find_handle(handle);
        if (!entry.transfer)
        {
            throw Error(ErrorCode::GenericFailure, "invalid handle");
        }
        return entry.transfer->read_at(buffer, offset);
    }

    void SftpServer::write(const std::string &handle, std::uint64_t offset, std::span<const std::uint8_t> data)
    {
        auto &entry = find_handle(handle);
        if (!entry.transfer || entry.transfer->type() != TransferType::Upload)
        {
            throw Error(ErrorCode::PermissionDenied, "handle not open for writing");
        }
        std::size_t done = 0;
        while (done < data.size())
        {
            const auto written = entry.transfer->write_at(data.subspan(done), offset + done);
            if (written == 0)
            {
                throw Error(ErrorCode::ShortWrite, "short write");
            }
            done += written;
        }
    }

    FileInfo SftpServer::stat(const std::string &path, bool follow_links)
    {
        const auto virtual_path = vpath::clean(path);
        require(permission::kList, vpath::dir(virtual_path));
        auto &fs = connection_->fs();
        const auto real = fs.resolve_path(virtual_path);
        auto info = follow_links ? fs.stat(real) : fs.lstat(real);
        info.name = vpath::base(virtual_path);
        return info;
    }

    FileInfo SftpServer::fstat(const std::string &handle)
    {
        const auto &entry = find_handle(handle);
        auto &fs = connection_->fs();
        const auto real = entry.transfer ? entry.transfer->fs_path() : fs.resolve_path(entry.virtual_path);
        const bool is_upload = entry.transfer && entry.transfer->type() == TransferType::Upload;
        FileInfo info;
        try
        {
            info = fs.stat(real);
        }
        catch (const Error &error)
        {
            // A new atomic upload only exists as its temp file.
            if (!is_upload || error.code() != ErrorCode::NotFound)
            {
                throw;
            }
            info.mode = S_IFREG | 0644u;
            info.modified = std::chrono::system_clock::now();
            info.accessed = info.modified;
        }
        info.name = vpath::base(entry.virtual_path);
        if (is_upload)
        {
            info.size = std::max<std::uint64_t>(info.size, entry.transfer->bytes_received());
        }
        return info;
    }

    void SftpServer::setstat(const std::string &path, const sftp_attributes_struct &attrs)
    {
        const auto virtual_path = vpath::clean(path);
        auto &fs = connection_->fs();
        const auto real = fs.resolve_path(virtual_path);
        if ((attrs.flags & SSH_FILEXFER_ATTR_PERMISSIONS) != 0)
        {
            require(permission::kChmod, virtual_path);
            fs.chmod(real, attrs.permissions & 07777u);
        }
        if ((attrs.flags & SSH_FILEXFER_ATTR_UIDGID) != 0)
        {
            require(permission::kChown, virtual_path);
            fs.chown(real, attrs.uid, attrs.gid);
        }
        if ((attrs.flags & SSH_FILEXFER_ATTR_ACMODTIME) != 0)
        {
            require(permission::kChtimes, virtual_path);
            fs.chtimes(real, from_unix_seconds(attrs.atime), from_unix_seconds(attrs.mtime));
        }
        if ((attrs.flags & SSH_FILEXFER_ATTR_SIZE) != 0)
        {
            require(permission::kOverwrite, virtual_path);
            const auto before = fs.stat(real);
            fs.truncate(real, attrs.size);
            connection_->update_quota(virtual_path, 0,
                                      static_cast<std::int64_t>(attrs.size) - static_cast<std::int64_t>(before.size));
        }
    }

    void SftpServer::fsetstat(const std::string &handle, const sftp_attributes_struct &attrs)
    {
        const auto virtual_path = find_handle(handle).virtual_path;
        setstat(virtual_path, attrs);
    }

    std::string SftpServer::opendir(const std::string &path)
    {
        const auto virtual_path = vpath::clean(path);
        require(permission::kList, virtual_path);
        auto &fs = connection_->fs();
        const auto real = fs.resolve_path(virtual_path);
        if (!fs.stat(real).is_dir())
        {
            throw Error(ErrorCode::GenericFailure, "not a directory");
        }
        auto entries = fs.read_dir(real);
        for (const auto &name : connection_->user().virtual_dirs_in(virtual_path))
        {
            const auto duplicate = std::any_of(entries.begin(), entries.end(), [&name](const FileInfo &entry)
                                               { return entry.name == name; });
            if (duplicate)
            {
                continue;
            }
            try
            {
                auto info = fs.stat(fs.resolve_path(vpath::join(virtual_path, name)));
                info.name = name;
                entries.push_back(std::move(info));
            }
            catch (const Error &error)
            {
                spdlog::warn("{} unable to stat virtual folder \"{}\": {}", connection_->log_prefix(),
                             vpath::join(virtual_path, name), error.what());
            }
        }
        return add_handle(Handle{.virtual_path = virtual_path, .entries = std::move(entries)});
    }

    std::vector<FileInfo> SftpServer::readdir(const std::string &handle)
    {
        auto &entry = find_handle(handle);
        if (entry.transfer)
        {
            throw Error(ErrorCode::GenericFailure, "not a directory handle");
        }
        const auto count = std::min(kReaddirBatch, entry.entries.size() - entry.next_entry);
        const auto first = entry.entries.begin() + static_cast<std::ptrdiff_t>(entry.next_entry);
        std::vector<FileInfo> batch(first, first + static_cast<std::ptrdiff_t>(count));
        entry.next_entry += count;
        return batch;
    }

    void SftpServer::remove(const std::string &path)
    {
        const auto virtual_path = vpath::clean(path);
        require(permission::kDelete, vpath::dir(virtual_path));
        auto &fs = connection_->fs();
        const auto real = fs.resolve_path(virtual_path);
        const auto info = fs.lstat(real);
        if (info.is_dir())
        {
            throw Error(ErrorCode::GenericFailure, "cannot remove a directory, use rmdir");
        }
        if (!info.is_symlink() && !connection_->user().is_file_allowed(virtual_path))
        {
            throw Error(ErrorCode::PermissionDenied);
        }
        fs.remove(real, false);
        if (info.is_regular())
        {
            connection_->update_quota(virtual_path, -1, -static_cast<std::int64_t>(info.size));
        }
        spdlog::info("{} removed file \"{}\"", connection_->log_prefix(), virtual_path);
    }

    void SftpServer::mkdir(const std::string &path)
    {
        const auto virtual_path = vpath::clean(path);
        require(permission::kCreateDirs, vpath::dir(virtual_path));
        auto &fs = connection_->fs();
        fs.mkdir(fs.resolve_path(virtual_path));
    }

    void SftpServer::rmdir(const std::string &path)
    {
        const auto virtual_path = vpath::clean(path);
        const auto &user = connection_->user();
        if (virtual_path == "/" || user.is_virtual_folder(virtual_path))
        {
            throw Error(ErrorCode::PermissionDenied, "removing this directory is not allowed");
        }
        if (user.has_virtual_folders_inside(virtual_path))
        {
            throw Error(ErrorCode::PermissionDenied, "the directory contains virtual folders");
        }
        require(permission::kDelete, vpath::dir(virtual_path));
        auto &fs = connection_->fs();
        const auto real = fs.resolve_path(virtual_path);
        if (!fs.lstat(real).is_dir())
        {
            throw Error(ErrorCode::GenericFailure, "not a directory");
        }
        fs.remove(real, true);
    }

    std::string SftpServer::realpath(const std::string &path) const
    {
        return vpath::clean(path);
    }

    void SftpServer::rename(const std::string &source, const std::string &target)
    {
        const auto source_path = vpath::clean(source);
        const auto target_path = vpath::clean(target);
        const auto &user = connection_->user();
        require(permission::kRename, vpath::dir(source_path));
        require(permission::kRename, vpath::dir(target_path));
        if (user.is_virtual_folder(source_path) || user.is_virtual_folder(target_path) ||
            user.has_virtual_folders_inside(source_path))
        {
            throw Error(ErrorCode::PermissionDenied, "renaming a virtual folder is not allowed");
        }
        const auto source_folder = user.virtual_folder_for_path(source_path);
        const auto target_folder = user.virtual_folder_for_path(target_path);
        if (source_folder.has_value() != target_folder.has_value() ||
            (source_folder && source_folder->name != target_folder->name))
        {
            throw Error(ErrorCode::Unsupported, "renaming across virtual folders is not supported");
        }

        auto &fs = connection_->fs();
        const auto source_real = fs.resolve_path(source_path);
        const auto target_real = fs.resolve_path(target_path);
        const auto info = fs.lstat(source_real);
        if (info.is_regular() && (!user.is_file_allowed(source_path) || !user.is_file_allowed(target_path)))
        {
            throw Error(ErrorCode::PermissionDenied);
        }
        if (lstat_if_exists(target_real))
        {
            throw Error(ErrorCode::GenericFailure, "the target already exists");
        }
        fs.rename(source_real, target_real);
        spdlog::info("{} renamed \"{}\" to \"{}\"", connection_->log_prefix(), source_path, target_path);
    }

    std::string SftpServer::readlink(const std::string &path)
    {
        const auto virtual_path = vpath::clean(path);
        require(permission::kList, vpath::dir(virtual_path));
        auto &fs = connection_->fs();
        const auto target = fs.readlink(fs.resolve_path(virtual_path));
        if (target.is_absolute())
        {
            return fs.relative_path(target);
        }
        return target.generic_string();
    }

    void SftpServer::symlink(const std::string &target, const std::string &link)
    {
        const auto link_path = vpath::clean(link);
        const auto target_path = target.starts_with('/') ? vpath::clean(target)
                                                         : vpath::join(vpath::dir(link_path), target);
        require(permission::kCreateSymlinks, vpath::dir(link_path));
        auto &fs = connection_->fs();
        fs.symlink(fs.resolve_path(target_path), fs.resolve_path(link_path));
    }

    SftpServer::Handle &SftpServer::find_handle(const std::string &handle)
    {
        const auto it = handles_.find(handle);
        if (it == handles_.end())
        {
            throw Error(ErrorCode::GenericFailure, "invalid handle");
        }
        return it->second;
    }

    std::string SftpServer::add_handle(Handle handle)
    {
        auto name = std::to_string(next_handle_++);
        handles_.emplace(name, std::move(handle));
        return name;
    }

    void SftpServer::require(std::string_view permission, const std::string &virtual_path) const
    {
        if (!connection_->user().has_perm(permission, virtual_path))
        {
            spdlog::warn("{} permission \"{}\" denied for \"{}\"", connection_->log_prefix(), permission, virtual_path);
            throw Error(ErrorCode::PermissionDenied);
        }
    }

    std::optional<FileInfo> SftpServer::lstat_if_exists(const std::filesystem::path &path) const
    {
        try
        {
            return connection_->fs().lstat(path);
        }
        catch (const Error &error)
        {
            if (error.code() == ErrorCode::NotFound)
            {
                return std::nullopt;
            }
            throw;
        }
    }

    SftpSubsystem::SftpSubsystem(ssh_session session, ssh_channel channel, std::shared_ptr<Connection> connection,
                                 std::mutex &session_mutex, const std::atomic<bool> &closing)
        : channel_(channel),
          connection_(connection),
          session_mutex_(session_mutex),
          closing_(closing),
          server_(std::move(connection))
    {
        {
            std::lock_guard lock(session_mutex_);
            sftp_.reset(::sftp_server_new(session, channel));
            if (!sftp_)
            {
                ::ssh_channel_free(channel);
            }
        }
        if (!sftp_)
        {
            throw Error(ErrorCode::GenericFailure,
                        std::string("unable to create the sftp session: ") + ::ssh_get_error(session));
        }
    }

    SftpSubsystem::~SftpSubsystem()
    {
        server_.close_all_handles();
        std::lock_guard lock(session_mutex_);
        // Also frees the channel.
        sftp_.reset();
    }

    void SftpSubsystem::serve(std::chrono::seconds idle_timeout)
    {
        if (!wait_for_request(idle_timeout))
        {
            return;
        }
        {
            std::lock_guard lock(session_mutex_);
            // Reads SSH_FXP_INIT and answers with our version.
            if (::sftp_server_init(sftp_.get()) != SSH_OK)
            {
                throw Error(ErrorCode::GenericFailure, "sftp init failed");
            }
        }
        spdlog::debug("{} sftp session initialized, client version {}", connection_->log_prefix(),
                      sftp_->client_version);

        while (wait_for_request(idle_timeout))
        {
            std::lock_guard lock(session_mutex_);
            // Null on EOF, on a malformed or oversized packet and on unhandled message types.
            std::unique_ptr<std::remove_pointer_t<sftp_client_message>, decltype(&::sftp_client_message_free)> message(
                ::sftp_get_client_message(sftp_.get()), ::sftp_client_message_free);
            if (!message)
            {
                break;
            }
            connection_->update_last_activity();
            if (process(message.get()) != SSH_OK)
            {
                spdlog::warn("{} unable to send the sftp reply", connection_->log_prefix());
                break;
            }
        }
        spdlog::debug("{} sftp channel closed", connection_->log_prefix());
        server_.close_all_handles();
    }

    bool SftpSubsystem::wait_for_request(std::chrono::seconds idle_timeout)
    {
        for (;;)
        {
            if (closing_.load())
            {
                return false;
            }
            int available = 0;
            {
                std::lock_guard lock(session_mutex_);
                available = ::ssh_channel_poll_timeout(channel_, kPollTimeoutMs, 0);
            }
            if (available == SSH_ERROR || available == SSH_EOF)
            {
                return false;
            }
            if (available > 0)
            {
                return true;
            }
            if (idle_timeout.count() > 0 &&
                std::chrono::system_clock::now() - connection_->last_activity() > idle_timeout)
            {
                spdlog::info("{} idle timeout, closing the sftp channel", connection_->log_prefix());
                return false;
            }
        }
    }

    int SftpSubsystem::process(sftp_client_message message)
    {
        try
        {
            return dispatch(message);
        }
        catch (const Error &error)
        {
            spdlog::debug("{} sftp request type {} failed: {}", connection_->log_prefix(),
                          static_cast<int>(::sftp_client_message_get_type(message)), error.what());
            return ::sftp_reply_status(message, sftp::status_from_error(error.code()), error.what());
        }
    }

    int SftpSubsystem::dispatch(sftp_client_message message)
    {
        switch (::sftp_client_message_get_type(message))
        {
        case SSH_FXP_OPEN:
            return reply_handle(message, server_.open(filename_of(message), ::sftp_client_message_get_flags(message)));
        case SSH_FXP_CLOSE:
            server_.close(string_of(message->handle));
            return ::sftp_reply_status(message, SSH_FX_OK, "OK");
        case SSH_FXP_READ:
        {
            std::vector<std::uint8_t> buffer(std::min(message->len, kMaxReadLength));
            const auto count = server_.read(string_of(message->handle), message->offset, buffer);
            if (count == 0 && !buffer.empty())
            {
                return ::sftp_reply_status(message, SSH_FX_EOF, "EOF");
            }
            return ::sftp_reply_data(message, buffer.data(), static_cast<int>(count));
        }
        case SSH_FXP_WRITE:
        {
            if (message->data == nullptr)
            {
                throw Error(ErrorCode::SyntaxError, "missing write data");
            }
            const auto *data = static_cast<const std::uint8_t *>(::ssh_string_data(message->data));
            server_.write(string_of(message->handle), message->offset,
                          std::span<const std::uint8_t>(data, ::ssh_string_len(message->data)));
            return ::sftp_reply_status(message, SSH_FX_OK, "OK");
        }
        case SSH_FXP_LSTAT:
            return reply_info(message, server_.stat(filename_of(message), false));
        case SSH_FXP_STAT:
            return reply_info(message, server_.stat(filename_of(message), true));
        case SSH_FXP_FSTAT:
            return reply_info(message, server_.fstat(string_of(message->handle)));
        case SSH_FXP_SETSTAT:
            server_.setstat(filename_of(message), attributes_of(message));
            return ::sftp_reply_status(message, SSH_FX_OK, "OK");
        case SSH_FXP_FSETSTAT:
            server_.fsetstat(string_of(message->handle), attributes_of(message));
            return ::sftp_reply_status(message, SSH_FX_OK, "OK");
        case SSH_FXP_OPENDIR:
            return reply_handle(message, server_.opendir(filename_of(message)));
        case SSH_FXP_READDIR:
        {
            const auto entries = server_.readdir(string_of(message->handle));
            if (entries.empty())
            {
                return ::sftp_reply_status(message, SSH_FX_EOF, "EOF");
            }
            for (const auto &info : entries)
            {
                auto attrs = sftp::attributes_from_info(info);
                ::sftp_reply_names_add(message, info.name.c_str(), sftp::long_name(info).c_str(), &attrs);
            }
            return ::sftp_reply_names(message);
        }
        case SSH_FXP_REMOVE:
            server_.remove(filename_of(message));
            return ::sftp_reply_status(message, SSH_FX_OK, "OK");
        case SSH_FXP_MKDIR:
            server_.mkdir(filename_of(message));
            return ::sftp_reply_status(message, SSH_FX_OK, "OK");
        case SSH_FXP_RMDIR:
            server_.rmdir(filename_of(message));
            return ::sftp_reply_status(message, SSH_FX_OK, "OK");
        case SSH_FXP_REALPATH:
            return reply_single_name(message, server_.realpath(filename_of(message)));
        case SSH_FXP_RENAME:
            server_.rename(filename_of(message), second_path_of(message));
            return ::sftp_reply_status(message, SSH_FX_OK, "OK");
        case SSH_FXP_READLINK:
            return reply_single_name(message, server_.readlink(filename_of(message)));
        case SSH_FXP_SYMLINK:
            // OpenSSH sends the target first.
            server_.symlink(filename_of(message), second_path_of(message));
            return ::sftp_reply_status(message, SSH_FX_OK, "OK");
        default:
            return ::sftp_reply_status(message, SSH_FX_OP_UNSUPPORTED, "operation unsupported");
        }
    }

    int SftpSubsystem::reply_handle(sftp_client_message message, const std::string &handle)
    {
        std::unique_ptr<std::remove_pointer_t<ssh_string>, decltype(&::ssh_string_free)> value(
            ::ssh_string_from_char(handle.c_str()), ::ssh_string_free);
        if (!value)
        {
            throw Error(ErrorCode::GenericFailure, "unable to allocate the handle");
        }
        return ::sftp_reply_handle(message, value.get());
    }

    int SftpSubsystem::reply_info(sftp_client_message message, const FileInfo &info)
    {
        auto attrs = sftp::attributes_from_info(info);
        return ::sftp_reply_attr(message, &attrs);
    }

    int SftpSubsystem::reply_single_name(sftp_client_message message, const std::string &name)
    {
        sftp_attributes_struct attrs{};
        return ::sftp_reply_name(message, name.c_str(), &attrs);
    }

} // namespace sftpgate::server
