#include "sftpgate/server/scp.hpp"

#include <algorithm>
#include <charconv>

#include <spdlog/spdlog.h>

#include "sftpgate/server/command_line.hpp"
#include "sftpgate/server/vpath.hpp"

namespace sftpgate::server
{

    namespace
    {

        constexpr std::size_t kNoParent = static_cast<std::size_t>(-1);

        std::vector<std::string_view> split_n(std::string_view line, char separator, std::size_t max_parts)
        {
            std::vector<std::string_view> parts;
            while (parts.size() + 1 < max_parts)
            {
                const auto pos = line.find(separator);
                if (pos == std::string_view::npos)
                {
                    break;
                }
                parts.push_back(line.substr(0, pos));
                line.remove_prefix(pos + 1);
            }
            parts.push_back(line);
            return parts;
        }

        template <typename T>
        bool parse_number(std::string_view text, T &value)
        {
            if (text.empty())
            {
                return false;
            }
            const auto *end = text.data() + text.size();
            const auto [ptr, ec] = std::from_chars(text.data(), end, value);
            return ec == std::errc() && ptr == end;
        }

        std::span<const std::uint8_t> as_bytes(std::string_view text)
        {
            return {reinterpret_cast<const std::uint8_t *>(text.data()), text.size()};
        }

        std::int64_t to_unix_seconds(std::chrono::system_clock::time_point time)
        {
            return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
        }

    } // namespace

    ScpMessage parse_scp_message(std::string_view line)
    {
        if (line.empty())
        {
            throw Error(ErrorCode::SyntaxError, "unknown or invalid upload message");
        }
        ScpMessage message;
        switch (line.front())
        {
        case 'E':
            message.kind = ScpMessageKind::EndDirectory;
            return message;
        case 'T':
        {
            const auto parts = split_n(line.substr(1), ' ', 4);
            if (parts.size() != 4 || !parse_number(parts[0], message.modified) ||
                !parse_number(parts[2], message.accessed))
            {
                throw Error(ErrorCode::SyntaxError, "invalid time message: " + std::string(line));
            }
            message.kind = ScpMessageKind::Timestamp;
            return message;
        }
        case 'C':
        case 'D':
            break;
        default:
            throw Error(ErrorCode::SyntaxError, "unknown or invalid upload message: " + std::string(line));
        }

        message.kind = line.front() == 'D' ? ScpMessageKind::Directory : ScpMessageKind::File;
        const auto parts = split_n(line, ' ', 3);
        if (parts.size() != 3)
        {
            throw Error(ErrorCode::SyntaxError, "unable to split upload message: " + std::string(line));
        }
        message.mode = std::string(parts[0].substr(1));
        if (!parse_number(parts[1], message.size))
        {
            throw Error(ErrorCode::SyntaxError, "invalid size in upload message: " + std::string(line));
        }
        message.name = std::string(parts[2]);
        if (message.name.empty())
        {
            throw Error(ErrorCode::SyntaxError, "error getting name from upload message, cannot be empty");
        }
        if (message.name == "." || message.name == ".." || message.name.find('/') != std::string::npos)
        {
            throw Error(ErrorCode::SyntaxError, "invalid name in upload message: " + message.name);
        }
        return message;
    }

    std::string file_mode_string(std::uint32_t mode, bool is_dir)
    {
        if ((mode & 07777u) == 0)
        {
            return is_dir ? "0755" : "0644";
        }
        unsigned leading = 0;
        if ((mode & S_ISUID) != 0)
        {
            leading += 2;
        }
        if ((mode & S_ISGID) != 0)
        {
            leading += 4;
        }
        if ((mode & S_ISVTX) != 0)
        {
            leading += 1;
        }
        const auto perm = mode & 0777u;
        std::string result(4, '0');
        result[0] = static_cast<char>('0' + leading);
        result[1] = static_cast<char>('0' + ((perm >> 6) & 07u));
        result[2] = static_cast<char>('0' + ((perm >> 3) & 07u));
        result[3] = static_cast<char>('0' + (perm & 07u));
        return result;
    }

    ScpCommand::ScpCommand(std::shared_ptr<Connection> connection, Channel &channel, ConnectionRegistry &registry,
                           std::vector<std::string> args)
        : connection_(std::move(connection)), channel_(channel), registry_(registry), args_(std::move(args))
    {
    }

    std::string ScpCommand::dest_path() const
    {
        if (args_.empty())
        {
            return "";
        }
        return clean_command_path(args_.back());
    }

    std::string ScpCommand::command_type() const
    {
        if (args_.size() < 2)
        {
            return "";
        }
        return args_[args_.size() - 2];
    }

    bool ScpCommand::is_recursive() const
    {
        return std::find(args_.begin(), args_.end(), "-r") != args_.end();
    }

    bool ScpCommand::send_file_time() const
    {
        return std::find(args_.begin(), args_.end(), "-p") != args_.end();
    }

    void ScpCommand::handle()
    {
        ConnectionGuard guard(registry_, connection_);
        try
        {
            run();
        }
        catch (const Error &)
        {
            throw;
        }
        catch (const std::exception &ex)
        {
            spdlog::error("{} scp command recovered from unexpected error: {}", connection_->log_prefix(), ex.what());
            throw Error(ErrorCode::GenericFailure, "unexpected error handling scp command");
        }
    }

    void ScpCommand::run()
    {
        connection_->update_last_activity();
        const auto dest = dest_path();
        const auto type = command_type();
        spdlog::debug("{} handle scp command, args: {} user: {}, dest path: \"{}\"", connection_->log_prefix(),
                      join_args(args_), connection_->user().username, dest);

        std::optional<Error> failure;
        try
        {
            if (type == "-t")
            {
                send_confirmation_message();
                handle_recursive_upload();
            }
            else if (type == "-f")
            {
                read_confirmation_message();
                handle_download(dest);
            }
            else
            {
                failure = Error(ErrorCode::Unsupported, "scp command not supported, args: " + join_args(args_));
            }
        }
        catch (const Error &error)
        {
            failure = error;
        }

        send_exit_status(failure);
        if (failure)
        {
            throw *failure;
        }
    }

    void ScpCommand::handle_recursive_upload()
    {
        std::vector<DirectoryFrame> frames{DirectoryFrame{.virtual_path = dest_path(), .parent = kNoParent}};
        std::size_t current = 0;

        while (true)
        {
            const auto line = next_upload_protocol_message();
            if (!line)
            {
                return;
            }
            if (line->starts_with('E'))
            {
                if (frames[current].parent == kNoParent)
                {
                    fail(Error(ErrorCode::SyntaxError, "unacceptable end dir command"));
                }
                current = frames[current].parent;
                frames.pop_back();
            }
            else
            {
                const auto message = parse_upload_message(*line);
                if (message.kind == ScpMessageKind::Directory)
                {
                    frames.push_back(DirectoryFrame{
                        .virtual_path = vpath::join(frames[current].virtual_path, message.name),
                        .parent = current,
                    });
                    current = frames.size() - 1;
                    pending_times_.reset();
                    handle_create_dir(frames[current].virtual_path);
                }
                else
                {
                    handle_upload(file_upload_dest_path(frames[current].virtual_path, message.name), message.size);
                }
            }
            send_confirmation_message();
        }
    }

    std::optional<std::string> ScpCommand::next_upload_protocol_message()
    {
        while (true)
        {
            auto line = read_protocol_message();
            if (!line || !line->starts_with('T'))
            {
                return line;
            }
            try
            {
                pending_times_ = parse_scp_message(*line);
            }
            catch (const Error &error)
            {
                fail(error);
            }
            send_confirmation_message();
        }
    }

    ScpMessage ScpCommand::parse_upload_message(const std::string &line)
    {
        ScpMessage message;
        try
        {
            message = parse_scp_message(line);
        }
        catch (const Error &error)
        {
            fail(error);
        }
        if (message.kind != ScpMessageKind::Directory && message.kind != ScpMessageKind::File)
        {
            fail(Error(ErrorCode::SyntaxError, "unknown or invalid upload message: " + line));
        }
        return message;
    }

    std::string ScpCommand::file_upload_dest_path(const std::string &scp_dest_path, const std::string &file_name) const
    {
        if (is_recursive() || vpath::has_trailing_slash(scp_dest_path))
        {
            return vpath::join(scp_dest_path, file_name);
        }
        // "scp file host:/existing_dir" uploads inside the directory.
        try
        {
            const auto real = connection_->fs().resolve_path(scp_dest_path);
            if (connection_->fs().stat(real).is_dir())
            {
                return vpath::join(scp_dest_path, file_name);
            }
        }
        catch (const Error &error)
        {
            spdlog::debug("{} upload destination \"{}\" is not an existing directory: {}", connection_->log_prefix(),
                          scp_dest_path, error.what());
        }
        return scp_dest_path;
    }

    void ScpCommand::handle_create_dir(const std::string &virtual_path)
    {
        connection_->update_last_activity();
        std::filesystem::path real;
        try
        {
            real = connection_->fs().resolve_path(virtual_path);
        }
        catch (const Error &error)
        {
            fail(error);
        }
        if (!connection_->user().has_perm(permission::kCreateDirs, vpath::dir(virtual_path)))
        {
            spdlog::warn("{} error creating dir \"{}\": permission denied", connection_->log_prefix(), virtual_path);
            fail(Error(ErrorCode::PermissionDenied));
        }
        try
        {
            const auto existing = lstat_if_exists(real);
            if (existing && existing->is_dir())
            {
                return;
            }
            connection_->fs().mkdir(real);
        }
        catch (const Error &error)
        {
            spdlog::warn("{} error creating dir \"{}\": {}", connection_->log_prefix(), virtual_path, error.what());
            fail(error);
        }
    }

    void ScpCommand::handle_upload(const std::string &virtual_path, std::uint64_t size)
    {
        connection_->update_last_activity();
        const auto &user = connection_->user();
        auto &fs = connection_->fs();

        if (!user.is_file_allowed(virtual_path))
        {
            spdlog::warn("{} writing file \"{}\" is not allowed", connection_->log_prefix(), virtual_path);
            fail(Error(ErrorCode::PermissionDenied));
        }

        std::filesystem::path real;
        std::optional<FileInfo> existing;
        try
        {
            real = fs.resolve_path(virtual_path);
            existing = lstat_if_exists(real);
        }
        catch (const Error &error)
        {
            fail(error);
        }
        const auto file_path = connection_->is_atomic_upload_enabled() ? fs.atomic_upload_path(real) : real;

        if (!existing || existing->is_symlink())
        {
            if (!user.has_perm(permission::kUpload, vpath::dir(virtual_path)))
            {
                spdlog::warn("{} cannot upload file \"{}\": permission denied", connection_->log_prefix(), virtual_path);
                fail(Error(ErrorCode::PermissionDenied));
            }
            handle_upload_file(real, file_path, size, true, 0, virtual_path);
            return;
        }
        if (existing->is_dir())
        {
            fail(Error(ErrorCode::GenericFailure, "attempted to open a directory for writing to: \"" + virtual_path + "\""));
        }
        if (!user.has_perm(permission::kOverwrite, virtual_path))
        {
            spdlog::warn("{} cannot overwrite file \"{}\": permission denied", connection_->log_prefix(), virtual_path);
            fail(Error(ErrorCode::PermissionDenied));
        }
        handle_upload_file(real, file_path, size, false, static_cast<std::int64_t>(existing->size), virtual_path);
    }

    void ScpCommand::handle_upload_file(const std::filesystem::path &resolved_path, const std::filesystem::path &file_path,
                                        std::uint64_t size, bool is_new_file, std::int64_t file_size,
                                        const std::string &request_path)
    {
        auto &fs = connection_->fs();
        const auto quota = connection_->has_space(is_new_file, false, request_path);
        if (!quota.has_space)
        {
            spdlog::warn("{} error uploading file \"{}\": quota exceeded", connection_->log_prefix(), request_path);
            fail(Error(ErrorCode::QuotaExceeded, "denying file write due to quota limits"));
        }

        std::int64_t max_write_size = 0;
        CreateResult created;
        try
        {
            max_write_size = connection_->max_write_size(quota, false, file_size);
            created = fs.create(file_path, CreateOptions{.truncate = true});
        }
        catch (const Error &error)
        {
            spdlog::error("{} error creating file \"{}\": {}", connection_->log_prefix(), resolved_path.string(),
                          error.what());
            fail(error);
        }

        const bool atomic = file_path != resolved_path;
        std::int64_t initial_size = 0;
        if (!is_new_file)
        {
            if (fs.is_local() && !atomic)
            {
                // The truncated file no longer counts.
                connection_->update_quota(request_path, 0, -file_size);
            }
            else
            {
                initial_size = file_size;
            }
        }

        Transfer transfer(*connection_, TransferParams{
                                            .file = std::move(created.file),
                                            .writer = std::move(created.writer),
                                            .cancel = std::move(created.cancel),
                                            .fs_path = resolved_path,
                                            .request_path = request_path,
                                            .type = TransferType::Upload,
                                            .initial_size = initial_size,
                                            .max_write_size = max_write_size,
                                            .is_new_file = is_new_file,
                                            .expected_size = size,
                                        });
        get_upload_file_data(size, transfer);
        apply_pending_times(resolved_path, request_path);
    }

    void ScpCommand::get_upload_file_data(std::uint64_t size, Transfer &transfer)
    {
        try
        {
            send_confirmation_message();
        }
        catch (const Error &error)
        {
            transfer.transfer_error(error);
            close_after_error(transfer);
            throw;
        }

        if (size > 0)
        {
            std::vector<std::uint8_t> buffer(std::min<std::uint64_t>(size, kCopyBufferSize));
            std::uint64_t offset = 0;
            while (offset < size)
            {
                std::size_t count = 0;
                try
                {
                    count = channel_.read(buffer);
                    if (count == 0)
                    {
                        throw Error(ErrorCode::Eof, "unexpected EOF reading file data");
                    }
                }
                catch (const Error &error)
                {
                    send_error_message(error.what());
                    transfer.transfer_error(error);
                    close_after_error(transfer);
                    throw;
                }
                try
                {
                    transfer.write_at(std::span<const std::uint8_t>(buffer.data(), count), offset);
                }
                catch (const Error &error)
                {
                    send_error_message(error.what());
                    close_after_error(transfer);
                    throw;
                }
                offset += count;
                const auto remaining = size - offset;
                if (remaining > 0 && remaining < buffer.size())
                {
                    buffer.resize(static_cast<std::size_t>(remaining));
                }
            }
        }

        try
        {
            read_confirmation_message();
        }
        catch (const Error &error)
        {
            transfer.transfer_error(error);
            close_after_error(transfer);
            throw;
        }

        try
        {
            transfer.close();
        }
        catch (const Error &error)
        {
            fail(error);
        }
    }

    void ScpCommand::apply_pending_times(const std::filesystem::path &real_path, const std::string &virtual_path)
    {
        if (!pending_times_)
        {
            return;
        }
        const auto times = *pending_times_;
        pending_times_.reset();
        if (!send_file_time() || !connection_->user().has_perm(permission::kChtimes, vpath::dir(virtual_path)))
        {
            return;
        }
        try
        {
            connection_->fs().chtimes(real_path,
                                      std::chrono::system_clock::time_point(std::chrono::seconds(times.accessed)),
                                      std::chrono::system_clock::time_point(std::chrono::seconds(times.modified)));
        }
        catch (const Error &error)
        {
            spdlog::warn("{} unable to set times for \"{}\": {}", connection_->log_prefix(), virtual_path, error.what());
        }
    }

    void ScpCommand::handle_download(const std::string &virtual_path)
    {
        std::vector<DownloadItem> pending{DownloadItem{.virtual_path = virtual_path, .end_of_directory = false}};
        while (!pending.empty())
        {
            const auto item = std::move(pending.back());
            pending.pop_back();
            if (item.end_of_directory)
            {
                send_protocol_message("E\n");
                read_confirmation_message();
                continue;
            }
            download_entry(item.virtual_path, pending);
        }
    }

    void ScpCommand::download_entry(const std::string &virtual_path, std::vector<DownloadItem> &pending)
    {
        connection_->update_last_activity();
        const auto &user = connection_->user();
        auto &fs = connection_->fs();

        std::filesystem::path real;
        FileInfo info;
        try
        {
            real = fs.resolve_path(virtual_path);
            info = fs.stat(real);
        }
        catch (const Error &error)
        {
            spdlog::warn("{} error downloading \"{}\": {}", connection_->log_prefix(), virtual_path, error.what());
            fail(error);
        }

        if (!info.is_dir())
        {
            if (!user.has_perm(permission::kDownload, vpath::dir(virtual_path)))
            {
                spdlog::warn("{} error downloading file \"{}\": permission denied", connection_->log_prefix(), virtual_path);
                fail(Error(ErrorCode::PermissionDenied));
            }
            if (!user.is_file_allowed(virtual_path))
            {
                spdlog::warn("{} reading file \"{}\" is not allowed", connection_->log_prefix(), virtual_path);
                fail(Error(ErrorCode::PermissionDenied));
            }
            send_download_file(virtual_path, real, info);
            return;
        }

        if (!user.has_perm(permission::kDownload, virtual_path))
        {
            spdlog::warn("{} error downloading dir \"{}\": permission denied", connection_->log_prefix(), virtual_path);
            fail(Error(ErrorCode::PermissionDenied));
        }
        if (!is_recursive())
        {
            fail(Error(ErrorCode::GenericFailure, "unable to send directory for non recursive copy"));
        }

        if (send_file_time())
        {
            send_protocol_message("T" + std::to_string(to_unix_seconds(info.modified)) + " 0 " +
                                  std::to_string(to_unix_seconds(info.accessed)) + " 0\n");
            read_confirmation_message();
        }
        send_protocol_message("D" + file_mode_string(info.mode, true) + " 0 " + vpath::base(virtual_path) + "\n");
        read_confirmation_message();

        std::vector<FileInfo> entries;
        try
        {
            entries = fs.read_dir(real);
        }
        catch (const Error &error)
        {
            fail(error);
        }
        for (const auto &name : user.virtual_dirs_in(virtual_path))
        {
            const auto duplicate = std::any_of(entries.begin(), entries.end(), [&name](const FileInfo &entry)
                                               { return entry.name == name; });
            if (!duplicate)
            {
                FileInfo folder_info;
                folder_info.name = name;
                folder_info.mode = S_IFDIR | 0755u;
                entries.push_back(folder_info);
            }
        }

        // Files are sent before directories; the stack pops in reverse order.
        pending.push_back(DownloadItem{.virtual_path = virtual_path, .end_of_directory = true});
        std::vector<std::string> files;
        std::vector<std::string> dirs;
        for (const auto &entry : entries)
        {
            const auto child = vpath::join(virtual_path, entry.name);
            if (entry.is_dir())
            {
                dirs.push_back(child);
            }
            else if (entry.is_regular() || entry.is_symlink())
            {
                files.push_back(child);
            }
        }
        std::sort(files.begin(), files.end());
        std::sort(dirs.begin(), dirs.end());
        for (auto it = dirs.rbegin(); it != dirs.rend(); ++it)
        {
            pending.push_back(DownloadItem{.virtual_path = *it, .end_of_directory = false});
        }
        for (auto it = files.rbegin(); it != files.rend(); ++it)
        {
            pending.push_back(DownloadItem{.virtual_path = *it, .end_of_directory = false});
        }
    }

    void ScpCommand::send_download_file(const std::string &virtual_path, const std::filesystem::path &real_path,
                                        const FileInfo &info)
    {
        OpenResult opened;
        try
        {
            opened = connection_->fs().open(real_path, 0);
        }
        catch (const Error &error)
        {
            spdlog::error("{} could not open file \"{}\" for reading: {}", connection_->log_prefix(),
                          real_path.string(), error.what());
            fail(error);
        }

        Transfer transfer(*connection_, TransferParams{
                                            .file = std::move(opened.file),
                                            .reader = std::move(opened.reader),
                                            .cancel = std::move(opened.cancel),
                                            .fs_path = real_path,
                                            .request_path = virtual_path,
                                            .type = TransferType::Download,
                                        });
        try
        {
            send_download_file_data(virtual_path, info, transfer);
        }
        catch (const Error &error)
        {
            transfer.transfer_error(error);
            close_after_error(transfer);
            throw;
        }
        transfer.close();
    }

    void ScpCommand::send_download_file_data(const std::string &virtual_path, const FileInfo &info, Transfer &transfer)
    {
        if (send_file_time())
        {
            send_protocol_message("T" + std::to_string(to_unix_seconds(info.modified)) + " 0 " +
                                  std::to_string(to_unix_seconds(info.accessed)) + " 0\n");
            read_confirmation_message();
        }
        send_protocol_message("C" + file_mode_string(info.mode, false) + " " + std::to_string(info.size) + " " +
                              vpath::base(virtual_path) + "\n");
        read_confirmation_message();

        std::vector<std::uint8_t> buffer(kCopyBufferSize);
        std::uint64_t offset = 0;
        while (true)
        {
            const auto count = transfer.read_at(buffer, offset);
            if (count == 0)
            {
                break;
            }
            write_all(channel_, std::span<const std::uint8_t>(buffer.data(), count));
            offset += count;
        }
        send_confirmation_message();
        read_confirmation_message();
    }

    void ScpCommand::read_confirmation_message()
    {
        std::uint8_t code = 0;
        std::size_t count = 0;
        try
        {
            count = channel_.read(std::span<std::uint8_t>(&code, 1));
        }
        catch (const Error &)
        {
            channel_.close();
            throw;
        }
        if (count == 0)
        {
            channel_.close();
            throw Error(ErrorCode::Eof, "EOF");
        }
        if (code != kScpOk)
        {
            const auto message = read_protocol_message();
            channel_.close();
            throw Error(ErrorCode::GenericFailure, message.value_or("unexpected confirmation message"));
        }
    }

    std::optional<std::string> ScpCommand::read_protocol_message()
    {
        std::string line;
        std::uint8_t c = 0;
        while (true)
        {
            std::size_t count = 0;
            try
            {
                count = channel_.read(std::span<std::uint8_t>(&c, 1));
            }
            catch (const Error &)
            {
                channel_.close();
                throw;
            }
            if (count == 0)
            {
                return std::nullopt;
            }
            if (c == '\n')
            {
                return line;
            }
            line.push_back(static_cast<char>(c));
        }
    }

    void ScpCommand::send_confirmation_message()
    {
        const std::uint8_t ok = kScpOk;
        try
        {
            write_all(channel_, std::span<const std::uint8_t>(&ok, 1));
        }
        catch (const Error &)
        {
            channel_.close();
            throw;
        }
    }

    void ScpCommand::send_protocol_message(std::string_view message)
    {
        try
        {
            write_all(channel_, as_bytes(message));
        }
        catch (const Error &error)
        {
            spdlog::warn("{} error sending protocol message: {}, err: {}", connection_->log_prefix(), message,
                         error.what());
            channel_.close();
            throw;
        }
    }

    void ScpCommand::send_error_message(std::string_view message)
    {
        std::string payload;
        payload.push_back(static_cast<char>(kScpError));
        payload.append(message);
        payload.push_back('\n');
        try
        {
            write_all(channel_, as_bytes(payload));
        }
        catch (const Error &error)
        {
            spdlog::warn("{} unable to send error message: {}", connection_->log_prefix(), error.what());
        }
        try
        {
            channel_.close();
        }
        catch (const Error &error)
        {
            spdlog::debug("{} unable to close channel: {}", connection_->log_prefix(), error.what());
        }
    }

    void ScpCommand::send_exit_status(const std::optional<Error> &error)
    {
        const std::uint32_t status = error ? 1 : 0;
        if (error)
        {
            spdlog::warn("{} command failed: scp {}, user: {}, error: {}", connection_->log_prefix(), join_args(args_),
                         connection_->user().username, error->what());
        }
        try
        {
            channel_.send_exit_status(status);
            channel_.close();
        }
        catch (const Error &ex)
        {
            spdlog::debug("{} unable to send exit status: {}", connection_->log_prefix(), ex.what());
        }
    }

    std::optional<FileInfo> ScpCommand::lstat_if_exists(const std::filesystem::path &path) const
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

    void ScpCommand::fail(const Error &error)
    {
        send_error_message(error.what());
        throw error;
    }

    void ScpCommand::close_after_error(Transfer &transfer)
    {
        try
        {
            transfer.close();
        }
        catch (const Error &error)
        {
            spdlog::debug("{} transfer closed with error: {}", connection_->log_prefix(), error.what());
        }
    }

} // namespace sftpgate::server
