#include "sftpgate/server/ssh_command.hpp"

#include <algorithm>
#include <array>
#include <mutex>
#include <thread>
#include <tuple>

#include <spdlog/spdlog.h>

#include "sftpgate/server/process.hpp"
#include "sftpgate/server/scp.hpp"
#include "sftpgate/server/transfer.hpp"
#include "sftpgate/server/vpath.hpp"

namespace sftpgate::server
{

    namespace
    {

        constexpr std::string_view kUnsupportedConfig = "unsupported configuration";
        constexpr std::size_t kHashStdinLimit = 4096;

        struct CommandEntry
        {
            std::string_view name;
            CommandKind kind;
            std::optional<digest::Algorithm> algorithm;
        };

        constexpr std::array<CommandEntry, 14> kCommands{{
            {"scp", CommandKind::Scp, std::nullopt},
            {"md5sum", CommandKind::Hash, digest::Algorithm::Md5},
            {"sha1sum", CommandKind::Hash, digest::Algorithm::Sha1},
            {"sha256sum", CommandKind::Hash, digest::Algorithm::Sha256},
            {"sha384sum", CommandKind::Hash, digest::Algorithm::Sha384},
            {"sha512sum", CommandKind::Hash, digest::Algorithm::Sha512},
            {"cd", CommandKind::ChangeDir, std::nullopt},
            {"pwd", CommandKind::PrintDir, std::nullopt},
            {"git-receive-pack", CommandKind::GitReceivePack, std::nullopt},
            {"git-upload-pack", CommandKind::GitUploadPack, std::nullopt},
            {"git-upload-archive", CommandKind::GitUploadArchive, std::nullopt},
            {"rsync", CommandKind::Rsync, std::nullopt},
            {"sftpgo-copy", CommandKind::Copy, std::nullopt},
            {"sftpgo-remove", CommandKind::Remove, std::nullopt},
        }};

        bool paths_intersect(std::string_view a, std::string_view b)
        {
            return vpath::is_within(a, b) || vpath::is_within(b, a);
        }

        std::string hash_from_filesystem(Filesystem &fs, digest::Algorithm algorithm, const std::filesystem::path &path)
        {
            if (fs.is_local())
            {
                return digest::hash_file(algorithm, path);
            }
            auto opened = fs.open(path, 0);
            digest::Digest digest(algorithm);
            std::vector<std::uint8_t> buffer(kCopyBufferSize);
            std::uint64_t offset = 0;
            while (true)
            {
                const auto count = opened.file ? opened.file->read_at(buffer, offset) : opened.reader->read(buffer);
                if (count == 0)
                {
                    break;
                }
                digest.update(std::span<const std::uint8_t>(buffer.data(), count));
                offset += count;
            }
            if (opened.file)
            {
                opened.file->close();
            }
            else
            {
                opened.reader->close();
            }
            return digest.final_hex();
        }

    } // namespace

    ClassifiedCommand classify_command(std::string_view name) noexcept
    {
        for (const auto &entry : kCommands)
        {
            if (entry.name == name)
            {
                return ClassifiedCommand{.kind = entry.kind, .algorithm = entry.algorithm};
            }
        }
        return ClassifiedCommand{};
    }

    const std::vector<std::string> &supported_ssh_commands()
    {
        static const std::vector<std::string> commands = []
        {
            std::vector<std::string> names;
            for (const auto &entry : kCommands)
            {
                names.emplace_back(entry.name);
            }
            return names;
        }();
        return commands;
    }

    bool is_command_enabled(std::string_view name, const std::vector<std::string> &enabled)
    {
        if (classify_command(name).kind == CommandKind::Unsupported)
        {
            return false;
        }
        return std::any_of(enabled.begin(), enabled.end(), [name](const std::string &entry)
                           { return entry == "*" || entry == name; });
    }

    void dispatch_exec_command(const std::shared_ptr<Connection> &connection, Channel &channel,
                               ConnectionRegistry &registry, const ParsedCommand &command)
    {
        connection->set_command(command.args.empty() ? command.name : command.name + " " + join_args(command.args));
        if (classify_command(command.name).kind == CommandKind::Scp)
        {
            connection->set_protocol(Protocol::Scp);
            ScpCommand scp(connection, channel, registry, command.args);
            scp.handle();
            return;
        }
        connection->set_protocol(Protocol::Ssh);
        SshCommand ssh(connection, channel, registry, command.name, command.args);
        ssh.handle();
    }

    SshCommand::SshCommand(std::shared_ptr<Connection> connection, Channel &channel, ConnectionRegistry &registry,
                           std::string command, std::vector<std::string> args)
        : connection_(std::move(connection)),
          channel_(channel),
          registry_(registry),
          command_(std::move(command)),
          args_(std::move(args))
    {
    }

    std::string SshCommand::dest_path() const
    {
        if (args_.empty())
        {
            return "";
        }
        return clean_command_path(args_.back());
    }

    std::string SshCommand::source_path() const
    {
        if (args_.size() != 2)
        {
            return "";
        }
        return clean_command_path(args_.front());
    }

    void SshCommand::handle()
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
            spdlog::error("{} command \"{}\" recovered from unexpected error: {}", connection_->log_prefix(), command_,
                          ex.what());
            throw Error(ErrorCode::GenericFailure, "unexpected error handling ssh command");
        }
    }

    void SshCommand::run()
    {
        connection_->update_last_activity();
        spdlog::debug("{} handle ssh command {} args: {} user: {}", connection_->log_prefix(), command_,
                      join_args(args_), connection_->user().username);

        const auto classified = classify_command(command_);
        switch (classified.kind)
        {
        case CommandKind::Hash:
            handle_hash_command(*classified.algorithm);
            return;
        case CommandKind::ChangeDir:
            send_exit_status(std::nullopt);
            return;
        case CommandKind::PrintDir:
            write_response("/\n");
            send_exit_status(std::nullopt);
            return;
        case CommandKind::Copy:
            handle_copy();
            return;
        case CommandKind::Remove:
            handle_remove();
            return;
        case CommandKind::Rsync:
        case CommandKind::GitReceivePack:
        case CommandKind::GitUploadPack:
        case CommandKind::GitUploadArchive:
        {
            SystemCommand command;
            try
            {
                command = system_command();
            }
            catch (const Error &error)
            {
                send_error_response(error);
            }
            execute_system_command(command);
            return;
        }
        case CommandKind::Scp:
        case CommandKind::Unsupported:
            break;
        }
        send_error_response(Error(ErrorCode::Unsupported, "unsupported command: " + command_));
    }

    void SshCommand::handle_hash_command(digest::Algorithm algorithm)
    {
        std::string response;
        if (args_.empty())
        {
            // Without arguments the data to hash comes from the channel.
            std::vector<std::uint8_t> buffer(kHashStdinLimit);
            std::size_t count = 0;
            try
            {
                count = channel_.read(buffer);
            }
            catch (const Error &error)
            {
                send_error_response(error);
            }
            response = digest::hash_bytes(algorithm, std::span<const std::uint8_t>(buffer.data(), count)) + "  -\n";
        }
        else
        {
            const auto path = dest_path();
            const auto &user = connection_->user();
            if (!user.is_file_allowed(path))
            {
                spdlog::info("{} hash not allowed for file \"{}\"", connection_->log_prefix(), path);
                send_error_response(Error(ErrorCode::PermissionDenied));
            }
            std::string hash;
            try
            {
                const auto fs_path = connection_->fs().resolve_path(path);
                if (!user.has_perm(permission::kList, path))
                {
                    throw Error(ErrorCode::PermissionDenied);
                }
                hash = hash_from_filesystem(connection_->fs(), algorithm, fs_path);
            }
            catch (const Error &error)
            {
                send_error_response(error);
            }
            response = hash + "  " + path + "\n";
        }
        write_response(response);
        send_exit_status(std::nullopt);
    }

    SystemCommand SshCommand::system_command() const
    {
        SystemCommand result;
        auto args = args_;
        const auto kind = classify_command(command_).kind;
        const auto &user = connection_->user();

        if (!args.empty())
        {
            const auto path = dest_path();
            result.fs_path = connection_->fs().resolve_path(path);
            result.quota_check_path = path;
            try
            {
                if (connection_->fs().stat(result.fs_path).is_dir())
                {
                    result.quota_check_path = vpath::join(path, "quota-check");
                }
            }
            catch (const Error &error)
            {
                if (error.code() != ErrorCode::NotFound)
                {
                    throw;
                }
            }

            auto real = result.fs_path.string();
            if (vpath::has_trailing_slash(path) && !real.ends_with('/'))
            {
                real.push_back('/');
            }
            args.back() = real;

            if (user.has_virtual_folders_inside(path))
            {
                spdlog::debug("{} command \"{}\" target \"{}\" contains virtual folders", connection_->log_prefix(),
                              command_, path);
                throw Error(ErrorCode::Unsupported, std::string(kUnsupportedConfig));
            }
            if (kind == CommandKind::Rsync)
            {
                for (const auto &folder : user.virtual_folders)
                {
                    if (paths_intersect(folder.virtual_path, path))
                    {
                        throw Error(ErrorCode::Unsupported, std::string(kUnsupportedConfig));
                    }
                }
            }
            for (const auto &filter : user.extension_filters)
            {
                if (paths_intersect(vpath::clean(filter.path), path))
                {
                    spdlog::debug("{} command \"{}\" target \"{}\" overlaps the extension filter on \"{}\"",
                                  connection_->log_prefix(), command_, path, filter.path);
                    throw Error(ErrorCode::Unsupported, std::string(kUnsupportedConfig));
                }
            }
        }

        if (kind == CommandKind::Rsync)
        {
            // rsync may create symlinks: keep them inside the tree, or make them unusable.
            const auto flag = user.has_perm(permission::kCreateSymlinks, dest_path()) ? "--safe-links" : "--munge-links";
            if (std::find(args.begin(), args.end(), flag) == args.end())
            {
                args.insert(args.begin(), flag);
            }
        }

        result.argv.reserve(args.size() + 1);
        result.argv.push_back(command_);
        result.argv.insert(result.argv.end(), args.begin(), args.end());
        return result;
    }

    void SshCommand::execute_system_command(const SystemCommand &command)
    {
        const auto path = dest_path();
        try
        {
            check_local_filesystem();
        }
        catch (const Error &error)
        {
            send_error_response(error);
        }

        const auto quota = connection_->has_space(true, false, command.quota_check_path);
        if (!quota.has_space)
        {
            send_error_response(Error(ErrorCode::QuotaExceeded));
        }
        const auto &user = connection_->user();
        if (!user.has_perms({permission::kDownload, permission::kUpload, permission::kCreateDirs, permission::kList,
                             permission::kOverwrite, permission::kDelete},
                            path))
        {
            send_error_response(Error(ErrorCode::PermissionDenied));
        }

        PathSize initial;
        std::unique_ptr<ChildProcess> process;
        try
        {
            initial = size_for_path(command.fs_path);
            process = std::make_unique<ChildProcess>(command.argv);
        }
        catch (const Error &error)
        {
            send_error_response(error);
        }
        spdlog::debug("{} command \"{}\" started, pid {}", connection_->log_prefix(), join_args(command.argv),
                      process->pid());

        std::once_flag kill_once;
        auto kill_on_error = [&]
        {
            std::call_once(kill_once, [&]
                           { process->kill(); });
        };
        const auto remaining_size = quota.remaining_size();

        std::thread stdin_thread([&]
                                 {
            try
            {
                Transfer transfer(*connection_, TransferParams{
                                                    .fs_path = command.fs_path,
                                                    .request_path = path,
                                                    .type = TransferType::Upload,
                                                    .max_write_size = remaining_size,
                                                });
                const auto result = transfer.copy_from_reader_to_writer(process->stdin_writer(), channel_);
                process->close_stdin();
                spdlog::debug("{} command stdin copy finished, written: {}, error: {}", connection_->log_prefix(),
                              result.written, result.error ? result.error->what() : "none");
                if (result.error)
                {
                    kill_on_error();
                }
            }
            catch (const std::exception &ex)
            {
                spdlog::error("{} command stdin copy failed: {}", connection_->log_prefix(), ex.what());
                kill_on_error();
            } });

        std::thread stderr_thread([&]
                                  {
            try
            {
                Transfer transfer(*connection_, TransferParams{
                                                    .fs_path = command.fs_path,
                                                    .request_path = path,
                                                    .type = TransferType::Download,
                                                });
                const auto result = transfer.copy_from_reader_to_writer(channel_.stderr_writer(), process->stderr_reader());
                if (result.error)
                {
                    spdlog::debug("{} command stderr copy failed: {}", connection_->log_prefix(), result.error->what());
                    kill_on_error();
                }
            }
            catch (const std::exception &ex)
            {
                spdlog::error("{} command stderr copy failed: {}", connection_->log_prefix(), ex.what());
                kill_on_error();
            } });

        std::optional<Error> failure;
        try
        {
            Transfer transfer(*connection_, TransferParams{
                                                .fs_path = command.fs_path,
                                                .request_path = path,
                                                .type = TransferType::Download,
                                            });
            const auto result = transfer.copy_from_reader_to_writer(channel_, process->stdout_reader());
            spdlog::debug("{} command stdout copy finished, written: {}, error: {}", connection_->log_prefix(),
                          result.written, result.error ? result.error->what() : "none");
            if (result.error)
            {
                kill_on_error();
            }
        }
        catch (const std::exception &ex)
        {
            spdlog::error("{} command stdout copy failed: {}", connection_->log_prefix(), ex.what());
            kill_on_error();
        }

        try
        {
            const auto exit_code = process->wait();
            if (exit_code != 0)
            {
                failure = Error(ErrorCode::GenericFailure, "exit status " + std::to_string(exit_code));
            }
        }
        catch (const Error &error)
        {
            failure = error;
        }
        stderr_thread.join();
        // Closing the channel here unblocks the stdin copy.
        send_exit_status(failure);
        stdin_thread.join();

        try
        {
            const auto final_size = size_for_path(command.fs_path);
            const auto files = final_size.files - initial.files;
            const auto size = final_size.size - initial.size;
            if (files != 0 || size != 0)
            {
                connection_->update_quota(command.quota_check_path, files, size);
            }
        }
        catch (const Error &error)
        {
            spdlog::warn("{} unable to update quota after command \"{}\": {}", connection_->log_prefix(), command_,
                         error.what());
        }

        if (failure)
        {
            throw *failure;
        }
    }

    PathSize SshCommand::size_for_path(const std::filesystem::path &fs_path) const
    {
        auto &fs = connection_->fs();
        FileInfo info;
        try
        {
            info = fs.lstat(fs_path);
        }
        catch (const Error &error)
        {
            if (error.code() == ErrorCode::NotFound)
            {
                return PathSize{};
            }
            throw;
        }
        if (info.is_dir())
        {
            const auto size = fs.dir_size(fs_path);
            return PathSize{.files = size.files, .size = size.size};
        }
        if (info.is_regular())
        {
            return PathSize{.files = 1, .size = static_cast<std::int64_t>(info.size)};
        }
        return PathSize{};
    }

    std::pair<std::string, std::string> SshCommand::copy_paths() const
    {
        auto source = source_path();
        if (source.size() > 1 && source.ends_with('/'))
        {
            source.pop_back();
        }
        auto dest = dest_path();
        if (!source.empty() && vpath::has_trailing_slash(dest))
        {
            dest = vpath::join(dest, vpath::base(source));
        }
        if (source.empty() || dest.empty() || args_.size() != 2)
        {
            throw Error(ErrorCode::SyntaxError, "usage sftpgo-copy <source dir path> <destination dir path>");
        }
        return {source, dest};
    }

    bool SshCommand::has_copy_permissions(const std::string &source_path, const std::string &dest_path,
                                          const FileInfo &source_info) const
    {
        const auto &user = connection_->user();
        const auto source_dir = vpath::dir(source_path);
        const auto dest_dir = vpath::dir(dest_path);
        if (!user.has_perms({permission::kList, permission::kDownload}, source_dir))
        {
            return false;
        }
        if (source_info.is_dir())
        {
            return user.has_perm(permission::kCreateDirs, dest_dir);
        }
        if (source_info.is_symlink())
        {
            return user.has_perm(permission::kCreateSymlinks, dest_dir);
        }
        return user.has_perm(permission::kUpload, dest_dir);
    }

    void SshCommand::check_recursive_copy_permissions(const std::filesystem::path &fs_source_path,
                                                      const std::filesystem::path &fs_dest_path,
                                                      const std::string &dest_path) const
    {
        const auto &user = connection_->user();
        auto &fs = connection_->fs();
        if (!user.has_perm(permission::kCreateDirs, vpath::dir(dest_path)))
        {
            throw Error(ErrorCode::PermissionDenied);
        }
        const auto source_prefix = fs_source_path.string();
        fs.walk(fs_source_path, [&](const std::filesystem::path &walked, const FileInfo &info)
                {
            const auto relative = walked.string().substr(source_prefix.size());
            const auto fs_dest_sub_path = std::filesystem::path(fs_dest_path.string() + relative);
            const auto source_sub_path = fs.relative_path(walked);
            const auto dest_sub_path = fs.relative_path(fs_dest_sub_path);
            // Nothing below overrides the permissions: no need to look further.
            if (!user.has_permissions_inside(vpath::dir(source_sub_path)) &&
                !user.has_permissions_inside(vpath::dir(dest_sub_path)) &&
                user.has_perm(permission::kList, vpath::dir(source_sub_path)) &&
                user.has_perms({permission::kCreateDirs, permission::kCreateSymlinks, permission::kUpload},
                               vpath::dir(dest_sub_path)))
            {
                return WalkAction::Stop;
            }
            if (!has_copy_permissions(source_sub_path, dest_sub_path, info))
            {
                throw Error(ErrorCode::PermissionDenied);
            }
            return WalkAction::Continue; });
    }

    void SshCommand::check_copy_destination(const std::filesystem::path &fs_dest_path) const
    {
        try
        {
            connection_->fs().lstat(fs_dest_path);
        }
        catch (const Error &error)
        {
            if (error.code() == ErrorCode::NotFound)
            {
                return;
            }
            throw;
        }
        throw Error(ErrorCode::GenericFailure, "invalid copy destination: cannot overwrite an existing file or directory");
    }

    void SshCommand::check_copy_quota(int files, std::int64_t size, const std::string &request_path) const
    {
        const auto quota = connection_->has_space(true, false, request_path);
        if (!quota.has_space)
        {
            throw Error(ErrorCode::QuotaExceeded);
        }
        if (quota.quota_files > 0 && quota.remaining_files() < files)
        {
            throw Error(ErrorCode::QuotaExceeded);
        }
        if (quota.quota_size > 0 && quota.remaining_size() < size)
        {
            throw Error(ErrorCode::QuotaExceeded);
        }
    }

    void SshCommand::handle_copy()
    {
        auto &fs = connection_->fs();
        const auto &user = connection_->user();
        std::string source;
        std::string dest;
        int files = 0;
        std::int64_t size = 0;
        std::filesystem::path fs_source;
        std::filesystem::path fs_dest;
        try
        {
            check_local_filesystem();
            std::tie(source, dest) = copy_paths();
            fs_source = fs.resolve_path(source);
            fs_dest = fs.resolve_path(dest);
            check_copy_destination(fs_dest);
            spdlog::debug("{} requested copy \"{}\" -> \"{}\" virtual paths \"{}\" -> \"{}\"", connection_->log_prefix(),
                          fs_source.string(), fs_dest.string(), source, dest);

            const auto info = fs.lstat(fs_source);
            if (info.is_dir())
            {
                check_recursive_copy_permissions(fs_source, fs_dest, dest);
            }
            else if (!has_copy_permissions(source, dest, info))
            {
                throw Error(ErrorCode::PermissionDenied);
            }

            if (info.is_dir())
            {
                const auto dir_size = fs.dir_size(fs_source);
                files = dir_size.files;
                size = dir_size.size;
                if (user.has_virtual_folders_inside(source))
                {
                    throw Error(ErrorCode::Unsupported,
                                "unsupported copy source: the source directory contains virtual folders");
                }
                if (user.has_virtual_folders_inside(dest))
                {
                    throw Error(ErrorCode::Unsupported,
                                "unsupported copy source: the destination directory contains virtual folders");
                }
            }
            else if (info.is_regular())
            {
                if (!user.is_file_allowed(dest))
                {
                    throw Error(ErrorCode::PermissionDenied, "unsupported copy destination: this file is not allowed");
                }
                files = 1;
                size = static_cast<std::int64_t>(info.size);
            }
            else
            {
                throw Error(ErrorCode::Unsupported, "unsupported copy source: only files and directories are supported");
            }

            check_copy_quota(files, size, dest);
            spdlog::debug("{} start copy \"{}\" -> \"{}\"", connection_->log_prefix(), fs_source.string(), fs_dest.string());
            fs.copy_tree(fs_source, fs_dest);
        }
        catch (const Error &error)
        {
            send_error_response(error);
        }

        connection_->update_quota(dest, files, size);
        write_response("OK\n");
        send_exit_status(std::nullopt);
    }

    std::string SshCommand::remove_path() const
    {
        auto path = dest_path();
        if (path.empty() || args_.size() != 1)
        {
            throw Error(ErrorCode::SyntaxError, "usage sftpgo-remove <destination path>");
        }
        if (path.size() > 1 && path.ends_with('/'))
        {
            path.pop_back();
        }
        return path;
    }

    void SshCommand::handle_remove()
    {
        auto &fs = connection_->fs();
        const auto &user = connection_->user();
        std::string path;
        int files = 0;
        std::int64_t size = 0;
        try
        {
            check_local_filesystem();
            path = remove_path();
            if (!user.has_perm(permission::kDelete, vpath::dir(path)))
            {
                throw Error(ErrorCode::PermissionDenied);
            }
            const auto fs_path = fs.resolve_path(path);
            const auto info = fs.lstat(fs_path);
            if (info.is_dir())
            {
                if (path == "/")
                {
                    throw Error(ErrorCode::PermissionDenied, "removing root dir is not allowed");
                }
                if (user.has_virtual_folders_inside(path))
                {
                    throw Error(ErrorCode::Unsupported, "unable to remove this directory: it contains virtual folders");
                }
                if (user.is_virtual_folder(path))
                {
                    throw Error(ErrorCode::Unsupported, "unable to remove a virtual folder");
                }
                const auto dir_size = fs.dir_size(fs_path);
                files = dir_size.files;
                size = dir_size.size;
                fs.remove_all(fs_path);
            }
            else
            {
                if (info.is_regular())
                {
                    files = 1;
                    size = static_cast<std::int64_t>(info.size);
                }
                fs.remove(fs_path, false);
            }
        }
        catch (const Error &error)
        {
            send_error_response(error);
        }

        connection_->update_quota(path, -files, -size);
        write_response("OK\n");
        send_exit_status(std::nullopt);
    }

    void SshCommand::check_local_filesystem() const
    {
        if (!connection_->fs().is_local())
        {
            throw Error(ErrorCode::Unsupported, std::string(kUnsupportedConfig));
        }
    }

    void SshCommand::write_response(std::string_view text)
    {
        try
        {
            write_all(channel_, text);
        }
        catch (const Error &error)
        {
            send_error_response(error);
        }
    }

    void SshCommand::send_error_response(const Error &error)
    {
        const auto message = command_ + ": " + dest_path() + " " + error.what() + "\n";
        try
        {
            write_all(channel_, message);
        }
        catch (const Error &write_error)
        {
            spdlog::debug("{} unable to send error response: {}", connection_->log_prefix(), write_error.what());
        }
        send_exit_status(error);
        throw error;
    }

    void SshCommand::send_exit_status(const std::optional<Error> &error)
    {
        if (error)
        {
            spdlog::warn("{} command failed: {} {}, user: {}, error: {}", connection_->log_prefix(), command_,
                         join_args(args_), connection_->user().username, error->what());
        }
        else
        {
            spdlog::debug("{} command completed: {} {}", connection_->log_prefix(), command_, join_args(args_));
        }
        try
        {
            channel_.send_exit_status(error ? 1 : 0);
            channel_.close();
        }
        catch (const Error &ex)
        {
            spdlog::debug("{} unable to send exit status: {}", connection_->log_prefix(), ex.what());
        }
    }

} // namespace sftpgate::server
