#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "sftpgate/digest.hpp"
#include "sftpgate/error_codes.hpp"
#include "sftpgate/server/channel.hpp"
#include "sftpgate/server/command_line.hpp"
#include "sftpgate/server/connection.hpp"
#include "sftpgate/server/connection_registry.hpp"
#include "sftpgate/server/vfs.hpp"

namespace sftpgate::server
{

    enum class CommandKind : std::uint8_t
    {
        Scp,
        Hash,
        Rsync,
        GitReceivePack,
        GitUploadPack,
        GitUploadArchive,
        Copy,
        Remove,
        ChangeDir,
        PrintDir,
        Unsupported
    };

    struct ClassifiedCommand
    {
        CommandKind kind{CommandKind::Unsupported};
        // Set for CommandKind::Hash only.
        std::optional<digest::Algorithm> algorithm;
    };

    ClassifiedCommand classify_command(std::string_view name) noexcept;

    // Every command name the dispatcher knows about.
    const std::vector<std::string> &supported_ssh_commands();

    // "*" in enabled allows every supported command.
    bool is_command_enabled(std::string_view name, const std::vector<std::string> &enabled);

    // Runs one exec request to completion; throws the error reported to the client.
    void dispatch_exec_command(const std::shared_ptr<Connection> &connection, Channel &channel,
                               ConnectionRegistry &registry, const ParsedCommand &command);

    struct SystemCommand
    {
        std::vector<std::string> argv;
        std::filesystem::path fs_path;
        // Virtual path whose owning folder is charged for the command.
        std::string quota_check_path;
    };

    struct PathSize
    {
        int files{0};
        std::int64_t size{0};
    };

    class SshCommand
    {
    public:
        SshCommand(std::shared_ptr<Connection> connection, Channel &channel, ConnectionRegistry &registry,
                   std::string command, std::vector<std::string> args);

        void handle();

        const std::string &command() const noexcept { return command_; }
        std::string dest_path() const;

        void handle_hash_command(digest::Algorithm algorithm);

        SystemCommand system_command() const;
        void execute_system_command(const SystemCommand &command);
        PathSize size_for_path(const std::filesystem::path &fs_path) const;

        void handle_copy();
        void handle_remove();

        std::pair<std::string, std::string> copy_paths() const;
        bool has_copy_permissions(const std::string &source_path, const std::string &dest_path,
                                  const FileInfo &source_info) const;
        void check_copy_destination(const std::filesystem::path &fs_dest_path) const;
        void check_copy_quota(int files, std::int64_t size, const std::string &request_path) const;

    private:
        void run();
        std::string source_path() const;
        std::string remove_path() const;
        void check_local_filesystem() const;
        void check_recursive_copy_permissions(const std::filesystem::path &fs_source_path,
                                              const std::filesystem::path &fs_dest_path,
                                              const std::string &dest_path) const;
        void write_response(std::string_view text);
        [[noreturn]] void send_error_response(const Error &error);
        void send_exit_status(const std::optional<Error> &error);

        std::shared_ptr<Connection> connection_;
        Channel &channel_;
        ConnectionRegistry &registry_;
        std::string command_;
        std::vector<std::string> args_;
    };

} // namespace sftpgate::server
