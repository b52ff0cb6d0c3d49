#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sftpgate/error_codes.hpp"
#include "sftpgate/server/channel.hpp"
#include "sftpgate/server/connection.hpp"
#include "sftpgate/server/connection_registry.hpp"
#include "sftpgate/server/transfer.hpp"
#include "sftpgate/server/vfs.hpp"

namespace sftpgate::server
{

    inline constexpr std::uint8_t kScpOk = 0x00;
    inline constexpr std::uint8_t kScpWarning = 0x01;
    inline constexpr std::uint8_t kScpError = 0x02;

    enum class ScpMessageKind : std::uint8_t
    {
        Directory,
        EndDirectory,
        Timestamp,
        File
    };

    struct ScpMessage
    {
        ScpMessageKind kind{ScpMessageKind::File};
        std::string mode;
        std::uint64_t size{0};
        std::string name;
        std::int64_t modified{0};
        std::int64_t accessed{0};
    };

    // Parses one control line without its trailing newline; throws SyntaxError.
    ScpMessage parse_scp_message(std::string_view line);

    // Four octal digits; the leading one carries setuid (2), setgid (4) and sticky (1).
    std::string file_mode_string(std::uint32_t mode, bool is_dir);

    class ScpCommand
    {
    public:
        ScpCommand(std::shared_ptr<Connection> connection, Channel &channel, ConnectionRegistry &registry,
                   std::vector<std::string> args);

        void handle();

        // Protocol steps, usable on their own.
        std::string dest_path() const;
        std::string command_type() const;
        bool is_recursive() const;
        bool send_file_time() const;

        void handle_recursive_upload();
        void handle_create_dir(const std::string &virtual_path);
        void handle_upload(const std::string &virtual_path, std::uint64_t size);
        void get_upload_file_data(std::uint64_t size, Transfer &transfer);
        std::string file_upload_dest_path(const std::string &scp_dest_path, const std::string &file_name) const;
        ScpMessage parse_upload_message(const std::string &line);
        std::optional<std::string> next_upload_protocol_message();

        void handle_download(const std::string &virtual_path);
        void send_download_file_data(const std::string &virtual_path, const FileInfo &info, Transfer &transfer);

        void read_confirmation_message();
        // Reads one line; nullopt at end of stream.
        std::optional<std::string> read_protocol_message();
        void send_confirmation_message();
        void send_protocol_message(std::string_view message);
        void send_error_message(std::string_view message);
        void send_exit_status(const std::optional<Error> &error);

    private:
        struct DirectoryFrame
        {
            std::string virtual_path;
            std::size_t parent;
        };

        struct DownloadItem
        {
            std::string virtual_path;
            bool end_of_directory;
        };

        void run();

        void handle_upload_file(const std::filesystem::path &resolved_path, const std::filesystem::path &file_path,
                                std::uint64_t size, bool is_new_file, std::int64_t file_size,
                                const std::string &request_path);
        void download_entry(const std::string &virtual_path, std::vector<DownloadItem> &pending);
        void apply_pending_times(const std::filesystem::path &real_path, const std::string &virtual_path);
        void send_download_file(const std::string &virtual_path, const std::filesystem::path &real_path,
                                const FileInfo &info);
        std::optional<FileInfo> lstat_if_exists(const std::filesystem::path &path) const;
        [[noreturn]] void fail(const Error &error);
        void close_after_error(Transfer &transfer);

        std::shared_ptr<Connection> connection_;
        Channel &channel_;
        ConnectionRegistry &registry_;
        std::vector<std::string> args_;
        std::optional<ScpMessage> pending_times_;
    };

} // namespace sftpgate::server
