#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>

#include "sftpgate/error_codes.hpp"
#include "sftpgate/server/channel.hpp"
#include "sftpgate/server/connection.hpp"
#include "sftpgate/server/pipe.hpp"
#include "sftpgate/server/vfs.hpp"

namespace sftpgate::server
{

    inline constexpr std::size_t kCopyBufferSize = 32 * 1024;

    struct TransferParams
    {
        // At most one of file, writer and reader; none for streaming commands.
        std::unique_ptr<File> file;
        std::shared_ptr<PipeWriter> writer;
        std::shared_ptr<PipeReader> reader;
        std::function<void()> cancel;
        // Final destination; differs from file->name() for atomic uploads.
        std::filesystem::path fs_path;
        std::string request_path;
        TransferType type{TransferType::Upload};
        std::uint64_t min_write_offset{0};
        std::int64_t initial_size{0};
        // 0 unlimited, negative rejects every write.
        std::int64_t max_write_size{0};
        bool is_new_file{false};
        std::optional<std::uint64_t> expected_size;
        // Reported by read_at, e.g. reads on an atomic upload handle.
        std::optional<Error> read_error;
    };

    struct CopyResult
    {
        std::uint64_t written{0};
        std::optional<Error> error;
    };

    // A transfer registers itself with its connection on construction and is
    // removed again by close(), by copy_from_reader_to_writer() or, at the
    // latest, by its destructor. The first error recorded wins; it is reported
    // by close() in preference to any error raised while closing.
    class Transfer
    {
    public:
        Transfer(Connection &connection, TransferParams params);
        ~Transfer();

        Transfer(const Transfer &) = delete;
        Transfer &operator=(const Transfer &) = delete;

        std::size_t write_at(std::span<const std::uint8_t> data, std::uint64_t offset);
        std::size_t read_at(std::span<std::uint8_t> buffer, std::uint64_t offset);

        // Throws TransferClosed on every call after the first.
        void close();

        void transfer_error(const Error &error);

        // Streams src into dst until EOF; used by commands without a file endpoint.
        CopyResult copy_from_reader_to_writer(Writer &dst, Reader &src);

        std::uint64_t id() const noexcept { return id_; }
        TransferType type() const noexcept { return type_; }
        const std::filesystem::path &fs_path() const noexcept { return fs_path_; }
        const std::string &request_path() const noexcept { return request_path_; }
        std::uint64_t bytes_sent() const noexcept { return bytes_sent_.load(); }
        std::uint64_t bytes_received() const noexcept { return bytes_received_.load(); }
        std::optional<Error> error() const;
        bool is_finished() const;
        TransferStatus status() const;

    private:
        std::optional<Error> close_io();
        std::optional<Error> close_base();
        bool remove_partial_upload(const char *reason);
        void update_quota(int num_files);
        void log_transfer(std::chrono::milliseconds elapsed) const;

        Connection &connection_;
        const std::uint64_t id_;
        const TransferType type_;
        std::unique_ptr<File> file_;
        std::shared_ptr<PipeWriter> writer_;
        std::shared_ptr<PipeReader> reader_;
        const std::filesystem::path fs_path_;
        const std::string request_path_;
        const std::int64_t initial_size_;
        const std::int64_t max_write_size_;
        const bool is_new_file_;
        const std::optional<std::uint64_t> expected_size_;
        const std::optional<Error> read_error_;
        const std::chrono::steady_clock::time_point started_;
        const std::chrono::system_clock::time_point started_at_;

        std::atomic<std::uint64_t> min_write_offset_;
        std::atomic<std::uint64_t> bytes_sent_{0};
        std::atomic<std::uint64_t> bytes_received_{0};

        mutable std::mutex mutex_;
        std::mutex close_mutex_;
        std::function<void()> cancel_;
        std::optional<Error> error_;
        bool finished_{false};
        bool discarded_{false};
    };

} // namespace sftpgate::server
