#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include "sftpgate/server/channel.hpp"

namespace sftpgate::server
{

    class FdReader : public Reader
    {
    public:
        explicit FdReader(int fd = -1) noexcept : fd_(fd) {}
        ~FdReader() override;

        FdReader(const FdReader &) = delete;
        FdReader &operator=(const FdReader &) = delete;

        std::size_t read(std::span<std::uint8_t> buffer) override;
        void reset(int fd) noexcept;
        void close() noexcept;

    private:
        int fd_;
    };

    class FdWriter : public Writer
    {
    public:
        explicit FdWriter(int fd = -1) noexcept : fd_(fd) {}
        ~FdWriter() override;

        FdWriter(const FdWriter &) = delete;
        FdWriter &operator=(const FdWriter &) = delete;

        std::size_t write(std::span<const std::uint8_t> data) override;
        void reset(int fd) noexcept;
        void close() noexcept;

    private:
        int fd_;
    };

    class ChildProcess
    {
    public:
        // argv[0] is looked up in PATH; throws if the program cannot be started.
        explicit ChildProcess(const std::vector<std::string> &argv,
                              const std::optional<std::filesystem::path> &working_dir = std::nullopt);
        ~ChildProcess();

        ChildProcess(const ChildProcess &) = delete;
        ChildProcess &operator=(const ChildProcess &) = delete;

        Writer &stdin_writer() noexcept { return stdin_; }
        Reader &stdout_reader() noexcept { return stdout_; }
        Reader &stderr_reader() noexcept { return stderr_; }

        void close_stdin() noexcept { stdin_.close(); }
        void kill() noexcept;

        // Exit code, or 128 + signal number for a signalled child.
        int wait();

        pid_t pid() const noexcept { return pid_; }

    private:
        pid_t pid_{-1};
        FdWriter stdin_;
        FdReader stdout_;
        FdReader stderr_;
        std::mutex mutex_;
        bool reaped_{false};
        int exit_code_{0};
    };

} // namespace sftpgate::server
