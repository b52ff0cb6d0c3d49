#include "sftpgate/server/process.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include "sftpgate/error_codes.hpp"

namespace sftpgate::server
{

    namespace
    {

        struct PipeFds
        {
            int read{-1};
            int write{-1};
        };

        PipeFds make_pipe_fds()
        {
            int fds[2] = {-1, -1};
            if (::pipe2(fds, O_CLOEXEC) != 0)
            {
                throw_errno(errno, "pipe2");
            }
            return PipeFds{.read = fds[0], .write = fds[1]};
        }

        void close_fd(int &fd) noexcept
        {
            if (fd >= 0)
            {
                ::close(fd);
                fd = -1;
            }
        }

        // Runs in the child between fork and exec: async-signal-safe calls only.
        [[noreturn]] void exec_child(const std::vector<char *> &argv, const char *working_dir, int in, int out, int err,
                                     int status_fd)
        {
            int failure = 0;
            if (::dup2(in, STDIN_FILENO) < 0 || ::dup2(out, STDOUT_FILENO) < 0 || ::dup2(err, STDERR_FILENO) < 0)
            {
                failure = errno;
            }
            else if (working_dir != nullptr && ::chdir(working_dir) != 0)
            {
                failure = errno;
            }
            else
            {
                ::signal(SIGPIPE, SIG_DFL);
                ::execvp(argv[0], argv.data());
                failure = errno;
            }
            [[maybe_unused]] const auto written = ::write(status_fd, &failure, sizeof(failure));
            ::_exit(127);
        }

    } // namespace

    FdReader::~FdReader()
    {
        close();
    }

    std::size_t FdReader::read(std::span<std::uint8_t> buffer)
    {
        if (fd_ < 0)
        {
            throw Error(ErrorCode::GenericFailure, "read on closed pipe");
        }
        while (true)
        {
            const auto count = ::read(fd_, buffer.data(), buffer.size());
            if (count >= 0)
            {
                return static_cast<std::size_t>(count);
            }
            if (errno != EINTR)
            {
                throw_errno(errno, "read pipe");
            }
        }
    }

    void FdReader::reset(int fd) noexcept
    {
        close_fd(fd_);
        fd_ = fd;
    }

    void FdReader::close() noexcept
    {
        close_fd(fd_);
    }

    FdWriter::~FdWriter()
    {
        close();
    }

    std::size_t FdWriter::write(std::span<const std::uint8_t> data)
    {
        if (fd_ < 0)
        {
            throw Error(ErrorCode::GenericFailure, "write on closed pipe");
        }
        while (true)
        {
            const auto count = ::write(fd_, data.data(), data.size());
            if (count >= 0)
            {
                return static_cast<std::size_t>(count);
            }
            if (errno != EINTR)
            {
                throw_errno(errno, "write pipe");
            }
        }
    }

    void FdWriter::reset(int fd) noexcept
    {
        close_fd(fd_);
        fd_ = fd;
    }

    void FdWriter::close() noexcept
    {
        close_fd(fd_);
    }

    ChildProcess::ChildProcess(const std::vector<std::string> &argv,
                               const std::optional<std::filesystem::path> &working_dir)
    {
        if (argv.empty())
        {
            throw Error(ErrorCode::GenericFailure, "empty command line");
        }

        auto in = make_pipe_fds();
        PipeFds out;
        PipeFds err;
        PipeFds status;
        try
        {
            out = make_pipe_fds();
            err = make_pipe_fds();
            status = make_pipe_fds();
        }
        catch (const Error &)
        {
            for (auto *fd : {&in.read, &in.write, &out.read, &out.write, &err.read, &err.write})
            {
                close_fd(*fd);
            }
            throw;
        }

        std::vector<char *> raw_argv;
        raw_argv.reserve(argv.size() + 1);
        for (const auto &arg : argv)
        {
            raw_argv.push_back(const_cast<char *>(arg.c_str()));
        }
        raw_argv.push_back(nullptr);
        const auto dir = working_dir ? working_dir->string() : std::string();

        const auto pid = ::fork();
        if (pid < 0)
        {
            const auto error_number = errno;
            for (auto *fd : {&in.read, &in.write, &out.read, &out.write, &err.read, &err.write, &status.read,
                             &status.write})
            {
                close_fd(*fd);
            }
            throw_errno(error_number, "fork");
        }
        if (pid == 0)
        {
            exec_child(raw_argv, working_dir ? dir.c_str() : nullptr, in.read, out.write, err.write, status.write);
        }

        close_fd(in.read);
        close_fd(out.write);
        close_fd(err.write);
        close_fd(status.write);

        int child_errno = 0;
        ssize_t count = 0;
        do
        {
            count = ::read(status.read, &child_errno, sizeof(child_errno));
        } while (count < 0 && errno == EINTR);
        close_fd(status.read);

        pid_ = pid;
        if (count > 0)
        {
            int ignored = 0;
            while (::waitpid(pid, &ignored, 0) < 0 && errno == EINTR)
            {
            }
            reaped_ = true;
            close_fd(in.write);
            close_fd(out.read);
            close_fd(err.read);
            throw_errno(child_errno, "unable to start \"" + argv.front() + "\"");
        }

        stdin_.reset(in.write);
        stdout_.reset(out.read);
        stderr_.reset(err.read);
    }

    ChildProcess::~ChildProcess()
    {
        bool running = false;
        {
            std::lock_guard lock(mutex_);
            running = pid_ > 0 && !reaped_;
        }
        if (running)
        {
            kill();
            try
            {
                wait();
            }
            catch (const Error &error)
            {
                spdlog::warn("unable to reap child process {}: {}", pid_, error.what());
            }
        }
    }

    void ChildProcess::kill() noexcept
    {
        std::lock_guard lock(mutex_);
        if (pid_ > 0 && !reaped_)
        {
            ::kill(pid_, SIGKILL);
        }
    }

    int ChildProcess::wait()
    {
        {
            std::lock_guard lock(mutex_);
            if (reaped_)
            {
                return exit_code_;
            }
        }
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0)
        {
            if (errno != EINTR)
            {
                throw_errno(errno, "waitpid");
            }
        }
        std::lock_guard lock(mutex_);
        reaped_ = true;
        if (WIFEXITED(status))
        {
            exit_code_ = WEXITSTATUS(status);
        }
        else if (WIFSIGNALED(status))
        {
            exit_code_ = 128 + WTERMSIG(status);
        }
        return exit_code_;
    }

} // namespace sftpgate::server
