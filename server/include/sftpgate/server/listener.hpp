#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <system_error>

namespace sftpgate::server
{

    class Listener
    {
    public:
        virtual ~Listener() = default;

        // Accepted socket descriptor, nullopt once the listener has been closed.
        // Accept failures are thrown as std::system_error.
        virtual std::optional<int> accept() = 0;
        virtual void close() = 0;
    };

    bool is_temporary_accept_error(const std::error_code &ec) noexcept;

    struct BackoffPolicy
    {
        std::chrono::milliseconds initial{5};
        std::chrono::milliseconds max{1000};
    };

    // The handler owns the descriptor it receives.
    using ConnectionHandler = std::function<void(int)>;
    using SleepFunction = std::function<void(std::chrono::milliseconds)>;

    // Runs until the listener is closed. Temporary errors are retried with exponential
    // backoff, any other accept error is rethrown. Handler exceptions are logged only.
    void serve(Listener &listener, const ConnectionHandler &handler, const BackoffPolicy &policy = {},
               const SleepFunction &sleep = {});

} // namespace sftpgate::server
