#include "sftpgate/server/listener.hpp"

#include <algorithm>
#include <cerrno>
#include <thread>

#include <spdlog/spdlog.h>

namespace sftpgate::server
{

    bool is_temporary_accept_error(const std::error_code &ec) noexcept
    {
        if (ec.category() != std::generic_category() && ec.category() != std::system_category())
        {
            return false;
        }
        switch (ec.value())
        {
        case EMFILE:
        case ENFILE:
        case ENOBUFS:
        case ENOMEM:
        case ECONNABORTED:
        case EINTR:
        case EAGAIN:
        case ETIMEDOUT:
            return true;
        default:
            return false;
        }
    }

    void serve(Listener &listener, const ConnectionHandler &handler, const BackoffPolicy &policy,
               const SleepFunction &sleep)
    {
        std::chrono::milliseconds delay{0};
        for (;;)
        {
            std::optional<int> fd;
            try
            {
                fd = listener.accept();
            }
            catch (const std::system_error &ex)
            {
                if (!is_temporary_accept_error(ex.code()))
                {
                    spdlog::error("Accept failed: {}", ex.what());
                    throw;
                }
                delay = delay.count() == 0 ? policy.initial : std::min(delay * 2, policy.max);
                spdlog::warn("Temporary accept error: {}; retrying in {} ms", ex.what(), delay.count());
                if (sleep)
                {
                    sleep(delay);
                }
                else
                {
                    std::this_thread::sleep_for(delay);
                }
                continue;
            }
            if (!fd)
            {
                spdlog::debug("Listener closed, accept loop finished");
                return;
            }
            delay = std::chrono::milliseconds{0};
            try
            {
                handler(*fd);
            }
            catch (const std::exception &ex)
            {
                spdlog::error("Connection handler failed: {}", ex.what());
            }
        }
    }

} // namespace sftpgate::server
