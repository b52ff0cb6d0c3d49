#include <cassert>
#include <cerrno>
#include <chrono>
#include <deque>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <variant>
#include <vector>

#include "sftpgate/server/listener.hpp"

#include "test_support.hpp"

using namespace sftpgate;
using namespace sftpgate::server;
using namespace std::chrono_literals;

namespace
{

    // Replays a fixed script of accept results: a descriptor, an errno to throw, or the end.
    class ScriptedListener : public Listener
    {
    public:
        struct Fd
        {
            int value;
        };
        struct Fail
        {
            int error;
        };
        struct Closed
        {
        };
        using Step = std::variant<Fd, Fail, Closed>;

        explicit ScriptedListener(std::deque<Step> script) : script_(std::move(script)) {}

        std::optional<int> accept() override
        {
            assert(!script_.empty());
            const auto step = script_.front();
            script_.pop_front();
            if (const auto *fd = std::get_if<Fd>(&step))
            {
                return fd->value;
            }
            if (const auto *fail = std::get_if<Fail>(&step))
            {
                throw std::system_error(fail->error, std::generic_category(), "accept");
            }
            return std::nullopt;
        }

        void close() override { closed_ = true; }

        bool exhausted() const { return script_.empty(); }

    private:
        std::deque<Step> script_;
        bool closed_{false};
    };

    void test_temporary_errors()
    {
        assert(is_temporary_accept_error(std::error_code(EMFILE, std::generic_category())));
        assert(is_temporary_accept_error(std::error_code(ECONNABORTED, std::system_category())));
        assert(is_temporary_accept_error(std::error_code(EAGAIN, std::generic_category())));
        assert(!is_temporary_accept_error(std::error_code(EBADF, std::generic_category())));
        assert(!is_temporary_accept_error(std::error_code(EINVAL, std::generic_category())));
        assert(!is_temporary_accept_error(std::make_error_code(std::io_errc::stream)));
    }

    void test_backoff_sequence()
    {
        std::deque<ScriptedListener::Step> script;
        for (int i = 0; i < 9; ++i)
        {
            script.push_back(ScriptedListener::Fail{EMFILE});
        }
        script.push_back(ScriptedListener::Fail{EBADF});
        ScriptedListener listener(std::move(script));

        std::vector<std::chrono::milliseconds> sleeps;
        bool rethrown = false;
        try
        {
            serve(listener, [](int) { assert(false); }, BackoffPolicy{},
                  [&sleeps](std::chrono::milliseconds delay) { sleeps.push_back(delay); });
        }
        catch (const std::system_error &ex)
        {
            rethrown = ex.code().value() == EBADF;
        }
        assert(rethrown);
        assert(listener.exhausted());
        const std::vector<std::chrono::milliseconds> expected{5ms, 10ms, 20ms, 40ms, 80ms, 160ms, 320ms, 640ms, 1000ms};
        assert(sleeps == expected);
    }

    void test_backoff_resets_after_accept()
    {
        ScriptedListener listener({ScriptedListener::Fail{ENFILE}, ScriptedListener::Fail{ENOBUFS},
                                   ScriptedListener::Fd{7}, ScriptedListener::Fail{ENOMEM}, ScriptedListener::Closed{}});
        std::vector<std::chrono::milliseconds> sleeps;
        std::vector<int> handled;
        serve(
            listener, [&handled](int fd) { handled.push_back(fd); }, BackoffPolicy{.initial = 2ms, .max = 50ms},
            [&sleeps](std::chrono::milliseconds delay) { sleeps.push_back(delay); });
        assert(listener.exhausted());
        assert(handled == std::vector<int>{7});
        assert((sleeps == std::vector<std::chrono::milliseconds>{2ms, 4ms, 2ms}));
    }

    void test_handler_failures_do_not_stop_the_loop()
    {
        ScriptedListener listener(
            {ScriptedListener::Fd{3}, ScriptedListener::Fd{4}, ScriptedListener::Fd{5}, ScriptedListener::Closed{}});
        std::vector<int> handled;
        serve(listener, [&handled](int fd)
              {
                  handled.push_back(fd);
                  if (fd == 3)
                  {
                      throw std::runtime_error("handshake failed");
                  }
                  if (fd == 4)
                  {
                      throw Error(ErrorCode::GenericFailure, "session crashed");
                  }
              });
        assert(listener.exhausted());
        assert((handled == std::vector<int>{3, 4, 5}));
    }

} // namespace

void run_listener_tests()
{
    test_temporary_errors();
    test_backoff_sequence();
    test_backoff_resets_after_accept();
    test_handler_failures_do_not_stop_the_loop();
}
