#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <span>

#include "sftpgate/error_codes.hpp"

namespace sftpgate::server
{

    namespace detail
    {
        struct PipeState
        {
            std::mutex mutex;
            std::condition_variable cv;
            std::deque<std::uint8_t> buffer;
            std::size_t capacity{};
            bool write_closed{false};
            bool read_closed{false};
            bool done{false};
            std::optional<Error> done_error;
            std::optional<Error> write_error;
            std::uint64_t written{0};
            std::uint64_t read{0};
        };
    } // namespace detail

    // Offsets must be sequential on both ends. For uploads the backend drains the
    // reader and reports the outcome with PipeWriter::done(); PipeWriter::close()
    // blocks until then and rethrows that outcome. For downloads the backend fills
    // the writer and ends the stream with PipeWriter::finish().
    class PipeWriter
    {
    public:
        explicit PipeWriter(std::shared_ptr<detail::PipeState> state);

        std::size_t write_at(std::span<const std::uint8_t> data, std::uint64_t offset);

        void close();
        void done(std::optional<Error> error);
        void finish(std::optional<Error> error);

        std::uint64_t bytes_written() const;

    private:
        std::shared_ptr<detail::PipeState> state_;
    };

    class PipeReader
    {
    public:
        explicit PipeReader(std::shared_ptr<detail::PipeState> state);

        std::size_t read_at(std::span<std::uint8_t> buffer, std::uint64_t offset);

        // Returns 0 once the writer finished and the buffer is drained.
        std::size_t read(std::span<std::uint8_t> buffer);

        void close();

    private:
        std::shared_ptr<detail::PipeState> state_;
    };

    struct Pipe
    {
        std::shared_ptr<PipeReader> reader;
        std::shared_ptr<PipeWriter> writer;
    };

    Pipe make_pipe(std::size_t capacity = 1024 * 1024);

} // namespace sftpgate::server
