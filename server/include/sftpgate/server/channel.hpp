#pragma once

#include <cstdint>
#include <span>
#include <string_view>

namespace sftpgate::server
{

    class Reader
    {
    public:
        virtual ~Reader() = default;

        // Returns 0 at end of stream; throws sftpgate::Error on failure.
        virtual std::size_t read(std::span<std::uint8_t> buffer) = 0;
    };

    class Writer
    {
    public:
        virtual ~Writer() = default;

        // May accept fewer bytes than offered; throws sftpgate::Error on failure.
        virtual std::size_t write(std::span<const std::uint8_t> data) = 0;
    };

    class Channel : public Reader, public Writer
    {
    public:
        virtual Writer &stderr_writer() = 0;
        virtual void send_exit_status(std::uint32_t status) = 0;
        // Sends EOF to the peer, reads stay possible.
        virtual void close_write() = 0;
        virtual void close() = 0;
    };

    // Loops until everything is written; a zero length write is a ShortWrite error.
    void write_all(Writer &writer, std::span<const std::uint8_t> data);

    void write_all(Writer &writer, std::string_view text);

} // namespace sftpgate::server
