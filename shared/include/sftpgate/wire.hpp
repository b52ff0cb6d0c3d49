/**
 * sftpgate - SSH binary encoding (RFC 4251 section 5) used by OpenSSH key
 * blobs and certificates.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sftpgate::wire
{

    class Reader
    {
    public:
        explicit Reader(std::span<const std::uint8_t> buffer) : buffer_(buffer) {}

        std::uint32_t read_u32();
        std::uint64_t read_u64();
        std::string read_string();
        std::span<const std::uint8_t> read_bytes();

        std::size_t remaining() const noexcept { return buffer_.size() - offset_; }
        std::size_t offset() const noexcept { return offset_; }
        bool empty() const noexcept { return remaining() == 0; }

    private:
        std::span<const std::uint8_t> take(std::size_t count);

        std::span<const std::uint8_t> buffer_;
        std::size_t offset_{0};
    };

    class Writer
    {
    public:
        Writer &put_u32(std::uint32_t value);
        Writer &put_u64(std::uint64_t value);
        Writer &put_string(std::string_view value);
        Writer &put_bytes(std::span<const std::uint8_t> value);
        // Big-endian magnitude, leading zeros stripped, sign byte added when needed.
        Writer &put_mpint(std::span<const std::uint8_t> magnitude);

        const std::vector<std::uint8_t> &data() const noexcept { return data_; }
        std::vector<std::uint8_t> take() { return std::move(data_); }

    private:
        Writer &append(std::span<const std::uint8_t> value);

        std::vector<std::uint8_t> data_;
    };

} // namespace sftpgate::wire
