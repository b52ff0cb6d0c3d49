#include "sftpgate/wire.hpp"

#include <limits>

#include "sftpgate/error_codes.hpp"

namespace sftpgate::wire
{

    namespace
    {

        std::uint32_t load_u32_be(std::span<const std::uint8_t> buffer)
        {
            return (static_cast<std::uint32_t>(buffer[0]) << 24) |
                   (static_cast<std::uint32_t>(buffer[1]) << 16) |
                   (static_cast<std::uint32_t>(buffer[2]) << 8) |
                   static_cast<std::uint32_t>(buffer[3]);
        }

        void store_u32_be(std::uint32_t value, std::span<std::uint8_t> buffer)
        {
            buffer[0] = static_cast<std::uint8_t>((value >> 24) & 0xFF);
            buffer[1] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
            buffer[2] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
            buffer[3] = static_cast<std::uint8_t>(value & 0xFF);
        }

    } // namespace

    std::span<const std::uint8_t> Reader::take(std::size_t count)
    {
        if (count > remaining())
        {
            throw Error(ErrorCode::SyntaxError, "unexpected end of message");
        }
        auto result = buffer_.subspan(offset_, count);
        offset_ += count;
        return result;
    }

    std::uint32_t Reader::read_u32()
    {
        return load_u32_be(take(4));
    }

    std::uint64_t Reader::read_u64()
    {
        const auto high = static_cast<std::uint64_t>(read_u32());
        const auto low = static_cast<std::uint64_t>(read_u32());
        return (high << 32) | low;
    }

    std::string Reader::read_string()
    {
        const auto bytes = read_bytes();
        return std::string(bytes.begin(), bytes.end());
    }

    std::span<const std::uint8_t> Reader::read_bytes()
    {
        const auto length = read_u32();
        return take(length);
    }

    Writer &Writer::put_u32(std::uint32_t value)
    {
        std::uint8_t encoded[4];
        store_u32_be(value, encoded);
        data_.insert(data_.end(), encoded, encoded + 4);
        return *this;
    }

    Writer &Writer::put_u64(std::uint64_t value)
    {
        put_u32(static_cast<std::uint32_t>(value >> 32));
        return put_u32(static_cast<std::uint32_t>(value & 0xFFFFFFFFu));
    }

    Writer &Writer::put_string(std::string_view value)
    {
        return put_bytes(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(value.data()), value.size()));
    }

    Writer &Writer::put_bytes(std::span<const std::uint8_t> value)
    {
        if (value.size() > std::numeric_limits<std::uint32_t>::max())
        {
            throw Error(ErrorCode::GenericFailure, "field too large to encode");
        }
        put_u32(static_cast<std::uint32_t>(value.size()));
        return append(value);
    }

    Writer &Writer::append(std::span<const std::uint8_t> value)
    {
        data_.insert(data_.end(), value.begin(), value.end());
        return *this;
    }

    Writer &Writer::put_mpint(std::span<const std::uint8_t> magnitude)
    {
        std::size_t first = 0;
        while (first < magnitude.size() && magnitude[first] == 0)
        {
            ++first;
        }
        const auto digits = magnitude.subspan(first);
        if (!digits.empty() && (digits[0] & 0x80u) != 0)
        {
            put_u32(static_cast<std::uint32_t>(digits.size() + 1));
            data_.push_back(0);
            return append(digits);
        }
        return put_bytes(digits);
    }

} // namespace sftpgate::wire
