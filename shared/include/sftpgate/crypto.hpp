/**
 * sftpgate - Crypto helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace sftpgate::crypto
{

    void ensure_sodium_init();

    std::string hash_password(std::string_view password);

    bool verify_password(std::string_view password, std::string_view password_hash);

    // Lowercase hex string built from `byte_count` random bytes.
    std::string random_hex(std::size_t byte_count);

    bool constant_time_equals(std::span<const std::uint8_t> lhs, std::span<const std::uint8_t> rhs);

} // namespace sftpgate::crypto
