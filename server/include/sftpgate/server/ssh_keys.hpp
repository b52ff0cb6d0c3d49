#pragma once

#include <chrono>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "sftpgate/openssl_util.hpp"

namespace sftpgate::server
{

    struct PublicKey
    {
        // Algorithm name as found inside the blob, e.g. "ssh-ed25519".
        std::string type;
        std::vector<std::uint8_t> blob;
        std::string comment;

        bool is_certificate() const;
        // "SHA256:" followed by unpadded base64, as printed by ssh-keygen -l.
        std::string fingerprint() const;
        std::string authorized_key() const;

        bool operator==(const PublicKey &other) const { return blob == other.blob; }
    };

    // Parses "<type> <base64> [comment]"; throws SyntaxError.
    PublicKey parse_authorized_key(std::string_view line);

    PublicKey public_key_from_blob(std::span<const std::uint8_t> blob);

    PublicKey public_key_from_pkey(EVP_PKEY *pkey);

    // Plain (non certificate) keys only.
    openssl::PkeyPtr pkey_from_public_key(const PublicKey &key);

    // signature is an SSH signature blob (string format, string data).
    bool verify_ssh_signature(const PublicKey &key, std::span<const std::uint8_t> data,
                              std::span<const std::uint8_t> signature);

    inline constexpr std::uint32_t kUserCertificate = 1;
    inline constexpr std::uint32_t kHostCertificate = 2;

    struct Certificate
    {
        std::string type;
        PublicKey key;
        std::uint64_t serial{0};
        std::uint32_t cert_type{0};
        std::string key_id;
        std::vector<std::string> principals;
        std::uint64_t valid_after{0};
        std::uint64_t valid_before{0};
        PublicKey signature_key;
        std::vector<std::uint8_t> signature;
        // Bytes covered by the signature.
        std::vector<std::uint8_t> signed_data;

        bool is_valid_at(std::chrono::system_clock::time_point now) const;
    };

    // Parses a "*-cert-v01@openssh.com" blob; throws SyntaxError.
    Certificate parse_certificate(std::span<const std::uint8_t> blob);

} // namespace sftpgate::server
