#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include <libssh/libssh.h>

#include "sftpgate/server/ssh_keys.hpp"

namespace sftpgate::server
{

    enum class KeyType : std::uint8_t
    {
        Rsa,
        Ecdsa,
        Ed25519
    };

    std::string_view default_key_name(KeyType type) noexcept;

    struct HostKeyOptions
    {
        unsigned int rsa_bits{4096};
    };

    struct SshKeyFree
    {
        void operator()(ssh_key key) const;
    };

    using SshKeyPtr = std::unique_ptr<std::remove_pointer_t<ssh_key>, SshKeyFree>;

    PublicKey public_key_from_ssh_key(ssh_key key);

    struct HostKey
    {
        std::filesystem::path path;
        PublicKey public_key;
        // Handed over to the ssh bind when the server starts.
        SshKeyPtr private_key;
    };

    // Writes the private key with mode 0600 and "<path>.pub" beside it.
    HostKey generate_host_key(KeyType type, const std::filesystem::path &path, const HostKeyOptions &options = {});

    // Any private key format libssh reads, without passphrase. Throws ConfigError.
    HostKey load_host_key(const std::filesystem::path &path);

    // With nothing configured the three default keys are used from config_dir, generated when missing.
    // An absolute configured path named like a default key is generated when missing.
    std::vector<HostKey> load_host_keys(const std::vector<std::string> &configured,
                                        const std::filesystem::path &config_dir,
                                        const HostKeyOptions &options = {});

    class CertificateChecker
    {
    public:
        // Every file must hold an OpenSSH public key. Throws ConfigError.
        static CertificateChecker load(const std::vector<std::string> &ca_files,
                                       const std::filesystem::path &config_dir);

        void add_authority(PublicKey key);
        bool empty() const noexcept { return authorities_.empty(); }
        const std::vector<PublicKey> &authorities() const noexcept { return authorities_; }
        bool is_authority(const PublicKey &key) const;

        // Throws PermissionDenied describing the first failed check.
        Certificate check_user_certificate(const PublicKey &key, const std::string &username,
                                           std::chrono::system_clock::time_point now) const;

    private:
        std::vector<PublicKey> authorities_;
    };

} // namespace sftpgate::server
