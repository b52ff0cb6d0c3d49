#include "sftpgate/server/host_keys.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <iterator>
#include <sstream>

#include <spdlog/spdlog.h>

#include "sftpgate/error_codes.hpp"

namespace sftpgate::server
{

    namespace
    {

        constexpr std::array<KeyType, 3> kDefaultKeys{KeyType::Rsa, KeyType::Ecdsa, KeyType::Ed25519};

        struct SshStringFree
        {
            void operator()(ssh_string value) const { ::ssh_string_free(value); }
        };

        struct CharFree
        {
            void operator()(char *value) const { ::ssh_string_free_char(value); }
        };

        using SshStringPtr = std::unique_ptr<std::remove_pointer_t<ssh_string>, SshStringFree>;

        const KeyType *default_key_for_name(std::string_view name)
        {
            for (const auto &type : kDefaultKeys)
            {
                if (default_key_name(type) == name)
                {
                    return &type;
                }
            }
            return nullptr;
        }

        std::string read_text_file(const std::filesystem::path &path)
        {
            std::error_code ec;
            if (!std::filesystem::is_regular_file(path, ec))
            {
                throw Error(ErrorCode::ConfigError, "\"" + path.string() + "\" is not a regular file");
            }
            std::ifstream in(path, std::ios::binary);
            if (!in.is_open())
            {
                throw Error(ErrorCode::ConfigError, "unable to open \"" + path.string() + "\"");
            }
            return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        }

        SshKeyPtr generate_ssh_key(KeyType type, const HostKeyOptions &options)
        {
            enum ssh_keytypes_e key_type = SSH_KEYTYPE_ED25519;
            int parameter = 0;
            switch (type)
            {
            case KeyType::Rsa:
                key_type = SSH_KEYTYPE_RSA;
                parameter = static_cast<int>(options.rsa_bits);
                break;
            case KeyType::Ecdsa:
                key_type = SSH_KEYTYPE_ECDSA_P256;
                parameter = 256;
                break;
            case KeyType::Ed25519:
                break;
            }
            ssh_key key = nullptr;
            if (::ssh_pki_generate(key_type, parameter, &key) != SSH_OK || key == nullptr)
            {
                throw Error(ErrorCode::GenericFailure, std::string("unable to generate ") +
                                                           std::string(default_key_name(type)) + " key");
            }
            return SshKeyPtr(key);
        }

        void write_public_key(ssh_key key, const std::filesystem::path &path)
        {
            char *raw = nullptr;
            if (::ssh_pki_export_pubkey_base64(key, &raw) != SSH_OK || raw == nullptr)
            {
                throw Error(ErrorCode::GenericFailure, "unable to encode the public key");
            }
            const std::unique_ptr<char, CharFree> base64(raw);
            std::ofstream pub(path, std::ios::trunc);
            if (!pub.is_open())
            {
                throw Error(ErrorCode::GenericFailure, "unable to create \"" + path.string() + "\"");
            }
            pub << ::ssh_key_type_to_char(::ssh_key_type(key)) << ' ' << base64.get() << '\n';
            if (!pub)
            {
                throw Error(ErrorCode::GenericFailure, "unable to write \"" + path.string() + "\"");
            }
        }

        PublicKey read_authorized_key_file(const std::filesystem::path &path)
        {
            std::istringstream lines(read_text_file(path));
            std::string line;
            while (std::getline(lines, line))
            {
                const auto first = line.find_first_not_of(" \t\r");
                if (first == std::string::npos || line[first] == '#')
                {
                    continue;
                }
                return parse_authorized_key(line);
            }
            throw Error(ErrorCode::SyntaxError, "no public key found");
        }

    } // namespace

    void SshKeyFree::operator()(ssh_key key) const
    {
        ::ssh_key_free(key);
    }

    PublicKey public_key_from_ssh_key(ssh_key key)
    {
        ssh_string raw = nullptr;
        if (::ssh_pki_export_pubkey_blob(key, &raw) != SSH_OK || raw == nullptr)
        {
            throw Error(ErrorCode::GenericFailure, "unable to export public key blob");
        }
        const SshStringPtr blob(raw);
        const auto *data = static_cast<const std::uint8_t *>(::ssh_string_data(blob.get()));
        return public_key_from_blob(std::span<const std::uint8_t>(data, ::ssh_string_len(blob.get())));
    }

    std::string_view default_key_name(KeyType type) noexcept
    {
        switch (type)
        {
        case KeyType::Rsa:
            return "id_rsa";
        case KeyType::Ecdsa:
            return "id_ecdsa";
        case KeyType::Ed25519:
            return "id_ed25519";
        }
        return "";
    }

    HostKey generate_host_key(KeyType type, const std::filesystem::path &path, const HostKeyOptions &options)
    {
        if (path.has_parent_path())
        {
            std::filesystem::create_directories(path.parent_path());
        }
        auto key = generate_ssh_key(type, options);
        if (::ssh_pki_export_privkey_file(key.get(), nullptr, nullptr, nullptr, path.c_str()) != SSH_OK)
        {
            throw Error(ErrorCode::GenericFailure, "unable to write \"" + path.string() + "\"");
        }
        std::filesystem::permissions(path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                     std::filesystem::perm_options::replace);

        auto pub_path = path;
        pub_path += ".pub";
        write_public_key(key.get(), pub_path);

        HostKey host_key{.path = path, .public_key = public_key_from_ssh_key(key.get()), .private_key = std::move(key)};
        spdlog::info("Generated host key {} ({})", path.string(), host_key.public_key.fingerprint());
        return host_key;
    }

    HostKey load_host_key(const std::filesystem::path &path)
    {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec))
        {
            throw Error(ErrorCode::ConfigError, "\"" + path.string() + "\" is not a regular file");
        }
        ssh_key raw = nullptr;
        if (::ssh_pki_import_privkey_file(path.c_str(), nullptr, nullptr, nullptr, &raw) != SSH_OK || raw == nullptr)
        {
            throw Error(ErrorCode::ConfigError, "unable to parse host key \"" + path.string() + "\"");
        }
        SshKeyPtr key(raw);
        try
        {
            auto public_key = public_key_from_ssh_key(key.get());
            return HostKey{.path = path, .public_key = std::move(public_key), .private_key = std::move(key)};
        }
        catch (const Error &error)
        {
            throw Error(ErrorCode::ConfigError,
                        "unable to parse host key \"" + path.string() + "\": " + error.what());
        }
    }

    std::vector<HostKey> load_host_keys(const std::vector<std::string> &configured,
                                        const std::filesystem::path &config_dir,
                                        const HostKeyOptions &options)
    {
        std::vector<std::pair<std::filesystem::path, const KeyType *>> candidates;
        if (configured.empty())
        {
            for (const auto &type : kDefaultKeys)
            {
                candidates.emplace_back(config_dir / default_key_name(type), &type);
            }
        }
        else
        {
            for (const auto &entry : configured)
            {
                const std::filesystem::path path(entry);
                if (path.is_absolute())
                {
                    candidates.emplace_back(path, default_key_for_name(path.filename().string()));
                }
                else
                {
                    candidates.emplace_back(config_dir / path, nullptr);
                }
            }
        }

        std::vector<HostKey> keys;
        for (const auto &[path, default_type] : candidates)
        {
            std::error_code ec;
            if (default_type != nullptr && !std::filesystem::exists(path, ec))
            {
                try
                {
                    keys.push_back(generate_host_key(*default_type, path, options));
                }
                catch (const std::exception &ex)
                {
                    throw Error(ErrorCode::ConfigError,
                                "unable to create host key \"" + path.string() + "\": " + ex.what());
                }
                continue;
            }
            auto key = load_host_key(path);
            spdlog::info("Loaded host key {} ({}, {})", path.string(), key.public_key.type,
                         key.public_key.fingerprint());
            keys.push_back(std::move(key));
        }
        return keys;
    }

    CertificateChecker CertificateChecker::load(const std::vector<std::string> &ca_files,
                                                const std::filesystem::path &config_dir)
    {
        CertificateChecker checker;
        for (const auto &entry : ca_files)
        {
            std::filesystem::path path(entry);
            if (path.is_relative())
            {
                path = config_dir / path;
            }
            try
            {
                checker.add_authority(read_authorized_key_file(path));
            }
            catch (const Error &error)
            {
                if (error.code() == ErrorCode::ConfigError)
                {
                    throw;
                }
                throw Error(ErrorCode::ConfigError,
                            "unable to parse trusted CA key \"" + path.string() + "\": " + error.what());
            }
            spdlog::info("Loaded trusted user CA {}", path.string());
        }
        return checker;
    }

    void CertificateChecker::add_authority(PublicKey key)
    {
        if (key.is_certificate())
        {
            throw Error(ErrorCode::ConfigError, "a certificate cannot be used as certificate authority");
        }
        authorities_.push_back(std::move(key));
    }

    bool CertificateChecker::is_authority(const PublicKey &key) const
    {
        return std::find(authorities_.begin(), authorities_.end(), key) != authorities_.end();
    }

    Certificate CertificateChecker::check_user_certificate(const PublicKey &key, const std::string &username,
                                                           std::chrono::system_clock::time_point now) const
    {
        if (!key.is_certificate())
        {
            throw Error(ErrorCode::PermissionDenied, "public key is not a certificate");
        }
        Certificate cert;
        try
        {
            cert = parse_certificate(key.blob);
        }
        catch (const Error &error)
        {
            throw Error(ErrorCode::PermissionDenied, error.what());
        }
        if (cert.cert_type != kUserCertificate)
        {
            throw Error(ErrorCode::PermissionDenied, "certificate is not a user certificate");
        }
        if (!cert.principals.empty() &&
            std::find(cert.principals.begin(), cert.principals.end(), username) == cert.principals.end())
        {
            throw Error(ErrorCode::PermissionDenied, "principal \"" + username + "\" not in the set of valid principals");
        }
        if (!cert.is_valid_at(now))
        {
            throw Error(ErrorCode::PermissionDenied, "certificate is expired or not yet valid");
        }
        if (!is_authority(cert.signature_key))
        {
            throw Error(ErrorCode::PermissionDenied, "certificate signed by unrecognized authority");
        }
        bool verified = false;
        try
        {
            verified = verify_ssh_signature(cert.signature_key, cert.signed_data, cert.signature);
        }
        catch (const Error &error)
        {
            throw Error(ErrorCode::PermissionDenied, std::string("certificate signature check failed: ") + error.what());
        }
        if (!verified)
        {
            throw Error(ErrorCode::PermissionDenied, "certificate signature does not verify");
        }
        return cert;
    }

} // namespace sftpgate::server
