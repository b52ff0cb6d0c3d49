#include "sftpgate/server/ssh_keys.hpp"

#include <array>
#include <memory>

#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/param_build.h>

#include "sftpgate/encoding/base64.hpp"
#include "sftpgate/error_codes.hpp"
#include "sftpgate/wire.hpp"

namespace sftpgate::server
{

    namespace
    {

        constexpr std::string_view kCertSuffix = "-cert-v01@openssh.com";

        struct CurveName
        {
            std::string_view ssh;
            const char *openssl;
        };

        constexpr std::array<CurveName, 3> kCurves{{
            {"nistp256", SN_X9_62_prime256v1},
            {"nistp384", SN_secp384r1},
            {"nistp521", SN_secp521r1},
        }};

        struct ParamBldFree
        {
            void operator()(OSSL_PARAM_BLD *bld) const { ::OSSL_PARAM_BLD_free(bld); }
        };

        struct ParamFree
        {
            void operator()(OSSL_PARAM *params) const { ::OSSL_PARAM_free(params); }
        };

        struct PkeyCtxFree
        {
            void operator()(EVP_PKEY_CTX *ctx) const { ::EVP_PKEY_CTX_free(ctx); }
        };

        struct MdCtxFree
        {
            void operator()(EVP_MD_CTX *ctx) const { ::EVP_MD_CTX_free(ctx); }
        };

        struct EcdsaSigFree
        {
            void operator()(ECDSA_SIG *sig) const { ::ECDSA_SIG_free(sig); }
        };

        openssl::BigNumPtr to_bignum(std::span<const std::uint8_t> mpint)
        {
            openssl::BigNumPtr number(::BN_bin2bn(mpint.data(), static_cast<int>(mpint.size()), nullptr));
            if (!number)
            {
                openssl::throw_last_error("BN_bin2bn");
            }
            return number;
        }

        std::vector<std::uint8_t> bignum_bytes(const BIGNUM *number)
        {
            std::vector<std::uint8_t> bytes(static_cast<std::size_t>(BN_num_bytes(number)));
            ::BN_bn2bin(number, bytes.data());
            return bytes;
        }

        openssl::BigNumPtr pkey_bignum(EVP_PKEY *pkey, const char *name)
        {
            BIGNUM *number = nullptr;
            if (::EVP_PKEY_get_bn_param(pkey, name, &number) != 1)
            {
                openssl::throw_last_error("EVP_PKEY_get_bn_param");
            }
            return openssl::BigNumPtr(number);
        }

        const char *openssl_curve(std::string_view ssh_curve)
        {
            for (const auto &curve : kCurves)
            {
                if (curve.ssh == ssh_curve)
                {
                    return curve.openssl;
                }
            }
            throw Error(ErrorCode::SyntaxError, "unsupported elliptic curve: " + std::string(ssh_curve));
        }

        std::string_view ssh_curve(std::string_view openssl_curve_name)
        {
            for (const auto &curve : kCurves)
            {
                if (curve.openssl == openssl_curve_name)
                {
                    return curve.ssh;
                }
            }
            throw Error(ErrorCode::SyntaxError, "unsupported elliptic curve: " + std::string(openssl_curve_name));
        }

        openssl::PkeyPtr pkey_from_params(const char *key_type, OSSL_PARAM_BLD *bld)
        {
            std::unique_ptr<OSSL_PARAM, ParamFree> params(::OSSL_PARAM_BLD_to_param(bld));
            if (!params)
            {
                openssl::throw_last_error("OSSL_PARAM_BLD_to_param");
            }
            std::unique_ptr<EVP_PKEY_CTX, PkeyCtxFree> ctx(::EVP_PKEY_CTX_new_from_name(nullptr, key_type, nullptr));
            if (!ctx)
            {
                openssl::throw_last_error("EVP_PKEY_CTX_new_from_name");
            }
            if (::EVP_PKEY_fromdata_init(ctx.get()) != 1)
            {
                openssl::throw_last_error("EVP_PKEY_fromdata_init");
            }
            EVP_PKEY *pkey = nullptr;
            if (::EVP_PKEY_fromdata(ctx.get(), &pkey, EVP_PKEY_PUBLIC_KEY, params.get()) != 1)
            {
                openssl::throw_last_error("EVP_PKEY_fromdata");
            }
            return openssl::PkeyPtr(pkey, ::EVP_PKEY_free);
        }

        std::unique_ptr<OSSL_PARAM_BLD, ParamBldFree> new_param_bld()
        {
            std::unique_ptr<OSSL_PARAM_BLD, ParamBldFree> bld(::OSSL_PARAM_BLD_new());
            if (!bld)
            {
                openssl::throw_last_error("OSSL_PARAM_BLD_new");
            }
            return bld;
        }

        const EVP_MD *digest_for_signature(const PublicKey &key, std::string_view format)
        {
            if (key.type == "ssh-rsa")
            {
                if (format == "rsa-sha2-256")
                {
                    return ::EVP_sha256();
                }
                if (format == "rsa-sha2-512")
                {
                    return ::EVP_sha512();
                }
                if (format == "ssh-rsa")
                {
                    return ::EVP_sha1();
                }
            }
            else if (format == key.type)
            {
                if (format == "ssh-ed25519")
                {
                    return nullptr;
                }
                if (format == "ecdsa-sha2-nistp256")
                {
                    return ::EVP_sha256();
                }
                if (format == "ecdsa-sha2-nistp384")
                {
                    return ::EVP_sha384();
                }
                if (format == "ecdsa-sha2-nistp521")
                {
                    return ::EVP_sha512();
                }
            }
            throw Error(ErrorCode::SyntaxError, "signature format " + std::string(format) + " does not match key type " +
                                                    key.type);
        }

        // SSH carries ECDSA signatures as two mpints, OpenSSL expects DER.
        std::vector<std::uint8_t> ecdsa_signature_to_der(std::span<const std::uint8_t> signature)
        {
            wire::Reader reader(signature);
            auto r = to_bignum(reader.read_bytes());
            auto s = to_bignum(reader.read_bytes());
            std::unique_ptr<ECDSA_SIG, EcdsaSigFree> sig(::ECDSA_SIG_new());
            if (!sig)
            {
                openssl::throw_last_error("ECDSA_SIG_new");
            }
            if (::ECDSA_SIG_set0(sig.get(), r.get(), s.get()) != 1)
            {
                openssl::throw_last_error("ECDSA_SIG_set0");
            }
            r.release();
            s.release();

            const int length = ::i2d_ECDSA_SIG(sig.get(), nullptr);
            if (length <= 0)
            {
                openssl::throw_last_error("i2d_ECDSA_SIG");
            }
            std::vector<std::uint8_t> der(static_cast<std::size_t>(length));
            auto *out = der.data();
            ::i2d_ECDSA_SIG(sig.get(), &out);
            return der;
        }

        // Copies the algorithm specific public fields of a key or certificate blob.
        void copy_key_fields(std::string_view base_type, wire::Reader &reader, wire::Writer &writer)
        {
            if (base_type == "ssh-rsa")
            {
                writer.put_bytes(reader.read_bytes());
                writer.put_bytes(reader.read_bytes());
            }
            else if (base_type.starts_with("ecdsa-sha2-"))
            {
                writer.put_bytes(reader.read_bytes());
                writer.put_bytes(reader.read_bytes());
            }
            else if (base_type == "ssh-ed25519")
            {
                writer.put_bytes(reader.read_bytes());
            }
            else
            {
                throw Error(ErrorCode::SyntaxError, "unsupported key type: " + std::string(base_type));
            }
        }

    } // namespace

    bool PublicKey::is_certificate() const
    {
        return type.ends_with(kCertSuffix);
    }

    std::string PublicKey::fingerprint() const
    {
        std::array<std::uint8_t, EVP_MAX_MD_SIZE> md{};
        unsigned int length = 0;
        if (::EVP_Digest(blob.data(), blob.size(), md.data(), &length, ::EVP_sha256(), nullptr) != 1)
        {
            openssl::throw_last_error("EVP_Digest");
        }
        auto encoded = encoding::encode_base64(std::span<const std::uint8_t>(md.data(), length));
        while (!encoded.empty() && encoded.back() == '=')
        {
            encoded.pop_back();
        }
        return "SHA256:" + encoded;
    }

    std::string PublicKey::authorized_key() const
    {
        auto line = type + " " + encoding::encode_base64(blob);
        if (!comment.empty())
        {
            line += " " + comment;
        }
        return line;
    }

    PublicKey public_key_from_blob(std::span<const std::uint8_t> blob)
    {
        PublicKey key;
        try
        {
            wire::Reader reader(blob);
            key.type = reader.read_string();
        }
        catch (const Error &)
        {
            throw Error(ErrorCode::SyntaxError, "invalid public key blob");
        }
        if (key.type.empty())
        {
            throw Error(ErrorCode::SyntaxError, "invalid public key blob");
        }
        key.blob.assign(blob.begin(), blob.end());
        return key;
    }

    PublicKey parse_authorized_key(std::string_view line)
    {
        while (!line.empty() && (line.front() == ' ' || line.front() == '\t'))
        {
            line.remove_prefix(1);
        }
        while (!line.empty() && (line.back() == '\n' || line.back() == '\r' || line.back() == ' '))
        {
            line.remove_suffix(1);
        }
        const auto type_end = line.find(' ');
        if (line.empty() || type_end == std::string_view::npos)
        {
            throw Error(ErrorCode::SyntaxError, "invalid authorized key");
        }
        const auto declared_type = line.substr(0, type_end);
        auto rest = line.substr(type_end + 1);
        const auto data_end = rest.find(' ');
        const auto encoded = rest.substr(0, data_end);

        auto key = public_key_from_blob(encoding::decode_base64(encoded));
        if (key.type != declared_type)
        {
            throw Error(ErrorCode::SyntaxError, "key type mismatch: declared " + std::string(declared_type) +
                                                    ", found " + key.type);
        }
        if (data_end != std::string_view::npos)
        {
            key.comment = std::string(rest.substr(data_end + 1));
        }
        return key;
    }

    PublicKey public_key_from_pkey(EVP_PKEY *pkey)
    {
        wire::Writer writer;
        switch (::EVP_PKEY_get_base_id(pkey))
        {
        case EVP_PKEY_RSA:
        {
            const auto e = pkey_bignum(pkey, OSSL_PKEY_PARAM_RSA_E);
            const auto n = pkey_bignum(pkey, OSSL_PKEY_PARAM_RSA_N);
            writer.put_string("ssh-rsa").put_mpint(bignum_bytes(e.get())).put_mpint(bignum_bytes(n.get()));
            break;
        }
        case EVP_PKEY_EC:
        {
            std::array<char, 64> group{};
            std::size_t group_length = 0;
            if (::EVP_PKEY_get_utf8_string_param(pkey, OSSL_PKEY_PARAM_GROUP_NAME, group.data(), group.size(),
                                                 &group_length) != 1)
            {
                openssl::throw_last_error("EVP_PKEY_get_utf8_string_param");
            }
            const auto curve = ssh_curve(std::string_view(group.data(), group_length));
            std::size_t point_length = 0;
            if (::EVP_PKEY_get_octet_string_param(pkey, OSSL_PKEY_PARAM_ENCODED_PUBLIC_KEY, nullptr, 0,
                                                  &point_length) != 1)
            {
                openssl::throw_last_error("EVP_PKEY_get_octet_string_param");
            }
            std::vector<std::uint8_t> point(point_length);
            if (::EVP_PKEY_get_octet_string_param(pkey, OSSL_PKEY_PARAM_ENCODED_PUBLIC_KEY, point.data(), point.size(),
                                                  &point_length) != 1)
            {
                openssl::throw_last_error("EVP_PKEY_get_octet_string_param");
            }
            writer.put_string("ecdsa-sha2-" + std::string(curve)).put_string(curve).put_bytes(point);
            break;
        }
        case EVP_PKEY_ED25519:
        {
            std::size_t length = 0;
            if (::EVP_PKEY_get_raw_public_key(pkey, nullptr, &length) != 1)
            {
                openssl::throw_last_error("EVP_PKEY_get_raw_public_key");
            }
            std::vector<std::uint8_t> raw(length);
            if (::EVP_PKEY_get_raw_public_key(pkey, raw.data(), &length) != 1)
            {
                openssl::throw_last_error("EVP_PKEY_get_raw_public_key");
            }
            writer.put_string("ssh-ed25519").put_bytes(raw);
            break;
        }
        default:
            throw Error(ErrorCode::SyntaxError, "unsupported private key algorithm");
        }
        return public_key_from_blob(writer.data());
    }

    openssl::PkeyPtr pkey_from_public_key(const PublicKey &key)
    {
        wire::Reader reader(key.blob);
        const auto type = reader.read_string();
        if (type == "ssh-rsa")
        {
            const auto e = to_bignum(reader.read_bytes());
            const auto n = to_bignum(reader.read_bytes());
            auto bld = new_param_bld();
            if (::OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_N, n.get()) != 1 ||
                ::OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_E, e.get()) != 1)
            {
                openssl::throw_last_error("OSSL_PARAM_BLD_push_BN");
            }
            return pkey_from_params("RSA", bld.get());
        }
        if (type.starts_with("ecdsa-sha2-"))
        {
            const auto curve = reader.read_string();
            if (type != "ecdsa-sha2-" + curve)
            {
                throw Error(ErrorCode::SyntaxError, "curve mismatch in " + type + " key");
            }
            const auto point = reader.read_bytes();
            auto bld = new_param_bld();
            if (::OSSL_PARAM_BLD_push_utf8_string(bld.get(), OSSL_PKEY_PARAM_GROUP_NAME, openssl_curve(curve), 0) != 1)
            {
                openssl::throw_last_error("OSSL_PARAM_BLD_push_utf8_string");
            }
            if (::OSSL_PARAM_BLD_push_octet_string(bld.get(), OSSL_PKEY_PARAM_PUB_KEY, point.data(), point.size()) != 1)
            {
                openssl::throw_last_error("OSSL_PARAM_BLD_push_octet_string");
            }
            return pkey_from_params("EC", bld.get());
        }
        if (type == "ssh-ed25519")
        {
            const auto raw = reader.read_bytes();
            EVP_PKEY *pkey = ::EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, raw.data(), raw.size());
            if (pkey == nullptr)
            {
                openssl::throw_last_error("EVP_PKEY_new_raw_public_key");
            }
            return openssl::PkeyPtr(pkey, ::EVP_PKEY_free);
        }
        throw Error(ErrorCode::SyntaxError, "unsupported key type: " + type);
    }

    bool verify_ssh_signature(const PublicKey &key, std::span<const std::uint8_t> data,
                              std::span<const std::uint8_t> signature)
    {
        wire::Reader reader(signature);
        const auto format = reader.read_string();
        const auto raw_signature = reader.read_bytes();
        const auto *md = digest_for_signature(key, format);
        const auto pkey = pkey_from_public_key(key);

        std::vector<std::uint8_t> der;
        auto signature_bytes = raw_signature;
        if (format.starts_with("ecdsa-sha2-"))
        {
            der = ecdsa_signature_to_der(raw_signature);
            signature_bytes = der;
        }

        std::unique_ptr<EVP_MD_CTX, MdCtxFree> ctx(::EVP_MD_CTX_new());
        if (!ctx)
        {
            openssl::throw_last_error("EVP_MD_CTX_new");
        }
        if (::EVP_DigestVerifyInit(ctx.get(), nullptr, md, nullptr, pkey.get()) != 1)
        {
            openssl::throw_last_error("EVP_DigestVerifyInit");
        }
        const int result = ::EVP_DigestVerify(ctx.get(), signature_bytes.data(), signature_bytes.size(), data.data(),
                                              data.size());
        if (result != 1)
        {
            ::ERR_clear_error();
        }
        return result == 1;
    }

    bool Certificate::is_valid_at(std::chrono::system_clock::time_point now) const
    {
        const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
        const auto unix_now = seconds < 0 ? 0u : static_cast<std::uint64_t>(seconds);
        return valid_after <= unix_now && unix_now < valid_before;
    }

    Certificate parse_certificate(std::span<const std::uint8_t> blob)
    {
        Certificate cert;
        try
        {
            wire::Reader reader(blob);
            cert.type = reader.read_string();
            if (!cert.type.ends_with(kCertSuffix))
            {
                throw Error(ErrorCode::SyntaxError, "not a certificate: " + cert.type);
            }
            const auto base_type = cert.type.substr(0, cert.type.size() - kCertSuffix.size());
            reader.read_bytes(); // nonce

            wire::Writer key_writer;
            key_writer.put_string(base_type);
            copy_key_fields(base_type, reader, key_writer);
            cert.key = public_key_from_blob(key_writer.data());

            cert.serial = reader.read_u64();
            cert.cert_type = reader.read_u32();
            cert.key_id = reader.read_string();
            wire::Reader principals(reader.read_bytes());
            while (!principals.empty())
            {
                cert.principals.push_back(principals.read_string());
            }
            cert.valid_after = reader.read_u64();
            cert.valid_before = reader.read_u64();
            reader.read_bytes(); // critical options
            reader.read_bytes(); // extensions
            reader.read_bytes(); // reserved
            cert.signature_key = public_key_from_blob(reader.read_bytes());
            const auto signed_length = reader.offset();
            const auto signature = reader.read_bytes();
            cert.signature.assign(signature.begin(), signature.end());
            cert.signed_data.assign(blob.begin(), blob.begin() + static_cast<std::ptrdiff_t>(signed_length));
        }
        catch (const Error &error)
        {
            if (error.code() == ErrorCode::SyntaxError)
            {
                throw;
            }
            throw Error(ErrorCode::SyntaxError, std::string("invalid certificate: ") + error.what());
        }
        return cert;
    }

} // namespace sftpgate::server
