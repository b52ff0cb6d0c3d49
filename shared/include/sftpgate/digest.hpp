/**
 * sftpgate - Streaming message digests (OpenSSL EVP) for the hash commands.
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

struct evp_md_ctx_st;

namespace sftpgate::digest
{

    enum class Algorithm : std::uint8_t
    {
        Md5,
        Sha1,
        Sha256,
        Sha384,
        Sha512
    };

    std::string_view to_string(Algorithm algorithm) noexcept;

    std::optional<Algorithm> algorithm_from_string(std::string_view name) noexcept;

    class Digest
    {
    public:
        explicit Digest(Algorithm algorithm);
        ~Digest();

        Digest(const Digest &) = delete;
        Digest &operator=(const Digest &) = delete;

        void update(std::span<const std::uint8_t> data);

        // Lowercase hex; the digest cannot be updated afterwards.
        std::string final_hex();

    private:
        struct ContextFree
        {
            void operator()(evp_md_ctx_st *ctx) const;
        };

        std::unique_ptr<evp_md_ctx_st, ContextFree> ctx_;
        bool finished_{false};
    };

    std::string hash_bytes(Algorithm algorithm, std::span<const std::uint8_t> data);

    std::string hash_file(Algorithm algorithm, const std::filesystem::path &path);

    std::string to_hex(std::span<const std::uint8_t> data);

} // namespace sftpgate::digest
