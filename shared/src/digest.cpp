#include "sftpgate/digest.hpp"

#include <array>
#include <cerrno>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include <openssl/evp.h>

#include "sftpgate/error_codes.hpp"
#include "sftpgate/openssl_util.hpp"

namespace sftpgate::digest
{

    namespace
    {
        struct AlgorithmName
        {
            Algorithm algorithm;
            std::string_view name;
        };

        constexpr std::array<AlgorithmName, 5> kNames{{
            {Algorithm::Md5, "md5"},
            {Algorithm::Sha1, "sha1"},
            {Algorithm::Sha256, "sha256"},
            {Algorithm::Sha384, "sha384"},
            {Algorithm::Sha512, "sha512"},
        }};

        const EVP_MD *evp_for(Algorithm algorithm)
        {
            switch (algorithm)
            {
            case Algorithm::Md5:
                return ::EVP_md5();
            case Algorithm::Sha1:
                return ::EVP_sha1();
            case Algorithm::Sha256:
                return ::EVP_sha256();
            case Algorithm::Sha384:
                return ::EVP_sha384();
            case Algorithm::Sha512:
                return ::EVP_sha512();
            }
            return ::EVP_sha512();
        }

        class FileDescriptor
        {
        public:
            explicit FileDescriptor(int fd) : fd_(fd) {}
            ~FileDescriptor()
            {
                if (fd_ >= 0)
                {
                    ::close(fd_);
                }
            }
            FileDescriptor(const FileDescriptor &) = delete;
            FileDescriptor &operator=(const FileDescriptor &) = delete;

            int get() const noexcept { return fd_; }

        private:
            int fd_;
        };

    } // namespace

    std::string_view to_string(Algorithm algorithm) noexcept
    {
        for (const auto &entry : kNames)
        {
            if (entry.algorithm == algorithm)
            {
                return entry.name;
            }
        }
        return "unknown";
    }

    std::optional<Algorithm> algorithm_from_string(std::string_view name) noexcept
    {
        for (const auto &entry : kNames)
        {
            if (entry.name == name)
            {
                return entry.algorithm;
            }
        }
        return std::nullopt;
    }

    void Digest::ContextFree::operator()(evp_md_ctx_st *ctx) const
    {
        ::EVP_MD_CTX_free(ctx);
    }

    Digest::Digest(Algorithm algorithm) : ctx_(::EVP_MD_CTX_new())
    {
        if (!ctx_)
        {
            openssl::throw_last_error("EVP_MD_CTX_new");
        }
        if (::EVP_DigestInit_ex(ctx_.get(), evp_for(algorithm), nullptr) != 1)
        {
            openssl::throw_last_error("EVP_DigestInit_ex");
        }
    }

    Digest::~Digest() = default;

    void Digest::update(std::span<const std::uint8_t> data)
    {
        if (finished_)
        {
            throw Error(ErrorCode::GenericFailure, "digest already finalized");
        }
        if (::EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1)
        {
            openssl::throw_last_error("EVP_DigestUpdate");
        }
    }

    std::string Digest::final_hex()
    {
        if (finished_)
        {
            throw Error(ErrorCode::GenericFailure, "digest already finalized");
        }
        finished_ = true;
        std::array<std::uint8_t, EVP_MAX_MD_SIZE> output{};
        unsigned int length = 0;
        if (::EVP_DigestFinal_ex(ctx_.get(), output.data(), &length) != 1)
        {
            openssl::throw_last_error("EVP_DigestFinal_ex");
        }
        return to_hex(std::span<const std::uint8_t>(output.data(), length));
    }

    std::string hash_bytes(Algorithm algorithm, std::span<const std::uint8_t> data)
    {
        Digest digest(algorithm);
        digest.update(data);
        return digest.final_hex();
    }

    std::string hash_file(Algorithm algorithm, const std::filesystem::path &path)
    {
        FileDescriptor file(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
        if (file.get() < 0)
        {
            throw_errno(errno, "unable to open " + path.string());
        }

        Digest digest(algorithm);
        std::vector<std::uint8_t> buffer(64 * 1024);
        while (true)
        {
            const auto read_count = ::read(file.get(), buffer.data(), buffer.size());
            if (read_count < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                throw_errno(errno, "unable to read " + path.string());
            }
            if (read_count == 0)
            {
                break;
            }
            digest.update(std::span<const std::uint8_t>(buffer.data(), static_cast<std::size_t>(read_count)));
        }
        return digest.final_hex();
    }

    std::string to_hex(std::span<const std::uint8_t> data)
    {
        static constexpr char kHexDigits[] = "0123456789abcdef";
        std::string result;
        result.resize(data.size() * 2);
        for (std::size_t i = 0; i < data.size(); ++i)
        {
            const auto byte = data[i];
            result[2 * i] = kHexDigits[(byte >> 4) & 0x0F];
            result[2 * i + 1] = kHexDigits[byte & 0x0F];
        }
        return result;
    }

} // namespace sftpgate::digest
