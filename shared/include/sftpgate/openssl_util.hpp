#pragma once

#include <memory>
#include <string>

#include <openssl/bn.h>
#include <openssl/evp.h>

namespace sftpgate::openssl
{

    struct BnFree
    {
        void operator()(BIGNUM *num) const { ::BN_free(num); }
    };

    using BigNumPtr = std::unique_ptr<BIGNUM, BnFree>;
    using PkeyPtr = std::shared_ptr<EVP_PKEY>;

    // Latest error of the thread's OpenSSL queue; clears the queue.
    std::string format_last_error(const char *function_name);

    // Throws sftpgate::Error(GenericFailure) carrying format_last_error().
    [[noreturn]] void throw_last_error(const char *function_name);

} // namespace sftpgate::openssl
