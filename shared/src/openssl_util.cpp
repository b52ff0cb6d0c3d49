#include "sftpgate/openssl_util.hpp"

#include <openssl/err.h>

#include "sftpgate/error_codes.hpp"

namespace sftpgate::openssl
{

    std::string format_last_error(const char *function_name)
    {
        const auto ec = ::ERR_peek_last_error();
        ::ERR_clear_error();
        std::string message = std::string(function_name) + " failed";
        if (ec != 0)
        {
            char buffer[256] = {};
            ::ERR_error_string_n(ec, buffer, sizeof(buffer));
            message += ": ";
            message += buffer;
        }
        return message;
    }

    void throw_last_error(const char *function_name)
    {
        throw Error(ErrorCode::GenericFailure, format_last_error(function_name));
    }

} // namespace sftpgate::openssl
