#include "sftpgate/error_codes.hpp"

#include <array>
#include <cerrno>
#include <cstring>

namespace sftpgate
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 13> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::SyntaxError, "syntax error"},
            {ErrorCode::PathError, "invalid path"},
            {ErrorCode::PermissionDenied, "permission denied"},
            {ErrorCode::NotFound, "no such file or directory"},
            {ErrorCode::QuotaExceeded, "denying write due to space limit"},
            {ErrorCode::Unsupported, "operation unsupported"},
            {ErrorCode::InvalidOffset, "invalid write offset"},
            {ErrorCode::TransferClosed, "transfer already closed"},
            {ErrorCode::GenericFailure, "failure"},
            {ErrorCode::ConfigError, "invalid configuration"},
            {ErrorCode::ShortWrite, "short write"},
            {ErrorCode::Eof, "end of file"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::GenericFailure;
    }

    Error::Error(ErrorCode code, const std::string &message) : std::runtime_error(message), code_(code) {}

    Error::Error(ErrorCode code) : std::runtime_error(std::string(to_string(code))), code_(code) {}

    ErrorCode error_code_from_errno(int error_number) noexcept
    {
        switch (error_number)
        {
        case ENOENT:
        case ENOTDIR:
            return ErrorCode::NotFound;
        case EACCES:
        case EPERM:
            return ErrorCode::PermissionDenied;
        case EDQUOT:
        case EFBIG:
            return ErrorCode::QuotaExceeded;
        case ENOTSUP:
            return ErrorCode::Unsupported;
        default:
            return ErrorCode::GenericFailure;
        }
    }

    void throw_errno(int error_number, const std::string &context)
    {
        throw Error(error_code_from_errno(error_number), context + ": " + std::strerror(error_number));
    }

} // namespace sftpgate
