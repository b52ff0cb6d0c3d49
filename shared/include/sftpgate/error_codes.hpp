/**
 * sftpgate - Error vocabulary shared by every protocol layer.
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace sftpgate
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        SyntaxError = 1,
        PathError = 2,
        PermissionDenied = 3,
        NotFound = 4,
        QuotaExceeded = 5,
        Unsupported = 6,
        InvalidOffset = 7,
        TransferClosed = 8,
        GenericFailure = 9,
        ConfigError = 10,
        ShortWrite = 11,
        Eof = 12
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

    class Error : public std::runtime_error
    {
    public:
        Error(ErrorCode code, const std::string &message);
        explicit Error(ErrorCode code);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

    // Maps an errno value to the closest code.
    ErrorCode error_code_from_errno(int error_number) noexcept;

    [[noreturn]] void throw_errno(int error_number, const std::string &context);

} // namespace sftpgate
