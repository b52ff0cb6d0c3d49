#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace sftpgate::server
{

    struct ParsedCommand
    {
        std::string name;
        std::vector<std::string> args;
    };

    // Shell-like split honouring quotes and backslash escapes; throws SyntaxError.
    ParsedCommand parse_command_payload(std::string_view payload);

    // Strips quotes and cleans the path; a trailing "/" on the input is kept.
    std::string clean_command_path(std::string_view name);

    std::string join_args(const std::vector<std::string> &args);

} // namespace sftpgate::server
