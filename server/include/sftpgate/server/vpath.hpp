#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace sftpgate::server::vpath
{

    // Lexical cleanup of "/" + path: collapses separators, "." and "..".
    std::string clean(std::string_view path);

    std::string dir(std::string_view path);

    // Last element of the cleaned path; "/" for the root.
    std::string base(std::string_view path);

    std::string join(std::string_view parent, std::string_view child);

    // The path itself followed by every ancestor up to "/".
    std::vector<std::string> dirs_for(std::string_view path);

    // True when path equals root or lives below it.
    bool is_within(std::string_view path, std::string_view root);

    bool has_trailing_slash(std::string_view path) noexcept;

} // namespace sftpgate::server::vpath
