#include "sftpgate/server/vpath.hpp"

namespace sftpgate::server::vpath
{

    std::string clean(std::string_view path)
    {
        std::vector<std::string_view> segments;
        std::size_t position = 0;
        while (position <= path.size())
        {
            auto next = path.find('/', position);
            if (next == std::string_view::npos)
            {
                next = path.size();
            }
            const auto segment = path.substr(position, next - position);
            position = next + 1;

            if (segment.empty() || segment == ".")
            {
                continue;
            }
            if (segment == "..")
            {
                if (!segments.empty())
                {
                    segments.pop_back();
                }
                continue;
            }
            segments.push_back(segment);
        }

        if (segments.empty())
        {
            return "/";
        }
        std::string result;
        for (const auto segment : segments)
        {
            result.push_back('/');
            result.append(segment);
        }
        return result;
    }

    std::string dir(std::string_view path)
    {
        const auto cleaned = clean(path);
        const auto slash = cleaned.rfind('/');
        if (slash == 0 || slash == std::string::npos)
        {
            return "/";
        }
        return cleaned.substr(0, slash);
    }

    std::string base(std::string_view path)
    {
        const auto cleaned = clean(path);
        if (cleaned == "/")
        {
            return cleaned;
        }
        return cleaned.substr(cleaned.rfind('/') + 1);
    }

    std::string join(std::string_view parent, std::string_view child)
    {
        std::string combined(parent);
        combined.push_back('/');
        combined.append(child);
        return clean(combined);
    }

    std::vector<std::string> dirs_for(std::string_view path)
    {
        std::vector<std::string> result;
        auto current = clean(path);
        result.push_back(current);
        while (current != "/")
        {
            current = dir(current);
            result.push_back(current);
        }
        return result;
    }

    bool is_within(std::string_view path, std::string_view root)
    {
        if (root == "/")
        {
            return true;
        }
        if (path == root)
        {
            return true;
        }
        return path.size() > root.size() && path.starts_with(root) && path[root.size()] == '/';
    }

    bool has_trailing_slash(std::string_view path) noexcept
    {
        return !path.empty() && path.back() == '/';
    }

} // namespace sftpgate::server::vpath
