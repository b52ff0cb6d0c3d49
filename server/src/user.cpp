#include "sftpgate/server/user.hpp"

#include <algorithm>
#include <array>
#include <cctype>

#include "sftpgate/server/vpath.hpp"

namespace sftpgate::server
{

    namespace
    {

        constexpr std::array<std::string_view, 12> kPermissions{
            permission::kAny, permission::kList, permission::kDownload, permission::kUpload,
            permission::kOverwrite, permission::kDelete, permission::kRename, permission::kCreateDirs,
            permission::kCreateSymlinks, permission::kChmod, permission::kChown, permission::kChtimes};

        std::string to_lower(std::string_view value)
        {
            std::string result(value);
            std::transform(result.begin(), result.end(), result.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return result;
        }

    } // namespace

    bool permission::is_valid(std::string_view name) noexcept
    {
        return std::find(kPermissions.begin(), kPermissions.end(), name) != kPermissions.end();
    }

    bool VirtualFolder::has_no_quota_restrictions(bool check_files) const noexcept
    {
        return quota_size == 0 && (!check_files || quota_files == 0);
    }

    std::vector<std::string> User::permissions_for_path(std::string_view virtual_path) const
    {
        for (const auto &dir : vpath::dirs_for(virtual_path))
        {
            const auto it = permissions.find(dir);
            if (it != permissions.end())
            {
                return it->second;
            }
        }
        return {};
    }

    bool User::has_perm(std::string_view permission, std::string_view virtual_path) const
    {
        const auto granted = permissions_for_path(virtual_path);
        return std::any_of(granted.begin(), granted.end(), [permission](const std::string &entry)
                           { return entry == permission::kAny || entry == permission; });
    }

    bool User::has_perms(std::initializer_list<std::string_view> required, std::string_view virtual_path) const
    {
        const auto granted = permissions_for_path(virtual_path);
        if (std::find(granted.begin(), granted.end(), permission::kAny) != granted.end())
        {
            return true;
        }
        return std::all_of(required.begin(), required.end(), [&granted](std::string_view permission)
                           { return std::find(granted.begin(), granted.end(), permission) != granted.end(); });
    }

    bool User::has_permissions_inside(std::string_view virtual_path) const
    {
        for (const auto &[dir, _] : permissions)
        {
            if (dir == virtual_path)
            {
                return true;
            }
            if (dir.size() > virtual_path.size() && virtual_path != "/" && vpath::is_within(dir, virtual_path))
            {
                return true;
            }
        }
        return false;
    }

    const ExtensionsFilter *User::extension_filter_for_dir(std::string_view virtual_dir) const
    {
        for (const auto &dir : vpath::dirs_for(virtual_dir))
        {
            for (const auto &filter : extension_filters)
            {
                if (filter.path == dir)
                {
                    return &filter;
                }
            }
        }
        return nullptr;
    }

    bool User::is_file_allowed(std::string_view virtual_path) const
    {
        if (extension_filters.empty())
        {
            return true;
        }
        const auto *filter = extension_filter_for_dir(vpath::dir(virtual_path));
        if (filter == nullptr)
        {
            return true;
        }
        const auto name = to_lower(virtual_path);
        for (const auto &denied : filter->denied)
        {
            if (name.ends_with(to_lower(denied)))
            {
                return false;
            }
        }
        for (const auto &allowed : filter->allowed)
        {
            if (name.ends_with(to_lower(allowed)))
            {
                return true;
            }
        }
        return filter->allowed.empty();
    }

    std::optional<VirtualFolder> User::virtual_folder_for_path(std::string_view virtual_path) const
    {
        if (virtual_path == "/")
        {
            return std::nullopt;
        }
        for (const auto &folder : virtual_folders)
        {
            if (vpath::is_within(virtual_path, folder.virtual_path))
            {
                return folder;
            }
        }
        return std::nullopt;
    }

    bool User::is_virtual_folder(std::string_view virtual_path) const
    {
        return std::any_of(virtual_folders.begin(), virtual_folders.end(), [virtual_path](const VirtualFolder &folder)
                           { return folder.virtual_path == virtual_path; });
    }

    bool User::is_mapped_path(const std::filesystem::path &real_path) const
    {
        const auto normalized = real_path.lexically_normal();
        return std::any_of(virtual_folders.begin(), virtual_folders.end(), [&normalized](const VirtualFolder &folder)
                           { return folder.mapped_path.lexically_normal() == normalized; });
    }

    bool User::has_virtual_folders_inside(std::string_view virtual_path) const
    {
        if (virtual_path == "/")
        {
            return !virtual_folders.empty();
        }
        return std::any_of(virtual_folders.begin(), virtual_folders.end(), [virtual_path](const VirtualFolder &folder)
                           { return folder.virtual_path.size() > virtual_path.size() &&
                                    vpath::is_within(folder.virtual_path, virtual_path); });
    }

    std::vector<std::string> User::virtual_dirs_in(std::string_view virtual_dir) const
    {
        std::vector<std::string> names;
        const auto cleaned = vpath::clean(virtual_dir);
        for (const auto &folder : virtual_folders)
        {
            if (folder.virtual_path != "/" && vpath::dir(folder.virtual_path) == cleaned)
            {
                names.push_back(vpath::base(folder.virtual_path));
            }
        }
        return names;
    }

    bool User::has_no_quota_restrictions(bool check_files) const noexcept
    {
        return quota_size == 0 && (!check_files || quota_files == 0);
    }

} // namespace sftpgate::server
