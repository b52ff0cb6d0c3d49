#pragma once

#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sftpgate::server
{

    namespace permission
    {
        inline constexpr std::string_view kAny = "*";
        inline constexpr std::string_view kList = "list";
        inline constexpr std::string_view kDownload = "download";
        inline constexpr std::string_view kUpload = "upload";
        inline constexpr std::string_view kOverwrite = "overwrite";
        inline constexpr std::string_view kDelete = "delete";
        inline constexpr std::string_view kRename = "rename";
        inline constexpr std::string_view kCreateDirs = "create_dirs";
        inline constexpr std::string_view kCreateSymlinks = "create_symlinks";
        inline constexpr std::string_view kChmod = "chmod";
        inline constexpr std::string_view kChown = "chown";
        inline constexpr std::string_view kChtimes = "chtimes";

        bool is_valid(std::string_view name) noexcept;
    } // namespace permission

    struct VirtualFolder
    {
        std::string name;
        std::string virtual_path;
        std::filesystem::path mapped_path;
        std::int64_t quota_size{0};
        int quota_files{0};
        // When true usage is also charged to the owning user.
        bool included_in_user_quota{true};

        bool has_no_quota_restrictions(bool check_files) const noexcept;
    };

    struct ExtensionsFilter
    {
        std::string path;
        std::vector<std::string> allowed;
        std::vector<std::string> denied;
    };

    struct User
    {
        std::string username;
        std::string password_hash;
        std::vector<std::string> public_keys;
        std::filesystem::path home_dir;
        std::map<std::string, std::vector<std::string>> permissions;
        std::int64_t quota_size{0};
        int quota_files{0};
        std::int64_t used_quota_size{0};
        int used_quota_files{0};
        std::int64_t max_upload_file_size{0};
        std::vector<VirtualFolder> virtual_folders;
        std::vector<ExtensionsFilter> extension_filters;
        bool enabled{true};

        // Permissions of the nearest configured ancestor directory.
        std::vector<std::string> permissions_for_path(std::string_view virtual_path) const;
        bool has_perm(std::string_view permission, std::string_view virtual_path) const;
        bool has_perms(std::initializer_list<std::string_view> required, std::string_view virtual_path) const;
        bool has_permissions_inside(std::string_view virtual_path) const;

        bool is_file_allowed(std::string_view virtual_path) const;
        const ExtensionsFilter *extension_filter_for_dir(std::string_view virtual_dir) const;

        std::optional<VirtualFolder> virtual_folder_for_path(std::string_view virtual_path) const;
        bool is_virtual_folder(std::string_view virtual_path) const;
        bool is_mapped_path(const std::filesystem::path &real_path) const;
        bool has_virtual_folders_inside(std::string_view virtual_path) const;
        // Names of the virtual folders mounted directly below virtual_dir.
        std::vector<std::string> virtual_dirs_in(std::string_view virtual_dir) const;

        bool has_no_quota_restrictions(bool check_files) const noexcept;
    };

} // namespace sftpgate::server
