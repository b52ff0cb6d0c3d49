#include "sftpgate/server/user_store.hpp"

#include <fstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "sftpgate/crypto.hpp"
#include "sftpgate/error_codes.hpp"
#include "sftpgate/server/vpath.hpp"

namespace sftpgate::server
{

    void from_json(const nlohmann::json &json, VirtualFolder &folder)
    {
        json.at("name").get_to(folder.name);
        folder.virtual_path = vpath::clean(json.at("virtual_path").get<std::string>());
        folder.mapped_path = json.at("mapped_path").get<std::string>();
        folder.quota_size = json.value("quota_size", std::int64_t{0});
        folder.quota_files = json.value("quota_files", 0);
        folder.included_in_user_quota = json.value("included_in_user_quota", true);
    }

    void to_json(nlohmann::json &json, const VirtualFolder &folder)
    {
        json = nlohmann::json{
            {"name", folder.name},
            {"virtual_path", folder.virtual_path},
            {"mapped_path", folder.mapped_path.string()},
            {"quota_size", folder.quota_size},
            {"quota_files", folder.quota_files},
            {"included_in_user_quota", folder.included_in_user_quota},
        };
    }

    void from_json(const nlohmann::json &json, ExtensionsFilter &filter)
    {
        filter.path = vpath::clean(json.at("path").get<std::string>());
        filter.allowed = json.value("allowed_extensions", std::vector<std::string>{});
        filter.denied = json.value("denied_extensions", std::vector<std::string>{});
    }

    void to_json(nlohmann::json &json, const ExtensionsFilter &filter)
    {
        json = nlohmann::json{
            {"path", filter.path},
            {"allowed_extensions", filter.allowed},
            {"denied_extensions", filter.denied},
        };
    }

    void from_json(const nlohmann::json &json, User &user)
    {
        json.at("username").get_to(user.username);
        user.password_hash = json.value("password", std::string{});
        user.public_keys = json.value("public_keys", std::vector<std::string>{});
        user.home_dir = json.at("home_dir").get<std::string>();
        user.permissions.clear();
        for (const auto &[dir, perms] : json.at("permissions").items())
        {
            user.permissions[vpath::clean(dir)] = perms.get<std::vector<std::string>>();
        }
        user.quota_size = json.value("quota_size", std::int64_t{0});
        user.quota_files = json.value("quota_files", 0);
        user.used_quota_size = json.value("used_quota_size", std::int64_t{0});
        user.used_quota_files = json.value("used_quota_files", 0);
        user.max_upload_file_size = json.value("max_upload_file_size", std::int64_t{0});
        user.virtual_folders = json.value("virtual_folders", std::vector<VirtualFolder>{});
        user.extension_filters = json.value("filters", std::vector<ExtensionsFilter>{});
        user.enabled = json.value("enabled", true);
    }

    void to_json(nlohmann::json &json, const User &user)
    {
        json = nlohmann::json{
            {"username", user.username},
            {"password", user.password_hash},
            {"public_keys", user.public_keys},
            {"home_dir", user.home_dir.string()},
            {"permissions", user.permissions},
            {"quota_size", user.quota_size},
            {"quota_files", user.quota_files},
            {"used_quota_size", user.used_quota_size},
            {"used_quota_files", user.used_quota_files},
            {"max_upload_file_size", user.max_upload_file_size},
            {"virtual_folders", user.virtual_folders},
            {"filters", user.extension_filters},
            {"enabled", user.enabled},
        };
    }

    namespace
    {

        void validate_user(const User &user)
        {
            if (user.username.empty())
            {
                throw Error(ErrorCode::ConfigError, "user without username");
            }
            if (!user.home_dir.is_absolute())
            {
                throw Error(ErrorCode::ConfigError, "home dir of user \"" + user.username + "\" must be absolute");
            }
            if (!user.permissions.contains("/"))
            {
                throw Error(ErrorCode::ConfigError, "user \"" + user.username + "\" has no permissions for \"/\"");
            }
            for (const auto &[dir, perms] : user.permissions)
            {
                for (const auto &perm : perms)
                {
                    if (!permission::is_valid(perm))
                    {
                        throw Error(ErrorCode::ConfigError,
                                    "invalid permission \"" + perm + "\" for user \"" + user.username + "\"");
                    }
                }
            }
            for (const auto &folder : user.virtual_folders)
            {
                if (folder.virtual_path == "/" || !folder.mapped_path.is_absolute())
                {
                    throw Error(ErrorCode::ConfigError,
                                "invalid virtual folder \"" + folder.name + "\" for user \"" + user.username + "\"");
                }
            }
        }

    } // namespace

    UserStore::UserStore(std::filesystem::path users_file) : users_file_(std::move(users_file)) {}

    void UserStore::load()
    {
        std::ifstream in(users_file_);
        if (!in.is_open())
        {
            throw Error(ErrorCode::ConfigError, "unable to open users file " + users_file_.string());
        }
        std::unordered_map<std::string, User> users;
        std::map<std::string, QuotaUsage> folders;
        try
        {
            nlohmann::json json;
            in >> json;
            for (const auto &entry : json.at("users"))
            {
                auto user = entry.get<User>();
                validate_user(user);
                const auto name = user.username;
                if (!users.emplace(name, std::move(user)).second)
                {
                    throw Error(ErrorCode::ConfigError, "duplicate user \"" + name + "\"");
                }
            }
            if (const auto it = json.find("folders"); it != json.end())
            {
                for (const auto &[name, usage] : it->items())
                {
                    folders[name] = QuotaUsage{.files = usage.value("used_quota_files", 0),
                                               .size = usage.value("used_quota_size", std::int64_t{0})};
                }
            }
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw Error(ErrorCode::ConfigError, "unable to parse users file " + users_file_.string() + ": " + ex.what());
        }

        std::lock_guard lock(mutex_);
        users_ = std::move(users);
        folders_ = std::move(folders);
        spdlog::info("Loaded {} users from {}", users_.size(), users_file_.string());
    }

    std::optional<User> UserStore::find(const std::string &username) const
    {
        std::lock_guard lock(mutex_);
        const auto it = users_.find(username);
        if (it == users_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<User> UserStore::authenticate(const std::string &username, const std::string &password) const
    {
        auto user = find(username);
        if (!user || !user->enabled || user->password_hash.empty())
        {
            return std::nullopt;
        }
        if (!crypto::verify_password(password, user->password_hash))
        {
            return std::nullopt;
        }
        return user;
    }

    std::size_t UserStore::size() const
    {
        std::lock_guard lock(mutex_);
        return users_.size();
    }

    void UserStore::seed_quota(QuotaTracker &tracker) const
    {
        std::lock_guard lock(mutex_);
        for (const auto &[name, user] : users_)
        {
            tracker.seed_user(name, QuotaUsage{.files = user.used_quota_files, .size = user.used_quota_size});
        }
        for (const auto &[name, usage] : folders_)
        {
            tracker.seed_folder(name, usage);
        }
    }

    void UserStore::persist_usage(const QuotaTracker &tracker)
    {
        std::lock_guard lock(mutex_);
        for (const auto &[name, usage] : tracker.user_snapshot())
        {
            const auto it = users_.find(name);
            if (it != users_.end())
            {
                it->second.used_quota_files = usage.files;
                it->second.used_quota_size = usage.size;
            }
        }
        for (const auto &[name, user] : users_)
        {
            for (const auto &folder : user.virtual_folders)
            {
                folders_[folder.name] = tracker.folder_usage(folder.name);
            }
        }
        persist_locked();
    }

    void UserStore::persist_locked() const
    {
        nlohmann::json json = nlohmann::json::object();
        json["users"] = nlohmann::json::array();
        for (const auto &[name, user] : users_)
        {
            json["users"].push_back(user);
        }
        json["folders"] = nlohmann::json::object();
        for (const auto &[name, usage] : folders_)
        {
            json["folders"][name] = {{"used_quota_files", usage.files}, {"used_quota_size", usage.size}};
        }
        std::ofstream out(users_file_, std::ios::trunc);
        if (!out.is_open())
        {
            throw Error(ErrorCode::GenericFailure, "unable to write users file " + users_file_.string());
        }
        out << json.dump(2);
    }

} // namespace sftpgate::server
