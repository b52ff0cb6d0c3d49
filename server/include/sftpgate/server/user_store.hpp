#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "sftpgate/server/quota.hpp"
#include "sftpgate/server/user.hpp"

namespace sftpgate::server
{

    // JSON users file: {"users": [...], "folders": {"<name>": {"used_quota_size": .., "used_quota_files": ..}}}
    class UserStore
    {
    public:
        explicit UserStore(std::filesystem::path users_file);

        // Throws ConfigError for unreadable files and invalid accounts.
        void load();

        std::optional<User> find(const std::string &username) const;
        // Enabled account whose password hash matches.
        std::optional<User> authenticate(const std::string &username, const std::string &password) const;
        std::size_t size() const;

        void seed_quota(QuotaTracker &tracker) const;
        // Writes the tracker counters back into the users file.
        void persist_usage(const QuotaTracker &tracker);

        const std::filesystem::path &path() const noexcept { return users_file_; }

    private:
        void persist_locked() const;

        std::filesystem::path users_file_;

        mutable std::mutex mutex_;
        std::unordered_map<std::string, User> users_;
        std::map<std::string, QuotaUsage> folders_;
    };

} // namespace sftpgate::server
