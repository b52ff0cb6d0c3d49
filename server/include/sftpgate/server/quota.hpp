#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "sftpgate/server/user.hpp"
#include "sftpgate/server/vfs.hpp"

namespace sftpgate::server
{

    struct QuotaUsage
    {
        int files{0};
        std::int64_t size{0};
    };

    struct QuotaCheckResult
    {
        bool has_space{true};
        std::int64_t allowed_size{0};
        int allowed_files{0};
        std::int64_t used_size{0};
        int used_files{0};
        std::int64_t quota_size{0};
        int quota_files{0};

        // Bytes left, 0 when no size quota applies; negative once exceeded.
        std::int64_t remaining_size() const noexcept;
        int remaining_files() const noexcept;
    };

    class QuotaTracker
    {
    public:
        // Seeding keeps counters that were already updated in this process.
        void seed_user(const std::string &username, QuotaUsage usage);
        void seed_folder(const std::string &name, QuotaUsage usage);

        QuotaUsage user_usage(const std::string &username) const;
        QuotaUsage folder_usage(const std::string &name) const;

        void update_user(const std::string &username, int files, std::int64_t size, bool reset = false);
        void update_folder(const std::string &name, int files, std::int64_t size, bool reset = false);

        std::map<std::string, QuotaUsage> user_snapshot() const;

    private:
        static void apply(QuotaUsage &usage, int files, std::int64_t size, bool reset);

        mutable std::mutex mutex_;
        std::unordered_map<std::string, QuotaUsage> users_;
        std::unordered_map<std::string, QuotaUsage> folders_;
    };

    struct QuotaScan
    {
        std::string username;
        std::chrono::system_clock::time_point started;
    };

    // At most one running scan per user.
    class QuotaScanRegistry
    {
    public:
        bool add(const std::string &username);
        bool remove(const std::string &username);
        std::vector<QuotaScan> scans() const;

    private:
        mutable std::mutex mutex_;
        std::vector<QuotaScan> scans_;
    };

    // Recomputes usage of the home dir and of every virtual folder included in the user quota.
    QuotaUsage scan_user_quota(const Filesystem &fs, const User &user, QuotaTracker &tracker,
                               QuotaScanRegistry &scans);

} // namespace sftpgate::server
