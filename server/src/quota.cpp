#include "sftpgate/server/quota.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "sftpgate/error_codes.hpp"

namespace sftpgate::server
{

    std::int64_t QuotaCheckResult::remaining_size() const noexcept
    {
        if (quota_size > 0)
        {
            return quota_size - used_size;
        }
        return 0;
    }

    int QuotaCheckResult::remaining_files() const noexcept
    {
        if (quota_files > 0)
        {
            return quota_files - used_files;
        }
        return 0;
    }

    void QuotaTracker::apply(QuotaUsage &usage, int files, std::int64_t size, bool reset)
    {
        if (reset)
        {
            usage.files = files;
            usage.size = size;
        }
        else
        {
            usage.files += files;
            usage.size += size;
        }
        usage.files = std::max(usage.files, 0);
        usage.size = std::max<std::int64_t>(usage.size, 0);
    }

    void QuotaTracker::seed_user(const std::string &username, QuotaUsage usage)
    {
        std::lock_guard lock(mutex_);
        users_.try_emplace(username, usage);
    }

    void QuotaTracker::seed_folder(const std::string &name, QuotaUsage usage)
    {
        std::lock_guard lock(mutex_);
        folders_.try_emplace(name, usage);
    }

    QuotaUsage QuotaTracker::user_usage(const std::string &username) const
    {
        std::lock_guard lock(mutex_);
        const auto it = users_.find(username);
        return it == users_.end() ? QuotaUsage{} : it->second;
    }

    QuotaUsage QuotaTracker::folder_usage(const std::string &name) const
    {
        std::lock_guard lock(mutex_);
        const auto it = folders_.find(name);
        return it == folders_.end() ? QuotaUsage{} : it->second;
    }

    void QuotaTracker::update_user(const std::string &username, int files, std::int64_t size, bool reset)
    {
        std::lock_guard lock(mutex_);
        apply(users_[username], files, size, reset);
    }

    void QuotaTracker::update_folder(const std::string &name, int files, std::int64_t size, bool reset)
    {
        std::lock_guard lock(mutex_);
        apply(folders_[name], files, size, reset);
    }

    std::map<std::string, QuotaUsage> QuotaTracker::user_snapshot() const
    {
        std::lock_guard lock(mutex_);
        return std::map<std::string, QuotaUsage>(users_.begin(), users_.end());
    }

    bool QuotaScanRegistry::add(const std::string &username)
    {
        std::lock_guard lock(mutex_);
        const auto running = std::any_of(scans_.begin(), scans_.end(), [&username](const QuotaScan &scan)
                                         { return scan.username == username; });
        if (running)
        {
            return false;
        }
        scans_.push_back(QuotaScan{.username = username, .started = std::chrono::system_clock::now()});
        return true;
    }

    bool QuotaScanRegistry::remove(const std::string &username)
    {
        std::lock_guard lock(mutex_);
        const auto it = std::find_if(scans_.begin(), scans_.end(), [&username](const QuotaScan &scan)
                                     { return scan.username == username; });
        if (it == scans_.end())
        {
            return false;
        }
        scans_.erase(it);
        return true;
    }

    std::vector<QuotaScan> QuotaScanRegistry::scans() const
    {
        std::lock_guard lock(mutex_);
        return scans_;
    }

    QuotaUsage scan_user_quota(const Filesystem &fs, const User &user, QuotaTracker &tracker,
                               QuotaScanRegistry &scans)
    {
        if (!scans.add(user.username))
        {
            throw Error(ErrorCode::GenericFailure, "quota scan already running for user " + user.username);
        }

        QuotaUsage usage;
        try
        {
            const auto home = fs.dir_size(user.home_dir);
            usage.files = home.files;
            usage.size = home.size;
            for (const auto &folder : user.virtual_folders)
            {
                const auto folder_size = fs.dir_size(folder.mapped_path);
                tracker.update_folder(folder.name, folder_size.files, folder_size.size, true);
                if (folder.included_in_user_quota)
                {
                    usage.files += folder_size.files;
                    usage.size += folder_size.size;
                }
            }
        }
        catch (const Error &)
        {
            scans.remove(user.username);
            throw;
        }

        tracker.update_user(user.username, usage.files, usage.size, true);
        scans.remove(user.username);
        spdlog::info("Quota scan completed for user {}, files: {} size: {}", user.username, usage.files, usage.size);
        return usage;
    }

} // namespace sftpgate::server
