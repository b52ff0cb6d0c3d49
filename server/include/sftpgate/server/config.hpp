#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sftpgate::server
{

    enum class UploadMode : std::uint8_t
    {
        Standard = 0,
        Atomic = 1,
        AtomicWithResume = 2
    };

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{2022};
        std::filesystem::path config_dir{"."};
        std::filesystem::path users_file{"users.json"};
        std::vector<std::string> host_keys;
        std::vector<std::string> trusted_user_ca_keys;
        std::vector<std::string> enabled_ssh_commands{"md5sum", "sha1sum", "cd", "pwd", "scp"};
        UploadMode upload_mode{UploadMode::Standard};
        int max_auth_tries{0};
        std::chrono::seconds idle_timeout{std::chrono::seconds{0}};
        std::optional<std::filesystem::path> log_file;
        std::string log_level{"info"};

        // Relative entries are resolved against config_dir.
        std::filesystem::path resolve(const std::filesystem::path &path) const;
    };

    // Reads a JSON configuration file; unknown keys are ignored. Throws ConfigError.
    ServerConfig load_config(const std::filesystem::path &path);

    UploadMode upload_mode_from_int(int value);

    // Throws ConfigError for values outside trace/debug/info/warn/error/critical/off.
    void validate_log_level(const std::string &level);

} // namespace sftpgate::server
