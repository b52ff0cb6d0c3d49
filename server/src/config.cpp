#include "sftpgate/server/config.hpp"

#include <array>
#include <fstream>

#include <nlohmann/json.hpp>

#include "sftpgate/error_codes.hpp"

namespace sftpgate::server
{

    namespace
    {

        constexpr std::array<std::string_view, 7> kLogLevels{"trace", "debug", "info", "warn", "error", "critical", "off"};

        template <typename T>
        void read_key(const nlohmann::json &json, const char *key, T &target)
        {
            const auto it = json.find(key);
            if (it == json.end() || it->is_null())
            {
                return;
            }
            try
            {
                target = it->get<T>();
            }
            catch (const nlohmann::json::exception &ex)
            {
                throw Error(ErrorCode::ConfigError, std::string("invalid value for \"") + key + "\": " + ex.what());
            }
        }

    } // namespace

    std::filesystem::path ServerConfig::resolve(const std::filesystem::path &path) const
    {
        if (path.is_absolute())
        {
            return path;
        }
        return config_dir / path;
    }

    UploadMode upload_mode_from_int(int value)
    {
        switch (value)
        {
        case 0:
            return UploadMode::Standard;
        case 1:
            return UploadMode::Atomic;
        case 2:
            return UploadMode::AtomicWithResume;
        default:
            throw Error(ErrorCode::ConfigError, "invalid upload_mode " + std::to_string(value));
        }
    }

    void validate_log_level(const std::string &level)
    {
        for (const auto candidate : kLogLevels)
        {
            if (candidate == level)
            {
                return;
            }
        }
        throw Error(ErrorCode::ConfigError, "invalid log level \"" + level + "\"");
    }

    ServerConfig load_config(const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw Error(ErrorCode::ConfigError, "unable to open config file " + path.string());
        }

        nlohmann::json json;
        try
        {
            in >> json;
        }
        catch (const nlohmann::json::parse_error &ex)
        {
            throw Error(ErrorCode::ConfigError, "unable to parse config file " + path.string() + ": " + ex.what());
        }
        if (!json.is_object())
        {
            throw Error(ErrorCode::ConfigError, "config file " + path.string() + " must contain an object");
        }

        ServerConfig config;
        std::string config_dir = path.parent_path().empty() ? "." : path.parent_path().string();
        std::string users_file = config.users_file.string();
        std::string log_file;
        int upload_mode = 0;
        std::int64_t idle_timeout = 0;

        read_key(json, "address", config.address);
        read_key(json, "port", config.port);
        read_key(json, "config_dir", config_dir);
        read_key(json, "users_file", users_file);
        read_key(json, "host_keys", config.host_keys);
        read_key(json, "trusted_user_ca_keys", config.trusted_user_ca_keys);
        read_key(json, "enabled_ssh_commands", config.enabled_ssh_commands);
        read_key(json, "upload_mode", upload_mode);
        read_key(json, "max_auth_tries", config.max_auth_tries);
        read_key(json, "idle_timeout_seconds", idle_timeout);
        read_key(json, "log_file", log_file);
        read_key(json, "log_level", config.log_level);

        config.config_dir = config_dir;
        config.users_file = users_file;
        config.upload_mode = upload_mode_from_int(upload_mode);
        if (idle_timeout < 0)
        {
            throw Error(ErrorCode::ConfigError, "idle_timeout_seconds cannot be negative");
        }
        config.idle_timeout = std::chrono::seconds(idle_timeout);
        if (config.max_auth_tries < 0)
        {
            throw Error(ErrorCode::ConfigError, "max_auth_tries cannot be negative");
        }
        if (!log_file.empty())
        {
            config.log_file = std::filesystem::path(log_file);
        }
        validate_log_level(config.log_level);
        return config;
    }

} // namespace sftpgate::server
