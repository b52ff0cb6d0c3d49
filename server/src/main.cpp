#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "sftpgate/server/config.hpp"
#include "sftpgate/server/server.hpp"
#include "sftpgate/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "sftpgate server " << sftpgate::version() << "\n"
                  << "Usage: " << program_name
                  << " [--config <FILE>] [--port <PORT>] [--address <ADDRESS>] [--config-dir <DIR>] "
                     "[--users <FILE>] [--log <FILE>] [--log-level <LEVEL>]\n";
    }

    std::optional<std::string> read_option(int &index, int argc, char *argv[])
    {
        if (index + 1 >= argc)
        {
            return std::nullopt;
        }
        ++index;
        return std::string(argv[index]);
    }

    struct Overrides
    {
        std::optional<std::filesystem::path> config_file;
        std::optional<std::uint16_t> port;
        std::optional<std::string> address;
        std::optional<std::filesystem::path> config_dir;
        std::optional<std::filesystem::path> users_file;
        std::optional<std::filesystem::path> log_file;
        std::optional<std::string> log_level;
    };

} // namespace

int main(int argc, char *argv[])
{
    using sftpgate::server::Server;
    using sftpgate::server::ServerConfig;

    Overrides overrides;

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        }
        if (arg != "--config" && arg != "--port" && arg != "--address" && arg != "--config-dir" &&
            arg != "--users" && arg != "--log" && arg != "--log-level")
        {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
        auto value = read_option(i, argc, argv);
        if (!value)
        {
            std::cerr << "Missing value for " << arg << std::endl;
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
        if (arg == "--config")
        {
            overrides.config_file = std::filesystem::path(*value);
        }
        else if (arg == "--port")
        {
            try
            {
                const auto port = std::stoi(*value);
                if (port <= 0 || port > 65535)
                {
                    throw std::out_of_range("port");
                }
                overrides.port = static_cast<std::uint16_t>(port);
            }
            catch (const std::exception &)
            {
                std::cerr << "Invalid port: " << *value << std::endl;
                return EXIT_FAILURE;
            }
        }
        else if (arg == "--address")
        {
            overrides.address = *value;
        }
        else if (arg == "--config-dir")
        {
            overrides.config_dir = std::filesystem::path(*value);
        }
        else if (arg == "--users")
        {
            overrides.users_file = std::filesystem::path(*value);
        }
        else if (arg == "--log")
        {
            overrides.log_file = std::filesystem::path(*value);
        }
        else
        {
            overrides.log_level = *value;
        }
    }

    try
    {
        ServerConfig config = overrides.config_file ? sftpgate::server::load_config(*overrides.config_file)
                                                    : ServerConfig{};
        if (overrides.port)
        {
            config.port = *overrides.port;
        }
        if (overrides.address)
        {
            config.address = *overrides.address;
        }
        if (overrides.config_dir)
        {
            config.config_dir = *overrides.config_dir;
        }
        if (overrides.users_file)
        {
            config.users_file = *overrides.users_file;
        }
        if (overrides.log_file)
        {
            config.log_file = *overrides.log_file;
        }
        if (overrides.log_level)
        {
            sftpgate::server::validate_log_level(*overrides.log_level);
            config.log_level = *overrides.log_level;
        }

        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.resolve(*config.log_file).string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::from_str(config.log_level));
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
        spdlog::info("Starting sftpgate {} on {}:{}", sftpgate::version(), config.address, config.port);

        // Peer resets surface as write errors.
        std::signal(SIGPIPE, SIG_IGN);

        Server server(std::move(config));
        server.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Server failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
