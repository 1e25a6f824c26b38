#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "sftpbridge/server/server.hpp"
#include "sftpbridge/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "SFTP bridge " << sftpbridge::version() << "\n"
                  << "Usage: " << program_name
                  << " [--address <ADDRESS>] [--port <PORT>] [--staging-dir <DIR>] [--keepalive <seconds>] "
                     "[--keepalive-count <N>] [--connect-timeout <seconds>] [--log-capacity <N>] "
                     "[--max-frame <bytes>] [--log <FILE>] [--log-level <LEVEL>]\n";
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

} // namespace

int main(int argc, char *argv[])
{
    using sftpbridge::server::Server;
    using sftpbridge::server::ServerConfig;

    ServerConfig config;

    try
    {
        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--help" || arg == "-h")
            {
                print_usage(argv[0]);
                return EXIT_SUCCESS;
            }

            const bool takes_value = arg == "--address" || arg == "--port" || arg == "--staging-dir" ||
                                     arg == "--keepalive" || arg == "--keepalive-count" ||
                                     arg == "--connect-timeout" || arg == "--log-capacity" || arg == "--max-frame" ||
                                     arg == "--log" || arg == "--log-level";
            if (!takes_value)
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

            if (arg == "--address")
            {
                config.address = *value;
            }
            else if (arg == "--port")
            {
                config.port = static_cast<std::uint16_t>(std::stoi(*value));
            }
            else if (arg == "--staging-dir")
            {
                config.staging_dir = std::filesystem::path(*value);
            }
            else if (arg == "--keepalive")
            {
                config.transport.keepalive_interval = std::chrono::seconds(std::stoll(*value));
            }
            else if (arg == "--keepalive-count")
            {
                config.transport.keepalive_count_max = std::stoi(*value);
            }
            else if (arg == "--connect-timeout")
            {
                config.transport.connect_timeout = std::chrono::seconds(std::stoll(*value));
            }
            else if (arg == "--log-capacity")
            {
                config.log_capacity = static_cast<std::size_t>(std::stoul(*value));
            }
            else if (arg == "--max-frame")
            {
                config.max_frame_size = static_cast<std::size_t>(std::stoull(*value));
            }
            else if (arg == "--log")
            {
                config.log_file = std::filesystem::path(*value);
            }
            else
            {
                const auto level = spdlog::level::from_str(*value);
                if (level == spdlog::level::off && *value != "off")
                {
                    std::cerr << "Unknown log level: " << *value << std::endl;
                    print_usage(argv[0]);
                    return EXIT_FAILURE;
                }
                config.log_level = level;
            }
        }
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Invalid argument value: " << ex.what() << std::endl;
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    if (config.port == 0 || config.log_capacity == 0 || config.transport.keepalive_count_max < 1)
    {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }
    if (config.staging_dir.empty())
    {
        config.staging_dir = sftpbridge::server::default_staging_dir();
    }

    try
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
        logger->set_level(config.log_level);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
        spdlog::info("Starting SFTP bridge {} on {}:{}", sftpbridge::version(), config.address, config.port);

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
