#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "filedock/server/server.hpp"
#include "filedock/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "FileDock server " << filedock::version() << "\n"
                  << "Usage: " << program_name
                  << " --mount <NAME=PATH[:ro]> --token <USER=TOKEN> [options]\n"
                     "  --port <PORT>              listen port (default 8080)\n"
                     "  --address <ADDRESS>        listen address (default 0.0.0.0)\n"
                     "  --mount <NAME=PATH[:ro]>   expose a directory, repeatable\n"
                     "  --token <USER=TOKEN>       accepted API token, repeatable; FILEDOCK_TOKEN adds one for admin\n"
                     "  --allow-origin <PATTERN>   allowed websocket origin, exact or *.domain, repeatable\n"
                     "  --threads <N>              HTTP event loop threads\n"
                     "  --workers <N>              job workers (default 4)\n"
                     "  --queue <N>                job queue capacity (default 100)\n"
                     "  --upload-timeout <SECONDS> idle upload session lifetime (default 3600)\n"
                     "  --max-uploads <N>          concurrent upload sessions (default 64)\n"
                     "  --state-dir <DIR>          persist upload sessions across restarts\n"
                     "  --ping-period <SECONDS>    observer ping interval (default 30)\n"
                     "  --log <FILE>               also log to FILE\n"
                     "  --log-level <LEVEL>        trace, debug, info, warn, error (default info)\n";
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
    using filedock::server::Server;
    using filedock::server::ServerConfig;

    ServerConfig config;

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        }

        auto value = read_option(i, argc, argv);
        if (!value)
        {
            std::cerr << "Missing value for " << arg << std::endl;
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }

        try
        {
            if (arg == "--port")
            {
                config.port = static_cast<std::uint16_t>(std::stoi(*value));
            }
            else if (arg == "--address")
            {
                config.address = *value;
            }
            else if (arg == "--mount")
            {
                auto mount = filedock::server::parse_mount_spec(*value);
                if (!mount)
                {
                    std::cerr << "Invalid mount (expected NAME=PATH[:ro]): " << *value << std::endl;
                    return EXIT_FAILURE;
                }
                config.mounts.push_back(std::move(*mount));
            }
            else if (arg == "--token")
            {
                auto token = filedock::server::parse_token_spec(*value);
                if (!token)
                {
                    std::cerr << "Invalid token (expected USER=TOKEN)" << std::endl;
                    return EXIT_FAILURE;
                }
                config.tokens[token->first] = token->second;
            }
            else if (arg == "--allow-origin")
            {
                config.allowed_origins.push_back(*value);
            }
            else if (arg == "--threads")
            {
                config.http_threads = static_cast<std::size_t>(std::stoul(*value));
            }
            else if (arg == "--workers")
            {
                config.job_workers = static_cast<std::size_t>(std::stoul(*value));
            }
            else if (arg == "--queue")
            {
                config.job_queue = static_cast<std::size_t>(std::stoul(*value));
            }
            else if (arg == "--upload-timeout")
            {
                config.upload_timeout = std::chrono::seconds(std::stoll(*value));
            }
            else if (arg == "--max-uploads")
            {
                config.max_uploads = static_cast<std::size_t>(std::stoul(*value));
            }
            else if (arg == "--state-dir")
            {
                config.state_dir = std::filesystem::path(*value);
            }
            else if (arg == "--ping-period")
            {
                config.ping_period = std::chrono::seconds(std::stoll(*value));
            }
            else if (arg == "--log")
            {
                config.log_file = std::filesystem::path(*value);
            }
            else if (arg == "--log-level")
            {
                config.log_level = *value;
            }
            else
            {
                std::cerr << "Unknown argument: " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }
        }
        catch (const std::exception &)
        {
            std::cerr << "Invalid value for " << arg << ": " << *value << std::endl;
            return EXIT_FAILURE;
        }
    }

    if (const char *token = std::getenv("FILEDOCK_TOKEN"); token != nullptr && *token != '\0')
    {
        config.tokens["admin"] = token;
    }

    if (config.port == 0 || config.mounts.empty() || config.tokens.empty())
    {
        print_usage(argv[0]);
        return EXIT_FAILURE;
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
        logger->set_level(spdlog::level::from_str(config.log_level));
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
        spdlog::info("Starting FileDock server {} on {}:{}", filedock::version(), config.address, config.port);

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
