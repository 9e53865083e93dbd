#include "remotefs/client/config.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

namespace remotefs::client
{

    namespace
    {

        std::string require_value(int &index, int argc, char *argv[], const std::string &flag,
                                  const std::string &what)
        {
            if (index >= argc)
            {
                throw std::runtime_error(flag + " requires " + what);
            }
            return argv[index++];
        }

    } // namespace

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        if (argc < 2)
        {
            throw std::runtime_error("Usage: remotefs_shell --root <dir> [--session <id>] [--log <file>] "
                                     "[--transfer-timeout <seconds>] [--removal-grace <ms>] [--chunk-size <bytes>] "
                                     "[--max-transfer-rate <bytes/s>]");
        }

        ClientConfig config;
        int index = 1;
        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--root")
            {
                config.root = std::filesystem::path(require_value(index, argc, argv, arg, "a directory"));
            }
            else if (arg == "--session")
            {
                config.session_id = require_value(index, argc, argv, arg, "a session id");
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(require_value(index, argc, argv, arg, "a file path"));
            }
            else if (arg == "--transfer-timeout")
            {
                config.transfer_timeout =
                    std::chrono::seconds(std::stoll(require_value(index, argc, argv, arg, "a value (seconds)")));
            }
            else if (arg == "--removal-grace")
            {
                config.removal_grace =
                    std::chrono::milliseconds(std::stoll(require_value(index, argc, argv, arg, "a value (milliseconds)")));
            }
            else if (arg == "--chunk-size")
            {
                config.chunk_size = static_cast<std::size_t>(
                    std::stoull(require_value(index, argc, argv, arg, "a value (bytes)")));
                if (config.chunk_size == 0)
                {
                    throw std::runtime_error("--chunk-size must be positive");
                }
            }
            else if (arg == "--max-transfer-rate")
            {
                config.max_transfer_rate = static_cast<std::size_t>(
                    std::stoull(require_value(index, argc, argv, arg, "a value (bytes per second)")));
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }

        if (config.root.empty())
        {
            throw std::runtime_error("--root is required");
        }
        if (config.session_id.empty())
        {
            throw std::runtime_error("--session must not be empty");
        }
        return config;
    }

} // namespace remotefs::client
