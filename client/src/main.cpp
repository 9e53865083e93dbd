#include <cstdlib>
#include <iostream>
#include <memory>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "remotefs/client/config.hpp"
#include "remotefs/client/shell.hpp"

int main(int argc, char *argv[])
{
    using remotefs::client::ClientConfig;
    using remotefs::client::Shell;

    ClientConfig config;
    try
    {
        config = remotefs::client::parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    try
    {
        // The loopback service logs through the default logger.
        std::vector<spdlog::sink_ptr> sinks;
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_level(spdlog::level::warn);
        sinks.push_back(console);
        if (config.log_path)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_path->string(), false));
        }
        auto logger = std::make_shared<spdlog::logger>("loopback", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::info);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);

        Shell shell(std::move(config));
        return shell.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Shell failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }
}
