#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace remotefs::client
{

    struct ClientConfig
    {
        std::filesystem::path root;
        std::string session_id{"local"};
        std::optional<std::filesystem::path> log_path;
        std::chrono::milliseconds transfer_timeout{std::chrono::seconds{60}};
        std::chrono::milliseconds removal_grace{std::chrono::seconds{3}};
        std::size_t chunk_size{64 * 1024};
        std::optional<std::size_t> max_transfer_rate;
    };

    ClientConfig parse_arguments(int argc, char *argv[]);

} // namespace remotefs::client
