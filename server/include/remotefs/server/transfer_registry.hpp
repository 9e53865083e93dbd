#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <asio.hpp>

#include "remotefs/protocol.hpp"

namespace remotefs::server
{

    struct TransferItem
    {
        // Relative to the transfer root; empty for the root itself.
        std::filesystem::path relative;
        bool is_directory{};
        std::uint64_t size{};
    };

    struct TransferJob
    {
        remotefs::protocol::TransferTask task;
        std::filesystem::path source;
        std::filesystem::path final_path;
        std::filesystem::path temp_path;
        std::vector<TransferItem> items;
        std::size_t next_item{};
        std::uint64_t item_offset{};
        std::ifstream input;
        std::ofstream output;
        bool cancel_requested{};
        bool awaiting_resolution{};
        std::chrono::steady_clock::time_point started{};
        std::chrono::steady_clock::time_point last_report{};
        std::unique_ptr<asio::steady_timer> timer;

        bool finished_copying() const noexcept { return next_item >= items.size(); }
    };

    // In-flight transfers of the loopback service. Data is staged in "<target>.part" and only
    // renamed onto the target by commit().
    class TransferRegistry
    {
    public:
        explicit TransferRegistry(asio::io_context &io);

        // Scans source (recursively for directories) and registers the job; throws
        // FilesystemError when the task id is already in use or the source is unreadable.
        std::shared_ptr<TransferJob> create(remotefs::protocol::TransferTask task, const std::filesystem::path &source,
                                            const std::filesystem::path &final_path);

        std::shared_ptr<TransferJob> find(const std::string &task_id) const;

        // Copies up to max_bytes of file data; returns the number of bytes copied.
        std::uint64_t copy_chunk(TransferJob &job, std::size_t max_bytes);

        void commit(TransferJob &job);

        // Removes staged data; false when something could not be removed.
        bool discard(TransferJob &job);

        void erase(const std::string &task_id);

        void for_each(const std::function<void(TransferJob &)> &visitor);

        std::size_t size() const noexcept { return jobs_.size(); }

    private:
        asio::io_context &io_;
        std::unordered_map<std::string, std::shared_ptr<TransferJob>> jobs_;
    };

} // namespace remotefs::server
