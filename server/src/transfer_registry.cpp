#include "remotefs/server/transfer_registry.hpp"

#include <algorithm>
#include <array>
#include <system_error>

#include "remotefs/server/filesystem.hpp"

namespace remotefs::server
{

    namespace
    {
        constexpr auto kPartSuffix = ".part";

        std::vector<TransferItem> scan_source(const std::filesystem::path &source)
        {
            std::vector<TransferItem> items;
            if (!std::filesystem::is_directory(source))
            {
                items.push_back(TransferItem{
                    .relative = {},
                    .is_directory = false,
                    .size = static_cast<std::uint64_t>(std::filesystem::file_size(source)),
                });
                return items;
            }

            items.push_back(TransferItem{.relative = {}, .is_directory = true, .size = 0});
            for (const auto &entry : std::filesystem::recursive_directory_iterator(source))
            {
                const auto relative = entry.path().lexically_relative(source);
                if (entry.is_directory())
                {
                    items.push_back(TransferItem{.relative = relative, .is_directory = true, .size = 0});
                }
                else if (entry.is_regular_file())
                {
                    items.push_back(TransferItem{
                        .relative = relative,
                        .is_directory = false,
                        .size = static_cast<std::uint64_t>(entry.file_size()),
                    });
                }
            }
            // Parents sort before their children.
            std::sort(items.begin() + 1, items.end(), [](const TransferItem &lhs, const TransferItem &rhs)
                      { return lhs.relative.generic_string() < rhs.relative.generic_string(); });
            return items;
        }

        std::filesystem::path join_relative(const std::filesystem::path &root, const std::filesystem::path &relative)
        {
            return relative.empty() ? root : root / relative;
        }

    } // namespace

    TransferRegistry::TransferRegistry(asio::io_context &io) : io_(io) {}

    std::shared_ptr<TransferJob> TransferRegistry::create(remotefs::protocol::TransferTask task,
                                                          const std::filesystem::path &source,
                                                          const std::filesystem::path &final_path)
    {
        if (jobs_.count(task.task_id) != 0)
        {
            throw FilesystemError(remotefs::ErrorCode::InvalidPayload, "Task id already in use: " + task.task_id);
        }

        auto job = std::make_shared<TransferJob>();
        job->source = source;
        job->final_path = final_path;
        job->temp_path = final_path;
        job->temp_path += kPartSuffix;
        job->items = scan_source(source);
        job->timer = std::make_unique<asio::steady_timer>(io_);

        task.total_bytes = 0;
        for (const auto &item : job->items)
        {
            task.total_bytes += item.size;
        }
        task.transferred_bytes = 0;
        task.status = remotefs::protocol::TransferStatus::Pending;
        job->task = std::move(task);
        job->started = std::chrono::steady_clock::now();
        job->last_report = job->started;

        jobs_.emplace(job->task.task_id, job);
        return job;
    }

    std::shared_ptr<TransferJob> TransferRegistry::find(const std::string &task_id) const
    {
        auto it = jobs_.find(task_id);
        if (it != jobs_.end())
        {
            return it->second;
        }
        return nullptr;
    }

    std::uint64_t TransferRegistry::copy_chunk(TransferJob &job, std::size_t max_bytes)
    {
        if (job.next_item == 0 && job.item_offset == 0 && !job.input.is_open())
        {
            // Leftovers of an earlier attempt.
            std::filesystem::remove_all(job.temp_path);
        }

        std::array<char, 16 * 1024> buffer{};
        std::uint64_t copied = 0;
        while (copied < max_bytes && !job.finished_copying())
        {
            const auto &item = job.items[job.next_item];
            const auto target = join_relative(job.temp_path, item.relative);
            if (item.is_directory)
            {
                std::filesystem::create_directories(target);
                ++job.next_item;
                continue;
            }

            if (!job.input.is_open())
            {
                const auto source = join_relative(job.source, item.relative);
                job.input.open(source, std::ios::binary);
                if (!job.input.is_open())
                {
                    throw FilesystemError(remotefs::ErrorCode::PermissionDenied,
                                          "Unable to read " + source.generic_string());
                }
                if (target.has_parent_path())
                {
                    std::filesystem::create_directories(target.parent_path());
                }
                job.output.open(target, std::ios::binary | std::ios::trunc);
                if (!job.output.is_open())
                {
                    job.input.close();
                    throw FilesystemError(remotefs::ErrorCode::PermissionDenied,
                                          "Unable to write " + target.generic_string());
                }
                job.item_offset = 0;
            }

            const auto wanted = std::min<std::uint64_t>({max_bytes - copied, buffer.size(), item.size - std::min(item.size, job.item_offset)});
            std::streamsize got = 0;
            if (wanted > 0)
            {
                job.input.read(buffer.data(), static_cast<std::streamsize>(wanted));
                got = job.input.gcount();
                job.output.write(buffer.data(), got);
                if (!job.output)
                {
                    throw FilesystemError(remotefs::ErrorCode::TransferFailed,
                                          "Write failed for " + target.generic_string());
                }
                job.item_offset += static_cast<std::uint64_t>(got);
                copied += static_cast<std::uint64_t>(got);
            }

            // A source that shrank while being read ends early.
            if (job.item_offset >= item.size || got == 0)
            {
                job.input.close();
                job.output.close();
                job.item_offset = 0;
                ++job.next_item;
            }
        }

        job.task.transferred_bytes = std::min(job.task.transferred_bytes + copied, job.task.total_bytes);
        return copied;
    }

    void TransferRegistry::commit(TransferJob &job)
    {
        std::error_code ec;
        if (std::filesystem::exists(std::filesystem::symlink_status(job.final_path, ec)))
        {
            std::filesystem::remove_all(job.final_path);
        }
        std::filesystem::rename(job.temp_path, job.final_path);
    }

    bool TransferRegistry::discard(TransferJob &job)
    {
        job.input.close();
        job.output.close();
        std::error_code ec;
        std::filesystem::remove_all(job.temp_path, ec);
        return !ec;
    }

    void TransferRegistry::erase(const std::string &task_id)
    {
        jobs_.erase(task_id);
    }

    void TransferRegistry::for_each(const std::function<void(TransferJob &)> &visitor)
    {
        for (auto &[id, job] : jobs_)
        {
            visitor(*job);
        }
    }

} // namespace remotefs::server
