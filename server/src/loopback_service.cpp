#include "remotefs/server/loopback_service.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include <spdlog/spdlog.h>

#include "remotefs/remote_path.hpp"

namespace remotefs::server
{

    using remotefs::ErrorCode;
    using remotefs::OperationResult;
    using remotefs::protocol::ConflictResolution;
    using remotefs::protocol::TransferStatus;

    LoopbackService::LoopbackService(asio::io_context &io, LoopbackOptions options, EventSink sink)
        : io_(io), options_(options), sink_(std::move(sink)), registry_(io)
    {
        if (options_.chunk_size == 0)
        {
            options_.chunk_size = 64 * 1024;
        }
    }

    LoopbackService::~LoopbackService()
    {
        // Pending steps must not run against a destroyed service.
        registry_.for_each([](TransferJob &job)
                           { job.timer->cancel(); });
    }

    void LoopbackService::add_session(const std::string &session_id, const std::filesystem::path &root)
    {
        sessions_.insert_or_assign(session_id, filesystem_.prepare_session_paths(session_id, root));
        spdlog::info("Session {} serves {}", session_id, sessions_.at(session_id).root.string());
    }

    void LoopbackService::remove_session(const std::string &session_id)
    {
        sessions_.erase(session_id);
    }

    void LoopbackService::list_directory(const std::string &session_id, const std::string &path,
                                         remotefs::ListHandler handler)
    {
        std::vector<remotefs::protocol::FileEntry> entries;
        OperationResult result;
        try
        {
            entries = filesystem_.list_directory(session(session_id), path);
        }
        catch (const FilesystemError &ex)
        {
            result = OperationResult::failure(ex.code(), ex.what());
        }
        catch (const std::filesystem::filesystem_error &ex)
        {
            result = OperationResult::failure(error_code_from(ex.code()), ex.what());
        }
        if (!result.ok())
        {
            spdlog::warn("LIST {} failed: {}", path, result.message);
        }
        asio::post(io_, [handler = std::move(handler), result = std::move(result), entries = std::move(entries)]() mutable
                   { handler(result, std::move(entries)); });
    }

    void LoopbackService::upload(const std::string &session_id, const std::filesystem::path &local_path,
                                 const std::string &remote_path, const std::string &task_id,
                                 remotefs::ResultHandler handler)
    {
        std::shared_ptr<TransferJob> job;
        run_operation("UPLOAD " + remote_path, std::move(handler), [&]
                      {
            const auto &paths = session(session_id);
            std::error_code ec;
            if (!std::filesystem::exists(local_path, ec))
            {
                throw FilesystemError(ErrorCode::NotFound, "Local path does not exist: " + local_path.string());
            }
            const auto target = filesystem_.resolve_for_new_entry(paths, remote_path);
            if (!std::filesystem::is_directory(target.parent_path()))
            {
                throw FilesystemError(ErrorCode::NotFound, "Destination directory does not exist");
            }
            remotefs::protocol::TransferTask task;
            task.task_id = task_id;
            task.kind = remotefs::protocol::TransferKind::Upload;
            task.session_id = session_id;
            task.file_name = remotefs::remote_path::file_name(remote_path);
            task.source_path = local_path.string();
            task.destination_path = remotefs::remote_path::normalize(remote_path);
            job = registry_.create(std::move(task), local_path, target); });

        if (job)
        {
            schedule_begin(job, true);
        }
    }

    void LoopbackService::download(const std::string &session_id, const std::string &remote_path,
                                   const std::filesystem::path &local_path, const std::string &task_id,
                                   remotefs::ResultHandler handler)
    {
        std::shared_ptr<TransferJob> job;
        run_operation("DOWNLOAD " + remote_path, std::move(handler), [&]
                      {
            const auto source = filesystem_.resolve(session(session_id), remote_path);
            const auto parent = local_path.has_parent_path() ? local_path.parent_path() : std::filesystem::current_path();
            if (!std::filesystem::is_directory(parent))
            {
                throw FilesystemError(ErrorCode::NotFound, "Local directory does not exist: " + parent.string());
            }
            remotefs::protocol::TransferTask task;
            task.task_id = task_id;
            task.kind = remotefs::protocol::TransferKind::Download;
            task.session_id = session_id;
            task.file_name = remotefs::remote_path::file_name(remote_path);
            task.source_path = remotefs::remote_path::normalize(remote_path);
            task.destination_path = local_path.string();
            job = registry_.create(std::move(task), source, local_path); });

        if (job)
        {
            // Downloads replace the local target without asking.
            schedule_begin(job, false);
        }
    }

    void LoopbackService::copy(const std::string &session_id, const std::string &source_path,
                               const std::string &destination_path, remotefs::ResultHandler handler)
    {
        run_operation("COPY " + source_path + " " + destination_path, std::move(handler), [&]
                      { filesystem_.copy_path(session(session_id), source_path, destination_path); });
    }

    void LoopbackService::rename(const std::string &session_id, const std::string &old_path,
                                 const std::string &new_path, remotefs::ResultHandler handler)
    {
        run_operation("MOVE " + old_path + " " + new_path, std::move(handler), [&]
                      { filesystem_.move_path(session(session_id), old_path, new_path); });
    }

    void LoopbackService::remove(const std::string &session_id, const std::string &path, bool is_directory,
                                 remotefs::ResultHandler handler)
    {
        run_operation((is_directory ? "RMDIR " : "DELETE ") + path, std::move(handler), [&]
                      {
            if (is_directory)
            {
                filesystem_.remove_directory(session(session_id), path);
            }
            else
            {
                filesystem_.remove_file(session(session_id), path);
            } });
    }

    void LoopbackService::create_file(const std::string &session_id, const std::string &path,
                                      remotefs::ResultHandler handler)
    {
        run_operation("TOUCH " + path, std::move(handler), [&]
                      { filesystem_.create_file(session(session_id), path); });
    }

    void LoopbackService::create_directory(const std::string &session_id, const std::string &path,
                                           remotefs::ResultHandler handler)
    {
        run_operation("MKDIR " + path, std::move(handler), [&]
                      { filesystem_.create_directory(session(session_id), path); });
    }

    void LoopbackService::change_permissions(const std::string &session_id, const std::string &path,
                                             std::uint32_t mode, remotefs::ResultHandler handler)
    {
        run_operation("CHMOD " + path, std::move(handler), [&]
                      { filesystem_.change_permissions(session(session_id), path, mode); });
    }

    void LoopbackService::cancel_transfer(const std::string &task_id, remotefs::ResultHandler handler)
    {
        auto job = registry_.find(task_id);
        if (!job)
        {
            post(std::move(handler), OperationResult::failure(ErrorCode::NotFound, "Unknown transfer " + task_id));
            return;
        }
        spdlog::info("CANCEL {}", task_id);
        if (job->awaiting_resolution)
        {
            apply_resolution(job, ConflictResolution::Cancel);
        }
        else
        {
            job->cancel_requested = true;
        }
        post(std::move(handler), OperationResult::success());
    }

    void LoopbackService::resolve_conflict(const std::string &task_id, ConflictResolution resolution,
                                           remotefs::ResultHandler handler)
    {
        auto job = registry_.find(task_id);
        if (!job)
        {
            post(std::move(handler), OperationResult::failure(ErrorCode::NotFound, "Unknown transfer " + task_id));
            return;
        }
        if (!job->awaiting_resolution)
        {
            post(std::move(handler),
                 OperationResult::failure(ErrorCode::InvalidCommand, "No conflict pending for " + task_id));
            return;
        }
        spdlog::info("RESOLVE {} {}", task_id, remotefs::protocol::to_string(resolution));
        apply_resolution(job, resolution);
        post(std::move(handler), OperationResult::success());
    }

    const SessionPaths &LoopbackService::session(const std::string &session_id) const
    {
        auto it = sessions_.find(session_id);
        if (it == sessions_.end())
        {
            throw FilesystemError(ErrorCode::SessionNotFound, "Unknown session " + session_id);
        }
        return it->second;
    }

    void LoopbackService::post(remotefs::ResultHandler handler, OperationResult result)
    {
        if (!handler)
        {
            return;
        }
        asio::post(io_, [handler = std::move(handler), result = std::move(result)]
                   { handler(result); });
    }

    void LoopbackService::run_operation(const std::string &what, remotefs::ResultHandler handler,
                                        const std::function<void()> &operation)
    {
        OperationResult result;
        try
        {
            operation();
            spdlog::info("{} ok", what);
        }
        catch (const FilesystemError &ex)
        {
            result = OperationResult::failure(ex.code(), ex.what());
        }
        catch (const std::filesystem::filesystem_error &ex)
        {
            result = OperationResult::failure(error_code_from(ex.code()), ex.what());
        }
        if (!result.ok())
        {
            spdlog::warn("{} failed: {}", what, result.message);
        }
        post(std::move(handler), std::move(result));
    }

    void LoopbackService::schedule_begin(const std::shared_ptr<TransferJob> &job, bool detect_conflict)
    {
        // On the job timer, so the destructor's cancel covers the first step as well.
        job->timer->expires_after(std::chrono::milliseconds{0});
        job->timer->async_wait([this, job, detect_conflict](const asio::error_code &error)
                               {
            if (error == asio::error::operation_aborted)
            {
                return;
            }
            begin(job, detect_conflict); });
    }

    void LoopbackService::begin(const std::shared_ptr<TransferJob> &job, bool detect_conflict)
    {
        report(*job);
        if (job->cancel_requested)
        {
            finish(job, TransferStatus::Cancelled, std::string(remotefs::protocol::kCancelledByUser));
            return;
        }
        std::error_code ec;
        if (detect_conflict && std::filesystem::exists(std::filesystem::symlink_status(job->final_path, ec)))
        {
            park(job);
            return;
        }
        schedule_step(job, std::chrono::milliseconds{0});
    }

    void LoopbackService::park(const std::shared_ptr<TransferJob> &job)
    {
        job->awaiting_resolution = true;

        remotefs::protocol::FileConflict conflict;
        conflict.task_id = job->task.task_id;
        conflict.session_id = job->task.session_id;
        conflict.file_path = job->task.destination_path;
        conflict.local_size = job->task.total_bytes;
        std::error_code ec;
        if (std::filesystem::is_regular_file(job->final_path, ec))
        {
            const auto size = std::filesystem::file_size(job->final_path, ec);
            if (!ec)
            {
                conflict.remote_size = static_cast<std::uint64_t>(size);
            }
        }
        const auto remote_time = std::filesystem::last_write_time(job->final_path, ec);
        if (!ec)
        {
            conflict.remote_modified = static_cast<std::uint64_t>(std::max<std::int64_t>(
                0, std::chrono::duration_cast<std::chrono::seconds>(
                       (remote_time - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now())
                           .time_since_epoch())
                       .count()));
        }

        spdlog::info("Transfer {} waits for a decision on {}", job->task.task_id, conflict.file_path);
        sink_(remotefs::protocol::make_conflict_event(conflict));

        job->timer->expires_after(options_.conflict_timeout);
        job->timer->async_wait([this, job](const asio::error_code &error)
                               {
            if (error == asio::error::operation_aborted || !job->awaiting_resolution)
            {
                return;
            }
            job->awaiting_resolution = false;
            finish(job, TransferStatus::Failed, std::string("Conflict resolution timed out")); });
    }

    void LoopbackService::apply_resolution(const std::shared_ptr<TransferJob> &job, ConflictResolution resolution)
    {
        job->awaiting_resolution = false;
        job->timer->cancel();
        switch (resolution)
        {
        case ConflictResolution::Overwrite:
            schedule_step(job, std::chrono::milliseconds{0});
            break;
        case ConflictResolution::Skip:
            finish(job, TransferStatus::Cancelled, std::string(remotefs::protocol::kSkippedByUser));
            break;
        case ConflictResolution::Cancel:
            finish(job, TransferStatus::Cancelled, std::string(remotefs::protocol::kCancelledByUser));
            break;
        }
    }

    void LoopbackService::schedule_step(const std::shared_ptr<TransferJob> &job, std::chrono::milliseconds delay)
    {
        job->timer->expires_after(delay);
        job->timer->async_wait([this, job](const asio::error_code &error)
                               {
            if (error == asio::error::operation_aborted)
            {
                return;
            }
            step(job); });
    }

    void LoopbackService::step(const std::shared_ptr<TransferJob> &job)
    {
        if (job->cancel_requested)
        {
            finish(job, TransferStatus::Cancelled, std::string(remotefs::protocol::kCancelledByUser));
            return;
        }

        const bool first = job->task.status == TransferStatus::Pending;
        if (first)
        {
            job->task.status = TransferStatus::Transferring;
            job->started = std::chrono::steady_clock::now();
        }

        std::uint64_t copied = 0;
        try
        {
            copied = registry_.copy_chunk(*job, options_.chunk_size);
            if (job->finished_copying())
            {
                registry_.commit(*job);
            }
        }
        catch (const FilesystemError &ex)
        {
            finish(job, TransferStatus::Failed, std::string(ex.what()));
            return;
        }
        catch (const std::filesystem::filesystem_error &ex)
        {
            finish(job, TransferStatus::Failed, std::string(ex.what()));
            return;
        }

        if (job->finished_copying())
        {
            finish(job, TransferStatus::Completed, std::nullopt);
            return;
        }

        const auto now = std::chrono::steady_clock::now();
        if (first || now - job->last_report >= options_.progress_interval)
        {
            job->last_report = now;
            report(*job);
        }

        std::chrono::milliseconds delay{0};
        if (options_.max_transfer_rate && *options_.max_transfer_rate > 0)
        {
            delay = std::chrono::milliseconds(copied * 1000 / *options_.max_transfer_rate);
        }
        schedule_step(job, delay);
    }

    void LoopbackService::finish(const std::shared_ptr<TransferJob> &job, TransferStatus status,
                                 std::optional<std::string> error)
    {
        auto &task = job->task;
        task.status = status;
        task.error = std::move(error);
        task.eta_seconds.reset();
        if (status == TransferStatus::Completed)
        {
            task.transferred_bytes = task.total_bytes;
            spdlog::info("Transfer {} completed ({} bytes)", task.task_id, task.total_bytes);
        }
        else
        {
            if (!registry_.discard(*job))
            {
                spdlog::warn("Unable to remove partial data {}", job->temp_path.string());
            }
            spdlog::warn("Transfer {} {}: {}", task.task_id, remotefs::protocol::to_string(status),
                         task.error.value_or(""));
        }
        task.speed_bytes_per_second = 0;
        sink_(remotefs::protocol::make_progress_event(task));
        registry_.erase(task.task_id);
    }

    void LoopbackService::report(TransferJob &job)
    {
        auto &task = job.task;
        const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - job.started).count();
        task.speed_bytes_per_second = elapsed > 0 ? static_cast<double>(task.transferred_bytes) / elapsed : 0.0;
        if (task.speed_bytes_per_second > 0)
        {
            const auto remaining = static_cast<double>(task.total_bytes - task.transferred_bytes);
            task.eta_seconds = static_cast<std::uint64_t>(std::ceil(remaining / task.speed_bytes_per_second));
        }
        else
        {
            task.eta_seconds.reset();
        }
        sink_(remotefs::protocol::make_progress_event(task));
    }

} // namespace remotefs::server
