#include "remotefs/client/transfer_coordinator.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

#include "remotefs/client/logger.hpp"
#include "remotefs/crypto.hpp"
#include "remotefs/remote_path.hpp"

namespace remotefs::client
{

    namespace
    {

        int status_rank(protocol::TransferStatus status)
        {
            if (protocol::is_terminal(status))
            {
                return 2;
            }
            return status == protocol::TransferStatus::Transferring ? 1 : 0;
        }

        std::uint64_t local_size(const std::filesystem::path &path)
        {
            std::error_code ec;
            if (!std::filesystem::is_regular_file(path, ec))
            {
                return 0;
            }
            const auto size = std::filesystem::file_size(path, ec);
            return ec ? 0 : static_cast<std::uint64_t>(size);
        }

    } // namespace

    TransferCoordinator::TransferCoordinator(asio::io_context &io, RemoteService &service, EventBus &events,
                                             Logger &logger, TransferSettings settings)
        : io_(io), service_(service), events_(events), logger_(logger), settings_(settings)
    {
        // Registered first, so the visible list is current when per-task completions run.
        progress_subscription_ = events_.on_progress(std::nullopt, [this](const protocol::TransferTask &event)
                                                     { on_progress(event); });
    }

    std::string TransferCoordinator::upload(const std::string &session_id, const std::filesystem::path &local_path,
                                            const std::string &remote_path, CompletionHandler done,
                                            const std::shared_ptr<TransferBatch> &batch)
    {
        protocol::TransferTask task;
        task.kind = protocol::TransferKind::Upload;
        task.session_id = session_id;
        task.file_name = remote_path::file_name(local_path.generic_string());
        task.source_path = local_path.string();
        task.destination_path = remote_path::normalize(remote_path);
        task.total_bytes = local_size(local_path);

        const auto destination = task.destination_path;
        return start(std::move(task), std::move(done), batch,
                     [this, session_id, local_path, destination](const std::string &task_id, ResultHandler acknowledged)
                     { service_.upload(session_id, local_path, destination, task_id, std::move(acknowledged)); });
    }

    std::string TransferCoordinator::download(const std::string &session_id, const std::string &remote_path,
                                              const std::filesystem::path &local_path, CompletionHandler done)
    {
        protocol::TransferTask task;
        task.kind = protocol::TransferKind::Download;
        task.session_id = session_id;
        task.file_name = remote_path::file_name(remote_path);
        task.source_path = remote_path::normalize(remote_path);
        task.destination_path = local_path.string();

        const auto source = task.source_path;
        return start(std::move(task), std::move(done), {},
                     [this, session_id, source, local_path](const std::string &task_id, ResultHandler acknowledged)
                     { service_.download(session_id, source, local_path, task_id, std::move(acknowledged)); });
    }

    void TransferCoordinator::upload_batch(const std::string &session_id,
                                           const std::vector<std::filesystem::path> &files,
                                           const std::string &remote_directory,
                                           const std::shared_ptr<TransferBatch> &batch, BatchHandler done)
    {
        if (files.empty())
        {
            if (done)
            {
                done({});
            }
            return;
        }

        struct Aggregate
        {
            std::vector<TransferOutcome> outcomes;
            std::size_t remaining{};
            BatchHandler done;
        };
        auto aggregate = std::make_shared<Aggregate>();
        aggregate->outcomes.resize(files.size());
        aggregate->remaining = files.size();
        aggregate->done = std::move(done);

        logger_.log("transfer", "uploading ", files.size(), " item(s) to ", remote_directory);
        for (std::size_t index = 0; index < files.size(); ++index)
        {
            const auto destination =
                remote_path::join(remote_directory, remote_path::file_name(files[index].generic_string()));
            upload(session_id, files[index], destination,
                   [aggregate, index](const TransferOutcome &outcome)
                   {
                       aggregate->outcomes[index] = outcome;
                       if (--aggregate->remaining == 0 && aggregate->done)
                       {
                           aggregate->done(aggregate->outcomes);
                       }
                   },
                   batch);
        }
    }

    void TransferCoordinator::cancel(const std::string &task_id, ResultHandler done)
    {
        auto it = tasks_.find(task_id);
        if (it == tasks_.end())
        {
            if (done)
            {
                done(OperationResult::failure(ErrorCode::NotFound, "Unknown task " + task_id));
            }
            return;
        }
        if (protocol::is_terminal(it->second.status))
        {
            if (done)
            {
                done(OperationResult::failure(ErrorCode::InvalidCommand, "Task already finished"));
            }
            return;
        }
        logger_.log("transfer", "cancel requested for ", task_id);
        service_.cancel_transfer(task_id, [this, task_id, done = std::move(done)](const OperationResult &result)
                                 {
            if (!result.ok())
            {
                logger_.warn("transfer", "cancel of ", task_id, " failed: ", result.message);
            }
            if (done)
            {
                done(result);
            } });
    }

    std::vector<protocol::TransferTask> TransferCoordinator::tasks() const
    {
        std::vector<protocol::TransferTask> result;
        result.reserve(order_.size());
        for (const auto &id : order_)
        {
            result.push_back(tasks_.at(id));
        }
        return result;
    }

    std::optional<protocol::TransferTask> TransferCoordinator::find(const std::string &task_id) const
    {
        auto it = tasks_.find(task_id);
        if (it == tasks_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::string TransferCoordinator::start(protocol::TransferTask task, CompletionHandler done,
                                           const std::shared_ptr<TransferBatch> &batch, Issue issue)
    {
        task.task_id = crypto::generate_task_id();
        task.status = protocol::TransferStatus::Pending;
        const auto task_id = task.task_id;
        const auto session_id = task.session_id;

        logger_.log("transfer", protocol::to_string(task.kind), ' ', task.source_path, " -> ", task.destination_path,
                    " as ", task_id);
        order_.push_back(task_id);
        tasks_.emplace(task_id, std::move(task));
        if (batch)
        {
            batch->task_ids.insert(task_id);
        }

        auto completion = TaskCompletion::start(io_, events_, session_id, task_id, settings_.completion_timeout,
                                                [this, done = std::move(done)](const TransferOutcome &outcome)
                                                {
                                                    on_outcome(outcome);
                                                    if (done)
                                                    {
                                                        done(outcome);
                                                    }
                                                });

        issue(task_id, [completion](const OperationResult &result)
              {
            if (!result.ok())
            {
                completion->fail(result.error, result.message);
            } });
        return task_id;
    }

    void TransferCoordinator::on_progress(const protocol::TransferTask &event)
    {
        auto it = tasks_.find(event.task_id);
        if (it == tasks_.end())
        {
            // Late events of removed tasks end up here as well.
            logger_.log("transfer", "ignoring event for unknown task ", event.task_id);
            return;
        }
        auto &task = it->second;
        if (protocol::is_terminal(task.status) || status_rank(event.status) < status_rank(task.status))
        {
            logger_.warn("transfer", "protocol violation: task ", task.task_id, " moved from ",
                         protocol::to_string(task.status), " to ", protocol::to_string(event.status));
            return;
        }

        task.status = event.status;
        if (event.total_bytes != 0)
        {
            task.total_bytes = event.total_bytes;
        }
        task.transferred_bytes = event.transferred_bytes;
        if (task.total_bytes != 0)
        {
            task.transferred_bytes = std::min(task.transferred_bytes, task.total_bytes);
        }
        task.speed_bytes_per_second = event.speed_bytes_per_second;
        task.eta_seconds = event.eta_seconds;
        task.error = event.error;

        if (protocol::is_terminal(task.status))
        {
            logger_.log("transfer", "task ", task.task_id, ' ', protocol::to_string(task.status),
                        task.error ? ": " + *task.error : std::string{});
            schedule_removal(task.task_id);
        }
    }

    void TransferCoordinator::on_outcome(const TransferOutcome &outcome)
    {
        auto it = tasks_.find(outcome.task_id);
        if (it == tasks_.end() || protocol::is_terminal(it->second.status))
        {
            return;
        }
        // Timeouts and rejected requests never produce a terminal event of their own.
        mark_failed(outcome.task_id, outcome.message);
    }

    void TransferCoordinator::mark_failed(const std::string &task_id, const std::string &message)
    {
        auto failed = tasks_.at(task_id);
        failed.status = protocol::TransferStatus::Failed;
        failed.error = message;
        failed.speed_bytes_per_second = 0;
        failed.eta_seconds.reset();
        logger_.warn("transfer", "task ", task_id, " failed: ", message);
        // Published like a remote event so other listeners see the task end too.
        events_.publish(failed);
    }

    void TransferCoordinator::schedule_removal(const std::string &task_id)
    {
        auto timer = std::make_unique<asio::steady_timer>(io_);
        timer->expires_after(settings_.removal_grace);
        timer->async_wait([this, task_id](const asio::error_code &ec)
                          {
            if (ec == asio::error::operation_aborted)
            {
                return;
            }
            tasks_.erase(task_id);
            order_.erase(std::remove(order_.begin(), order_.end(), task_id), order_.end());
            removals_.erase(task_id); });
        removals_.insert_or_assign(task_id, std::move(timer));
    }

} // namespace remotefs::client
