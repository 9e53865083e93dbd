#include "remotefs/client/task_completion.hpp"

#include <utility>

namespace remotefs::client
{

    TransferOutcome outcome_from_task(const protocol::TransferTask &task)
    {
        TransferOutcome outcome{.task_id = task.task_id, .status = task.status};
        switch (task.status)
        {
        case protocol::TransferStatus::Completed:
            break;
        case protocol::TransferStatus::Cancelled:
            if (task.error && task.error->find("Skipped") != std::string::npos)
            {
                outcome.error = ErrorCode::Skipped;
                outcome.message = "Skipped";
            }
            else
            {
                outcome.error = ErrorCode::Cancelled;
                outcome.message = "Cancelled";
            }
            break;
        case protocol::TransferStatus::Failed:
            outcome.error = ErrorCode::TransferFailed;
            outcome.message = task.error.value_or("Failed");
            break;
        default:
            outcome.error = ErrorCode::InternalError;
            outcome.message = "Transfer has not finished";
            break;
        }
        return outcome;
    }

    std::shared_ptr<TaskCompletion> TaskCompletion::start(asio::io_context &io, EventBus &events,
                                                          const std::string &session_id, const std::string &task_id,
                                                          std::chrono::milliseconds timeout, Handler handler)
    {
        auto completion = std::make_shared<TaskCompletion>(io, task_id, std::move(handler));
        std::weak_ptr<TaskCompletion> weak = completion;
        completion->subscription_ = events.on_progress(session_id, [weak](const protocol::TransferTask &task)
                                                       {
            if (auto self = weak.lock())
            {
                self->on_progress(task);
            } });

        // The pending wait owns the completion until it fires or is cancelled.
        completion->timer_.expires_after(timeout);
        completion->timer_.async_wait([completion](const asio::error_code &ec)
                                      {
            if (ec == asio::error::operation_aborted)
            {
                return;
            }
            completion->finish(TransferOutcome{
                .task_id = completion->task_id_,
                .status = protocol::TransferStatus::Failed,
                .error = ErrorCode::Timeout,
                .message = std::string(kTransferTimeoutMessage),
            }); });
        return completion;
    }

    TaskCompletion::TaskCompletion(asio::io_context &io, std::string task_id, Handler handler)
        : task_id_(std::move(task_id)), handler_(std::move(handler)), timer_(io) {}

    void TaskCompletion::fail(ErrorCode code, std::string message)
    {
        finish(TransferOutcome{
            .task_id = task_id_,
            .status = protocol::TransferStatus::Failed,
            .error = code,
            .message = std::move(message),
        });
    }

    void TaskCompletion::on_progress(const protocol::TransferTask &task)
    {
        if (task.task_id != task_id_ || !protocol::is_terminal(task.status))
        {
            return;
        }
        finish(outcome_from_task(task));
    }

    void TaskCompletion::finish(TransferOutcome outcome)
    {
        if (finished_)
        {
            return;
        }
        finished_ = true;
        subscription_.reset();
        timer_.cancel();
        auto handler = std::move(handler_);
        handler_ = nullptr;
        if (handler)
        {
            handler(outcome);
        }
    }

} // namespace remotefs::client
