#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include <asio.hpp>

#include "remotefs/client/event_bus.hpp"
#include "remotefs/error_codes.hpp"
#include "remotefs/protocol.hpp"

namespace remotefs::client
{

    struct TransferOutcome
    {
        std::string task_id;
        protocol::TransferStatus status{protocol::TransferStatus::Pending};
        ErrorCode error{ErrorCode::Ok};
        std::string message{};

        bool ok() const noexcept { return error == ErrorCode::Ok; }
    };

    // Maps a terminal task onto the result reported to the caller.
    TransferOutcome outcome_from_task(const protocol::TransferTask &task);

    inline constexpr std::string_view kTransferTimeoutMessage = "Timeout waiting for transfer";

    // Awaits the terminal state of one task. The subscription is taken when the completion is
    // created, so callers create it before issuing the remote request. The handler runs
    // exactly once: on the terminal event, on fail(), or when the timeout expires.
    class TaskCompletion : public std::enable_shared_from_this<TaskCompletion>
    {
    public:
        using Handler = std::function<void(const TransferOutcome &)>;

        static std::shared_ptr<TaskCompletion> start(asio::io_context &io, EventBus &events,
                                                     const std::string &session_id, const std::string &task_id,
                                                     std::chrono::milliseconds timeout, Handler handler);

        TaskCompletion(asio::io_context &io, std::string task_id, Handler handler);

        void fail(ErrorCode code, std::string message);
        bool finished() const noexcept { return finished_; }

    private:
        void on_progress(const protocol::TransferTask &task);
        void finish(TransferOutcome outcome);

        std::string task_id_;
        Handler handler_;
        asio::steady_timer timer_;
        EventBus::Subscription subscription_;
        bool finished_{false};
    };

} // namespace remotefs::client
