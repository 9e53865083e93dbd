#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <asio.hpp>

#include "remotefs/client/event_bus.hpp"
#include "remotefs/client/task_completion.hpp"
#include "remotefs/client/transfer_batch.hpp"
#include "remotefs/protocol.hpp"
#include "remotefs/remote_service.hpp"

namespace remotefs::client
{

    class Logger;

    struct TransferSettings
    {
        std::chrono::milliseconds completion_timeout{std::chrono::seconds{60}};
        std::chrono::milliseconds removal_grace{std::chrono::seconds{3}};
    };

    using CompletionHandler = std::function<void(const TransferOutcome &)>;
    using BatchHandler = std::function<void(const std::vector<TransferOutcome> &)>;

    // Issues transfers under client-generated task ids and keeps the visible task list in
    // step with the progress events the remote side reports for them.
    class TransferCoordinator
    {
    public:
        TransferCoordinator(asio::io_context &io, RemoteService &service, EventBus &events, Logger &logger,
                            TransferSettings settings = {});

        TransferCoordinator(const TransferCoordinator &) = delete;
        TransferCoordinator &operator=(const TransferCoordinator &) = delete;

        // Returns the task id; the visible task exists before the request leaves.
        std::string upload(const std::string &session_id, const std::filesystem::path &local_path,
                           const std::string &remote_path, CompletionHandler done = {},
                           const std::shared_ptr<TransferBatch> &batch = {});

        std::string download(const std::string &session_id, const std::string &remote_path,
                             const std::filesystem::path &local_path, CompletionHandler done = {});

        // Uploads every file into remote_directory concurrently. Outcomes are reported in the
        // order of files once all of them finished.
        void upload_batch(const std::string &session_id, const std::vector<std::filesystem::path> &files,
                          const std::string &remote_directory, const std::shared_ptr<TransferBatch> &batch,
                          BatchHandler done);

        void cancel(const std::string &task_id, ResultHandler done = {});

        std::vector<protocol::TransferTask> tasks() const;
        std::optional<protocol::TransferTask> find(const std::string &task_id) const;

    private:
        using Issue = std::function<void(const std::string &task_id, ResultHandler acknowledged)>;

        std::string start(protocol::TransferTask task, CompletionHandler done, const std::shared_ptr<TransferBatch> &batch,
                          Issue issue);
        void on_progress(const protocol::TransferTask &event);
        void on_outcome(const TransferOutcome &outcome);
        void mark_failed(const std::string &task_id, const std::string &message);
        void schedule_removal(const std::string &task_id);

        asio::io_context &io_;
        RemoteService &service_;
        EventBus &events_;
        Logger &logger_;
        TransferSettings settings_;

        std::vector<std::string> order_;
        std::unordered_map<std::string, protocol::TransferTask> tasks_;
        std::map<std::string, std::unique_ptr<asio::steady_timer>> removals_;
        EventBus::Subscription progress_subscription_;
    };

} // namespace remotefs::client
