#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "remotefs/client/event_bus.hpp"
#include "remotefs/client/transfer_batch.hpp"
#include "remotefs/protocol.hpp"
#include "remotefs/remote_service.hpp"

namespace remotefs::client
{

    class Logger;

    enum class ResolutionChoice : std::uint8_t
    {
        Overwrite,
        Skip,
        Cancel,
        OverwriteAll
    };

    std::string_view to_string(ResolutionChoice choice) noexcept;
    std::optional<ResolutionChoice> resolution_choice_from_string(std::string_view value) noexcept;

    // Holds the collisions the remote side reported and forwards the user's decisions. A
    // collision disappears once its task ends, however it ended.
    class ConflictResolver
    {
    public:
        ConflictResolver(RemoteService &service, EventBus &events, Logger &logger);

        ConflictResolver(const ConflictResolver &) = delete;
        ConflictResolver &operator=(const ConflictResolver &) = delete;

        // A new upload action; pass the batch to the transfer coordinator.
        std::shared_ptr<TransferBatch> begin_batch();

        const std::vector<protocol::FileConflict> &conflicts() const noexcept { return conflicts_; }

        void resolve(const std::string &task_id, ResolutionChoice choice, ResultHandler done = {});

    private:
        void on_conflict(const protocol::FileConflict &conflict);
        void on_progress(const protocol::TransferTask &task);
        std::shared_ptr<TransferBatch> batch_for(const std::string &task_id);
        void send(const std::string &task_id, protocol::ConflictResolution resolution, ResultHandler done);

        RemoteService &service_;
        Logger &logger_;
        std::vector<protocol::FileConflict> conflicts_;
        std::vector<std::weak_ptr<TransferBatch>> batches_;
        EventBus::Subscription conflict_subscription_;
        EventBus::Subscription progress_subscription_;
    };

} // namespace remotefs::client
