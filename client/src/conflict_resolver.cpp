#include "remotefs/client/conflict_resolver.hpp"

#include <algorithm>
#include <array>
#include <utility>

#include "remotefs/client/logger.hpp"

namespace remotefs::client
{

    namespace
    {

        struct ChoiceMapping
        {
            ResolutionChoice choice;
            std::string_view label;
        };

        constexpr std::array<ChoiceMapping, 4> kChoiceMappings{{
            {ResolutionChoice::Overwrite, "overwrite"},
            {ResolutionChoice::Skip, "skip"},
            {ResolutionChoice::Cancel, "cancel"},
            {ResolutionChoice::OverwriteAll, "overwrite-all"},
        }};

        protocol::ConflictResolution to_resolution(ResolutionChoice choice)
        {
            switch (choice)
            {
            case ResolutionChoice::Skip:
                return protocol::ConflictResolution::Skip;
            case ResolutionChoice::Cancel:
                return protocol::ConflictResolution::Cancel;
            default:
                return protocol::ConflictResolution::Overwrite;
            }
        }

    } // namespace

    std::string_view to_string(ResolutionChoice choice) noexcept
    {
        for (const auto &mapping : kChoiceMappings)
        {
            if (mapping.choice == choice)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<ResolutionChoice> resolution_choice_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kChoiceMappings)
        {
            if (mapping.label == value)
            {
                return mapping.choice;
            }
        }
        return std::nullopt;
    }

    ConflictResolver::ConflictResolver(RemoteService &service, EventBus &events, Logger &logger)
        : service_(service), logger_(logger)
    {
        conflict_subscription_ = events.on_conflict([this](const protocol::FileConflict &conflict)
                                                    { on_conflict(conflict); });
        progress_subscription_ = events.on_progress(std::nullopt, [this](const protocol::TransferTask &task)
                                                    { on_progress(task); });
    }

    std::shared_ptr<TransferBatch> ConflictResolver::begin_batch()
    {
        // Forget batches whose upload action is gone.
        batches_.erase(std::remove_if(batches_.begin(), batches_.end(),
                                      [](const std::weak_ptr<TransferBatch> &batch)
                                      { return batch.expired(); }),
                       batches_.end());
        auto batch = std::make_shared<TransferBatch>();
        batches_.push_back(batch);
        return batch;
    }

    void ConflictResolver::resolve(const std::string &task_id, ResolutionChoice choice, ResultHandler done)
    {
        auto it = std::find_if(conflicts_.begin(), conflicts_.end(), [&task_id](const protocol::FileConflict &conflict)
                               { return conflict.task_id == task_id; });
        if (it == conflicts_.end())
        {
            if (done)
            {
                done(OperationResult::failure(ErrorCode::NotFound, "No pending conflict for task " + task_id));
            }
            return;
        }
        conflicts_.erase(it);
        logger_.log("conflict", "task ", task_id, " resolved as ", to_string(choice));

        if (choice == ResolutionChoice::OverwriteAll)
        {
            if (auto batch = batch_for(task_id))
            {
                batch->overwrite_all = true;
                std::vector<std::string> siblings;
                for (auto sibling = conflicts_.begin(); sibling != conflicts_.end();)
                {
                    if (batch->contains(sibling->task_id))
                    {
                        siblings.push_back(sibling->task_id);
                        sibling = conflicts_.erase(sibling);
                    }
                    else
                    {
                        ++sibling;
                    }
                }
                for (const auto &sibling_id : siblings)
                {
                    send(sibling_id, protocol::ConflictResolution::Overwrite, {});
                }
            }
            else
            {
                logger_.warn("conflict", "task ", task_id, " belongs to no batch, overwriting it alone");
            }
        }
        send(task_id, to_resolution(choice), std::move(done));
    }

    void ConflictResolver::on_conflict(const protocol::FileConflict &conflict)
    {
        auto batch = batch_for(conflict.task_id);
        if (batch && batch->overwrite_all)
        {
            logger_.log("conflict", "overwriting ", conflict.file_path, " (overwrite all)");
            send(conflict.task_id, protocol::ConflictResolution::Overwrite, {});
            return;
        }

        logger_.log("conflict", "task ", conflict.task_id, " collides with ", conflict.file_path);
        auto it = std::find_if(conflicts_.begin(), conflicts_.end(), [&conflict](const protocol::FileConflict &existing)
                               { return existing.task_id == conflict.task_id; });
        if (it != conflicts_.end())
        {
            *it = conflict;
            return;
        }
        conflicts_.push_back(conflict);
    }

    void ConflictResolver::on_progress(const protocol::TransferTask &task)
    {
        if (!protocol::is_terminal(task.status))
        {
            return;
        }
        auto it = std::find_if(conflicts_.begin(), conflicts_.end(), [&task](const protocol::FileConflict &conflict)
                               { return conflict.task_id == task.task_id; });
        if (it != conflicts_.end())
        {
            logger_.log("conflict", "task ", task.task_id, " ended while waiting for a decision");
            conflicts_.erase(it);
        }
    }

    std::shared_ptr<TransferBatch> ConflictResolver::batch_for(const std::string &task_id)
    {
        for (const auto &weak : batches_)
        {
            auto batch = weak.lock();
            if (batch && batch->contains(task_id))
            {
                return batch;
            }
        }
        return nullptr;
    }

    void ConflictResolver::send(const std::string &task_id, protocol::ConflictResolution resolution,
                                ResultHandler done)
    {
        service_.resolve_conflict(task_id, resolution,
                                  [this, task_id, done = std::move(done)](const OperationResult &result)
                                  {
                                      if (!result.ok())
                                      {
                                          logger_.warn("conflict", "resolution for ", task_id,
                                                       " was not delivered: ", result.message);
                                      }
                                      if (done)
                                      {
                                          done(result);
                                      }
                                  });
    }

} // namespace remotefs::client
