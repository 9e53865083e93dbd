#include "remotefs/client/event_bus.hpp"

#include <utility>
#include <vector>

#include "remotefs/client/logger.hpp"

namespace remotefs::client
{

    struct EventBus::Subscription::Registry
    {
        struct ProgressEntry
        {
            std::optional<std::string> session_id;
            ProgressListener listener;
        };

        std::uint64_t next_id{1};
        std::map<std::uint64_t, ProgressEntry> progress;
        std::map<std::uint64_t, ConflictListener> conflicts;

        void erase(std::uint64_t id)
        {
            progress.erase(id);
            conflicts.erase(id);
        }

        bool contains(std::uint64_t id) const
        {
            return progress.count(id) != 0 || conflicts.count(id) != 0;
        }
    };

    EventBus::Subscription::Subscription(std::weak_ptr<Registry> registry, std::uint64_t id)
        : registry_(std::move(registry)), id_(id) {}

    EventBus::Subscription::~Subscription()
    {
        reset();
    }

    EventBus::Subscription::Subscription(Subscription &&other) noexcept
        : registry_(std::move(other.registry_)), id_(other.id_)
    {
        other.id_ = 0;
    }

    EventBus::Subscription &EventBus::Subscription::operator=(Subscription &&other) noexcept
    {
        if (this != &other)
        {
            reset();
            registry_ = std::move(other.registry_);
            id_ = other.id_;
            other.id_ = 0;
        }
        return *this;
    }

    void EventBus::Subscription::reset()
    {
        if (id_ == 0)
        {
            return;
        }
        if (auto registry = registry_.lock())
        {
            registry->erase(id_);
        }
        registry_.reset();
        id_ = 0;
    }

    bool EventBus::Subscription::active() const
    {
        auto registry = registry_.lock();
        return registry && registry->contains(id_);
    }

    EventBus::EventBus(Logger &logger)
        : logger_(logger), registry_(std::make_shared<Subscription::Registry>()) {}

    EventBus::Subscription EventBus::on_progress(std::optional<std::string> session_id, ProgressListener listener)
    {
        const auto id = registry_->next_id++;
        registry_->progress.emplace(id, Subscription::Registry::ProgressEntry{std::move(session_id), std::move(listener)});
        return Subscription(registry_, id);
    }

    EventBus::Subscription EventBus::on_conflict(ConflictListener listener)
    {
        const auto id = registry_->next_id++;
        registry_->conflicts.emplace(id, std::move(listener));
        return Subscription(registry_, id);
    }

    void EventBus::publish(const protocol::TransferTask &task)
    {
        // Snapshot first: listeners subscribe and unsubscribe while we iterate.
        std::vector<std::pair<std::uint64_t, ProgressListener>> targets;
        for (const auto &[id, entry] : registry_->progress)
        {
            if (!entry.session_id || *entry.session_id == task.session_id)
            {
                targets.emplace_back(id, entry.listener);
            }
        }
        for (const auto &[id, listener] : targets)
        {
            if (registry_->progress.count(id) != 0)
            {
                listener(task);
            }
        }
    }

    void EventBus::publish(const protocol::FileConflict &conflict)
    {
        std::vector<std::pair<std::uint64_t, ConflictListener>> targets(registry_->conflicts.begin(),
                                                                         registry_->conflicts.end());
        for (const auto &[id, listener] : targets)
        {
            if (registry_->conflicts.count(id) != 0)
            {
                listener(conflict);
            }
        }
    }

    void EventBus::dispatch(const protocol::EventEnvelope &envelope)
    {
        if (envelope.event == protocol::kTransferProgressEvent)
        {
            protocol::TransferTask task;
            try
            {
                task = envelope.payload.get<protocol::TransferTask>();
            }
            catch (const std::exception &ex)
            {
                logger_.warn("events", "malformed ", envelope.event, " payload: ", ex.what());
                return;
            }
            publish(task);
        }
        else if (envelope.event == protocol::kFileConflictEvent)
        {
            protocol::FileConflict conflict;
            try
            {
                conflict = envelope.payload.get<protocol::FileConflict>();
            }
            catch (const std::exception &ex)
            {
                logger_.warn("events", "malformed ", envelope.event, " payload: ", ex.what());
                return;
            }
            publish(conflict);
        }
        else
        {
            logger_.warn("events", "ignoring unknown event ", envelope.event);
        }
    }

} // namespace remotefs::client
