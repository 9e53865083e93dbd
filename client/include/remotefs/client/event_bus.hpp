#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "remotefs/protocol.hpp"

namespace remotefs::client
{

    class Logger;

    // Fans inbound remote events out to listeners. Listeners run on the publishing thread, which
    // is the event loop thread. A listener may drop any subscription, its own included, while an
    // event is being delivered.
    class EventBus
    {
    public:
        using ProgressListener = std::function<void(const protocol::TransferTask &)>;
        using ConflictListener = std::function<void(const protocol::FileConflict &)>;

        class Subscription
        {
        public:
            Subscription() = default;
            ~Subscription();

            Subscription(Subscription &&other) noexcept;
            Subscription &operator=(Subscription &&other) noexcept;

            Subscription(const Subscription &) = delete;
            Subscription &operator=(const Subscription &) = delete;

            void reset();
            bool active() const;

        private:
            friend class EventBus;

            struct Registry;

            Subscription(std::weak_ptr<Registry> registry, std::uint64_t id);

            std::weak_ptr<Registry> registry_;
            std::uint64_t id_{0};
        };

        explicit EventBus(Logger &logger);

        // session_id filters progress events; std::nullopt receives every session.
        [[nodiscard]] Subscription on_progress(std::optional<std::string> session_id, ProgressListener listener);
        [[nodiscard]] Subscription on_conflict(ConflictListener listener);

        void publish(const protocol::TransferTask &task);
        void publish(const protocol::FileConflict &conflict);

        // Decodes a JSON event envelope; unknown events and malformed payloads are logged and dropped.
        void dispatch(const protocol::EventEnvelope &envelope);

    private:
        Logger &logger_;
        std::shared_ptr<Subscription::Registry> registry_;
    };

} // namespace remotefs::client
