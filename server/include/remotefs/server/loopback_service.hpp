#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include <asio.hpp>

#include "remotefs/protocol.hpp"
#include "remotefs/remote_service.hpp"
#include "remotefs/server/filesystem.hpp"
#include "remotefs/server/transfer_registry.hpp"

namespace remotefs::server
{

    struct LoopbackOptions
    {
        std::size_t chunk_size{64 * 1024};
        std::optional<std::size_t> max_transfer_rate;
        std::chrono::milliseconds progress_interval{500};
        std::chrono::milliseconds conflict_timeout{std::chrono::minutes{5}};
    };

    using EventSink = std::function<void(const remotefs::protocol::EventEnvelope &)>;

    // RemoteService over local directories, one sandbox root per session. Transfers run as
    // chunked steps on the io_context and report through the event sink.
    class LoopbackService : public remotefs::RemoteService
    {
    public:
        LoopbackService(asio::io_context &io, LoopbackOptions options, EventSink sink);
        ~LoopbackService() override;

        LoopbackService(const LoopbackService &) = delete;
        LoopbackService &operator=(const LoopbackService &) = delete;

        void add_session(const std::string &session_id, const std::filesystem::path &root);
        void remove_session(const std::string &session_id);

        std::size_t active_transfers() const noexcept { return registry_.size(); }

        void list_directory(const std::string &session_id, const std::string &path,
                            remotefs::ListHandler handler) override;

        void upload(const std::string &session_id, const std::filesystem::path &local_path,
                    const std::string &remote_path, const std::string &task_id,
                    remotefs::ResultHandler handler) override;

        void download(const std::string &session_id, const std::string &remote_path,
                      const std::filesystem::path &local_path, const std::string &task_id,
                      remotefs::ResultHandler handler) override;

        void copy(const std::string &session_id, const std::string &source_path,
                  const std::string &destination_path, remotefs::ResultHandler handler) override;

        void rename(const std::string &session_id, const std::string &old_path, const std::string &new_path,
                    remotefs::ResultHandler handler) override;

        void remove(const std::string &session_id, const std::string &path, bool is_directory,
                    remotefs::ResultHandler handler) override;

        void create_file(const std::string &session_id, const std::string &path,
                         remotefs::ResultHandler handler) override;

        void create_directory(const std::string &session_id, const std::string &path,
                              remotefs::ResultHandler handler) override;

        void change_permissions(const std::string &session_id, const std::string &path, std::uint32_t mode,
                                remotefs::ResultHandler handler) override;

        void cancel_transfer(const std::string &task_id, remotefs::ResultHandler handler) override;

        void resolve_conflict(const std::string &task_id, remotefs::protocol::ConflictResolution resolution,
                              remotefs::ResultHandler handler) override;

    private:
        const SessionPaths &session(const std::string &session_id) const;

        void post(remotefs::ResultHandler handler, remotefs::OperationResult result);
        void run_operation(const std::string &what, remotefs::ResultHandler handler,
                           const std::function<void()> &operation);

        void schedule_begin(const std::shared_ptr<TransferJob> &job, bool detect_conflict);
        void begin(const std::shared_ptr<TransferJob> &job, bool detect_conflict);
        void park(const std::shared_ptr<TransferJob> &job);
        void apply_resolution(const std::shared_ptr<TransferJob> &job,
                              remotefs::protocol::ConflictResolution resolution);
        void schedule_step(const std::shared_ptr<TransferJob> &job, std::chrono::milliseconds delay);
        void step(const std::shared_ptr<TransferJob> &job);
        void finish(const std::shared_ptr<TransferJob> &job, remotefs::protocol::TransferStatus status,
                    std::optional<std::string> error);
        void report(TransferJob &job);

        asio::io_context &io_;
        LoopbackOptions options_;
        EventSink sink_;
        Filesystem filesystem_;
        TransferRegistry registry_;
        std::map<std::string, SessionPaths> sessions_;
    };

} // namespace remotefs::server
