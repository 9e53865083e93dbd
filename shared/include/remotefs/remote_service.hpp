/**
 * RemoteFS - Interface of the remote connection service consumed by the explorer engine.
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "remotefs/error_codes.hpp"
#include "remotefs/protocol.hpp"

namespace remotefs
{

    struct OperationResult
    {
        ErrorCode error{ErrorCode::Ok};
        std::string message{};

        bool ok() const noexcept { return error == ErrorCode::Ok; }

        static OperationResult success() { return {}; }

        static OperationResult failure(ErrorCode code, std::string text)
        {
            return OperationResult{code, std::move(text)};
        }
    };

    using ResultHandler = std::function<void(const OperationResult &)>;
    using ListHandler = std::function<void(const OperationResult &, std::vector<protocol::FileEntry>)>;

    // Every call completes asynchronously on the caller's event loop. Transfer calls only
    // acknowledge the request; their progress arrives as transfer-progress events tagged with
    // the task id supplied by the caller.
    class RemoteService
    {
    public:
        virtual ~RemoteService() = default;

        virtual void list_directory(const std::string &session_id, const std::string &path,
                                    ListHandler handler) = 0;

        virtual void upload(const std::string &session_id, const std::filesystem::path &local_path,
                            const std::string &remote_path, const std::string &task_id, ResultHandler handler) = 0;

        virtual void download(const std::string &session_id, const std::string &remote_path,
                              const std::filesystem::path &local_path, const std::string &task_id,
                              ResultHandler handler) = 0;

        virtual void copy(const std::string &session_id, const std::string &source_path,
                          const std::string &destination_path, ResultHandler handler) = 0;

        virtual void rename(const std::string &session_id, const std::string &old_path, const std::string &new_path,
                            ResultHandler handler) = 0;

        virtual void remove(const std::string &session_id, const std::string &path, bool is_directory,
                            ResultHandler handler) = 0;

        virtual void create_file(const std::string &session_id, const std::string &path, ResultHandler handler) = 0;

        virtual void create_directory(const std::string &session_id, const std::string &path,
                                      ResultHandler handler) = 0;

        virtual void change_permissions(const std::string &session_id, const std::string &path, std::uint32_t mode,
                                        ResultHandler handler) = 0;

        virtual void cancel_transfer(const std::string &task_id, ResultHandler handler) = 0;

        virtual void resolve_conflict(const std::string &task_id, protocol::ConflictResolution resolution,
                                      ResultHandler handler) = 0;
    };

} // namespace remotefs
