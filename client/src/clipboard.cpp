#include "remotefs/client/clipboard.hpp"

#include <utility>

#include "remotefs/client/logger.hpp"
#include "remotefs/client/tree_store.hpp"
#include "remotefs/remote_path.hpp"

namespace remotefs::client
{

    namespace
    {

        std::string copy_name(const std::string &name, const std::optional<std::set<std::string>> &existing)
        {
            auto candidate = "copy_of_" + name;
            if (!existing)
            {
                return candidate;
            }
            for (int attempt = 2; existing->count(candidate) != 0; ++attempt)
            {
                candidate = "copy_" + std::to_string(attempt) + "_of_" + name;
            }
            return candidate;
        }

    } // namespace

    PastePlan plan_paste(const ClipboardEntry &entry, const std::string &destination_directory,
                         const std::optional<std::set<std::string>> &existing_names)
    {
        const auto source = remote_path::normalize(entry.source_path);
        const auto destination = remote_path::normalize(destination_directory);
        const auto into_parent = remote_path::parent(source) == destination;

        if (entry.is_directory && remote_path::is_same_or_descendant(destination, source))
        {
            return PastePlan{
                .error = ErrorCode::InvalidPayload,
                .message = "Cannot paste a directory into itself",
            };
        }

        if (entry.is_cut)
        {
            if (into_parent)
            {
                return PastePlan{};
            }
            return PastePlan{
                .operation = PasteOperation::Move,
                .destination_path = remote_path::join(destination, entry.source_name),
            };
        }

        const auto name = into_parent ? copy_name(entry.source_name, existing_names) : entry.source_name;
        return PastePlan{
            .operation = PasteOperation::Copy,
            .destination_path = remote_path::join(destination, name),
        };
    }

    std::string select_paste_target(const std::optional<protocol::FileEntry> &context_entry,
                                    const std::string &current_path)
    {
        if (context_entry && context_entry->is_directory_like())
        {
            return remote_path::normalize(context_entry->path);
        }
        return remote_path::normalize(current_path);
    }

    Clipboard::Clipboard(RemoteService &service, TreeStore &tree, Logger &logger)
        : service_(service), tree_(tree), logger_(logger) {}

    void Clipboard::cut(const std::string &session_id, const protocol::FileEntry &entry)
    {
        stage(session_id, entry, true);
    }

    void Clipboard::copy(const std::string &session_id, const protocol::FileEntry &entry)
    {
        stage(session_id, entry, false);
    }

    void Clipboard::clear()
    {
        entry_.reset();
    }

    void Clipboard::paste(const std::string &session_id, const std::string &destination_directory,
                          ResultHandler done)
    {
        auto notify = [&done](const OperationResult &result)
        {
            if (done)
            {
                done(result);
            }
        };

        if (!entry_)
        {
            notify(OperationResult::failure(ErrorCode::InvalidCommand, "Clipboard is empty"));
            return;
        }
        const auto entry = std::move(*entry_);
        entry_.reset();

        if (entry.session_id != session_id)
        {
            logger_.warn("clipboard", "refusing to paste ", entry.source_path, " from session ", entry.session_id,
                         " into session ", session_id);
            notify(OperationResult::failure(ErrorCode::InvalidPayload, "Clipboard belongs to another session"));
            return;
        }

        const auto destination_directory_path = remote_path::normalize(destination_directory);
        const auto plan = plan_paste(entry, destination_directory_path,
                                     tree_.cached_names(session_id, destination_directory_path));
        if (plan.error != ErrorCode::Ok)
        {
            logger_.warn("clipboard", "paste of ", entry.source_path, " rejected: ", plan.message);
            notify(OperationResult::failure(plan.error, plan.message));
            return;
        }
        if (plan.operation == PasteOperation::None)
        {
            logger_.log("clipboard", entry.source_path, " is already in ", destination_directory_path);
            notify(OperationResult::success());
            return;
        }

        const bool is_move = plan.operation == PasteOperation::Move;
        const auto source_parent = remote_path::parent(entry.source_path);
        logger_.log("clipboard", is_move ? "moving " : "copying ", entry.source_path, " -> ", plan.destination_path);

        auto finished = [this, session_id, is_move, source_parent, destination_directory_path,
                         done = std::move(done)](const OperationResult &result)
        {
            if (!result.ok())
            {
                logger_.warn("clipboard", "paste failed: ", to_string(result.error), ' ', result.message);
                if (done)
                {
                    done(result);
                }
                return;
            }
            tree_.reload_preserving(
                session_id, destination_directory_path,
                [this, session_id, is_move, source_parent, destination_directory_path,
                 done](const OperationResult &)
                {
                    if (!is_move || source_parent == destination_directory_path)
                    {
                        if (done)
                        {
                            done(OperationResult::success());
                        }
                        return;
                    }
                    tree_.reload_preserving(session_id, source_parent, [done](const OperationResult &)
                                            {
                        if (done)
                        {
                            done(OperationResult::success());
                        } });
                });
        };

        if (is_move)
        {
            service_.rename(session_id, entry.source_path, plan.destination_path, std::move(finished));
        }
        else
        {
            service_.copy(session_id, entry.source_path, plan.destination_path, std::move(finished));
        }
    }

    void Clipboard::stage(const std::string &session_id, const protocol::FileEntry &entry, bool is_cut)
    {
        entry_ = ClipboardEntry{
            .source_path = remote_path::normalize(entry.path),
            .source_name = entry.name,
            .is_directory = entry.is_directory_like(),
            .is_cut = is_cut,
            .session_id = session_id,
        };
        logger_.log("clipboard", is_cut ? "cut " : "copied ", entry_->source_path);
    }

} // namespace remotefs::client
