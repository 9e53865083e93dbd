#include "remotefs/client/explorer.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include "remotefs/client/logger.hpp"
#include "remotefs/remote_path.hpp"

namespace remotefs::client
{

    namespace
    {

        bool is_blank(const std::string &text)
        {
            return std::all_of(text.begin(), text.end(), [](unsigned char ch)
                               { return std::isspace(ch) != 0; });
        }

        bool is_valid_name(const std::string &name)
        {
            return !is_blank(name) && name.find('/') == std::string::npos && name != "." && name != "..";
        }

        void notify(const ResultHandler &done, const OperationResult &result)
        {
            if (done)
            {
                done(result);
            }
        }

    } // namespace

    std::optional<std::uint32_t> parse_octal_permissions(std::string_view text)
    {
        if (text.empty() || text.size() > 4)
        {
            return std::nullopt;
        }
        std::uint32_t mode = 0;
        for (const char ch : text)
        {
            if (ch < '0' || ch > '7')
            {
                return std::nullopt;
            }
            mode = mode * 8 + static_cast<std::uint32_t>(ch - '0');
        }
        return mode;
    }

    std::string permissions_to_octal(const std::optional<std::uint32_t> &mode)
    {
        if (!mode)
        {
            return "755";
        }
        const auto bits = *mode & 0777U;
        std::string text(3, '0');
        text[0] = static_cast<char>('0' + ((bits >> 6) & 7U));
        text[1] = static_cast<char>('0' + ((bits >> 3) & 7U));
        text[2] = static_cast<char>('0' + (bits & 7U));
        return text;
    }

    Explorer::Explorer(asio::io_context &io, RemoteService &service, EventBus &events, Logger &logger,
                       TransferSettings settings)
        : service_(service),
          logger_(logger),
          tree_(service, logger),
          transfers_(io, service, events, logger, settings),
          conflicts_(service, events, logger),
          clipboard_(service, tree_, logger) {}

    void Explorer::remove(const std::string &session_id, const protocol::FileEntry &entry, ResultHandler done)
    {
        const auto path = remote_path::normalize(entry.path);
        logger_.log("explorer", "deleting ", path);
        service_.remove(session_id, path, entry.is_directory,
                        reload_after(session_id, remote_path::parent(path), std::move(done)));
    }

    void Explorer::create_file(const std::string &session_id, const std::optional<protocol::FileEntry> &context_entry,
                               const std::string &name, ResultHandler done)
    {
        if (!is_valid_name(name))
        {
            notify(done, OperationResult::failure(ErrorCode::InvalidPayload, "Invalid file name"));
            return;
        }
        const auto parent = parent_for_new_entry(session_id, context_entry);
        const auto path = remote_path::join(parent, name);
        logger_.log("explorer", "creating file ", path);
        service_.create_file(session_id, path, reload_after(session_id, parent, std::move(done)));
    }

    void Explorer::create_directory(const std::string &session_id,
                                    const std::optional<protocol::FileEntry> &context_entry, const std::string &name,
                                    ResultHandler done)
    {
        if (!is_valid_name(name))
        {
            notify(done, OperationResult::failure(ErrorCode::InvalidPayload, "Invalid directory name"));
            return;
        }
        const auto parent = parent_for_new_entry(session_id, context_entry);
        const auto path = remote_path::join(parent, name);
        logger_.log("explorer", "creating directory ", path);
        service_.create_directory(session_id, path, reload_after(session_id, parent, std::move(done)));
    }

    void Explorer::rename(const std::string &session_id, const protocol::FileEntry &entry,
                          const std::string &new_name, ResultHandler done)
    {
        if (!is_valid_name(new_name))
        {
            notify(done, OperationResult::failure(ErrorCode::InvalidPayload, "Invalid name"));
            return;
        }
        if (new_name == entry.name)
        {
            notify(done, OperationResult::success());
            return;
        }
        const auto path = remote_path::normalize(entry.path);
        const auto parent = remote_path::parent(path);
        const auto target = remote_path::join(parent, new_name);
        logger_.log("explorer", "renaming ", path, " -> ", target);
        service_.rename(session_id, path, target, reload_after(session_id, parent, std::move(done)));
    }

    void Explorer::change_permissions(const std::string &session_id, const protocol::FileEntry &entry,
                                      const std::string &octal_text, ResultHandler done)
    {
        const auto mode = parse_octal_permissions(octal_text);
        if (!mode)
        {
            notify(done, OperationResult::failure(ErrorCode::InvalidPayload, "Invalid permissions: " + octal_text));
            return;
        }
        const auto path = remote_path::normalize(entry.path);
        logger_.log("explorer", "chmod ", permissions_to_octal(*mode), ' ', path);
        service_.change_permissions(session_id, path, *mode,
                                    reload_after(session_id, remote_path::parent(path), std::move(done)));
    }

    void Explorer::upload(const std::string &session_id, const std::vector<std::filesystem::path> &local_files,
                          const std::string &target_directory, BatchHandler done)
    {
        auto batch = conflicts_.begin_batch();
        const auto directory = remote_path::normalize(target_directory);
        // The handler keeps the batch alive until every member finished.
        transfers_.upload_batch(
            session_id, local_files, directory, batch,
            [this, session_id, directory, batch, done = std::move(done)](const std::vector<TransferOutcome> &outcomes)
            {
                const auto completed = std::count_if(outcomes.begin(), outcomes.end(), [](const TransferOutcome &outcome)
                                                     { return outcome.ok(); });
                logger_.log("explorer", "upload batch finished, ", completed, " of ", outcomes.size(), " completed");
                if (completed == 0)
                {
                    if (done)
                    {
                        done(outcomes);
                    }
                    return;
                }
                tree_.reload_preserving(session_id, directory, [done, outcomes](const OperationResult &)
                                        {
                    if (done)
                    {
                        done(outcomes);
                    } });
            });
    }

    std::string Explorer::download(const std::string &session_id, const std::string &remote_path,
                                   const std::filesystem::path &local_path, CompletionHandler done)
    {
        return transfers_.download(session_id, remote_path, local_path, std::move(done));
    }

    std::string Explorer::parent_for_new_entry(const std::string &session_id,
                                               const std::optional<protocol::FileEntry> &context_entry) const
    {
        if (!context_entry)
        {
            return tree_.current_path(session_id).value_or("/");
        }
        if (context_entry->is_directory_like())
        {
            return remote_path::normalize(context_entry->path);
        }
        return remote_path::parent(context_entry->path);
    }

    ResultHandler Explorer::reload_after(const std::string &session_id, const std::string &directory,
                                         ResultHandler done)
    {
        return [this, session_id, directory, done = std::move(done)](const OperationResult &result)
        {
            if (!result.ok())
            {
                logger_.warn("explorer", "operation in ", directory, " failed: ", to_string(result.error), ' ',
                             result.message);
                notify(done, result);
                return;
            }
            tree_.reload_preserving(session_id, directory, [done](const OperationResult &)
                                    { notify(done, OperationResult::success()); });
        };
    }

} // namespace remotefs::client
