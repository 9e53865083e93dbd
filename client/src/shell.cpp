#include "remotefs/client/shell.hpp"

#include <cctype>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

#include <nlohmann/json.hpp>

#include "remotefs/remote_path.hpp"
#include "remotefs/version.hpp"

namespace remotefs::client
{

    namespace
    {

        std::string trim(const std::string &input)
        {
            const auto begin = input.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
            {
                return "";
            }
            const auto end = input.find_last_not_of(" \t\r\n");
            return input.substr(begin, end - begin + 1);
        }

        std::vector<std::string> split_tokens(const std::string &input)
        {
            std::vector<std::string> tokens;
            std::istringstream iss(input);
            std::string token;
            while (iss >> token)
            {
                tokens.push_back(token);
            }
            return tokens;
        }

        std::string to_upper(std::string value)
        {
            for (auto &ch : value)
            {
                ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
            }
            return value;
        }

        void print_entry(const protocol::FileEntry &entry, int depth)
        {
            std::cout << std::string(static_cast<std::size_t>(depth) * 2, ' ');
            if (entry.is_directory_like())
            {
                std::cout << (entry.expanded ? "[-] " : "[+] ");
            }
            else
            {
                std::cout << "    ";
            }
            std::cout << entry.name;
            if (entry.is_symlink)
            {
                std::cout << " -> " << entry.symlink_target.value_or("?");
            }
            if (!entry.is_directory_like())
            {
                std::cout << "  " << entry.size << " B";
            }
            std::cout << "  " << permissions_to_octal(entry.permission_bits);
            if (entry.loading)
            {
                std::cout << "  (loading)";
            }
            std::cout << std::endl;
            if (entry.expanded && entry.children)
            {
                for (const auto &child : *entry.children)
                {
                    print_entry(child, depth + 1);
                }
            }
        }

    } // namespace

    Shell::Shell(ClientConfig config)
        : config_(std::move(config)),
          logger_(config_.log_path),
          events_(logger_),
          service_(io_,
                   remotefs::server::LoopbackOptions{
                       .chunk_size = config_.chunk_size,
                       .max_transfer_rate = config_.max_transfer_rate,
                   },
                   [this](const protocol::EventEnvelope &envelope)
                   { events_.dispatch(envelope); }),
          explorer_(io_, service_, events_, logger_,
                    TransferSettings{
                        .completion_timeout = config_.transfer_timeout,
                        .removal_grace = config_.removal_grace,
                    }) {}

    int Shell::run()
    {
        try
        {
            service_.add_session(config_.session_id, config_.root);
            std::cout << "RemoteFS shell " << remotefs::version() << " - session " << config_.session_id << " at "
                      << config_.root.string() << std::endl;
            await([this](ResultHandler done)
                  { explorer_.tree().open(config_.session_id, std::move(done)); });
            interactive_shell();
        }
        catch (const std::exception &ex)
        {
            std::cerr << "ERROR: " << ex.what() << std::endl;
            logger_.log("error", "fatal: ", ex.what());
            return 1;
        }
        return 0;
    }

    void Shell::interactive_shell()
    {
        while (true)
        {
            std::cout << config_.session_id << "> " << std::flush;
            std::string line;
            if (!std::getline(std::cin, line))
            {
                std::cout << std::endl;
                break;
            }
            line = trim(line);
            if (line.empty())
            {
                io_.restart();
                io_.poll();
                continue;
            }
            logger_.log("cmd", line);

            const auto tokens = split_tokens(line);
            const auto command = to_upper(tokens[0]);
            const std::vector<std::string> args(tokens.begin() + 1, tokens.end());

            if (command == "EXIT" || command == "QUIT")
            {
                std::cout << "OK" << std::endl;
                break;
            }
            if (command == "HELP")
            {
                print_help();
                continue;
            }

            try
            {
                if (!dispatch(command, args))
                {
                    std::cout << "ERROR: invalid_command" << std::endl;
                }
            }
            catch (const std::exception &ex)
            {
                std::cout << "ERROR: internal_error" << std::endl;
                std::cout << ex.what() << std::endl;
                logger_.log("error", "command failed: ", ex.what());
            }

            // Let running transfers advance between prompts.
            io_.restart();
            io_.poll();
        }
    }

    bool Shell::dispatch(const std::string &command, const std::vector<std::string> &args)
    {
        if (command == "TREE")
        {
            return handle_tree(args);
        }
        if (command == "TOGGLE")
        {
            return handle_toggle(args);
        }
        if (command == "RELOAD")
        {
            return handle_reload(args);
        }
        if (command == "REFRESH")
        {
            return handle_refresh(args);
        }
        if (command == "SORT")
        {
            return handle_sort(args);
        }
        if (command == "UPLOAD")
        {
            return handle_upload(args);
        }
        if (command == "DOWNLOAD")
        {
            return handle_download(args);
        }
        if (command == "TASKS")
        {
            return handle_tasks(args);
        }
        if (command == "CANCEL")
        {
            return handle_cancel(args);
        }
        if (command == "CONFLICTS")
        {
            return handle_conflicts(args);
        }
        if (command == "RESOLVE")
        {
            return handle_resolve(args);
        }
        if (command == "CUT")
        {
            return handle_stage(args, true);
        }
        if (command == "COPY")
        {
            return handle_stage(args, false);
        }
        if (command == "PASTE")
        {
            return handle_paste(args);
        }
        if (command == "CLEAR")
        {
            return handle_clear(args);
        }
        if (command == "DELETE")
        {
            return handle_delete(args);
        }
        if (command == "MKDIR")
        {
            return handle_create(args, true);
        }
        if (command == "TOUCH")
        {
            return handle_create(args, false);
        }
        if (command == "RENAME")
        {
            return handle_rename(args);
        }
        if (command == "CHMOD")
        {
            return handle_chmod(args);
        }
        if (command == "WAIT")
        {
            return handle_wait(args);
        }
        return false;
    }

    void Shell::print_help() const
    {
        std::cout << "Available commands:" << std::endl;
        std::cout << "  HELP                             Show this help" << std::endl;
        std::cout << "  EXIT                             Leave the shell" << std::endl;
        std::cout << "  TREE [--json]                    Print the loaded tree" << std::endl;
        std::cout << "  TOGGLE <path>                    Expand or collapse a directory" << std::endl;
        std::cout << "  RELOAD <path>                    Reload a directory" << std::endl;
        std::cout << "  REFRESH                          Reload everything that is expanded" << std::endl;
        std::cout << "  SORT name|modified               Sort the tree" << std::endl;
        std::cout << "  UPLOAD <remote_dir> <local...>   Upload files or directories" << std::endl;
        std::cout << "  DOWNLOAD <remote> <local>        Download a file or directory" << std::endl;
        std::cout << "  TASKS                            Show transfers" << std::endl;
        std::cout << "  CANCEL <task>                    Cancel a transfer" << std::endl;
        std::cout << "  CONFLICTS                        Show pending conflicts" << std::endl;
        std::cout << "  RESOLVE <task> <choice>          overwrite, skip, cancel or overwrite-all" << std::endl;
        std::cout << "  CUT <path> / COPY <path>         Put an entry on the clipboard" << std::endl;
        std::cout << "  PASTE [dir]                      Paste into dir or the current directory" << std::endl;
        std::cout << "  CLEAR                            Empty the clipboard" << std::endl;
        std::cout << "  DELETE <path>                    Delete a file or directory" << std::endl;
        std::cout << "  MKDIR <parent> <name>            Create a directory" << std::endl;
        std::cout << "  TOUCH <parent> <name>            Create an empty file" << std::endl;
        std::cout << "  RENAME <path> <name>             Rename an entry" << std::endl;
        std::cout << "  CHMOD <path> <octal>             Change permissions" << std::endl;
        std::cout << "  WAIT                             Run until transfers finish or need a decision" << std::endl;
    }

    bool Shell::handle_tree(const std::vector<std::string> &args)
    {
        const auto state = explorer_.tree().snapshot(config_.session_id);
        if (!state)
        {
            std::cout << "ERROR: session_not_found" << std::endl;
            return true;
        }
        if (!args.empty() && args[0] == "--json")
        {
            std::cout << nlohmann::json(*state).dump(2) << std::endl;
            return true;
        }
        if (!args.empty())
        {
            return false;
        }
        std::cout << state->current_path << "  (sort " << protocol::to_string(state->sort.field) << ' '
                  << protocol::to_string(state->sort.direction) << (state->loading ? ", loading" : "") << ")"
                  << std::endl;
        for (const auto &entry : state->root_entries)
        {
            print_entry(entry, 1);
        }
        return true;
    }

    bool Shell::handle_toggle(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            return false;
        }
        await([this, &args](ResultHandler done)
              { explorer_.tree().toggle(config_.session_id, args[0], std::move(done)); });
        return true;
    }

    bool Shell::handle_reload(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            return false;
        }
        await([this, &args](ResultHandler done)
              { explorer_.tree().reload_preserving(config_.session_id, args[0], std::move(done)); });
        return true;
    }

    bool Shell::handle_refresh(const std::vector<std::string> &args)
    {
        if (!args.empty())
        {
            return false;
        }
        await([this](ResultHandler done)
              { explorer_.tree().refresh(config_.session_id, std::move(done)); });
        return true;
    }

    bool Shell::handle_sort(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            return false;
        }
        const auto field = protocol::sort_field_from_string(args[0]);
        if (!field)
        {
            return false;
        }
        explorer_.tree().sort(config_.session_id, *field);
        std::cout << "OK" << std::endl;
        return true;
    }

    bool Shell::handle_upload(const std::vector<std::string> &args)
    {
        if (args.size() < 2)
        {
            return false;
        }
        std::vector<std::filesystem::path> files(args.begin() + 1, args.end());
        ++outstanding_;
        explorer_.upload(config_.session_id, files, args[0], [this](const std::vector<TransferOutcome> &outcomes)
                         {
            --outstanding_;
            for (const auto &outcome : outcomes)
            {
                print_outcome(outcome);
            } });
        for (const auto &task : explorer_.transfers().tasks())
        {
            if (task.status == protocol::TransferStatus::Pending && task.kind == protocol::TransferKind::Upload)
            {
                std::cout << "> " << task.task_id << ' ' << task.file_name << std::endl;
            }
        }
        std::cout << "OK" << std::endl;
        return true;
    }

    bool Shell::handle_download(const std::vector<std::string> &args)
    {
        if (args.size() != 2)
        {
            return false;
        }
        ++outstanding_;
        const auto task_id = explorer_.download(config_.session_id, args[0], std::filesystem::path(args[1]),
                                                [this](const TransferOutcome &outcome)
                                                {
                                                    --outstanding_;
                                                    print_outcome(outcome);
                                                });
        std::cout << "> " << task_id << std::endl;
        std::cout << "OK" << std::endl;
        return true;
    }

    bool Shell::handle_tasks(const std::vector<std::string> &args)
    {
        if (!args.empty())
        {
            return false;
        }
        for (const auto &task : explorer_.transfers().tasks())
        {
            std::cout << task.task_id << "  " << std::setw(8) << std::left << protocol::to_string(task.kind)
                      << std::setw(13) << protocol::to_string(task.status) << std::right << task.transferred_bytes
                      << '/' << task.total_bytes << " B  " << std::fixed << std::setprecision(0)
                      << task.speed_bytes_per_second << " B/s";
            if (task.eta_seconds)
            {
                std::cout << "  eta " << *task.eta_seconds << " s";
            }
            std::cout << "  " << task.file_name;
            if (task.error)
            {
                std::cout << "  (" << *task.error << ")";
            }
            std::cout << std::endl;
        }
        return true;
    }

    bool Shell::handle_cancel(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            return false;
        }
        await([this, &args](ResultHandler done)
              { explorer_.transfers().cancel(args[0], std::move(done)); });
        return true;
    }

    bool Shell::handle_conflicts(const std::vector<std::string> &args)
    {
        if (!args.empty())
        {
            return false;
        }
        for (const auto &conflict : explorer_.conflicts().conflicts())
        {
            std::cout << conflict.task_id << "  " << conflict.file_path;
            if (conflict.local_size && conflict.remote_size)
            {
                std::cout << "  local " << *conflict.local_size << " B, remote " << *conflict.remote_size << " B";
            }
            std::cout << std::endl;
        }
        return true;
    }

    bool Shell::handle_resolve(const std::vector<std::string> &args)
    {
        if (args.size() != 2)
        {
            return false;
        }
        const auto choice = resolution_choice_from_string(args[1]);
        if (!choice)
        {
            return false;
        }
        await([this, &args, choice](ResultHandler done)
              { explorer_.conflicts().resolve(args[0], *choice, std::move(done)); });
        return true;
    }

    bool Shell::handle_stage(const std::vector<std::string> &args, bool is_cut)
    {
        if (args.size() != 1)
        {
            return false;
        }
        const auto entry = require_entry(args[0]);
        if (!entry)
        {
            return true;
        }
        if (is_cut)
        {
            explorer_.clipboard().cut(config_.session_id, *entry);
        }
        else
        {
            explorer_.clipboard().copy(config_.session_id, *entry);
        }
        std::cout << "OK" << std::endl;
        return true;
    }

    bool Shell::handle_paste(const std::vector<std::string> &args)
    {
        if (args.size() > 1)
        {
            return false;
        }
        std::optional<protocol::FileEntry> context;
        if (!args.empty() && !remote_path::is_root(remote_path::normalize(args[0])))
        {
            context = require_entry(args[0]);
            if (!context)
            {
                return true;
            }
        }
        const auto target = select_paste_target(
            context, explorer_.tree().current_path(config_.session_id).value_or("/"));
        await([this, &target](ResultHandler done)
              { explorer_.clipboard().paste(config_.session_id, target, std::move(done)); });
        return true;
    }

    bool Shell::handle_clear(const std::vector<std::string> &args)
    {
        if (!args.empty())
        {
            return false;
        }
        explorer_.clipboard().clear();
        std::cout << "OK" << std::endl;
        return true;
    }

    bool Shell::handle_delete(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            return false;
        }
        const auto entry = require_entry(args[0]);
        if (!entry)
        {
            return true;
        }
        await([this, &entry](ResultHandler done)
              { explorer_.remove(config_.session_id, *entry, std::move(done)); });
        return true;
    }

    bool Shell::handle_create(const std::vector<std::string> &args, bool directory)
    {
        if (args.size() != 2)
        {
            return false;
        }
        std::optional<protocol::FileEntry> context;
        if (!remote_path::is_root(remote_path::normalize(args[0])))
        {
            context = require_entry(args[0]);
            if (!context)
            {
                return true;
            }
        }
        await([this, &args, &context, directory](ResultHandler done)
              {
            if (directory)
            {
                explorer_.create_directory(config_.session_id, context, args[1], std::move(done));
            }
            else
            {
                explorer_.create_file(config_.session_id, context, args[1], std::move(done));
            } });
        return true;
    }

    bool Shell::handle_rename(const std::vector<std::string> &args)
    {
        if (args.size() != 2)
        {
            return false;
        }
        const auto entry = require_entry(args[0]);
        if (!entry)
        {
            return true;
        }
        await([this, &args, &entry](ResultHandler done)
              { explorer_.rename(config_.session_id, *entry, args[1], std::move(done)); });
        return true;
    }

    bool Shell::handle_chmod(const std::vector<std::string> &args)
    {
        if (args.size() != 2)
        {
            return false;
        }
        const auto entry = require_entry(args[0]);
        if (!entry)
        {
            return true;
        }
        await([this, &args, &entry](ResultHandler done)
              { explorer_.change_permissions(config_.session_id, *entry, args[1], std::move(done)); });
        return true;
    }

    bool Shell::handle_wait(const std::vector<std::string> &args)
    {
        if (!args.empty())
        {
            return false;
        }
        while (outstanding_ > 0 && explorer_.conflicts().conflicts().empty())
        {
            io_.restart();
            if (io_.run_one() == 0)
            {
                break;
            }
        }
        if (!explorer_.conflicts().conflicts().empty())
        {
            std::cout << "Conflicts need a decision:" << std::endl;
            handle_conflicts({});
            return true;
        }
        std::cout << "OK" << std::endl;
        return true;
    }

    void Shell::await(const std::function<void(ResultHandler)> &operation)
    {
        bool finished = false;
        OperationResult result;
        operation([&finished, &result](const OperationResult &outcome)
                  {
            result = outcome;
            finished = true; });
        run_until(finished);
        if (!finished)
        {
            std::cout << "ERROR: internal_error" << std::endl;
            std::cout << "The operation never completed" << std::endl;
            return;
        }
        print_result(result);
    }

    void Shell::run_until(const bool &finished)
    {
        while (!finished)
        {
            io_.restart();
            if (io_.run_one() == 0)
            {
                break;
            }
        }
    }

    std::optional<protocol::FileEntry> Shell::require_entry(const std::string &path)
    {
        auto entry = explorer_.tree().find(config_.session_id, path);
        if (!entry)
        {
            std::cout << "ERROR: not_found" << std::endl;
            std::cout << "Expand the parent directory first: " << path << std::endl;
        }
        return entry;
    }

    void Shell::print_result(const OperationResult &result) const
    {
        if (result.ok())
        {
            std::cout << "OK" << std::endl;
            return;
        }
        std::cout << "ERROR: " << to_string(result.error) << std::endl;
        if (!result.message.empty())
        {
            std::cout << result.message << std::endl;
        }
    }

    void Shell::print_outcome(const TransferOutcome &outcome) const
    {
        std::cout << "[" << outcome.task_id << "] " << protocol::to_string(outcome.status);
        if (!outcome.ok())
        {
            std::cout << " " << to_string(outcome.error) << ": " << outcome.message;
        }
        std::cout << std::endl;
    }

} // namespace remotefs::client
