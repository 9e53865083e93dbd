#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <asio.hpp>

#include "remotefs/client/config.hpp"
#include "remotefs/client/event_bus.hpp"
#include "remotefs/client/explorer.hpp"
#include "remotefs/client/logger.hpp"
#include "remotefs/server/loopback_service.hpp"

namespace remotefs::client
{

    // Line-oriented front end over one explorer and a loopback service. Every command drives
    // the event loop until its own result arrived; transfers keep running between commands.
    class Shell
    {
    public:
        explicit Shell(ClientConfig config);

        int run();

    private:
        void interactive_shell();
        bool dispatch(const std::string &command, const std::vector<std::string> &args);
        void print_help() const;

        bool handle_tree(const std::vector<std::string> &args);
        bool handle_toggle(const std::vector<std::string> &args);
        bool handle_reload(const std::vector<std::string> &args);
        bool handle_refresh(const std::vector<std::string> &args);
        bool handle_sort(const std::vector<std::string> &args);
        bool handle_upload(const std::vector<std::string> &args);
        bool handle_download(const std::vector<std::string> &args);
        bool handle_tasks(const std::vector<std::string> &args);
        bool handle_cancel(const std::vector<std::string> &args);
        bool handle_conflicts(const std::vector<std::string> &args);
        bool handle_resolve(const std::vector<std::string> &args);
        bool handle_stage(const std::vector<std::string> &args, bool is_cut);
        bool handle_paste(const std::vector<std::string> &args);
        bool handle_clear(const std::vector<std::string> &args);
        bool handle_delete(const std::vector<std::string> &args);
        bool handle_create(const std::vector<std::string> &args, bool directory);
        bool handle_rename(const std::vector<std::string> &args);
        bool handle_chmod(const std::vector<std::string> &args);
        bool handle_wait(const std::vector<std::string> &args);

        // Issues an operation and runs the loop until its handler reported.
        void await(const std::function<void(ResultHandler)> &operation);
        void run_until(const bool &finished);
        std::optional<protocol::FileEntry> require_entry(const std::string &path);
        void print_result(const OperationResult &result) const;
        void print_outcome(const TransferOutcome &outcome) const;

        ClientConfig config_;
        Logger logger_;
        asio::io_context io_;
        EventBus events_;
        remotefs::server::LoopbackService service_;
        Explorer explorer_;
        std::size_t outstanding_{0};
    };

} // namespace remotefs::client
