#pragma once

#include <set>
#include <string>

namespace remotefs::client
{

    // Scope of one multi-file upload action. The "overwrite all" decision lives here so it
    // never leaks into the next action.
    struct TransferBatch
    {
        std::set<std::string> task_ids;
        bool overwrite_all{};

        bool contains(const std::string &task_id) const { return task_ids.count(task_id) != 0; }
    };

} // namespace remotefs::client
