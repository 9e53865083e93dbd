/**
 * RemoteFS - Random identifiers built on libsodium.
 */
#pragma once

#include <string>

namespace remotefs::crypto
{

    void ensure_sodium_init();

    // Random RFC 4122 version 4 identifier, e.g. "3b241101-e2bb-4255-8caf-4136c566a962".
    std::string generate_task_id();

} // namespace remotefs::crypto
