/******************************************************************************\
 * RemoteConfig.hpp - Settings shared by every Host in a registry
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace fleet {

struct RemoteConfig
{
    using Sleeper = std::function<void(std::chrono::seconds)>;

    std::string username;
    int port;
    std::vector<std::string> keys;   // private key files, tried in order
    std::string passphrase;          // empty for unencrypted keys
    std::chrono::seconds connectTimeout;
    int copyPort;
    Sleeper sleep;                   // backoff between command retries

    // Build from FLEET_* environment variables, falling back to defaults
    static RemoteConfig fromEnvironment();

    // Defaults only, ignoring the environment
    RemoteConfig();
};

} /* namespace fleet */
