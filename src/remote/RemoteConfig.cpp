/******************************************************************************\
 * RemoteConfig.cpp - Read fleet settings from the environment
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "fleet_defs.h"

#include <stdlib.h>

#include <algorithm>
#include <stdexcept>
#include <thread>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>

#include "remote/RemoteConfig.hpp"
#include "useful/fleet_wrappers.hpp"

namespace fleet {

// Parse a positive integer setting, naming the variable on failure
static int
parsePositive(char const* envVar, int defaultValue)
{
    auto const raw = ::getenv(envVar);
    if ((raw == nullptr) || (*raw == '\0')) {
        return defaultValue;
    }

    try {
        size_t consumed = 0;
        auto const value = std::stoi(raw, &consumed);
        if ((consumed == std::string{raw}.length()) && (value > 0)) {
            return value;
        }
    } catch (std::exception const&) {
        // fall through to the error below
    }

    throw std::runtime_error(std::string{"Invalid value '"} + raw + "' for environment variable "
        + envVar + ": expected a positive integer");
}

static std::vector<std::string>
defaultKeys()
{
    auto const home = std::string{getenvOrDefault("HOME", "/root")};
    return { home + "/.ssh/id_rsa", home + "/.ssh/id_dsa" };
}

RemoteConfig::RemoteConfig()
    : username{FLEET_DEFAULT_SSH_USER}
    , port{FLEET_DEFAULT_SSH_PORT}
    , keys{defaultKeys()}
    , passphrase{}
    , connectTimeout{FLEET_DEFAULT_SSH_TIMEOUT}
    , copyPort{FLEET_DEFAULT_COPY_PORT}
    , sleep{[](std::chrono::seconds duration) { std::this_thread::sleep_for(duration); }}
{}

RemoteConfig
RemoteConfig::fromEnvironment()
{
    auto result = RemoteConfig{};

    result.username = getenvOrDefault(FLEET_SSH_USER_ENV_VAR, FLEET_DEFAULT_SSH_USER);
    result.port = parsePositive(FLEET_SSH_PORT_ENV_VAR, FLEET_DEFAULT_SSH_PORT);
    result.connectTimeout = std::chrono::seconds{parsePositive(FLEET_SSH_TIMEOUT_ENV_VAR, FLEET_DEFAULT_SSH_TIMEOUT)};
    result.copyPort = parsePositive(FLEET_COPY_PORT_ENV_VAR, FLEET_DEFAULT_COPY_PORT);

    if (auto const keyList = ::getenv(FLEET_SSH_KEYS_ENV_VAR)) {
        auto keys = std::vector<std::string>{};
        boost::algorithm::split(keys, keyList, boost::algorithm::is_any_of(":"));
        keys.erase(std::remove(keys.begin(), keys.end(), std::string{}), keys.end());
        if (!keys.empty()) {
            result.keys = std::move(keys);
        }
    }

    if (auto const passphrase = ::getenv(FLEET_SSH_PASSPHRASE_ENV_VAR)) {
        result.passphrase = passphrase;
    }

    return result;
}

} /* namespace fleet */
