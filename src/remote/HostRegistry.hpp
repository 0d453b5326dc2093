/******************************************************************************\
 * HostRegistry.hpp - Maps machine addresses to their one Host instance
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "fleet_defs.h"

#include "remote/Host.hpp"
#include "remote/RemoteConfig.hpp"
#include "remote/RemoteSession.hpp"

namespace fleet {

/*
** The registry owns every Host it hands out. Resolving an address that was
** seen before returns the same instance, so all callers share its session pool
** and cached attributes. Hosts live as long as the registry; there is no
** eviction.
*/
class HostRegistry
{
private: // variables
    std::shared_ptr<SessionFactory>     m_factory;
    std::shared_ptr<RemoteConfig const> m_config;

    mutable std::mutex m_lock;
    std::unordered_map<std::string, std::shared_ptr<Host>> m_hosts;

public: // interface
    // Return the Host for address, creating it on first use
    std::shared_ptr<Host> resolve(std::string const& address);

    // Return the Host for this machine, identified by the address of interface
    std::shared_ptr<Host> local(std::string const& interface = FLEET_DEFAULT_INTERFACE);

    size_t size() const;
    RemoteConfig const& getConfig() const { return *m_config; }

public: // Constructor/destructors
    HostRegistry(std::shared_ptr<SessionFactory> factory, RemoteConfig config);

    // Registry of libssh2 sessions configured from the environment
    static std::unique_ptr<HostRegistry> fromEnvironment();

    ~HostRegistry() = default;
    HostRegistry(const HostRegistry&) = delete;
    HostRegistry& operator=(const HostRegistry&) = delete;
    HostRegistry(HostRegistry&&) = delete;
    HostRegistry& operator=(HostRegistry&&) = delete;
};

} /* namespace fleet */
