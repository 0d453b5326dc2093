/******************************************************************************\
 * HostRegistry.cpp - Maps machine addresses to their one Host instance
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "fleet_defs.h"

#include "remote/HostRegistry.hpp"
#include "SSHSession/SSHSession.hpp"

#include "useful/fleet_hostname.hpp"

namespace fleet {

HostRegistry::HostRegistry(std::shared_ptr<SessionFactory> factory, RemoteConfig config)
    : m_factory{std::move(factory)}
    , m_config{std::make_shared<RemoteConfig const>(std::move(config))}
    , m_lock{}
    , m_hosts{}
{
    if (m_factory == nullptr) {
        throw std::logic_error("HostRegistry created without a session factory");
    }
}

std::unique_ptr<HostRegistry>
HostRegistry::fromEnvironment()
{
    auto config = RemoteConfig::fromEnvironment();
    auto factory = std::make_shared<SSHSessionFactory>(config);
    return std::make_unique<HostRegistry>(std::move(factory), std::move(config));
}

std::shared_ptr<Host>
HostRegistry::resolve(std::string const& address)
{
    if (address.empty()) {
        throw std::invalid_argument("cannot resolve a host with an empty address");
    }

    // Lookup and creation happen under one lock so an address never gets two pools
    auto const guard = std::lock_guard<std::mutex>{m_lock};

    auto const found = m_hosts.find(address);
    if (found != m_hosts.end()) {
        return found->second;
    }

    auto host = std::make_shared<Host>(address, m_factory, m_config);
    m_hosts.emplace(address, host);
    return host;
}

std::shared_ptr<Host>
HostRegistry::local(std::string const& interface)
{
    return resolve(findInterfaceAddress(interface));
}

size_t
HostRegistry::size() const
{
    auto const guard = std::lock_guard<std::mutex>{m_lock};
    return m_hosts.size();
}

} /* namespace fleet */
