/******************************************************************************\
 * fleet_hostname.hpp - Look up the address of a local network interface
 *
 * Copyright 2020 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <errno.h>
#include <string.h>

#include <sys/socket.h>
#include <netinet/in.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netdb.h>

#include <memory>
#include <stdexcept>
#include <string>

namespace fleet {

// IPv4 address bound to the named interface
static inline std::string
findInterfaceAddress(std::string const& interface)
{
    // Get information structs for all network interfaces
    auto ifaddr = std::unique_ptr<struct ifaddrs, decltype(&freeifaddrs)>{nullptr, freeifaddrs};
    { struct ifaddrs *raw_ifaddr = nullptr;
        if (getifaddrs(&raw_ifaddr) < 0) {
            throw std::runtime_error("getifaddrs failed: " + std::string{strerror(errno)});
        }
        ifaddr = {raw_ifaddr, freeifaddrs};
    }

    for (struct ifaddrs* ifa = ifaddr.get(); ifa != nullptr; ifa = ifa->ifa_next) {
        if ((ifa->ifa_addr == nullptr) || (ifa->ifa_addr->sa_family != AF_INET)) {
            continue;
        }
        if (interface != ifa->ifa_name) {
            continue;
        }

        char address[NI_MAXHOST];
        if (auto const rc = getnameinfo(ifa->ifa_addr, sizeof(struct sockaddr_in),
            address, NI_MAXHOST, nullptr, 0, NI_NUMERICHOST)) {
            throw std::runtime_error("getnameinfo failed: " + std::string{gai_strerror(rc)});
        }

        return std::string{address};
    }

    throw std::runtime_error("no IPv4 address found for interface " + interface);
}

} /* namespace fleet */
