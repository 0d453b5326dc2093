/******************************************************************************\
 * fleet_error.hpp - Exception types raised by the fleet library.
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/
#pragma once

#include <stdexcept>
#include <string>

namespace fleet {

// No validated session could be obtained for a host
struct ConnectivityError : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

// A remote command failed on an open session
struct CommandError : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

// Refused to run because the request looked dangerous or would clobber data
struct SafetyError : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

// A listener or relay conduit was not observed within its bound
struct ReadinessTimeout : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

// Source and destination trees differ after a transfer
struct VerificationError : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

} /* namespace fleet */
