/******************************************************************************\
 * SSHSession.hpp - A header file for the libssh2 remote session
 *
 * Copyright 2017-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <memory>
#include <string>

#include <libssh2.h>

#include "remote/RemoteConfig.hpp"
#include "remote/RemoteSession.hpp"

#include "useful/fleet_wrappers.hpp"

// Custom deleters
static void delete_ssh2_session(LIBSSH2_SESSION *pSession)
{
    libssh2_session_disconnect(pSession, "Normal Shutdown");
    libssh2_session_free(pSession);
}

static void delete_ssh2_channel(LIBSSH2_CHANNEL *pChannel)
{
    // SSH standard does not mandate sending EOF before closing connection,
    // but some SSH servers will not respond properly to shutdown requests
    // unless an EOF message is received
    libssh2_channel_send_eof(pChannel);
    libssh2_channel_wait_eof(pChannel);

    libssh2_channel_close(pChannel);
    libssh2_channel_wait_closed(pChannel);
    libssh2_channel_free(pChannel);
}

namespace fleet {

class SSHSession : public RemoteSession
{
public: // types
    using UniqueSession = std::unique_ptr<LIBSSH2_SESSION, decltype(&delete_ssh2_session)>;
    using UniqueChannel = std::unique_ptr<LIBSSH2_CHANNEL, decltype(&delete_ssh2_channel)>;

private: // members
    std::string   m_address;
    fd_handle     m_session_sock;
    UniqueSession m_session_ptr;

public: // interface
    /*
     * SSHSession constructor - start and authenticate an ssh session with a remote host
     *
     * detail
     *      connects to address within the configured timeout and authenticates
     *      config.username with ssh-agent, then with each configured key file in
     *      order. host keys are not checked: every machine reached this way is part
     *      of the administered fleet.
     *
     * arguments
     *      address - hostname or IP address of the remote host
     *      config  - user, port, keys and timeout to use
     */
    SSHSession(std::string const& address, RemoteConfig const& config);
    ~SSHSession() = default;

    /*
     * exec - Run a command string on the remote host
     *
     * Detail
     *      Opens a channel, runs command through the remote shell, and collects
     *      stdout and stderr until the channel reaches EOF. A nonzero exit status
     *      is logged but not treated as a failure; callers interpret the output.
     *
     * Returns
     *      The combined output of the command
     */
    std::string exec(std::string const& command) override;
};

class SSHSessionFactory : public SessionFactory
{
private: // members
    RemoteConfig m_config;

public: // interface
    std::unique_ptr<RemoteSession> open(std::string const& address) override;

public:
    explicit SSHSessionFactory(RemoteConfig config);
    ~SSHSessionFactory() = default;
};

} /* namespace fleet */
