/******************************************************************************\
 * RemoteSession.hpp - Interface to one live remote shell connection, and the
 *                     factory that opens them.
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <memory>
#include <string>

namespace fleet {

/*
** A RemoteSession is one authenticated shell connection to a machine. Any two
** sessions to the same machine are interchangeable. Sessions are never used by
** two threads at once: they are owned by a Host's pool while idle and by a
** single command execution while borrowed.
*/
class RemoteSession
{
public: // interface
    // Run command and return its combined stdout / stderr output.
    // Throws CommandError if the command could not be run over the session.
    virtual std::string exec(std::string const& command) = 0;

public:
    RemoteSession() = default;
    virtual ~RemoteSession() = default;
    RemoteSession(const RemoteSession&) = delete;
    RemoteSession& operator=(const RemoteSession&) = delete;
};

class SessionFactory
{
public: // interface
    // Open and authenticate a new session. Throws on any connection failure.
    virtual std::unique_ptr<RemoteSession> open(std::string const& address) = 0;

public:
    SessionFactory() = default;
    virtual ~SessionFactory() = default;
    SessionFactory(const SessionFactory&) = delete;
    SessionFactory& operator=(const SessionFactory&) = delete;
};

} /* namespace fleet */
