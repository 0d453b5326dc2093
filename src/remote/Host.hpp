/******************************************************************************\
 * Host.hpp - A machine administered over a remote shell, with its pool of
 *            reusable sessions.
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "fleet_defs.h"

#include "remote/RemoteConfig.hpp"
#include "remote/RemoteSession.hpp"
#include "transfer/CopyTarget.hpp"
#include "transfer/DirectoryListing.hpp"

#include "useful/fleet_log.h"

namespace fleet {

enum class Availability { Unknown, Reachable, Unreachable };

/*
** A Host is the only in-process representative of one administered machine.
** Hosts are created by a HostRegistry, which guarantees a single instance per
** address, so every caller shares the same session pool and cached attributes.
*/
class Host
{
private: // variables
    std::string const                   m_address;
    std::shared_ptr<SessionFactory>     m_factory;
    std::shared_ptr<RemoteConfig const> m_config;

    // m_lock guards every member below it
    mutable std::mutex                  m_lock;
    std::deque<std::unique_ptr<RemoteSession>> m_pool; // idle, validated sessions
    Availability                        m_available;
    std::optional<std::string>          m_hostname;
    std::optional<int>                  m_cores;

private: // session pool
    // Pop or open a session and confirm it answers FLEET_PING_CMD.
    // Throws ConnectivityError after FLEET_ACQUIRE_ATTEMPTS failures.
    std::unique_ptr<RemoteSession> acquireSession();
    // Reset the session and return it to the pool, or drop it if the reset fails
    void releaseSession(std::unique_ptr<RemoteSession>&& session);
    void setAvailability(Availability available);

    // Run a remote loop until test succeeds or timeout elapses
    bool pollUntil(std::string const& test, std::chrono::seconds timeout);

public: // command execution
    /*
     * execute - Run commands in order on one pooled session
     *
     * Detail
     *      A failed command is retried in place after sleeping one second per
     *      failure so far. Once attempts failures have occurred the failure is
     *      rethrown unchanged. Use attempts = 1 for commands that are not safe to
     *      repeat. The session is pooled again only if every command succeeds.
     *
     * Returns
     *      The output of the last command
     */
    std::string execute(std::vector<std::string> const& commands, int attempts = FLEET_DEFAULT_CMD_ATTEMPTS);
    std::string execute(std::string const& command, int attempts = FLEET_DEFAULT_CMD_ATTEMPTS);

    // Run a command that is not idempotent
    std::string executeOnce(std::string const& command) { return execute(command, 1); }

    // Probe with a no-op command the first time, then report the cached state
    bool isReachable();
    Availability getAvailability() const;
    size_t getIdleSessionCount() const;

    // Wait until something listens on port. Throws ReadinessTimeout.
    void confirmListeningOnPort(int port, std::chrono::seconds timeout = std::chrono::seconds{FLEET_DEFAULT_READY_TIMEOUT});
    // Wait until path exists as a named pipe. Throws ReadinessTimeout.
    void confirmPipeExists(std::string const& path, std::chrono::seconds timeout = std::chrono::seconds{FLEET_DEFAULT_READY_TIMEOUT});

public: // directory listing, comparison and copying
    DirectoryListing listDirectory(std::string const& path);
    uint64_t totalSize(std::string const& path);

    // Throws VerificationError naming both paths and sizes on the first difference
    void compareTrees(std::string const& baseDir, std::vector<CopyTarget> const& targets,
        CopyOptions const& options = {});

    // Stream baseDir to every target through a relay chain, then verify.
    // Not safe to retry blindly: a failed chain may leave partial data behind.
    void copyChain(std::string const& baseDir, std::vector<CopyTarget> const& targets,
        CopyOptions const& options = {});

public: // simple command wrappers
    // operation is start, stop or restart
    std::string service(std::string const& operation, std::string const& name);
    std::string setIoScheduler(std::string const& name, std::string const& device = "sda");
    // Throws SafetyError if program is not on the remote PATH
    void confirmInstalled(std::string const& program);
    int cores();
    std::string hostname();

    // Comment out / un-comment lines of an ini file that set any of prefixes
    std::string commentOutIni(std::string const& file, std::vector<std::string> const& prefixes);
    std::string uncommentOutIni(std::string const& file, std::vector<std::string> const& prefixes);
    std::string toggleIni(std::string const& file, std::vector<std::string> const& prefixes, bool enable);

public: // accessors
    std::string const& getAddress() const { return m_address; }
    std::string toString() const { return m_address; }
    RemoteConfig const& getConfig() const { return *m_config; }

    // Host specific logger
    template <typename... Args>
    void writeLog(char const* fmt, Args&&... args) const {
        getLogger().write(("[" + m_address + "] " + fmt).c_str(), std::forward<Args>(args)...);
    }

public: // Constructor/destructors
    Host(std::string address, std::shared_ptr<SessionFactory> factory, std::shared_ptr<RemoteConfig const> config);
    ~Host() = default;
    Host(const Host&) = delete;
    Host& operator=(const Host&) = delete;
    Host(Host&&) = delete;
    Host& operator=(Host&&) = delete;
};

} /* namespace fleet */
