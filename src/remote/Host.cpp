/******************************************************************************\
 * Host.cpp - Session pool and command execution for an administered machine
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "fleet_defs.h"

#include <algorithm>
#include <exception>

#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <boost/algorithm/string/trim.hpp>

#include "remote/Host.hpp"
#include "transfer/CopyChain.hpp"
#include "transfer/TreeCompare.hpp"

#include "useful/fleet_error.hpp"

namespace fleet {

namespace {

// Outcome of running one command once: its output, or the reason it failed
struct Attempt
{
    std::string output;
    std::exception_ptr error;
    std::string reason;

    bool succeeded() const { return error == nullptr; }
};

Attempt tryExec(RemoteSession& session, std::string const& command)
{
    try {
        return Attempt{session.exec(command), nullptr, {}};
    } catch (std::exception const& ex) {
        return Attempt{{}, std::current_exception(), ex.what()};
    }
}

} /* anonymous namespace */

Host::Host(std::string address, std::shared_ptr<SessionFactory> factory, std::shared_ptr<RemoteConfig const> config)
    : m_address{std::move(address)}
    , m_factory{std::move(factory)}
    , m_config{std::move(config)}
    , m_lock{}
    , m_pool{}
    , m_available{Availability::Unknown}
    , m_hostname{}
    , m_cores{}
{
    if (m_factory == nullptr) {
        throw std::logic_error("Host " + m_address + " created without a session factory");
    }
    if (m_config == nullptr) {
        throw std::logic_error("Host " + m_address + " created without a configuration");
    }
}

/* session pool */

std::unique_ptr<RemoteSession>
Host::acquireSession()
{
    for (int attempt = 1; attempt <= FLEET_ACQUIRE_ATTEMPTS; attempt++) {
        auto session = std::unique_ptr<RemoteSession>{};

        // Reuse an idle session if there is one
        { auto const guard = std::lock_guard<std::mutex>{m_lock};
            if (!m_pool.empty()) {
                session = std::move(m_pool.front());
                m_pool.pop_front();
            }
        }

        if (session == nullptr) {
            try {
                session = m_factory->open(m_address);
            } catch (std::exception const& ex) {
                writeLog("Unable to connect on attempt %d: %s\n", attempt, ex.what());
                continue;
            }
            if (session == nullptr) {
                writeLog("Unable to connect on attempt %d: no session returned\n", attempt);
                continue;
            }
        }

        // Confirm that the session works before trusting it
        auto const reply = tryExec(*session, FLEET_PING_CMD);
        if (reply.succeeded() && (boost::algorithm::trim_copy(reply.output) == FLEET_PING_REPLY)) {
            setAvailability(Availability::Reachable);
            return session;
        }

        writeLog("Discarding nonfunctional session on attempt %d\n", attempt);
    }

    setAvailability(Availability::Unreachable);
    throw ConnectivityError("Unable to obtain working session to " + m_address + " after "
        + std::to_string(FLEET_ACQUIRE_ATTEMPTS) + " attempts");
}

void
Host::releaseSession(std::unique_ptr<RemoteSession>&& session)
{
    auto const reset = tryExec(*session, FLEET_RESET_CMD);
    if (!reset.succeeded()) {
        writeLog("Discarding nonfunctional session: %s\n", reset.reason.c_str());
        return;
    }

    auto const guard = std::lock_guard<std::mutex>{m_lock};
    m_pool.push_back(std::move(session));
}

void
Host::setAvailability(Availability available)
{
    auto const guard = std::lock_guard<std::mutex>{m_lock};
    m_available = available;
}

Availability
Host::getAvailability() const
{
    auto const guard = std::lock_guard<std::mutex>{m_lock};
    return m_available;
}

size_t
Host::getIdleSessionCount() const
{
    auto const guard = std::lock_guard<std::mutex>{m_lock};
    return m_pool.size();
}

/* command execution */

std::string
Host::execute(std::vector<std::string> const& commands, int attempts)
{
    if (attempts < 1) {
        attempts = 1;
    }

    auto session = acquireSession();

    auto result = std::string{};
    for (auto&& command : commands) {
        for (int failures = 0; ; ) {
            auto attempt = tryExec(*session, command);
            if (attempt.succeeded()) {
                result = std::move(attempt.output);
                break;
            }

            failures++;
            if (failures >= attempts) {
                writeLog("Command \"%s\" failed %d time(s), giving up: %s\n", command.c_str(), failures,
                    attempt.reason.c_str());
                // session is dropped rather than pooled
                std::rethrow_exception(attempt.error);
            }

            writeLog("Command \"%s\" failed, re-trying after delay: %s\n", command.c_str(),
                attempt.reason.c_str());
            m_config->sleep(std::chrono::seconds{failures});
        }
    }

    releaseSession(std::move(session));
    return result;
}

std::string
Host::execute(std::string const& command, int attempts)
{
    return execute(std::vector<std::string>{command}, attempts);
}

bool
Host::isReachable()
{
    // The first probe populates the flag, later calls reuse it
    if (getAvailability() == Availability::Unknown) {
        try {
            execute(FLEET_PING_CMD);
        } catch (std::exception const& ex) {
            writeLog("Reachability probe failed: %s\n", ex.what());
        }
    }

    return getAvailability() == Availability::Reachable;
}

bool
Host::pollUntil(std::string const& test, std::chrono::seconds timeout)
{
    // The loop runs remotely so the wait does not depend on round trips
    auto const limit = std::to_string(timeout.count());
    auto const loop = "n=0; until " + test + " || [ $n -ge " + limit + " ]; do n=$((n+1)); sleep 1; done; "
        "if " + test + "; then echo " FLEET_READY_TOKEN "; else echo " FLEET_TIMEOUT_TOKEN "; fi";

    // A retry would restart the full wait
    auto const output = executeOnce(loop);
    return boost::algorithm::contains(output, FLEET_READY_TOKEN);
}

void
Host::confirmListeningOnPort(int port, std::chrono::seconds timeout)
{
    auto const test = "[ \"$(" FLEET_SOCKET_LIST " | grep -c ':" + std::to_string(port) + " ')\" -ge 1 ]";
    if (!pollUntil(test, timeout)) {
        throw ReadinessTimeout("Nothing is listening on " + m_address + ":" + std::to_string(port)
            + " after " + std::to_string(timeout.count()) + " seconds");
    }
}

void
Host::confirmPipeExists(std::string const& path, std::chrono::seconds timeout)
{
    if (!pollUntil("[ -p " + path + " ]", timeout)) {
        throw ReadinessTimeout("FIFO " + path + " not found on " + m_address + " after "
            + std::to_string(timeout.count()) + " seconds");
    }
}

/* directory listing, comparison and copying */

DirectoryListing
Host::listDirectory(std::string const& path)
{
    return fleet::listDirectory(*this, path);
}

uint64_t
Host::totalSize(std::string const& path)
{
    return fleet::totalSize(*this, path);
}

void
Host::compareTrees(std::string const& baseDir, std::vector<CopyTarget> const& targets, CopyOptions const& options)
{
    auto const base = withTrailingSlash(baseDir);
    fleet::compareTrees(*this, base, normalizeTargets(base, targets), requestedFiles(options));
}

void
Host::copyChain(std::string const& baseDir, std::vector<CopyTarget> const& targets, CopyOptions const& options)
{
    fleet::copyChain(*this, baseDir, targets, options);
}

/* simple command wrappers */

std::string
Host::service(std::string const& operation, std::string const& name)
{
    return execute("/sbin/service " + name + " " + operation);
}

std::string
Host::setIoScheduler(std::string const& name, std::string const& device)
{
    writeLog("Setting I/O scheduler for %s to %s.\n", device.c_str(), name.c_str());
    return execute("echo '" + name + "' >/sys/block/" + device + "/queue/scheduler");
}

void
Host::confirmInstalled(std::string const& program)
{
    auto const output = boost::algorithm::trim_copy(execute("which " + program));
    if (output.empty() || boost::algorithm::contains(output, "no " + program + " in ")) {
        throw SafetyError(program + " not installed on " + m_address + ", or missing from path");
    }
}

int
Host::cores()
{
    { auto const guard = std::lock_guard<std::mutex>{m_lock};
        if (m_cores) {
            return *m_cores;
        }
    }

    // Counts virtual cores when hyperthreading is enabled
    auto const output = boost::algorithm::trim_copy(execute("cat /proc/cpuinfo|grep 'processor\\s*:' | wc -l"));
    auto count = 1;
    try {
        count = std::max(1, std::stoi(output));
    } catch (std::exception const&) {
        writeLog("Could not parse core count '%s', assuming 1\n", output.c_str());
    }

    auto const guard = std::lock_guard<std::mutex>{m_lock};
    m_cores = count;
    return count;
}

std::string
Host::hostname()
{
    { auto const guard = std::lock_guard<std::mutex>{m_lock};
        if (m_hostname) {
            return *m_hostname;
        }
    }

    auto const name = boost::algorithm::trim_right_copy(execute("hostname"));

    auto const guard = std::lock_guard<std::mutex>{m_lock};
    m_hostname = name;
    return name;
}

std::string
Host::commentOutIni(std::string const& file, std::vector<std::string> const& prefixes)
{
    return toggleIni(file, prefixes, false);
}

std::string
Host::uncommentOutIni(std::string const& file, std::vector<std::string> const& prefixes)
{
    return toggleIni(file, prefixes, true);
}

std::string
Host::toggleIni(std::string const& file, std::vector<std::string> const& prefixes, bool enable)
{
    // Matches "setting" and "setting = value", with optional surrounding blanks
    auto commands = std::vector<std::string>{};
    for (auto&& prefix : prefixes) {
        auto const setting = boost::algorithm::replace_all_copy(prefix, "/", "\\/");
        auto const line = "[[:space:]]*" + setting + "[[:space:]]*(=.*)?";
        auto const substitution = enable
            ? "s/^#(" + line + ")$/\\1/"
            : "s/^(" + line + ")$/#\\1/";
        commands.push_back("sed -i -E '" + substitution + "' " + file);
    }

    return execute(boost::algorithm::join(commands, "; "));
}

} /* namespace fleet */
