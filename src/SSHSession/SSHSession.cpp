/******************************************************************************\
 * SSHSession.cpp - libssh2 implementation of the remote session interface.
 *
 * Copyright 2017-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "fleet_defs.h"

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <string.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <mutex>

#include "SSHSession.hpp"

#include "useful/fleet_error.hpp"
#include "useful/fleet_log.h"

#include <libssh2.h>

class SSHAgent {
private:
    LIBSSH2_AGENT * m_agent;
    std::string     m_username;

public:
    SSHAgent(LIBSSH2_SESSION *session, std::string username)
        : m_agent{nullptr}, m_username{username}
    {
        if (session == nullptr) {
            throw std::logic_error("SSHAgent: session was null");
        }

        // Connect to the ssh-agent
        m_agent = libssh2_agent_init(session);
        if (m_agent == nullptr) {
            throw std::runtime_error("Could not init ssh-agent support.");
        }
    }

    ~SSHAgent()
    {
        // cleanup
        if (m_agent != nullptr) {
            libssh2_agent_disconnect(m_agent);
            libssh2_agent_free(m_agent);
        }
    }

    // Delete copy/move constructors
    SSHAgent(const SSHAgent&) = delete;
    SSHAgent& operator=(const SSHAgent&) = delete;
    SSHAgent(SSHAgent&&) = delete;
    SSHAgent& operator=(SSHAgent&&) = delete;

    void auth()
    {
        if (libssh2_agent_connect(m_agent)) {
            throw std::runtime_error("Could not connect to ssh-agent.");
        }
        if (libssh2_agent_list_identities(m_agent)) {
            throw std::runtime_error("Could not request identities from ssh-agent.");
        }
        // Try to obtain a valid identity from the agent and authenticate
        struct libssh2_agent_publickey *identity, *prev_identity = nullptr;
        while (1) {
            auto rc = libssh2_agent_get_identity(m_agent, &identity, prev_identity);

            if (rc < 0) {
                throw std::runtime_error("Could not obtain identity from ssh-agent.");

            } else if (rc == 1) {
                throw std::runtime_error("ssh-agent reached the end of the public keys without authenticating.");
            }

            // Only valid return codes are 1, 0, or negative value.
            if (libssh2_agent_userauth(m_agent, m_username.c_str(), identity) == 0) {
                return;
            }

            prev_identity = identity;
        }
    }
};

// Get libssh2 error information
static auto get_libssh2_error(LIBSSH2_SESSION* session)
{
    char *libssh2_error_ptr = nullptr;
    libssh2_session_last_error(session, &libssh2_error_ptr, nullptr, false);
    return std::string{ (libssh2_error_ptr)
        ? libssh2_error_ptr
        : "no error information available"
    };
}

// Retry if hit timeout
template <typename Func>
static auto libssh2_retry(Func&& func)
{
    auto rc = LIBSSH2_ERROR_TIMEOUT;
    for (auto i = 0; i < 10; i++) {
        rc = func();

        if (rc != LIBSSH2_ERROR_TIMEOUT)  {
            break;
        }

        ::sleep(1);
    }

    return rc;
}

// Connect a TCP socket to the first reachable address, giving up on each after timeout
static fleet::fd_handle
connect_with_timeout(std::string const& address, int port, std::chrono::seconds timeout)
{
    struct addrinfo hints = {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_NUMERICSERV;

    struct addrinfo *raw_host = nullptr;
    if (auto const rc = getaddrinfo(address.c_str(), std::to_string(port).c_str(), &hints, &raw_host)) {
        throw std::runtime_error("getaddrinfo failed for " + address + ": " + std::string{gai_strerror(rc)});
    }
    // Take ownership of the host addrinfo into the unique_ptr.
    // This will enforce cleanup.
    auto host_ptr = fleet::take_pointer_ownership(std::move(raw_host), freeaddrinfo);

    auto lastError = std::string{"no usable address"};
    for (auto candidate = host_ptr.get(); candidate != nullptr; candidate = candidate->ai_next) {
        auto sock = fleet::fd_handle{ (int)socket(candidate->ai_family, candidate->ai_socktype, candidate->ai_protocol) };

        // Connect in non-blocking mode so the timeout can be enforced
        auto const flags = fcntl(sock.fd(), F_GETFL);
        if ((flags < 0) || (fcntl(sock.fd(), F_SETFL, flags | O_NONBLOCK) < 0)) {
            lastError = "fcntl failed: " + std::string{strerror(errno)};
            continue;
        }

        if (::connect(sock.fd(), candidate->ai_addr, candidate->ai_addrlen) < 0) {
            if (errno != EINPROGRESS) {
                lastError = strerror(errno);
                continue;
            }

            auto pfd = pollfd{ sock.fd(), POLLOUT, 0 };
            auto const poll_rc = ::poll(&pfd, 1, std::chrono::milliseconds{timeout}.count());
            if (poll_rc == 0) {
                lastError = "timed out after " + std::to_string(timeout.count()) + " seconds";
                continue;
            } else if (poll_rc < 0) {
                lastError = "poll failed: " + std::string{strerror(errno)};
                continue;
            }

            int so_error = 0;
            auto so_len = socklen_t{sizeof(so_error)};
            if (getsockopt(sock.fd(), SOL_SOCKET, SO_ERROR, &so_error, &so_len) < 0) {
                lastError = "getsockopt failed: " + std::string{strerror(errno)};
                continue;
            } else if (so_error != 0) {
                lastError = strerror(so_error);
                continue;
            }
        }

        // Back to blocking mode for libssh2
        if (fcntl(sock.fd(), F_SETFL, flags) < 0) {
            lastError = "fcntl failed: " + std::string{strerror(errno)};
            continue;
        }

        return sock;
    }

    throw std::runtime_error("failed to connect to host " + address + ":" + std::to_string(port)
        + ": " + lastError);
}

namespace fleet {

SSHSession::SSHSession(std::string const& address, RemoteConfig const& config)
    : m_address{address}
    , m_session_sock{connect_with_timeout(address, config.port, config.connectTimeout)}
    , m_session_ptr{nullptr, delete_ssh2_session}
{
    // Init a new libssh2 session.
    m_session_ptr = take_pointer_ownership(libssh2_session_init(), delete_ssh2_session);
    if (m_session_ptr == nullptr) {
        throw std::runtime_error("libssh2_session_init() failed");
    }

    // Set to blocking mode, bounded by the connect timeout until authenticated
    libssh2_session_set_blocking(m_session_ptr.get(), 1);
    libssh2_session_set_timeout(m_session_ptr.get(),
        std::chrono::milliseconds{config.connectTimeout}.count());
    if (::getenv(FLEET_DBG_ENV_VAR) != nullptr) {
        libssh2_trace(m_session_ptr.get(), LIBSSH2_TRACE_KEX | LIBSSH2_TRACE_AUTH | LIBSSH2_TRACE_ERROR);
    }

    // Start up the new session.
    // This will trade welcome banners, exchange keys, and setup crypto,
    // compression, and MAC layers.
    auto handshake_rc = libssh2_session_handshake(m_session_ptr.get(), m_session_sock.fd());
    if (handshake_rc < 0) {
        throw std::runtime_error("Failure establishing SSH session with " + address + ": "
            + get_libssh2_error(m_session_ptr.get()));
    }

    // check what authentication methods are available
    auto const& username = config.username;
    auto userauthlist = libssh2_userauth_list(m_session_ptr.get(), username.c_str(), username.length());
    if ((userauthlist == nullptr) || (::strstr(userauthlist, "publickey") == nullptr)) {
        throw std::runtime_error(address + " does not offer publickey authentication for " + username);
    }

    auto authenticated = false;

    // Start by trying to use the ssh-agent mechanism
    try {
        SSHAgent agent(m_session_ptr.get(), username);
        agent.auth();
        authenticated = true;

    } catch (std::exception const& ex) {
        // fall back on the configured key files
        getLogger().write("[%s] ssh-agent authentication unavailable: %s\n", address.c_str(), ex.what());
    }

    // Try each configured private key in turn
    for (auto keyIter = config.keys.begin(); !authenticated && (keyIter != config.keys.end()); ++keyIter) {
        auto const& privatekeyPath = *keyIter;
        if (!fileHasPerms(privatekeyPath.c_str(), R_OK)) {
            continue;
        }

        // A missing public key is derived from the private key by libssh2
        auto const publickeyPath = privatekeyPath + ".pub";
        auto const publickey = pathExists(publickeyPath.c_str())
            ? publickeyPath.c_str()
            : nullptr;
        auto const passphrase = config.passphrase.empty()
            ? nullptr
            : config.passphrase.c_str();

        // Authentication call suffers from spurious timeout
        auto userauth_rc = libssh2_retry([&]() {
            return libssh2_userauth_publickey_fromfile(m_session_ptr.get(),
                username.c_str(), publickey, privatekeyPath.c_str(), passphrase);
        });

        if (userauth_rc == 0) {
            authenticated = true;
        } else {
            getLogger().write("[%s] key %s rejected: %s\n", address.c_str(), privatekeyPath.c_str(),
                get_libssh2_error(m_session_ptr.get()).c_str());
        }
    }

    if (!authenticated) {
        throw std::runtime_error("Failed to authenticate to " + address + " as " + username
            + " using ssh-agent or any key listed in " FLEET_SSH_KEYS_ENV_VAR);
    }

    // Commands may run for as long as they need once connected
    libssh2_session_set_timeout(m_session_ptr.get(), 0);
}

std::string SSHSession::exec(std::string const& command)
{
    // Create a new ssh channel
    auto channel_ptr = UniqueChannel{nullptr, delete_ssh2_channel};
    auto open_session_rc = libssh2_retry([&]() {
        channel_ptr.reset(libssh2_channel_open_session(m_session_ptr.get()));
        return (channel_ptr == nullptr) ? LIBSSH2_ERROR_TIMEOUT : 0;
    });
    if (open_session_rc < 0) {
        throw CommandError("Failure opening SSH channel on " + m_address + ": "
            + get_libssh2_error(m_session_ptr.get()));
    }

    // Deliver stderr interleaved with stdout
    libssh2_channel_handle_extended_data2(channel_ptr.get(), LIBSSH2_CHANNEL_EXTENDED_DATA_MERGE);

    // Request execution of the command on the remote host
    auto exec_rc = libssh2_retry([&]() {
        return libssh2_channel_exec(channel_ptr.get(), command.c_str());
    });
    if (exec_rc < 0) {
        throw CommandError("Executing remote command on " + m_address + " failed: "
            + get_libssh2_error(m_session_ptr.get()));
    }

    // Read until the remote side closes its output
    auto output = std::string{};
    char buf[4096];
    while (true) {
        auto const bytes_read = libssh2_channel_read(channel_ptr.get(), buf, sizeof(buf));
        if (bytes_read == LIBSSH2_ERROR_EAGAIN) {
            continue;
        } else if (bytes_read < 0) {
            throw CommandError("Reading output of remote command on " + m_address + " failed: "
                + get_libssh2_error(m_session_ptr.get()));
        } else if (bytes_read == 0) {
            break;
        }
        output.append(buf, bytes_read);
    }

    if ((libssh2_channel_close(channel_ptr.get()) == 0)
     && (libssh2_channel_wait_closed(channel_ptr.get()) == 0)) {
        if (auto const exit_status = libssh2_channel_get_exit_status(channel_ptr.get())) {
            getLogger().write("[%s] command exited with status %d: %s\n", m_address.c_str(),
                exit_status, command.c_str());
        }
    }

    return output;
}

SSHSessionFactory::SSHSessionFactory(RemoteConfig config)
    : m_config{std::move(config)}
{
    // libssh2_init is not thread safe, run it once before any session exists
    static std::once_flag initFlag;
    std::call_once(initFlag, []() {
        if (auto const rc = libssh2_init(0)) {
            throw std::runtime_error("libssh2_init failed: " + std::to_string(rc));
        }
    });
}

std::unique_ptr<RemoteSession> SSHSessionFactory::open(std::string const& address)
{
    return std::make_unique<SSHSession>(address, m_config);
}

} /* namespace fleet */
