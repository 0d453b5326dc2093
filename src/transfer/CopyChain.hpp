/******************************************************************************\
 * CopyChain.hpp - Stream a directory tree from one host to many through a
 *                 relay chain of destinations.
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <future>
#include <memory>
#include <string>
#include <vector>

#include "transfer/CopyTarget.hpp"

namespace fleet {

class Host;

// A remote command running in the background on one chain member.
// The thread is detached so an abandoned chain never blocks its caller.
class ChainWorker
{
private: // variables
    std::string m_description;
    std::future<std::string> m_result;

public: // interface
    // Block until the command finishes. Rethrows its failure.
    std::string wait();

    std::string const& getDescription() const { return m_description; }

public: // Constructor/destructors
    ChainWorker(std::shared_ptr<Host> host, std::string command);
    ChainWorker(ChainWorker&&) = default;
    ChainWorker& operator=(ChainWorker&&) = default;
    ~ChainWorker() = default;
};

/*
 * copyChain - Copy baseDir (or options.files below it) from source to targets
 *
 * Detail
 *      The source sends one compressed stream to the first target. Every
 *      target except the last extracts it while forwarding it to the next
 *      target through a named pipe. Listeners are started from the tail of
 *      the chain backwards so each hop is accepting before its upstream
 *      hop connects.
 *
 *      Pre-flight checks run on every target before any listener starts:
 *      suspicious paths and pre-existing nonzero-size entries raise
 *      SafetyError. A listener or pipe that does not come up in time raises
 *      ReadinessTimeout and abandons the chain without cleanup. After the
 *      transfer every target is compared against the source, raising
 *      VerificationError on any difference.
 *
 *      Each remote command is run at most once.
 */
void copyChain(Host& source, std::string const& baseDir, std::vector<CopyTarget> const& targets,
    CopyOptions const& options);

} /* namespace fleet */
