/******************************************************************************\
 * CopyChain.cpp - Stream a directory tree from one host to many through a
 *                 relay chain of destinations.
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "fleet_defs.h"

#include <algorithm>
#include <iterator>
#include <thread>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>

#include "transfer/CopyChain.hpp"
#include "transfer/DirectoryListing.hpp"
#include "transfer/TreeCompare.hpp"
#include "remote/Host.hpp"

#include "useful/fleet_error.hpp"

namespace fleet {

ChainWorker::ChainWorker(std::shared_ptr<Host> host, std::string command)
    : m_description{host->getAddress() + ": " + command}
    , m_result{}
{
    auto task = std::packaged_task<std::string()>{[host, command]() {
        return host->executeOnce(command);
    }};
    m_result = task.get_future();
    std::thread{std::move(task)}.detach();
}

std::string
ChainWorker::wait()
{
    return m_result.get();
}

namespace {

void
checkDirectory(std::string const& address, std::string const& directory)
{
    if (directory.empty()
     || (directory == "/")
     || boost::algorithm::contains(directory, "..")
     || boost::algorithm::contains(directory, "./")) {
        throw SafetyError("Directory " + address + ":" + directory + " looks suspicious");
    }
}

void
checkFiles(std::vector<std::string> const& files)
{
    for (auto&& file : files) {
        auto components = std::vector<std::string>{};
        boost::algorithm::split(components, file, boost::algorithm::is_any_of("/"));
        auto const escapes = std::find(components.begin(), components.end(), "..") != components.end();
        if (file.empty() || escapes) {
            throw SafetyError("Requested file '" + file + "' looks suspicious");
        }
    }
}

// Refuse to overwrite any requested entry that already holds data
void
checkNotOverwriting(Host& target, std::string const& directory, std::vector<std::string> const& files)
{
    auto paths = std::vector<std::string>{};
    for (auto&& file : files) {
        paths.push_back(directory + file);
    }

    for (auto&& [name, size] : listDirectory(target, boost::algorithm::join(paths, " "))) {
        if (!size.isDirectory() && (size.bytes > 0)) {
            throw SafetyError("File " + name + " exists on " + target.getAddress() + " and has nonzero size!");
        }
    }
}

std::string
conduitName(int port)
{
    return FLEET_CONDUIT_NAME + std::to_string(port);
}

} /* anonymous namespace */

void
copyChain(Host& source, std::string const& baseDir, std::vector<CopyTarget> const& targets,
    CopyOptions const& options)
{
    auto const port = (options.port != 0) ? options.port : source.getConfig().copyPort;
    if ((port < 1) || (port > 65535)) {
        throw std::invalid_argument("copy port " + std::to_string(port) + " is out of range");
    }

    // Path checks complete before any remote command runs
    if (baseDir.empty()) {
        throw SafetyError("No source directory given on " + source.getAddress());
    }
    auto const base = withTrailingSlash(baseDir);
    auto const chain = normalizeTargets(base, targets);
    for (auto&& link : chain) {
        checkDirectory(link.host->getAddress(), link.directory);
    }
    auto const files = requestedFiles(options);
    checkFiles(files);
    auto const fileList = boost::algorithm::join(files, " ");

    source.confirmInstalled(FLEET_COMPRESSOR);
    for (auto&& link : chain) {
        link.host->confirmInstalled(FLEET_COMPRESSOR);
        link.host->execute("mkdir -p " + link.directory);
        if (!options.overwrite) {
            checkNotOverwriting(*link.host, link.directory, files);
        }
    }

    auto const portString = std::to_string(port);
    auto const conduit = conduitName(port);
    auto const extract = FLEET_COMPRESSOR " -d | " FLEET_ARCHIVER " xvf -";

    // Start listeners from the tail so every hop accepts before its upstream connects
    auto workers = std::vector<ChainWorker>{};
    for (auto link = chain.rbegin(); link != chain.rend(); ++link) {
        auto& host = link->host;
        auto const& directory = link->directory;

        if (link == chain.rbegin()) {
            workers.emplace_back(host, "cd " + directory + " && " FLEET_TRANSPORT " -l " + portString
                + " | " + extract);
            host->confirmListeningOnPort(port);
            host->writeLog("Listening on port %d.\n", port);
        } else {
            auto const& next = *std::prev(link);

            workers.emplace_back(host, "cd " + directory + " && " FLEET_CONDUIT_MAKER " " + conduit
                + " && " FLEET_TRANSPORT " " + next.host->getAddress() + " " + portString + " <" + conduit
                + " && rm " + conduit);
            host->confirmPipeExists(directory + conduit);

            workers.emplace_back(host, "cd " + directory + " && " FLEET_TRANSPORT " -l " + portString
                + " | " FLEET_RELAY " " + conduit + " | " + extract);
            host->confirmListeningOnPort(port);
            host->writeLog("Listening on port %d, and chaining to %s.\n", port, next.host->getAddress().c_str());
        }
    }

    source.writeLog("Sending files over to %s: %s\n", chain.front().host->getAddress().c_str(), fileList.c_str());
    source.executeOnce("cd " + base + " && " FLEET_ARCHIVER " vc " + fileList + " | " FLEET_COMPRESSOR " | "
        FLEET_TRANSPORT " " + chain.front().host->getAddress() + " " + portString);

    for (auto&& worker : workers) {
        try {
            worker.wait();
        } catch (std::exception const& ex) {
            source.writeLog("Chain command failed (%s): %s\n", worker.getDescription().c_str(), ex.what());
            throw;
        }
    }
    source.writeLog("File copy complete.\n");

    source.writeLog("Verifying file sizes and types on all destinations.\n");
    compareTrees(source, base, chain, files);
    source.writeLog("Verification successful.\n");
}

} /* namespace fleet */
