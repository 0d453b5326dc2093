/******************************************************************************\
 * TreeCompare.cpp - Verify that destination trees match a source tree
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "fleet_defs.h"

#include <deque>

#include "transfer/TreeCompare.hpp"
#include "transfer/DirectoryListing.hpp"
#include "remote/Host.hpp"

#include "useful/fleet_error.hpp"

namespace fleet {

namespace {

struct PendingPath
{
    std::string path;
    bool isFile;
};

// Requested entries may name a single file. Its type comes from the parent listing.
PendingPath
classifyRequested(Host& source, std::string const& baseDir, std::string const& file)
{
    if (file == ".") {
        return {file, false};
    }

    auto const lastSlash = file.find_last_of('/');
    auto const parent = (lastSlash == std::string::npos) ? std::string{"."} : file.substr(0, lastSlash);
    auto const name = (lastSlash == std::string::npos) ? file : file.substr(lastSlash + 1);

    auto const parentListing = listDirectory(source, baseDir + parent);
    auto const found = parentListing.find(name);
    auto const isFile = (found != parentListing.end()) && !found->second.isDirectory();
    return {file, isFile};
}

// Path of a listed entry relative to the base directory
std::string
entryPath(PendingPath const& listed, std::string const& name)
{
    // Listing a single file reports the file itself
    if (listed.isFile) {
        return listed.path;
    }
    return (listed.path == ".") ? name : listed.path + "/" + name;
}

} /* anonymous namespace */

void
compareTrees(Host& source, std::string const& baseDir, std::vector<CopyChainLink> const& destinations,
    std::vector<std::string> const& files)
{
    auto pending = std::deque<PendingPath>{};
    for (auto&& file : files) {
        pending.push_back(classifyRequested(source, baseDir, file));
    }

    while (!pending.empty()) {
        auto const listed = std::move(pending.front());
        pending.pop_front();

        auto const sourceListing = listDirectory(source, baseDir + listed.path);

        for (auto&& destination : destinations) {
            auto const destinationListing = listDirectory(*destination.host, destination.directory + listed.path);

            for (auto&& [name, size] : sourceListing) {
                auto const found = destinationListing.find(name);
                auto const destinationSize = (found != destinationListing.end())
                    ? found->second
                    : EntrySize::missing();

                if (size != destinationSize) {
                    auto const path = entryPath(listed, name);
                    throw VerificationError("Directory listing mismatch when comparing "
                        + source.getAddress() + ":" + baseDir + path + " to "
                        + destination.host->getAddress() + ":" + destination.directory + path
                        + " (size: " + size.toString() + " vs " + destinationSize.toString() + ")");
                }
            }
        }

        // Directories found while descending are never single files
        for (auto&& [name, size] : sourceListing) {
            if (size.isDirectory()) {
                pending.push_back({entryPath(listed, name), false});
            }
        }
    }

    source.writeLog("Verified %zu destination(s) against %s\n", destinations.size(), baseDir.c_str());
}

} /* namespace fleet */
