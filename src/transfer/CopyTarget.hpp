/******************************************************************************\
 * CopyTarget.hpp - Destination descriptions accepted by the copy and compare
 *                  operations, and their canonical chain form.
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace fleet {

class Host;

// A destination host, optionally with its own base directory.
// An empty directory means "same as the source base directory".
struct CopyTarget
{
    std::shared_ptr<Host> host;
    std::string directory;

    CopyTarget(std::shared_ptr<Host> host_)
        : host{std::move(host_)}
        , directory{}
    {}

    CopyTarget(std::shared_ptr<Host> host_, std::string directory_)
        : host{std::move(host_)}
        , directory{std::move(directory_)}
    {}
};

struct CopyOptions
{
    std::vector<std::string> files;  // entries under the base directory; empty copies "."
    int port = 0;                    // 0 selects the configured copy port
    bool overwrite = false;          // allow nonzero-size entries to exist on destinations
};

// One hop of a copy chain. Only lives for the duration of one copy or compare.
struct CopyChainLink
{
    std::shared_ptr<Host> host;
    std::string directory;           // always ends in '/'
    size_t position;                 // 0 receives from the source
};

// Ensure path ends in a single trailing '/'
std::string withTrailingSlash(std::string const& path);

// Produce the ordered chain for targets, defaulting each directory to baseDir.
// Throws SafetyError if there are no targets.
std::vector<CopyChainLink> normalizeTargets(std::string const& baseDir, std::vector<CopyTarget> const& targets);

// Requested entry names, "." when none were given
std::vector<std::string> requestedFiles(CopyOptions const& options);

// Split "HOST" or "HOST:DIR" into its host and directory, ignoring surrounding blanks
std::pair<std::string, std::string> parseHostDirectory(std::string const& arg);

} /* namespace fleet */
