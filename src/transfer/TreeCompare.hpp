/******************************************************************************\
 * TreeCompare.hpp - Verify that destination trees match a source tree
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <string>
#include <vector>

#include "transfer/CopyTarget.hpp"

namespace fleet {

class Host;

/*
 * compareTrees - Breadth-first size comparison of source against destinations
 *
 * Arguments
 *      source - host holding the reference tree
 *      baseDir - source base directory, ending in '/'
 *      destinations - normalized chain, each with its own base directory
 *      files - entries below baseDir to start from, "." for the whole tree
 *
 * Detail
 *      Every entry found on the source must exist with the same size on
 *      every destination. Entries only present on a destination are ignored,
 *      and only directories seen on the source are descended into.
 *      Throws VerificationError naming both paths and sizes on the first
 *      mismatch.
 */
void compareTrees(Host& source, std::string const& baseDir, std::vector<CopyChainLink> const& destinations,
    std::vector<std::string> const& files);

} /* namespace fleet */
