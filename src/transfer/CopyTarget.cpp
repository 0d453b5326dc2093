/******************************************************************************\
 * CopyTarget.cpp - Normalize copy destinations into chain order
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "fleet_defs.h"

#include <boost/algorithm/string/trim.hpp>

#include "transfer/CopyTarget.hpp"

#include "useful/fleet_error.hpp"

namespace fleet {

std::string
withTrailingSlash(std::string const& path)
{
    if (!path.empty() && (path.back() == '/')) {
        return path;
    }
    return path + "/";
}

std::vector<CopyChainLink>
normalizeTargets(std::string const& baseDir, std::vector<CopyTarget> const& targets)
{
    if (targets.empty()) {
        throw SafetyError("No target hosts supplied");
    }

    auto result = std::vector<CopyChainLink>{};
    result.reserve(targets.size());
    for (auto&& target : targets) {
        if (target.host == nullptr) {
            throw std::invalid_argument("copy target " + std::to_string(result.size()) + " has no host");
        }

        // Empty directories are kept empty so the path check can reject them
        auto directory = target.directory.empty()
            ? withTrailingSlash(baseDir)
            : withTrailingSlash(target.directory);
        result.push_back(CopyChainLink{target.host, std::move(directory), result.size()});
    }

    return result;
}

std::vector<std::string>
requestedFiles(CopyOptions const& options)
{
    if (options.files.empty()) {
        return { "." };
    }
    return options.files;
}

std::pair<std::string, std::string>
parseHostDirectory(std::string const& arg)
{
    auto const trimmed = boost::algorithm::trim_copy(arg);
    auto const colon = trimmed.find(':');
    if (colon == std::string::npos) {
        return {trimmed, ""};
    }
    return {trimmed.substr(0, colon), trimmed.substr(colon + 1)};
}

} /* namespace fleet */
