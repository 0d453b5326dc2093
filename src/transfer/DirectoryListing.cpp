/******************************************************************************\
 * DirectoryListing.cpp - Parse remote directory listings and sum their sizes
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "fleet_defs.h"

#include <regex>
#include <sstream>

#include "transfer/DirectoryListing.hpp"
#include "remote/Host.hpp"

namespace fleet {

// Type indicators appended by ls -F
static constexpr char const* TYPE_SUFFIXES = "*/=>@|";

// <mode> <links> <size> ... <HH:MM or year> <name>
static std::regex const&
listingLinePattern()
{
    static auto const pattern = std::regex{R"(^[\w.+-]+\s+\d+\s+(\d+).*(?:\d\d:\d\d|\d{4})\s+(.*)$)"};
    return pattern;
}

std::string
EntrySize::toString() const
{
    switch (kind) {
        case Kind::Directory:
            return "/";
        case Kind::Missing:
            return "MISSING";
        case Kind::File:
        default:
            return std::to_string(bytes);
    }
}

std::ostream&
operator<<(std::ostream& os, EntrySize const& size)
{
    return os << size.toString();
}

DirectoryListing
parseListing(std::string const& output)
{
    auto result = DirectoryListing{};

    auto stream = std::istringstream{output};
    auto line = std::string{};
    while (std::getline(stream, line)) {
        if (!line.empty() && (line.back() == '\r')) {
            line.pop_back();
        }

        auto matches = std::smatch{};
        if (!std::regex_match(line, matches, listingLinePattern())) {
            continue;
        }

        auto name = matches[2].str();
        auto const isDirectory = !name.empty() && (name.back() == '/');
        if (!name.empty() && (std::string{TYPE_SUFFIXES}.find(name.back()) != std::string::npos)) {
            name.pop_back();
        }

        // Listing a path directly reports the path as given
        auto const lastSlash = name.find_last_of('/');
        if (lastSlash != std::string::npos) {
            name = name.substr(lastSlash + 1);
        }
        if (name.empty()) {
            continue;
        }

        if (isDirectory) {
            result.insert_or_assign(name, EntrySize::directory());
        } else {
            try {
                result.insert_or_assign(name, EntrySize::file(std::stoull(matches[1].str())));
            } catch (std::out_of_range const&) {
                continue;
            }
        }
    }

    return result;
}

DirectoryListing
listDirectory(Host& host, std::string const& path)
{
    return parseListing(host.execute(FLEET_LIST_CMD " " + path));
}

uint64_t
totalSize(Host& host, std::string const& path)
{
    auto total = uint64_t{0};
    for (auto&& [name, size] : listDirectory(host, path)) {
        total += size.isDirectory()
            ? totalSize(host, path + "/" + name)
            : size.bytes;
    }
    return total;
}

} /* namespace fleet */
