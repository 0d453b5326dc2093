/******************************************************************************\
 * DirectoryListing.hpp - Remote directory listings as name -> size maps
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <stdint.h>

#include <map>
#include <ostream>
#include <string>

namespace fleet {

class Host;

// Size descriptor of a listed entry: a byte count, the directory sentinel,
// or the placeholder used when a compared entry does not exist.
struct EntrySize
{
    enum class Kind { File, Directory, Missing };

    Kind     kind;
    uint64_t bytes;

    static EntrySize file(uint64_t bytes) { return EntrySize{Kind::File, bytes}; }
    static EntrySize directory()          { return EntrySize{Kind::Directory, 0}; }
    static EntrySize missing()            { return EntrySize{Kind::Missing, 0}; }

    bool isDirectory() const { return kind == Kind::Directory; }

    // "/" for directories, "MISSING" for absent entries, otherwise the byte count
    std::string toString() const;

    bool operator==(EntrySize const& other) const
    {
        return (kind == other.kind) && ((kind != Kind::File) || (bytes == other.bytes));
    }
    bool operator!=(EntrySize const& other) const { return !(*this == other); }
};

std::ostream& operator<<(std::ostream& os, EntrySize const& size);

using DirectoryListing = std::map<std::string, EntrySize>;

/*
 * parseListing - Parse the output of FLEET_LIST_CMD
 *
 * Detail
 *      Each entry line has the form
 *          <mode> <links> <size> <month> <day> <time-or-year> <name>[suffix]
 *      Directories carry a trailing '/', other file types one of '*=>@|'.
 *      The suffix is stripped from the name, and only the last path component
 *      is kept. Lines that do not match (totals, headers, errors) are skipped.
 */
DirectoryListing parseListing(std::string const& output);

// List path (a directory, a single file, or several space separated paths) on host
DirectoryListing listDirectory(Host& host, std::string const& path);

// Recursively sum the size of all files below path on host
uint64_t totalSize(Host& host, std::string const& path);

} /* namespace fleet */
