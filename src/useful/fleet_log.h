/******************************************************************************\
 * fleet_log.h - Header file for the log interface.
 *
 * Copyright 2011-2020 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#ifndef _FLEET_LOG_H
#define _FLEET_LOG_H

#include <stdarg.h>
#include <stdio.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef FILE fleet_log_t;

// if logging is enabled,
// create a new logfile in directory with format <filename>.<suffix>.log
// otherwise, returns NULL fleet_log_t that can be passed to logging functions with no effect
fleet_log_t* _fleet_create_log(char const *directory, char const* filename, int suffix);

// finalize log and close its file (if nonnull)
int _fleet_close_log(fleet_log_t* log_file);

// write the given formatted string to the log file (if nonnull)
int _fleet_write_log(fleet_log_t* log_file, const char *fmt, ...);

#ifdef __cplusplus
}

#include <string>
#include <memory>
#include <utility>

namespace fleet {

class Logger
{
private: // types
    using LogPtr = std::unique_ptr<fleet_log_t, int(*)(fleet_log_t*)>;

private: // variables
    LogPtr logFile;

public: // interface
    Logger(bool enable, std::string const& directory, std::string const& filename, int suffix) : logFile{nullptr, _fleet_close_log}
    {
        // determine if logging mode is enabled
        if (enable) {
            char const *dir = nullptr;
            if (!directory.empty()) {
                dir = directory.c_str();
            }
            logFile = LogPtr{_fleet_create_log(dir, filename.c_str(), suffix), _fleet_close_log};
        }
    }

    bool enabled() const { return logFile != nullptr; }

    template <typename... Args>
    void write(char const* fmt, Args&&... args)
    {
        if (logFile) {
            _fleet_write_log(logFile.get(), fmt, std::forward<Args>(args)...);
        }
    }
};

// process log, configured from FLEET_DEBUG / FLEET_LOG_DIR on first use
Logger& getLogger();

} /* namespace fleet */

#endif /* __cplusplus */

#endif /* _FLEET_LOG_H */
