/******************************************************************************\
 * fleet_log.cpp - Functions relating to creating and writing log files.
 *
 * Copyright 2011-2020 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "fleet_defs.h"

#include <errno.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>
#include <unistd.h>

#include "useful/fleet_log.h"
#include "useful/fleet_wrappers.hpp"

fleet_log_t*
_fleet_create_log(char const* directory, char const* filename, int suffix)
{
    if (filename == nullptr) {
        fprintf(stderr, "_fleet_create_log: invalid args\n");
        return nullptr;
    }

    // fall back to the default log directory
    if ((directory == nullptr) || !fleet::dirHasPerms(directory, R_OK | W_OK | X_OK)) {
        directory = FLEET_DEFAULT_LOG_DIR;
    }

    // <directory>/<filename>.<suffix>.log
    auto const logPath = std::string{directory} + "/" + filename + "." + std::to_string(suffix) + ".log";

    auto logFile = fopen(logPath.c_str(), "a");
    if (logFile == nullptr) {
        fprintf(stderr, "_fleet_create_log: fopen %s failed: %s\n", logPath.c_str(), strerror(errno));
        return nullptr;
    }

    // line buffered so that concurrent writers interleave whole lines
    setvbuf(logFile, nullptr, _IOLBF, 0);

    return logFile;
}

int
_fleet_close_log(fleet_log_t* log_file)
{
    if (log_file == nullptr) {
        return 0;
    }

    return fclose(log_file);
}

int
_fleet_write_log(fleet_log_t* log_file, const char* fmt, ...)
{
    if (log_file == nullptr) {
        return 1;
    }

    // HH:MM:SS prefix
    char stamp[16];
    auto const now = time(nullptr);
    struct tm local;
    if ((localtime_r(&now, &local) == nullptr) || (strftime(stamp, sizeof(stamp), "%H:%M:%S", &local) == 0)) {
        stamp[0] = '\0';
    }

    flockfile(log_file);
    fprintf(log_file, "%s ", stamp);

    va_list vargs;
    va_start(vargs, fmt);
    vfprintf(log_file, fmt, vargs);
    va_end(vargs);

    funlockfile(log_file);

    return 0;
}

namespace fleet {

Logger& getLogger()
{
    static auto logger = Logger
        { ::getenv(FLEET_DBG_ENV_VAR) != nullptr
        , getenvOrDefault(FLEET_LOG_DIR_ENV_VAR, FLEET_DEFAULT_LOG_DIR)
        , "fleet"
        , getpid()
    };
    return logger;
}

} /* namespace fleet */
