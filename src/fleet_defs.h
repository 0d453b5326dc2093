/******************************************************************************\
 * fleet_defs.h - Global definitions used by the fleet library. Include this
 *                in every source file.
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#ifndef _FLEET_DEFS_H
#define _FLEET_DEFS_H

#include "fleet_shared.h"

/*******************************************************************************
** Session pool
*******************************************************************************/
#define FLEET_ACQUIRE_ATTEMPTS      5                   // attempts to obtain a validated session
#define FLEET_DEFAULT_CMD_ATTEMPTS  3                   // default retry budget for a command
#define FLEET_PING_CMD              "echo ping"         // validation round-trip
#define FLEET_PING_REPLY            "ping"              // exact expected validation reply
#define FLEET_RESET_CMD             "cd ~"              // run before returning a session to the pool

/*******************************************************************************
** Readiness polling
*******************************************************************************/
#define FLEET_DEFAULT_READY_TIMEOUT 10                  // seconds to wait for a listener or conduit
#define FLEET_READY_TOKEN           "fleet-ready"       // printed by the remote poll loop on success
#define FLEET_TIMEOUT_TOKEN         "fleet-timeout"     // printed by the remote poll loop on expiry

/*******************************************************************************
** Remote tools used by the listing and copy code
*******************************************************************************/
#define FLEET_LIST_CMD      "ls --color=never -1AgGF"   // no color, one per line, no owner/group, type suffix
#define FLEET_ARCHIVER      "tar"
#define FLEET_COMPRESSOR    "pigz"
#define FLEET_TRANSPORT     "nc"
#define FLEET_RELAY         "tee"
#define FLEET_CONDUIT_MAKER "mkfifo"
#define FLEET_CONDUIT_NAME  "fifo"                      // relay conduit is <dir>/fifo<port>
#define FLEET_SOCKET_LIST   "netstat -ln"

#endif /* _FLEET_DEFS_H */
