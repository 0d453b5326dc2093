/******************************************************************************\
 * fleet_shared.h - Definitions shared between the fleet library and its
 *                  command line front end.
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#ifndef _FLEET_SHARED_H
#define _FLEET_SHARED_H

/*
** Environment variables read by the fleet library
*/
#define FLEET_SSH_USER_ENV_VAR       "FLEET_SSH_USER"       // remote account used for every session
#define FLEET_SSH_PORT_ENV_VAR       "FLEET_SSH_PORT"       // remote shell port
#define FLEET_SSH_KEYS_ENV_VAR       "FLEET_SSH_KEYS"       // colon separated list of private key files
#define FLEET_SSH_PASSPHRASE_ENV_VAR "FLEET_SSH_PASSPHRASE" // passphrase used to unlock the keys
#define FLEET_SSH_TIMEOUT_ENV_VAR    "FLEET_SSH_TIMEOUT"    // connect timeout in seconds
#define FLEET_COPY_PORT_ENV_VAR      "FLEET_COPY_PORT"      // default port for copy chains
#define FLEET_DBG_ENV_VAR            "FLEET_DEBUG"          // enable logging
#define FLEET_LOG_DIR_ENV_VAR        "FLEET_LOG_DIR"        // directory to write the log file into

/*
** Defaults used when the environment does not override them
*/
#define FLEET_DEFAULT_SSH_USER       "root"
#define FLEET_DEFAULT_SSH_PORT       22
#define FLEET_DEFAULT_SSH_TIMEOUT    5
#define FLEET_DEFAULT_COPY_PORT      7000
#define FLEET_DEFAULT_LOG_DIR        "/tmp"
#define FLEET_DEFAULT_INTERFACE      "bond0"

#endif /* _FLEET_SHARED_H */
