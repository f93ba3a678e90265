/******************************************************************************\
 * doorman_defs.h - A header file for common compile time defines.
 *
 * NOTE: These defines are used throughout the internal code base and are all
 *       placed inside this file to make changes to the container contract
 *       easier.
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#ifndef _DOORMAN_DEFS_H
#define _DOORMAN_DEFS_H

#include <limits.h>
#include <stdint.h>
#include <sys/types.h>

/*******************************************************************************
** Generic defines
*******************************************************************************/
#define DOORMAN_VERSION         "0.4.0"
#define DOORMAN_BUF_SIZE        4096
#define DEFAULT_ERR_STR         "Unknown doorman error"

/*******************************************************************************
** Environment variables
*******************************************************************************/
#define DOORMAN_CONFIG_ENV_VAR  "DOORMAN_CONFIG"    // Path to the configuration file (read)
#define DOORMAN_DBG_ENV_VAR     "DOORMAN_DEBUG"     // Enable debug logging (read)
#define DOORMAN_LOG_DIR_ENV_VAR "DOORMAN_LOG_DIR"   // Directory for debug log files (read)
#define DOORMAN_RAW_ENV_VAR     "DOORMAN_RAW"       // Raw / translated display flag (set in container)
#define TERM_ENV_VAR            "TERM"              // Terminal type (read, set in container)
#define SUDO_USER_ENV_VAR       "SUDO_USER"
#define DOAS_USER_ENV_VAR       "DOAS_USER"

#define DEFAULT_TERM            "xterm"
#define DEFAULT_LOG_DIR         "/tmp"

/*******************************************************************************
** Configuration defaults
*******************************************************************************/
#define DEFAULT_CONFIG_SUBPATH  "/.config/doorman/doorman.json"  // relative to $HOME
#define DEFAULT_DATA_SUBPATH    "/.local/share/doorman"          // relative to $HOME
#define DEFAULT_DOSEMU_IMAGE    "ghcr.io/jordemort/doorman-dosemu:main"
#define DEFAULT_MAX_NODES       1
#define MAX_MAX_NODES           99

/*******************************************************************************
** Run directory layout
*******************************************************************************/
#define LOCK_FILE_SUFFIX        ".lock"     // {door}.lock, {door}.{node}.lock
#define SYSOP_WORKSPACE_NAME    "sysop"     // {door}.sysop
#define PODMAN_ROOT_DIR         "podman"
#define PODMAN_RUNROOT_DIR      "podman-run"

/*******************************************************************************
** Container contract
*******************************************************************************/
#define CONTAINER_WORKSPACE_MOUNT   "/mnt/doorman"
#define CONTAINER_DOOR_MOUNT        "/mnt/door"
#define CONTAINER_DOOR_LOCK_MOUNT   "/mnt/door.lock"
#define CONTAINER_NODE_LOCK_MOUNT   "/mnt/node.lock"

#define WAIT_FOR_LAUNCH_SCRIPT  "wait-for-launch.sh"    // blocks until dosemu is ready
#define LAUNCH_SCRIPT           "launch.sh"             // interactive attach entrypoint
#define SYSOP_SCRIPT_SUFFIX     ".sh"                   // configure.sh, nightly.sh

#define LABEL_DOOR      "doorman.door"
#define LABEL_NODE      "doorman.node"
#define LABEL_USER      "doorman.user"
#define LABEL_RUNDIR    "doorman.rundir"
#define LABEL_COMMAND   "doorman.command"

#define CONTAINER_TMPFS_MOUNTS  { "/run/user", "/tmp", "/var/tmp" }

/*******************************************************************************
** DOS side files
*******************************************************************************/
#define DOOR_SYS_FILE           "door.sys"
#define BATCH_FILE              "doorman.bat"
#define CP437_REPLACEMENT_CHAR  '?'

#endif /* _DOORMAN_DEFS_H */
