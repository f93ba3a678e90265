/******************************************************************************\
 * dm_log.cpp - Functions relating to creating and writing log files.
 *
 * Copyright 2011-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "doorman_defs.h"

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>

#include "useful/dm_log.h"
#include "useful/dm_wrappers.hpp"

dm_log_t*
_dm_create_log(char const *directory, char const* filename, int suffix)
{
    // sanity check
    if (filename == nullptr) {
        return nullptr;
    }

    if (directory == nullptr) {
        directory = DEFAULT_LOG_DIR;
    }

    // determine the logfile path
    char logfile[PATH_MAX];
    if (snprintf(logfile, PATH_MAX, "%s/doorman.%s.%d.log", directory, filename, suffix) < 0) {
        return nullptr;
    }

    // open the logfile, appending so that forked children share it.
    // the name is predictable, so never follow a planted symlink
    auto const fd = open(logfile, O_WRONLY | O_APPEND | O_CREAT | O_NOFOLLOW | O_CLOEXEC, S_IRUSR | S_IWUSR);
    if (fd < 0) {
        fprintf(stderr, "doorman: could not open log file %s: %s\n", logfile, strerror(errno));
        return nullptr;
    }

    auto fp = fdopen(fd, "a");
    if (fp == nullptr) {
        fprintf(stderr, "doorman: could not open log file %s: %s\n", logfile, strerror(errno));
        close(fd);
        return nullptr;
    }

    // logs should be written line at a time so a crash leaves a usable file
    setvbuf(fp, nullptr, _IOLBF, 0);

    return fp;
}

int
_dm_close_log(dm_log_t* log_file)
{
    if (log_file == nullptr) {
        return 0;
    }

    return fclose(log_file);
}

int
_dm_write_log(dm_log_t* log_file, const char *fmt, ...)
{
    if ((log_file == nullptr) || (fmt == nullptr)) {
        return 0;
    }

    va_list vargs;
    va_start(vargs, fmt);
    fprintf(log_file, "%d: ", getpid());
    auto const rc = vfprintf(log_file, fmt, vargs);
    va_end(vargs);

    return rc;
}

namespace doorman {

bool
hasSplitIdentity()
{
    uid_t ruid, euid, suid;
    gid_t rgid, egid, sgid;
    if ((getresuid(&ruid, &euid, &suid) < 0) || (getresgid(&rgid, &egid, &sgid) < 0)) {
        return true;
    }

    // the saved IDs still differ after the setuid transition
    return (ruid != euid) || (ruid != suid) || (rgid != egid) || (rgid != sgid);
}

Logger&
getLogger()
{
    // a setuid install must not let the caller pick files the service account writes
    static auto const privileged = hasSplitIdentity();

    static auto logger = Logger
        { !privileged && (getenv(DOORMAN_DBG_ENV_VAR) != nullptr)
        , privileged ? DEFAULT_LOG_DIR : getenvOrDefault(DOORMAN_LOG_DIR_ENV_VAR, DEFAULT_LOG_DIR)
        , cstr::gethostname()
        , getpid()
    };
    return logger;
}

} /* namespace doorman */
