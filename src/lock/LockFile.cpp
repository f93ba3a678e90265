/******************************************************************************\
 * LockFile.cpp - Advisory file locks used to coordinate doorman processes
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "doorman_defs.h"

#include <sys/file.h>
#include <fcntl.h>
#include <errno.h>
#include <string.h>

#include "lock/LockFile.hpp"

#include "doorman_error.hpp"
#include "useful/dm_log.h"

namespace doorman {

LockFile::LockFile(std::string path, fd_handle&& fd)
    : m_path{std::move(path)}
    , m_fd{std::move(fd)}
    , m_state{State::Unlocked}
{}

LockFile
LockFile::open(std::string const& path)
{
    // Never truncate: the file may be held open (and locked) by another process
    auto const rawFd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, S_IRUSR | S_IWUSR | S_IRGRP | S_IWGRP);
    if (rawFd < 0) {
        throw IOError{"Couldn't open lockfile " + path + ": " + strerror(errno)};
    }

    return LockFile{path, fd_handle{rawFd}};
}

bool
LockFile::tryLock(int operation, State newState)
{
    while (::flock(m_fd.fd(), operation | LOCK_NB) < 0) {
        if (errno == EINTR) {
            continue;
        } else if (errno == EWOULDBLOCK) {
            return false;
        }
        throw IOError{"flock " + m_path + " failed: " + strerror(errno)};
    }

    m_state = newState;
    return true;
}

bool
LockFile::tryLockShared()
{
    return tryLock(LOCK_SH, State::Shared);
}

bool
LockFile::tryLockExclusive()
{
    return tryLock(LOCK_EX, State::Exclusive);
}

void
LockFile::lockExclusive()
{
    while (::flock(m_fd.fd(), LOCK_EX) < 0) {
        if (errno != EINTR) {
            throw IOError{"flock " + m_path + " failed: " + strerror(errno)};
        }
    }

    m_state = State::Exclusive;
}

void
LockFile::unlock()
{
    if (::flock(m_fd.fd(), LOCK_UN) < 0) {
        throw IOError{"unlock " + m_path + " failed: " + strerror(errno)};
    }

    m_state = State::Unlocked;
}

std::string
doorLockPath(std::string const& rundir, std::string const& door)
{
    return rundir + "/" + door + LOCK_FILE_SUFFIX;
}

std::string
nodeLockPath(std::string const& rundir, std::string const& door, int node)
{
    return rundir + "/" + door + "." + std::to_string(node) + LOCK_FILE_SUFFIX;
}

NodeClaim
claimNode(std::string const& rundir, std::string const& door, int maxNodes)
{
    for (int node = 1; node <= maxNodes; node++) {
        auto lock = [&]() {
            try {
                return LockFile::open(nodeLockPath(rundir, door, node));
            } catch (IOError const& ex) {
                throw IOError{"Failed to lock node " + std::to_string(node)
                    + " for door '" + door + "': " + ex.what()};
            }
        }();

        if (lock.tryLockExclusive()) {
            writeLog("claimNode: door %s claimed node %d\n", door.c_str(), node);
            return NodeClaim{node, std::move(lock)};
        }

        writeLog("claimNode: door %s node %d is busy\n", door.c_str(), node);
    }

    throw AllNodesBusy{"All nodes for " + door + " are busy!"};
}

} /* namespace doorman */
