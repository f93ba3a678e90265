/******************************************************************************\
 * LockFile.hpp - Advisory file locks used to coordinate doorman processes
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <string>

#include "useful/dm_wrappers.hpp"

namespace doorman {

/*
** A LockFile is an open handle on a lock file in the run directory. Locks are
** flock(2) advisory locks, so they belong to the open file description: two
** handles on the same path conflict even inside one process, and everything
** is released when the handle is destroyed or the process exits.
*/
class LockFile {
public: // types
    enum class State
        { Unlocked
        , Shared
        , Exclusive
    };

private: // variables
    std::string m_path;
    fd_handle   m_fd;
    State       m_state;

private: // helpers
    bool tryLock(int operation, State newState);

public: // interface
    // Open (creating if absent) the lock file at path. Throws IOError.
    static LockFile open(std::string const& path);

    // Non-blocking attempts. Return false if the lock is held in a conflicting mode.
    bool tryLockShared();
    bool tryLockExclusive();

    // Block until an exclusive lock is acquired
    void lockExclusive();

    // Release any lock held through this handle
    void unlock();

    std::string const& getPath() const { return m_path; }
    State getState() const { return m_state; }
    bool isLocked() const { return m_state != State::Unlocked; }

public: // constructor / destructor interface
    LockFile(std::string path, fd_handle&& fd);
    ~LockFile() = default;
    LockFile(LockFile&&) = default;
    LockFile& operator=(LockFile&&) = default;
    LockFile(const LockFile&) = delete;
    LockFile& operator=(const LockFile&) = delete;
};

/* run directory lock paths */

// {rundir}/{door}.lock
std::string doorLockPath(std::string const& rundir, std::string const& door);

// {rundir}/{door}.{node}.lock
std::string nodeLockPath(std::string const& rundir, std::string const& door, int node);

/* node slot allocation */

struct NodeClaim {
    int         node;
    LockFile    lock;
};

// Scan nodes 1..maxNodes in ascending order and exclusively lock the first free one.
// Throws AllNodesBusy if every node is locked, IOError if a lock file can't be opened.
NodeClaim claimNode(std::string const& rundir, std::string const& door, int maxNodes);

} /* namespace doorman */
