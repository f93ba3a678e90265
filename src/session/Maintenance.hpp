/******************************************************************************\
 * Maintenance.hpp - Run a sysop configure / nightly command for a door
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <optional>
#include <string>

#include "config/Config.hpp"
#include "engine/Engine.hpp"
#include "lock/LockFile.hpp"
#include "user/User.hpp"

namespace doorman {

class Maintenance {
public: // types
    enum class Command
        { Configure
        , Nightly
    };

    enum class State
        { Idle
        , Authorized
        , DoorLockAttempt
        , WorkspaceStaged
        , ContainerRunning
        , Done
        , Failed
    };

private: // variables
    Engine&     m_engine;
    std::string m_rundir;
    std::string m_image;
    Door        m_door;
    User        m_user;
    Command     m_command;

    State       m_state;
    std::string m_failure;

    std::optional<LockFile> m_doorLock;

private: // steps
    std::string const& authorize() const;
    void lockDoor(bool nowait);

public: // interface
    // Run the maintenance container attached to the terminal. The exclusive
    // door lock is released once the container has been spawned. Returns the
    // container's exit status. Throws PermissionDenied, NotConfigured,
    // DoorBusy, IOError.
    int run(bool nowait);

    State getState() const { return m_state; }
    std::string const& getFailure() const { return m_failure; }
    bool holdsDoorLock() const { return m_doorLock && m_doorLock->isLocked(); }

public: // constructor / destructor interface
    Maintenance(Engine& engine, std::string rundir, std::string image, Door door, User user, Command command);
    ~Maintenance() = default;
    Maintenance(const Maintenance&) = delete;
    Maintenance& operator=(const Maintenance&) = delete;
    Maintenance(Maintenance&&) = delete;
    Maintenance& operator=(Maintenance&&) = delete;
};

// "configure", "nightly": the label value and the container script name
char const* getName(Maintenance::Command command);

} /* namespace doorman */
