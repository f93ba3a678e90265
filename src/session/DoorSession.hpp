/******************************************************************************\
 * DoorSession.hpp - Launch one play session of a door
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <optional>
#include <string>

#include "config/Config.hpp"
#include "dos/Templates.hpp"
#include "engine/Engine.hpp"
#include "lock/LockFile.hpp"
#include "session/Workspace.hpp"
#include "user/User.hpp"

namespace doorman {

// Current local time as HH:MM, for drop files
std::string currentTime();

/*
** DoorSession drives a play session from the door lock to the interactive
** attach. The door lock is taken shared and held until the DoorSession is
** destroyed. The node lock is released as soon as the container is running:
** from then on the node slot may be claimed again, and the container labels
** are what identify the running session.
*/
class DoorSession {
public: // types
    enum class State
        { Idle
        , DoorLocked
        , NodeScanning
        , NodeClaimed
        , WorkspaceStaged
        , ContainerStarting
        , ContainerReady
        , Attached
        , Done
        , Failed
    };

    struct Options {
        // DOORMAN_RAW inside the container
        bool        raw;
        // TERM inside the container
        std::string term;
    };

private: // variables
    Engine&     m_engine;
    std::string m_rundir;
    std::string m_image;
    Door        m_door;
    User        m_user;

    State       m_state;
    std::string m_failure;

    std::optional<LockFile>  m_doorLock;
    std::optional<NodeClaim> m_claim;
    int                      m_node;
    std::string              m_containerId;

private: // steps
    void lockDoor();
    void claimNodeSlot();
    Workspace stageWorkspace();
    void startContainer(Workspace const& workspace, Options const& options);
    int attachContainer();

public: // interface
    // Run the whole launch flow and return the exit status of the attached
    // client. Throws DoorBusy, AllNodesBusy, LaunchFailed or IOError; the
    // session is then left in State::Failed.
    int run(Options const& options);

    State getState() const { return m_state; }
    std::string const& getFailure() const { return m_failure; }
    int getNode() const { return m_node; }
    std::string const& getContainerId() const { return m_containerId; }

    // Door lock is still held while the session exists
    bool holdsDoorLock() const { return m_doorLock && m_doorLock->isLocked(); }

    // Node lock is only held between the scan and container start
    bool holdsNodeLock() const { return m_claim && m_claim->lock.isLocked(); }

public: // constructor / destructor interface
    DoorSession(Engine& engine, std::string rundir, std::string image, Door door, User user);
    ~DoorSession() = default;
    DoorSession(const DoorSession&) = delete;
    DoorSession& operator=(const DoorSession&) = delete;
    DoorSession(DoorSession&&) = delete;
    DoorSession& operator=(DoorSession&&) = delete;
};

char const* toString(DoorSession::State state);

} /* namespace doorman */
