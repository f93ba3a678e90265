/******************************************************************************\
 * DoorSession.cpp - Launch one play session of a door
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "doorman_defs.h"

#include <time.h>

#include "session/DoorSession.hpp"

#include "doorman_error.hpp"
#include "useful/dm_log.h"

namespace doorman {

std::string
currentTime()
{
    auto const now = ::time(nullptr);
    struct tm local;
    if (::localtime_r(&now, &local) == nullptr) {
        return "00:00";
    }

    char buf[8];
    ::strftime(buf, sizeof(buf), "%H:%M", &local);
    return buf;
}

char const*
toString(DoorSession::State state)
{
    switch (state) {
        case DoorSession::State::Idle:              return "Idle";
        case DoorSession::State::DoorLocked:        return "DoorLocked";
        case DoorSession::State::NodeScanning:      return "NodeScanning";
        case DoorSession::State::NodeClaimed:       return "NodeClaimed";
        case DoorSession::State::WorkspaceStaged:   return "WorkspaceStaged";
        case DoorSession::State::ContainerStarting: return "ContainerStarting";
        case DoorSession::State::ContainerReady:    return "ContainerReady";
        case DoorSession::State::Attached:          return "Attached";
        case DoorSession::State::Done:              return "Done";
        case DoorSession::State::Failed:            return "Failed";
    }
    return "Unknown";
}

DoorSession::DoorSession(Engine& engine, std::string rundir, std::string image, Door door, User user)
    : m_engine{engine}
    , m_rundir{std::move(rundir)}
    , m_image{std::move(image)}
    , m_door{std::move(door)}
    , m_user{std::move(user)}
    , m_state{State::Idle}
    , m_failure{}
    , m_doorLock{}
    , m_claim{}
    , m_node{0}
    , m_containerId{}
{}

void
DoorSession::lockDoor()
{
    auto doorLock = LockFile::open(doorLockPath(m_rundir, m_door.name));
    if (!doorLock.tryLockShared()) {
        throw DoorBusy{"Sorry, " + m_door.name + " is currently undergoing maintenance."};
    }

    m_doorLock = std::move(doorLock);
    m_state = State::DoorLocked;
}

void
DoorSession::claimNodeSlot()
{
    m_state = State::NodeScanning;

    m_claim = claimNode(m_rundir, m_door.name, m_door.options.max_nodes);
    m_node = m_claim->node;

    m_state = State::NodeClaimed;
}

Workspace
DoorSession::stageWorkspace()
{
    auto workspace = Workspace::forNode(m_rundir, m_door.name, m_node);
    workspace.reset();

    auto vars = TemplateVars{};
    m_user.addTemplateVars(vars);
    vars["node"] = std::to_string(m_node);
    vars["current_time"] = currentTime();

    workspace.write(DOOR_SYS_FILE, vars);

    try {
        vars["commands"] = dos::renderString(m_door.options.launch_commands, vars);
    } catch (std::exception const& ex) {
        throw IOError{"Couldn't generate batch commands for " + m_door.name + ": " + ex.what()};
    }
    workspace.write(BATCH_FILE, vars);

    m_state = State::WorkspaceStaged;
    return workspace;
}

void
DoorSession::startContainer(Workspace const& workspace, Options const& options)
{
    auto const spec = RunSpec
        { .detach = true
        , .env =
            { { TERM_ENV_VAR, options.term }
            , { DOORMAN_RAW_ENV_VAR, options.raw ? "1" : "0" }
            }
        , .volumes =
            { { workspace.getPath(), CONTAINER_WORKSPACE_MOUNT }
            , { m_door.options.door_path, CONTAINER_DOOR_MOUNT }
            , { m_doorLock->getPath(), CONTAINER_DOOR_LOCK_MOUNT }
            , { m_claim->lock.getPath(), CONTAINER_NODE_LOCK_MOUNT }
            }
        , .labels =
            { { LABEL_DOOR, m_door.name }
            , { LABEL_NODE, std::to_string(m_node) }
            , { LABEL_USER, m_user.username }
            , { LABEL_RUNDIR, workspace.getPath() }
            }
        , .image = m_image
        , .entrypoint = WAIT_FOR_LAUNCH_SCRIPT
    };

    m_state = State::ContainerStarting;

    try {
        m_containerId = m_engine.startDetached(spec);
    } catch (LaunchFailed const& ex) {
        throw LaunchFailed{"Starting container for " + m_door.name + " failed: " + ex.what()};
    }

    m_state = State::ContainerReady;
}

int
DoorSession::attachContainer()
{
    // The container holds its own handle on the node lock from here on
    m_claim->lock.unlock();
    writeLog("DoorSession: released node %d of %s, attaching to %s\n",
        m_node, m_door.name.c_str(), m_containerId.c_str());

    m_state = State::Attached;
    return m_engine.attach(m_containerId, LAUNCH_SCRIPT);
}

int
DoorSession::run(Options const& options)
{
    try {
        lockDoor();
        claimNodeSlot();
        auto const workspace = stageWorkspace();
        startContainer(workspace, options);
        auto const status = attachContainer();

        m_state = State::Done;
        writeLog("DoorSession: %s node %d finished with status %d\n", m_door.name.c_str(), m_node, status);
        return status;

    } catch (std::exception const& ex) {
        writeLog("DoorSession: %s failed in state %s: %s\n", m_door.name.c_str(), toString(m_state), ex.what());
        m_failure = ex.what();
        m_state = State::Failed;
        throw;
    }
}

} /* namespace doorman */
