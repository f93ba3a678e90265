/******************************************************************************\
 * Maintenance.cpp - Run a sysop configure / nightly command for a door
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "doorman_defs.h"

#include "session/Maintenance.hpp"

#include "doorman_error.hpp"
#include "dos/Templates.hpp"
#include "session/Workspace.hpp"
#include "useful/dm_log.h"
#include "useful/dm_wrappers.hpp"

namespace doorman {

char const*
getName(Maintenance::Command command)
{
    switch (command) {
        case Maintenance::Command::Configure: return "configure";
        case Maintenance::Command::Nightly:   return "nightly";
    }
    return "unknown";
}

Maintenance::Maintenance(Engine& engine, std::string rundir, std::string image, Door door, User user, Command command)
    : m_engine{engine}
    , m_rundir{std::move(rundir)}
    , m_image{std::move(image)}
    , m_door{std::move(door)}
    , m_user{std::move(user)}
    , m_command{command}
    , m_state{State::Idle}
    , m_failure{}
    , m_doorLock{}
{}

std::string const&
Maintenance::authorize() const
{
    if (!m_user.is_sysop) {
        throw PermissionDenied{"This command is only for sysops!"};
    }

    auto const& commands = (m_command == Command::Configure)
        ? m_door.options.configure_commands
        : m_door.options.nightly_commands;
    if (!commands) {
        throw NotConfigured{std::string{"No "} + getName(m_command) + " command configured for " + m_door.name + "!"};
    }

    return *commands;
}

void
Maintenance::lockDoor(bool nowait)
{
    m_state = State::DoorLockAttempt;

    auto doorLock = LockFile::open(doorLockPath(m_rundir, m_door.name));
    if (nowait) {
        if (!doorLock.tryLockExclusive()) {
            throw DoorBusy{"Sorry, I couldn't lock the door '" + m_door.name + "' exclusively."};
        }
    } else {
        writeLog("Maintenance: waiting for exclusive lock on %s\n", doorLock.getPath().c_str());
        doorLock.lockExclusive();
    }

    m_doorLock = std::move(doorLock);
}

int
Maintenance::run(bool nowait)
{
    try {
        auto const& commands = authorize();
        m_state = State::Authorized;

        lockDoor(nowait);

        auto const workspace = Workspace::forSysop(m_rundir, m_door.name);
        workspace.reset();

        auto vars = TemplateVars{};
        m_user.addTemplateVars(vars);
        try {
            vars["commands"] = dos::renderString(commands, vars);
        } catch (std::exception const& ex) {
            throw IOError{std::string{"Couldn't generate "} + getName(m_command)
                + " commands for " + m_door.name + ": " + ex.what()};
        }
        workspace.write(BATCH_FILE, vars);
        m_state = State::WorkspaceStaged;

        auto const spec = RunSpec
            { .detach = false
            , .env =
                { { TERM_ENV_VAR, getenvOrDefault(TERM_ENV_VAR, DEFAULT_TERM) }
                }
            , .volumes =
                { { workspace.getPath(), CONTAINER_WORKSPACE_MOUNT }
                , { m_door.options.door_path, CONTAINER_DOOR_MOUNT }
                , { m_doorLock->getPath(), CONTAINER_DOOR_LOCK_MOUNT }
                }
            , .labels =
                { { LABEL_DOOR, m_door.name }
                , { LABEL_COMMAND, getName(m_command) }
                , { LABEL_USER, m_user.username }
                , { LABEL_RUNDIR, workspace.getPath() }
                }
            , .image = m_image
            , .entrypoint = std::string{getName(m_command)} + SYSOP_SCRIPT_SUFFIX
        };

        auto container = m_engine.spawnAttached(spec);
        m_state = State::ContainerRunning;

        // The container keeps the door busy through the mounted door lock
        m_doorLock->unlock();
        writeLog("Maintenance: released %s, waiting for %s\n", m_doorLock->getPath().c_str(), getName(m_command));

        auto const status = container->wait();
        m_state = State::Done;
        return status;

    } catch (std::exception const& ex) {
        writeLog("Maintenance: %s %s failed: %s\n", getName(m_command), m_door.name.c_str(), ex.what());
        m_failure = ex.what();
        m_state = State::Failed;
        throw;
    }
}

} /* namespace doorman */
