/******************************************************************************\
 * Workspace.cpp - Per-session directory in the run directory
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "doorman_defs.h"

#include <filesystem>
#include <system_error>

#include "session/Workspace.hpp"

#include "doorman_error.hpp"
#include "useful/dm_log.h"

namespace fs = std::filesystem;

namespace doorman {

Workspace
Workspace::forNode(std::string const& rundir, std::string const& door, int node)
{
    return Workspace{rundir + "/" + door + "." + std::to_string(node)};
}

Workspace
Workspace::forSysop(std::string const& rundir, std::string const& door)
{
    return Workspace{rundir + "/" + door + "." + SYSOP_WORKSPACE_NAME};
}

Workspace::Workspace(std::string path)
    : m_path{std::move(path)}
{}

void
Workspace::reset() const
{
    auto ec = std::error_code{};

    auto const removed = fs::remove_all(m_path, ec);
    if (ec) {
        throw IOError{"Couldn't remove workspace " + m_path + ": " + ec.message()};
    }

    fs::create_directories(m_path, ec);
    if (ec) {
        throw IOError{"Couldn't create workspace " + m_path + ": " + ec.message()};
    }

    writeLog("Workspace::reset: %s (removed %ju entries)\n", m_path.c_str(), static_cast<uintmax_t>(removed));
}

std::string
Workspace::write(std::string const& name, TemplateVars const& vars) const
{
    try {
        return dos::writeDos(name, m_path, vars);
    } catch (IOError const&) {
        throw;
    } catch (std::exception const& ex) {
        throw IOError{"Couldn't write " + name + " in workspace " + m_path + ": " + ex.what()};
    }
}

} /* namespace doorman */
