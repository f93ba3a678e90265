/******************************************************************************\
 * Workspace.hpp - Per-session directory in the run directory
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <string>

#include "dos/Templates.hpp"

namespace doorman {

/*
** A Workspace is the directory mounted as the DOS working drive of one
** session container: {rundir}/{door}.{node} for play sessions and
** {rundir}/{door}.sysop for maintenance. Only the holder of the matching
** node lock (or the exclusive door lock) may stage it.
*/
class Workspace {
private: // variables
    std::string m_path;

public: // interface
    static Workspace forNode(std::string const& rundir, std::string const& door, int node);
    static Workspace forSysop(std::string const& rundir, std::string const& door);

    // Remove everything a previous session left behind and recreate the
    // directory empty. Throws IOError naming the path.
    void reset() const;

    // Render a built-in DOS file into the workspace. Returns its path.
    std::string write(std::string const& name, TemplateVars const& vars) const;

    std::string const& getPath() const { return m_path; }

public: // constructor / destructor interface
    explicit Workspace(std::string path);
};

} /* namespace doorman */
