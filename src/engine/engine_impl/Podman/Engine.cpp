/******************************************************************************\
 * Engine.cpp - podman specific container engine functions.
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "doorman_defs.h"

#include <boost/property_tree/ptree.hpp>

#include "engine/engine_impl/Podman/Engine.hpp"

#include "useful/dm_execvp.hpp"
#include "useful/dm_json.hpp"
#include "useful/dm_log.h"

namespace doorman {

bool
PodmanEngine::parseRootless(std::string const& infoJson)
{
    auto const root = parse_json(infoJson);
    return root.get<bool>("host.security.rootless");
}

bool
PodmanEngine::detectRootless(std::string const& enginePath)
{
    try {
        auto infoArgv = ManagedArgv{enginePath, "info", "--format=json"};
        auto infoOutput = Execvp{enginePath.c_str(), infoArgv.get(), Execvp::stderr::Ignore};
        auto const infoJson = infoOutput.readAll();

        if (auto const status = infoOutput.getExitStatus()) {
            writeLog("PodmanEngine::detectRootless: %s info exited with %d\n", enginePath.c_str(), status);
            return false;
        }

        return parseRootless(infoJson);

    } catch (std::exception const& ex) {
        writeLog("PodmanEngine::detectRootless: assuming rootful: %s\n", ex.what());
        return false;
    }
}

PodmanEngine::PodmanEngine(std::string enginePath, uid_t uid, gid_t gid, std::string rundir, bool rootless)
    : Engine{std::move(enginePath), uid, gid}
    , m_rundir{std::move(rundir)}
    , m_rootless{rootless}
{}

void
PodmanEngine::addGlobalArgs(OutgoingArgv<ContainerArgv>& argv) const
{
    if (m_rootless) {
        argv.add(ContainerArgv::Root,          m_rundir + "/" + PODMAN_ROOT_DIR);
        argv.add(ContainerArgv::RunRoot,       m_rundir + "/" + PODMAN_RUNROOT_DIR);
        argv.add(ContainerArgv::CgroupManager, "cgroupfs");
    }
}

void
PodmanEngine::addRunSuffixArgs(OutgoingArgv<ContainerArgv>& argv) const
{
    if (m_rootless) {
        argv.add(ContainerArgv::Userns, "keep-id");
        argv.add(ContainerArgv::Passwd, "false");
    }
}

} /* namespace doorman */
