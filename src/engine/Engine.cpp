/******************************************************************************\
 * Engine.cpp - container engine detection and common base class
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "doorman_defs.h"

#include <algorithm>
#include <stdexcept>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>

#include "engine/Engine.hpp"
#include "engine/engine_impl/Engine_impl.hpp"

#include "config/Config.hpp"
#include "doorman_error.hpp"
#include "useful/dm_execvp.hpp"
#include "useful/dm_log.h"
#include "useful/dm_wrappers.hpp"

namespace doorman {

namespace {

// Container attached to the caller's terminal
class SpawnedContainer : public Child {
private:
    ManagedArgv m_argv;
    Spawn       m_spawn;

public:
    SpawnedContainer(std::string const& enginePath, ManagedArgv&& argv)
        : m_argv{std::move(argv)}
        , m_spawn{enginePath.c_str(), m_argv.get()}
    {}

    int wait() override { return m_spawn.wait(); }
};

// Search PATH for podman, then docker
std::string locateEngine()
{
    for (auto&& name : { PodmanEngine::getName(), DockerEngine::getName() }) {
        try {
            return findPath(name);
        } catch (std::exception const& ex) {
            writeLog("locateEngine: %s\n", ex.what());
        }
    }

    throw ConfigurationError{std::string{"Couldn't find "} + PodmanEngine::getName()
        + " or " + DockerEngine::getName() + " in PATH"};
}

} /* anonymous namespace */

EngineType
detectEngineType(std::string const& enginePath)
{
    auto versionLine = std::string{};

    try {
        auto versionArgv = ManagedArgv{enginePath, "--version"};
        auto versionOutput = Execvp{enginePath.c_str(), versionArgv.get(), Execvp::stderr::Ignore};

        std::getline(versionOutput.stream(), versionLine);

        if (auto const status = versionOutput.getExitStatus()) {
            writeLog("detectEngineType: %s --version exited with %d\n", enginePath.c_str(), status);
        }
    } catch (std::exception const& ex) {
        throw UnknownEngine{"Couldn't run " + enginePath + ": " + ex.what()};
    }

    auto const upperVersion = boost::algorithm::to_upper_copy(versionLine);
    writeLog("detectEngineType: %s: %s\n", enginePath.c_str(), versionLine.c_str());

    if (boost::algorithm::starts_with(upperVersion, PodmanEngine::getVersionPrefix())) {
        return EngineType::Podman;
    } else if (boost::algorithm::starts_with(upperVersion, DockerEngine::getVersionPrefix())) {
        return EngineType::Docker;
    }

    throw UnknownEngine{"Couldn't identify container engine " + enginePath
        + " from version '" + versionLine + "'"};
}

std::unique_ptr<Engine>
make_Engine(Config const& config, uid_t uid, gid_t gid)
{
    auto const enginePath = config.getEnginePath()
        ? *config.getEnginePath()
        : locateEngine();

    switch (detectEngineType(enginePath)) {

    case EngineType::Podman:
    {
        auto const rootless = config.getRootlessPodman()
            ? *config.getRootlessPodman()
            : PodmanEngine::detectRootless(enginePath);
        writeLog("make_Engine: podman at %s, rootless %d\n", enginePath.c_str(), rootless);
        return std::make_unique<PodmanEngine>(enginePath, uid, gid, config.getRundir(), rootless);
    }

    case EngineType::Docker:
        if (config.getRootlessPodman().value_or(false)) {
            writeLog("make_Engine: ignoring rootless_podman for docker at %s\n", enginePath.c_str());
        }
        writeLog("make_Engine: docker at %s\n", enginePath.c_str());
        return std::make_unique<DockerEngine>(enginePath, uid, gid);

    }

    throw UnknownEngine{"Unsupported container engine " + enginePath};
}

Engine::Engine(std::string enginePath, uid_t uid, gid_t gid)
    : m_enginePath{std::move(enginePath)}
    , m_uid{uid}
    , m_gid{gid}
{}

ManagedArgv
Engine::buildCommand(std::string const& subcommand) const
{
    auto argv = OutgoingArgv<ContainerArgv>{m_enginePath};
    addGlobalArgs(argv);
    argv.add(ContainerArgv::Argument(subcommand));

    return argv.eject();
}

ManagedArgv
Engine::buildRunArgs(RunSpec const& spec) const
{
    auto argv = OutgoingArgv<ContainerArgv>{m_enginePath};
    addGlobalArgs(argv);
    argv.add(ContainerArgv::Argument("run"));

    if (spec.detach) {
        argv.add(ContainerArgv::Detach);
    } else {
        argv.add(ContainerArgv::Tty);
        argv.add(ContainerArgv::Interactive);
    }

    // fixed prefix
    argv.add(ContainerArgv::User, std::to_string(m_uid) + ":" + std::to_string(m_gid));
    for (auto&& tmpfs : CONTAINER_TMPFS_MOUNTS) {
        argv.add(ContainerArgv::Tmpfs, tmpfs);
    }

    for (auto&& [hostPath, containerPath] : spec.volumes) {
        argv.add(ContainerArgv::Volume, hostPath + ":" + containerPath);
    }
    for (auto&& [key, value] : spec.env) {
        argv.add(ContainerArgv::Env, key + "=" + value);
    }
    for (auto&& [key, value] : spec.labels) {
        argv.add(ContainerArgv::Label, key + "=" + value);
    }

    addRunSuffixArgs(argv);

    argv.add(ContainerArgv::Argument(spec.image));
    argv.add(ContainerArgv::Argument(spec.entrypoint));

    return argv.eject();
}

ManagedArgv
Engine::buildExecArgs(std::string const& containerId, std::string const& command) const
{
    auto argv = OutgoingArgv<ContainerArgv>{m_enginePath};
    addGlobalArgs(argv);
    argv.add(ContainerArgv::Argument("exec"));
    argv.add(ContainerArgv::Tty);
    argv.add(ContainerArgv::Interactive);
    argv.add(ContainerArgv::Argument(containerId));
    argv.add(ContainerArgv::Argument(command));

    return argv.eject();
}

ManagedArgv
Engine::buildPsArgs(std::optional<std::string> const& door) const
{
    auto argv = OutgoingArgv<ContainerArgv>{m_enginePath};
    addGlobalArgs(argv);
    argv.add(ContainerArgv::Argument("ps"));
    argv.add(ContainerArgv::Format, "json");

    auto filter = std::string{"label="} + LABEL_DOOR;
    if (door) {
        filter += "=" + *door;
    }
    argv.add(ContainerArgv::Filter, filter);

    return argv.eject();
}

std::string
Engine::startDetached(RunSpec const& spec)
{
    auto runArgv = buildRunArgs(spec);
    writeLog("Engine::startDetached: %s\n", runArgv.string().c_str());

    auto runOutput = Execvp{m_enginePath.c_str(), runArgv.get(), Execvp::stderr::Inherit};
    auto containerId = runOutput.readAll();
    boost::algorithm::trim(containerId);

    if (auto const status = runOutput.getExitStatus()) {
        throw LaunchFailed{"Container failed to start: " + m_enginePath
            + " exited with status " + std::to_string(status)};
    }
    if (containerId.empty()) {
        throw LaunchFailed{"Container failed to start: " + m_enginePath
            + " did not report a container ID"};
    }

    writeLog("Engine::startDetached: started container %s\n", containerId.c_str());

    return containerId;
}

std::unique_ptr<Child>
Engine::spawnAttached(RunSpec const& spec)
{
    auto runArgv = buildRunArgs(spec);
    writeLog("Engine::spawnAttached: %s\n", runArgv.string().c_str());

    return std::make_unique<SpawnedContainer>(m_enginePath, std::move(runArgv));
}

int
Engine::attach(std::string const& containerId, std::string const& command)
{
    auto execArgv = buildExecArgs(containerId, command);
    writeLog("Engine::attach: %s\n", execArgv.string().c_str());

    auto execChild = Spawn{m_enginePath.c_str(), execArgv.get()};
    return execChild.wait();
}

std::string
Engine::listContainers(std::optional<std::string> const& door)
{
    auto psArgv = buildPsArgs(door);
    writeLog("Engine::listContainers: %s\n", psArgv.string().c_str());

    auto psOutput = Execvp{m_enginePath.c_str(), psArgv.get(), Execvp::stderr::Inherit};
    auto listing = psOutput.readAll();

    if (auto const status = psOutput.getExitStatus()) {
        throw IOError{"Couldn't list containers: " + m_enginePath
            + " ps exited with status " + std::to_string(status)};
    }

    return listing;
}

} /* namespace doorman */
