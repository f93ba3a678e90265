/******************************************************************************\
 * Engine.hpp - define container engine interface and common base class
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <sys/types.h>

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "doorman_argv_defs.hpp"
#include "useful/dm_argv.hpp"

namespace doorman {

class Config;

enum class EngineType
    { Podman
    , Docker
};

// Insertion-ordered KEY / VALUE pairs for volumes, environment and labels
using KeyValueList = std::vector<std::pair<std::string, std::string>>;

// Everything needed to start one session container
struct RunSpec {
    // -d, or -t -i attached to the caller's terminal
    bool         detach;
    KeyValueList env;
    // host path -> container path
    KeyValueList volumes;
    KeyValueList labels;
    std::string  image;
    std::string  entrypoint;
};

// A container process running attached to the caller's terminal
class Child {
public:
    // Block until the container exits and return its exit status
    virtual int wait() = 0;

    virtual ~Child() = default;
};

/*
** The Engine object defines the container runtime interface used by the
** session and maintenance orchestrators. It is an abstract base class; the
** podman and docker variants supply the flags that differ between them.
** Argument building is shared in the base. The process boundary methods are
** virtual so that tests can replace the container runtime.
*/
class Engine {
public: // impl.-specific interface that derived type must implement

    // Engine implementations must implement the following static functions:

    // static char const* getName()
    //   return the binary name probed for on PATH

    // static char const* getVersionPrefix()
    //   return the upper-cased prefix of the first line of ENGINE --version


    // engine type
    virtual EngineType getEngineType() const = 0;

    // true if run invocations need the rootless namespace flags
    virtual bool rootlessMode() const = 0;

protected:
    // flags placed between the engine binary and the subcommand
    virtual void addGlobalArgs(OutgoingArgv<ContainerArgv>& argv) const = 0;

    // flags placed after the labels of a run invocation
    virtual void addRunSuffixArgs(OutgoingArgv<ContainerArgv>& argv) const = 0;

protected: // variables
    std::string m_enginePath;
    uid_t       m_uid;
    gid_t       m_gid;

public: // argument building
    std::string const& getEnginePath() const { return m_enginePath; }

    // ENGINE [global flags] SUBCOMMAND
    ManagedArgv buildCommand(std::string const& subcommand) const;

    // ENGINE [global] run (-d | -t -i) --user=U:G --tmpfs=... -v.. -e.. -l.. [suffix] IMAGE ENTRYPOINT
    ManagedArgv buildRunArgs(RunSpec const& spec) const;

    // ENGINE [global] exec -t -i CONTAINER_ID COMMAND
    ManagedArgv buildExecArgs(std::string const& containerId, std::string const& command) const;

    // ENGINE [global] ps --format=json --filter=label=doorman.door[=DOOR]
    ManagedArgv buildPsArgs(std::optional<std::string> const& door) const;

public: // process boundary
    // Start a detached container and return its ID once the entrypoint has
    // signalled readiness. Throws LaunchFailed.
    virtual std::string startDetached(RunSpec const& spec);

    // Start a container attached to the caller's terminal
    virtual std::unique_ptr<Child> spawnAttached(RunSpec const& spec);

    // Run command inside a running container attached to the caller's
    // terminal and return its exit status
    virtual int attach(std::string const& containerId, std::string const& command);

    // Return the engine's JSON listing of doorman containers. Throws IOError.
    virtual std::string listContainers(std::optional<std::string> const& door);

public: // constructor / destructor interface
    Engine(std::string enginePath, uid_t uid, gid_t gid);
    virtual ~Engine() = default;
    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;
    Engine(Engine&&) = delete;
    Engine& operator=(Engine&&) = delete;
};

// Classify the binary at enginePath by its --version output. Throws UnknownEngine.
EngineType detectEngineType(std::string const& enginePath);

// Select the engine once at startup: the configured engine path, else podman
// then docker on PATH. Throws ConfigurationError / UnknownEngine.
std::unique_ptr<Engine> make_Engine(Config const& config, uid_t uid, gid_t gid);

} /* namespace doorman */
