// Copyright 2023 Hewlett Packard Enterprise Development LP.

#pragma once

#include <string>

#include "engine/Engine.hpp"

namespace doorman {

class PodmanEngine : public Engine
{
private: // variables
    std::string m_rundir;
    bool        m_rootless;

public: // static interface
    static char const* getName()          { return "podman"; }
    static char const* getVersionPrefix() { return "PODMAN "; }

    // Run ENGINE info --format=json and read host.security.rootless.
    // Any failure to run or parse is reported as not rootless.
    static bool detectRootless(std::string const& enginePath);

    // Read host.security.rootless from info output. Throws on malformed input.
    static bool parseRootless(std::string const& infoJson);

public: // engine interface
    EngineType getEngineType() const override { return EngineType::Podman; }

    bool rootlessMode() const override { return m_rootless; }

protected:
    // rootless: --root=RUNDIR/podman --runroot=RUNDIR/podman-run --cgroup-manager=cgroupfs
    void addGlobalArgs(OutgoingArgv<ContainerArgv>& argv) const override;

    // rootless: --userns=keep-id --passwd=false
    void addRunSuffixArgs(OutgoingArgv<ContainerArgv>& argv) const override;

public: // constructor / destructor interface
    PodmanEngine(std::string enginePath, uid_t uid, gid_t gid, std::string rundir, bool rootless);
    ~PodmanEngine() override = default;
};

} /* namespace doorman */
