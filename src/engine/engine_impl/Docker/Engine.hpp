// Copyright 2023 Hewlett Packard Enterprise Development LP.

#pragma once

#include "engine/Engine.hpp"

namespace doorman {

class DockerEngine : public Engine
{
public: // static interface
    static char const* getName()          { return "docker"; }
    static char const* getVersionPrefix() { return "DOCKER "; }

public: // engine interface
    EngineType getEngineType() const override { return EngineType::Docker; }

    bool rootlessMode() const override { return false; }

protected:
    void addGlobalArgs(OutgoingArgv<ContainerArgv>&) const override {}
    void addRunSuffixArgs(OutgoingArgv<ContainerArgv>&) const override {}

public: // constructor / destructor interface
    DockerEngine(std::string enginePath, uid_t uid, gid_t gid)
        : Engine{std::move(enginePath), uid, gid}
    {}
    ~DockerEngine() override = default;
};

} /* namespace doorman */
