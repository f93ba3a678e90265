/******************************************************************************\
 * Config.hpp - doorman configuration file
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace doorman {

struct DoorOptions {
    // Path to door files; mounted as the door drive in DOSEMU
    std::string door_path;
    // Number of concurrent players
    int max_nodes;
    // DOS commands to launch the door
    std::string launch_commands;
    // DOS commands for the door's configuration program / nightly maintenance
    std::optional<std::string> configure_commands;
    std::optional<std::string> nightly_commands;
};

struct Door {
    std::string name;
    DoorOptions options;
};

class Config {
private: // variables
    std::string m_datadir;
    std::string m_rundir;
    std::vector<std::string> m_sysops;
    std::optional<std::string> m_engine_path;
    std::optional<bool> m_rootless_podman;
    std::string m_dosemu_image;
    std::map<std::string, DoorOptions> m_doors;

public: // interface
    // Load from --config, DOORMAN_CONFIG, or the default location, and create
    // the data / run directories. Throws ConfigurationError.
    static Config load(std::optional<std::string> const& configPath);

    // Parse JSON configuration text. Directories are not created.
    static Config parse(std::istream& input, std::string const& source);

    // Default path when neither --config nor DOORMAN_CONFIG is set
    static std::string defaultPath();

    // Door names become run directory file names: not empty, no leading '.', no '/'.
    // Throws ConfigurationError.
    static void verifyDoorName(std::string const& name);

    // Look up a door by name. Throws ConfigurationError for unknown doors.
    Door getDoor(std::string const& name) const;

    std::string const& getDatadir() const { return m_datadir; }
    std::string const& getRundir() const { return m_rundir; }
    std::vector<std::string> const& getSysops() const { return m_sysops; }
    std::optional<std::string> const& getEnginePath() const { return m_engine_path; }
    std::optional<bool> const& getRootlessPodman() const { return m_rootless_podman; }
    std::string const& getDosemuImage() const { return m_dosemu_image; }
    std::map<std::string, DoorOptions> const& getDoors() const { return m_doors; }

    // Create the data and run directories if missing. Throws IOError.
    void createDirectories() const;
};

} /* namespace doorman */
