/******************************************************************************\
 * Config.cpp - doorman configuration file
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "doorman_defs.h"

#include <filesystem>
#include <fstream>

// Boost JSON
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>

#include "config/Config.hpp"

#include "doorman_error.hpp"
#include "useful/dm_log.h"
#include "useful/dm_wrappers.hpp"

namespace pt = boost::property_tree;

namespace doorman {

void
Config::verifyDoorName(std::string const& name)
{
    if (name.empty() || (name[0] == '.') || (name.find('/') != std::string::npos)) {
        throw ConfigurationError{"Invalid door name '" + name + "'"};
    }
}

// optional key whose value, when present, must convert to T
template <typename T>
static std::optional<T> getChecked(pt::ptree const& tree, std::string const& key)
{
    if (auto const child = tree.get_child_optional(key)) {
        return child->get_value<T>();
    }
    return std::nullopt;
}

static DoorOptions parseDoor(std::string const& name, pt::ptree const& door)
{
    auto result = DoorOptions
        { .door_path = door.get<std::string>("door_path")
        , .max_nodes = getChecked<int>(door, "max_nodes").value_or(DEFAULT_MAX_NODES)
        , .launch_commands = door.get<std::string>("launch_commands")
        , .configure_commands = {}
        , .nightly_commands = {}
    };

    if (auto const configure = door.get_optional<std::string>("configure_commands")) {
        result.configure_commands = *configure;
    }
    if (auto const nightly = door.get_optional<std::string>("nightly_commands")) {
        result.nightly_commands = *nightly;
    }

    if ((result.max_nodes < 1) || (result.max_nodes > MAX_MAX_NODES)) {
        throw ConfigurationError{"Door '" + name + "': max_nodes must be between 1 and "
            + std::to_string(MAX_MAX_NODES) + ", got " + std::to_string(result.max_nodes)};
    }

    if (result.door_path.empty()) {
        throw ConfigurationError{"Door '" + name + "': door_path is empty"};
    }

    return result;
}

std::string
Config::defaultPath()
{
    return std::string{getenvOrDefault("HOME", "")} + DEFAULT_CONFIG_SUBPATH;
}

Config
Config::parse(std::istream& input, std::string const& source)
{
    auto root = pt::ptree{};
    try {
        pt::read_json(input, root);
    } catch (pt::json_parser::json_parser_error const& parse_ex) {
        throw ConfigurationError{"Couldn't parse config file " + source + ": " + parse_ex.what()};
    }

    auto result = Config{};

    try {
        // doorman section
        if (auto const datadir = root.get_optional<std::string>("doorman.datadir")) {
            result.m_datadir = *datadir;
        } else {
            result.m_datadir = std::string{getenvOrDefault("HOME", "")} + DEFAULT_DATA_SUBPATH;
        }

        if (auto const rundir = root.get_optional<std::string>("doorman.rundir")) {
            result.m_rundir = *rundir;
        } else if (auto const runtimeDir = ::getenv("XDG_RUNTIME_DIR")) {
            result.m_rundir = std::string{runtimeDir} + "/doorman";
        } else {
            result.m_rundir = result.m_datadir + "/run";
        }

        if (auto const sysops = root.get_child_optional("doorman.sysops")) {
            for (auto&& [key, sysop] : *sysops) {
                result.m_sysops.push_back(sysop.get_value<std::string>());
            }
        }

        // container section
        if (auto const enginePath = root.get_optional<std::string>("container.engine_path")) {
            result.m_engine_path = *enginePath;
        }
        if (auto const rootless = getChecked<bool>(root, "container.rootless_podman")) {
            result.m_rootless_podman = *rootless;
        }
        result.m_dosemu_image = root.get<std::string>("container.dosemu_image", DEFAULT_DOSEMU_IMAGE);

        // door definitions
        if (auto const doors = root.get_child_optional("doors")) {
            for (auto&& [name, door] : *doors) {
                verifyDoorName(name);
                result.m_doors.emplace(name, parseDoor(name, door));
            }
        }

    } catch (pt::ptree_error const& ex) {
        throw ConfigurationError{"Couldn't parse config file " + source + ": " + ex.what()};
    }

    writeLog("Config::parse: %s: rundir %s, %zu doors\n", source.c_str(), result.m_rundir.c_str(), result.m_doors.size());

    return result;
}

Config
Config::load(std::optional<std::string> const& configPath)
{
    auto const path = configPath
        ? *configPath
        : std::string{getenvOrDefault(DOORMAN_CONFIG_ENV_VAR, defaultPath().c_str())};

    auto configFile = std::ifstream{path};
    if (!configFile) {
        throw ConfigurationError{"Couldn't open config file: " + path};
    }

    auto result = parse(configFile, path);
    result.createDirectories();

    return result;
}

void
Config::createDirectories() const
{
    for (auto&& dir : { m_datadir, m_rundir }) {
        auto ec = std::error_code{};
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            throw IOError{"Couldn't create directory " + dir + ": " + ec.message()};
        }
    }
}

Door
Config::getDoor(std::string const& name) const
{
    auto const door = m_doors.find(name);
    if (door == m_doors.end()) {
        throw ConfigurationError{"Unknown door '" + name + "'"};
    }

    return Door{name, door->second};
}

} /* namespace doorman */
