/******************************************************************************\
 * doorman.cpp - Launch DOS doors in containers for BBS users
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "doorman_defs.h"

#include <stdio.h>
#include <stdlib.h>

#include <iostream>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include "doorman_argv_defs.hpp"
#include "doorman_error.hpp"

#include "config/Config.hpp"
#include "engine/Engine.hpp"
#include "session/DoorSession.hpp"
#include "session/Maintenance.hpp"
#include "status/Who.hpp"
#include "user/User.hpp"

#include "useful/dm_argv.hpp"
#include "useful/dm_log.h"
#include "useful/dm_wrappers.hpp"

using namespace doorman;

/* runtime helpers */

static void
usage(FILE* stream, char const* name)
{
    fprintf(stream, "Usage: %s [OPTIONS] COMMAND [ARGS]...\n", name);
    fprintf(stream, "Launch DOS doors in containers for BBS users\n\n");

    fprintf(stream, "\t-%c, --%s PATH  Configuration file (default $%s, then ~%s)\n",
        DoormanArgv::ConfigPath.val, DoormanArgv::ConfigPath.name, DOORMAN_CONFIG_ENV_VAR, DEFAULT_CONFIG_SUBPATH);
    fprintf(stream, "\t-%c, --%s       Display version and exit\n",
        DoormanArgv::Version.val, DoormanArgv::Version.name);
    fprintf(stream, "\t-%c, --%s          Display this text and exit\n\n",
        DoormanArgv::Help.val, DoormanArgv::Help.name);

    fprintf(stream, "Commands:\n");
    fprintf(stream, "\tlaunch DOOR [-%c USER] [-%c UID] [-%c NAME] [-%c]\n",
        LaunchArgv::Username.val, LaunchArgv::UserId.val, LaunchArgv::DisplayName.val, LaunchArgv::Raw.val);
    fprintf(stream, "\t\tPlay DOOR on the first free node. Sysops may play as another user.\n");
    fprintf(stream, "\tconfigure DOOR [-%c]\n", SysopArgv::NoWait.val);
    fprintf(stream, "\t\tRun the door's configuration program (sysops only)\n");
    fprintf(stream, "\tnightly DOOR [-%c]\n", SysopArgv::NoWait.val);
    fprintf(stream, "\t\tRun the door's nightly maintenance (sysops only)\n");
    fprintf(stream, "\twho [DOOR] [-%c table|json|yaml]\n", WhoArgv::Format.val);
    fprintf(stream, "\t\tShow who is playing what\n\n");

    fprintf(stream, "Set %s=1 to write a debug log to $%s (default %s)\n",
        DOORMAN_DBG_ENV_VAR, DOORMAN_LOG_DIR_ENV_VAR, DEFAULT_LOG_DIR);
}

// Options may appear before or after positional arguments. Calls handleOption
// for each option and returns the positionals.
template <typename ArgvDef, typename Handler>
static std::vector<std::string>
parseCommandArgs(int argc, char* const* argv, Handler&& handleOption)
{
    auto positionals = std::vector<std::string>{};

    while (true) {
        auto incomingArgv = IncomingArgv<ArgvDef>{argc, argv};
        int c; std::string optarg;
        while (true) {
            std::tie(c, optarg) = incomingArgv.get_next();
            if (c < 0) {
                break;
            }
            handleOption(c, optarg);
        }

        if (incomingArgv.get_rest_argc() <= 0) {
            break;
        }

        // getopt skips argv[0], so restart with the positional in its place
        positionals.push_back(incomingArgv.get_rest()[0]);
        argc = incomingArgv.get_rest_argc();
        argv = incomingArgv.get_rest();
    }

    return positionals;
}

static void
badArguments(char const* name, std::string const& message)
{
    fprintf(stderr, "%s: %s\n\n", name, message.c_str());
    usage(stderr, name);
    exit(1);
}

static std::string
requireDoor(char const* name, std::string const& command, std::vector<std::string> const& positionals)
{
    if (positionals.size() != 1) {
        badArguments(name, command + " takes exactly one DOOR argument");
    }
    return positionals[0];
}

static uid_t
parseUid(std::string const& uid)
{
    try {
        size_t end = 0;
        auto const result = std::stoul(uid, &end);
        if (end != uid.length()) {
            throw std::invalid_argument{"trailing characters"};
        }
        return static_cast<uid_t>(result);
    } catch (std::exception const&) {
        throw ConfigurationError{"Invalid user ID '" + uid + "'"};
    }
}

/* commands */

static int
launchCommand(char const* name, int argc, char* const* argv,
    Config const& config, Identity const& identity, User user, Engine& engine)
{
    auto username = std::optional<std::string>{};
    auto uid = std::optional<uid_t>{};
    auto displayName = std::optional<std::string>{};
    auto raw = false;

    auto const positionals = parseCommandArgs<LaunchArgv>(argc, argv, [&](int c, std::string const& optarg) {
        switch (c) {

        case LaunchArgv::Username.val:
            username = optarg;
            break;

        case LaunchArgv::UserId.val:
            uid = parseUid(optarg);
            break;

        case LaunchArgv::DisplayName.val:
            displayName = optarg;
            break;

        case LaunchArgv::Raw.val:
            raw = true;
            break;

        case LaunchArgv::Help.val:
            usage(stdout, name);
            exit(0);

        case '?':
        default:
            badArguments(name, "unknown or incomplete launch option");
        }
    });
    auto const doorName = requireDoor(name, "launch", positionals);
    auto door = config.getDoor(doorName);

    if (username || uid || displayName) {
        user = identity.switchUser(user, username, uid, displayName);
    }

    auto session = DoorSession{engine, config.getRundir(), config.getDosemuImage(), std::move(door), std::move(user)};
    return session.run(DoorSession::Options
        { .raw = raw
        , .term = getenvOrDefault(TERM_ENV_VAR, DEFAULT_TERM)
    });
}

static int
maintenanceCommand(char const* name, Maintenance::Command command, int argc, char* const* argv,
    Config const& config, User user, Engine& engine)
{
    auto nowait = false;

    auto const positionals = parseCommandArgs<SysopArgv>(argc, argv, [&](int c, std::string const& optarg) {
        switch (c) {

        case SysopArgv::NoWait.val:
            nowait = true;
            break;

        case SysopArgv::Help.val:
            usage(stdout, name);
            exit(0);

        case '?':
        default:
            badArguments(name, std::string{"unknown or incomplete "} + getName(command) + " option");
        }
    });
    auto door = config.getDoor(requireDoor(name, getName(command), positionals));

    auto maintenance = Maintenance{engine, config.getRundir(), config.getDosemuImage(),
        std::move(door), std::move(user), command};
    return maintenance.run(nowait);
}

static int
whoCommand(char const* name, int argc, char* const* argv, Engine& engine)
{
    auto format = WhoFormat::Table;

    auto const positionals = parseCommandArgs<WhoArgv>(argc, argv, [&](int c, std::string const& optarg) {
        switch (c) {

        case WhoArgv::Format.val:
            format = parseWhoFormat(optarg);
            break;

        case WhoArgv::Help.val:
            usage(stdout, name);
            exit(0);

        case '?':
        default:
            badArguments(name, "unknown or incomplete who option");
        }
    });

    auto door = std::optional<std::string>{};
    if (positionals.size() > 1) {
        badArguments(name, "who takes at most one DOOR argument");
    } else if (positionals.size() == 1) {
        // containers of doors no longer configured are still listed
        Config::verifyDoorName(positionals[0]);
        door = positionals[0];
    }

    who(engine, door, format, std::cout);
    return 0;
}

// Report a failure the way every command does: one line on stderr, exit code 1
template <typename FuncType>
static int
runSafely(FuncType&& func)
{
    try {
        return std::forward<FuncType>(func)();
    } catch (std::exception const& ex) {
        writeLog("doorman failed: %s\n", ex.what());
        fprintf(stderr, "doorman: %s\n", ex.what());
        return 1;
    }
}

int
main(int argc, char *argv[])
{
    auto configPath = std::optional<std::string>{};

    // global options stop at the command name
    auto incomingArgv = IncomingArgv<DoormanArgv>{argc, argv};
    { int c; std::string optarg;
        while (true) {
            std::tie(c, optarg) = incomingArgv.get_next();
            if (c < 0) {
                break;
            }

            switch (c) {

            case DoormanArgv::ConfigPath.val:
                configPath = optarg;
                break;

            case DoormanArgv::Version.val:
                fprintf(stdout, "doorman %s\n", DOORMAN_VERSION);
                exit(0);

            case DoormanArgv::Help.val:
                usage(stdout, argv[0]);
                exit(0);

            case '?':
            default:
                usage(stderr, argv[0]);
                exit(1);

            }
        }
    }

    auto const commandArgc = incomingArgv.get_rest_argc();
    auto const commandArgv = incomingArgv.get_rest();
    if (commandArgc < 1) {
        usage(stderr, argv[0]);
        exit(1);
    }
    auto const command = std::string{commandArgv[0]};
    if ((command != "launch") && (command != "configure") && (command != "nightly") && (command != "who")) {
        badArguments(argv[0], "unknown command '" + command + "'");
    }

    return runSafely([&]() {
        // the caller must be read before the setuid transition replaces it
        auto const caller = User::calling();
        Identity::transition();

        auto const config = Config::load(configPath);
        auto const identity = Identity{config.getSysops()};
        auto user = identity.authorize(caller);

        writeLog("doorman %s: %s as %s (sysop %d)\n", DOORMAN_VERSION, command.c_str(),
            user.username.c_str(), user.is_sysop);

        auto const engine = make_Engine(config, identity.getUid(), identity.getGid());

        if (command == "launch") {
            return launchCommand(argv[0], commandArgc, commandArgv, config, identity, std::move(user), *engine);
        } else if (command == "configure") {
            return maintenanceCommand(argv[0], Maintenance::Command::Configure, commandArgc, commandArgv,
                config, std::move(user), *engine);
        } else if (command == "nightly") {
            return maintenanceCommand(argv[0], Maintenance::Command::Nightly, commandArgc, commandArgv,
                config, std::move(user), *engine);
        }

        return whoCommand(argv[0], commandArgc, commandArgv, *engine);
    });
}
