/******************************************************************************\
 * doorman_argv_defs.hpp - Command line argument definitions for doorman and
 *                         the container engines it drives.
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include "useful/dm_argv.hpp"

/* doorman command line */

struct DoormanArgv : public doorman::Argv {
    using Option    = doorman::Argv::Option;
    using Parameter = doorman::Argv::Parameter;

    static constexpr Option Help    { "help",    'h' };
    static constexpr Option Version { "version", 'V' };

    static constexpr Parameter ConfigPath { "config", 'c' };

    static constexpr GNUOption long_options[] = {
        Help,
        Version,
        ConfigPath,
        long_options_done
    };
};

struct LaunchArgv : public doorman::Argv {
    using Option    = doorman::Argv::Option;
    using Parameter = doorman::Argv::Parameter;

    static constexpr Option Help { "help", 'h' };
    static constexpr Option Raw  { "raw",  'r' };

    static constexpr Parameter Username    { "user", 'u' };
    static constexpr Parameter UserId      { "uid",  'i' };
    static constexpr Parameter DisplayName { "name", 'n' };

    static constexpr GNUOption long_options[] = {
        Help,
        Raw,
        Username,
        UserId,
        DisplayName,
        long_options_done
    };
};

struct SysopArgv : public doorman::Argv {
    using Option    = doorman::Argv::Option;
    using Parameter = doorman::Argv::Parameter;

    static constexpr Option Help   { "help",   'h' };
    static constexpr Option NoWait { "nowait", 'n' };

    static constexpr GNUOption long_options[] = {
        Help,
        NoWait,
        long_options_done
    };
};

struct WhoArgv : public doorman::Argv {
    using Option    = doorman::Argv::Option;
    using Parameter = doorman::Argv::Parameter;

    static constexpr Option Help { "help", 'h' };

    static constexpr Parameter Format { "format", 'f' };

    static constexpr GNUOption long_options[] = {
        Help,
        Format,
        long_options_done
    };
};

/* podman / docker command line */

struct ContainerArgv : public doorman::Argv {
    using Option    = doorman::Argv::Option;
    using Parameter = doorman::Argv::Parameter;

    static constexpr Option Detach      { nullptr,   'd' };
    static constexpr Option Tty         { nullptr,   't' };
    static constexpr Option Interactive { nullptr,   'i' };
    static constexpr Option Version     { "version", 1 };

    static constexpr Parameter Volume { nullptr, 'v' };
    static constexpr Parameter Env    { nullptr, 'e' };
    static constexpr Parameter Label  { nullptr, 'l' };

    static constexpr Parameter User          { "user",           2 };
    static constexpr Parameter Tmpfs         { "tmpfs",          3 };
    static constexpr Parameter Userns        { "userns",         4 };
    static constexpr Parameter Passwd        { "passwd",         5 };
    static constexpr Parameter Root          { "root",           6 };
    static constexpr Parameter RunRoot       { "runroot",        7 };
    static constexpr Parameter CgroupManager { "cgroup-manager", 8 };
    static constexpr Parameter Format        { "format",         9 };
    static constexpr Parameter Filter        { "filter",         10 };

    static constexpr GNUOption long_options[] = {
        Detach,
        Tty,
        Interactive,
        Version,
        Volume,
        Env,
        Label,
        User,
        Tmpfs,
        Userns,
        Passwd,
        Root,
        RunRoot,
        CgroupManager,
        Format,
        Filter,
        long_options_done
    };
};
