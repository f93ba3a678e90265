/******************************************************************************\
 * User.cpp - Calling identity and the setuid identity transition
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "doorman_defs.h"

#include <stdlib.h>
#include <string.h>
#include <errno.h>
#include <unistd.h>

#include <algorithm>

#include "user/User.hpp"

#include "doorman_error.hpp"
#include "useful/dm_log.h"
#include "useful/dm_wrappers.hpp"

namespace doorman {

static User fromPasswd(struct passwd const& pwd)
{
    auto const gecos = std::string{(pwd.pw_gecos != nullptr) ? pwd.pw_gecos : ""};
    auto const gecosName = gecos.substr(0, gecos.find(','));

    return User
        { .uid = pwd.pw_uid
        , .username = pwd.pw_name
        , .display_name = gecosName.empty() ? std::string{pwd.pw_name} : gecosName
        , .is_sysop = false
    };
}

User
User::fromUid(uid_t uid)
{
    try {
        auto const [pwd, pwd_buf] = getpwuid(uid);
        return fromPasswd(pwd);
    } catch (std::exception const& ex) {
        throw ConfigurationError{"Couldn't look up user ID " + std::to_string(uid) + ": " + ex.what()};
    }
}

User
User::fromUsername(std::string const& username)
{
    try {
        auto const [pwd, pwd_buf] = getpwnam(username);
        return fromPasswd(pwd);
    } catch (std::exception const& ex) {
        throw ConfigurationError{"Couldn't look up username '" + username + "': " + ex.what()};
    }
}

User
User::calling()
{
    // sudo / doas only pass the original user through when running as root
    if (::getuid() == 0) {
        if (auto const sudoUser = ::getenv(SUDO_USER_ENV_VAR)) {
            writeLog("User::calling: using username '%s' from %s\n", sudoUser, SUDO_USER_ENV_VAR);
            return fromUsername(sudoUser);
        } else if (auto const doasUser = ::getenv(DOAS_USER_ENV_VAR)) {
            writeLog("User::calling: using username '%s' from %s\n", doasUser, DOAS_USER_ENV_VAR);
            return fromUsername(doasUser);
        }
    }

    return fromUid(::getuid());
}

void
User::addTemplateVars(TemplateVars& vars) const
{
    vars["user.uid"] = std::to_string(uid);
    vars["user.username"] = username;
    vars["user.display_name"] = display_name;
    vars["user.is_sysop"] = is_sysop ? "true" : "false";
}

void
Identity::transition()
{
    auto const uid = ::getuid();
    auto const euid = ::geteuid();

    if (euid != uid) {
        if (::setresuid(euid, euid, uid) < 0) {
            throw PermissionDenied{"Couldn't change user ID to " + std::to_string(euid) + ": " + strerror(errno)};
        }

        // environment of the service account, for the container engine
        auto const [pwd, pwd_buf] = getpwuid(euid);
        ::setenv("LOGNAME", pwd.pw_name, 1);
        ::setenv("USER", pwd.pw_name, 1);
        ::setenv("HOME", pwd.pw_dir, 1);
        ::unsetenv("XDG_RUNTIME_DIR");
        ::unsetenv("DBUS_SESSION_BUS_ADDRESS");

        writeLog("Identity::transition: uid %d -> %d\n", uid, euid);
    }

    auto const gid = ::getgid();
    auto const egid = ::getegid();

    if (egid != gid) {
        if (::setresgid(egid, egid, gid) < 0) {
            throw PermissionDenied{"Couldn't change group ID to " + std::to_string(egid) + ": " + strerror(errno)};
        }

        writeLog("Identity::transition: gid %d -> %d\n", gid, egid);
    }
}

Identity::Identity(std::vector<std::string> sysops)
    : Identity{::getuid(), ::getgid(), std::move(sysops)}
{}

Identity::Identity(uid_t uid, gid_t gid, std::vector<std::string> sysops)
    : m_uid{uid}
    , m_gid{gid}
    , m_sysops{std::move(sysops)}
{}

bool
Identity::isSysop(User const& user) const
{
    if (user.uid == m_uid) {
        return true;
    }

    return std::find(m_sysops.begin(), m_sysops.end(), user.username) != m_sysops.end();
}

User
Identity::authorize(User user) const
{
    user.is_sysop = isSysop(user);
    return user;
}

User
Identity::switchUser(User const& current, std::optional<std::string> const& username,
    std::optional<uid_t> uid, std::optional<std::string> const& displayName) const
{
    if (!current.is_sysop) {
        throw PermissionDenied{"Only sysops can switch identities!"};
    }

    auto user = current;

    if (uid && username) {
        user = User
            { .uid = *uid
            , .username = *username
            , .display_name = displayName ? *displayName : *username
            , .is_sysop = false
        };
    } else {
        if (uid) {
            user = User::fromUid(*uid);
        } else if (username) {
            user = User::fromUsername(*username);
        }

        if (displayName) {
            user.display_name = *displayName;
        }
    }

    writeLog("Identity::switchUser: %s -> %s (%d)\n", current.username.c_str(), user.username.c_str(), user.uid);

    return authorize(std::move(user));
}

} /* namespace doorman */
