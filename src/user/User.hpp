/******************************************************************************\
 * User.hpp - Calling identity and the setuid identity transition
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include "dos/Templates.hpp"

namespace doorman {

struct User {
    uid_t       uid;
    std::string username;
    std::string display_name;
    bool        is_sysop;

    // passwd lookups. Throw ConfigurationError if the user doesn't exist.
    static User fromUid(uid_t uid);
    static User fromUsername(std::string const& username);

    // The real user that invoked doorman. Call before Identity::transition.
    static User calling();

    // user.* template variables
    void addTemplateVars(TemplateVars& vars) const;
};

/*
** Identity of the doorman process itself: the account that owns the run
** directory and runs the container engine. When doorman is installed setuid,
** the transition commits the whole process (and its children) to that account.
*/
class Identity {
private: // variables
    uid_t m_uid;
    gid_t m_gid;
    std::vector<std::string> m_sysops;

public: // interface
    // One-shot transition from the invoking identity to the service account.
    // Must run before any path in the run directory is touched.
    static void transition();

    uid_t getUid() const { return m_uid; }
    gid_t getGid() const { return m_gid; }

    // Decide sysop status: the service account itself, or a listed username
    bool isSysop(User const& user) const;

    // Mark the user with its sysop status
    User authorize(User user) const;

    // Sysop-only: replace `current` with another identity. With both uid and
    // username the user is synthesized without a passwd lookup.
    User switchUser(User const& current, std::optional<std::string> const& username,
        std::optional<uid_t> uid, std::optional<std::string> const& displayName) const;

public: // constructor / destructor interface
    // current real uid/gid of the process
    explicit Identity(std::vector<std::string> sysops);
    Identity(uid_t uid, gid_t gid, std::vector<std::string> sysops);
};

} /* namespace doorman */
