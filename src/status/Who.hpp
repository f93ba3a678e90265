/******************************************************************************\
 * Who.hpp - Report who is playing which door
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <time.h>

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "engine/Engine.hpp"
#include "status/PsAPI.hpp"

namespace doorman {

enum class WhoFormat
    { Table
    , Json
    , Yaml
};

// "table", "json", "yaml". Throws ConfigurationError for anything else.
WhoFormat parseWhoFormat(std::string const& format);

// List the running sessions, optionally for a single door, sorted by door then node
std::vector<SessionRecord> querySessions(Engine& engine, std::optional<std::string> const& door);

// "now", "a minute", "5 minutes", ..., "3 years"
std::string humanizeDuration(time_t seconds);

// Array of session objects. node and since are JSON numbers
void writeSessionsJson(std::ostream& output, std::vector<SessionRecord> const& sessions);

// Sequence of session mappings with the same keys as the JSON output
void writeSessionsYaml(std::ostream& output, std::vector<SessionRecord> const& sessions);

// Terminal columns taken by a UTF-8 string, one per code point
size_t displayWidth(std::string const& str);

// User / Door / Node / Duration table, or the empty-state message
void writeSessionsTable(std::ostream& output, std::vector<SessionRecord> const& sessions, time_t now);

// Query and print in the given format
void who(Engine& engine, std::optional<std::string> const& door, WhoFormat format, std::ostream& output);

} /* namespace doorman */
