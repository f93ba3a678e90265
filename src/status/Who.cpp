/******************************************************************************\
 * Who.cpp - Report who is playing which door
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "doorman_defs.h"

#include <algorithm>
#include <array>
#include <regex>
#include <sstream>

// Boost JSON
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>

#include <yaml-cpp/yaml.h>

#include "status/Who.hpp"

#include "doorman_error.hpp"
#include "useful/dm_log.h"

namespace doorman {

namespace {

const char* const EMPTY_MESSAGE = "Nobody is playing anything right now. How boring.";

const time_t MINUTE = 60;
const time_t HOUR   = 60 * MINUTE;
const time_t DAY    = 24 * HOUR;
const time_t MONTH  = 30 * DAY;
const time_t YEAR   = 365 * DAY;

// Rounded count of unit in seconds, at least 2
std::string plural(time_t seconds, time_t unit, char const* name)
{
    auto const count = std::max<time_t>(2, (seconds + (unit / 2)) / unit);
    return std::to_string(count) + " " + name;
}

// Node number, maintenance command, or ??? for the node column
std::string nodeColumn(SessionRecord const& session)
{
    if (session.node) {
        return std::to_string(*session.node);
    } else if (session.command) {
        return *session.command;
    }
    return "???";
}

} /* anonymous namespace */

WhoFormat
parseWhoFormat(std::string const& format)
{
    if (format == "table") {
        return WhoFormat::Table;
    } else if (format == "json") {
        return WhoFormat::Json;
    } else if (format == "yaml") {
        return WhoFormat::Yaml;
    }

    throw ConfigurationError{"Unknown output format '" + format + "' (expected table, json or yaml)"};
}

std::vector<SessionRecord>
querySessions(Engine& engine, std::optional<std::string> const& door)
{
    auto const listing = engine.listContainers(door);

    auto sessions = std::vector<SessionRecord>{};
    try {
        sessions = ps::parse_listing(listing);
    } catch (std::exception const& ex) {
        throw IOError{std::string{"Couldn't read container listing: "} + ex.what()};
    }
    ps::sort_sessions(sessions);

    writeLog("querySessions: %zu sessions\n", sessions.size());

    return sessions;
}

std::string
humanizeDuration(time_t seconds)
{
    if (seconds < 45) {
        return "now";
    } else if (seconds < 90) {
        return "a minute";
    } else if (seconds < 45 * MINUTE) {
        return plural(seconds, MINUTE, "minutes");
    } else if (seconds < 90 * MINUTE) {
        return "an hour";
    } else if (seconds < 22 * HOUR) {
        return plural(seconds, HOUR, "hours");
    } else if (seconds < 36 * HOUR) {
        return "a day";
    } else if (seconds < 26 * DAY) {
        return plural(seconds, DAY, "days");
    } else if (seconds < 45 * DAY) {
        return "a month";
    } else if (seconds < 320 * DAY) {
        return plural(seconds, MONTH, "months");
    } else if (seconds < 548 * DAY) {
        return "a year";
    }
    return plural(seconds, YEAR, "years");
}

void
writeSessionsJson(std::ostream& output, std::vector<SessionRecord> const& sessions)
{
    // property_tree writes an empty tree as "", not as an array
    if (sessions.empty()) {
        output << "[]" << std::endl;
        return;
    }

    auto root = pt::ptree{};
    for (auto&& session : sessions) {
        auto entry = pt::ptree{};
        entry.put("container_id", session.container_id);
        entry.put("user", session.user);
        entry.put("door", session.door);
        if (session.node) {
            entry.put("node", *session.node);
        }
        if (session.command) {
            entry.put("command", *session.command);
        }
        entry.put("since", static_cast<int64_t>(session.since));
        root.push_back(std::make_pair("", entry));
    }

    auto json = std::stringstream{};
    pt::write_json(json, root);

    // property_tree only writes strings, unquote the numeric fields.
    // escaped quotes inside values never match the line start
    static auto const numericField = std::regex{R"re(^(\s*"(?:node|since)": )"(-?[0-9]+)"(,?)$)re"};
    auto line = std::string{};
    while (std::getline(json, line)) {
        output << std::regex_replace(line, numericField, "$1$2$3") << '\n';
    }
    output.flush();
}

void
writeSessionsYaml(std::ostream& output, std::vector<SessionRecord> const& sessions)
{
    // hex container IDs and names like "no" must stay strings
    auto yaml = YAML::Emitter{};

    yaml << YAML::BeginSeq;
    for (auto&& session : sessions) {
        yaml << YAML::BeginMap;
        yaml << YAML::Key << "container_id" << YAML::Value << YAML::DoubleQuoted << session.container_id;
        yaml << YAML::Key << "user" << YAML::Value << YAML::DoubleQuoted << session.user;
        yaml << YAML::Key << "door" << YAML::Value << YAML::DoubleQuoted << session.door;
        if (session.node) {
            yaml << YAML::Key << "node" << YAML::Value << *session.node;
        }
        if (session.command) {
            yaml << YAML::Key << "command" << YAML::Value << YAML::DoubleQuoted << *session.command;
        }
        yaml << YAML::Key << "since" << YAML::Value << static_cast<long long>(session.since);
        yaml << YAML::EndMap;
    }
    yaml << YAML::EndSeq;

    if (!yaml.good()) {
        throw IOError{"Couldn't write YAML: " + yaml.GetLastError()};
    }

    output << yaml.c_str() << std::endl;
}

size_t
displayWidth(std::string const& str)
{
    // count every byte that is not a UTF-8 continuation byte
    return static_cast<size_t>(std::count_if(str.begin(), str.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

void
writeSessionsTable(std::ostream& output, std::vector<SessionRecord> const& sessions, time_t now)
{
    if (sessions.empty()) {
        output << EMPTY_MESSAGE << std::endl;
        return;
    }

    using Row = std::array<std::string, 4>;

    auto rows = std::vector<Row>{};
    rows.push_back(Row{"User", "Door", "Node", "Duration"});
    for (auto&& session : sessions) {
        rows.push_back(Row
            { session.user
            , session.door
            , nodeColumn(session)
            , humanizeDuration(now - session.since)
        });
    }

    auto widths = std::array<size_t, 4>{};
    for (auto&& row : rows) {
        for (size_t i = 0; i < row.size(); i++) {
            widths[i] = std::max(widths[i], displayWidth(row[i]));
        }
    }

    auto writeRow = [&](Row const& row) {
        for (size_t i = 0; i < row.size(); i++) {
            if (i + 1 < row.size()) {
                output << row[i] << std::string(widths[i] - displayWidth(row[i]), ' ') << "  ";
            } else {
                output << row[i];
            }
        }
        output << '\n';
    };

    writeRow(rows[0]);
    writeRow(Row
        { std::string(widths[0], '-')
        , std::string(widths[1], '-')
        , std::string(widths[2], '-')
        , std::string(widths[3], '-')
    });
    for (size_t i = 1; i < rows.size(); i++) {
        writeRow(rows[i]);
    }
    output.flush();
}

void
who(Engine& engine, std::optional<std::string> const& door, WhoFormat format, std::ostream& output)
{
    auto const sessions = querySessions(engine, door);

    switch (format) {
        case WhoFormat::Json:
            writeSessionsJson(output, sessions);
            break;
        case WhoFormat::Yaml:
            writeSessionsYaml(output, sessions);
            break;
        case WhoFormat::Table:
            writeSessionsTable(output, sessions, ::time(nullptr));
            break;
    }
}

} /* namespace doorman */
