/******************************************************************************\
 * PsAPI.hpp - Container engine ps listing parsing functions
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include "doorman_defs.h"

#include <time.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// Boost JSON
#include <boost/property_tree/ptree.hpp>
#include <boost/algorithm/string/trim.hpp>

#include "useful/dm_json.hpp"
#include "useful/dm_log.h"

namespace doorman {

// One running session container, rebuilt from its labels
struct SessionRecord {
    std::string                container_id;
    std::string                user;
    std::string                door;
    std::optional<int>         node;      // play sessions
    std::optional<std::string> command;   // maintenance sessions
    std::optional<std::string> rundir;
    time_t                     since;
};

namespace ps
{

using Labels = std::map<std::string, std::string>;

// "k1=v1,k2=v2": split on ',' then on the first '='
static inline auto parse_labelString(std::string const& labelString)
{
    auto result = Labels{};

    auto labelStream = std::stringstream{labelString};
    auto label = std::string{};
    while (std::getline(labelStream, label, ',')) {
        auto const equals = label.find('=');
        if (equals == std::string::npos) {
            result[label] = "";
        } else {
            result[label.substr(0, equals)] = label.substr(equals + 1);
        }
    }

    return result;
}

// "2023-03-05 12:34:56 -0500 EST" -> epoch seconds
static inline time_t parse_createdAt(std::string const& createdAt)
{
    struct tm created = {};
    auto const end = ::strptime(createdAt.c_str(), "%Y-%m-%d %H:%M:%S %z", &created);
    if (end == nullptr) {
        throw std::runtime_error("failed to parse container creation time: " + createdAt);
    }

    // strptime leaves the parsed offset in tm_gmtoff
    auto const gmtoff = created.tm_gmtoff;
    return ::timegm(&created) - gmtoff;
}

// Positive node number label, or empty if malformed
static inline std::optional<int> parse_node(std::string const& node)
{
    if (node.empty() || !std::all_of(node.begin(), node.end(), [](unsigned char c) { return std::isdigit(c); }) || (node.size() > 4)) {
        return std::nullopt;
    }

    auto const result = std::stoi(node);
    if (result < 1) {
        return std::nullopt;
    }
    return result;
}

// Containers without user and door labels do not belong to doorman
static inline std::optional<SessionRecord> make_sessionRecord(std::string const& containerId,
    Labels const& labels, time_t since)
{
    auto const user = labels.find(LABEL_USER);
    auto const door = labels.find(LABEL_DOOR);
    if ((user == labels.end()) || (door == labels.end())) {
        writeLog("ps: skipping container %s without doorman labels\n", containerId.c_str());
        return std::nullopt;
    }

    auto result = SessionRecord
        { .container_id = containerId
        , .user = user->second
        , .door = door->second
        , .node = std::nullopt
        , .command = std::nullopt
        , .rundir = std::nullopt
        , .since = since
    };

    if (auto const node = labels.find(LABEL_NODE); node != labels.end()) {
        result.node = parse_node(node->second);
        if (!result.node) {
            writeLog("ps: skipping container %s with bad node '%s'\n", containerId.c_str(), node->second.c_str());
            return std::nullopt;
        }
    }
    if (auto const command = labels.find(LABEL_COMMAND); command != labels.end()) {
        result.command = command->second;
    }
    if (auto const rundir = labels.find(LABEL_RUNDIR); rundir != labels.end()) {
        result.rundir = rundir->second;
    }

    return result;
}

// podman: [ { "Id": "...", "Created": 1678000000, "Labels": { "doorman.door": "..." } | null }, ... ]
static inline auto parse_podmanListing(pt::ptree const& root)
{
    auto result = std::vector<SessionRecord>{};

    for (auto&& [key, container] : root) {
        auto labels = Labels{};
        if (auto const labelTree = container.get_child_optional("Labels")) {
            // label keys contain '.', so read them as children rather than paths
            for (auto&& [labelKey, labelValue] : *labelTree) {
                labels[labelKey] = labelValue.get_value<std::string>();
            }
        }

        auto const containerId = container.get<std::string>("Id");
        auto const created = container.get<int64_t>("Created");

        if (auto record = make_sessionRecord(containerId, labels, static_cast<time_t>(created))) {
            result.push_back(std::move(*record));
        }
    }

    return result;
}

// docker: one { "ID": "...", "CreatedAt": "...", "Labels": "k=v,k=v" } object per line
static inline auto parse_dockerListing(std::string const& listing)
{
    auto result = std::vector<SessionRecord>{};

    auto listingStream = std::stringstream{listing};
    auto line = std::string{};
    while (std::getline(listingStream, line)) {
        boost::algorithm::trim(line);
        if (line.empty()) {
            continue;
        }

        auto const container = parse_json(line);
        auto const containerId = container.get<std::string>("ID");
        auto const labels = parse_labelString(container.get<std::string>("Labels", ""));
        auto const created = parse_createdAt(container.get<std::string>("CreatedAt"));

        if (auto record = make_sessionRecord(containerId, labels, created)) {
            result.push_back(std::move(*record));
        }
    }

    return result;
}

// True if the tree is a JSON array (every child has an empty key)
static inline bool is_array(pt::ptree const& root)
{
    return std::all_of(root.begin(), root.end(), [](auto const& child) { return child.first.empty(); });
}

// Try the podman array shape first, then the line-oriented docker shape
static inline std::vector<SessionRecord> parse_listing(std::string const& listing)
{
    auto const trimmed = boost::algorithm::trim_copy(listing);
    if (trimmed.empty()) {
        return {};
    }

    auto root = std::optional<pt::ptree>{};
    try {
        root = parse_json(trimmed);
    } catch (std::runtime_error const& ex) {
        writeLog("ps: reading one container per line: %s\n", ex.what());
    }

    if (root && is_array(*root)) {
        return parse_podmanListing(*root);
    }

    return parse_dockerListing(trimmed);
}

// Door name, then node; maintenance sessions sort as node 0
static inline void sort_sessions(std::vector<SessionRecord>& sessions)
{
    std::stable_sort(sessions.begin(), sessions.end(), [](SessionRecord const& lhs, SessionRecord const& rhs) {
        if (lhs.door != rhs.door) {
            return lhs.door < rhs.door;
        }
        return lhs.node.value_or(0) < rhs.node.value_or(0);
    });
}

} /* namespace doorman::ps */

} /* namespace doorman */
