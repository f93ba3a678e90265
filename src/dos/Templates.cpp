/******************************************************************************\
 * Templates.cpp - Render DOS drop files and batch files for a session
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "doorman_defs.h"

#include <stdio.h>
#include <errno.h>
#include <string.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iterator>
#include <stdexcept>

#include <boost/algorithm/string/replace.hpp>
#include <boost/algorithm/string/trim.hpp>

#include "dos/Templates.hpp"

#include "doorman_error.hpp"
#include "useful/dm_wrappers.hpp"

namespace doorman {

namespace dos {

namespace {

// 52 line DOOR.SYS (GAP) drop file
const char* const DOOR_SYS_TEMPLATE =
    "COM1:\n"
    "115200\n"
    "8\n"
    "{{node}}\n"
    "115200\n"
    "Y\n"
    "Y\n"
    "Y\n"
    "Y\n"
    "{{user.display_name}}\n"
    "Doorman\n"
    "000-000-0000\n"
    "000-000-0000\n"
    "PASSWORD\n"
    "30\n"
    "1\n"
    "01/01/70\n"
    "86400\n"
    "1440\n"
    "GR\n"
    "25\n"
    "Y\n"
    "1\n"
    "1\n"
    "12/31/99\n"
    "{{user.uid}}\n"
    "Z\n"
    "0\n"
    "0\n"
    "0\n"
    "999999\n"
    "01/01/70\n"
    "C:\\\n"
    "C:\\\n"
    "Sysop\n"
    "{{user.username}}\n"
    "00:00\n"
    "Y\n"
    "Y\n"
    "Y\n"
    "7\n"
    "0\n"
    "01/01/70\n"
    "{{current_time}}\n"
    "{{current_time}}\n"
    "9999\n"
    "0\n"
    "0\n"
    "0\n"
    "None\n"
    "0\n"
    "0\n";

const char* const BATCH_TEMPLATE =
    "@ECHO OFF\n"
    "{{commands}}\n";

// CP437 code points for bytes 0x80 - 0xFF
const char32_t CP437_HIGH[128] = {
    0x00C7, 0x00FC, 0x00E9, 0x00E2, 0x00E4, 0x00E0, 0x00E5, 0x00E7,
    0x00EA, 0x00EB, 0x00E8, 0x00EF, 0x00EE, 0x00EC, 0x00C4, 0x00C5,
    0x00C9, 0x00E6, 0x00C6, 0x00F4, 0x00F6, 0x00F2, 0x00FB, 0x00F9,
    0x00FF, 0x00D6, 0x00DC, 0x00A2, 0x00A3, 0x00A5, 0x20A7, 0x0192,
    0x00E1, 0x00ED, 0x00F3, 0x00FA, 0x00F1, 0x00D1, 0x00AA, 0x00BA,
    0x00BF, 0x2310, 0x00AC, 0x00BD, 0x00BC, 0x00A1, 0x00AB, 0x00BB,
    0x2591, 0x2592, 0x2593, 0x2502, 0x2524, 0x2561, 0x2562, 0x2556,
    0x2555, 0x2563, 0x2551, 0x2557, 0x255D, 0x255C, 0x255B, 0x2510,
    0x2514, 0x2534, 0x252C, 0x251C, 0x2500, 0x253C, 0x255E, 0x255F,
    0x255A, 0x2554, 0x2569, 0x2566, 0x2560, 0x2550, 0x256C, 0x2567,
    0x2568, 0x2564, 0x2565, 0x2559, 0x2558, 0x2552, 0x2553, 0x256B,
    0x256A, 0x2518, 0x250C, 0x2588, 0x2584, 0x258C, 0x2590, 0x2580,
    0x03B1, 0x00DF, 0x0393, 0x03C0, 0x03A3, 0x03C3, 0x00B5, 0x03C4,
    0x03A6, 0x0398, 0x03A9, 0x03B4, 0x221E, 0x03C6, 0x03B5, 0x2229,
    0x2261, 0x00B1, 0x2265, 0x2264, 0x2320, 0x2321, 0x00F7, 0x2248,
    0x00B0, 0x2219, 0x00B7, 0x221A, 0x207F, 0x00B2, 0x25A0, 0x00A0,
};

static char toCP437(char32_t codePoint)
{
    if (codePoint < 0x80) {
        return static_cast<char>(codePoint);
    }

    auto const end = std::end(CP437_HIGH);
    auto const found = std::find(std::begin(CP437_HIGH), end, codePoint);
    if (found == end) {
        return CP437_REPLACEMENT_CHAR;
    }
    return static_cast<char>(0x80 + (found - std::begin(CP437_HIGH)));
}

// Decode one UTF-8 sequence starting at pos and advance pos past it.
// Malformed input decodes as U+FFFD, one byte at a time.
static char32_t decodeUtf8(std::string const& text, size_t& pos)
{
    auto const lead = static_cast<unsigned char>(text[pos++]);
    if (lead < 0x80) {
        return lead;
    }

    auto length = size_t{0};
    auto codePoint = char32_t{0};
    if ((lead & 0xE0) == 0xC0) {
        length = 1;
        codePoint = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 2;
        codePoint = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 3;
        codePoint = lead & 0x07;
    } else {
        return 0xFFFD;
    }

    if (pos + length > text.size()) {
        return 0xFFFD;
    }
    for (size_t i = 0; i < length; i++) {
        auto const cont = static_cast<unsigned char>(text[pos + i]);
        if ((cont & 0xC0) != 0x80) {
            return 0xFFFD;
        }
        codePoint = (codePoint << 6) | (cont & 0x3F);
    }
    pos += length;

    return codePoint;
}

} /* anonymous namespace */

std::string
renderString(std::string const& tmpl, TemplateVars const& vars)
{
    auto result = std::string{};
    result.reserve(tmpl.size());

    auto cursor = size_t{0};
    while (true) {
        auto const open = tmpl.find("{{", cursor);
        if (open == std::string::npos) {
            result.append(tmpl, cursor, std::string::npos);
            break;
        }
        result.append(tmpl, cursor, open - cursor);

        auto const close = tmpl.find("}}", open + 2);
        if (close == std::string::npos) {
            throw std::runtime_error("unterminated placeholder in template at offset " + std::to_string(open));
        }

        auto const name = boost::algorithm::trim_copy(tmpl.substr(open + 2, close - open - 2));
        if (auto const var = vars.find(name); var != vars.end()) {
            result.append(var->second);
        }

        cursor = close + 2;
    }

    return result;
}

std::string
renderTemplate(std::string const& name, TemplateVars const& vars)
{
    if (name == DOOR_SYS_FILE) {
        return renderString(DOOR_SYS_TEMPLATE, vars);
    } else if (name == BATCH_FILE) {
        return renderString(BATCH_TEMPLATE, vars);
    }

    throw std::runtime_error("Couldn't find template for " + name);
}

std::string
encodeDos(std::string const& text)
{
    auto crlf = text;
    boost::algorithm::replace_all(crlf, "\n", "\r\n");

    auto encoded = std::string{};
    encoded.reserve(crlf.size());
    for (size_t pos = 0; pos < crlf.size(); ) {
        encoded.push_back(toCP437(decodeUtf8(crlf, pos)));
    }

    return encoded;
}

std::string
writeDos(std::string const& name, std::string const& dir, TemplateVars const& vars)
{
    auto rendered = std::string{};
    try {
        rendered = renderTemplate(name, vars);
    } catch (std::exception const& ex) {
        throw std::runtime_error("While rendering template " + name + ": " + ex.what());
    }
    auto const encoded = encodeDos(rendered);

    auto upperName = name;
    std::transform(upperName.begin(), upperName.end(), upperName.begin(),
        [](unsigned char c) { return std::toupper(c); });
    auto const path = dir + "/" + upperName;

    auto const output = take_pointer_ownership(fopen(path.c_str(), "wb"), std::fclose);
    if (!output) {
        throw IOError{"Couldn't create " + path + ": " + strerror(errno)};
    }
    if (fwrite(encoded.data(), 1, encoded.size(), output.get()) != encoded.size()) {
        throw IOError{"Couldn't write " + path + ": " + strerror(errno)};
    }
    if (fflush(output.get()) != 0) {
        throw IOError{"Couldn't write " + path + ": " + strerror(errno)};
    }

    return path;
}

} /* namespace doorman::dos */

} /* namespace doorman */
