/******************************************************************************\
 * Templates.hpp - Render DOS drop files and batch files for a session
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <map>
#include <string>

namespace doorman {

// Flat {{name}} -> value map, e.g. "user.username" -> "alice"
using TemplateVars = std::map<std::string, std::string>;

namespace dos {

// Replace every {{name}} in tmpl with its value. Unknown names render empty.
// Throws std::runtime_error on an unterminated placeholder.
std::string renderString(std::string const& tmpl, TemplateVars const& vars);

// Render one of the built-in templates (door.sys, doorman.bat)
std::string renderTemplate(std::string const& name, TemplateVars const& vars);

// LF -> CRLF, then UTF-8 -> CP437 with '?' for anything without a mapping
std::string encodeDos(std::string const& text);

// Render the built-in template `name` and write it DOS-encoded as dir/NAME.
// Returns the written path. Throws IOError.
std::string writeDos(std::string const& name, std::string const& dir, TemplateVars const& vars);

} /* namespace doorman::dos */

} /* namespace doorman */
