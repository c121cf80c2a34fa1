//  psremote - Remote control for PlayStation consoles
//  Copyright (C) 2022  Tim Hughey
//
//  This program is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License, or
//  (at your option) any later version.
//
//  This program is distributed in the hope that it will be useful,
//  but WITHOUT ANY WARRANTY; without even the implied warranty of
//  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//  GNU General Public License for more details.
//
//  You should have received a copy of the GNU General Public License
//  along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
//  https://www.wisslanding.com

#pragma once

#include "base/conf/keys.hpp"
#include "base/conf/toml.hpp"
#include "base/types.hpp"

#include <sstream>

namespace psremote {
namespace conf {

/// @brief Command line of a single psremote invocation, captured as a toml
///        table so options and configuration read the same way
///
///        psremote [options] <command> [arg]
struct cli_args {

  friend struct fixed;

  cli_args(int argc, char **argv) noexcept;

  /// @brief Command verb (e.g. search, pair, start), empty when missing
  static string command() noexcept { return ttable[key::command].value_or(string()); }

  /// @brief Optional argument of the command (remote key, title id)
  static string arg() noexcept { return ttable[key::arg].value_or(string()); }

  /// @brief --debug was given
  static bool debug() noexcept { return ttable[key::debug].value_or(false); }

  /// @brief Reason parsing failed, empty on success
  static const string &failure() noexcept { return error_str; }

  /// @brief --help was given; usage() holds the text to print
  static bool help() noexcept { return help_requested; }
  static string usage() noexcept { return help_ss.str(); }

  /// @brief Neither --help nor a parse failure
  static bool nominal_start() noexcept { return !help_requested && error_str.empty(); }

  static const auto &table() noexcept { return ttable; }

protected:
  static toml::table ttable;

private:
  static string error_str;
  static bool help_requested;
  static std::ostringstream help_ss;
};

} // namespace conf
} // namespace psremote
