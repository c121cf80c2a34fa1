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

#include "base/conf/fixed.hpp"
#include "base/conf/toml.hpp"
#include "base/types.hpp"

#include <filesystem>
#include <fmt/format.h>

namespace psremote {
namespace conf {

/// @brief Read the configuration file (--config or the default) into tt_dest
///
///        A missing file leaves tt_dest untouched and only notes it in
///        msgs[Info]; a file that fails to parse is reported in msgs[Parser]
inline bool parse(toml::table &tt_dest, parse_msgs_t &msgs) noexcept {
  msgs.fill(string());

  const auto cfg_file = fixed::cfg_file();

  if (std::error_code fs_ec; !std::filesystem::exists(cfg_file, fs_ec)) {
    msgs[Info] = fmt::format("{} not found, using defaults", cfg_file);
    return true;
  }

  auto result = toml::parse_file(cfg_file);

  if (!result) {
    const auto &err = result.error();
    msgs[Parser] = fmt::format("{} line {}: {}", cfg_file, err.source().begin.line,
                               err.description());
    return false;
  }

  tt_dest = std::move(result).table();
  return true;
}

} // namespace conf
} // namespace psremote
