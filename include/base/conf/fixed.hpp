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

#include "base/types.hpp"

#include <filesystem>

namespace psremote {
namespace conf {

/// @brief Build time facts and paths derived from the command line
///
///        Without a cli_args (library use, tests) every path falls back to
///        its default below the per user state directory
struct fixed {
  using fs_path = std::filesystem::path;

  static csv app_name() noexcept;
  static string git() noexcept;

  /// @brief --config, else ~/.psremote/psremote.toml
  static string cfg_file() noexcept;

  /// @brief Directory holding the executable, for the setcap hint
  static fs_path exec_dir() noexcept;

  /// @brief --log-file, empty for stdout
  static fs_path log_file() noexcept;

  /// @brief ~/.psremote
  static fs_path state_dir() noexcept;

  /// @brief Expand a leading '~' to $HOME
  static fs_path expand(const string &p) noexcept;
};

} // namespace conf
} // namespace psremote
