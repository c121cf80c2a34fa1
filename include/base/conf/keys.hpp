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

namespace psremote {
namespace conf {

/// @brief Keys of the command line table (see cli_args)
struct key {
  static constexpr auto app_name{"app-name"};
  static constexpr auto arg{"arg"};
  static constexpr auto cfg_file{"config"};
  static constexpr auto command{"command"};
  static constexpr auto credential{"credential"};
  static constexpr auto debug{"debug"};
  static constexpr auto exec_dir{"exec-path"};
  static constexpr auto help{"help"};
  static constexpr auto ip{"ip"};
  static constexpr auto log_file{"log-file"};
  static constexpr auto port{"port"};
  static constexpr auto region{"region"};
  static constexpr auto timeout{"timeout"};
};

} // namespace conf
} // namespace psremote
