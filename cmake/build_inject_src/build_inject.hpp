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

#include <string_view>

namespace psremote {
namespace build {

/// @brief Facts captured by cmake when the project was configured
struct info_t {
  std::string_view project;
  std::string_view version;
  std::string_view git;
};

extern const info_t info;

} // namespace build
} // namespace psremote
