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

#include <cstdint>
#include <string>
#include <string_view>

namespace psremote {

using namespace std::literals;

using string = std::string;
using string_view = std::string_view;

typedef const std::string_view csv;

/// @brief UDP or TCP port in host byte order, ANY_PORT asks the kernel for one
using Port = uint16_t;
static constexpr Port ANY_PORT{0};

/// @brief Declares module_id, the log prefix of a class or file
#define MOD_ID(mid)                                                                                \
  static constexpr std::string_view module_id { mid }

} // namespace psremote
