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

#include <fmt/format.h>

namespace psremote {
namespace pair {

/// @brief Credential harvested from the companion app.  The token is opaque
///        and scoped to the device it was harvested for.
struct Credential {
  string token;
  string device_id;

  bool empty() const noexcept { return token.empty(); }
  bool operator==(const Credential &) const = default;
};

} // namespace pair
} // namespace psremote

template <> struct fmt::formatter<psremote::pair::Credential> : formatter<std::string_view> {
  // never log the full token
  template <typename FormatContext>
  auto format(const psremote::pair::Credential &c, FormatContext &ctx) const {
    const auto shown = std::string_view(c.token).substr(0, 4);
    const auto msg = fmt::format("device={} token={}...({} bytes)", c.device_id, shown,
                                 c.token.size());

    return formatter<std::string_view>::format(msg, ctx);
  }
};
