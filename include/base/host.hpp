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

#include <vector>

namespace psremote {

/// @brief Network identity of this machine
///
///        The hardware address serves as the default host id announced while
///        impersonating a console during pairing; broadcast addresses are the
///        targets of a search when none is given
class Host {
public:
  Host() noexcept;

  /// @brief Hardware address as twelve upper case hex digits (empty if unknown)
  csv device_id() const noexcept { return id; }
  csv hostname() const noexcept { return name; }

  /// @brief Directed broadcast address of each up, non-loopback IPv4 interface
  const std::vector<string> &broadcast_addresses() const noexcept { return bcast_addrs; }

private:
  void scan_interfaces() noexcept;

private:
  string name;
  string id;
  std::vector<string> bcast_addrs;

public:
  MOD_ID("host");
};

} // namespace psremote
