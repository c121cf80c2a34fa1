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

#include "base/asio.hpp"
#include "base/types.hpp"
#include "ddp/device.hpp"
#include "pair/credential.hpp"

#include <optional>
#include <utility>
#include <vector>

namespace psremote {
namespace client {

using Paired = std::pair<ddp::DeviceRecord, pair::Credential>;

/// @brief Storage of paired devices, implemented outside the core
class Persistence {
public:
  virtual ~Persistence() = default;

  /// @brief Every saved device with its credential
  virtual std::vector<Paired> load(error_code &ec) noexcept = 0;

  /// @brief Add or replace (by device id) a device and its credential
  virtual void save(const ddp::DeviceRecord &record, const pair::Credential &credential,
                    error_code &ec) noexcept = 0;
};

/// @brief Descriptive information of a title
struct MediaInfo {
  string title_id;
  string title;
  string image_url;
  string content_type;
  bool locked{false};

  bool operator==(const MediaInfo &) const = default;
};

/// @brief Title lookup, implemented outside the core
class Metadata {
public:
  virtual ~Metadata() = default;

  virtual std::optional<MediaInfo> lookup(csv title_id, csv region) noexcept = 0;
};

} // namespace client
} // namespace psremote
