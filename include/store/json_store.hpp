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
#include "base/conf/token.hpp"
#include "base/types.hpp"
#include "client/collab.hpp"
#include "store/file.hpp"

#include <mutex>
#include <vector>

namespace psremote {
namespace store {

/// @brief Paired devices saved as a JSON document
///
///        { "devices": [ { "address": "192.168.1.20", "device_id": "...",
///                         "credential": "...", ... } ] }
class JsonStore : public client::Persistence {
public:
  explicit JsonStore(fs::path path) noexcept : path(std::move(path)) {}

  /// @brief Store at [store].path (default ~/.psremote/devices.json)
  static JsonStore from_config() noexcept;

  std::vector<client::Paired> load(error_code &ec) noexcept override;

  void save(const ddp::DeviceRecord &record, const pair::Credential &credential,
            error_code &ec) noexcept override;

  /// @brief Saved device matching an address or device id
  std::optional<client::Paired> find(csv address_or_id, error_code &ec) noexcept;

  const fs::path &file() const noexcept { return path; }

private:
  string to_json(const std::vector<client::Paired> &devices) const noexcept;

private:
  const fs::path path;
  std::mutex mtx;

public:
  MOD_ID("store.json");
};

} // namespace store
} // namespace psremote
