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
#include "client/collab.hpp"
#include "store/file.hpp"

#include <mutex>
#include <optional>

namespace psremote {
namespace store {

/// @brief Title cache implementing Metadata lookups.
///
///        Titles are grouped by region, each title id maps to an object
///        { "title", "image_url", "content_type", "locked" }.  A bare string
///        value is accepted as the title alone.  Titles outside a region
///        object apply to every region.
class GamesFile : public client::Metadata {
public:
  explicit GamesFile(fs::path path) noexcept : path(std::move(path)) {}

  /// @brief Cache at [store].games (default ~/.psremote/games.json)
  static GamesFile from_config() noexcept;

  std::optional<client::MediaInfo> lookup(csv title_id, csv region) noexcept override;

  /// @brief Add or replace a title within a region
  void add(const client::MediaInfo &info, csv region, error_code &ec) noexcept;

  const fs::path &file() const noexcept { return path; }

private:
  const fs::path path;
  std::mutex mtx;

public:
  MOD_ID("store.games");
};

} // namespace store
} // namespace psremote
