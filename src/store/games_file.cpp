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

#include "store/games_file.hpp"
#include "base/conf/fixed.hpp"
#include "base/conf/token.hpp"
#include "base/error.hpp"
#include "base/logger.hpp"

#include <ArduinoJson.h>

namespace psremote {
namespace store {

namespace {
constexpr auto TITLE{"title"};
constexpr auto IMAGE_URL{"image_url"};
constexpr auto CONTENT_TYPE{"content_type"};
constexpr auto LOCKED{"locked"};
constexpr auto GAME{"game"};

size_t doc_capacity(size_t json_bytes) noexcept { return (json_bytes * 2) + 1024; }

std::optional<client::MediaInfo> media_info(csv title_id, JsonVariantConst v) noexcept {
  client::MediaInfo info;
  info.title_id = title_id;

  if (v.is<const char *>()) {
    info.title = v.as<const char *>();
    info.content_type = GAME;

    return info;
  }

  if (!v.is<JsonObjectConst>()) return std::nullopt;

  info.title = v[TITLE] | "";
  info.image_url = v[IMAGE_URL] | "";
  info.content_type = v[CONTENT_TYPE] | GAME;
  info.locked = v[LOCKED] | false;

  return info;
}
} // namespace

void GamesFile::add(const client::MediaInfo &info, csv region, error_code &ec) noexcept {
  INFO_AUTO_CAT("add");

  std::unique_lock lck(mtx);

  auto json = read_file(path, ec);
  if (ec == errc::no_such_file_or_directory) {
    ec.clear();
    json = "{}";
  }

  if (ec) return;

  DynamicJsonDocument doc(doc_capacity(json.size() + 512));

  if (auto err = deserializeJson(doc, json); err || !doc.is<JsonObject>()) {
    ec = error::malformed_document;
    INFO_AUTO("{} {}", path.string(), err ? err.c_str() : "not an object");
    return;
  }

  const string region_key(region);
  const string title_key(info.title_id);

  JsonObject titles = doc[region_key];
  if (titles.isNull()) titles = doc.createNestedObject(region_key);

  titles.remove(title_key);
  auto obj = titles.createNestedObject(title_key);

  obj[TITLE] = info.title;
  obj[IMAGE_URL] = info.image_url;
  obj[CONTENT_TYPE] = info.content_type.empty() ? string(GAME) : info.content_type;
  obj[LOCKED] = info.locked;

  if (doc.overflowed()) {
    ec = error::malformed_document;
    INFO_AUTO("{} document capacity exceeded", path.string());
    return;
  }

  string out;
  serializeJsonPretty(doc, out);
  write_file(path, out, ec);

  INFO_AUTO("{} {} {}", region, info.title_id, ec ? ec.message() : info.title);
}

GamesFile GamesFile::from_config() noexcept {
  conf::token tokc("store");

  return GamesFile(conf::fixed::expand(tokc.val<string>("games", "~/.psremote/games.json")));
}

std::optional<client::MediaInfo> GamesFile::lookup(csv title_id, csv region) noexcept {
  INFO_AUTO_CAT("lookup");

  std::unique_lock lck(mtx);

  error_code ec;
  const auto json = read_file(path, ec);

  if (ec) {
    if (ec != errc::no_such_file_or_directory) INFO_AUTO("{} {}", path.string(), ec.message());
    return std::nullopt;
  }

  DynamicJsonDocument doc(doc_capacity(json.size()));

  if (auto err = deserializeJson(doc, json); err) {
    INFO_AUTO("{} {}", path.string(), err.c_str());
    return std::nullopt;
  }

  const string region_key(region);
  const string title_key(title_id);

  const auto &cdoc = doc;
  auto info = media_info(title_id, cdoc[region_key][title_key]);

  // titles not grouped by region
  if (!info.has_value()) info = media_info(title_id, cdoc[title_key]);

  if (info.has_value()) INFO_AUTO("{} {} '{}'", region, title_id, info->title);

  return info;
}

} // namespace store
} // namespace psremote
