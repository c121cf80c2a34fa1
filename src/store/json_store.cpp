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

#include "store/json_store.hpp"
#include "base/conf/fixed.hpp"
#include "base/error.hpp"
#include "base/logger.hpp"

#include <ArduinoJson.h>
#include <algorithm>

namespace psremote {
namespace store {

namespace {
constexpr auto DEVICES{"devices"};
constexpr auto ADDRESS{"address"};
constexpr auto DEVICE_ID{"device_id"};
constexpr auto NAME{"name"};
constexpr auto DEVICE_TYPE{"device_type"};
constexpr auto SYSTEM_VERSION{"system_version"};
constexpr auto DDP_VERSION{"ddp_version"};
constexpr auto CONTROL_PORT{"control_port"};
constexpr auto CAPABILITIES{"capabilities"};
constexpr auto CREDENTIAL{"credential"};

size_t doc_capacity(size_t json_bytes) noexcept { return (json_bytes * 2) + 1024; }
} // namespace

JsonStore JsonStore::from_config() noexcept {
  conf::token tokc("store");

  return JsonStore(conf::fixed::expand(tokc.val<string>("path", "~/.psremote/devices.json")));
}

std::optional<client::Paired> JsonStore::find(csv address_or_id, error_code &ec) noexcept {
  auto devices = load(ec);

  auto it = std::find_if(devices.begin(), devices.end(), [&](const auto &p) {
    return (p.first.address == address_or_id) || (p.first.device_id == address_or_id);
  });

  if (it == devices.end()) return std::nullopt;

  return std::move(*it);
}

std::vector<client::Paired> JsonStore::load(error_code &ec) noexcept {
  INFO_AUTO_CAT("load");

  std::unique_lock lck(mtx);
  std::vector<client::Paired> devices;

  const auto json = read_file(path, ec);

  // nothing saved yet
  if (ec == errc::no_such_file_or_directory) {
    ec.clear();
    return devices;
  }

  if (ec) {
    INFO_AUTO("{} {}", path.string(), ec.message());
    return devices;
  }

  DynamicJsonDocument doc(doc_capacity(json.size()));

  if (auto err = deserializeJson(doc, json); err) {
    ec = error::malformed_document;
    INFO_AUTO("{} {}", path.string(), err.c_str());
    return devices;
  }

  for (JsonObjectConst obj : doc[DEVICES].as<JsonArrayConst>()) {
    ddp::DeviceRecord rec;

    rec.address = obj[ADDRESS] | "";
    rec.device_id = obj[DEVICE_ID] | "";
    rec.name = obj[NAME] | "";
    rec.device_type = obj[DEVICE_TYPE] | "";
    rec.system_version = obj[SYSTEM_VERSION] | "";
    rec.ddp_version = obj[DDP_VERSION] | "";
    rec.control_port = obj[CONTROL_PORT] | wire::ddp::control_port;
    rec.capabilities = ddp::Capabilities::from_ulong(obj[CAPABILITIES] | 0UL);

    pair::Credential cred{obj[CREDENTIAL] | "", rec.device_id};

    if (rec.address.empty() || cred.empty()) {
      INFO_AUTO("skipping incomplete entry device={}", rec.device_id);
      continue;
    }

    devices.emplace_back(std::move(rec), std::move(cred));
  }

  INFO_AUTO("{} devices={}", path.string(), devices.size());

  return devices;
}

void JsonStore::save(const ddp::DeviceRecord &record, const pair::Credential &credential,
                     error_code &ec) noexcept {
  INFO_AUTO_CAT("save");

  auto devices = load(ec);
  if (ec) return;

  std::unique_lock lck(mtx);

  auto it = std::find_if(devices.begin(), devices.end(), [&](const auto &p) {
    return !record.device_id.empty() ? p.first.device_id == record.device_id
                                     : p.first.address == record.address;
  });

  if (it != devices.end()) {
    *it = client::Paired(record, credential);
  } else {
    devices.emplace_back(record, credential);
  }

  write_file(path, to_json(devices), ec);

  INFO_AUTO("{} {} {}", path.string(), record.address, ec ? ec.message() : "ok");
}

string JsonStore::to_json(const std::vector<client::Paired> &devices) const noexcept {
  DynamicJsonDocument doc(doc_capacity(devices.size() * 512));

  auto arr = doc.createNestedArray(DEVICES);

  for (const auto &[rec, cred] : devices) {
    auto obj = arr.createNestedObject();

    obj[ADDRESS] = rec.address;
    obj[DEVICE_ID] = rec.device_id;
    obj[NAME] = rec.name;
    obj[DEVICE_TYPE] = rec.device_type;
    obj[SYSTEM_VERSION] = rec.system_version;
    obj[DDP_VERSION] = rec.ddp_version;
    obj[CONTROL_PORT] = rec.control_port;
    obj[CAPABILITIES] = rec.capabilities.to_ulong();
    obj[CREDENTIAL] = cred.token;
  }

  string json;
  serializeJsonPretty(doc, json);

  return json;
}

} // namespace store
} // namespace psremote
