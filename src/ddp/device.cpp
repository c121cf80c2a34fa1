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

#include "ddp/device.hpp"

#include <array>
#include <charconv>

namespace psremote {
namespace ddp {

namespace {
// RemoteKey requires system version major >= 5
static constexpr int remote_key_min_major{5};

int version_major(csv system_version) noexcept {
  int major{0};

  if (system_version.size() >= 2) {
    const auto fc = std::from_chars(system_version.data(), system_version.data() + 2, major);
    if (fc.ec != std::errc()) major = 0;
  }

  return major;
}

Port port_from(csv val) noexcept {
  Port port{0};

  const auto fc = std::from_chars(val.data(), val.data() + val.size(), port);

  return (fc.ec == std::errc()) ? port : Port{0};
}
} // namespace

Power power_from(int status_code) noexcept {
  switch (status_code) {
  case wire::ddp::status_ok:
    return Power::Awake;

  case wire::ddp::status_standby:
    return Power::Standby;

  default:
    return Power::Unknown;
  }
}

csv power_name(Power power) noexcept {
  static constexpr std::array names{"unknown"sv, "awake"sv, "standby"sv};

  return names[static_cast<size_t>(power)];
}

csv Capabilities::bit_name(Bit bit) noexcept {
  static constexpr std::array names{"control"sv, "launch"sv, "remote_key"sv, "status_poll"sv,
                                    "wake"sv};

  return bit < Count ? names[bit] : "unknown"sv;
}

Capabilities Capabilities::from(const wire::StatusMsg &msg) noexcept {
  using key = wire::ddp_key;

  Capabilities caps;

  // every device answering DDP can be woken with a credential
  caps.set(Wake);

  if (port_from(msg.field(key::host_request_port)) > 0) {
    caps.set(Control).set(Launch);

    if (version_major(msg.field(key::system_version)) >= remote_key_min_major) {
      caps.set(RemoteKey);
    }

    // fixed width, zero padded version strings compare lexically
    const auto ddp_vsn = msg.field(key::protocol_version);
    if ((ddp_vsn.size() == wire::ddp::version.size()) && (ddp_vsn >= wire::ddp::version)) {
      caps.set(StatusPoll);
    }
  }

  return caps;
}

DeviceStatus DeviceStatus::from(const wire::StatusMsg &msg) noexcept {
  using key = wire::ddp_key;

  DeviceStatus s;

  s.power = power_from(msg.code);
  s.status_code = msg.code;
  s.status_text = msg.text;
  s.title_id = msg.field(key::running_app_titleid);
  s.title_name = msg.field(key::running_app_name);
  s.device_id = msg.field(key::host_id);
  s.device_name = msg.field(key::host_name);
  s.device_type = msg.field(key::host_type);
  s.system_version = msg.field(key::system_version);
  s.ddp_version = msg.field(key::protocol_version);
  s.control_port = port_from(msg.field(key::host_request_port));
  s.capabilities = Capabilities::from(msg);
  s.fields = msg.fields;

  return s;
}

DeviceRecord DeviceRecord::from(csv address, const DeviceStatus &status) noexcept {
  DeviceRecord rec;

  rec.address = address;
  rec.device_id = status.device_id;
  rec.update_from(status);

  return rec;
}

void DeviceRecord::update_from(const DeviceStatus &status) noexcept {
  if (!status.device_name.empty()) name = status.device_name;
  if (!status.device_type.empty()) device_type = status.device_type;
  if (!status.system_version.empty()) system_version = status.system_version;
  if (!status.ddp_version.empty()) ddp_version = status.ddp_version;
  if (status.control_port > 0) control_port = status.control_port;

  capabilities = status.capabilities;
}

} // namespace ddp
} // namespace psremote
