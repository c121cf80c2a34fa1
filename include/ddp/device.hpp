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
#include "wire/ddp_msg.hpp"

#include <bitset>
#include <cstdint>
#include <fmt/format.h>
#include <map>

namespace psremote {
namespace ddp {

enum class Power : uint8_t { Unknown = 0, Awake, Standby };

/// @brief Map a DDP status code to a power state (200 Awake, 620 Standby)
Power power_from(int status_code) noexcept;

csv power_name(Power power) noexcept;

/// @brief Features a device supports, derived from its status responses
class Capabilities {
public:
  enum Bit : uint8_t { Control = 0, Launch, RemoteKey, StatusPoll, Wake, Count };

  Capabilities() = default;

  /// @brief Capabilities advertised by a status response
  static Capabilities from(const wire::StatusMsg &msg) noexcept;

  bool has(Bit bit) const noexcept { return bits.test(bit); }
  Capabilities &set(Bit bit, bool val = true) noexcept {
    bits.set(bit, val);
    return *this;
  }

  bool none() const noexcept { return bits.none(); }
  unsigned long to_ulong() const noexcept { return bits.to_ulong(); }

  static Capabilities from_ulong(unsigned long val) noexcept {
    Capabilities caps;
    caps.bits = std::bitset<Count>(val);

    return caps;
  }

  bool operator==(const Capabilities &) const = default;

  static csv bit_name(Bit bit) noexcept;

private:
  std::bitset<Count> bits;
};

/// @brief Status of a device as reported by one DDP response (transient)
struct DeviceStatus {
  Power power{Power::Unknown};
  int status_code{0};
  string status_text;
  string title_id;
  string title_name;
  string device_id;
  string device_name;
  string device_type;
  string system_version;
  string ddp_version;
  Port control_port{0};
  Capabilities capabilities;
  std::map<string, string, std::less<>> fields;

  /// @brief Build from a parsed status response
  static DeviceStatus from(const wire::StatusMsg &msg) noexcept;

  bool awake() const noexcept { return power == Power::Awake; }

  bool operator==(const DeviceStatus &) const = default;
};

/// @brief Identity of a device discovered on the network
struct DeviceRecord {
  string address;
  string device_id;
  string name;
  string device_type;
  Capabilities capabilities;
  string system_version;
  string ddp_version;
  Port control_port{wire::ddp::control_port};

  /// @brief Create from the first discovery response
  /// @param address ip address the response arrived from
  /// @param status parsed status
  static DeviceRecord from(csv address, const DeviceStatus &status) noexcept;

  /// @brief Refresh mutable attributes (name, capabilities, versions) from a
  ///        later response
  void update_from(const DeviceStatus &status) noexcept;

  bool operator==(const DeviceRecord &) const = default;

public:
  MOD_ID("ddp.device");
};

} // namespace ddp
} // namespace psremote

template <> struct fmt::formatter<psremote::ddp::Power> : formatter<std::string_view> {
  template <typename FormatContext>
  auto format(psremote::ddp::Power power, FormatContext &ctx) const {
    return formatter<std::string_view>::format(psremote::ddp::power_name(power), ctx);
  }
};

template <> struct fmt::formatter<psremote::ddp::Capabilities> : formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const psremote::ddp::Capabilities &caps, FormatContext &ctx) const {
    using psremote::ddp::Capabilities;

    std::string msg;
    for (uint8_t b = 0; b < Capabilities::Count; b++) {
      const auto bit = static_cast<Capabilities::Bit>(b);

      if (caps.has(bit)) {
        if (!msg.empty()) msg.append(",");
        msg.append(Capabilities::bit_name(bit));
      }
    }

    return formatter<std::string_view>::format(msg, ctx);
  }
};

template <> struct fmt::formatter<psremote::ddp::DeviceStatus> : formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const psremote::ddp::DeviceStatus &s, FormatContext &ctx) const {
    const auto msg = fmt::format("{} {} {} code={} title={} '{}' caps={}", s.device_name,
                                 s.device_id, s.power, s.status_code, s.title_id, s.title_name,
                                 s.capabilities);

    return formatter<std::string_view>::format(msg, ctx);
  }
};
