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

#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace psremote {
namespace wire {

/// @brief Device Discovery Protocol constants
struct ddp {
  static constexpr Port port{987};
  static constexpr Port local_port{1987};
  static constexpr Port control_port{997};

  static constexpr csv version{"00020020"};
  static constexpr csv version_key{"device-discovery-protocol-version"};
  static constexpr csv credential_key{"user-credential"};

  static constexpr size_t max_credential{256};
  static constexpr size_t max_datagram{1024};

  static constexpr int status_ok{200};
  static constexpr int status_standby{620};
};

/// @brief Well known status response keys
struct ddp_key {
  static constexpr csv host_id{"host-id"};
  static constexpr csv host_type{"host-type"};
  static constexpr csv host_name{"host-name"};
  static constexpr csv host_request_port{"host-request-port"};
  static constexpr csv running_app_name{"running-app-name"};
  static constexpr csv running_app_titleid{"running-app-titleid"};
  static constexpr csv system_version{"system-version"};
  static constexpr csv protocol_version{"device-discovery-protocol-version"};
};

enum class DdpType : uint8_t { Search = 0, Wakeup, Launch };

using ddp_fields_t = std::vector<std::pair<string, string>>;

/// @brief A parsed status response datagram
struct StatusMsg {
  int code{0};
  string text;
  std::map<string, string, std::less<>> fields;

  /// @brief Value of a field or empty
  csv field(csv key) const noexcept {
    if (auto it = fields.find(key); it != fields.end()) return it->second;

    return csv();
  }

  bool has(csv key) const noexcept { return fields.contains(key); }
};

csv type_name(DdpType type) noexcept;

/// @brief Build a request datagram: request line, fields, protocol version
string make_msg(DdpType type, const ddp_fields_t &fields = {}) noexcept;

inline string make_search() noexcept { return make_msg(DdpType::Search); }

/// @brief WAKEUP datagram, credential is the first field
string make_wakeup(csv credential) noexcept;

/// @brief LAUNCH datagram, credential is the first field
string make_launch(csv credential) noexcept;

/// @brief Fixed byte offset of the credential within a WAKEUP / LAUNCH datagram
size_t credential_offset(DdpType type) noexcept;

/// @brief Identify the request type of a datagram sent to a console
/// @return request type or std::nullopt when the datagram is not a request
std::optional<DdpType> request_type(csv datagram) noexcept;

/// @brief Extract the credential from a WAKEUP / LAUNCH datagram
/// @param datagram received bytes
/// @param ec malformed_status when the datagram is not a credential carrier
/// @return credential bytes (at most ddp::max_credential)
string extract_credential(csv datagram, error_code &ec) noexcept;

/// @brief Build a console shaped status response datagram
string make_status(int code, csv text, const ddp_fields_t &fields) noexcept;

/// @brief Parse a status response datagram
/// @param datagram received bytes
/// @param ec malformed_status when no status line is present
/// @return status; std::nullopt with ec clear when the datagram is itself a
///         search request (to be ignored)
std::optional<StatusMsg> parse_status(csv datagram, error_code &ec) noexcept;

} // namespace wire
} // namespace psremote
