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

#include "control/command.hpp"
#include "base/error.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace psremote {
namespace control {

namespace {

struct key_entry {
  csv name;
  RemoteKey key;
  Millis hold;
};

constexpr std::array key_table{
    key_entry{"up"sv, RemoteKey::Up, 0ms},           key_entry{"down"sv, RemoteKey::Down, 0ms},
    key_entry{"right"sv, RemoteKey::Right, 0ms},     key_entry{"left"sv, RemoteKey::Left, 0ms},
    key_entry{"enter"sv, RemoteKey::Enter, 0ms},     key_entry{"back"sv, RemoteKey::Back, 0ms},
    key_entry{"option"sv, RemoteKey::Option, 0ms},   key_entry{"ps"sv, RemoteKey::PS, 0ms},
    key_entry{"ps_hold"sv, RemoteKey::PS, 1000ms},   key_entry{"key_off"sv, RemoteKey::KeyOff, 0ms},
    key_entry{"cancel"sv, RemoteKey::Cancel, 0ms},   key_entry{"open_rc"sv, RemoteKey::OpenRC, 0ms},
    key_entry{"close_rc"sv, RemoteKey::CloseRC, 0ms}};

} // namespace

csv opcode_name(uint32_t op) noexcept {
  switch (op) {
  case opcode::hello:
    return "hello";
  case opcode::hello_ack:
    return "hello_ack";
  case opcode::login:
    return "login";
  case opcode::login_result:
    return "login_result";
  case opcode::pin_login:
    return "pin_login";
  case opcode::status:
    return "status";
  case opcode::status_result:
    return "status_result";
  case opcode::standby:
    return "standby";
  case opcode::standby_result:
    return "standby_result";
  case opcode::launch:
    return "launch";
  case opcode::launch_result:
    return "launch_result";
  case opcode::remote_key:
    return "remote_key";
  case opcode::remote_key_result:
    return "remote_key_result";
  case opcode::power:
    return "power";
  case opcode::power_result:
    return "power_result";
  case opcode::bye:
    return "bye";
  default:
    return "unknown";
  }
}

std::optional<KeyPress> parse_key(csv name, error_code &ec) noexcept {
  ec.clear();

  auto it = std::find_if(key_table.begin(), key_table.end(),
                         [&](const auto &entry) { return entry.name == name; });

  if (it == key_table.end()) {
    ec = error::unknown_key;
    return std::nullopt;
  }

  return KeyPress{it->key, it->hold};
}

csv key_name(RemoteKey key) noexcept {
  auto it = std::find_if(key_table.begin(), key_table.end(),
                         [&](const auto &entry) { return entry.key == key; });

  return it != key_table.end() ? it->name : "unknown"sv;
}

Command Command::launch(csv title_id) noexcept {
  Command cmd(Launch);
  cmd._title_id.assign(title_id);

  return cmd;
}

Command Command::remote(KeyPress key_press) noexcept {
  Command cmd(Remote);
  cmd._key_press = key_press;

  return cmd;
}

uint32_t Command::request_opcode() const noexcept {
  static constexpr std::array ops{opcode::power, opcode::standby, opcode::launch,
                                  opcode::remote_key};

  return ops[_kind];
}

uint32_t Command::response_opcode() const noexcept {
  static constexpr std::array ops{opcode::power_result, opcode::standby_result,
                                  opcode::launch_result, opcode::remote_key_result};

  return ops[_kind];
}

ddp::Capabilities::Bit Command::capability() const noexcept {
  using caps = ddp::Capabilities;

  switch (_kind) {
  case Launch:
    return caps::Launch;
  case Remote:
    return caps::RemoteKey;
  default:
    return caps::Control;
  }
}

uint8v Command::payload(error_code &ec) const noexcept {
  ec.clear();

  uint8v payload;

  switch (_kind) {
  case Launch:
    if (_title_id.empty() || (_title_id.size() > field::title_id)) {
      ec = error::bad_argument;
      break;
    }

    payload.append_padded(_title_id, field::title_id);
    break;

  case Remote:
    payload.put_le32(static_cast<uint32_t>(_key_press.key));
    payload.put_le32(static_cast<uint32_t>(_key_press.hold.count()));
    break;

  default:
    break;
  }

  return payload;
}

csv Command::kind_name(Kind kind) noexcept {
  static constexpr std::array names{"power"sv, "standby"sv, "launch"sv, "remote"sv};

  return names[kind];
}

uint8v hello_payload(const crypto::Nonce &nonce) noexcept {
  uint8v payload;

  payload.put_le32(protocol_version);
  payload.append(nonce);

  return payload;
}

std::optional<HelloAck> parse_hello_ack(const uint8v &payload, error_code &ec) noexcept {
  ec.clear();

  if (payload.size() < (8 + crypto::nonce_bytes)) {
    ec = error::malformed_frame;
    return std::nullopt;
  }

  HelloAck ack;
  ack.version = payload.le32(0);
  ack.result = payload.le32(4);
  std::copy_n(payload.begin() + 8, crypto::nonce_bytes, ack.nonce.begin());

  return ack;
}

uint8v login_payload(csv credential, csv client_name, csv model, csv app_version,
                     error_code &ec) noexcept {
  ec.clear();

  if (credential.empty() || (credential.size() > field::credential)) {
    ec = error::bad_argument;
    return uint8v();
  }

  uint8v payload;

  payload.append_padded(credential, field::credential)
      .append_padded(client_name, field::client_name)
      .append_padded(model, field::model)
      .append_padded(app_version, field::app_version);

  return payload;
}

uint8v pin_login_payload(csv credential, csv pin, csv client_name, csv model, csv app_version,
                         error_code &ec) noexcept {
  if (!valid_pin(pin)) {
    ec = error::bad_argument;
    return uint8v();
  }

  auto payload = login_payload(credential, client_name, model, app_version, ec);
  if (ec) return uint8v();

  payload.append_padded(pin, field::pin);

  return payload;
}

bool valid_pin(csv pin) noexcept {
  return (pin.size() == field::pin) &&
         std::all_of(pin.begin(), pin.end(), [](char c) { return (c >= '0') && (c <= '9'); });
}

std::optional<uint32_t> parse_result(const uint8v &payload, error_code &ec) noexcept {
  ec.clear();

  if (payload.size() < 4) {
    ec = error::malformed_frame;
    return std::nullopt;
  }

  return payload.le32(0);
}

std::optional<ddp::DeviceStatus> parse_status_result(const uint8v &payload,
                                                     error_code &ec) noexcept {
  ec.clear();

  if (payload.size() < (4 + field::title_id)) {
    ec = error::malformed_frame;
    return std::nullopt;
  }

  ddp::DeviceStatus status;
  status.status_code = static_cast<int>(payload.le32(0));
  status.power = ddp::power_from(status.status_code);
  status.title_id = payload.padded(4, field::title_id);

  const auto name_at = 4 + field::title_id;
  status.title_name = payload.padded(name_at, payload.size() - name_at);

  return status;
}

} // namespace control
} // namespace psremote
