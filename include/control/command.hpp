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
#include "base/dura_t.hpp"
#include "base/types.hpp"
#include "base/uint8v.hpp"
#include "crypto/keys.hpp"
#include "ddp/device.hpp"

#include <cstdint>
#include <fmt/format.h>
#include <optional>

namespace psremote {
namespace control {

/// @brief Control channel opcodes (u32 LE on the wire)
struct opcode {
  static constexpr uint32_t hello{0x6f636370};
  static constexpr uint32_t hello_ack{0x70636370};
  static constexpr uint32_t login{0x1e};
  static constexpr uint32_t login_result{0x07};
  static constexpr uint32_t pin_login{0x1f}; // registration, answered by login_result
  static constexpr uint32_t status{0x14};
  static constexpr uint32_t status_result{0x12};
  static constexpr uint32_t standby{0x1a};
  static constexpr uint32_t standby_result{0x1b};
  static constexpr uint32_t launch{0x0a};
  static constexpr uint32_t launch_result{0x0b};
  static constexpr uint32_t remote_key{0x1c};
  static constexpr uint32_t remote_key_result{0x1d};
  static constexpr uint32_t power{0x18};
  static constexpr uint32_t power_result{0x19};
  static constexpr uint32_t bye{0x04};
};

/// @brief Fixed (NUL padded) field widths
struct field {
  static constexpr size_t credential{64};
  static constexpr size_t client_name{40};
  static constexpr size_t model{16};
  static constexpr size_t app_version{8};
  static constexpr size_t pin{8};
  static constexpr size_t title_id{16};
};

static constexpr uint32_t protocol_version{0x00020000};

csv opcode_name(uint32_t op) noexcept;

/// @brief Remote control buttons, values are the button bits sent to the device
enum class RemoteKey : uint32_t {
  Up = 1,
  Down = 2,
  Right = 4,
  Left = 8,
  Enter = 16,
  Back = 32,
  Option = 64,
  PS = 128,
  KeyOff = 256,
  Cancel = 512,
  OpenRC = 1024,
  CloseRC = 2048
};

struct KeyPress {
  RemoteKey key{RemoteKey::Enter};
  Millis hold{0};

  bool operator==(const KeyPress &) const = default;
};

/// @brief Translate a key name (up, down, ..., ps_hold, open_rc) to a key press
/// @param name key name, case sensitive
/// @param ec unknown_key
/// @return key press (ps_hold is PS held for one second)
std::optional<KeyPress> parse_key(csv name, error_code &ec) noexcept;

csv key_name(RemoteKey key) noexcept;

/// @brief A command accepted by a Ready session
class Command {
public:
  enum Kind : uint8_t { Power = 0, Standby, Launch, Remote };

public:
  static Command power() noexcept { return Command(Power); }
  static Command standby() noexcept { return Command(Standby); }
  static Command launch(csv title_id) noexcept;
  static Command remote(KeyPress key_press) noexcept;

  Kind kind() const noexcept { return _kind; }
  csv title_id() const noexcept { return _title_id; }
  const KeyPress &key_press() const noexcept { return _key_press; }

  uint32_t request_opcode() const noexcept;
  uint32_t response_opcode() const noexcept;

  /// @brief Capability the device must advertise for this command
  ddp::Capabilities::Bit capability() const noexcept;

  /// @brief Build the request payload
  /// @param ec bad_argument when the title id does not fit its field
  uint8v payload(error_code &ec) const noexcept;

  static csv kind_name(Kind kind) noexcept;

private:
  explicit Command(Kind kind) noexcept : _kind(kind) {}

private:
  Kind _kind;
  string _title_id;
  KeyPress _key_press;
};

/// @brief Response to a command
struct Ack {
  uint32_t opcode{0};
  uint32_t result{0};

  bool ok() const noexcept { return result == 0; }
};

/// @brief HelloAck contents
struct HelloAck {
  uint32_t version{0};
  uint32_t result{0};
  crypto::Nonce nonce{0};
};

/// @brief Hello payload: u32 version, nonce[16]
uint8v hello_payload(const crypto::Nonce &nonce) noexcept;

/// @brief Parse a HelloAck payload: u32 version, u32 result, nonce[16]
std::optional<HelloAck> parse_hello_ack(const uint8v &payload, error_code &ec) noexcept;

/// @brief Login payload: credential[64], client name[40], model[16], app version[8]
/// @param ec bad_argument when the credential is empty or does not fit
uint8v login_payload(csv credential, csv client_name, csv model, csv app_version,
                     error_code &ec) noexcept;

/// @brief Registration payload: the login payload followed by pin[8]
/// @param ec bad_argument when the credential is unusable or the pin is not
///           eight digits
uint8v pin_login_payload(csv credential, csv pin, csv client_name, csv model, csv app_version,
                         error_code &ec) noexcept;

/// @brief PIN shown by the device while adding a mobile device (eight digits)
bool valid_pin(csv pin) noexcept;

/// @brief Parse a u32 result payload
std::optional<uint32_t> parse_result(const uint8v &payload, error_code &ec) noexcept;

/// @brief Parse a StatusResult payload: u32 code, title id[16], title name (rest)
std::optional<ddp::DeviceStatus> parse_status_result(const uint8v &payload,
                                                     error_code &ec) noexcept;

} // namespace control
} // namespace psremote

template <> struct fmt::formatter<psremote::control::Command> : formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const psremote::control::Command &cmd, FormatContext &ctx) const {
    using psremote::control::Command;

    std::string msg(Command::kind_name(cmd.kind()));

    if (cmd.kind() == Command::Launch) {
      msg = fmt::format("{} {}", msg, cmd.title_id());
    } else if (cmd.kind() == Command::Remote) {
      msg = fmt::format("{} {} hold={}ms", msg, psremote::control::key_name(cmd.key_press().key),
                        cmd.key_press().hold.count());
    }

    return formatter<std::string_view>::format(msg, ctx);
  }
};
