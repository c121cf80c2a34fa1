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

#include <array>
#include <cstdint>
#include <fmt/format.h>

namespace psremote {
namespace crypto {

static constexpr size_t nonce_bytes{16};
static constexpr size_t session_key_bytes{16};
static constexpr size_t iv_seed_bytes{16};
static constexpr size_t hmac_key_bytes{32};

using Nonce = std::array<uint8_t, nonce_bytes>;

/// @brief Which end of the control channel this engine represents
enum class Role : uint8_t { Client = 0, Console };

/// @brief Direction byte mixed into the counter block and the tag
enum Dir : uint8_t { ToConsole = 0x00, ToClient = 0x01 };

/// @brief Key material of one control session (HandshakeState)
struct Keys {
  Nonce local_nonce{0};
  Nonce remote_nonce{0};
  std::array<uint8_t, session_key_bytes> session_key{0};
  std::array<uint8_t, iv_seed_bytes> iv_seed{0};
  std::array<uint8_t, hmac_key_bytes> hmac_key{0};

  bool operator==(const Keys &) const = default;

  /// @brief True once derive() has populated the key material
  bool ready() const noexcept;

  /// @brief Zero all key material
  void wipe() noexcept;
};

/// @brief Generate a random 16 byte nonce
Nonce make_nonce() noexcept;

/// @brief Derive session keys from both nonces.  Both roles pass the
///        client nonce first so the result is bit exact on both ends.
/// @param client_nonce nonce sent in Hello
/// @param device_nonce nonce returned in HelloAck
/// @return populated keys (local / remote nonce are left to the caller)
Keys derive(const Nonce &client_nonce, const Nonce &device_nonce) noexcept;

} // namespace crypto
} // namespace psremote

template <> struct fmt::formatter<psremote::crypto::Role> : formatter<std::string_view> {
  template <typename FormatContext>
  auto format(psremote::crypto::Role role, FormatContext &ctx) const {
    return formatter<std::string_view>::format(
        role == psremote::crypto::Role::Client ? "client" : "console", ctx);
  }
};
