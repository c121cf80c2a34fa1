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
#include "base/uint8v.hpp"
#include "crypto/keys.hpp"
#include "wire/frame.hpp"

#include <cstdint>
#include <optional>
#include <span>

namespace psremote {
namespace crypto {

/// @brief AES-128-CTR over the bytes using the counter block
///        (iv_seed[0..8) ^ be64(seq)) || dir || 0x00 * 7
/// @param keys session keys
/// @param dir direction of the message
/// @param seq per direction sequence number
/// @param in plaintext (encrypt) or ciphertext (decrypt)
/// @param ec crypto_failure when libgcrypt reports an error
/// @return transformed bytes
uint8v encrypt(const Keys &keys, Dir dir, uint64_t seq, std::span<const uint8_t> in,
               error_code &ec) noexcept;

/// @brief CTR mode is symmetric, decrypt is encrypt
inline uint8v decrypt(const Keys &keys, Dir dir, uint64_t seq, std::span<const uint8_t> in,
                      error_code &ec) noexcept {
  return encrypt(keys, dir, seq, in, ec);
}

/// @brief HMAC-SHA256 truncated to 16 bytes
wire::tag_t tag(std::span<const uint8_t> hmac_key, std::span<const uint8_t> msg) noexcept;

/// @brief Seals and opens control frames for one role of a session.
///
///        The sequence counters advance once per sealed / opened frame.  A
///        tag mismatch is fatal for the owning session.
class Cipher {
public:
  Cipher(Role role, const Keys &keys) noexcept;
  ~Cipher() noexcept { keys.wipe(); }

  Cipher(const Cipher &) = delete;
  Cipher &operator=(const Cipher &) = delete;

  /// @brief Encrypt and tag a plaintext frame
  /// @param frame plaintext frame
  /// @param ec crypto_failure
  /// @return encoded wire bytes (payload is ciphertext || tag)
  uint8v seal(const wire::Frame &frame, error_code &ec) noexcept;

  /// @brief Verify and decrypt a frame decoded from the wire
  /// @param sealed frame whose payload is ciphertext || tag
  /// @param ec integrity on tag mismatch, malformed_frame when too short
  /// @return plaintext frame
  std::optional<wire::Frame> open(const wire::Frame &sealed, error_code &ec) noexcept;

  const Keys &key_material() const noexcept { return keys; }
  Role role() const noexcept { return _role; }
  uint64_t tx_seq() const noexcept { return _tx_seq; }
  uint64_t rx_seq() const noexcept { return _rx_seq; }

private:
  Dir tx_dir() const noexcept { return _role == Role::Client ? ToConsole : ToClient; }
  Dir rx_dir() const noexcept { return _role == Role::Client ? ToClient : ToConsole; }

  wire::tag_t frame_tag(Dir dir, uint64_t seq, uint32_t len, uint32_t opcode,
                        std::span<const uint8_t> ciphertext) const noexcept;

private:
  const Role _role;
  Keys keys;
  uint64_t _tx_seq{0};
  uint64_t _rx_seq{0};

public:
  MOD_ID("crypto.cipher");
};

} // namespace crypto
} // namespace psremote
