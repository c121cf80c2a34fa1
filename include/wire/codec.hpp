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
#include "wire/frame.hpp"

#include <optional>
#include <span>

namespace psremote {
namespace wire {

/// @brief Encode a frame: u32 LE total length (header included), u32 LE opcode, payload
/// @param opcode frame opcode
/// @param payload frame payload
/// @return encoded bytes
uint8v encode(uint32_t opcode, std::span<const uint8_t> payload) noexcept;

inline uint8v encode(const Frame &frame) noexcept { return encode(frame.opcode, frame.payload); }

/// @brief Decode exactly one frame from a complete buffer
/// @param bytes buffer containing a single frame (no more, no less)
/// @param ec set to malformed_frame or frame_too_large on failure
/// @param max_frame maximum acceptable frame length
/// @return the frame or std::nullopt (with ec set)
std::optional<Frame> decode(std::span<const uint8_t> bytes, error_code &ec,
                            size_t max_frame = default_max_frame) noexcept;

/// @brief Resumable stream decoder for the control channel.
///
///        Bytes are fed in arbitrary chunks; next() yields one frame per
///        call and keeps surplus bytes for the following call.  Once a
///        malformed header is seen the decoder stays malformed until reset().
class Codec {
public:
  explicit Codec(size_t max_frame = default_max_frame) noexcept : max_frame(max_frame) {}

  /// @brief Append received bytes
  void feed(std::span<const uint8_t> bytes) noexcept;

  /// @brief Extract the next complete frame
  /// @param ec set when the stream is malformed (sticky until reset)
  /// @return frame; std::nullopt with ec clear means more data is needed
  std::optional<Frame> next(error_code &ec) noexcept;

  /// @brief Bytes buffered but not yet consumed
  size_t buffered() const noexcept { return buff.size(); }

  bool malformed() const noexcept { return (bool)sticky_ec; }

  /// @brief Discard buffered bytes and clear the malformed state
  void reset() noexcept {
    buff.clear();
    sticky_ec.clear();
  }

private:
  const size_t max_frame;
  uint8v buff;
  error_code sticky_ec;

public:
  MOD_ID("wire.codec");
};

} // namespace wire
} // namespace psremote
