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
#include "base/uint8v.hpp"

#include <array>
#include <cstdint>
#include <fmt/format.h>
#include <optional>
#include <utility>

namespace psremote {
namespace wire {

/// @brief u32 length + u32 opcode
static constexpr size_t header_bytes{8};
static constexpr size_t default_max_frame{64 * 1024};

static constexpr size_t tag_bytes{16};
using tag_t = std::array<uint8_t, tag_bytes>;

/// @brief One control channel message.  The payload is plaintext once a
///        sealed frame has been opened; tag holds the integrity tag that
///        accompanied it on the wire (if any).
struct Frame {
  uint32_t opcode{0};
  uint8v payload;
  std::optional<tag_t> tag;

  Frame() = default;
  Frame(uint32_t opcode, uint8v payload) noexcept : opcode(opcode), payload(std::move(payload)) {}

  size_t length() const noexcept { return header_bytes + payload.size(); }

  bool operator==(const Frame &rhs) const noexcept {
    return (opcode == rhs.opcode) && (payload == rhs.payload);
  }

public:
  MOD_ID("wire.frame");
};

} // namespace wire
} // namespace psremote

template <> struct fmt::formatter<psremote::wire::Frame> : formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const psremote::wire::Frame &f, FormatContext &ctx) const {
    const auto msg = fmt::format("opcode=0x{:02x} len={}{}", f.opcode, f.length(),
                                 f.tag.has_value() ? " sealed" : "");

    return formatter<std::string_view>::format(msg, ctx);
  }
};
