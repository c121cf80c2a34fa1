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

#include "wire/codec.hpp"
#include "base/error.hpp"
#include "base/logger.hpp"

#include <algorithm>

namespace psremote {
namespace wire {

static uint32_t le32(std::span<const uint8_t> bytes, size_t offset) noexcept {
  uint32_t val = 0;

  for (auto i = 0; i < 4; i++) {
    val |= static_cast<uint32_t>(bytes[offset + i]) << (i * 8);
  }

  return val;
}

static error_code check_length(uint32_t len, size_t max_frame) noexcept {
  if (len < header_bytes) return error::malformed_frame;
  if (len > max_frame) return error::frame_too_large;

  return error_code();
}

uint8v encode(uint32_t opcode, std::span<const uint8_t> payload) noexcept {
  uint8v out;
  out.reserve(header_bytes + payload.size());

  out.put_le32(static_cast<uint32_t>(header_bytes + payload.size()));
  out.put_le32(opcode);
  out.append(payload);

  return out;
}

std::optional<Frame> decode(std::span<const uint8_t> bytes, error_code &ec,
                            size_t max_frame) noexcept {
  ec.clear();

  if (bytes.size() < header_bytes) {
    ec = error::malformed_frame;
    return std::nullopt;
  }

  const auto len = le32(bytes, 0);

  ec = check_length(len, max_frame);
  if (!ec && (len != bytes.size())) ec = error::malformed_frame;
  if (ec) return std::nullopt;

  return Frame(le32(bytes, 4), uint8v(bytes.begin() + header_bytes, bytes.end()));
}

void Codec::feed(std::span<const uint8_t> bytes) noexcept {
  if (!sticky_ec) buff.append(bytes);
}

std::optional<Frame> Codec::next(error_code &ec) noexcept {
  INFO_AUTO_CAT("next");

  ec = sticky_ec;
  if (ec || (buff.size() < header_bytes)) return std::nullopt;

  const auto len = buff.le32(0);

  if (sticky_ec = check_length(len, max_frame); sticky_ec) {
    INFO_AUTO("declared len={} max={} buffered={}", len, max_frame, buff.size());

    buff.clear();
    ec = sticky_ec;
    return std::nullopt;
  }

  // need more data
  if (buff.size() < len) return std::nullopt;

  Frame frame(buff.le32(4), uint8v(buff.from_begin(header_bytes), buff.from_begin(len)));

  // keep surplus for the next call
  buff.erase(buff.begin(), buff.from_begin(len));

  return frame;
}

} // namespace wire
} // namespace psremote
