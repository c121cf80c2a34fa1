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

#include <algorithm>
#include <cctype>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <iterator>
#include <span>
#include <vector>

namespace psremote {

/// @brief Multi-purpose byte container
class uint8v : public std::vector<uint8_t> {

public:
  /// @brief Construct an empty container
  uint8v() = default;

  /// @brief Constructor container with count bytes allocated
  /// @param count byte to allocate
  /// @param byte fill with value (default 0x00)
  explicit uint8v(std::integral auto count, uint8_t byte = 0x00) noexcept
      : std::vector<uint8_t>(static_cast<size_t>(count), byte) {}

  uint8v(std::initializer_list<uint8_t> il) : std::vector<uint8_t>(il) {}

  template <std::input_iterator It>
  uint8v(It first, It last) : std::vector<uint8_t>(first, last) {}

  /// @brief Construct from the characters of a string view (no terminator)
  /// @param sv source characters
  static uint8v from_chars(csv sv) noexcept { return uint8v(sv.begin(), sv.end()); }

  /// @brief Assign the span to the container
  /// @param span Span representing uint8_t
  void assign_span(std::span<const uint8_t> span) noexcept { assign(span.begin(), span.end()); }

  /// @brief Append a span of bytes
  /// @param span bytes to append
  /// @return reference to this container
  uint8v &append(std::span<const uint8_t> span) noexcept {
    insert(end(), span.begin(), span.end());
    return *this;
  }

  /// @brief Append the characters of a string view padded (or truncated)
  ///        to exactly n bytes with NUL
  /// @param sv characters to append
  /// @param n fixed width of the field
  /// @return reference to this container
  uint8v &append_padded(csv sv, size_t n) noexcept {
    const auto count = std::min(sv.size(), n);

    insert(end(), sv.begin(), sv.begin() + count);
    insert(end(), n - count, 0x00);

    return *this;
  }

  /// @brief Append bytes padded (or truncated) to exactly n bytes with NUL
  uint8v &append_padded(std::span<const uint8_t> span, size_t n) noexcept {
    const auto count = std::min(span.size(), n);

    insert(end(), span.begin(), span.begin() + count);
    insert(end(), n - count, 0x00);

    return *this;
  }

  /// @brief Append an uint32_t in little endian byte order
  /// @param val value to append
  /// @return reference to this container
  uint8v &put_le32(uint32_t val) noexcept {
    for (auto i = 0; i < 4; i++) {
      push_back(static_cast<uint8_t>(val >> (i * 8)));
    }

    return *this;
  }

  /// @brief Append an uint64_t in big endian byte order
  /// @param val value to append
  /// @return reference to this container
  uint8v &put_be64(uint64_t val) noexcept {
    for (auto i = 7; i >= 0; i--) {
      push_back(static_cast<uint8_t>(val >> (i * 8)));
    }

    return *this;
  }

  /// @brief Pointer to raw container data
  /// @tparam T Pointer type
  /// @param offset Offset applied to pointer, default 0
  /// @return Raw pointer of type T with offset applied
  template <typename T = char> T *data_as(std::ptrdiff_t offset = 0) noexcept {
    return (T *)(data() + offset);
  }

  /// @brief Return an iterator into the container with an offest
  /// @param bytes bytes to offset
  /// @return Iterator offset by bytes
  uint8v::iterator from_begin(std::ptrdiff_t bytes) { return begin() + bytes; }

  /// @brief Return an iterator into the container from the end offset by bytes
  /// @param bytes bytes to offset
  /// @return Iterator offset by bytes
  uint8v::iterator from_end(std::ptrdiff_t bytes) { return end() - bytes; }

  /// @brief Return const raw pointer to container data with offset applied
  /// @tparam T Treat as data type
  /// @param offset bytes to offset, default 0
  /// @return Raw const pointer to container data with offset applied
  template <typename T = char> const T *raw(size_t offset = 0) const noexcept {
    return (const T *)(data() + (sizeof(T) * offset));
  }

  /// @brief Convert four little endian bytes at offset to an uint32_t
  /// @param offset offset into container
  /// @return converted uint32_t
  uint32_t le32(size_t offset) const noexcept {
    uint32_t val = 0;

    for (auto i = 0; i < 4; i++) {
      val |= static_cast<uint32_t>((*this)[offset + i]) << (i * 8);
    }

    return val;
  }

  /// @brief Read a NUL padded text field
  /// @param offset starting offset
  /// @param n width of the field
  /// @return string up to the first NUL (or the full width)
  string padded(size_t offset, size_t n) const noexcept {
    if (offset >= size()) return string();

    n = std::min(n, size() - offset);
    const auto first = begin() + offset;
    const auto last = std::find(first, first + n, 0x00);

    return string(first, last);
  }

  /// @brief Return const string view starting at offset for bytes
  /// @param offset starting offset, default to 0
  /// @param bytes count of bytes to include, default to 0
  /// @return
  csv view(const size_t offset = 0, size_t bytes = 0) const noexcept {
    bytes = (bytes == 0) ? size() - offset : bytes;
    return string_view(raw<char>(offset), bytes);
  }

  /// @brief Is container printable
  /// @return boolean
  bool printable() const noexcept {
    if (size()) {
      return std::all_of(begin(), end(), [](auto c) {
        return std::isprint(static_cast<unsigned char>(c)) || std::isspace(c);
      });
    }

    return false;
  }

public:
  MOD_ID("uint8v");
};

} // namespace psremote
