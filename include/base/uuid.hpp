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
#include <fmt/format.h>
#include <uuid/uuid.h>

namespace psremote {

/// @brief Random (version 4) identifier in canonical text form, tags each
///        control connection in the log
class UUID {
public:
  UUID() noexcept {
    uuid_t bin;
    std::array<char, 37> buf{0};

    uuid_generate_random(bin);
    uuid_unparse_lower(bin, buf.data());
    text.assign(buf.data(), 36);
  }

  static bool valid(csv s) noexcept {
    uuid_t bin;
    return uuid_parse(string(s).c_str(), bin) == 0;
  }

  /// @brief Final group only, enough to tell connections apart in a log
  csv brief() const noexcept { return csv(text).substr(text.rfind('-') + 1); }

  const string &str() const noexcept { return text; }

  bool operator==(const UUID &rhs) const noexcept = default;

private:
  string text;
};

} // namespace psremote

template <> struct fmt::formatter<psremote::UUID> : formatter<std::string_view> {
  template <typename FormatContext> auto format(const psremote::UUID &id, FormatContext &ctx) const {
    return formatter<std::string_view>::format(id.brief(), ctx);
  }
};
