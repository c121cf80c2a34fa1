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

#include "base/conf/toml.hpp"
#include "base/dura_t.hpp"
#include "base/types.hpp"

#include <concepts>
#include <fmt/format.h>
#include <utility>

namespace psremote {
namespace conf {

template <typename T>
concept IsConfNativeType = std::same_as<T, string> || std::integral<T> || std::floating_point<T>;

/// @brief View of one table of the configuration file (e.g. [ddp], [pair])
///
///        Components build their Opts from a token; every value has a
///        default so a missing file, table or key is never an error.
class token {
  friend struct fmt::formatter<token>;

public:
  token() = default;

  /// @brief Token rooted at table mid of the configuration file
  token(csv mid) noexcept;

  /// @brief Token rooted at table mid of an already parsed document
  token(csv mid, toml::table tt) noexcept;

  token(token &&other) = default;
  token &operator=(token &&) = default;

public:
  bool empty() const noexcept { return ttable.empty(); }
  bool is_table() const noexcept { return ttable.at_path(root).is_table(); }

  const string &msg(ParseMsg id) const noexcept { return msgs[id]; }
  bool parse_ok() const noexcept { return msgs[Parser].empty(); }

  /// @brief The table at root, empty when absent
  const toml::table &table() const noexcept {
    if (const auto *t = ttable.at_path(root).as_table(); t != nullptr) return *t;

    return empty_table;
  }

  /// @brief timeout key of table p, relative to root (empty for root)
  Millis timeout_val(csv p, Millis def_val) const noexcept {
    auto path = toml::path(p);
    path.append(toml::path("timeout"));

    return duration_val(path.str(), def_val);
  }

  /// @brief Duration written as a table, e.g. interval = { seconds = 2, millis = 500 }
  /// @param p key of the table, relative to root
  Millis duration_val(csv p, Millis def_val) const noexcept {
    auto path = toml::path(root);
    path.append(toml::path(p));

    const auto *tt = ttable.at_path(path).as_table();
    if (tt == nullptr) return def_val;

    Millis sum{0};

    for (auto &&[key, node] : *tt) {
      const auto v = node.value_or<int64_t>(0);
      const auto k = key.str();

      if (k.starts_with("min")) {
        sum += Minutes{v};
      } else if (k.starts_with("sec")) {
        sum += Seconds{v};
      } else if ((k == "millis"sv) || (k == "ms"sv)) {
        sum += Millis{v};
      }
    }

    return sum;
  }

  /// @brief Value at path p below root, def_val when missing or of another type
  template <typename T>
    requires IsConfNativeType<T>
  T val(csv p, T def_val) const noexcept {
    return ttable.at_path(toml::path(root).append(toml::path(p))).value_or(std::move(def_val));
  }

  string val(csv p, const char *def_val) const noexcept { return val<string>(p, string(def_val)); }

protected:
  toml::path root;
  toml::table ttable;
  parse_msgs_t msgs;

private:
  static const toml::table empty_table;

public:
  MOD_ID("conf.token");
};

} // namespace conf
} // namespace psremote

template <> struct fmt::formatter<psremote::conf::token> : formatter<std::string_view> {

  template <typename FormatContext>
  auto format(const psremote::conf::token &tok, FormatContext &ctx) const {
    const auto msg = tok.is_table()
                         ? fmt::format("[{}] keys={}", tok.root.str(), tok.table().size())
                         : fmt::format("[{}] absent", tok.root.str());

    return formatter<std::string_view>::format(msg, ctx);
  }
};
