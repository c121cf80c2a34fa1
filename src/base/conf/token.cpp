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

#define TOML_IMPLEMENTATION

#include "base/conf/token.hpp"
#include "base/conf/parser.hpp"

namespace psremote {
namespace conf {

namespace {

struct document {
  toml::table tt;
  parse_msgs_t msgs;
};

// the configuration file is read once, on first use
const document &cached() noexcept {
  static const document doc = []() {
    document d;
    parse(d.tt, d.msgs);
    return d;
  }();

  return doc;
}

} // namespace

const toml::table token::empty_table;

token::token(csv mid) noexcept : root{mid}, ttable(cached().tt), msgs(cached().msgs) {}

token::token(csv mid, toml::table tt) noexcept : root{mid}, ttable(std::move(tt)) {}

} // namespace conf
} // namespace psremote
