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

#include "base/conf/fixed.hpp"
#include "base/conf/cli_args.hpp"
#include "base/conf/keys.hpp"
#include "build_inject.hpp"

#include <cstdlib>
#include <fmt/format.h>

namespace psremote {
namespace conf {

csv fixed::app_name() noexcept { return build::info.project; }

string fixed::git() noexcept { return fmt::format("{} ({})", build::info.version, build::info.git); }

string fixed::cfg_file() noexcept {
  if (auto cfg = cli_args::ttable[key::cfg_file].value<string>(); cfg.has_value()) return *cfg;

  return (state_dir() / "psremote.toml").string();
}

fixed::fs_path fixed::exec_dir() noexcept {
  return cli_args::ttable[key::exec_dir].value_or(string("."));
}

fixed::fs_path fixed::log_file() noexcept {
  return cli_args::ttable[key::log_file].value_or(string());
}

fixed::fs_path fixed::state_dir() noexcept { return expand("~/.psremote"); }

fixed::fs_path fixed::expand(const string &p) noexcept {
  const char *home = std::getenv("HOME");

  if (!p.starts_with('~') || (home == nullptr)) return fs_path(p);

  return fs_path(home) / p.substr(p.starts_with("~/") ? 2 : 1);
}

} // namespace conf
} // namespace psremote
