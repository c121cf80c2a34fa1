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

#include "base/logger.hpp"
#include "base/conf/fixed.hpp"

#include <chrono>
#include <fmt/chrono.h>

namespace psremote {

std::unique_ptr<Logger> _logger;

Elapsed Logger::e;

namespace {

string out_path() noexcept {
  const auto log_file = conf::fixed::log_file();

  return log_file.empty() ? string("/dev/stdout") : log_file.string();
}

constexpr auto flags{fmt::file::WRONLY | fmt::file::APPEND | fmt::file::CREATE};

} // namespace

Logger::Logger() : tokc(module_id), out(fmt::output_file(out_path(), flags)) {
  out.print("\n{:%FT%H:%M:%S} START {}\n", std::chrono::system_clock::now(), conf::fixed::app_name());

  if (!tokc.parse_ok()) out.print("config: {}\n", tokc.msg(conf::Parser));
  if (const auto &info = tokc.msg(conf::Info); !info.empty()) out.print("config: {}\n", info);
}

Logger::~Logger() noexcept {
  out.print("{:%FT%H:%M:%S} STOP\n", std::chrono::system_clock::now());
  out.close();
}

} // namespace psremote
