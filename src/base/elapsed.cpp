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

#include "base/elapsed.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <iterator>
#include <time.h>

namespace psremote {

Nanos Elapsed::monotonic() noexcept {
  struct timespec tn;
  clock_gettime(CLOCK_MONOTONIC, &tn);

  return Nanos(static_cast<int64_t>(tn.tv_sec) * 1'000'000'000 + tn.tv_nsec);
}

string Elapsed::humanize() const noexcept {
  string msg;
  auto w = std::back_inserter(msg);

  auto d = elapsed();

  if (const auto mins = std::chrono::duration_cast<Minutes>(d); mins.count() > 0) {
    fmt::format_to(w, "{} ", mins);
    d -= mins;
  }

  if (const auto secs = std::chrono::duration_cast<Seconds>(d); secs.count() > 0) {
    fmt::format_to(w, "{} ", secs);
    d -= secs;
  }

  fmt::format_to(w, "{:0.1f}ms", std::chrono::duration_cast<millis_fp>(d).count());

  return msg;
}

} // namespace psremote
