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

#include "base/dura_t.hpp"
#include "base/types.hpp"

#include <compare>

namespace psremote {

/// @brief Monotonic stopwatch started at construction
///
///        Operations with a timeout create one Elapsed and spend the
///        timeout across every blocking step with remaining()
class Elapsed {
public:
  Elapsed() noexcept : start(monotonic()) {}

  Nanos operator()() const noexcept { return elapsed(); }

  millis_fp millis() const noexcept { return std::chrono::duration_cast<millis_fp>(elapsed()); }

  /// @brief Stop the clock, later calls report the frozen duration
  Nanos freeze() noexcept {
    start = elapsed();
    frozen = true;
    return start;
  }

  /// @brief Elapsed duration for humans (e.g. 1min 2s 3.1ms)
  string humanize() const noexcept;

  /// @brief Portion of budget not yet spent, zero once exhausted
  Millis remaining(Millis budget) const noexcept {
    const auto used = std::chrono::duration_cast<Millis>(elapsed());
    return used >= budget ? Millis::zero() : budget - used;
  }

  /// @brief Restart the clock
  void reset() noexcept {
    start = monotonic();
    frozen = false;
  }

  template <typename D> std::partial_ordering operator<=>(D rhs) const noexcept {
    return elapsed() <=> std::chrono::duration_cast<Nanos>(rhs);
  }

private:
  static Nanos monotonic() noexcept;
  Nanos elapsed() const noexcept { return frozen ? start : monotonic() - start; }

private:
  Nanos start;
  bool frozen{false};
};

} // namespace psremote
