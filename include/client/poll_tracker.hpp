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

#include "base/conf/token.hpp"
#include "base/dura_t.hpp"
#include "base/elapsed.hpp"
#include "base/types.hpp"
#include "ddp/device.hpp"

#include <map>
#include <mutex>
#include <optional>

namespace psremote {
namespace client {

/// @brief Liveness of devices polled repeatedly over DDP.
///
///        Each poll sent counts as unanswered until a status arrives from the
///        device.  Sending a poll while more than max_polls are unanswered
///        marks the device unreachable and forgets its status.  A device seen
///        going from Awake to Standby ignores polls for a while, so polls to
///        it are suppressed for standby_quiet.
class PollTracker {
public:
  struct Opts {
    size_t max_polls{5};
    Millis standby_quiet{50s};
    Millis interval{5s}; // between polls of a watched device

    /// @brief Options from the [poll] configuration table
    static Opts from(const conf::token &tokc) noexcept;
  };

public:
  explicit PollTracker(Opts opts = Opts()) noexcept : opts(std::move(opts)) {}

  /// @brief false while the device is in its standby quiet period
  bool may_poll(csv address) noexcept;

  /// @brief Count a poll sent to the device
  /// @return true when this poll made the device unreachable
  bool sent(csv address) noexcept;

  /// @brief Record a status from the device
  /// @return true when the status differs from the previous one
  bool received(csv address, const ddp::DeviceStatus &status) noexcept;

  bool unreachable(csv address) const noexcept;
  size_t unanswered(csv address) const noexcept;
  std::optional<ddp::DeviceStatus> status(csv address) const noexcept;

  const Opts &options() const noexcept { return opts; }

private:
  struct Device {
    size_t unanswered{0};
    bool unreachable{false};
    std::optional<ddp::DeviceStatus> status;
    std::optional<Elapsed> standby; // since the Awake to Standby transition
  };

private:
  const Opts opts;

  mutable std::mutex mtx;
  std::map<string, Device, std::less<>> devices;

public:
  MOD_ID("client.poll");
};

} // namespace client
} // namespace psremote
