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

#include "client/poll_tracker.hpp"
#include "base/logger.hpp"

namespace psremote {
namespace client {

PollTracker::Opts PollTracker::Opts::from(const conf::token &tokc) noexcept {
  Opts opts;

  opts.max_polls = static_cast<size_t>(tokc.val<int64_t>("max_polls", opts.max_polls));
  opts.standby_quiet = tokc.duration_val("standby_quiet", opts.standby_quiet);
  opts.interval = tokc.duration_val("interval", opts.interval);

  return opts;
}

bool PollTracker::may_poll(csv address) noexcept {
  INFO_AUTO_CAT("may_poll");

  std::unique_lock lck(mtx);

  auto it = devices.find(address);
  if ((it == devices.end()) || !it->second.standby.has_value()) return true;

  auto &standby = *it->second.standby;

  if (standby() < opts.standby_quiet) {
    INFO_AUTO("{} polls suppressed for {}ms", address,
              standby.remaining(opts.standby_quiet).count());
    return false;
  }

  it->second.standby.reset();

  return true;
}

bool PollTracker::sent(csv address) noexcept {
  INFO_AUTO_CAT("sent");

  std::unique_lock lck(mtx);

  auto it = devices.find(address);
  if (it == devices.end()) it = devices.emplace(string(address), Device()).first;

  auto &dev = it->second;
  dev.unanswered++;

  if ((dev.unanswered <= opts.max_polls) || dev.unreachable) return false;

  dev.unreachable = true;
  dev.status.reset();

  INFO_AUTO("{} is unreachable, unanswered={}", address, dev.unanswered - 1);

  return true;
}

bool PollTracker::received(csv address, const ddp::DeviceStatus &status) noexcept {
  INFO_AUTO_CAT("received");

  std::unique_lock lck(mtx);

  auto it = devices.find(address);
  if (it == devices.end()) it = devices.emplace(string(address), Device()).first;

  auto &dev = it->second;

  if (dev.unreachable) INFO_AUTO("{} is reachable", address);

  dev.unanswered = 0;
  dev.unreachable = false;

  if (dev.status.has_value() && (*dev.status == status)) return false;

  // a device going to standby stops answering for a while
  if (dev.status.has_value() && (dev.status->power == ddp::Power::Awake) &&
      (status.power == ddp::Power::Standby)) {
    dev.standby.emplace();
    INFO_AUTO("{} went to standby, polls suppressed for {}ms", address,
              opts.standby_quiet.count());
  }

  dev.status = status;

  return true;
}

size_t PollTracker::unanswered(csv address) const noexcept {
  std::unique_lock lck(mtx);

  auto it = devices.find(address);
  return (it == devices.end()) ? 0 : it->second.unanswered;
}

bool PollTracker::unreachable(csv address) const noexcept {
  std::unique_lock lck(mtx);

  auto it = devices.find(address);
  return (it != devices.end()) && it->second.unreachable;
}

std::optional<ddp::DeviceStatus> PollTracker::status(csv address) const noexcept {
  std::unique_lock lck(mtx);

  auto it = devices.find(address);
  if (it == devices.end()) return std::nullopt;

  return it->second.status;
}

} // namespace client
} // namespace psremote
