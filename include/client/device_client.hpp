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

#include "base/asio.hpp"
#include "base/conf/token.hpp"
#include "base/dura_t.hpp"
#include "base/types.hpp"
#include "client/collab.hpp"
#include "client/poll_tracker.hpp"
#include "control/command.hpp"
#include "control/session.hpp"
#include "ddp/device.hpp"
#include "ddp/poller.hpp"
#include "ddp/scan.hpp"
#include "pair/credential.hpp"
#include "pair/exchange.hpp"

#include <memory>
#include <mutex>
#include <optional>

namespace psremote {
namespace client {

/// @brief One handle per device composing discovery, pairing and the
///        control session
class DeviceClient {
public:
  struct Opts {
    ddp::Poller::Opts ddp;
    pair::Exchange::Opts pair;
    control::Session::Opts control;
    PollTracker::Opts poll;

    /// @brief Options from the [ddp], [pair], [control] and [poll] configuration tables
    static Opts from_config() noexcept;
  };

public:
  explicit DeviceClient(Opts opts = Opts()) noexcept;
  ~DeviceClient() noexcept;

  DeviceClient(const DeviceClient &) = delete;
  DeviceClient &operator=(const DeviceClient &) = delete;

  // discovery
  ddp::Scan discover(csv broadcast, Millis timeout, error_code &ec) noexcept;
  std::optional<ddp::DeviceStatus> probe(csv address, Millis timeout, error_code &ec) noexcept;
  void wakeup(const ddp::DeviceRecord &record, const pair::Credential &credential,
              error_code &ec) noexcept;

  /// @brief Probe a device polled repeatedly, tracking its liveness
  ///
  ///        While the device is in its standby quiet period no poll is sent
  ///        and the last status is returned.
  /// @return status, empty with ec set when the device did not answer
  std::optional<ddp::DeviceStatus> track(csv address, Millis timeout, error_code &ec) noexcept;

  const PollTracker &polls() const noexcept { return tracker; }

  // pairing
  std::optional<pair::Credential> pair(const ddp::DeviceRecord &record, Millis timeout,
                                       error_code &ec) noexcept;

  /// @brief Abort a pending pair() from another thread
  void cancel_pair() noexcept { exchange.cancel(); }

  /// @brief Open a control session, closing any previous one
  /// @return Ready session or nullptr (ec set)
  std::shared_ptr<control::Session> connect(const ddp::DeviceRecord &record,
                                            const pair::Credential &credential, Millis timeout,
                                            error_code &ec) noexcept;

  /// @brief Register with the device using the PIN it shows, then close
  /// @param ec bad_argument (pin), login_rejected (wrong pin or credential),
  ///           otherwise the device is not on or not reachable
  void link(const ddp::DeviceRecord &record, const pair::Credential &credential, csv pin,
            Millis timeout, error_code &ec) noexcept;

  // control, forwarded to the open session
  std::optional<control::Ack> send_command(const control::Command &cmd, Millis timeout,
                                           error_code &ec) noexcept;
  std::optional<ddp::DeviceStatus> poll_status(Millis timeout, error_code &ec) noexcept;

  /// @brief Close the open session (if any)
  void disconnect() noexcept;

  std::shared_ptr<control::Session> session() const noexcept;

  const Opts &options() const noexcept { return opts; }

private:
  std::shared_ptr<control::Session> start(const ddp::DeviceRecord &record,
                                          const pair::Credential &credential, csv pin,
                                          Millis timeout, error_code &ec) noexcept;

private:
  // order dependent
  const Opts opts;
  ddp::Poller poller;
  pair::Exchange exchange;
  PollTracker tracker;

  // order independent
  mutable std::mutex mtx; // guards the session pointer
  std::shared_ptr<control::Session> _session;

public:
  MOD_ID("client");
};

} // namespace client
} // namespace psremote
