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
#include "ddp/device.hpp"
#include "ddp/scan.hpp"
#include "wire/ddp_msg.hpp"

#include <memory>
#include <mutex>
#include <optional>

namespace psremote {
namespace ddp {

/// @brief Discovery and status polling over UDP (DDP).
///
///        Every operation opens its own socket which is released on every
///        exit path.  Probe and scan are mutually exclusive on one Poller;
///        a Scan holds the Poller busy until it is destroyed.
class Poller {
public:
  struct Opts {
    Port port{wire::ddp::port};             // console ddp port
    Port local_port{wire::ddp::local_port}; // source port (0 for ephemeral)
    Millis timeout{3s};

    /// @brief Options from the [ddp] configuration table
    static Opts from(const conf::token &tokc) noexcept;
  };

public:
  explicit Poller(Opts opts = Opts()) noexcept : opts(opts) {}

  Poller(const Poller &) = delete;
  Poller &operator=(const Poller &) = delete;

  /// @brief Send one search to address and wait for its status reply
  /// @param address console ip address
  /// @param timeout time allowed for the reply
  /// @param ec timeout, malformed_status, busy or a socket error
  /// @return status of the console
  std::optional<DeviceStatus> probe(csv address, Millis timeout, error_code &ec) noexcept;

  /// @brief Broadcast one search and return a lazy sequence of replies
  /// @param broadcast broadcast (or unicast) address
  /// @param timeout deadline for the sequence
  /// @param ec busy or a socket error (the returned Scan is then empty)
  /// @return Scan
  Scan scan(csv broadcast, Millis timeout, error_code &ec) noexcept;

  /// @brief Send a WAKEUP datagram, no reply is expected
  void wakeup(csv address, csv credential, error_code &ec) noexcept;

  /// @brief Send a LAUNCH datagram, no reply is expected
  void launch(csv address, csv credential, error_code &ec) noexcept;

  const Opts &options() const noexcept { return opts; }

  /// @brief Open a UDP socket bound to local_port (falling back to an
  ///        ephemeral port) with address reuse and broadcast enabled
  static error_code open_socket(udp_socket &sock, Port local_port) noexcept;

private:
  void send_only(csv address, const string &msg, error_code &ec) noexcept;

private:
  const Opts opts;
  std::mutex mtx;

public:
  MOD_ID("ddp.poller");
};

} // namespace ddp
} // namespace psremote
