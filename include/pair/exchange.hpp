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
#include "pair/credential.hpp"
#include "wire/ddp_msg.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>

namespace psremote {
namespace pair {

/// @brief Impersonates a console on the DDP port so the official companion
///        app reveals the credential it would use to wake the console.
///
///        Idle -> Listening (begin) -> Challenged (SRCH answered)
///             -> WaitCredential -> Complete | Timeout
///
///        The socket is released on every exit from wait().
class Exchange {
public:
  enum State : uint8_t { Idle = 0, Listening, Challenged, WaitCredential, Complete, Timeout };

  struct Opts {
    Port port{wire::ddp::port}; // privileged on most systems
    string host_id;             // empty: this host's hardware address
    string host_name{"psremote"};
    string host_type{"PS5"};
    string system_version{"07020001"};
    Port control_port{wire::ddp::control_port};
    Millis timeout{120s};

    /// @brief Options from the [pair] configuration table
    static Opts from(const conf::token &tokc) noexcept;
  };

public:
  explicit Exchange(Opts opts = Opts()) noexcept;
  ~Exchange() noexcept;

  Exchange(const Exchange &) = delete;
  Exchange &operator=(const Exchange &) = delete;

  /// @brief Bind the exchange port and start listening
  /// @param device_id device the harvested credential will be scoped to
  /// @param ec invalid_state when not Idle, permission_denied when the port
  ///           is privileged, other socket errors
  void begin(csv device_id, error_code &ec) noexcept;

  /// @brief Run the exchange until a credential arrives or the timeout elapses
  /// @param timeout time allowed
  /// @param ec timeout, cancelled, invalid_state or a socket error
  /// @return credential when Complete
  std::optional<Credential> wait(Millis timeout, error_code &ec) noexcept;

  /// @brief begin() + wait() + reset()
  std::optional<Credential> exchange(csv device_id, Millis timeout, error_code &ec) noexcept;

  /// @brief Abort a pending wait() from any thread (it returns cancelled);
  ///        before wait() the socket is released and the state returns to Idle
  void cancel() noexcept;

  /// @brief Return from Complete / Timeout to Idle
  void reset() noexcept;

  State state() const noexcept { return _state.load(); }

  /// @brief Port actually bound while listening (0 when not bound)
  Port local_port() const noexcept;

  const Opts &options() const noexcept { return opts; }

  static csv state_name(State state) noexcept;

private:
  /// @brief Handle one datagram, returns the credential when harvested
  std::optional<Credential> handle(csv datagram, const udp_endpoint &from) noexcept;

  void release() noexcept;
  void set_state(State next) noexcept;
  string status_reply() const noexcept;

private:
  // order dependent
  const Opts opts;
  string host_id;

  // order independent
  mutable std::mutex mtx; // guards sock lifecycle vs cancel()
  std::unique_ptr<io_context> io_ctx;
  std::unique_ptr<udp_socket> sock;
  std::atomic<State> _state{Idle};
  std::atomic_bool waiting{false};
  std::atomic_bool cancelled{false};
  string device_id;

public:
  MOD_ID("pair.exchange");
};

} // namespace pair
} // namespace psremote
