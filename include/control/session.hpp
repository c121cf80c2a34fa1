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
#include "base/elapsed.hpp"
#include "base/types.hpp"
#include "base/uint8v.hpp"
#include "base/uuid.hpp"
#include "control/command.hpp"
#include "crypto/cipher.hpp"
#include "ddp/device.hpp"
#include "pair/credential.hpp"
#include "wire/codec.hpp"

#include <atomic>
#include <fmt/format.h>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace psremote {
namespace control {

/// @brief Authenticated, encrypted command channel to one device.
///
///        Closed -> Connecting -> Handshaking -> Authenticating -> Ready -> Closed
///
///        Public calls block the calling thread and are serialized.  close()
///        may be called from any thread; a call blocked in I/O returns
///        cancelled.
class Session {
public:
  enum State : uint8_t { Closed = 0, Connecting, Handshaking, Authenticating, Ready };

  struct Opts {
    Port port{wire::ddp::control_port}; // used when the record has none
    size_t max_frame{wire::default_max_frame};
    Millis timeout{5s};
    string client_name{"psremote"};
    string model{"psremote"};
    string app_version{"1.0"};

    /// @brief Options from the [control] configuration table
    static Opts from(const conf::token &tokc) noexcept;
  };

public:
  explicit Session(Opts opts = Opts()) noexcept;
  ~Session() noexcept;

  Session(const Session &) = delete;
  Session &operator=(const Session &) = delete;

  /// @brief Connect, exchange nonces, derive keys and login
  /// @param record device to connect to (address, control port, capabilities)
  /// @param credential credential harvested for the device
  /// @param timeout budget for the whole open
  /// @param ec invalid_state (not Closed), unsupported, timeout, handshake_rejected,
  ///           login_rejected, cancelled or a transport error
  void open(const ddp::DeviceRecord &record, const pair::Credential &credential,
            Millis timeout, error_code &ec) noexcept;

  /// @brief Register with the device using the PIN it shows while adding a
  ///        mobile device, then continue as open() does
  /// @param pin eight digits
  /// @param ec bad_argument (pin), otherwise as open(); login_rejected when
  ///           the device refused the pin
  void link(const ddp::DeviceRecord &record, const pair::Credential &credential, csv pin,
            Millis timeout, error_code &ec) noexcept;

  /// @brief Send a command and wait for its response
  /// @return ack (result may be non-zero) when ec is clear
  std::optional<Ack> send_command(const Command &cmd, Millis timeout, error_code &ec) noexcept;

  /// @brief Request the device status over the control channel
  std::optional<ddp::DeviceStatus> poll_status(Millis timeout, error_code &ec) noexcept;

  /// @brief Send Bye (when Ready), close the socket and wipe keys.  Thread safe.
  void close() noexcept;

  State state() const noexcept { return _state.load(); }
  bool ready() const noexcept { return _state == Ready; }

  const UUID &id() const noexcept { return uuid; }
  const Opts &options() const noexcept { return opts; }

  /// @brief Copy of the active key material (empty when not Ready)
  std::optional<crypto::Keys> key_material() const noexcept;

  /// @brief Frames sealed and opened during this session
  std::pair<uint64_t, uint64_t> sequence() const noexcept;

  static csv state_name(State state) noexcept;

private:
  /// @brief Common entry for Ready-only calls, takes the call lock
  bool begin_call(std::unique_lock<std::mutex> &lck, ddp::Capabilities::Bit cap,
                  error_code &ec) noexcept;
  void end_call(error_code &ec) noexcept;

  /// @brief Shared by open() and link(), pin is empty for open()
  void connect(const ddp::DeviceRecord &rec, const pair::Credential &credential, csv pin,
               Millis timeout, error_code &ec) noexcept;

  void handshake(const pair::Credential &credential, csv pin, const Elapsed &e, Millis budget,
                 error_code &ec) noexcept;

  /// @brief Send a request and wait for the matching response frame
  std::optional<wire::Frame> transact(uint32_t op, uint8v payload, uint32_t expect,
                                      Millis timeout, error_code &ec) noexcept;

  void send_frame(const wire::Frame &frame, Millis timeout, error_code &ec) noexcept;
  std::optional<wire::Frame> recv_frame(uint32_t expect, Millis timeout, error_code &ec) noexcept;

  void set_state(State next) noexcept;

  /// @brief Release the transport and key material
  /// @param bye send Bye first (best effort) when Ready
  void shutdown(bool bye) noexcept;

private:
  // order dependent
  const Opts opts;
  wire::Codec codec;

  // order independent
  UUID uuid;
  ddp::DeviceRecord record;

  std::mutex call_mtx;         // serializes public calls
  mutable std::mutex sock_mtx; // guards in_call, cancelled and the transport pointers
  std::unique_ptr<io_context> io_ctx;
  std::unique_ptr<tcp_socket> sock;
  std::unique_ptr<crypto::Cipher> cipher;

  std::atomic<State> _state{Closed};
  bool in_call{false};
  bool cancelled{false};
  bool was_ready{false};

  // response owed to a call that timed out, forgotten by the first call
  // that begins once ttl has passed
  struct Abandoned {
    uint32_t opcode;
    Millis ttl;
    Elapsed age;
  };

  std::vector<Abandoned> stale;
  size_t own_discards{0}; // stale frames matching the opcode the call expected
  uint8v rbuf;

public:
  MOD_ID("control.session");
};

} // namespace control
} // namespace psremote

template <> struct fmt::formatter<psremote::control::Session> : formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const psremote::control::Session &s, FormatContext &ctx) const {
    const auto [tx, rx] = s.sequence();
    const auto msg =
        fmt::format("{} {} tx={} rx={}", s.id(), psremote::control::Session::state_name(s.state()),
                    tx, rx);

    return formatter<std::string_view>::format(msg, ctx);
  }
};
