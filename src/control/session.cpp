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

#include "control/session.hpp"
#include "base/error.hpp"
#include "base/logger.hpp"
#include "io/io.hpp"

#include <algorithm>
#include <array>
#include <span>
#include <thread>

namespace psremote {
namespace control {

Session::Opts Session::Opts::from(const conf::token &tokc) noexcept {
  Opts opts;

  opts.port = tokc.val<Port>("port", opts.port);
  opts.max_frame = static_cast<size_t>(
      tokc.val<int64_t>("max_frame", static_cast<int64_t>(opts.max_frame)));
  opts.timeout = tokc.timeout_val("", opts.timeout);
  opts.client_name = tokc.val<string>("client_name", opts.client_name);
  opts.model = tokc.val<string>("model", opts.model);
  opts.app_version = tokc.val<string>("app_version", opts.app_version);

  return opts;
}

Session::Session(Opts opts) noexcept
    : opts(std::move(opts)), codec(this->opts.max_frame), rbuf(4096) {}

Session::~Session() noexcept { close(); }

bool Session::begin_call(std::unique_lock<std::mutex> &lck, ddp::Capabilities::Bit cap,
                         error_code &ec) noexcept {
  lck = std::unique_lock(call_mtx);

  ec.clear();

  if (_state != Ready) {
    ec = was_ready ? error::session_closed : error::not_ready;
    return false;
  }

  if (!record.capabilities.has(cap)) {
    ec = error::unsupported;
    return false;
  }

  std::unique_lock slck(sock_mtx);
  in_call = true;

  return true;
}

void Session::close() noexcept {
  INFO_AUTO_CAT("close");

  for (;;) {
    std::unique_lock call_lck(call_mtx, std::try_to_lock);

    if (call_lck.owns_lock()) {
      shutdown(true);
      return;
    }

    {
      std::unique_lock lck(sock_mtx);

      if (in_call) {
        cancelled = true;

        // the calling thread owns the io_context, close on that thread
        if (io_ctx && sock) {
          asio::post(*io_ctx, [s = sock.get()]() {
            error_code ec;
            s->close(ec);
          });
        }

        INFO_AUTO("cancel requested, state={}", state_name(_state));
        return;
      }
    }

    // a call is finishing, try again
    std::this_thread::yield();
  }
}

void Session::end_call(error_code &ec) noexcept {
  INFO_AUTO_CAT("end_call");

  bool cancel_requested{false};

  {
    std::unique_lock lck(sock_mtx);
    in_call = false;
    cancel_requested = cancelled;
  }

  if (cancel_requested) {
    if (ec) ec = error::cancelled;

    shutdown(true);
    return;
  }

  if (ec && ((_state != Ready) || error::is_fatal(ec))) {
    INFO_AUTO("{} kind={}, closing", ec.message(), error::kind(ec));
    shutdown(false);
  }
}

void Session::handshake(const pair::Credential &credential, csv pin, const Elapsed &e,
                        Millis budget, error_code &ec) noexcept {
  INFO_AUTO_CAT("handshake");

  set_state(Handshaking);

  const auto nonce = crypto::make_nonce();
  auto frame = transact(opcode::hello, hello_payload(nonce), opcode::hello_ack,
                        e.remaining(budget), ec);
  if (ec) return;

  const auto ack = parse_hello_ack(frame->payload, ec);
  if (ec) return;

  if (ack->result != 0) {
    ec = error::handshake_rejected;
    INFO_AUTO("hello result={} version=0x{:08x}", ack->result, ack->version);
    return;
  }

  auto keys = crypto::derive(nonce, ack->nonce);
  keys.local_nonce = nonce;
  keys.remote_nonce = ack->nonce;

  {
    std::unique_lock lck(sock_mtx);
    cipher = std::make_unique<crypto::Cipher>(crypto::Role::Client, keys);
  }

  keys.wipe();

  set_state(Authenticating);

  if (!credential.device_id.empty() && (credential.device_id != record.device_id)) {
    INFO_AUTO("credential device={} differs from device={}", credential.device_id,
              record.device_id);
  }

  const auto login_op = pin.empty() ? opcode::login : opcode::pin_login;
  auto payload =
      pin.empty()
          ? login_payload(credential.token, opts.client_name, opts.model, opts.app_version, ec)
          : pin_login_payload(credential.token, pin, opts.client_name, opts.model,
                              opts.app_version, ec);
  if (ec) return;

  frame = transact(login_op, std::move(payload), opcode::login_result, e.remaining(budget), ec);
  if (ec) return;

  const auto result = parse_result(frame->payload, ec);
  if (ec) return;

  if (*result != 0) {
    ec = error::login_rejected;
    INFO_AUTO("{} result={}", opcode_name(login_op), *result);
  }
}

std::optional<crypto::Keys> Session::key_material() const noexcept {
  std::unique_lock lck(sock_mtx);

  if (!cipher) return std::nullopt;

  return cipher->key_material();
}

void Session::link(const ddp::DeviceRecord &rec, const pair::Credential &credential, csv pin,
                   Millis timeout, error_code &ec) noexcept {
  INFO_AUTO_CAT("link");

  if (!valid_pin(pin)) {
    ec = error::bad_argument;
    INFO_AUTO("pin must be {} digits", field::pin);
    return;
  }

  connect(rec, credential, pin, timeout, ec);
}

void Session::open(const ddp::DeviceRecord &rec, const pair::Credential &credential,
                   Millis timeout, error_code &ec) noexcept {
  connect(rec, credential, csv(), timeout, ec);
}

void Session::connect(const ddp::DeviceRecord &rec, const pair::Credential &credential, csv pin,
                      Millis timeout, error_code &ec) noexcept {
  INFO_AUTO_CAT("open");

  std::unique_lock lck(call_mtx);

  ec.clear();

  if (_state != Closed) {
    ec = error::invalid_state;
    INFO_AUTO("state={} {}", state_name(_state), ec.message());
    return;
  }

  if (!rec.capabilities.has(ddp::Capabilities::Control)) {
    ec = error::unsupported;
    INFO_AUTO("{} {} caps={}", rec.address, ec.message(), rec.capabilities);
    return;
  }

  const auto addr = asio::ip::make_address(rec.address, ec);
  if (ec) {
    INFO_AUTO("address={} {}", rec.address, ec.message());
    return;
  }

  {
    std::unique_lock slck(sock_mtx);

    io_ctx = std::make_unique<io_context>();
    sock = std::make_unique<tcp_socket>(*io_ctx);
    in_call = true;
    cancelled = false;
  }

  record = rec;
  uuid = UUID();
  was_ready = false;
  stale.clear();
  codec.reset();

  Elapsed e;
  const tcp_endpoint ep(addr, rec.control_port ? rec.control_port : opts.port);

  set_state(Connecting);
  io::connect(*io_ctx, *sock, ep, e.remaining(timeout), ec);
  INFO_AUTO("{}", io::log_socket_msg(ec, *sock, ep, e));

  if (!ec) handshake(credential, pin, e, timeout, ec);

  if (!ec) {
    set_state(Ready);
    was_ready = true;
  }

  end_call(ec);

  if (ec) {
    INFO_AUTO("{} failed, {} kind={}", rec.address, ec.message(), error::kind(ec));
  } else {
    INFO_AUTO("{} {} ready {}", rec.address, uuid, e.humanize());
  }
}

std::optional<ddp::DeviceStatus> Session::poll_status(Millis timeout, error_code &ec) noexcept {
  INFO_AUTO_CAT("poll_status");

  std::unique_lock<std::mutex> lck;
  if (!begin_call(lck, ddp::Capabilities::StatusPoll, ec)) {
    INFO_AUTO("{}", ec.message());
    return std::nullopt;
  }

  std::optional<ddp::DeviceStatus> status;

  auto frame = transact(opcode::status, uint8v(), opcode::status_result, timeout, ec);
  if (!ec) status = parse_status_result(frame->payload, ec);

  if (status.has_value()) {
    status->device_id = record.device_id;
    status->device_name = record.name;
    status->device_type = record.device_type;
    status->system_version = record.system_version;
    status->ddp_version = record.ddp_version;
    status->control_port = record.control_port;
    status->capabilities = record.capabilities;
  }

  end_call(ec);

  if (ec) {
    INFO_AUTO("{} kind={}", ec.message(), error::kind(ec));
    return std::nullopt;
  }

  INFO_AUTO("{}", *status);

  return status;
}

std::optional<wire::Frame> Session::recv_frame(uint32_t expect, Millis timeout,
                                               error_code &ec) noexcept {
  INFO_AUTO_CAT("recv");

  Elapsed e;

  for (;;) {
    auto frame = codec.next(ec);

    // the stream can no longer be framed
    if (ec) {
      INFO_AUTO("{}, closing", ec.message());
      shutdown(false);
      return std::nullopt;
    }

    if (frame.has_value()) {
      if (cipher) {
        std::unique_lock lck(sock_mtx);
        auto opened = cipher->open(*frame, ec);
        frame = std::move(opened);
      }

      if (ec) return std::nullopt;

      // responses arrive in order, a late response precedes the one expected
      auto it = std::find_if(stale.begin(), stale.end(),
                             [op = frame->opcode](const auto &a) { return a.opcode == op; });

      if (it != stale.end()) {
        INFO_AUTO("discarded late {}", opcode_name(frame->opcode));
        if (frame->opcode == expect) own_discards++;

        stale.erase(it);
        continue;
      }

      if (frame->opcode == expect) return frame;

      if (frame->opcode == opcode::bye) {
        INFO_AUTO("peer sent bye");
        ec = asio::error::eof;
        return std::nullopt;
      }

      INFO_AUTO("expected {} received {}", opcode_name(expect), *frame);
      ec = error::unexpected_opcode;
      return std::nullopt;
    }

    const auto remaining = e.remaining(timeout);
    if (remaining <= Millis::zero()) {
      ec = error::timeout;
      return std::nullopt;
    }

    const auto bytes = io::read_some(*io_ctx, *sock, rbuf, remaining, ec);
    if (ec) return std::nullopt;

    codec.feed(std::span(rbuf.data(), bytes));
  }
}

std::optional<Ack> Session::send_command(const Command &cmd, Millis timeout,
                                         error_code &ec) noexcept {
  INFO_AUTO_CAT("send_command");

  std::unique_lock<std::mutex> lck;
  if (!begin_call(lck, cmd.capability(), ec)) {
    INFO_AUTO("{} {}", cmd, ec.message());
    return std::nullopt;
  }

  std::optional<Ack> ack;

  auto payload = cmd.payload(ec);

  if (!ec) {
    auto frame = transact(cmd.request_opcode(), std::move(payload), cmd.response_opcode(),
                          timeout, ec);

    if (!ec) {
      const auto result = parse_result(frame->payload, ec);
      if (!ec) ack.emplace(Ack{frame->opcode, *result});
    }
  }

  end_call(ec);

  if (ec) {
    INFO_AUTO("{} {} kind={}", cmd, ec.message(), error::kind(ec));
    return std::nullopt;
  }

  INFO_AUTO("{} result={}", cmd, ack->result);

  return ack;
}

void Session::send_frame(const wire::Frame &frame, Millis timeout, error_code &ec) noexcept {
  INFO_AUTO_CAT("send");

  uint8v bytes;

  if (cipher) {
    std::unique_lock lck(sock_mtx);
    bytes = cipher->seal(frame, ec);
  } else {
    bytes = wire::encode(frame);
  }

  if (ec) return;

  io::write(*io_ctx, *sock, bytes, timeout, ec);

  // a partially written frame leaves the stream misaligned
  if (ec == error::timeout) {
    INFO_AUTO("{} write timed out, closing", opcode_name(frame.opcode));
    shutdown(false);
  }
}

std::pair<uint64_t, uint64_t> Session::sequence() const noexcept {
  std::unique_lock lck(sock_mtx);

  if (!cipher) return {0, 0};

  return {cipher->tx_seq(), cipher->rx_seq()};
}

void Session::set_state(State next) noexcept {
  INFO_AUTO_CAT("state");

  const auto prev = _state.exchange(next);

  if (prev != next) INFO_AUTO("{} {} -> {}", uuid, state_name(prev), state_name(next));
}

void Session::shutdown(bool bye) noexcept {
  INFO_AUTO_CAT("shutdown");

  if (bye && (_state == Ready) && cipher && sock && sock->is_open()) {
    error_code ec;
    uint8v bytes;

    {
      std::unique_lock lck(sock_mtx);
      bytes = cipher->seal(wire::Frame(opcode::bye, uint8v()), ec);
    }

    if (!ec) io::write(*io_ctx, *sock, bytes, std::min(opts.timeout, Millis(1000)), ec);
    if (ec) INFO_AUTO("bye failed, {}", ec.message());
  }

  {
    std::unique_lock lck(sock_mtx);

    if (sock && sock->is_open()) {
      error_code ec;
      sock->shutdown(tcp_socket::shutdown_both, ec);
      sock->close(ec);
    }

    // socket first, it refers to the io_context
    sock.reset();
    io_ctx.reset();
    cipher.reset();
    cancelled = false;
  }

  codec.reset();
  stale.clear();

  set_state(Closed);
}

csv Session::state_name(State state) noexcept {
  static constexpr std::array names{"closed"sv, "connecting"sv, "handshaking"sv,
                                    "authenticating"sv, "ready"sv};

  return names[state];
}

std::optional<wire::Frame> Session::transact(uint32_t op, uint8v payload, uint32_t expect,
                                             Millis timeout, error_code &ec) noexcept {
  Elapsed e;

  // a device that never answered an abandoned call must not cost later calls
  std::erase_if(stale, [](const auto &a) { return a.age() >= a.ttl; });

  send_frame(wire::Frame(op, std::move(payload)), timeout, ec);
  if (ec) return std::nullopt;

  const auto discards = own_discards;
  auto frame = recv_frame(expect, e.remaining(timeout), ec);

  // the response may still arrive, remember to discard it unless a frame
  // with this opcode was already discarded during this call
  if ((ec == error::timeout) && (own_discards == discards)) {
    stale.emplace_back(Abandoned{expect, timeout, Elapsed()});
  }

  return frame;
}

} // namespace control
} // namespace psremote
