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

#include "pair/exchange.hpp"
#include "base/elapsed.hpp"
#include "base/error.hpp"
#include "base/host.hpp"
#include "base/logger.hpp"
#include "io/io.hpp"

#include <array>
#include <boost/system/error_code.hpp>

namespace psremote {
namespace pair {

Exchange::Opts Exchange::Opts::from(const conf::token &tokc) noexcept {
  Opts opts;

  opts.port = tokc.val<Port>("port", opts.port);
  opts.host_id = tokc.val<string>("host_id", opts.host_id);
  opts.host_name = tokc.val<string>("host_name", opts.host_name);
  opts.host_type = tokc.val<string>("host_type", opts.host_type);
  opts.system_version = tokc.val<string>("system_version", opts.system_version);
  opts.control_port = tokc.val<Port>("control_port", opts.control_port);
  opts.timeout = tokc.timeout_val("", opts.timeout);

  return opts;
}

Exchange::Exchange(Opts opts) noexcept
    : opts(std::move(opts)), host_id(this->opts.host_id.empty() ? string(Host().device_id())
                                                                : this->opts.host_id) {}

Exchange::~Exchange() noexcept { release(); }

void Exchange::begin(csv dev_id, error_code &ec) noexcept {
  INFO_AUTO_CAT("begin");

  ec.clear();

  std::unique_lock lck(mtx);

  if (_state != Idle) {
    ec = error::invalid_state;
    INFO_AUTO("state={} {}", state_name(_state), ec.message());
    return;
  }

  io_ctx = std::make_unique<io_context>();
  sock = std::make_unique<udp_socket>(*io_ctx);

  sock->open(ip_udp::v4(), ec);
  if (!ec) sock->set_option(udp_socket::reuse_address(true), ec);
  if (!ec) sock->bind(udp_endpoint(ip_udp::v4(), opts.port), ec);

  if (ec) {
    namespace sys_errc = boost::system::errc;

    if ((ec == sys_errc::permission_denied) || (ec == sys_errc::operation_not_permitted)) {
      INFO_AUTO("port={} requires privileges, try: setcap 'cap_net_bind_service=+ep' <exe>",
                opts.port);
    } else {
      INFO_AUTO("bind port={} failed, {}", opts.port, ec.message());
    }

    lck.unlock();
    release();
    return;
  }

  device_id.assign(dev_id);
  cancelled = false;
  set_state(Listening);

  INFO_AUTO("listening port={} device={} host_id={}", local_port(), device_id, host_id);
}

void Exchange::cancel() noexcept {
  INFO_AUTO_CAT("cancel");

  std::unique_lock lck(mtx);

  cancelled = true;

  if (!sock) return;

  if (waiting) {
    // the blocked wait() owns the io_context, close on its thread
    asio::post(*io_ctx, [s = sock.get()]() {
      error_code ec;
      s->close(ec);
    });
    INFO_AUTO("requested, state={}", state_name(_state));
    return;
  }

  // nothing blocked in wait(), give back the port and return to idle
  error_code ec;
  sock->close(ec);
  sock.reset();
  io_ctx.reset();
  device_id.clear();

  set_state(Idle);
  INFO_AUTO("released before wait");
}

std::optional<Credential> Exchange::exchange(csv dev_id, Millis timeout, error_code &ec) noexcept {
  begin(dev_id, ec);
  if (ec) return std::nullopt;

  auto credential = wait(timeout, ec);

  reset();

  return credential;
}

std::optional<Credential> Exchange::handle(csv datagram, const udp_endpoint &from) noexcept {
  INFO_AUTO_CAT("handle");

  const auto type = wire::request_type(datagram);

  if (!type.has_value()) {
    INFO_AUTO("{} not a request, ignored", from.address().to_string());
    return std::nullopt;
  }

  if (*type == wire::DdpType::Search) {
    const auto reply = status_reply();

    error_code ec;
    sock->send_to(asio::buffer(reply), from, 0, ec);
    INFO_AUTO("{}", io::log_socket_msg(ec, *sock, from));

    if (!ec) {
      set_state(Challenged);
      set_state(WaitCredential);
    }

    return std::nullopt;
  }

  if (_state != WaitCredential) {
    INFO_AUTO("{} before search, ignored", wire::type_name(*type));
    return std::nullopt;
  }

  error_code ec;
  auto token = wire::extract_credential(datagram, ec);

  if (ec || token.empty()) {
    INFO_AUTO("{} {}, ignored", wire::type_name(*type), ec ? ec.message() : "empty credential");
    return std::nullopt;
  }

  return Credential{std::move(token), device_id};
}

Port Exchange::local_port() const noexcept {
  std::unique_lock lck(mtx);

  if (!sock || !sock->is_open()) return ANY_PORT;

  error_code ec;
  const auto ep = sock->local_endpoint(ec);

  return ec ? ANY_PORT : ep.port();
}

void Exchange::release() noexcept {
  std::unique_lock lck(mtx);

  if (sock && sock->is_open()) {
    error_code ec;
    sock->close(ec);
  }

  sock.reset();
  io_ctx.reset();
}

void Exchange::reset() noexcept {
  INFO_AUTO_CAT("reset");

  const auto prev = _state.load();

  if ((prev == Complete) || (prev == Timeout) || (prev == Idle)) {
    release();
    device_id.clear();
    set_state(Idle);
  } else {
    INFO_AUTO("state={} in progress, ignored", state_name(prev));
  }
}

void Exchange::set_state(State next) noexcept {
  INFO_AUTO_CAT("state");

  const auto prev = _state.exchange(next);

  if (prev != next) INFO_AUTO("{} -> {}", state_name(prev), state_name(next));
}

csv Exchange::state_name(State state) noexcept {
  static constexpr std::array names{"idle"sv,     "listening"sv, "challenged"sv,
                                    "wait_cred"sv, "complete"sv, "timeout"sv};

  return names[state];
}

string Exchange::status_reply() const noexcept {
  return wire::make_status(wire::ddp::status_standby, "Server Standby",
                           {{string(wire::ddp_key::host_id), host_id},
                            {string(wire::ddp_key::host_type), opts.host_type},
                            {string(wire::ddp_key::host_name), opts.host_name},
                            {string(wire::ddp_key::host_request_port),
                             fmt::format("{}", opts.control_port)},
                            {string(wire::ddp_key::system_version), opts.system_version}});
}

std::optional<Credential> Exchange::wait(Millis timeout, error_code &ec) noexcept {
  INFO_AUTO_CAT("wait");

  ec.clear();

  {
    std::unique_lock lck(mtx);

    // cancel() arrived between begin() and wait()
    if (!sock && cancelled) {
      ec = error::cancelled;
      INFO_AUTO("{}", ec.message());
      return std::nullopt;
    }

    if (!sock || ((_state != Listening) && (_state != Challenged) && (_state != WaitCredential))) {
      ec = error::invalid_state;
      INFO_AUTO("state={} {}", state_name(_state), ec.message());
      return std::nullopt;
    }

    if (cancelled) ec = error::cancelled;

    waiting = true;
  }

  Elapsed e;
  uint8v buf(wire::ddp::max_datagram);
  std::optional<Credential> credential;

  while (!ec && !credential.has_value()) {
    const auto remaining = e.remaining(timeout);

    if (remaining <= Millis::zero()) {
      ec = error::timeout;
      break;
    }

    udp_endpoint from;
    const auto bytes = io::receive_from(*io_ctx, *sock, buf, from, remaining, ec);

    if (cancelled) {
      ec = error::cancelled;
      break;
    }

    if (ec) break;

    credential = handle(csv(buf.raw(), bytes), from);
  }

  waiting = false;
  release();

  if (credential.has_value()) {
    set_state(Complete);
    INFO_AUTO("{} {}", *credential, e.humanize());
  } else if (ec == error::timeout) {
    set_state(Timeout);
    INFO_AUTO("no credential after {}", e.humanize());
  } else {
    set_state(Idle);
    INFO_AUTO("{} kind={}", ec.message(), error::kind(ec));
  }

  return credential;
}

} // namespace pair
} // namespace psremote
