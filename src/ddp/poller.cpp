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

#include "ddp/poller.hpp"
#include "base/error.hpp"
#include "base/logger.hpp"
#include "io/io.hpp"

#include <array>

namespace psremote {
namespace ddp {

Poller::Opts Poller::Opts::from(const conf::token &tokc) noexcept {
  Opts opts;

  opts.port = tokc.val<Port>("port", opts.port);
  opts.local_port = tokc.val<Port>("local_port", opts.local_port);
  opts.timeout = tokc.timeout_val("", opts.timeout);

  return opts;
}

error_code Poller::open_socket(udp_socket &sock, Port local_port) noexcept {
  INFO_AUTO_CAT("open_socket");

  error_code ec;

  // as the original companion tooling does: try the well known source port
  // once then fall back to an ephemeral port
  for (auto port : std::array{local_port, ANY_PORT}) {
    if (sock.is_open()) sock.close(ec);

    sock.open(ip_udp::v4(), ec);
    if (ec) return ec;

    sock.set_option(udp_socket::reuse_address(true), ec);
    if (!ec) sock.set_option(asio::socket_base::broadcast(true), ec);
    if (ec) return ec;

    sock.bind(udp_endpoint(ip_udp::v4(), port), ec);

    if (!ec) break;

    INFO_AUTO("bind port={} failed, {}", port, ec.message());

    if (port == ANY_PORT) return ec;
  }

  return ec;
}

std::optional<DeviceStatus> Poller::probe(csv address, Millis timeout, error_code &ec) noexcept {
  INFO_AUTO_CAT("probe");

  std::unique_lock lck(mtx, std::try_to_lock);
  if (!lck.owns_lock()) {
    ec = error::busy;
    return std::nullopt;
  }

  const auto addr = asio::ip::make_address(address, ec);
  if (ec) return std::nullopt;

  io_context io_ctx;
  udp_socket sock(io_ctx);

  if (ec = open_socket(sock, opts.local_port); ec) return std::nullopt;

  const udp_endpoint target(addr, opts.port);
  const auto msg = wire::make_search();

  sock.send_to(asio::buffer(msg), target, 0, ec);
  INFO_AUTO("{}", io::log_socket_msg(ec, sock, target));

  if (ec) return std::nullopt;

  Elapsed e;
  uint8v buf(wire::ddp::max_datagram);

  for (auto remaining = e.remaining(timeout); remaining > Millis::zero();
       remaining = e.remaining(timeout)) {
    udp_endpoint from;
    const auto bytes = io::receive_from(io_ctx, sock, buf, from, remaining, ec);

    if (ec) break;

    // first status reply from the probed address wins
    if (from.address() != addr) continue;

    auto status_msg = wire::parse_status(csv(buf.raw(), bytes), ec);

    if (ec) break;
    if (!status_msg.has_value()) continue; // a search echo, ignore

    auto status = DeviceStatus::from(*status_msg);
    INFO_AUTO("{} {}", address, status);

    return status;
  }

  if (!ec) ec = error::timeout;

  INFO_AUTO("{} failed, {}", address, ec.message());

  return std::nullopt;
}

Scan Poller::scan(csv broadcast, Millis timeout, error_code &ec) noexcept {
  INFO_AUTO_CAT("scan");

  std::unique_lock lck(mtx, std::try_to_lock);
  if (!lck.owns_lock()) {
    ec = error::busy;
    return Scan();
  }

  const auto addr = asio::ip::make_address(broadcast, ec);
  if (ec) return Scan();

  auto io_ctx = std::make_unique<io_context>();
  auto sock = std::make_unique<udp_socket>(*io_ctx);

  if (ec = open_socket(*sock, opts.local_port); ec) return Scan();

  Scan scan(std::move(lck), std::move(io_ctx), std::move(sock), udp_endpoint(addr, opts.port),
            timeout);

  scan.search(ec);

  return scan;
}

void Poller::send_only(csv address, const string &msg, error_code &ec) noexcept {
  INFO_AUTO_CAT("send");

  const auto addr = asio::ip::make_address(address, ec);
  if (ec) return;

  io_context io_ctx;
  udp_socket sock(io_ctx);

  if (ec = open_socket(sock, opts.local_port); ec) return;

  const udp_endpoint target(addr, opts.port);
  sock.send_to(asio::buffer(msg), target, 0, ec);

  INFO_AUTO("{}", io::log_socket_msg(ec, sock, target));
}

void Poller::wakeup(csv address, csv credential, error_code &ec) noexcept {
  send_only(address, wire::make_wakeup(credential), ec);
}

void Poller::launch(csv address, csv credential, error_code &ec) noexcept {
  send_only(address, wire::make_launch(credential), ec);
}

} // namespace ddp
} // namespace psremote
