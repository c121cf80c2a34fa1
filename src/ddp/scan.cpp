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

#include "ddp/scan.hpp"
#include "base/error.hpp"
#include "base/logger.hpp"
#include "io/io.hpp"
#include "wire/ddp_msg.hpp"

#include <algorithm>

namespace psremote {
namespace ddp {

Scan::Scan(std::unique_lock<std::mutex> lock, std::unique_ptr<io_context> io_ctx,
           std::unique_ptr<udp_socket> sock, udp_endpoint target, Millis timeout) noexcept
    : lock(std::move(lock)), io_ctx(std::move(io_ctx)), sock(std::move(sock)), target(target),
      timeout(timeout) {}

Scan &Scan::operator=(Scan &&other) noexcept {
  if (this == &other) return *this;

  close();

  // the socket must not outlive its io_context
  sock.reset();
  io_ctx.reset();

  lock = std::move(other.lock);
  io_ctx = std::move(other.io_ctx);
  sock = std::move(other.sock);
  target = other.target;
  timeout = other.timeout;
  e = other.e;
  last_ec = other.last_ec;

  return *this;
}

void Scan::close() noexcept {
  if (sock && sock->is_open()) {
    error_code ec;
    sock->close(ec);
  }

  if (lock.owns_lock()) lock.unlock();
}

void Scan::search(error_code &ec) noexcept {
  INFO_AUTO_CAT("search");

  if (!is_open()) {
    ec = error::invalid_state;
    return;
  }

  const auto msg = wire::make_search();
  sock->send_to(asio::buffer(msg), target, 0, ec);

  INFO_AUTO("{}", io::log_socket_msg(ec, *sock, target));

  e.reset();
}

void Scan::restart(error_code &ec) noexcept { search(ec); }

std::optional<ScanResult> Scan::next(error_code &ec) noexcept {
  INFO_AUTO_CAT("next");

  ec.clear();

  if (!is_open()) return std::nullopt;

  uint8v buf(wire::ddp::max_datagram);

  for (auto remaining = e.remaining(timeout); remaining > Millis::zero();
       remaining = e.remaining(timeout)) {
    udp_endpoint from;
    const auto bytes = io::receive_from(*io_ctx, *sock, buf, from, remaining, ec);

    // deadline reached, the sequence is finished
    if (ec == error::timeout) {
      ec.clear();
      break;
    }

    if (ec) {
      INFO_AUTO("receive failed, {}", ec.message());
      break;
    }

    error_code parse_ec;
    auto msg = wire::parse_status(csv(buf.raw(), bytes), parse_ec);

    if (parse_ec) {
      INFO_AUTO("{} {}, ignored", from.address().to_string(), parse_ec.message());
      continue;
    }

    if (!msg.has_value()) continue; // search request (possibly our own), ignore

    ScanResult result{from.address().to_string(), DeviceStatus::from(*msg)};
    INFO_AUTO("{} {}", result.address, result.status);

    return result;
  }

  return std::nullopt;
}

std::vector<ScanResult> Scan::collect(error_code &ec) noexcept {
  std::vector<ScanResult> results;

  for (auto result = next(ec); result.has_value(); result = next(ec)) {
    auto it = std::find_if(results.begin(), results.end(),
                           [&](const auto &r) { return r.address == result->address; });

    if (it != results.end()) {
      it->status = std::move(result->status);
    } else {
      results.emplace_back(std::move(*result));
    }
  }

  return results;
}

void Scan::iterator::advance() noexcept {
  if (scan == nullptr) {
    current.reset();
    return;
  }

  current = scan->next(scan->last_ec);
}

} // namespace ddp
} // namespace psremote
