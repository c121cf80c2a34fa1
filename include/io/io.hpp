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
#include "base/dura_t.hpp"
#include "base/elapsed.hpp"
#include "base/error.hpp"
#include "base/types.hpp"

#include <fmt/format.h>
#include <iterator>
#include <span>

namespace psremote {
namespace io {

/// @brief Run the io_context until the pending operation marks done or the
///        timeout elapses.  On timeout the operation is cancelled and the
///        io_context drained so the handler runs before returning.
/// @tparam Cancel callable that cancels the pending operation(s)
/// @param io_ctx io_context owning the operation
/// @param timeout time allowed
/// @param done set by the completion handler
/// @param ec error reported by the completion handler
/// @param cancel invoked on timeout
/// @return true when the operation completed, including one that finished
///         before the cancel took effect (its result stands)
template <typename Cancel>
bool run_for(io_context &io_ctx, Millis timeout, const bool &done, const error_code &ec,
             Cancel &&cancel) noexcept {
  io_ctx.restart();

  if (timeout > Millis::zero()) io_ctx.run_for(timeout);

  if (done) return true;

  cancel();

  io_ctx.restart();
  io_ctx.run();

  return done && (ec != asio::error::operation_aborted);
}

/// @brief Receive one datagram within the timeout
/// @param io_ctx io_context the socket was created with
/// @param sock open udp socket
/// @param buf destination (sized by the caller)
/// @param from sender of the datagram
/// @param timeout time allowed
/// @param ec error::timeout when no datagram arrived, otherwise the socket error
/// @return bytes received
inline size_t receive_from(io_context &io_ctx, udp_socket &sock, std::span<uint8_t> buf,
                           udp_endpoint &from, Millis timeout, error_code &ec) noexcept {
  bool done{false};
  size_t bytes{0};

  ec.clear();

  sock.async_receive_from(asio::buffer(buf.data(), buf.size()), from,
                          [&](const error_code &op_ec, size_t n) {
                            ec = op_ec;
                            bytes = n;
                            done = true;
                          });

  if (!run_for(io_ctx, timeout, done, ec, [&sock]() {
        error_code cancel_ec;
        sock.cancel(cancel_ec);
      })) {
    ec = error::timeout;
    return 0;
  }

  return bytes;
}

/// @brief Connect a tcp socket within the timeout
inline void connect(io_context &io_ctx, tcp_socket &sock, const tcp_endpoint &ep, Millis timeout,
                    error_code &ec) noexcept {
  bool done{false};

  ec.clear();

  sock.async_connect(ep, [&](const error_code &op_ec) {
    ec = op_ec;
    done = true;
  });

  if (!run_for(io_ctx, timeout, done, ec, [&sock]() {
        error_code close_ec;
        sock.close(close_ec);
      })) {
    ec = error::timeout;
  }
}

/// @brief Write all bytes within the timeout
inline void write(io_context &io_ctx, tcp_socket &sock, std::span<const uint8_t> bytes,
                  Millis timeout, error_code &ec) noexcept {
  bool done{false};

  ec.clear();

  asio::async_write(sock, asio::buffer(bytes.data(), bytes.size()),
                    [&](const error_code &op_ec, size_t) {
                      ec = op_ec;
                      done = true;
                    });

  if (!run_for(io_ctx, timeout, done, ec, [&sock]() {
        error_code cancel_ec;
        sock.cancel(cancel_ec);
      })) {
    ec = error::timeout;
  }
}

/// @brief Read whatever is available (at least one byte) within the timeout
inline size_t read_some(io_context &io_ctx, tcp_socket &sock, std::span<uint8_t> buf,
                        Millis timeout, error_code &ec) noexcept {
  bool done{false};
  size_t bytes{0};

  ec.clear();

  sock.async_read_some(asio::buffer(buf.data(), buf.size()),
                       [&](const error_code &op_ec, size_t n) {
                         ec = op_ec;
                         bytes = n;
                         done = true;
                       });

  if (!run_for(io_ctx, timeout, done, ec, [&sock]() {
        error_code cancel_ec;
        sock.cancel(cancel_ec);
      })) {
    ec = error::timeout;
    return 0;
  }

  return bytes;
}

/// @brief Describe a socket and its peer for logging
template <typename Socket, typename Endpoint>
const string log_socket_msg(error_code ec, Socket &sock, const Endpoint &r,
                            Elapsed e = Elapsed()) noexcept {
  e.freeze();

  string msg;
  auto w = std::back_inserter(msg);

  auto open = sock.is_open();
  fmt::format_to(w, "{} ", open ? "[OPEN]" : "[CLSD]");

  if (open) {
    error_code local_ec;
    const auto l = sock.local_endpoint(local_ec);

    fmt::format_to(w, "{:>15}:{:<5} {:>15}:{:<5}",    //
                   l.address().to_string(), l.port(), //
                   r.address().to_string(), r.port());
  }

  if (ec) fmt::format_to(w, " {}", ec.message());

  if (e > 1us) fmt::format_to(w, " {}", e.humanize());

  return msg;
}

} // namespace io
} // namespace psremote
