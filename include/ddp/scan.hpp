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
#include "base/types.hpp"
#include "base/uint8v.hpp"
#include "ddp/device.hpp"

#include <cstddef>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace psremote {
namespace ddp {

/// @brief One reply received during a scan
struct ScanResult {
  string address;
  DeviceStatus status;
};

/// @brief Lazy, finite, restartable sequence of discovery replies.
///
///        Created by Poller::scan().  Replies are yielded in arrival order
///        until the deadline; a device answering more than once is yielded
///        again (an update).  The Poller remains busy while the Scan exists.
class Scan {
public:
  /// @brief Input iterator over the remaining replies
  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = ScanResult;
    using difference_type = std::ptrdiff_t;
    using pointer = const ScanResult *;
    using reference = const ScanResult &;

    iterator() = default;
    explicit iterator(Scan *scan) noexcept : scan(scan) { advance(); }

    reference operator*() const noexcept { return *current; }
    pointer operator->() const noexcept { return &(*current); }

    iterator &operator++() noexcept {
      advance();
      return *this;
    }

    void operator++(int) noexcept { advance(); }

    bool operator==(const iterator &rhs) const noexcept {
      return !current.has_value() && !rhs.current.has_value();
    }

  private:
    void advance() noexcept;

  private:
    Scan *scan{nullptr};
    std::optional<ScanResult> current;
  };

public:
  /// @brief An empty scan (yields nothing)
  Scan() = default;

  Scan(std::unique_lock<std::mutex> lock, std::unique_ptr<io_context> io_ctx,
       std::unique_ptr<udp_socket> sock, udp_endpoint target, Millis timeout) noexcept;

  Scan(Scan &&) = default;

  /// @brief Closes this scan (socket before io_context) then takes other's
  Scan &operator=(Scan &&other) noexcept;

  ~Scan() noexcept { close(); }

  /// @brief Next reply in arrival order
  /// @param ec socket error (the sequence ends)
  /// @return reply or std::nullopt once the deadline passed
  std::optional<ScanResult> next(error_code &ec) noexcept;

  /// @brief Drain the sequence, de-duplicated by address
  ///        (last reply wins, first arrival order)
  std::vector<ScanResult> collect(error_code &ec) noexcept;

  /// @brief Send the search again and reset the deadline
  void restart(error_code &ec) noexcept;

  /// @brief Send the search (initial and restart)
  void search(error_code &ec) noexcept;

  /// @brief Iteration yields every reply, so a device answering twice
  ///        appears twice; collect() yields each device once
  iterator begin() noexcept { return iterator(this); }
  iterator end() noexcept { return iterator(); }

  /// @brief Error that ended iteration via begin()/end() (if any)
  const error_code &error() const noexcept { return last_ec; }

  bool is_open() const noexcept { return sock && sock->is_open(); }

  void close() noexcept;

private:
  // order dependent
  std::unique_lock<std::mutex> lock;
  std::unique_ptr<io_context> io_ctx;
  std::unique_ptr<udp_socket> sock;

  // order independent
  udp_endpoint target;
  Millis timeout{0};
  Elapsed e;
  error_code last_ec;

public:
  MOD_ID("ddp.scan");
};

} // namespace ddp
} // namespace psremote
