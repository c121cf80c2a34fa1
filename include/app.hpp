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
#include "base/types.hpp"
#include "client/collab.hpp"
#include "client/device_client.hpp"

#include <atomic>
#include <boost/asio/signal_set.hpp>
#include <memory>
#include <optional>
#include <thread>

namespace psremote {

/// @brief psremote Application Object
class App {
public:
  /// @brief Construct the App object.
  ///        CLI arguments have already been handled and
  ///        the command is on the cusp of running.
  App() noexcept;
  ~App() noexcept;

  /// @brief Similar to 'C' main.  Runs the requested command and returns
  ///        the process exit code.
  int main();

private:
  // commands
  int link();
  int pair_cmd();
  int poll();
  int remote();
  int search();
  int standby();
  int start();
  int status();
  int wakeup();
  int watch();

  /// @brief Saved (or --ip / --credential) device with a refreshed record
  std::optional<client::Paired> paired(error_code &ec);

  /// @brief Address from --ip, the only saved device or the only device
  ///        answering a search
  std::optional<string> address(error_code &ec);

  /// @brief Connect to the paired device then send one command
  int command(const control::Command &cmd);

  Millis timeout(Millis def) const noexcept;

  static int failed(csv what, const error_code &ec) noexcept;

private:
  // order dependent
  io_context io_ctx;
  asio::signal_set ss_shutdown;
  client::DeviceClient client;

  // order independent
  std::atomic_bool stopping{false}; // set by SIGINT / SIGTERM
  std::jthread thread;

public:
  MOD_ID("app");
};

} // namespace psremote
