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

#include "app.hpp"
#include "base/conf/cli_args.hpp"
#include "base/conf/fixed.hpp"
#include "base/conf/keys.hpp"
#include "base/crypto.hpp"
#include "base/elapsed.hpp"
#include "base/error.hpp"
#include "base/host.hpp"
#include "base/logger.hpp"
#include "base/types.hpp"
#include "control/command.hpp"
#include "store/games_file.hpp"
#include "store/json_store.hpp"

#include <algorithm>
#include <array>
#include <csignal>
#include <cstdio>
#include <exception>
#include <fmt/format.h>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <utility>

using namespace std::string_view_literals;

/// @brief primary entry point for application
/// @param argc number of cli args
/// @param argv actual cli args
/// @return exit code returned to starting process
int main(int argc, char *argv[]) {
  using namespace psremote;

  int rc{1}; // exit code, default to failed

  // initialize sodium and gcrypt
  try {
    crypto::init();
  } catch (const std::runtime_error &e) {
    std::cerr << e.what() << std::endl;
    return rc;
  }

  // handle cli args
  conf::cli_args cli(argc, argv);

  if (conf::cli_args::help()) {
    std::cout << conf::cli_args::usage() << std::endl;
    return 0;
  }

  if (!conf::cli_args::nominal_start()) {
    std::cout << conf::cli_args::failure() << std::endl;
    return rc;
  }

  // logging is opt-in for a command line tool
  if (conf::cli_args::debug() || conf::cli_args::table().contains(conf::key::log_file)) {
    try {
      Logger::create();
    } catch (const std::system_error &e) {
      std::cerr << "logger: " << e.what() << std::endl;
      return rc;
    }
  }

  {
    App app;
    rc = app.main();
  }

  Logger::shutdown();

  return rc;
}

namespace psremote {

namespace {

template <typename T> T cli_val(const char *k, T def) noexcept {
  return conf::cli_args::table()[k].value_or(std::move(def));
}

client::DeviceClient::Opts client_opts() noexcept {
  auto opts = client::DeviceClient::Opts::from_config();

  if (auto port = cli_val<int64_t>(conf::key::port, 0); port > 0) {
    opts.ddp.port = static_cast<Port>(port);
  }

  return opts;
}

void print_device(const ddp::DeviceRecord &rec, const ddp::DeviceStatus &s) noexcept {
  fmt::print("{:<15} {:<20} {:<14} {:<8} {} {}\n", rec.address, s.device_name, s.device_id,
             s.power, s.title_id, s.title_name);
}

void print_status(csv address, const ddp::DeviceStatus &s) noexcept {
  fmt::print("\nstatus for {} ({})\n", s.device_name, address);
  fmt::print("{:<36} {}\n", "power", s.power);
  fmt::print("{:<36} {} {}\n", "status", s.status_code, s.status_text);
  fmt::print("{:<36} {}\n", "capabilities", s.capabilities);

  for (const auto &[key, val] : s.fields) {
    fmt::print("{:<36} {}\n", key, val);
  }
}

} // namespace

App::App() noexcept : ss_shutdown(io_ctx, SIGINT, SIGTERM), client(client_opts()) {

  // a signal aborts whatever the command is blocked on
  ss_shutdown.async_wait([this](const error_code &ec, int sig) {
    INFO_AUTO_CAT("ss_shutdown");

    if (ec) return;

    INFO_AUTO("caught signal({}), cancelling", sig);

    stopping = true;
    client.cancel_pair();
    client.disconnect();
  });

  thread = std::jthread([this]() { io_ctx.run(); });
}

App::~App() noexcept {
  error_code ec;
  ss_shutdown.cancel(ec);

  io_ctx.stop();
}

std::optional<string> App::address(error_code &ec) {
  ec.clear();

  if (auto ip = cli_val<string>(conf::key::ip, string()); !ip.empty()) return ip;

  auto store = store::JsonStore::from_config();
  auto devices = store.load(ec);
  if (ec) return std::nullopt;

  if (devices.size() == 1) return devices.front().first.address;

  if (devices.size() > 1) {
    fmt::print("multiple devices saved in {}, use --ip\n", store.file().string());
    ec = error::bad_argument;
    return std::nullopt;
  }

  // nothing saved, search the local network
  std::vector<string> found;

  for (const auto &bcast : Host().broadcast_addresses()) {
    auto scan = client.discover(bcast, timeout(client.options().ddp.timeout), ec);
    if (ec) return std::nullopt;

    for (const auto &r : scan.collect(ec)) {
      if (std::find(found.begin(), found.end(), r.address) == found.end()) {
        found.emplace_back(r.address);
      }
    }

    if (ec) return std::nullopt;
  }

  if (found.size() == 1) return found.front();

  fmt::print("{} devices found, use --ip\n", found.size());
  ec = error::bad_argument;

  return std::nullopt;
}

int App::command(const control::Command &cmd) {
  error_code ec;

  auto p = paired(ec);
  if (!p.has_value()) return failed("device", ec);

  const auto &[rec, cred] = *p;
  const auto op_timeout = timeout(client.options().control.timeout);

  auto session = client.connect(rec, cred, op_timeout, ec);
  if (!session) return failed("connect", ec);

  auto ack = client.send_command(cmd, op_timeout, ec);

  client.disconnect();

  if (!ack.has_value()) return failed(fmt::format("{}", cmd), ec);

  fmt::print("{} {} result={}\n", rec.address, cmd, ack->result);

  return ack->ok() ? 0 : 1;
}

int App::failed(csv what, const error_code &ec) noexcept {
  const auto kind = error::kind(ec);

  fmt::print("{} failed: {} ({})\n", what, ec.message(), kind);

  if (kind == ErrorKind::Permission) {
    fmt::print("binding privileged ports requires: setcap 'cap_net_bind_service=+ep' {}\n",
               (conf::fixed::exec_dir() / std::filesystem::path(conf::fixed::app_name())).string());
  } else if (kind == ErrorKind::Auth) {
    fmt::print("the credential was rejected, run 'pair' again\n");
  }

  return 1;
}

int App::main() {
  INFO_AUTO_CAT("main");

  using cmd_fn = int (App::*)();

  static constexpr std::array cmds{
      std::pair{"link"sv, &App::link},       std::pair{"pair"sv, &App::pair_cmd},
      std::pair{"poll"sv, &App::poll},       std::pair{"remote"sv, &App::remote},
      std::pair{"search"sv, &App::search},   std::pair{"standby"sv, &App::standby},
      std::pair{"start"sv, &App::start},     std::pair{"status"sv, &App::status},
      std::pair{"wakeup"sv, &App::wakeup},   std::pair{"watch"sv, &App::watch}};

  const auto name = conf::cli_args::command();

  auto it = std::find_if(cmds.begin(), cmds.end(), [&](const auto &c) { return c.first == name; });

  if (it == cmds.end()) {
    fmt::print("unknown command '{}', see --help\n", name);
    return 1;
  }

  INFO_AUTO("{} {}", name, conf::fixed::git());

  cmd_fn fn = it->second;

  return (this->*fn)();
}

int App::link() {
  error_code ec;

  auto p = paired(ec);
  if (!p.has_value()) return failed("device", ec);

  auto pin = conf::cli_args::arg();

  if (pin.empty()) {
    fmt::print("On the console go to:\n\nSettings -> Mobile App Connection Settings -> "
               "Add Device\n\nEnter the PIN displayed:\n> ");
    std::fflush(stdout);
    std::getline(std::cin, pin);
  }

  std::erase(pin, ' ');

  if (!control::valid_pin(pin)) {
    fmt::print("PIN invalid, must be 8 digits\n");
    return 1;
  }

  const auto &[rec, cred] = *p;

  client.link(rec, cred, pin, timeout(client.options().control.timeout), ec);

  if (ec) {
    if (error::kind(ec) == ErrorKind::Auth) {
      fmt::print("login failed, check the PIN and try again\n");
    } else if (error::kind(ec) != ErrorKind::Cancelled) {
      fmt::print("console not on or not connected\n");
    }

    return failed("link", ec);
  }

  fmt::print("{} linked\n", rec.address);

  auto store = store::JsonStore::from_config();
  store.save(rec, cred, ec);
  if (ec) return failed("save", ec);

  fmt::print("{} saved to: {}\n", rec.address, store.file().string());

  return 0;
}

int App::pair_cmd() {
  error_code ec;
  ddp::DeviceRecord rec;

  // pairing works without a known device, the credential is then unscoped
  if (auto addr = address(ec); addr.has_value()) {
    if (auto s = client.probe(*addr, timeout(client.options().ddp.timeout), ec); s.has_value()) {
      rec = ddp::DeviceRecord::from(*addr, *s);
    }
  }

  if (ec) fmt::print("no device selected ({}), the credential will not be saved\n", ec.message());

  fmt::print("\nWith the companion app, refresh devices and select '{}'.\n",
             client.options().pair.host_name);
  fmt::print("To cancel press 'CTRL + C'.\n\n");

  auto cred = client.pair(rec, timeout(client.options().pair.timeout), ec);
  if (!cred.has_value()) return failed("pair", ec);

  fmt::print("credential is: '{}'\n", cred->token);

  if (rec.address.empty()) return 0;

  auto store = store::JsonStore::from_config();
  store.save(rec, *cred, ec);
  if (ec) return failed("save", ec);

  fmt::print("{} saved to: {}\n", rec.address, store.file().string());

  return 0;
}

std::optional<client::Paired> App::paired(error_code &ec) {
  auto addr = address(ec);
  if (!addr.has_value()) return std::nullopt;

  auto store = store::JsonStore::from_config();
  auto saved = store.find(*addr, ec);
  if (ec) return std::nullopt;

  auto token = cli_val<string>(conf::key::credential, string());
  if (token.empty() && saved.has_value()) token = saved->second.token;

  if (token.empty()) {
    fmt::print("no credential for {}, run 'pair' or use --credential\n", *addr);
    ec = error::bad_argument;
    return std::nullopt;
  }

  // refresh the record, a device in standby still answers
  error_code probe_ec;
  auto s = client.probe(*addr, timeout(client.options().ddp.timeout), probe_ec);

  ddp::DeviceRecord rec;

  if (saved.has_value()) {
    rec = saved->first;
    if (s.has_value()) rec.update_from(*s);
  } else if (s.has_value()) {
    rec = ddp::DeviceRecord::from(*addr, *s);
  } else {
    ec = probe_ec;
    return std::nullopt;
  }

  return client::Paired(rec, pair::Credential{token, rec.device_id});
}

int App::poll() {
  error_code ec;

  auto p = paired(ec);
  if (!p.has_value()) return failed("device", ec);

  const auto &[rec, cred] = *p;
  const auto op_timeout = timeout(client.options().control.timeout);

  if (!client.connect(rec, cred, op_timeout, ec)) return failed("connect", ec);

  auto s = client.poll_status(op_timeout, ec);

  client.disconnect();

  if (!s.has_value()) return failed("poll", ec);

  print_device(rec, *s);

  return 0;
}

int App::remote() {
  error_code ec;

  const auto key = conf::cli_args::arg();
  auto key_press = control::parse_key(key, ec);

  if (!key_press.has_value()) {
    fmt::print("keys: up down right left enter back option ps ps_hold key_off cancel "
               "open_rc close_rc\n");
    return failed(fmt::format("remote '{}'", key), ec);
  }

  return command(control::Command::remote(*key_press));
}

int App::search() {
  error_code ec;
  size_t found{0};

  std::vector<string> targets;

  if (auto ip = cli_val<string>(conf::key::ip, string()); !ip.empty()) {
    targets.emplace_back(std::move(ip));
  } else {
    targets = Host().broadcast_addresses();
  }

  if (targets.empty()) targets.emplace_back("255.255.255.255");

  for (const auto &target : targets) {
    auto scan = client.discover(target, timeout(client.options().ddp.timeout), ec);
    if (ec) return failed("search", ec);

    for (const auto &r : scan.collect(ec)) {
      print_device(ddp::DeviceRecord::from(r.address, r.status), r.status);
      found++;
    }

    if (ec) return failed("search", ec);
  }

  fmt::print("found {} device(s)\n", found);

  return 0;
}

int App::standby() { return command(control::Command::standby()); }

int App::start() {
  const auto title_id = conf::cli_args::arg();
  const auto region = cli_val<string>(conf::key::region, string("US"));

  if (auto info = store::GamesFile::from_config().lookup(title_id, region); info.has_value()) {
    fmt::print("starting {} '{}'\n", title_id, info->title);
  } else {
    fmt::print("starting {}\n", title_id);
  }

  return command(control::Command::launch(title_id));
}

int App::status() {
  error_code ec;

  auto addr = address(ec);
  if (!addr.has_value()) return failed("device", ec);

  auto s = client.probe(*addr, timeout(client.options().ddp.timeout), ec);
  if (!s.has_value()) return failed(fmt::format("status {}", *addr), ec);

  print_status(*addr, *s);

  return 0;
}

Millis App::timeout(Millis def) const noexcept {
  const auto secs = cli_val<int64_t>(conf::key::timeout, 0);

  return secs > 0 ? Millis(Seconds(secs)) : def;
}

int App::wakeup() {
  error_code ec;

  auto p = paired(ec);
  if (!p.has_value()) return failed("device", ec);

  const auto &[rec, cred] = *p;

  client.wakeup(rec, cred, ec);
  if (ec) return failed("wakeup", ec);

  fmt::print("wakeup sent to {}\n", rec.address);

  return 0;
}

int App::watch() {
  error_code ec;

  auto addr = address(ec);
  if (!addr.has_value()) return failed("device", ec);

  const auto interval = client.options().poll.interval;
  const auto probe_timeout = timeout(client.options().ddp.timeout);

  std::optional<ddp::DeviceStatus> last;
  bool unreachable{false};

  fmt::print("watching {}, press 'CTRL + C' to stop\n", *addr);

  while (!stopping) {
    auto s = client.track(*addr, probe_timeout, ec);
    if (ec && (ec != error::timeout)) return failed("watch", ec);

    if (client.polls().unreachable(*addr)) {
      if (!unreachable) fmt::print("{} is unreachable\n", *addr);

      unreachable = true;
      last.reset();
    } else if (s.has_value() && (last != s)) {
      print_device(ddp::DeviceRecord::from(*addr, *s), *s);

      unreachable = false;
      last = std::move(s);
    }

    for (Elapsed e; !stopping && (e < interval);) {
      std::this_thread::sleep_for(100ms);
    }
  }

  return 0;
}

} // namespace psremote
