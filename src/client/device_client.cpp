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

#include "client/device_client.hpp"
#include "base/error.hpp"
#include "base/logger.hpp"

#include <utility>

namespace psremote {
namespace client {

DeviceClient::Opts DeviceClient::Opts::from_config() noexcept {
  Opts opts;

  opts.ddp = ddp::Poller::Opts::from(conf::token("ddp"));
  opts.pair = pair::Exchange::Opts::from(conf::token("pair"));
  opts.control = control::Session::Opts::from(conf::token("control"));
  opts.poll = PollTracker::Opts::from(conf::token("poll"));

  return opts;
}

DeviceClient::DeviceClient(Opts opts) noexcept
    : opts(std::move(opts)), poller(this->opts.ddp), exchange(this->opts.pair),
      tracker(this->opts.poll) {}

DeviceClient::~DeviceClient() noexcept { disconnect(); }

std::shared_ptr<control::Session> DeviceClient::connect(const ddp::DeviceRecord &record,
                                                        const pair::Credential &credential,
                                                        Millis timeout, error_code &ec) noexcept {
  return start(record, credential, csv(), timeout, ec);
}

ddp::Scan DeviceClient::discover(csv broadcast, Millis timeout, error_code &ec) noexcept {
  return poller.scan(broadcast, timeout, ec);
}

void DeviceClient::disconnect() noexcept {
  std::shared_ptr<control::Session> session;

  {
    std::unique_lock lck(mtx);
    session = std::exchange(_session, nullptr);
  }

  if (session) session->close();
}

std::optional<pair::Credential> DeviceClient::pair(const ddp::DeviceRecord &record,
                                                   Millis timeout, error_code &ec) noexcept {
  return exchange.exchange(record.device_id, timeout, ec);
}

void DeviceClient::link(const ddp::DeviceRecord &record, const pair::Credential &credential,
                        csv pin, Millis timeout, error_code &ec) noexcept {
  INFO_AUTO_CAT("link");

  if (!control::valid_pin(pin)) {
    ec = error::bad_argument;
    return;
  }

  if (auto session = start(record, credential, pin, timeout, ec); session) {
    INFO_AUTO("{} linked as {}", record.address, opts.control.client_name);
    disconnect();
  }
}

std::optional<ddp::DeviceStatus> DeviceClient::poll_status(Millis timeout,
                                                           error_code &ec) noexcept {
  auto s = session();

  if (!s) {
    ec = error::not_ready;
    return std::nullopt;
  }

  return s->poll_status(timeout, ec);
}

std::optional<ddp::DeviceStatus> DeviceClient::probe(csv address, Millis timeout,
                                                     error_code &ec) noexcept {
  return poller.probe(address, timeout, ec);
}

std::shared_ptr<control::Session> DeviceClient::start(const ddp::DeviceRecord &record,
                                                      const pair::Credential &credential, csv pin,
                                                      Millis timeout, error_code &ec) noexcept {
  INFO_AUTO_CAT("start");

  disconnect();

  auto session = std::make_shared<control::Session>(opts.control);

  // published before opening so disconnect() can abort the handshake
  {
    std::unique_lock lck(mtx);
    _session = session;
  }

  if (pin.empty()) {
    session->open(record, credential, timeout, ec);
  } else {
    session->link(record, credential, pin, timeout, ec);
  }

  std::unique_lock lck(mtx);

  // disconnect() ran before open() took the session
  if (!ec && (_session != session)) ec = error::cancelled;

  if (ec) {
    if (_session == session) _session.reset();
    lck.unlock();

    session->close();
    INFO_AUTO("{} {} kind={}", record.address, ec.message(), error::kind(ec));
    return nullptr;
  }

  return session;
}

std::optional<control::Ack> DeviceClient::send_command(const control::Command &cmd,
                                                       Millis timeout, error_code &ec) noexcept {
  auto s = session();

  if (!s) {
    ec = error::not_ready;
    return std::nullopt;
  }

  return s->send_command(cmd, timeout, ec);
}

std::shared_ptr<control::Session> DeviceClient::session() const noexcept {
  std::unique_lock lck(mtx);

  return _session;
}

std::optional<ddp::DeviceStatus> DeviceClient::track(csv address, Millis timeout,
                                                     error_code &ec) noexcept {
  ec.clear();

  // the last status stands while the device ignores polls
  if (!tracker.may_poll(address)) return tracker.status(address);

  auto status = poller.probe(address, timeout, ec);

  // a busy poller sent nothing
  if (ec != error::busy) tracker.sent(address);
  if (status.has_value()) tracker.received(address, *status);

  return status;
}

void DeviceClient::wakeup(const ddp::DeviceRecord &record, const pair::Credential &credential,
                          error_code &ec) noexcept {
  if (!record.capabilities.none() && !record.capabilities.has(ddp::Capabilities::Wake)) {
    ec = error::unsupported;
    return;
  }

  poller.wakeup(record.address, credential.token, ec);
}

} // namespace client
} // namespace psremote
