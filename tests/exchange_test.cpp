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

// Credential exchange tests with a simulated companion app.
#include "base/error.hpp"
#include "mock_devices.hpp"
#include "pair/exchange.hpp"
#include "wire/ddp_msg.hpp"

#include <gtest/gtest.h>
#include <thread>

using namespace psremote;
using namespace std::chrono_literals;

namespace {

pair::Exchange::Opts exchange_opts() {
  pair::Exchange::Opts opts;

  opts.port = ANY_PORT;
  opts.host_id = "0123456789AB";
  opts.host_name = "psremote-test";

  return opts;
}

/// @brief Plays the companion app: search, read the status, then wake
class Companion {
public:
  explicit Companion(Port port) : target(asio::ip::make_address("127.0.0.1"), port) {
    sock.open(ip_udp::v4());
  }

  string search() {
    const auto msg = wire::make_search();
    sock.send_to(asio::buffer(msg), target);

    uint8v buf(1024);
    udp_endpoint from;
    const auto n = sock.receive_from(asio::buffer(buf.data(), buf.size()), from);

    return string(buf.raw(), n);
  }

  void send(const string &msg) { sock.send_to(asio::buffer(msg), target); }

private:
  io_context io_ctx;
  udp_socket sock{io_ctx};
  udp_endpoint target;
};

} // namespace

TEST(ExchangeTest, HarvestsCredential) {
  pair::Exchange exchange(exchange_opts());

  error_code ec;
  exchange.begin("DEVICE01", ec);
  ASSERT_FALSE(ec) << ec.message();
  EXPECT_EQ(exchange.state(), pair::Exchange::Listening);

  const auto port = exchange.local_port();
  ASSERT_NE(port, ANY_PORT);

  string status_reply;

  std::jthread companion([&]() {
    Companion app(port);

    // a credential before the search is ignored
    app.send(wire::make_wakeup("too-early"));

    status_reply = app.search();
    app.send(wire::make_wakeup("harvested-credential"));
  });

  auto credential = exchange.wait(2s, ec);
  companion.join();

  ASSERT_FALSE(ec) << ec.message();
  ASSERT_TRUE(credential.has_value());
  EXPECT_EQ(credential->token, "harvested-credential");
  EXPECT_EQ(credential->device_id, "DEVICE01");
  EXPECT_EQ(exchange.state(), pair::Exchange::Complete);

  // the impersonated console answered as a device in standby
  auto status = wire::parse_status(status_reply, ec);
  ASSERT_TRUE(status.has_value());
  EXPECT_EQ(status->code, wire::ddp::status_standby);
  EXPECT_EQ(status->field(wire::ddp_key::host_id), "0123456789AB");
  EXPECT_EQ(status->field(wire::ddp_key::host_name), "psremote-test");
  EXPECT_EQ(status->field(wire::ddp_key::host_request_port), "997");

  // the socket is released
  EXPECT_EQ(exchange.local_port(), ANY_PORT);

  exchange.reset();
  EXPECT_EQ(exchange.state(), pair::Exchange::Idle);
}

TEST(ExchangeTest, LaunchAlsoCarriesCredential) {
  pair::Exchange exchange(exchange_opts());

  error_code ec;
  exchange.begin("", ec);
  ASSERT_FALSE(ec);

  std::jthread companion([port = exchange.local_port()]() {
    Companion app(port);
    app.search();
    app.send(wire::make_launch("launch-credential"));
  });

  auto credential = exchange.wait(2s, ec);

  ASSERT_TRUE(credential.has_value());
  EXPECT_EQ(credential->token, "launch-credential");
}

TEST(ExchangeTest, TimesOut) {
  pair::Exchange exchange(exchange_opts());

  error_code ec;
  auto credential = exchange.exchange("DEVICE01", 200ms, ec);

  EXPECT_FALSE(credential.has_value());
  EXPECT_EQ(ec, error::timeout);

  // exchange() resets, a new exchange may begin
  EXPECT_EQ(exchange.state(), pair::Exchange::Idle);
}

TEST(ExchangeTest, WaitWithoutBegin) {
  pair::Exchange exchange(exchange_opts());

  error_code ec;
  EXPECT_FALSE(exchange.wait(100ms, ec).has_value());
  EXPECT_EQ(ec, error::invalid_state);
}

TEST(ExchangeTest, BeginTwice) {
  pair::Exchange exchange(exchange_opts());

  error_code ec;
  exchange.begin("A", ec);
  ASSERT_FALSE(ec);

  exchange.begin("B", ec);
  EXPECT_EQ(ec, error::invalid_state);
}

TEST(ExchangeTest, CancelFromAnotherThread) {
  pair::Exchange exchange(exchange_opts());

  error_code ec;
  exchange.begin("DEVICE01", ec);
  ASSERT_FALSE(ec);

  std::jthread canceller([&exchange]() {
    std::this_thread::sleep_for(100ms);
    exchange.cancel();
  });

  const auto start = std::chrono::steady_clock::now();
  auto credential = exchange.wait(5s, ec);

  EXPECT_FALSE(credential.has_value());
  EXPECT_EQ(ec, error::cancelled);
  EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
  EXPECT_EQ(exchange.state(), pair::Exchange::Idle);
}

TEST(ExchangeTest, PortInUse) {
  io_context io_ctx;
  udp_socket holder(io_ctx, udp_endpoint(ip_udp::v4(), 0));

  auto opts = exchange_opts();
  opts.port = holder.local_endpoint().port();

  pair::Exchange exchange(opts);

  // address reuse on both ends is required to share a port
  error_code ec;
  exchange.begin("DEVICE01", ec);

  EXPECT_TRUE(ec);
  EXPECT_EQ(exchange.state(), pair::Exchange::Idle);
}

TEST(ExchangeTest, CancelBeforeWaitReleases) {
  pair::Exchange exchange(exchange_opts());

  error_code ec;
  exchange.begin("DEVICE01", ec);
  ASSERT_FALSE(ec);

  exchange.cancel();

  EXPECT_EQ(exchange.state(), pair::Exchange::Idle);
  EXPECT_EQ(exchange.local_port(), ANY_PORT);

  // a wait racing the cancel reports it
  EXPECT_FALSE(exchange.wait(100ms, ec).has_value());
  EXPECT_EQ(ec, error::cancelled);

  // the exchange is usable again
  exchange.begin("DEVICE01", ec);
  ASSERT_FALSE(ec) << ec.message();
  EXPECT_EQ(exchange.state(), pair::Exchange::Listening);
  EXPECT_NE(exchange.local_port(), ANY_PORT);

  EXPECT_FALSE(exchange.wait(100ms, ec).has_value());
  EXPECT_EQ(ec, error::timeout);
}

TEST(ExchangeTest, BinaryCredentialBytes) {
  pair::Exchange exchange(exchange_opts());

  error_code ec;
  exchange.begin("DEVICE01", ec);
  ASSERT_FALSE(ec);

  const string binary("\xAA\xBB\xCC\xDD\x01\x7F", 6);

  std::jthread companion([port = exchange.local_port(), &binary]() {
    Companion app(port);
    app.search();
    app.send(wire::make_wakeup(binary));
  });

  auto credential = exchange.wait(2s, ec);

  ASSERT_FALSE(ec) << ec.message();
  ASSERT_TRUE(credential.has_value());
  EXPECT_EQ(credential->token, binary);
  EXPECT_EQ(credential->token.size(), 6u);
}
