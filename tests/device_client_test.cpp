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

// Device client tests: discovery, pairing and control through one handle.
#include "base/elapsed.hpp"
#include "base/error.hpp"
#include "client/device_client.hpp"
#include "mock_devices.hpp"
#include "wire/ddp_msg.hpp"

#include <gtest/gtest.h>
#include <thread>

using namespace psremote;
using namespace std::chrono_literals;

namespace {

client::DeviceClient::Opts client_opts(Port ddp_port) {
  client::DeviceClient::Opts opts;

  opts.ddp.port = ddp_port;
  opts.ddp.local_port = ANY_PORT;
  opts.pair.port = ANY_PORT;
  opts.control.timeout = 2s;

  return opts;
}

} // namespace

TEST(DeviceClientTest, DiscoverAndProbe) {
  test::DdpResponder responder(
      {{"127.0.0.1", test::DdpResponder::status(200, "Living Room", "F1", "CUSA00001")}});

  client::DeviceClient dc(client_opts(responder.port()));

  error_code ec;
  auto scan = dc.discover("127.0.0.1", 300ms, ec);
  ASSERT_FALSE(ec);

  const auto found = scan.collect(ec);
  ASSERT_EQ(found.size(), 1u);
  EXPECT_EQ(found.front().status.device_id, "F1");

  // probing waits for the scan to finish
  std::jthread([&]() { dc.probe("127.0.0.1", 300ms, ec); }).join();
  EXPECT_EQ(ec, error::busy);

  scan.close();

  auto status = dc.probe("127.0.0.1", 1s, ec);
  ASSERT_TRUE(status.has_value());
  EXPECT_TRUE(status->awake());
}

TEST(DeviceClientTest, ControlRequiresConnect) {
  client::DeviceClient dc(client_opts(ANY_PORT));

  error_code ec;
  EXPECT_FALSE(dc.send_command(control::Command::standby(), 1s, ec).has_value());
  EXPECT_EQ(ec, error::not_ready);

  EXPECT_FALSE(dc.poll_status(1s, ec).has_value());
  EXPECT_EQ(ec, error::not_ready);
  EXPECT_EQ(dc.session(), nullptr);
}

TEST(DeviceClientTest, ConnectCommandDisconnect) {
  test::MockConsole console;
  client::DeviceClient dc(client_opts(ANY_PORT));

  error_code ec;
  auto session = dc.connect(console.record(), pair::Credential{"good-credential", "MOCK01"}, 2s, ec);

  ASSERT_FALSE(ec) << ec.message();
  ASSERT_NE(session, nullptr);
  EXPECT_EQ(dc.session(), session);

  auto status = dc.poll_status(1s, ec);
  ASSERT_TRUE(status.has_value());
  EXPECT_EQ(status->title_id, "CUSA00001");

  auto ack = dc.send_command(control::Command::launch("CUSA00001"), 1s, ec);
  ASSERT_TRUE(ack.has_value());
  EXPECT_TRUE(ack->ok());

  dc.disconnect();

  EXPECT_EQ(dc.session(), nullptr);
  EXPECT_EQ(session->state(), control::Session::Closed);
  EXPECT_TRUE(test::eventually([&]() { return console.saw_bye(); }));

  dc.send_command(control::Command::standby(), 1s, ec);
  EXPECT_EQ(ec, error::not_ready);
}

TEST(DeviceClientTest, ConnectRejectedCredential) {
  test::MockConsole console;
  client::DeviceClient dc(client_opts(ANY_PORT));

  error_code ec;
  auto session = dc.connect(console.record(), pair::Credential{"wrong", "MOCK01"}, 2s, ec);

  EXPECT_EQ(session, nullptr);
  EXPECT_EQ(error::kind(ec), ErrorKind::Auth);
  EXPECT_EQ(dc.session(), nullptr);
}

TEST(DeviceClientTest, DisconnectAbortsConnect) {
  test::MockConsole console;
  console.delay_ms = 1500; // login result arrives late

  client::DeviceClient dc(client_opts(ANY_PORT));

  std::jthread disconnector([&dc]() {
    std::this_thread::sleep_for(150ms);
    dc.disconnect();
  });

  error_code ec;
  Elapsed e;
  auto session = dc.connect(console.record(), pair::Credential{"good-credential", "MOCK01"}, 5s, ec);

  EXPECT_EQ(session, nullptr);
  EXPECT_EQ(ec, error::cancelled);
  EXPECT_LT(e.millis(), Millis(1200));
  EXPECT_EQ(dc.session(), nullptr);
}

TEST(DeviceClientTest, WakeupSendsCredential) {
  test::DdpResponder responder({});
  client::DeviceClient dc(client_opts(responder.port()));

  ddp::DeviceRecord rec;
  rec.address = "127.0.0.1";
  rec.capabilities.set(ddp::Capabilities::Wake);

  error_code ec;
  dc.wakeup(rec, pair::Credential{"wake-credential", ""}, ec);
  ASSERT_FALSE(ec);

  ASSERT_TRUE(test::eventually([&]() { return !responder.received().empty(); }));
  EXPECT_EQ(wire::extract_credential(responder.received().front(), ec), "wake-credential");
}

TEST(DeviceClientTest, WakeupUnsupported) {
  client::DeviceClient dc(client_opts(ANY_PORT));

  ddp::DeviceRecord rec;
  rec.address = "127.0.0.1";
  rec.capabilities.set(ddp::Capabilities::Control);

  error_code ec;
  dc.wakeup(rec, pair::Credential{"c", ""}, ec);
  EXPECT_EQ(ec, error::unsupported);
}

TEST(DeviceClientTest, PairCancelled) {
  client::DeviceClient dc(client_opts(ANY_PORT));

  ddp::DeviceRecord rec;
  rec.device_id = "MOCK01";

  std::jthread canceller([&dc]() {
    std::this_thread::sleep_for(150ms);
    dc.cancel_pair();
  });

  error_code ec;
  auto credential = dc.pair(rec, 5s, ec);

  EXPECT_FALSE(credential.has_value());
  EXPECT_EQ(ec, error::cancelled);
  EXPECT_EQ(error::kind(ec), ErrorKind::Cancelled);
}

TEST(DeviceClientTest, LinkWithPin) {
  test::MockConsole console;
  client::DeviceClient dc(client_opts(ANY_PORT));

  error_code ec;
  dc.link(console.record(), pair::Credential{"good-credential", "MOCK01"}, "12345678", 2s, ec);

  ASSERT_FALSE(ec) << ec.message();
  EXPECT_EQ(dc.session(), nullptr);
  ASSERT_FALSE(console.requests().empty());
  EXPECT_EQ(console.requests().front().opcode, control::opcode::pin_login);
  EXPECT_TRUE(test::eventually([&]() { return console.saw_bye(); }));
}

TEST(DeviceClientTest, LinkRejectsPin) {
  client::DeviceClient dc(client_opts(ANY_PORT));

  ddp::DeviceRecord rec;
  rec.address = "127.0.0.1";
  rec.capabilities.set(ddp::Capabilities::Control);

  error_code ec;
  dc.link(rec, pair::Credential{"c", ""}, "12 34", 1s, ec);
  EXPECT_EQ(ec, error::bad_argument);

  test::MockConsole console;
  dc.link(console.record(), pair::Credential{"good-credential", "MOCK01"}, "00000000", 2s, ec);
  EXPECT_EQ(ec, error::login_rejected);
  EXPECT_EQ(dc.session(), nullptr);
}

TEST(DeviceClientTest, TrackMarksSilentDeviceUnreachable) {
  test::DdpResponder responder({});

  auto opts = client_opts(responder.port());
  opts.poll.max_polls = 2;
  client::DeviceClient dc(opts);

  error_code ec;
  for (auto i = 0; i < 2; i++) {
    EXPECT_FALSE(dc.track("127.0.0.1", 50ms, ec).has_value());
    EXPECT_EQ(ec, error::timeout);
    EXPECT_FALSE(dc.polls().unreachable("127.0.0.1"));
  }

  dc.track("127.0.0.1", 50ms, ec);
  EXPECT_TRUE(dc.polls().unreachable("127.0.0.1"));
  EXPECT_TRUE(test::eventually([&]() { return responder.received().size() == 3; }));
}

TEST(DeviceClientTest, TrackAnsweringDevice) {
  test::DdpResponder responder(
      {{"127.0.0.1", test::DdpResponder::status(620, "Living Room", "F1")}});

  auto opts = client_opts(responder.port());
  opts.poll.max_polls = 1;
  client::DeviceClient dc(opts);

  error_code ec;
  for (auto i = 0; i < 3; i++) {
    auto status = dc.track("127.0.0.1", 1s, ec);
    ASSERT_TRUE(status.has_value()) << ec.message();
    EXPECT_EQ(status->power, ddp::Power::Standby);
  }

  EXPECT_FALSE(dc.polls().unreachable("127.0.0.1"));
  EXPECT_EQ(dc.polls().unanswered("127.0.0.1"), 0u);
}
