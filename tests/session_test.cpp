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

// Control session tests against a loopback console.
#include "base/error.hpp"
#include "control/command.hpp"
#include "control/session.hpp"
#include "mock_devices.hpp"

#include <boost/asio/error.hpp>
#include <chrono>
#include <gtest/gtest.h>
#include <thread>

using namespace psremote;
using namespace std::chrono_literals;

namespace {

const pair::Credential good_credential{"good-credential", "MOCK01"};

control::Session::Opts quick_opts() {
  control::Session::Opts opts;
  opts.timeout = 2s;

  return opts;
}

} // namespace

TEST(SessionTest, OpenReachesReady) {
  test::MockConsole console;
  control::Session session(quick_opts());

  error_code ec;
  session.open(console.record(), good_credential, 2s, ec);

  ASSERT_FALSE(ec) << ec.message();
  EXPECT_EQ(session.state(), control::Session::Ready);

  // both ends derived the same keys
  auto keys = session.key_material();
  ASSERT_TRUE(keys.has_value());
  ASSERT_TRUE(console.keys().has_value());
  EXPECT_EQ(keys->session_key, console.keys()->session_key);
  EXPECT_EQ(keys->hmac_key, console.keys()->hmac_key);
  EXPECT_EQ(keys->iv_seed, console.keys()->iv_seed);

  // login was the only sealed frame so far
  ASSERT_TRUE(test::eventually([&]() { return console.requests().size() == 1; }));
  const auto login = console.requests().front();

  EXPECT_EQ(login.opcode, control::opcode::login);
  EXPECT_EQ(login.payload.size(), control::field::credential + control::field::client_name +
                                      control::field::model + control::field::app_version);
  EXPECT_EQ(login.payload.padded(0, control::field::credential), "good-credential");
  EXPECT_EQ(session.sequence(), std::make_pair(uint64_t{1}, uint64_t{1}));
}

TEST(SessionTest, CommandsAndRepeatedPolls) {
  test::MockConsole console;
  control::Session session(quick_opts());

  error_code ec;
  session.open(console.record(), good_credential, 2s, ec);
  ASSERT_FALSE(ec) << ec.message();

  const auto keys_before = session.key_material();

  for (auto i = 0; i < 2; i++) {
    auto status = session.poll_status(1s, ec);

    ASSERT_FALSE(ec) << ec.message();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->power, ddp::Power::Awake);
    EXPECT_EQ(status->title_id, "CUSA00001");
    EXPECT_EQ(status->title_name, "Some Game");
    EXPECT_EQ(status->device_id, "MOCK01");
  }

  // polling does not renegotiate
  EXPECT_EQ(session.key_material(), keys_before);

  auto ack = session.send_command(control::Command::launch("PPSA01234"), 1s, ec);
  ASSERT_FALSE(ec) << ec.message();
  ASSERT_TRUE(ack.has_value());
  EXPECT_TRUE(ack->ok());
  EXPECT_EQ(ack->opcode, control::opcode::launch_result);

  ack = session.send_command(control::Command::remote({control::RemoteKey::PS, 1000ms}), 1s, ec);
  ASSERT_FALSE(ec) << ec.message();
  EXPECT_EQ(ack->opcode, control::opcode::remote_key_result);

  ack = session.send_command(control::Command::standby(), 1s, ec);
  ASSERT_FALSE(ec) << ec.message();
  EXPECT_EQ(ack->opcode, control::opcode::standby_result);

  // login, two polls, three commands
  EXPECT_EQ(session.sequence(), std::make_pair(uint64_t{6}, uint64_t{6}));

  ASSERT_TRUE(test::eventually([&]() { return console.requests().size() == 6; }));
  const auto requests = console.requests();

  EXPECT_EQ(requests[3].opcode, control::opcode::launch);
  EXPECT_EQ(requests[3].payload.padded(0, control::field::title_id), "PPSA01234");
  EXPECT_EQ(requests[4].payload.le32(0), 128u);
  EXPECT_EQ(requests[4].payload.le32(4), 1000u);

  session.close();

  EXPECT_EQ(session.state(), control::Session::Closed);
  EXPECT_FALSE(session.key_material().has_value());
  EXPECT_TRUE(test::eventually([&]() { return console.saw_bye(); }));
}

TEST(SessionTest, CallsBeforeOpenAreNotReady) {
  control::Session session;

  error_code ec;
  EXPECT_FALSE(session.send_command(control::Command::standby(), 1s, ec).has_value());
  EXPECT_EQ(ec, error::not_ready);

  EXPECT_FALSE(session.poll_status(1s, ec).has_value());
  EXPECT_EQ(ec, error::not_ready);
  EXPECT_EQ(error::kind(ec), ErrorKind::State);
}

TEST(SessionTest, OpenTwiceIsInvalidState) {
  test::MockConsole console;
  control::Session session(quick_opts());

  error_code ec;
  session.open(console.record(), good_credential, 2s, ec);
  ASSERT_FALSE(ec);

  session.open(console.record(), good_credential, 2s, ec);
  EXPECT_EQ(ec, error::invalid_state);
  EXPECT_TRUE(session.ready());
}

TEST(SessionTest, WrongCredentialIsAuth) {
  test::MockConsole console;
  control::Session session(quick_opts());

  error_code ec;
  session.open(console.record(), pair::Credential{"stale-credential", "MOCK01"}, 2s, ec);

  EXPECT_EQ(ec, error::login_rejected);
  EXPECT_EQ(error::kind(ec), ErrorKind::Auth);
  EXPECT_EQ(session.state(), control::Session::Closed);
  EXPECT_FALSE(session.key_material().has_value());

  // never Ready, later calls are not_ready
  session.poll_status(1s, ec);
  EXPECT_EQ(ec, error::not_ready);
}

TEST(SessionTest, LinkWithPin) {
  test::MockConsole console;
  control::Session session(quick_opts());

  error_code ec;
  session.link(console.record(), good_credential, "12345678", 2s, ec);

  ASSERT_FALSE(ec) << ec.message();
  EXPECT_EQ(session.state(), control::Session::Ready);

  ASSERT_TRUE(test::eventually([&]() { return console.requests().size() == 1; }));
  const auto login = console.requests().front();

  EXPECT_EQ(login.opcode, control::opcode::pin_login);
  EXPECT_EQ(login.payload.padded(0, control::field::credential), "good-credential");

  // a linked session carries on as an opened one
  auto status = session.poll_status(1s, ec);
  ASSERT_TRUE(status.has_value()) << ec.message();
}

TEST(SessionTest, LinkWrongPinIsAuth) {
  test::MockConsole console;
  control::Session session(quick_opts());

  error_code ec;
  session.link(console.record(), good_credential, "87654321", 2s, ec);

  EXPECT_EQ(ec, error::login_rejected);
  EXPECT_EQ(error::kind(ec), ErrorKind::Auth);
  EXPECT_EQ(session.state(), control::Session::Closed);
}

TEST(SessionTest, LinkMalformedPinSendsNothing) {
  test::MockConsole console;
  control::Session session(quick_opts());

  error_code ec;
  session.link(console.record(), good_credential, "1234", 2s, ec);

  EXPECT_EQ(ec, error::bad_argument);
  EXPECT_EQ(session.state(), control::Session::Closed);
  EXPECT_TRUE(console.requests().empty());
}

TEST(SessionTest, HelloRejected) {
  test::MockConsole console(test::MockConsole::Opts{.hello_result = 3});
  control::Session session(quick_opts());

  error_code ec;
  session.open(console.record(), good_credential, 2s, ec);

  EXPECT_EQ(ec, error::handshake_rejected);
  EXPECT_EQ(session.state(), control::Session::Closed);
}

TEST(SessionTest, EmptyCredentialIsBadArgument) {
  test::MockConsole console;
  control::Session session(quick_opts());

  error_code ec;
  session.open(console.record(), pair::Credential{}, 2s, ec);

  EXPECT_EQ(ec, error::bad_argument);
  EXPECT_EQ(session.state(), control::Session::Closed);
}

TEST(SessionTest, ConnectionRefused) {
  Port unused{0};

  {
    io_context io_ctx;
    tcp_acceptor acceptor(io_ctx, tcp_endpoint(asio::ip::make_address("127.0.0.1"), 0));
    unused = acceptor.local_endpoint().port();
  }

  test::MockConsole console;
  auto rec = console.record();
  rec.control_port = unused;

  control::Session session(quick_opts());

  error_code ec;
  session.open(rec, good_credential, 1s, ec);

  EXPECT_TRUE(ec);
  EXPECT_EQ(error::kind(ec), ErrorKind::Network);
  EXPECT_EQ(session.state(), control::Session::Closed);
}

TEST(SessionTest, MissingCapabilityIsUnsupported) {
  test::MockConsole console;
  auto rec = console.record();
  rec.capabilities.set(ddp::Capabilities::RemoteKey, false);

  control::Session session(quick_opts());

  error_code ec;
  session.open(rec, good_credential, 2s, ec);
  ASSERT_FALSE(ec);

  session.send_command(control::Command::remote({control::RemoteKey::Up, 0ms}), 1s, ec);

  EXPECT_EQ(ec, error::unsupported);
  EXPECT_TRUE(session.ready());
}

TEST(SessionTest, LaunchTitleTooLong) {
  test::MockConsole console;
  control::Session session(quick_opts());

  error_code ec;
  session.open(console.record(), good_credential, 2s, ec);
  ASSERT_FALSE(ec);

  session.send_command(control::Command::launch("CUSA0000100000000"), 1s, ec);

  EXPECT_EQ(ec, error::bad_argument);
  EXPECT_TRUE(session.ready());
}

TEST(SessionTest, TamperedResponseClosesSession) {
  test::MockConsole console;
  control::Session session(quick_opts());

  error_code ec;
  session.open(console.record(), good_credential, 2s, ec);
  ASSERT_FALSE(ec);

  console.tamper_next = true;

  EXPECT_FALSE(session.poll_status(1s, ec).has_value());
  EXPECT_EQ(ec, error::integrity);
  EXPECT_EQ(error::kind(ec), ErrorKind::Integrity);
  EXPECT_EQ(session.state(), control::Session::Closed);
  EXPECT_FALSE(session.key_material().has_value());

  session.send_command(control::Command::standby(), 1s, ec);
  EXPECT_EQ(ec, error::session_closed);
}

TEST(SessionTest, UnexpectedOpcodeKeepsSession) {
  test::MockConsole console;
  control::Session session(quick_opts());

  error_code ec;
  session.open(console.record(), good_credential, 2s, ec);
  ASSERT_FALSE(ec);

  console.unexpected_next = true;

  session.send_command(control::Command::standby(), 1s, ec);
  EXPECT_EQ(ec, error::unexpected_opcode);
  EXPECT_EQ(error::kind(ec), ErrorKind::Malformed);
  EXPECT_TRUE(session.ready());

  auto status = session.poll_status(1s, ec);
  EXPECT_FALSE(ec) << ec.message();
  EXPECT_TRUE(status.has_value());
}

TEST(SessionTest, UnexpectedOpcodeOwesNothing) {
  test::MockConsole console;
  control::Session session(quick_opts());

  error_code ec;
  session.open(console.record(), good_credential, 2s, ec);
  ASSERT_FALSE(ec);

  console.unexpected_next = true;

  EXPECT_FALSE(session.poll_status(1s, ec).has_value());
  EXPECT_EQ(ec, error::unexpected_opcode);

  // the odd frame was the reply, later polls keep their own responses
  for (auto i = 0; i < 2; i++) {
    auto status = session.poll_status(1s, ec);
    EXPECT_FALSE(ec) << ec.message();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->title_id, "CUSA00001");
  }
}

TEST(SessionTest, UnansweredRequestIsForgotten) {
  test::MockConsole console;
  control::Session session(quick_opts());

  error_code ec;
  session.open(console.record(), good_credential, 2s, ec);
  ASSERT_FALSE(ec);

  console.drop_next = true;

  EXPECT_FALSE(session.poll_status(100ms, ec).has_value());
  EXPECT_EQ(ec, error::timeout);
  EXPECT_TRUE(session.ready());

  // once the abandoned call's timeout has passed nothing is owed
  std::this_thread::sleep_for(150ms);

  for (auto i = 0; i < 3; i++) {
    EXPECT_TRUE(session.poll_status(1s, ec).has_value()) << ec.message();
  }
}

TEST(SessionTest, UnansweredRequestCostsAtMostOneCall) {
  test::MockConsole console;
  control::Session session(quick_opts());

  error_code ec;
  session.open(console.record(), good_credential, 2s, ec);
  ASSERT_FALSE(ec);

  console.drop_next = true;

  EXPECT_FALSE(session.poll_status(100ms, ec).has_value());
  EXPECT_EQ(ec, error::timeout);

  // this response is taken for the late one, the next poll does not pay again
  session.poll_status(300ms, ec);

  for (auto i = 0; i < 3; i++) {
    EXPECT_TRUE(session.poll_status(1s, ec).has_value()) << ec.message();
  }

  EXPECT_TRUE(session.ready());
}

TEST(SessionTest, PeerByeClosesSession) {
  test::MockConsole console;
  control::Session session(quick_opts());

  error_code ec;
  session.open(console.record(), good_credential, 2s, ec);
  ASSERT_FALSE(ec);

  console.bye_next = true;

  EXPECT_FALSE(session.poll_status(1s, ec).has_value());
  EXPECT_EQ(ec, boost::asio::error::eof);
  EXPECT_EQ(error::kind(ec), ErrorKind::Network);
  EXPECT_EQ(session.state(), control::Session::Closed);

  const auto sent = console.requests().size();

  session.send_command(control::Command::standby(), 1s, ec);
  EXPECT_EQ(ec, error::session_closed);

  session.poll_status(1s, ec);
  EXPECT_EQ(ec, error::session_closed);

  // refused without touching the transport
  EXPECT_EQ(console.requests().size(), sent);
}

TEST(SessionTest, PeerHangupClosesSession) {
  test::MockConsole console;
  control::Session session(quick_opts());

  error_code ec;
  session.open(console.record(), good_credential, 2s, ec);
  ASSERT_FALSE(ec);

  console.hangup_next = true;

  EXPECT_FALSE(session.send_command(control::Command::power(), 1s, ec).has_value());
  EXPECT_EQ(error::kind(ec), ErrorKind::Network) << ec.message();
  EXPECT_EQ(session.state(), control::Session::Closed);
  EXPECT_FALSE(session.key_material().has_value());

  session.poll_status(1s, ec);
  EXPECT_EQ(ec, error::session_closed);
}

TEST(SessionTest, LateResponseIsDiscarded) {
  test::MockConsole console;
  control::Session session(quick_opts());

  error_code ec;
  session.open(console.record(), good_credential, 2s, ec);
  ASSERT_FALSE(ec);

  console.delay_ms = 400;

  EXPECT_FALSE(session.send_command(control::Command::standby(), 100ms, ec).has_value());
  EXPECT_EQ(ec, error::timeout);
  EXPECT_EQ(error::kind(ec), ErrorKind::Timeout);
  EXPECT_TRUE(session.ready());

  // the standby result arrives first and must not satisfy this call
  auto ack = session.send_command(control::Command::remote({control::RemoteKey::Back, 0ms}), 2s, ec);

  ASSERT_FALSE(ec) << ec.message();
  ASSERT_TRUE(ack.has_value());
  EXPECT_EQ(ack->opcode, control::opcode::remote_key_result);
}

TEST(SessionTest, CloseCancelsBlockedCall) {
  test::MockConsole console;
  control::Session session(quick_opts());

  error_code ec;
  session.open(console.record(), good_credential, 2s, ec);
  ASSERT_FALSE(ec);

  console.delay_ms = 1500;

  std::jthread closer([&session]() {
    std::this_thread::sleep_for(150ms);
    session.close();
  });

  const auto start = std::chrono::steady_clock::now();
  auto status = session.poll_status(5s, ec);
  const auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_FALSE(status.has_value());
  EXPECT_EQ(ec, error::cancelled);
  EXPECT_EQ(error::kind(ec), ErrorKind::Cancelled);
  EXPECT_LT(elapsed, 1200ms);

  closer.join();

  EXPECT_EQ(session.state(), control::Session::Closed);
  EXPECT_FALSE(session.key_material().has_value());
}
