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

// Command payloads and key name parsing.
#include "base/error.hpp"
#include "control/command.hpp"

#include <fmt/format.h>
#include <gtest/gtest.h>

using namespace psremote;
using namespace std::chrono_literals;

TEST(KeyTest, ParseKnownKeys) {
  error_code ec;

  auto kp = control::parse_key("up", ec);
  ASSERT_TRUE(kp.has_value());
  EXPECT_EQ(kp->key, control::RemoteKey::Up);
  EXPECT_EQ(kp->hold, 0ms);

  kp = control::parse_key("close_rc", ec);
  ASSERT_TRUE(kp.has_value());
  EXPECT_EQ(kp->key, control::RemoteKey::CloseRC);
}

TEST(KeyTest, PsHoldHoldsOneSecond) {
  error_code ec;
  auto kp = control::parse_key("ps_hold", ec);

  ASSERT_TRUE(kp.has_value());
  EXPECT_EQ(kp->key, control::RemoteKey::PS);
  EXPECT_EQ(kp->hold, 1000ms);
}

TEST(KeyTest, UnknownKey) {
  error_code ec;

  EXPECT_FALSE(control::parse_key("UP", ec).has_value());
  EXPECT_EQ(ec, error::unknown_key);
  EXPECT_EQ(error::kind(ec), ErrorKind::Malformed);
}

TEST(KeyTest, KeyNames) {
  EXPECT_EQ(control::key_name(control::RemoteKey::OpenRC), "open_rc");
  EXPECT_EQ(control::key_name(control::RemoteKey::Option), "option");
}

TEST(CommandTest, Opcodes) {
  using control::opcode;

  EXPECT_EQ(control::Command::standby().request_opcode(), opcode::standby);
  EXPECT_EQ(control::Command::standby().response_opcode(), opcode::standby_result);
  EXPECT_EQ(control::Command::power().request_opcode(), opcode::power);
  EXPECT_EQ(control::Command::launch("CUSA1").response_opcode(), opcode::launch_result);
  EXPECT_EQ(control::Command::remote({}).request_opcode(), opcode::remote_key);
}

TEST(CommandTest, Capabilities) {
  using caps = ddp::Capabilities;

  EXPECT_EQ(control::Command::standby().capability(), caps::Control);
  EXPECT_EQ(control::Command::launch("CUSA1").capability(), caps::Launch);
  EXPECT_EQ(control::Command::remote({}).capability(), caps::RemoteKey);
}

TEST(CommandTest, LaunchPayloadIsPadded) {
  error_code ec;
  const auto payload = control::Command::launch("CUSA00001").payload(ec);

  ASSERT_FALSE(ec);
  ASSERT_EQ(payload.size(), control::field::title_id);
  EXPECT_EQ(payload.padded(0, payload.size()), "CUSA00001");
  EXPECT_EQ(payload.back(), 0x00);
}

TEST(CommandTest, LaunchRejectsBadTitle) {
  error_code ec;

  control::Command::launch("").payload(ec);
  EXPECT_EQ(ec, error::bad_argument);

  control::Command::launch("ABCDEFGHIJKLMNOPQ").payload(ec);
  EXPECT_EQ(ec, error::bad_argument);

  // exactly the field width fits
  control::Command::launch("ABCDEFGHIJKLMNOP").payload(ec);
  EXPECT_FALSE(ec);
}

TEST(CommandTest, RemotePayload) {
  error_code ec;
  const auto payload =
      control::Command::remote({control::RemoteKey::Enter, 250ms}).payload(ec);

  ASSERT_EQ(payload.size(), 8u);
  EXPECT_EQ(payload.le32(0), 16u);
  EXPECT_EQ(payload.le32(4), 250u);
}

TEST(CommandTest, StandbyPayloadEmpty) {
  error_code ec;

  EXPECT_TRUE(control::Command::standby().payload(ec).empty());
  EXPECT_FALSE(ec);
}

TEST(CommandTest, Format) {
  EXPECT_EQ(fmt::format("{}", control::Command::launch("CUSA00001")), "launch CUSA00001");
  EXPECT_EQ(fmt::format("{}", control::Command::remote({control::RemoteKey::PS, 1000ms})),
            "remote ps hold=1000ms");
}

TEST(HandshakePayloadTest, LoginLayout) {
  error_code ec;
  const auto payload = control::login_payload("cred", "client", "model", "1.0", ec);

  ASSERT_FALSE(ec);
  ASSERT_EQ(payload.size(), 64u + 40u + 16u + 8u);
  EXPECT_EQ(payload.padded(0, 64), "cred");
  EXPECT_EQ(payload.padded(64, 40), "client");
  EXPECT_EQ(payload.padded(104, 16), "model");
  EXPECT_EQ(payload.padded(120, 8), "1.0");
}

TEST(HandshakePayloadTest, LoginRejectsCredential) {
  error_code ec;

  control::login_payload("", "c", "m", "v", ec);
  EXPECT_EQ(ec, error::bad_argument);

  control::login_payload(string(65, 'x'), "c", "m", "v", ec);
  EXPECT_EQ(ec, error::bad_argument);
}

TEST(HandshakePayloadTest, PinLoginLayout) {
  error_code ec;
  const auto payload = control::pin_login_payload("cred", "01234567", "client", "model", "1.0", ec);

  ASSERT_FALSE(ec);
  ASSERT_EQ(payload.size(), 64u + 40u + 16u + 8u + 8u);
  EXPECT_EQ(payload.padded(0, 64), "cred");
  EXPECT_EQ(payload.padded(120, 8), "1.0");
  EXPECT_EQ(payload.padded(128, 8), "01234567");
}

TEST(HandshakePayloadTest, PinMustBeEightDigits) {
  EXPECT_TRUE(control::valid_pin("12345678"));
  EXPECT_FALSE(control::valid_pin("1234567"));
  EXPECT_FALSE(control::valid_pin("123456789"));
  EXPECT_FALSE(control::valid_pin("1234 678"));
  EXPECT_FALSE(control::valid_pin("abcdefgh"));
  EXPECT_FALSE(control::valid_pin(""));

  error_code ec;
  EXPECT_TRUE(control::pin_login_payload("cred", "12a45678", "c", "m", "v", ec).empty());
  EXPECT_EQ(ec, error::bad_argument);

  control::pin_login_payload("", "12345678", "c", "m", "v", ec);
  EXPECT_EQ(ec, error::bad_argument);
}

TEST(HandshakePayloadTest, HelloAck) {
  crypto::Nonce nonce;
  nonce.fill(0x5a);

  uint8v payload;
  payload.put_le32(control::protocol_version);
  payload.put_le32(0);
  payload.append(nonce);

  error_code ec;
  auto ack = control::parse_hello_ack(payload, ec);

  ASSERT_TRUE(ack.has_value());
  EXPECT_EQ(ack->version, control::protocol_version);
  EXPECT_EQ(ack->result, 0u);
  EXPECT_EQ(ack->nonce, nonce);

  payload.resize(10);
  EXPECT_FALSE(control::parse_hello_ack(payload, ec).has_value());
  EXPECT_EQ(ec, error::malformed_frame);
}

TEST(HandshakePayloadTest, StatusResult) {
  uint8v payload;
  payload.put_le32(620);
  payload.append_padded("CUSA00002", control::field::title_id);

  error_code ec;
  auto status = control::parse_status_result(payload, ec);

  ASSERT_TRUE(status.has_value());
  EXPECT_EQ(status->power, ddp::Power::Standby);
  EXPECT_EQ(status->title_id, "CUSA00002");
  EXPECT_TRUE(status->title_name.empty());
}
