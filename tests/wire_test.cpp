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

// Control channel framing and DDP datagram tests.
#include "base/error.hpp"
#include "base/uint8v.hpp"
#include "wire/codec.hpp"
#include "wire/ddp_msg.hpp"

#include <gtest/gtest.h>

using namespace psremote;

namespace {

uint8v bytes_of(std::initializer_list<uint8_t> il) { return uint8v(il); }

} // namespace

TEST(CodecTest, EncodeLayout) {
  const auto payload = bytes_of({0xaa, 0xbb, 0xcc});
  const auto out = wire::encode(0x1a, payload);

  ASSERT_EQ(out.size(), 11u);
  EXPECT_EQ(out.le32(0), 11u); // length includes the header
  EXPECT_EQ(out.le32(4), 0x1au);
  EXPECT_EQ(out[8], 0xaa);
  EXPECT_EQ(out[10], 0xcc);
}

TEST(CodecTest, DecodeRejectsLengthMismatch) {
  auto bytes = wire::encode(0x04, uint8v());
  bytes.push_back(0x00);

  error_code ec;
  auto frame = wire::decode(bytes, ec);

  EXPECT_FALSE(frame.has_value());
  EXPECT_EQ(ec, error::malformed_frame);
}

TEST(CodecTest, DecodeShortHeader) {
  error_code ec;
  auto frame = wire::decode(bytes_of({0x08, 0x00, 0x00}), ec);

  EXPECT_FALSE(frame.has_value());
  EXPECT_EQ(ec, error::malformed_frame);
}

TEST(CodecTest, StreamReassemblesChunks) {
  const auto first = wire::encode(0x12, bytes_of({1, 2, 3, 4, 5}));
  const auto second = wire::encode(0x1b, bytes_of({9}));

  uint8v stream(first);
  stream.append(second);

  wire::Codec codec;
  error_code ec;

  // feed one byte at a time, nothing is available until the first frame completes
  size_t fed{0};
  std::optional<wire::Frame> frame;

  while (!frame.has_value() && (fed < stream.size())) {
    codec.feed(std::span(stream.data() + fed, 1));
    fed++;

    frame = codec.next(ec);
    ASSERT_FALSE(ec);
  }

  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(fed, first.size());
  EXPECT_EQ(frame->opcode, 0x12u);
  EXPECT_EQ(frame->payload, bytes_of({1, 2, 3, 4, 5}));

  codec.feed(std::span(stream.data() + fed, stream.size() - fed));

  frame = codec.next(ec);
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(frame->opcode, 0x1bu);
  EXPECT_EQ(codec.buffered(), 0u);

  EXPECT_FALSE(codec.next(ec).has_value());
  EXPECT_FALSE(ec);
}

TEST(CodecTest, SurplusBytesKept) {
  auto stream = wire::encode(0x07, bytes_of({0, 0, 0, 0}));
  const auto next = wire::encode(0x04, uint8v());
  stream.insert(stream.end(), next.begin(), next.begin() + 3);

  wire::Codec codec;
  codec.feed(stream);

  error_code ec;
  auto frame = codec.next(ec);

  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(codec.buffered(), 3u);
  EXPECT_FALSE(codec.next(ec).has_value());
  EXPECT_FALSE(ec);
}

TEST(CodecTest, MalformedIsSticky) {
  wire::Codec codec;
  codec.feed(bytes_of({0x04, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00}));

  error_code ec;
  EXPECT_FALSE(codec.next(ec).has_value());
  EXPECT_EQ(ec, error::malformed_frame);
  EXPECT_TRUE(codec.malformed());

  // a valid frame afterwards is not decoded
  codec.feed(wire::encode(0x04, uint8v()));
  EXPECT_FALSE(codec.next(ec).has_value());
  EXPECT_EQ(ec, error::malformed_frame);

  codec.reset();
  codec.feed(wire::encode(0x04, uint8v()));

  auto frame = codec.next(ec);
  EXPECT_FALSE(ec);
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(frame->opcode, 0x04u);
}

TEST(CodecTest, FrameTooLarge) {
  wire::Codec codec(64);

  uint8v header;
  header.put_le32(65);
  header.put_le32(0x12);
  codec.feed(header);

  error_code ec;
  EXPECT_FALSE(codec.next(ec).has_value());
  EXPECT_EQ(ec, error::frame_too_large);
  EXPECT_EQ(error::kind(ec), ErrorKind::Malformed);
}

TEST(DdpMsgTest, SearchRequest) {
  const auto msg = wire::make_search();

  EXPECT_EQ(msg, "SRCH * HTTP/1.1\ndevice-discovery-protocol-version:00020020\n");
  EXPECT_EQ(wire::request_type(msg), wire::DdpType::Search);
}

TEST(DdpMsgTest, WakeupCarriesCredentialAtFixedOffset) {
  const auto msg = wire::make_wakeup("123456789");

  EXPECT_TRUE(msg.starts_with("WAKEUP * HTTP/1.1\nuser-credential:123456789\n"));
  EXPECT_EQ(csv(msg).substr(wire::credential_offset(wire::DdpType::Wakeup), 9), "123456789");

  error_code ec;
  EXPECT_EQ(wire::extract_credential(msg, ec), "123456789");
  EXPECT_FALSE(ec);

  EXPECT_EQ(wire::extract_credential(wire::make_launch("abc"), ec), "abc");
  EXPECT_FALSE(ec);
}

TEST(DdpMsgTest, ExtractCredentialRejectsSearch) {
  error_code ec;

  EXPECT_TRUE(wire::extract_credential(wire::make_search(), ec).empty());
  EXPECT_EQ(ec, error::malformed_status);

  EXPECT_TRUE(wire::extract_credential("WAKEUP * HTTP/1.1\nclient-type:a\n", ec).empty());
  EXPECT_EQ(ec, error::malformed_status);
}

TEST(DdpMsgTest, ParseStatus) {
  const auto datagram = wire::make_status(200, "Ok",
                                          {{"host-id", "A1B2C3"},
                                           {"host-name", "Living Room"},
                                           {"running-app-titleid", "CUSA00001"},
                                           {"running-app-name", "Some: Game"}});

  error_code ec;
  auto status = wire::parse_status(datagram, ec);

  ASSERT_TRUE(status.has_value());
  EXPECT_FALSE(ec);
  EXPECT_EQ(status->code, 200);
  EXPECT_EQ(status->text, "Ok");
  EXPECT_EQ(status->field("host-name"), "Living Room");

  // values run to the end of line, colons included
  EXPECT_EQ(status->field("running-app-name"), "Some: Game");
  EXPECT_EQ(status->field(wire::ddp::version_key), wire::ddp::version);
  EXPECT_FALSE(status->has("missing"));
}

TEST(DdpMsgTest, ParseStatusToleratesCrLf) {
  error_code ec;
  auto status = wire::parse_status("HTTP/1.1 620 Server Standby\r\nhost-id:XYZ\r\n", ec);

  ASSERT_TRUE(status.has_value());
  EXPECT_EQ(status->code, 620);
  EXPECT_EQ(status->text, "Server Standby");
  EXPECT_EQ(status->field("host-id"), "XYZ");
}

TEST(DdpMsgTest, ParseStatusIgnoresSearch) {
  error_code ec;

  EXPECT_FALSE(wire::parse_status(wire::make_search(), ec).has_value());
  EXPECT_FALSE(ec);
}

TEST(DdpMsgTest, ParseStatusWithoutStatusLine) {
  error_code ec;

  EXPECT_FALSE(wire::parse_status("host-id:XYZ\nhost-name:abc\n", ec).has_value());
  EXPECT_EQ(ec, error::malformed_status);
}
