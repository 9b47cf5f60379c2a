// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#include <gmock/gmock.h>
#include <gtest/gtest-message.h>
#include <gtest/gtest.h>

#include <sstream>
#include <vector>

#include "net/asio.hpp"
#include "net/frame.hpp"
#include "net/net_errors.hpp"
#include "test_util.hpp"

using namespace net;

TEST(FrameTest, EncodeLayout) {
  const uint8_t payload[] = {'a', 'b', 'c'};
  std::vector<uint8_t> encoded = EncodeFrame(0x10, payload, sizeof(payload));
  const uint8_t expected[] = {0x10, 0x00, 0x00, 0x00, 0x03, 'a', 'b', 'c'};
  EXPECT_EQ(testing::Bytes(expected, sizeof(expected)), testing::Bytes(encoded));
}

TEST(FrameTest, EncodeEmptyPayload) {
  std::vector<uint8_t> encoded = EncodeFrame(Frame{0x02, {}});
  const uint8_t expected[] = {0x02, 0x00, 0x00, 0x00, 0x00};
  EXPECT_EQ(testing::Bytes(expected, sizeof(expected)), testing::Bytes(encoded));
}

TEST(FrameTest, DecodeHeaderIsBigEndian) {
  const uint8_t header[] = {0x01, 0x01, 0x02, 0x03, 0x04};
  uint8_t type;
  uint32_t length;
  DecodeFrameHeader(header, &type, &length);
  EXPECT_EQ(0x01, type);
  EXPECT_EQ(0x01020304u, length);
}

TEST(FrameTest, ErrorsBelongToNetCategory) {
  asio::error_code ec = error::malformed_frame;
  EXPECT_STREQ("net", ec.category().name());
  EXPECT_EQ("malformed frame", ec.message());
  ec = error::frame_too_large;
  EXPECT_EQ(&net_category(), &ec.category());
}

TEST(FrameTest, Printable) {
  std::ostringstream os;
  os << Frame{0x11, {1, 2}};
  EXPECT_FALSE(os.str().empty());
}

class FrameStreamTest : public ::testing::Test {
 protected:
  void SetUp() override { asio::local::connect_pair(local_, peer_); }

  void SendRaw(const std::vector<uint8_t>& bytes, bool close) {
    asio::error_code ec;
    asio::write(peer_, asio::buffer(bytes), ec);
    ASSERT_FALSE(ec) << ec;
    if (close) {
      peer_.close(ec);
    }
  }

  asio::io_context io_context_;
  asio::local::stream_protocol::socket local_{io_context_};
  asio::local::stream_protocol::socket peer_{io_context_};
};

TEST_F(FrameStreamTest, WriteThenRead) {
  asio::error_code ec;
  WriteFrame(peer_, Frame{0x12, {'h', 'i'}}, ec);
  ASSERT_FALSE(ec) << ec;
  WriteFrame(peer_, Frame{0x02, {}}, ec);
  ASSERT_FALSE(ec) << ec;

  Frame frame = ReadFrame(local_, ec);
  ASSERT_FALSE(ec) << ec;
  EXPECT_EQ(Frame({0x12, {'h', 'i'}}), frame);
  frame = ReadFrame(local_, ec);
  ASSERT_FALSE(ec) << ec;
  EXPECT_EQ(Frame({0x02, {}}), frame);
}

TEST_F(FrameStreamTest, CleanEndOfStream) {
  SendRaw({}, true);
  asio::error_code ec;
  ReadFrame(local_, ec);
  EXPECT_EQ(asio::error::eof, ec);
}

TEST_F(FrameStreamTest, EndInsideHeaderIsMalformed) {
  SendRaw({0x01, 0x00}, true);
  asio::error_code ec;
  ReadFrame(local_, ec);
  EXPECT_EQ(error::malformed_frame, ec);
}

TEST_F(FrameStreamTest, EndInsidePayloadIsMalformed) {
  SendRaw({0x01, 0x00, 0x00, 0x00, 0x0a, 'a', 'b', 'c'}, true);
  asio::error_code ec;
  ReadFrame(local_, ec);
  EXPECT_EQ(error::malformed_frame, ec);
}

TEST_F(FrameStreamTest, OversizedLengthIsRejected) {
  SendRaw({0x01, 0xff, 0xff, 0xff, 0xff}, false);
  asio::error_code ec;
  ReadFrame(local_, ec);
  EXPECT_EQ(error::frame_too_large, ec);
}
