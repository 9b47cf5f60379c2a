// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#ifndef H_NET_FRAME
#define H_NET_FRAME

#include <stdint.h>

#include <iosfwd>
#include <vector>

#include "net/asio.hpp"
#include "net/net_errors.hpp"

namespace net {

// A frame on the wire is
//
//   +------+-----------------+-----------+
//   | TYPE |     LENGTH      |  PAYLOAD  |
//   +------+-----------------+-----------+
//   |  1   | 4 (big endian)  |  LENGTH   |
//   +------+-----------------+-----------+
//
// The type byte is opaque at this level; each peer role owns its own tag space.
constexpr size_t kFrameHeaderSize = sizeof(uint8_t) + sizeof(uint32_t);
constexpr uint32_t kMaxFramePayload = 16 * 1024 * 1024;

struct Frame {
  uint8_t type = 0;
  std::vector<uint8_t> payload;

  bool operator==(const Frame& other) const { return type == other.type && payload == other.payload; }
  bool operator!=(const Frame& other) const { return !(*this == other); }
};

std::ostream& operator<<(std::ostream& o, const Frame& frame);

// Encodes a whole frame into one contiguous buffer, so that it can be handed to
// a single write and never interleave with another frame.
std::vector<uint8_t> EncodeFrame(uint8_t type, const uint8_t* data, size_t length);

inline std::vector<uint8_t> EncodeFrame(const Frame& frame) {
  return EncodeFrame(frame.type, frame.payload.data(), frame.payload.size());
}

// Decodes the fixed-size header at |header|.
void DecodeFrameHeader(const uint8_t* header, uint8_t* type, uint32_t* length);

// Blocking helpers for any SyncReadStream / SyncWriteStream. A stream that
// ends inside a frame reports malformed_frame.
template <typename SyncReadStream>
Frame ReadFrame(SyncReadStream& stream, asio::error_code& ec) {
  Frame frame;
  uint8_t header[kFrameHeaderSize];
  size_t n = asio::read(stream, asio::buffer(header, sizeof(header)), ec);
  if (ec) {
    if (ec == asio::error::eof && n != 0) {
      ec = error::malformed_frame;
    }
    return frame;
  }
  uint32_t length;
  DecodeFrameHeader(header, &frame.type, &length);
  if (length > kMaxFramePayload) {
    ec = error::frame_too_large;
    return frame;
  }
  frame.payload.resize(length);
  if (length == 0) {
    return frame;
  }
  asio::read(stream, asio::buffer(frame.payload), ec);
  if (ec == asio::error::eof) {
    ec = error::malformed_frame;
  }
  return frame;
}

template <typename SyncWriteStream>
void WriteFrame(SyncWriteStream& stream, const Frame& frame, asio::error_code& ec) {
  std::vector<uint8_t> buf = EncodeFrame(frame);
  asio::write(stream, asio::buffer(buf), ec);
}

}  // namespace net

#endif  // H_NET_FRAME
