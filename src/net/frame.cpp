// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#include "net/frame.hpp"

#include <string.h>

#include <ostream>

#include "core/logging.hpp"

namespace net {

std::ostream& operator<<(std::ostream& o, const Frame& frame) {
  return o << "frame{type: 0x" << std::hex << static_cast<int>(frame.type) << std::dec
           << " length: " << frame.payload.size() << "}";
}

std::vector<uint8_t> EncodeFrame(uint8_t type, const uint8_t* data, size_t length) {
  DCHECK_LE(length, kMaxFramePayload);
  std::vector<uint8_t> buf(kFrameHeaderSize + length);
  buf[0] = type;
  buf[1] = static_cast<uint8_t>(length >> 24);
  buf[2] = static_cast<uint8_t>(length >> 16);
  buf[3] = static_cast<uint8_t>(length >> 8);
  buf[4] = static_cast<uint8_t>(length);
  if (length) {
    memcpy(buf.data() + kFrameHeaderSize, data, length);
  }
  return buf;
}

void DecodeFrameHeader(const uint8_t* header, uint8_t* type, uint32_t* length) {
  *type = header[0];
  *length = (static_cast<uint32_t>(header[1]) << 24) | (static_cast<uint32_t>(header[2]) << 16) |
            (static_cast<uint32_t>(header[3]) << 8) | static_cast<uint32_t>(header[4]);
}

}  // namespace net
