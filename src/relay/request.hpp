// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#ifndef H_RELAY_REQUEST
#define H_RELAY_REQUEST

#include <stdint.h>

#include <iosfwd>
#include <utility>
#include <vector>

#include "net/asio.hpp"
#include "net/frame.hpp"

namespace relay {

// Peer roles, each with its own frame tag space and managed connection.
enum class Role {
  PLUGIN,
  TUNNEL,
};

const char* RoleToName(Role role);

// Tag space of the plugin channel.
enum PluginFrameType : uint8_t {
  PLUGIN_PUSH_TASK = 0x01,
  // zero length, server to plugin only
  PLUGIN_TUNNEL_RECONNECT_FAILED = 0x02,
  PLUGIN_CREATE_SS_CONNECT = 0x10,
  PLUGIN_CREATE_SOCKS5_CONNECT = 0x11,
  PLUGIN_CREATE_HTTP_CONNECT = 0x12,
};

// Tag space of the tunnel channel.
enum TunnelFrameType : uint8_t {
  TUNNEL_TASK = 0x01,
  // zero length, both directions
  TUNNEL_PING = 0x02,
};

// Kinds of requests flowing into the dispatch loop. The connection creation
// kinds form a contiguous range ending at REQUEST_TYPE_END (exclusive).
enum RequestType : uint8_t {
  REQUEST_PUSH_TASK,
  REQUEST_TASK_RESULT,
  REQUEST_TUNNEL_CONNECT_OK,
  REQUEST_PING,
  REQUEST_CREATE_SS_CONNECT,
  REQUEST_CREATE_SOCKS5_CONNECT,
  REQUEST_CREATE_HTTP_CONNECT,
  REQUEST_TYPE_END,
};

const char* RequestTypeToName(RequestType type);

inline bool IsCreateConnectRequest(RequestType type) {
  return type >= REQUEST_CREATE_SS_CONNECT && type < REQUEST_TYPE_END;
}

class Request {
 public:
  Request() = default;
  explicit Request(RequestType type) : type_(type) {}
  Request(RequestType type, std::vector<uint8_t> data) : type_(type), data_(std::move(data)) {}

  RequestType type() const { return type_; }
  // empty means the request carries no task data
  const std::vector<uint8_t>& data() const { return data_; }
  bool has_data() const { return !data_.empty(); }

  bool operator==(const Request& other) const { return type_ == other.type_ && data_ == other.data_; }
  bool operator!=(const Request& other) const { return !(*this == other); }

 private:
  RequestType type_ = REQUEST_TYPE_END;
  std::vector<uint8_t> data_;
};

std::ostream& operator<<(std::ostream& o, const Request& request);

// Translates a frame read on the |role| channel. A tag outside the role's
// valid set gives unknown_frame_type.
Request FrameToRequest(Role role, net::Frame&& frame, asio::error_code& ec);

// Inverse of FrameToRequest. Kinds with no frame on |role| give
// unsupported_request.
net::Frame RequestToFrame(Role role, const Request& request, asio::error_code& ec);

}  // namespace relay

#endif  // H_RELAY_REQUEST
