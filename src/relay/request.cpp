// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#include "relay/request.hpp"

#include <iterator>
#include <ostream>

#include "relay/relay_errors.hpp"

namespace relay {

namespace {

struct FrameMapping {
  uint8_t frame_type;
  RequestType request_type;
};

constexpr FrameMapping kPluginFrames[] = {
    {PLUGIN_PUSH_TASK, REQUEST_PUSH_TASK},
    {PLUGIN_CREATE_SS_CONNECT, REQUEST_CREATE_SS_CONNECT},
    {PLUGIN_CREATE_SOCKS5_CONNECT, REQUEST_CREATE_SOCKS5_CONNECT},
    {PLUGIN_CREATE_HTTP_CONNECT, REQUEST_CREATE_HTTP_CONNECT},
};

constexpr FrameMapping kTunnelFrames[] = {
    {TUNNEL_TASK, REQUEST_TASK_RESULT},
    {TUNNEL_PING, REQUEST_PING},
};

}  // namespace

const char* RoleToName(Role role) {
  switch (role) {
    case Role::PLUGIN:
      return "plugin";
    case Role::TUNNEL:
      return "tunnel";
  }
  return "unknown";
}

const char* RequestTypeToName(RequestType type) {
  switch (type) {
    case REQUEST_PUSH_TASK:
      return "push_task";
    case REQUEST_TASK_RESULT:
      return "task_result";
    case REQUEST_TUNNEL_CONNECT_OK:
      return "tunnel_connect_ok";
    case REQUEST_PING:
      return "ping";
    case REQUEST_CREATE_SS_CONNECT:
      return "create_ss_connect";
    case REQUEST_CREATE_SOCKS5_CONNECT:
      return "create_socks5_connect";
    case REQUEST_CREATE_HTTP_CONNECT:
      return "create_http_connect";
    case REQUEST_TYPE_END:
      break;
  }
  return "invalid";
}

std::ostream& operator<<(std::ostream& o, const Request& request) {
  return o << RequestTypeToName(request.type()) << "(" << request.data().size() << " bytes)";
}

Request FrameToRequest(Role role, net::Frame&& frame, asio::error_code& ec) {
  ec = asio::error_code();
  if (role == Role::PLUGIN) {
    for (const auto& mapping : kPluginFrames) {
      if (mapping.frame_type == frame.type) {
        return Request(mapping.request_type, std::move(frame.payload));
      }
    }
  } else {
    for (const auto& mapping : kTunnelFrames) {
      if (mapping.frame_type == frame.type) {
        // probes carry nothing
        if (mapping.request_type == REQUEST_PING) {
          return Request(REQUEST_PING);
        }
        return Request(mapping.request_type, std::move(frame.payload));
      }
    }
  }
  ec = error::unknown_frame_type;
  return Request();
}

net::Frame RequestToFrame(Role role, const Request& request, asio::error_code& ec) {
  ec = asio::error_code();
  net::Frame frame;
  const FrameMapping* begin = role == Role::PLUGIN ? std::begin(kPluginFrames) : std::begin(kTunnelFrames);
  const FrameMapping* end = role == Role::PLUGIN ? std::end(kPluginFrames) : std::end(kTunnelFrames);
  for (const FrameMapping* it = begin; it != end; ++it) {
    if (it->request_type == request.type()) {
      frame.type = it->frame_type;
      frame.payload = request.data();
      return frame;
    }
  }
  ec = error::unsupported_request;
  return frame;
}

}  // namespace relay
