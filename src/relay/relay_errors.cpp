// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#include "relay/relay_errors.hpp"

#include <string>

namespace relay {

namespace {

class relay_error_category : public asio::error_category {
 public:
  const char* name() const noexcept override { return "relay"; }

  std::string message(int value) const override {
    switch (static_cast<error>(value)) {
      case error::setup_plugin_failed:
        return "setup plugin connection failed";
      case error::tunnel_timeout:
        return "tunnel keepalive timeout";
      case error::tunnel_not_connected:
        return "tunnel not connected";
      case error::unknown_frame_type:
        return "unknown frame type";
      case error::unsupported_request:
        return "unsupported request type";
      case error::no_data_address:
        return "no data address configured";
      case error::server_stopped:
        return "server stopped";
    }
    return "relay error";
  }
};

}  // namespace

const asio::error_category& relay_category() {
  static const relay_error_category instance;
  return instance;
}

asio::error_code make_error_code(error e) {
  return asio::error_code(static_cast<int>(e), relay_category());
}

}  // namespace relay
