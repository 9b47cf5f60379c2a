// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#include "net/net_errors.hpp"

#include <string>

namespace net {

namespace {

class net_error_category : public asio::error_category {
 public:
  const char* name() const noexcept override { return "net"; }

  std::string message(int value) const override {
    switch (static_cast<error>(value)) {
      case error::malformed_frame:
        return "malformed frame";
      case error::frame_too_large:
        return "frame payload too large";
      case error::invalid_address:
        return "invalid address";
    }
    return "net error";
  }
};

}  // namespace

const asio::error_category& net_category() {
  static const net_error_category instance;
  return instance;
}

asio::error_code make_error_code(error e) {
  return asio::error_code(static_cast<int>(e), net_category());
}

}  // namespace net
