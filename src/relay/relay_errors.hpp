// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#ifndef H_RELAY_RELAY_ERRORS
#define H_RELAY_RELAY_ERRORS

#include <system_error>

#include "net/asio.hpp"

namespace relay {

enum class error {
  setup_plugin_failed = 1,
  tunnel_timeout,
  tunnel_not_connected,
  unknown_frame_type,
  unsupported_request,
  no_data_address,
  server_stopped,
};

const asio::error_category& relay_category();

asio::error_code make_error_code(error e);

}  // namespace relay

namespace std {
template <>
struct is_error_code_enum<relay::error> : public true_type {};
}  // namespace std

#endif  // H_RELAY_RELAY_ERRORS
