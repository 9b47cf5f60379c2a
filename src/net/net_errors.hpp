// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#ifndef H_NET_NET_ERRORS
#define H_NET_NET_ERRORS

#include <system_error>

#include "net/asio.hpp"

namespace net {

// Transport level failures: framing and addressing.
enum class error {
  malformed_frame = 1,
  frame_too_large,
  invalid_address,
};

const asio::error_category& net_category();

asio::error_code make_error_code(error e);

}  // namespace net

namespace std {
template <>
struct is_error_code_enum<net::error> : public true_type {};
}  // namespace std

#endif  // H_NET_NET_ERRORS
