// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#ifndef H_NET_DIALER
#define H_NET_DIALER

#include <chrono>
#include <string>

#include "net/asio.hpp"

namespace net {

// Splits "host:port" or "[v6]:port". Returns false on a malformed address or
// a port outside 1..65535.
bool SplitHostPort(const std::string& address, std::string* host, uint16_t* port);

// Connects to |address| within |timeout| and hands the connected socket over
// to |io_context|. Blocks the calling thread, so it must never be called from
// a thread running |io_context|.
asio::ip::tcp::socket Dial(asio::io_context& io_context,
                           const std::string& address,
                           std::chrono::milliseconds timeout,
                           asio::error_code& ec);

}  // namespace net

#endif  // H_NET_DIALER
