// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2020-2024 Chilledheart  */

#ifndef H_NET_NETWORK
#define H_NET_NETWORK

#include "net/asio.hpp"

namespace net {

void SetSocketTcpNoDelay(asio::ip::tcp::socket* socket, asio::error_code& ec);

// Turns on SO_KEEPALIVE so a half-dead peer is eventually noticed by the kernel
// even when nobody is writing.
void SetSocketKeepAlive(asio::ip::tcp::socket* socket, asio::error_code& ec);

}  // namespace net

#endif  // H_NET_NETWORK
