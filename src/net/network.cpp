// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2020-2024 Chilledheart  */

#include "net/network.hpp"

#include "core/logging.hpp"

namespace net {

void SetSocketTcpNoDelay(asio::ip::tcp::socket* socket, asio::error_code& ec) {
  ec = asio::error_code();
  asio::ip::tcp::no_delay option(true);
  socket->set_option(option, ec);
  if (ec) {
    VLOG(2) << "TCP_NODELAY is not supported on this platform: " << ec;
  } else {
    VLOG(3) << "Applied TCP_NODELAY";
  }
}

void SetSocketKeepAlive(asio::ip::tcp::socket* socket, asio::error_code& ec) {
  ec = asio::error_code();
  asio::socket_base::keep_alive option(true);
  socket->set_option(option, ec);
  if (ec) {
    VLOG(2) << "TCP Keep Alive is not supported on this platform: " << ec;
  } else {
    VLOG(3) << "Applied SO socket_option: so_keepalive";
  }
}

}  // namespace net
