// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#include "net/dialer.hpp"

#include <unistd.h>

#include <absl/strings/numbers.h>

#include "core/logging.hpp"
#include "net/net_errors.hpp"
#include "net/network.hpp"

namespace net {

bool SplitHostPort(const std::string& address, std::string* host, uint16_t* port) {
  std::string port_str;
  if (!address.empty() && address[0] == '[') {
    auto close = address.find(']');
    if (close == std::string::npos || close + 1 >= address.size() || address[close + 1] != ':') {
      return false;
    }
    *host = address.substr(1, close - 1);
    port_str = address.substr(close + 2);
  } else {
    auto colon = address.rfind(':');
    if (colon == std::string::npos) {
      return false;
    }
    *host = address.substr(0, colon);
    // a bare v6 literal needs brackets
    if (host->find(':') != std::string::npos) {
      return false;
    }
    port_str = address.substr(colon + 1);
  }
  uint32_t port_num;
  if (host->empty() || !absl::SimpleAtoi(port_str, &port_num) || port_num == 0 || port_num > 65535) {
    return false;
  }
  *port = static_cast<uint16_t>(port_num);
  return true;
}

asio::ip::tcp::socket Dial(asio::io_context& io_context,
                           const std::string& address,
                           std::chrono::milliseconds timeout,
                           asio::error_code& ec) {
  asio::ip::tcp::socket result(io_context);
  std::string host;
  uint16_t port;
  if (!SplitHostPort(address, &host, &port)) {
    ec = error::invalid_address;
    return result;
  }

  // the connect runs on a private io_context so the caller never waits on
  // handlers queued behind the shared worker
  asio::io_context dial_context;
  asio::ip::tcp::resolver resolver(dial_context);
  asio::ip::tcp::socket socket(dial_context);
  asio::steady_timer timer(dial_context);
  bool timed_out = false;

  ec = asio::error::would_block;
  timer.expires_after(timeout);
  timer.async_wait([&](asio::error_code timer_ec) {
    if (timer_ec == asio::error::operation_aborted) {
      return;
    }
    timed_out = true;
    resolver.cancel();
    asio::error_code close_ec;
    socket.close(close_ec);
  });
  resolver.async_resolve(host, std::to_string(port),
                         [&](asio::error_code resolve_ec, asio::ip::tcp::resolver::results_type results) {
                           if (resolve_ec) {
                             ec = resolve_ec;
                             timer.cancel();
                             return;
                           }
                           asio::async_connect(socket, results,
                                               [&](asio::error_code connect_ec, const asio::ip::tcp::endpoint&) {
                                                 ec = connect_ec;
                                                 timer.cancel();
                                               });
                         });
  dial_context.run();

  if (timed_out) {
    ec = asio::error::timed_out;
  }
  if (ec) {
    VLOG(1) << "dial " << address << " failed: " << ec;
    return result;
  }

  asio::error_code opt_ec;
  SetSocketTcpNoDelay(&socket, opt_ec);
  SetSocketKeepAlive(&socket, opt_ec);

  auto protocol = socket.local_endpoint(ec).protocol();
  if (ec) {
    return result;
  }
  auto native_handle = socket.release(ec);
  if (ec) {
    return result;
  }
  result.assign(protocol, native_handle, ec);
  if (ec) {
    ::close(native_handle);
    return result;
  }
  VLOG(2) << "dialed " << address;
  return result;
}

}  // namespace net
