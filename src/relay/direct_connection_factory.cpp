// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#include "relay/direct_connection_factory.hpp"

#include <utility>

#include "core/compiler_specific.hpp"
#include "core/logging.hpp"
#include "net/dialer.hpp"
#include "net/frame.hpp"
#include "net/net_errors.hpp"
#include "net/network.hpp"
#include "relay/relay_errors.hpp"

namespace relay {

struct DirectConnectionFactory::DataConnection {
  explicit DataConnection(asio::io_context& io_context)
      : resolver(io_context), socket(io_context), timer(io_context) {}

  RequestType type = REQUEST_TYPE_END;
  std::vector<uint8_t> first_frame;
  asio::ip::tcp::resolver resolver;
  asio::ip::tcp::socket socket;
  asio::steady_timer timer;
  uint8_t read_buffer[4096];
  bool done = false;
};

DirectConnectionFactory::DirectConnectionFactory(asio::io_context& io_context,
                                                 std::string data_address,
                                                 std::chrono::milliseconds connect_timeout)
    : io_context_(io_context), data_address_(std::move(data_address)), connect_timeout_(connect_timeout) {
  if (!data_address_.empty()) {
    address_valid_ = net::SplitHostPort(data_address_, &host_, &port_);
    LOG_IF(WARNING, !address_valid_) << "data: invalid address " << data_address_;
  }
}

DirectConnectionFactory::~DirectConnectionFactory() = default;

void DirectConnectionFactory::Create(RequestType type, const std::vector<uint8_t>& task_data, asio::error_code& ec) {
  ec = asio::error_code();
  if (!IsCreateConnectRequest(type)) {
    ec = error::unsupported_request;
    return;
  }
  if (data_address_.empty()) {
    ec = error::no_data_address;
    return;
  }
  if (!address_valid_) {
    ec = net::error::invalid_address;
    return;
  }
  net::Frame frame = RequestToFrame(Role::PLUGIN, Request(type, task_data), ec);
  if (ec) {
    return;
  }

  auto conn = std::make_shared<DataConnection>(io_context_);
  conn->type = type;
  conn->first_frame = net::EncodeFrame(frame);
  asio::post(io_context_, [this, conn]() { Connect(conn); });
}

void DirectConnectionFactory::Connect(std::shared_ptr<DataConnection> conn) {
  if (shutdown_) {
    return;
  }
  connections_.push_back(conn);
  active_.store(connections_.size(), std::memory_order_relaxed);
  VLOG(2) << "data: " << RequestTypeToName(conn->type) << " connecting to " << data_address_;

  conn->timer.expires_after(connect_timeout_);
  conn->timer.async_wait([this, conn](asio::error_code ec) {
    if (UNLIKELY(ec == asio::error::operation_aborted)) {
      return;
    }
    OnFailed(conn, asio::error::timed_out);
  });
  conn->resolver.async_resolve(host_, std::to_string(port_),
                               [this, conn](asio::error_code ec, asio::ip::tcp::resolver::results_type results) {
                                 OnResolved(conn, ec, std::move(results));
                               });
}

void DirectConnectionFactory::OnResolved(std::shared_ptr<DataConnection> conn,
                                         asio::error_code ec,
                                         asio::ip::tcp::resolver::results_type results) {
  if (conn->done) {
    return;
  }
  if (ec) {
    OnFailed(conn, ec);
    return;
  }
  asio::async_connect(conn->socket, results,
                      [this, conn](asio::error_code ec, const asio::ip::tcp::endpoint&) { OnConnected(conn, ec); });
}

void DirectConnectionFactory::OnConnected(std::shared_ptr<DataConnection> conn, asio::error_code ec) {
  if (conn->done) {
    return;
  }
  if (ec) {
    OnFailed(conn, ec);
    return;
  }
  conn->done = true;
  conn->timer.cancel();
  ++connected_;
  asio::error_code opt_ec;
  net::SetSocketTcpNoDelay(&conn->socket, opt_ec);
  VLOG(1) << "data: " << RequestTypeToName(conn->type) << " connected to " << data_address_;

  asio::async_write(conn->socket, asio::buffer(conn->first_frame), [this, conn](asio::error_code ec, size_t) {
    if (UNLIKELY(ec == asio::error::operation_aborted)) {
      return;
    }
    if (ec) {
      LOG(WARNING) << "data: " << RequestTypeToName(conn->type) << " write failed: " << ec;
      Release(conn);
      return;
    }
    conn->first_frame.clear();
    WaitForClose(conn);
  });
}

void DirectConnectionFactory::WaitForClose(std::shared_ptr<DataConnection> conn) {
  // the data peer owns the rest of the conversation, anything it sends is dropped
  conn->socket.async_read_some(asio::buffer(conn->read_buffer), [this, conn](asio::error_code ec, size_t bytes) {
    if (UNLIKELY(ec == asio::error::operation_aborted)) {
      return;
    }
    if (ec) {
      VLOG(1) << "data: " << RequestTypeToName(conn->type) << " connection closed: " << ec;
      Release(conn);
      return;
    }
    VLOG(3) << "data: " << RequestTypeToName(conn->type) << " discarded " << bytes << " bytes";
    WaitForClose(conn);
  });
}

void DirectConnectionFactory::Release(std::shared_ptr<DataConnection> conn) {
  asio::error_code ec;
  conn->socket.close(ec);
  connections_.remove(conn);
  active_.store(connections_.size(), std::memory_order_relaxed);
}

void DirectConnectionFactory::OnFailed(std::shared_ptr<DataConnection> conn, asio::error_code ec) {
  if (conn->done) {
    return;
  }
  conn->done = true;
  ++failed_;
  LOG(WARNING) << "data: " << RequestTypeToName(conn->type) << " connect to " << data_address_ << " failed: " << ec;
  conn->timer.cancel();
  conn->resolver.cancel();
  Release(conn);
}

void DirectConnectionFactory::Shutdown() {
  shutdown_ = true;
  VLOG(1) << "data: closing " << connections_.size() << " connections";
  for (auto& conn : connections_) {
    conn->done = true;
    conn->timer.cancel();
    conn->resolver.cancel();
    asio::error_code ec;
    conn->socket.close(ec);
  }
  connections_.clear();
  active_.store(0, std::memory_order_relaxed);
}

}  // namespace relay
