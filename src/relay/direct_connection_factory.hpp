// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#ifndef H_RELAY_DIRECT_CONNECTION_FACTORY
#define H_RELAY_DIRECT_CONNECTION_FACTORY

#include <stdint.h>

#include <atomic>
#include <chrono>
#include <list>
#include <memory>
#include <string>
#include <vector>

#include "net/asio.hpp"
#include "relay/data_connection_factory.hpp"

namespace relay {

// Opens a plain TCP connection to the data address for every creation
// request. The task data goes out as the first frame, tagged with the
// plugin's creation tag of that kind. A connection is held until its peer
// closes it or Shutdown() runs; Shutdown() has to run on |io_context|.
//
// Create() only validates and schedules; the resolve and connect run on
// |io_context| and their failures are logged.
class DirectConnectionFactory : public DataConnectionFactory {
 public:
  DirectConnectionFactory(asio::io_context& io_context,
                          std::string data_address,
                          std::chrono::milliseconds connect_timeout);
  ~DirectConnectionFactory() override;

  void Create(RequestType type, const std::vector<uint8_t>& task_data, asio::error_code& ec) override;
  void Shutdown() override;
  const char* Name() const override { return "direct"; }

  uint64_t connected() const { return connected_.load(std::memory_order_relaxed); }
  uint64_t failed() const { return failed_.load(std::memory_order_relaxed); }
  // Connections currently held, connecting ones included.
  size_t active() const { return active_.load(std::memory_order_relaxed); }

 private:
  struct DataConnection;

  void Connect(std::shared_ptr<DataConnection> conn);
  void OnResolved(std::shared_ptr<DataConnection> conn,
                  asio::error_code ec,
                  asio::ip::tcp::resolver::results_type results);
  void OnConnected(std::shared_ptr<DataConnection> conn, asio::error_code ec);
  void OnFailed(std::shared_ptr<DataConnection> conn, asio::error_code ec);
  void WaitForClose(std::shared_ptr<DataConnection> conn);
  void Release(std::shared_ptr<DataConnection> conn);

  asio::io_context& io_context_;
  const std::string data_address_;
  std::string host_;
  uint16_t port_ = 0;
  bool address_valid_ = false;
  const std::chrono::milliseconds connect_timeout_;

  // touched on the io thread only
  std::list<std::shared_ptr<DataConnection>> connections_;
  bool shutdown_ = false;

  std::atomic<uint64_t> connected_{0};
  std::atomic<uint64_t> failed_{0};
  std::atomic<size_t> active_{0};
};

}  // namespace relay

#endif  // H_RELAY_DIRECT_CONNECTION_FACTORY
