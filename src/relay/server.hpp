// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#ifndef H_RELAY_SERVER
#define H_RELAY_SERVER

#include <stdint.h>

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include <absl/time/time.h>

#include "core/cancel_scope.hpp"
#include "net/asio.hpp"
#include "net/link.hpp"
#include "relay/connection_manager.hpp"
#include "relay/data_connection_factory.hpp"
#include "relay/dispatch_queue.hpp"
#include "relay/request.hpp"
#include "relay/server_config.hpp"
#include "relay/task_delegate.hpp"

namespace relay {

// Bridges the plugin channel and the tunnel channel.
//
// All poll loops and the keepalive monitor run on one background io thread.
// Loop() runs on the caller's thread and is the only place where requests are
// dispatched and faults are acted upon: a plugin fault leaves the plugin down,
// a tunnel fault gets exactly one reconnect attempt, and a failed attempt is
// reported to the plugin with PLUGIN_TUNNEL_RECONNECT_FAILED. There is no
// retry beyond that; ReconnectTunnel() is the trigger for another attempt.
//
// The first tunnel connection goes through the same path: Start() only sets
// up the plugin and queues a tunnel_not_connected fault.
class Server {
 public:
  // An empty address disables automatic setup for that role. The data
  // address is handed to the default data connection factory.
  Server(std::string plugin_address,
         std::string control_address,
         std::string data_address,
         const ServerConfig& config = ServerConfig());
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  // Not owned, must outlive the server. Set before Start().
  void set_task_delegate(TaskDelegate* delegate) { task_delegate_ = delegate; }
  // Replaces the default DirectConnectionFactory. Set before Start().
  void set_data_connection_factory(std::unique_ptr<DataConnectionFactory> factory);

  // Sets up the plugin connection; a failure gives setup_plugin_failed.
  void Start(asio::error_code& ec);

  // Dispatches until Stop(). Blocks the calling thread.
  void Loop();

  // Cancels every loop and makes Loop() return. Safe from any thread,
  // including the io thread; never blocks.
  void Stop();

  // Stops, waits for every loop to exit and shuts the io thread down. Must
  // not be called from the io thread.
  void Join();

  void Setup(Role role, asio::error_code& ec) { connections_.Setup(role, ec); }
  void Attach(Role role, net::Link::socket_type&& socket) { connections_.Attach(role, std::move(socket)); }
  void Retire(Role role) { connections_.Retire(role); }

  void HandleRequest(const Request& request);

  // One reconnect attempt for the tunnel. Returns the dial error, if any,
  // after the plugin has been told.
  asio::error_code HandleTunnelError(asio::error_code fault);

  void HandlePluginError(asio::error_code fault);

  void SetTunnelAddress(std::string address) { connections_.SetAddress(Role::TUNNEL, std::move(address)); }

  // Asks the dispatch loop for another tunnel reconnect attempt.
  void ReconnectTunnel();

  asio::io_context& io_context() { return io_context_; }
  ConnectionManager& connections() { return connections_; }
  DispatchQueue& queue() { return queue_; }
  DataConnectionFactory* data_connection_factory() { return factory_.get(); }

  uint64_t last_recv_time() const { return last_recv_time_.load(std::memory_order_acquire); }
  bool tunnel_ready() const { return tunnel_ready_.load(std::memory_order_acquire); }
  uint64_t pings_received() const { return pings_received_.load(std::memory_order_relaxed); }
  uint64_t requests_dispatched() const { return requests_dispatched_.load(std::memory_order_relaxed); }

  int active_loops(Role role) const { return connections_.active_loops(role); }
  bool WaitIdle(Role role, absl::Duration timeout = absl::InfiniteDuration()) {
    return connections_.WaitIdle(role, timeout);
  }

 private:
  void WorkFunc();
  void HandleFault(const DispatchEvent& event);

  asio::io_context io_context_;
  std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
  std::shared_ptr<CancelScope> root_;
  DispatchQueue queue_;
  std::atomic<uint64_t> last_recv_time_{0};
  const ServerConfig config_;
  ConnectionManager connections_;

  TaskDelegate* task_delegate_ = nullptr;
  std::unique_ptr<DataConnectionFactory> factory_;

  std::atomic<bool> tunnel_ready_{false};
  std::atomic<uint64_t> pings_received_{0};
  std::atomic<uint64_t> requests_dispatched_{0};
  bool joined_ = false;

  std::thread thread_;
};

}  // namespace relay

#endif  // H_RELAY_SERVER
