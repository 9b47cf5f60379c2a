// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#ifndef H_RELAY_KEEPALIVE_MONITOR
#define H_RELAY_KEEPALIVE_MONITOR

#include <stdint.h>

#include <atomic>
#include <chrono>
#include <memory>

#include "core/cancel_scope.hpp"
#include "core/wait_group.hpp"
#include "net/asio.hpp"
#include "net/link.hpp"
#include "relay/dispatch_queue.hpp"

namespace relay {

// Watches the tunnel for silence. Every |probe_interval| it looks at the last
// receipt time: a receipt since the previous tick resets the idle window,
// otherwise the window grows by one interval. While the window is below
// |probe_timeout| a TUNNEL_PING goes out; once it reaches the timeout a
// tunnel_timeout fault is posted and the monitor stops.
//
// With interval I, timeout (N+1)*I and a silent peer exactly N probes are sent
// before the fault, regardless of timer jitter.
class KeepaliveMonitor : public std::enable_shared_from_this<KeepaliveMonitor> {
 public:
  KeepaliveMonitor(uint64_t generation,
                   std::shared_ptr<net::Link> link,
                   std::shared_ptr<CancelScope> scope,
                   WaitGroup* wait_group,
                   DispatchQueue* queue,
                   const std::atomic<uint64_t>* last_recv_time,
                   std::chrono::milliseconds probe_interval,
                   std::chrono::milliseconds probe_timeout);
  ~KeepaliveMonitor();

  KeepaliveMonitor(const KeepaliveMonitor&) = delete;
  KeepaliveMonitor& operator=(const KeepaliveMonitor&) = delete;

  void Start();

  uint64_t probes_sent() const { return probes_sent_.load(std::memory_order_relaxed); }

 private:
  void OnStart();
  void ScheduleTick();
  void OnTick(asio::error_code ec);
  void OnCancelled();
  void Finish();

  const uint64_t generation_;
  std::shared_ptr<net::Link> link_;
  std::shared_ptr<CancelScope> scope_;
  WaitGroup* wait_group_;
  DispatchQueue* queue_;
  const std::atomic<uint64_t>* last_recv_time_;
  const std::chrono::milliseconds probe_interval_;
  const std::chrono::milliseconds probe_timeout_;

  asio::steady_timer timer_;
  uint64_t cancel_callback_id_ = 0;
  uint64_t observed_recv_time_ = 0;
  // consecutive ticks without a receipt
  int64_t missed_ticks_ = 0;
  bool finished_ = false;
  std::atomic<uint64_t> probes_sent_{0};
};

}  // namespace relay

#endif  // H_RELAY_KEEPALIVE_MONITOR
