// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#ifndef H_RELAY_POLLER
#define H_RELAY_POLLER

#include <stdint.h>

#include <atomic>
#include <chrono>
#include <memory>

#include "core/cancel_scope.hpp"
#include "core/wait_group.hpp"
#include "net/asio.hpp"
#include "net/frame.hpp"
#include "net/link.hpp"
#include "relay/dispatch_queue.hpp"
#include "relay/request.hpp"

namespace relay {

// Reads frames off one role's link and turns them into requests on the
// dispatch inbox until the link fails or |scope| is cancelled.
//
// Every iteration waits for the socket to become readable, bounded by
// |read_timeout|. An elapsed deadline is not an error: the poller re-checks
// its scope and waits again. Once readable, exactly one frame is read. A
// malformed frame, a tag the role does not know, end of stream or an I/O
// error posts a single fault for this generation and ends the loop.
//
// The tunnel poller emits REQUEST_TUNNEL_CONNECT_OK before reading anything
// and stamps |last_recv_time| for every frame it accepts.
//
// Start() takes one unit of |wait_group|; it is given back exactly once, when
// the loop ends for whatever reason.
class Poller : public std::enable_shared_from_this<Poller> {
 public:
  Poller(Role role,
         uint64_t generation,
         std::shared_ptr<net::Link> link,
         std::shared_ptr<CancelScope> scope,
         WaitGroup* wait_group,
         DispatchQueue* queue,
         std::atomic<uint64_t>* last_recv_time,
         std::chrono::milliseconds read_timeout);
  ~Poller();

  Poller(const Poller&) = delete;
  Poller& operator=(const Poller&) = delete;

  void Start();

  Role role() const { return role_; }
  uint64_t generation() const { return generation_; }

  // Number of elapsed read deadlines, for tests.
  uint64_t deadlines() const { return deadlines_.load(std::memory_order_relaxed); }

 private:
  void OnStart();
  void OnCancelled();

  void WaitReadable();
  void OnDeadline(asio::error_code ec);
  void OnReadable(asio::error_code ec);
  void ReadHeader();
  void OnHeader(asio::error_code ec, size_t bytes_transferred);
  void OnPayload(asio::error_code ec, size_t bytes_transferred);

  // Hands |request| to the dispatch inbox and continues with the next read,
  // possibly after sitting parked on a full inbox.
  void Emit(Request request);

  void ReportFault(asio::error_code ec);
  void Finish();

  const char* name() const { return RoleToName(role_); }

  const Role role_;
  const uint64_t generation_;
  std::shared_ptr<net::Link> link_;
  std::shared_ptr<CancelScope> scope_;
  WaitGroup* wait_group_;
  DispatchQueue* queue_;
  std::atomic<uint64_t>* last_recv_time_;
  const std::chrono::milliseconds read_timeout_;

  asio::steady_timer deadline_timer_;
  uint8_t header_[net::kFrameHeaderSize];
  net::Frame frame_;
  uint64_t cancel_callback_id_ = 0;
  uint64_t parked_ticket_ = 0;
  bool waiting_readable_ = false;
  bool finished_ = false;
  std::atomic<uint64_t> deadlines_{0};
};

}  // namespace relay

#endif  // H_RELAY_POLLER
