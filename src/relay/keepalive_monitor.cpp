// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#include "relay/keepalive_monitor.hpp"

#include <utility>

#include "core/compiler_specific.hpp"
#include "core/logging.hpp"
#include "relay/relay_errors.hpp"
#include "relay/request.hpp"

namespace relay {

KeepaliveMonitor::KeepaliveMonitor(uint64_t generation,
                                   std::shared_ptr<net::Link> link,
                                   std::shared_ptr<CancelScope> scope,
                                   WaitGroup* wait_group,
                                   DispatchQueue* queue,
                                   const std::atomic<uint64_t>* last_recv_time,
                                   std::chrono::milliseconds probe_interval,
                                   std::chrono::milliseconds probe_timeout)
    : generation_(generation),
      link_(std::move(link)),
      scope_(std::move(scope)),
      wait_group_(wait_group),
      queue_(queue),
      last_recv_time_(last_recv_time),
      probe_interval_(probe_interval),
      probe_timeout_(probe_timeout),
      timer_(link_->socket().get_executor()) {
  DCHECK_GT(probe_interval_.count(), 0);
  DCHECK_GT(probe_timeout_, probe_interval_);
}

KeepaliveMonitor::~KeepaliveMonitor() {
  VLOG(3) << "tunnel: keepalive monitor " << generation_ << " freed";
}

void KeepaliveMonitor::Start() {
  wait_group_->Add(1);
  asio::post(link_->socket().get_executor(), [self = shared_from_this()]() { self->OnStart(); });
}

void KeepaliveMonitor::OnStart() {
  auto executor = link_->socket().get_executor();
  cancel_callback_id_ = scope_->AddCancelCallback([self = shared_from_this(), executor]() {
    asio::post(executor, [self]() { self->OnCancelled(); });
  });
  if (scope_->cancelled()) {
    Finish();
    return;
  }
  observed_recv_time_ = last_recv_time_->load(std::memory_order_acquire);
  missed_ticks_ = 0;
  VLOG(2) << "tunnel: keepalive monitor " << generation_ << " started, interval " << probe_interval_.count()
          << "ms timeout " << probe_timeout_.count() << "ms";
  ScheduleTick();
}

void KeepaliveMonitor::ScheduleTick() {
  timer_.expires_after(probe_interval_);
  timer_.async_wait([self = shared_from_this()](asio::error_code ec) { self->OnTick(ec); });
}

void KeepaliveMonitor::OnTick(asio::error_code ec) {
  if (UNLIKELY(ec == asio::error::operation_aborted)) {
    return;
  }
  if (finished_) {
    return;
  }
  if (scope_->cancelled()) {
    Finish();
    return;
  }

  uint64_t recv_time = last_recv_time_->load(std::memory_order_acquire);
  if (recv_time != observed_recv_time_) {
    observed_recv_time_ = recv_time;
    missed_ticks_ = 0;
  } else {
    ++missed_ticks_;
    if (missed_ticks_ * probe_interval_ >= probe_timeout_) {
      LOG(WARNING) << "tunnel: no receipt for " << (missed_ticks_ * probe_interval_).count() << "ms, giving up after "
                   << probes_sent() << " probes";
      queue_->PostFault(Role::TUNNEL, generation_, error::tunnel_timeout);
      Finish();
      return;
    }
  }

  VLOG(3) << "tunnel: sending keepalive probe, idle ticks " << missed_ticks_;
  link_->Write(TUNNEL_PING);
  ++probes_sent_;
  ScheduleTick();
}

void KeepaliveMonitor::OnCancelled() {
  if (finished_) {
    return;
  }
  VLOG(2) << "tunnel: keepalive monitor " << generation_ << " cancelled";
  Finish();
}

void KeepaliveMonitor::Finish() {
  DCHECK(!finished_);
  finished_ = true;
  timer_.cancel();
  if (cancel_callback_id_) {
    scope_->RemoveCancelCallback(cancel_callback_id_);
    cancel_callback_id_ = 0;
  }
  VLOG(2) << "tunnel: keepalive monitor " << generation_ << " exited";
  wait_group_->Done();
}

}  // namespace relay
