// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#include "relay/poller.hpp"

#include <utility>

#include "core/compiler_specific.hpp"
#include "core/logging.hpp"
#include "core/utils.hpp"
#include "net/net_errors.hpp"
#include "relay/relay_errors.hpp"

namespace relay {

namespace {

void StampReceipt(std::atomic<uint64_t>* last_recv_time) {
  uint64_t now = GetMonotonicTime();
  uint64_t prev = last_recv_time->load(std::memory_order_relaxed);
  while (prev < now && !last_recv_time->compare_exchange_weak(prev, now, std::memory_order_release,
                                                              std::memory_order_relaxed)) {
  }
}

}  // namespace

Poller::Poller(Role role,
               uint64_t generation,
               std::shared_ptr<net::Link> link,
               std::shared_ptr<CancelScope> scope,
               WaitGroup* wait_group,
               DispatchQueue* queue,
               std::atomic<uint64_t>* last_recv_time,
               std::chrono::milliseconds read_timeout)
    : role_(role),
      generation_(generation),
      link_(std::move(link)),
      scope_(std::move(scope)),
      wait_group_(wait_group),
      queue_(queue),
      last_recv_time_(last_recv_time),
      read_timeout_(read_timeout),
      deadline_timer_(link_->socket().get_executor()) {}

Poller::~Poller() {
  VLOG(3) << name() << ": poller " << generation_ << " freed";
}

void Poller::Start() {
  wait_group_->Add(1);
  asio::post(link_->socket().get_executor(), [self = shared_from_this()]() { self->OnStart(); });
}

void Poller::OnStart() {
  VLOG(2) << name() << ": poll loop " << generation_ << " started";
  auto executor = link_->socket().get_executor();
  cancel_callback_id_ = scope_->AddCancelCallback([self = shared_from_this(), executor]() {
    asio::post(executor, [self]() { self->OnCancelled(); });
  });
  if (scope_->cancelled()) {
    Finish();
    return;
  }
  if (role_ == Role::TUNNEL) {
    // the handshake request goes first for every tunnel generation
    Emit(Request(REQUEST_TUNNEL_CONNECT_OK));
    return;
  }
  WaitReadable();
}

void Poller::OnCancelled() {
  if (finished_) {
    return;
  }
  VLOG(2) << name() << ": poll loop " << generation_ << " cancelled";
  if (parked_ticket_) {
    queue_->Withdraw(parked_ticket_);
    parked_ticket_ = 0;
  }
  asio::error_code ec;
  link_->socket().cancel(ec);
  Finish();
}

void Poller::WaitReadable() {
  if (finished_) {
    return;
  }
  if (scope_->cancelled()) {
    Finish();
    return;
  }
  if (!waiting_readable_) {
    waiting_readable_ = true;
    link_->socket().async_wait(asio::socket_base::wait_read,
                               [self = shared_from_this()](asio::error_code ec) { self->OnReadable(ec); });
  }
  deadline_timer_.expires_after(read_timeout_);
  deadline_timer_.async_wait([self = shared_from_this()](asio::error_code ec) { self->OnDeadline(ec); });
}

void Poller::OnDeadline(asio::error_code ec) {
  if (UNLIKELY(ec == asio::error::operation_aborted)) {
    return;
  }
  if (finished_ || !waiting_readable_) {
    return;
  }
  ++deadlines_;
  // nothing arrived in time; the readable wait stays armed
  WaitReadable();
}

void Poller::OnReadable(asio::error_code ec) {
  waiting_readable_ = false;
  if (finished_) {
    return;
  }
  deadline_timer_.cancel();
  if (ec) {
    ReportFault(ec);
    return;
  }
  if (scope_->cancelled()) {
    Finish();
    return;
  }
  ReadHeader();
}

void Poller::ReadHeader() {
  asio::async_read(link_->socket(), asio::buffer(header_, sizeof(header_)),
                   [self = shared_from_this()](asio::error_code ec, size_t bytes_transferred) {
                     self->OnHeader(ec, bytes_transferred);
                   });
}

void Poller::OnHeader(asio::error_code ec, size_t bytes_transferred) {
  if (finished_) {
    return;
  }
  if (ec) {
    if (ec == asio::error::eof && bytes_transferred != 0) {
      ec = net::error::malformed_frame;
    }
    ReportFault(ec);
    return;
  }
  uint32_t length;
  net::DecodeFrameHeader(header_, &frame_.type, &length);
  if (length > net::kMaxFramePayload) {
    ReportFault(net::error::frame_too_large);
    return;
  }
  frame_.payload.resize(length);
  if (length == 0) {
    OnPayload(asio::error_code(), 0);
    return;
  }
  asio::async_read(link_->socket(), asio::buffer(frame_.payload),
                   [self = shared_from_this()](asio::error_code ec, size_t bytes_transferred) {
                     self->OnPayload(ec, bytes_transferred);
                   });
}

void Poller::OnPayload(asio::error_code ec, size_t /*bytes_transferred*/) {
  if (finished_) {
    return;
  }
  if (ec) {
    // the stream ended inside the declared payload
    if (ec == asio::error::eof) {
      ec = net::error::malformed_frame;
    }
    ReportFault(ec);
    return;
  }
  VLOG(3) << name() << ": received " << frame_;
  Request request = FrameToRequest(role_, std::move(frame_), ec);
  frame_ = net::Frame();
  if (ec) {
    ReportFault(ec);
    return;
  }
  if (role_ == Role::TUNNEL) {
    StampReceipt(last_recv_time_);
  }
  Emit(std::move(request));
}

void Poller::Emit(Request request) {
  if (finished_) {
    return;
  }
  auto executor = link_->socket().get_executor();
  uint64_t ticket =
      queue_->Offer(role_, generation_, std::move(request), [self = shared_from_this(), executor]() {
        asio::post(executor, [self]() {
          if (self->finished_) {
            return;
          }
          self->parked_ticket_ = 0;
          self->WaitReadable();
        });
      });
  if (ticket) {
    // resumed once the dispatch loop makes room
    parked_ticket_ = ticket;
    return;
  }
  WaitReadable();
}

void Poller::ReportFault(asio::error_code ec) {
  if (finished_) {
    return;
  }
  if (scope_->cancelled()) {
    VLOG(2) << name() << ": poll loop " << generation_ << " stopped: " << ec;
  } else {
    LOG(WARNING) << name() << ": poll loop " << generation_ << " failed: " << ec;
    queue_->PostFault(role_, generation_, ec);
  }
  Finish();
}

void Poller::Finish() {
  DCHECK(!finished_);
  finished_ = true;
  deadline_timer_.cancel();
  if (cancel_callback_id_) {
    scope_->RemoveCancelCallback(cancel_callback_id_);
    cancel_callback_id_ = 0;
  }
  VLOG(2) << name() << ": poll loop " << generation_ << " exited";
  wait_group_->Done();
}

}  // namespace relay
