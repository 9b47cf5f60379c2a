// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#include "relay/dispatch_queue.hpp"

#include <algorithm>
#include <utility>

#include "core/logging.hpp"

namespace relay {

DispatchQueue::DispatchQueue(size_t capacity) : capacity_(std::max<size_t>(capacity, 1u)) {}

DispatchQueue::~DispatchQueue() = default;

uint64_t DispatchQueue::Offer(Role role, uint64_t generation, Request request, ResumeCallback resume) {
  DispatchEvent event;
  event.kind = DispatchEvent::REQUEST;
  event.role = role;
  event.generation = generation;
  event.request = std::move(request);

  absl::MutexLock l(&mutex_);
  if (closed_) {
    VLOG(2) << RoleToName(role) << ": dropping " << event.request << " on closed inbox";
    return 0;
  }
  if (pending_requests_ < capacity_ && parked_.empty()) {
    events_.push_back(std::move(event));
    ++pending_requests_;
    cond_.Signal();
    return 0;
  }
  uint64_t ticket = next_ticket_++;
  parked_.push_back(Parked{ticket, std::move(event), std::move(resume)});
  VLOG(3) << RoleToName(role) << ": inbox full, parked ticket " << ticket;
  return ticket;
}

bool DispatchQueue::Withdraw(uint64_t ticket) {
  absl::MutexLock l(&mutex_);
  auto it = std::find_if(parked_.begin(), parked_.end(), [ticket](const Parked& p) { return p.ticket == ticket; });
  if (it == parked_.end()) {
    return false;
  }
  parked_.erase(it);
  return true;
}

void DispatchQueue::PostFault(Role role, uint64_t generation, asio::error_code ec) {
  DispatchEvent event;
  event.kind = DispatchEvent::FAULT;
  event.role = role;
  event.generation = generation;
  event.ec = ec;

  absl::MutexLock l(&mutex_);
  if (closed_) {
    VLOG(2) << RoleToName(role) << ": dropping fault " << ec << " on closed inbox";
    return;
  }
  events_.push_back(std::move(event));
  cond_.Signal();
}

bool DispatchQueue::PopLocked(DispatchEvent* event, ResumeCallback* resume) {
  if (closed_ || events_.empty()) {
    return false;
  }
  *event = std::move(events_.front());
  events_.pop_front();
  if (event->kind == DispatchEvent::REQUEST) {
    --pending_requests_;
    // admit the oldest parked request into the freed slot
    if (!parked_.empty()) {
      Parked parked = std::move(parked_.front());
      parked_.pop_front();
      events_.push_back(std::move(parked.event));
      ++pending_requests_;
      *resume = std::move(parked.resume);
    }
  }
  return true;
}

bool DispatchQueue::Wait(DispatchEvent* event) {
  ResumeCallback resume;
  {
    absl::MutexLock l(&mutex_);
    while (!closed_ && events_.empty()) {
      cond_.Wait(&mutex_);
    }
    if (!PopLocked(event, &resume)) {
      return false;
    }
  }
  if (resume) {
    resume();
  }
  return true;
}

bool DispatchQueue::WaitWithTimeout(DispatchEvent* event, absl::Duration timeout) {
  absl::Time deadline = absl::Now() + timeout;
  ResumeCallback resume;
  {
    absl::MutexLock l(&mutex_);
    while (!closed_ && events_.empty()) {
      if (cond_.WaitWithDeadline(&mutex_, deadline)) {
        break;
      }
    }
    if (!PopLocked(event, &resume)) {
      return false;
    }
  }
  if (resume) {
    resume();
  }
  return true;
}

void DispatchQueue::Close() {
  std::deque<Parked> parked;
  {
    absl::MutexLock l(&mutex_);
    if (closed_) {
      return;
    }
    closed_ = true;
    events_.clear();
    parked.swap(parked_);
    pending_requests_ = 0;
    cond_.SignalAll();
  }
  VLOG(2) << "inbox closed, " << parked.size() << " parked requests dropped";
}

bool DispatchQueue::closed() const {
  absl::MutexLock l(&mutex_);
  return closed_;
}

size_t DispatchQueue::size() const {
  absl::MutexLock l(&mutex_);
  return events_.size();
}

size_t DispatchQueue::parked() const {
  absl::MutexLock l(&mutex_);
  return parked_.size();
}

}  // namespace relay
