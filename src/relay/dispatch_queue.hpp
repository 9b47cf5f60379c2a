// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#ifndef H_RELAY_DISPATCH_QUEUE
#define H_RELAY_DISPATCH_QUEUE

#include <stddef.h>
#include <stdint.h>

#include <deque>

#include <absl/functional/any_invocable.h>
#include <absl/synchronization/mutex.h>
#include <absl/time/time.h>

#include "net/asio.hpp"
#include "relay/request.hpp"

namespace relay {

// One item consumed by the dispatch loop: either a request read from a peer,
// or a fault raised by the loops serving one generation of a role.
struct DispatchEvent {
  enum Kind {
    REQUEST,
    FAULT,
  };

  Kind kind = REQUEST;
  Role role = Role::PLUGIN;
  uint64_t generation = 0;
  Request request;
  asio::error_code ec;
};

// The inbox of the dispatch loop. Requests are bounded by |capacity|; an
// offer beyond that is parked until the consumer makes room, which is how a
// slow dispatcher throttles the pollers. Faults are never bounded.
// Everything comes out in the order it was admitted.
class DispatchQueue {
 public:
  using ResumeCallback = absl::AnyInvocable<void()>;

  explicit DispatchQueue(size_t capacity);
  ~DispatchQueue();

  DispatchQueue(const DispatchQueue&) = delete;
  DispatchQueue& operator=(const DispatchQueue&) = delete;

  // Returns 0 if the request was admitted right away (or dropped because the
  // queue is closed). Otherwise the request is parked and the returned ticket
  // identifies it; |resume| runs on the consumer thread, outside the lock,
  // right after the request is admitted.
  uint64_t Offer(Role role, uint64_t generation, Request request, ResumeCallback resume);

  // Drops a parked request. Returns false when it was already admitted, in
  // which case its resume callback has run or is about to.
  bool Withdraw(uint64_t ticket);

  void PostFault(Role role, uint64_t generation, asio::error_code ec);

  // Blocks until an event is available. Returns false once closed.
  bool Wait(DispatchEvent* event);

  // As Wait(), giving up after |timeout|.
  bool WaitWithTimeout(DispatchEvent* event, absl::Duration timeout);

  // Wakes up every waiter and drops whatever is queued or parked.
  void Close();

  bool closed() const;
  size_t size() const;
  size_t parked() const;

 private:
  struct Parked {
    uint64_t ticket;
    DispatchEvent event;
    ResumeCallback resume;
  };

  bool PopLocked(DispatchEvent* event, ResumeCallback* resume) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  const size_t capacity_;
  mutable absl::Mutex mutex_;
  absl::CondVar cond_;
  std::deque<DispatchEvent> events_ ABSL_GUARDED_BY(mutex_);
  std::deque<Parked> parked_ ABSL_GUARDED_BY(mutex_);
  size_t pending_requests_ ABSL_GUARDED_BY(mutex_) = 0;
  uint64_t next_ticket_ ABSL_GUARDED_BY(mutex_) = 1;
  bool closed_ ABSL_GUARDED_BY(mutex_) = false;
};

}  // namespace relay

#endif  // H_RELAY_DISPATCH_QUEUE
