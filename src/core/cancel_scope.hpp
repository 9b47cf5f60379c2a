// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#ifndef H_CORE_CANCEL_SCOPE
#define H_CORE_CANCEL_SCOPE

#include <stdint.h>

#include <atomic>
#include <map>
#include <memory>
#include <vector>

#include <absl/functional/any_invocable.h>
#include <absl/synchronization/mutex.h>

namespace relay {

// A node in a cancellation tree. Cancelling a scope cancels every scope
// created below it; cancelling a child leaves its parent and siblings alone.
// A scope never becomes uncancelled again.
class CancelScope : public std::enable_shared_from_this<CancelScope> {
 public:
  using CancelCallback = absl::AnyInvocable<void()>;

  static std::shared_ptr<CancelScope> Create();

  ~CancelScope();

  CancelScope(const CancelScope&) = delete;
  CancelScope& operator=(const CancelScope&) = delete;

  // A child of an already cancelled scope is born cancelled.
  std::shared_ptr<CancelScope> NewChild();

  void Cancel();

  bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

  // |callback| runs exactly once, on the cancelling thread and outside any
  // lock. When the scope is already cancelled it runs before this returns,
  // and 0 is returned.
  uint64_t AddCancelCallback(CancelCallback callback);

  // Returns true if the callback was removed before running.
  bool RemoveCancelCallback(uint64_t id);

 private:
  CancelScope() = default;

  std::atomic<bool> cancelled_{false};
  absl::Mutex mutex_;
  std::vector<std::weak_ptr<CancelScope>> children_ ABSL_GUARDED_BY(mutex_);
  std::map<uint64_t, CancelCallback> callbacks_ ABSL_GUARDED_BY(mutex_);
  uint64_t next_callback_id_ ABSL_GUARDED_BY(mutex_) = 1;
};

}  // namespace relay

#endif  // H_CORE_CANCEL_SCOPE
