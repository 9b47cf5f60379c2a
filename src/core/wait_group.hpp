// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#ifndef H_CORE_WAIT_GROUP
#define H_CORE_WAIT_GROUP

#include <absl/synchronization/mutex.h>
#include <absl/time/time.h>

#include "core/logging.hpp"

namespace relay {

// Counts outstanding units of work and lets a thread block until all of them
// have completed.
class WaitGroup {
 public:
  WaitGroup() = default;
  WaitGroup(const WaitGroup&) = delete;
  WaitGroup& operator=(const WaitGroup&) = delete;

  void Add(int delta = 1) {
    absl::MutexLock l(&mutex_);
    count_ += delta;
    CHECK_GE(count_, 0) << "negative WaitGroup counter";
    if (count_ == 0) {
      cond_.SignalAll();
    }
  }

  void Done() { Add(-1); }

  void Wait() {
    absl::MutexLock l(&mutex_);
    while (count_ != 0) {
      cond_.Wait(&mutex_);
    }
  }

  // Returns false when the counter is still non-zero after |timeout|.
  bool WaitWithTimeout(absl::Duration timeout) {
    absl::Time deadline = absl::Now() + timeout;
    absl::MutexLock l(&mutex_);
    while (count_ != 0) {
      if (cond_.WaitWithDeadline(&mutex_, deadline)) {
        return count_ == 0;
      }
    }
    return true;
  }

  int count() const {
    absl::MutexLock l(&mutex_);
    return count_;
  }

 private:
  mutable absl::Mutex mutex_;
  absl::CondVar cond_;
  int count_ ABSL_GUARDED_BY(mutex_) = 0;
};

}  // namespace relay

#endif  // H_CORE_WAIT_GROUP
