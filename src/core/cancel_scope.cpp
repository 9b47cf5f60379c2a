// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#include "core/cancel_scope.hpp"

#include <algorithm>
#include <utility>

namespace relay {

std::shared_ptr<CancelScope> CancelScope::Create() {
  return std::shared_ptr<CancelScope>(new CancelScope);
}

CancelScope::~CancelScope() = default;

std::shared_ptr<CancelScope> CancelScope::NewChild() {
  std::shared_ptr<CancelScope> child = Create();
  {
    absl::MutexLock l(&mutex_);
    if (!cancelled()) {
      children_.erase(std::remove_if(children_.begin(), children_.end(),
                                     [](const std::weak_ptr<CancelScope>& c) { return c.expired(); }),
                      children_.end());
      children_.push_back(child);
      return child;
    }
  }
  child->Cancel();
  return child;
}

void CancelScope::Cancel() {
  std::vector<std::weak_ptr<CancelScope>> children;
  std::map<uint64_t, CancelCallback> callbacks;
  {
    absl::MutexLock l(&mutex_);
    if (cancelled()) {
      return;
    }
    cancelled_.store(true, std::memory_order_release);
    children.swap(children_);
    callbacks.swap(callbacks_);
  }
  for (auto& callback : callbacks) {
    std::move(callback.second)();
  }
  for (auto& weak_child : children) {
    if (auto child = weak_child.lock()) {
      child->Cancel();
    }
  }
}

uint64_t CancelScope::AddCancelCallback(CancelCallback callback) {
  {
    absl::MutexLock l(&mutex_);
    if (!cancelled()) {
      uint64_t id = next_callback_id_++;
      callbacks_.emplace(id, std::move(callback));
      return id;
    }
  }
  std::move(callback)();
  return 0;
}

bool CancelScope::RemoveCancelCallback(uint64_t id) {
  absl::MutexLock l(&mutex_);
  return callbacks_.erase(id) != 0;
}

}  // namespace relay
