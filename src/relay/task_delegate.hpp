// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#ifndef H_RELAY_TASK_DELEGATE
#define H_RELAY_TASK_DELEGATE

#include "relay/request.hpp"

namespace relay {

// Downstream consumer of task traffic. Both methods run on the dispatch loop
// thread.
class TaskDelegate {
 public:
  virtual ~TaskDelegate() = default;

  // A task pushed by the plugin.
  virtual void OnPushTask(const Request& request) = 0;

  // A task result returned over the tunnel.
  virtual void OnTaskResult(const Request& request) = 0;
};

}  // namespace relay

#endif  // H_RELAY_TASK_DELEGATE
