// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#ifndef H_RELAY_CONNECTION_MANAGER
#define H_RELAY_CONNECTION_MANAGER

#include <stdint.h>

#include <atomic>
#include <memory>
#include <string>

#include <absl/synchronization/mutex.h>
#include <absl/time/time.h>

#include "core/cancel_scope.hpp"
#include "core/wait_group.hpp"
#include "net/asio.hpp"
#include "net/link.hpp"
#include "relay/dispatch_queue.hpp"
#include "relay/request.hpp"
#include "relay/server_config.hpp"

namespace relay {

// Owns the live transport of each role together with the scope and the
// completion tracker of the loops serving it.
//
// Replacing a role's link always cancels the previous scope and waits for its
// loops to drain first, so at most one poll loop (and one keepalive monitor)
// runs per role. Installing or retiring a link moves the role to a new
// generation number; faults are tagged with the generation that raised them.
//
// All blocking methods wait on loops that run on |io_context|, so they must
// not be called from a thread running it.
class ConnectionManager {
 public:
  ConnectionManager(asio::io_context& io_context,
                    std::shared_ptr<CancelScope> root,
                    DispatchQueue* queue,
                    std::atomic<uint64_t>* last_recv_time,
                    const ServerConfig& config);
  ~ConnectionManager();

  ConnectionManager(const ConnectionManager&) = delete;
  ConnectionManager& operator=(const ConnectionManager&) = delete;

  void SetAddress(Role role, std::string address);
  std::string address(Role role) const;

  // Dials the role's address and installs the result. An empty address is a
  // successful no-op. The current link is retired before dialing; a failed
  // dial leaves the role without a link.
  void Setup(Role role, asio::error_code& ec);

  // Installs an externally connected transport exactly like a dialed one.
  void Attach(Role role, net::Link::socket_type&& socket);

  // Cancels the role's loops, waits for them and closes its link.
  void Retire(Role role);

  std::shared_ptr<net::Link> link(Role role) const;
  uint64_t generation(Role role) const;

  // Whether a fault tagged with |generation| still concerns the live link.
  bool IsCurrent(Role role, uint64_t generation) const;

  // Loops of |role| that have been started and not yet exited.
  int active_loops(Role role) const;

  // Waits for every loop of |role| to exit. Returns false on timeout.
  bool WaitIdle(Role role, absl::Duration timeout = absl::InfiniteDuration());

 private:
  struct ManagedConnection {
    // serializes setup, attach and retire of the role
    absl::Mutex setup_mutex;
    mutable absl::Mutex mutex;
    std::string address ABSL_GUARDED_BY(mutex);
    std::shared_ptr<net::Link> link ABSL_GUARDED_BY(mutex);
    std::shared_ptr<CancelScope> scope ABSL_GUARDED_BY(mutex);
    uint64_t generation ABSL_GUARDED_BY(mutex) = 0;
    WaitGroup wait_group;
  };

  ManagedConnection& connection(Role role);
  const ManagedConnection& connection(Role role) const;

  // Both require the role's setup_mutex.
  void RetireLocked(Role role);
  void InstallLocked(Role role, net::Link::socket_type&& socket);

  asio::io_context& io_context_;
  std::shared_ptr<CancelScope> root_;
  DispatchQueue* queue_;
  std::atomic<uint64_t>* last_recv_time_;
  const ServerConfig config_;

  ManagedConnection plugin_;
  ManagedConnection tunnel_;
};

}  // namespace relay

#endif  // H_RELAY_CONNECTION_MANAGER
