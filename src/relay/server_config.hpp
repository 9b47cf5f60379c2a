// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#ifndef H_RELAY_SERVER_CONFIG
#define H_RELAY_SERVER_CONFIG

#include <stddef.h>

#include <chrono>

namespace relay {

// Tunables of one server instance. Filled from flags in main and passed by
// value, so tests can shrink them freely.
struct ServerConfig {
  // Bound of one readable-wait of a poll loop.
  std::chrono::milliseconds read_timeout{200};
  // Tick of the keepalive monitor.
  std::chrono::milliseconds probe_interval{5000};
  // Idle window after which the tunnel is declared dead. Must exceed
  // probe_interval.
  std::chrono::milliseconds probe_timeout{30000};
  std::chrono::milliseconds connect_timeout{5000};
  // Requests the dispatch inbox holds before the pollers are parked.
  size_t request_queue_size = 64;
};

}  // namespace relay

#endif  // H_RELAY_SERVER_CONFIG
