// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#ifndef H_RELAY_DATA_CONNECTION_FACTORY
#define H_RELAY_DATA_CONNECTION_FACTORY

#include <stdint.h>

#include <vector>

#include "net/asio.hpp"
#include "relay/request.hpp"

namespace relay {

// Establishes data connections for individual proxied flows. Create() is
// called on the dispatch loop thread for every connection creation request
// and must not block it for long; failures are reported through |ec| and are
// never fatal to the caller.
class DataConnectionFactory {
 public:
  virtual ~DataConnectionFactory() = default;

  virtual void Create(RequestType type, const std::vector<uint8_t>& task_data, asio::error_code& ec) = 0;

  // Drops every connection still owned by the factory. Called once the
  // server stops dispatching.
  virtual void Shutdown() {}

  virtual const char* Name() const = 0;
};

}  // namespace relay

#endif  // H_RELAY_DATA_CONNECTION_FACTORY
