// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#include "relay/connection_manager.hpp"

#include <utility>

#include "core/logging.hpp"
#include "net/dialer.hpp"
#include "relay/relay_errors.hpp"
#include "relay/keepalive_monitor.hpp"
#include "relay/poller.hpp"

namespace relay {

ConnectionManager::ConnectionManager(asio::io_context& io_context,
                                     std::shared_ptr<CancelScope> root,
                                     DispatchQueue* queue,
                                     std::atomic<uint64_t>* last_recv_time,
                                     const ServerConfig& config)
    : io_context_(io_context),
      root_(std::move(root)),
      queue_(queue),
      last_recv_time_(last_recv_time),
      config_(config) {}

ConnectionManager::~ConnectionManager() {
  // the server drains every loop before tearing us down
  DCHECK_EQ(plugin_.wait_group.count(), 0);
  DCHECK_EQ(tunnel_.wait_group.count(), 0);
}

ConnectionManager::ManagedConnection& ConnectionManager::connection(Role role) {
  return role == Role::PLUGIN ? plugin_ : tunnel_;
}

const ConnectionManager::ManagedConnection& ConnectionManager::connection(Role role) const {
  return role == Role::PLUGIN ? plugin_ : tunnel_;
}

void ConnectionManager::SetAddress(Role role, std::string address) {
  ManagedConnection& c = connection(role);
  absl::MutexLock l(&c.mutex);
  c.address = std::move(address);
}

std::string ConnectionManager::address(Role role) const {
  const ManagedConnection& c = connection(role);
  absl::MutexLock l(&c.mutex);
  return c.address;
}

void ConnectionManager::Setup(Role role, asio::error_code& ec) {
  ec = asio::error_code();
  DCHECK(!io_context_.get_executor().running_in_this_thread());
  ManagedConnection& c = connection(role);
  absl::MutexLock setup_lock(&c.setup_mutex);

  std::string address;
  {
    absl::MutexLock l(&c.mutex);
    address = c.address;
  }
  if (address.empty()) {
    VLOG(1) << RoleToName(role) << ": no address, setup skipped";
    return;
  }

  RetireLocked(role);

  if (root_->cancelled()) {
    ec = error::server_stopped;
    return;
  }

  asio::ip::tcp::socket socket = net::Dial(io_context_, address, config_.connect_timeout, ec);
  if (ec) {
    LOG(WARNING) << RoleToName(role) << ": connect to " << address << " failed: " << ec;
    return;
  }
  LOG(INFO) << RoleToName(role) << ": connected to " << address;
  InstallLocked(role, net::Link::socket_type(std::move(socket)));
}

void ConnectionManager::Attach(Role role, net::Link::socket_type&& socket) {
  DCHECK(!io_context_.get_executor().running_in_this_thread());
  ManagedConnection& c = connection(role);
  absl::MutexLock setup_lock(&c.setup_mutex);
  RetireLocked(role);
  VLOG(1) << RoleToName(role) << ": attaching external transport";
  InstallLocked(role, std::move(socket));
}

void ConnectionManager::Retire(Role role) {
  DCHECK(!io_context_.get_executor().running_in_this_thread());
  ManagedConnection& c = connection(role);
  absl::MutexLock setup_lock(&c.setup_mutex);
  RetireLocked(role);
}

void ConnectionManager::RetireLocked(Role role) {
  ManagedConnection& c = connection(role);
  std::shared_ptr<CancelScope> scope;
  std::shared_ptr<net::Link> link;
  uint64_t generation;
  {
    absl::MutexLock l(&c.mutex);
    scope = std::move(c.scope);
    link = std::move(c.link);
    generation = c.generation;
    // faults still in flight for the retired link become stale
    if (scope) {
      ++c.generation;
    }
  }
  if (scope) {
    scope->Cancel();
  }
  c.wait_group.Wait();
  if (link) {
    link->Close();
    VLOG(1) << RoleToName(role) << ": generation " << generation << " retired";
  }
}

void ConnectionManager::InstallLocked(Role role, net::Link::socket_type&& socket) {
  ManagedConnection& c = connection(role);
  std::shared_ptr<CancelScope> scope = root_->NewChild();
  uint64_t generation;
  {
    absl::MutexLock l(&c.mutex);
    generation = ++c.generation;
  }
  auto link = std::make_shared<net::Link>(std::move(socket), RoleToName(role));

  auto poller = std::make_shared<Poller>(role, generation, link, scope, &c.wait_group, queue_, last_recv_time_,
                                         config_.read_timeout);
  poller->Start();
  if (role == Role::TUNNEL) {
    auto monitor = std::make_shared<KeepaliveMonitor>(generation, link, scope, &c.wait_group, queue_,
                                                      last_recv_time_, config_.probe_interval,
                                                      config_.probe_timeout);
    monitor->Start();
  }

  {
    absl::MutexLock l(&c.mutex);
    c.link = std::move(link);
    c.scope = std::move(scope);
  }
  VLOG(1) << RoleToName(role) << ": generation " << generation << " installed";
}

std::shared_ptr<net::Link> ConnectionManager::link(Role role) const {
  const ManagedConnection& c = connection(role);
  absl::MutexLock l(&c.mutex);
  return c.link;
}

uint64_t ConnectionManager::generation(Role role) const {
  const ManagedConnection& c = connection(role);
  absl::MutexLock l(&c.mutex);
  return c.generation;
}

bool ConnectionManager::IsCurrent(Role role, uint64_t generation) const {
  const ManagedConnection& c = connection(role);
  absl::MutexLock l(&c.mutex);
  return c.generation == generation;
}

int ConnectionManager::active_loops(Role role) const {
  return connection(role).wait_group.count();
}

bool ConnectionManager::WaitIdle(Role role, absl::Duration timeout) {
  ManagedConnection& c = connection(role);
  if (timeout == absl::InfiniteDuration()) {
    c.wait_group.Wait();
    return true;
  }
  return c.wait_group.WaitWithTimeout(timeout);
}

}  // namespace relay
