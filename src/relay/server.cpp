// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#include "relay/server.hpp"

#include <utility>

#include "core/logging.hpp"
#include "core/utils.hpp"
#include "relay/direct_connection_factory.hpp"
#include "relay/relay_errors.hpp"

namespace relay {

Server::Server(std::string plugin_address,
               std::string control_address,
               std::string data_address,
               const ServerConfig& config)
    : work_guard_(std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
          io_context_.get_executor())),
      root_(CancelScope::Create()),
      queue_(config.request_queue_size),
      config_(config),
      connections_(io_context_, root_, &queue_, &last_recv_time_, config_) {
  DCHECK_GT(config_.probe_timeout, config_.probe_interval);
  connections_.SetAddress(Role::PLUGIN, std::move(plugin_address));
  connections_.SetAddress(Role::TUNNEL, std::move(control_address));
  factory_ = std::make_unique<DirectConnectionFactory>(io_context_, std::move(data_address), config_.connect_timeout);
  thread_ = std::thread([this] { WorkFunc(); });
}

Server::~Server() {
  Join();
}

void Server::set_data_connection_factory(std::unique_ptr<DataConnectionFactory> factory) {
  DCHECK(factory);
  factory_ = std::move(factory);
}

void Server::WorkFunc() {
  if (!SetCurrentThreadName("relay_io")) {
    PLOG(WARNING) << "server: failed to set thread name";
  }
  VLOG(1) << "server: io thread started";
  io_context_.run();
  VLOG(1) << "server: io thread stopped";
}

void Server::Start(asio::error_code& ec) {
  ec = asio::error_code();
  asio::error_code setup_ec;
  connections_.Setup(Role::PLUGIN, setup_ec);
  if (setup_ec) {
    LOG(ERROR) << "plugin: setup failed: " << setup_ec;
    ec = error::setup_plugin_failed;
    return;
  }
  LOG(INFO) << "server: started, data connections via " << factory_->Name() << " factory";
  // the first tunnel connection is made by the dispatch loop
  queue_.PostFault(Role::TUNNEL, connections_.generation(Role::TUNNEL), error::tunnel_not_connected);
}

void Server::Loop() {
  VLOG(1) << "server: dispatch loop started";
  DispatchEvent event;
  while (queue_.Wait(&event)) {
    if (event.kind == DispatchEvent::REQUEST) {
      HandleRequest(event.request);
    } else {
      HandleFault(event);
    }
  }
  VLOG(1) << "server: dispatch loop stopped";
}

void Server::HandleFault(const DispatchEvent& event) {
  if (!connections_.IsCurrent(event.role, event.generation)) {
    VLOG(1) << RoleToName(event.role) << ": ignoring fault of retired generation " << event.generation << ": "
            << event.ec;
    return;
  }
  if (event.role == Role::PLUGIN) {
    HandlePluginError(event.ec);
    return;
  }
  asio::error_code ec = HandleTunnelError(event.ec);
  if (ec) {
    LOG(WARNING) << "tunnel: waiting for an external reconnect trigger after: " << ec;
  }
}

void Server::HandleRequest(const Request& request) {
  ++requests_dispatched_;
  VLOG(3) << "server: dispatching " << request;
  switch (request.type()) {
    case REQUEST_PUSH_TASK:
      if (task_delegate_) {
        task_delegate_->OnPushTask(request);
      } else {
        LOG(WARNING) << "plugin: no task delegate, dropping " << request;
      }
      return;
    case REQUEST_TASK_RESULT:
      if (task_delegate_) {
        task_delegate_->OnTaskResult(request);
      } else {
        LOG(WARNING) << "tunnel: no task delegate, dropping " << request;
      }
      return;
    case REQUEST_TUNNEL_CONNECT_OK:
      tunnel_ready_ = true;
      LOG(INFO) << "tunnel: connection established";
      return;
    case REQUEST_PING:
      ++pings_received_;
      return;
    default:
      break;
  }

  if (!IsCreateConnectRequest(request.type())) {
    LOG(WARNING) << "server: unsupported request " << static_cast<int>(request.type());
    return;
  }
  asio::error_code ec;
  factory_->Create(request.type(), request.data(), ec);
  if (ec) {
    LOG(WARNING) << "data: " << RequestTypeToName(request.type()) << " failed: " << ec;
  }
}

asio::error_code Server::HandleTunnelError(asio::error_code fault) {
  LOG(WARNING) << "tunnel: " << fault << ", reconnecting";
  tunnel_ready_ = false;
  asio::error_code ec;
  connections_.Setup(Role::TUNNEL, ec);
  if (!ec) {
    return ec;
  }
  if (ec == error::server_stopped) {
    return ec;
  }
  LOG(ERROR) << "tunnel: reconnect to " << connections_.address(Role::TUNNEL) << " failed: " << ec;
  auto plugin = connections_.link(Role::PLUGIN);
  if (plugin) {
    plugin->Write(PLUGIN_TUNNEL_RECONNECT_FAILED);
  } else {
    LOG(WARNING) << "plugin: not connected, reconnect failure not delivered";
  }
  return ec;
}

void Server::HandlePluginError(asio::error_code fault) {
  LOG(ERROR) << "plugin: " << fault << ", connection left down";
  connections_.Retire(Role::PLUGIN);
}

void Server::ReconnectTunnel() {
  queue_.PostFault(Role::TUNNEL, connections_.generation(Role::TUNNEL), error::tunnel_not_connected);
}

void Server::Stop() {
  if (!root_->cancelled()) {
    VLOG(1) << "server: stopping";
  }
  root_->Cancel();
  queue_.Close();
}

void Server::Join() {
  if (joined_) {
    return;
  }
  joined_ = true;
  Stop();
  connections_.Retire(Role::PLUGIN);
  connections_.Retire(Role::TUNNEL);
  asio::post(io_context_, [this]() {
    if (factory_) {
      factory_->Shutdown();
    }
  });
  work_guard_.reset();
  if (thread_.joinable()) {
    thread_.join();
  }
  VLOG(1) << "server: joined";
}

}  // namespace relay
