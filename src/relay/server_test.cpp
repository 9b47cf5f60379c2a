// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#include <gmock/gmock.h>
#include <gtest/gtest-message.h>
#include <gtest/gtest.h>

#include <absl/time/clock.h>

#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "net/asio.hpp"
#include "net/frame.hpp"
#include "net/net_errors.hpp"
#include "relay/data_connection_factory.hpp"
#include "relay/relay_errors.hpp"
#include "relay/request.hpp"
#include "relay/server.hpp"
#include "relay/task_delegate.hpp"
#include "test_util.hpp"

using namespace relay;
using ::testing::_;
using ::testing::SetArgReferee;

namespace {

class MockDataConnectionFactory : public DataConnectionFactory {
 public:
  MOCK_METHOD(void, Create, (RequestType, const std::vector<uint8_t>&, asio::error_code&), (override));
  MOCK_METHOD(void, Shutdown, (), (override));
  const char* Name() const override { return "mock"; }
};

class MockTaskDelegate : public TaskDelegate {
 public:
  MOCK_METHOD(void, OnPushTask, (const Request&), (override));
  MOCK_METHOD(void, OnTaskResult, (const Request&), (override));
};

ServerConfig TestConfig() {
  ServerConfig config;
  config.read_timeout = std::chrono::milliseconds(20);
  config.connect_timeout = std::chrono::milliseconds(1000);
  return config;
}

constexpr char kUnreachable[] = "127.0.0.1:1";

}  // namespace

TEST(ServerTest, StartFailsWhenPluginUnreachable) {
  Server server(kUnreachable, std::string(), std::string(), TestConfig());
  asio::error_code ec;
  server.Start(ec);
  EXPECT_EQ(error::setup_plugin_failed, ec);
  EXPECT_FALSE(server.connections().link(Role::PLUGIN));
}

TEST(ServerTest, StartDoesNotTouchTunnel) {
  testing::TestPeer plugin;
  Server server(plugin.address(), kUnreachable, std::string(), TestConfig());
  asio::error_code ec;
  server.Start(ec);
  EXPECT_FALSE(ec) << ec;
  ASSERT_TRUE(plugin.WaitForConnections(1));

  // the tunnel is left to the dispatch loop
  DispatchEvent event;
  ASSERT_TRUE(server.queue().WaitWithTimeout(&event, absl::Seconds(1)));
  EXPECT_EQ(DispatchEvent::FAULT, event.kind);
  EXPECT_EQ(Role::TUNNEL, event.role);
  EXPECT_EQ(error::tunnel_not_connected, event.ec);
}

TEST(ServerTest, StartWithoutPluginAddressIsNoop) {
  Server server(std::string(), std::string(), std::string(), TestConfig());
  asio::error_code ec;
  server.Start(ec);
  EXPECT_FALSE(ec) << ec;
  EXPECT_EQ(0, server.active_loops(Role::PLUGIN));
}

TEST(ServerTest, HandleTunnelErrorWithoutAddressIsNoop) {
  Server server(std::string(), std::string(), std::string(), TestConfig());
  EXPECT_FALSE(server.HandleTunnelError(error::tunnel_timeout));
  EXPECT_FALSE(server.connections().link(Role::TUNNEL));
}

TEST(ServerTest, HandleTunnelErrorNotifiesPluginOnFailure) {
  testing::TestPeer plugin;
  Server server(plugin.address(), kUnreachable, std::string(), TestConfig());
  asio::error_code ec;
  server.Start(ec);
  ASSERT_FALSE(ec) << ec;
  ASSERT_TRUE(plugin.WaitForConnections(1));

  EXPECT_TRUE(server.HandleTunnelError(error::tunnel_timeout));

  net::Frame frame;
  ASSERT_TRUE(plugin.ReadFrame(0, &frame));
  EXPECT_EQ(PLUGIN_TUNNEL_RECONNECT_FAILED, frame.type);
  EXPECT_TRUE(frame.payload.empty());
  // exactly one notification per attempt
  EXPECT_FALSE(plugin.ReadFrame(0, &frame, absl::Milliseconds(100)));
}

TEST(ServerTest, HandleTunnelErrorWithoutPluginStillFails) {
  Server server(std::string(), kUnreachable, std::string(), TestConfig());
  EXPECT_TRUE(server.HandleTunnelError(error::tunnel_timeout));
}

TEST(ServerTest, HandleTunnelErrorReconnects) {
  testing::TestPeer plugin;
  testing::TestPeer tunnel;
  Server server(plugin.address(), tunnel.address(), std::string(), TestConfig());
  asio::error_code ec;
  server.Start(ec);
  ASSERT_FALSE(ec) << ec;

  EXPECT_FALSE(server.HandleTunnelError(error::tunnel_not_connected));
  ASSERT_TRUE(tunnel.WaitForConnections(1));
  EXPECT_TRUE(server.connections().link(Role::TUNNEL));
  // poll loop and keepalive monitor
  EXPECT_EQ(2, server.active_loops(Role::TUNNEL));

  net::Frame frame;
  EXPECT_FALSE(plugin.ReadFrame(0, &frame, absl::Milliseconds(100)));
}

TEST(ServerTest, RepeatedSetupKeepsOneSetOfLoops) {
  testing::TestPeer tunnel;
  Server server(std::string(), tunnel.address(), std::string(), TestConfig());

  asio::error_code ec;
  server.Setup(Role::TUNNEL, ec);
  ASSERT_FALSE(ec) << ec;
  absl::SleepFor(absl::Milliseconds(2));
  server.Setup(Role::TUNNEL, ec);
  ASSERT_FALSE(ec) << ec;

  EXPECT_EQ(2, server.active_loops(Role::TUNNEL));
  ASSERT_TRUE(tunnel.WaitForConnections(2));

  // the first link was closed when it was replaced
  net::Frame frame;
  EXPECT_FALSE(tunnel.ReadFrameOfType(0, 0xff, &frame, absl::Seconds(2)));
}

TEST(ServerTest, RepeatedPluginSetupKeepsOneLoop) {
  testing::TestPeer plugin;
  Server server(plugin.address(), std::string(), std::string(), TestConfig());

  asio::error_code ec;
  server.Setup(Role::PLUGIN, ec);
  ASSERT_FALSE(ec) << ec;
  EXPECT_EQ(1, server.active_loops(Role::PLUGIN));
  uint64_t first_generation = server.connections().generation(Role::PLUGIN);
  absl::SleepFor(absl::Milliseconds(2));
  server.Setup(Role::PLUGIN, ec);
  ASSERT_FALSE(ec) << ec;

  EXPECT_EQ(1, server.active_loops(Role::PLUGIN));
  EXPECT_FALSE(server.connections().IsCurrent(Role::PLUGIN, first_generation));
  ASSERT_TRUE(plugin.WaitForConnections(2));
  EXPECT_EQ(0, server.active_loops(Role::TUNNEL));

  net::Frame frame;
  EXPECT_FALSE(plugin.ReadFrameOfType(0, 0xff, &frame, absl::Seconds(2)));
}

TEST(ServerTest, RetireDrainsLoops) {
  testing::TestPeer plugin;
  Server server(plugin.address(), std::string(), std::string(), TestConfig());
  asio::error_code ec;
  server.Start(ec);
  ASSERT_FALSE(ec) << ec;
  EXPECT_EQ(1, server.active_loops(Role::PLUGIN));

  uint64_t generation = server.connections().generation(Role::PLUGIN);
  server.Retire(Role::PLUGIN);
  EXPECT_EQ(0, server.active_loops(Role::PLUGIN));
  EXPECT_FALSE(server.connections().link(Role::PLUGIN));
  EXPECT_FALSE(server.connections().IsCurrent(Role::PLUGIN, generation));
}

TEST(ServerTest, AttachInstallsExternalTransport) {
  Server server(std::string(), std::string(), std::string(), TestConfig());
  asio::local::stream_protocol::socket local(server.io_context());
  asio::io_context peer_io;
  asio::local::stream_protocol::socket peer(peer_io);
  asio::local::connect_pair(local, peer);

  server.Attach(Role::TUNNEL, net::Link::socket_type(std::move(local)));
  EXPECT_EQ(2, server.active_loops(Role::TUNNEL));
  EXPECT_EQ(1u, server.connections().generation(Role::TUNNEL));

  DispatchEvent event;
  ASSERT_TRUE(server.queue().WaitWithTimeout(&event, absl::Seconds(1)));
  EXPECT_EQ(DispatchEvent::REQUEST, event.kind);
  EXPECT_EQ(Request(REQUEST_TUNNEL_CONNECT_OK), event.request);

  asio::error_code ec;
  net::WriteFrame(peer, net::Frame{TUNNEL_TASK, {0x42}}, ec);
  ASSERT_FALSE(ec) << ec;
  ASSERT_TRUE(server.queue().WaitWithTimeout(&event, absl::Seconds(1)));
  EXPECT_EQ(Request(REQUEST_TASK_RESULT, {0x42}), event.request);
  EXPECT_NE(0u, server.last_recv_time());
}

TEST(ServerTest, CreateRequestsGoToFactory) {
  Server server(std::string(), std::string(), std::string(), TestConfig());
  auto factory = std::make_unique<MockDataConnectionFactory>();
  EXPECT_CALL(*factory, Create(REQUEST_CREATE_SS_CONNECT, _, _))
      .WillOnce(SetArgReferee<2>(asio::error_code(error::no_data_address)));
  EXPECT_CALL(*factory, Create(REQUEST_CREATE_SOCKS5_CONNECT, _, _))
      .WillOnce(SetArgReferee<2>(asio::error_code(net::error::invalid_address)));
  EXPECT_CALL(*factory, Create(REQUEST_CREATE_HTTP_CONNECT, _, _)).Times(1);
  EXPECT_CALL(*factory, Shutdown()).Times(1);
  server.set_data_connection_factory(std::move(factory));

  // failures are logged and never end dispatching
  for (int type = REQUEST_CREATE_SS_CONNECT; type < REQUEST_TYPE_END; ++type) {
    server.HandleRequest(Request(static_cast<RequestType>(type)));
  }
  EXPECT_EQ(3u, server.requests_dispatched());
  server.Join();
}

TEST(ServerTest, DefaultFactoryRejectsWithoutDataAddress) {
  Server server(std::string(), std::string(), std::string(), TestConfig());
  asio::error_code ec;
  server.data_connection_factory()->Create(REQUEST_CREATE_HTTP_CONNECT, {}, ec);
  EXPECT_EQ(error::no_data_address, ec);
  // and the dispatch path only logs it
  server.HandleRequest(Request(REQUEST_CREATE_HTTP_CONNECT));
}

TEST(ServerTest, TaskRequestsGoToDelegate) {
  Server server(std::string(), std::string(), std::string(), TestConfig());
  MockTaskDelegate delegate;
  EXPECT_CALL(delegate, OnPushTask(Request(REQUEST_PUSH_TASK, {1, 2}))).Times(1);
  EXPECT_CALL(delegate, OnTaskResult(Request(REQUEST_TASK_RESULT, {3}))).Times(1);
  server.set_task_delegate(&delegate);

  server.HandleRequest(Request(REQUEST_PUSH_TASK, {1, 2}));
  server.HandleRequest(Request(REQUEST_TASK_RESULT, {3}));
  server.HandleRequest(Request(REQUEST_PING));
  server.HandleRequest(Request(REQUEST_TUNNEL_CONNECT_OK));

  EXPECT_EQ(1u, server.pings_received());
  EXPECT_TRUE(server.tunnel_ready());
}

TEST(ServerTest, StaleTunnelFaultIsIgnored) {
  testing::TestPeer tunnel;
  Server server(std::string(), tunnel.address(), std::string(), TestConfig());
  asio::error_code ec;
  server.Setup(Role::TUNNEL, ec);
  ASSERT_FALSE(ec) << ec;
  ASSERT_TRUE(tunnel.WaitForConnections(1));
  uint64_t generation = server.connections().generation(Role::TUNNEL);

  std::thread loop([&server]() { server.Loop(); });
  server.queue().PostFault(Role::TUNNEL, generation - 1, error::tunnel_timeout);
  absl::SleepFor(absl::Milliseconds(200));
  EXPECT_EQ(1u, tunnel.connections());
  EXPECT_EQ(generation, server.connections().generation(Role::TUNNEL));

  server.queue().PostFault(Role::TUNNEL, generation, error::tunnel_timeout);
  EXPECT_TRUE(tunnel.WaitForConnections(2));

  server.Stop();
  loop.join();
}

TEST(ServerTest, StopUnblocksLoopAndJoinIsIdempotent) {
  testing::TestPeer plugin;
  Server server(plugin.address(), std::string(), std::string(), TestConfig());
  asio::error_code ec;
  server.Start(ec);
  ASSERT_FALSE(ec) << ec;

  std::thread loop([&server]() { server.Loop(); });
  server.Stop();
  loop.join();

  EXPECT_TRUE(server.WaitIdle(Role::PLUGIN, absl::Seconds(5)));
  server.Join();
  server.Join();
  EXPECT_EQ(0, server.active_loops(Role::PLUGIN));

  // nothing gets set up once stopped
  server.Setup(Role::PLUGIN, ec);
  EXPECT_EQ(error::server_stopped, ec);
}
