// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#include <gmock/gmock.h>
#include <gtest/gtest-message.h>
#include <gtest/gtest.h>

#include <absl/time/clock.h>

#include <atomic>
#include <memory>
#include <thread>

#include "core/cancel_scope.hpp"
#include "core/wait_group.hpp"
#include "net/asio.hpp"
#include "net/frame.hpp"
#include "net/link.hpp"
#include "net/net_errors.hpp"
#include "relay/dispatch_queue.hpp"
#include "relay/poller.hpp"
#include "relay/relay_errors.hpp"
#include "relay/request.hpp"
#include "test_util.hpp"

using namespace relay;

class PollerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
        io_context_.get_executor());
    thread_ = std::thread([this]() { io_context_.run(); });
    scope_ = CancelScope::Create();
    queue_ = std::make_unique<DispatchQueue>(16);
    asio::local::stream_protocol::socket local(io_context_);
    asio::local::connect_pair(local, peer_);
    link_ = std::make_shared<net::Link>(net::Link::socket_type(std::move(local)), "test");
  }

  void TearDown() override {
    scope_->Cancel();
    EXPECT_TRUE(wait_group_.WaitWithTimeout(absl::Seconds(5)));
    link_->Close();
    work_guard_.reset();
    thread_.join();
  }

  void StartPoller(Role role, std::chrono::milliseconds read_timeout = std::chrono::milliseconds(20)) {
    poller_ = std::make_shared<Poller>(role, kGeneration, link_, scope_, &wait_group_, queue_.get(),
                                       &last_recv_time_, read_timeout);
    poller_->Start();
  }

  void Send(const net::Frame& frame) {
    asio::error_code ec;
    net::WriteFrame(peer_, frame, ec);
    ASSERT_FALSE(ec) << ec;
  }

  void SendRaw(const std::vector<uint8_t>& bytes) {
    asio::error_code ec;
    asio::write(peer_, asio::buffer(bytes), ec);
    ASSERT_FALSE(ec) << ec;
  }

  bool NextEvent(DispatchEvent* event, absl::Duration timeout = absl::Seconds(5)) {
    return queue_->WaitWithTimeout(event, timeout);
  }

  static constexpr uint64_t kGeneration = 7;

  asio::io_context io_context_;
  std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
  std::thread thread_;
  asio::io_context peer_io_;
  asio::local::stream_protocol::socket peer_{peer_io_};
  std::shared_ptr<CancelScope> scope_;
  WaitGroup wait_group_;
  std::unique_ptr<DispatchQueue> queue_;
  std::atomic<uint64_t> last_recv_time_{0};
  std::shared_ptr<net::Link> link_;
  std::shared_ptr<Poller> poller_;
};

TEST_F(PollerTest, PluginFramesBecomeRequests) {
  StartPoller(Role::PLUGIN);
  Send(net::Frame{PLUGIN_PUSH_TASK, {1, 2, 3}});
  Send(net::Frame{PLUGIN_CREATE_HTTP_CONNECT, {4}});

  DispatchEvent event;
  ASSERT_TRUE(NextEvent(&event));
  EXPECT_EQ(DispatchEvent::REQUEST, event.kind);
  EXPECT_EQ(Role::PLUGIN, event.role);
  EXPECT_EQ(kGeneration, event.generation);
  EXPECT_EQ(Request(REQUEST_PUSH_TASK, {1, 2, 3}), event.request);

  ASSERT_TRUE(NextEvent(&event));
  EXPECT_EQ(Request(REQUEST_CREATE_HTTP_CONNECT, {4}), event.request);

  // only the tunnel counts as liveness
  EXPECT_EQ(0u, last_recv_time_.load());
}

TEST_F(PollerTest, TunnelAnnouncesItselfBeforeReading) {
  Send(net::Frame{TUNNEL_TASK, {9}});
  StartPoller(Role::TUNNEL);

  DispatchEvent event;
  ASSERT_TRUE(NextEvent(&event));
  EXPECT_EQ(Request(REQUEST_TUNNEL_CONNECT_OK), event.request);
  EXPECT_EQ(Role::TUNNEL, event.role);

  ASSERT_TRUE(NextEvent(&event));
  EXPECT_EQ(Request(REQUEST_TASK_RESULT, {9}), event.request);
  uint64_t first = last_recv_time_.load();
  EXPECT_NE(0u, first);

  Send(net::Frame{TUNNEL_PING, {}});
  ASSERT_TRUE(NextEvent(&event));
  EXPECT_EQ(Request(REQUEST_PING), event.request);
  EXPECT_GE(last_recv_time_.load(), first);
}

TEST_F(PollerTest, UnknownTagFaultsOnceAndStops) {
  StartPoller(Role::PLUGIN);
  Send(net::Frame{0xff, {}});

  DispatchEvent event;
  ASSERT_TRUE(NextEvent(&event));
  EXPECT_EQ(DispatchEvent::FAULT, event.kind);
  EXPECT_EQ(kGeneration, event.generation);
  EXPECT_EQ(error::unknown_frame_type, event.ec);
  EXPECT_TRUE(wait_group_.WaitWithTimeout(absl::Seconds(5)));

  // nothing is read after the loop has ended
  Send(net::Frame{PLUGIN_PUSH_TASK, {1}});
  EXPECT_FALSE(NextEvent(&event, absl::Milliseconds(100)));
}

TEST_F(PollerTest, ServerOnlyTagIsUnknownFromPlugin) {
  StartPoller(Role::PLUGIN);
  Send(net::Frame{PLUGIN_TUNNEL_RECONNECT_FAILED, {}});

  DispatchEvent event;
  ASSERT_TRUE(NextEvent(&event));
  EXPECT_EQ(DispatchEvent::FAULT, event.kind);
  EXPECT_EQ(error::unknown_frame_type, event.ec);
}

TEST_F(PollerTest, PeerCloseFaults) {
  StartPoller(Role::PLUGIN);
  peer_.close();

  DispatchEvent event;
  ASSERT_TRUE(NextEvent(&event));
  EXPECT_EQ(DispatchEvent::FAULT, event.kind);
  EXPECT_EQ(asio::error::eof, event.ec);
  EXPECT_TRUE(wait_group_.WaitWithTimeout(absl::Seconds(5)));
  EXPECT_EQ(0u, queue_->size());
}

TEST_F(PollerTest, TruncatedFrameIsMalformed) {
  StartPoller(Role::PLUGIN);
  SendRaw({PLUGIN_PUSH_TASK, 0x00, 0x00, 0x00, 0x0a, 'a', 'b', 'c'});
  peer_.shutdown(asio::socket_base::shutdown_send);

  DispatchEvent event;
  ASSERT_TRUE(NextEvent(&event));
  EXPECT_EQ(DispatchEvent::FAULT, event.kind);
  EXPECT_EQ(net::error::malformed_frame, event.ec);
}

TEST_F(PollerTest, OversizedFrameFaults) {
  StartPoller(Role::TUNNEL);
  DispatchEvent event;
  ASSERT_TRUE(NextEvent(&event));
  EXPECT_EQ(Request(REQUEST_TUNNEL_CONNECT_OK), event.request);

  SendRaw({TUNNEL_TASK, 0x01, 0x00, 0x00, 0x01});
  ASSERT_TRUE(NextEvent(&event));
  EXPECT_EQ(DispatchEvent::FAULT, event.kind);
  EXPECT_EQ(net::error::frame_too_large, event.ec);
}

TEST_F(PollerTest, ElapsedDeadlineIsNotAnError) {
  StartPoller(Role::PLUGIN, std::chrono::milliseconds(1));
  absl::SleepFor(absl::Milliseconds(50));

  EXPECT_GT(poller_->deadlines(), 0u);
  EXPECT_EQ(0u, queue_->size());
  EXPECT_EQ(1, wait_group_.count());

  Send(net::Frame{PLUGIN_PUSH_TASK, {5}});
  DispatchEvent event;
  ASSERT_TRUE(NextEvent(&event));
  EXPECT_EQ(Request(REQUEST_PUSH_TASK, {5}), event.request);
}

TEST_F(PollerTest, CancelStopsLoopWithoutFault) {
  StartPoller(Role::TUNNEL);
  DispatchEvent event;
  ASSERT_TRUE(NextEvent(&event));

  scope_->Cancel();
  EXPECT_TRUE(wait_group_.WaitWithTimeout(absl::Seconds(5)));
  EXPECT_EQ(0u, queue_->size());

  // the link itself stays usable for writes until it is closed
  link_->Write(TUNNEL_PING);
  net::Frame frame;
  asio::error_code ec;
  ASSERT_TRUE(testing::ReadFrameWithTimeout(peer_, &frame, absl::Seconds(5), ec)) << ec;
  EXPECT_EQ(TUNNEL_PING, frame.type);
}

TEST_F(PollerTest, CancelledScopeNeverStarts) {
  scope_->Cancel();
  StartPoller(Role::TUNNEL);
  EXPECT_TRUE(wait_group_.WaitWithTimeout(absl::Seconds(5)));
  EXPECT_EQ(0u, queue_->size());
}

TEST_F(PollerTest, FullInboxParksPollerInOrder) {
  queue_ = std::make_unique<DispatchQueue>(1);
  StartPoller(Role::PLUGIN);
  Send(net::Frame{PLUGIN_PUSH_TASK, {1}});
  Send(net::Frame{PLUGIN_PUSH_TASK, {2}});
  Send(net::Frame{PLUGIN_PUSH_TASK, {3}});

  ASSERT_TRUE(testing::WaitUntil([this]() { return queue_->parked() == 1; }));
  EXPECT_EQ(1u, queue_->size());

  DispatchEvent event;
  for (uint8_t i = 1; i <= 3; ++i) {
    ASSERT_TRUE(NextEvent(&event));
    EXPECT_EQ(Request(REQUEST_PUSH_TASK, {i}), event.request);
  }
}

TEST_F(PollerTest, CancelWhileParkedWithdrawsRequest) {
  queue_ = std::make_unique<DispatchQueue>(1);
  StartPoller(Role::PLUGIN);
  Send(net::Frame{PLUGIN_PUSH_TASK, {1}});
  Send(net::Frame{PLUGIN_PUSH_TASK, {2}});
  ASSERT_TRUE(testing::WaitUntil([this]() { return queue_->parked() == 1; }));

  scope_->Cancel();
  EXPECT_TRUE(wait_group_.WaitWithTimeout(absl::Seconds(5)));
  EXPECT_EQ(0u, queue_->parked());

  DispatchEvent event;
  ASSERT_TRUE(NextEvent(&event));
  EXPECT_EQ(Request(REQUEST_PUSH_TASK, {1}), event.request);
  EXPECT_FALSE(NextEvent(&event, absl::Milliseconds(50)));
}
