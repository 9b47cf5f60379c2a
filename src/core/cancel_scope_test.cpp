// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2024 Chilledheart  */

#include <gmock/gmock.h>
#include <gtest/gtest-message.h>
#include <gtest/gtest.h>

#include <absl/time/clock.h>

#include <atomic>
#include <thread>
#include <vector>

#include "core/cancel_scope.hpp"
#include "core/wait_group.hpp"

using namespace relay;

TEST(CancelScopeTest, CancelCascadesDown) {
  auto root = CancelScope::Create();
  auto child = root->NewChild();
  auto grandchild = child->NewChild();
  EXPECT_FALSE(grandchild->cancelled());

  root->Cancel();
  EXPECT_TRUE(root->cancelled());
  EXPECT_TRUE(child->cancelled());
  EXPECT_TRUE(grandchild->cancelled());
}

TEST(CancelScopeTest, CancelLeavesParentAndSiblingsAlone) {
  auto root = CancelScope::Create();
  auto first = root->NewChild();
  auto second = root->NewChild();

  first->Cancel();
  EXPECT_TRUE(first->cancelled());
  EXPECT_FALSE(root->cancelled());
  EXPECT_FALSE(second->cancelled());
}

TEST(CancelScopeTest, ChildOfCancelledScopeIsBornCancelled) {
  auto root = CancelScope::Create();
  root->Cancel();
  auto child = root->NewChild();
  EXPECT_TRUE(child->cancelled());
}

TEST(CancelScopeTest, CallbacksRunOnce) {
  auto root = CancelScope::Create();
  auto child = root->NewChild();
  int root_calls = 0;
  int child_calls = 0;
  EXPECT_NE(0u, root->AddCancelCallback([&root_calls]() { ++root_calls; }));
  EXPECT_NE(0u, child->AddCancelCallback([&child_calls]() { ++child_calls; }));

  root->Cancel();
  root->Cancel();
  child->Cancel();
  EXPECT_EQ(1, root_calls);
  EXPECT_EQ(1, child_calls);
}

TEST(CancelScopeTest, CallbackOnCancelledScopeRunsImmediately) {
  auto scope = CancelScope::Create();
  scope->Cancel();
  bool called = false;
  EXPECT_EQ(0u, scope->AddCancelCallback([&called]() { called = true; }));
  EXPECT_TRUE(called);
}

TEST(CancelScopeTest, RemovedCallbackNeverRuns) {
  auto scope = CancelScope::Create();
  bool called = false;
  uint64_t id = scope->AddCancelCallback([&called]() { called = true; });
  EXPECT_TRUE(scope->RemoveCancelCallback(id));
  EXPECT_FALSE(scope->RemoveCancelCallback(id));
  scope->Cancel();
  EXPECT_FALSE(called);
}

TEST(CancelScopeTest, CallbackMayTouchScope) {
  auto scope = CancelScope::Create();
  bool saw_cancelled = false;
  scope->AddCancelCallback([&scope, &saw_cancelled]() {
    saw_cancelled = scope->cancelled();
    // no deadlock: callbacks run outside the lock
    scope->NewChild();
  });
  scope->Cancel();
  EXPECT_TRUE(saw_cancelled);
}

TEST(CancelScopeTest, ConcurrentCancel) {
  auto root = CancelScope::Create();
  std::vector<std::shared_ptr<CancelScope>> children;
  for (int i = 0; i < 16; ++i) {
    children.push_back(root->NewChild());
  }
  std::atomic<int> calls{0};
  for (auto& child : children) {
    child->AddCancelCallback([&calls]() { ++calls; });
  }
  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([&root]() { root->Cancel(); });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(16, calls.load());
}

TEST(WaitGroupTest, WaitReturnsWhenAllDone) {
  WaitGroup wait_group;
  wait_group.Add(3);
  std::vector<std::thread> threads;
  for (int i = 0; i < 3; ++i) {
    threads.emplace_back([&wait_group]() {
      absl::SleepFor(absl::Milliseconds(5));
      wait_group.Done();
    });
  }
  wait_group.Wait();
  EXPECT_EQ(0, wait_group.count());
  for (auto& thread : threads) {
    thread.join();
  }
}

TEST(WaitGroupTest, WaitWithTimeout) {
  WaitGroup wait_group;
  EXPECT_TRUE(wait_group.WaitWithTimeout(absl::Milliseconds(1)));
  wait_group.Add();
  EXPECT_FALSE(wait_group.WaitWithTimeout(absl::Milliseconds(10)));
  EXPECT_EQ(1, wait_group.count());
  wait_group.Done();
  EXPECT_TRUE(wait_group.WaitWithTimeout(absl::Milliseconds(1)));
}
