#include <gtest/gtest.h>

#include "core/cancel_token.h"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace stagehand::core;

TEST(CancelToken, StartsUncanceled) {
  auto token = CancelToken::create();
  ASSERT_FALSE(token->is_canceled());
  ASSERT_FALSE(token->wait_for(std::chrono::milliseconds(1)));
}

TEST(CancelToken, CancelIsIdempotentAndRunsCallbacksOnce) {
  auto token = CancelToken::create();
  int calls = 0;
  token->on_cancel([&calls]() { ++calls; });

  token->request_cancel();
  token->request_cancel();
  ASSERT_TRUE(token->is_canceled());
  ASSERT_EQ(calls, 1);
}

TEST(CancelToken, LateCallbackRunsImmediately) {
  auto token = CancelToken::create();
  token->request_cancel();
  bool called = false;
  token->on_cancel([&called]() { called = true; });
  ASSERT_TRUE(called);
}

TEST(CancelToken, ThrowingCallbackDoesNotStopTheOthers) {
  auto token = CancelToken::create();
  auto child = CancelToken::create_child(token);
  int calls = 0;
  token->on_cancel([]() { throw std::runtime_error("callback bug"); });
  token->on_cancel([&calls]() { ++calls; });

  ASSERT_NO_THROW(token->request_cancel());
  ASSERT_TRUE(token->is_canceled());
  ASSERT_TRUE(child->is_canceled());
  ASSERT_EQ(calls, 1);
}

TEST(CancelToken, WaitForWakesOnCancel) {
  auto token = CancelToken::create();
  std::thread canceller([token]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    token->request_cancel();
  });

  const auto start = std::chrono::steady_clock::now();
  ASSERT_TRUE(token->wait_for(std::chrono::seconds(5)));
  const auto waited = std::chrono::steady_clock::now() - start;
  canceller.join();
  ASSERT_LT(waited, std::chrono::seconds(5));
}

TEST(CancelToken, ParentCancelsChildren) {
  auto parent = CancelToken::create();
  auto a = CancelToken::create_child(parent);
  auto b = CancelToken::create_child(parent);

  parent->request_cancel();
  ASSERT_TRUE(a->is_canceled());
  ASSERT_TRUE(b->is_canceled());
}

TEST(CancelToken, ChildDoesNotCancelParentOrSiblings) {
  auto parent = CancelToken::create();
  auto a = CancelToken::create_child(parent);
  auto b = CancelToken::create_child(parent);

  a->request_cancel();
  ASSERT_FALSE(parent->is_canceled());
  ASSERT_FALSE(b->is_canceled());
}

TEST(CancelToken, ChildOfCanceledParentStartsCanceled) {
  auto parent = CancelToken::create();
  parent->request_cancel();
  ASSERT_TRUE(CancelToken::create_child(parent)->is_canceled());
}
