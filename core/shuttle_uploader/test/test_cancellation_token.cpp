// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for CancellationToken
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

#include "cancellation_token.hpp"

using namespace shuttle::uploader;

namespace {

class CountingHandle : public ICancellableHandle {
public:
  void forceClose() override {
    ++closes;
  }

  std::atomic<int> closes{0};
};

}  // namespace

TEST(CancellationTokenTest, InitiallyNotCancelled) {
  CancellationToken token;
  EXPECT_FALSE(token.isCancelled());
  EXPECT_EQ(token.registeredCount(), 0u);
}

TEST(CancellationTokenTest, CancelIsIdempotent) {
  CancellationToken token;
  CountingHandle handle;
  auto registration = token.registerHandle(&handle);

  token.cancel();
  token.cancel();

  EXPECT_TRUE(token.isCancelled());
  EXPECT_EQ(handle.closes.load(), 1);
}

TEST(CancellationTokenTest, CancelClosesRegisteredHandles) {
  CancellationToken token;
  CountingHandle first;
  CountingHandle second;
  auto reg1 = token.registerHandle(&first);
  auto reg2 = token.registerHandle(&second);
  EXPECT_EQ(token.registeredCount(), 2u);
  EXPECT_FALSE(reg1.cancelled());

  token.cancel();

  EXPECT_EQ(first.closes.load(), 1);
  EXPECT_EQ(second.closes.load(), 1);
}

TEST(CancellationTokenTest, RegistrationScopeDeregisters) {
  CancellationToken token;
  CountingHandle handle;
  {
    auto registration = token.registerHandle(&handle);
    EXPECT_EQ(token.registeredCount(), 1u);
  }
  EXPECT_EQ(token.registeredCount(), 0u);

  token.cancel();
  EXPECT_EQ(handle.closes.load(), 0);
}

TEST(CancellationTokenTest, ReleaseDeregistersEarly) {
  CancellationToken token;
  CountingHandle handle;
  auto registration = token.registerHandle(&handle);
  registration.release();
  EXPECT_EQ(token.registeredCount(), 0u);

  token.cancel();
  EXPECT_EQ(handle.closes.load(), 0);
}

TEST(CancellationTokenTest, RegisterAfterCancelClosesImmediately) {
  CancellationToken token;
  token.cancel();

  CountingHandle handle;
  auto registration = token.registerHandle(&handle);
  EXPECT_TRUE(registration.cancelled());
  EXPECT_EQ(handle.closes.load(), 1);
  EXPECT_EQ(token.registeredCount(), 0u);
}

TEST(CancellationTokenTest, MovedRegistrationDeregistersOnce) {
  CancellationToken token;
  CountingHandle handle;
  {
    auto original = token.registerHandle(&handle);
    CancellationToken::Registration moved(std::move(original));
    EXPECT_EQ(token.registeredCount(), 1u);
  }
  EXPECT_EQ(token.registeredCount(), 0u);
}

TEST(CancellationTokenTest, WaitForTimesOutWithoutCancel) {
  CancellationToken token;
  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(token.waitFor(std::chrono::milliseconds(20)));
  EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(15));
}

TEST(CancellationTokenTest, WaitForWakesOnCancel) {
  CancellationToken token;
  std::thread canceller([&token] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    token.cancel();
  });

  auto start = std::chrono::steady_clock::now();
  EXPECT_TRUE(token.waitFor(std::chrono::seconds(10)));
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
  canceller.join();
}

TEST(CancellationTokenTest, WaitForReturnsAtOnceWhenCancelled) {
  CancellationToken token;
  token.cancel();
  EXPECT_TRUE(token.waitFor(std::chrono::seconds(10)));
}
