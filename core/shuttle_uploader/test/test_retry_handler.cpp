/**
 * Unit tests for RetryHandler
 */

#include <gtest/gtest.h>

#include "retry_handler.hpp"

using namespace shuttle::uploader;

TEST(RetryHandlerTest, DefaultConfig) {
  RetryHandler handler;
  EXPECT_EQ(handler.maxRetries(), 3);
  EXPECT_EQ(handler.maxAttempts(), 4);
  EXPECT_EQ(handler.config().base_delay, std::chrono::milliseconds(1000));
  EXPECT_EQ(handler.config().max_delay, std::chrono::milliseconds(30000));
}

TEST(RetryHandlerTest, LinearBackoff) {
  RetryConfig config;
  config.base_delay = std::chrono::milliseconds(1000);
  config.max_delay = std::chrono::milliseconds(30000);
  RetryHandler handler(config);

  EXPECT_EQ(handler.getDelay(1), std::chrono::milliseconds(1000));
  EXPECT_EQ(handler.getDelay(2), std::chrono::milliseconds(2000));
  EXPECT_EQ(handler.getDelay(3), std::chrono::milliseconds(3000));
}

TEST(RetryHandlerTest, DelayIsCapped) {
  RetryConfig config;
  config.base_delay = std::chrono::milliseconds(1000);
  config.max_delay = std::chrono::milliseconds(2500);
  RetryHandler handler(config);

  EXPECT_EQ(handler.getDelay(2), std::chrono::milliseconds(2000));
  EXPECT_EQ(handler.getDelay(3), std::chrono::milliseconds(2500));
  EXPECT_EQ(handler.getDelay(100), std::chrono::milliseconds(2500));
}

TEST(RetryHandlerTest, AttemptIndexBelowOneUsesFirstDelay) {
  RetryHandler handler;
  EXPECT_EQ(handler.getDelay(0), handler.getDelay(1));
  EXPECT_EQ(handler.getDelay(-5), handler.getDelay(1));
}

TEST(RetryHandlerTest, ShouldRetry) {
  RetryConfig config;
  config.max_retries = 2;
  RetryHandler handler(config);

  EXPECT_TRUE(handler.shouldRetry(0));
  EXPECT_TRUE(handler.shouldRetry(1));
  EXPECT_FALSE(handler.shouldRetry(2));
}

TEST(RetryHandlerTest, ZeroRetriesMeansOneAttempt) {
  RetryConfig config;
  config.max_retries = 0;
  RetryHandler handler(config);
  EXPECT_FALSE(handler.shouldRetry(0));
  EXPECT_EQ(handler.maxAttempts(), 1);
}

TEST(RetryHandlerTest, RetryableStoreErrors) {
  EXPECT_TRUE(RetryHandler::isRetryableError("RequestTimeout"));
  EXPECT_TRUE(RetryHandler::isRetryableError("SlowDown"));
  EXPECT_TRUE(RetryHandler::isRetryableError("XMinioServerNotInitialized"));

  EXPECT_FALSE(RetryHandler::isRetryableError("AccessDenied"));
  EXPECT_FALSE(RetryHandler::isRetryableError("NoSuchBucket"));
  EXPECT_FALSE(RetryHandler::isRetryableError(""));
}
