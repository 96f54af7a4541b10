// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SHUTTLE_RETRY_HANDLER_HPP
#define SHUTTLE_RETRY_HANDLER_HPP

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <set>
#include <string>

namespace shuttle {
namespace uploader {

/**
 * Configuration for per-part retry behavior
 */
struct RetryConfig {
  int max_retries = 3;                            // Retries after the first attempt
  std::chrono::milliseconds base_delay{1000};     // Delay unit for linear backoff
  std::chrono::milliseconds max_delay{30000};     // Upper bound for a single wait
};

/**
 * Retry handler with linear backoff
 *
 * The wait before retry n (1-based) is n * base_delay, capped at max_delay.
 * Stateless apart from its configuration, so safe to share between workers.
 */
class RetryHandler {
public:
  explicit RetryHandler(const RetryConfig& config = {})
      : config_(config) {}

  /**
   * Delay before the given retry
   *
   * @param attempt_index Retry number, starting at 1
   */
  std::chrono::milliseconds getDelay(int attempt_index) const {
    if (attempt_index < 1) {
      attempt_index = 1;
    }
    int64_t delay_ms = config_.base_delay.count() * static_cast<int64_t>(attempt_index);
    delay_ms = std::min<int64_t>(delay_ms, config_.max_delay.count());
    return std::chrono::milliseconds(std::max<int64_t>(delay_ms, 0));
  }

  /**
   * @param retry_count Retries already performed
   * @return true if retry_count < max_retries
   */
  bool shouldRetry(int retry_count) const {
    return retry_count < config_.max_retries;
  }

  int maxRetries() const {
    return config_.max_retries;
  }

  /**
   * Total attempts allowed for one part (first attempt plus retries)
   */
  int maxAttempts() const {
    return 1 + std::max(config_.max_retries, 0);
  }

  /**
   * Transient store error codes. Used for store calls that are retried
   * by the SDK configuration and for log classification.
   */
  static bool isRetryableError(const std::string& error_code) {
    static const std::set<std::string> retryable = {// S3/HTTP errors
                                                    "RequestTimeout",
                                                    "ServiceUnavailable",
                                                    "InternalError",
                                                    "SlowDown",
                                                    "RequestTimeTooSkewed",

                                                    // Network errors
                                                    "ConnectionReset",
                                                    "ConnectionTimeout",
                                                    "ConnectionRefused",
                                                    "NetworkingError",

                                                    // MinIO-specific
                                                    "XMinioServerNotInitialized",

                                                    // Generic
                                                    "Throttling",
                                                    "ThrottlingException"};
    return retryable.count(error_code) > 0;
  }

  const RetryConfig& config() const {
    return config_;
  }

private:
  RetryConfig config_;
};

}  // namespace uploader
}  // namespace shuttle

#endif  // SHUTTLE_RETRY_HANDLER_HPP
