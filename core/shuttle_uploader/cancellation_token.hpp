// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SHUTTLE_CANCELLATION_TOKEN_HPP
#define SHUTTLE_CANCELLATION_TOKEN_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>

namespace shuttle {
namespace uploader {

/**
 * In-flight network resource that can be torn down from another thread.
 * forceClose() must be safe to call concurrently with I/O on the resource.
 */
class ICancellableHandle {
public:
  virtual ~ICancellableHandle() = default;
  virtual void forceClose() = 0;
};

/**
 * Per-upload cancellation flag plus a registry of in-flight handles
 *
 * cancel() sets the flag, wakes every waitFor() caller and force-closes all
 * registered handles. Handles registered after cancel() are closed at once.
 *
 * Thread-safe.
 */
class CancellationToken {
public:
  /**
   * Scoped registration. Deregisters the handle on destruction.
   */
  class Registration {
  public:
    Registration() = default;
    Registration(CancellationToken* token, uint64_t id, bool cancelled)
        : token_(token)
        , id_(id)
        , cancelled_(cancelled) {}
    ~Registration();

    Registration(const Registration&) = delete;
    Registration& operator=(const Registration&) = delete;
    Registration(Registration&& other) noexcept;
    Registration& operator=(Registration&& other) noexcept;

    /**
     * True when the token was already cancelled at registration time;
     * the handle has been force-closed and must not be used.
     */
    bool cancelled() const {
      return cancelled_;
    }

    void release();

  private:
    CancellationToken* token_ = nullptr;
    uint64_t id_ = 0;
    bool cancelled_ = false;
  };

  CancellationToken() = default;

  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  /**
   * Request cancellation. Idempotent.
   */
  void cancel();

  bool isCancelled() const {
    return cancelled_.load(std::memory_order_acquire);
  }

  /**
   * Register an in-flight handle. The handle must outlive the returned
   * Registration.
   */
  Registration registerHandle(ICancellableHandle* handle);

  /**
   * Sleep for up to `duration`, waking early on cancel().
   * @return true if the token is cancelled
   */
  bool waitFor(std::chrono::milliseconds duration);

  size_t registeredCount() const;

private:
  void deregister(uint64_t id);

  std::atomic<bool> cancelled_{false};
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::map<uint64_t, ICancellableHandle*> handles_;
  uint64_t next_id_ = 1;
};

}  // namespace uploader
}  // namespace shuttle

#endif  // SHUTTLE_CANCELLATION_TOKEN_HPP
