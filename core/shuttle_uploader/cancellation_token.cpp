// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "cancellation_token.hpp"

#define SHUTTLE_LOG_COMPONENT "cancellation"
#include <shuttle_log_macros.hpp>

namespace shuttle {
namespace uploader {

CancellationToken::Registration::~Registration() {
  release();
}

CancellationToken::Registration::Registration(Registration&& other) noexcept
    : token_(other.token_)
    , id_(other.id_)
    , cancelled_(other.cancelled_) {
  other.token_ = nullptr;
  other.id_ = 0;
}

CancellationToken::Registration& CancellationToken::Registration::operator=(
  Registration&& other
) noexcept {
  if (this != &other) {
    release();
    token_ = other.token_;
    id_ = other.id_;
    cancelled_ = other.cancelled_;
    other.token_ = nullptr;
    other.id_ = 0;
  }
  return *this;
}

void CancellationToken::Registration::release() {
  if (token_ && id_ != 0) {
    token_->deregister(id_);
  }
  token_ = nullptr;
  id_ = 0;
}

void CancellationToken::cancel() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (cancelled_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }

  SHUTTLE_LOG_DEBUG("cancel requested" << logging::kv("in_flight", handles_.size()));

  // Closing under the lock keeps handles alive: deregister() blocks until done
  for (auto& entry : handles_) {
    entry.second->forceClose();
  }
  cv_.notify_all();
}

CancellationToken::Registration CancellationToken::registerHandle(ICancellableHandle* handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (cancelled_.load(std::memory_order_acquire)) {
    handle->forceClose();
    return Registration(nullptr, 0, true);
  }
  uint64_t id = next_id_++;
  handles_.emplace(id, handle);
  return Registration(this, id, false);
}

bool CancellationToken::waitFor(std::chrono::milliseconds duration) {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, duration, [this] {
    return cancelled_.load(std::memory_order_acquire);
  });
}

size_t CancellationToken::registeredCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return handles_.size();
}

void CancellationToken::deregister(uint64_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  handles_.erase(id);
}

}  // namespace uploader
}  // namespace shuttle
