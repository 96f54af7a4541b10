// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "part_queue.hpp"

namespace shuttle {
namespace uploader {

void PartQueue::push(const Part& part) {
  std::lock_guard<std::mutex> lock(mutex_);
  pending_bytes_ += part.size();
  parts_.push_back(part);
}

void PartQueue::pushAll(const std::vector<Part>& parts) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& part : parts) {
    pending_bytes_ += part.size();
    parts_.push_back(part);
  }
}

std::optional<Part> PartQueue::tryPop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (parts_.empty()) {
    return std::nullopt;
  }
  Part part = parts_.front();
  parts_.pop_front();
  pending_bytes_ -= part.size();
  return part;
}

size_t PartQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return parts_.size();
}

bool PartQueue::empty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return parts_.empty();
}

uint64_t PartQueue::pendingBytes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_bytes_;
}

void PartQueue::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  parts_.clear();
  pending_bytes_ = 0;
}

}  // namespace uploader
}  // namespace shuttle
