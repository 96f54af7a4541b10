// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SHUTTLE_PART_QUEUE_HPP
#define SHUTTLE_PART_QUEUE_HPP

#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

#include "part_planner.hpp"

namespace shuttle {
namespace uploader {

/**
 * Thread-safe FIFO of parts awaiting upload
 *
 * Filled by the coordinator before workers start (and again on retry),
 * drained by the workers with non-blocking tryPop(). An empty queue means
 * there is no more work for this round.
 */
class PartQueue {
public:
  PartQueue() = default;

  // Non-copyable, non-movable
  PartQueue(const PartQueue&) = delete;
  PartQueue& operator=(const PartQueue&) = delete;
  PartQueue(PartQueue&&) = delete;
  PartQueue& operator=(PartQueue&&) = delete;

  void push(const Part& part);

  void pushAll(const std::vector<Part>& parts);

  /**
   * Remove and return the front part, std::nullopt when empty. Never blocks.
   */
  std::optional<Part> tryPop();

  size_t size() const;

  bool empty() const;

  /**
   * Bytes covered by the queued parts
   */
  uint64_t pendingBytes() const;

  void clear();

private:
  mutable std::mutex mutex_;
  std::deque<Part> parts_;
  uint64_t pending_bytes_ = 0;
};

}  // namespace uploader
}  // namespace shuttle

#endif  // SHUTTLE_PART_QUEUE_HPP
