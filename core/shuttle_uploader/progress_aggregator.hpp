// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SHUTTLE_PROGRESS_AGGREGATOR_HPP
#define SHUTTLE_PROGRESS_AGGREGATOR_HPP

#include <atomic>
#include <cstdint>
#include <memory>

namespace shuttle {
namespace uploader {

/**
 * Global progress view derived from the per-part counters
 */
struct ProgressSnapshot {
  uint64_t transferred_bytes = 0;
  uint64_t total_bytes = 0;
  int percentage = 0;  // round(100 * transferred / total), clamped to [0, 100]
};

/**
 * Per-part transferred-byte counters merged on demand
 *
 * One atomic counter per part, indexed by part_number - 1. Workers write only
 * their own part's counter; snapshot() may run concurrently from any thread.
 */
class ProgressAggregator {
public:
  ProgressAggregator(uint64_t total_bytes, size_t part_count);

  ProgressAggregator(const ProgressAggregator&) = delete;
  ProgressAggregator& operator=(const ProgressAggregator&) = delete;

  /**
   * Overwrite the counter of a part with its cumulative transferred bytes.
   * Out-of-range part numbers are ignored.
   */
  void recordPartProgress(int part_number, uint64_t transferred_bytes);

  void resetPart(int part_number);

  /**
   * Mark the whole payload as transferred (single-shot uploads).
   */
  void markComplete();

  ProgressSnapshot snapshot() const;

  uint64_t totalBytes() const {
    return total_bytes_;
  }

  size_t partCount() const {
    return part_count_;
  }

  static int percentageOf(uint64_t transferred, uint64_t total);

private:
  bool inRange(int part_number) const {
    return part_number >= 1 && static_cast<size_t>(part_number) <= part_count_;
  }

  uint64_t total_bytes_;
  size_t part_count_;
  std::unique_ptr<std::atomic<uint64_t>[]> counters_;
};

}  // namespace uploader
}  // namespace shuttle

#endif  // SHUTTLE_PROGRESS_AGGREGATOR_HPP
