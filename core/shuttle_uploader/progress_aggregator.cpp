// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "progress_aggregator.hpp"

#include <algorithm>
#include <cmath>

namespace shuttle {
namespace uploader {

ProgressAggregator::ProgressAggregator(uint64_t total_bytes, size_t part_count)
    : total_bytes_(total_bytes)
    , part_count_(part_count)
    // Value-initialized, so every counter starts at zero
    , counters_(std::make_unique<std::atomic<uint64_t>[]>(part_count)) {}

void ProgressAggregator::recordPartProgress(int part_number, uint64_t transferred_bytes) {
  if (!inRange(part_number)) {
    return;
  }
  counters_[part_number - 1].store(transferred_bytes, std::memory_order_relaxed);
}

void ProgressAggregator::resetPart(int part_number) {
  recordPartProgress(part_number, 0);
}

void ProgressAggregator::markComplete() {
  if (part_count_ == 0) {
    return;
  }
  for (size_t i = 0; i + 1 < part_count_; ++i) {
    counters_[i].store(0, std::memory_order_relaxed);
  }
  counters_[part_count_ - 1].store(total_bytes_, std::memory_order_relaxed);
}

ProgressSnapshot ProgressAggregator::snapshot() const {
  ProgressSnapshot snap;
  snap.total_bytes = total_bytes_;
  for (size_t i = 0; i < part_count_; ++i) {
    snap.transferred_bytes += counters_[i].load(std::memory_order_relaxed);
  }
  snap.percentage = percentageOf(snap.transferred_bytes, snap.total_bytes);
  return snap;
}

int ProgressAggregator::percentageOf(uint64_t transferred, uint64_t total) {
  if (total == 0) {
    return 0;
  }
  double ratio = static_cast<double>(transferred) / static_cast<double>(total);
  long pct = std::lround(ratio * 100.0);
  return static_cast<int>(std::clamp<long>(pct, 0, 100));
}

}  // namespace uploader
}  // namespace shuttle
