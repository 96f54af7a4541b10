// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SHUTTLE_PART_PLANNER_HPP
#define SHUTTLE_PART_PLANNER_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "upload_result.hpp"

namespace shuttle {
namespace uploader {

// S3 multipart limits
constexpr uint64_t kMinPartSize = 5ULL * 1024 * 1024;         // 5 MiB (last part may be smaller)
constexpr uint64_t kMaxPartSize = 5ULL * 1024 * 1024 * 1024;  // 5 GiB
constexpr uint64_t kMaxParts = 10000;

/**
 * Byte range [start, end) uploaded as one part. part_number is 1-based.
 */
struct Part {
  int part_number = 0;
  uint64_t start = 0;
  uint64_t end = 0;

  uint64_t size() const {
    return end - start;
  }

  bool operator==(const Part& other) const {
    return part_number == other.part_number && start == other.start && end == other.end;
  }
};

/**
 * Ordered parts covering [0, file_size) contiguously
 */
struct UploadPlan {
  uint64_t file_size = 0;
  uint64_t part_size = 0;
  std::vector<Part> parts;
};

struct PlanResult {
  bool success;
  UploadPlan plan;
  UploadErrorCode error_code;
  std::string error_message;

  static PlanResult Success(UploadPlan plan) {
    return {true, std::move(plan), UploadErrorCode::None, ""};
  }

  static PlanResult Failure(const std::string& message) {
    return {false, UploadPlan{}, UploadErrorCode::InvalidConfiguration, message};
  }
};

/**
 * Splits a file into parts of part_size bytes, the last part taking the remainder.
 */
class PartPlanner {
public:
  /**
   * Compute the plan. Deterministic for identical inputs.
   *
   * Fails with InvalidConfiguration when part_size is outside
   * [kMinPartSize, kMaxPartSize], file_size is zero, or more than kMaxParts
   * parts would be needed.
   */
  static PlanResult plan(uint64_t file_size, uint64_t part_size);

  static uint64_t partCount(uint64_t file_size, uint64_t part_size) {
    return part_size == 0 ? 0 : (file_size + part_size - 1) / part_size;
  }
};

}  // namespace uploader
}  // namespace shuttle

#endif  // SHUTTLE_PART_PLANNER_HPP
