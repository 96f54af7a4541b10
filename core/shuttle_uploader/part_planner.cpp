// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "part_planner.hpp"

#include <algorithm>

namespace shuttle {
namespace uploader {

PlanResult PartPlanner::plan(uint64_t file_size, uint64_t part_size) {
  if (part_size < kMinPartSize) {
    return PlanResult::Failure(
      "part size " + std::to_string(part_size) + " is below the minimum of " +
      std::to_string(kMinPartSize) + " bytes"
    );
  }
  if (part_size > kMaxPartSize) {
    return PlanResult::Failure(
      "part size " + std::to_string(part_size) + " exceeds the maximum of " +
      std::to_string(kMaxPartSize) + " bytes"
    );
  }
  if (file_size == 0) {
    return PlanResult::Failure("file is empty");
  }

  uint64_t count = partCount(file_size, part_size);
  if (count > kMaxParts) {
    return PlanResult::Failure(
      "file needs " + std::to_string(count) + " parts, store allows at most " +
      std::to_string(kMaxParts) + "; increase the part size"
    );
  }

  UploadPlan plan;
  plan.file_size = file_size;
  plan.part_size = part_size;
  plan.parts.reserve(static_cast<size_t>(count));

  uint64_t offset = 0;
  for (uint64_t i = 0; i < count; ++i) {
    Part part;
    part.part_number = static_cast<int>(i + 1);
    part.start = offset;
    part.end = std::min(offset + part_size, file_size);
    plan.parts.push_back(part);
    offset = part.end;
  }

  return PlanResult::Success(std::move(plan));
}

}  // namespace uploader
}  // namespace shuttle
