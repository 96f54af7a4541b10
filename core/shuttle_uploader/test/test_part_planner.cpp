// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for PartPlanner
 */

#include <gtest/gtest.h>

#include "part_planner.hpp"
#include "test_helpers.hpp"

using namespace shuttle::uploader;
using shuttle::uploader::test::kMiB;

namespace {

void expectExactCover(const UploadPlan& plan) {
  ASSERT_FALSE(plan.parts.empty());
  uint64_t expected_start = 0;
  for (size_t i = 0; i < plan.parts.size(); ++i) {
    const auto& part = plan.parts[i];
    EXPECT_EQ(part.part_number, static_cast<int>(i + 1));
    EXPECT_EQ(part.start, expected_start);
    EXPECT_GT(part.end, part.start);
    expected_start = part.end;
  }
  EXPECT_EQ(expected_start, plan.file_size);
}

}  // namespace

TEST(PartPlannerTest, SplitsWithSmallerLastPart) {
  auto result = PartPlanner::plan(26 * kMiB, 5 * kMiB);
  ASSERT_TRUE(result.success) << result.error_message;

  const auto& parts = result.plan.parts;
  ASSERT_EQ(parts.size(), 6u);
  for (size_t i = 0; i < 5; ++i) {
    EXPECT_EQ(parts[i].size(), 5 * kMiB);
  }
  EXPECT_EQ(parts[5].size(), 1 * kMiB);
  expectExactCover(result.plan);
}

TEST(PartPlannerTest, ExactMultipleHasNoRemainderPart) {
  auto result = PartPlanner::plan(15 * kMiB, 5 * kMiB);
  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.plan.parts.size(), 3u);
  EXPECT_EQ(result.plan.parts.back().size(), 5 * kMiB);
  expectExactCover(result.plan);
}

TEST(PartPlannerTest, SingleByteOverPartSize) {
  auto result = PartPlanner::plan(5 * kMiB + 1, 5 * kMiB);
  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.plan.parts.size(), 2u);
  EXPECT_EQ(result.plan.parts[1].size(), 1u);
  expectExactCover(result.plan);
}

TEST(PartPlannerTest, FileSmallerThanPartSizeIsOnePart) {
  auto result = PartPlanner::plan(1000, 5 * kMiB);
  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.plan.parts.size(), 1u);
  EXPECT_EQ(result.plan.parts[0].start, 0u);
  EXPECT_EQ(result.plan.parts[0].end, 1000u);
}

TEST(PartPlannerTest, Deterministic) {
  auto first = PartPlanner::plan(123 * kMiB + 17, 7 * kMiB);
  auto second = PartPlanner::plan(123 * kMiB + 17, 7 * kMiB);
  ASSERT_TRUE(first.success);
  ASSERT_TRUE(second.success);
  EXPECT_EQ(first.plan.parts, second.plan.parts);
  expectExactCover(first.plan);
}

TEST(PartPlannerTest, RejectsPartSizeBelowMinimum) {
  auto result = PartPlanner::plan(100 * kMiB, kMinPartSize - 1);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error_code, UploadErrorCode::InvalidConfiguration);
  EXPECT_TRUE(result.plan.parts.empty());
}

TEST(PartPlannerTest, RejectsPartSizeAboveMaximum) {
  auto result = PartPlanner::plan(100 * kMiB, kMaxPartSize + 1);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error_code, UploadErrorCode::InvalidConfiguration);
}

TEST(PartPlannerTest, RejectsEmptyFile) {
  auto result = PartPlanner::plan(0, 5 * kMiB);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error_code, UploadErrorCode::InvalidConfiguration);
}

TEST(PartPlannerTest, RejectsTooManyParts) {
  auto result = PartPlanner::plan(kMaxParts * kMinPartSize + 1, kMinPartSize);
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error_message.find("increase the part size"), std::string::npos);
}

TEST(PartPlannerTest, MaxPartsExactlyFits) {
  auto result = PartPlanner::plan(kMaxParts * kMinPartSize, kMinPartSize);
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.plan.parts.size(), kMaxParts);
}

TEST(PartPlannerTest, PartCount) {
  EXPECT_EQ(PartPlanner::partCount(26 * kMiB, 5 * kMiB), 6u);
  EXPECT_EQ(PartPlanner::partCount(25 * kMiB, 5 * kMiB), 5u);
  EXPECT_EQ(PartPlanner::partCount(1, 5 * kMiB), 1u);
  EXPECT_EQ(PartPlanner::partCount(10, 0), 0u);
}
