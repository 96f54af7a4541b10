// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SHUTTLE_RETRYING_PART_UPLOADER_HPP
#define SHUTTLE_RETRYING_PART_UPLOADER_HPP

#include <chrono>
#include <memory>
#include <string>

#include "cancellation_token.hpp"
#include "part_planner.hpp"
#include "part_source.hpp"
#include "presigned_put_client.hpp"
#include "progress_aggregator.hpp"
#include "retry_handler.hpp"
#include "upload_result.hpp"

namespace shuttle {
namespace uploader {

/**
 * Identifies the multipart session the parts belong to
 */
struct PartTarget {
  std::string bucket;
  std::string key;
  std::string upload_id;
  std::chrono::seconds presign_ttl{3600};
};

/**
 * Uploads a single part with bounded retries
 *
 * Every attempt reads the part, presigns its URL and PUTs it. A failed
 * attempt resets the part's progress to 0 and waits attempt * base_delay
 * (capped) before the next one. The wait and the PUT are interrupted by the
 * cancellation token.
 */
class RetryingPartUploader {
public:
  RetryingPartUploader(
    std::shared_ptr<IPresignedPutClient> client, std::shared_ptr<IPartSource> source,
    ProgressAggregator& progress, CancellationToken& token, const RetryHandler& retry,
    const PartTarget& target
  );

  /**
   * Attempt the part until it succeeds or the RetryHandler's budget is spent.
   *
   * @return PartResult on success; Cancelled, or PartUploadFailed with the
   *         last attempt's error
   */
  PartUploadResult upload(const Part& part);

private:
  std::shared_ptr<IPresignedPutClient> client_;
  std::shared_ptr<IPartSource> source_;
  ProgressAggregator& progress_;
  CancellationToken& token_;
  const RetryHandler& retry_;
  PartTarget target_;
};

}  // namespace uploader
}  // namespace shuttle

#endif  // SHUTTLE_RETRYING_PART_UPLOADER_HPP
