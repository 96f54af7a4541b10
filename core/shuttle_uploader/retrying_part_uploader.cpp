// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "retrying_part_uploader.hpp"

#include <utility>
#include <vector>

#define SHUTTLE_LOG_COMPONENT "part_uploader"
#include <shuttle_log_macros.hpp>

namespace shuttle {
namespace uploader {

RetryingPartUploader::RetryingPartUploader(
  std::shared_ptr<IPresignedPutClient> client, std::shared_ptr<IPartSource> source,
  ProgressAggregator& progress, CancellationToken& token, const RetryHandler& retry,
  const PartTarget& target
)
    : client_(std::move(client))
    , source_(std::move(source))
    , progress_(progress)
    , token_(token)
    , retry_(retry)
    , target_(target) {}

PartUploadResult RetryingPartUploader::upload(const Part& part) {
  std::vector<char> buffer;
  UploadErrorCode last_code = UploadErrorCode::None;
  std::string last_error;
  int attempt = 0;

  while (true) {
    if (token_.isCancelled()) {
      return PartUploadResult::Failure(
        part.part_number, UploadErrorCode::Cancelled, "cancelled", attempt
      );
    }
    ++attempt;

    std::string read_error;
    if (!source_->readPart(part, buffer, read_error)) {
      last_code = UploadErrorCode::FileReadError;
      last_error = read_error;
    } else {
      auto presigned = client_->presign(
        target_.bucket, target_.key, target_.upload_id, part.part_number, target_.presign_ttl
      );
      if (!presigned.success) {
        last_code = presigned.error_code;
        last_error = presigned.error_message;
      } else {
        const int part_number = part.part_number;
        auto put = client_->putRange(
          presigned.url,
          buffer.data(),
          buffer.size(),
          [this, part_number](uint64_t transferred) {
            progress_.recordPartProgress(part_number, transferred);
          },
          token_
        );

        if (put.success) {
          progress_.recordPartProgress(part.part_number, part.size());
          SHUTTLE_LOG_DEBUG(
            "part uploaded" << logging::kv("part", part.part_number)
                            << logging::kv("bytes", part.size())
                            << logging::kv("attempt", attempt)
          );
          return PartUploadResult::Success(PartResult{part.part_number, put.etag}, attempt);
        }
        if (put.error_code == UploadErrorCode::Cancelled) {
          return PartUploadResult::Failure(
            part.part_number, UploadErrorCode::Cancelled, put.error_message, attempt
          );
        }
        last_code = put.error_code;
        last_error = put.error_message;
      }
    }

    // Discard partial progress before the next attempt
    progress_.resetPart(part.part_number);

    // attempt - 1 retries have been spent so far
    if (!retry_.shouldRetry(attempt - 1)) {
      break;
    }

    auto delay = retry_.getDelay(attempt);
    SHUTTLE_LOG_WARN(
      "part attempt failed, retrying"
      << logging::kv("part", part.part_number) << logging::kv("attempt", attempt)
      << logging::kv("max_attempts", retry_.maxAttempts())
      << logging::kv("code", errorCodeToString(last_code)) << logging::kv("error", last_error)
      << logging::kv("delay_ms", delay.count())
    );
    if (token_.waitFor(delay)) {
      return PartUploadResult::Failure(
        part.part_number, UploadErrorCode::Cancelled, "cancelled during backoff", attempt
      );
    }
  }

  SHUTTLE_LOG_ERROR(
    "part failed" << logging::kv("part", part.part_number) << logging::kv("attempts", attempt)
                  << logging::kv("code", errorCodeToString(last_code))
                  << logging::kv("error", last_error)
  );
  return PartUploadResult::Failure(
    part.part_number,
    UploadErrorCode::PartUploadFailed,
    "part " + std::to_string(part.part_number) + " failed after " + std::to_string(attempt) +
      " attempts: " + errorCodeToString(last_code) + ": " + last_error,
    attempt
  );
}

}  // namespace uploader
}  // namespace shuttle
