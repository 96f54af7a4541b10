// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_coordinator.hpp"

#include <algorithm>
#include <thread>
#include <unordered_map>
#include <utility>

#include "retrying_part_uploader.hpp"

#define SHUTTLE_LOG_COMPONENT "coordinator"
#include <shuttle_log_macros.hpp>

namespace shuttle {
namespace uploader {

namespace {

const std::unordered_map<UploadState, std::vector<UploadState>>& transition_map() {
  static const std::unordered_map<UploadState, std::vector<UploadState>> transitions = {
    {UploadState::PLANNING, {UploadState::INITIATED, UploadState::TERMINATED}},
    {UploadState::INITIATED, {UploadState::PARTS_IN_FLIGHT, UploadState::ABORTING}},
    {UploadState::PARTS_IN_FLIGHT,
     {UploadState::ALL_SUCCEEDED, UploadState::PARTIAL_FAILURE, UploadState::ABORTING}},
    {UploadState::ALL_SUCCEEDED, {UploadState::COMPLETING}},
    {UploadState::PARTIAL_FAILURE, {UploadState::RETRYING, UploadState::ABORTING}},
    {UploadState::RETRYING, {UploadState::PARTS_IN_FLIGHT, UploadState::ABORTING}},
    {UploadState::COMPLETING, {UploadState::TERMINATED}},
    {UploadState::ABORTING, {UploadState::TERMINATED}},
    {UploadState::TERMINATED, {}},
  };
  return transitions;
}

}  // namespace

UploadCoordinator::UploadCoordinator(
  std::shared_ptr<IObjectStore> store, std::shared_ptr<IPresignedPutClient> client,
  std::shared_ptr<IPartSource> source, const CoordinatorConfig& config
)
    : store_(std::move(store))
    , client_(std::move(client))
    , source_(std::move(source))
    , config_(config) {
  config_.retry.max_retries = config_.max_retries;
  retry_ = RetryHandler(config_.retry);
}

UploadCoordinator::~UploadCoordinator() = default;

void UploadCoordinator::set_partial_failure_handler(PartialFailureHandler handler) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  failure_handler_ = std::move(handler);
}

void UploadCoordinator::register_transition_callback(UploadStateCallback callback) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  callbacks_.push_back(std::move(callback));
}

bool UploadCoordinator::is_valid_transition(UploadState from, UploadState to) {
  const auto& transitions = transition_map();
  auto it = transitions.find(from);
  if (it == transitions.end()) {
    return false;
  }
  return std::find(it->second.begin(), it->second.end(), to) != it->second.end();
}

bool UploadCoordinator::transition_to(UploadState to) {
  UploadState from;
  std::vector<UploadStateCallback> callbacks;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    from = state_;
    if (!is_valid_transition(from, to)) {
      SHUTTLE_LOG_ERROR(
        "invalid state transition" << logging::kv("from", state_to_string(from))
                                   << logging::kv("to", state_to_string(to))
      );
      return false;
    }
    state_ = to;
    callbacks = callbacks_;
  }

  SHUTTLE_LOG_DEBUG(
    "state" << logging::kv("from", state_to_string(from)) << logging::kv("to", state_to_string(to))
  );
  for (const auto& callback : callbacks) {
    callback(from, to);
  }
  return true;
}

UploadState UploadCoordinator::get_state() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_;
}

std::string UploadCoordinator::upload_id() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return upload_id_;
}

ProgressSnapshot UploadCoordinator::progress() const {
  std::shared_ptr<ProgressAggregator> progress;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    progress = progress_;
  }
  return progress ? progress->snapshot() : ProgressSnapshot{};
}

void UploadCoordinator::cancel() {
  {
    std::lock_guard<std::mutex> lock(results_mutex_);
    accepting_results_ = false;
  }
  token_.cancel();
}

UploadOutcome UploadCoordinator::run(
  const std::string& bucket, const std::string& key, uint64_t file_size
) {
  auto planned = PartPlanner::plan(file_size, config_.part_size);
  if (!planned.success) {
    return terminate_with(planned.error_code, planned.error_message);
  }
  plan_ = std::move(planned.plan);

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    progress_ = std::make_shared<ProgressAggregator>(plan_.file_size, plan_.parts.size());
  }

  if (token_.isCancelled()) {
    return terminate_with(UploadErrorCode::UploadCancelled, "upload cancelled before start");
  }

  auto initiated = store_->initiateMultipartUpload(bucket, key);
  if (!initiated.success) {
    SHUTTLE_LOG_ERROR(
      "initiate failed" << logging::kv("key", key) << logging::kv("code", initiated.error_code)
                        << logging::kv("error", initiated.error_message)
    );
    return terminate_with(
      UploadErrorCode::InitiateFailed, "initiate multipart upload failed: " + initiated.error_message
    );
  }

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    upload_id_ = initiated.value;
  }
  transition_to(UploadState::INITIATED);

  SHUTTLE_LOG_SCOPED_UPLOAD(initiated.value, key);
  SHUTTLE_LOG_INFO(
    "multipart upload initiated" << logging::kv("bucket", bucket)
                                 << logging::kv("parts", plan_.parts.size())
                                 << logging::kv("part_size", plan_.part_size)
                                 << logging::kv("file_size", plan_.file_size)
  );

  if (token_.isCancelled()) {
    return abort(bucket, key, UploadErrorCode::UploadCancelled, "upload cancelled");
  }

  queue_.pushAll(plan_.parts);

  while (true) {
    transition_to(UploadState::PARTS_IN_FLIGHT);
    run_workers(bucket, key);

    if (token_.isCancelled()) {
      return abort(bucket, key, UploadErrorCode::UploadCancelled, "upload cancelled");
    }

    size_t completed;
    std::string first_error;
    {
      std::lock_guard<std::mutex> lock(results_mutex_);
      completed = completed_.size();
      first_error = first_error_;
    }
    const size_t total = plan_.parts.size();

    if (completed == total && first_error.empty()) {
      transition_to(UploadState::ALL_SUCCEEDED);
      return complete(bucket, key, file_size);
    }

    transition_to(UploadState::PARTIAL_FAILURE);
    const size_t failed = total - completed;
    SHUTTLE_LOG_WARN(
      "parts failed" << logging::kv("completed", completed) << logging::kv("total", total)
                     << logging::kv("failed", failed) << logging::kv("error", first_error)
    );

    PartialFailureHandler handler;
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      handler = failure_handler_;
    }
    PartialFailureDecision decision =
      handler ? handler(completed, total, failed) : PartialFailureDecision::ABORT;

    if (token_.isCancelled()) {
      return abort(bucket, key, UploadErrorCode::UploadCancelled, "upload cancelled");
    }

    if (decision == PartialFailureDecision::ABORT) {
      return abort(
        bucket,
        key,
        UploadErrorCode::UploadAborted,
        "upload aborted after " + std::to_string(failed) + " of " + std::to_string(total) +
          " parts failed: " + first_error
      );
    }

    transition_to(UploadState::RETRYING);
    auto retry_parts = failed_parts();
    {
      std::lock_guard<std::mutex> lock(results_mutex_);
      first_error_.clear();
    }
    auto progress = this->progress_;
    for (const auto& part : retry_parts) {
      progress->resetPart(part.part_number);
    }
    queue_.clear();
    queue_.pushAll(retry_parts);
    SHUTTLE_LOG_INFO("retrying failed parts" << logging::kv("parts", retry_parts.size()));
  }
}

void UploadCoordinator::run_workers(const std::string& bucket, const std::string& key) {
  PartTarget target;
  target.bucket = bucket;
  target.key = key;
  target.upload_id = upload_id();
  target.presign_ttl = config_.presign_ttl;

  size_t worker_count =
    std::min(static_cast<size_t>(std::max(config_.concurrency, 1)), queue_.size());

  std::vector<std::thread> workers;
  workers.reserve(worker_count);
  for (size_t i = 0; i < worker_count; ++i) {
    workers.emplace_back([this, &target] { worker_loop(target); });
  }
  for (auto& worker : workers) {
    worker.join();
  }
}

void UploadCoordinator::worker_loop(const PartTarget& target) {
  SHUTTLE_LOG_SCOPED_UPLOAD(target.upload_id, target.key);

  RetryingPartUploader uploader(client_, source_, *progress_, token_, retry_, target);

  while (!token_.isCancelled()) {
    auto part = queue_.tryPop();
    if (!part) {
      break;
    }

    auto result = uploader.upload(*part);

    if (result.success) {
      std::lock_guard<std::mutex> lock(results_mutex_);
      if (accepting_results_ && !token_.isCancelled()) {
        completed_[result.part.part_number] = result.part;
      }
    } else if (result.error_code == UploadErrorCode::Cancelled) {
      break;
    } else {
      std::lock_guard<std::mutex> lock(results_mutex_);
      if (first_error_.empty()) {
        first_error_ = result.error_message;
      }
      // Stop pulling; the remaining workers keep draining the queue
      break;
    }

    SHUTTLE_LOG_PROGRESS(
      2.0, "progress" << logging::kv("percent", progress_->snapshot().percentage)
    );
  }
}

UploadOutcome UploadCoordinator::complete(
  const std::string& bucket, const std::string& key, uint64_t file_size
) {
  transition_to(UploadState::COMPLETING);

  std::vector<PartResult> parts;
  {
    std::lock_guard<std::mutex> lock(results_mutex_);
    parts.reserve(completed_.size());
    for (const auto& entry : completed_) {
      parts.push_back(entry.second);
    }
  }
  std::sort(parts.begin(), parts.end(), [](const PartResult& a, const PartResult& b) {
    return a.part_number < b.part_number;
  });

  const std::string id = upload_id();
  auto result = store_->completeMultipartUpload(bucket, key, id, parts);
  transition_to(UploadState::TERMINATED);

  if (!result.success) {
    SHUTTLE_LOG_ERROR(
      "complete failed" << logging::kv("code", result.error_code)
                        << logging::kv("error", result.error_message)
    );
    UploadOutcome outcome = UploadOutcome::Failure(
      UploadErrorCode::CompletionFailed,
      "complete multipart upload failed: " + result.error_message + "; upload id " + id +
        " is orphaned and must be aborted manually"
    );
    outcome.object_key = key;
    outcome.upload_id = id;
    outcome.multipart = true;
    return outcome;
  }

  SHUTTLE_LOG_INFO("multipart upload complete" << logging::kv("parts", parts.size()));

  UploadOutcome outcome;
  outcome.success = true;
  outcome.object_key = key;
  outcome.etag = result.value;
  outcome.upload_id = id;
  outcome.bytes = file_size;
  outcome.multipart = true;
  return outcome;
}

UploadOutcome UploadCoordinator::abort(
  const std::string& bucket, const std::string& key, UploadErrorCode code,
  const std::string& message
) {
  transition_to(UploadState::ABORTING);

  const std::string id = upload_id();
  if (!abort_sent_) {
    abort_sent_ = true;
    auto result = store_->abortMultipartUpload(bucket, key, id);
    if (!result.success) {
      // Best effort; the session may linger on the store until lifecycle cleanup
      SHUTTLE_LOG_WARN(
        errorCodeToString(UploadErrorCode::AbortFailed)
        << logging::kv("upload_id", id) << logging::kv("error", result.error_message)
      );
    } else {
      SHUTTLE_LOG_INFO("multipart upload aborted" << logging::kv("reason", errorCodeToString(code)));
    }
  }

  transition_to(UploadState::TERMINATED);

  UploadOutcome outcome = UploadOutcome::Failure(code, message);
  outcome.object_key = key;
  outcome.upload_id = id;
  outcome.multipart = true;
  return outcome;
}

UploadOutcome UploadCoordinator::terminate_with(UploadErrorCode code, const std::string& message) {
  transition_to(UploadState::TERMINATED);
  return UploadOutcome::Failure(code, message);
}

std::vector<Part> UploadCoordinator::failed_parts() const {
  std::lock_guard<std::mutex> lock(results_mutex_);
  std::vector<Part> failed;
  for (const auto& part : plan_.parts) {
    if (completed_.find(part.part_number) == completed_.end()) {
      failed.push_back(part);
    }
  }
  return failed;
}

}  // namespace uploader
}  // namespace shuttle
