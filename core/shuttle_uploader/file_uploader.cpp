// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "file_uploader.hpp"

#include <filesystem>
#include <utility>

#include "part_source.hpp"
#include "uploader_impl.hpp"

#define SHUTTLE_LOG_COMPONENT "file_uploader"
#include <shuttle_log_macros.hpp>

namespace fs = std::filesystem;

namespace shuttle {
namespace uploader {

namespace {

std::string trimSlashes(const std::string& value) {
  auto first = value.find_first_not_of('/');
  if (first == std::string::npos) {
    return "";
  }
  auto last = value.find_last_not_of('/');
  return value.substr(first, last - first + 1);
}

}  // namespace

std::string buildObjectKey(const std::string& prefix, const std::string& local_path) {
  std::string name = fs::path(local_path).filename().string();
  std::string trimmed = trimSlashes(prefix);
  return trimmed.empty() ? name : trimmed + "/" + name;
}

std::string buildPublicUrl(
  const std::string& base, const std::string& bucket, const std::string& object_key
) {
  if (base.empty()) {
    return "";
  }
  std::string url = base;
  if (url.back() == '/') {
    url.pop_back();
  }
  if (url.find(bucket) != std::string::npos) {
    return url + "/" + object_key;
  }
  return url + "/" + bucket + "/" + object_key;
}

FileUploader::FileUploader(
  std::shared_ptr<IObjectStore> store, std::shared_ptr<IPresignedPutClient> client,
  const FileUploaderConfig& config, std::shared_ptr<IFileSystem> filesystem
)
    : store_(std::move(store))
    , client_(std::move(client))
    , config_(config)
    , filesystem_(filesystem ? std::move(filesystem) : std::make_shared<FileSystemImpl>()) {}

FileUploader::~FileUploader() = default;

void FileUploader::cancel() {
  cancelled_.store(true);
  std::shared_ptr<UploadCoordinator> coordinator;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    coordinator = coordinator_;
  }
  if (coordinator) {
    coordinator->cancel();
  }
}

ProgressSnapshot FileUploader::progress() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (coordinator_) {
    return coordinator_->progress();
  }
  if (simple_progress_) {
    return simple_progress_->snapshot();
  }
  return ProgressSnapshot{};
}

void FileUploader::set_partial_failure_handler(PartialFailureHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  failure_handler_ = std::move(handler);
}

void FileUploader::register_transition_callback(UploadStateCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  transition_callbacks_.push_back(std::move(callback));
}

UploadOutcome FileUploader::validateConfig() const {
  if (config_.part_size < kMinPartSize || config_.part_size > kMaxPartSize) {
    return UploadOutcome::Failure(
      UploadErrorCode::InvalidConfiguration,
      "part size " + std::to_string(config_.part_size) + " outside [" +
        std::to_string(kMinPartSize) + ", " + std::to_string(kMaxPartSize) + "]"
    );
  }
  if (config_.concurrency < 1) {
    return UploadOutcome::Failure(
      UploadErrorCode::InvalidConfiguration, "concurrency must be at least 1"
    );
  }
  if (config_.max_retries < 0) {
    return UploadOutcome::Failure(
      UploadErrorCode::InvalidConfiguration, "max retries must not be negative"
    );
  }
  if (config_.max_file_size == 0) {
    return UploadOutcome::Failure(
      UploadErrorCode::InvalidConfiguration, "max file size must be greater than 0"
    );
  }

  UploadOutcome ok;
  ok.success = true;
  return ok;
}

UploadOutcome FileUploader::ensureBucket(const std::string& bucket) {
  UploadOutcome ok;
  ok.success = true;

  if (store_->bucketExists(bucket)) {
    return ok;
  }

  SHUTTLE_LOG_INFO(
    "bucket missing, creating" << logging::kv("bucket", bucket)
                               << logging::kv("region", config_.region)
  );
  auto created = store_->createBucket(bucket, config_.region);
  if (!created.success) {
    return UploadOutcome::Failure(
      UploadErrorCode::BucketUnavailable,
      "bucket " + bucket + " does not exist and cannot be created: " + created.error_message
    );
  }
  return ok;
}

UploadOutcome FileUploader::upload(
  const std::string& local_path, const std::string& bucket, const std::string& prefix
) {
  auto valid = validateConfig();
  if (!valid.success) {
    return valid;
  }
  if (bucket.empty()) {
    return UploadOutcome::Failure(UploadErrorCode::InvalidConfiguration, "bucket name is empty");
  }

  const LocalFileInfo info = filesystem_->stat(local_path);
  if (!info.exists || !info.regular) {
    return UploadOutcome::Failure(
      UploadErrorCode::InvalidConfiguration, "file not found: " + local_path
    );
  }
  std::string open_error;
  std::shared_ptr<IRandomAccessFile> file = filesystem_->open_for_read(local_path, open_error);
  if (!file) {
    return UploadOutcome::Failure(
      UploadErrorCode::InvalidConfiguration, "file is not readable: " + open_error
    );
  }

  const uint64_t file_size = info.size;
  if (file_size > config_.max_file_size) {
    return UploadOutcome::Failure(
      UploadErrorCode::InvalidConfiguration,
      "file size " + std::to_string(file_size) + " exceeds the limit of " +
        std::to_string(config_.max_file_size) + " bytes"
    );
  }

  if (cancelled_.load()) {
    return UploadOutcome::Failure(UploadErrorCode::UploadCancelled, "upload cancelled before start");
  }

  auto bucket_ready = ensureBucket(bucket);
  if (!bucket_ready.success) {
    SHUTTLE_LOG_ERROR(bucket_ready.error_message);
    return bucket_ready;
  }

  const std::string key = buildObjectKey(prefix, local_path);
  SHUTTLE_LOG_INFO(
    "upload starting" << logging::kv("file", local_path) << logging::kv("bucket", bucket)
                      << logging::kv("key", key) << logging::kv("size", file_size)
  );

  auto source = std::make_shared<FilePartSource>(local_path, std::move(file));
  UploadOutcome outcome = file_size < config_.part_size
                            ? uploadSimple(*source, bucket, key, file_size)
                            : uploadMultipart(source, bucket, key, file_size);

  if (outcome.success) {
    outcome.public_url = buildPublicUrl(config_.public_url_base, bucket, key);
    SHUTTLE_LOG_INFO(
      "upload complete" << logging::kv("key", key) << logging::kv("etag", outcome.etag)
                        << logging::kv("multipart", outcome.multipart)
    );
  } else {
    SHUTTLE_LOG_ERROR(
      "upload failed" << logging::kv("key", key)
                      << logging::kv("code", errorCodeToString(outcome.error_code))
                      << logging::kv("error", outcome.error_message)
    );
  }
  return outcome;
}

UploadOutcome FileUploader::uploadSimple(
  IPartSource& source, const std::string& bucket, const std::string& key, uint64_t file_size
) {
  auto progress = std::make_shared<ProgressAggregator>(file_size, 1);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    coordinator_.reset();
    simple_progress_ = progress;
  }

  std::vector<char> data;
  std::string error;
  if (!source.readPart(Part{1, 0, file_size}, data, error)) {
    return UploadOutcome::Failure(UploadErrorCode::FileReadError, error);
  }

  if (cancelled_.load()) {
    return UploadOutcome::Failure(UploadErrorCode::UploadCancelled, "upload cancelled");
  }

  auto result = store_->putObjectSimple(bucket, key, data);
  if (!result.success) {
    return UploadOutcome::Failure(
      UploadErrorCode::SimpleUploadFailed, "put object failed: " + result.error_message
    );
  }
  progress->markComplete();

  UploadOutcome outcome;
  outcome.success = true;
  outcome.object_key = key;
  outcome.etag = result.value;
  outcome.bytes = file_size;
  outcome.multipart = false;
  return outcome;
}

UploadOutcome FileUploader::uploadMultipart(
  std::shared_ptr<IPartSource> source, const std::string& bucket, const std::string& key,
  uint64_t file_size
) {
  CoordinatorConfig coordinator_config;
  coordinator_config.part_size = config_.part_size;
  coordinator_config.concurrency = config_.concurrency;
  coordinator_config.max_retries = config_.max_retries;
  coordinator_config.retry = config_.retry;
  coordinator_config.presign_ttl = config_.presign_ttl;

  auto coordinator =
    std::make_shared<UploadCoordinator>(store_, client_, source, coordinator_config);

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failure_handler_) {
      coordinator->set_partial_failure_handler(failure_handler_);
    }
    for (const auto& callback : transition_callbacks_) {
      coordinator->register_transition_callback(callback);
    }
    simple_progress_.reset();
    coordinator_ = coordinator;
  }

  // cancel() may have run between the checks above and publishing the coordinator
  if (cancelled_.load()) {
    coordinator->cancel();
  }

  return coordinator->run(bucket, key, file_size);
}

}  // namespace uploader
}  // namespace shuttle
