// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SHUTTLE_FILE_UPLOADER_HPP
#define SHUTTLE_FILE_UPLOADER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "object_store.hpp"
#include "presigned_put_client.hpp"
#include "progress_aggregator.hpp"
#include "retry_handler.hpp"
#include "upload_coordinator.hpp"
#include "upload_result.hpp"
#include "uploader_interfaces.hpp"

namespace shuttle {
namespace uploader {

/**
 * Upload settings for one FileUploader
 */
struct FileUploaderConfig {
  // Region used when the target bucket has to be created
  std::string region = "us-east-1";

  // Base of the public object URL; empty disables public URLs
  std::string public_url_base;

  uint64_t part_size = kMinPartSize;
  int concurrency = 4;
  int max_retries = 3;
  uint64_t max_file_size = 1024ULL * 1024 * 1024;

  RetryConfig retry;
  std::chrono::seconds presign_ttl{3600};
};

/**
 * Object key for a local file: "prefix/basename", or the base name alone when
 * the prefix is empty. Surrounding slashes of the prefix are dropped.
 */
std::string buildObjectKey(const std::string& prefix, const std::string& local_path);

/**
 * Public URL of an object, or "" when `base` is empty.
 * The bucket is omitted when the base already names it.
 */
std::string buildPublicUrl(
  const std::string& base, const std::string& bucket, const std::string& object_key
);

/**
 * Uploads one local file to an S3-compatible store.
 *
 * Files smaller than the part size go through a single PUT; everything else
 * is a multipart session driven by UploadCoordinator.
 *
 * Usage:
 *   auto store = std::make_shared<S3ObjectStore>(s3_config);
 *   auto client = std::make_shared<PresignedPutClient>(store, http_config);
 *   FileUploader uploader(store, client, config);
 *   auto outcome = uploader.upload("/data/video.mp4", "uploads", "2026/10");
 *
 * Thread Safety:
 * - upload() runs on one thread at a time
 * - cancel() and progress() may be called from any thread
 */
class FileUploader {
public:
  FileUploader(
    std::shared_ptr<IObjectStore> store, std::shared_ptr<IPresignedPutClient> client,
    const FileUploaderConfig& config, std::shared_ptr<IFileSystem> filesystem = nullptr
  );
  ~FileUploader();

  // Non-copyable
  FileUploader(const FileUploader&) = delete;
  FileUploader& operator=(const FileUploader&) = delete;

  UploadOutcome upload(
    const std::string& local_path, const std::string& bucket, const std::string& prefix = ""
  );

  /**
   * Cancel the running upload, or the next one if none has started yet.
   */
  void cancel();

  bool is_cancelled() const {
    return cancelled_.load();
  }

  ProgressSnapshot progress() const;

  /**
   * Forwarded to every multipart session started by upload()
   */
  void set_partial_failure_handler(PartialFailureHandler handler);
  void register_transition_callback(UploadStateCallback callback);

  const FileUploaderConfig& config() const {
    return config_;
  }

private:
  UploadOutcome validateConfig() const;
  UploadOutcome ensureBucket(const std::string& bucket);
  UploadOutcome uploadSimple(
    IPartSource& source, const std::string& bucket, const std::string& key, uint64_t file_size
  );
  UploadOutcome uploadMultipart(
    std::shared_ptr<IPartSource> source, const std::string& bucket, const std::string& key,
    uint64_t file_size
  );

  std::shared_ptr<IObjectStore> store_;
  std::shared_ptr<IPresignedPutClient> client_;
  FileUploaderConfig config_;
  std::shared_ptr<IFileSystem> filesystem_;

  std::atomic<bool> cancelled_{false};

  mutable std::mutex mutex_;
  std::shared_ptr<UploadCoordinator> coordinator_;
  std::shared_ptr<ProgressAggregator> simple_progress_;
  PartialFailureHandler failure_handler_;
  std::vector<UploadStateCallback> transition_callbacks_;
};

}  // namespace uploader
}  // namespace shuttle

#endif  // SHUTTLE_FILE_UPLOADER_HPP
