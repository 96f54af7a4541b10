// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SHUTTLE_S3_OBJECT_STORE_HPP
#define SHUTTLE_S3_OBJECT_STORE_HPP

#include <memory>
#include <string>

#include "object_store.hpp"

namespace shuttle {
namespace uploader {

/**
 * S3 connection options
 */
struct S3Config {
  std::string endpoint_url;  // e.g. "http://localhost:9000"; empty means AWS S3
  std::string region = "us-east-1";
  bool use_ssl = true;
  bool verify_ssl = true;

  // Credentials (if not using environment variables)
  // If empty, will read from AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY
  std::string access_key;
  std::string secret_key;

  // Timeouts (in milliseconds)
  int connect_timeout_ms = 10000;
  int request_timeout_ms = 300000;

  // SDK-internal retries for control calls (initiate, complete, abort).
  // Part PUTs are retried by RetryingPartUploader instead.
  int max_sdk_retries = 2;
};

/**
 * IObjectStore backed by the AWS SDK for C++
 *
 * Custom endpoints (MinIO, ...) use path-style addressing, AWS S3 uses
 * virtual-hosted style. Part URLs are presigned locally with SigV4; no
 * network round trip is involved.
 */
class S3ObjectStore : public IObjectStore {
public:
  explicit S3ObjectStore(const S3Config& config);
  ~S3ObjectStore() override;

  // Non-copyable, non-movable
  S3ObjectStore(const S3ObjectStore&) = delete;
  S3ObjectStore& operator=(const S3ObjectStore&) = delete;
  S3ObjectStore(S3ObjectStore&&) = delete;
  S3ObjectStore& operator=(S3ObjectStore&&) = delete;

  bool bucketExists(const std::string& bucket) override;

  StoreResult createBucket(const std::string& bucket, const std::string& region) override;

  StoreResult initiateMultipartUpload(const std::string& bucket, const std::string& key) override;

  StoreResult presignPartUrl(
    const std::string& bucket, const std::string& key, const std::string& upload_id,
    int part_number, std::chrono::seconds ttl
  ) override;

  StoreResult completeMultipartUpload(
    const std::string& bucket, const std::string& key, const std::string& upload_id,
    const std::vector<PartResult>& parts
  ) override;

  StoreResult abortMultipartUpload(
    const std::string& bucket, const std::string& key, const std::string& upload_id
  ) override;

  StoreResult putObjectSimple(
    const std::string& bucket, const std::string& key, const std::vector<char>& data
  ) override;

  /**
   * Endpoint with scheme, without trailing slash
   */
  const std::string& endpoint() const;

  /**
   * Normalize a configured endpoint: add the scheme implied by use_ssl when
   * missing and strip trailing slashes. An empty endpoint maps to the AWS
   * regional endpoint.
   */
  static std::string normalizeEndpoint(const S3Config& config);

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace uploader
}  // namespace shuttle

#endif  // SHUTTLE_S3_OBJECT_STORE_HPP
