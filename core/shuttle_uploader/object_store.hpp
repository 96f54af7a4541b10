// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SHUTTLE_OBJECT_STORE_HPP
#define SHUTTLE_OBJECT_STORE_HPP

#include <chrono>
#include <string>
#include <vector>

#include "upload_result.hpp"

namespace shuttle {
namespace uploader {

/**
 * Boundary to an S3-compatible object store
 *
 * Implementations must be safe to call from several worker threads at once
 * (presignPartUrl is called concurrently by the part workers).
 */
class IObjectStore {
public:
  virtual ~IObjectStore() = default;

  virtual bool bucketExists(const std::string& bucket) = 0;

  virtual StoreResult createBucket(const std::string& bucket, const std::string& region) = 0;

  /**
   * @return upload id in StoreResult::value
   */
  virtual StoreResult initiateMultipartUpload(
    const std::string& bucket, const std::string& key
  ) = 0;

  /**
   * Pre-signed PUT URL for one part of a multipart upload
   *
   * @return URL in StoreResult::value
   */
  virtual StoreResult presignPartUrl(
    const std::string& bucket, const std::string& key, const std::string& upload_id,
    int part_number, std::chrono::seconds ttl
  ) = 0;

  /**
   * @param parts Uploaded parts sorted ascending by part number
   */
  virtual StoreResult completeMultipartUpload(
    const std::string& bucket, const std::string& key, const std::string& upload_id,
    const std::vector<PartResult>& parts
  ) = 0;

  virtual StoreResult abortMultipartUpload(
    const std::string& bucket, const std::string& key, const std::string& upload_id
  ) = 0;

  /**
   * Single-shot PUT of a whole object
   *
   * @return ETag in StoreResult::value
   */
  virtual StoreResult putObjectSimple(
    const std::string& bucket, const std::string& key, const std::vector<char>& data
  ) = 0;
};

}  // namespace uploader
}  // namespace shuttle

#endif  // SHUTTLE_OBJECT_STORE_HPP
