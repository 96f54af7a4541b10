// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SHUTTLE_PRESIGNED_PUT_CLIENT_HPP
#define SHUTTLE_PRESIGNED_PUT_CLIENT_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "cancellation_token.hpp"
#include "object_store.hpp"
#include "upload_result.hpp"

namespace shuttle {
namespace uploader {

/**
 * Cumulative bytes of the current part written to the socket
 */
using PartProgressCallback = std::function<void(uint64_t transferred_bytes)>;

/**
 * HTTP settings for part PUTs
 */
struct HttpClientConfig {
  std::chrono::milliseconds connect_timeout{10000};
  std::chrono::milliseconds request_timeout{300000};
  bool verify_ssl = true;
  size_t chunk_size = 64 * 1024;  // progress granularity
};

struct PresignResult {
  bool success;
  std::string url;
  UploadErrorCode error_code;
  std::string error_message;

  static PresignResult Success(const std::string& url) {
    return {true, url, UploadErrorCode::None, ""};
  }

  static PresignResult Failure(const std::string& message) {
    return {false, "", UploadErrorCode::SigningError, message};
  }
};

/**
 * Components of an http(s) URL
 */
struct ParsedUrl {
  bool use_ssl = false;
  std::string host;
  std::string port;
  std::string target;  // path and query, "/" when absent

  /**
   * Value for the Host header; the port is kept when it is not the scheme default
   */
  std::string hostHeader() const;
};

/**
 * Obtains pre-signed part URLs and PUTs byte ranges against them
 */
class IPresignedPutClient {
public:
  virtual ~IPresignedPutClient() = default;

  /**
   * Pre-signed PUT URL for (bucket, key, upload_id, part_number)
   * Fails with SigningError.
   */
  virtual PresignResult presign(
    const std::string& bucket, const std::string& key, const std::string& upload_id,
    int part_number, std::chrono::seconds ttl
  ) = 0;

  /**
   * One HTTP PUT of `size` bytes
   *
   * Fails with HttpError (non-2xx), NetworkError (connect, timeout, reset)
   * or Cancelled (token set or connection force-closed by cancel).
   */
  virtual PutResult putRange(
    const std::string& url, const char* data, size_t size, const PartProgressCallback& progress,
    CancellationToken& token
  ) = 0;
};

/**
 * IPresignedPutClient using the store for signing and Boost.Beast for the PUT
 *
 * Each putRange() runs on its own io_context, so calls from different worker
 * threads are independent. The connection is registered with the token for
 * the duration of the call; cancel() closes it from the cancelling thread.
 */
class PresignedPutClient : public IPresignedPutClient {
public:
  explicit PresignedPutClient(
    std::shared_ptr<IObjectStore> store, const HttpClientConfig& config = HttpClientConfig()
  );

  PresignResult presign(
    const std::string& bucket, const std::string& key, const std::string& upload_id,
    int part_number, std::chrono::seconds ttl
  ) override;

  PutResult putRange(
    const std::string& url, const char* data, size_t size, const PartProgressCallback& progress,
    CancellationToken& token
  ) override;

  /**
   * Parse http(s)://host(:port)/path?query
   * @return false for anything else
   */
  static bool parse_url(const std::string& url, ParsedUrl& out);

  const HttpClientConfig& config() const {
    return config_;
  }

private:
  std::shared_ptr<IObjectStore> store_;
  HttpClientConfig config_;
};

}  // namespace uploader
}  // namespace shuttle

#endif  // SHUTTLE_PRESIGNED_PUT_CLIENT_HPP
