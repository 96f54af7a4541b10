// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SHUTTLE_UPLOAD_RESULT_HPP
#define SHUTTLE_UPLOAD_RESULT_HPP

#include <cstdint>
#include <string>

namespace shuttle {
namespace uploader {

/**
 * Error taxonomy for upload operations
 */
enum class UploadErrorCode {
  None,
  InvalidConfiguration,
  InitiateFailed,
  SigningError,
  NetworkError,
  HttpError,
  PartUploadFailed,
  Cancelled,
  CompletionFailed,
  AbortFailed,
  UploadAborted,
  UploadCancelled,
  BucketUnavailable,
  SimpleUploadFailed,
  FileReadError,
};

inline const char* errorCodeToString(UploadErrorCode code) {
  switch (code) {
    case UploadErrorCode::None:
      return "None";
    case UploadErrorCode::InvalidConfiguration:
      return "InvalidConfiguration";
    case UploadErrorCode::InitiateFailed:
      return "InitiateFailed";
    case UploadErrorCode::SigningError:
      return "SigningError";
    case UploadErrorCode::NetworkError:
      return "NetworkError";
    case UploadErrorCode::HttpError:
      return "HttpError";
    case UploadErrorCode::PartUploadFailed:
      return "PartUploadFailed";
    case UploadErrorCode::Cancelled:
      return "Cancelled";
    case UploadErrorCode::CompletionFailed:
      return "CompletionFailed";
    case UploadErrorCode::AbortFailed:
      return "AbortFailed";
    case UploadErrorCode::UploadAborted:
      return "UploadAborted";
    case UploadErrorCode::UploadCancelled:
      return "UploadCancelled";
    case UploadErrorCode::BucketUnavailable:
      return "BucketUnavailable";
    case UploadErrorCode::SimpleUploadFailed:
      return "SimpleUploadFailed";
    case UploadErrorCode::FileReadError:
      return "FileReadError";
  }
  return "Unknown";
}

/**
 * Stores send ETags quoted ("abc123"); results carry them bare.
 */
inline std::string unquoteEtag(const std::string& etag) {
  if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"') {
    return etag.substr(1, etag.size() - 2);
  }
  return etag;
}

/**
 * ETag of one successfully uploaded part
 */
struct PartResult {
  int part_number = 0;
  std::string etag;
};

/**
 * Result of a store call (initiate, presign, complete, abort, bucket ops)
 *
 * `value` carries the upload id for initiate, the URL for presign and the
 * ETag for a simple put. `error_code` is the store's own code (e.g. "NoSuchBucket").
 */
struct StoreResult {
  bool success;
  std::string value;
  std::string error_message;
  std::string error_code;
  bool is_retryable;

  static StoreResult Success(const std::string& value = "") {
    return {true, value, "", "", false};
  }

  static StoreResult Failure(
    const std::string& message, const std::string& code = "", bool retryable = false
  ) {
    return {false, "", message, code, retryable};
  }
};

/**
 * Result of a single HTTP PUT against a pre-signed URL
 */
struct PutResult {
  bool success;
  int status_code;
  std::string etag;
  UploadErrorCode error_code;
  std::string error_message;

  static PutResult Success(int status, const std::string& etag) {
    return {true, status, etag, UploadErrorCode::None, ""};
  }

  static PutResult Failure(UploadErrorCode code, const std::string& message, int status = 0) {
    return {false, status, "", code, message};
  }
};

/**
 * Result of uploading one part with retries
 */
struct PartUploadResult {
  bool success;
  PartResult part;
  UploadErrorCode error_code;
  std::string error_message;
  int attempts;

  static PartUploadResult Success(const PartResult& part, int attempts) {
    return {true, part, UploadErrorCode::None, "", attempts};
  }

  static PartUploadResult Failure(
    int part_number, UploadErrorCode code, const std::string& message, int attempts
  ) {
    return {false, PartResult{part_number, ""}, code, message, attempts};
  }
};

/**
 * Terminal outcome of an upload session, as seen by the caller
 */
struct UploadOutcome {
  bool success = false;
  UploadErrorCode error_code = UploadErrorCode::None;
  std::string error_message;
  std::string object_key;
  std::string etag;
  std::string upload_id;
  std::string public_url;
  uint64_t bytes = 0;
  bool multipart = false;

  static UploadOutcome Failure(UploadErrorCode code, const std::string& message) {
    UploadOutcome outcome;
    outcome.error_code = code;
    outcome.error_message = message;
    return outcome;
  }
};

}  // namespace uploader
}  // namespace shuttle

#endif  // SHUTTLE_UPLOAD_RESULT_HPP
