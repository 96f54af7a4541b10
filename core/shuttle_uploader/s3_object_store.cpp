// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "s3_object_store.hpp"

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/auth/AWSCredentialsProvider.h>
#include <aws/core/auth/signer/AWSAuthV4Signer.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/client/DefaultRetryStrategy.h>
#include <aws/core/http/URI.h>
#include <aws/core/http/standard/StandardHttpRequest.h>
#include <aws/core/utils/memory/stl/AWSStringStream.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/S3Errors.h>
#include <aws/s3/model/AbortMultipartUploadRequest.h>
#include <aws/s3/model/BucketLocationConstraint.h>
#include <aws/s3/model/CompleteMultipartUploadRequest.h>
#include <aws/s3/model/CompletedMultipartUpload.h>
#include <aws/s3/model/CompletedPart.h>
#include <aws/s3/model/CreateBucketConfiguration.h>
#include <aws/s3/model/CreateBucketRequest.h>
#include <aws/s3/model/CreateMultipartUploadRequest.h>
#include <aws/s3/model/HeadBucketRequest.h>
#include <aws/s3/model/PutObjectRequest.h>

#include <cstdlib>
#include <mutex>

#include "retry_handler.hpp"

#define SHUTTLE_LOG_COMPONENT "s3_store"
#include <shuttle_log_macros.hpp>

namespace shuttle {
namespace uploader {

namespace {

constexpr const char* kAllocationTag = "ShuttleS3";

template<typename OutcomeError>
StoreResult failure_from(const OutcomeError& error, const std::string& what) {
  std::string code = error.GetExceptionName();
  std::string message = error.GetMessage();
  if (message.empty()) {
    message = what + " failed (HTTP " +
              std::to_string(static_cast<int>(error.GetResponseCode())) + ")";
  }
  bool retryable = RetryHandler::isRetryableError(code) || error.ShouldRetry();
  return StoreResult::Failure(message, code, retryable);
}

}  // namespace

// =============================================================================
// AWS SDK Lifecycle Management
// =============================================================================
// Aws::InitAPI/ShutdownAPI must bracket every SDK object. Stores share one
// reference-counted initialization.
// =============================================================================

class AwsSdkManager {
public:
  static AwsSdkManager& instance() {
    static AwsSdkManager instance;
    return instance;
  }

  void addRef() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
      Aws::SDKOptions options;
      options.loggingOptions.logLevel = Aws::Utils::Logging::LogLevel::Off;
      Aws::InitAPI(options);
      options_ = options;
      initialized_ = true;
    }
    ++ref_count_;
  }

  void release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ref_count_ > 0) {
      --ref_count_;
      if (ref_count_ == 0 && initialized_) {
        Aws::ShutdownAPI(options_);
        initialized_ = false;
      }
    }
  }

private:
  AwsSdkManager() = default;
  ~AwsSdkManager() = default;

  std::mutex mutex_;
  bool initialized_ = false;
  int ref_count_ = 0;
  Aws::SDKOptions options_;
};

// =============================================================================
// S3ObjectStore Implementation
// =============================================================================

class S3ObjectStore::Impl {
public:
  S3Config config;
  std::string endpoint;
  bool virtual_addressing = false;
  std::shared_ptr<Aws::Auth::AWSCredentialsProvider> credentials;
  std::shared_ptr<Aws::S3::S3Client> client;
  std::unique_ptr<Aws::Client::AWSAuthV4Signer> signer;

  Impl() {
    AwsSdkManager::instance().addRef();
  }

  ~Impl() {
    // SDK objects must go before release(), which may call Aws::ShutdownAPI()
    signer.reset();
    client.reset();
    credentials.reset();
    AwsSdkManager::instance().release();
  }

  void initClient() {
    Aws::Client::ClientConfiguration client_config;
    client_config.region = config.region;

    if (!config.endpoint_url.empty()) {
      client_config.endpointOverride = endpoint;
    }

    client_config.verifySSL = config.verify_ssl;
    client_config.scheme = config.use_ssl ? Aws::Http::Scheme::HTTPS : Aws::Http::Scheme::HTTP;
    client_config.connectTimeoutMs = config.connect_timeout_ms;
    client_config.requestTimeoutMs = config.request_timeout_ms;
    client_config.retryStrategy =
      Aws::MakeShared<Aws::Client::DefaultRetryStrategy>(kAllocationTag, config.max_sdk_retries);

    credentials = Aws::MakeShared<Aws::Auth::SimpleAWSCredentialsProvider>(
      kAllocationTag, config.access_key.c_str(), config.secret_key.c_str()
    );

    // Path style for custom endpoints (MinIO), virtual-hosted style for AWS S3
    virtual_addressing = config.endpoint_url.empty();

    client = std::make_shared<Aws::S3::S3Client>(
      credentials,
      client_config,
      Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
      virtual_addressing
    );

    signer = std::make_unique<Aws::Client::AWSAuthV4Signer>(
      credentials,
      "s3",
      config.region,
      Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
      false
    );
  }

  Aws::Http::URI objectUri(const std::string& bucket, const std::string& key) const {
    Aws::Http::URI uri;
    if (virtual_addressing) {
      std::string scheme = config.use_ssl ? "https://" : "http://";
      uri = Aws::Http::URI(
        (scheme + bucket + ".s3." + config.region + ".amazonaws.com").c_str()
      );
    } else {
      uri = Aws::Http::URI(endpoint.c_str());
      uri.AddPathSegment(bucket);
    }
    uri.AddPathSegments(key);
    return uri;
  }
};

S3ObjectStore::S3ObjectStore(const S3Config& config)
    : impl_(std::make_unique<Impl>()) {
  impl_->config = config;

  // Load credentials from environment if not provided
  if (impl_->config.access_key.empty()) {
    if (const char* key = std::getenv("AWS_ACCESS_KEY_ID")) {
      impl_->config.access_key = key;
    }
  }
  if (impl_->config.secret_key.empty()) {
    if (const char* key = std::getenv("AWS_SECRET_ACCESS_KEY")) {
      impl_->config.secret_key = key;
    }
  }

  impl_->endpoint = normalizeEndpoint(impl_->config);
  impl_->initClient();

  SHUTTLE_LOG_DEBUG(
    "S3 store ready" << logging::kv("endpoint", impl_->endpoint)
                     << logging::kv("region", impl_->config.region)
                     << logging::kv("path_style", !impl_->virtual_addressing)
  );
}

S3ObjectStore::~S3ObjectStore() = default;

std::string S3ObjectStore::normalizeEndpoint(const S3Config& config) {
  std::string endpoint = config.endpoint_url;
  if (endpoint.empty()) {
    return std::string(config.use_ssl ? "https://" : "http://") + "s3." + config.region +
           ".amazonaws.com";
  }
  while (!endpoint.empty() && endpoint.back() == '/') {
    endpoint.pop_back();
  }
  if (endpoint.rfind("http://", 0) != 0 && endpoint.rfind("https://", 0) != 0) {
    endpoint = (config.use_ssl ? "https://" : "http://") + endpoint;
  }
  return endpoint;
}

const std::string& S3ObjectStore::endpoint() const {
  return impl_->endpoint;
}

bool S3ObjectStore::bucketExists(const std::string& bucket) {
  Aws::S3::Model::HeadBucketRequest request;
  request.SetBucket(bucket);

  auto outcome = impl_->client->HeadBucket(request);
  if (!outcome.IsSuccess()) {
    SHUTTLE_LOG_DEBUG(
      "HeadBucket failed" << logging::kv("bucket", bucket)
                          << logging::kv("code", outcome.GetError().GetExceptionName())
    );
  }
  return outcome.IsSuccess();
}

StoreResult S3ObjectStore::createBucket(const std::string& bucket, const std::string& region) {
  Aws::S3::Model::CreateBucketRequest request;
  request.SetBucket(bucket);

  // us-east-1 must not carry a location constraint
  if (!region.empty() && region != "us-east-1") {
    Aws::S3::Model::CreateBucketConfiguration bucket_config;
    bucket_config.SetLocationConstraint(
      Aws::S3::Model::BucketLocationConstraintMapper::GetBucketLocationConstraintForName(region)
    );
    request.SetCreateBucketConfiguration(bucket_config);
  }

  auto outcome = impl_->client->CreateBucket(request);
  if (!outcome.IsSuccess()) {
    return failure_from(outcome.GetError(), "CreateBucket");
  }
  SHUTTLE_LOG_INFO("created bucket" << logging::kv("bucket", bucket) << logging::kv("region", region));
  return StoreResult::Success();
}

StoreResult S3ObjectStore::initiateMultipartUpload(
  const std::string& bucket, const std::string& key
) {
  Aws::S3::Model::CreateMultipartUploadRequest request;
  request.SetBucket(bucket);
  request.SetKey(key);
  request.SetContentType("application/octet-stream");

  auto outcome = impl_->client->CreateMultipartUpload(request);
  if (!outcome.IsSuccess()) {
    return failure_from(outcome.GetError(), "CreateMultipartUpload");
  }

  std::string upload_id = outcome.GetResult().GetUploadId();
  if (upload_id.empty()) {
    return StoreResult::Failure("store returned an empty upload id", "EmptyUploadId", false);
  }
  return StoreResult::Success(upload_id);
}

StoreResult S3ObjectStore::presignPartUrl(
  const std::string& bucket, const std::string& key, const std::string& upload_id,
  int part_number, std::chrono::seconds ttl
) {
  if (impl_->config.access_key.empty() || impl_->config.secret_key.empty()) {
    return StoreResult::Failure("no credentials configured for presigning", "MissingCredentials");
  }

  Aws::Http::URI uri = impl_->objectUri(bucket, key);
  uri.AddQueryStringParameter("partNumber", std::to_string(part_number).c_str());
  uri.AddQueryStringParameter("uploadId", upload_id.c_str());

  auto request = Aws::MakeShared<Aws::Http::Standard::StandardHttpRequest>(
    kAllocationTag, uri, Aws::Http::HttpMethod::HTTP_PUT
  );
  if (!impl_->signer->PresignRequest(*request, static_cast<long long>(ttl.count()))) {
    return StoreResult::Failure(
      "failed to presign part " + std::to_string(part_number), "PresignFailed"
    );
  }

  return StoreResult::Success(std::string(request->GetURIString().c_str()));
}

StoreResult S3ObjectStore::completeMultipartUpload(
  const std::string& bucket, const std::string& key, const std::string& upload_id,
  const std::vector<PartResult>& parts
) {
  Aws::S3::Model::CompletedMultipartUpload completed;
  for (const auto& part : parts) {
    Aws::S3::Model::CompletedPart completed_part;
    completed_part.SetPartNumber(part.part_number);
    completed_part.SetETag(part.etag);
    completed.AddParts(completed_part);
  }

  Aws::S3::Model::CompleteMultipartUploadRequest request;
  request.SetBucket(bucket);
  request.SetKey(key);
  request.SetUploadId(upload_id);
  request.SetMultipartUpload(completed);

  auto outcome = impl_->client->CompleteMultipartUpload(request);
  if (!outcome.IsSuccess()) {
    return failure_from(outcome.GetError(), "CompleteMultipartUpload");
  }
  return StoreResult::Success(unquoteEtag(outcome.GetResult().GetETag()));
}

StoreResult S3ObjectStore::abortMultipartUpload(
  const std::string& bucket, const std::string& key, const std::string& upload_id
) {
  Aws::S3::Model::AbortMultipartUploadRequest request;
  request.SetBucket(bucket);
  request.SetKey(key);
  request.SetUploadId(upload_id);

  auto outcome = impl_->client->AbortMultipartUpload(request);
  if (!outcome.IsSuccess()) {
    return failure_from(outcome.GetError(), "AbortMultipartUpload");
  }
  return StoreResult::Success();
}

StoreResult S3ObjectStore::putObjectSimple(
  const std::string& bucket, const std::string& key, const std::vector<char>& data
) {
  auto body = Aws::MakeShared<Aws::StringStream>(kAllocationTag);
  body->write(data.data(), static_cast<std::streamsize>(data.size()));

  Aws::S3::Model::PutObjectRequest request;
  request.SetBucket(bucket);
  request.SetKey(key);
  request.SetContentType("application/octet-stream");
  request.SetContentLength(static_cast<long long>(data.size()));
  request.SetBody(body);

  auto outcome = impl_->client->PutObject(request);
  if (!outcome.IsSuccess()) {
    return failure_from(outcome.GetError(), "PutObject");
  }
  return StoreResult::Success(unquoteEtag(outcome.GetResult().GetETag()));
}

}  // namespace uploader
}  // namespace shuttle
