// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for RetryingPartUploader using GoogleMock
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "retrying_part_uploader.hpp"
#include "test_helpers.hpp"
#include "uploader_mocks.hpp"

using namespace shuttle::uploader;
using namespace shuttle::uploader::test;
using ::testing::_;
using ::testing::InSequence;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;

class RetryingPartUploaderTest : public ::testing::Test {
protected:
  void SetUp() override {
    client_ = std::make_shared<NiceMock<MockPresignedPutClient>>();
    source_ = std::make_shared<ZeroPartSource>();

    RetryConfig config;
    config.base_delay = std::chrono::milliseconds(1);
    config.max_delay = std::chrono::milliseconds(5);
    retry_ = RetryHandler(config);

    target_.bucket = "bucket";
    target_.key = "key";
    target_.upload_id = "upload-1";

    ON_CALL(*client_, presign(_, _, _, _, _))
      .WillByDefault(Invoke([](const std::string&, const std::string&, const std::string&,
                               int part_number, std::chrono::seconds) {
        return PresignResult::Success(fakePartUrl(part_number));
      }));
  }

  // The retry budget comes from the handler, so set it before constructing
  RetryingPartUploader makeUploader(
    int max_retries, std::shared_ptr<IPartSource> source = nullptr
  ) {
    RetryConfig config = retry_.config();
    config.max_retries = max_retries;
    retry_ = RetryHandler(config);
    return RetryingPartUploader(
      client_, source ? source : source_, progress_, token_, retry_, target_
    );
  }

  std::shared_ptr<NiceMock<MockPresignedPutClient>> client_;
  std::shared_ptr<IPartSource> source_;
  ProgressAggregator progress_{3000, 3};
  CancellationToken token_;
  RetryHandler retry_;
  PartTarget target_;
  Part part_{2, 1000, 2000};
};

TEST_F(RetryingPartUploaderTest, SuccessOnFirstAttempt) {
  EXPECT_CALL(*client_, presign("bucket", "key", "upload-1", 2, _)).Times(1);
  EXPECT_CALL(*client_, putRange(fakePartUrl(2), _, 1000, _, _)).WillOnce(Invoke(succeedPut));

  auto uploader = makeUploader(3);
  auto result = uploader.upload(part_);

  ASSERT_TRUE(result.success) << result.error_message;
  EXPECT_EQ(result.part.part_number, 2);
  EXPECT_EQ(result.part.etag, fakeEtag(2));
  EXPECT_EQ(result.attempts, 1);
  EXPECT_EQ(progress_.snapshot().transferred_bytes, 1000u);
}

TEST_F(RetryingPartUploaderTest, RetriesTransientFailure) {
  {
    InSequence seq;
    EXPECT_CALL(*client_, putRange(_, _, _, _, _))
      .WillOnce(Return(PutResult::Failure(UploadErrorCode::NetworkError, "connection reset")));
    EXPECT_CALL(*client_, putRange(_, _, _, _, _))
      .WillOnce(Return(PutResult::Failure(UploadErrorCode::HttpError, "HTTP 503", 503)));
    EXPECT_CALL(*client_, putRange(_, _, _, _, _)).WillOnce(Invoke(succeedPut));
  }
  // A fresh URL is requested for every attempt
  EXPECT_CALL(*client_, presign(_, _, _, 2, _)).Times(3);

  auto uploader = makeUploader(3);
  auto result = uploader.upload(part_);

  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.attempts, 3);
}

TEST_F(RetryingPartUploaderTest, FailsAfterMaxRetries) {
  EXPECT_CALL(*client_, putRange(_, _, _, _, _))
    .Times(3)
    .WillRepeatedly(Return(PutResult::Failure(UploadErrorCode::HttpError, "HTTP 500", 500)));

  auto uploader = makeUploader(2);
  auto result = uploader.upload(part_);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error_code, UploadErrorCode::PartUploadFailed);
  EXPECT_EQ(result.attempts, 3);
  EXPECT_EQ(result.part.part_number, 2);
  EXPECT_NE(result.error_message.find("part 2 failed after 3 attempts"), std::string::npos);
  EXPECT_NE(result.error_message.find("HttpError"), std::string::npos);
}

TEST_F(RetryingPartUploaderTest, ZeroRetriesMeansSingleAttempt) {
  EXPECT_CALL(*client_, putRange(_, _, _, _, _))
    .WillOnce(Return(PutResult::Failure(UploadErrorCode::NetworkError, "timeout")));

  auto uploader = makeUploader(0);
  auto result = uploader.upload(part_);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.attempts, 1);
}

TEST_F(RetryingPartUploaderTest, NegativeRetriesMeanSingleAttempt) {
  EXPECT_CALL(*client_, putRange(_, _, _, _, _))
    .WillOnce(Return(PutResult::Failure(UploadErrorCode::NetworkError, "timeout")));

  auto uploader = makeUploader(-2);
  auto result = uploader.upload(part_);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.attempts, retry_.maxAttempts());
  EXPECT_EQ(result.attempts, 1);
}

TEST_F(RetryingPartUploaderTest, ProgressResetBeforeRetry) {
  std::vector<uint64_t> progress_at_attempt_start;
  EXPECT_CALL(*client_, putRange(_, _, _, _, _))
    .WillOnce(Invoke([this, &progress_at_attempt_start](
                       const std::string&, const char*, size_t size,
                       const PartProgressCallback& progress, CancellationToken&
                     ) {
      progress_at_attempt_start.push_back(progress_.snapshot().transferred_bytes);
      progress(size / 2);
      return PutResult::Failure(UploadErrorCode::NetworkError, "connection reset");
    }))
    .WillOnce(Invoke([this, &progress_at_attempt_start](
                       const std::string& url, const char* data, size_t size,
                       const PartProgressCallback& progress, CancellationToken& token
                     ) {
      progress_at_attempt_start.push_back(progress_.snapshot().transferred_bytes);
      return succeedPut(url, data, size, progress, token);
    }));

  auto uploader = makeUploader(1);
  auto result = uploader.upload(part_);

  ASSERT_TRUE(result.success);
  ASSERT_EQ(progress_at_attempt_start.size(), 2u);
  EXPECT_EQ(progress_at_attempt_start[0], 0u);
  EXPECT_EQ(progress_at_attempt_start[1], 0u);
  EXPECT_EQ(progress_.snapshot().transferred_bytes, 1000u);
}

TEST_F(RetryingPartUploaderTest, FailedPartLeavesNoProgress) {
  EXPECT_CALL(*client_, putRange(_, _, _, _, _))
    .WillRepeatedly(Invoke([](const std::string&, const char*, size_t size,
                              const PartProgressCallback& progress, CancellationToken&) {
      progress(size);
      return PutResult::Failure(UploadErrorCode::HttpError, "HTTP 500", 500);
    }));

  auto uploader = makeUploader(1);
  auto result = uploader.upload(part_);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(progress_.snapshot().transferred_bytes, 0u);
}

TEST_F(RetryingPartUploaderTest, SigningErrorIsRetried) {
  EXPECT_CALL(*client_, presign(_, _, _, _, _))
    .WillOnce(Return(PresignResult::Failure("clock skew")))
    .WillOnce(Return(PresignResult::Success(fakePartUrl(2))));
  EXPECT_CALL(*client_, putRange(_, _, _, _, _)).WillOnce(Invoke(succeedPut));

  auto uploader = makeUploader(1);
  auto result = uploader.upload(part_);

  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.attempts, 2);
}

TEST_F(RetryingPartUploaderTest, ReadErrorIsRetried) {
  auto source = std::make_shared<MockPartSource>();
  EXPECT_CALL(*source, readPart(_, _, _))
    .WillOnce(Invoke([](const Part&, std::vector<char>&, std::string& error) {
      error = "short read";
      return false;
    }))
    .WillOnce(Invoke([](const Part& part, std::vector<char>& buffer, std::string&) {
      buffer.assign(static_cast<size_t>(part.size()), 'a');
      return true;
    }));
  EXPECT_CALL(*client_, putRange(_, _, 1000, _, _)).WillOnce(Invoke(succeedPut));

  auto uploader = makeUploader(1, source);
  auto result = uploader.upload(part_);

  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.attempts, 2);
}

TEST_F(RetryingPartUploaderTest, PersistentReadErrorReported) {
  auto source = std::make_shared<MockPartSource>();
  EXPECT_CALL(*source, readPart(_, _, _))
    .Times(2)
    .WillRepeatedly(Invoke([](const Part&, std::vector<char>&, std::string& error) {
      error = "cannot open /data/file.bin";
      return false;
    }));
  EXPECT_CALL(*client_, putRange(_, _, _, _, _)).Times(0);

  auto uploader = makeUploader(1, source);
  auto result = uploader.upload(part_);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error_code, UploadErrorCode::PartUploadFailed);
  EXPECT_NE(result.error_message.find("FileReadError"), std::string::npos);
}

TEST_F(RetryingPartUploaderTest, CancelledBeforeStart) {
  token_.cancel();
  EXPECT_CALL(*client_, presign(_, _, _, _, _)).Times(0);
  EXPECT_CALL(*client_, putRange(_, _, _, _, _)).Times(0);

  auto uploader = makeUploader(3);
  auto result = uploader.upload(part_);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error_code, UploadErrorCode::Cancelled);
  EXPECT_EQ(result.attempts, 0);
}

TEST_F(RetryingPartUploaderTest, CancelledPutIsNotRetried) {
  EXPECT_CALL(*client_, putRange(_, _, _, _, _))
    .WillOnce(Return(PutResult::Failure(UploadErrorCode::Cancelled, "request cancelled")));

  auto uploader = makeUploader(3);
  auto result = uploader.upload(part_);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error_code, UploadErrorCode::Cancelled);
  EXPECT_EQ(result.attempts, 1);
}

TEST_F(RetryingPartUploaderTest, CancelDuringBackoffWakesImmediately) {
  RetryConfig slow;
  slow.base_delay = std::chrono::seconds(30);
  slow.max_delay = std::chrono::seconds(30);
  retry_ = RetryHandler(slow);

  std::thread canceller;
  EXPECT_CALL(*client_, putRange(_, _, _, _, _))
    .WillOnce(Invoke([this, &canceller](const std::string&, const char*, size_t,
                                        const PartProgressCallback&, CancellationToken&) {
      canceller = std::thread([this] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        token_.cancel();
      });
      return PutResult::Failure(UploadErrorCode::NetworkError, "connection reset");
    }));

  auto start = std::chrono::steady_clock::now();
  auto uploader = makeUploader(3);
  auto result = uploader.upload(part_);
  canceller.join();

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error_code, UploadErrorCode::Cancelled);
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
}
