// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SHUTTLE_UPLOADER_TEST_HELPERS_HPP
#define SHUTTLE_UPLOADER_TEST_HELPERS_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "part_source.hpp"
#include "presigned_put_client.hpp"
#include "upload_result.hpp"

namespace shuttle {
namespace uploader {
namespace test {

namespace fs = std::filesystem;

constexpr uint64_t kMiB = 1024ULL * 1024;

/**
 * Create a temporary directory for testing
 */
inline std::string createTempDir(const std::string& prefix = "shuttle_test_") {
  std::string dir =
    "/tmp/" + prefix + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
  fs::create_directories(dir);
  return dir;
}

/**
 * Generate a test file of specified size. Byte i holds (i % 251) so that
 * every part of a file has distinct content.
 */
inline std::string generateTestFile(const std::string& path, size_t size_bytes) {
  std::ofstream file(path, std::ios::binary);
  if (!file) {
    return "";
  }

  std::vector<char> data(size_bytes);
  for (size_t i = 0; i < size_bytes; ++i) {
    data[i] = static_cast<char>(i % 251);
  }
  file.write(data.data(), static_cast<std::streamsize>(data.size()));
  file.close();

  return path;
}

/**
 * Clean up temporary directory and files
 */
inline void cleanupTempDir(const std::string& dir) {
  std::error_code ec;
  fs::remove_all(dir, ec);
}

/**
 * URL handed out by the mocked presign step; the part number is encoded in
 * the query so putRange() fakes can tell parts apart.
 */
inline std::string fakePartUrl(int part_number) {
  return "http://store.test/bucket/key?partNumber=" + std::to_string(part_number) +
         "&uploadId=upload-1";
}

inline int partNumberFromUrl(const std::string& url) {
  auto pos = url.find("partNumber=");
  if (pos == std::string::npos) {
    return 0;
  }
  return std::stoi(url.substr(pos + 11));
}

inline std::string fakeEtag(int part_number) {
  return "etag-" + std::to_string(part_number);
}

/**
 * Part source that produces part.size() bytes without touching the disk
 */
class ZeroPartSource : public IPartSource {
public:
  bool readPart(const Part& part, std::vector<char>& buffer, std::string&) override {
    buffer.assign(static_cast<size_t>(part.size()), '\0');
    return true;
  }
};

/**
 * Successful PUT: reports progress in two steps, then returns the part's ETag
 */
inline PutResult succeedPut(
  const std::string& url, const char*, size_t size, const PartProgressCallback& progress,
  CancellationToken&
) {
  if (progress) {
    progress(size / 2);
    progress(size);
  }
  return PutResult::Success(200, fakeEtag(partNumberFromUrl(url)));
}

}  // namespace test
}  // namespace uploader
}  // namespace shuttle

#endif  // SHUTTLE_UPLOADER_TEST_HELPERS_HPP
