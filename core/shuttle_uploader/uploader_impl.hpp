// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SHUTTLE_UPLOADER_IMPL_HPP
#define SHUTTLE_UPLOADER_IMPL_HPP

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <memory>

#include "uploader_interfaces.hpp"

namespace shuttle {
namespace uploader {

/**
 * pread(2) on a descriptor owned by this object
 */
class PosixRandomAccessFile : public IRandomAccessFile {
public:
  explicit PosixRandomAccessFile(int fd)
      : fd_(fd) {}

  ~PosixRandomAccessFile() override {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  PosixRandomAccessFile(const PosixRandomAccessFile&) = delete;
  PosixRandomAccessFile& operator=(const PosixRandomAccessFile&) = delete;

  int64_t read_at(
    uint64_t offset, char* buffer, size_t size, std::string& error_message
  ) override {
    size_t total = 0;
    while (total < size) {
      ssize_t n = ::pread(fd_, buffer + total, size - total, static_cast<off_t>(offset + total));
      if (n < 0) {
        if (errno == EINTR) {
          continue;
        }
        error_message = "read at offset " + std::to_string(offset + total) +
                        " failed: " + std::strerror(errno);
        return -1;
      }
      if (n == 0) {
        break;
      }
      total += static_cast<size_t>(n);
    }
    return static_cast<int64_t>(total);
  }

private:
  int fd_;
};

/**
 * Default IFileSystem over std::filesystem and open(2)
 */
class FileSystemImpl : public IFileSystem {
public:
  LocalFileInfo stat(const std::string& path) const override {
    LocalFileInfo info;
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(status)) {
      return info;
    }
    info.exists = true;
    info.regular = std::filesystem::is_regular_file(status);
    if (info.regular) {
      auto size = std::filesystem::file_size(path, ec);
      info.size = ec ? 0 : static_cast<uint64_t>(size);
    }
    return info;
  }

  std::unique_ptr<IRandomAccessFile> open_for_read(
    const std::string& path, std::string& error_message
  ) override {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
      error_message = "cannot open " + path + ": " + std::strerror(errno);
      return nullptr;
    }
    return std::make_unique<PosixRandomAccessFile>(fd);
  }
};

}  // namespace uploader
}  // namespace shuttle

#endif  // SHUTTLE_UPLOADER_IMPL_HPP
