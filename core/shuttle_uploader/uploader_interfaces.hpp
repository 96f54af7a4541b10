// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SHUTTLE_UPLOADER_INTERFACES_HPP
#define SHUTTLE_UPLOADER_INTERFACES_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace shuttle {
namespace uploader {

/**
 * What upload() needs to know about the local path before planning parts
 */
struct LocalFileInfo {
  bool exists = false;
  bool regular = false;
  uint64_t size = 0;
};

/**
 * An open file read by offset. There is no shared file position, so all
 * workers of one upload read through the same handle.
 */
class IRandomAccessFile {
public:
  virtual ~IRandomAccessFile() = default;

  /**
   * Read up to `size` bytes starting at `offset`.
   *
   * @return Bytes read, fewer than `size` only at end of file; -1 on an I/O
   *         error with `error_message` set
   */
  virtual int64_t read_at(
    uint64_t offset, char* buffer, size_t size, std::string& error_message
  ) = 0;
};

/**
 * Local filesystem seam; tests substitute MockFileSystem
 */
class IFileSystem {
public:
  virtual ~IFileSystem() = default;

  virtual LocalFileInfo stat(const std::string& path) const = 0;

  /**
   * @return nullptr with `error_message` set when the file cannot be opened
   */
  virtual std::unique_ptr<IRandomAccessFile> open_for_read(
    const std::string& path, std::string& error_message
  ) = 0;
};

}  // namespace uploader
}  // namespace shuttle

#endif  // SHUTTLE_UPLOADER_INTERFACES_HPP
