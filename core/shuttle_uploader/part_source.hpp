// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SHUTTLE_PART_SOURCE_HPP
#define SHUTTLE_PART_SOURCE_HPP

#include <memory>
#include <string>
#include <vector>

#include "part_planner.hpp"
#include "uploader_interfaces.hpp"

namespace shuttle {
namespace uploader {

/**
 * Supplies the bytes of one part
 */
class IPartSource {
public:
  virtual ~IPartSource() = default;

  /**
   * Fill `buffer` with exactly part.size() bytes.
   *
   * @return false with `error_message` set when the range cannot be read
   */
  virtual bool readPart(const Part& part, std::vector<char>& buffer, std::string& error_message) = 0;
};

/**
 * Reads part ranges from one open local file. The handle reads by offset, so
 * concurrent workers share it.
 */
class FilePartSource : public IPartSource {
public:
  FilePartSource(const std::string& path, std::shared_ptr<IRandomAccessFile> file);

  bool readPart(const Part& part, std::vector<char>& buffer, std::string& error_message) override;

  const std::string& path() const {
    return path_;
  }

private:
  std::string path_;
  std::shared_ptr<IRandomAccessFile> file_;
};

}  // namespace uploader
}  // namespace shuttle

#endif  // SHUTTLE_PART_SOURCE_HPP
