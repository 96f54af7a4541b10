// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "part_source.hpp"

#include <utility>

namespace shuttle {
namespace uploader {

FilePartSource::FilePartSource(const std::string& path, std::shared_ptr<IRandomAccessFile> file)
    : path_(path)
    , file_(std::move(file)) {}

bool FilePartSource::readPart(
  const Part& part, std::vector<char>& buffer, std::string& error_message
) {
  buffer.resize(static_cast<size_t>(part.size()));
  if (buffer.empty()) {
    return true;
  }

  std::string read_error;
  int64_t got = file_->read_at(part.start, buffer.data(), buffer.size(), read_error);
  if (got < 0) {
    error_message = "part " + std::to_string(part.part_number) + " of " + path_ + ": " + read_error;
    return false;
  }
  if (static_cast<uint64_t>(got) != buffer.size()) {
    // The file shrank after it was measured
    error_message = "short read for part " + std::to_string(part.part_number) + ": expected " +
                    std::to_string(buffer.size()) + " bytes, got " + std::to_string(got);
    return false;
  }
  return true;
}

}  // namespace uploader
}  // namespace shuttle
