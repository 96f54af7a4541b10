// Copyright (c) 2026 ArcheBase
// Shuttle is licensed under Mulan PSL v2.
// You can use this software according to the terms and conditions of the Mulan PSL v2.
// You may obtain a copy of Mulan PSL v2 at:
//          http://license.coscl.org.cn/MulanPSL2
// THIS SOFTWARE IS PROVIDED ON AN "AS IS" BASIS, WITHOUT WARRANTIES OF ANY KIND,
// EITHER EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO NON-INFRINGEMENT,
// MERCHANTABILITY OR FIT FOR A PARTICULAR PURPOSE.
// See the Mulan PSL v2 for more details.

#ifndef SHUTTLE_LOG_SEVERITY_HPP
#define SHUTTLE_LOG_SEVERITY_HPP

#include <boost/log/expressions/keyword.hpp>

#include <ostream>
#include <string>

namespace shuttle {
namespace logging {

/**
 * Severity levels for shuttle logging.
 */
enum class severity_level { debug = 0, info = 1, warn = 2, error = 3, fatal = 4 };

inline const char* severity_name(severity_level level) {
  switch (level) {
    case severity_level::debug:
      return "DEBUG";
    case severity_level::info:
      return "INFO";
    case severity_level::warn:
      return "WARN";
    case severity_level::error:
      return "ERROR";
    case severity_level::fatal:
      return "FATAL";
  }
  return "UNKNOWN";
}

inline std::ostream& operator<<(std::ostream& strm, severity_level level) {
  return strm << severity_name(level);
}

// Boost.Log keywords used by filters and formatters
BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)
BOOST_LOG_ATTRIBUTE_KEYWORD(upload_id_attr, "UploadID", std::string)
BOOST_LOG_ATTRIBUTE_KEYWORD(object_key_attr, "ObjectKey", std::string)

// Channel of the periodic transfer-progress records
constexpr const char* kProgressChannel = "progress";

}  // namespace logging
}  // namespace shuttle

#endif  // SHUTTLE_LOG_SEVERITY_HPP
