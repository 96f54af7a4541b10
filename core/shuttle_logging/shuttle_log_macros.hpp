// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SHUTTLE_LOG_MACROS_HPP
#define SHUTTLE_LOG_MACROS_HPP

#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/scoped_attribute.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/utility/unique_identifier_name.hpp>

#include <chrono>
#include <mutex>
#include <sstream>
#include <string>

#include "shuttle_log_severity.hpp"

namespace shuttle {
namespace logging {

typedef boost::log::sources::severity_logger_mt<severity_level> logger_type;

/**
 * Process-wide logger. Defined in shuttle_log_init.cpp.
 */
logger_type& get_logger();

/**
 * Key-value fragment for structured messages.
 * Usage: SHUTTLE_LOG_INFO("part uploaded" << kv("part", n));
 */
template<typename T>
inline std::string kv(const char* name, const T& value) {
  std::ostringstream oss;
  oss << " " << name << "=" << value;
  return oss.str();
}

template<>
inline std::string kv(const char* name, const std::string& value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

inline std::string kv(const char* name, const char* value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

}  // namespace logging
}  // namespace shuttle

// Define SHUTTLE_LOG_COMPONENT before including this header to tag records
// with the emitting component.
#ifndef SHUTTLE_LOG_COMPONENT
#define SHUTTLE_LOG_COMPONENT "shuttle"
#endif

#ifdef NDEBUG
#define SHUTTLE_LOG_ENABLE_DEBUG 0
#else
#define SHUTTLE_LOG_ENABLE_DEBUG 1
#endif

#define SHUTTLE_LOG_SEV(level, msg)                                                  \
  do {                                                                               \
    BOOST_LOG_SEV(::shuttle::logging::get_logger(), ::shuttle::logging::severity_level::level) \
      << "[" << SHUTTLE_LOG_COMPONENT << "] " << msg;                                \
  } while (0)

#define SHUTTLE_LOG_DEBUG(msg)        \
  do {                                \
    if (SHUTTLE_LOG_ENABLE_DEBUG) {   \
      SHUTTLE_LOG_SEV(debug, msg);    \
    }                                 \
  } while (0)

#define SHUTTLE_LOG_INFO(msg) SHUTTLE_LOG_SEV(info, msg)
#define SHUTTLE_LOG_WARN(msg) SHUTTLE_LOG_SEV(warn, msg)
#define SHUTTLE_LOG_ERROR(msg) SHUTTLE_LOG_SEV(error, msg)
#define SHUTTLE_LOG_FATAL(msg) SHUTTLE_LOG_SEV(fatal, msg)

// Tags every record emitted by this thread until the end of the scope with the
// multipart upload id and the target object key.
#define SHUTTLE_LOG_SCOPED_UPLOAD(upload_id_val, object_key_val)                          \
  BOOST_LOG_SCOPED_THREAD_ATTR_INTERNAL(                                                  \
    "UploadID", boost::log::attributes::constant<std::string>(upload_id_val),             \
    BOOST_LOG_UNIQUE_IDENTIFIER_NAME(_shuttle_upload_id_sentry_)                          \
  )                                                                                       \
  BOOST_LOG_SCOPED_THREAD_ATTR_INTERNAL(                                                  \
    "ObjectKey", boost::log::attributes::constant<std::string>(object_key_val),           \
    BOOST_LOG_UNIQUE_IDENTIFIER_NAME(_shuttle_object_key_sentry_)                         \
  )

// At most one record per interval (seconds) for this call site.
#define SHUTTLE_LOG_THROTTLE(level, interval_sec, msg)                                      \
  do {                                                                                      \
    static std::chrono::steady_clock::time_point _shuttle_last_log_time{};                  \
    static bool _shuttle_logged_once = false;                                               \
    static std::mutex _shuttle_throttle_mutex;                                              \
    auto _shuttle_now = std::chrono::steady_clock::now();                                   \
    bool _shuttle_should_log = false;                                                       \
    {                                                                                       \
      std::lock_guard<std::mutex> _shuttle_lock(_shuttle_throttle_mutex);                   \
      if (!_shuttle_logged_once || _shuttle_now - _shuttle_last_log_time >=                 \
                                     std::chrono::duration<double>(interval_sec)) {         \
        _shuttle_last_log_time = _shuttle_now;                                              \
        _shuttle_logged_once = true;                                                        \
        _shuttle_should_log = true;                                                         \
      }                                                                                     \
    }                                                                                       \
    if (_shuttle_should_log) {                                                              \
      SHUTTLE_LOG_SEV(level, msg);                                                          \
    }                                                                                       \
  } while (0)

// Throttled INFO record on the progress channel. Console sinks drop these
// unless LoggingConfig::console_progress is set; file sinks keep them.
#define SHUTTLE_LOG_PROGRESS(interval_sec, msg)                                              \
  do {                                                                                      \
    BOOST_LOG_SCOPED_THREAD_TAG("Channel", std::string(::shuttle::logging::kProgressChannel)); \
    SHUTTLE_LOG_THROTTLE(info, interval_sec, msg);                                          \
  } while (0)

#endif  // SHUTTLE_LOG_MACROS_HPP
