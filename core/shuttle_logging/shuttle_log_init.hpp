// Copyright (c) 2026 ArcheBase
// Shuttle is licensed under Mulan PSL v2.
// You can use this software according to the terms and conditions of the Mulan PSL v2.
// You may obtain a copy of Mulan PSL v2 at:
//          http://license.coscl.org.cn/MulanPSL2
// THIS SOFTWARE IS PROVIDED ON AN "AS IS" BASIS, WITHOUT WARRANTIES OF ANY KIND,
// EITHER EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO NON-INFRINGEMENT,
// MERCHANTABILITY OR FIT FOR A PARTICULAR PURPOSE.
// See the Mulan PSL v2 for more details.

#ifndef SHUTTLE_LOG_INIT_HPP
#define SHUTTLE_LOG_INIT_HPP

#include <boost/log/core/core.hpp>
#include <boost/log/expressions/filter.hpp>

#include <optional>
#include <string>

#include "shuttle_console_sink.hpp"
#include "shuttle_file_sink.hpp"
#include "shuttle_log_severity.hpp"

namespace shuttle {
namespace logging {

/**
 * Sink selection for one shuttle run.
 */
struct LoggingConfig {
  bool console_enabled = true;
  bool console_colors = true;
  severity_level console_level = severity_level::info;
  // The CLI draws its own progress line, so progress records stay off the
  // console unless asked for.
  bool console_progress = false;

  bool file_enabled = false;
  FileSinkConfig file_config;
  severity_level file_level = severity_level::debug;
};

/**
 * Parse a level name.
 * Accepts "debug", "info", "warn", "warning", "error", "fatal" (case-insensitive).
 *
 * @return The parsed level, or std::nullopt if the name is unknown
 */
std::optional<severity_level> parse_severity_level(const std::string& level_str);

/**
 * Apply SHUTTLE_LOG_* environment variables on top of a LoggingConfig.
 *
 *   SHUTTLE_LOG_LEVEL            - level of both sinks, applied first
 *   SHUTTLE_LOG_CONSOLE_LEVEL    - console sink level
 *   SHUTTLE_LOG_CONSOLE_ENABLED  - "true" / "false"
 *   SHUTTLE_LOG_CONSOLE_PROGRESS - "true" / "false"
 *   SHUTTLE_LOG_FILE_LEVEL       - file sink level
 *   SHUTTLE_LOG_FILE_ENABLED     - "true" / "false"
 *   SHUTTLE_LOG_FILE_DIR         - log file directory
 *   SHUTTLE_LOG_FORMAT           - file format ("json" or "text")
 *
 * Unparsable values leave the field unchanged.
 */
void apply_env_overrides(LoggingConfig& config);

/**
 * Filter for the console sink: level threshold, and progress-channel
 * records only when show_progress is set.
 */
boost::log::filter make_console_filter(severity_level min_level, bool show_progress);

/**
 * Logging for the lifetime of one upload run.
 *
 * The constructor applies the environment overrides, registers the TimeStamp
 * and ThreadID attributes the sinks print, and attaches the configured sinks.
 * The destructor drains the async queues and detaches the sinks, so records
 * logged while an upload unwinds still reach the file.
 *
 * Only one session may be open at a time.
 */
class LogSession {
public:
  /**
   * @throws std::logic_error if another session is open
   */
  explicit LogSession(const LoggingConfig& config);
  ~LogSession();

  LogSession(const LogSession&) = delete;
  LogSession& operator=(const LogSession&) = delete;

  /**
   * Configuration after environment overrides.
   */
  const LoggingConfig& config() const {
    return config_;
  }

  /**
   * Block until both sinks have written every queued record.
   */
  void flush();

  static bool is_open();

private:
  LoggingConfig config_;
  boost::shared_ptr<async_console_sink_t> console_sink_;
  boost::shared_ptr<async_file_sink_t> file_sink_;
};

}  // namespace logging
}  // namespace shuttle

#endif  // SHUTTLE_LOG_INIT_HPP
