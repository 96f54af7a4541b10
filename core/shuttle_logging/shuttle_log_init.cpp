// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "shuttle_log_init.hpp"

#include <boost/log/attributes/clock.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/core.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

#include "shuttle_log_macros.hpp"

namespace shuttle {
namespace logging {

namespace {

std::atomic<bool> g_session_open(false);

std::string to_lower(const std::string& s) {
  std::string result = s;
  std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
    return std::tolower(c);
  });
  return result;
}

std::optional<bool> parse_bool(const std::string& s) {
  std::string lower = to_lower(s);
  if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
    return true;
  }
  if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
    return false;
  }
  return std::nullopt;
}

struct EnvOverride {
  const char* name;
  void (*apply)(const std::string& value, LoggingConfig& config);
};

// Order matters: the global level goes first so per-sink levels win.
const EnvOverride kEnvOverrides[] = {
  {"SHUTTLE_LOG_LEVEL",
   [](const std::string& value, LoggingConfig& config) {
     if (auto level = parse_severity_level(value)) {
       config.console_level = *level;
       config.file_level = *level;
     }
   }},
  {"SHUTTLE_LOG_CONSOLE_LEVEL",
   [](const std::string& value, LoggingConfig& config) {
     if (auto level = parse_severity_level(value)) {
       config.console_level = *level;
     }
   }},
  {"SHUTTLE_LOG_CONSOLE_ENABLED",
   [](const std::string& value, LoggingConfig& config) {
     config.console_enabled = parse_bool(value).value_or(config.console_enabled);
   }},
  {"SHUTTLE_LOG_CONSOLE_PROGRESS",
   [](const std::string& value, LoggingConfig& config) {
     config.console_progress = parse_bool(value).value_or(config.console_progress);
   }},
  {"SHUTTLE_LOG_FILE_LEVEL",
   [](const std::string& value, LoggingConfig& config) {
     if (auto level = parse_severity_level(value)) {
       config.file_level = *level;
     }
   }},
  {"SHUTTLE_LOG_FILE_ENABLED",
   [](const std::string& value, LoggingConfig& config) {
     config.file_enabled = parse_bool(value).value_or(config.file_enabled);
   }},
  {"SHUTTLE_LOG_FILE_DIR",
   [](const std::string& value, LoggingConfig& config) {
     config.file_config.directory = value;
   }},
  {"SHUTTLE_LOG_FORMAT",
   [](const std::string& value, LoggingConfig& config) {
     config.file_config.format_json = (to_lower(value) == "json");
   }},
};

}  // namespace

std::optional<severity_level> parse_severity_level(const std::string& level_str) {
  std::string lower = to_lower(level_str);

  if (lower == "debug") {
    return severity_level::debug;
  } else if (lower == "info") {
    return severity_level::info;
  } else if (lower == "warn" || lower == "warning") {
    return severity_level::warn;
  } else if (lower == "error") {
    return severity_level::error;
  } else if (lower == "fatal") {
    return severity_level::fatal;
  }
  return std::nullopt;
}

void apply_env_overrides(LoggingConfig& config) {
  for (const auto& entry : kEnvOverrides) {
    const char* value = std::getenv(entry.name);
    if (value && value[0] != '\0') {
      entry.apply(value, config);
    }
  }
}

boost::log::filter make_console_filter(severity_level min_level, bool show_progress) {
  return [min_level, show_progress](const boost::log::attribute_value_set& attrs) {
    auto level = boost::log::extract<severity_level>("Severity", attrs);
    if (!level || *level < min_level) {
      return false;
    }
    if (show_progress) {
      return true;
    }
    auto channel = boost::log::extract<std::string>("Channel", attrs);
    return !channel || *channel != kProgressChannel;
  };
}

logger_type& get_logger() {
  static logger_type instance;
  return instance;
}

LogSession::LogSession(const LoggingConfig& config)
    : config_(config) {
  bool expected = false;
  if (!g_session_open.compare_exchange_strong(expected, true)) {
    throw std::logic_error("a logging session is already open");
  }
  apply_env_overrides(config_);

  auto core = boost::log::core::get();
  core->add_global_attribute("TimeStamp", boost::log::attributes::local_clock());
  core->add_global_attribute("ThreadID", boost::log::attributes::current_thread_id());

  try {
    if (config_.console_enabled) {
      console_sink_ = create_console_sink(config_.console_level, config_.console_colors);
      console_sink_->set_filter(
        make_console_filter(config_.console_level, config_.console_progress)
      );
      core->add_sink(console_sink_);
    }
    if (config_.file_enabled) {
      file_sink_ = create_file_sink(config_.file_config, config_.file_level);
      core->add_sink(file_sink_);
    }
  } catch (...) {
    if (console_sink_) {
      core->remove_sink(console_sink_);
      console_sink_->stop();
    }
    g_session_open.store(false);
    throw;
  }
}

LogSession::~LogSession() {
  auto core = boost::log::core::get();
  // Stop feeding the queues, then drain them
  if (console_sink_) {
    core->remove_sink(console_sink_);
    console_sink_->stop();
    console_sink_->flush();
  }
  if (file_sink_) {
    core->remove_sink(file_sink_);
    file_sink_->stop();
    file_sink_->flush();
  }
  g_session_open.store(false);
}

void LogSession::flush() {
  if (console_sink_) {
    console_sink_->flush();
  }
  if (file_sink_) {
    file_sink_->flush();
  }
}

bool LogSession::is_open() {
  return g_session_open.load();
}

}  // namespace logging
}  // namespace shuttle
