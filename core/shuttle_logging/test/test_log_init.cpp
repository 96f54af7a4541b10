// Copyright (c) 2026 ArcheBase
// Shuttle is licensed under Mulan PSL v2.
// You can use this software according to the terms and conditions of the Mulan PSL v2.
// You may obtain a copy of Mulan PSL v2 at:
//          http://license.coscl.org.cn/MulanPSL2
// THIS SOFTWARE IS PROVIDED ON AN "AS IS" BASIS, WITHOUT WARRANTIES OF ANY KIND,
// EITHER EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO NON-INFRINGEMENT,
// MERCHANTABILITY OR FIT FOR A PARTICULAR PURPOSE.
// See the Mulan PSL v2 for more details.

/**
 * @file test_log_init.cpp
 * @brief Unit tests for logging configuration, env overrides and the log macros
 */

#include <boost/core/null_deleter.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/make_shared.hpp>
#include <gtest/gtest.h>

#include <cstdlib>
#include <stdexcept>
#include <sstream>
#include <string>

#include "shuttle_log_init.hpp"
#include "shuttle_log_macros.hpp"

using namespace shuttle::logging;

namespace {

typedef boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>
  capture_sink_t;

/**
 * Synchronous sink writing message plus context attributes into a string
 * stream so assertions can inspect exactly what was emitted.
 */
class CaptureSink {
public:
  explicit CaptureSink(severity_level min_level = severity_level::debug)
      : stream_(boost::make_shared<std::ostringstream>()) {
    auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
    backend->add_stream(stream_);
    backend->auto_flush(true);

    sink_ = boost::make_shared<capture_sink_t>(backend);
    sink_->set_filter(severity >= min_level);
    sink_->set_formatter([](boost::log::record_view const& rec,
                            boost::log::formatting_ostream& strm) {
      auto sev = boost::log::extract<severity_level>("Severity", rec);
      if (sev) {
        strm << "[" << *sev << "] ";
      }
      strm << rec[boost::log::expressions::smessage];
      auto upload_id = boost::log::extract<std::string>("UploadID", rec);
      if (upload_id) {
        strm << " upload_id=" << *upload_id;
      }
      auto object_key = boost::log::extract<std::string>("ObjectKey", rec);
      if (object_key) {
        strm << " key=" << *object_key;
      }
    });
    boost::log::core::get()->add_sink(sink_);
  }

  ~CaptureSink() {
    boost::log::core::get()->remove_sink(sink_);
  }

  std::string text() const {
    return stream_->str();
  }

private:
  boost::shared_ptr<std::ostringstream> stream_;
  boost::shared_ptr<capture_sink_t> sink_;
};

const char* kEnvVars[] = {
  "SHUTTLE_LOG_LEVEL",
  "SHUTTLE_LOG_CONSOLE_LEVEL",
  "SHUTTLE_LOG_FILE_LEVEL",
  "SHUTTLE_LOG_FILE_DIR",
  "SHUTTLE_LOG_FORMAT",
  "SHUTTLE_LOG_FILE_ENABLED",
  "SHUTTLE_LOG_CONSOLE_ENABLED",
  "SHUTTLE_LOG_CONSOLE_PROGRESS",
};

}  // namespace

// ============================================================================
// Severity Parsing
// ============================================================================

TEST(SeverityParseTest, KnownNames) {
  EXPECT_EQ(parse_severity_level("debug"), severity_level::debug);
  EXPECT_EQ(parse_severity_level("info"), severity_level::info);
  EXPECT_EQ(parse_severity_level("warn"), severity_level::warn);
  EXPECT_EQ(parse_severity_level("warning"), severity_level::warn);
  EXPECT_EQ(parse_severity_level("error"), severity_level::error);
  EXPECT_EQ(parse_severity_level("fatal"), severity_level::fatal);
}

TEST(SeverityParseTest, CaseInsensitive) {
  EXPECT_EQ(parse_severity_level("DEBUG"), severity_level::debug);
  EXPECT_EQ(parse_severity_level("Warning"), severity_level::warn);
}

TEST(SeverityParseTest, UnknownNameIsNullopt) {
  EXPECT_FALSE(parse_severity_level("verbose").has_value());
  EXPECT_FALSE(parse_severity_level("").has_value());
}

TEST(SeverityParseTest, NamesAndColors) {
  EXPECT_STREQ(severity_name(severity_level::warn), "WARN");
  EXPECT_STREQ(severity_name(severity_level::fatal), "FATAL");
  EXPECT_STRNE(severity_color(severity_level::error), severity_color(severity_level::info));
}

// ============================================================================
// Environment Overrides
// ============================================================================

class EnvOverrideTest : public ::testing::Test {
protected:
  void SetUp() override {
    clear_env();
  }

  void TearDown() override {
    clear_env();
  }

  static void clear_env() {
    for (const char* name : kEnvVars) {
      unsetenv(name);
    }
  }
};

TEST_F(EnvOverrideTest, NoEnvKeepsConfig) {
  LoggingConfig config;
  apply_env_overrides(config);

  EXPECT_TRUE(config.console_enabled);
  EXPECT_FALSE(config.file_enabled);
  EXPECT_EQ(config.console_level, severity_level::info);
  EXPECT_EQ(config.file_level, severity_level::debug);
  EXPECT_EQ(config.file_config.directory, "/tmp/shuttle");
}

TEST_F(EnvOverrideTest, GlobalLevelAppliesToBothSinks) {
  setenv("SHUTTLE_LOG_LEVEL", "error", 1);

  LoggingConfig config;
  apply_env_overrides(config);

  EXPECT_EQ(config.console_level, severity_level::error);
  EXPECT_EQ(config.file_level, severity_level::error);
}

TEST_F(EnvOverrideTest, SinkSpecificLevelWinsOverGlobal) {
  setenv("SHUTTLE_LOG_LEVEL", "warn", 1);
  setenv("SHUTTLE_LOG_CONSOLE_LEVEL", "debug", 1);

  LoggingConfig config;
  apply_env_overrides(config);

  EXPECT_EQ(config.console_level, severity_level::debug);
  EXPECT_EQ(config.file_level, severity_level::warn);
}

TEST_F(EnvOverrideTest, InvalidLevelIgnored) {
  setenv("SHUTTLE_LOG_LEVEL", "chatty", 1);

  LoggingConfig config;
  apply_env_overrides(config);

  EXPECT_EQ(config.console_level, severity_level::info);
}

TEST_F(EnvOverrideTest, FileSettings) {
  setenv("SHUTTLE_LOG_FILE_ENABLED", "yes", 1);
  setenv("SHUTTLE_LOG_FILE_DIR", "/tmp/shuttle_env_logs", 1);
  setenv("SHUTTLE_LOG_FORMAT", "JSON", 1);
  setenv("SHUTTLE_LOG_CONSOLE_ENABLED", "false", 1);

  LoggingConfig config;
  apply_env_overrides(config);

  EXPECT_TRUE(config.file_enabled);
  EXPECT_EQ(config.file_config.directory, "/tmp/shuttle_env_logs");
  EXPECT_TRUE(config.file_config.format_json);
  EXPECT_FALSE(config.console_enabled);
}

TEST_F(EnvOverrideTest, ConsoleProgressToggle) {
  setenv("SHUTTLE_LOG_CONSOLE_PROGRESS", "on", 1);

  LoggingConfig config;
  EXPECT_FALSE(config.console_progress);
  apply_env_overrides(config);
  EXPECT_TRUE(config.console_progress);
}

TEST_F(EnvOverrideTest, UnparsableBoolKeepsCurrentValue) {
  setenv("SHUTTLE_LOG_CONSOLE_ENABLED", "maybe", 1);

  LoggingConfig config;
  apply_env_overrides(config);

  EXPECT_TRUE(config.console_enabled);
}

// ============================================================================
// Log Session
// ============================================================================

class LogSessionTest : public EnvOverrideTest {};

TEST_F(LogSessionTest, OpenForItsLifetime) {
  LoggingConfig config;
  config.console_enabled = false;

  EXPECT_FALSE(LogSession::is_open());
  {
    LogSession session(config);
    EXPECT_TRUE(LogSession::is_open());
  }
  EXPECT_FALSE(LogSession::is_open());
}

TEST_F(LogSessionTest, SecondSessionThrows) {
  LoggingConfig config;
  config.console_enabled = false;

  LogSession session(config);
  EXPECT_THROW(LogSession another(config), std::logic_error);
  EXPECT_TRUE(LogSession::is_open());
}

TEST_F(LogSessionTest, AppliesEnvironmentOverrides) {
  setenv("SHUTTLE_LOG_CONSOLE_ENABLED", "false", 1);
  setenv("SHUTTLE_LOG_LEVEL", "warn", 1);

  LoggingConfig config;
  LogSession session(config);

  EXPECT_FALSE(session.config().console_enabled);
  EXPECT_EQ(session.config().console_level, severity_level::warn);
  EXPECT_NO_THROW(session.flush());
}

// ============================================================================
// Console Filter
// ============================================================================

TEST(ConsoleFilterTest, ProgressHiddenByDefault) {
  CaptureSink capture;
  boost::log::core::get()->set_filter(make_console_filter(severity_level::info, false));

  SHUTTLE_LOG_PROGRESS(0.0, "progress" << kv("percent", 40));
  SHUTTLE_LOG_INFO("part 2 uploaded");
  SHUTTLE_LOG_DEBUG("debug detail");

  boost::log::core::get()->reset_filter();

  std::string text = capture.text();
  EXPECT_EQ(text.find("percent=40"), std::string::npos);
  EXPECT_NE(text.find("part 2 uploaded"), std::string::npos);
  EXPECT_EQ(text.find("debug detail"), std::string::npos);
}

TEST(ConsoleFilterTest, ProgressShownWhenEnabled) {
  CaptureSink capture;
  boost::log::core::get()->set_filter(make_console_filter(severity_level::info, true));

  SHUTTLE_LOG_PROGRESS(0.0, "progress" << kv("percent", 75));

  boost::log::core::get()->reset_filter();

  EXPECT_NE(capture.text().find("percent=75"), std::string::npos);
}

TEST(ConsoleFilterTest, ProgressTagEndsWithRecord) {
  CaptureSink capture;
  boost::log::core::get()->set_filter(make_console_filter(severity_level::info, false));

  SHUTTLE_LOG_PROGRESS(0.0, "progress" << kv("percent", 10));
  SHUTTLE_LOG_INFO("after progress");

  boost::log::core::get()->reset_filter();

  EXPECT_NE(capture.text().find("after progress"), std::string::npos);
}

// ============================================================================
// Macros
// ============================================================================

TEST(LogMacroTest, KvFormatting) {
  EXPECT_EQ(kv("part", 3), " part=3");
  EXPECT_EQ(kv("key", std::string("a/b.bin")), " key=\"a/b.bin\"");
  EXPECT_EQ(kv("bucket", "media"), " bucket=\"media\"");
}

TEST(LogMacroTest, MessageCarriesComponentPrefix) {
  CaptureSink capture;

  SHUTTLE_LOG_INFO("planned upload" << kv("parts", 6));

  std::string text = capture.text();
  EXPECT_NE(text.find("[INFO]"), std::string::npos);
  EXPECT_NE(text.find("[shuttle] planned upload parts=6"), std::string::npos);
}

TEST(LogMacroTest, SinkFilterDropsLowerSeverity) {
  CaptureSink capture(severity_level::warn);

  SHUTTLE_LOG_INFO("quiet");
  SHUTTLE_LOG_ERROR("loud");

  std::string text = capture.text();
  EXPECT_EQ(text.find("quiet"), std::string::npos);
  EXPECT_NE(text.find("loud"), std::string::npos);
}

TEST(LogMacroTest, ScopedUploadAttributes) {
  CaptureSink capture;

  {
    SHUTTLE_LOG_SCOPED_UPLOAD("upload-42", "media/video.mp4");
    SHUTTLE_LOG_INFO("inside scope");
  }
  SHUTTLE_LOG_INFO("outside scope");

  std::string text = capture.text();
  EXPECT_NE(text.find("inside scope upload_id=upload-42 key=media/video.mp4"), std::string::npos);

  auto outside = text.find("outside scope");
  ASSERT_NE(outside, std::string::npos);
  EXPECT_EQ(text.find("upload_id", outside), std::string::npos);
}

TEST(LogMacroTest, ThrottleEmitsOncePerInterval) {
  CaptureSink capture;

  for (int i = 0; i < 5; ++i) {
    SHUTTLE_LOG_THROTTLE(warn, 60.0, "throttled warning");
  }

  std::string text = capture.text();
  auto first = text.find("throttled warning");
  ASSERT_NE(first, std::string::npos);
  EXPECT_EQ(text.find("throttled warning", first + 1), std::string::npos);
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
