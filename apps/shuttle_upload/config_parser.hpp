// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SHUTTLE_UPLOAD_CONFIG_PARSER_HPP
#define SHUTTLE_UPLOAD_CONFIG_PARSER_HPP

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <string>

#include "file_uploader.hpp"
#include "presigned_put_client.hpp"
#include "s3_object_store.hpp"

// Forward declaration in global namespace
namespace shuttle {
namespace logging {
struct LoggingConfig;
}
}  // namespace shuttle

namespace shuttle {
namespace upload_app {

/**
 * Store connection plus the target bucket defaults
 */
struct StoreSection {
  uploader::S3Config s3;
  std::string default_bucket;
  std::string public_url_base;
};

/**
 * Upload tuning as written in the YAML file (sizes in MiB, times in ms/s)
 */
struct UploadSection {
  uint64_t part_size_mb = 5;
  int concurrency = 4;
  int max_retries = 3;
  uint64_t max_file_size_mb = 1024;
  int retry_base_delay_ms = 1000;
  int retry_max_delay_ms = 30000;
  int presign_ttl_sec = 3600;
  int connect_timeout_ms = 10000;
  int request_timeout_ms = 300000;
};

/**
 * Logging section as written in the YAML file; levels stay strings until
 * convert_logging_config() maps them.
 */
struct LoggingSection {
  bool console_enabled = true;
  bool console_colors = true;
  std::string console_level = "info";
  bool console_progress = false;

  bool file_enabled = false;
  std::string file_level = "debug";
  std::string file_directory = "/tmp/shuttle";
  std::string file_pattern = "shuttle_%Y%m%d_%H%M%S.log";
  std::string file_format = "text";
  size_t rotation_size_mb = 50;
  size_t max_files = 5;
  bool rotate_at_midnight = false;
};

struct ShuttleConfig {
  StoreSection store;
  UploadSection upload;
  LoggingSection logging;
};

/**
 * Convert LoggingSection to shuttle::logging::LoggingConfig.
 * Unknown level names keep the library defaults.
 */
void convert_logging_config(
  const LoggingSection& yaml_config, ::shuttle::logging::LoggingConfig& log_config
);

/**
 * Map the upload section onto FileUploaderConfig (MiB to bytes, ms/s to durations)
 */
uploader::FileUploaderConfig to_uploader_config(const ShuttleConfig& config);

/**
 * S3 section with the shared connect/request timeouts applied
 */
uploader::S3Config to_s3_config(const ShuttleConfig& config);

/**
 * Timeouts for the part PUT client; the S3 section supplies verify_ssl
 */
uploader::HttpClientConfig to_http_client_config(const ShuttleConfig& config);

class ConfigParser {
public:
  ConfigParser() = default;

  /**
   * Load configuration from YAML file
   */
  bool load_from_file(const std::string& path, ShuttleConfig& config);

  /**
   * Load configuration from YAML string
   */
  bool load_from_string(const std::string& yaml_content, ShuttleConfig& config);

  /**
   * Validate configuration
   */
  static bool validate(const ShuttleConfig& config, std::string& error_msg);

  /**
   * Get last error message
   */
  const std::string& get_last_error() const {
    return last_error_;
  }

private:
  bool parse_s3(const YAML::Node& node, StoreSection& store);
  bool parse_upload(const YAML::Node& node, UploadSection& upload);
  bool parse_logging(const YAML::Node& node, LoggingSection& logging);

  std::string last_error_;
};

}  // namespace upload_app
}  // namespace shuttle

#endif  // SHUTTLE_UPLOAD_CONFIG_PARSER_HPP
