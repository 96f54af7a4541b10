// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "config_parser.hpp"

#include <chrono>
#include <fstream>

#include "part_planner.hpp"

#include <shuttle_log_init.hpp>

namespace shuttle {
namespace upload_app {

namespace {
constexpr uint64_t kBytesPerMiB = 1024ULL * 1024;
// Largest object S3 accepts
constexpr uint64_t kMaxObjectSizeMiB = 5ULL * 1024 * 1024;
}

// ============================================================================
// ConfigParser Implementation
// ============================================================================

bool ConfigParser::load_from_file(const std::string& path, ShuttleConfig& config) {
  std::ifstream file(path);
  if (!file.good()) {
    last_error_ = "Config file not found or not readable: " + path;
    return false;
  }

  try {
    YAML::Node yaml = YAML::LoadFile(path);
    return load_from_string(YAML::Dump(yaml), config);
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML file: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::load_from_string(const std::string& yaml_content, ShuttleConfig& config) {
  try {
    YAML::Node node = YAML::Load(yaml_content);

    if (node["s3"]) {
      parse_s3(node["s3"], config.store);
    }

    if (node["upload"]) {
      parse_upload(node["upload"], config.upload);
    }

    if (node["logging"]) {
      parse_logging(node["logging"], config.logging);
    }

    return true;
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML content: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::parse_s3(const YAML::Node& node, StoreSection& store) {
  if (node["endpoint_url"]) {
    store.s3.endpoint_url = node["endpoint_url"].as<std::string>();
  }
  if (node["region"]) {
    store.s3.region = node["region"].as<std::string>();
  }
  if (node["use_ssl"]) {
    store.s3.use_ssl = node["use_ssl"].as<bool>();
  }
  if (node["verify_ssl"]) {
    store.s3.verify_ssl = node["verify_ssl"].as<bool>();
  }
  if (node["access_key"]) {
    store.s3.access_key = node["access_key"].as<std::string>();
  }
  if (node["secret_key"]) {
    store.s3.secret_key = node["secret_key"].as<std::string>();
  }
  if (node["default_bucket"]) {
    store.default_bucket = node["default_bucket"].as<std::string>();
  }
  if (node["public_url_base"]) {
    store.public_url_base = node["public_url_base"].as<std::string>();
  }

  return true;
}

bool ConfigParser::parse_upload(const YAML::Node& node, UploadSection& upload) {
  if (node["part_size_mb"]) {
    upload.part_size_mb = node["part_size_mb"].as<uint64_t>();
  }
  if (node["concurrency"]) {
    upload.concurrency = node["concurrency"].as<int>();
  }
  if (node["max_retries"]) {
    upload.max_retries = node["max_retries"].as<int>();
  }
  if (node["max_file_size_mb"]) {
    upload.max_file_size_mb = node["max_file_size_mb"].as<uint64_t>();
  }
  if (node["retry_base_delay_ms"]) {
    upload.retry_base_delay_ms = node["retry_base_delay_ms"].as<int>();
  }
  if (node["retry_max_delay_ms"]) {
    upload.retry_max_delay_ms = node["retry_max_delay_ms"].as<int>();
  }
  if (node["presign_ttl_sec"]) {
    upload.presign_ttl_sec = node["presign_ttl_sec"].as<int>();
  }
  if (node["connect_timeout_ms"]) {
    upload.connect_timeout_ms = node["connect_timeout_ms"].as<int>();
  }
  if (node["request_timeout_ms"]) {
    upload.request_timeout_ms = node["request_timeout_ms"].as<int>();
  }

  return true;
}

bool ConfigParser::parse_logging(const YAML::Node& node, LoggingSection& logging) {
  if (node["console"]) {
    const auto& console = node["console"];
    if (console["enabled"]) {
      logging.console_enabled = console["enabled"].as<bool>();
    }
    if (console["colors"]) {
      logging.console_colors = console["colors"].as<bool>();
    }
    if (console["level"]) {
      logging.console_level = console["level"].as<std::string>();
    }
    if (console["progress"]) {
      logging.console_progress = console["progress"].as<bool>();
    }
  }

  if (node["file"]) {
    const auto& file = node["file"];
    if (file["enabled"]) {
      logging.file_enabled = file["enabled"].as<bool>();
    }
    if (file["level"]) {
      logging.file_level = file["level"].as<std::string>();
    }
    if (file["directory"]) {
      logging.file_directory = file["directory"].as<std::string>();
    }
    if (file["pattern"]) {
      logging.file_pattern = file["pattern"].as<std::string>();
    }
    if (file["format"]) {
      logging.file_format = file["format"].as<std::string>();
    }
    if (file["rotation_size_mb"]) {
      logging.rotation_size_mb = file["rotation_size_mb"].as<size_t>();
    }
    if (file["max_files"]) {
      logging.max_files = file["max_files"].as<size_t>();
    }
    if (file["rotate_at_midnight"]) {
      logging.rotate_at_midnight = file["rotate_at_midnight"].as<bool>();
    }
  }

  return true;
}

bool ConfigParser::validate(const ShuttleConfig& config, std::string& error_msg) {
  const auto& upload = config.upload;

  // Compared in MiB so huge values cannot wrap when scaled to bytes
  if (upload.part_size_mb < uploader::kMinPartSize / kBytesPerMiB) {
    error_msg = "part_size_mb must be at least 5";
    return false;
  }
  if (upload.part_size_mb > uploader::kMaxPartSize / kBytesPerMiB) {
    error_msg = "part_size_mb must not exceed 5120";
    return false;
  }

  if (upload.concurrency < 1) {
    error_msg = "concurrency must be at least 1";
    return false;
  }

  if (upload.max_retries < 0) {
    error_msg = "max_retries must not be negative";
    return false;
  }

  if (upload.max_file_size_mb == 0) {
    error_msg = "max_file_size_mb must be greater than 0";
    return false;
  }
  if (upload.max_file_size_mb > kMaxObjectSizeMiB) {
    error_msg =
      "max_file_size_mb must not exceed " + std::to_string(kMaxObjectSizeMiB) + " (5 TiB)";
    return false;
  }

  if (upload.retry_base_delay_ms < 0 || upload.retry_max_delay_ms < 0) {
    error_msg = "retry delays must not be negative";
    return false;
  }

  if (upload.presign_ttl_sec <= 0) {
    error_msg = "presign_ttl_sec must be greater than 0";
    return false;
  }

  if (upload.connect_timeout_ms <= 0 || upload.request_timeout_ms <= 0) {
    error_msg = "timeouts must be greater than 0";
    return false;
  }

  if (config.store.default_bucket.empty()) {
    error_msg = "bucket is empty (set s3.default_bucket or pass --bucket)";
    return false;
  }

  return true;
}

// ============================================================================
// Conversions
// ============================================================================

void convert_logging_config(
  const LoggingSection& yaml_config, ::shuttle::logging::LoggingConfig& log_config
) {
  log_config.console_enabled = yaml_config.console_enabled;
  log_config.console_colors = yaml_config.console_colors;
  if (auto level = ::shuttle::logging::parse_severity_level(yaml_config.console_level)) {
    log_config.console_level = *level;
  }
  log_config.console_progress = yaml_config.console_progress;

  log_config.file_enabled = yaml_config.file_enabled;
  if (auto level = ::shuttle::logging::parse_severity_level(yaml_config.file_level)) {
    log_config.file_level = *level;
  }

  log_config.file_config.directory = yaml_config.file_directory;
  log_config.file_config.file_pattern = yaml_config.file_pattern;
  log_config.file_config.format_json = (yaml_config.file_format == "json");
  log_config.file_config.rotation_size_mb = yaml_config.rotation_size_mb;
  log_config.file_config.max_files = static_cast<int>(yaml_config.max_files);
  log_config.file_config.rotate_at_midnight = yaml_config.rotate_at_midnight;
}

uploader::FileUploaderConfig to_uploader_config(const ShuttleConfig& config) {
  const auto& upload = config.upload;

  uploader::FileUploaderConfig out;
  out.region = config.store.s3.region;
  out.public_url_base = config.store.public_url_base;
  out.part_size = upload.part_size_mb * kBytesPerMiB;
  out.concurrency = upload.concurrency;
  out.max_retries = upload.max_retries;
  out.max_file_size = upload.max_file_size_mb * kBytesPerMiB;
  out.retry.max_retries = upload.max_retries;
  out.retry.base_delay = std::chrono::milliseconds(upload.retry_base_delay_ms);
  out.retry.max_delay = std::chrono::milliseconds(upload.retry_max_delay_ms);
  out.presign_ttl = std::chrono::seconds(upload.presign_ttl_sec);
  return out;
}

uploader::S3Config to_s3_config(const ShuttleConfig& config) {
  uploader::S3Config out = config.store.s3;
  out.connect_timeout_ms = config.upload.connect_timeout_ms;
  out.request_timeout_ms = config.upload.request_timeout_ms;
  return out;
}

uploader::HttpClientConfig to_http_client_config(const ShuttleConfig& config) {
  uploader::HttpClientConfig out;
  out.connect_timeout = std::chrono::milliseconds(config.upload.connect_timeout_ms);
  out.request_timeout = std::chrono::milliseconds(config.upload.request_timeout_ms);
  out.verify_ssl = config.store.s3.verify_ssl;
  return out;
}

}  // namespace upload_app
}  // namespace shuttle
