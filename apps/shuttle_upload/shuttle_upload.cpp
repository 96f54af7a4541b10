// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "cli_options.hpp"
#include "config_parser.hpp"
#include "file_uploader.hpp"
#include "presigned_put_client.hpp"
#include "s3_object_store.hpp"

#define SHUTTLE_LOG_COMPONENT "shuttle_upload"
#include <shuttle_log_init.hpp>
#include <shuttle_log_macros.hpp>

namespace shuttle {
namespace upload_app {

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitCancelled = 130;

void print_usage(const char* program_name) {
  std::cout
    << "Usage: " << program_name << " [OPTIONS] FILE\n"
    << "\n"
    << "Shuttle - concurrent multipart uploader for S3-compatible stores\n"
    << "\n"
    << "Options:\n"
    << "  --config PATH          Path to YAML configuration file\n"
    << "  --bucket NAME          Target bucket (overrides s3.default_bucket)\n"
    << "  --prefix P             Object key prefix (key = P/basename(FILE))\n"
    << "  --endpoint URL         S3 endpoint, e.g. http://localhost:9000\n"
    << "  --part-size-mb N       Part size in MiB (minimum 5)\n"
    << "  --concurrency N        Parts uploaded in parallel (default: 4)\n"
    << "  --max-retries N        Retries per part after the first attempt (default: 3)\n"
    << "  --on-failure MODE      ask, retry or abort when parts fail (default: ask)\n"
    << "  --no-ssl               Use plain HTTP for the endpoint\n"
    << "  --help                 Show this help message\n"
    << "\n"
    << "Configuration File:\n"
    << "  Command-line arguments OVERRIDE config file values.\n"
    << "  s3:\n"
    << "    endpoint_url: http://localhost:9000\n"
    << "    default_bucket: uploads\n"
    << "  upload:\n"
    << "    part_size_mb: 5\n"
    << "    concurrency: 4\n"
    << "    max_retries: 3\n"
    << "\n"
    << "Exit status: 0 on success, 1 on failure, 130 when cancelled.\n"
    << "\n"
    << "Examples:\n"
    << "  " << program_name << " --config config/shuttle_upload.yaml video.mp4\n"
    << "  " << program_name << " --endpoint http://localhost:9000 --no-ssl \\\n"
    << "    --bucket uploads --prefix 2026/10 --concurrency 8 video.mp4\n"
    << std::endl;
}

/**
 * Prints the running percentage and forwards interrupts to the uploader.
 * Pauses while the partial-failure prompt owns the terminal.
 */
class ProgressReporter {
public:
  explicit ProgressReporter(uploader::FileUploader& target)
      : uploader_(target) {}

  ~ProgressReporter() {
    stop();
  }

  void start() {
    thread_ = std::thread([this]() {
      run();
    });
  }

  void stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stopping_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  void set_paused(bool paused) {
    std::lock_guard<std::mutex> lock(mutex_);
    paused_ = paused;
  }

  void print_line() {
    auto snapshot = uploader_.progress();
    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cout << "\rUploading: " << snapshot.percentage << "% (" << snapshot.transferred_bytes
              << "/" << snapshot.total_bytes << " bytes)   " << std::flush;
  }

private:
  void run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
      cv_.wait_for(lock, std::chrono::milliseconds(500), [this]() {
        return stopping_;
      });
      if (stopping_) {
        break;
      }
      // The signal handler only sets the flag; cancellation happens here
      if (interrupt_requested().load() && !uploader_.is_cancelled()) {
        lock.unlock();
        std::cout << "\nInterrupted, cancelling upload..." << std::endl;
        uploader_.cancel();
        lock.lock();
        continue;
      }
      if (!paused_) {
        lock.unlock();
        print_line();
        lock.lock();
      }
    }
  }

  uploader::FileUploader& uploader_;
  std::thread thread_;
  std::mutex mutex_;
  std::mutex output_mutex_;
  std::condition_variable cv_;
  bool stopping_ = false;
  bool paused_ = false;
};

uploader::PartialFailureDecision prompt_partial_failure(
  FailurePolicy policy, ProgressReporter& reporter, size_t completed, size_t total, size_t failed
) {
  if (policy == FailurePolicy::RETRY) {
    std::cout << "\n" << failed << " of " << total << " parts failed, retrying them" << std::endl;
    return uploader::PartialFailureDecision::RETRY;
  }
  if (policy == FailurePolicy::ABORT) {
    std::cout << "\n" << failed << " of " << total << " parts failed, aborting" << std::endl;
    return uploader::PartialFailureDecision::ABORT;
  }

  reporter.set_paused(true);
  auto decision = ask_partial_failure(std::cin, std::cout, completed, total, failed);
  reporter.set_paused(false);

  SHUTTLE_LOG_INFO(
    "Partial failure decision" << logging::kv("completed", completed) << logging::kv("total", total)
                               << logging::kv("failed", failed)
                               << logging::kv("decision",
                                     decision == uploader::PartialFailureDecision::RETRY
                                       ? "retry"
                                       : "abort")
  );
  return decision;
}

int run(int argc, char* argv[]) {
  // Step 1: Parse command line
  CliOptions options;
  std::string error_msg;
  if (!parse_command_line(argc, argv, options, error_msg)) {
    std::cerr << "Error: " << error_msg << std::endl;
    print_usage(argv[0]);
    return kExitFailure;
  }
  if (options.show_help) {
    print_usage(argv[0]);
    return kExitSuccess;
  }
  if (options.file_path.empty()) {
    std::cerr << "Error: FILE is required" << std::endl;
    print_usage(argv[0]);
    return kExitFailure;
  }

  // Step 2: Load configuration file if specified
  ShuttleConfig config;
  if (!options.config_file.empty()) {
    ConfigParser parser;
    if (!parser.load_from_file(options.config_file, config)) {
      std::cerr << "Error: Failed to load config file '" << options.config_file
                << "': " << parser.get_last_error() << std::endl;
      return kExitFailure;
    }
  }

  // Step 3: Apply CLI argument overrides and validate
  apply_cli_overrides(options, config);
  if (!ConfigParser::validate(config, error_msg)) {
    std::cerr << "Error: Invalid configuration: " << error_msg << std::endl;
    return kExitFailure;
  }

  // Step 4: Logging
  logging::LoggingConfig log_config;
  convert_logging_config(config.logging, log_config);
  logging::LogSession log_session(log_config);

  SHUTTLE_LOG_INFO(
    "Starting upload" << logging::kv("file", options.file_path)
                      << logging::kv("bucket", config.store.default_bucket)
                      << logging::kv("endpoint", config.store.s3.endpoint_url)
                      << logging::kv("part_size_mb", config.upload.part_size_mb)
                      << logging::kv("concurrency", config.upload.concurrency)
  );

  if (!install_interrupt_handlers(error_msg)) {
    SHUTTLE_LOG_WARN("Ctrl+C will not cancel the upload" << logging::kv("error", error_msg));
  }

  // Step 5: Wire the store, the part client and the uploader
  auto store = std::make_shared<uploader::S3ObjectStore>(to_s3_config(config));
  auto client = std::make_shared<uploader::PresignedPutClient>(store, to_http_client_config(config));
  uploader::FileUploader file_uploader(store, client, to_uploader_config(config));

  ProgressReporter reporter(file_uploader);
  file_uploader.set_partial_failure_handler(
    [&options, &reporter](size_t completed, size_t total, size_t failed) {
      return prompt_partial_failure(options.on_failure, reporter, completed, total, failed);
    }
  );

  if (interrupt_requested().load()) {
    file_uploader.cancel();
  }

  reporter.start();
  auto outcome = file_uploader.upload(
    options.file_path, config.store.default_bucket, options.prefix.value_or("")
  );
  reporter.stop();
  if (outcome.success) {
    reporter.print_line();
  }
  std::cout << std::endl;

  // Step 6: One terminal line
  int exit_code = kExitSuccess;
  if (outcome.success) {
    std::cout << "Upload succeeded: s3://" << config.store.default_bucket << "/"
              << outcome.object_key << " (" << outcome.bytes << " bytes, "
              << (outcome.multipart ? "multipart" : "single PUT") << ")";
    if (!outcome.public_url.empty()) {
      std::cout << " " << outcome.public_url;
    }
    std::cout << std::endl;
  } else if (outcome.error_code == uploader::UploadErrorCode::UploadCancelled) {
    std::cout << "Upload cancelled: " << outcome.error_message << std::endl;
    exit_code = kExitCancelled;
  } else {
    std::cout << "Upload failed [" << uploader::errorCodeToString(outcome.error_code)
              << "]: " << outcome.error_message << std::endl;
    exit_code = kExitFailure;
  }

  return exit_code;
}

}  // namespace

}  // namespace upload_app
}  // namespace shuttle

int main(int argc, char* argv[]) {
  try {
    return shuttle::upload_app::run(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
