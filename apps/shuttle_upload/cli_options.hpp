// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SHUTTLE_UPLOAD_CLI_OPTIONS_HPP
#define SHUTTLE_UPLOAD_CLI_OPTIONS_HPP

#include <atomic>
#include <cstddef>
#include <istream>
#include <optional>
#include <ostream>
#include <string>

#include "config_parser.hpp"
#include "upload_coordinator.hpp"

namespace shuttle {
namespace upload_app {

/**
 * What to do when a multipart session drains with failed parts
 */
enum class FailurePolicy { ASK, RETRY, ABORT };

std::optional<FailurePolicy> parse_failure_policy(const std::string& value);

/**
 * Command-line values. Unset optionals leave the config file value in place.
 */
struct CliOptions {
  bool show_help = false;
  std::string config_file;
  std::string file_path;
  FailurePolicy on_failure = FailurePolicy::ASK;

  std::optional<std::string> bucket;
  std::optional<std::string> prefix;
  std::optional<std::string> endpoint;
  std::optional<uint64_t> part_size_mb;
  std::optional<int> concurrency;
  std::optional<int> max_retries;
  bool no_ssl = false;
};

/**
 * Parse argv into `options`. Returns false with `error_msg` set on an unknown
 * flag, a missing or malformed value, or more than one FILE.
 */
bool parse_command_line(int argc, char* argv[], CliOptions& options, std::string& error_msg);

/**
 * CLI values take precedence over the config file
 */
void apply_cli_overrides(const CliOptions& options, ShuttleConfig& config);

/**
 * Set from the SIGINT and SIGTERM handlers.
 */
std::atomic<bool>& interrupt_requested();

/**
 * Route SIGINT and SIGTERM to interrupt_requested(). SA_RESTART stays clear
 * so a prompt blocked in read(2) returns on Ctrl+C.
 *
 * @return false with `error_msg` set when sigaction fails
 */
bool install_interrupt_handlers(std::string& error_msg);

/**
 * Ask whether to retry the failed parts until `in` answers r/retry or
 * a/abort. End of input, an interrupted read or a pending interrupt is an
 * abort.
 */
uploader::PartialFailureDecision ask_partial_failure(
  std::istream& in, std::ostream& out, size_t completed, size_t total, size_t failed
);

}  // namespace upload_app
}  // namespace shuttle

#endif  // SHUTTLE_UPLOAD_CLI_OPTIONS_HPP
