// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "cli_options.hpp"

#include <signal.h>

#include <cerrno>
#include <cstring>
#include <initializer_list>
#include <stdexcept>

namespace shuttle {
namespace upload_app {

namespace {

std::atomic<bool> g_interrupt_requested(false);

void on_interrupt_signal(int) {
  g_interrupt_requested.store(true);
}

bool parse_int(const char* text, int& out) {
  try {
    size_t consumed = 0;
    int value = std::stoi(text, &consumed);
    if (text[consumed] != '\0') {
      return false;
    }
    out = value;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

bool parse_uint64(const char* text, uint64_t& out) {
  if (text[0] == '-') {
    return false;
  }
  try {
    size_t consumed = 0;
    unsigned long long value = std::stoull(text, &consumed);
    if (text[consumed] != '\0') {
      return false;
    }
    out = value;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

}  // namespace

std::optional<FailurePolicy> parse_failure_policy(const std::string& value) {
  if (value == "ask") {
    return FailurePolicy::ASK;
  }
  if (value == "retry") {
    return FailurePolicy::RETRY;
  }
  if (value == "abort") {
    return FailurePolicy::ABORT;
  }
  return std::nullopt;
}

bool parse_command_line(int argc, char* argv[], CliOptions& options, std::string& error_msg) {
  for (int i = 1; i < argc; ++i) {
    const char* arg = argv[i];

    if (strcmp(arg, "--help") == 0 || strcmp(arg, "-h") == 0) {
      options.show_help = true;
      return true;
    }
    if (strcmp(arg, "--no-ssl") == 0) {
      options.no_ssl = true;
      continue;
    }

    if (strncmp(arg, "--", 2) == 0) {
      if (i + 1 >= argc) {
        error_msg = std::string(arg) + " requires a value";
        return false;
      }
      const char* value = argv[++i];

      if (strcmp(arg, "--config") == 0) {
        options.config_file = value;
      } else if (strcmp(arg, "--bucket") == 0) {
        options.bucket = std::string(value);
      } else if (strcmp(arg, "--prefix") == 0) {
        options.prefix = std::string(value);
      } else if (strcmp(arg, "--endpoint") == 0) {
        options.endpoint = std::string(value);
      } else if (strcmp(arg, "--part-size-mb") == 0) {
        uint64_t mb = 0;
        if (!parse_uint64(value, mb)) {
          error_msg = "Invalid --part-size-mb value: " + std::string(value);
          return false;
        }
        options.part_size_mb = mb;
      } else if (strcmp(arg, "--concurrency") == 0) {
        int n = 0;
        if (!parse_int(value, n)) {
          error_msg = "Invalid --concurrency value: " + std::string(value);
          return false;
        }
        options.concurrency = n;
      } else if (strcmp(arg, "--max-retries") == 0) {
        int n = 0;
        if (!parse_int(value, n)) {
          error_msg = "Invalid --max-retries value: " + std::string(value);
          return false;
        }
        options.max_retries = n;
      } else if (strcmp(arg, "--on-failure") == 0) {
        auto policy = parse_failure_policy(value);
        if (!policy) {
          error_msg = "Invalid --on-failure value: " + std::string(value) +
                      " (expected ask, retry or abort)";
          return false;
        }
        options.on_failure = *policy;
      } else {
        error_msg = "Unknown argument: " + std::string(arg);
        return false;
      }
      continue;
    }

    if (!options.file_path.empty()) {
      error_msg = "Only one FILE may be given (got '" + options.file_path + "' and '" + arg + "')";
      return false;
    }
    options.file_path = arg;
  }

  return true;
}

void apply_cli_overrides(const CliOptions& options, ShuttleConfig& config) {
  if (options.bucket) {
    config.store.default_bucket = *options.bucket;
  }
  if (options.endpoint) {
    config.store.s3.endpoint_url = *options.endpoint;
  }
  if (options.no_ssl) {
    config.store.s3.use_ssl = false;
  }
  if (options.part_size_mb) {
    config.upload.part_size_mb = *options.part_size_mb;
  }
  if (options.concurrency) {
    config.upload.concurrency = *options.concurrency;
  }
  if (options.max_retries) {
    config.upload.max_retries = *options.max_retries;
  }
}

std::atomic<bool>& interrupt_requested() {
  return g_interrupt_requested;
}

bool install_interrupt_handlers(std::string& error_msg) {
  struct sigaction action;
  std::memset(&action, 0, sizeof(action));
  action.sa_handler = on_interrupt_signal;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;

  for (int signal_number : {SIGINT, SIGTERM}) {
    if (sigaction(signal_number, &action, nullptr) != 0) {
      error_msg = std::string("sigaction failed: ") + std::strerror(errno);
      return false;
    }
  }
  return true;
}

uploader::PartialFailureDecision ask_partial_failure(
  std::istream& in, std::ostream& out, size_t completed, size_t total, size_t failed
) {
  while (!g_interrupt_requested.load()) {
    out << "\n"
        << completed << " of " << total << " parts uploaded, " << failed
        << " failed. Retry failed parts? [r]etry/[a]bort: " << std::flush;
    std::string answer;
    if (!std::getline(in, answer)) {
      // EOF, or EINTR from Ctrl+C
      in.clear();
      break;
    }
    if (g_interrupt_requested.load()) {
      break;
    }
    if (answer == "r" || answer == "retry") {
      return uploader::PartialFailureDecision::RETRY;
    }
    if (answer == "a" || answer == "abort") {
      break;
    }
  }
  return uploader::PartialFailureDecision::ABORT;
}

}  // namespace upload_app
}  // namespace shuttle
