// Copyright (c) 2026 ArcheBase
// Shuttle is licensed under Mulan PSL v2.
// You can use this software according to the terms and conditions of the Mulan PSL v2.
// You may obtain a copy of Mulan PSL v2 at:
//          http://license.coscl.org.cn/MulanPSL2
// THIS SOFTWARE IS PROVIDED ON AN "AS IS" BASIS, WITHOUT WARRANTIES OF ANY KIND,
// EITHER EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO NON-INFRINGEMENT,
// MERCHANTABILITY OR FIT FOR A PARTICULAR PURPOSE.
// See the Mulan PSL v2 for more details.

#ifndef SHUTTLE_UPLOAD_COORDINATOR_HPP
#define SHUTTLE_UPLOAD_COORDINATOR_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "cancellation_token.hpp"
#include "object_store.hpp"
#include "part_planner.hpp"
#include "part_queue.hpp"
#include "part_source.hpp"
#include "presigned_put_client.hpp"
#include "progress_aggregator.hpp"
#include "retry_handler.hpp"
#include "retrying_part_uploader.hpp"
#include "upload_result.hpp"

namespace shuttle {
namespace uploader {

/**
 * UploadState of one multipart session.
 *
 * State transitions:
 * - PLANNING -> INITIATED: initiateMultipartUpload succeeded
 * - PLANNING -> TERMINATED: bad plan, initiate failed or cancelled before initiate
 * - INITIATED -> PARTS_IN_FLIGHT: workers started
 * - PARTS_IN_FLIGHT -> ALL_SUCCEEDED | PARTIAL_FAILURE: queue drained
 * - ALL_SUCCEEDED -> COMPLETING -> TERMINATED
 * - PARTIAL_FAILURE -> RETRYING -> PARTS_IN_FLIGHT: caller chose retry
 * - PARTIAL_FAILURE / PARTS_IN_FLIGHT / RETRYING / INITIATED -> ABORTING -> TERMINATED
 */
enum class UploadState {
  PLANNING,
  INITIATED,
  PARTS_IN_FLIGHT,
  ALL_SUCCEEDED,
  PARTIAL_FAILURE,
  RETRYING,
  COMPLETING,
  ABORTING,
  TERMINATED
};

inline std::string state_to_string(UploadState state) {
  switch (state) {
    case UploadState::PLANNING:
      return "planning";
    case UploadState::INITIATED:
      return "initiated";
    case UploadState::PARTS_IN_FLIGHT:
      return "parts_in_flight";
    case UploadState::ALL_SUCCEEDED:
      return "all_succeeded";
    case UploadState::PARTIAL_FAILURE:
      return "partial_failure";
    case UploadState::RETRYING:
      return "retrying";
    case UploadState::COMPLETING:
      return "completing";
    case UploadState::ABORTING:
      return "aborting";
    case UploadState::TERMINATED:
      return "terminated";
    default:
      return "unknown";
  }
}

/**
 * Caller's answer to a partial failure
 */
enum class PartialFailureDecision { RETRY, ABORT };

/**
 * Invoked on the thread running run() when the queue drained with failed parts.
 * Parameters: (completed, total, failed). Blocks until the caller decides.
 */
using PartialFailureHandler =
  std::function<PartialFailureDecision(size_t completed, size_t total, size_t failed)>;

/**
 * Parameters: (from_state, to_state)
 */
using UploadStateCallback = std::function<void(UploadState, UploadState)>;

/**
 * Multipart session settings
 */
struct CoordinatorConfig {
  uint64_t part_size = kMinPartSize;
  int concurrency = 4;
  int max_retries = 3;
  RetryConfig retry;
  std::chrono::seconds presign_ttl{3600};
};

/**
 * UploadCoordinator drives one multipart upload from plan to completion or abort.
 *
 * A bounded pool of std::threads drains a shared PartQueue; each worker runs
 * a RetryingPartUploader per part. Completed parts are kept keyed by part
 * number so the completion call always receives them in ascending order.
 *
 * Thread Safety:
 * - run() is called once, from one thread
 * - cancel(), progress() and state() may be called from any thread
 */
class UploadCoordinator {
public:
  UploadCoordinator(
    std::shared_ptr<IObjectStore> store, std::shared_ptr<IPresignedPutClient> client,
    std::shared_ptr<IPartSource> source, const CoordinatorConfig& config
  );
  ~UploadCoordinator();

  // Non-copyable
  UploadCoordinator(const UploadCoordinator&) = delete;
  UploadCoordinator& operator=(const UploadCoordinator&) = delete;

  /**
   * Without a handler every partial failure is aborted.
   */
  void set_partial_failure_handler(PartialFailureHandler handler);

  /**
   * Register a callback for state transitions.
   * Invoked after each transition, outside the state lock.
   */
  void register_transition_callback(UploadStateCallback callback);

  /**
   * Upload `file_size` bytes from the part source to bucket/key.
   * Blocks until the session terminates.
   */
  UploadOutcome run(const std::string& bucket, const std::string& key, uint64_t file_size);

  /**
   * Request cancellation. Safe from any thread, including signal watchers.
   */
  void cancel();

  bool is_cancelled() const {
    return token_.isCancelled();
  }

  UploadState get_state() const;

  /**
   * Progress of the current session; zeros before planning.
   */
  ProgressSnapshot progress() const;

  std::string upload_id() const;

  static bool is_valid_transition(UploadState from, UploadState to);

private:
  bool transition_to(UploadState to);

  void run_workers(const std::string& bucket, const std::string& key);
  void worker_loop(const PartTarget& target);

  UploadOutcome complete(const std::string& bucket, const std::string& key, uint64_t file_size);
  UploadOutcome abort(
    const std::string& bucket, const std::string& key, UploadErrorCode code,
    const std::string& message
  );
  UploadOutcome terminate_with(UploadErrorCode code, const std::string& message);

  std::vector<Part> failed_parts() const;

  std::shared_ptr<IObjectStore> store_;
  std::shared_ptr<IPresignedPutClient> client_;
  std::shared_ptr<IPartSource> source_;
  CoordinatorConfig config_;
  RetryHandler retry_;

  CancellationToken token_;
  PartQueue queue_;
  UploadPlan plan_;

  mutable std::mutex state_mutex_;
  UploadState state_ = UploadState::PLANNING;
  std::vector<UploadStateCallback> callbacks_;
  PartialFailureHandler failure_handler_;
  std::string upload_id_;
  std::shared_ptr<ProgressAggregator> progress_;

  mutable std::mutex results_mutex_;
  std::map<int, PartResult> completed_;
  bool accepting_results_ = true;
  std::string first_error_;

  bool abort_sent_ = false;
};

}  // namespace uploader
}  // namespace shuttle

#endif  // SHUTTLE_UPLOAD_COORDINATOR_HPP
