#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>

#include "config/config.pb.h"
#include "internal/net/http_transport.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/cancellation.hpp"
#include "lipsync/v1.hpp"

namespace lipsync::client {

enum class TaskStatus : std::uint8_t {
  kUnknown   = 0,
  kPending   = 1,
  kRunning   = 2,
  kCompleted = 3,
  kFailed    = 4,
  kCanceled  = 5,
};

// Case-insensitive; COMPLETE and COMPLETED are the same state. Anything
// unrecognized is kUnknown.
TaskStatus ParseTaskStatus(std::string_view text);

constexpr bool IsTerminal(TaskStatus status) {
  return status == TaskStatus::kCompleted || status == TaskStatus::kFailed || status == TaskStatus::kCanceled;
}

std::string_view ToString(TaskStatus status);

struct TaskQueueSettings {
  std::string submit_url;
  std::string status_url_template = "https://api.beam.cloud/v2/task/{task_id}/";
  std::string sync_url;
  std::string token;

  std::chrono::milliseconds poll_interval{std::chrono::seconds(5)};
  int                       poll_attempts = 5;
  std::chrono::milliseconds poll_retry_backoff{std::chrono::seconds(2)};
  std::chrono::milliseconds request_timeout{std::chrono::seconds(30)};
  std::chrono::milliseconds download_timeout{std::chrono::minutes(30)};
  std::size_t               download_chunk_bytes = 8192;
  // Zero waits forever.
  std::chrono::milliseconds wait_ceiling{0};
};

// Queue section of the runtime config over the built-in defaults.
TaskQueueSettings TaskQueueSettingsFrom(const lipsync::runtime::config::QueueConfig& config, std::string token);

struct TaskOutcome {
  std::string                          task_id;
  TaskStatus                           status = TaskStatus::kUnknown;
  lipsync::v1::TaskStatusResponse      response;

  bool succeeded() const {
    return status == TaskStatus::kCompleted;
  }
};

// Status name on every change, and on every RUNNING poll with the counter
// advanced. The counter is cosmetic (capped at 99), not real progress.
using ProgressObserver = std::function<void(const std::string& status, int counter)>;

/*
  TaskQueueClient

  Drives one asynchronous job on the hosted task queue:

      Submit            POST submit_url                 → task id
      WaitForCompletion GET status_url every interval   → terminal status
      Fetch             GET outputs[0].url in chunks    → local file

  Submission is never retried. A single poll retries transient failures
  (network, non-2xx, unparsable body) with a fixed backoff before giving up
  with util::PollError. Terminal FAILED/CANCELED are reported, not retried.
*/
class TaskQueueClient {
 public:
  TaskQueueClient(TaskQueueSettings settings, net::HttpTransportPtr transport, observability::Logger logger);

  std::string Submit(const lipsync::v1::JobRequest& payload) const;

  lipsync::v1::TaskStatusResponse Poll(const std::string& task_id) const;

  TaskOutcome WaitForCompletion(const std::string& task_id, const ProgressObserver& observer = {},
                                const util::CancellationToken& cancel = {}) const;

  /*
    Downloads the first output of a completed task to `output`.

    Bytes go to `<output>.part`, which is renamed on success and left in
    place when the transfer fails. util::NoOutputError when the task listed
    no downloadable output.
  */
  std::filesystem::path Fetch(const lipsync::v1::TaskStatusResponse& status, const std::filesystem::path& output) const;

  // Decodes an inline base64 artifact to `output`, same .part handling.
  std::filesystem::path SaveInline(const std::string& base64, const std::filesystem::path& output) const;

  // Synchronous endpoint: the job runs within the request.
  lipsync::v1::JobResult CallSync(const std::string& endpoint_url, const lipsync::v1::JobRequest& payload) const;

  const TaskQueueSettings& settings() const {
    return settings_;
  }

 private:
  net::HttpRequest AuthorizedRequest(std::string method, std::string url) const;

  TaskQueueSettings     settings_;
  net::HttpTransportPtr transport_;
  observability::Logger logger_;
};

} // namespace lipsync::client
