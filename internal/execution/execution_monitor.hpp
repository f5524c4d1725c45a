#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "internal/execution/execution_state.hpp"
#include "internal/execution/inference_api.hpp"
#include "internal/net/event_channel.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/cancellation.hpp"
#include "internal/util/time.hpp"
#include "internal/workflow/job_graph.hpp"

namespace lipsync::execution {

struct MonitorSettings {
  std::chrono::milliseconds connect_retry_interval{std::chrono::seconds(1)};
  std::chrono::milliseconds connect_ceiling{std::chrono::seconds(180)};
  std::chrono::milliseconds connect_attempt_timeout{std::chrono::seconds(10)};
  std::chrono::milliseconds execution_timeout{std::chrono::hours(1)};
  std::chrono::milliseconds read_slice{std::chrono::seconds(1)};
};

// A fresh, unconnected channel per connection attempt.
using EventChannelFactory = std::function<net::EventChannelPtr()>;

// Called on every state change; `node` is set for kExecuting only.
using StateObserver = std::function<void(ExecutionState state, const std::string& node)>;

struct ExecutionResult {
  std::string                        prompt_id;
  std::string                        client_id;
  std::vector<std::filesystem::path> artifacts;  // resolvable outputs, in history order
  std::filesystem::path              result;     // artifacts.front()
};

/*
  ExecutionMonitor

  Runs one job graph to completion on the inference server:

      connect realtime channel (retry until ceiling)  → ConnectTimeout
      POST /prompt                                    → SubmissionError
      read events until executing{node: null}         → ExecutionError
      GET /history, resolve artifacts                 → NoOutputError / NotFoundError

  The channel is always open before the job is submitted so no event for the
  job can be missed. A dropped channel is reopened with the same client id
  and the history is checked once, since completion may have been broadcast
  in between. Deadline and cancellation only stop local waiting.
*/
class ExecutionMonitor {
 public:
  ExecutionMonitor(InferenceApi api, EventChannelFactory channels, MonitorSettings settings, observability::Logger logger);

  ExecutionResult Run(const workflow::JobGraph& graph, const util::CancellationToken& cancel = {},
                      const StateObserver& observer = {}) const;

 private:
  net::EventChannelPtr Connect(const std::string& client_id, util::TimePoint deadline, const util::CancellationToken& cancel) const;

  // Replaces `channel` with a new connection. Returns the history entry when
  // the prompt already finished.
  std::optional<lipsync::v1::HistoryEntry> Reconnect(net::EventChannelPtr& channel, const std::string& client_id,
                                                     const std::string& prompt_id, util::TimePoint deadline,
                                                     const util::CancellationToken& cancel, const StateObserver& observer) const;

  // std::nullopt when completion arrived as an event; the history entry when
  // it was found after a reconnect.
  std::optional<lipsync::v1::HistoryEntry> WaitForCompletion(net::EventChannelPtr& channel, const std::string& client_id,
                                                             const std::string& prompt_id, const util::CancellationToken& cancel,
                                                             const StateObserver& observer) const;

  ExecutionResult CollectArtifacts(const std::optional<lipsync::v1::HistoryEntry>& entry, const std::string& prompt_id,
                                   const std::string& client_id) const;

  InferenceApi          api_;
  EventChannelFactory   channels_;
  MonitorSettings       settings_;
  observability::Logger logger_;
};

} // namespace lipsync::execution
