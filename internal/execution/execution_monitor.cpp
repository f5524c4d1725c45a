#include "internal/execution/execution_monitor.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "lipsync/v1/inference.pb.h"

namespace lipsync::execution {

using lipsync::observability::IntField;
using lipsync::observability::StringField;

namespace {

void Notify(const StateObserver& observer, ExecutionState state, const std::string& node = {}) {
  if (observer) {
    observer(state, node);
  }
}

std::string StringFieldOf(const google::protobuf::Struct& data, const std::string& key) {
  auto it = data.fields().find(key);
  if (it == data.fields().end() || it->second.kind_case() != google::protobuf::Value::kStringValue) {
    return {};
  }
  return it->second.string_value();
}

} // namespace

ExecutionMonitor::ExecutionMonitor(InferenceApi api, EventChannelFactory channels, MonitorSettings settings,
                                   observability::Logger logger)
    : api_(std::move(api)), channels_(std::move(channels)), settings_(settings), logger_(std::move(logger)) {
}

ExecutionResult ExecutionMonitor::Run(const workflow::JobGraph& graph, const util::CancellationToken& cancel,
                                      const StateObserver& observer) const {
  const auto client_id = util::NewUuidString();
  auto       channel   = Connect(client_id, util::Now() + settings_.connect_ceiling, cancel);

  std::string prompt_id;
  try {
    prompt_id = api_.QueuePrompt(graph, client_id).prompt_id();
  } catch (const std::exception&) {
    channel->Close();
    Notify(observer, ExecutionState::kFailed);
    throw;
  }
  Notify(observer, ExecutionState::kSubmitted);

  auto entry = WaitForCompletion(channel, client_id, prompt_id, cancel, observer);
  channel->Close();

  try {
    if (!entry) {
      entry = api_.GetHistory(prompt_id);
    }
    auto result = CollectArtifacts(entry, prompt_id, client_id);
    Notify(observer, ExecutionState::kComplete);
    return result;
  } catch (const std::exception&) {
    Notify(observer, ExecutionState::kFailed);
    throw;
  }
}

net::EventChannelPtr ExecutionMonitor::Connect(const std::string& client_id, util::TimePoint deadline,
                                               const util::CancellationToken& cancel) const {
  const auto url = api_.EventsUrl(client_id);

  for (int attempt = 1;; ++attempt) {
    if (cancel.IsCancelled()) {
      throw util::ExecutionError("Cancelled while connecting to " + url);
    }

    auto channel = channels_();
    try {
      channel->Connect(url, settings_.connect_attempt_timeout);
      LIPSYNC_LOG_INFO(logger_, "Connected to event channel", {StringField("client_id", client_id), IntField("attempts", attempt)});
      return channel;
    } catch (const util::TransportError& e) {
      if (util::Now() + settings_.connect_retry_interval >= deadline) {
        LIPSYNC_LOG_ERROR(logger_, "Event channel unreachable",
                          {StringField("url", url), IntField("attempts", attempt), StringField("error", e.what())});
        throw util::ConnectTimeout("Timeout waiting for inference server at " + url + " after " + std::to_string(attempt) +
                                   " attempts: " + e.what());
      }
      LIPSYNC_LOG_DEBUG(logger_, "Event channel not ready, retrying", {IntField("attempt", attempt), StringField("error", e.what())});
    }
    util::SleepFor(settings_.connect_retry_interval);
  }
}

std::optional<lipsync::v1::HistoryEntry> ExecutionMonitor::Reconnect(net::EventChannelPtr& channel, const std::string& client_id,
                                                                     const std::string& prompt_id, util::TimePoint deadline,
                                                                     const util::CancellationToken& cancel,
                                                                     const StateObserver& observer) const {
  channel->Close();
  util::SleepFor(settings_.connect_retry_interval);

  const util::TimePoint ceiling = util::Now() + settings_.connect_ceiling;
  try {
    channel = Connect(client_id, std::min(ceiling, deadline), cancel);
  } catch (const util::ConnectTimeout& e) {
    Notify(observer, ExecutionState::kFailed);
    throw util::ExecutionError("Event channel lost for prompt " + prompt_id + ": " + e.what());
  } catch (const util::ExecutionError&) {
    Notify(observer, ExecutionState::kFailed);
    throw;
  }

  // Completion may have been broadcast while nobody was listening.
  try {
    auto entry = api_.GetHistory(prompt_id);
    if (entry) {
      LIPSYNC_LOG_INFO(logger_, "Prompt finished while disconnected", {StringField("prompt_id", prompt_id)});
    }
    return entry;
  } catch (const util::ExecutionError& e) {
    LIPSYNC_LOG_WARN(logger_, "History check after reconnect failed, waiting for events",
                     {StringField("prompt_id", prompt_id), StringField("error", e.what())});
    return std::nullopt;
  }
}

std::optional<lipsync::v1::HistoryEntry> ExecutionMonitor::WaitForCompletion(net::EventChannelPtr& channel, const std::string& client_id,
                                                                             const std::string& prompt_id,
                                                                             const util::CancellationToken& cancel,
                                                                             const StateObserver& observer) const {
  google::protobuf::util::JsonParseOptions parse_options;
  parse_options.ignore_unknown_fields = true;

  const util::TimePoint deadline = util::Now() + settings_.execution_timeout;
  while (true) {
    if (cancel.IsCancelled()) {
      Notify(observer, ExecutionState::kFailed);
      throw util::ExecutionError("Cancelled while waiting for prompt " + prompt_id);
    }
    const auto now = util::Now();
    if (now >= deadline) {
      Notify(observer, ExecutionState::kFailed);
      throw util::ExecutionError("Timed out waiting for prompt " + prompt_id);
    }

    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::optional<net::ChannelMessage> message;
    try {
      message = channel->Read(std::min(settings_.read_slice, remaining));
    } catch (const util::TransportError& e) {
      LIPSYNC_LOG_WARN(logger_, "Event channel closed, reconnecting", {StringField("prompt_id", prompt_id), StringField("error", e.what())});
      Notify(observer, ExecutionState::kDisconnected);
      auto entry = Reconnect(channel, client_id, prompt_id, deadline, cancel, observer);
      if (entry) {
        return entry;
      }
      continue;
    }

    // Binary frames carry previews.
    if (!message || message->binary) {
      continue;
    }

    lipsync::v1::ServerEvent event;
    if (!google::protobuf::util::JsonStringToMessage(message->payload, &event, parse_options).ok()) {
      LIPSYNC_LOG_DEBUG(logger_, "Ignoring unparsable event", {IntField("bytes", static_cast<std::int64_t>(message->payload.size()))});
      continue;
    }
    if (event.type() != "executing" || StringFieldOf(event.data(), "prompt_id") != prompt_id) {
      continue;
    }

    auto node = event.data().fields().find("node");
    if (node == event.data().fields().end()) {
      continue;
    }
    if (node->second.kind_case() == google::protobuf::Value::kNullValue) {
      LIPSYNC_LOG_INFO(logger_, "Execution complete", {StringField("prompt_id", prompt_id)});
      return std::nullopt;
    }
    if (node->second.kind_case() == google::protobuf::Value::kStringValue) {
      LIPSYNC_LOG_INFO(logger_, "Executing node", {StringField("prompt_id", prompt_id), StringField("node", node->second.string_value())});
      Notify(observer, ExecutionState::kExecuting, node->second.string_value());
    }
  }
}

ExecutionResult ExecutionMonitor::CollectArtifacts(const std::optional<lipsync::v1::HistoryEntry>& entry, const std::string& prompt_id,
                                                   const std::string& client_id) const {
  if (!entry) {
    LIPSYNC_LOG_WARN(logger_, "No history for prompt", {StringField("prompt_id", prompt_id)});
    throw util::NoOutputError("No output video found for prompt " + prompt_id);
  }

  std::vector<std::string> references;
  for (const auto& node_id : entry->output_order()) {
    for (const auto& file : entry->outputs().at(node_id).gifs()) {
      if (!file.fullpath().empty()) {
        references.push_back(file.fullpath());
      }
    }
  }
  if (references.empty()) {
    throw util::NoOutputError("No output video found for prompt " + prompt_id);
  }

  ExecutionResult result;
  result.prompt_id = prompt_id;
  result.client_id = client_id;
  for (const auto& reference : references) {
    std::error_code ec;
    if (std::filesystem::is_regular_file(reference, ec)) {
      result.artifacts.emplace_back(reference);
    } else {
      LIPSYNC_LOG_WARN(logger_, "Output file missing", {StringField("path", reference)});
    }
  }
  if (result.artifacts.empty()) {
    throw util::NotFoundError("Output file not found: " + references.front());
  }

  result.result = result.artifacts.front();
  if (result.artifacts.size() > 1) {
    LIPSYNC_LOG_INFO(logger_, "Additional outputs not returned",
                     {StringField("prompt_id", prompt_id), IntField("extra", static_cast<std::int64_t>(result.artifacts.size() - 1))});
  }
  LIPSYNC_LOG_INFO(logger_, "Output resolved", {StringField("prompt_id", prompt_id), StringField("path", result.result.string())});
  return result;
}

} // namespace lipsync::execution
