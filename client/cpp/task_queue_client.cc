#include "client/cpp/task_queue_client.h"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cctype>
#include <fstream>

#include "internal/net/url.hpp"
#include "internal/util/base64.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace lipsync::client {

using lipsync::observability::IntField;
using lipsync::observability::StringField;

namespace {

constexpr int kMaxProgressCounter = 99;

std::string Upper(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return out;
}

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to encode request: " + std::string(status.message()));
  }
  return json;
}

bool FromJson(const std::string& json, google::protobuf::Message* message) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  return google::protobuf::util::JsonStringToMessage(json, message, options).ok();
}

std::filesystem::path PartPath(const std::filesystem::path& output) {
  return std::filesystem::path(output.string() + ".part");
}

} // namespace

TaskStatus ParseTaskStatus(std::string_view text) {
  const auto upper = Upper(text);
  if (upper == "PENDING") {
    return TaskStatus::kPending;
  }
  if (upper == "RUNNING") {
    return TaskStatus::kRunning;
  }
  if (upper == "COMPLETED" || upper == "COMPLETE") {
    return TaskStatus::kCompleted;
  }
  if (upper == "FAILED") {
    return TaskStatus::kFailed;
  }
  if (upper == "CANCELED") {
    return TaskStatus::kCanceled;
  }
  return TaskStatus::kUnknown;
}

std::string_view ToString(TaskStatus status) {
  switch (status) {
    case TaskStatus::kPending:
      return "PENDING";
    case TaskStatus::kRunning:
      return "RUNNING";
    case TaskStatus::kCompleted:
      return "COMPLETED";
    case TaskStatus::kFailed:
      return "FAILED";
    case TaskStatus::kCanceled:
      return "CANCELED";
    case TaskStatus::kUnknown:
      break;
  }
  return "UNKNOWN";
}

TaskQueueSettings TaskQueueSettingsFrom(const lipsync::runtime::config::QueueConfig& config, std::string token) {
  TaskQueueSettings settings;
  settings.submit_url = config.submit_url();
  if (!config.status_url_template().empty()) {
    settings.status_url_template = config.status_url_template();
  }
  settings.sync_url = config.sync_url();
  settings.token    = std::move(token);

  settings.poll_interval      = util::OrDefault(config.poll_interval(), settings.poll_interval);
  settings.poll_retry_backoff = util::OrDefault(config.poll_retry_backoff(), settings.poll_retry_backoff);
  settings.request_timeout    = util::OrDefault(config.request_timeout(), settings.request_timeout);
  settings.download_timeout   = util::OrDefault(config.download_timeout(), settings.download_timeout);
  settings.wait_ceiling       = util::FromProto(config.wait_ceiling());
  if (config.poll_attempts() > 0) {
    settings.poll_attempts = static_cast<int>(config.poll_attempts());
  }
  if (config.download_chunk_bytes() > 0) {
    settings.download_chunk_bytes = config.download_chunk_bytes();
  }
  return settings;
}

TaskQueueClient::TaskQueueClient(TaskQueueSettings settings, net::HttpTransportPtr transport, observability::Logger logger)
    : settings_(std::move(settings)), transport_(std::move(transport)), logger_(std::move(logger)) {
}

net::HttpRequest TaskQueueClient::AuthorizedRequest(std::string method, std::string url) const {
  net::HttpRequest request;
  request.method  = std::move(method);
  request.url     = std::move(url);
  request.timeout = settings_.request_timeout;
  if (!settings_.token.empty()) {
    request.headers.emplace_back("Authorization", "Bearer " + settings_.token);
  }
  return request;
}

std::string TaskQueueClient::Submit(const lipsync::v1::JobRequest& payload) const {
  auto request = AuthorizedRequest("POST", settings_.submit_url);
  request.headers.emplace_back("Content-Type", "application/json");
  request.body = ToJson(payload);

  net::HttpResponse response;
  try {
    response = transport_->Send(request);
  } catch (const util::TransportError& e) {
    throw util::SubmissionError(std::string("Error submitting task: ") + e.what());
  } catch (const std::invalid_argument& e) {
    throw util::SubmissionError(std::string("Error submitting task: ") + e.what());
  }

  if (!response.ok()) {
    LIPSYNC_LOG_ERROR(logger_, "Submission rejected", {IntField("status", response.status), StringField("body", response.body)});
    throw util::SubmissionError("Error submitting task: HTTP " + std::to_string(response.status) + ": " + response.body);
  }

  lipsync::v1::SubmitTaskResponse submitted;
  if (!FromJson(response.body, &submitted) || submitted.task_id().empty()) {
    throw util::SubmissionError("Error submitting task: no task_id in response: " + response.body);
  }

  LIPSYNC_LOG_INFO(logger_, "Task submitted", {StringField("task_id", submitted.task_id())});
  return submitted.task_id();
}

lipsync::v1::TaskStatusResponse TaskQueueClient::Poll(const std::string& task_id) const {
  const auto url      = net::ExpandTemplate(settings_.status_url_template, "{task_id}", net::PercentEncode(task_id));
  const int  attempts = std::max(settings_.poll_attempts, 1);

  std::string last_error;
  for (int attempt = 1; attempt <= attempts; ++attempt) {
    try {
      const auto response = transport_->Send(AuthorizedRequest("GET", url));
      if (!response.ok()) {
        last_error = "HTTP " + std::to_string(response.status) + ": " + response.body;
      } else {
        lipsync::v1::TaskStatusResponse status;
        if (FromJson(response.body, &status)) {
          return status;
        }
        last_error = "unparsable status response: " + response.body;
      }
    } catch (const util::TransportError& e) {
      last_error = e.what();
    }

    LIPSYNC_LOG_WARN(logger_, "Poll attempt failed",
                     {StringField("task_id", task_id), IntField("attempt", attempt), StringField("error", last_error)});
    if (attempt < attempts) {
      util::SleepFor(settings_.poll_retry_backoff);
    }
  }

  throw util::PollError("Polling task " + task_id + " failed after " + std::to_string(attempts) + " attempts: " + last_error);
}

TaskOutcome TaskQueueClient::WaitForCompletion(const std::string& task_id, const ProgressObserver& observer,
                                               const util::CancellationToken& cancel) const {
  const auto start = util::Now();

  std::string last_status;
  int         counter = 0;
  while (true) {
    if (cancel.IsCancelled()) {
      throw util::PollError("Stopped waiting for task " + task_id);
    }

    TaskOutcome outcome;
    outcome.task_id  = task_id;
    outcome.response = Poll(task_id);
    outcome.status   = ParseTaskStatus(outcome.response.status());

    const bool changed = outcome.response.status() != last_status;
    if (changed) {
      LIPSYNC_LOG_INFO(logger_, "Task status", {StringField("task_id", task_id), StringField("status", outcome.response.status())});
      last_status = outcome.response.status();
    }
    if (outcome.status == TaskStatus::kRunning) {
      counter = std::min(counter + 1, kMaxProgressCounter);
    }
    if (observer && (changed || outcome.status == TaskStatus::kRunning)) {
      observer(last_status, counter);
    }

    if (IsTerminal(outcome.status)) {
      return outcome;
    }

    if (settings_.wait_ceiling.count() > 0 && util::Now() - start + settings_.poll_interval >= settings_.wait_ceiling) {
      throw util::PollError("Task " + task_id + " still " + last_status + " after the client wait ceiling");
    }
    util::SleepFor(settings_.poll_interval);
  }
}

std::filesystem::path TaskQueueClient::Fetch(const lipsync::v1::TaskStatusResponse& status, const std::filesystem::path& output) const {
  if (status.outputs().empty()) {
    throw util::NoOutputError("Task completed but returned no outputs");
  }
  const auto& url = status.outputs(0).url();
  if (url.empty()) {
    throw util::NoOutputError("Task output has no URL");
  }
  if (status.outputs_size() > 1) {
    LIPSYNC_LOG_INFO(logger_, "Task has additional outputs, downloading the first", {IntField("outputs", status.outputs_size())});
  }

  net::HttpRequest request;
  request.method  = "GET";
  request.url     = url;
  request.timeout = settings_.download_timeout;

  const auto    part  = PartPath(output);
  std::uint64_t bytes = 0;

  LIPSYNC_LOG_INFO(logger_, "Downloading output", {StringField("url", url), StringField("output", output.string())});
  net::HttpResponse response;
  {
    std::ofstream out(part, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw util::DownloadError("Cannot open " + part.string() + " for writing");
    }
    try {
      response = transport_->Stream(request, settings_.download_chunk_bytes, [&](std::string_view chunk) {
        out.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        if (!out) {
          throw util::DownloadError("Write to " + part.string() + " failed");
        }
        bytes += chunk.size();
      });
    } catch (const util::TransportError& e) {
      LIPSYNC_LOG_ERROR(logger_, "Download interrupted, partial file kept",
                        {StringField("part", part.string()), IntField("bytes", static_cast<std::int64_t>(bytes))});
      throw util::DownloadError(std::string("Download failed: ") + e.what());
    } catch (const std::invalid_argument& e) {
      throw util::DownloadError(std::string("Download failed: ") + e.what());
    }
  }

  if (!response.ok()) {
    throw util::DownloadError("Download failed: HTTP " + std::to_string(response.status) + " for " + url);
  }

  std::filesystem::rename(part, output);
  LIPSYNC_LOG_INFO(logger_, "Video saved", {StringField("output", output.string()), IntField("bytes", static_cast<std::int64_t>(bytes))});
  return output;
}

std::filesystem::path TaskQueueClient::SaveInline(const std::string& base64, const std::filesystem::path& output) const {
  const auto bytes = util::Base64Decode(base64);
  const auto part  = PartPath(output);
  {
    std::ofstream out(part, std::ios::binary | std::ios::trunc);
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
      throw util::DownloadError("Write to " + part.string() + " failed");
    }
  }
  std::filesystem::rename(part, output);
  LIPSYNC_LOG_INFO(logger_, "Video saved", {StringField("output", output.string()), IntField("bytes", static_cast<std::int64_t>(bytes.size()))});
  return output;
}

lipsync::v1::JobResult TaskQueueClient::CallSync(const std::string& endpoint_url, const lipsync::v1::JobRequest& payload) const {
  auto request = AuthorizedRequest("POST", endpoint_url);
  request.headers.emplace_back("Content-Type", "application/json");
  request.body = ToJson(payload);
  // The job runs inside this request.
  request.timeout = std::max(settings_.download_timeout, settings_.request_timeout);

  net::HttpResponse response;
  try {
    response = transport_->Send(request);
  } catch (const util::TransportError& e) {
    throw util::SubmissionError(std::string("Synchronous call failed: ") + e.what());
  } catch (const std::invalid_argument& e) {
    throw util::SubmissionError(std::string("Synchronous call failed: ") + e.what());
  }
  if (!response.ok()) {
    throw util::SubmissionError("Synchronous call failed: HTTP " + std::to_string(response.status) + ": " + response.body);
  }

  lipsync::v1::JobResult result;
  if (!FromJson(response.body, &result)) {
    throw util::SubmissionError("Synchronous call returned an unexpected body: " + response.body);
  }
  return result;
}

} // namespace lipsync::client
