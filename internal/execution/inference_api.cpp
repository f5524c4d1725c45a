#include "internal/execution/inference_api.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <vector>

#include "internal/net/url.hpp"
#include "internal/util/errors.hpp"

namespace lipsync::execution {

using lipsync::observability::IntField;
using lipsync::observability::StringField;

namespace {

// Output node ids of `prompt_id` in document order. The JSON is read a second
// time with yaml-cpp because protobuf maps do not keep insertion order.
std::vector<std::string> OutputKeysInDocumentOrder(const std::string& body, const std::string& prompt_id) {
  const YAML::Node document = YAML::Load(body);
  if (!document.IsMap()) {
    return {};
  }
  const YAML::Node entry = document[prompt_id];
  if (!entry || !entry.IsMap()) {
    return {};
  }
  const YAML::Node outputs = entry["outputs"];
  if (!outputs || !outputs.IsMap()) {
    return {};
  }

  std::vector<std::string> keys;
  for (const auto& item : outputs) {
    if (item.first.IsScalar()) {
      keys.push_back(item.first.Scalar());
    }
  }
  return keys;
}

} // namespace

InferenceApi::InferenceApi(net::HttpTransportPtr transport, std::string host, std::uint16_t port,
                           std::chrono::milliseconds request_timeout, observability::Logger logger)
    : transport_(std::move(transport)),
      host_(std::move(host)),
      port_(port),
      request_timeout_(request_timeout),
      logger_(std::move(logger)) {
}

std::string InferenceApi::BaseUrl() const {
  return "http://" + host_ + ":" + std::to_string(port_);
}

std::string InferenceApi::EventsUrl(const std::string& client_id) const {
  return "ws://" + host_ + ":" + std::to_string(port_) + "/ws?clientId=" + net::PercentEncode(client_id);
}

lipsync::v1::QueuePromptResponse InferenceApi::QueuePrompt(const workflow::JobGraph& graph, const std::string& client_id) const {
  lipsync::v1::QueuePromptRequest body;
  *body.mutable_prompt() = graph.nodes();
  body.set_client_id(client_id);

  google::protobuf::util::JsonPrintOptions print_options;
  print_options.preserve_proto_field_names = true;

  net::HttpRequest request;
  request.method  = "POST";
  request.url     = BaseUrl() + "/prompt";
  request.timeout = request_timeout_;
  request.headers.emplace_back("Content-Type", "application/json");
  auto status = google::protobuf::util::MessageToJsonString(body, &request.body, print_options);
  if (!status.ok()) {
    throw util::SubmissionError("Failed to encode job graph: " + std::string(status.message()));
  }

  net::HttpResponse response;
  try {
    response = transport_->Send(request);
  } catch (const util::TransportError& e) {
    throw util::SubmissionError(std::string("Failed to queue prompt: ") + e.what());
  }

  if (!response.ok()) {
    LIPSYNC_LOG_ERROR(logger_, "Prompt rejected", {IntField("status", response.status), StringField("body", response.body)});
    throw util::SubmissionError("Failed to queue prompt: HTTP " + std::to_string(response.status) + ": " + response.body);
  }

  google::protobuf::util::JsonParseOptions parse_options;
  parse_options.ignore_unknown_fields = true;

  lipsync::v1::QueuePromptResponse queued;
  status = google::protobuf::util::JsonStringToMessage(response.body, &queued, parse_options);
  if (!status.ok() || queued.prompt_id().empty()) {
    throw util::SubmissionError("Failed to queue prompt: unexpected response: " + response.body);
  }

  LIPSYNC_LOG_INFO(logger_, "Queued prompt", {StringField("prompt_id", queued.prompt_id()), StringField("client_id", client_id)});
  return queued;
}

std::optional<lipsync::v1::HistoryEntry> InferenceApi::GetHistory(const std::string& prompt_id) const {
  net::HttpRequest request;
  request.method  = "GET";
  request.url     = BaseUrl() + "/history/" + net::PercentEncode(prompt_id);
  request.timeout = request_timeout_;

  net::HttpResponse response;
  try {
    response = transport_->Send(request);
  } catch (const util::TransportError& e) {
    throw util::ExecutionError(std::string("History fetch failed: ") + e.what());
  }
  if (!response.ok()) {
    throw util::ExecutionError("History fetch failed: HTTP " + std::to_string(response.status));
  }

  // The top level is keyed by prompt id, so it is read as a Struct first.
  google::protobuf::Struct all;
  auto                     status = google::protobuf::util::JsonStringToMessage(response.body, &all);
  if (!status.ok()) {
    throw util::ExecutionError("History fetch failed: malformed response: " + std::string(status.message()));
  }

  auto it = all.fields().find(prompt_id);
  if (it == all.fields().end()) {
    LIPSYNC_LOG_DEBUG(logger_, "No history for prompt yet", {StringField("prompt_id", prompt_id)});
    return std::nullopt;
  }

  std::string entry_json;
  status = google::protobuf::util::MessageToJsonString(it->second, &entry_json);
  if (!status.ok()) {
    throw util::ExecutionError("History fetch failed: " + std::string(status.message()));
  }

  google::protobuf::util::JsonParseOptions parse_options;
  parse_options.ignore_unknown_fields = true;

  lipsync::v1::HistoryEntry entry;
  status = google::protobuf::util::JsonStringToMessage(entry_json, &entry, parse_options);
  if (!status.ok()) {
    throw util::ExecutionError("History fetch failed: unexpected entry: " + std::string(status.message()));
  }

  std::vector<std::string> order;
  try {
    order = OutputKeysInDocumentOrder(response.body, prompt_id);
  } catch (const YAML::Exception& e) {
    LIPSYNC_LOG_WARN(logger_, "History output order unavailable, using node id order",
                     {StringField("prompt_id", prompt_id), StringField("error", e.what())});
  }

  // Anything the ordered read missed goes last, by node id.
  std::vector<std::string> rest;
  for (const auto& [node_id, output] : entry.outputs()) {
    if (std::find(order.begin(), order.end(), node_id) == order.end()) {
      rest.push_back(node_id);
    }
  }
  std::sort(rest.begin(), rest.end(), workflow::NodeIdLess);

  entry.clear_output_order();
  for (const auto& node_id : order) {
    if (entry.outputs().count(node_id) != 0) {
      entry.add_output_order(node_id);
    }
  }
  for (const auto& node_id : rest) {
    entry.add_output_order(node_id);
  }
  return entry;
}

bool InferenceApi::Ping() const {
  net::HttpRequest request;
  request.method  = "GET";
  request.url     = BaseUrl() + "/";
  request.timeout = request_timeout_;

  try {
    return transport_->Send(request).ok();
  } catch (const util::TransportError& e) {
    LIPSYNC_LOG_DEBUG(logger_, "Inference server not reachable", {StringField("error", e.what())});
    return false;
  }
}

} // namespace lipsync::execution
