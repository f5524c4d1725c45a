#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "internal/net/http_transport.hpp"
#include "internal/observability/logging.hpp"
#include "internal/workflow/job_graph.hpp"
#include "lipsync/v1/inference.pb.h"

namespace lipsync::execution {

/*
  InferenceApi

  HTTP side of the inference server:

      POST /prompt               enqueue a job graph
      GET  /history/<prompt_id>  outputs of a finished job
      GET  /                     readiness probe

  plus the realtime channel URL for a correlation id.
*/
class InferenceApi {
 public:
  InferenceApi(net::HttpTransportPtr transport, std::string host, std::uint16_t port, std::chrono::milliseconds request_timeout,
               observability::Logger logger);

  std::string BaseUrl() const;
  std::string EventsUrl(const std::string& client_id) const;

  // Throws util::SubmissionError carrying the response body on any
  // non-success answer or a response without prompt_id.
  lipsync::v1::QueuePromptResponse QueuePrompt(const workflow::JobGraph& graph, const std::string& client_id) const;

  // Entry for `prompt_id`, or std::nullopt while the server has no record of
  // it. output_order lists the output nodes as the server listed them.
  // Throws util::ExecutionError when the history cannot be fetched.
  std::optional<lipsync::v1::HistoryEntry> GetHistory(const std::string& prompt_id) const;

  // True when the server answers GET / with 2xx.
  bool Ping() const;

 private:
  net::HttpTransportPtr     transport_;
  std::string               host_;
  std::uint16_t             port_;
  std::chrono::milliseconds request_timeout_;
  observability::Logger     logger_;
};

} // namespace lipsync::execution
