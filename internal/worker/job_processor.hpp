#pragma once

#include <chrono>
#include <filesystem>
#include <string>

#include "internal/execution/execution_monitor.hpp"
#include "internal/input/input_materializer.hpp"
#include "internal/input/job_request.hpp"
#include "internal/net/http_transport.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/cancellation.hpp"
#include "internal/workflow/parameter_injector.hpp"
#include "lipsync/v1/job.pb.h"

namespace lipsync::worker {

struct ProcessorSettings {
  std::filesystem::path work_root  = "/tmp";
  std::filesystem::path output_dir = "output";
  // Optional PUT target for async results; "{name}" becomes the file name.
  std::string upload_url;
  bool        keep_workspace = false;

  std::filesystem::path image_template = "workflows/I2V_single.json";
  std::filesystem::path video_template = "workflows/V2V_single.json";

  std::string default_prompt        = "A person talking naturally";
  int         default_width         = 512;
  int         default_height        = 512;
  bool        default_force_offload = true;

  std::chrono::milliseconds upload_timeout{std::chrono::minutes(10)};
};

/*
  JobProcessor

  Body of the worker endpoint. One call handles one request end to end:

      validate → materialize inputs → inject template → execute → deliver

  Failures never escape as exceptions; they come back as JobResult::error.
  Each call uses its own workspace and correlation id, so calls from
  different threads do not interfere.
*/
class JobProcessor {
 public:
  JobProcessor(ProcessorSettings settings, input::InputMaterializer materializer, workflow::ParameterInjector injector,
               execution::ExecutionMonitor monitor, net::HttpTransportPtr transport, observability::Logger logger);

  // {"video": <base64>} on success.
  lipsync::v1::JobResult ProcessSync(const lipsync::v1::JobRequest& request, const util::CancellationToken& cancel = {}) const;

  // Artifact copied to output_dir (and uploaded when configured).
  lipsync::v1::JobResult ProcessAsync(const lipsync::v1::JobRequest& request, const util::CancellationToken& cancel = {}) const;

 private:
  std::filesystem::path Execute(const input::ValidatedRequest& request, const input::JobWorkspace& workspace,
                                const util::CancellationToken& cancel) const;
  std::string           Upload(const std::filesystem::path& file) const;

  ProcessorSettings           settings_;
  input::InputMaterializer    materializer_;
  workflow::ParameterInjector injector_;
  execution::ExecutionMonitor monitor_;
  net::HttpTransportPtr       transport_;
  observability::Logger       logger_;
};

} // namespace lipsync::worker
