#include "internal/worker/job_processor.hpp"

#include <cctype>
#include <fstream>
#include <sstream>

#include "internal/net/url.hpp"
#include "internal/util/base64.hpp"
#include "internal/util/error_result.hpp"
#include "internal/util/errors.hpp"

namespace lipsync::worker {

using lipsync::observability::IntField;
using lipsync::observability::StringField;

namespace {

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw util::NotFoundError("Output video file not readable: " + path.string());
  }
  std::ostringstream bytes;
  bytes << in.rdbuf();
  return bytes.str();
}

void RequireFile(const std::filesystem::path& path, input::MediaKind kind) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    std::string medium(input::ToString(kind));
    medium[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(medium[0])));
    throw util::ValidationError(medium + " file not found: " + path.string());
  }
}

} // namespace

JobProcessor::JobProcessor(ProcessorSettings settings, input::InputMaterializer materializer, workflow::ParameterInjector injector,
                           execution::ExecutionMonitor monitor, net::HttpTransportPtr transport, observability::Logger logger)
    : settings_(std::move(settings)),
      materializer_(std::move(materializer)),
      injector_(std::move(injector)),
      monitor_(std::move(monitor)),
      transport_(std::move(transport)),
      logger_(std::move(logger)) {
}

std::filesystem::path JobProcessor::Execute(const input::ValidatedRequest& request, const input::JobWorkspace& workspace,
                                            const util::CancellationToken& cancel) const {
  const auto primary = materializer_.Materialize(request.primary, request.primary_kind, workspace);
  const auto audio   = materializer_.Materialize(request.audio, input::MediaKind::kAudio, workspace);
  RequireFile(primary, request.primary_kind);
  RequireFile(audio, input::MediaKind::kAudio);

  const auto& template_path =
      request.primary_kind == input::MediaKind::kVideo ? settings_.video_template : settings_.image_template;
  const auto graph_template = workflow::JobGraph::LoadFile(template_path);

  workflow::InjectionParams params;
  params.primary_kind  = request.primary_kind;
  params.primary       = primary;
  params.audio         = audio;
  params.prompt        = request.prompt.empty() ? settings_.default_prompt : request.prompt;
  params.width         = request.width.value_or(settings_.default_width);
  params.height        = request.height.value_or(settings_.default_height);
  params.force_offload = request.force_offload.value_or(settings_.default_force_offload);
  params.frame_count   = request.max_frame;

  LIPSYNC_LOG_INFO(logger_, "Settings",
                   {StringField("workspace", workspace.id()), StringField("prompt", params.prompt),
                    IntField("width", params.width), IntField("height", params.height),
                    observability::BoolField("force_offload", params.force_offload)});

  const auto graph   = injector_.Inject(graph_template, params);
  const auto observe = [this, &workspace](execution::ExecutionState state, const std::string&) {
    if (!execution::IsTerminal(state)) {
      return;
    }
    LIPSYNC_LOG_INFO(logger_, "Execution finished",
                     {StringField("workspace", workspace.id()), StringField("state", execution::ToString(state))});
  };
  return monitor_.Run(graph, cancel, observe).result;
}

lipsync::v1::JobResult JobProcessor::ProcessSync(const lipsync::v1::JobRequest& request, const util::CancellationToken& cancel) const {
  LIPSYNC_LOG_INFO(logger_, "Received request", {StringField("input", input::DescribeForLog(request))});
  try {
    const auto validated = input::ValidateJobRequest(request, logger_);

    input::JobWorkspace workspace(settings_.work_root, settings_.keep_workspace, logger_);
    const auto          artifact = Execute(validated, workspace, cancel);

    lipsync::v1::JobResult result;
    result.set_video(util::Base64Encode(ReadFile(artifact)));
    LIPSYNC_LOG_INFO(logger_, "Video generated", {StringField("path", artifact.string()), IntField("base64_chars", static_cast<std::int64_t>(result.video().size()))});
    return result;
  } catch (const std::exception& e) {
    LIPSYNC_LOG_ERROR(logger_, "Job failed", {StringField("error", e.what())});
    return util::ToJobResult(e);
  }
}

lipsync::v1::JobResult JobProcessor::ProcessAsync(const lipsync::v1::JobRequest& request, const util::CancellationToken& cancel) const {
  LIPSYNC_LOG_INFO(logger_, "Received async task", {StringField("input", input::DescribeForLog(request))});
  try {
    const auto validated = input::ValidateJobRequest(request, logger_);

    input::JobWorkspace workspace(settings_.work_root, settings_.keep_workspace, logger_);
    const auto          artifact = Execute(validated, workspace, cancel);

    std::filesystem::create_directories(settings_.output_dir);
    auto extension = artifact.extension().string();
    if (extension.empty()) {
      extension = ".mp4";
    }
    const auto output = std::filesystem::absolute(settings_.output_dir / (workspace.id() + extension));
    std::filesystem::copy_file(artifact, output, std::filesystem::copy_options::overwrite_existing);
    LIPSYNC_LOG_INFO(logger_, "Saving output", {StringField("path", output.string())});

    lipsync::v1::JobResult result;
    result.set_status("success");
    result.set_output_path(output.string());
    if (settings_.upload_url.empty()) {
      result.set_message("Video generated and saved");
    } else {
      result.set_output_url(Upload(output));
      result.set_message("Video generated and uploaded");
    }
    return result;
  } catch (const std::exception& e) {
    LIPSYNC_LOG_ERROR(logger_, "Async task failed", {StringField("error", e.what())});
    return util::ToJobResult(e);
  }
}

std::string JobProcessor::Upload(const std::filesystem::path& file) const {
  net::HttpRequest request;
  request.method  = "PUT";
  request.url     = net::ExpandTemplate(settings_.upload_url, "{name}", file.filename().string());
  request.timeout = settings_.upload_timeout;
  request.headers.emplace_back("Content-Type", "video/mp4");
  request.body = ReadFile(file);

  net::HttpResponse response;
  try {
    response = transport_->Send(request);
  } catch (const util::TransportError& e) {
    throw util::TransportError(std::string("Upload failed: ") + e.what());
  }
  if (!response.ok()) {
    throw util::TransportError("Upload failed: HTTP " + std::to_string(response.status) + " for " + request.url);
  }

  LIPSYNC_LOG_INFO(logger_, "Output uploaded", {StringField("url", request.url), IntField("bytes", static_cast<std::int64_t>(request.body.size()))});
  return request.url;
}

} // namespace lipsync::worker
