#include "internal/workflow/parameter_injector.hpp"

#include <cmath>
#include <cstdint>
#include <limits>

#include "internal/media/wav_probe.hpp"
#include "internal/util/errors.hpp"

namespace lipsync::workflow {

std::optional<int> FramesForDuration(double seconds, const FrameBudget& budget) {
  constexpr std::int64_t kMaxFrames = std::numeric_limits<int>::max();

  const double scaled = std::floor(seconds * budget.fps);
  if (!std::isfinite(scaled) || scaled < 0 || scaled > static_cast<double>(kMaxFrames)) {
    return std::nullopt;
  }
  const std::int64_t frames = static_cast<std::int64_t>(scaled) + budget.lookahead_frames;
  if (frames <= 0 || frames > kMaxFrames) {
    return std::nullopt;
  }
  return static_cast<int>(frames);
}

int FramesForAudio(const std::filesystem::path& audio, const FrameBudget& budget, const observability::Logger& logger) {
  const auto duration = media::ProbeDurationSeconds(audio);
  const auto frames   = duration ? FramesForDuration(*duration, budget) : std::nullopt;
  if (!frames) {
    LIPSYNC_LOG_WARN(logger, "Could not determine audio duration, using default frame count",
                     {observability::StringField("audio", audio.string()),
                      observability::IntField("frames", budget.default_frames)});
    return budget.default_frames;
  }

  LIPSYNC_LOG_INFO(logger, "Frame count from audio",
                   {observability::StringField("duration_s", std::to_string(*duration)), observability::IntField("frames", *frames)});
  return *frames;
}

ParameterInjector::ParameterInjector(RoleBindings bindings, FrameBudget budget, observability::Logger logger)
    : bindings_(std::move(bindings)), budget_(budget), logger_(std::move(logger)) {
}

void ParameterInjector::Apply(JobGraph& graph, const RoleTable& table, Role role, google::protobuf::Value value) const {
  const auto& binding = bindings_.at(role);
  auto        node    = table.NodeFor(role);
  if (!node) {
    if (binding.required) {
      throw util::ValidationError("Workflow template has no node for required role '" + std::string(ToString(role)) + "'");
    }
    LIPSYNC_LOG_WARN(logger_, "Workflow template has no node for optional role, keeping template value",
                     {observability::StringField("role", ToString(role))});
    return;
  }

  graph.SetInput(*node, binding.field, std::move(value));
}

JobGraph ParameterInjector::Inject(const JobGraph& graph_template, const InjectionParams& params) const {
  // Only the roles this job writes take part; the other primary medium is
  // irrelevant to an image job and vice versa.
  RoleBindings active;
  const Role   primary_role = params.primary_kind == input::MediaKind::kVideo ? Role::kVideo : Role::kImage;
  for (const auto& [role, binding] : bindings_) {
    if ((role == Role::kImage || role == Role::kVideo) && role != primary_role) {
      continue;
    }
    active.emplace(role, binding);
  }

  const auto table = RoleTable::Build(graph_template, active, logger_);
  JobGraph   graph = graph_template;

  const int frames = params.frame_count ? *params.frame_count : FramesForAudio(params.audio, budget_, logger_);

  Apply(graph, table, primary_role, StringValue(params.primary.string()));
  Apply(graph, table, Role::kAudio, StringValue(params.audio.string()));
  Apply(graph, table, Role::kPrompt, StringValue(params.prompt));
  Apply(graph, table, Role::kWidth, NumberValue(params.width));
  Apply(graph, table, Role::kHeight, NumberValue(params.height));
  Apply(graph, table, Role::kFrameCount, NumberValue(frames));
  Apply(graph, table, Role::kOffload, BoolValue(params.force_offload));

  LIPSYNC_LOG_INFO(logger_, "Workflow parameters injected",
                   {observability::StringField("mode", input::ToString(params.primary_kind)),
                    observability::IntField("width", params.width), observability::IntField("height", params.height),
                    observability::IntField("frames", frames), observability::BoolField("force_offload", params.force_offload)});
  return graph;
}

} // namespace lipsync::workflow
