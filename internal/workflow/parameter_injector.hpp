#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "internal/input/input_reference.hpp"
#include "internal/observability/logging.hpp"
#include "internal/workflow/job_graph.hpp"
#include "internal/workflow/role_table.hpp"

namespace lipsync::workflow {

struct FrameBudget {
  int fps              = 25;
  int lookahead_frames = 81;
  int default_frames   = 81;
};

// floor(seconds * fps) + lookahead_frames, or std::nullopt when the result
// is not a positive int.
std::optional<int> FramesForDuration(double seconds, const FrameBudget& budget);

// Frame count for an audio file; budget.default_frames (with a warning) when
// the file is not a readable WAV or its duration gives no usable count.
int FramesForAudio(const std::filesystem::path& audio, const FrameBudget& budget, const observability::Logger& logger);

struct InjectionParams {
  input::MediaKind      primary_kind = input::MediaKind::kImage;
  std::filesystem::path primary;
  std::filesystem::path audio;
  std::string           prompt;
  int                   width         = 512;
  int                   height        = 512;
  bool                  force_offload = true;
  // Derived from the audio duration when unset.
  std::optional<int> frame_count;
};

/*
  ParameterInjector

  Writes one job's parameters into a copy of a workflow template. The
  template is never modified. Missing required roles throw
  util::ValidationError; missing optional roles are logged and keep the
  template's values.
*/
class ParameterInjector {
 public:
  ParameterInjector(RoleBindings bindings, FrameBudget budget, observability::Logger logger);

  JobGraph Inject(const JobGraph& graph_template, const InjectionParams& params) const;

 private:
  void Apply(JobGraph& graph, const RoleTable& table, Role role, google::protobuf::Value value) const;

  RoleBindings          bindings_;
  FrameBudget           budget_;
  observability::Logger logger_;
};

} // namespace lipsync::workflow
