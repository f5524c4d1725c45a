#pragma once

#include <optional>
#include <string>

#include "internal/input/input_reference.hpp"
#include "internal/observability/logging.hpp"
#include "lipsync/v1/job.pb.h"

namespace lipsync::input {

/*
  ValidatedRequest

  A JobRequest after the checks that must pass before any network call:
  known input_type and exactly one selected source per required medium.
  Numeric parameters are left optional; defaults are applied by the worker.
*/
struct ValidatedRequest {
  MediaKind      primary_kind = MediaKind::kImage;
  InputReference primary;
  InputReference audio;

  std::string prompt;

  std::optional<int>  width;
  std::optional<int>  height;
  std::optional<int>  max_frame;
  std::optional<bool> force_offload;
};

// Parses the submission JSON. Unknown keys are ignored; malformed JSON or
// wrongly typed values throw util::ValidationError.
lipsync::v1::JobRequest ParseJobRequest(const std::string& json);

/*
  Validates a request and selects one source per medium.

  Precedence when several forms are present: path, then url, then base64.
  The pick is logged as a warning. A medium with no form at all throws
  util::ValidationError.
*/
ValidatedRequest ValidateJobRequest(const lipsync::v1::JobRequest& request, const observability::Logger& logger);

// Same selection rule for a single medium; std::nullopt when none is present.
std::optional<InputReference> SelectSource(const std::string& path, const std::string& url, const std::string& base64);

// Request JSON with base64 payloads shortened, for logging.
std::string DescribeForLog(const lipsync::v1::JobRequest& request);

} // namespace lipsync::input
