#pragma once

#include <exception>

#include "lipsync/v1/job.pb.h"

namespace lipsync::util {

/*
  Converts internal exceptions into process-boundary results.
*/

constexpr int kExitSuccess = 0;
constexpr int kExitUsage   = 1;
constexpr int kExitFailure = 2;

// kExitUsage for missing or invalid input, kExitFailure for everything else.
int ToExitCode(const std::exception& e);

lipsync::v1::JobResult ToJobResult(const std::exception& e);

} // namespace lipsync::util
