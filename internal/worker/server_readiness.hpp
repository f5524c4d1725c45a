#pragma once

#include <chrono>

#include "internal/execution/inference_api.hpp"
#include "internal/observability/logging.hpp"

namespace lipsync::worker {

struct ReadinessSettings {
  std::chrono::milliseconds interval{std::chrono::seconds(1)};
  std::chrono::milliseconds ceiling{std::chrono::seconds(180)};
};

/*
  Blocks until the inference server answers GET / with 2xx.

  Returns the time spent waiting. Throws util::ConnectTimeout once the
  ceiling has passed.
*/
std::chrono::milliseconds WaitForServerReady(const execution::InferenceApi& api, const ReadinessSettings& settings,
                                             const observability::Logger& logger);

} // namespace lipsync::worker
