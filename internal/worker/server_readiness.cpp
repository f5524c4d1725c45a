#include "internal/worker/server_readiness.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace lipsync::worker {

using lipsync::observability::IntField;
using lipsync::observability::StringField;

std::chrono::milliseconds WaitForServerReady(const execution::InferenceApi& api, const ReadinessSettings& settings,
                                             const observability::Logger& logger) {
  const auto start    = util::Now();
  const auto deadline = start + settings.ceiling;

  LIPSYNC_LOG_INFO(logger, "Waiting for inference server", {StringField("url", api.BaseUrl())});
  for (int attempt = 1;; ++attempt) {
    if (api.Ping()) {
      const auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(util::Now() - start);
      LIPSYNC_LOG_INFO(logger, "Inference server ready", {IntField("waited_ms", waited.count()), IntField("attempts", attempt)});
      return waited;
    }
    if (util::Now() + settings.interval >= deadline) {
      throw util::ConnectTimeout("Inference server at " + api.BaseUrl() + " not ready after " + std::to_string(attempt) +
                                 " attempts");
    }
    util::SleepFor(settings.interval);
  }
}

} // namespace lipsync::worker
