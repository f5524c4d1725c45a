#include "internal/util/error_result.hpp"

#include "internal/util/errors.hpp"

namespace lipsync::util {

int ToExitCode(const std::exception& e) {
  if (dynamic_cast<const ValidationError*>(&e)) {
    return kExitUsage;
  }
  if (dynamic_cast<const std::invalid_argument*>(&e)) {
    return kExitUsage;
  }

  return kExitFailure;
}

lipsync::v1::JobResult ToJobResult(const std::exception& e) {
  lipsync::v1::JobResult result;
  result.set_error(e.what());
  return result;
}

} // namespace lipsync::util
