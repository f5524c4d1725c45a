#include "internal/input/workspace.hpp"

#include <system_error>

#include "internal/util/uuid.hpp"

namespace lipsync::input {

using lipsync::observability::StringField;

JobWorkspace::JobWorkspace(const std::filesystem::path& root, bool keep, observability::Logger logger)
    : id_("task_" + util::NewUuidString()), path_(root / id_), keep_(keep), logger_(std::move(logger)) {
  std::filesystem::create_directories(path_);
}

JobWorkspace::~JobWorkspace() {
  if (keep_) {
    return;
  }

  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  if (ec) {
    LIPSYNC_LOG_WARN(logger_, "Failed to remove job workspace", {StringField("path", path_.string()), StringField("error", ec.message())});
  }
}

std::filesystem::path JobWorkspace::File(const std::string& name) const {
  return std::filesystem::absolute(path_ / name);
}

} // namespace lipsync::input
