#pragma once

#include <filesystem>
#include <string>

#include "internal/observability/logging.hpp"

namespace lipsync::input {

/*
  JobWorkspace

  Per-job scratch directory <root>/task_<uuid>. Names are unique per job, so
  concurrent jobs never share files and nothing needs locking. The directory
  is removed on destruction unless `keep` is set.
*/
class JobWorkspace {
 public:
  JobWorkspace(const std::filesystem::path& root, bool keep, observability::Logger logger);
  ~JobWorkspace();

  JobWorkspace(const JobWorkspace&)            = delete;
  JobWorkspace& operator=(const JobWorkspace&) = delete;

  const std::string&           id() const { return id_; }
  const std::filesystem::path& path() const { return path_; }

  std::filesystem::path File(const std::string& name) const;

 private:
  std::string           id_;
  std::filesystem::path path_;
  bool                  keep_;
  observability::Logger logger_;
};

} // namespace lipsync::input
