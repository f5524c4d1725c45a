#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/workflow/job_graph.hpp"

namespace lipsync::workflow {

enum class Role : std::uint8_t {
  kImage      = 0,
  kVideo      = 1,
  kAudio      = 2,
  kPrompt     = 3,
  kWidth      = 4,
  kHeight     = 5,
  kFrameCount = 6,
  kOffload    = 7,
};

std::string_view    ToString(Role role);
std::optional<Role> RoleFromName(std::string_view name);

/*
  How a role is found in a template and which input it writes.

  A node matches when its class_type is one of `class_types` and, if `title`
  is set, its _meta.title equals it ignoring case. The preferred id is taken
  whenever that node exists with an accepted class type, title or not.
*/
struct RoleBinding {
  std::string              preferred_id;
  std::vector<std::string> class_types;
  std::string              title;
  std::string              field;
  bool                     required = false;
};

using RoleBindings = std::map<Role, RoleBinding>;

// Bindings for the stock image/video lip-sync templates.
RoleBindings DefaultRoleBindings();

// Overlays config entries on `base`. Empty config fields keep the base value.
// Throws util::ValidationError for an unknown role name.
RoleBindings MergeRoleBindings(RoleBindings base,
                               const google::protobuf::Map<std::string, lipsync::runtime::config::RoleBinding>& overrides);

/*
  RoleTable

  Role → node id, resolved once per template:

      1. preferred id, if present and of an accepted class
      2. otherwise the first matching node in ascending node-id order

  Every decision is logged.
*/
class RoleTable {
 public:
  static RoleTable Build(const JobGraph& graph, const RoleBindings& bindings, const observability::Logger& logger);

  std::optional<std::string> NodeFor(Role role) const;

 private:
  std::map<Role, std::string> nodes_;
};

} // namespace lipsync::workflow
