#include "internal/workflow/role_table.hpp"

#include <algorithm>
#include <cctype>

#include "internal/util/errors.hpp"

namespace lipsync::workflow {
namespace {

constexpr Role kAllRoles[] = {
    Role::kImage, Role::kVideo, Role::kAudio, Role::kPrompt, Role::kWidth, Role::kHeight, Role::kFrameCount, Role::kOffload,
};

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
  return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
         });
}

bool AcceptsClass(const RoleBinding& binding, const std::string& class_type) {
  return std::find(binding.class_types.begin(), binding.class_types.end(), class_type) != binding.class_types.end();
}

bool Matches(const JobGraph& graph, const std::string& node_id, const RoleBinding& binding) {
  if (!AcceptsClass(binding, graph.ClassType(node_id))) {
    return false;
  }
  return binding.title.empty() || EqualsIgnoreCase(graph.Title(node_id), binding.title);
}

} // namespace

std::string_view ToString(Role role) {
  switch (role) {
    case Role::kImage:
      return "image";
    case Role::kVideo:
      return "video";
    case Role::kAudio:
      return "audio";
    case Role::kPrompt:
      return "prompt";
    case Role::kWidth:
      return "width";
    case Role::kHeight:
      return "height";
    case Role::kFrameCount:
      return "frame_count";
    case Role::kOffload:
      return "offload";
  }
  return "unknown";
}

std::optional<Role> RoleFromName(std::string_view name) {
  for (Role role : kAllRoles) {
    if (ToString(role) == name) {
      return role;
    }
  }
  return std::nullopt;
}

RoleBindings DefaultRoleBindings() {
  RoleBindings bindings;
  bindings[Role::kImage]      = {"284", {"LoadImage"}, "", "image", true};
  bindings[Role::kVideo]      = {"228", {"VHS_LoadVideo"}, "", "video", true};
  bindings[Role::kAudio]      = {"125", {"LoadAudio"}, "", "audio", true};
  bindings[Role::kPrompt]     = {"241", {"WanVideoTextEncode", "WanVideoTextEncodeCached"}, "", "positive_prompt", true};
  bindings[Role::kWidth]      = {"245", {"INTConstant"}, "Width", "value", false};
  bindings[Role::kHeight]     = {"246", {"INTConstant"}, "Height", "value", false};
  bindings[Role::kFrameCount] = {"270", {"INTConstant"}, "Max frames", "value", false};
  bindings[Role::kOffload]    = {"128", {"WanVideoSampler"}, "", "force_offload", false};
  return bindings;
}

RoleBindings MergeRoleBindings(RoleBindings base,
                               const google::protobuf::Map<std::string, lipsync::runtime::config::RoleBinding>& overrides) {
  for (const auto& [name, cfg] : overrides) {
    auto role = RoleFromName(name);
    if (!role) {
      throw util::ValidationError("unknown workflow role in config: " + name);
    }

    auto& binding = base[*role];
    if (!cfg.preferred_id().empty()) {
      binding.preferred_id = cfg.preferred_id();
    }
    if (cfg.class_types_size() > 0) {
      binding.class_types.assign(cfg.class_types().begin(), cfg.class_types().end());
    }
    if (!cfg.title().empty()) {
      binding.title = cfg.title();
    }
    if (!cfg.field().empty()) {
      binding.field = cfg.field();
    }
    // proto3 bool has no presence; a listed role can only be made required.
    binding.required = binding.required || cfg.required();
  }
  return base;
}

RoleTable RoleTable::Build(const JobGraph& graph, const RoleBindings& bindings, const observability::Logger& logger) {
  RoleTable table;
  const auto ids = graph.NodeIds();

  for (const auto& [role, binding] : bindings) {
    if (!binding.preferred_id.empty() && graph.Has(binding.preferred_id) &&
        AcceptsClass(binding, graph.ClassType(binding.preferred_id))) {
      table.nodes_[role] = binding.preferred_id;
      LIPSYNC_LOG_DEBUG(logger, "Role resolved",
                        {observability::StringField("role", ToString(role)),
                         observability::StringField("node", binding.preferred_id),
                         observability::StringField("via", "preferred_id")});
      continue;
    }

    std::vector<std::string> candidates;
    for (const auto& id : ids) {
      if (Matches(graph, id, binding)) {
        candidates.push_back(id);
      }
    }
    if (candidates.empty()) {
      continue;
    }

    table.nodes_[role] = candidates.front();
    LIPSYNC_LOG_INFO(logger, "Role resolved by search",
                     {observability::StringField("role", ToString(role)),
                      observability::StringField("node", candidates.front()),
                      observability::StringField("preferred_id", binding.preferred_id),
                      observability::IntField("candidates", static_cast<std::int64_t>(candidates.size()))});
  }

  return table;
}

std::optional<std::string> RoleTable::NodeFor(Role role) const {
  auto it = nodes_.find(role);
  if (it == nodes_.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace lipsync::workflow
