#include "internal/workflow/job_graph.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace lipsync::workflow {
namespace {

bool IsNumeric(const std::string& s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
}

std::string StripLeadingZeros(const std::string& s) {
  const auto first = s.find_first_not_of('0');
  return first == std::string::npos ? "0" : s.substr(first);
}

} // namespace

bool NodeIdLess(const std::string& a, const std::string& b) {
  const bool a_num = IsNumeric(a);
  const bool b_num = IsNumeric(b);
  if (a_num != b_num) {
    return a_num;
  }
  if (a_num) {
    const auto sa = StripLeadingZeros(a);
    const auto sb = StripLeadingZeros(b);
    if (sa.size() != sb.size()) {
      return sa.size() < sb.size();
    }
    if (sa != sb) {
      return sa < sb;
    }
  }
  return a < b;
}

google::protobuf::Value StringValue(const std::string& value) {
  google::protobuf::Value v;
  v.set_string_value(value);
  return v;
}

google::protobuf::Value NumberValue(double value) {
  google::protobuf::Value v;
  v.set_number_value(value);
  return v;
}

google::protobuf::Value BoolValue(bool value) {
  google::protobuf::Value v;
  v.set_bool_value(value);
  return v;
}

JobGraph::JobGraph(google::protobuf::Struct nodes) : nodes_(std::move(nodes)) {
}

JobGraph JobGraph::FromJson(const std::string& json) {
  google::protobuf::Struct nodes;
  auto                     status = google::protobuf::util::JsonStringToMessage(json, &nodes);
  if (!status.ok()) {
    throw util::ValidationError("Invalid workflow JSON: " + std::string(status.message()));
  }
  return JobGraph(std::move(nodes));
}

JobGraph JobGraph::LoadFile(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    throw util::ValidationError("Workflow template not readable: " + path.string());
  }
  std::ostringstream text;
  text << in.rdbuf();
  return FromJson(text.str());
}

std::string JobGraph::ToJson() const {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(nodes_, &json);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize job graph: " + std::string(status.message()));
  }
  return json;
}

std::vector<std::string> JobGraph::NodeIds() const {
  std::vector<std::string> ids;
  ids.reserve(nodes_.fields_size());
  for (const auto& [id, value] : nodes_.fields()) {
    if (value.kind_case() == google::protobuf::Value::kStructValue) {
      ids.push_back(id);
    }
  }
  std::sort(ids.begin(), ids.end(), NodeIdLess);
  return ids;
}

const google::protobuf::Struct* JobGraph::Node(const std::string& node_id) const {
  auto it = nodes_.fields().find(node_id);
  if (it == nodes_.fields().end() || it->second.kind_case() != google::protobuf::Value::kStructValue) {
    return nullptr;
  }
  return &it->second.struct_value();
}

bool JobGraph::Has(const std::string& node_id) const {
  return Node(node_id) != nullptr;
}

std::string JobGraph::ClassType(const std::string& node_id) const {
  const auto* node = Node(node_id);
  if (!node) {
    return {};
  }
  auto it = node->fields().find("class_type");
  if (it == node->fields().end() || it->second.kind_case() != google::protobuf::Value::kStringValue) {
    return {};
  }
  return it->second.string_value();
}

std::string JobGraph::Title(const std::string& node_id) const {
  const auto* node = Node(node_id);
  if (!node) {
    return {};
  }
  auto meta = node->fields().find("_meta");
  if (meta == node->fields().end() || meta->second.kind_case() != google::protobuf::Value::kStructValue) {
    return {};
  }
  auto title = meta->second.struct_value().fields().find("title");
  if (title == meta->second.struct_value().fields().end() || title->second.kind_case() != google::protobuf::Value::kStringValue) {
    return {};
  }
  return title->second.string_value();
}

const google::protobuf::Value* JobGraph::Input(const std::string& node_id, const std::string& field) const {
  const auto* node = Node(node_id);
  if (!node) {
    return nullptr;
  }
  auto inputs = node->fields().find("inputs");
  if (inputs == node->fields().end() || inputs->second.kind_case() != google::protobuf::Value::kStructValue) {
    return nullptr;
  }
  auto it = inputs->second.struct_value().fields().find(field);
  if (it == inputs->second.struct_value().fields().end()) {
    return nullptr;
  }
  return &it->second;
}

void JobGraph::SetInput(const std::string& node_id, const std::string& field, google::protobuf::Value value) {
  auto it = nodes_.mutable_fields()->find(node_id);
  if (it == nodes_.mutable_fields()->end() || it->second.kind_case() != google::protobuf::Value::kStructValue) {
    throw std::out_of_range("job graph has no node " + node_id);
  }

  auto& node_fields = *it->second.mutable_struct_value()->mutable_fields();
  auto& inputs      = node_fields["inputs"];
  if (inputs.kind_case() != google::protobuf::Value::kStructValue) {
    inputs.mutable_struct_value();
  }
  (*inputs.mutable_struct_value()->mutable_fields())[field] = std::move(value);
}

} // namespace lipsync::workflow
