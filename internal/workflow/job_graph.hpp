#pragma once

#include <google/protobuf/struct.pb.h>

#include <filesystem>
#include <string>
#include <vector>

namespace lipsync::workflow {

/*
  JobGraph

  The node-graph job in the inference server's API format:

      { "<node id>": { "class_type": "...", "_meta": {"title": "..."},
                       "inputs": { "<field>": <scalar | [node, slot]> } } }

  Backed by google.protobuf.Struct, whose map has no stable order; every
  traversal goes through NodeIds(), which sorts ids ascending with numeric
  ids compared as numbers.
*/
class JobGraph {
 public:
  JobGraph() = default;
  explicit JobGraph(google::protobuf::Struct nodes);

  // Throws util::ValidationError when the text is not a JSON object.
  static JobGraph FromJson(const std::string& json);
  static JobGraph LoadFile(const std::filesystem::path& path);

  std::string ToJson() const;

  const google::protobuf::Struct& nodes() const { return nodes_; }

  std::vector<std::string> NodeIds() const;

  bool        Has(const std::string& node_id) const;
  std::string ClassType(const std::string& node_id) const;
  std::string Title(const std::string& node_id) const;

  // nullptr when the node or the field does not exist.
  const google::protobuf::Value* Input(const std::string& node_id, const std::string& field) const;

  // Creates the node's "inputs" object when missing. The node must exist.
  void SetInput(const std::string& node_id, const std::string& field, google::protobuf::Value value);

 private:
  const google::protobuf::Struct* Node(const std::string& node_id) const;

  google::protobuf::Struct nodes_;
};

// Ascending order, numeric ids first and compared numerically.
bool NodeIdLess(const std::string& a, const std::string& b);

google::protobuf::Value StringValue(const std::string& value);
google::protobuf::Value NumberValue(double value);
google::protobuf::Value BoolValue(bool value);

} // namespace lipsync::workflow
