#include "internal/config/config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace lipsync::config {

namespace {

using google::protobuf::Value;
using lipsync::runtime::config::RuntimeConfig;

bool IsBoolLiteral(const std::string& text, bool* out) {
  if (text == "true" || text == "True" || text == "TRUE") {
    *out = true;
    return true;
  }
  if (text == "false" || text == "False" || text == "FALSE") {
    *out = false;
    return true;
  }
  return false;
}

// Decimal numbers only; hex, inf and nan stay strings.
bool IsNumberLiteral(const std::string& text, double* out) {
  if (text.empty()) {
    return false;
  }
  const bool plausible = std::all_of(text.begin(), text.end(), [](unsigned char c) {
    return std::isdigit(c) || c == '-' || c == '+' || c == '.' || c == 'e' || c == 'E';
  });
  if (!plausible) {
    return false;
  }

  char* end = nullptr;
  *out      = std::strtod(text.c_str(), &end);
  return end != nullptr && *end == '\0';
}

Value ScalarToValue(const YAML::Node& node) {
  Value       value;
  const auto& text = node.Scalar();

  // "!" is the tag yaml-cpp gives quoted scalars.
  if (node.Tag() == "!") {
    value.set_string_value(text);
    return value;
  }

  bool   flag   = false;
  double number = 0;
  if (IsBoolLiteral(text, &flag)) {
    value.set_bool_value(flag);
  } else if (IsNumberLiteral(text, &number)) {
    value.set_number_value(number);
  } else {
    value.set_string_value(text);
  }
  return value;
}

Value ToValue(const YAML::Node& node) {
  Value value;
  switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
      value.set_null_value(google::protobuf::NULL_VALUE);
      return value;

    case YAML::NodeType::Scalar:
      return ScalarToValue(node);

    case YAML::NodeType::Sequence: {
      auto* list = value.mutable_list_value();
      for (const auto& item : node) {
        *list->add_values() = ToValue(item);
      }
      return value;
    }

    case YAML::NodeType::Map: {
      auto& fields = *value.mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        if (!entry.first.IsScalar()) {
          throw std::runtime_error("Configuration keys must be scalars");
        }
        fields[entry.first.Scalar()] = ToValue(entry.second);
      }
      return value;
    }
  }
  throw std::runtime_error("Unsupported YAML node");
}

/*
  YAML → google.protobuf.Value → JSON → RuntimeConfig. The JSON parser does
  the typing (durations as "5s", enums, nested messages) and rejects keys
  the schema does not know.
*/
RuntimeConfig FromDocument(const YAML::Node& document, const std::string& origin) {
  RuntimeConfig config;
  if (document.IsNull() || !document.IsDefined()) {
    return config;
  }
  if (!document.IsMap()) {
    throw std::runtime_error("Invalid configuration in " + origin + ": top level must be a mapping");
  }

  std::string json;
  const auto  printed = google::protobuf::util::MessageToJsonString(ToValue(document), &json);
  if (!printed.ok()) {
    throw std::runtime_error("Failed to serialize " + origin + " to JSON: " + std::string(printed.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  const auto parsed = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!parsed.ok()) {
    throw std::runtime_error("Invalid configuration in " + origin + ": " + std::string(parsed.message()));
  }
  return config;
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node document;
  try {
    document = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load YAML config " + path + ": " + e.what());
  }
  return FromDocument(document, path);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml_text) {
  YAML::Node document;
  try {
    document = YAML::Load(yaml_text);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to parse YAML config: ") + e.what());
  }
  return FromDocument(document, "<inline>");
}

} // namespace lipsync::config
