#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace siros::config {

namespace {

constexpr std::uint32_t kDefaultDimension   = 1536;
constexpr std::uint32_t kDefaultMaxK        = 100;
constexpr const char*   kDefaultBindAddress = "0.0.0.0:50051";

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar = node.Scalar();

  // "!" marks a quoted scalar: keep it verbatim.
  if (node.Tag() == "!") {
    value->set_string_value(scalar);
    return;
  }

  if (scalar == "true" || scalar == "false") {
    value->set_bool_value(scalar == "true");
    return;
  }

  if (!scalar.empty()) {
    char*        end     = nullptr;
    const double numeric = std::strtod(scalar.c_str(), &end);
    if (end && *end == '\0') {
      value->set_number_value(numeric);
      return;
    }
  }

  value->set_string_value(scalar);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (std::size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (const auto& entry : node) {
        YamlToProtoValue(entry.second, &(*struct_value->mutable_fields())[entry.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("unsupported YAML node");
  }
}

siros::runtime::config::RuntimeConfig ParseNode(const YAML::Node& yaml) {
  siros::runtime::config::RuntimeConfig config;
  if (!yaml || yaml.IsNull()) {
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value value;
  YamlToProtoValue(yaml, &value);

  std::string json;
  auto        to_json = google::protobuf::util::MessageToJsonString(value, &json);
  if (!to_json.ok()) {
    throw std::runtime_error("failed to serialize YAML to JSON: " + std::string(to_json.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("invalid configuration: " + std::string(status.message()));
  }
  return config;
}

} // namespace

siros::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("failed to load YAML config " + path + ": " + e.what());
  }
  return ParseNode(yaml);
}

siros::runtime::config::RuntimeConfig ConfigLoader::LoadFromString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseNode(yaml);
}

std::uint32_t VectorDimension(const siros::runtime::config::RuntimeConfig& config) {
  return config.vector().dimension() == 0 ? kDefaultDimension : config.vector().dimension();
}

std::uint32_t MaxK(const siros::runtime::config::RuntimeConfig& config) {
  return config.vector().max_k() == 0 ? kDefaultMaxK : config.vector().max_k();
}

bool EmbeddingEnabled(const siros::runtime::config::RuntimeConfig& config) {
  return !config.embedding().has_enabled() || config.embedding().enabled();
}

std::string BindAddress(const siros::runtime::config::RuntimeConfig& config) {
  return config.server().bind_address().empty() ? kDefaultBindAddress : config.server().bind_address();
}

} // namespace siros::config
