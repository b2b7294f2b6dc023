#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <initializer_list>
#include <stdexcept>

#include "internal/model/names.hpp"

namespace release::config {

namespace {

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar = node.Scalar();

  // yaml-cpp tags quoted scalars "!".
  if (node.Tag() == "!") {
    value->set_string_value(scalar);
    return;
  }

  if (scalar == "true" || scalar == "false") {
    value->set_bool_value(scalar == "true");
    return;
  }

  char*        endptr = nullptr;
  const double number = std::strtod(scalar.c_str(), &endptr);
  if (!scalar.empty() && endptr && *endptr == '\0') {
    value->set_number_value(number);
    return;
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
      auto* list = value->mutable_list_value();
      for (std::size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* fields = value->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        YamlToProtoValue(entry.second, &(*fields)[entry.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

YAML::Node LoadYaml(const std::string& path) {
  try {
    return YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML file " + path + ": " + e.what());
  }
}

google::protobuf::Value ToProtoValue(const YAML::Node& yaml) {
  google::protobuf::Value value;
  YamlToProtoValue(yaml, &value);
  return value;
}

// Tags plain scalars as quoted so "version: 2.0" or "name: inf" stay strings.
void MarkAsString(YAML::Node node) {
  if (node.IsScalar()) {
    node.SetTag("!");
    return;
  }
  if (node.IsSequence()) {
    for (auto item : node) {
      if (item.IsScalar()) {
        item.SetTag("!");
      }
    }
  }
}

void MarkStringFields(const YAML::Node& map, std::initializer_list<const char*> keys) {
  if (!map.IsMap()) {
    return;
  }
  for (auto entry : map) {
    const auto& key = entry.first.Scalar();
    for (const char* field : keys) {
      if (key == field) {
        MarkAsString(entry.second);
      }
    }
  }
}

void ParseInto(const google::protobuf::Value& value, google::protobuf::Message* message, const std::string& path) {
  std::string json;
  auto        to_json = google::protobuf::util::MessageToJsonString(value, &json);
  if (!to_json.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid " + path + ": " + std::string(status.message()));
  }
}

// Rewrites a lowercase enum name to its protobuf spelling in place.
template <typename Parse, typename Name>
void NormalizeEnumField(google::protobuf::Struct* object, const std::string& key, Parse parse, Name name) {
  auto it = object->mutable_fields()->find(key);
  if (it == object->mutable_fields()->end() || !it->second.has_string_value()) {
    return;
  }
  const auto parsed = parse(it->second.string_value());
  if (!parsed) {
    throw std::runtime_error("Invalid " + key + ": '" + it->second.string_value() + "'");
  }
  it->second.set_string_value(name(*parsed));
}

} // namespace

release::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  release::runtime::config::RuntimeConfig config;
  ParseInto(ToProtoValue(LoadYaml(path)), &config, "configuration");
  return config;
}

release::coordinator::v1::CoordinateReleaseRequest ConfigLoader::LoadReleaseRequest(const std::string& path) {
  using namespace release::coordinator::v1;

  auto yaml = LoadYaml(path);
  MarkStringFields(yaml, {"release_name", "releaseName", "notify_channels", "notifyChannels"});
  if (yaml.IsMap()) {
    const auto services = static_cast<const YAML::Node&>(yaml)["services"];
    if (services.IsSequence()) {
      for (auto service : services) {
        MarkStringFields(service, {"name", "version", "dependencies"});
      }
    }
  }

  auto value = ToProtoValue(yaml);
  if (!value.has_struct_value()) {
    throw std::runtime_error("Invalid release request: top level must be a map");
  }

  auto* object = value.mutable_struct_value();
  NormalizeEnumField(object, "environment", model::ParseEnvironment, [](Environment e) { return Environment_Name(e); });
  NormalizeEnumField(object, "strategy", model::ParseStrategy, [](Strategy s) { return Strategy_Name(s); });

  CoordinateReleaseRequest request;
  ParseInto(value, &request, "release request");
  return request;
}

} // namespace release::config
