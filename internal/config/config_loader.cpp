#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace inkvault::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("2s", "00047")
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static void SetDurationIfUnset(google::protobuf::Duration* d, int64_t millis) {
  if (d->seconds() != 0 || d->nanos() != 0) return;
  d->set_seconds(millis / 1000);
  d->set_nanos(static_cast<int32_t>((millis % 1000) * 1000000));
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

inkvault::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  inkvault::runtime::config::RuntimeConfig config;

  // empty file: every default
  if (yaml.IsNull()) {
    ApplyDefaults(&config);
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(&config);
  return config;
}

void ConfigLoader::ApplyDefaults(inkvault::runtime::config::RuntimeConfig* config) {
  auto* storage = config->mutable_storage();
  if (storage->root().empty()) storage->set_root("./annotations");
  if (!storage->has_fsync()) storage->set_fsync(true);

  auto* autosave = config->mutable_autosave();
  SetDurationIfUnset(autosave->mutable_tick_interval(), 1000);
  SetDurationIfUnset(autosave->mutable_grace_window(), 2000);
  SetDurationIfUnset(autosave->mutable_load_timeout(), 30000);

  if (config->change_detection().coordinate_tolerance() < 0) {
    throw std::runtime_error("Invalid configuration: change_detection.coordinate_tolerance must not be negative");
  }
}

} // namespace inkvault::config
