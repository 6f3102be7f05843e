#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include "internal/core/custody_policy.hpp"

namespace lifebank::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      // "memory:" with no body selects the backend, so null maps to an empty message
      value->mutable_struct_value();
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

static void Validate(const lifebank::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite() && database.sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path must not be empty");
  }

  // compare the limits the runtime will use, with unset values at their defaults
  const lifebank::core::CustodyPolicy defaults;
  const auto&                         custody    = config.custody();
  const std::uint32_t                 min_volume = custody.min_volume_ml() != 0 ? custody.min_volume_ml() : defaults.min_volume_ml;
  const std::uint32_t                 max_volume = custody.max_volume_ml() != 0 ? custody.max_volume_ml() : defaults.max_volume_ml;
  if (min_volume > max_volume) {
    throw std::runtime_error("Invalid configuration: custody.min_volume_ml (" + std::to_string(min_volume) +
                             ") exceeds custody.max_volume_ml (" + std::to_string(max_volume) + ")");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

lifebank::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  lifebank::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  // LIFEBANK_DB_PATH points an existing sqlite config at another ledger file;
  // it never changes the selected backend
  const char* db_path = std::getenv("LIFEBANK_DB_PATH");
  if (db_path != nullptr && config.database().has_sqlite()) {
    config.mutable_database()->mutable_sqlite()->set_path(db_path);
  }

  Validate(config);
  return config;
}

} // namespace lifebank::config
