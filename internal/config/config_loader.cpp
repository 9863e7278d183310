#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <spdlog/common.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace pagereg::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // Quoted scalars carry the "!" tag and always stay strings ("0xdead", "1").
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
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
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
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

static pagereg::runtime::config::RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  pagereg::runtime::config::RuntimeConfig config;
  if (yaml.IsNull()) {
    ConfigLoader::Validate(config);
    return config;
  }
  if (!yaml.IsMap()) {
    throw util::InvalidArgument(util::ErrorCode::kInvalidConfig, "config root must be a mapping");
  }

  google::protobuf::Value json_value;
  try {
    YamlToProtoValue(yaml, &json_value);
  } catch (const std::runtime_error& e) {
    throw util::InvalidArgument(util::ErrorCode::kInvalidConfig, e.what());
  }

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw util::InvalidArgument(util::ErrorCode::kInvalidConfig, "Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw util::InvalidArgument(util::ErrorCode::kInvalidConfig, "Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::Validate(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

pagereg::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::InvalidArgument(util::ErrorCode::kInvalidConfig, "Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

pagereg::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw util::InvalidArgument(util::ErrorCode::kInvalidConfig, "Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

void ConfigLoader::Validate(pagereg::runtime::config::RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address("0.0.0.0:50061");
  }

  auto* database = config.mutable_database();
  if (database->backend_case() == pagereg::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    database->mutable_memory();
  }
  if (database->has_sqlite() && database->sqlite().path().empty()) {
    throw util::InvalidArgument(util::ErrorCode::kInvalidConfig, "database.sqlite.path is required");
  }

  const auto& level = config.logging().level();
  if (!level.empty() && spdlog::level::from_str(level) == spdlog::level::off && level != "off") {
    throw util::InvalidArgument(util::ErrorCode::kInvalidConfig, "unknown logging.level: " + level);
  }

  const auto& content = config.content();
  for (const auto& prefix : content.thumbnail_prefixes()) {
    if (prefix.empty()) {
      throw util::InvalidArgument(util::ErrorCode::kInvalidConfig, "content.thumbnail_prefixes entries must be non-empty");
    }
  }

  for (const auto& account : config.treasury().rejected_accounts()) {
    if (account.empty()) {
      throw util::InvalidArgument(util::ErrorCode::kInvalidConfig, "treasury.rejected_accounts entries must be non-empty");
    }
  }
}

} // namespace pagereg::config
