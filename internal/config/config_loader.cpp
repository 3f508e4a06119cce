#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>
#include <unordered_set>

#include "internal/model/progress.hpp"
#include "internal/util/decimal.hpp"

namespace pagewise::config {

using pagewise::runtime::config::DatabaseConfig;
using pagewise::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars carry the non-specific "!" tag and are always strings
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

static RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  RuntimeConfig config;
  if (!yaml || yaml.IsNull()) {
    ConfigLoader::Validate(config);
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

  ConfigLoader::Validate(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

void ConfigLoader::Validate(RuntimeConfig& config) {
  auto* database = config.mutable_database();
  if (database->backend() == DatabaseConfig::BACKEND_UNSPECIFIED) {
    database->set_backend(DatabaseConfig::BACKEND_MEMORY);
  }
  if (database->backend() == DatabaseConfig::BACKEND_SQLITE && database->sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required for the sqlite backend");
  }

  auto* engine = config.mutable_engine();
  if (engine->default_playback_speed().empty()) {
    engine->set_default_playback_speed(model::kDefaultPlaybackSpeed.ToString(1));
  }
  util::Decimal speed;
  try {
    speed = util::Decimal::Parse(engine->default_playback_speed());
  } catch (const std::invalid_argument& e) {
    throw std::runtime_error("Invalid configuration: engine.default_playback_speed: " + std::string(e.what()));
  }
  if (speed < model::kMinPlaybackSpeed || model::kMaxPlaybackSpeed < speed) {
    throw std::runtime_error("Invalid configuration: engine.default_playback_speed must be within 0.5-3.0");
  }
  // UTC-14:00 .. UTC+14:00
  if (engine->utc_offset_minutes() < -14 * 60 || engine->utc_offset_minutes() > 14 * 60) {
    throw std::runtime_error("Invalid configuration: engine.utc_offset_minutes out of range");
  }

  std::unordered_set<std::string> seen;
  for (const auto& book : config.catalog().books()) {
    if (book.book_id().empty()) {
      throw std::runtime_error("Invalid configuration: catalog book without book_id");
    }
    if (book.total_pages() < 0) {
      throw std::runtime_error("Invalid configuration: catalog book " + book.book_id() + " has negative total_pages");
    }
    if (!seen.insert(book.book_id()).second) {
      throw std::runtime_error("Invalid configuration: duplicate catalog book " + book.book_id());
    }
  }
}

} // namespace pagewise::config
