#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <spdlog/common.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace durable::config {

namespace {

constexpr uint32_t kDefaultWorkerThreads = 4;
constexpr uint32_t kMaxWorkerThreads     = 256;
constexpr const char* kDefaultRecordStore = "records";

} // namespace

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
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      // "memory:" with no body selects the backend like "memory: {}".
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
  }
}

static durable::runtime::config::RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  durable::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

durable::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  return ParseYaml(yaml);
}

durable::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  return ParseYaml(yaml);
}

void ConfigLoader::ApplyDefaults(durable::runtime::config::RuntimeConfig& config) {
  auto* engine = config.mutable_engine();
  if (engine->worker_threads() == 0) {
    engine->set_worker_threads(kDefaultWorkerThreads);
  }
  if (!engine->has_dump_history_on_error()) {
    engine->set_dump_history_on_error(true);
  }
  if (engine->record_store().empty()) {
    engine->set_record_store(kDefaultRecordStore);
  }

  auto* database = config.mutable_database();
  if (database->backend_case() == durable::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    database->mutable_memory();
  }
}

void ConfigLoader::Validate(const durable::runtime::config::RuntimeConfig& config) {
  const auto& level = config.logging().level();
  if (!level.empty() && level != "off" && spdlog::level::from_str(level) == spdlog::level::off) {
    throw std::runtime_error("Invalid configuration: unknown logging.level '" + level + "'");
  }

  if (config.engine().worker_threads() > kMaxWorkerThreads) {
    throw std::runtime_error("Invalid configuration: engine.worker_threads exceeds " + std::to_string(kMaxWorkerThreads));
  }

  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
}

} // namespace durable::config
