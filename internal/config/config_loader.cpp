#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/document/yaml_value.hpp"

namespace mlmeta::config {

namespace {

constexpr const char* kDefaultBindAddress = "0.0.0.0:50051";

mlmeta::runtime::config::RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  mlmeta::document::YamlToValue(yaml, &json_value);
  if (json_value.kind_case() == google::protobuf::Value::kNullValue) {
    json_value.mutable_struct_value();
  }

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  mlmeta::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }
  return config;
}

void ApplyEnvironment(mlmeta::runtime::config::RuntimeConfig* config) {
  if (const char* bind_address = std::getenv("MLMETA_BIND_ADDRESS")) {
    config->mutable_server()->set_bind_address(bind_address);
  }
  if (const char* sqlite_path = std::getenv("MLMETA_SQLITE_PATH")) {
    config->mutable_store()->mutable_sqlite()->set_path(sqlite_path);
  }
}

void ApplyDefaults(mlmeta::runtime::config::RuntimeConfig* config) {
  if (config->server().bind_address().empty()) {
    config->mutable_server()->set_bind_address(kDefaultBindAddress);
  }
}

mlmeta::runtime::config::RuntimeConfig Finish(mlmeta::runtime::config::RuntimeConfig config) {
  ApplyEnvironment(&config);
  ApplyDefaults(&config);
  return config;
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

mlmeta::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return Finish(FromYamlNode(yaml));
}

mlmeta::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml) {
  YAML::Node node;
  try {
    node = YAML::Load(yaml);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return Finish(FromYamlNode(node));
}

} // namespace mlmeta::config
