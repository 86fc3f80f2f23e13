#include "internal/document/codec.hpp"

#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <stdexcept>

#include "internal/document/yaml_value.hpp"
#include "internal/util/errors.hpp"

namespace mlmeta::document {

namespace {

constexpr std::string_view kYamlDocumentMarker = "---";

google::protobuf::Value ParseYaml(std::string_view bytes) {
  google::protobuf::Value value;
  try {
    YamlToValue(YAML::Load(std::string(bytes)), &value);
  } catch (const YAML::Exception& e) {
    throw util::FormatError("malformed YAML document: " + std::string(e.what()));
  } catch (const std::runtime_error& e) {
    throw util::FormatError("malformed YAML document: " + std::string(e.what()));
  }
  return value;
}

} // namespace

DocumentFormat Detect(std::string_view bytes) {
  return bytes.substr(0, kYamlDocumentMarker.size()) == kYamlDocumentMarker ? DocumentFormat::kYaml : DocumentFormat::kJson;
}

const char* FormatName(DocumentFormat format) {
  return format == DocumentFormat::kYaml ? "yaml" : "json";
}

google::protobuf::Value ParseJson(std::string_view json) {
  google::protobuf::Value value;
  auto status = google::protobuf::util::JsonStringToMessage(std::string(json), &value);
  if (!status.ok()) {
    throw util::FormatError("malformed JSON document: " + std::string(status.message()));
  }
  return value;
}

std::string SerializeJson(const google::protobuf::Value& value) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(value, &json);
  if (!status.ok()) {
    throw util::FormatError("failed to serialize JSON: " + std::string(status.message()));
  }
  return json;
}

google::protobuf::Value ParseDocument(std::string_view bytes) {
  return Detect(bytes) == DocumentFormat::kYaml ? ParseYaml(bytes) : ParseJson(bytes);
}

std::string ToJson(std::string_view bytes) {
  if (Detect(bytes) == DocumentFormat::kYaml) {
    return SerializeJson(ParseYaml(bytes));
  }
  ParseJson(bytes);
  return std::string(bytes);
}

std::string FromJson(std::string_view json, DocumentFormat format) {
  if (format == DocumentFormat::kJson) {
    return std::string(json);
  }

  auto          value = ParseJson(json);
  YAML::Emitter out;
  out << YAML::BeginDoc;
  ValueToYaml(value, out);
  if (!out.good()) {
    throw util::FormatError("failed to emit YAML: " + out.GetLastError());
  }
  return std::string(out.c_str()) + "\n";
}

} // namespace mlmeta::document
