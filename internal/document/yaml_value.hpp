#pragma once

#include <google/protobuf/struct.pb.h>
#include <yaml-cpp/yaml.h>

namespace mlmeta::document {

/*
  YAML <-> google::protobuf::Value (the JSON DOM used throughout).

  Plain scalars are typed: true/false -> bool, decimal numbers -> number,
  ~/null/empty -> null. Quoted scalars always stay strings.

  Throws std::runtime_error on node kinds that have no JSON equivalent.
*/
void YamlToValue(const YAML::Node& node, google::protobuf::Value* value);

// Emits `value` as YAML. Strings that would re-read as another scalar type
// are double-quoted.
void ValueToYaml(const google::protobuf::Value& value, YAML::Emitter& out);

} // namespace mlmeta::document
