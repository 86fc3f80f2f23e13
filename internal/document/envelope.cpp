#include "internal/document/envelope.hpp"

#include <cctype>
#include <cmath>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace mlmeta::document {

namespace {

using google::protobuf::Value;

bool EqualFold(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) return false;
  }
  return true;
}

// Exact key first, then the smallest case-insensitive match.
const Value* FindField(const google::protobuf::Struct& object, std::string_view key) {
  auto exact = object.fields().find(std::string(key));
  if (exact != object.fields().end()) {
    return &exact->second;
  }

  const std::string* best_key = nullptr;
  const Value*       best     = nullptr;
  for (const auto& [name, value] : object.fields()) {
    if (EqualFold(name, key) && (!best_key || name < *best_key)) {
      best_key = &name;
      best     = &value;
    }
  }
  return best;
}

} // namespace

const std::vector<FieldDescriptor<RunEnvelope>>& RunEnvelope::Fields() {
  static const std::vector<FieldDescriptor<RunEnvelope>> fields = {
      {"metadata.name", "metadata.name", &RunEnvelope::name},
      {"metadata.uid", "metadata.uid", &RunEnvelope::uid},
      {"metadata.iteration", "metadata.iteration", &RunEnvelope::iteration},
      {"metadata.project", "metadata.project", &RunEnvelope::project},
      {"metadata.labels", "metadata.labels", &RunEnvelope::labels},
      {"status.state", "status.state", &RunEnvelope::state},
      {"status.lasttime", "status.last_update", &RunEnvelope::last_update},
      {"status.starttime", "status.start_time", &RunEnvelope::start_time},
  };
  return fields;
}

const std::vector<FieldDescriptor<ArtifactEnvelope>>& ArtifactEnvelope::Fields() {
  static const std::vector<FieldDescriptor<ArtifactEnvelope>> fields = {
      {"name", "key", &ArtifactEnvelope::key},
      {"labels", "labels", &ArtifactEnvelope::labels},
  };
  return fields;
}

namespace detail {

Lookup LookupPath(const Value& root, std::string_view json_path, const Value** found) {
  const Value* current = &root;
  while (true) {
    if (current->kind_case() == Value::kNullValue) {
      return Lookup::kAbsent;
    }
    if (current->kind_case() != Value::kStructValue) {
      return Lookup::kMismatch;
    }

    const auto dot = json_path.find('.');
    current        = FindField(current->struct_value(), json_path.substr(0, dot));
    if (!current) {
      return Lookup::kAbsent;
    }
    if (dot == std::string_view::npos) {
      break;
    }
    json_path.remove_prefix(dot + 1);
  }

  if (current->kind_case() == Value::kNullValue) {
    return Lookup::kAbsent;
  }
  *found = current;
  return Lookup::kFound;
}

bool Assign(const Value& value, std::string* target) {
  if (value.kind_case() != Value::kStringValue) return false;
  *target = value.string_value();
  return true;
}

bool Assign(const Value& value, std::int64_t* target) {
  if (value.kind_case() != Value::kNumberValue) return false;
  const double number = value.number_value();
  // [-2^63, 2^63)
  if (std::trunc(number) != number || number < -9223372036854775808.0 || number >= 9223372036854775808.0) return false;
  *target = static_cast<std::int64_t>(number);
  return true;
}

bool Assign(const Value& value, double* target) {
  if (value.kind_case() != Value::kNumberValue) return false;
  *target = value.number_value();
  return true;
}

bool Assign(const Value& value, bool* target) {
  if (value.kind_case() != Value::kBoolValue) return false;
  *target = value.bool_value();
  return true;
}

bool Assign(const Value& value, std::optional<Labels>* target) {
  if (value.kind_case() != Value::kStructValue) return false;

  Labels labels;
  for (const auto& [key, label] : value.struct_value().fields()) {
    if (label.kind_case() == Value::kNullValue) continue;
    if (label.kind_case() != Value::kStringValue) return false;
    labels.emplace(key, label.string_value());
  }
  *target = std::move(labels);
  return true;
}

void ReportMismatch(std::string_view attribute, DecodeMode mode) {
  if (mode == DecodeMode::kStrict) {
    throw util::FormatError("metadata field " + std::string(attribute) + " has an unexpected type");
  }
  MLMETA_LOG_DEBUG("skipping mistyped metadata field", {observability::StringField("attribute", attribute)});
}

} // namespace detail

RunEnvelope DecodeRunEnvelope(const google::protobuf::Value& document, DecodeMode mode) {
  return DecodeEnvelope<RunEnvelope>(document, mode);
}

ArtifactEnvelope DecodeArtifactEnvelope(const google::protobuf::Value& document, DecodeMode mode) {
  return DecodeEnvelope<ArtifactEnvelope>(document, mode);
}

} // namespace mlmeta::document
