#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mlmeta::document {

/*
  Metadata envelopes: the fixed-shape projection of a stored document from
  which index attributes are derived.

  Every field starts at its sentinel; a field still holding the sentinel
  after decoding was absent from the document and yields no attribute.
*/

inline constexpr std::string_view kInvalidString = "?invalid";
inline constexpr std::int64_t     kInvalidInt    = 0xBADACAFE;
inline constexpr double           kInvalidFloat  = std::numeric_limits<double>::infinity();

using Labels = std::map<std::string, std::string>;

template <typename Envelope>
struct FieldDescriptor {
  using Member = std::variant<std::string Envelope::*, std::int64_t Envelope::*, double Envelope::*, bool Envelope::*,
                              std::optional<Labels> Envelope::*>;

  // Unsanitized attribute name ("status.lasttime").
  std::string_view attribute;
  // Dot-separated JSON key path, matched case-insensitively ("status.last_update").
  std::string_view json_path;
  Member           member;
};

struct RunEnvelope {
  std::string           name{kInvalidString};
  std::string           uid{kInvalidString};
  std::int64_t          iteration = kInvalidInt;
  std::string           project{kInvalidString};
  std::optional<Labels> labels;
  std::string           state{kInvalidString};
  std::string           last_update{kInvalidString};
  std::string           start_time{kInvalidString};

  static const std::vector<FieldDescriptor<RunEnvelope>>& Fields();
};

struct ArtifactEnvelope {
  std::string           key{kInvalidString};
  std::optional<Labels> labels;

  static const std::vector<FieldDescriptor<ArtifactEnvelope>>& Fields();
};

enum class DecodeMode {
  // Field type mismatches raise util::FormatError.
  kStrict,
  // Mismatched fields keep their sentinel.
  kLenient,
};

namespace detail {

enum class Lookup { kFound, kAbsent, kMismatch };

// Walks `json_path`; JSON null anywhere along the way counts as absent.
Lookup LookupPath(const google::protobuf::Value& root, std::string_view json_path, const google::protobuf::Value** found);

// Each returns false on a type mismatch and leaves the target untouched.
bool Assign(const google::protobuf::Value& value, std::string* target);
bool Assign(const google::protobuf::Value& value, std::int64_t* target);
bool Assign(const google::protobuf::Value& value, double* target);
bool Assign(const google::protobuf::Value& value, bool* target);
bool Assign(const google::protobuf::Value& value, std::optional<Labels>* target);

void ReportMismatch(std::string_view attribute, DecodeMode mode);

} // namespace detail

template <typename Envelope>
Envelope DecodeEnvelope(const google::protobuf::Value& document, DecodeMode mode) {
  Envelope envelope;
  if (document.kind_case() != google::protobuf::Value::kStructValue && document.kind_case() != google::protobuf::Value::kNullValue) {
    detail::ReportMismatch("<document>", mode);
    return envelope;
  }

  for (const auto& field : Envelope::Fields()) {
    const google::protobuf::Value* value  = nullptr;
    const auto                     lookup = detail::LookupPath(document, field.json_path, &value);
    bool                           ok     = lookup != detail::Lookup::kMismatch;
    if (lookup == detail::Lookup::kFound) {
      ok = std::visit([&](auto member) { return detail::Assign(*value, &(envelope.*member)); }, field.member);
    }
    if (!ok) {
      detail::ReportMismatch(field.attribute, mode);
    }
  }
  return envelope;
}

RunEnvelope      DecodeRunEnvelope(const google::protobuf::Value& document, DecodeMode mode);
ArtifactEnvelope DecodeArtifactEnvelope(const google::protobuf::Value& document, DecodeMode mode);

} // namespace mlmeta::document
