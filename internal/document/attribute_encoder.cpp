#include "internal/document/attribute_encoder.hpp"

#include <cctype>

#include "internal/util/time.hpp"

namespace mlmeta::document {

std::string SanitizeAttributeName(std::string_view name) {
  std::string out(name);
  for (auto& c : out) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
      c = '_';
    }
  }
  return out;
}

namespace detail {

void EmitString(std::string_view attribute, const std::string& value, store::AttributeMap* out) {
  if (auto epoch = util::ParseDocumentTimestamp(value)) {
    (*out)[SanitizeAttributeName(std::string(attribute) + "Epoch")] = *epoch;
    return;
  }
  (*out)[SanitizeAttributeName(attribute)] = value;
}

void EmitLabels(std::string_view attribute, const Labels& labels, store::AttributeMap* out) {
  for (const auto& [key, value] : labels) {
    (*out)[SanitizeAttributeName(std::string(attribute) + "." + key)] = value;
  }
}

} // namespace detail

} // namespace mlmeta::document
