#pragma once

#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

#include "internal/document/envelope.hpp"
#include "internal/store/api/item.hpp"

namespace mlmeta::document {

// Replaces every character outside [a-zA-Z0-9_] with '_'. Not collision-free.
std::string SanitizeAttributeName(std::string_view name);

namespace detail {

// Timestamp-shaped strings become <name>Epoch (int64 ns); others are copied.
void EmitString(std::string_view attribute, const std::string& value, store::AttributeMap* out);
void EmitLabels(std::string_view attribute, const Labels& labels, store::AttributeMap* out);

} // namespace detail

/*
  Flattens an envelope into index attributes, driven by Envelope::Fields().

  Sentinel-valued fields are skipped; label maps expand to one attribute per
  key. Pure: flattening the same envelope twice yields equal maps.
*/
template <typename Envelope>
store::AttributeMap Flatten(const Envelope& envelope) {
  store::AttributeMap attributes;
  for (const auto& field : Envelope::Fields()) {
    std::visit(
        [&](auto member) {
          const auto& value = envelope.*member;
          using T           = std::decay_t<decltype(value)>;
          if constexpr (std::is_same_v<T, std::string>) {
            if (value != kInvalidString) {
              detail::EmitString(field.attribute, value, &attributes);
            }
          } else if constexpr (std::is_same_v<T, std::int64_t>) {
            if (value != kInvalidInt) {
              attributes[SanitizeAttributeName(field.attribute)] = value;
            }
          } else if constexpr (std::is_same_v<T, double>) {
            if (value != kInvalidFloat) {
              attributes[SanitizeAttributeName(field.attribute)] = value;
            }
          } else if constexpr (std::is_same_v<T, bool>) {
            attributes[SanitizeAttributeName(field.attribute)] = value;
          } else {
            if (value) {
              detail::EmitLabels(field.attribute, *value, &attributes);
            }
          }
        },
        field.member);
  }
  return attributes;
}

} // namespace mlmeta::document
