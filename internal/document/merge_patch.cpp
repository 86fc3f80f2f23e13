#include "internal/document/merge_patch.hpp"

#include <algorithm>
#include <charconv>
#include <optional>
#include <string>

#include "internal/document/codec.hpp"
#include "internal/util/errors.hpp"

namespace mlmeta::document {

namespace {

using google::protobuf::Value;

constexpr std::string_view kAppendIndex = "-1";

// Largest number of nulls a single index may pad an array with.
constexpr std::size_t kMaxIndexGap = 1024;

std::optional<std::size_t> ArrayIndex(const std::string& component) {
  if (component.empty()) return std::nullopt;
  std::size_t index = 0;
  auto [ptr, ec]    = std::from_chars(component.data(), component.data() + component.size(), index);
  if (ec != std::errc{} || ptr != component.data() + component.size()) return std::nullopt;
  return index;
}

void SetPath(Value* node, const std::vector<std::string>& components, std::size_t depth, const Value& leaf) {
  if (depth == components.size()) {
    *node = leaf;
    return;
  }
  const auto& component = components[depth];

  if (node->kind_case() == Value::kListValue) {
    auto* list = node->mutable_list_value();
    if (component == kAppendIndex) {
      SetPath(list->add_values(), components, depth + 1, leaf);
      return;
    }
    if (auto index = ArrayIndex(component)) {
      const auto size = static_cast<std::size_t>(list->values_size());
      if (*index > size + kMaxIndexGap) {
        throw util::ParseError("patch: array index " + component + " is too far past the end (size " + std::to_string(size) + ")");
      }
      while (static_cast<std::size_t>(list->values_size()) <= *index) {
        list->add_values()->set_null_value(google::protobuf::NULL_VALUE);
      }
      SetPath(list->mutable_values(static_cast<int>(*index)), components, depth + 1, leaf);
      return;
    }
  }

  if (node->kind_case() != Value::kStructValue) {
    node->mutable_struct_value();
  }
  auto& child = (*node->mutable_struct_value()->mutable_fields())[component];
  SetPath(&child, components, depth + 1, leaf);
}

} // namespace

std::vector<std::string> SplitPatchPath(std::string_view key) {
  std::vector<std::string> components(1);
  for (std::size_t i = 0; i < key.size(); ++i) {
    const char c = key[i];
    if (c == '\\' && i + 1 < key.size()) {
      components.back().push_back(key[++i]);
    } else if (c == '.') {
      components.emplace_back();
    } else {
      components.back().push_back(c);
    }
  }
  return components;
}

void ApplyPatch(const google::protobuf::Struct& patch, Value* document) {
  std::vector<std::string> keys;
  keys.reserve(patch.fields_size());
  for (const auto& [key, value] : patch.fields()) {
    keys.push_back(key);
  }
  std::sort(keys.begin(), keys.end());

  for (const auto& key : keys) {
    SetPath(document, SplitPatchPath(key), 0, patch.fields().at(key));
  }
}

std::string Merge(std::string_view old_json, std::string_view patch_json) {
  Value patch;
  try {
    patch = ParseJson(patch_json);
  } catch (const util::FormatError& e) {
    throw util::ParseError(std::string("patch: ") + e.what());
  }
  if (patch.kind_case() != Value::kStructValue) {
    throw util::ParseError("patch: expected a JSON object of dot paths");
  }

  auto document = ParseJson(old_json);
  ApplyPatch(patch.struct_value(), &document);
  return SerializeJson(document);
}

std::string ExpandPatch(std::string_view patch_json) {
  return Merge("{}", patch_json);
}

} // namespace mlmeta::document
