#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mlmeta::store {

/*
  A single indexed scalar stored alongside a document blob.

  Strings double as byte blobs (the canonical document lives in a string
  attribute).
*/
using AttributeValue = std::variant<std::int64_t, double, bool, std::string>;

// Ordered so that iteration (and therefore logging/serialization) is stable.
using AttributeMap = std::map<std::string, AttributeValue>;

// Canonical document attribute.
inline constexpr const char* kDataAttribute = "_data_";

// Backend-maintained attribute holding the last path component of an item.
inline constexpr const char* kNameAttribute = "__name";

struct Item {
  std::string  path;
  AttributeMap attributes;

  bool HasField(const std::string& name) const;

  // Typed accessors: nullopt when the attribute is missing or of another type.
  std::optional<std::int64_t> GetFieldInt(const std::string& name) const;
  std::optional<double>       GetFieldDouble(const std::string& name) const;
  std::optional<std::string>  GetFieldString(const std::string& name) const;
};

// Last component of a hierarchical path ("/run/p/uid" -> "uid").
std::string BaseName(const std::string& path);

// Parent directory including the trailing slash ("/run/p/uid" -> "/run/p/").
std::string DirName(const std::string& path);

// Copy of `attributes` restricted to `names` (empty = everything).
AttributeMap Project(const AttributeMap& attributes, const std::vector<std::string>& names);

} // namespace mlmeta::store
