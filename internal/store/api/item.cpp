#include "item.hpp"

#include <vector>

namespace mlmeta::store {

bool Item::HasField(const std::string& name) const {
  return attributes.find(name) != attributes.end();
}

std::optional<std::int64_t> Item::GetFieldInt(const std::string& name) const {
  auto it = attributes.find(name);
  if (it == attributes.end()) return std::nullopt;
  if (const auto* v = std::get_if<std::int64_t>(&it->second)) return *v;
  return std::nullopt;
}

std::optional<double> Item::GetFieldDouble(const std::string& name) const {
  auto it = attributes.find(name);
  if (it == attributes.end()) return std::nullopt;
  if (const auto* v = std::get_if<double>(&it->second)) return *v;
  if (const auto* v = std::get_if<std::int64_t>(&it->second)) return static_cast<double>(*v);
  return std::nullopt;
}

std::optional<std::string> Item::GetFieldString(const std::string& name) const {
  auto it = attributes.find(name);
  if (it == attributes.end()) return std::nullopt;
  if (const auto* v = std::get_if<std::string>(&it->second)) return *v;
  return std::nullopt;
}

std::string BaseName(const std::string& path) {
  const auto pos = path.find_last_of('/');
  return pos == std::string::npos ? path : path.substr(pos + 1);
}

std::string DirName(const std::string& path) {
  const auto pos = path.find_last_of('/');
  return pos == std::string::npos ? std::string{} : path.substr(0, pos + 1);
}

AttributeMap Project(const AttributeMap& attributes, const std::vector<std::string>& names) {
  if (names.empty()) {
    return attributes;
  }
  AttributeMap out;
  for (const auto& name : names) {
    auto it = attributes.find(name);
    if (it != attributes.end()) {
      out.emplace(it->first, it->second);
    }
  }
  return out;
}

} // namespace mlmeta::store
