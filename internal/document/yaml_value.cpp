#include "internal/document/yaml_value.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace mlmeta::document {

namespace {

// 2^53: largest range in which every integer is exactly representable as double.
constexpr double kMaxExactInteger = 9007199254740992.0;

// YAML 1.1 boolean set, as go-yaml v2 resolves plain scalars.
constexpr std::array<std::string_view, 11> kTrueLiterals  = {"y", "Y", "yes", "Yes", "YES", "on", "On", "ON", "true", "True", "TRUE"};
constexpr std::array<std::string_view, 11> kFalseLiterals = {"n", "N", "no", "No", "NO", "off", "Off", "OFF", "false", "False", "FALSE"};

std::optional<bool> BoolLiteral(std::string_view s) {
  if (std::find(kTrueLiterals.begin(), kTrueLiterals.end(), s) != kTrueLiterals.end()) return true;
  if (std::find(kFalseLiterals.begin(), kFalseLiterals.end(), s) != kFalseLiterals.end()) return false;
  return std::nullopt;
}

bool IsNullLiteral(std::string_view s) {
  return s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL";
}

// [-+]? (digits [. digits?] | . digits) ([eE] [-+]? digits)?
bool IsDecimalNumber(std::string_view s) {
  std::size_t i = 0;
  if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;

  std::size_t int_digits = 0;
  while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
    ++i;
    ++int_digits;
  }
  std::size_t frac_digits = 0;
  if (i < s.size() && s[i] == '.') {
    ++i;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
      ++i;
      ++frac_digits;
    }
  }
  if (int_digits == 0 && frac_digits == 0) return false;

  if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
    ++i;
    if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
    std::size_t exp_digits = 0;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
      ++i;
      ++exp_digits;
    }
    if (exp_digits == 0) return false;
  }
  return i == s.size();
}

bool LooksLikeNonString(std::string_view s) {
  return BoolLiteral(s).has_value() || IsNullLiteral(s) || IsDecimalNumber(s);
}

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar = node.Scalar();

  // "!" marks a quoted (non-plain) scalar.
  if (node.Tag() == "!") {
    value->set_string_value(scalar);
    return;
  }
  if (auto flag = BoolLiteral(scalar)) {
    value->set_bool_value(*flag);
    return;
  }
  if (IsDecimalNumber(scalar)) {
    value->set_number_value(std::strtod(scalar.c_str(), nullptr));
    return;
  }
  value->set_string_value(scalar);
}

// Shortest representation that reads back to the same double.
std::string FormatNumber(double number) {
  std::array<char, 64> buffer{};
  auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), number);
  if (ec != std::errc{}) {
    throw std::runtime_error("cannot format number");
  }
  return std::string(buffer.data(), ptr);
}

} // namespace

void YamlToValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (std::size_t i = 0; i < node.size(); ++i) {
        YamlToValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        if (!it.first.IsScalar()) {
          throw std::runtime_error("unsupported non-scalar YAML map key");
        }
        YamlToValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("unsupported YAML node");
  }
}

void ValueToYaml(const google::protobuf::Value& value, YAML::Emitter& out) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kNullValue:
    case google::protobuf::Value::KIND_NOT_SET:
      out << YAML::Null;
      break;

    case google::protobuf::Value::kNumberValue: {
      const double number = value.number_value();
      if (std::nearbyint(number) == number && std::fabs(number) < kMaxExactInteger) {
        out << static_cast<long long>(number);
      } else {
        out << FormatNumber(number);
      }
      break;
    }

    case google::protobuf::Value::kStringValue: {
      const auto& s = value.string_value();
      if (LooksLikeNonString(s)) {
        out << YAML::DoubleQuoted << s;
      } else {
        out << s;
      }
      break;
    }

    case google::protobuf::Value::kBoolValue:
      out << value.bool_value();
      break;

    case google::protobuf::Value::kStructValue: {
      // Map iteration order is unspecified; emit keys sorted.
      std::vector<std::string> keys;
      keys.reserve(value.struct_value().fields_size());
      for (const auto& [key, field] : value.struct_value().fields()) {
        keys.push_back(key);
      }
      std::sort(keys.begin(), keys.end());

      out << YAML::BeginMap;
      for (const auto& key : keys) {
        out << YAML::Key << key << YAML::Value;
        ValueToYaml(value.struct_value().fields().at(key), out);
      }
      out << YAML::EndMap;
      break;
    }

    case google::protobuf::Value::kListValue:
      out << YAML::BeginSeq;
      for (const auto& item : value.list_value().values()) {
        ValueToYaml(item, out);
      }
      out << YAML::EndSeq;
      break;
  }
}

} // namespace mlmeta::document
