#include "internal/store/filter/filter_expr.hpp"

#include <type_traits>

namespace mlmeta::store::filter {

namespace {

template <typename T>
bool ApplyOrder(CompareOp op, const T& lhs, const T& rhs) {
  switch (op) {
    case CompareOp::kEq: return lhs == rhs;
    case CompareOp::kNe: return lhs != rhs;
    case CompareOp::kLt: return lhs < rhs;
    case CompareOp::kLe: return lhs <= rhs;
    case CompareOp::kGt: return lhs > rhs;
    case CompareOp::kGe: return lhs >= rhs;
  }
  return false;
}

bool IsNumeric(const AttributeValue& v) {
  return std::holds_alternative<std::int64_t>(v) || std::holds_alternative<double>(v);
}

double AsDouble(const AttributeValue& v) {
  if (const auto* i = std::get_if<std::int64_t>(&v)) return static_cast<double>(*i);
  return std::get<double>(v);
}

bool EvalCompare(const Compare& cmp, const AttributeMap& attributes) {
  auto it = attributes.find(cmp.attribute);
  if (it == attributes.end()) {
    return false;
  }
  const auto& actual = it->second;

  // int64 against int64 stays exact; epoch nanoseconds exceed double precision.
  if (std::holds_alternative<std::int64_t>(actual) && std::holds_alternative<std::int64_t>(cmp.value)) {
    return ApplyOrder(cmp.op, std::get<std::int64_t>(actual), std::get<std::int64_t>(cmp.value));
  }
  if (IsNumeric(actual) && IsNumeric(cmp.value)) {
    return ApplyOrder(cmp.op, AsDouble(actual), AsDouble(cmp.value));
  }
  if (std::holds_alternative<std::string>(actual) && std::holds_alternative<std::string>(cmp.value)) {
    return ApplyOrder(cmp.op, std::get<std::string>(actual), std::get<std::string>(cmp.value));
  }
  if (std::holds_alternative<bool>(actual) && std::holds_alternative<bool>(cmp.value)) {
    if (cmp.op != CompareOp::kEq && cmp.op != CompareOp::kNe) {
      return false;
    }
    return ApplyOrder(cmp.op, std::get<bool>(actual), std::get<bool>(cmp.value));
  }
  return false;
}

bool EvalCall(const Call& call, const AttributeMap& attributes) {
  auto it = attributes.find(call.attribute);
  if (it == attributes.end()) {
    return false;
  }
  if (call.function == Function::kExists) {
    return true;
  }

  const auto* actual = std::get_if<std::string>(&it->second);
  if (!actual || !call.argument) {
    return false;
  }
  const auto& arg = *call.argument;
  switch (call.function) {
    case Function::kContains:
      return actual->find(arg) != std::string::npos;
    case Function::kStarts:
      return actual->size() >= arg.size() && actual->compare(0, arg.size(), arg) == 0;
    case Function::kEnds:
      return actual->size() >= arg.size() && actual->compare(actual->size() - arg.size(), arg.size(), arg) == 0;
    case Function::kExists:
      break;
  }
  return false;
}

} // namespace

bool Matches(const FilterExpr& expr, const AttributeMap& attributes) {
  return std::visit(
      [&attributes](const auto& node) -> bool {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, Compare>) {
          return EvalCompare(node, attributes);
        } else if constexpr (std::is_same_v<T, Call>) {
          return EvalCall(node, attributes);
        } else if constexpr (std::is_same_v<T, FilterExpr::And>) {
          for (const auto& c : node.children)
            if (!Matches(c, attributes)) return false;
          return true;
        } else if constexpr (std::is_same_v<T, FilterExpr::Or>) {
          for (const auto& c : node.children)
            if (Matches(c, attributes)) return true;
          return false;
        } else {
          bool v = true;
          for (const auto& c : node.children) v = v && !Matches(c, attributes);
          return v;
        }
      },
      expr.node);
}

bool Matches(const std::optional<FilterExpr>& expr, const AttributeMap& attributes) {
  return !expr || Matches(*expr, attributes);
}

} // namespace mlmeta::store::filter
