#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "internal/store/api/item.hpp"

namespace mlmeta::store::filter {

/*
  Filter expression AST for item attribute predicates.

  Grammar accepted by ParseFilter:

    expr    := and (OR and)*
    and     := unary (AND unary)*
    unary   := NOT unary | '(' expr ')' | call | compare
    call    := (exists|contains|starts|ends) '(' ident [',' literal] ')'
    compare := ident op literal          op := == | = | != | < | <= | > | >=
    literal := "str" | 'str' | number | true | false

  Keywords and function names are case-insensitive.
*/

enum class CompareOp { kEq, kNe, kLt, kLe, kGt, kGe };

enum class Function { kExists, kContains, kStarts, kEnds };

using Literal = AttributeValue;

struct Compare {
  std::string attribute;
  CompareOp   op = CompareOp::kEq;
  Literal     value;
};

struct Call {
  Function                   function = Function::kExists;
  std::string                attribute;
  std::optional<std::string> argument;
};

struct FilterExpr {
  struct And { std::vector<FilterExpr> children; };
  struct Or  { std::vector<FilterExpr> children; };
  struct Not { std::vector<FilterExpr> children; };

  std::variant<Compare, Call, And, Or, Not> node;
};

class FilterSyntaxError : public std::runtime_error {
 public:
  explicit FilterSyntaxError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Empty/blank text yields nullopt (match everything). Throws FilterSyntaxError.
std::optional<FilterExpr> ParseFilter(std::string_view text);

// Missing attributes and type mismatches evaluate to false.
bool Matches(const FilterExpr& expr, const AttributeMap& attributes);

// Convenience: parse + evaluate, nullopt expression matches everything.
bool Matches(const std::optional<FilterExpr>& expr, const AttributeMap& attributes);

} // namespace mlmeta::store::filter
