#include "internal/query/filter_builder.hpp"

#include <algorithm>
#include <regex>

#include "internal/document/attribute_encoder.hpp"
#include "internal/observability/logging.hpp"

namespace mlmeta::query {

namespace {

// Non-greedy key so "a!=b" splits as (a, !=, b).
const std::regex& LabelPattern() {
  static const std::regex pattern(R"(^(.+?)(~=|!=|=)(.+)$)");
  return pattern;
}

void AppendClause(std::string* filter, const std::string& clause) {
  if (clause.empty()) return;
  if (!filter->empty()) {
    *filter += " AND ";
  }
  *filter += clause;
}

std::vector<std::string> LabelClauses(std::string_view prefix, const std::vector<std::string>& labels) {
  std::vector<std::string> clauses;
  clauses.reserve(labels.size());
  for (const auto& label : labels) {
    if (!label.empty()) {
      clauses.push_back(ParseLabelPredicate(prefix, label));
    }
  }
  // Clause order must not depend on the order labels were supplied in.
  std::sort(clauses.begin(), clauses.end());
  clauses.erase(std::unique(clauses.begin(), clauses.end()), clauses.end());
  return clauses;
}

} // namespace

std::string QuoteLiteral(std::string_view value, char quote) {
  std::string out;
  out.reserve(value.size() + 2);
  out.push_back(quote);
  for (char c : value) {
    if (c == '\\' || c == quote) {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  out.push_back(quote);
  return out;
}

std::string ParseLabelPredicate(std::string_view prefix, std::string_view text) {
  const std::string full_prefix = prefix.empty() ? std::string() : std::string(prefix) + ".";
  const std::string input(text);

  std::smatch match;
  if (!std::regex_match(input, match, LabelPattern())) {
    return "exists(" + document::SanitizeAttributeName(full_prefix + input) + ")";
  }

  const auto attribute = document::SanitizeAttributeName(full_prefix + match[1].str());
  const auto op        = match[2].str();
  const auto value     = match[3].str();
  if (op == "~=") {
    return "contains(" + attribute + ", " + QuoteLiteral(value, '\'') + ")";
  }
  return attribute + " == " + QuoteLiteral(value, '\'');
}

std::string BuildRunFilter(const std::vector<std::string>& labels, std::string_view name, std::string_view state,
                           std::int64_t updated_after_ns) {
  std::string filter;
  if (!name.empty()) {
    AppendClause(&filter, document::SanitizeAttributeName("metadata.name") + " == " + QuoteLiteral(name));
  }
  if (!state.empty()) {
    AppendClause(&filter, document::SanitizeAttributeName("status.state") + " == " + QuoteLiteral(state));
  }
  for (const auto& clause : LabelClauses(kRunLabelPrefix, labels)) {
    AppendClause(&filter, clause);
  }
  if (updated_after_ns > 0) {
    AppendClause(&filter, document::SanitizeAttributeName("status.lasttimeEpoch") + " > " + std::to_string(updated_after_ns));
  }
  MLMETA_LOG_DEBUG("run filter", {observability::StringField("filter", filter)});
  return filter;
}

std::string BuildArtifactFilter(const std::vector<std::string>& labels, std::string_view name, std::string_view tag) {
  std::string filter;
  if (!name.empty()) {
    AppendClause(&filter, document::SanitizeAttributeName("name") + " == " + QuoteLiteral(name));
  }
  if (!tag.empty()) {
    AppendClause(&filter, "ends(__name, " + QuoteLiteral(tag) + ")");
  }
  for (const auto& clause : LabelClauses(kArtifactLabelPrefix, labels)) {
    AppendClause(&filter, clause);
  }
  MLMETA_LOG_DEBUG("artifact filter", {observability::StringField("filter", filter)});
  return filter;
}

} // namespace mlmeta::query
