#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace mlmeta::query {

// Label attribute prefixes, matching the flattened envelope attribute names.
inline constexpr std::string_view kRunLabelPrefix      = "metadata.labels";
inline constexpr std::string_view kArtifactLabelPrefix = "labels";

// Quotes `value` as a filter string literal.
std::string QuoteLiteral(std::string_view value, char quote = '"');

/*
  Translates one label predicate into a filter clause:

    key~=value  ->  contains(<attr>, 'value')
    key=value   ->  <attr> == 'value'
    key!=value  ->  <attr> == 'value'   (inequality is not supported)
    key         ->  exists(<attr>)

  <attr> is SanitizeAttributeName(prefix + "." + key).
*/
std::string ParseLabelPredicate(std::string_view prefix, std::string_view text);

// AND of the non-empty clauses; updated_after_ns <= 0 adds no clause.
std::string BuildRunFilter(const std::vector<std::string>& labels, std::string_view name, std::string_view state,
                           std::int64_t updated_after_ns);

// `tag` must already be resolved ("" = any tag).
std::string BuildArtifactFilter(const std::vector<std::string>& labels, std::string_view name, std::string_view tag);

} // namespace mlmeta::query
