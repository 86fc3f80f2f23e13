#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace mlmeta::util {

// Parses "YYYY-MM-DD HH:MM:SS.ffffff" (UTC, exactly six fractional digits)
// into nanoseconds since the Unix epoch. Anything else, including instants
// outside the int64 nanosecond range, yields nullopt.
std::optional<std::int64_t> ParseDocumentTimestamp(std::string_view text);

} // namespace mlmeta::util
