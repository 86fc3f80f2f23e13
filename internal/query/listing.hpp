#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "internal/store/api/document_store.hpp"

namespace mlmeta::query {

// Built-in run listing limit when the caller supplies none.
inline constexpr std::size_t kDefaultRunLimit = 30;

// Attribute the listing sorts on.
inline constexpr const char* kSortAttribute = "status_lasttimeEpoch";

/*
  Drains `cursor` and returns the `_data_` blob of every item.

  When `sort` is set or `limit` > 0 the blobs are ordered newest first by
  status_lasttimeEpoch (stable; items without it get 0, 1, 2, ... in
  arrival order). `limit` > 0 truncates; 0 is unbounded.
*/
std::vector<std::string> List(store::ItemCursor& cursor, bool sort, std::size_t limit);

// {"<key>": [b1,b2,...]} with the blobs spliced in verbatim.
std::string WrapListing(std::string_view key, const std::vector<std::string>& blobs);

// {"data": <blob>} with the blob spliced in verbatim.
std::string WrapDocument(std::string_view blob);

/*
  Parses a listing limit parameter.

  Empty -> default_limit. Non-negative integer -> that value (0 = unbounded).
  Anything else throws util::InvalidArgument.
*/
std::size_t ParseLimit(std::string_view text, std::size_t default_limit);

} // namespace mlmeta::query
