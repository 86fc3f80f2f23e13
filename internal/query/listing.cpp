#include "internal/query/listing.hpp"

#include <algorithm>
#include <charconv>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace mlmeta::query {

namespace {

struct Entry {
  std::int64_t sort_key = 0;
  std::string  blob;
};

} // namespace

std::vector<std::string> List(store::ItemCursor& cursor, bool sort, std::size_t limit) {
  std::vector<Entry> entries;
  std::int64_t       synthetic_key = 0;

  while (auto item = cursor.Next()) {
    Entry entry;
    if (auto epoch = item->GetFieldInt(kSortAttribute)) {
      entry.sort_key = *epoch;
    } else {
      entry.sort_key = synthetic_key++;
    }
    if (auto blob = item->GetFieldString(store::kDataAttribute)) {
      entry.blob = std::move(*blob);
    } else {
      MLMETA_LOG_WARN("listed item has no document", {observability::StringField("path", item->path)});
      continue;
    }
    entries.push_back(std::move(entry));
  }

  if (sort || limit > 0) {
    std::stable_sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) { return a.sort_key > b.sort_key; });
  }
  if (limit > 0 && entries.size() > limit) {
    entries.resize(limit);
  }

  std::vector<std::string> blobs;
  blobs.reserve(entries.size());
  for (auto& entry : entries) {
    blobs.push_back(std::move(entry.blob));
  }
  return blobs;
}

std::string WrapListing(std::string_view key, const std::vector<std::string>& blobs) {
  std::string out;
  out += "{\"";
  out += key;
  out += "\": [";
  for (std::size_t i = 0; i < blobs.size(); ++i) {
    if (i > 0) out += ',';
    out += blobs[i];
  }
  out += "]}";
  return out;
}

std::string WrapDocument(std::string_view blob) {
  std::string out;
  out.reserve(blob.size() + 10);
  out += "{\"data\":";
  out += blob;
  out += '}';
  return out;
}

std::size_t ParseLimit(std::string_view text, std::size_t default_limit) {
  if (text.empty()) {
    return default_limit;
  }
  std::size_t limit = 0;
  auto [ptr, ec]    = std::from_chars(text.data(), text.data() + text.size(), limit);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    throw util::InvalidArgument("invalid limit '" + std::string(text) + "'");
  }
  return limit;
}

} // namespace mlmeta::query
