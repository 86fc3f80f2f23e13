#include "document_store.hpp"

#include <utility>

namespace mlmeta::store {

std::vector<Item> ItemCursor::All() {
  std::vector<Item> items;
  while (auto item = Next()) {
    items.push_back(std::move(*item));
  }
  return items;
}

SnapshotCursor::SnapshotCursor(std::vector<Item> items) : items_(std::move(items)) {
}

std::optional<Item> SnapshotCursor::Next() {
  if (position_ >= items_.size()) {
    return std::nullopt;
  }
  return std::move(items_[position_++]);
}

} // namespace mlmeta::store
