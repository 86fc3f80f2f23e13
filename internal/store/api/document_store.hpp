#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/store/api/item.hpp"

namespace mlmeta::store {

/*
  Forward-only cursor over the items matched by a query.

  The matched set is fixed when the query runs; later writes to the store
  are not observed by an open cursor.
*/
class ItemCursor {
 public:
  virtual ~ItemCursor() = default;

  virtual std::optional<Item> Next() = 0;

  // Drains the remaining items.
  std::vector<Item> All();
};

class SnapshotCursor final : public ItemCursor {
 public:
  explicit SnapshotCursor(std::vector<Item> items);

  std::optional<Item> Next() override;

 private:
  std::vector<Item> items_;
  std::size_t       position_ = 0;
};

struct QueryInput {
  // Directory to scan, with trailing slash ("/run/<project>/").
  std::string path;

  // Attributes to return per item (empty = all).
  std::vector<std::string> attribute_names;

  // Filter expression (empty = match everything).
  std::string filter;
};

/*
  Document store abstraction.

  Addresses objects/items by hierarchical path. An object body and the
  item attributes at the same path are one entity.

  ERRORS (all methods):
    util::NotFound      path (or query directory) does not exist
    util::BackendError  every other failure, with the backend status code

  Implementations must be safe for concurrent use. No operation is atomic
  across calls: read-modify-write sequences are last-writer-wins.
*/
class DocumentStore {
 public:
  virtual ~DocumentStore() = default;

  // Full object write; replaces body and drops existing attributes.
  virtual void PutObject(const std::string& path, const std::string& body) = 0;

  virtual std::string GetObject(const std::string& path) = 0;

  virtual Item GetItem(const std::string& path, const std::vector<std::string>& attribute_names) = 0;

  // Attribute-level upsert; creates the item when missing.
  virtual void UpdateItem(const std::string& path, const AttributeMap& attributes) = 0;

  // The item's attributes become exactly `attributes`; the object body is
  // kept. Creates the item when missing.
  virtual void ReplaceItem(const std::string& path, const AttributeMap& attributes) = 0;

  virtual void DeleteObject(const std::string& path) = 0;

  // Direct children of input.path that satisfy input.filter.
  virtual std::unique_ptr<ItemCursor> Query(const QueryInput& input) = 0;
};

} // namespace mlmeta::store
