#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

#include "internal/store/api/document_store.hpp"
#include "sqlite_db.hpp"

namespace mlmeta::store::sqlite {

/*
  SQLite-backed document store.

  Schema (one row per path):
    items(path TEXT PRIMARY KEY, dir TEXT, body BLOB, attributes BLOB)

  `attributes` holds a serialized mlmeta.store.v1.StoredAttributes message.
  Filters are evaluated in-process after the directory scan.
*/
class SqliteDocumentStore final : public DocumentStore {
 public:
  SqliteDocumentStore(std::shared_ptr<SqliteDB> db, std::size_t query_page_size = 0);

  // Creates the schema if missing.
  static void Bootstrap(SqliteDB& db);

  void PutObject(const std::string& path, const std::string& body) override;
  std::string GetObject(const std::string& path) override;
  Item GetItem(const std::string& path, const std::vector<std::string>& attribute_names) override;
  void UpdateItem(const std::string& path, const AttributeMap& attributes) override;
  void ReplaceItem(const std::string& path, const AttributeMap& attributes) override;
  void DeleteObject(const std::string& path) override;
  std::unique_ptr<ItemCursor> Query(const QueryInput& input) override;

 private:
  std::shared_ptr<SqliteDB> db_;
  std::size_t               query_page_size_;

  // One connection is shared; BEGIN IMMEDIATE sections must not interleave.
  std::mutex mutex_;
};

} // namespace mlmeta::store::sqlite
