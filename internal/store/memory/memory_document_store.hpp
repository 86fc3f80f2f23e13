#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <string>

#include "internal/store/api/document_store.hpp"

namespace mlmeta::store::memory {

/*
  In-process document store.

  One mutex guards the whole map; queries copy the matching items out under
  the lock so cursors never observe later writes.
*/
class MemoryDocumentStore final : public DocumentStore {
 public:
  explicit MemoryDocumentStore(std::size_t query_page_size = 0);

  void PutObject(const std::string& path, const std::string& body) override;
  std::string GetObject(const std::string& path) override;
  Item GetItem(const std::string& path, const std::vector<std::string>& attribute_names) override;
  void UpdateItem(const std::string& path, const AttributeMap& attributes) override;
  void ReplaceItem(const std::string& path, const AttributeMap& attributes) override;
  void DeleteObject(const std::string& path) override;
  std::unique_ptr<ItemCursor> Query(const QueryInput& input) override;

  std::size_t Size() const;

 private:
  struct Entry {
    std::string  body;
    AttributeMap attributes;
  };

  static AttributeMap WithSystemAttributes(const std::string& path, const Entry& entry);

  mutable std::mutex                  mutex_;
  std::map<std::string, Entry>        entries_;
  std::size_t                         query_page_size_;
};

} // namespace mlmeta::store::memory
