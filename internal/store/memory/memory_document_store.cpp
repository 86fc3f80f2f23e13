#include "memory_document_store.hpp"

#include <utility>

#include "internal/store/filter/filter_expr.hpp"
#include "internal/util/errors.hpp"

namespace mlmeta::store::memory {

namespace {

constexpr int kStatusBadRequest = 400;

bool IsDirectChild(const std::string& path, const std::string& dir) {
  if (path.size() <= dir.size() || path.compare(0, dir.size(), dir) != 0) {
    return false;
  }
  return path.find('/', dir.size()) == std::string::npos;
}

} // namespace

MemoryDocumentStore::MemoryDocumentStore(std::size_t query_page_size) : query_page_size_(query_page_size) {
}

AttributeMap MemoryDocumentStore::WithSystemAttributes(const std::string& path, const Entry& entry) {
  AttributeMap attributes = entry.attributes;
  attributes[kNameAttribute] = BaseName(path);
  return attributes;
}

void MemoryDocumentStore::PutObject(const std::string& path, const std::string& body) {
  std::scoped_lock lock(mutex_);
  entries_[path] = Entry{body, {}};
}

std::string MemoryDocumentStore::GetObject(const std::string& path) {
  std::scoped_lock lock(mutex_);
  auto it = entries_.find(path);
  if (it == entries_.end()) {
    throw util::NotFound("object not found: " + path);
  }
  return it->second.body;
}

Item MemoryDocumentStore::GetItem(const std::string& path, const std::vector<std::string>& attribute_names) {
  std::scoped_lock lock(mutex_);
  auto it = entries_.find(path);
  if (it == entries_.end()) {
    throw util::NotFound("item not found: " + path);
  }
  return Item{path, Project(WithSystemAttributes(path, it->second), attribute_names)};
}

void MemoryDocumentStore::UpdateItem(const std::string& path, const AttributeMap& attributes) {
  std::scoped_lock lock(mutex_);
  auto& entry = entries_[path];
  for (const auto& [name, value] : attributes) {
    entry.attributes[name] = value;
  }
}

void MemoryDocumentStore::ReplaceItem(const std::string& path, const AttributeMap& attributes) {
  std::scoped_lock lock(mutex_);
  entries_[path].attributes = attributes;
}

void MemoryDocumentStore::DeleteObject(const std::string& path) {
  std::scoped_lock lock(mutex_);
  if (entries_.erase(path) == 0) {
    throw util::NotFound("object not found: " + path);
  }
}

std::unique_ptr<ItemCursor> MemoryDocumentStore::Query(const QueryInput& input) {
  std::optional<filter::FilterExpr> expr;
  try {
    expr = filter::ParseFilter(input.filter);
  } catch (const filter::FilterSyntaxError& e) {
    throw util::BackendError(kStatusBadRequest, e.what());
  }

  std::scoped_lock  lock(mutex_);
  std::vector<Item> matched;
  bool              directory_exists = false;

  for (auto it = entries_.lower_bound(input.path); it != entries_.end(); ++it) {
    const auto& path = it->first;
    if (path.compare(0, input.path.size(), input.path) != 0) {
      break;
    }
    directory_exists = true;
    if (!IsDirectChild(path, input.path)) {
      continue;
    }

    auto attributes = WithSystemAttributes(path, it->second);
    if (!filter::Matches(expr, attributes)) {
      continue;
    }
    matched.push_back(Item{path, Project(attributes, input.attribute_names)});
    if (query_page_size_ > 0 && matched.size() >= query_page_size_) {
      break;
    }
  }

  if (!directory_exists) {
    throw util::NotFound("directory not found: " + input.path);
  }
  return std::make_unique<SnapshotCursor>(std::move(matched));
}

std::size_t MemoryDocumentStore::Size() const {
  std::scoped_lock lock(mutex_);
  return entries_.size();
}

} // namespace mlmeta::store::memory
