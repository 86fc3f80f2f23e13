#include "internal/store/memory/memory_document_store.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using mlmeta::store::AttributeMap;
using mlmeta::store::kDataAttribute;
using mlmeta::store::kNameAttribute;
using mlmeta::store::memory::MemoryDocumentStore;

template <typename Fn>
bool ThrowsNotFound(Fn&& fn) {
  try {
    fn();
  } catch (const mlmeta::util::NotFound&) {
    return true;
  }
  return false;
}

void TestObjectRoundTripAndMissingPaths() {
  MemoryDocumentStore store;
  store.PutObject("/log/p-1", "line one\nline two");
  assert(store.GetObject("/log/p-1") == "line one\nline two");

  assert(ThrowsNotFound([&] { (void)store.GetObject("/log/p-2"); }));
  assert(ThrowsNotFound([&] { (void)store.GetItem("/run/p/missing", {}); }));
  assert(ThrowsNotFound([&] { store.DeleteObject("/run/p/missing"); }));
}

void TestUpdateItemMergesAttributes() {
  MemoryDocumentStore store;
  store.UpdateItem("/run/p/a", {{"status_state", std::string("running")}, {"metadata_iteration", std::int64_t{1}}});
  store.UpdateItem("/run/p/a", {{"status_state", std::string("completed")}});

  const auto item = store.GetItem("/run/p/a", {});
  assert(item.GetFieldString("status_state") == "completed");
  assert(item.GetFieldInt("metadata_iteration") == 1);
  assert(item.GetFieldString(kNameAttribute) == "a");
}

void TestReplaceItemDropsStaleAttributesAndKeepsBody() {
  MemoryDocumentStore store;
  store.PutObject("/run/p/a", "body");
  store.UpdateItem("/run/p/a", {{"metadata_labels_owner", std::string("alice")}, {"status_state", std::string("running")}});
  store.ReplaceItem("/run/p/a", {{"status_state", std::string("completed")}});

  const auto item = store.GetItem("/run/p/a", {});
  assert(!item.HasField("metadata_labels_owner"));
  assert(item.GetFieldString("status_state") == "completed");
  assert(store.GetObject("/run/p/a") == "body");
}

void TestPutObjectDropsAttributes() {
  MemoryDocumentStore store;
  store.UpdateItem("/run/p/a", {{"status_state", std::string("running")}});
  store.PutObject("/run/p/a", "fresh");

  const auto item = store.GetItem("/run/p/a", {});
  assert(!item.HasField("status_state"));
}

void TestGetItemProjectsRequestedAttributes() {
  MemoryDocumentStore store;
  store.UpdateItem("/run/p/a", {{kDataAttribute, std::string("{}")}, {"status_state", std::string("running")}});

  const auto item = store.GetItem("/run/p/a", {kDataAttribute});
  assert(item.attributes.size() == 1);
  assert(item.GetFieldString(kDataAttribute) == "{}");
  assert(!item.GetFieldInt(kDataAttribute));
}

void TestQueryScansDirectChildrenOnly() {
  MemoryDocumentStore store;
  store.UpdateItem("/run/p/a", {{"status_state", std::string("running")}});
  store.UpdateItem("/run/p/b", {{"status_state", std::string("completed")}});
  store.UpdateItem("/run/p/nested/c", {{"status_state", std::string("running")}});
  store.UpdateItem("/run/other/d", {{"status_state", std::string("running")}});

  auto items = store.Query({"/run/p/", {}, R"(status_state == "running")"})->All();
  assert(items.size() == 1);
  assert(items[0].path == "/run/p/a");

  auto all = store.Query({"/run/p/", {kNameAttribute}, ""})->All();
  assert(all.size() == 2);
  assert(all[0].GetFieldString(kNameAttribute) == "a");
  assert(all[1].GetFieldString(kNameAttribute) == "b");
}

void TestQueryMissingDirectoryIsNotFound() {
  MemoryDocumentStore store;
  store.UpdateItem("/run/p/a", {});
  assert(ThrowsNotFound([&] { (void)store.Query({"/run/q/", {}, ""}); }));
}

void TestQueryRejectsMalformedFilterAsBadRequest() {
  MemoryDocumentStore store;
  store.UpdateItem("/run/p/a", {});

  bool threw = false;
  try {
    (void)store.Query({"/run/p/", {}, "status_state =="});
  } catch (const mlmeta::util::BackendError& e) {
    threw = e.StatusCode() == 400;
  }
  assert(threw);
}

void TestQueryCursorIsASnapshot() {
  MemoryDocumentStore store;
  store.UpdateItem("/run/p/a", {});
  auto cursor = store.Query({"/run/p/", {}, ""});
  store.UpdateItem("/run/p/b", {});

  std::size_t seen = 0;
  while (cursor->Next()) ++seen;
  assert(seen == 1);
}

void TestQueryPageSizeBoundsResults() {
  MemoryDocumentStore store(2);
  for (const char* uid : {"a", "b", "c"}) {
    store.UpdateItem(std::string("/run/p/") + uid, {});
  }
  assert(store.Query({"/run/p/", {}, ""})->All().size() == 2);
}

} // namespace

int main() {
  TestObjectRoundTripAndMissingPaths();
  TestUpdateItemMergesAttributes();
  TestReplaceItemDropsStaleAttributesAndKeepsBody();
  TestPutObjectDropsAttributes();
  TestGetItemProjectsRequestedAttributes();
  TestQueryScansDirectChildrenOnly();
  TestQueryMissingDirectoryIsNotFound();
  TestQueryRejectsMalformedFilterAsBadRequest();
  TestQueryCursorIsASnapshot();
  TestQueryPageSizeBoundsResults();

  std::cout << "mlmeta_unit_memory_document_store: pass\n";
  return 0;
}
