#include "internal/store/sqlite/sqlite_document_store.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using mlmeta::store::kDataAttribute;
using mlmeta::store::kNameAttribute;
using mlmeta::store::sqlite::SqliteDB;
using mlmeta::store::sqlite::SqliteDocumentStore;

std::filesystem::path DatabasePath(const std::string& test_name) {
  const auto base_dir = std::filesystem::temp_directory_path() / "mlmeta_sqlite_document_store_tests";
  std::filesystem::create_directories(base_dir);
  const auto path = base_dir / (test_name + ".db");
  std::filesystem::remove(path);
  std::filesystem::remove(path.string() + "-wal");
  std::filesystem::remove(path.string() + "-shm");
  return path;
}

std::unique_ptr<SqliteDocumentStore> OpenStore(const std::filesystem::path& path, std::size_t page_size = 0) {
  auto db = std::make_shared<SqliteDB>(path.string(), true);
  SqliteDocumentStore::Bootstrap(*db);
  return std::make_unique<SqliteDocumentStore>(std::move(db), page_size);
}

template <typename Fn>
bool ThrowsNotFound(Fn&& fn) {
  try {
    fn();
  } catch (const mlmeta::util::NotFound&) {
    return true;
  }
  return false;
}

void TestTypedAttributesSurviveReopen() {
  const auto path = DatabasePath("reopen");
  {
    auto store = OpenStore(path);
    store->ReplaceItem("/run/p/a", {{kDataAttribute, std::string(R"({"metadata":{"name":"train"}})")},
                                    {"metadata_iteration", std::int64_t{7}},
                                    {"accuracy", 0.5},
                                    {"cached", true}});
  }

  auto       store = OpenStore(path);
  const auto item  = store->GetItem("/run/p/a", {});
  assert(item.GetFieldString(kDataAttribute) == R"({"metadata":{"name":"train"}})");
  assert(item.GetFieldInt("metadata_iteration") == 7);
  assert(item.GetFieldDouble("accuracy") == 0.5);
  assert(std::get<bool>(item.attributes.at("cached")));
  assert(item.GetFieldString(kNameAttribute) == "a");
}

void TestObjectsAndItemsShareAPath() {
  auto store = OpenStore(DatabasePath("shared_path"));
  store->PutObject("/run/p/a", "body");
  store->UpdateItem("/run/p/a", {{"status_state", std::string("running")}});
  store->UpdateItem("/run/p/a", {{"metadata_name", std::string("train")}});

  assert(store->GetObject("/run/p/a") == "body");
  const auto item = store->GetItem("/run/p/a", {});
  assert(item.GetFieldString("status_state") == "running");
  assert(item.GetFieldString("metadata_name") == "train");

  store->ReplaceItem("/run/p/a", {{"status_state", std::string("completed")}});
  const auto replaced = store->GetItem("/run/p/a", {});
  assert(!replaced.HasField("metadata_name"));
  assert(replaced.GetFieldString("status_state") == "completed");
  assert(store->GetObject("/run/p/a") == "body");
}

void TestDeleteAndMissingPaths() {
  auto store = OpenStore(DatabasePath("delete"));
  store->PutObject("/log/p-1", "text");
  store->DeleteObject("/log/p-1");

  assert(ThrowsNotFound([&] { (void)store->GetObject("/log/p-1"); }));
  assert(ThrowsNotFound([&] { store->DeleteObject("/log/p-1"); }));
  assert(ThrowsNotFound([&] { (void)store->GetItem("/run/p/none", {}); }));
}

void TestQueryFiltersDirectChildren() {
  auto store = OpenStore(DatabasePath("query"));
  store->ReplaceItem("/artifact/p/model.latest", {{"name", std::string("model")}});
  store->ReplaceItem("/artifact/p/model.uid1", {{"name", std::string("model")}});
  store->ReplaceItem("/artifact/p/data.latest", {{"name", std::string("data")}});
  store->ReplaceItem("/artifact/p/sub/x.latest", {{"name", std::string("model")}});

  auto latest = store->Query({"/artifact/p/", {kNameAttribute}, R"(name == "model" AND ends(__name, "latest"))"})->All();
  assert(latest.size() == 1);
  assert(latest[0].path == "/artifact/p/model.latest");
  assert(latest[0].attributes.size() == 1);

  assert(store->Query({"/artifact/p/", {}, ""})->All().size() == 3);
  assert(ThrowsNotFound([&] { (void)store->Query({"/artifact/q/", {}, ""}); }));
}

void TestQueryPageSize() {
  auto store = OpenStore(DatabasePath("page_size"), 2);
  for (const char* uid : {"a", "b", "c"}) {
    store->ReplaceItem(std::string("/run/p/") + uid, {});
  }
  assert(store->Query({"/run/p/", {}, ""})->All().size() == 2);
}

void TestMalformedFilterIsBadRequest() {
  auto store = OpenStore(DatabasePath("bad_filter"));
  store->ReplaceItem("/run/p/a", {});

  int status = 0;
  try {
    (void)store->Query({"/run/p/", {}, "exists("});
  } catch (const mlmeta::util::BackendError& e) {
    status = e.StatusCode();
  }
  assert(status == 400);
}

} // namespace

int main() {
  TestTypedAttributesSurviveReopen();
  TestObjectsAndItemsShareAPath();
  TestDeleteAndMissingPaths();
  TestQueryFiltersDirectChildren();
  TestQueryPageSize();
  TestMalformedFilterIsBadRequest();

  std::cout << "mlmeta_unit_sqlite_document_store: pass\n";
  return 0;
}
