#include "internal/factory.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/store/memory/memory_document_store.hpp"
#include "internal/store/sqlite/sqlite_document_store.hpp"

namespace {

void TestDefaultsToMemoryStore() {
  mlmeta::runtime::config::RuntimeConfig config;
  auto                                   app = mlmeta::factory::Build(config);
  assert(app.metadata_service);
  assert(std::dynamic_pointer_cast<mlmeta::store::memory::MemoryDocumentStore>(app.store));
}

void TestBuildsSqliteStore() {
  const auto dir = std::filesystem::temp_directory_path() / "mlmeta_factory_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / "factory.db";
  std::filesystem::remove(path);

  mlmeta::runtime::config::RuntimeConfig config;
  config.mutable_store()->mutable_sqlite()->set_path(path.string());
  config.mutable_store()->mutable_sqlite()->set_wal_mode(true);

  auto app = mlmeta::factory::Build(config);
  assert(std::dynamic_pointer_cast<mlmeta::store::sqlite::SqliteDocumentStore>(app.store));

  mlmeta::api::StoreLogRequest req;
  req.set_project("p");
  req.set_uid("u1");
  req.set_body("hello");
  app.metadata_service->StoreLog(req);
  assert(app.store->GetObject("/log/p-u1") == "hello");
  assert(std::filesystem::exists(path));
}

void TestSqliteRequiresPath() {
  mlmeta::runtime::config::StoreConfig config;
  config.mutable_sqlite();

  bool threw = false;
  try {
    (void)mlmeta::factory::BuildStore(config);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestConfiguredRunLimitApplies() {
  mlmeta::runtime::config::RuntimeConfig config;
  config.mutable_listing()->set_default_run_limit(1);
  auto app = mlmeta::factory::Build(config);

  for (const char* uid : {"a", "b"}) {
    mlmeta::api::StoreRunRequest req;
    req.set_project("p");
    req.set_uid(uid);
    req.set_body(R"({"metadata":{"name":"n"}})");
    app.metadata_service->StoreRun(req);
  }

  mlmeta::api::ListRunsRequest list;
  list.set_project("p");
  const auto body = app.metadata_service->ListRuns(list).body();
  assert(body == R"({"runs": [{"metadata":{"name":"n"}}]})");
}

} // namespace

int main() {
  TestDefaultsToMemoryStore();
  TestBuildsSqliteStore();
  TestSqliteRequiresPath();
  TestConfiguredRunLimitApplies();

  std::cout << "mlmeta_unit_factory: pass\n";
  return 0;
}
