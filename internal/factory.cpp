#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/query/listing.hpp"
#include "internal/service/service_context.hpp"
#include "internal/store/memory/memory_document_store.hpp"
#include "internal/store/sqlite/sqlite_db.hpp"
#include "internal/store/sqlite/sqlite_document_store.hpp"

namespace mlmeta::factory {

std::shared_ptr<store::DocumentStore> BuildStore(const mlmeta::runtime::config::StoreConfig& config) {
  const std::size_t page_size = config.query_page_size();

  if (config.has_sqlite()) {
    const auto& sqlite = config.sqlite();
    if (sqlite.path().empty()) {
      throw std::runtime_error("store.sqlite.path must be set");
    }
    auto db = std::make_shared<store::sqlite::SqliteDB>(sqlite.path(), sqlite.wal_mode());
    store::sqlite::SqliteDocumentStore::Bootstrap(*db);
    MLMETA_LOG_INFO("Using sqlite document store", {observability::StringField("path", sqlite.path()),
                                                    observability::BoolField("wal_mode", sqlite.wal_mode())});
    return std::make_shared<store::sqlite::SqliteDocumentStore>(std::move(db), page_size);
  }

  MLMETA_LOG_INFO("Using in-memory document store");
  return std::make_shared<store::memory::MemoryDocumentStore>(page_size);
}

/*
    Build full application dependency graph
*/
Application Build(const mlmeta::runtime::config::RuntimeConfig& config) {
  Application app;
  app.store = BuildStore(config.store());

  service::ServiceContext ctx;
  ctx.store = app.store;
  if (config.listing().default_run_limit() > 0) {
    ctx.listing.default_run_limit = config.listing().default_run_limit();
  }

  app.metadata_service = std::make_shared<service::MetadataService>(std::move(ctx));
  return app;
}

} // namespace mlmeta::factory
