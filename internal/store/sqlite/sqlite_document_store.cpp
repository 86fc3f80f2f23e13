#include "sqlite_document_store.hpp"

#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "internal/store/filter/filter_expr.hpp"
#include "internal/util/errors.hpp"
#include "mlmeta/store/v1/item.pb.h"

namespace mlmeta::store::sqlite {

namespace {

constexpr int kStatusBadRequest         = 400;
constexpr int kStatusConflict           = 409;
constexpr int kStatusInternalError      = 500;
constexpr int kStatusServiceUnavailable = 503;

[[noreturn]] void ThrowBackend(sqlite3* db, int rc, const std::string& what) {
  int status = kStatusInternalError;
  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      status = kStatusServiceUnavailable;
      break;
    case SQLITE_CONSTRAINT:
      status = kStatusConflict;
      break;
    default:
      break;
  }
  throw util::BackendError(status, what + ": " + sqlite3_errmsg(db));
}

StatementPtr PrepareOrThrow(sqlite3* db, const char* sql) {
  try {
    return Prepare(db, sql);
  } catch (const std::runtime_error& e) {
    throw util::BackendError(kStatusInternalError, e.what());
  }
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? std::string(reinterpret_cast<const char*>(t), static_cast<std::size_t>(sqlite3_column_bytes(st, col))) : std::string{};
}

std::string ColBlob(sqlite3_stmt* st, int col) {
  const void* b = sqlite3_column_blob(st, col);
  return b ? std::string(static_cast<const char*>(b), static_cast<std::size_t>(sqlite3_column_bytes(st, col))) : std::string{};
}

std::string EncodeAttributes(const AttributeMap& attributes) {
  v1::StoredAttributes stored;
  auto&                fields = *stored.mutable_attributes();
  for (const auto& [name, value] : attributes) {
    auto& out = fields[name];
    std::visit(
        [&out](const auto& v) {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, std::int64_t>) {
            out.set_int_value(v);
          } else if constexpr (std::is_same_v<T, double>) {
            out.set_double_value(v);
          } else if constexpr (std::is_same_v<T, bool>) {
            out.set_bool_value(v);
          } else {
            out.set_string_value(v);
          }
        },
        value);
  }
  std::string bytes;
  if (!stored.SerializeToString(&bytes)) {
    throw util::BackendError(kStatusInternalError, "failed to serialize item attributes");
  }
  return bytes;
}

AttributeMap DecodeAttributes(const std::string& bytes) {
  v1::StoredAttributes stored;
  if (!stored.ParseFromString(bytes)) {
    throw util::BackendError(kStatusInternalError, "corrupt item attributes");
  }
  AttributeMap attributes;
  for (const auto& [name, value] : stored.attributes()) {
    switch (value.kind_case()) {
      case v1::AttributeValue::kIntValue:
        attributes.emplace(name, value.int_value());
        break;
      case v1::AttributeValue::kDoubleValue:
        attributes.emplace(name, value.double_value());
        break;
      case v1::AttributeValue::kBoolValue:
        attributes.emplace(name, value.bool_value());
        break;
      case v1::AttributeValue::kStringValue:
        attributes.emplace(name, value.string_value());
        break;
      case v1::AttributeValue::KIND_NOT_SET:
        break;
    }
  }
  return attributes;
}

AttributeMap WithSystemAttributes(const std::string& path, AttributeMap attributes) {
  attributes[kNameAttribute] = BaseName(path);
  return attributes;
}

} // namespace

SqliteDocumentStore::SqliteDocumentStore(std::shared_ptr<SqliteDB> db, std::size_t query_page_size)
    : db_(std::move(db)), query_page_size_(query_page_size) {
}

void SqliteDocumentStore::Bootstrap(SqliteDB& db) {
  db.Exec("CREATE TABLE IF NOT EXISTS items (path TEXT PRIMARY KEY, dir TEXT NOT NULL, body BLOB, attributes BLOB NOT NULL);");
  db.Exec("CREATE INDEX IF NOT EXISTS items_dir ON items(dir);");
  db.Exec("SELECT path,dir,body,attributes FROM items LIMIT 1;");
}

void SqliteDocumentStore::PutObject(const std::string& path, const std::string& body) {
  std::scoped_lock lock(mutex_);
  auto*            db = db_->Handle();

  auto st = PrepareOrThrow(db, "INSERT OR REPLACE INTO items(path,dir,body,attributes) VALUES(?,?,?,?);");
  BindText(st.get(), 1, path);
  BindText(st.get(), 2, DirName(path));
  BindBlob(st.get(), 3, body);
  BindBlob(st.get(), 4, EncodeAttributes({}));

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) ThrowBackend(db, rc, "put object " + path);
}

std::string SqliteDocumentStore::GetObject(const std::string& path) {
  std::scoped_lock lock(mutex_);
  auto*            db = db_->Handle();

  auto st = PrepareOrThrow(db, "SELECT body FROM items WHERE path=?;");
  BindText(st.get(), 1, path);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) throw util::NotFound("object not found: " + path);
  if (rc != SQLITE_ROW) ThrowBackend(db, rc, "get object " + path);
  return ColBlob(st.get(), 0);
}

Item SqliteDocumentStore::GetItem(const std::string& path, const std::vector<std::string>& attribute_names) {
  std::scoped_lock lock(mutex_);
  auto*            db = db_->Handle();

  auto st = PrepareOrThrow(db, "SELECT attributes FROM items WHERE path=?;");
  BindText(st.get(), 1, path);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) throw util::NotFound("item not found: " + path);
  if (rc != SQLITE_ROW) ThrowBackend(db, rc, "get item " + path);

  return Item{path, Project(WithSystemAttributes(path, DecodeAttributes(ColBlob(st.get(), 0))), attribute_names)};
}

void SqliteDocumentStore::UpdateItem(const std::string& path, const AttributeMap& attributes) {
  std::scoped_lock lock(mutex_);
  auto*            db = db_->Handle();

  std::unique_ptr<WriteTransaction> tx;
  try {
    tx = std::make_unique<WriteTransaction>(*db_);
  } catch (const std::runtime_error& e) {
    throw util::BackendError(kStatusServiceUnavailable, e.what());
  }

  AttributeMap merged;
  {
    auto st = PrepareOrThrow(db, "SELECT attributes FROM items WHERE path=?;");
    BindText(st.get(), 1, path);
    const int rc = sqlite3_step(st.get());
    if (rc == SQLITE_ROW) {
      merged = DecodeAttributes(ColBlob(st.get(), 0));
    } else if (rc != SQLITE_DONE) {
      ThrowBackend(db, rc, "update item " + path);
    }
  }
  for (const auto& [name, value] : attributes) {
    merged[name] = value;
  }

  auto st = PrepareOrThrow(db,
                           "INSERT INTO items(path,dir,body,attributes) VALUES(?,?,NULL,?) "
                           "ON CONFLICT(path) DO UPDATE SET attributes=excluded.attributes;");
  BindText(st.get(), 1, path);
  BindText(st.get(), 2, DirName(path));
  BindBlob(st.get(), 3, EncodeAttributes(merged));

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) ThrowBackend(db, rc, "update item " + path);

  try {
    tx->Commit();
  } catch (const std::runtime_error& e) {
    throw util::BackendError(kStatusServiceUnavailable, e.what());
  }
}

void SqliteDocumentStore::ReplaceItem(const std::string& path, const AttributeMap& attributes) {
  std::scoped_lock lock(mutex_);
  auto*            db = db_->Handle();

  auto st = PrepareOrThrow(db,
                           "INSERT INTO items(path,dir,body,attributes) VALUES(?,?,NULL,?) "
                           "ON CONFLICT(path) DO UPDATE SET attributes=excluded.attributes;");
  BindText(st.get(), 1, path);
  BindText(st.get(), 2, DirName(path));
  BindBlob(st.get(), 3, EncodeAttributes(attributes));

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) ThrowBackend(db, rc, "replace item " + path);
}

void SqliteDocumentStore::DeleteObject(const std::string& path) {
  std::scoped_lock lock(mutex_);
  auto*            db = db_->Handle();

  auto st = PrepareOrThrow(db, "DELETE FROM items WHERE path=?;");
  BindText(st.get(), 1, path);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) ThrowBackend(db, rc, "delete " + path);
  if (sqlite3_changes(db) == 0) throw util::NotFound("object not found: " + path);
}

std::unique_ptr<ItemCursor> SqliteDocumentStore::Query(const QueryInput& input) {
  std::optional<filter::FilterExpr> expr;
  try {
    expr = filter::ParseFilter(input.filter);
  } catch (const filter::FilterSyntaxError& e) {
    throw util::BackendError(kStatusBadRequest, e.what());
  }

  std::scoped_lock lock(mutex_);
  auto*            db = db_->Handle();

  {
    auto st = PrepareOrThrow(db, "SELECT 1 FROM items WHERE substr(path,1,length(?1))=?1 LIMIT 1;");
    BindText(st.get(), 1, input.path);
    const int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) throw util::NotFound("directory not found: " + input.path);
    if (rc != SQLITE_ROW) ThrowBackend(db, rc, "query " + input.path);
  }

  auto st = PrepareOrThrow(db, "SELECT path,attributes FROM items WHERE dir=? ORDER BY path;");
  BindText(st.get(), 1, input.path);

  std::vector<Item> matched;
  int               rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    auto path       = ColText(st.get(), 0);
    auto attributes = WithSystemAttributes(path, DecodeAttributes(ColBlob(st.get(), 1)));
    if (!filter::Matches(expr, attributes)) {
      continue;
    }
    matched.push_back(Item{path, Project(attributes, input.attribute_names)});
    if (query_page_size_ > 0 && matched.size() >= query_page_size_) {
      rc = SQLITE_DONE;
      break;
    }
  }
  if (rc != SQLITE_DONE) ThrowBackend(db, rc, "query " + input.path);

  return std::make_unique<SnapshotCursor>(std::move(matched));
}

} // namespace mlmeta::store::sqlite
