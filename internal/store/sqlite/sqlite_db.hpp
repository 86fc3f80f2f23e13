#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace mlmeta::store::sqlite {

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  SqliteDB(std::string path, bool wal_mode);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/migrations/transaction control)
  void Exec(const std::string& sql);

 private:
  void Configure(bool wal_mode);

  sqlite3*    db_ = nullptr;
  std::string path_;
};

using StatementPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

// Prepares `sql`; throws on failure.
StatementPtr Prepare(sqlite3* db, const char* sql);

/*
  Scoped write transaction (BEGIN IMMEDIATE).

  Rolls back on destruction unless committed.
*/
class WriteTransaction {
 public:
  explicit WriteTransaction(SqliteDB& db);
  ~WriteTransaction();

  WriteTransaction(const WriteTransaction&)            = delete;
  WriteTransaction& operator=(const WriteTransaction&) = delete;

  void Commit();

 private:
  SqliteDB& db_;
  bool      committed_ = false;
};

} // namespace mlmeta::store::sqlite
