#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace stash::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  Opening creates the file if needed, applies PRAGMAs and brings the
  schema up to the latest migration. Any failure on that path throws
  util::StorageUnavailable.
*/
class SqliteDB final : public sql::MigrationExecutor {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB() override;

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }

  // PRAGMA user_version
  int  SchemaVersion() override;
  void SetSchemaVersion(int version) override;

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

 private:
  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure(bool wal_mode);

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace stash::db::sqlite
