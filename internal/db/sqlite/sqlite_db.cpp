#include "sqlite_db.hpp"

#include <filesystem>
#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace stash::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  if (path_ != ":memory:") {
    const auto parent = std::filesystem::path(path_).parent_path();
    std::error_code ec;
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw util::StorageUnavailable("cannot create data directory " + parent.string() + ": " + ec.message());
    }
  }

  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::StorageUnavailable("open " + path_ + ": " + msg);
  }

  try {
    Configure(wal_mode);
    const int applied = sql::RunMigrations(*this, sql::SchemaMigrations());
    if (applied > 0) {
      STASH_LOG_INFO("sqlite schema migrated", {observability::StringField("path", path_), observability::IntField("applied", applied),
                                                observability::IntField("version", SchemaVersion())});
    }
  } catch (const std::exception& e) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw util::StorageUnavailable("initialize " + path_ + ": " + e.what());
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  return stmt;
}

int SqliteDB::SchemaVersion() {
  sqlite3_stmt* stmt    = Prepare("PRAGMA user_version;");
  const int     rc      = sqlite3_step(stmt);
  const int     version = rc == SQLITE_ROW ? sqlite3_column_int(stmt, 0) : 0;
  sqlite3_finalize(stmt);
  if (rc != SQLITE_ROW) ThrowIf(rc, db_, "read user_version");
  return version;
}

void SqliteDB::SetSchemaVersion(int version) {
  // PRAGMA takes no bound parameters
  Exec("PRAGMA user_version=" + std::to_string(version) + ";");
}

void SqliteDB::Configure(bool wal_mode) {
  // IMPORTANT: WAL lets the CLI read while the agent holds the write lock
  if (wal_mode) Exec("PRAGMA journal_mode=WAL;");

  Exec("PRAGMA synchronous=NORMAL;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace stash::db::sqlite
