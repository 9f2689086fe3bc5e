#include "sqlite_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace stash::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, TxMode mode) : db_(std::move(db)), mode_(mode) {
  db_->Exec(mode_ == TxMode::kWrite ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!open_) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    STASH_LOG_WARN("sqlite rollback failed", {observability::StringField("mode", ToString(mode_)), observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::EnsureOpen() const {
  if (!open_) throw std::logic_error(std::string(ToString(mode_)) + " transaction already finished");
}

void SqliteTransaction::Commit() {
  EnsureOpen();
  // a failed COMMIT leaves the transaction open; the destructor rolls it back
  db_->Exec("COMMIT;");
  open_ = false;
}

void SqliteTransaction::Rollback() {
  EnsureOpen();
  open_ = false;
  db_->Exec("ROLLBACK;");
}

} // namespace stash::db::sqlite
