#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace stash::db::sqlite {

/*
  Write transactions take the RESERVED lock at BEGIN so the CLI and the
  agent queue on busy_timeout up front rather than failing to upgrade a
  read lock halfway through. Read transactions stay DEFERRED and, under
  WAL, never block the writer.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  SqliteTransaction(std::shared_ptr<SqliteDB> db, TxMode mode);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  TxMode Mode() const override {
    return mode_;
  }

  void Commit() override;
  void Rollback() override;

 private:
  void EnsureOpen() const;

  std::shared_ptr<SqliteDB> db_;
  TxMode                    mode_;
  bool                      open_ = true;
};

} // namespace stash::db::sqlite
