#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace stash::db::sqlite {

class SqliteRepository final : public db::TaskRepository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin(TxMode mode) override;

  Result InsertTask(Transaction&, const model::TaskRecord&) override;
  std::vector<model::TaskRecord> ListActive(Transaction&) override;
  std::vector<model::TaskRecord> ListCompleted(Transaction&) override;
  Result MarkCompleted(Transaction&, const std::string& id, double completed_at) override;
  Result UpdateTier(Transaction&, const std::string& id, const std::string& tier,
                    double assigned_at) override;
  Result DeleteCompleted(Transaction&) override;
  Result DeleteAll(Transaction&) override;
  std::uint64_t CountActive(Transaction&, const std::string& tier) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  std::vector<model::TaskRecord> Query(Transaction& t, const char* sql);
  Result ExecDelete(Transaction& t, const char* sql);
};

}
