#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/task_record.hpp"

namespace stash::db {

/*
  Task repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a kWrite Transaction; in a kRead one they
    return ReadOnly and change nothing
  - Reads inside a transaction see its writes
  - Active rows list oldest tier assignment first
  - Completed rows list most recent completion first

  The DB is the source of truth for every task; the engine only
  ever holds a reloaded copy.
*/

class TaskRepository {
 public:
  virtual ~TaskRepository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin(TxMode mode) = 0;

  // ---------------------------------------------------------------------
  // Task lifecycle
  // ---------------------------------------------------------------------

  // AlreadyExists when the id is taken.
  virtual Result InsertTask(Transaction&, const model::TaskRecord&) = 0;

  virtual std::vector<model::TaskRecord> ListActive(Transaction&) = 0;

  virtual std::vector<model::TaskRecord> ListCompleted(Transaction&) = 0;

  // Only touches rows that are still active. NotFound otherwise.
  virtual Result MarkCompleted(Transaction&, const std::string& id, double completed_at) = 0;

  // Sets tier and tierAssignedAt on an active row. NotFound otherwise.
  virtual Result UpdateTier(Transaction&, const std::string& id, const std::string& tier, double assigned_at) = 0;

  virtual Result DeleteCompleted(Transaction&) = 0;

  virtual Result DeleteAll(Transaction&) = 0;

  virtual std::uint64_t CountActive(Transaction&, const std::string& tier) = 0;
};

// Shared guard for the write half of every backend.
inline Result CheckWritable(const Transaction& tx) {
  if (tx.Mode() == TxMode::kWrite) return Result::Ok();
  return Result::Err(ErrorCode::ReadOnly, "write attempted in a read transaction");
}

} // namespace stash::db
