#pragma once

namespace stash::db {

enum class TxMode {
  kRead,  // consistent view of committed rows; writes are refused
  kWrite, // the single writer
};

constexpr const char* ToString(TxMode mode) {
  return mode == TxMode::kRead ? "read" : "write";
}

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Writes are invisible to others until Commit()
  - Reads inside the transaction see its own writes
  - Rollback() (or destruction without Commit()) discards all writes
  - Commit() or Rollback() ends the transaction; a second call throws

                 kRead              kWrite
  SQLite:        BEGIN DEFERRED     BEGIN IMMEDIATE
  Memory:        snapshot copy      snapshot copy + version check
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual TxMode Mode() const = 0;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;
};

} // namespace stash::db
