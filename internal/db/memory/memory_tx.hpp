#pragma once

#include <cstdint>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace stash::db::memory {

/*
  Works on a private copy of the committed rows.

  A write transaction publishes its copy on Commit() only if no other
  writer committed since it began; otherwise Commit() throws and the
  caller's write is lost. A read transaction never publishes.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  MemoryTransaction(MemoryRepository& repo, TxMode mode);

  TxMode Mode() const override {
    return mode_;
  }

  void Commit() override;
  void Rollback() override;

  MemoryRepository::State& Rows() {
    return working_;
  }
  const MemoryRepository::State& Rows() const {
    return working_;
  }

 private:
  void Finish();

  MemoryRepository&       repo_;
  TxMode                  mode_;
  MemoryRepository::State working_;
  std::uint64_t           base_version_ = 0;
  bool                    finished_     = false;
};

} // namespace stash::db::memory
