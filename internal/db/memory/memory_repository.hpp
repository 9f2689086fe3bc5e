#pragma once

#include <cstdint>
#include <mutex>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace stash::db::memory {

class MemoryTransaction;

/*
  Non-durable backend.

  Used by tests and as the fallback when the data file cannot be
  opened: the engine keeps working, nothing survives the process.
*/
class MemoryRepository final : public db::TaskRepository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    // insertion order doubles as the rowid tie-break
    std::vector<model::TaskRecord> rows;
  };

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

}
