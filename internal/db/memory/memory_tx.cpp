#include "memory_tx.hpp"

#include <stdexcept>

namespace stash::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, TxMode mode) : repo_(repo), mode_(mode) {
  std::scoped_lock lock(repo_.mutex_);
  working_      = repo_.committed_;
  base_version_ = repo_.committed_version_;
}

void MemoryTransaction::Finish() {
  if (finished_) throw std::logic_error(std::string(ToString(mode_)) + " transaction already finished");
  finished_ = true;
}

void MemoryTransaction::Commit() {
  Finish();
  if (mode_ == TxMode::kRead) return;

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != base_version_) {
    throw std::runtime_error("write conflict: rows changed since the transaction began");
  }
  repo_.committed_ = std::move(working_);
  ++repo_.committed_version_;
}

void MemoryTransaction::Rollback() {
  Finish();
  working_.rows.clear();
}

} // namespace stash::db::memory
