#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace stash::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin(TxMode mode) {
  return std::make_unique<MemoryTransaction>(*this, mode);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

static model::TaskRecord* FindActive(std::vector<model::TaskRecord>& rows, const std::string& id) {
  auto it = std::find_if(rows.begin(), rows.end(), [&](const model::TaskRecord& r) { return r.id == id && !r.is_completed; });
  return it == rows.end() ? nullptr : &*it;
}

Result MemoryRepository::InsertTask(Transaction& t, const model::TaskRecord& r) {
  if (auto writable = CheckWritable(t); !writable) return writable;
  auto& rows = TX(t).Rows().rows;
  if (std::any_of(rows.begin(), rows.end(), [&](const model::TaskRecord& row) { return row.id == r.id; })) {
    return Result::Err(ErrorCode::AlreadyExists, "task " + r.id + " already exists");
  }
  rows.push_back(r);
  return Result::Ok();
}

std::vector<model::TaskRecord> MemoryRepository::ListActive(Transaction& t) {
  std::vector<model::TaskRecord> out;
  for (const auto& r : TX(t).Rows().rows)
    if (!r.is_completed) out.push_back(r);

  std::stable_sort(out.begin(), out.end(),
                   [](const model::TaskRecord& a, const model::TaskRecord& b) { return a.tier_assigned_at < b.tier_assigned_at; });
  return out;
}

std::vector<model::TaskRecord> MemoryRepository::ListCompleted(Transaction& t) {
  std::vector<model::TaskRecord> out;
  const auto&                    rows = TX(t).Rows().rows;
  // reverse insertion order so ties match "rowid DESC"
  for (auto it = rows.rbegin(); it != rows.rend(); ++it)
    if (it->is_completed) out.push_back(*it);

  std::stable_sort(out.begin(), out.end(), [](const model::TaskRecord& a, const model::TaskRecord& b) {
    return a.completed_at.value_or(0.0) > b.completed_at.value_or(0.0);
  });
  return out;
}

Result MemoryRepository::MarkCompleted(Transaction& t, const std::string& id, double completed_at) {
  if (auto writable = CheckWritable(t); !writable) return writable;
  auto* row = FindActive(TX(t).Rows().rows, id);
  if (!row) return Result::Err(ErrorCode::NotFound, "no active task " + id);
  row->is_completed = true;
  row->completed_at = completed_at;
  return Result::Ok();
}

Result MemoryRepository::UpdateTier(Transaction& t, const std::string& id, const std::string& tier, double assigned_at) {
  if (auto writable = CheckWritable(t); !writable) return writable;
  auto* row = FindActive(TX(t).Rows().rows, id);
  if (!row) return Result::Err(ErrorCode::NotFound, "no active task " + id);
  row->tier             = tier;
  row->tier_assigned_at = assigned_at;
  return Result::Ok();
}

Result MemoryRepository::DeleteCompleted(Transaction& t) {
  if (auto writable = CheckWritable(t); !writable) return writable;
  auto& rows = TX(t).Rows().rows;
  rows.erase(std::remove_if(rows.begin(), rows.end(), [](const model::TaskRecord& r) { return r.is_completed; }), rows.end());
  return Result::Ok();
}

Result MemoryRepository::DeleteAll(Transaction& t) {
  if (auto writable = CheckWritable(t); !writable) return writable;
  TX(t).Rows().rows.clear();
  return Result::Ok();
}

std::uint64_t MemoryRepository::CountActive(Transaction& t, const std::string& tier) {
  const auto& rows = TX(t).Rows().rows;
  return static_cast<std::uint64_t>(
      std::count_if(rows.begin(), rows.end(), [&](const model::TaskRecord& r) { return !r.is_completed && r.tier == tier; }));
}

} // namespace stash::db::memory
