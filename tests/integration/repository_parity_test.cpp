#include <cassert>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/task_record.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"

namespace {

using stash::db::ErrorCode;
using stash::db::TaskRepository;
using stash::db::TxMode;
using stash::db::memory::MemoryRepository;
using stash::db::model::TaskRecord;

constexpr double kT0 = 1'800'000'000.0;

struct BackendFactory {
  std::string                                      name;
  std::function<std::shared_ptr<TaskRepository>()> make_repository;
};

std::shared_ptr<TaskRepository> MakeSqlite() {
  const auto dir = std::filesystem::temp_directory_path() / "stash_repository_parity_tests";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  auto db = std::make_shared<stash::db::sqlite::SqliteDB>((dir / "parity.db").string());
  return std::make_shared<stash::db::sqlite::SqliteRepository>(std::move(db));
}

TaskRecord Row(const std::string& id, const std::string& tier, double assigned_at) {
  TaskRecord record;
  record.id               = id;
  record.title            = "task " + id;
  record.tier             = tier;
  record.created_at       = kT0;
  record.tier_assigned_at = assigned_at;
  return record;
}

std::vector<std::string> Ids(const std::vector<TaskRecord>& rows) {
  std::vector<std::string> ids;
  for (const auto& row : rows) ids.push_back(row.id);
  return ids;
}

std::optional<TaskRecord> Find(TaskRepository& repo, stash::db::Transaction& tx, const std::string& id) {
  for (auto rows : {repo.ListActive(tx), repo.ListCompleted(tx)}) {
    for (const auto& row : rows) {
      if (row.id == id) return row;
    }
  }
  return std::nullopt;
}

void Insert(TaskRepository& repo, const TaskRecord& record) {
  auto tx = repo.Begin(TxMode::kWrite);
  assert(repo.InsertTask(*tx, record));
  tx->Commit();
}

void TestCommitAndRollback(const BackendFactory& backend) {
  auto repo = backend.make_repository();

  {
    auto tx = repo->Begin(TxMode::kWrite);
    assert(repo->InsertTask(*tx, Row("a", "l1", kT0)));
    // reads inside the transaction see its own write
    assert(Find(*repo, *tx, "a"));
    tx->Rollback();
  }
  {
    auto tx = repo->Begin(TxMode::kWrite);
    assert(repo->InsertTask(*tx, Row("b", "l1", kT0)));
    // destroyed without commit
  }

  auto tx = repo->Begin(TxMode::kRead);
  assert(!Find(*repo, *tx, "a"));
  assert(!Find(*repo, *tx, "b"));
  tx->Commit();

  Insert(*repo, Row("c", "l2", kT0));
  auto read = repo->Begin(TxMode::kRead);
  const auto row = Find(*repo, *read, "c");
  assert(row);
  assert(row->title == "task c");
  assert(row->tier == "l2");
  assert(!row->is_completed);
  assert(!row->completed_at);
  assert(row->created_at == kT0);
  read->Commit();
}

void TestDuplicateInsert(const BackendFactory& backend) {
  auto repo = backend.make_repository();
  Insert(*repo, Row("dup", "l1", kT0));

  auto       tx     = repo->Begin(TxMode::kWrite);
  const auto result = repo->InsertTask(*tx, Row("dup", "l3", kT0));
  assert(!result);
  assert(result.code == ErrorCode::AlreadyExists);
  tx->Rollback();
}

void TestOrdering(const BackendFactory& backend) {
  auto repo = backend.make_repository();
  Insert(*repo, Row("late", "l1", kT0 + 20));
  Insert(*repo, Row("tie-1", "l2", kT0 + 10));
  Insert(*repo, Row("early", "l3", kT0));
  Insert(*repo, Row("tie-2", "mem", kT0 + 10));

  {
    auto tx = repo->Begin(TxMode::kWrite);
    assert((Ids(repo->ListActive(*tx)) == std::vector<std::string>{"early", "tie-1", "tie-2", "late"}));
    assert(repo->MarkCompleted(*tx, "early", kT0 + 50));
    assert(repo->MarkCompleted(*tx, "late", kT0 + 40));
    assert(repo->MarkCompleted(*tx, "tie-1", kT0 + 50));
    tx->Commit();
  }

  auto tx = repo->Begin(TxMode::kRead);
  // most recent completion first, later insert wins a tie
  assert((Ids(repo->ListCompleted(*tx)) == std::vector<std::string>{"early", "tie-1", "late"}));
  assert((Ids(repo->ListActive(*tx)) == std::vector<std::string>{"tie-2"}));
  tx->Commit();
}

void TestActiveOnlyUpdates(const BackendFactory& backend) {
  auto repo = backend.make_repository();
  Insert(*repo, Row("t", "l3", kT0));

  auto tx = repo->Begin(TxMode::kWrite);
  assert(repo->UpdateTier(*tx, "t", "l2", kT0 + 5));
  auto row = Find(*repo, *tx, "t");
  assert(row->tier == "l2");
  assert(row->tier_assigned_at == kT0 + 5);

  assert(repo->MarkCompleted(*tx, "t", kT0 + 9));
  row = Find(*repo, *tx, "t");
  assert(row->is_completed);
  assert(row->completed_at == kT0 + 9);
  assert(row->tier_assigned_at == kT0 + 5);

  assert(repo->UpdateTier(*tx, "t", "l1", kT0 + 10).code == ErrorCode::NotFound);
  assert(repo->MarkCompleted(*tx, "t", kT0 + 10).code == ErrorCode::NotFound);
  assert(repo->UpdateTier(*tx, "nope", "l1", kT0).code == ErrorCode::NotFound);
  tx->Commit();
}

void TestCountsAndDeletes(const BackendFactory& backend) {
  auto repo = backend.make_repository();
  Insert(*repo, Row("a", "l1", kT0));
  Insert(*repo, Row("b", "l1", kT0));
  Insert(*repo, Row("c", "l2", kT0));

  auto tx = repo->Begin(TxMode::kWrite);
  assert(repo->MarkCompleted(*tx, "b", kT0));
  assert(repo->CountActive(*tx, "l1") == 1);
  assert(repo->CountActive(*tx, "l2") == 1);
  assert(repo->CountActive(*tx, "mem") == 0);

  assert(repo->DeleteCompleted(*tx));
  assert(repo->DeleteCompleted(*tx));
  assert(repo->ListCompleted(*tx).empty());
  assert(repo->ListActive(*tx).size() == 2);

  assert(repo->DeleteAll(*tx));
  assert(repo->ListActive(*tx).empty());
  tx->Commit();
}

void TestReadTransactionRefusesWrites(const BackendFactory& backend) {
  auto repo = backend.make_repository();
  Insert(*repo, Row("r", "l2", kT0));

  {
    auto tx = repo->Begin(TxMode::kRead);
    assert(tx->Mode() == TxMode::kRead);
    assert(repo->InsertTask(*tx, Row("s", "l1", kT0)).code == ErrorCode::ReadOnly);
    assert(repo->UpdateTier(*tx, "r", "l1", kT0 + 1).code == ErrorCode::ReadOnly);
    assert(repo->MarkCompleted(*tx, "r", kT0 + 1).code == ErrorCode::ReadOnly);
    assert(repo->DeleteCompleted(*tx).code == ErrorCode::ReadOnly);
    assert(repo->DeleteAll(*tx).code == ErrorCode::ReadOnly);
    assert(repo->CountActive(*tx, "l2") == 1);
    tx->Commit();
  }

  auto tx = repo->Begin(TxMode::kRead);
  const auto rows = repo->ListActive(*tx);
  assert((Ids(rows) == std::vector<std::string>{"r"}));
  assert(rows[0].tier == "l2");
  assert(rows[0].tier_assigned_at == kT0);
  tx->Commit();
}

void TestFinishedTransactionThrows(const BackendFactory& backend) {
  auto repo = backend.make_repository();

  for (auto mode : {TxMode::kRead, TxMode::kWrite}) {
    auto tx = repo->Begin(mode);
    tx->Commit();

    bool threw = false;
    try {
      tx->Commit();
    } catch (const std::logic_error&) {
      threw = true;
    }
    assert(threw);

    threw = false;
    try {
      tx->Rollback();
    } catch (const std::logic_error&) {
      threw = true;
    }
    assert(threw);
  }
}

} // namespace

int main() {
  const std::vector<BackendFactory> backends = {
      {"memory", [] { return std::make_shared<MemoryRepository>(); }},
      {"sqlite", MakeSqlite},
  };

  for (const auto& backend : backends) {
    TestCommitAndRollback(backend);
    TestDuplicateInsert(backend);
    TestOrdering(backend);
    TestActiveOnlyUpdates(backend);
    TestCountsAndDeletes(backend);
    TestReadTransactionRefusesWrites(backend);
    TestFinishedTransactionThrows(backend);
    std::cout << "  " << backend.name << ": ok\n";
  }

  std::cout << "stash_integration_repository_parity: pass\n";
  return 0;
}
