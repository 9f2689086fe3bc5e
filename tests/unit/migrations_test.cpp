#include "internal/db/sql/migrations.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"

namespace {

using stash::db::sql::Migration;
using stash::db::sql::RunMigrations;

class RecordingExecutor final : public stash::db::sql::MigrationExecutor {
 public:
  void ExecuteSQL(const std::string& sql) override {
    if (sql == fail_on) throw std::runtime_error("disk full");
    executed.push_back(sql);
  }

  int SchemaVersion() override {
    return version;
  }

  void SetSchemaVersion(int v) override {
    version = v;
  }

  std::vector<std::string> executed;
  std::string              fail_on;
  int                      version = 0;
};

const std::vector<Migration> kSteps = {
    {1, "create", "CREATE t"},
    {2, "index", "CREATE i"},
    {5, "column", "ALTER t"},
};

bool Throws(RecordingExecutor& executor, const std::vector<Migration>& steps, const std::string& needle) {
  try {
    RunMigrations(executor, steps);
  } catch (const std::runtime_error& e) {
    return std::string(e.what()).find(needle) != std::string::npos;
  }
  return false;
}

void TestFreshDatabaseGetsEveryStep() {
  RecordingExecutor executor;
  assert(RunMigrations(executor, kSteps) == 3);
  assert((executor.executed == std::vector<std::string>{"CREATE t", "CREATE i", "ALTER t"}));
  assert(executor.version == 5);

  // nothing left on the second open
  assert(RunMigrations(executor, kSteps) == 0);
  assert(executor.executed.size() == 3);
}

void TestOnlyPendingStepsRun() {
  RecordingExecutor executor;
  executor.version = 2;
  assert(RunMigrations(executor, kSteps) == 1);
  assert((executor.executed == std::vector<std::string>{"ALTER t"}));
  assert(executor.version == 5);
}

void TestFailureKeepsLastGoodVersion() {
  RecordingExecutor executor;
  executor.fail_on = "CREATE i";
  assert(Throws(executor, kSteps, "migration 2 (index) failed: disk full"));
  assert(executor.version == 1);

  executor.fail_on.clear();
  assert(RunMigrations(executor, kSteps) == 2);
  assert(executor.version == 5);
}

void TestRejectsBadInput() {
  RecordingExecutor unordered;
  assert(Throws(unordered, {{2, "b", "B"}, {2, "c", "C"}}, "out of order"));
  assert(unordered.executed.empty());

  RecordingExecutor newer;
  newer.version = 9;
  assert(Throws(newer, kSteps, "newer than this build"));
  assert(newer.executed.empty());
}

void TestSqliteRecordsUserVersion() {
  const auto dir = std::filesystem::temp_directory_path() / "stash_migrations_tests";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  const auto path   = (dir / "stash.db").string();
  const int  latest = stash::db::sql::SchemaMigrations().back().version;

  {
    stash::db::sqlite::SqliteDB db(path);
    assert(db.SchemaVersion() == latest);
  }

  stash::db::sqlite::SqliteDB db(path);
  assert(db.SchemaVersion() == latest);
  assert(RunMigrations(db, stash::db::sql::SchemaMigrations()) == 0);

  db.SetSchemaVersion(latest + 1);
  bool threw = false;
  try {
    RunMigrations(db, stash::db::sql::SchemaMigrations());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFreshDatabaseGetsEveryStep();
  TestOnlyPendingStepsRun();
  TestFailureKeepsLastGoodVersion();
  TestRejectsBadInput();
  TestSqliteRecordsUserVersion();

  std::cout << "stash_unit_migrations: pass\n";
  return 0;
}
