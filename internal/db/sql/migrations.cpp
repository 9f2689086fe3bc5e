#include "migrations.hpp"

#include <stdexcept>

namespace stash::db::sql {

namespace {

void CheckOrdered(const std::vector<Migration>& migrations) {
  int previous = 0;
  for (const auto& m : migrations) {
    if (m.version <= previous) {
      throw std::runtime_error("migration " + std::to_string(m.version) + " (" + m.name + ") is out of order");
    }
    previous = m.version;
  }
}

} // namespace

int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& migrations) {
  CheckOrdered(migrations);

  const int current = executor.SchemaVersion();
  const int latest  = migrations.empty() ? 0 : migrations.back().version;
  if (current > latest) {
    throw std::runtime_error("schema version " + std::to_string(current) + " is newer than this build supports (" +
                             std::to_string(latest) + ")");
  }

  int applied = 0;
  for (const auto& m : migrations) {
    if (m.version <= current) continue;
    try {
      executor.ExecuteSQL(m.sql);
      executor.SetSchemaVersion(m.version);
    } catch (const std::exception& e) {
      throw std::runtime_error("migration " + std::to_string(m.version) + " (" + m.name + ") failed: " + e.what());
    }
    ++applied;
  }
  return applied;
}

} // namespace stash::db::sql
