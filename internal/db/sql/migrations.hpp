#pragma once

#include <string>
#include <vector>

namespace stash::db::sql {

struct Migration {
  int         version; // > 0, strictly increasing across the list
  std::string name;
  std::string sql;
};

/*
  Backend-agnostic migration execution.

  Each backend runs SQL and keeps a single integer schema version
  (SQLite: PRAGMA user_version). A fresh database reports 0.
*/
class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  virtual int  SchemaVersion()               = 0;
  virtual void SetSchemaVersion(int version) = 0;
};

/*
  Applies every migration newer than the recorded schema version, in
  order, bumping the version after each one. Returns how many ran.

  Throws std::runtime_error when the list is out of order, when the
  database is newer than the list, or when a step fails. A failed step
  leaves the version at the last one that succeeded.
*/
int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& migrations);

} // namespace stash::db::sql
