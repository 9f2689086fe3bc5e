#pragma once

#include <string>
#include <vector>

#include "internal/db/sql/migrations.hpp"

namespace stash::db::sql {

/*
  Canonical SQL for the task table.

  Every SELECT lists the columns in table order; ReadTask() in
  sqlite_repository.cpp depends on it.
*/

static constexpr const char* CREATE_TASK_TABLE =
    "CREATE TABLE IF NOT EXISTS task ("
    " id TEXT PRIMARY KEY,"
    " title TEXT NOT NULL,"
    " tier TEXT NOT NULL DEFAULT 'l1',"
    " isCompleted INTEGER NOT NULL DEFAULT 0,"
    " createdAt REAL NOT NULL,"
    " tierAssignedAt REAL NOT NULL,"
    " completedAt REAL"
    ");";

static constexpr const char* CREATE_ACTIVE_INDEX =
    "CREATE INDEX IF NOT EXISTS task_active_tier ON task(isCompleted, tier, tierAssignedAt);";

static constexpr const char* INSERT_TASK =
    "INSERT INTO task(id,title,tier,isCompleted,createdAt,tierAssignedAt,completedAt)"
    " VALUES(?,?,?,?,?,?,?);";

static constexpr const char* SELECT_ACTIVE =
    "SELECT id,title,tier,isCompleted,createdAt,tierAssignedAt,completedAt"
    " FROM task WHERE isCompleted=0"
    " ORDER BY tierAssignedAt ASC, rowid ASC;";

static constexpr const char* SELECT_COMPLETED =
    "SELECT id,title,tier,isCompleted,createdAt,tierAssignedAt,completedAt"
    " FROM task WHERE isCompleted=1"
    " ORDER BY completedAt DESC, rowid DESC;";

static constexpr const char* COMPLETE_TASK =
    "UPDATE task SET isCompleted=1, completedAt=? WHERE id=? AND isCompleted=0;";

static constexpr const char* UPDATE_TIER =
    "UPDATE task SET tier=?, tierAssignedAt=? WHERE id=? AND isCompleted=0;";

static constexpr const char* DELETE_COMPLETED =
    "DELETE FROM task WHERE isCompleted=1;";

static constexpr const char* DELETE_ALL =
    "DELETE FROM task;";

static constexpr const char* COUNT_ACTIVE_IN_TIER =
    "SELECT COUNT(*) FROM task WHERE isCompleted=0 AND tier=?;";

// Append only: released versions must never change.
inline const std::vector<Migration>& SchemaMigrations() {
  static const std::vector<Migration> kMigrations = {
      {1, "task table", CREATE_TASK_TABLE},
      {2, "active tier index", CREATE_ACTIVE_INDEX},
  };
  return kMigrations;
}

} // namespace stash::db::sql
