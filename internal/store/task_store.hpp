#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/task.hpp"
#include "internal/util/time.hpp"

namespace stash::store {

/*
  Durable, serialized CRUD over tasks.

  Every call takes the store mutex for its whole duration, so calls
  from the owner thread and the escalation worker never interleave
  and "mutate then reload" always reads its own write.

  Storage failures are logged and degrade: writes report false and
  leave the committed state untouched, reads return empty results.
  Nothing here throws.
*/
class TaskStore {
 public:
  TaskStore(std::shared_ptr<db::TaskRepository> repository, std::shared_ptr<const util::Clock> clock);

  TaskStore(const TaskStore&)            = delete;
  TaskStore& operator=(const TaskStore&) = delete;

  // False if the id already exists or the write failed.
  bool Add(const model::Task& task);

  // Oldest tier assignment first.
  std::vector<model::Task> FetchActive();

  // Most recently completed first.
  std::vector<model::Task> FetchCompleted();

  // Sets completed_at = now. Unknown or already completed ids are ignored.
  bool Complete(const std::string& id);

  // Sets tier and tier_assigned_at = now. The only way a tier changes.
  bool UpdateTier(const std::string& id, model::Tier tier);

  bool ClearCompleted();
  bool ClearAll();

  std::uint64_t CountActive(model::Tier tier);

  // Pretty-printed JSON array of every task, active first.
  std::optional<std::string> ExportSnapshot();

  // ExportSnapshot() written to `path`. Returns the number of tasks written.
  std::optional<std::size_t> ExportToFile(const std::string& path);

  const util::Clock& clock() const {
    return *clock_;
  }

 private:
  // Runs `write` in its own transaction; commits only on success.
  template <typename Fn>
  bool WriteTx(const char* operation, const std::string& id, Fn&& write);

  std::vector<model::Task>   FetchAllLocked();
  std::optional<std::string> RenderExportLocked(std::size_t* count);

  std::shared_ptr<db::TaskRepository> repository_;
  std::shared_ptr<const util::Clock>  clock_;

  std::mutex mutex_;
};

} // namespace stash::store
