#include "task_store.hpp"

#include <google/protobuf/util/json_util.h>

#include <fstream>
#include <sstream>

#include "internal/observability/logging.hpp"
#include "stash/backup/v1/task_export.pb.h"

namespace stash::store {

using observability::IntField;
using observability::StringField;

namespace {

db::model::TaskRecord ToRecord(const model::Task& task) {
  db::model::TaskRecord record;
  record.id               = task.id;
  record.title            = task.title;
  record.tier             = std::string(model::ToString(task.tier));
  record.is_completed     = task.is_completed;
  record.created_at       = util::ToEpochSeconds(task.created_at);
  record.tier_assigned_at = util::ToEpochSeconds(task.tier_assigned_at);
  if (task.completed_at) {
    record.completed_at = util::ToEpochSeconds(*task.completed_at);
  }
  return record;
}

model::Task FromRecord(const db::model::TaskRecord& record) {
  model::Task task;
  task.id    = record.id;
  task.title = record.title;
  // rows written by older builds may carry an unknown tier; park them in L1
  task.tier             = model::ParseTier(record.tier).value_or(model::Tier::kL1);
  task.is_completed     = record.is_completed;
  task.created_at       = util::FromEpochSeconds(record.created_at);
  task.tier_assigned_at = util::FromEpochSeconds(record.tier_assigned_at);
  if (record.completed_at) {
    task.completed_at = util::FromEpochSeconds(*record.completed_at);
  }
  return task;
}

std::vector<model::Task> FromRecords(const std::vector<db::model::TaskRecord>& records) {
  std::vector<model::Task> tasks;
  tasks.reserve(records.size());
  for (const auto& record : records) {
    tasks.push_back(FromRecord(record));
  }
  return tasks;
}

stash::backup::v1::TaskExport ToExport(const model::Task& task) {
  const auto seconds = [](util::TimePoint tp) { return util::ToProto(std::chrono::time_point_cast<std::chrono::seconds>(tp)); };

  stash::backup::v1::TaskExport out;
  out.set_id(task.id);
  out.set_title(task.title);
  out.set_tier(std::string(model::ToString(task.tier)));
  out.set_is_completed(task.is_completed);
  *out.mutable_created_at()       = seconds(task.created_at);
  *out.mutable_tier_assigned_at() = seconds(task.tier_assigned_at);
  if (task.completed_at) {
    *out.mutable_completed_at() = seconds(*task.completed_at);
  }
  return out;
}

// Indents every line of a printed JSON object by two spaces.
std::string Indent(const std::string& json) {
  std::istringstream in(json);
  std::ostringstream out;
  std::string        line;
  bool               first = true;
  while (std::getline(in, line)) {
    if (line.empty()) continue;
    if (!first) out << '\n';
    first = false;
    out << "  " << line;
  }
  return out.str();
}

} // namespace

TaskStore::TaskStore(std::shared_ptr<db::TaskRepository> repository, std::shared_ptr<const util::Clock> clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
}

template <typename Fn>
bool TaskStore::WriteTx(const char* operation, const std::string& id, Fn&& write) {
  try {
    auto       tx     = repository_->Begin(db::TxMode::kWrite);
    const auto result = write(*tx);
    if (!result) {
      // NotFound is the expected outcome for stale ids; keep it quiet
      if (result.code == db::ErrorCode::NotFound) {
        STASH_LOG_DEBUG("task store write skipped", {StringField("op", operation), StringField("id", id), StringField("reason", result.message)});
      } else {
        STASH_LOG_ERROR("task store write failed", {StringField("op", operation), StringField("id", id),
                                                    StringField("code", db::ToString(result.code)), StringField("error", result.message)});
      }
      tx->Rollback();
      return false;
    }
    tx->Commit();
    return true;
  } catch (const std::exception& e) {
    STASH_LOG_ERROR("task store write failed", {StringField("op", operation), StringField("id", id), StringField("error", e.what())});
    return false;
  }
}

bool TaskStore::Add(const model::Task& task) {
  std::lock_guard lock(mutex_);
  const auto      record = ToRecord(task);
  return WriteTx("add", task.id, [&](db::Transaction& tx) { return repository_->InsertTask(tx, record); });
}

std::vector<model::Task> TaskStore::FetchActive() {
  std::lock_guard lock(mutex_);
  try {
    auto tx      = repository_->Begin(db::TxMode::kRead);
    auto records = repository_->ListActive(*tx);
    tx->Commit();
    return FromRecords(records);
  } catch (const std::exception& e) {
    STASH_LOG_ERROR("task store read failed", {StringField("op", "fetch_active"), StringField("error", e.what())});
    return {};
  }
}

std::vector<model::Task> TaskStore::FetchCompleted() {
  std::lock_guard lock(mutex_);
  try {
    auto tx      = repository_->Begin(db::TxMode::kRead);
    auto records = repository_->ListCompleted(*tx);
    tx->Commit();
    return FromRecords(records);
  } catch (const std::exception& e) {
    STASH_LOG_ERROR("task store read failed", {StringField("op", "fetch_completed"), StringField("error", e.what())});
    return {};
  }
}

bool TaskStore::Complete(const std::string& id) {
  std::lock_guard lock(mutex_);
  const double    now = util::ToEpochSeconds(clock_->Now());
  return WriteTx("complete", id, [&](db::Transaction& tx) { return repository_->MarkCompleted(tx, id, now); });
}

bool TaskStore::UpdateTier(const std::string& id, model::Tier tier) {
  std::lock_guard   lock(mutex_);
  const double      now = util::ToEpochSeconds(clock_->Now());
  const std::string raw(model::ToString(tier));
  return WriteTx("update_tier", id, [&](db::Transaction& tx) { return repository_->UpdateTier(tx, id, raw, now); });
}

bool TaskStore::ClearCompleted() {
  std::lock_guard lock(mutex_);
  return WriteTx("clear_completed", "", [&](db::Transaction& tx) { return repository_->DeleteCompleted(tx); });
}

bool TaskStore::ClearAll() {
  std::lock_guard lock(mutex_);
  return WriteTx("clear_all", "", [&](db::Transaction& tx) { return repository_->DeleteAll(tx); });
}

std::uint64_t TaskStore::CountActive(model::Tier tier) {
  std::lock_guard lock(mutex_);
  try {
    auto tx    = repository_->Begin(db::TxMode::kRead);
    auto count = repository_->CountActive(*tx, std::string(model::ToString(tier)));
    tx->Commit();
    return count;
  } catch (const std::exception& e) {
    STASH_LOG_ERROR("task store read failed", {StringField("op", "count_active"), StringField("error", e.what())});
    return 0;
  }
}

std::vector<model::Task> TaskStore::FetchAllLocked() {
  auto tx        = repository_->Begin(db::TxMode::kRead);
  auto active    = repository_->ListActive(*tx);
  auto completed = repository_->ListCompleted(*tx);
  tx->Commit();

  active.insert(active.end(), completed.begin(), completed.end());
  return FromRecords(active);
}

std::optional<std::string> TaskStore::RenderExportLocked(std::size_t* count) {
  std::vector<model::Task> tasks;
  try {
    tasks = FetchAllLocked();
  } catch (const std::exception& e) {
    STASH_LOG_ERROR("task export failed", {StringField("error", e.what())});
    return std::nullopt;
  }

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;

  std::ostringstream out;
  out << '[';
  for (size_t i = 0; i < tasks.size(); ++i) {
    std::string json;
    auto        status = google::protobuf::util::MessageToJsonString(ToExport(tasks[i]), &json, options);
    if (!status.ok()) {
      STASH_LOG_ERROR("task export failed", {StringField("id", tasks[i].id), StringField("error", std::string(status.message()))});
      return std::nullopt;
    }
    out << (i == 0 ? "\n" : ",\n") << Indent(json);
  }
  out << (tasks.empty() ? "]" : "\n]") << '\n';

  if (count) *count = tasks.size();
  return out.str();
}

std::optional<std::string> TaskStore::ExportSnapshot() {
  std::lock_guard lock(mutex_);
  return RenderExportLocked(nullptr);
}

std::optional<std::size_t> TaskStore::ExportToFile(const std::string& path) {
  std::size_t count = 0;
  std::optional<std::string> document;
  {
    std::lock_guard lock(mutex_);
    document = RenderExportLocked(&count);
  }
  if (!document) {
    return std::nullopt;
  }

  std::ofstream file(path, std::ios::out | std::ios::trunc);
  file << *document;
  file.close();
  if (!file) {
    STASH_LOG_ERROR("task export write failed", {StringField("path", path)});
    return std::nullopt;
  }

  STASH_LOG_INFO("tasks exported", {StringField("path", path), IntField("count", static_cast<std::int64_t>(count))});
  return count;
}

} // namespace stash::store
