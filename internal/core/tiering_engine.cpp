#include "tiering_engine.hpp"

#include <algorithm>
#include <iterator>

#include "internal/observability/logging.hpp"
#include "internal/store/task_store.hpp"
#include "internal/util/strings.hpp"

namespace stash::core {

using observability::StringField;

TieringEngine::TieringEngine(std::shared_ptr<store::TaskStore> store) : store_(std::move(store)) {
}

void TieringEngine::Reload() {
  tasks_ = store_->FetchActive();
  Notify(ChangeKind::kActiveChanged);
}

void TieringEngine::ReloadCompleted() {
  completed_tasks_ = store_->FetchCompleted();
  Notify(ChangeKind::kCompletedChanged);
}

bool TieringEngine::AddTask(std::string_view title, model::Tier tier) {
  const auto trimmed = util::Trim(title);
  if (trimmed.empty()) {
    STASH_LOG_DEBUG("rejected blank task title");
    return false;
  }

  auto task = model::MakeTask(std::string(trimmed), tier, store_->clock().Now());
  if (!store_->Add(task)) {
    return false;
  }
  STASH_LOG_DEBUG("task added", {StringField("id", task.id), StringField("tier", model::ToString(tier))});
  Reload();
  return true;
}

void TieringEngine::CompleteTask(const model::Task& task) {
  store_->Complete(task.id);
  Reload();
}

void TieringEngine::PromoteTask(const model::Task& task) {
  const auto target = model::Promoted(task.tier);
  if (!target) return;
  store_->UpdateTier(task.id, *target);
  Reload();
}

void TieringEngine::SnoozeTask(const model::Task& task) {
  const auto target = model::Previous(task.tier);
  if (!target) return;
  store_->UpdateTier(task.id, *target);
  Reload();
}

void TieringEngine::SetTier(const model::Task& task, model::Tier tier) {
  if (task.tier == tier) return;
  store_->UpdateTier(task.id, tier);
  Reload();
}

void TieringEngine::ClearCompleted() {
  store_->ClearCompleted();
  ReloadCompleted();
}

void TieringEngine::ClearAllData() {
  store_->ClearAll();
  Reload();
  ReloadCompleted();
}

std::vector<model::Task> TieringEngine::ActiveTasks(model::Tier tier) const {
  std::vector<model::Task> out;
  std::copy_if(tasks_.begin(), tasks_.end(), std::back_inserter(out), [&](const model::Task& t) { return t.tier == tier; });
  return out;
}

std::optional<model::Tier> TieringEngine::HighestActiveTier() const {
  for (auto tier : model::kAllTiers) {
    if (std::any_of(tasks_.begin(), tasks_.end(), [&](const model::Task& t) { return t.tier == tier; })) {
      return tier;
    }
  }
  return std::nullopt;
}

std::optional<model::Task> TieringEngine::FindActiveByTitle(std::string_view fragment) const {
  const auto needle = util::ToLower(fragment);
  for (const auto& task : tasks_) {
    if (util::ToLower(task.title).find(needle) != std::string::npos) {
      return task;
    }
  }
  return std::nullopt;
}

void TieringEngine::RecordEscalation(util::TimePoint when) {
  last_escalation_time_ = when;
  Notify(ChangeKind::kEscalated);
}

TieringEngine::SubscriptionId TieringEngine::Subscribe(Listener listener) {
  const auto id = next_subscription_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void TieringEngine::Unsubscribe(SubscriptionId id) {
  listeners_.erase(id);
}

void TieringEngine::Notify(ChangeKind kind) {
  // copy so a listener may unsubscribe itself
  const auto listeners = listeners_;
  for (const auto& [id, listener] : listeners) {
    try {
      listener(ChangeEvent{kind});
    } catch (const std::exception& e) {
      STASH_LOG_ERROR("change listener failed", {observability::IntField("subscription", static_cast<std::int64_t>(id)), StringField("error", e.what())});
    }
  }
}

} // namespace stash::core
