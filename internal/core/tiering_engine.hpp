#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/task.hpp"
#include "internal/model/tier.hpp"
#include "internal/util/time.hpp"

namespace stash::store {
class TaskStore;
}

namespace stash::core {

/*
  In-memory view of the stash and the mutation facade used by every
  front end.

  The snapshots are never authoritative: each mutation goes through
  the TaskStore and the affected snapshot is reloaded from it.

  Threading: owned by the main queue. Nothing here locks; callers on
  other threads must marshal through runtime::MainQueue.
*/
class TieringEngine {
 public:
  enum class ChangeKind {
    kActiveChanged,
    kCompletedChanged,
    kEscalated,
  };

  struct ChangeEvent {
    ChangeKind kind;
  };

  using Listener       = std::function<void(const ChangeEvent&)>;
  using SubscriptionId = std::uint64_t;

  explicit TieringEngine(std::shared_ptr<store::TaskStore> store);

  TieringEngine(const TieringEngine&)            = delete;
  TieringEngine& operator=(const TieringEngine&) = delete;

  void Reload();
  void ReloadCompleted();

  // The title is trimmed; blank titles are rejected and nothing is stored.
  bool AddTask(std::string_view title, model::Tier tier);

  void CompleteTask(const model::Task& task);

  // No-op at L1.
  void PromoteTask(const model::Task& task);

  // No-op at MEM.
  void SnoozeTask(const model::Task& task);

  // Direct placement, as used by tier cycling in the input panel.
  void SetTier(const model::Task& task, model::Tier tier);

  void ClearCompleted();
  void ClearAllData();

  const std::vector<model::Task>& tasks() const {
    return tasks_;
  }
  const std::vector<model::Task>& completed_tasks() const {
    return completed_tasks_;
  }
  const std::optional<util::TimePoint>& last_escalation_time() const {
    return last_escalation_time_;
  }

  std::vector<model::Task> ActiveTasks(model::Tier tier) const;

  std::optional<model::Tier> HighestActiveTier() const;

  // First active task whose title contains `fragment`, ignoring case.
  std::optional<model::Task> FindActiveByTitle(std::string_view fragment) const;

  // Called after an escalation pass changed something.
  void RecordEscalation(util::TimePoint when);

  // Listeners run on the owner context. An exception from one is logged
  // and does not reach the mutation that triggered it.
  SubscriptionId Subscribe(Listener listener);
  void           Unsubscribe(SubscriptionId id);

  store::TaskStore& store() {
    return *store_;
  }

 private:
  void Notify(ChangeKind kind);

  std::shared_ptr<store::TaskStore> store_;

  std::vector<model::Task>       tasks_;
  std::vector<model::Task>       completed_tasks_;
  std::optional<util::TimePoint> last_escalation_time_;

  std::map<SubscriptionId, Listener> listeners_;
  SubscriptionId                     next_subscription_id_ = 1;
};

} // namespace stash::core
