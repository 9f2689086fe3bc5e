#include "escalation_scheduler.hpp"

#include "feature_flags.hpp"
#include "internal/core/tiering_engine.hpp"
#include "internal/notify/escalation_notifier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/main_queue.hpp"
#include "internal/store/task_store.hpp"

namespace stash::tiering {

using observability::IntField;
using observability::StringField;

EscalationScheduler::EscalationScheduler(std::shared_ptr<core::TieringEngine> engine, std::shared_ptr<runtime::MainQueue> main_queue,
                                         std::shared_ptr<const EscalationPolicy> policy, std::shared_ptr<notify::EscalationNotifier> notifier,
                                         std::shared_ptr<const FeatureFlags> flags, Options options)
    : engine_(std::move(engine)),
      main_queue_(std::move(main_queue)),
      policy_(std::move(policy)),
      notifier_(std::move(notifier)),
      flags_(std::move(flags)),
      options_(options) {
}

EscalationScheduler::~EscalationScheduler() {
  Stop();
}

void EscalationScheduler::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&EscalationScheduler::Loop, this);
  STASH_LOG_INFO("escalation scheduler started", {IntField("initial_delay_ms", options_.initial_delay.count()),
                                                  IntField("period_ms", options_.period.count())});
}

void EscalationScheduler::Stop() {
  {
    std::lock_guard lock(wait_mutex_);
    running_ = false;
  }
  wait_cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

bool EscalationScheduler::WaitFor(std::chrono::milliseconds duration) {
  std::unique_lock lock(wait_mutex_);
  return !wait_cv_.wait_for(lock, duration, [&] { return !running_.load(); });
}

void EscalationScheduler::Loop() {
  if (!WaitFor(options_.initial_delay)) return;

  while (running_) {
    try {
      if (!main_queue_->Call([this] { RunPass(); })) {
        STASH_LOG_WARN("main queue shut down; escalation stopped");
        return;
      }
    } catch (const std::exception& e) {
      // a failed pass is retried on the next tick
      STASH_LOG_ERROR("escalation pass failed", {StringField("error", e.what())});
    }

    if (!WaitFor(options_.period)) return;
  }
}

std::size_t EscalationScheduler::RunPass() {
  passes_run_++;

  if (flags_ && !flags_->EscalationEnabled()) {
    STASH_LOG_DEBUG("escalation disabled; pass skipped");
    return 0;
  }

  auto&      store = engine_->store();
  const auto now   = store.clock().Now();

  // read: one snapshot and one set of counts for the whole pass. Reload
  // first, the CLI may have written to the same database.
  engine_->Reload();
  const auto snapshot = engine_->tasks();
  Occupancy  occupancy{};
  for (auto tier : model::kAllTiers) {
    occupancy[model::SortOrder(tier)] = store.CountActive(tier);
  }

  // decide
  const auto decisions = policy_->Plan(snapshot, occupancy, now);

  // commit
  std::size_t escalated = 0;
  for (const auto& decision : decisions) {
    if (!store.UpdateTier(decision.task_id, decision.to)) {
      STASH_LOG_WARN("escalation failed", {StringField("id", decision.task_id), StringField("to", model::ToString(decision.to))});
      continue;
    }
    ++escalated;
    STASH_LOG_INFO("task escalated", {StringField("id", decision.task_id), StringField("from", model::ToString(decision.from)),
                                      StringField("to", model::ToString(decision.to))});
    if (!notifier_) continue;
    try {
      notifier_->OnTaskEscalated(decision.title, decision.to);
    } catch (const std::exception& e) {
      STASH_LOG_ERROR("escalation notification failed", {StringField("id", decision.task_id), StringField("error", e.what())});
    }
  }

  if (escalated > 0) {
    engine_->Reload();
    engine_->RecordEscalation(now);
  }
  return escalated;
}

} // namespace stash::tiering
