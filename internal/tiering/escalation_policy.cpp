#include "escalation_policy.hpp"

namespace stash::tiering {

EscalationPolicy::EscalationPolicy(bool recount_within_pass) : recount_within_pass_(recount_within_pass) {
}

bool EscalationPolicy::IsDue(const model::Task& task, util::TimePoint now) {
  if (task.is_completed) return false;

  if (!model::EscalationTarget(task.tier)) return false;

  const auto threshold = model::EscalationThreshold(task.tier);
  if (threshold.count() == 0) return false;

  return now - task.tier_assigned_at >= threshold;
}

std::vector<EscalationDecision> EscalationPolicy::Plan(const std::vector<model::Task>& snapshot, const Occupancy& occupancy,
                                                       util::TimePoint now) const {
  std::vector<EscalationDecision> decisions;
  Occupancy                       counts = occupancy;

  for (const auto& task : snapshot) {
    if (!IsDue(task, now)) continue;

    const auto target   = *model::EscalationTarget(task.tier);
    const auto capacity = static_cast<std::uint64_t>(model::TargetTierCapacity(task.tier));
    if (counts[model::SortOrder(target)] >= capacity) continue;

    decisions.push_back({task.id, task.title, task.tier, target});

    if (recount_within_pass_) {
      counts[model::SortOrder(target)]++;
      auto& source = counts[model::SortOrder(task.tier)];
      if (source > 0) source--;
    }
  }
  return decisions;
}

} // namespace stash::tiering
