#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/task.hpp"
#include "internal/model/tier.hpp"
#include "internal/util/time.hpp"

namespace stash::tiering {

// Active task count per tier, indexed by model::SortOrder().
using Occupancy = std::array<std::uint64_t, model::kAllTiers.size()>;

struct EscalationDecision {
  std::string task_id;
  std::string title;
  model::Tier from;
  model::Tier to;
};

/*
  Decides which tasks escalate in one pass.

  Pure: no store access, no clock. Tasks are considered in snapshot
  order (oldest tier assignment first), which is also the tie-break
  when several tasks compete for the same target tier.

  By default every capacity check uses the occupancy counted at the
  start of the pass, so a pass can admit more tasks into a tier than
  its capacity. With recount_within_pass the counts follow each
  admitted escalation instead.
*/
class EscalationPolicy {
 public:
  explicit EscalationPolicy(bool recount_within_pass = false);

  std::vector<EscalationDecision> Plan(const std::vector<model::Task>& snapshot, const Occupancy& occupancy, util::TimePoint now) const;

  // Dwell and target checks only; capacity is the caller's concern.
  static bool IsDue(const model::Task& task, util::TimePoint now);

  bool recount_within_pass() const {
    return recount_within_pass_;
  }

 private:
  bool recount_within_pass_;
};

} // namespace stash::tiering
