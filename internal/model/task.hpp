#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "internal/model/tier.hpp"
#include "internal/util/time.hpp"

namespace stash::model {

/*
  A stashed task.

  Invariants:
  - completed_at is set iff is_completed
  - tier_assigned_at moves on every tier change and is the escalation clock;
    completion does not touch it
  - a completed task only changes by being deleted
*/
struct Task {
  std::string id;
  std::string title;
  Tier        tier = Tier::kL1;
  bool        is_completed = false;

  util::TimePoint                created_at{};
  util::TimePoint                tier_assigned_at{};
  std::optional<util::TimePoint> completed_at;

  // Time spent in the current tier.
  std::chrono::seconds DwellTime(util::TimePoint now) const;

  // "just now", "5m ago", "2h ago", "3d ago", measured from created_at.
  std::string RelativeAge(util::TimePoint now) const;
};

// Fresh active task with a new id; both timestamps set to `now`.
Task MakeTask(std::string title, Tier tier, util::TimePoint now);

} // namespace stash::model
