#include "task.hpp"

#include "internal/util/uuid.hpp"

namespace stash::model {

std::chrono::seconds Task::DwellTime(util::TimePoint now) const {
  return std::chrono::duration_cast<std::chrono::seconds>(now - tier_assigned_at);
}

std::string Task::RelativeAge(util::TimePoint now) const {
  const auto interval = std::chrono::duration_cast<std::chrono::seconds>(now - created_at).count();

  if (interval < 60) {
    return "just now";
  }
  if (interval < 3600) {
    return std::to_string(interval / 60) + "m ago";
  }
  if (interval < 86400) {
    return std::to_string(interval / 3600) + "h ago";
  }
  return std::to_string(interval / 86400) + "d ago";
}

Task MakeTask(std::string title, Tier tier, util::TimePoint now) {
  Task task;
  task.id               = util::GenerateUUIDString();
  task.title            = std::move(title);
  task.tier             = tier;
  task.created_at       = now;
  task.tier_assigned_at = now;
  return task;
}

} // namespace stash::model
