#include "escalation_notifier.hpp"

#include "internal/observability/logging.hpp"
#include "internal/tiering/feature_flags.hpp"

namespace stash::notify {

std::string FormatEscalationMessage(const std::string& task_title, model::Tier new_tier) {
  return "\"" + task_title + "\" escalated to " + std::string(model::ShortLabel(new_tier));
}

LogNotifier::LogNotifier(std::shared_ptr<const tiering::FeatureFlags> flags) : flags_(std::move(flags)) {
}

void LogNotifier::OnTaskEscalated(const std::string& task_title, model::Tier new_tier) {
  if (flags_ && !flags_->NotificationsEnabled()) {
    return;
  }
  STASH_LOG_INFO("Task Escalated: " + FormatEscalationMessage(task_title, new_tier));
}

} // namespace stash::notify
