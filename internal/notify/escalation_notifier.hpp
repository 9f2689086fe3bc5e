#pragma once

#include <memory>
#include <string>

#include "internal/model/tier.hpp"

namespace stash::tiering {
struct FeatureFlags;
}

namespace stash::notify {

/*
  Receives one event per successful automatic escalation.

  Delivery (desktop notification, sound, tray pulse) belongs to the
  implementation; the engine only reports what moved where.
*/
class EscalationNotifier {
 public:
  virtual ~EscalationNotifier() = default;

  virtual void OnTaskEscalated(const std::string& task_title, model::Tier new_tier) = 0;
};

// "\"<title>\" escalated to <SHORT>"
std::string FormatEscalationMessage(const std::string& task_title, model::Tier new_tier);

/*
  Default notifier: writes the alert to the log while
  notifications are enabled.
*/
class LogNotifier final : public EscalationNotifier {
 public:
  explicit LogNotifier(std::shared_ptr<const tiering::FeatureFlags> flags);

  void OnTaskEscalated(const std::string& task_title, model::Tier new_tier) override;

 private:
  std::shared_ptr<const tiering::FeatureFlags> flags_;
};

} // namespace stash::notify
