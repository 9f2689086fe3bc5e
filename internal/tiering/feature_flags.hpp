#pragma once

#include <atomic>

namespace stash::tiering {

/*
  Externally owned switches, read by the engine on every use.

  Front ends may flip them at any time from any thread.
*/
struct FeatureFlags {
  std::atomic<bool> escalation_enabled{true};
  std::atomic<bool> notifications_enabled{true};

  bool EscalationEnabled() const {
    return escalation_enabled.load();
  }
  bool NotificationsEnabled() const {
    return notifications_enabled.load();
  }
};

} // namespace stash::tiering
