#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include "escalation_policy.hpp"

namespace stash::core {
class TieringEngine;
}
namespace stash::runtime {
class MainQueue;
}
namespace stash::notify {
class EscalationNotifier;
}

namespace stash::tiering {

struct FeatureFlags;

/*
  Periodically escalates tasks that have dwelled long enough.

  The timer runs on its own thread but never touches the engine: each
  tick hands RunPass() to the main queue and waits for it, so passes
  run on the owner context and never overlap.

  One pass:
    read   reload engine snapshot + per-tier occupancy from the store
    decide EscalationPolicy::Plan()
    commit TaskStore::UpdateTier() per decision, notify, reload once
*/
class EscalationScheduler {
 public:
  struct Options {
    std::chrono::milliseconds initial_delay{std::chrono::seconds(60)};
    std::chrono::milliseconds period{std::chrono::seconds(300)};
  };

  EscalationScheduler(std::shared_ptr<core::TieringEngine> engine, std::shared_ptr<runtime::MainQueue> main_queue,
                      std::shared_ptr<const EscalationPolicy> policy, std::shared_ptr<notify::EscalationNotifier> notifier,
                      std::shared_ptr<const FeatureFlags> flags, Options options);
  ~EscalationScheduler();

  EscalationScheduler(const EscalationScheduler&)            = delete;
  EscalationScheduler& operator=(const EscalationScheduler&) = delete;

  // A pass that throws is logged and retried on the next tick; the loop
  // ends only on Stop() or once the main queue is shut down.
  void Start();
  void Stop();

  // Runs one pass on the calling thread, which must own the engine.
  // Returns the number of tasks escalated.
  std::size_t RunPass();

  std::uint64_t passes_run() const {
    return passes_run_.load();
  }

 private:
  void Loop();

  // Sleeps up to `duration`; false when Stop() cut the wait short.
  bool WaitFor(std::chrono::milliseconds duration);

  std::shared_ptr<core::TieringEngine>        engine_;
  std::shared_ptr<runtime::MainQueue>         main_queue_;
  std::shared_ptr<const EscalationPolicy>     policy_;
  std::shared_ptr<notify::EscalationNotifier> notifier_;
  std::shared_ptr<const FeatureFlags>         flags_;
  Options                                     options_;

  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::mutex              wait_mutex_;
  std::condition_variable wait_cv_;

  std::atomic<std::uint64_t> passes_run_{0};
};

} // namespace stash::tiering
