#include "internal/tiering/escalation_scheduler.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "internal/core/tiering_engine.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/notify/escalation_notifier.hpp"
#include "internal/runtime/main_queue.hpp"
#include "internal/store/task_store.hpp"
#include "internal/tiering/feature_flags.hpp"
#include "tests/support/manual_clock.hpp"

namespace {

using namespace std::chrono_literals;
using stash::core::TieringEngine;
using stash::model::Tier;
using stash::testing::ManualClock;
using stash::tiering::EscalationPolicy;
using stash::tiering::EscalationScheduler;
using stash::tiering::FeatureFlags;

class RecordingNotifier final : public stash::notify::EscalationNotifier {
 public:
  void OnTaskEscalated(const std::string& task_title, Tier new_tier) override {
    std::lock_guard lock(mutex);
    events.emplace_back(task_title, new_tier);
  }

  std::mutex                              mutex;
  std::vector<std::pair<std::string, Tier>> events;
};

struct Fixture {
  explicit Fixture(bool recount = false, EscalationScheduler::Options options = {}) {
    store      = std::make_shared<stash::store::TaskStore>(std::make_shared<stash::db::memory::MemoryRepository>(), clock);
    engine     = std::make_shared<TieringEngine>(store);
    scheduler  = std::make_shared<EscalationScheduler>(engine, main_queue, std::make_shared<EscalationPolicy>(recount), notifier, flags, options);
  }

  void Add(const std::string& title, Tier tier) {
    assert(engine->AddTask(title, tier));
  }

  std::shared_ptr<ManualClock>             clock      = std::make_shared<ManualClock>();
  std::shared_ptr<FeatureFlags>            flags      = std::make_shared<FeatureFlags>();
  std::shared_ptr<RecordingNotifier>       notifier   = std::make_shared<RecordingNotifier>();
  std::shared_ptr<stash::runtime::MainQueue> main_queue = std::make_shared<stash::runtime::MainQueue>();
  std::shared_ptr<stash::store::TaskStore> store;
  std::shared_ptr<TieringEngine>           engine;
  std::shared_ptr<EscalationScheduler>     scheduler;
};

void TestThreeTasksCompeteForEmptyL1() {
  Fixture f;
  f.Add("first", Tier::kL2);
  f.Add("second", Tier::kL2);
  f.Add("third", Tier::kL2);

  std::vector<TieringEngine::ChangeKind> events;
  f.engine->Subscribe([&](const TieringEngine::ChangeEvent& e) { events.push_back(e.kind); });

  f.clock->Advance(7201s);
  assert(f.scheduler->RunPass() == 3);

  assert(f.engine->ActiveTasks(Tier::kL1).size() == 3);
  assert(f.engine->ActiveTasks(Tier::kL2).empty());
  for (const auto& task : f.engine->tasks()) {
    assert(task.tier_assigned_at == f.clock->Now());
  }

  assert(f.notifier->events.size() == 3);
  assert(f.notifier->events[0] == std::make_pair(std::string("first"), Tier::kL1));
  assert(f.notifier->events[2].first == "third");

  assert(f.engine->last_escalation_time() == f.clock->Now());
  // pass-start reload, post-commit reload, then the escalation itself
  assert(events.size() == 3);
  assert(events[0] == TieringEngine::ChangeKind::kActiveChanged);
  assert(events[1] == TieringEngine::ChangeKind::kActiveChanged);
  assert(events[2] == TieringEngine::ChangeKind::kEscalated);

  // fresh tier clocks: nothing else is due right away
  f.clock->Advance(1h);
  assert(f.scheduler->RunPass() == 0);
  assert(f.scheduler->passes_run() == 2);
}

void TestCapacityIsJudgedAtPassStart() {
  Fixture f;
  f.Add("resident", Tier::kL1);
  f.Add("a", Tier::kL2);
  f.Add("b", Tier::kL2);
  f.Add("c", Tier::kL2);

  f.clock->Advance(2h);
  assert(f.scheduler->RunPass() == 3);
  assert(f.engine->ActiveTasks(Tier::kL1).size() == 4);

  // L1 is over capacity now; later arrivals wait
  f.Add("late", Tier::kL2);
  f.clock->Advance(3h);
  assert(f.scheduler->RunPass() == 0);
  assert(f.engine->ActiveTasks(Tier::kL2).size() == 1);
}

void TestRecountWithinPass() {
  Fixture f(true);
  f.Add("resident", Tier::kL1);
  f.Add("a", Tier::kL2);
  f.Add("b", Tier::kL2);
  f.Add("c", Tier::kL2);

  f.clock->Advance(2h);
  assert(f.scheduler->RunPass() == 2);
  assert(f.engine->ActiveTasks(Tier::kL1).size() == 3);
  assert(f.engine->ActiveTasks(Tier::kL2).size() == 1);
  assert(f.engine->ActiveTasks(Tier::kL2)[0].title == "c");
}

void TestDisabledPassChangesNothing() {
  Fixture f;
  f.Add("waiting", Tier::kL3);
  f.flags->escalation_enabled = false;

  f.clock->Advance(6h);
  assert(f.scheduler->RunPass() == 0);
  assert(f.scheduler->passes_run() == 1);
  assert(f.engine->tasks()[0].tier == Tier::kL3);
  assert(f.notifier->events.empty());
  assert(!f.engine->last_escalation_time());

  f.flags->escalation_enabled = true;
  assert(f.scheduler->RunPass() == 1);
  assert(f.engine->tasks()[0].tier == Tier::kL2);
}

void TestMemAndCompletedNeverMove() {
  Fixture f;
  f.Add("parked", Tier::kMem);
  f.Add("finished", Tier::kL2);
  f.engine->CompleteTask(*f.engine->FindActiveByTitle("finished"));

  f.clock->Advance(1000h);
  assert(f.scheduler->RunPass() == 0);
  assert(f.engine->tasks().size() == 1);
  assert(f.engine->tasks()[0].tier == Tier::kMem);
  assert(!f.engine->last_escalation_time());
}

void TestPassSeesWritesMadeBehindTheEngine() {
  Fixture f;
  f.Add("gone", Tier::kL2);

  // another process writes to the same store; the engine's cached
  // snapshot knows nothing about either change
  assert(f.store->Add(stash::model::MakeTask("pay rent", Tier::kL2, f.clock->Now())));
  assert(f.store->Complete(f.engine->FindActiveByTitle("gone")->id));
  assert(f.engine->tasks().size() == 1);

  f.clock->Advance(3h);
  assert(f.scheduler->RunPass() == 1);
  assert(f.notifier->events.size() == 1);
  assert(f.notifier->events[0].first == "pay rent");
  assert(f.engine->tasks().size() == 1);
  assert(f.engine->tasks()[0].title == "pay rent");
  assert(f.engine->tasks()[0].tier == Tier::kL1);
}

void TestThrowingListenerDoesNotAbortThePass() {
  Fixture f;
  f.Add("due", Tier::kL2);
  f.engine->Subscribe([](const TieringEngine::ChangeEvent&) { throw std::runtime_error("listener failed"); });

  f.clock->Advance(2h);
  assert(f.scheduler->RunPass() == 1);
  assert(f.engine->tasks()[0].tier == Tier::kL1);
  assert(f.engine->last_escalation_time() == f.clock->Now());
}

void TestFailedPassIsRetriedOnNextTick() {
  EscalationScheduler::Options options;
  options.initial_delay = 5ms;
  options.period        = 5ms;

  Fixture f(false, options);
  f.Add("due", Tier::kL2);
  f.clock->Advance(3h);
  f.clock->FailNext();

  std::thread owner([queue = f.main_queue] { queue->Run(); });
  f.scheduler->Start();

  const auto deadline = std::chrono::steady_clock::now() + 10s;
  while (f.scheduler->passes_run() < 3 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(5ms);
  }
  f.scheduler->Stop();
  assert(f.scheduler->passes_run() >= 3);

  const bool ran = f.main_queue->Call([&] {
    assert(f.engine->tasks()[0].tier == Tier::kL1);
    assert(f.engine->last_escalation_time());
  });
  assert(ran);

  f.main_queue->Shutdown();
  owner.join();
}

void TestBackgroundLoopRunsOnOwnerContext() {
  EscalationScheduler::Options options;
  options.initial_delay = 10ms;
  options.period        = 10ms;

  Fixture f(false, options);
  f.Add("due", Tier::kL2);
  f.clock->Advance(3h);

  std::thread owner([queue = f.main_queue] { queue->Run(); });
  f.scheduler->Start();

  const auto deadline = std::chrono::steady_clock::now() + 10s;
  while (f.scheduler->passes_run() < 3 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(5ms);
  }
  f.scheduler->Stop();
  assert(f.scheduler->passes_run() >= 3);

  f.main_queue->Call([&] {
    assert(f.engine->tasks()[0].tier == Tier::kL1);
    assert(f.engine->last_escalation_time());
  });

  f.main_queue->Shutdown();
  owner.join();

  std::lock_guard lock(f.notifier->mutex);
  assert(f.notifier->events.size() == 1);
}

void TestStopWithoutStartAndAfterQueueShutdown() {
  Fixture f;
  f.scheduler->Stop();

  EscalationScheduler::Options options;
  options.initial_delay = 1ms;
  options.period        = 1ms;
  Fixture g(false, options);
  g.main_queue->Shutdown();
  g.scheduler->Start();
  std::this_thread::sleep_for(50ms);
  // the loop gave up on its own; Stop just joins
  g.scheduler->Stop();
  assert(g.scheduler->passes_run() == 0);
}

void TestNotificationMessage() {
  assert(stash::notify::FormatEscalationMessage("Pay rent", Tier::kL1) == "\"Pay rent\" escalated to L1");
}

} // namespace

int main() {
  TestThreeTasksCompeteForEmptyL1();
  TestCapacityIsJudgedAtPassStart();
  TestRecountWithinPass();
  TestDisabledPassChangesNothing();
  TestMemAndCompletedNeverMove();
  TestPassSeesWritesMadeBehindTheEngine();
  TestThrowingListenerDoesNotAbortThePass();
  TestFailedPassIsRetriedOnNextTick();
  TestBackgroundLoopRunsOnOwnerContext();
  TestStopWithoutStartAndAfterQueueShutdown();
  TestNotificationMessage();

  std::cout << "stash_unit_escalation_scheduler: pass\n";
  return 0;
}
