#pragma once

#include <memory>

#include "stash/config/v1/config.pb.h"

namespace stash::db {
class TaskRepository;
}
namespace stash::store {
class TaskStore;
}
namespace stash::core {
class TieringEngine;
}
namespace stash::runtime {
class MainQueue;
}
namespace stash::tiering {
struct FeatureFlags;
class EscalationScheduler;
}
namespace stash::notify {
class EscalationNotifier;
}
namespace stash::command {
class CommandProcessor;
}
namespace stash::util {
class Clock;
}

namespace stash::factory {

/*
  Application

  Owns every long-lived component. Everything here lives for the
  lifetime of the process; nothing is reachable through globals.
*/
struct Application {
  std::shared_ptr<const util::Clock>           clock;
  std::shared_ptr<tiering::FeatureFlags>       flags;
  std::shared_ptr<db::TaskRepository>          repository;
  std::shared_ptr<store::TaskStore>            store;
  std::shared_ptr<core::TieringEngine>         engine;
  std::shared_ptr<runtime::MainQueue>          main_queue;
  std::shared_ptr<notify::EscalationNotifier>  notifier;
  std::shared_ptr<tiering::EscalationScheduler> scheduler;
  std::shared_ptr<command::CommandProcessor>   processor;

  // false when the configured database could not be opened and the
  // store runs on the in-memory fallback
  bool durable = true;
};

/*
  Build

  Constructs the entire backend based on runtime config. The
  scheduler is created but not started.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const stash::config::v1::RuntimeConfig& config, std::shared_ptr<const util::Clock> clock = nullptr,
                  std::shared_ptr<notify::EscalationNotifier> notifier = nullptr);

} // namespace stash::factory
