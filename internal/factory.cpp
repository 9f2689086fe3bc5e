#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/command/command_processor.hpp"
#include "internal/core/tiering_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/notify/escalation_notifier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/main_queue.hpp"
#include "internal/store/task_store.hpp"
#include "internal/tiering/escalation_policy.hpp"
#include "internal/tiering/escalation_scheduler.hpp"
#include "internal/tiering/feature_flags.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace stash::factory {

using observability::StringField;

namespace {

std::chrono::milliseconds ToMillis(const google::protobuf::Duration& duration) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(duration.seconds()) + std::chrono::nanoseconds(duration.nanos()));
}

std::shared_ptr<db::TaskRepository> BuildRepository(const stash::config::v1::RuntimeConfig& config, bool* durable) {
  const auto& database = config.database();
  *durable             = false;

  if (database.has_sqlite()) {
    try {
      auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
      *durable       = true;
      return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
    } catch (const util::StorageUnavailable& e) {
      STASH_LOG_ERROR("storage unavailable; tasks will not be saved", {StringField("path", database.sqlite().path()), StringField("error", e.what())});
    }
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const stash::config::v1::RuntimeConfig& config, std::shared_ptr<const util::Clock> clock,
                  std::shared_ptr<notify::EscalationNotifier> notifier) {
  Application app;

  app.clock = clock ? std::move(clock) : std::make_shared<util::SystemClock>();

  // ------------------------------------------------------------------
  // Flags
  // ------------------------------------------------------------------
  app.flags = std::make_shared<tiering::FeatureFlags>();
  app.flags->escalation_enabled    = config.escalation().enabled();
  app.flags->notifications_enabled = config.escalation().notifications_enabled();

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config, &app.durable);
  app.store      = std::make_shared<store::TaskStore>(app.repository, app.clock);

  // ------------------------------------------------------------------
  // Core
  // ------------------------------------------------------------------
  app.main_queue = std::make_shared<runtime::MainQueue>();
  app.engine     = std::make_shared<core::TieringEngine>(app.store);
  app.engine->Reload();

  app.notifier = notifier ? std::move(notifier) : std::make_shared<notify::LogNotifier>(app.flags);

  // ------------------------------------------------------------------
  // Escalation
  // ------------------------------------------------------------------
  tiering::EscalationScheduler::Options options;
  options.initial_delay = ToMillis(config.escalation().initial_delay());
  options.period        = ToMillis(config.escalation().period());

  auto policy   = std::make_shared<tiering::EscalationPolicy>(config.escalation().recount_within_pass());
  app.scheduler = std::make_shared<tiering::EscalationScheduler>(app.engine, app.main_queue, std::move(policy), app.notifier, app.flags, options);

  app.processor = std::make_shared<command::CommandProcessor>(app.engine);

  return app;
}

} // namespace stash::factory
