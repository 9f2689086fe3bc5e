#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/command/command_processor.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/core/tiering_engine.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/main_queue.hpp"
#include "internal/tiering/escalation_scheduler.hpp"

static std::atomic<bool> g_running{true};

void HandleSignal(int) {
  g_running = false;
}

// Reads commands from stdin and runs them on the owner context.
static void ReadCommands(std::shared_ptr<stash::runtime::MainQueue> main_queue, std::shared_ptr<stash::command::CommandProcessor> processor) {
  std::string line;
  std::cout << "> " << std::flush;
  while (g_running && std::getline(std::cin, line)) {
    const bool posted = main_queue->Post([processor, line] {
      const auto reply = processor->Execute(line);
      (reply.ok ? std::cout : std::cerr) << reply.message << "\n";
      std::cout << "> " << std::flush;
    });
    if (!posted) break;
  }
  g_running = false;
}

static void RunAgent(stash::factory::Application& app, bool read_stdin) {
  // Tray-icon stand-in: announce escalations on the console.
  app.engine->Subscribe([engine = app.engine.get()](const stash::core::TieringEngine::ChangeEvent& event) {
    if (event.kind != stash::core::TieringEngine::ChangeKind::kEscalated) return;
    const auto top = engine->HighestActiveTier();
    std::cout << "\n[escalation] highest active tier: " << (top ? stash::model::ShortLabel(*top) : "none") << "\n> " << std::flush;
  });

  std::thread owner([queue = app.main_queue] { queue->Run(); });

  // Register signal handlers before starting workers to avoid race window.
  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  app.scheduler->Start();
  STASH_LOG_INFO("Stash agent started", {stash::observability::BoolField("durable", app.durable)});

  if (read_stdin) {
    // a blocked read cannot be interrupted; the thread ends with the process
    std::thread(ReadCommands, app.main_queue, app.processor).detach();
  }

  while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

  STASH_LOG_INFO("Shutting down stash agent");

  app.scheduler->Stop();
  app.main_queue->Shutdown();
  owner.join();
}

int main(int argc, char** argv) {
  std::string config_path;
  bool        read_stdin = true;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--no-input") {
      read_stdin = false;
    } else {
      std::cerr << "Usage: stashd [--config <config.yaml>] [--no-input]" << std::endl;
      return 1;
    }
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config_path.empty() ? stash::config::ConfigLoader::Defaults() : stash::config::ConfigLoader::LoadFromYaml(config_path);

    stash::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = stash::factory::Build(config);
    RunAgent(app, read_stdin);
  } catch (const std::exception& e) {
    STASH_LOG_ERROR("Fatal error", {stash::observability::StringField("error", e.what())});
    stash::observability::ShutdownLogging();
    return 2;
  }

  stash::observability::ShutdownLogging();
  return 0;
}
