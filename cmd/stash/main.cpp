#include <iostream>
#include <optional>
#include <string>

#include "internal/command/command_processor.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/model/tier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/tiering/escalation_scheduler.hpp"

static void Usage() {
  std::cout << "Usage:\n"
            << "  stash [--config <config.yaml>] [--tier l1|l2|l3|mem] <task title...>\n"
            << "  stash [--config <config.yaml>] /<command> [argument]\n"
            << "  stash [--config <config.yaml>] --escalate\n"
            << "\n"
            << "Run 'stash /help' for the command list.\n";
}

int main(int argc, char** argv) {
  std::optional<std::string>        config_path;
  std::optional<stash::model::Tier> tier;
  bool                              escalate = false;
  std::string                       input;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--tier" && i + 1 < argc) {
      tier = stash::model::ParseTier(argv[++i]);
      if (!tier) {
        std::cerr << "invalid tier: " << argv[i] << "\n";
        return 1;
      }
    } else if (arg == "--escalate") {
      escalate = true;
    } else if (arg == "-h" || arg == "--help") {
      Usage();
      return 0;
    } else {
      if (!input.empty()) input += ' ';
      input += arg;
    }
  }

  if (input.empty() && !escalate) {
    Usage();
    return 1;
  }

  try {
    auto config = config_path ? stash::config::ConfigLoader::LoadFromYaml(*config_path) : stash::config::ConfigLoader::Defaults();
    stash::observability::InitializeLogging(config);

    int status = 0;
    {
      // the calling thread is the owner context for this one-shot run
      auto app = stash::factory::Build(config);

      if (escalate) {
        const auto escalated = app.scheduler->RunPass();
        std::cout << "Escalated " << escalated << (escalated == 1 ? " task" : " tasks") << "\n";
      }

      if (!input.empty()) {
        if (tier) app.processor->set_selected_tier(*tier);
        const auto reply = app.processor->Execute(input);
        (reply.ok ? std::cout : std::cerr) << reply.message << "\n";
        status = reply.ok ? 0 : 1;
      }
    }

    stash::observability::ShutdownLogging();
    return status;
  } catch (const std::exception& e) {
    STASH_LOG_ERROR("Fatal error", {stash::observability::StringField("error", e.what())});
    stash::observability::ShutdownLogging();
    return 2;
  }
}
