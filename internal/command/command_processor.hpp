#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/tier.hpp"

namespace stash::core {
class TieringEngine;
}

namespace stash::command {

struct CommandReply {
  bool        ok = true;
  std::string message;
};

struct CommandInfo {
  std::string_view usage;
  std::string_view description;
};

/*
  Text command surface shared by the input panel, the CLI and the agent.

  Plain text adds a task to the selected tier; "/..." runs a command.
  Commands are matched case-insensitively and take at most one
  argument (everything after the first space).

  Runs on the owner context. Never throws: not-found, usage and
  unknown-command errors come back as replies with ok == false.
*/
class CommandProcessor {
 public:
  explicit CommandProcessor(std::shared_ptr<core::TieringEngine> engine);

  CommandReply Execute(std::string_view input);

  model::Tier selected_tier() const {
    return selected_tier_;
  }
  void set_selected_tier(model::Tier tier) {
    selected_tier_ = tier;
  }

  static const std::vector<CommandInfo>& Commands();

 private:
  CommandReply Dispatch(const std::string& command, const std::string& argument);

  CommandReply AddTask(std::string_view title);
  CommandReply ListActive() const;
  CommandReply ListCompleted();
  CommandReply Focus() const;
  CommandReply Clear(const std::string& argument);
  CommandReply Complete(const std::string& argument);
  CommandReply Promote(const std::string& argument);
  CommandReply Snooze(const std::string& argument);
  CommandReply SelectTier(const std::string& argument);
  CommandReply Export(const std::string& argument);
  CommandReply Help() const;

  std::shared_ptr<core::TieringEngine> engine_;
  model::Tier                          selected_tier_ = model::Tier::kL1;
};

} // namespace stash::command
