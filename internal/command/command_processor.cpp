#include "command_processor.hpp"

#include <sstream>

#include "internal/core/tiering_engine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/task_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace stash::command {

using observability::StringField;

namespace {

CommandReply Fail(std::string message) {
  return {false, std::move(message)};
}

// Maps internal exceptions to reply text.
CommandReply ToReply(const std::exception& e) {
  if (dynamic_cast<const util::TaskNotFound*>(&e)) {
    return Fail("Task not found");
  }
  STASH_LOG_ERROR("command failed", {StringField("error", e.what())});
  return Fail(std::string("Error: ") + e.what());
}

model::Task RequireMatch(const core::TieringEngine& engine, const std::string& fragment) {
  auto task = engine.FindActiveByTitle(fragment);
  if (!task) {
    throw util::TaskNotFound("no active task matching '" + fragment + "'");
  }
  return *task;
}

} // namespace

CommandProcessor::CommandProcessor(std::shared_ptr<core::TieringEngine> engine) : engine_(std::move(engine)) {
}

const std::vector<CommandInfo>& CommandProcessor::Commands() {
  static const std::vector<CommandInfo> kCommands = {
      {"/list", "View all tasks by tier"},
      {"/done", "View completed tasks"},
      {"/focus", "Show L1 tasks only"},
      {"/complete [task]", "Mark a task as done"},
      {"/snooze [task]", "Demote task one tier"},
      {"/promote [task]", "Promote task one tier"},
      {"/tier [l1|l2|l3|mem]", "Select the tier for new tasks (no argument cycles)"},
      {"/clear", "Clear completed tasks"},
      {"/clear all", "Delete every task"},
      {"/export [path]", "Export all tasks as JSON"},
      {"/help", "Show all commands"},
  };
  return kCommands;
}

CommandReply CommandProcessor::Execute(std::string_view input) {
  const auto trimmed = util::Trim(input);
  if (trimmed.empty()) {
    return Fail("Nothing to do");
  }

  try {
    if (trimmed.front() != '/') {
      return AddTask(trimmed);
    }

    const auto  space    = trimmed.find(' ');
    std::string command  = util::ToLower(trimmed.substr(0, space));
    std::string argument = space == std::string_view::npos ? std::string() : std::string(util::Trim(trimmed.substr(space + 1)));
    return Dispatch(command, argument);
  } catch (const std::exception& e) {
    return ToReply(e);
  }
}

CommandReply CommandProcessor::Dispatch(const std::string& command, const std::string& argument) {
  if (command == "/list") return ListActive();
  if (command == "/done") return ListCompleted();
  if (command == "/focus") return Focus();
  if (command == "/clear") return Clear(argument);
  if (command == "/complete") return Complete(argument);
  if (command == "/promote") return Promote(argument);
  if (command == "/snooze") return Snooze(argument);
  if (command == "/tier") return SelectTier(argument);
  if (command == "/export") return Export(argument);
  if (command == "/help") return Help();
  return Fail("Unknown command");
}

CommandReply CommandProcessor::AddTask(std::string_view title) {
  if (!engine_->AddTask(title, selected_tier_)) {
    return Fail("Could not add task");
  }
  return {true, "Added to " + std::string(model::ShortLabel(selected_tier_))};
}

CommandReply CommandProcessor::ListActive() const {
  const auto now = engine_->store().clock().Now();

  std::ostringstream out;
  bool               any = false;
  for (auto tier : model::kAllTiers) {
    const auto tasks = engine_->ActiveTasks(tier);
    if (tasks.empty()) continue;

    if (any) out << '\n';
    any = true;
    out << model::Label(tier) << " (" << tasks.size() << ")";
    for (const auto& task : tasks) {
      out << "\n  - " << task.title << " (" << task.RelativeAge(now) << ")";
    }
  }
  if (!any) {
    return {true, "No active tasks"};
  }
  return {true, out.str()};
}

CommandReply CommandProcessor::ListCompleted() {
  engine_->ReloadCompleted();
  const auto& tasks = engine_->completed_tasks();
  if (tasks.empty()) {
    return {true, "No completed tasks"};
  }

  std::ostringstream out;
  out << "Completed (" << tasks.size() << ")";
  for (const auto& task : tasks) {
    out << "\n  - " << task.title;
    if (task.completed_at) out << " (" << util::FormatIso8601(*task.completed_at) << ")";
  }
  return {true, out.str()};
}

CommandReply CommandProcessor::Focus() const {
  const auto tasks = engine_->ActiveTasks(model::Tier::kL1);
  if (tasks.empty()) {
    return {true, "Nothing in L1"};
  }

  std::ostringstream out;
  out << "Focus: " << model::Label(model::Tier::kL1) << " (" << tasks.size() << ")";
  for (const auto& task : tasks) {
    out << "\n  - " << task.title;
  }
  return {true, out.str()};
}

CommandReply CommandProcessor::Clear(const std::string& argument) {
  if (argument.empty()) {
    engine_->ClearCompleted();
    return {true, "Completed tasks cleared"};
  }
  if (util::ToLower(argument) == "all") {
    engine_->ClearAllData();
    return {true, "All data cleared"};
  }
  return Fail("Usage: /clear [all]");
}

CommandReply CommandProcessor::Complete(const std::string& argument) {
  if (argument.empty()) return Fail("Usage: /complete [task name]");

  const auto task = RequireMatch(*engine_, argument);
  engine_->CompleteTask(task);
  return {true, "Completed \"" + task.title + "\""};
}

CommandReply CommandProcessor::Promote(const std::string& argument) {
  if (argument.empty()) return Fail("Usage: /promote [task name]");

  const auto task = RequireMatch(*engine_, argument);
  engine_->PromoteTask(task);
  const auto tier = model::Promoted(task.tier).value_or(task.tier);
  return {true, "Promoted \"" + task.title + "\" to " + std::string(model::ShortLabel(tier))};
}

CommandReply CommandProcessor::Snooze(const std::string& argument) {
  if (argument.empty()) return Fail("Usage: /snooze [task name]");

  const auto task = RequireMatch(*engine_, argument);
  engine_->SnoozeTask(task);
  const auto tier = model::Previous(task.tier).value_or(task.tier);
  return {true, "Snoozed \"" + task.title + "\" to " + std::string(model::ShortLabel(tier))};
}

CommandReply CommandProcessor::SelectTier(const std::string& argument) {
  if (argument.empty()) {
    selected_tier_ = model::Next(selected_tier_);
  } else {
    const auto tier = model::ParseTier(argument);
    if (!tier) return Fail("Usage: /tier [l1|l2|l3|mem]");
    selected_tier_ = *tier;
  }
  return {true, "Tier set to " + std::string(model::ShortLabel(selected_tier_))};
}

CommandReply CommandProcessor::Export(const std::string& argument) {
  auto& store = engine_->store();
  if (argument.empty()) {
    auto document = store.ExportSnapshot();
    if (!document) return Fail("Export failed");
    return {true, *document};
  }

  const auto count = store.ExportToFile(argument);
  if (!count) return Fail("Export failed");
  return {true, "Exported " + std::to_string(*count) + " tasks to " + argument};
}

CommandReply CommandProcessor::Help() const {
  std::ostringstream out;
  out << "Commands";
  for (const auto& info : Commands()) {
    out << "\n  " << info.usage;
    for (auto pad = info.usage.size(); pad < 24; ++pad) out << ' ';
    out << info.description;
  }
  out << "\nAnything else is added as a task to the selected tier.";
  return {true, out.str()};
}

} // namespace stash::command
