#include "List.hpp"

#include "Cli.hpp"
#include "Common.hpp"
#include "Runner/Runner.hpp"
#include "TermColor.hpp"

#include <algorithm>
#include <cstddef>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>
#include <rs/result.hpp>
#include <string>
#include <string_view>
#include <utility>

namespace trellis {

static rs::Result<void> listMain(CliArgsView args);

const Subcmd LIST_CMD = //
    Subcmd{ "list" }
        .setShort("ls")
        .setDesc("List the tasks of the workspace")
        .addOpt(OPT_JSON)
        .setMainFn(listMain);

static void printJson(const TaskGraph& graph) {
  nlohmann::json tasks = nlohmann::json::array();
  for (const Task& task : graph.tasks()) {
    tasks.push_back({
        { "name", task.name },
        { "description", task.description },
        { "dependencies", task.dependencies },
        { "aggregate", task.isAggregate() },
    });
  }

  nlohmann::json root;
  root["default"] = graph.defaultTask().has_value()
                        ? nlohmann::json(*graph.defaultTask())
                        : nlohmann::json(nullptr);
  root["tasks"] = std::move(tasks);
  fmt::print("{}\n", root.dump(2));
}

static void printText(const TaskGraph& graph) {
  std::size_t width = 0;
  for (const Task& task : graph.tasks()) {
    width = std::max(width, task.name.size());
  }

  fmt::print("{}\n", Bold(Green("Tasks:")).toOutStr());
  for (const Task& task : graph.tasks()) {
    std::string line = fmt::format(
        "  {}{}  {}", Bold(Cyan(task.name)).toOutStr(),
        std::string(width - task.name.size(), ' '), task.description);
    if (!task.dependencies.empty()) {
      line += fmt::format(" (depends on: {})",
                          fmt::join(task.dependencies, ", "));
    }
    if (graph.defaultTask() == task.name) {
      line += " [default]";
    }
    // No trailing blank for tasks without a description.
    while (line.ends_with(' ')) {
      line.pop_back();
    }
    fmt::print("{}\n", line);
  }
}

static rs::Result<void> listMain(const CliArgsView args) {
  bool json = false;
  for (auto itr = args.begin(); itr != args.end(); ++itr) {
    const std::string_view arg = *itr;

    const auto control =
        rs_try(Cli::handleGlobalOpts(itr, args.end(), "list"));
    if (control == Cli::Return) {
      return rs::Ok();
    } else if (control == Cli::Continue) {
      continue;
    } else if (arg == "--json") {
      json = true;
    } else {
      return LIST_CMD.noSuchArg(arg);
    }
  }

  Runner runner(TaskOptions{});
  rs_try(runner.schedule(ScheduleOptions{ .suppressAnalysisLog = true }));
  if (json) {
    printJson(runner.graph());
  } else {
    printText(runner.graph());
  }
  return rs::Ok();
}

} // namespace trellis
