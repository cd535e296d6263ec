#include "Plan.hpp"

#include "Cli.hpp"
#include "Runner/Runner.hpp"

#include <cstddef>
#include <fmt/format.h>
#include <rs/result.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace trellis {

static rs::Result<void> planMain(CliArgsView args);

const Subcmd PLAN_CMD = //
    Subcmd{ "plan" }
        .setDesc("Print the order in which tasks would run")
        .setArg(Arg{ "TASK" }
                    .setDesc("Tasks to plan (the default task if omitted)")
                    .setRequired(false)
                    .setVariadic(true))
        .setMainFn(planMain);

static rs::Result<void> planMain(const CliArgsView args) {
  std::vector<std::string> targets;
  for (auto itr = args.begin(); itr != args.end(); ++itr) {
    const std::string_view arg = *itr;

    const auto control =
        rs_try(Cli::handleGlobalOpts(itr, args.end(), "plan"));
    if (control == Cli::Return) {
      return rs::Ok();
    } else if (control == Cli::Continue) {
      continue;
    } else if (arg == "--") {
      targets.insert(targets.end(), itr + 1, args.end());
      break;
    } else if (arg.starts_with('-')) {
      return PLAN_CMD.noSuchArg(arg);
    } else {
      targets.emplace_back(arg);
    }
  }

  Runner runner(TaskOptions{});
  rs_try(runner.schedule(ScheduleOptions{ .suppressAnalysisLog = true }));
  const std::vector<std::string> order = rs_try(runner.plan(targets));
  for (std::size_t i = 0; i < order.size(); ++i) {
    fmt::print("{}. {}\n", i + 1, order[i]);
  }
  return rs::Ok();
}

} // namespace trellis
