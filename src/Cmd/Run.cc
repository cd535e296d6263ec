#include "Run.hpp"

#include "Algos.hpp"
#include "Cli.hpp"
#include "Common.hpp"
#include "Configuration.hpp"
#include "Runner/Runner.hpp"
#include "Semver.hpp"
#include "Tasks.hpp"

#include <optional>
#include <rs/result.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace trellis {

static rs::Result<void> runMain(CliArgsView args);

const Subcmd RUN_CMD =
    Subcmd{ "run" }
        .setShort("r")
        .setDesc("Run tasks and their dependencies")
        .addOpt(OPT_CONFIGURATION)
        .addOpt(OPT_RELEASE)
        .addOpt(Opt{ "--dry-run" }.setShort("-n").setDesc(
            "Print the commands instead of executing them"))
        .addOpt(Opt{ "--version" }
                    .setDesc("Override the workspace version")
                    .setPlaceholder("<SEMVER>"))
        .addOpt(Opt{ "--filter" }
                    .setDesc("Only run test projects whose name contains "
                             "<SUBSTR>")
                    .setPlaceholder("<SUBSTR>"))
        .addOpt(OPT_JOBS)
        .setArg(Arg{ "TASK" }
                    .setDesc("Tasks to run (the default task if omitted)")
                    .setRequired(false)
                    .setVariadic(true))
        .setMainFn(runMain);

static rs::Result<void> runMain(const CliArgsView args) {
  // Parse args
  TaskOptions options;
  bool dryRun = false;
  std::vector<std::string> targets;
  for (auto itr = args.begin(); itr != args.end(); ++itr) {
    const std::string_view arg = *itr;

    const auto control = rs_try(Cli::handleGlobalOpts(itr, args.end(), "run"));
    if (control == Cli::Return) {
      return rs::Ok();
    } else if (control == Cli::Continue) {
      continue;
    } else if (matchesAny(arg, { "-r", "--release" })) {
      options.configuration = Configuration::Release;
    } else if (matchesAny(arg, { "-n", "--dry-run" })) {
      dryRun = true;
    } else if (matchesAny(arg, { "-c", "--configuration", "--version",
                                 "--filter", "-j", "--jobs" })) {
      if (itr + 1 == args.end()) {
        return Subcmd::missingOptArgumentFor(arg);
      }
      const std::string_view nextArg = *++itr;

      if (matchesAny(arg, { "-c", "--configuration" })) {
        rs_ensure(!nextArg.empty(), "configuration name must not be empty");
        options.configuration = Configuration::fromString(nextArg);
      } else if (arg == "--version") {
        options.version = rs_try(Version::parse(nextArg));
      } else if (arg == "--filter") {
        options.testFilter = std::string(nextArg);
      } else {
        rs_try(parseJobs(nextArg));
      }
    } else if (arg == "--") {
      targets.insert(targets.end(), itr + 1, args.end());
      break;
    } else if (arg.starts_with('-')) {
      return RUN_CMD.noSuchArg(arg);
    } else {
      targets.emplace_back(arg);
    }
  }

  Runner runner(std::move(options));
  rs_try(runner.schedule());
  rs_try(runner.run(targets, RunOptions{ .dryRun = dryRun,
                                         .suppressFinishLog = false }));
  return rs::Ok();
}

} // namespace trellis
