#include "Driver.hpp"

#include "Cli.hpp"
#include "Cmd/Help.hpp"
#include "Cmd/Init.hpp"
#include "Cmd/List.hpp"
#include "Cmd/Plan.hpp"
#include "Cmd/Projects.hpp"
#include "Cmd/Run.hpp"
#include "Cmd/Version.hpp"
#include "Diag.hpp"
#include "Tools.hpp"

#include <exception>
#include <memory>
#include <optional>
#include <rs/result.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace trellis {

const Cli& getCli() noexcept {
  static const Cli cli = //
      Cli{ "trellis" }
          .setDesc("A task runner for multi-project workspaces")
          .addOpt(Opt{ "--verbose" }
                      .setShort("-v")
                      .setDesc("Use verbose output (-vv very verbose output)")
                      .setGlobal(true))
          .addOpt(Opt{ "--quiet" }
                      .setShort("-q")
                      .setDesc("Do not print trellis log messages")
                      .setGlobal(true))
          .addOpt(Opt{ "--color" }
                      .setDesc("Coloring: auto, always, never")
                      .setPlaceholder("<WHEN>")
                      .setDefault("auto")
                      .setGlobal(true))
          .addOpt(Opt{ "--help" }
                      .setShort("-h")
                      .setDesc("Print help")
                      .setGlobal(true))
          .addOpt(Opt{ "--version" }
                      .setShort("-V")
                      .setDesc("Print version info and exit"))
          .addSubcmd(HELP_CMD)
          .addSubcmd(INIT_CMD)
          .addSubcmd(LIST_CMD)
          .addSubcmd(PLAN_CMD)
          .addSubcmd(PROJECTS_CMD)
          .addSubcmd(RUN_CMD)
          .addSubcmd(VERSION_CMD);
  return cli;
}

static void initLogger() {
  auto logger = spdlog::stderr_color_mt("trellis");
  logger->set_pattern("%^[%l]%$ %v");
  spdlog::set_default_logger(std::move(logger));

  // `TRELLIS_TERM_VERBOSE` is the initial level; `-v` and `-q` override it.
  const std::optional<std::string> verbose = getEnvVar("TRELLIS_TERM_VERBOSE");
  if (verbose == "2") {
    setDiagLevel(DiagLevel::VeryVerbose);
  } else if (verbose == "1" || verbose == "true") {
    setDiagLevel(DiagLevel::Verbose);
  } else {
    setDiagLevel(DiagLevel::Info);
  }
}

// NOLINTNEXTLINE(*-avoid-c-arrays)
rs::Result<void, void> run(const int argc, char* argv[]) noexcept {
  try {
    initLogger();

    const std::vector<const char*> rawArgs(argv + 1, argv + argc);
    const std::vector<std::string> args = Cli::expandOpts(rawArgs);
    const rs::Result<void> result = getCli().parseArgs(args);
    if (result.is_err()) {
      Diag::error("{}", result.unwrap_err()->what());
      return rs::Err();
    }
    return rs::Ok();
  } catch (const std::exception& e) {
    Diag::error("{}", e.what());
    return rs::Err();
  }
}

} // namespace trellis
