#include "Cli.hpp"

#include "Algos.hpp"
#include "Diag.hpp"
#include "TermColor.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <fmt/format.h>
#include <functional>
#include <optional>
#include <rs/result.hpp>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace trellis {

static std::string padding(const std::size_t width,
                           const std::size_t used) noexcept {
  return std::string(width > used ? width - used : 0, ' ');
}

std::string Opt::leftColumn() const {
  std::string column;
  if (!shortName.empty()) {
    column = fmt::format("{}, {}", shortName, name);
  } else {
    column = fmt::format("    {}", name);
  }
  if (!placeholder.empty()) {
    column += fmt::format(" {}", placeholder);
  }
  return column;
}

void Opt::print(const std::size_t maxOffset) const {
  if (isHidden) {
    return;
  }

  const std::string left = leftColumn();
  std::string line = fmt::format("  {}{}  {}", Bold(Cyan(left)).toOutStr(),
                                 padding(maxOffset, left.size()), desc);
  if (!defaultVal.empty()) {
    line += fmt::format(" [default: {}]", defaultVal);
  }
  fmt::print("{}\n", line);
}

std::string Arg::usage() const {
  std::string str = required ? fmt::format("<{}>", name)
                             : fmt::format("[{}]", name);
  if (variadic) {
    str += "...";
  }
  return str;
}

Subcmd& Subcmd::addOpt(Opt opt) {
  localOpts.push_back(opt);
  return *this;
}

Subcmd& Subcmd::setArg(Arg arg) {
  this->arg = arg;
  return *this;
}

Subcmd&
Subcmd::setMainFn(std::function<rs::Result<void>(CliArgsView)> mainFn) {
  this->mainFn = std::move(mainFn);
  return *this;
}

rs::Result<void> Subcmd::missingOptArgumentFor(const std::string_view arg) {
  rs_bail("missing argument for `{}`", arg);
}

rs::Result<void> Subcmd::noSuchArg(const std::string_view arg) const {
  std::vector<std::string_view> candidates;
  for (const Opt& opt : localOpts) {
    candidates.push_back(opt.name);
    if (!opt.shortName.empty()) {
      candidates.push_back(opt.shortName);
    }
  }

  if (const auto similar = findSimilarStr(arg, candidates)) {
    rs_bail("unexpected argument `{}` found; did you mean `{}`?", arg,
            *similar);
  }
  rs_bail("unexpected argument `{}` found (see `trellis help {}`)", arg, name);
}

void Subcmd::printHelp(const std::vector<Opt>& globalOpts) const {
  std::size_t maxOffset = 0;
  for (const Opt& opt : globalOpts) {
    maxOffset = std::max(maxOffset, opt.leftColumn().size());
  }
  for (const Opt& opt : localOpts) {
    maxOffset = std::max(maxOffset, opt.leftColumn().size());
  }
  if (arg.has_value()) {
    maxOffset = std::max(maxOffset, arg->usage().size());
  }

  fmt::print("{}\n\n", desc);
  fmt::print("{} {} {}{}\n\n", Bold(Green("Usage:")).toOutStr(),
             Bold(Cyan(fmt::format("trellis {}", name))).toOutStr(),
             Cyan("[OPTIONS]").toOutStr(),
             arg.has_value() ? fmt::format(" {}", arg->usage()) : "");

  fmt::print("{}\n", Bold(Green("Options:")).toOutStr());
  for (const Opt& opt : globalOpts) {
    opt.print(maxOffset);
  }
  for (const Opt& opt : localOpts) {
    opt.print(maxOffset);
  }

  if (arg.has_value()) {
    const std::string usage = arg->usage();
    fmt::print("\n{}\n  {}{}  {}\n", Bold(Green("Arguments:")).toOutStr(),
               Cyan(usage).toOutStr(), padding(maxOffset, usage.size()),
               arg->desc);
  }
}

Cli& Cli::addSubcmd(const Subcmd& subcmd) {
  subcmds.insert_or_assign(subcmd.name, subcmd);
  return *this;
}

Cli& Cli::addOpt(Opt opt) {
  if (opt.isGlobal) {
    globalOpts.push_back(opt);
  } else {
    localOpts.push_back(opt);
  }
  return *this;
}

bool Cli::hasSubcmd(const std::string_view name) const noexcept {
  return findSubcmd(name) != nullptr;
}

const Subcmd* Cli::findSubcmd(const std::string_view name) const noexcept {
  if (const auto itr = subcmds.find(name); itr != subcmds.end()) {
    return &itr->second;
  }
  for (const auto& [_, subcmd] : subcmds) {
    if (!subcmd.shortName.empty() && subcmd.shortName == name) {
      return &subcmd;
    }
  }
  return nullptr;
}

rs::Result<void> Cli::exec(const std::string_view subcmd,
                           const CliArgsView args) const {
  const Subcmd* cmd = findSubcmd(subcmd);
  if (cmd == nullptr) {
    std::vector<std::string_view> candidates;
    for (const auto& [cmdName, _] : subcmds) {
      candidates.push_back(cmdName);
    }
    if (const auto similar = findSimilarStr(subcmd, candidates)) {
      rs_bail("no such command `{}`; did you mean `{}`?", subcmd, *similar);
    }
    rs_bail("no such command `{}` (see `trellis help`)", subcmd);
  }
  return cmd->mainFn(args);
}

rs::Result<void> Cli::parseArgs(const CliArgsView args) const {
  for (auto itr = args.begin(); itr != args.end(); ++itr) {
    const std::string_view arg = *itr;

    const auto control = rs_try(handleGlobalOpts(itr, args.end()));
    if (control == Return) {
      return rs::Ok();
    } else if (control == Continue) {
      continue;
    } else if (matchesAny(arg, { "-V", "--version" })) {
      return exec("version", args.subspan(args.size()));
    } else if (arg.starts_with('-')) {
      std::vector<std::string_view> candidates;
      for (const Opt& opt : globalOpts) {
        candidates.push_back(opt.name);
      }
      for (const Opt& opt : localOpts) {
        candidates.push_back(opt.name);
      }
      if (const auto similar = findSimilarStr(arg, candidates)) {
        rs_bail("unexpected argument `{}` found; did you mean `{}`?", arg,
                *similar);
      }
      rs_bail("unexpected argument `{}` found (see `trellis help`)", arg);
    }

    const auto rest = static_cast<std::size_t>(itr - args.begin()) + 1;
    return exec(arg, args.subspan(rest));
  }

  printMainHelp();
  return rs::Ok();
}

std::size_t Cli::calcMaxOffset() const {
  std::size_t maxOffset = 0;
  for (const Opt& opt : globalOpts) {
    maxOffset = std::max(maxOffset, opt.leftColumn().size());
  }
  for (const Opt& opt : localOpts) {
    maxOffset = std::max(maxOffset, opt.leftColumn().size());
  }
  for (const auto& [cmdName, subcmd] : subcmds) {
    std::size_t width = cmdName.size();
    if (!subcmd.shortName.empty()) {
      width += subcmd.shortName.size() + 2;
    }
    maxOffset = std::max(maxOffset, width);
  }
  return maxOffset;
}

void Cli::printMainHelp() const {
  const std::size_t maxOffset = calcMaxOffset();

  fmt::print("{}\n\n", desc);
  fmt::print("{} {} {} {}\n\n", Bold(Green("Usage:")).toOutStr(),
             Bold(Cyan("trellis")).toOutStr(), Cyan("[OPTIONS]").toOutStr(),
             Cyan("[COMMAND]").toOutStr());

  fmt::print("{}\n", Bold(Green("Options:")).toOutStr());
  for (const Opt& opt : globalOpts) {
    opt.print(maxOffset);
  }
  for (const Opt& opt : localOpts) {
    opt.print(maxOffset);
  }

  fmt::print("\n{}\n", Bold(Green("Commands:")).toOutStr());
  for (const auto& [cmdName, subcmd] : subcmds) {
    if (subcmd.isHidden) {
      continue;
    }
    std::string left(cmdName);
    if (!subcmd.shortName.empty()) {
      left += fmt::format(", {}", subcmd.shortName);
    }
    fmt::print("  {}{}  {}\n", Bold(Cyan(left)).toOutStr(),
               padding(maxOffset, left.size()), subcmd.desc);
  }

  fmt::print("\nSee '{}' for more information on a specific command.\n",
             Bold(Cyan("trellis help <command>")).toOutStr());
}

rs::Result<void> Cli::printHelp(const CliArgsView args) const {
  if (args.empty()) {
    printMainHelp();
    return rs::Ok();
  }
  rs_ensure(args.size() == 1, "`help` takes at most one command");

  const std::string_view subcmd = args.front();
  const Subcmd* cmd = findSubcmd(subcmd);
  if (cmd == nullptr) {
    return exec(subcmd, {});
  }
  cmd->printHelp(globalOpts);
  return rs::Ok();
}

rs::Result<Cli::ControlFlow>
Cli::handleGlobalOpts(CliArgsView::iterator& itr,
                      const CliArgsView::iterator end,
                      const std::string_view subcmd) {
  const std::string_view arg = *itr;

  if (matchesAny(arg, { "-h", "--help" })) {
    if (subcmd.empty()) {
      getCli().printMainHelp();
    } else {
      const std::vector<std::string> helpArgs{ std::string(subcmd) };
      rs_try(getCli().printHelp(helpArgs));
    }
    return rs::Ok(Return);
  } else if (matchesAny(arg, { "-v", "--verbose" })) {
    // A second `-v` means trace output.
    if (isVerbose()) {
      setDiagLevel(DiagLevel::VeryVerbose);
    } else {
      setDiagLevel(DiagLevel::Verbose);
    }
    return rs::Ok(Continue);
  } else if (matchesAny(arg, { "-q", "--quiet" })) {
    setDiagLevel(DiagLevel::Off);
    return rs::Ok(Continue);
  } else if (arg == "--color") {
    rs_ensure(itr + 1 != end, "missing argument for `{}`", arg);
    const std::string_view mode = *++itr;
    rs_ensure(matchesAny(mode, { "auto", "always", "never" }),
              "invalid argument for `--color`: `{}` (expected `auto`, "
              "`always`, or `never`)",
              mode);
    setColorMode(mode);
    return rs::Ok(Continue);
  }
  return rs::Ok(Fallthrough);
}

static bool isFlagCluster(const std::string_view arg) noexcept {
  if (arg.size() <= 2 || arg[0] != '-' || arg[1] == '-') {
    return false;
  }
  return std::ranges::all_of(arg.substr(1), [](const char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
  });
}

// A short option with a numeric value attached, e.g. `-j4`.
static bool isAttachedNumber(const std::string_view arg) noexcept {
  if (arg.size() <= 2 || arg[0] != '-'
      || std::isalpha(static_cast<unsigned char>(arg[1])) == 0) {
    return false;
  }
  return std::ranges::all_of(arg.substr(2), [](const char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
  });
}

std::vector<std::string>
Cli::expandOpts(const std::span<const char* const> args) {
  std::vector<std::string> expanded;
  bool passthrough = false;
  for (const std::string_view arg : args) {
    if (passthrough) {
      expanded.emplace_back(arg);
    } else if (arg == "--") {
      // Everything after `--` is a positional argument.
      passthrough = true;
      expanded.emplace_back(arg);
    } else if (arg.starts_with("--") && arg.contains('=')) {
      const std::size_t eq = arg.find('=');
      expanded.emplace_back(arg.substr(0, eq));
      expanded.emplace_back(arg.substr(eq + 1));
    } else if (isAttachedNumber(arg)) {
      expanded.emplace_back(arg.substr(0, 2));
      expanded.emplace_back(arg.substr(2));
    } else if (isFlagCluster(arg)) {
      for (const char c : arg.substr(1)) {
        expanded.push_back(fmt::format("-{}", c));
      }
    } else {
      expanded.emplace_back(arg);
    }
  }
  return expanded;
}

} // namespace trellis

#ifdef TRELLIS_TEST

#  include <fmt/ranges.h>
#  include <rs/tests.hpp>

namespace trellis {

// Unit tests link without the command table.
const Cli& getCli() noexcept {
  static const Cli cli = Cli{ "trellis" }.setDesc("test");
  return cli;
}

static void testExpandOpts() {
  const std::vector<const char*> args = {
    "-vv", "run", "--configuration=release", "-j4", "--", "-qv", "--a=b"
  };
  tests::assertEq(Cli::expandOpts(args),
                  std::vector<std::string>{ "-v", "-v", "run",
                                            "--configuration", "release",
                                            "-j", "4", "--", "-qv", "--a=b" });

  tests::pass();
}

static void testHandleGlobalOpts() {
  setDiagLevel(DiagLevel::Info);
  const std::vector<std::string> args = { "-v", "-v", "--color", "never",
                                          "build", "--color" };
  auto itr = CliArgsView(args).begin();
  const auto end = CliArgsView(args).end();

  tests::assertTrue(Cli::handleGlobalOpts(itr, end).unwrap() == Cli::Continue);
  tests::assertTrue(getDiagLevel() == DiagLevel::Verbose);
  ++itr;
  tests::assertTrue(Cli::handleGlobalOpts(itr, end).unwrap() == Cli::Continue);
  tests::assertTrue(getDiagLevel() == DiagLevel::VeryVerbose);
  ++itr;
  tests::assertTrue(Cli::handleGlobalOpts(itr, end).unwrap() == Cli::Continue);
  tests::assertEq(*itr, "never");
  ++itr;
  tests::assertTrue(Cli::handleGlobalOpts(itr, end).unwrap()
                    == Cli::Fallthrough);
  ++itr;
  tests::assertEq(Cli::handleGlobalOpts(itr, end).unwrap_err()->what(),
                  "missing argument for `--color`");

  setDiagLevel(DiagLevel::Off);
  tests::pass();
}

static void testNoSuchArg() {
  const Subcmd cmd = Subcmd{ "run" }
                         .addOpt(Opt{ "--dry-run" }.setShort("-n"))
                         .addOpt(Opt{ "--filter" });

  tests::assertEq(cmd.noSuchArg("--dryrun").unwrap_err()->what(),
                  "unexpected argument `--dryrun` found; did you mean "
                  "`--dry-run`?");
  tests::assertEq(cmd.noSuchArg("--xyzzy").unwrap_err()->what(),
                  "unexpected argument `--xyzzy` found (see `trellis help "
                  "run`)");

  tests::pass();
}

static void testExec() {
  int calls = 0;
  Cli cli{ "trellis" };
  cli.addSubcmd(Subcmd{ "list" }.setShort("ls").setMainFn(
      [&calls](const CliArgsView args) -> rs::Result<void> {
        calls += static_cast<int>(args.size()) + 1;
        return rs::Ok();
      }));

  const std::vector<std::string> args = { "ls", "--json" };
  cli.parseArgs(args).unwrap();
  tests::assertEq(calls, 2);
  tests::assertTrue(cli.hasSubcmd("list"));
  tests::assertFalse(cli.hasSubcmd("lsit"));

  tests::assertEq(cli.exec("lsit", {}).unwrap_err()->what(),
                  "no such command `lsit`; did you mean `list`?");

  tests::pass();
}

} // namespace trellis

int main() {
  trellis::setColorMode("never");

  trellis::testExpandOpts();
  trellis::testHandleGlobalOpts();
  trellis::testNoSuchArg();
  trellis::testExec();
}

#endif
