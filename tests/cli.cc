#include "helpers.hpp"

#include <boost/ut.hpp>
#include <string>

int main() {
  using boost::ut::expect;
  using boost::ut::operator""_test;

  "trellis help"_test = [] {
    const auto result = tests::runTrellis({ "help" }).unwrap();
    expect(result.status.success());
    expect(result.out.contains("Usage: trellis [OPTIONS] [COMMAND]\n"))
        << result.out;
    expect(result.out.contains("  list, ls")) << result.out;
    expect(result.out.contains("  run, r")) << result.out;

    const auto bare = tests::runTrellis({}).unwrap();
    expect(bare.status.success());
    expect(bare.out == result.out) << bare.out;
  };

  "trellis help run"_test = [] {
    const auto result = tests::runTrellis({ "help", "run" }).unwrap();
    expect(result.status.success());
    expect(result.out.starts_with("Run tasks and their dependencies\n\n"
                                  "Usage: trellis run [OPTIONS] [TASK]...\n"))
        << result.out;
    expect(result.out.contains("-n, --dry-run")) << result.out;
    expect(result.out.contains("--filter <SUBSTR>")) << result.out;

    const auto flag = tests::runTrellis({ "run", "--help" }).unwrap();
    expect(flag.status.success());
    expect(flag.out == result.out) << flag.out;
  };

  "trellis unknown command"_test = [] {
    const auto result = tests::runTrellis({ "bulid" }).unwrap();
    expect(!result.status.success());
    expect(result.out.empty());
    expect(result.err.starts_with("Error: no such command `bulid`"))
        << result.err;

    const auto typo = tests::runTrellis({ "projcts" }).unwrap();
    expect(!typo.status.success());
    expect(typo.err == "Error: no such command `projcts`; did you mean "
                       "`projects`?\n")
        << typo.err;
  };

  "trellis unknown option"_test = [] {
    const tests::TempDir tmp;
    tests::writeWorkspace(tmp.path, "");

    const auto result =
        tests::runTrellis({ "run", "--dryrun" }, tmp.path).unwrap();
    expect(!result.status.success());
    expect(result.err == "Error: unexpected argument `--dryrun` found; did "
                         "you mean `--dry-run`?\n")
        << result.err;
  };

  "trellis --color"_test = [] {
    const auto result =
        tests::runTrellis({ "--color", "sometimes", "help" }).unwrap();
    expect(!result.status.success());
    expect(result.err == "Error: invalid argument for `--color`: `sometimes` "
                         "(expected `auto`, `always`, or `never`)\n")
        << result.err;
  };
}
