#include "helpers.hpp"

#include <boost/ut.hpp>
#include <string>

static constexpr std::string_view ECHO_ACTIONS = R"(
[actions]
restore = ["sh", "-c", "echo restore {project}"]
compile = ["sh", "-c", "echo compile {project} {configuration}"]
test = ["sh", "-c", "echo test {project}"]
)";

int main() {
  using boost::ut::expect;
  using boost::ut::operator""_test;

  "trellis run build"_test = [] {
    const tests::TempDir tmp;
    tests::writeWorkspace(tmp.path, ECHO_ACTIONS);

    const auto result = tests::runTrellis({ "run", "build" }, tmp.path).unwrap();
    expect(result.status.success()) << result.status.toString();
    expect(result.out
           == "restore a\n"
              "restore a-tests\n"
              "compile a debug\n"
              "compile a-tests debug\n")
        << result.out;

    const auto sanitizedErr = tests::sanitizeOutput(result.err);
    const std::string expectedErr =
        "   Analyzing workspace `acme` (2 project(s))\n"
        "     Running task `restore`\n"
        "   Restoring a (libs/a)\n"
        "   Restoring a-tests (tests/a-tests)\n"
        "     Running task `build`\n"
        "   Compiling a (libs/a)\n"
        "   Compiling a-tests (tests/a-tests)\n"
        "    Finished 2 task(s) in <DURATION>s\n";
    expect(sanitizedErr == expectedErr) << sanitizedErr;
  };

  "trellis run -j4 -- build"_test = [] {
    const tests::TempDir tmp;
    tests::writeWorkspace(tmp.path, ECHO_ACTIONS);

    const auto result =
        tests::runTrellis({ "run", "-j4", "--", "build" }, tmp.path).unwrap();
    expect(result.status.success()) << result.err;
    expect(result.out
           == "restore a\n"
              "restore a-tests\n"
              "compile a debug\n"
              "compile a-tests debug\n")
        << result.out;
  };

  "trellis run default task"_test = [] {
    const tests::TempDir tmp;
    tests::writeWorkspace(tmp.path, ECHO_ACTIONS);

    const auto result =
        tests::runTrellis({ "run", "--release" }, tmp.path / "libs/a")
            .unwrap();
    expect(result.status.success()) << result.status.toString();
    expect(result.out.contains("compile a-tests release\ntest a-tests\n"))
        << result.out;

    const auto sanitizedErr = tests::sanitizeOutput(result.err);
    expect(sanitizedErr.contains("     Testing a-tests (tests/a-tests)\n"))
        << sanitizedErr;
    expect(sanitizedErr.contains("          Ok 1 passed; 0 failed; 0 "
                                 "filtered out; finished in <DURATION>s\n"))
        << sanitizedErr;
    expect(sanitizedErr.contains("    Finished 4 task(s) in <DURATION>s\n"))
        << sanitizedErr;
  };

  "trellis run --filter"_test = [] {
    const tests::TempDir tmp;
    tests::writeWorkspace(tmp.path, ECHO_ACTIONS);

    const auto result =
        tests::runTrellis({ "run", "test", "--filter", "nothing" }, tmp.path)
            .unwrap();
    expect(result.status.success());
    expect(!result.out.contains("test a-tests")) << result.out;
    const auto sanitizedErr = tests::sanitizeOutput(result.err);
    expect(sanitizedErr.contains("0 passed; 0 failed; 1 filtered out"))
        << sanitizedErr;
  };

  "trellis run --dry-run"_test = [] {
    const tests::TempDir tmp;
    tests::writeWorkspace(tmp.path, ECHO_ACTIONS);

    const auto result = tests::runTrellis(
                            { "run", "-n", "build", "-c", "profiling",
                              "--version", "2.0.0" },
                            tmp.path)
                            .unwrap();
    expect(result.status.success()) << result.status.toString();
    expect(result.out
           == "sh -c 'echo restore a'\n"
              "sh -c 'echo restore a-tests'\n"
              "sh -c 'echo compile a profiling'\n"
              "sh -c 'echo compile a-tests profiling'\n")
        << result.out;
  };

  "trellis run failing action"_test = [] {
    const tests::TempDir tmp;
    tests::writeWorkspace(tmp.path, R"(
[actions]
compile = ["sh", "-c", "exit 2"]
)");

    const auto result = tests::runTrellis({ "run", "build" }, tmp.path).unwrap();
    expect(!result.status.success());
    const auto sanitizedErr = tests::sanitizeOutput(result.err);
    expect(sanitizedErr.contains(
        "Warning: no `restore` action configured; skipping\n"))
        << sanitizedErr;
    expect(sanitizedErr.ends_with("Error: task `build` failed: `sh -c 'exit "
                                  "2'` exited with code 2\n"))
        << sanitizedErr;
  };

  "trellis run failing test"_test = [] {
    const tests::TempDir tmp;
    tests::writeWorkspace(tmp.path, R"(
[actions]
test = ["sh", "-c", "exit 1"]
)");

    const auto result = tests::runTrellis({ "run", "test" }, tmp.path).unwrap();
    expect(!result.status.success());
    const auto sanitizedErr = tests::sanitizeOutput(result.err);
    expect(sanitizedErr.contains("Warning: test project `a-tests` failed: "
                                 "`sh -c 'exit 1'` exited with code 1\n"))
        << sanitizedErr;
    expect(sanitizedErr.ends_with(
        "Error: task `test` failed: 0 passed; 1 failed; 0 filtered out; "
        "finished in <DURATION>s\n"))
        << sanitizedErr;
  };

  "trellis run coverage"_test = [] {
    const tests::TempDir tmp;
    tests::writeWorkspace(tmp.path, R"(
[actions]
coverage = ["sh", "-c", "echo cover {project} {coverage_dir}"]
)");

    const auto result =
        tests::runTrellis({ "run", "coverage" }, tmp.path).unwrap();
    expect(result.status.success()) << result.err;
    expect(result.out
           == "cover a-tests " + (tmp.path / "trellis-out/coverage").string()
                  + "\n")
        << result.out;
    const auto sanitizedErr = tests::sanitizeOutput(result.err);
    expect(sanitizedErr.contains("    Covering a-tests (tests/a-tests)\n"
                                 "Warning: no coverage report for `a-tests` "
                                 "at trellis-out/coverage/a-tests.xml\n"))
        << sanitizedErr;
  };

  "trellis run unknown task"_test = [] {
    const tests::TempDir tmp;
    tests::writeWorkspace(tmp.path, ECHO_ACTIONS);

    const auto result = tests::runTrellis({ "run", "biuld" }, tmp.path).unwrap();
    expect(!result.status.success());
    expect(result.out.empty());
    expect(result.err.ends_with(
        "Error: no such task `biuld`; did you mean `build`?\n"))
        << result.err;
  };

  "trellis run outside a workspace"_test = [] {
    const tests::TempDir tmp;

    const auto result = tests::runTrellis({ "run" }, tmp.path).unwrap();
    expect(!result.status.success());
    expect(result.err.starts_with("Error: could not find `trellis.toml` in "))
        << result.err;
  };

  "trellis run custom task"_test = [] {
    const tests::TempDir tmp;
    tests::writeWorkspace(tmp.path, R"(
[tasks.lint]
description = "Lint the libraries"
run = ["sh", "-c", "echo lint {project} {{x}}"]
for-each = "library"
)");

    const auto result = tests::runTrellis({ "run", "lint" }, tmp.path).unwrap();
    expect(result.status.success()) << result.err;
    expect(result.out == "lint a {x}\n") << result.out;
  };
}
