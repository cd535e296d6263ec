#include "helpers.hpp"

#include <boost/ut.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

static constexpr std::string_view CUSTOM_TASKS = R"(
[tasks.lint]
description = "Lint the libraries"
depends-on = ["restore"]
run = ["sh", "-c", "true"]
)";

int main() {
  using boost::ut::expect;
  using boost::ut::operator""_test;

  "trellis list"_test = [] {
    const tests::TempDir tmp;
    tests::writeWorkspace(tmp.path, CUSTOM_TASKS);

    const auto result = tests::runTrellis({ "list" }, tmp.path).unwrap();
    expect(result.status.success()) << result.err;
    const std::string expectedOut =
        "Tasks:\n"
        "  clean     Remove the artifacts directory and build outputs\n"
        "  restore   Restore the dependencies of every project\n"
        "  build     Compile every project in dependency order (depends on: "
        "restore)\n"
        "  test      Run the test projects (depends on: build)\n"
        "  coverage  Collect code coverage from the test projects (depends "
        "on: build)\n"
        "  pack      Create packages of the packable projects (depends on: "
        "build)\n"
        "  publish   Push the packages to the feed (depends on: pack)\n"
        "  default   Build and test the workspace (depends on: build, test) "
        "[default]\n"
        "  lint      Lint the libraries (depends on: restore)\n";
    expect(result.out == expectedOut) << result.out;
    expect(result.err.empty()) << result.err;
  };

  "trellis list --json"_test = [] {
    const tests::TempDir tmp;
    tests::writeWorkspace(tmp.path,
                          std::string("default-task = \"build\"\n")
                              + std::string(CUSTOM_TASKS));

    const auto result =
        tests::runTrellis({ "ls", "--json" }, tmp.path).unwrap();
    expect(result.status.success()) << result.err;

    const auto json = nlohmann::json::parse(result.out);
    expect(json["default"] == "build");
    expect(json["tasks"].size() == 9u);
    expect(json["tasks"][2]["name"] == "build");
    expect(json["tasks"][2]["dependencies"].get<std::vector<std::string>>()
           == std::vector<std::string>{ "restore" });
    expect(json["tasks"][7]["name"] == "default");
    expect(json["tasks"][7]["aggregate"] == true);
    expect(json["tasks"][8]["name"] == "lint");
    expect(json["tasks"][8]["description"] == "Lint the libraries");
  };

  "trellis list with a bad manifest"_test = [] {
    const tests::TempDir tmp;
    tests::writeWorkspace(tmp.path, R"(
[tasks.lint]
depends-on = ["restroe"]
)");

    const auto result = tests::runTrellis({ "list" }, tmp.path).unwrap();
    expect(!result.status.success());
    expect(result.err == "Error: task `lint` depends on unknown task "
                         "`restroe`\n")
        << result.err;
  };
}
