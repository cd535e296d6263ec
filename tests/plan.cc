#include "helpers.hpp"

#include <boost/ut.hpp>
#include <string>

int main() {
  using boost::ut::expect;
  using boost::ut::operator""_test;

  "trellis plan"_test = [] {
    const tests::TempDir tmp;
    tests::writeWorkspace(tmp.path, "");

    const auto result = tests::runTrellis({ "plan" }, tmp.path).unwrap();
    expect(result.status.success()) << result.err;
    expect(result.out == "1. restore\n2. build\n3. test\n4. default\n")
        << result.out;
    expect(result.err.empty()) << result.err;
  };

  "trellis plan deduplicates"_test = [] {
    const tests::TempDir tmp;
    tests::writeWorkspace(tmp.path, "");

    const auto result =
        tests::runTrellis({ "plan", "publish", "coverage", "build" }, tmp.path)
            .unwrap();
    expect(result.status.success()) << result.err;
    expect(result.out
           == "1. restore\n2. build\n3. pack\n4. publish\n5. coverage\n")
        << result.out;
  };

  "trellis plan rejects cycles"_test = [] {
    const tests::TempDir tmp;
    tests::writeWorkspace(tmp.path, R"(
[tasks.a]
depends-on = ["b"]

[tasks.b]
depends-on = ["a"]
)");

    const auto result = tests::runTrellis({ "plan", "a" }, tmp.path).unwrap();
    expect(!result.status.success());
    expect(result.err.starts_with("Error: dependency cycle detected: "))
        << result.err;
  };
}
