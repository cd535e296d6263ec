#include "helpers.hpp"

#include <boost/ut.hpp>
#include <nlohmann/json.hpp>
#include <string>

int main() {
  using boost::ut::expect;
  using boost::ut::operator""_test;

  "trellis projects"_test = [] {
    const tests::TempDir tmp;
    tests::writeWorkspace(tmp.path, "");

    const auto result = tests::runTrellis({ "projects" }, tmp.path).unwrap();
    expect(result.status.success()) << result.err;
    const std::string expectedOut =
        "a        library     packable  libs/a\n"
        "a-tests  test                  tests/a-tests  (depends on: a, "
        "xunit)\n";
    expect(result.out == expectedOut) << result.out;
  };

  "trellis projects --json"_test = [] {
    const tests::TempDir tmp;
    tests::writeWorkspace(tmp.path, "");

    const auto result =
        tests::runTrellis({ "projects", "--json" }, tmp.path).unwrap();
    expect(result.status.success()) << result.err;

    const auto json = nlohmann::json::parse(result.out);
    expect(json.size() == 2u);
    expect(json[0]["name"] == "a");
    expect(json[0]["kind"] == "library");
    expect(json[0]["packable"] == true);
    expect(json[1]["name"] == "a-tests");
    expect(json[1]["kind"] == "test");
    expect(json[1]["path"] == "tests/a-tests");
    expect(json[1]["dependencies"][0]["path"] == "../../libs/a");
    expect(json[1]["dependencies"][1]["version"] == "2.9.0");
  };

  "trellis projects --kind"_test = [] {
    const tests::TempDir tmp;
    tests::writeWorkspace(tmp.path, "");

    const auto filtered =
        tests::runTrellis({ "projects", "--kind", "test", "--json" }, tmp.path)
            .unwrap();
    expect(filtered.status.success()) << filtered.err;
    const auto json = nlohmann::json::parse(filtered.out);
    expect(json.size() == 1u);
    expect(json[0]["name"] == "a-tests");

    const auto invalid =
        tests::runTrellis({ "projects", "--kind", "apps" }, tmp.path).unwrap();
    expect(!invalid.status.success());
    expect(invalid.err
           == "Error: invalid project filter `apps`; expected one of all, "
              "library, executable, test, packable\n")
        << invalid.err;
  };

  "trellis projects with an unknown path dependency"_test = [] {
    const tests::TempDir tmp;
    tests::writeWorkspace(tmp.path, "");
    tests::writeFile(tmp.path / "libs/b/project.toml",
                     "[project]\nname = \"b\"\n\n[dependencies]\n"
                     "c = { path = \"../c\" }\n");

    const auto result = tests::runTrellis({ "projects" }, tmp.path).unwrap();
    expect(!result.status.success());
    expect(result.err.starts_with(
        "Error: path dependency `c` of `b` is not a workspace member"))
        << result.err;
  };
}
