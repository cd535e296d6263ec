#include "helpers.hpp"

#include <boost/ut.hpp>
#include <string>

int main() {
  using boost::ut::expect;
  using boost::ut::operator""_test;

  "trellis init"_test = [] {
    const tests::TempDir tmp;
    const auto root = tmp.path / "acme";
    tests::writeFile(root / "src/core/project.toml",
                     "[project]\nname = \"core\"\n");
    tests::writeFile(root / "tests/core-tests/project.toml",
                     "[project]\nname = \"core-tests\"\n");
    tests::writeFile(root / "trellis-out/stale/project.toml",
                     "[project]\nname = \"stale\"\n");
    tests::writeFile(root / ".cache/hidden/project.toml",
                     "[project]\nname = \"hidden\"\n");

    const auto result = tests::runTrellis({ "init" }, root).unwrap();
    expect(result.status.success()) << result.err;
    expect(result.out.empty());
    expect(result.err == "     Created workspace `acme` with 2 project(s)\n")
        << result.err;

    const std::string manifest = tests::readFile(root / "trellis.toml");
    expect(manifest.starts_with("[workspace]\n"
                                "name = \"acme\"\n"
                                "version = \"0.1.0\"\n"
                                "members = [\n"
                                "  \"src/core\",\n"
                                "  \"tests/core-tests\",\n"
                                "]\n"))
        << manifest;

    // The generated manifest loads.
    const auto projects =
        tests::runTrellis({ "projects" }, root / "src/core").unwrap();
    expect(projects.status.success()) << projects.err;
    expect(projects.out.contains("core-tests  test")) << projects.out;
  };

  "trellis init skips git-ignored directories"_test = [] {
    if (!trellis::findExecutable("git").has_value()) {
      return;
    }
    const tests::TempDir tmp;
    const auto root = tmp.path / "acme";
    tests::writeFile(root / "libs/core/project.toml",
                     "[project]\nname = \"core\"\n");
    tests::writeFile(root / "vendor/zlib/project.toml",
                     "[project]\nname = \"zlib\"\n");
    tests::writeFile(root / ".gitignore", "vendor/\n");

    trellis::Command git("git", { "init", "-q" });
    git.setWorkingDirectory(root);
    expect(git.output().unwrap().exitStatus.success());

    const auto result = tests::runTrellis({ "init" }, root).unwrap();
    expect(result.status.success()) << result.err;
    expect(result.err == "     Created workspace `acme` with 1 project(s)\n")
        << result.err;
    const std::string manifest = tests::readFile(root / "trellis.toml");
    expect(manifest.contains("members = [\n  \"libs/core\",\n]\n"))
        << manifest;
    expect(!manifest.contains("vendor")) << manifest;
  };

  "trellis init existing"_test = [] {
    const tests::TempDir tmp;
    const auto root = tmp.path / "acme";
    tests::fs::create_directories(root);

    const auto first = tests::runTrellis({ "init" }, root).unwrap();
    expect(first.status.success());
    expect(first.err
           == "Warning: no `project.toml` found below " + root.string()
                  + "\n     Created workspace `acme` with 0 project(s)\n")
        << first.err;

    const auto second = tests::runTrellis({ "init" }, root).unwrap();
    expect(!second.status.success());
    expect(second.out.empty());
    expect(second.err
           == "Error: cannot initialize an existing trellis workspace\n")
        << second.err;
  };

  "trellis init invalid name"_test = [] {
    const tests::TempDir tmp;
    const auto root = tmp.path / "1acme";
    tests::fs::create_directories(root);

    const auto result = tests::runTrellis({ "init" }, root).unwrap();
    expect(!result.status.success());
    expect(result.err == "Error: workspace name must start with a letter\n")
        << result.err;
    expect(!tests::fs::exists(root / "trellis.toml"));
  };
}
