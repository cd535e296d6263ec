#include "helpers.hpp"

#include <boost/ut.hpp>
#include <string>

static constexpr std::string_view PUBLISH_MANIFEST = R"(
[publish]
feed = "https://feed.example.com/v3/index.json"

[actions]
pack = ["sh", "-c", "touch {package_dir}/{project}.{version}.nupkg"]
publish = ["sh", "-c", "echo push {package_file} --source {feed} --api-key {api_key}"]
)";

int main() {
  using boost::ut::expect;
  using boost::ut::operator""_test;

  "trellis run publish"_test = [] {
    const tests::TempDir tmp;
    tests::writeWorkspace(tmp.path, PUBLISH_MANIFEST);

    const auto result =
        tests::runTrellis({ "run", "publish", "-v" }, tmp.path,
                          { { "TRELLIS_API_KEY", "s3cr3t" } })
            .unwrap();
    expect(result.status.success()) << result.err;

    const auto package = tmp.path / "trellis-out/packages/a.1.0.0.nupkg";
    expect(tests::fs::is_regular_file(package));
    expect(!tests::fs::exists(tmp.path
                              / "trellis-out/packages/a-tests.1.0.0.nupkg"));
    expect(result.out
           == "push " + package.string()
                  + " --source https://feed.example.com/v3/index.json "
                    "--api-key s3cr3t\n")
        << result.out;

    const auto sanitizedErr = tests::sanitizeOutput(result.err);
    expect(sanitizedErr.contains("     Packing a (libs/a)\n")) << sanitizedErr;
    expect(sanitizedErr.contains("  Publishing a.1.0.0.nupkg\n"))
        << sanitizedErr;
    expect(sanitizedErr.contains("--api-key ***")) << sanitizedErr;
    expect(!sanitizedErr.contains("s3cr3t")) << sanitizedErr;
  };

  "trellis run publish --dry-run redacts the key"_test = [] {
    const tests::TempDir tmp;
    tests::writeWorkspace(tmp.path, PUBLISH_MANIFEST);
    tests::writeFile(tmp.path / "trellis-out/packages/a.1.0.0.nupkg", "");

    const auto result =
        tests::runTrellis({ "run", "--dry-run", "publish" }, tmp.path,
                          { { "TRELLIS_API_KEY", "s3cr3t" } })
            .unwrap();
    expect(result.status.success()) << result.err;
    expect(result.out.contains("--api-key ***'\n")) << result.out;
    expect(!result.out.contains("s3cr3t")) << result.out;
    expect(!result.err.contains("s3cr3t")) << result.err;
  };

  "trellis run publish without a key"_test = [] {
    const tests::TempDir tmp;
    tests::writeWorkspace(tmp.path, PUBLISH_MANIFEST);

    const auto result =
        tests::runTrellis({ "run", "publish" }, tmp.path,
                          { { "TRELLIS_API_KEY", "" } })
            .unwrap();
    expect(!result.status.success());
    expect(result.err.ends_with(
        "Error: task `publish` failed: environment variable "
        "`TRELLIS_API_KEY` is not set; it must hold the API key for "
        "publishing\n"))
        << result.err;
  };

  "trellis run clean"_test = [] {
    const tests::TempDir tmp;
    tests::writeWorkspace(tmp.path, "clean = [\"bin\", \"obj\"]\n");
    tests::writeFile(tmp.path / "trellis-out/packages/a.1.0.0.nupkg", "");
    tests::writeFile(tmp.path / "libs/a/bin/a.dll", "");
    tests::writeFile(tmp.path / "tests/a-tests/obj/cache", "");

    const auto result = tests::runTrellis({ "run", "clean" }, tmp.path).unwrap();
    expect(result.status.success()) << result.err;
    expect(!tests::fs::exists(tmp.path / "trellis-out"));
    expect(!tests::fs::exists(tmp.path / "libs/a/bin"));
    expect(!tests::fs::exists(tmp.path / "tests/a-tests/obj"));
    expect(tests::fs::exists(tmp.path / "libs/a/project.toml"));

    const auto sanitizedErr = tests::sanitizeOutput(result.err);
    expect(sanitizedErr.contains("    Removing trellis-out\n"))
        << sanitizedErr;
    expect(sanitizedErr.contains("    Removing libs/a/bin\n"))
        << sanitizedErr;
  };
}
