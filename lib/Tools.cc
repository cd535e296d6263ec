#include "Tools.hpp"

#include "Algos.hpp"
#include "Command.hpp"

#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>

namespace trellis {

std::optional<std::string> getEnvVar(const char* name) {
  if (const char* value = std::getenv(name);
      value != nullptr && *value != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

std::string toolEnvVar(const std::string_view role) {
  return "TRELLIS_" + toMacroName(role);
}

rs::Result<fs::path>
resolveTool(const std::string_view role,
            const std::map<std::string, std::string>& configured,
            const fs::path& baseDir) {
  const std::string envVar = toolEnvVar(role);

  std::string program;
  if (auto value = getEnvVar(envVar.c_str()); value.has_value()) {
    spdlog::debug("Using {}={} for the {} tool", envVar, *value, role);
    program = std::move(*value);
  } else if (const auto itr = configured.find(std::string(role));
             itr != configured.end()) {
    program = itr->second;
  } else {
    rs_bail("no `{}` tool configured (set {} or `tools.{}`)", role, envVar,
            role);
  }

  if (program.find('/') != std::string::npos) {
    fs::path path = program;
    if (path.is_relative()) {
      path = (baseDir / path).lexically_normal();
    }
    rs_ensure(findExecutable(path.string()).has_value(),
              "tool `{}` is not an executable file (set {} to override)",
              path.string(), envVar);
    return rs::Ok(path);
  }

  const std::optional<fs::path> found = findExecutable(program);
  rs_ensure(found.has_value(), "tool `{}` not found in PATH (set {} to override)",
            program, envVar);
  spdlog::trace("Resolved the {} tool to {}", role, found->string());
  return rs::Ok(*found);
}

} // namespace trellis

#ifdef TRELLIS_TEST

#  include <rs/tests.hpp>

namespace trellis {

static void testToolEnvVar() {
  tests::assertEq(toolEnvVar("build"), "TRELLIS_BUILD");
  tests::assertEq(toolEnvVar("coverage"), "TRELLIS_COVERAGE");

  tests::pass();
}

static void testResolveTool() {
  unsetenv("TRELLIS_BUILD");
  unsetenv("TRELLIS_PACKAGE");

  const std::map<std::string, std::string> tools = {
    { "build", "sh" },
    { "package", "trellis-no-such-tool" },
    { "coverage", "./bin/cover" },
  };

  const fs::path sh = resolveTool("build", tools, "/").unwrap();
  tests::assertEq(sh.filename(), fs::path("sh"));

  tests::assertEq(resolveTool("package", tools, "/").unwrap_err()->what(),
                  "tool `trellis-no-such-tool` not found in PATH (set "
                  "TRELLIS_PACKAGE to override)");
  tests::assertEq(resolveTool("coverage", tools, "/nonexistent")
                      .unwrap_err()
                      ->what(),
                  "tool `/nonexistent/bin/cover` is not an executable file "
                  "(set TRELLIS_COVERAGE to override)");
  tests::assertEq(resolveTool("build", {}, "/").unwrap_err()->what(),
                  "no `build` tool configured (set TRELLIS_BUILD or "
                  "`tools.build`)");

  // The environment wins over the manifest.
  setenv("TRELLIS_PACKAGE", "/bin/sh", 1);
  tests::assertEq(resolveTool("package", tools, "/").unwrap(),
                  fs::path("/bin/sh"));
  setenv("TRELLIS_PACKAGE", "", 1);
  tests::assertTrue(resolveTool("package", tools, "/").is_err());
  unsetenv("TRELLIS_PACKAGE");

  tests::pass();
}

} // namespace trellis

int main() {
  trellis::testToolEnvVar();
  trellis::testResolveTool();
}

#endif
