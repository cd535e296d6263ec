#pragma once

#include "Algos.hpp"
#include "Command.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <random>
#include <regex>
#include <rs/result.hpp>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tests {

namespace fs = std::filesystem;

inline fs::path trellisBinary() {
  if (const char* env = std::getenv("TRELLIS")) {
    return fs::path(env);
  }
  return fs::current_path() / "trellis";
}

struct RunResult {
  trellis::ExitStatus status;
  std::string out;
  std::string err;
};

inline std::string scrubDurations(std::string text) {
  static const std::regex pattern(R"(in [0-9]+\.[0-9]+s)");
  return std::regex_replace(text, pattern, "in <DURATION>s");
}

inline std::string sanitizeOutput(
    std::string text,
    std::initializer_list<std::pair<std::string_view, std::string_view>>
        replacements = {}) {
  for (const auto& [from, to] : replacements) {
    text = trellis::replaceAll(std::move(text), from, to);
  }
  return scrubDurations(std::move(text));
}

inline rs::Result<RunResult>
runTrellis(const std::vector<std::string>& args, const fs::path& workdir = {},
           const std::vector<std::pair<std::string, std::string>>& env = {}) {
  trellis::Command cmd(trellisBinary().string());
  cmd.setEnv("TRELLIS_TERM_COLOR", "never");
  cmd.setEnv("TRELLIS_TERM_VERBOSE", "");
  for (const auto& [name, value] : env) {
    cmd.setEnv(name, value);
  }
  cmd.addArgs(args);
  if (!workdir.empty()) {
    cmd.setWorkingDirectory(workdir);
  }
  cmd.setStdOutConfig(trellis::Command::IOConfig::Piped);
  cmd.setStdErrConfig(trellis::Command::IOConfig::Piped);

  const trellis::CommandOutput output = rs_try(cmd.output());
  return rs::Ok(RunResult{ output.exitStatus, output.stdOut, output.stdErr });
}

struct TempDir {
  fs::path path;

  TempDir()
      : path([] {
          const auto epoch =
              std::chrono::steady_clock::now().time_since_epoch();
          const auto ticks =
              std::chrono::duration_cast<std::chrono::nanoseconds>(epoch)
                  .count();
          const auto random =
              static_cast<std::uint64_t>(std::random_device{}());
          std::ostringstream oss;
          oss << "trellis-test-" << random << '-' << ticks;
          return fs::temp_directory_path() / oss.str();
        }()) {
    fs::create_directories(path);
  }

  ~TempDir() {
    if (path.empty()) {
      return;
    }
    std::error_code ec;
    fs::remove_all(path, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  TempDir(TempDir&& other) noexcept : path(std::move(other.path)) {
    other.path.clear();
  }

  TempDir& operator=(TempDir&& other) noexcept {
    if (this != &other) {
      path = std::move(other.path);
      other.path.clear();
    }
    return *this;
  }

  [[nodiscard]] fs::path operator/(const fs::path& relative) const {
    return path / relative;
  }
};

inline std::string readFile(const fs::path& file) {
  std::ifstream ifs(file);
  return std::string(std::istreambuf_iterator<char>(ifs), {});
}

inline void writeFile(const fs::path& file, const std::string& content) {
  fs::create_directories(file.parent_path());
  std::ofstream ofs(file);
  ofs << content;
}

// A workspace with a library `a`, its test project `a-tests`, and the
// manifest body `manifest` after the `[workspace]` table.
inline void writeWorkspace(const fs::path& root,
                           const std::string_view manifest) {
  writeFile(root / "libs/a/project.toml", "[project]\nname = \"a\"\n");
  writeFile(root / "tests/a-tests/project.toml",
            "[project]\nname = \"a-tests\"\n\n[dependencies]\n"
            "a = { path = \"../../libs/a\" }\n\"xunit\" = \"2.9.0\"\n");
  writeFile(root / "trellis.toml",
            std::string("[workspace]\nname = \"acme\"\nversion = \"1.0.0\"\n"
                        "members = [\"libs/*\", \"tests/*\"]\n")
                + std::string(manifest));
}

} // namespace tests
