#include "Manifest.hpp"

#include "Algos.hpp"
#include "Semver.hpp"
#include "Task/TaskGraph.hpp"
#include "TermColor.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <optional>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <system_error>
#include <toml.hpp>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace trellis {

// toml11 prefixes every message with `[error] `, colored when enabled.
static std::string tomlErrorMessage(const std::exception& e) {
  using std::string_view_literals::operator""sv;

  std::string what = e.what();
  static constexpr std::size_t errorPrefixSize = "[error] "sv.size();
  static constexpr std::size_t colorErrorPrefixSize =
      "\033[31m\033[01m[error]\033[00m "sv.size();

  if (what.starts_with("\033[")) {
    what = what.substr(std::min(colorErrorPrefixSize, what.size()));
  } else if (what.starts_with("[error] ")) {
    what = what.substr(errorPrefixSize);
  }
  if (!what.empty() && what.back() == '\n') {
    what.pop_back(); // remove the last '\n' since Diag::error adds one.
  }
  return what;
}

} // namespace trellis

namespace toml {

template <typename T, typename... U>
// NOLINTNEXTLINE(readability-identifier-naming,cppcoreguidelines-macro-usage)
inline rs::Result<T> try_find(const toml::value& v, const U&... u) noexcept {
  try {
    return rs::Ok(toml::find<T>(v, u...));
  } catch (const std::exception& e) {
    return rs::Err(rs::anyhow(trellis::tomlErrorMessage(e)));
  }
}

} // namespace toml

namespace trellis {

static const std::unordered_set<char> ALLOWED_CHARS = {
  '-', '_', '.', '+' // allowed in the dependency name
};

// Optional keys are absent or well-typed; a mistyped value is an error
// rather than silently falling back to the default.
template <typename T>
static rs::Result<std::optional<T>> tryFindOpt(const toml::value& val,
                                               const std::string& key) noexcept {
  if (!val.is_table() || !val.contains(key)) {
    return rs::Ok(std::optional<T>());
  }
  return rs::Ok(std::optional<T>(rs_try(toml::try_find<T>(val, key))));
}

template <typename T>
static rs::Result<std::optional<T>>
tryFindOpt(const toml::value& val, const std::string& table,
           const std::string& key) noexcept {
  if (!val.is_table() || !val.contains(table)) {
    return rs::Ok(std::optional<T>());
  }
  return tryFindOpt<T>(val.at(table), key);
}

template <typename T>
static rs::Result<T> tryFindOr(const toml::value& val, const std::string& table,
                               const std::string& key, T def) noexcept {
  std::optional<T> found = rs_try(tryFindOpt<T>(val, table, key));
  return rs::Ok(found.has_value() ? std::move(*found) : std::move(def));
}

void syncTomlColor() noexcept {
  if (shouldColorStderr()) {
    toml::color::enable();
  } else {
    toml::color::disable();
  }
}

static rs::Result<toml::value> parseTomlFile(const fs::path& path) noexcept {
  try {
    return rs::Ok(toml::parse(path));
  } catch (const std::exception& e) {
    return rs::Err(rs::anyhow(tomlErrorMessage(e)));
  }
}

rs::Result<ProjectKind> parseProjectKind(const std::string_view str) noexcept {
  if (str == "library") {
    return rs::Ok(ProjectKind::Library);
  } else if (str == "executable") {
    return rs::Ok(ProjectKind::Executable);
  } else if (str == "test") {
    return rs::Ok(ProjectKind::Test);
  }
  rs_bail("invalid project kind `{}`; expected `library`, `executable`, or "
          "`test`",
          str);
}

std::string_view toString(const ProjectKind kind) noexcept {
  switch (kind) {
  case ProjectKind::Library:
    return "library";
  case ProjectKind::Executable:
    return "executable";
  case ProjectKind::Test:
    return "test";
  }
  std::unreachable();
}

rs::Result<ProjectFilter>
parseProjectFilter(const std::string_view str) noexcept {
  if (str == "all") {
    return rs::Ok(ProjectFilter::All);
  } else if (str == "library") {
    return rs::Ok(ProjectFilter::Library);
  } else if (str == "executable") {
    return rs::Ok(ProjectFilter::Executable);
  } else if (str == "test") {
    return rs::Ok(ProjectFilter::Test);
  } else if (str == "packable") {
    return rs::Ok(ProjectFilter::Packable);
  }
  rs_bail("invalid project filter `{}`; expected one of all, library, executable, "
          "test, packable",
          str);
}

std::string_view toString(const ProjectFilter filter) noexcept {
  switch (filter) {
  case ProjectFilter::All:
    return "all";
  case ProjectFilter::Library:
    return "library";
  case ProjectFilter::Executable:
    return "executable";
  case ProjectFilter::Test:
    return "test";
  case ProjectFilter::Packable:
    return "packable";
  }
  std::unreachable();
}

rs::Result<void> validateProjectName(const std::string_view name,
                                     const std::string_view what) {
  rs_ensure(!name.empty(), "{} must not be empty", what);

  for (const char c : name) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_'
        && c != '.') {
      rs_bail("{} must only contain letters, numbers, `-`, `_`, or `.`", what);
    }
  }

  rs_ensure(std::isalpha(static_cast<unsigned char>(name.front())),
            "{} must start with a letter", what);
  rs_ensure(std::isalnum(static_cast<unsigned char>(name.back())),
            "{} must end with a letter or digit", what);
  return rs::Ok();
}

static rs::Result<void> validateDepName(const std::string_view name) noexcept {
  rs_ensure(!name.empty(), "dependency name must not be empty");
  rs_ensure(std::isalnum(static_cast<unsigned char>(name.front())),
            "dependency name must start with an alphanumeric character");
  rs_ensure(std::isalnum(static_cast<unsigned char>(name.back()))
                || name.back() == '+',
            "dependency name must end with an alphanumeric character or `+`");

  for (const char c : name) {
    if (!std::isalnum(static_cast<unsigned char>(c))
        && !ALLOWED_CHARS.contains(c)) {
      rs_bail("dependency name must be alphanumeric, `-`, `_`, `.`, or `+`");
    }
  }

  for (std::size_t i = 1; i < name.size(); ++i) {
    if (name[i] == '+') {
      // Allow consecutive `+` characters.
      continue;
    }

    if (!std::isalnum(static_cast<unsigned char>(name[i]))
        && name[i] == name[i - 1]) {
      rs_bail("dependency name must not contain consecutive non-alphanumeric "
              "characters");
    }
  }

  std::unordered_map<char, int> charsFreq;
  for (const char c : name) {
    ++charsFreq[c];
  }

  rs_ensure(charsFreq['+'] == 0 || charsFreq['+'] == 2,
            "dependency name must contain zero or two `+`");
  if (charsFreq['+'] == 2) {
    if (name.find('+') + 1 != name.rfind('+')) {
      rs_bail("`+` in the dependency name must be consecutive");
    }
  }

  return rs::Ok();
}

static rs::Result<Dependency> parseDependency(const std::string& name,
                                              const toml::value& info) noexcept {
  rs_try(validateDepName(name));

  if (info.is_string()) {
    rs_ensure(!info.as_string().empty(),
              "version of dependency `{}` must not be empty", name);
    return rs::Ok(Dependency(PackageDependency(name, info.as_string())));
  }
  if (info.is_table()) {
    const auto& table = info.as_table();
    if (table.contains("path")) {
      const auto& path = table.at("path");
      rs_ensure(path.is_string(), "path dependency must be a string");
      return rs::Ok(Dependency(PathDependency(name, path.as_string())));
    } else if (table.contains("version")) {
      const auto& version = table.at("version");
      rs_ensure(version.is_string(), "version of dependency `{}` must be a "
                                     "string",
                name);
      return rs::Ok(Dependency(PackageDependency(name, version.as_string())));
    }
  }

  rs_bail("dependency `{}` must be a version string or a table with "
          "`version` or `path`",
          name);
}

static rs::Result<std::vector<Dependency>>
parseDependencies(const toml::value& val) noexcept {
  const auto tomlDeps = toml::try_find<toml::table>(val, "dependencies");
  if (tomlDeps.is_err()) {
    spdlog::debug("[dependencies] not found or not a table");
    return rs::Ok(std::vector<Dependency>{});
  }

  std::vector<std::string> names;
  for (const auto& dep : tomlDeps.unwrap()) {
    names.push_back(dep.first);
  }
  std::ranges::sort(names);

  std::vector<Dependency> deps;
  for (const std::string& name : names) {
    deps.emplace_back(rs_try(parseDependency(name, tomlDeps.unwrap().at(name))));
  }
  return rs::Ok(std::move(deps));
}

rs::Result<ProjectManifest> ProjectManifest::tryParse(fs::path path) noexcept {
  const toml::value data = rs_try(parseTomlFile(path));
  return tryFromToml(data, std::move(path));
}

rs::Result<ProjectManifest>
ProjectManifest::tryFromToml(const toml::value& data, fs::path path) noexcept {
  ProjectManifest manifest;
  manifest.path = std::move(path);
  manifest.name = rs_try(toml::try_find<std::string>(data, "project", "name"));
  rs_try(validateProjectName(manifest.name));

  const std::optional<std::string> kind =
      rs_try(tryFindOpt<std::string>(data, "project", "kind"));
  if (kind.has_value()) {
    manifest.kind = rs_try(parseProjectKind(*kind));
  }
  manifest.packable = rs_try(tryFindOpt<bool>(data, "project", "packable"));

  manifest.dependencies = rs_try(parseDependencies(data));
  for (const Dependency& dep : manifest.dependencies) {
    rs_ensure(depName(dep) != manifest.name, "project `{}` depends on itself",
              manifest.name);
  }
  return rs::Ok(std::move(manifest));
}

static rs::Result<void> validateRelativePath(const std::string_view key,
                                             const std::string& path) {
  rs_ensure(!path.empty(), "`{}` entries must not be empty", key);
  rs_ensure(fs::path(path).is_relative(), "`{}` must be a relative path: {}",
            key, path);
  return rs::Ok();
}

// Removable directories must lie strictly below the directory they are
// relative to.
static rs::Result<void> validateNestedPath(const std::string_view key,
                                           const std::string& path) {
  rs_try(validateRelativePath(key, path));
  fs::path normal = fs::path(path).lexically_normal();
  if (!normal.has_filename()) {
    normal = normal.parent_path();
  }
  rs_ensure(!normal.empty() && normal != "." && *normal.begin() != "..",
            "`{}` must name a directory below its base: {}", key, path);
  return rs::Ok();
}

rs::Result<WorkspaceSection>
WorkspaceSection::tryFromToml(const toml::value& val) noexcept {
  WorkspaceSection ws;
  ws.name = rs_try(toml::try_find<std::string>(val, "workspace", "name"));
  rs_try(validateProjectName(ws.name, "workspace name"));
  ws.version = rs_try(Version::parse(
      rs_try(toml::try_find<std::string>(val, "workspace", "version"))));

  ws.members = rs_try(
      toml::try_find<std::vector<std::string>>(val, "workspace", "members"));
  rs_ensure(!ws.members.empty(), "`workspace.members` must not be empty");
  for (const std::string& member : ws.members) {
    rs_try(validateRelativePath("workspace.members", member));
  }
  ws.exclude = rs_try(tryFindOr<std::vector<std::string>>(
      val, "workspace", "exclude", {}));

  ws.artifacts = rs_try(
      tryFindOr<std::string>(val, "workspace", "artifacts", ws.artifacts));
  rs_try(validateNestedPath("workspace.artifacts", ws.artifacts));

  ws.defaultTask = rs_try(tryFindOr<std::string>(val, "workspace",
                                                 "default-task", ws.defaultTask));
  rs_try(validateTaskName(ws.defaultTask));

  ws.clean =
      rs_try(tryFindOr<std::vector<std::string>>(val, "workspace", "clean", {}));
  for (const std::string& dir : ws.clean) {
    rs_try(validateNestedPath("workspace.clean", dir));
  }
  return rs::Ok(std::move(ws));
}

rs::Result<PublishSection>
PublishSection::tryFromToml(const toml::value& val) noexcept {
  PublishSection publish;
  publish.feed = rs_try(tryFindOpt<std::string>(val, "publish", "feed"));
  publish.apiKeyEnv = rs_try(
      tryFindOr<std::string>(val, "publish", "api-key-env", publish.apiKeyEnv));
  rs_ensure(!publish.apiKeyEnv.empty(),
            "`publish.api-key-env` must not be empty");
  return rs::Ok(std::move(publish));
}

static rs::Result<std::map<std::string, std::string>>
parseTools(const toml::value& val) noexcept {
  std::map<std::string, std::string> tools;
  const auto table = toml::try_find<toml::table>(val, "tools");
  if (table.is_err()) {
    spdlog::debug("[tools] not found or not a table");
    return rs::Ok(std::move(tools));
  }

  for (const auto& [role, entry] : table.unwrap()) {
    rs_ensure(std::ranges::find(TOOL_ROLES, role) != TOOL_ROLES.end(),
              "unknown tool `{}` in [tools]; expected one of {}", role,
              fmt::join(TOOL_ROLES, ", "));
    rs_ensure(entry.is_string() && !entry.as_string().empty(),
              "`tools.{}` must be a non-empty string", role);
    tools.emplace(role, entry.as_string());
  }
  return rs::Ok(std::move(tools));
}

static rs::Result<std::map<std::string, CommandTemplate>>
parseActions(const toml::value& val) noexcept {
  std::map<std::string, CommandTemplate> actions;
  const auto table = toml::try_find<toml::table>(val, "actions");
  if (table.is_err()) {
    spdlog::debug("[actions] not found or not a table");
    return rs::Ok(std::move(actions));
  }

  for (const auto& entry : table.unwrap()) {
    const std::string& name = entry.first;
    if (std::ranges::find(ACTION_NAMES, name) == ACTION_NAMES.end()) {
      const std::vector<std::string_view> candidates(ACTION_NAMES.begin(),
                                                     ACTION_NAMES.end());
      if (const auto similar = findSimilarStr(name, candidates)) {
        rs_bail("unknown action `{}` in [actions]; did you mean `{}`?", name,
                *similar);
      }
      rs_bail("unknown action `{}` in [actions]", name);
    }

    CommandTemplate cmd = rs_try(
        toml::try_find<std::vector<std::string>>(val, "actions", name));
    rs_ensure(!cmd.empty() && !cmd.front().empty(),
              "`actions.{}` must name a program", name);
    actions.emplace(name, std::move(cmd));
  }
  return rs::Ok(std::move(actions));
}

static rs::Result<std::vector<CustomTask>>
parseCustomTasks(const toml::value& val) noexcept {
  static const std::unordered_set<std::string_view> knownKeys = {
    "description", "depends-on", "run", "for-each"
  };

  std::vector<CustomTask> tasks;
  const auto table = toml::try_find<toml::table>(val, "tasks");
  if (table.is_err()) {
    spdlog::debug("[tasks] not found or not a table");
    return rs::Ok(std::move(tasks));
  }

  for (const auto& [name, entry] : table.unwrap()) {
    rs_try(validateTaskName(name));
    rs_ensure(entry.is_table(), "`tasks.{}` must be a table", name);
    for (const auto& field : entry.as_table()) {
      rs_ensure(knownKeys.contains(field.first),
                "unknown key `{}` in `tasks.{}`", field.first, name);
    }

    CustomTask task;
    task.name = name;
    const std::optional<std::string> description =
        rs_try(tryFindOpt<std::string>(entry, "description"));
    task.description = description.value_or("");
    std::optional<std::vector<std::string>> dependsOn =
        rs_try(tryFindOpt<std::vector<std::string>>(entry, "depends-on"));
    if (dependsOn.has_value()) {
      task.dependsOn = std::move(*dependsOn);
    }
    task.run = rs_try(tryFindOpt<CommandTemplate>(entry, "run"));
    if (task.run.has_value()) {
      rs_ensure(!task.run->empty() && !task.run->front().empty(),
                "`tasks.{}.run` must name a program", name);
    }

    const std::optional<std::string> forEach =
        rs_try(tryFindOpt<std::string>(entry, "for-each"));
    if (forEach.has_value()) {
      rs_ensure(task.run.has_value(), "task `{}` sets `for-each` without `run`",
                name);
      task.forEach = rs_try(parseProjectFilter(*forEach));
    }
    tasks.push_back(std::move(task));
  }

  std::ranges::sort(tasks, {}, &CustomTask::name);
  return rs::Ok(std::move(tasks));
}

rs::Result<WorkspaceManifest>
WorkspaceManifest::tryParse(fs::path path, const bool findParents) noexcept {
  if (findParents) {
    path = rs_try(findPath(path.parent_path()));
  }

  std::error_code ec;
  fs::path absPath = fs::absolute(path, ec);
  rs_ensure(!ec, "failed to resolve {}: {}", path.string(), ec.message());

  syncTomlColor();
  const toml::value data = rs_try(parseTomlFile(absPath));
  return tryFromToml(data, absPath.lexically_normal());
}

rs::Result<WorkspaceManifest>
WorkspaceManifest::tryFromToml(const toml::value& data, fs::path path) noexcept {
  WorkspaceManifest manifest;
  manifest.path = std::move(path);
  manifest.workspace = rs_try(WorkspaceSection::tryFromToml(data));
  manifest.tools = rs_try(parseTools(data));
  manifest.actions = rs_try(parseActions(data));
  manifest.publish = rs_try(PublishSection::tryFromToml(data));
  manifest.tasks = rs_try(parseCustomTasks(data));
  return rs::Ok(std::move(manifest));
}

rs::Result<fs::path> WorkspaceManifest::findPath(fs::path candidateDir) noexcept {
  const fs::path origCandDir = candidateDir;
  while (true) {
    const fs::path configPath = candidateDir / FILE_NAME;
    spdlog::trace("Finding manifest: {}", configPath.string());
    if (fs::exists(configPath)) {
      return rs::Ok(configPath);
    }

    const fs::path parentPath = candidateDir.parent_path();
    if (candidateDir.has_parent_path() && parentPath != candidateDir) {
      candidateDir = parentPath;
    } else {
      break;
    }
  }

  rs_bail("could not find `{}` in `{}` or any parent directory", FILE_NAME,
          origCandDir.string());
}

} // namespace trellis

#ifdef TRELLIS_TEST

#  include <climits>
#  include <rs/tests.hpp>
#  include <toml11/fwd/literal_fwd.hpp>

// NOLINTBEGIN
using namespace trellis;
using namespace toml::literals::toml_literals;
// NOLINTEND

static void testParseKindAndFilter() {
  tests::assertTrue(parseProjectKind("library").unwrap()
                    == ProjectKind::Library);
  tests::assertTrue(parseProjectKind("test").unwrap() == ProjectKind::Test);
  tests::assertEq(parseProjectKind("Library").unwrap_err()->what(),
                  "invalid project kind `Library`; expected `library`, "
                  "`executable`, or `test`");

  tests::assertTrue(parseProjectFilter("packable").unwrap()
                    == ProjectFilter::Packable);
  tests::assertEq(parseProjectFilter("apps").unwrap_err()->what(),
                  "invalid project filter `apps`; expected one of all, library, "
                  "executable, test, packable");
  tests::assertEq(fmt::format("{}", ProjectKind::Executable), "executable");
  tests::assertEq(fmt::format("{}", ProjectFilter::All), "all");

  tests::pass();
}

static void testWorkspaceFromToml() {
  const toml::value val = R"(
    [workspace]
    name = "acme"
    version = "1.4.0-rc.1"
    members = ["libs/*", "apps/cli"]
    exclude = ["libs/legacy"]
    clean = ["bin", "obj"]

    [tools]
    build = "dotnet"

    [actions]
    compile = ["{build}", "build", "{project_dir}", "-c", "{configuration}"]

    [publish]
    feed = "https://packages.example.com"

    [tasks.lint]
    description = "Run the linter"
    depends-on = ["restore"]
    run = ["{build}", "format", "--verify-no-changes"]
    for-each = "library"

    [tasks.ci]
    depends-on = ["build", "test", "lint"]
  )"_toml;

  const auto manifest =
      WorkspaceManifest::tryFromToml(val, "/ws/trellis.toml").unwrap();
  tests::assertEq(manifest.rootDir(), fs::path("/ws"));
  tests::assertEq(manifest.workspace.name, "acme");
  tests::assertEq(manifest.workspace.version.toString(), "1.4.0-rc.1");
  tests::assertEq(manifest.workspace.members,
                  std::vector<std::string>{ "libs/*", "apps/cli" });
  tests::assertEq(manifest.workspace.exclude,
                  std::vector<std::string>{ "libs/legacy" });
  tests::assertEq(manifest.workspace.artifacts, "trellis-out");
  tests::assertEq(manifest.workspace.defaultTask, "default");
  tests::assertEq(manifest.tools.at("build"), "dotnet");
  tests::assertFalse(manifest.tools.contains("package"));
  tests::assertEq(manifest.actions.at("compile").size(), 5UL);
  tests::assertEq(*manifest.publish.feed, "https://packages.example.com");
  tests::assertEq(manifest.publish.apiKeyEnv, "TRELLIS_API_KEY");

  tests::assertEq(manifest.tasks.size(), 2UL);
  tests::assertEq(manifest.tasks[0].name, "ci");
  tests::assertFalse(manifest.tasks[0].run.has_value());
  tests::assertEq(manifest.tasks[0].dependsOn,
                  std::vector<std::string>{ "build", "test", "lint" });
  tests::assertEq(manifest.tasks[1].name, "lint");
  tests::assertEq(manifest.tasks[1].description, "Run the linter");
  tests::assertTrue(manifest.tasks[1].forEach == ProjectFilter::Library);

  tests::pass();
}

static void testWorkspaceErrors() {
  {
    const toml::value val = R"(
      [workspace]
      name = "acme"
      version = "1.4"
      members = ["libs/*"]
    )"_toml;
    tests::assertEq(
        WorkspaceSection::tryFromToml(val).unwrap_err()->what(),
        "invalid semver:\n"
        "1.4\n"
        "   ^ expected `.`");
  }
  {
    const toml::value val = R"(
      [workspace]
      name = "acme"
      version = "1.0.0"
      members = []
    )"_toml;
    tests::assertEq(WorkspaceSection::tryFromToml(val).unwrap_err()->what(),
                    "`workspace.members` must not be empty");
  }
  {
    const toml::value val = R"(
      [workspace]
      name = "acme"
      version = "1.0.0"
      members = ["libs/*"]
      artifacts = "/tmp/out"
    )"_toml;
    tests::assertEq(WorkspaceSection::tryFromToml(val).unwrap_err()->what(),
                    "`workspace.artifacts` must be a relative path: /tmp/out");
  }
  for (const std::string_view dir : { ".", "..", "./", "bin/../..", "a/.." }) {
    const toml::value val = toml::parse_str(fmt::format(R"(
      [workspace]
      name = "acme"
      version = "1.0.0"
      members = ["libs/*"]
      clean = ["bin", "{}"]
    )",
                                                        dir));
    tests::assertEq(WorkspaceSection::tryFromToml(val).unwrap_err()->what(),
                    fmt::format("`workspace.clean` must name a directory "
                                "below its base: {}",
                                dir));
  }
  {
    const toml::value val = R"(
      [workspace]
      name = "acme"
      version = "1.0.0"
      members = ["libs/*"]
      artifacts = "out/.."
    )"_toml;
    tests::assertEq(WorkspaceSection::tryFromToml(val).unwrap_err()->what(),
                    "`workspace.artifacts` must name a directory below its "
                    "base: out/..");
  }
  {
    const toml::value val = R"(
      [workspace]
      name = "-acme"
      version = "1.0.0"
      members = ["libs/*"]
    )"_toml;
    tests::assertEq(WorkspaceSection::tryFromToml(val).unwrap_err()->what(),
                    "workspace name must start with a letter");
  }
  {
    const toml::value val = R"(
      [tools]
      compiler = "gcc"
    )"_toml;
    tests::assertEq(parseTools(val).unwrap_err()->what(),
                    "unknown tool `compiler` in [tools]; expected one of "
                    "build, package, coverage");
  }
  {
    const toml::value val = R"(
      [actions]
      compiel = ["make"]
    )"_toml;
    tests::assertEq(parseActions(val).unwrap_err()->what(),
                    "unknown action `compiel` in [actions]; did you mean "
                    "`compile`?");
  }
  {
    const toml::value val = R"(
      [actions]
      test = []
    )"_toml;
    tests::assertEq(parseActions(val).unwrap_err()->what(),
                    "`actions.test` must name a program");
  }
  {
    const toml::value val = R"(
      [tasks.docs]
      for-each = "library"
    )"_toml;
    tests::assertEq(parseCustomTasks(val).unwrap_err()->what(),
                    "task `docs` sets `for-each` without `run`");
  }
  {
    const toml::value val = R"(
      [tasks.docs]
      dependencies = ["build"]
    )"_toml;
    tests::assertEq(parseCustomTasks(val).unwrap_err()->what(),
                    "unknown key `dependencies` in `tasks.docs`");
  }

  tests::pass();
}

static void testProjectFromToml() {
  {
    const toml::value val = R"(
      [project]
      name = "Acme.Core"

      [dependencies]
      "Serilog" = "3.1.1"
      acme-util = { path = "../util" }
      "Newtonsoft.Json" = { version = "13.0.3" }
    )"_toml;

    const auto manifest =
        ProjectManifest::tryFromToml(val, "/ws/libs/core/project.toml")
            .unwrap();
    tests::assertEq(manifest.name, "Acme.Core");
    tests::assertFalse(manifest.kind.has_value());
    tests::assertFalse(manifest.packable.has_value());
    tests::assertEq(manifest.dependencies.size(), 3UL);

    // Sorted by name.
    const auto& json = std::get<PackageDependency>(manifest.dependencies[0]);
    tests::assertEq(json.name, "Newtonsoft.Json");
    tests::assertEq(json.versionReq, "13.0.3");
    const auto& serilog =
        std::get<PackageDependency>(manifest.dependencies[1]);
    tests::assertEq(serilog.name, "Serilog");
    tests::assertEq(serilog.versionReq, "3.1.1");
    const auto& util = std::get<PathDependency>(manifest.dependencies[2]);
    tests::assertEq(util.name, "acme-util");
    tests::assertEq(util.path, "../util");
  }
  {
    const toml::value val = R"(
      [project]
      name = "cli"
      kind = "executable"
      packable = true
    )"_toml;

    const auto manifest =
        ProjectManifest::tryFromToml(val, "project.toml").unwrap();
    tests::assertTrue(manifest.kind == ProjectKind::Executable);
    tests::assertTrue(manifest.packable == true);
  }
  {
    const toml::value val = R"(
      [project]
      name = "cli"
      kind = "app"
    )"_toml;
    tests::assertEq(
        ProjectManifest::tryFromToml(val, "project.toml").unwrap_err()->what(),
        "invalid project kind `app`; expected `library`, `executable`, or "
        "`test`");
  }
  {
    const toml::value val = R"(
      [project]
      name = "cli"

      [dependencies]
      cli = { path = "." }
    )"_toml;
    tests::assertEq(
        ProjectManifest::tryFromToml(val, "project.toml").unwrap_err()->what(),
        "project `cli` depends on itself");
  }
  {
    const toml::value val = R"(
      [project]
      name = "cli"

      [dependencies]
      fmt = 11
    )"_toml;
    tests::assertEq(
        ProjectManifest::tryFromToml(val, "project.toml").unwrap_err()->what(),
        "dependency `fmt` must be a version string or a table with `version` "
        "or `path`");
  }

  tests::pass();
}

static void testValidateProjectName() {
  tests::assertTrue(validateProjectName("acme-core").is_ok());
  tests::assertTrue(validateProjectName("Acme.Core.Tests").is_ok());
  tests::assertEq(validateProjectName("").unwrap_err()->what(),
                  "project name must not be empty");
  tests::assertEq(validateProjectName("1core").unwrap_err()->what(),
                  "project name must start with a letter");
  tests::assertEq(validateProjectName("core-").unwrap_err()->what(),
                  "project name must end with a letter or digit");
  tests::assertEq(validateProjectName("my core").unwrap_err()->what(),
                  "project name must only contain letters, numbers, `-`, "
                  "`_`, or `.`");

  tests::pass();
}

static void testValidateDepName() {
  tests::assertEq(validateDepName("").unwrap_err()->what(),
                  "dependency name must not be empty");
  tests::assertEq(validateDepName("-").unwrap_err()->what(),
                  "dependency name must start with an alphanumeric character");
  tests::assertEq(
      validateDepName("1-").unwrap_err()->what(),
      "dependency name must end with an alphanumeric character or `+`");

  for (char c = 0; c < CHAR_MAX; ++c) {
    if (std::isalnum(c) || ALLOWED_CHARS.contains(c)) {
      continue;
    }
    tests::assertEq(
        validateDepName("1" + std::string(1, c) + "1").unwrap_err()->what(),
        "dependency name must be alphanumeric, `-`, `_`, `.`, or `+`");
  }

  tests::assertEq(validateDepName("1--1").unwrap_err()->what(),
                  "dependency name must not contain consecutive "
                  "non-alphanumeric characters");
  tests::assertTrue(validateDepName("1-1-1").is_ok());
  tests::assertTrue(validateDepName("Microsoft.Extensions.Logging").is_ok());

  tests::assertEq(validateDepName("a+").unwrap_err()->what(),
                  "dependency name must contain zero or two `+`");
  tests::assertEq(validateDepName("a+b+c").unwrap_err()->what(),
                  "`+` in the dependency name must be consecutive");
  tests::assertTrue(validateDepName("ncurses++").is_ok());

  tests::pass();
}

int main() {
  trellis::setColorMode("never");

  testParseKindAndFilter();
  testWorkspaceFromToml();
  testWorkspaceErrors();
  testProjectFromToml();
  testValidateProjectName();
  testValidateDepName();
}

#endif
