#include "Tasks.hpp"

#include "Command.hpp"
#include "Diag.hpp"
#include "Manifest.hpp"
#include "Tools.hpp"
#include "Vcs.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <fmt/format.h>
#include <memory>
#include <optional>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace trellis {

TaskEnv::TaskEnv(const Workspace& workspace, TaskOptions options)
    : workspace_(workspace), options_(std::move(options)) {
  const WorkspaceManifest& manifest = workspace_.manifest();
  const fs::path root = workspace_.rootDir();

  for (const std::string_view role : TOOL_ROLES) {
    placeholders_.setLazy(
        std::string(role),
        [role, tools = manifest.tools, root]() -> rs::Result<std::string> {
          return rs::Ok(rs_try(resolveTool(role, tools, root)).string());
        });
  }

  placeholders_.set("workspace_root", root.string())
      .set("workspace_name", manifest.workspace.name)
      .set("version", version().toString())
      .set("configuration", fmt::format("{}", options_.configuration))
      .set("artifacts", workspace_.artifactsDir().string())
      .set("package_dir", packageDir().string())
      .set("coverage_dir", coverageDir().string());
  if (manifest.publish.feed.has_value()) {
    placeholders_.set("feed", *manifest.publish.feed);
  }

  auto head = std::make_shared<std::optional<CommitInfo>>();
  const auto headCommit = [head, root]() -> rs::Result<CommitInfo> {
    if (!head->has_value()) {
      *head = rs_try(readHeadCommit(root));
    }
    return rs::Ok(**head);
  };
  placeholders_
      .setLazy("commit",
               [headCommit]() -> rs::Result<std::string> {
                 return rs::Ok(rs_try(headCommit()).hash);
               })
      .setLazy("commit_short",
               [headCommit]() -> rs::Result<std::string> {
                 return rs::Ok(rs_try(headCommit()).shortHash);
               })
      .setLazy("commit_date", [headCommit]() -> rs::Result<std::string> {
        return rs::Ok(rs_try(headCommit()).date);
      });
}

const Version& TaskEnv::version() const noexcept {
  if (options_.version.has_value()) {
    return *options_.version;
  }
  return workspace_.manifest().workspace.version;
}

PlaceholderMap TaskEnv::forProject(const Project& project) const {
  PlaceholderMap values = placeholders_;
  values.set("project", project.name())
      .set("project_dir", project.rootPath.string())
      .set("project_kind", std::string(toString(project.kind)))
      .set("coverage_file",
           (coverageDir() / (project.name() + ".xml")).string());
  return values;
}

const CommandTemplate*
TaskEnv::action(const std::string_view name) const noexcept {
  const auto& actions = workspace_.manifest().actions;
  const auto itr = actions.find(std::string(name));
  return itr != actions.end() ? &itr->second : nullptr;
}

rs::Result<void> TaskEnv::runAction(const TaskContext& ctx,
                                    const CommandTemplate& tmpl,
                                    const PlaceholderMap& values,
                                    const fs::path& cwd) const {
  const std::vector<std::string> args =
      rs_try(values.expand(tmpl, ctx.taskName));
  rs_ensure(!args.front().empty(), "`{}` action expands to an empty program",
            ctx.taskName);

  Command cmd(args.front(),
              std::vector<std::string>(args.begin() + 1, args.end()));
  cmd.setWorkingDirectory(cwd);

  // Secrets are redacted per argument, before shell quoting rewrites them.
  std::vector<std::string> shown;
  shown.reserve(args.size());
  for (const std::string& arg : args) {
    shown.push_back(values.redact(arg));
  }
  const std::string display =
      Command(shown.front(),
              std::vector<std::string>(shown.begin() + 1, shown.end()))
          .toString();

  if (ctx.dryRun) {
    fmt::print("{}\n", display);
    std::fflush(stdout);
    return rs::Ok();
  }

  Diag::verbose("Executing", "{}", display);
  spdlog::debug("Working directory: {}", cwd.string());
  std::fflush(stdout);
  const Child child = rs_try(cmd.spawn());
  const ExitStatus status = rs_try(child.wait());
  rs_ensure(status.success(), "`{}` {}", display, status);
  return rs::Ok();
}

namespace {

std::string_view progressHeader(const std::string_view action) noexcept {
  if (action == "restore") {
    return "Restoring";
  } else if (action == "compile") {
    return "Compiling";
  } else if (action == "test") {
    return "Testing";
  } else if (action == "coverage") {
    return "Covering";
  } else if (action == "pack") {
    return "Packing";
  }
  return "Executing";
}

std::string relativeTo(const fs::path& root, const fs::path& path) {
  return path.lexically_normal().lexically_relative(root).generic_string();
}

bool isInside(const fs::path& root, const fs::path& path) {
  const fs::path rel =
      path.lexically_normal().lexically_relative(root.lexically_normal());
  return !rel.empty() && rel != "." && !rel.native().starts_with("..");
}

rs::Result<void> runForProjects(const TaskEnv& env, const TaskContext& ctx,
                                const std::string_view actionName,
                                const std::vector<const Project*>& projects) {
  const CommandTemplate* tmpl = env.action(actionName);
  if (tmpl == nullptr) {
    Diag::warn("no `{}` action configured; skipping", actionName);
    return rs::Ok();
  }

  for (const Project* project : projects) {
    Diag::info(progressHeader(actionName), "{} ({})", project->name(),
               project->relPath.generic_string());
    rs_try(env.runAction(ctx, *tmpl, env.forProject(*project),
                         project->rootPath));
  }
  return rs::Ok();
}

rs::Result<void> ensureDir(const fs::path& dir, const TaskContext& ctx) {
  if (ctx.dryRun) {
    return rs::Ok();
  }
  std::error_code ec;
  fs::create_directories(dir, ec);
  rs_ensure(!ec, "failed to create {}: {}", dir.string(), ec.message());
  return rs::Ok();
}

std::vector<const Project*> selectTests(const TaskEnv& env,
                                        std::size_t& filteredOut) {
  std::vector<const Project*> selected;
  const std::optional<std::string>& filter = env.options().testFilter;
  for (const Project* project :
       env.workspace().membersOf(ProjectFilter::Test)) {
    if (filter.has_value() && !project->name().contains(*filter)) {
      ++filteredOut;
      continue;
    }
    selected.push_back(project);
  }
  return selected;
}

rs::Result<void> cleanAction(const TaskEnv& env, const TaskContext& ctx) {
  const Workspace& workspace = env.workspace();
  const fs::path root = workspace.rootDir();

  std::vector<fs::path> targets{ workspace.artifactsDir().lexically_normal() };
  for (const Project& project : workspace.members()) {
    for (const std::string& dir : workspace.manifest().workspace.clean) {
      targets.push_back((project.rootPath / dir).lexically_normal());
    }
  }
  // Nothing is removed unless every target is safe.
  for (const fs::path& target : targets) {
    rs_ensure(isInside(root, target),
              "refusing to remove `{}`: outside the workspace root",
              target.string());
  }

  for (const fs::path& target : targets) {
    std::error_code ec;
    if (!fs::exists(target, ec)) {
      continue;
    }
    const std::string rel = relativeTo(root, target);
    if (ctx.dryRun) {
      fmt::print("rm -rf {}\n", rel);
      continue;
    }

    Diag::info("Removing", "{}", rel);
    fs::remove_all(target, ec);
    rs_ensure(!ec, "failed to remove {}: {}", rel, ec.message());
  }
  return rs::Ok();
}

rs::Result<void> restoreAction(const TaskEnv& env, const TaskContext& ctx) {
  return runForProjects(env, ctx, "restore", env.workspace().buildOrder());
}

rs::Result<void> buildAction(const TaskEnv& env, const TaskContext& ctx) {
  return runForProjects(env, ctx, "compile", env.workspace().buildOrder());
}

rs::Result<void> testAction(const TaskEnv& env, const TaskContext& ctx) {
  const CommandTemplate* tmpl = env.action("test");
  if (tmpl == nullptr) {
    Diag::warn("no `test` action configured; skipping");
    return rs::Ok();
  }

  const auto start = std::chrono::steady_clock::now();
  std::size_t numPassed = 0;
  std::size_t numFilteredOut = 0;
  std::vector<std::string> failed;

  for (const Project* project : selectTests(env, numFilteredOut)) {
    Diag::info("Testing", "{} ({})", project->name(),
               project->relPath.generic_string());
    const rs::Result<void> result = env.runAction(
        ctx, *tmpl, env.forProject(*project), project->rootPath);
    if (result.is_ok()) {
      ++numPassed;
    } else {
      Diag::warn("test project `{}` failed: {}", project->name(),
                 result.unwrap_err()->what());
      failed.push_back(project->name());
    }
  }

  const auto end = std::chrono::steady_clock::now();
  const std::chrono::duration<double> elapsed = end - start;
  const std::string summary =
      fmt::format("{} passed; {} failed; {} filtered out; finished in {:.2f}s",
                  numPassed, failed.size(), numFilteredOut, elapsed.count());
  if (!failed.empty()) {
    return rs::Err(rs::anyhow(summary));
  }
  Diag::info("Ok", "{}", summary);
  return rs::Ok();
}

rs::Result<void> coverageAction(const TaskEnv& env, const TaskContext& ctx) {
  const CommandTemplate* tmpl = env.action("coverage");
  if (tmpl == nullptr) {
    Diag::warn("no `coverage` action configured; skipping");
    return rs::Ok();
  }
  rs_try(ensureDir(env.coverageDir(), ctx));

  std::size_t numFilteredOut = 0;
  const fs::path root = env.workspace().rootDir();
  for (const Project* project : selectTests(env, numFilteredOut)) {
    Diag::info("Covering", "{} ({})", project->name(),
               project->relPath.generic_string());
    rs_try(env.runAction(ctx, *tmpl, env.forProject(*project),
                         project->rootPath));

    const fs::path report = env.coverageDir() / (project->name() + ".xml");
    if (!ctx.dryRun && !fs::exists(report)) {
      Diag::warn("no coverage report for `{}` at {}", project->name(),
                 relativeTo(root, report));
    }
  }
  return rs::Ok();
}

rs::Result<void> packAction(const TaskEnv& env, const TaskContext& ctx) {
  if (env.action("pack") != nullptr) {
    rs_try(ensureDir(env.packageDir(), ctx));
  }
  return runForProjects(env, ctx, "pack",
                        env.workspace().membersOf(ProjectFilter::Packable));
}

rs::Result<void> publishAction(const TaskEnv& env, const TaskContext& ctx) {
  const CommandTemplate* tmpl = env.action("publish");
  if (tmpl == nullptr) {
    Diag::warn("no `publish` action configured; skipping");
    return rs::Ok();
  }

  const std::string& keyEnv = env.workspace().manifest().publish.apiKeyEnv;
  const std::optional<std::string> apiKey = getEnvVar(keyEnv.c_str());
  rs_ensure(apiKey.has_value() || ctx.dryRun,
            "environment variable `{}` is not set; it must hold the API key "
            "for publishing",
            keyEnv);

  const fs::path root = env.workspace().rootDir();
  const fs::path packageDir = env.packageDir();
  std::vector<fs::path> packages;
  std::error_code ec;
  if (fs::is_directory(packageDir, ec)) {
    for (const auto& entry : fs::directory_iterator(packageDir)) {
      if (entry.is_regular_file()) {
        packages.push_back(entry.path());
      }
    }
  }
  std::ranges::sort(packages);

  if (packages.empty()) {
    if (ctx.dryRun) {
      Diag::warn("no packages to publish in `{}`",
                 relativeTo(root, packageDir));
      return rs::Ok();
    }
    rs_bail("no packages to publish in `{}`", relativeTo(root, packageDir));
  }

  for (const fs::path& package : packages) {
    PlaceholderMap values = env.placeholders();
    values.set("package_file", package.string());
    if (apiKey.has_value()) {
      values.setSecret("api_key", *apiKey);
    } else {
      values.set("api_key", "***");
    }

    Diag::info("Publishing", "{}", package.filename().string());
    rs_try(env.runAction(ctx, *tmpl, values, root));
  }
  return rs::Ok();
}

using ActionFn = rs::Result<void> (*)(const TaskEnv&, const TaskContext&);

TaskAction bindAction(const std::shared_ptr<const TaskEnv>& env,
                      const ActionFn fn) {
  return [env, fn](const TaskContext& ctx) { return fn(*env, ctx); };
}

} // namespace

rs::Result<void>
registerStandardTasks(TaskGraph& graph,
                      const std::shared_ptr<const TaskEnv>& env) {
  std::vector<Task> tasks;
  tasks.push_back({ .name = "clean",
                    .description =
                        "Remove the artifacts directory and build outputs",
                    .dependencies = {},
                    .action = bindAction(env, cleanAction) });
  tasks.push_back({ .name = "restore",
                    .description = "Restore the dependencies of every project",
                    .dependencies = {},
                    .action = bindAction(env, restoreAction) });
  tasks.push_back({ .name = "build",
                    .description = "Compile every project in dependency order",
                    .dependencies = { "restore" },
                    .action = bindAction(env, buildAction) });
  tasks.push_back({ .name = "test",
                    .description = "Run the test projects",
                    .dependencies = { "build" },
                    .action = bindAction(env, testAction) });
  tasks.push_back({ .name = "coverage",
                    .description = "Collect code coverage from the test "
                                   "projects",
                    .dependencies = { "build" },
                    .action = bindAction(env, coverageAction) });
  tasks.push_back({ .name = "pack",
                    .description = "Create packages of the packable projects",
                    .dependencies = { "build" },
                    .action = bindAction(env, packAction) });
  tasks.push_back({ .name = "publish",
                    .description = "Push the packages to the feed",
                    .dependencies = { "pack" },
                    .action = bindAction(env, publishAction) });

  const auto& custom = env->workspace().manifest().tasks;
  const bool customDefault = std::ranges::any_of(
      custom, [](const CustomTask& task) { return task.name == "default"; });
  if (!customDefault) {
    tasks.push_back({ .name = "default",
                      .description = "Build and test the workspace",
                      .dependencies = { "build", "test" },
                      .action = {} });
  }

  for (Task& task : tasks) {
    rs_try(graph.addTask(std::move(task)));
  }
  return rs::Ok();
}

rs::Result<void>
registerCustomTasks(TaskGraph& graph,
                    const std::shared_ptr<const TaskEnv>& env) {
  for (const CustomTask& custom : env->workspace().manifest().tasks) {
    Task task{ .name = custom.name,
               .description = custom.description,
               .dependencies = custom.dependsOn,
               .action = {} };

    if (custom.run.has_value()) {
      task.action = [env, run = *custom.run, forEach = custom.forEach](
                        const TaskContext& ctx) -> rs::Result<void> {
        const Workspace& workspace = env->workspace();
        if (!forEach.has_value()) {
          return env->runAction(ctx, run, env->placeholders(),
                                workspace.rootDir());
        }
        for (const Project* project : workspace.membersOf(*forEach)) {
          Diag::info("Executing", "{} ({})", project->name(),
                     project->relPath.generic_string());
          rs_try(env->runAction(ctx, run, env->forProject(*project),
                                project->rootPath));
        }
        return rs::Ok();
      };
    }
    rs_try(graph.addTask(std::move(task)));
  }
  return rs::Ok();
}

} // namespace trellis

#ifdef TRELLIS_TEST

#  include <cstdlib>
#  include <fmt/ranges.h>
#  include <fstream>
#  include <rs/tests.hpp>
#  include <sstream>
#  include <stdexcept>

namespace trellis {

namespace {

class Fixture {
public:
  fs::path root;

  explicit Fixture(const std::string_view extraManifest) {
    std::string tmpl =
        (fs::temp_directory_path() / "trellis-tasks-XXXXXX").string();
    if (mkdtemp(tmpl.data()) == nullptr) {
      throw std::runtime_error("mkdtemp failed");
    }
    root = tmpl;

    write("libs/a/project.toml", "[project]\nname = \"a\"\n");
    write("tests/a-tests/project.toml",
          "[project]\nname = \"a-tests\"\n\n[dependencies]\n"
          "a = { path = \"../../libs/a\" }\n");
    write("tests/b-tests/project.toml", "[project]\nname = \"b-tests\"\n");
    write("trellis.toml",
          fmt::format("[workspace]\nname = \"acme\"\nversion = \"1.2.0\"\n"
                      "members = [\"libs/*\", \"tests/*\"]\n{}",
                      extraManifest));
  }
  ~Fixture() {
    std::error_code ec;
    fs::remove_all(root, ec);
  }
  Fixture(const Fixture&) = delete;
  Fixture& operator=(const Fixture&) = delete;

  void write(const fs::path& rel, const std::string_view content) const {
    fs::create_directories((root / rel).parent_path());
    std::ofstream ofs(root / rel);
    ofs << content;
  }

  std::string log() const {
    std::ifstream ifs(root / "log.txt");
    std::stringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
  }

  // Workspace and TaskEnv must outlive the graph's actions.
  struct Loaded {
    std::unique_ptr<Workspace> workspace;
    std::shared_ptr<const TaskEnv> env;
    TaskGraph graph;
  };

  Loaded load(TaskOptions options = {}) const {
    Loaded loaded;
    loaded.workspace = std::make_unique<Workspace>(
        Workspace::load(WorkspaceManifest::tryParse(root / "trellis.toml",
                                                    /*findParents=*/false)
                            .unwrap())
            .unwrap());
    loaded.env = std::make_shared<const TaskEnv>(*loaded.workspace,
                                                 std::move(options));
    registerStandardTasks(loaded.graph, loaded.env).unwrap();
    registerCustomTasks(loaded.graph, loaded.env).unwrap();
    loaded.graph.setDefaultTask("default");
    return loaded;
  }
};

constexpr RunOptions QUIET{ .dryRun = false, .suppressFinishLog = true };
constexpr RunOptions DRY_RUN{ .dryRun = true, .suppressFinishLog = true };

constexpr std::string_view ACTIONS = R"(
[actions]
restore = ["sh", "-c", "echo restore {project} >> {workspace_root}/log.txt"]
compile = ["sh", "-c", "echo compile {project} {configuration} >> {workspace_root}/log.txt"]
test = ["sh", "-c", "echo test {project} >> {workspace_root}/log.txt; test {project} != b-tests"]
)";

} // namespace

static void testBuildRunsInDependencyOrder() {
  const Fixture fixture(ACTIONS);
  const auto loaded = fixture.load();

  const RunSummary summary = loaded.graph.run({ "build" }, QUIET).unwrap();
  tests::assertEq(summary.executed,
                  std::vector<std::string>{ "restore", "build" });
  tests::assertEq(fixture.log(), "restore a\n"
                                 "restore a-tests\n"
                                 "restore b-tests\n"
                                 "compile a debug\n"
                                 "compile a-tests debug\n"
                                 "compile b-tests debug\n");

  tests::pass();
}

static void testTestRunsEveryProject() {
  const Fixture fixture(ACTIONS);
  const auto loaded = fixture.load({ .configuration = Configuration::Release,
                                     .version = std::nullopt,
                                     .testFilter = std::nullopt });

  const std::string what =
      loaded.graph.run({}, QUIET).unwrap_err()->what();
  tests::assertTrue(what.starts_with(
      "task `test` failed: 1 passed; 1 failed; 0 filtered out; finished in "));
  const std::string log = fixture.log();
  tests::assertTrue(log.contains("compile a release\n"));
  tests::assertTrue(log.contains("test a-tests\n"));
  tests::assertTrue(log.contains("test b-tests\n"));

  tests::pass();
}

static void testTestFilter() {
  const Fixture fixture(ACTIONS);
  const auto loaded = fixture.load({ .configuration = {},
                                     .version = std::nullopt,
                                     .testFilter = "a-" });

  loaded.graph.run({ "test" }, QUIET).unwrap();
  tests::assertTrue(fixture.log().contains("test a-tests\n"));
  tests::assertFalse(fixture.log().contains("test b-tests\n"));

  tests::pass();
}

static void testDryRunSpawnsNothing() {
  const Fixture fixture(ACTIONS);
  const auto loaded = fixture.load();

  const RunSummary summary = loaded.graph.run({}, DRY_RUN).unwrap();
  tests::assertEq(summary.executed,
                  std::vector<std::string>{ "restore", "build", "test",
                                            "default" });
  tests::assertFalse(fs::exists(fixture.root / "log.txt"));

  tests::pass();
}

static void testUnconfiguredActionsAreSkipped() {
  const Fixture fixture("");
  const auto loaded = fixture.load();

  const RunSummary summary =
      loaded.graph.run({ "coverage", "pack" }, QUIET).unwrap();
  tests::assertEq(summary.executed,
                  std::vector<std::string>{ "restore", "build", "coverage",
                                            "pack" });
  tests::assertFalse(fs::exists(fixture.root / "trellis-out"));

  tests::pass();
}

static void testPlaceholders() {
  const Fixture fixture("[publish]\nfeed = \"https://feed.example.com\"\n");
  const auto loaded =
      fixture.load({ .configuration = Configuration::fromString("profiling"),
                     .version = Version::parse("2.0.0-rc.1").unwrap(),
                     .testFilter = std::nullopt });

  const PlaceholderMap values =
      loaded.env->forProject(*loaded.workspace->find("a-tests"));
  const auto expand = [&](const std::string_view text) {
    return values.expand(text, "test").unwrap();
  };
  tests::assertEq(expand("{workspace_name}@{version}"), "acme@2.0.0-rc.1");
  tests::assertEq(expand("{configuration}"), "profiling");
  tests::assertEq(expand("{project}:{project_kind}"), "a-tests:test");
  tests::assertEq(expand("{project_dir}"),
                  (fixture.root / "tests/a-tests").string());
  tests::assertEq(expand("{coverage_file}"),
                  (fixture.root / "trellis-out/coverage/a-tests.xml").string());
  tests::assertEq(expand("{package_dir}"),
                  (fixture.root / "trellis-out/packages").string());
  tests::assertEq(expand("{feed}"), "https://feed.example.com");
  tests::assertEq(values.expand("{package_file}", "test").unwrap_err()->what(),
                  "unknown placeholder `{package_file}` in `test` action");

  tests::pass();
}

static void testCommitPlaceholders() {
  if (!findExecutable("git").has_value()) {
    tests::pass();
    return;
  }

  const Fixture fixture("");
  const auto git = [&](std::vector<std::string> args) {
    Command cmd("git", std::move(args));
    cmd.setWorkingDirectory(fixture.root)
        .setEnv("GIT_AUTHOR_NAME", "trellis")
        .setEnv("GIT_AUTHOR_EMAIL", "trellis@example.com")
        .setEnv("GIT_AUTHOR_DATE", "2024-03-05T12:00:00Z")
        .setEnv("GIT_COMMITTER_NAME", "trellis")
        .setEnv("GIT_COMMITTER_EMAIL", "trellis@example.com")
        .setEnv("GIT_COMMITTER_DATE", "2024-03-05T12:00:00Z");
    const CommandOutput output = cmd.output().unwrap();
    if (!output.exitStatus.success()) {
      throw std::runtime_error("git failed: " + output.stdErr);
    }
    return output.stdOut;
  };
  git({ "init", "-q" });
  git({ "-c", "commit.gpgsign=false", "commit", "-q", "--allow-empty", "-m",
        "init" });
  std::string head = git({ "rev-parse", "HEAD" });
  head.pop_back();

  const auto loaded = fixture.load();
  const PlaceholderMap& values = loaded.env->placeholders();
  tests::assertEq(values.expand("{commit}", "stamp").unwrap(), head);
  tests::assertEq(values.expand("{commit_short}@{commit_date}", "stamp").unwrap(),
                  head.substr(0, 7) + "@2024-03-05");

  tests::pass();
}

static void testCoverage() {
  const Fixture fixture(R"(
[actions]
coverage = ["sh", "-c", "test {project} = b-tests || touch {coverage_file}"]
)");
  const auto loaded = fixture.load();

  loaded.graph.run({ "coverage" }, QUIET).unwrap();
  tests::assertTrue(
      fs::exists(fixture.root / "trellis-out/coverage/a-tests.xml"));
  tests::assertFalse(
      fs::exists(fixture.root / "trellis-out/coverage/b-tests.xml"));

  tests::pass();
}

static void testCleanStaysInsideWorkspace() {
  {
    const Fixture fixture("clean = [\"bin\"]\n");
    fixture.write("trellis-out/packages/a.nupkg", "");
    fixture.write("libs/a/bin/a.dll", "");
    const auto loaded = fixture.load();

    loaded.graph.run({ "clean" }, QUIET).unwrap();
    tests::assertFalse(fs::exists(fixture.root / "trellis-out"));
    tests::assertFalse(fs::exists(fixture.root / "libs/a/bin"));
    tests::assertTrue(fs::exists(fixture.root / "libs/a/project.toml"));
  }
  for (const std::string_view dir : { "../../../outside", "..", "." }) {
    const Fixture fixture(fmt::format("clean = [\"{}\"]\n", dir));
    const auto parsed = WorkspaceManifest::tryParse(
        fixture.root / "trellis.toml", /*findParents=*/false);
    tests::assertEq(parsed.unwrap_err()->what(),
                    fmt::format("`workspace.clean` must name a directory "
                                "below its base: {}",
                                dir));
    tests::assertTrue(fs::exists(fixture.root / "libs/a/project.toml"));
  }

  tests::pass();
}

static void testPublish() {
  const Fixture fixture(R"(
[publish]
feed = "https://feed.example.com"
api-key-env = "TRELLIS_TEST_API_KEY"

[actions]
publish = ["sh", "-c", "echo push {package_file} {feed} {api_key} >> {workspace_root}/log.txt"]
)");
  const auto loaded = fixture.load();

  unsetenv("TRELLIS_TEST_API_KEY");
  tests::assertEq(loaded.graph.run({ "publish" }, QUIET).unwrap_err()->what(),
                  "task `publish` failed: environment variable "
                  "`TRELLIS_TEST_API_KEY` is not set; it must hold the API "
                  "key for publishing");
  // A dry run needs neither the key nor packages.
  tests::assertTrue(loaded.graph.run({ "publish" }, DRY_RUN).is_ok());

  setenv("TRELLIS_TEST_API_KEY", "s3cr3t", 1);
  tests::assertEq(loaded.graph.run({ "publish" }, QUIET).unwrap_err()->what(),
                  "task `publish` failed: no packages to publish in "
                  "`trellis-out/packages`");

  fixture.write("trellis-out/packages/a.1.2.0.nupkg", "");
  loaded.graph.run({ "publish" }, QUIET).unwrap();
  tests::assertEq(fixture.log(),
                  fmt::format("push {} https://feed.example.com s3cr3t\n",
                              (fixture.root / "trellis-out/packages/"
                                              "a.1.2.0.nupkg")
                                  .string()));
  unsetenv("TRELLIS_TEST_API_KEY");

  tests::pass();
}

static void testApiKeyIsRedacted() {
  const Fixture fixture(R"(
[publish]
api-key-env = "TRELLIS_TEST_API_KEY"

[actions]
publish = ["sh", "-c", "exit 1", "sh", "--api-key={api_key}"]
)");
  fixture.write("trellis-out/packages/a.1.2.0.nupkg", "");
  const auto loaded = fixture.load();

  setenv("TRELLIS_TEST_API_KEY", "ab'cd", 1);
  const std::string what =
      loaded.graph.run({ "publish" }, QUIET).unwrap_err()->what();
  tests::assertEq(what, "task `publish` failed: `sh -c 'exit 1' sh "
                        "--api-key=***` exited with code 1");
  tests::assertFalse(what.contains("ab"));
  tests::assertFalse(what.contains("cd"));
  unsetenv("TRELLIS_TEST_API_KEY");

  tests::pass();
}

static void testCustomTasks() {
  const Fixture fixture(R"(
[tasks.lint]
description = "Lint the libraries"
depends-on = ["restore"]
run = ["sh", "-c", "echo lint {project} >> {workspace_root}/log.txt"]
for-each = "library"

[tasks.ci]
description = "Everything CI runs"
depends-on = ["lint", "build"]

[tasks.stamp]
run = ["sh", "-c", "echo stamp {version} >> {workspace_root}/log.txt"]
)");
  const auto loaded = fixture.load();

  tests::assertEq(loaded.graph.resolve({ "ci" }).unwrap(),
                  std::vector<std::string>{ "restore", "lint", "build", "ci" });
  loaded.graph.run({ "ci", "stamp" }, QUIET).unwrap();
  tests::assertEq(fixture.log(), "lint a\nstamp 1.2.0\n");
  tests::assertEq(loaded.graph.at("ci").description, "Everything CI runs");
  tests::assertTrue(loaded.graph.at("ci").isAggregate());

  tests::pass();
}

static void testCustomDefaultReplacesStandard() {
  const Fixture fixture("[tasks.default]\ndepends-on = [\"build\"]\n");
  const auto loaded = fixture.load();

  tests::assertEq(loaded.graph.resolve({}).unwrap(),
                  std::vector<std::string>{ "restore", "build", "default" });

  const Fixture clash("[tasks.build]\nrun = [\"make\"]\n");
  Fixture::Loaded partial;
  partial.workspace = std::make_unique<Workspace>(
      Workspace::load(WorkspaceManifest::tryParse(clash.root / "trellis.toml",
                                                  /*findParents=*/false)
                          .unwrap())
          .unwrap());
  partial.env = std::make_shared<const TaskEnv>(*partial.workspace,
                                                TaskOptions{});
  registerStandardTasks(partial.graph, partial.env).unwrap();
  tests::assertEq(
      registerCustomTasks(partial.graph, partial.env).unwrap_err()->what(),
      "task `build` is already defined");

  tests::pass();
}

static void testFailingCommand() {
  const Fixture fixture(R"(
[actions]
compile = ["sh", "-c", "exit 3"]
)");
  const auto loaded = fixture.load();

  tests::assertEq(loaded.graph.run({ "build" }, QUIET).unwrap_err()->what(),
                  "task `build` failed: `sh -c 'exit 3'` exited with code 3");

  tests::pass();
}

} // namespace trellis

int main() {
  trellis::setColorMode("never");
  trellis::setDiagLevel(trellis::DiagLevel::Off);

  trellis::testBuildRunsInDependencyOrder();
  trellis::testTestRunsEveryProject();
  trellis::testTestFilter();
  trellis::testDryRunSpawnsNothing();
  trellis::testUnconfiguredActionsAreSkipped();
  trellis::testPlaceholders();
  trellis::testCommitPlaceholders();
  trellis::testCoverage();
  trellis::testCleanStaysInsideWorkspace();
  trellis::testPublish();
  trellis::testApiKeyIsRedacted();
  trellis::testCustomTasks();
  trellis::testCustomDefaultReplacesStandard();
  trellis::testFailingCommand();
}

#endif
