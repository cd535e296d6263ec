#include "Workspace.hpp"

#include "Diag.hpp"
#include "Manifest.hpp"
#include "Parallelism.hpp"
#include "Task/TaskGraph.hpp"

#include <algorithm>
#include <cstddef>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <optional>
#include <rs/result.hpp>
#include <set>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <system_error>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/spin_mutex.h>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace trellis {

bool Project::matches(const ProjectFilter filter) const noexcept {
  switch (filter) {
  case ProjectFilter::All:
    return true;
  case ProjectFilter::Library:
    return kind == ProjectKind::Library;
  case ProjectFilter::Executable:
    return kind == ProjectKind::Executable;
  case ProjectFilter::Test:
    return kind == ProjectKind::Test;
  case ProjectFilter::Packable:
    return packable;
  }
  std::unreachable();
}

ProjectKind classifyProject(const ProjectManifest& manifest,
                            const fs::path& relPath) noexcept {
  if (manifest.kind.has_value()) {
    return *manifest.kind;
  }

  for (const std::string_view suffix :
       { "-tests", "_tests", ".tests", "-test", ".Tests" }) {
    if (manifest.name.ends_with(suffix)) {
      return ProjectKind::Test;
    }
  }
  const std::string parentDir = relPath.parent_path().filename().string();
  if (parentDir == "tests" || parentDir == "test") {
    return ProjectKind::Test;
  }
  return ProjectKind::Library;
}

static std::string normalizeMember(const std::string_view entry) {
  std::string normalized =
      fs::path(entry).lexically_normal().generic_string();
  while (normalized.size() > 1 && normalized.back() == '/') {
    normalized.pop_back();
  }
  return normalized;
}

rs::Result<std::vector<fs::path>>
expandMembers(const fs::path& root, const std::vector<std::string>& members,
              const std::vector<std::string>& exclude) {
  std::set<std::string> excluded;
  for (const std::string& entry : exclude) {
    excluded.insert(normalizeMember(entry));
  }

  std::set<std::string> found;
  for (const std::string& entry : members) {
    if (entry == "*" || entry.ends_with("/*")) {
      const std::string base =
          entry == "*" ? "." : normalizeMember(entry.substr(0, entry.size() - 2));
      const fs::path baseDir = root / base;
      std::error_code ec;
      rs_ensure(fs::is_directory(baseDir, ec),
                "member `{}`: `{}` is not a directory", entry, base);

      std::size_t matched = 0;
      for (const auto& dirEntry : fs::directory_iterator(baseDir)) {
        if (!dirEntry.is_directory()
            || !fs::exists(dirEntry.path() / ProjectManifest::FILE_NAME)) {
          continue;
        }
        const std::string rel = normalizeMember(
            fs::relative(dirEntry.path(), root).generic_string());
        spdlog::trace("Member `{}` matched `{}`", entry, rel);
        found.insert(rel);
        ++matched;
      }
      if (matched == 0) {
        Diag::warn("member `{}` matched no projects", entry);
      }
      continue;
    }

    const std::string rel = normalizeMember(entry);
    rs_ensure(fs::exists(root / rel / ProjectManifest::FILE_NAME),
              "member `{}` has no {}", entry, ProjectManifest::FILE_NAME);
    found.insert(rel);
  }

  std::vector<fs::path> paths;
  for (const std::string& rel : found) {
    if (excluded.contains(rel)) {
      spdlog::debug("Excluding member `{}`", rel);
      continue;
    }
    paths.emplace_back(rel);
  }
  // std::set already orders by the generic string form.
  return rs::Ok(std::move(paths));
}

static rs::Result<Project> loadProject(const fs::path& root,
                                       const fs::path& relPath) {
  const fs::path manifestPath = root / relPath / ProjectManifest::FILE_NAME;
  spdlog::trace("Parsing {}", manifestPath.string());

  auto parsed = ProjectManifest::tryParse(manifestPath);
  if (parsed.is_err()) {
    rs_bail("failed to parse {}: {}",
            (relPath / ProjectManifest::FILE_NAME).generic_string(),
            parsed.unwrap_err()->what());
  }

  Project project;
  project.rootPath = (root / relPath).lexically_normal();
  project.relPath = relPath;
  project.manifest = parsed.unwrap();
  project.kind = classifyProject(project.manifest, relPath);

  if (project.manifest.packable.has_value()) {
    rs_ensure(!(*project.manifest.packable && project.kind == ProjectKind::Test),
              "test project `{}` cannot be packable", project.name());
    project.packable = *project.manifest.packable;
  } else {
    project.packable = project.kind == ProjectKind::Library;
  }
  return rs::Ok(std::move(project));
}

rs::Result<void> Workspace::loadMembers() {
  const fs::path root = rootDir();
  const std::vector<fs::path> paths = rs_try(expandMembers(
      root, manifest_.workspace.members, manifest_.workspace.exclude));

  syncTomlColor();
  if (isParallel() && paths.size() > 1) {
    std::vector<std::optional<Project>> slots(paths.size());
    std::vector<std::pair<std::size_t, std::string>> errors;
    tbb::spin_mutex mtx;
    tbb::parallel_for(
        tbb::blocked_range<std::size_t>(0, paths.size()),
        [&](const tbb::blocked_range<std::size_t>& rng) {
          for (std::size_t i = rng.begin(); i != rng.end(); ++i) {
            auto loaded = loadProject(root, paths[i]);
            if (loaded.is_ok()) {
              slots[i] = loaded.unwrap();
            } else {
              const tbb::spin_mutex::scoped_lock lock(mtx);
              errors.emplace_back(i, loaded.unwrap_err()->what());
            }
          }
        });
    if (!errors.empty()) {
      // Report what a sequential load would: the first member in order.
      std::ranges::sort(errors);
      rs_bail("{}", errors.front().second);
    }
    for (std::optional<Project>& slot : slots) {
      members_.push_back(std::move(*slot));
    }
  } else {
    for (const fs::path& path : paths) {
      members_.push_back(rs_try(loadProject(root, path)));
    }
  }

  std::unordered_map<std::string, std::size_t> names;
  for (std::size_t i = 0; i < members_.size(); ++i) {
    rs_ensure(names.emplace(members_[i].name(), i).second,
              "duplicate project name `{}`", members_[i].name());
  }
  return rs::Ok();
}

rs::Result<void> Workspace::computeBuildOrder() {
  std::unordered_map<std::string, std::size_t> byRoot;
  for (std::size_t i = 0; i < members_.size(); ++i) {
    byRoot.emplace(members_[i].rootPath.generic_string(), i);
  }

  TaskGraph graph;
  for (Project& project : members_) {
    for (const Dependency& dep : project.manifest.dependencies) {
      const auto* pathDep = std::get_if<PathDependency>(&dep);
      if (pathDep == nullptr) {
        continue;
      }

      fs::path target = (project.rootPath / pathDep->path).lexically_normal();
      if (!target.has_filename()) {
        target = target.parent_path(); // "../util/"
      }
      const auto itr = byRoot.find(target.generic_string());
      rs_ensure(itr != byRoot.end(),
                "path dependency `{}` of `{}` is not a workspace member ({})",
                pathDep->name, project.name(), pathDep->path);

      const Project& depProject = members_[itr->second];
      rs_ensure(depProject.name() == pathDep->name,
                "path dependency `{}` of `{}` points at project `{}`",
                pathDep->name, project.name(), depProject.name());
      project.memberDeps.push_back(depProject.name());
    }

    rs_try(graph.addTask(Task{ .name = project.name(),
                               .description = project.relPath.generic_string(),
                               .dependencies = project.memberDeps,
                               .action = {} }));
  }

  std::vector<std::string> targets;
  for (const Project& project : members_) {
    targets.push_back(project.name());
  }
  if (targets.empty()) {
    return rs::Ok();
  }

  const std::vector<std::string> names = rs_try(graph.resolve(targets));
  for (const std::string& name : names) {
    const auto itr =
        std::ranges::find(members_, std::string_view(name), &Project::name);
    order.push_back(static_cast<std::size_t>(itr - members_.begin()));
  }
  spdlog::debug("Build order: [{}]", fmt::join(names, ", "));
  return rs::Ok();
}

rs::Result<Workspace> Workspace::load(WorkspaceManifest manifest) {
  Workspace workspace(std::move(manifest));
  rs_try(workspace.loadMembers());
  rs_try(workspace.computeBuildOrder());
  spdlog::debug("Loaded workspace `{}` with {} member(s)",
                workspace.manifest_.workspace.name, workspace.members_.size());
  return rs::Ok(std::move(workspace));
}

std::vector<const Project*> Workspace::buildOrder() const {
  std::vector<const Project*> projects;
  projects.reserve(order.size());
  for (const std::size_t idx : order) {
    projects.push_back(&members_[idx]);
  }
  return projects;
}

std::vector<const Project*>
Workspace::membersOf(const ProjectFilter filter) const {
  std::vector<const Project*> projects;
  for (const std::size_t idx : order) {
    if (members_[idx].matches(filter)) {
      projects.push_back(&members_[idx]);
    }
  }
  return projects;
}

const Project* Workspace::find(const std::string_view name) const noexcept {
  for (const Project& project : members_) {
    if (project.name() == name) {
      return &project;
    }
  }
  return nullptr;
}

} // namespace trellis

#ifdef TRELLIS_TEST

#  include <cstdlib>
#  include <fstream>
#  include <rs/tests.hpp>
#  include <stdexcept>
#  include <unistd.h>

namespace trellis {

namespace {

class TempWorkspace {
public:
  fs::path root;

  TempWorkspace() {
    std::string tmpl =
        (fs::temp_directory_path() / "trellis-workspace-XXXXXX").string();
    const char* dir = mkdtemp(tmpl.data());
    if (dir == nullptr) {
      throw std::runtime_error("mkdtemp failed");
    }
    root = dir;
  }
  ~TempWorkspace() {
    std::error_code ec;
    fs::remove_all(root, ec);
  }
  TempWorkspace(const TempWorkspace&) = delete;
  TempWorkspace& operator=(const TempWorkspace&) = delete;

  void write(const fs::path& rel, const std::string_view content) const {
    fs::create_directories((root / rel).parent_path());
    std::ofstream ofs(root / rel);
    ofs << content;
  }

  void project(const fs::path& dir, const std::string_view name,
               const std::string_view extra = "") const {
    write(dir / ProjectManifest::FILE_NAME,
          fmt::format("[project]\nname = \"{}\"\n{}", name, extra));
  }

  rs::Result<Workspace> load(const std::string_view members,
                             const std::string_view extra = "") const {
    write(WorkspaceManifest::FILE_NAME,
          fmt::format("[workspace]\nname = \"acme\"\nversion = \"1.0.0\"\n"
                      "members = {}\n{}",
                      members, extra));
    return Workspace::load(rs_try(WorkspaceManifest::tryParse(
        root / WorkspaceManifest::FILE_NAME, /*findParents=*/false)));
  }
};

std::vector<std::string> names(const std::vector<const Project*>& projects) {
  std::vector<std::string> result;
  for (const Project* project : projects) {
    result.push_back(project->name());
  }
  return result;
}

} // namespace

using Names = std::vector<std::string>;

static void testClassifyProject() {
  const auto classify = [](std::string name, const fs::path& rel) {
    ProjectManifest manifest;
    manifest.name = std::move(name);
    return classifyProject(manifest, rel);
  };

  tests::assertTrue(classify("acme-core", "libs/core") == ProjectKind::Library);
  tests::assertTrue(classify("acme-core-tests", "x/a") == ProjectKind::Test);
  tests::assertTrue(classify("acme_tests", "x/a") == ProjectKind::Test);
  tests::assertTrue(classify("Acme.Core.Tests", "x/a") == ProjectKind::Test);
  tests::assertTrue(classify("acme-test", "x/a") == ProjectKind::Test);
  tests::assertTrue(classify("integration", "tests/integration")
                    == ProjectKind::Test);
  tests::assertTrue(classify("smoke", "test/smoke") == ProjectKind::Test);
  // Only the immediate parent directory counts.
  tests::assertTrue(classify("fixtures", "tests/data/fixtures")
                    == ProjectKind::Library);
  tests::assertTrue(classify("contest", "apps/contest")
                    == ProjectKind::Library);

  ProjectManifest explicitKind;
  explicitKind.name = "acme-tests";
  explicitKind.kind = ProjectKind::Executable;
  tests::assertTrue(classifyProject(explicitKind, "tests/acme-tests")
                    == ProjectKind::Executable);

  tests::pass();
}

static void testLoadWorkspace() {
  const TempWorkspace ws;
  ws.project("libs/core", "acme-core");
  ws.project("libs/util", "acme-util");
  ws.project("libs/legacy", "acme-legacy");
  ws.write("libs/docs/README.md", "not a project");
  ws.project("apps/cli", "acme-cli", "kind = \"executable\"\n");
  ws.project("tests/core", "core-checks");

  const Workspace workspace =
      ws.load(R"(["libs/*", "apps/cli", "tests/*"])",
              "exclude = [\"libs/legacy\"]")
          .unwrap();

  tests::assertEq(workspace.members().size(), 4UL);
  tests::assertEq(workspace.members()[0].relPath, fs::path("apps/cli"));
  tests::assertEq(workspace.members()[1].relPath, fs::path("libs/core"));
  tests::assertEq(workspace.members()[2].relPath, fs::path("libs/util"));
  tests::assertEq(workspace.members()[3].relPath, fs::path("tests/core"));

  const Project& cli = *workspace.find("acme-cli");
  tests::assertTrue(cli.kind == ProjectKind::Executable);
  tests::assertFalse(cli.packable);
  const Project& core = *workspace.find("acme-core");
  tests::assertTrue(core.kind == ProjectKind::Library);
  tests::assertTrue(core.packable);
  tests::assertTrue(workspace.find("core-checks")->kind == ProjectKind::Test);
  tests::assertTrue(workspace.find("acme-legacy") == nullptr);

  tests::assertEq(names(workspace.membersOf(ProjectFilter::Test)),
                  Names{ "core-checks" });
  tests::assertEq(names(workspace.membersOf(ProjectFilter::Packable)),
                  Names{ "acme-core", "acme-util" });

  tests::pass();
}

static void testBuildOrder() {
  const TempWorkspace ws;
  ws.project("apps/cli", "acme-cli",
             "[dependencies]\nacme-core = { path = \"../../libs/core\" }\n"
             "Serilog = \"3.1.1\"\n");
  ws.project("libs/core", "acme-core",
             "[dependencies]\nacme-util = { path = \"../util\" }\n");
  ws.project("libs/util", "acme-util");
  ws.project("tests/core", "acme-core-tests",
             "[dependencies]\nacme-core = { path = \"../../libs/core\" }\n");

  const Workspace workspace =
      ws.load(R"(["apps/*", "libs/*", "tests/*"])").unwrap();
  tests::assertEq(names(workspace.buildOrder()),
                  Names{ "acme-util", "acme-core", "acme-cli",
                         "acme-core-tests" });
  tests::assertEq(workspace.find("acme-cli")->memberDeps,
                  Names{ "acme-core" });
  tests::assertEq(names(workspace.membersOf(ProjectFilter::Library)),
                  Names{ "acme-util", "acme-core", "acme-cli" });

  tests::pass();
}

static void testParallelLoadMatchesSequential() {
  const TempWorkspace ws;
  for (int i = 0; i < 16; ++i) {
    ws.project(fmt::format("libs/lib{:02}", i), fmt::format("lib{:02}", i));
  }

  setParallelism(1);
  const Names sequential =
      names(ws.load(R"(["libs/*"])").unwrap().buildOrder());
  setParallelism(4);
  const Names parallel = names(ws.load(R"(["libs/*"])").unwrap().buildOrder());
  setParallelism(1);

  tests::assertEq(sequential.size(), 16UL);
  tests::assertEq(sequential, parallel);

  ws.write("libs/lib03/project.toml", "[project]\nkind = \"library\"\n");
  ws.write("libs/lib11/project.toml", "[project]\nkind = \"library\"\n");
  setParallelism(1);
  const std::string sequentialErr =
      ws.load(R"(["libs/*"])").unwrap_err()->what();
  setParallelism(4);
  const std::string parallelErr = ws.load(R"(["libs/*"])").unwrap_err()->what();
  setParallelism(1);

  tests::assertTrue(sequentialErr.contains("lib03"));
  tests::assertFalse(sequentialErr.contains("lib11"));
  tests::assertEq(sequentialErr, parallelErr);

  tests::pass();
}

static void testLoadErrors() {
  {
    const TempWorkspace ws;
    ws.project("libs/core", "acme-core");
    tests::assertEq(ws.load(R"(["libs/core", "apps/cli"])").unwrap_err()->what(),
                    "member `apps/cli` has no project.toml");
  }
  {
    const TempWorkspace ws;
    ws.project("libs/core", "acme-core");
    ws.project("libs/core2", "acme-core");
    tests::assertEq(ws.load(R"(["libs/*"])").unwrap_err()->what(),
                    "duplicate project name `acme-core`");
  }
  {
    const TempWorkspace ws;
    ws.project("tests/core", "core-checks", "packable = true\n");
    tests::assertEq(ws.load(R"(["tests/*"])").unwrap_err()->what(),
                    "test project `core-checks` cannot be packable");
  }
  {
    const TempWorkspace ws;
    ws.project("libs/a", "a", "[dependencies]\nb = { path = \"../b\" }\n");
    ws.project("libs/b", "b", "[dependencies]\na = { path = \"../a\" }\n");
    tests::assertEq(ws.load(R"(["libs/*"])").unwrap_err()->what(),
                    "dependency cycle detected: a -> b -> a");
  }
  {
    const TempWorkspace ws;
    ws.project("libs/a", "a", "[dependencies]\nzed = { path = \"../zed\" }\n");
    tests::assertEq(ws.load(R"(["libs/*"])").unwrap_err()->what(),
                    "path dependency `zed` of `a` is not a workspace member "
                    "(../zed)");
  }
  {
    const TempWorkspace ws;
    ws.write("libs/a/project.toml", "[project]\n");
    const std::string what = ws.load(R"(["libs/*"])").unwrap_err()->what();
    tests::assertTrue(what.starts_with("failed to parse libs/a/project.toml: "));
  }

  tests::pass();
}

} // namespace trellis

int main() {
  trellis::setColorMode("never");
  trellis::setDiagLevel(trellis::DiagLevel::Off);

  trellis::testClassifyProject();
  trellis::testLoadWorkspace();
  trellis::testBuildOrder();
  trellis::testParallelLoadMatchesSequential();
  trellis::testLoadErrors();
}

#endif
