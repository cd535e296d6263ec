#include "Projects.hpp"

#include "Cli.hpp"
#include "Common.hpp"
#include "Dependency.hpp"
#include "Manifest.hpp"
#include "TermColor.hpp"
#include "Workspace.hpp"

#include <algorithm>
#include <cstddef>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>
#include <rs/result.hpp>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace trellis {

static rs::Result<void> projectsMain(CliArgsView args);

const Subcmd PROJECTS_CMD = //
    Subcmd{ "projects" }
        .setDesc("List the member projects of the workspace")
        .addOpt(Opt{ "--kind" }
                    .setDesc("Only list `library`, `executable`, `test`, or "
                             "`packable` projects")
                    .setPlaceholder("<KIND>")
                    .setDefault("all"))
        .addOpt(OPT_JSON)
        .setMainFn(projectsMain);

static nlohmann::json toJson(const Dependency& dep) {
  return std::visit(
      [](const auto& d) -> nlohmann::json {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, PathDependency>) {
          return { { "name", d.name }, { "path", d.path } };
        } else {
          return { { "name", d.name }, { "version", d.versionReq } };
        }
      },
      dep);
}

static void printJson(const std::vector<const Project*>& projects) {
  nlohmann::json root = nlohmann::json::array();
  for (const Project* project : projects) {
    nlohmann::json deps = nlohmann::json::array();
    for (const Dependency& dep : project->manifest.dependencies) {
      deps.push_back(toJson(dep));
    }
    root.push_back({
        { "name", project->name() },
        { "kind", toString(project->kind) },
        { "packable", project->packable },
        { "path", project->relPath.generic_string() },
        { "dependencies", std::move(deps) },
    });
  }
  fmt::print("{}\n", root.dump(2));
}

static void printText(const std::vector<const Project*>& projects) {
  std::size_t nameWidth = 0;
  std::size_t pathWidth = 0;
  for (const Project* project : projects) {
    nameWidth = std::max(nameWidth, project->name().size());
    pathWidth =
        std::max(pathWidth, project->relPath.generic_string().size());
  }

  for (const Project* project : projects) {
    std::vector<std::string_view> deps;
    for (const Dependency& dep : project->manifest.dependencies) {
      deps.push_back(depName(dep));
    }

    const std::string path = project->relPath.generic_string();
    std::string line = fmt::format(
        "{}{}  {:<10}  {:<8}  {}", Bold(Cyan(project->name())).toOutStr(),
        std::string(nameWidth - project->name().size(), ' '),
        toString(project->kind), project->packable ? "packable" : "", path);
    if (!deps.empty()) {
      line += fmt::format("{}  (depends on: {})",
                          std::string(pathWidth - path.size(), ' '),
                          fmt::join(deps, ", "));
    }
    fmt::print("{}\n", line);
  }
}

static rs::Result<void> projectsMain(const CliArgsView args) {
  bool json = false;
  ProjectFilter filter = ProjectFilter::All;
  for (auto itr = args.begin(); itr != args.end(); ++itr) {
    const std::string_view arg = *itr;

    const auto control =
        rs_try(Cli::handleGlobalOpts(itr, args.end(), "projects"));
    if (control == Cli::Return) {
      return rs::Ok();
    } else if (control == Cli::Continue) {
      continue;
    } else if (arg == "--json") {
      json = true;
    } else if (arg == "--kind") {
      if (itr + 1 == args.end()) {
        return Subcmd::missingOptArgumentFor(arg);
      }
      filter = rs_try(parseProjectFilter(*++itr));
    } else {
      return PROJECTS_CMD.noSuchArg(arg);
    }
  }

  const WorkspaceManifest manifest = rs_try(WorkspaceManifest::tryParse());
  const Workspace workspace = rs_try(Workspace::load(manifest));
  const std::vector<const Project*> projects = workspace.membersOf(filter);
  if (json) {
    printJson(projects);
  } else {
    printText(projects);
  }
  return rs::Ok();
}

} // namespace trellis
