#pragma once

#include "Configuration.hpp"
#include "Manifest.hpp"
#include "Semver.hpp"
#include "Task/TaskGraph.hpp"
#include "Template.hpp"
#include "Workspace.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <rs/result.hpp>
#include <string>
#include <string_view>

namespace trellis {

namespace fs = std::filesystem;

struct TaskOptions {
  Configuration configuration;
  std::optional<Version> version; // overrides `workspace.version`
  std::optional<std::string> testFilter;
};

// What the standard and custom task actions share: the workspace, the run
// options, and the workspace-level placeholders.
class TaskEnv {
  const Workspace& workspace_;
  TaskOptions options_;
  PlaceholderMap placeholders_;

public:
  TaskEnv(const Workspace& workspace, TaskOptions options);

  const Workspace& workspace() const noexcept { return workspace_; }
  const TaskOptions& options() const noexcept { return options_; }
  const Version& version() const noexcept;
  const PlaceholderMap& placeholders() const noexcept { return placeholders_; }

  fs::path packageDir() const { return workspace_.artifactsDir() / "packages"; }
  fs::path coverageDir() const { return workspace_.artifactsDir() / "coverage"; }

  PlaceholderMap forProject(const Project& project) const;
  const CommandTemplate* action(std::string_view name) const noexcept;

  // Expands `tmpl` and runs it in `cwd`; with `ctx.dryRun` the command line
  // is printed instead.
  rs::Result<void> runAction(const TaskContext& ctx, const CommandTemplate& tmpl,
                             const PlaceholderMap& values,
                             const fs::path& cwd) const;
};

// clean, restore, build, test, coverage, pack, publish, and default.
rs::Result<void> registerStandardTasks(TaskGraph& graph,
                                       const std::shared_ptr<const TaskEnv>& env);
// `[tasks.<name>]` entries of the workspace manifest.
rs::Result<void> registerCustomTasks(TaskGraph& graph,
                                     const std::shared_ptr<const TaskEnv>& env);

} // namespace trellis
