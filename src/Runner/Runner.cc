#include "Runner/Runner.hpp"

#include "Diag.hpp"

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace trellis {

Runner::Runner(TaskOptions options, fs::path cwd)
    : taskOptions(std::move(options)), cwd(std::move(cwd)) {}

rs::Result<void> Runner::schedule(const ScheduleOptions& options) {
  WorkspaceManifest manifest =
      rs_try(WorkspaceManifest::tryParse(cwd / WorkspaceManifest::FILE_NAME));
  workspace_ = std::make_unique<Workspace>(
      rs_try(Workspace::load(std::move(manifest))));

  if (!options.suppressAnalysisLog) {
    Diag::info("Analyzing", "workspace `{}` ({} project(s))",
               workspace_->manifest().workspace.name,
               workspace_->members().size());
  }

  env = std::make_shared<const TaskEnv>(*workspace_, taskOptions);
  graph_ = TaskGraph();
  rs_try(registerStandardTasks(graph_, env));
  rs_try(registerCustomTasks(graph_, env));
  graph_.setDefaultTask(workspace_->manifest().workspace.defaultTask);
  rs_try(graph_.validate());
  return rs::Ok();
}

rs::Result<void> Runner::ensureScheduled() const {
  rs_ensure(workspace_ != nullptr, "runner.schedule() must be called first");
  return rs::Ok();
}

const Workspace& Runner::workspace() const {
  if (workspace_ == nullptr) {
    throw std::logic_error("runner.schedule() must be called first");
  }
  return *workspace_;
}

rs::Result<RunSummary> Runner::run(const std::vector<std::string>& targets,
                                   const RunOptions& options) const {
  rs_try(ensureScheduled());
  return graph_.run(targets, options);
}

rs::Result<std::vector<std::string>>
Runner::plan(const std::vector<std::string>& targets) const {
  rs_try(ensureScheduled());
  return graph_.resolve(targets);
}

} // namespace trellis
