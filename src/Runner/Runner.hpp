#pragma once

#include "Manifest.hpp"
#include "Task/TaskGraph.hpp"
#include "Tasks.hpp"
#include "Workspace.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <rs/result.hpp>
#include <string>
#include <vector>

namespace trellis {

namespace fs = std::filesystem;

struct ScheduleOptions {
  bool suppressAnalysisLog = false;
};

// Loads the workspace around `cwd` and registers its standard and custom
// tasks.
class Runner {
public:
  explicit Runner(TaskOptions options, fs::path cwd = fs::current_path());

  rs::Result<void> schedule(const ScheduleOptions& options = {});
  rs::Result<RunSummary> run(const std::vector<std::string>& targets,
                             const RunOptions& options = {}) const;
  rs::Result<std::vector<std::string>>
  plan(const std::vector<std::string>& targets) const;

  const TaskGraph& graph() const { return graph_; }
  const Workspace& workspace() const;

private:
  TaskOptions taskOptions;
  fs::path cwd;

  std::unique_ptr<Workspace> workspace_;
  std::shared_ptr<const TaskEnv> env;
  TaskGraph graph_;

  rs::Result<void> ensureScheduled() const;
};

} // namespace trellis
