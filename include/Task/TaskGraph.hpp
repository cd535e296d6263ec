#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <rs/result.hpp>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace trellis {

struct TaskContext {
  std::string_view taskName;
  bool dryRun = false;
};

using TaskAction = std::function<rs::Result<void>(const TaskContext&)>;

struct Task {
  std::string name;
  std::string description;
  std::vector<std::string> dependencies;
  // Empty for tasks that only group their dependencies.
  TaskAction action;

  bool isAggregate() const noexcept { return !action; }
};

struct RunOptions {
  bool dryRun = false;
  bool suppressFinishLog = false;
};

struct RunSummary {
  std::vector<std::string> executed;
  double elapsedSecs = 0.0;
};

// Named tasks with declared dependencies.  A run executes the dependency
// closure of the requested tasks in order, and every task at most once.
class TaskGraph {
public:
  rs::Result<void> addTask(Task task);
  void setDefaultTask(std::string name) { defaultTask_ = std::move(name); }

  const std::optional<std::string>& defaultTask() const noexcept {
    return defaultTask_;
  }
  bool contains(std::string_view name) const;
  const Task& at(std::string_view name) const;
  const std::vector<Task>& tasks() const noexcept { return tasks_; }
  std::size_t size() const noexcept { return tasks_.size(); }

  // Dependencies first; an empty `targets` selects the default task.
  rs::Result<std::vector<std::string>>
  resolve(const std::vector<std::string>& targets) const;
  rs::Result<void> validate() const;

  rs::Result<RunSummary> run(const std::vector<std::string>& targets,
                             const RunOptions& options = {}) const;

private:
  enum class VisitState : uint8_t { Unvisited, Visiting, Done };

  std::vector<Task> tasks_;
  std::unordered_map<std::string, std::size_t> index;
  std::optional<std::string> defaultTask_;

  rs::Result<std::size_t> findTarget(std::string_view name) const;
  rs::Result<void> visit( // NOLINT(misc-no-recursion)
      std::size_t idx, std::vector<VisitState>& states,
      std::vector<std::size_t>& path, std::vector<std::string>& order) const;
};

rs::Result<void> validateTaskName(std::string_view name);

} // namespace trellis
