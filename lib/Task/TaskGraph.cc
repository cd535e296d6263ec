#include "Task/TaskGraph.hpp"

#include "Algos.hpp"
#include "Diag.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <optional>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace trellis {

rs::Result<void> validateTaskName(const std::string_view name) {
  rs_ensure(!name.empty(), "invalid task name: the name is empty");
  for (const char c : name) {
    if (std::isalnum(static_cast<unsigned char>(c))
        || matchesAny(std::string_view(&c, 1), { "-", "_", ".", ":" })) {
      continue;
    }
    rs_bail("invalid task name `{}`: only alphanumerics, `-`, `_`, `.`, and "
            "`:` are allowed",
            name);
  }
  return rs::Ok();
}

rs::Result<void> TaskGraph::addTask(Task task) {
  rs_try(validateTaskName(task.name));
  rs_ensure(!index.contains(task.name), "task `{}` is already defined",
            task.name);

  std::unordered_set<std::string_view> seen;
  for (const std::string& dep : task.dependencies) {
    rs_ensure(seen.insert(dep).second,
              "task `{}` lists dependency `{}` more than once", task.name,
              dep);
  }

  spdlog::trace("Registering task `{}` (depends on [{}])", task.name,
                fmt::join(task.dependencies, ", "));
  index.emplace(task.name, tasks_.size());
  tasks_.push_back(std::move(task));
  return rs::Ok();
}

bool TaskGraph::contains(const std::string_view name) const {
  return index.contains(std::string(name));
}

const Task& TaskGraph::at(const std::string_view name) const {
  const auto itr = index.find(std::string(name));
  if (itr == index.end()) {
    throw std::out_of_range(fmt::format("no such task `{}`", name));
  }
  return tasks_[itr->second];
}

rs::Result<std::size_t>
TaskGraph::findTarget(const std::string_view name) const {
  if (const auto itr = index.find(std::string(name)); itr != index.end()) {
    return rs::Ok(itr->second);
  }

  std::vector<std::string_view> candidates;
  candidates.reserve(tasks_.size());
  for (const Task& task : tasks_) {
    candidates.emplace_back(task.name);
  }
  if (const auto similar = findSimilarStr(name, candidates)) {
    rs_bail("no such task `{}`; did you mean `{}`?", name, *similar);
  }
  rs_bail("no such task `{}`", name);
}

rs::Result<void> TaskGraph::visit( // NOLINT(misc-no-recursion)
    const std::size_t idx, std::vector<VisitState>& states,
    std::vector<std::size_t>& path, std::vector<std::string>& order) const {
  if (states[idx] == VisitState::Done) {
    return rs::Ok();
  }
  if (states[idx] == VisitState::Visiting) {
    const auto cycleStart = std::ranges::find(path, idx);
    std::vector<std::string_view> cycle;
    for (auto itr = cycleStart; itr != path.end(); ++itr) {
      cycle.emplace_back(tasks_[*itr].name);
    }
    cycle.emplace_back(tasks_[idx].name);
    rs_bail("dependency cycle detected: {}", fmt::join(cycle, " -> "));
  }

  states[idx] = VisitState::Visiting;
  path.push_back(idx);

  const Task& task = tasks_[idx];
  for (const std::string& dep : task.dependencies) {
    const auto itr = index.find(dep);
    rs_ensure(itr != index.end(), "task `{}` depends on unknown task `{}`",
              task.name, dep);
    rs_try(visit(itr->second, states, path, order));
  }

  path.pop_back();
  states[idx] = VisitState::Done;
  order.push_back(task.name);
  return rs::Ok();
}

rs::Result<std::vector<std::string>>
TaskGraph::resolve(const std::vector<std::string>& targets) const {
  std::vector<std::size_t> roots;
  if (targets.empty()) {
    rs_ensure(defaultTask_.has_value(),
              "no task given and no default task is defined");
    rs_ensure(contains(*defaultTask_), "default task `{}` is not defined",
              *defaultTask_);
    roots.push_back(index.at(*defaultTask_));
  } else {
    for (const std::string& target : targets) {
      roots.push_back(rs_try(findTarget(target)));
    }
  }

  std::vector<VisitState> states(tasks_.size(), VisitState::Unvisited);
  std::vector<std::size_t> path;
  std::vector<std::string> order;
  for (const std::size_t root : roots) {
    rs_try(visit(root, states, path, order));
  }

  spdlog::debug("Resolved [{}] to [{}]", fmt::join(targets, ", "),
                fmt::join(order, ", "));
  return rs::Ok(order);
}

rs::Result<void> TaskGraph::validate() const {
  std::vector<VisitState> states(tasks_.size(), VisitState::Unvisited);
  std::vector<std::size_t> path;
  std::vector<std::string> order;
  for (std::size_t idx = 0; idx < tasks_.size(); ++idx) {
    rs_try(visit(idx, states, path, order));
  }
  if (defaultTask_.has_value()) {
    rs_ensure(contains(*defaultTask_), "default task `{}` is not defined",
              *defaultTask_);
  }
  return rs::Ok();
}

rs::Result<RunSummary> TaskGraph::run(const std::vector<std::string>& targets,
                                      const RunOptions& options) const {
  const auto start = std::chrono::steady_clock::now();
  const std::vector<std::string> order = rs_try(resolve(targets));

  RunSummary summary;
  summary.executed.reserve(order.size());
  for (const std::string& name : order) {
    const Task& task = at(name);
    if (task.isAggregate()) {
      Diag::verbose("Skipped", "task `{}` (no action)", name);
      summary.executed.push_back(name);
      continue;
    }

    Diag::info("Running", "task `{}`", name);
    const TaskContext ctx{ .taskName = name, .dryRun = options.dryRun };
    const rs::Result<void> result = task.action(ctx);
    if (result.is_err()) {
      rs_bail("task `{}` failed: {}", name, result.unwrap_err()->what());
    }
    summary.executed.push_back(name);
  }

  const auto end = std::chrono::steady_clock::now();
  const std::chrono::duration<double> elapsed = end - start;
  summary.elapsedSecs = elapsed.count();
  if (!options.suppressFinishLog) {
    Diag::info("Finished", "{} task(s) in {:.2f}s", summary.executed.size(),
               summary.elapsedSecs);
  }
  return rs::Ok(summary);
}

} // namespace trellis

#ifdef TRELLIS_TEST

#  include <memory>
#  include <rs/tests.hpp>

namespace trellis {

using Names = std::vector<std::string>;

static Task makeTask(std::string name, Names deps = {},
                     std::shared_ptr<Names> log = nullptr) {
  Task task{ .name = name,
             .description = fmt::format("{} things", name),
             .dependencies = std::move(deps),
             .action = {} };
  if (log) {
    task.action = [log, name](const TaskContext&) -> rs::Result<void> {
      log->push_back(name);
      return rs::Ok();
    };
  }
  return task;
}

// clean; restore; build <- restore; test <- build; pack <- build, test;
// publish <- pack; default <- build, test (aggregate)
static TaskGraph makePipeline(const std::shared_ptr<Names>& log) {
  TaskGraph graph;
  graph.addTask(makeTask("clean", {}, log)).unwrap();
  graph.addTask(makeTask("restore", {}, log)).unwrap();
  graph.addTask(makeTask("build", { "restore" }, log)).unwrap();
  graph.addTask(makeTask("test", { "build" }, log)).unwrap();
  graph.addTask(makeTask("pack", { "build", "test" }, log)).unwrap();
  graph.addTask(makeTask("publish", { "pack" }, log)).unwrap();
  graph.addTask(makeTask("default", { "build", "test" })).unwrap();
  graph.setDefaultTask("default");
  return graph;
}

static void testResolveOrder() {
  const TaskGraph graph = makePipeline(std::make_shared<Names>());

  tests::assertEq(graph.resolve({ "restore" }).unwrap(), Names{ "restore" });
  tests::assertEq(graph.resolve({ "test" }).unwrap(),
                  Names{ "restore", "build", "test" });
  tests::assertEq(graph.resolve({ "publish" }).unwrap(),
                  Names{ "restore", "build", "test", "pack", "publish" });
  // Targets are visited in the given order.
  tests::assertEq(graph.resolve({ "clean", "build" }).unwrap(),
                  Names{ "clean", "restore", "build" });
  tests::assertEq(graph.resolve({ "build", "clean" }).unwrap(),
                  Names{ "restore", "build", "clean" });

  tests::pass();
}

static void testResolveDeduplicates() {
  TaskGraph graph;
  graph.addTask(makeTask("d")).unwrap();
  graph.addTask(makeTask("b", { "d" })).unwrap();
  graph.addTask(makeTask("c", { "d" })).unwrap();
  graph.addTask(makeTask("a", { "b", "c" })).unwrap();

  tests::assertEq(graph.resolve({ "a" }).unwrap(),
                  Names{ "d", "b", "c", "a" });
  tests::assertEq(graph.resolve({ "a", "a", "d" }).unwrap(),
                  Names{ "d", "b", "c", "a" });
  tests::assertEq(graph.resolve({ "c", "a" }).unwrap(),
                  Names{ "d", "c", "b", "a" });

  tests::pass();
}

static void testDefaultTask() {
  const TaskGraph graph = makePipeline(std::make_shared<Names>());
  tests::assertEq(graph.resolve({}).unwrap(),
                  Names{ "restore", "build", "test", "default" });

  TaskGraph noDefault;
  noDefault.addTask(makeTask("build")).unwrap();
  tests::assertEq(noDefault.resolve({}).unwrap_err()->what(),
                  "no task given and no default task is defined");

  noDefault.setDefaultTask("ship");
  tests::assertEq(noDefault.resolve({}).unwrap_err()->what(),
                  "default task `ship` is not defined");
  tests::assertEq(noDefault.validate().unwrap_err()->what(),
                  "default task `ship` is not defined");

  tests::pass();
}

static void testUnknownTasks() {
  const TaskGraph graph = makePipeline(std::make_shared<Names>());
  tests::assertEq(graph.resolve({ "biuld" }).unwrap_err()->what(),
                  "no such task `biuld`; did you mean `build`?");
  tests::assertEq(graph.resolve({ "deploy-to-production" }).unwrap_err()->what(),
                  "no such task `deploy-to-production`");

  TaskGraph dangling;
  dangling.addTask(makeTask("build", { "restore" })).unwrap();
  dangling.addTask(makeTask("lint")).unwrap();
  tests::assertEq(dangling.resolve({ "build" }).unwrap_err()->what(),
                  "task `build` depends on unknown task `restore`");
  // Tasks outside the closure are not inspected by resolve().
  tests::assertEq(dangling.resolve({ "lint" }).unwrap(), Names{ "lint" });
  tests::assertEq(dangling.validate().unwrap_err()->what(),
                  "task `build` depends on unknown task `restore`");

  tests::pass();
}

static void testCycles() {
  TaskGraph graph;
  graph.addTask(makeTask("a", { "b" })).unwrap();
  graph.addTask(makeTask("b", { "c" })).unwrap();
  graph.addTask(makeTask("c", { "a" })).unwrap();
  graph.addTask(makeTask("x", { "b" })).unwrap();
  graph.addTask(makeTask("self", { "self" })).unwrap();

  tests::assertEq(graph.resolve({ "a" }).unwrap_err()->what(),
                  "dependency cycle detected: a -> b -> c -> a");
  tests::assertEq(graph.resolve({ "x" }).unwrap_err()->what(),
                  "dependency cycle detected: b -> c -> a -> b");
  tests::assertEq(graph.resolve({ "self" }).unwrap_err()->what(),
                  "dependency cycle detected: self -> self");

  tests::pass();
}

static void testAddTaskErrors() {
  TaskGraph graph;
  graph.addTask(makeTask("build")).unwrap();

  tests::assertEq(graph.addTask(makeTask("build")).unwrap_err()->what(),
                  "task `build` is already defined");
  tests::assertEq(graph.addTask(makeTask("")).unwrap_err()->what(),
                  "invalid task name: the name is empty");
  tests::assertEq(graph.addTask(makeTask("run tests")).unwrap_err()->what(),
                  "invalid task name `run tests`: only alphanumerics, `-`, "
                  "`_`, `.`, and `:` are allowed");
  tests::assertEq(
      graph.addTask(makeTask("pack", { "build", "build" })).unwrap_err()->what(),
      "task `pack` lists dependency `build` more than once");
  tests::assertTrue(graph.addTask(makeTask("docs:api")).is_ok());
  tests::assertEq(graph.size(), 2UL);
  tests::assertFalse(graph.contains("pack"));

  tests::pass();
}

static void testRunExecutesEachTaskOnce() {
  const auto log = std::make_shared<Names>();
  const TaskGraph graph = makePipeline(log);

  const RunSummary summary =
      graph.run({ "test", "pack", "build" }, { .suppressFinishLog = true })
          .unwrap();
  tests::assertEq(*log, Names{ "restore", "build", "test", "pack" });
  tests::assertEq(summary.executed, *log);

  log->clear();
  graph.run({}, { .suppressFinishLog = true }).unwrap();
  tests::assertEq(*log, Names{ "restore", "build", "test" });

  // Each run is independent; shared prerequisites run again.
  log->clear();
  graph.run({ "build" }, { .suppressFinishLog = true }).unwrap();
  graph.run({ "build" }, { .suppressFinishLog = true }).unwrap();
  tests::assertEq(*log, Names{ "restore", "build", "restore", "build" });

  tests::pass();
}

static void testRunStopsAtFirstFailure() {
  const auto log = std::make_shared<Names>();
  TaskGraph graph = makePipeline(log);
  graph
      .addTask(Task{ .name = "lint",
                     .description = "fails",
                     .dependencies = { "build" },
                     .action = [log](const TaskContext& ctx) -> rs::Result<void> {
                       log->push_back(std::string(ctx.taskName));
                       rs_bail("`linter` exited with code 1");
                     } })
      .unwrap();
  graph.addTask(makeTask("ship", { "lint", "pack" }, log)).unwrap();

  tests::assertEq(
      graph.run({ "ship" }, { .suppressFinishLog = true }).unwrap_err()->what(),
      "task `lint` failed: `linter` exited with code 1");
  tests::assertEq(*log, Names{ "restore", "build", "lint" });

  tests::pass();
}

static void testDryRunContext() {
  bool sawDryRun = false;
  TaskGraph graph;
  graph
      .addTask(Task{ .name = "probe",
                     .description = "",
                     .dependencies = {},
                     .action = [&sawDryRun](const TaskContext& ctx)
                         -> rs::Result<void> {
                       sawDryRun = ctx.dryRun;
                       return rs::Ok();
                     } })
      .unwrap();

  graph.run({ "probe" }, { .dryRun = true, .suppressFinishLog = true })
      .unwrap();
  tests::assertTrue(sawDryRun);

  tests::pass();
}

} // namespace trellis

int main() {
  trellis::setColorMode("never");
  trellis::setDiagLevel(trellis::DiagLevel::Off);

  trellis::testResolveOrder();
  trellis::testResolveDeduplicates();
  trellis::testDefaultTask();
  trellis::testUnknownTasks();
  trellis::testCycles();
  trellis::testAddTaskErrors();
  trellis::testRunExecutesEachTaskOnce();
  trellis::testRunStopsAtFirstFailure();
  trellis::testDryRunContext();
}

#endif
