// Implementation file for executor.hpp

#include <agentflow/executor.hpp>
#include <agentflow/errors.hpp>
#include <spdlog/spdlog.h>
#include <exception>
#include <unordered_map>

namespace agentflow {

namespace {
// Condition-task return value that schedules no successor
constexpr int kStop = -1;
}  // namespace

// ============================================================================
// Run: state owned by one execution of the graph
// ============================================================================

class Executor::Run {
 public:
  Run(const Graph& graph, State initial, const StepObserver& observer,
      const CancellationToken& token, const ExecutorOptions& options)
      : graph_(graph), state_(std::move(initial)), observer_(observer),
        token_(token), options_(options) {}

  // Executes one node; returns the successor index to schedule, or kStop
  int step(const NodeDef& node);

  // Rethrows the stored failure, if any
  RunResult finish();

 private:
  const Graph& graph_;
  State state_;
  const StepObserver& observer_;
  CancellationToken token_;
  const ExecutorOptions& options_;
  std::vector<std::string> visited_;
  std::exception_ptr error_;
};

int Executor::Run::step(const NodeDef& node) {
  try {
    token_.throw_if_cancelled();

    auto started = Clock::now();
    std::optional<Clock::time_point> deadline;
    if (options_.node_timeout.count() > 0) {
      deadline = started + options_.node_timeout;
    }
    NodeContext ctx(node.id, token_, deadline);

    PartialUpdate update = node.fn(state_, ctx);
    ctx.check_deadline();

    if (!node.writes.contains(update.fields())) {
      throw NodeExecutionError(node.id, "update " + update.fields().to_string() +
                                        " exceeds declared fields " + node.writes.to_string());
    }
    merge(state_, update);
    visited_.push_back(node.id);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
    spdlog::debug("{} done in {} ms: {}", node.id, elapsed.count(), describe(update));

    if (observer_) {
      observer_(Step{node.id, update});
    }

    auto next = graph_.next(node.id, state_);
    if (!next) {
      return kStop;
    }
    return graph_.successor_index(node.id, *next);
  } catch (const WorkflowError&) {
    error_ = std::current_exception();
  } catch (const std::exception& e) {
    error_ = std::make_exception_ptr(NodeExecutionError(node.id, e.what()));
  }
  return kStop;
}

RunResult Executor::Run::finish() {
  if (error_) {
    std::rethrow_exception(error_);
  }
  return RunResult{std::move(state_), std::move(visited_)};
}

// ============================================================================
// Executor implementation
// ============================================================================

Executor::Executor(const Graph& graph, tf::Executor& executor, ExecutorOptions options)
    : graph_(graph), executor_(executor), options_(options) {}

RunResult Executor::run(State initial, const StepObserver& observer,
                        const CancellationToken& token) const {
  Run run(graph_, std::move(initial), observer, token, options_);

  // Every task is a condition task: all edges are weak, START is the only source
  tf::Taskflow taskflow(graph_.name());
  std::unordered_map<std::string, tf::Task> tasks;
  for (const auto& id : graph_.reachable()) {
    const NodeDef* def = &graph_.node(id);
    tasks[id] = taskflow.emplace([&run, def]() -> int {
      return run.step(*def);
    }).name(id);
  }
  auto start = taskflow.emplace([]() -> int { return 0; }).name("START");
  start.precede(tasks.at(graph_.entry()));
  for (const auto& id : graph_.reachable()) {
    for (const auto& s : graph_.successors(id)) {
      tasks.at(id).precede(tasks.at(s));
    }
  }

  spdlog::debug("run of '{}' started at '{}'", graph_.name(), graph_.entry());
  if (executor_.this_worker_id() >= 0) {
    executor_.corun(taskflow);
  } else {
    executor_.run(taskflow).wait();
  }
  return run.finish();
}

}  // namespace agentflow
