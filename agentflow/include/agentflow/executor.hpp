// Executor: runs a built Graph from entry to END on a Taskflow executor.
// Each run compiles the graph into its own tf::Taskflow of condition tasks;
// a node's task returns the index of the one successor to schedule, so the
// nodes of a run execute strictly one after another.

#ifndef AGENTFLOW_EXECUTOR_HPP
#define AGENTFLOW_EXECUTOR_HPP

#include <agentflow/cancellation.hpp>
#include <agentflow/graph.hpp>
#include <agentflow/state.hpp>
#include <taskflow/taskflow.hpp>
#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace agentflow {

// One completed node of a run
struct Step {
  std::string node_id;
  PartialUpdate update;
};

using StepObserver = std::function<void(const Step&)>;

struct RunResult {
  State state;                       // merged state at END
  std::vector<std::string> visited;  // node ids in execution order
};

struct ExecutorOptions {
  // Execution budget per node; zero means unbounded
  std::chrono::milliseconds node_timeout{0};
};

class Executor {
 public:
  /**
   * @param graph Built graph; must outlive the executor
   * @param executor Taskflow worker pool the runs are scheduled on
   */
  Executor(const Graph& graph, tf::Executor& executor, ExecutorOptions options = {});

  /**
   * @brief Run the graph once
   * @param initial State the run starts from
   * @param observer Called after each node with (node id, partial update)
   * @param token Cancellation signal, checked before every node and while nodes suspend
   * @return Final merged state and the visited nodes
   * @throws NodeExecutionError, NodeTimeoutError, RoutingError, RunCancelled
   * @details Nothing is observed after a failure. Safe to call concurrently.
   */
  RunResult run(State initial, const StepObserver& observer = {},
                const CancellationToken& token = CancellationToken()) const;

  const Graph& graph() const { return graph_; }

 private:
  class Run;

  const Graph& graph_;
  tf::Executor& executor_;
  ExecutorOptions options_;
};

}  // namespace agentflow

#endif  // AGENTFLOW_EXECUTOR_HPP
