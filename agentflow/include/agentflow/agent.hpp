// The agent workflow served by agentflow:
//
//   START -> plan
//   plan --(plan_needed == yes)--> execute
//   plan --(plan_needed == no)---> check_result
//   execute -> check_result
//   check_result -> END
//
// Node bodies simulate model/tool latency through NodeContext::sleep_for.

#ifndef AGENTFLOW_AGENT_HPP
#define AGENTFLOW_AGENT_HPP

#include <agentflow/graph.hpp>
#include <chrono>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace agentflow {

namespace node_ids {
inline constexpr char plan[] = "plan";
inline constexpr char execute[] = "execute";
inline constexpr char check_result[] = "check_result";
}  // namespace node_ids

struct AgentOptions {
  // Case-insensitive substrings that require the execute step
  std::vector<std::string> trigger_keywords{"simular", "ejecutar"};
  std::chrono::milliseconds plan_latency{500};
  std::chrono::milliseconds execute_latency{3000};
  std::chrono::milliseconds check_latency{500};
};

// Progress message per node id, sent when that node completes
using ProgressMessages = std::unordered_map<std::string, std::string>;

ProgressMessages default_progress_messages();

/**
 * @brief True if @p message contains any of @p keywords, ignoring ASCII case
 */
bool plan_required(std::string_view message, const std::vector<std::string>& keywords);

// Provisional answer written by the execute node
std::string simulation_report(std::string_view prompt);

// Final answer when the execute node ran
std::string task_complete_answer(std::string_view provisional);

// Final answer when no execution was needed
std::string quick_response_answer(std::string_view prompt);

// ============================================================================
// Node bodies
// ============================================================================

PartialUpdate plan_step(const State& state, const NodeContext& ctx, const AgentOptions& options);
PartialUpdate execute_step(const State& state, const NodeContext& ctx, const AgentOptions& options);
PartialUpdate check_result_step(const State& state, const NodeContext& ctx, const AgentOptions& options);

// Routing after plan
PlanNeeded route_plan(const State& state);

/**
 * @brief Build and validate the agent graph
 * @throws ValidationError if the definition is malformed
 */
Graph build_agent_graph(const AgentOptions& options = {});

}  // namespace agentflow

#endif  // AGENTFLOW_AGENT_HPP
