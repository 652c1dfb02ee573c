// Implementation file for agent.hpp

#include <agentflow/agent.hpp>
#include <algorithm>
#include <cctype>

namespace agentflow {

namespace {

std::string ascii_lower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

}  // namespace

ProgressMessages default_progress_messages() {
  return {
    {node_ids::plan, "**Step 1: [PLANNING].** Analyzing the user request..."},
    {node_ids::execute, "**Step 2: [EXECUTION].** Complex task detected. Starting 3-second simulation..."},
    {node_ids::check_result, "**Step 3: [VERIFICATION].** Gathering and formatting the final answer."},
  };
}

bool plan_required(std::string_view message, const std::vector<std::string>& keywords) {
  const auto lowered = ascii_lower(message);
  return std::any_of(keywords.begin(), keywords.end(), [&lowered](const std::string& kw) {
    return !kw.empty() && lowered.find(ascii_lower(kw)) != std::string::npos;
  });
}

std::string simulation_report(std::string_view prompt) {
  return "the simulation of the requested task ('" + std::string(prompt) +
         "') finished successfully after 3 seconds of computation";
}

std::string task_complete_answer(std::string_view provisional) {
  return "Task complete: " + std::string(provisional) + ". The agent has finished its work cycle.";
}

std::string quick_response_answer(std::string_view prompt) {
  return "Quick response: no complex execution was required for: '" + std::string(prompt) +
         "'. Process finished.";
}

// ============================================================================
// Node bodies
// ============================================================================

PartialUpdate plan_step(const State& state, const NodeContext& ctx, const AgentOptions& options) {
  ctx.sleep_for(options.plan_latency);
  PartialUpdate update;
  update.plan_needed = plan_required(state.user_message, options.trigger_keywords)
                           ? PlanNeeded::yes
                           : PlanNeeded::no;
  return update;
}

PartialUpdate execute_step(const State& state, const NodeContext& ctx, const AgentOptions& options) {
  ctx.sleep_for(options.execute_latency);
  PartialUpdate update;
  update.execution_complete = true;
  update.final_answer = simulation_report(state.user_message);
  return update;
}

PartialUpdate check_result_step(const State& state, const NodeContext& ctx, const AgentOptions& options) {
  ctx.sleep_for(options.check_latency);
  PartialUpdate update;
  if (state.execution_complete) {
    update.final_answer = task_complete_answer(state.final_answer.value_or(""));
  } else {
    update.final_answer = quick_response_answer(state.user_message);
  }
  return update;
}

PlanNeeded route_plan(const State& state) {
  return state.plan_needed;
}

Graph build_agent_graph(const AgentOptions& options) {
  GraphBuilder builder("agent");
  builder
    .add_node(node_ids::plan,
              [options](const State& s, const NodeContext& ctx) { return plan_step(s, ctx, options); },
              StateField::plan_needed)
    .add_node(node_ids::execute,
              [options](const State& s, const NodeContext& ctx) { return execute_step(s, ctx, options); },
              StateField::execution_complete | StateField::final_answer)
    .add_node(node_ids::check_result,
              [options](const State& s, const NodeContext& ctx) { return check_result_step(s, ctx, options); },
              StateField::final_answer)
    .set_entry(node_ids::plan)
    .add_conditional_edge<PlanNeeded>(node_ids::plan, route_plan, {
      {PlanNeeded::yes, node_ids::execute},
      {PlanNeeded::no, node_ids::check_result},
    })
    .add_edge(node_ids::execute, node_ids::check_result)
    .set_terminal(node_ids::check_result);
  return builder.build();
}

}  // namespace agentflow
