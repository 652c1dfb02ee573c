// Implementation file for state.hpp

#include <agentflow/state.hpp>
#include <sstream>

namespace agentflow {

std::string to_string(PlanNeeded value) {
  switch (value) {
    case PlanNeeded::yes: return "yes";
    case PlanNeeded::no: return "no";
    case PlanNeeded::unset: break;
  }
  return "unset";
}

std::string to_string(StateField field) {
  switch (field) {
    case StateField::plan_needed: return "plan_needed";
    case StateField::execution_complete: return "execution_complete";
    case StateField::final_answer: return "final_answer";
  }
  return "unknown";
}

std::string FieldSet::to_string() const {
  std::string out = "{";
  bool first = true;
  for (auto f : {StateField::plan_needed, StateField::execution_complete, StateField::final_answer}) {
    if (!contains(f)) continue;
    if (!first) out += ", ";
    first = false;
    out += agentflow::to_string(f);
  }
  out += "}";
  return out;
}

// ============================================================================
// PartialUpdate
// ============================================================================

FieldSet PartialUpdate::fields() const {
  FieldSet set;
  if (plan_needed) set = set | StateField::plan_needed;
  if (execution_complete) set = set | StateField::execution_complete;
  if (final_answer) set = set | StateField::final_answer;
  return set;
}

void merge(State& state, const PartialUpdate& update) {
  if (update.plan_needed) {
    state.plan_needed = *update.plan_needed;
  }
  if (update.execution_complete) {
    state.execution_complete = *update.execution_complete;
  }
  if (update.final_answer) {
    state.final_answer = *update.final_answer;
  }
}

std::string describe(const PartialUpdate& update) {
  std::ostringstream os;
  os << '{';
  bool first = true;
  auto sep = [&]() {
    if (!first) os << ", ";
    first = false;
  };
  if (update.plan_needed) {
    sep();
    os << "plan_needed: " << to_string(*update.plan_needed);
  }
  if (update.execution_complete) {
    sep();
    os << "execution_complete: " << (*update.execution_complete ? "true" : "false");
  }
  if (update.final_answer) {
    sep();
    os << "final_answer: \"" << *update.final_answer << '"';
  }
  os << '}';
  return os.str();
}

}  // namespace agentflow
