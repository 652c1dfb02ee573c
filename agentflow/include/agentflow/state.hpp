// State record threaded through a workflow run, and the partial updates
// nodes return. Merge overwrites exactly the fields an update names.

#ifndef AGENTFLOW_STATE_HPP
#define AGENTFLOW_STATE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace agentflow {

enum class PlanNeeded { unset, yes, no };

std::string to_string(PlanNeeded value);

// ============================================================================
// Field ownership
// ============================================================================

/**
 * @brief Writable fields of the state record, usable as a bit mask
 * @details user_message is absent on purpose: it is set once when the run starts
 */
enum class StateField : std::uint8_t {
  plan_needed        = 1u << 0,
  execution_complete = 1u << 1,
  final_answer       = 1u << 2,
};

class FieldSet {
 public:
  constexpr FieldSet() = default;
  constexpr FieldSet(StateField f) : bits_(static_cast<std::uint8_t>(f)) {}

  constexpr FieldSet operator|(FieldSet other) const { return FieldSet(static_cast<std::uint8_t>(bits_ | other.bits_)); }
  constexpr bool contains(StateField f) const { return (bits_ & static_cast<std::uint8_t>(f)) != 0; }
  constexpr bool contains(FieldSet other) const { return (bits_ & other.bits_) == other.bits_; }
  constexpr bool empty() const { return bits_ == 0; }
  constexpr bool operator==(const FieldSet& other) const = default;

  std::string to_string() const;

 private:
  constexpr explicit FieldSet(std::uint8_t bits) : bits_(bits) {}
  std::uint8_t bits_ = 0;
};

constexpr FieldSet operator|(StateField a, StateField b) { return FieldSet(a) | FieldSet(b); }

std::string to_string(StateField field);

// ============================================================================
// State record and partial update
// ============================================================================

struct State {
  std::string user_message;
  PlanNeeded plan_needed = PlanNeeded::unset;
  bool execution_complete = false;
  std::optional<std::string> final_answer;

  State() = default;
  explicit State(std::string message) : user_message(std::move(message)) {}

  bool operator==(const State&) const = default;
};

struct PartialUpdate {
  std::optional<PlanNeeded> plan_needed;
  std::optional<bool> execution_complete;
  std::optional<std::string> final_answer;

  // Fields this update sets
  FieldSet fields() const;
  bool empty() const { return fields().empty(); }

  bool operator==(const PartialUpdate&) const = default;
};

/**
 * @brief Shallow-merge an update into the state
 * @param state Running state of the run, modified in place
 * @param update Partial update returned by a node
 * @details Only the fields engaged in @p update are overwritten
 */
void merge(State& state, const PartialUpdate& update);

// Render an update as "{key: value, ...}" for logs
std::string describe(const PartialUpdate& update);

}  // namespace agentflow

#endif  // AGENTFLOW_STATE_HPP
