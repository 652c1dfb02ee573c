// Error types raised by graph construction, workflow runs and the stream bridge

#ifndef AGENTFLOW_ERRORS_HPP
#define AGENTFLOW_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace agentflow {

/**
 * @brief Base class for every error raised by the workflow engine
 */
class WorkflowError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief Malformed graph definition, detected by GraphBuilder::build()
 */
class ValidationError : public WorkflowError {
 public:
  using WorkflowError::WorkflowError;
};

/**
 * @brief A routing function produced a key absent from its table
 */
class RoutingError : public WorkflowError {
 public:
  RoutingError(const std::string& node_id, const std::string& key)
      : WorkflowError("Routing from '" + node_id + "' produced unmapped key '" + key + "'"),
        node_id_(node_id), key_(key) {}

  const std::string& node_id() const { return node_id_; }
  const std::string& key() const { return key_; }

 private:
  std::string node_id_;
  std::string key_;
};

/**
 * @brief A node function failed while executing; aborts only its run
 */
class NodeExecutionError : public WorkflowError {
 public:
  NodeExecutionError(const std::string& node_id, const std::string& what)
      : WorkflowError("Node '" + node_id + "' failed: " + what), node_id_(node_id) {}

  const std::string& node_id() const { return node_id_; }

 private:
  std::string node_id_;
};

// Node ran past its execution budget
class NodeTimeoutError : public NodeExecutionError {
 public:
  using NodeExecutionError::NodeExecutionError;
};

// Run aborted by its cancellation token
class RunCancelled : public WorkflowError {
 public:
  RunCancelled() : WorkflowError("Run cancelled") {}
};

// Caller supplied no prompt; no run is started
class EmptyPromptError : public WorkflowError {
 public:
  EmptyPromptError() : WorkflowError("No prompt was provided.") {}
};

}  // namespace agentflow

#endif  // AGENTFLOW_ERRORS_HPP
