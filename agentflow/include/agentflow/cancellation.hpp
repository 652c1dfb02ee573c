// Cancellation signal shared between a run and its caller, and the
// per-node context through which node bodies suspend.

#ifndef AGENTFLOW_CANCELLATION_HPP
#define AGENTFLOW_CANCELLATION_HPP

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace agentflow {

using Clock = std::chrono::steady_clock;

// ============================================================================
// CancellationToken
// ============================================================================

/**
 * @brief Copyable handle to a one-shot cancellation flag
 * @details All copies observe the same flag. Waiters are woken as soon as
 *          cancel() is called from any thread.
 */
class CancellationToken {
 public:
  CancellationToken();

  void cancel() const;
  bool cancelled() const;

  /**
   * @brief Block for up to @p duration or until cancelled
   * @return true if the token was cancelled
   */
  bool wait_for(std::chrono::milliseconds duration) const;

  // Same as wait_for, with an absolute deadline
  bool wait_until(Clock::time_point deadline) const;

  // Throws RunCancelled once the token is cancelled
  void throw_if_cancelled() const;

 private:
  struct Shared {
    mutable std::mutex mutex;
    std::condition_variable cv;
    bool cancelled = false;
  };
  std::shared_ptr<Shared> shared_;
};

// ============================================================================
// NodeContext
// ============================================================================

/**
 * @brief Handed to every node body for the duration of one execution
 * @details sleep_for() is the suspension point of a node: it honours the
 *          run's cancellation token and the node's execution budget.
 */
class NodeContext {
 public:
  NodeContext(std::string node_id, CancellationToken token,
              std::optional<Clock::time_point> deadline = std::nullopt);

  const std::string& node_id() const { return node_id_; }
  const CancellationToken& token() const { return token_; }
  const std::optional<Clock::time_point>& deadline() const { return deadline_; }

  /**
   * @brief Suspend the node for @p duration
   * @throws RunCancelled if the run is cancelled while waiting
   * @throws NodeTimeoutError if the wait would cross the node deadline
   */
  void sleep_for(std::chrono::milliseconds duration) const;

  // Throws NodeTimeoutError if the deadline has passed
  void check_deadline() const;

 private:
  std::string node_id_;
  CancellationToken token_;
  std::optional<Clock::time_point> deadline_;
};

}  // namespace agentflow

#endif  // AGENTFLOW_CANCELLATION_HPP
