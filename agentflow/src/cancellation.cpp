// Implementation file for cancellation.hpp

#include <agentflow/cancellation.hpp>
#include <agentflow/errors.hpp>

namespace agentflow {

// ============================================================================
// CancellationToken implementation
// ============================================================================

CancellationToken::CancellationToken() : shared_(std::make_shared<Shared>()) {}

void CancellationToken::cancel() const {
  {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    shared_->cancelled = true;
  }
  shared_->cv.notify_all();
}

bool CancellationToken::cancelled() const {
  std::lock_guard<std::mutex> lock(shared_->mutex);
  return shared_->cancelled;
}

bool CancellationToken::wait_for(std::chrono::milliseconds duration) const {
  return wait_until(Clock::now() + duration);
}

bool CancellationToken::wait_until(Clock::time_point deadline) const {
  std::unique_lock<std::mutex> lock(shared_->mutex);
  return shared_->cv.wait_until(lock, deadline, [this] { return shared_->cancelled; });
}

void CancellationToken::throw_if_cancelled() const {
  if (cancelled()) {
    throw RunCancelled();
  }
}

// ============================================================================
// NodeContext implementation
// ============================================================================

NodeContext::NodeContext(std::string node_id, CancellationToken token,
                         std::optional<Clock::time_point> deadline)
    : node_id_(std::move(node_id)), token_(std::move(token)), deadline_(deadline) {}

void NodeContext::sleep_for(std::chrono::milliseconds duration) const {
  auto wake = Clock::now() + duration;
  bool overrun = false;
  if (deadline_ && wake > *deadline_) {
    wake = *deadline_;
    overrun = true;
  }
  if (token_.wait_until(wake)) {
    throw RunCancelled();
  }
  if (overrun) {
    throw NodeTimeoutError(node_id_, "execution budget exceeded while suspended");
  }
}

void NodeContext::check_deadline() const {
  if (deadline_ && Clock::now() > *deadline_) {
    throw NodeTimeoutError(node_id_, "execution budget exceeded");
  }
}

}  // namespace agentflow
