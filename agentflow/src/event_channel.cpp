// Implementation file for event_channel.hpp

#include <agentflow/event_channel.hpp>
#include <algorithm>
#include <utility>

namespace agentflow {

std::string to_string(EventKind kind) {
  switch (kind) {
    case EventKind::progress: return "progress";
    case EventKind::result: return "result";
    case EventKind::error: return "error";
    case EventKind::end: return "end";
  }
  return "unknown";
}

Event Event::progress(std::string node_id, std::string text) {
  return Event{EventKind::progress, std::move(text), std::move(node_id)};
}

Event Event::result(std::string text) {
  return Event{EventKind::result, std::move(text), {}};
}

Event Event::error(std::string text) {
  return Event{EventKind::error, std::move(text), {}};
}

Event Event::end(std::string text) {
  return Event{EventKind::end, std::move(text), {}};
}

// ============================================================================
// EventChannel implementation
// ============================================================================

EventChannel::EventChannel(std::size_t capacity) : capacity_(std::max<std::size_t>(capacity, 1)) {}

bool EventChannel::push(Event event) {
  std::unique_lock<std::mutex> lock(mutex_);
  not_full_.wait(lock, [this] { return closed_ || queue_.size() < capacity_; });
  if (closed_) {
    return false;
  }
  queue_.push_back(std::move(event));
  lock.unlock();
  not_empty_.notify_one();
  return true;
}

std::optional<Event> EventChannel::pop() {
  std::unique_lock<std::mutex> lock(mutex_);
  not_empty_.wait(lock, [this] { return closed_ || !queue_.empty(); });
  if (queue_.empty()) {
    return std::nullopt;
  }
  Event event = std::move(queue_.front());
  queue_.pop_front();
  lock.unlock();
  not_full_.notify_one();
  return event;
}

void EventChannel::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  not_full_.notify_all();
  not_empty_.notify_all();
}

bool EventChannel::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

std::size_t EventChannel::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

}  // namespace agentflow
