// Stream events and the bounded channel carrying them from a run to the
// transport. Closing the channel is the end-of-stream signal.

#ifndef AGENTFLOW_EVENT_CHANNEL_HPP
#define AGENTFLOW_EVENT_CHANNEL_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace agentflow {

enum class EventKind { progress, result, error, end };

std::string to_string(EventKind kind);

struct Event {
  EventKind kind = EventKind::progress;
  std::string text;
  std::string node_id;  // set for progress events

  static Event progress(std::string node_id, std::string text);
  static Event result(std::string text);
  static Event error(std::string text);
  static Event end(std::string text);

  bool operator==(const Event&) const = default;
};

/**
 * @brief Bounded multi-producer / single-consumer event queue
 * @details push() blocks while the channel is full, so a slow consumer
 *          throttles the producer instead of growing the buffer.
 */
class EventChannel {
 public:
  explicit EventChannel(std::size_t capacity = 16);

  EventChannel(const EventChannel&) = delete;
  EventChannel& operator=(const EventChannel&) = delete;

  /**
   * @brief Append an event, waiting for space
   * @return false if the channel was closed; the event is dropped
   */
  bool push(Event event);

  /**
   * @brief Take the oldest event, waiting for one
   * @return std::nullopt once the channel is closed and drained
   */
  std::optional<Event> pop();

  // Idempotent; wakes every waiting producer and consumer
  void close();

  bool closed() const;
  std::size_t size() const;
  std::size_t capacity() const { return capacity_; }

 private:
  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable not_full_;
  std::condition_variable not_empty_;
  std::deque<Event> queue_;
  bool closed_ = false;
};

}  // namespace agentflow

#endif  // AGENTFLOW_EVENT_CHANNEL_HPP
