// Streaming bridge: turns one prompt into one Executor run and an ordered
// event sequence (progress messages, one result or error, one sentinel).

#ifndef AGENTFLOW_STREAM_BRIDGE_HPP
#define AGENTFLOW_STREAM_BRIDGE_HPP

#include <agentflow/agent.hpp>
#include <agentflow/cancellation.hpp>
#include <agentflow/event_channel.hpp>
#include <agentflow/executor.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <thread>

namespace agentflow {

struct StreamOptions {
  ProgressMessages progress_messages = default_progress_messages();
  // Pause after each progress event so clients can render it
  std::chrono::milliseconds progress_delay{500};
  std::size_t channel_capacity = 16;
  ExecutorOptions executor;

  std::string empty_prompt_message = "ERROR: No prompt was provided.";
  std::string missing_answer_message = "Error: No final answer was produced.";
  std::string failure_prefix = "**[FATAL ERROR]** Failed to obtain the final state. ";
  std::string sentinel_message = "--- END OF STREAM ---";
};

class StreamBridge;

/**
 * @brief One stream in flight: the producer thread and its event channel
 * @details The producer runs StreamBridge::stream on its own thread, never on
 *          a worker of the node executor. Destroying a task that was not
 *          joined cancels its run, closes the channel and joins the producer.
 */
class StreamTask {
 public:
  StreamTask(const StreamBridge& bridge, std::string prompt, CancellationToken token);
  ~StreamTask();

  StreamTask(StreamTask&&) = default;
  StreamTask& operator=(StreamTask&&) = delete;
  StreamTask(const StreamTask&) = delete;
  StreamTask& operator=(const StreamTask&) = delete;

  // Consumer end; closed after the last event
  EventChannel& channel() { return *channel_; }
  const CancellationToken& token() const { return token_; }

  // Wait for the producer to return
  void join();

 private:
  std::shared_ptr<EventChannel> channel_;
  CancellationToken token_;
  std::thread producer_;
};

class StreamBridge {
 public:
  /**
   * @param graph Built workflow graph, shared read-only by every stream
   * @param executor Worker pool running the node tasks; producers never occupy it
   */
  StreamBridge(const Graph& graph, tf::Executor& executor, StreamOptions options = {});

  StreamBridge(const StreamBridge&) = delete;
  StreamBridge& operator=(const StreamBridge&) = delete;

  /**
   * @brief Start streaming @p prompt on a producer thread
   * @param prompt User message
   * @param token Cancelled by the caller when the client goes away
   * @return The running stream; pop its channel until it is closed
   */
  StreamTask start(std::string prompt, CancellationToken token = CancellationToken()) const;

  /**
   * @brief Produce the full event sequence of @p prompt into @p channel
   * @details Never throws for per-request failures: they become one error
   *          event. Unless the prompt is empty, the sentinel event is always
   *          the last event, and the channel is always closed on return.
   */
  void stream(std::string_view prompt, EventChannel& channel, const CancellationToken& token) const;

  const StreamOptions& options() const { return options_; }

 private:
  // Builds the initial state; throws EmptyPromptError
  static State initial_state(std::string_view prompt);

  // Pushes an event; cancels the run if the consumer is gone
  bool emit(EventChannel& channel, Event event, const CancellationToken& token) const;

  const Graph& graph_;
  Executor runner_;
  StreamOptions options_;
};

}  // namespace agentflow

#endif  // AGENTFLOW_STREAM_BRIDGE_HPP
