// Implementation file for stream_bridge.hpp

#include <agentflow/stream_bridge.hpp>
#include <agentflow/errors.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/ranges.h>
#include <utility>

namespace agentflow {

namespace {

// Pushes the sentinel and closes the channel when the stream scope exits
class EndOfStream {
 public:
  EndOfStream(EventChannel& channel, const std::string& text) : channel_(channel), text_(text) {}
  ~EndOfStream() {
    if (!channel_.push(Event::end(text_))) {
      spdlog::debug("sentinel dropped: consumer already closed the channel");
    }
    channel_.close();
  }

  EndOfStream(const EndOfStream&) = delete;
  EndOfStream& operator=(const EndOfStream&) = delete;

 private:
  EventChannel& channel_;
  const std::string& text_;
};

}  // namespace

// ============================================================================
// StreamTask implementation
// ============================================================================

StreamTask::StreamTask(const StreamBridge& bridge, std::string prompt, CancellationToken token)
    : channel_(std::make_shared<EventChannel>(bridge.options().channel_capacity)),
      token_(std::move(token)) {
  producer_ = std::thread([&bridge, prompt = std::move(prompt), channel = channel_, token = token_]() {
    bridge.stream(prompt, *channel, token);
  });
}

StreamTask::~StreamTask() {
  if (producer_.joinable()) {
    token_.cancel();
    channel_->close();
    producer_.join();
  }
}

void StreamTask::join() {
  if (producer_.joinable()) {
    producer_.join();
  }
}

// ============================================================================
// StreamBridge implementation
// ============================================================================

StreamBridge::StreamBridge(const Graph& graph, tf::Executor& executor, StreamOptions options)
    : graph_(graph), runner_(graph, executor, options.executor), options_(std::move(options)) {}

State StreamBridge::initial_state(std::string_view prompt) {
  if (prompt.empty()) {
    throw EmptyPromptError();
  }
  return State(std::string(prompt));
}

bool StreamBridge::emit(EventChannel& channel, Event event, const CancellationToken& token) const {
  if (channel.push(std::move(event))) {
    return true;
  }
  // Consumer closed its end: nobody is listening, stop the run
  token.cancel();
  return false;
}

StreamTask StreamBridge::start(std::string prompt, CancellationToken token) const {
  return StreamTask(*this, std::move(prompt), std::move(token));
}

void StreamBridge::stream(std::string_view prompt, EventChannel& channel,
                          const CancellationToken& token) const {
  State initial;
  try {
    initial = initial_state(prompt);
  } catch (const EmptyPromptError& e) {
    spdlog::warn("stream rejected: {}", e.what());
    emit(channel, Event::error(options_.empty_prompt_message), token);
    channel.close();
    return;
  }

  EndOfStream guard(channel, options_.sentinel_message);
  spdlog::info("stream started on graph '{}' ({} bytes of prompt)", graph_.name(), prompt.size());

  try {
    auto result = runner_.run(std::move(initial), [&](const Step& step) {
      auto it = options_.progress_messages.find(step.node_id);
      if (it == options_.progress_messages.end()) {
        return;
      }
      if (!emit(channel, Event::progress(step.node_id, it->second), token)) {
        throw RunCancelled();
      }
      if (options_.progress_delay.count() > 0 && token.wait_for(options_.progress_delay)) {
        throw RunCancelled();
      }
    }, token);

    spdlog::info("stream finished: visited [{}]", fmt::join(result.visited, ", "));
    if (result.state.final_answer) {
      emit(channel, Event::result(*result.state.final_answer), token);
    } else {
      emit(channel, Event::error(options_.missing_answer_message), token);
    }
  } catch (const RunCancelled& e) {
    spdlog::info("stream cancelled: {}", e.what());
    emit(channel, Event::error(options_.failure_prefix + e.what()), token);
  } catch (const WorkflowError& e) {
    spdlog::error("stream failed: {}", e.what());
    emit(channel, Event::error(options_.failure_prefix + e.what()), token);
  } catch (const std::exception& e) {
    spdlog::error("stream failed with unexpected error: {}", e.what());
    emit(channel, Event::error(options_.failure_prefix + e.what()), token);
  }
}

}  // namespace agentflow
