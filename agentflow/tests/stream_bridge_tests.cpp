#include <gtest/gtest.h>
#include <agentflow/errors.hpp>
#include <agentflow/stream_bridge.hpp>
#include "test_utils.hpp"
#include <algorithm>
#include <stdexcept>
#include <thread>

using namespace agentflow;
using namespace std::chrono_literals;

namespace {

const std::string kSentinel = "--- END OF STREAM ---";
const std::string kFailure = "**[FATAL ERROR]** Failed to obtain the final state. ";

class StreamBridgeTest : public ::testing::Test {
 protected:
  void TearDown() override { pool.wait_for_all(); }

  std::vector<Event> run_prompt(const Graph& graph, const std::string& prompt,
                                StreamOptions options = test::instant_stream()) {
    StreamBridge bridge(graph, pool, std::move(options));
    auto stream = bridge.start(prompt);
    auto events = test::drain(stream.channel());
    stream.join();
    return events;
  }

  tf::Executor pool{4};
};

std::vector<std::string> texts(const std::vector<Event>& events) {
  std::vector<std::string> out;
  for (const auto& e : events) {
    out.push_back(e.text);
  }
  return out;
}

}  // namespace

TEST_F(StreamBridgeTest, ComplexPromptStreamsThreeSteps) {
  auto graph = build_agent_graph(test::instant_agent());
  auto events = run_prompt(graph, "simular carga");

  const auto messages = default_progress_messages();
  ASSERT_EQ(events.size(), 5u);
  EXPECT_EQ(events[0], Event::progress(node_ids::plan, messages.at(node_ids::plan)));
  EXPECT_EQ(events[1], Event::progress(node_ids::execute, messages.at(node_ids::execute)));
  EXPECT_EQ(events[2], Event::progress(node_ids::check_result, messages.at(node_ids::check_result)));
  EXPECT_EQ(events[3].kind, EventKind::result);
  EXPECT_EQ(events[3].text,
            "Task complete: the simulation of the requested task ('simular carga') finished "
            "successfully after 3 seconds of computation. The agent has finished its work cycle.");
  EXPECT_EQ(events[4], Event::end(kSentinel));
}

TEST_F(StreamBridgeTest, SimplePromptSkipsExecution) {
  auto graph = build_agent_graph(test::instant_agent());
  auto events = run_prompt(graph, "hola");

  EXPECT_EQ(texts(events), (std::vector<std::string>{
    "**Step 1: [PLANNING].** Analyzing the user request...",
    "**Step 3: [VERIFICATION].** Gathering and formatting the final answer.",
    "Quick response: no complex execution was required for: 'hola'. Process finished.",
    kSentinel,
  }));
}

TEST_F(StreamBridgeTest, EmptyPromptYieldsSingleErrorAndNoSentinel) {
  auto graph = build_agent_graph(test::instant_agent());
  auto events = run_prompt(graph, "");

  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0], Event::error("ERROR: No prompt was provided."));
}

TEST_F(StreamBridgeTest, NodeFailureBecomesErrorThenSentinel) {
  GraphBuilder b("failing");
  b.add_node("first", [](const State&, const NodeContext&) { return PartialUpdate{}; })
   .add_node("second", [](const State&, const NodeContext&) -> PartialUpdate {
     throw std::runtime_error("boom");
   })
   .set_entry("first")
   .add_edge("first", "second")
   .set_terminal("second");
  auto graph = b.build();

  auto options = test::instant_stream();
  options.progress_messages = {{"first", "first done"}, {"second", "second done"}};
  auto events = run_prompt(graph, "x", options);

  ASSERT_EQ(events.size(), 3u);
  EXPECT_EQ(events[0], Event::progress("first", "first done"));
  EXPECT_EQ(events[1].kind, EventKind::error);
  EXPECT_EQ(events[1].text, kFailure + "Node 'second' failed: boom");
  EXPECT_EQ(events[2], Event::end(kSentinel));
}

TEST_F(StreamBridgeTest, MissingAnswerIsReported) {
  GraphBuilder b("silent");
  b.add_node("only", [](const State&, const NodeContext&) { return PartialUpdate{}; })
   .set_entry("only")
   .set_terminal("only");
  auto graph = b.build();

  auto events = run_prompt(graph, "x");
  // No progress message is configured for "only"
  EXPECT_EQ(texts(events), (std::vector<std::string>{"Error: No final answer was produced.", kSentinel}));
}

TEST_F(StreamBridgeTest, NodeTimeoutEndsStreamWithError) {
  auto agent = test::instant_agent();
  agent.execute_latency = 10s;
  auto graph = build_agent_graph(agent);

  auto options = test::instant_stream();
  options.executor.node_timeout = 50ms;
  auto events = run_prompt(graph, "ejecutar", options);

  ASSERT_EQ(events.size(), 3u);
  EXPECT_EQ(events[0].node_id, node_ids::plan);
  EXPECT_EQ(events[1].kind, EventKind::error);
  EXPECT_EQ(events[1].text.rfind(kFailure + "Node 'execute' failed", 0), 0u);
  EXPECT_EQ(events[2].kind, EventKind::end);
}

TEST_F(StreamBridgeTest, CancelDuringNodeEndsStream) {
  auto agent = test::instant_agent();
  agent.execute_latency = 10s;
  auto graph = build_agent_graph(agent);
  StreamBridge bridge(graph, pool, test::instant_stream());

  CancellationToken token;
  auto started = Clock::now();
  auto stream = bridge.start("simular", token);
  auto first = stream.channel().pop();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->node_id, node_ids::plan);
  token.cancel();

  auto rest = test::drain(stream.channel());
  stream.join();
  EXPECT_LT(Clock::now() - started, 5s);
  ASSERT_EQ(rest.size(), 2u);
  EXPECT_EQ(rest[0], Event::error(kFailure + "Run cancelled"));
  EXPECT_EQ(rest[1], Event::end(kSentinel));
}

TEST_F(StreamBridgeTest, ClosedChannelCancelsRun) {
  auto graph = build_agent_graph(test::instant_agent());
  auto options = test::instant_stream();
  options.channel_capacity = 1;
  StreamBridge bridge(graph, pool, options);

  CancellationToken token;
  auto stream = bridge.start("hola", token);
  // Four events cannot fit in one slot: some push must see the closed channel
  stream.channel().close();
  stream.join();

  EXPECT_TRUE(token.cancelled());
  EXPECT_LE(test::drain(stream.channel()).size(), 1u);
}

TEST_F(StreamBridgeTest, SentinelIsAlwaysLastAndUnique) {
  auto graph = build_agent_graph(test::instant_agent());
  StreamBridge bridge(graph, pool, test::instant_stream());

  std::vector<StreamTask> streams;
  for (const char* prompt : {"simular a", "hola", "EJECUTAR b", "nada"}) {
    streams.push_back(bridge.start(prompt));
  }
  for (auto& stream : streams) {
    auto events = test::drain(stream.channel());
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().kind, EventKind::end);
    EXPECT_EQ(std::count_if(events.begin(), events.end(),
                            [](const Event& e) { return e.kind == EventKind::end; }), 1);
    EXPECT_EQ(std::count_if(events.begin(), events.end(),
                            [](const Event& e) { return e.kind == EventKind::result; }), 1);
  }
}

TEST_F(StreamBridgeTest, ProgressDelayIsApplied) {
  auto graph = build_agent_graph(test::instant_agent());
  auto options = test::instant_stream();
  options.progress_delay = 30ms;

  auto started = Clock::now();
  auto events = run_prompt(graph, "hola", options);
  EXPECT_EQ(events.size(), 4u);
  EXPECT_GE(Clock::now() - started, 60ms);
}

TEST_F(StreamBridgeTest, AbandonedStreamIsCancelledOnDestruction) {
  auto agent = test::instant_agent();
  agent.execute_latency = 10s;
  auto graph = build_agent_graph(agent);
  StreamBridge bridge(graph, pool, test::instant_stream());

  CancellationToken token;
  auto started = Clock::now();
  {
    auto stream = bridge.start("simular", token);
    ASSERT_TRUE(stream.channel().pop().has_value());
  }
  EXPECT_LT(Clock::now() - started, 5s);
  EXPECT_TRUE(token.cancelled());
}

TEST(StreamBridge, StreamsDoNotWaitOnEachOther) {
  // One node worker: producers must not occupy it or nest inside each other
  tf::Executor single(1);
  auto agent = test::instant_agent();
  agent.execute_latency = 300ms;
  auto graph = build_agent_graph(agent);
  StreamBridge bridge(graph, single, test::instant_stream());

  auto slow = bridge.start("simular");
  ASSERT_EQ(slow.channel().pop()->node_id, node_ids::plan);
  auto quick = bridge.start("hola");

  std::vector<Event> quick_events;
  Clock::time_point quick_done;
  std::thread consumer([&] {
    quick_events = test::drain(quick.channel());
    quick_done = Clock::now();
  });
  auto slow_events = test::drain(slow.channel());
  const auto slow_done = Clock::now();
  consumer.join();
  slow.join();
  quick.join();

  ASSERT_FALSE(slow_events.empty());
  EXPECT_EQ(slow_events.back(), Event::end(kSentinel));
  ASSERT_EQ(quick_events.size(), 4u);
  EXPECT_EQ(quick_events.back(), Event::end(kSentinel));
  // The earlier run finishes first; it is never stacked under the later one
  EXPECT_LT(slow_done, quick_done);
  single.wait_for_all();
}
