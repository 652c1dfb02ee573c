#include <gtest/gtest.h>
#include <agentflow/event_channel.hpp>
#include <atomic>
#include <chrono>
#include <thread>

using namespace agentflow;
using namespace std::chrono_literals;

TEST(EventChannel, FifoOrder) {
  EventChannel channel(4);
  ASSERT_TRUE(channel.push(Event::progress("plan", "one")));
  ASSERT_TRUE(channel.push(Event::result("two")));
  EXPECT_EQ(channel.size(), 2u);

  EXPECT_EQ(channel.pop(), Event::progress("plan", "one"));
  EXPECT_EQ(channel.pop()->text, "two");
}

TEST(EventChannel, ZeroCapacityBecomesOne) {
  EventChannel channel(0);
  EXPECT_EQ(channel.capacity(), 1u);
}

TEST(EventChannel, PushBlocksWhileFull) {
  EventChannel channel(1);
  ASSERT_TRUE(channel.push(Event::progress("a", "first")));

  std::atomic<bool> pushed{false};
  std::thread producer([&] {
    channel.push(Event::progress("b", "second"));
    pushed = true;
  });

  std::this_thread::sleep_for(50ms);
  EXPECT_FALSE(pushed.load());

  EXPECT_EQ(channel.pop()->text, "first");
  producer.join();
  EXPECT_TRUE(pushed.load());
  EXPECT_EQ(channel.pop()->text, "second");
}

TEST(EventChannel, CloseWakesBlockedProducer) {
  EventChannel channel(1);
  ASSERT_TRUE(channel.push(Event::progress("a", "first")));

  std::atomic<bool> result{true};
  std::thread producer([&] { result = channel.push(Event::progress("b", "second")); });
  std::this_thread::sleep_for(20ms);
  channel.close();
  producer.join();
  EXPECT_FALSE(result.load());
}

TEST(EventChannel, CloseWakesBlockedConsumer) {
  EventChannel channel;
  std::optional<Event> popped = Event::error("placeholder");
  std::thread consumer([&] { popped = channel.pop(); });
  std::this_thread::sleep_for(20ms);
  channel.close();
  consumer.join();
  EXPECT_FALSE(popped.has_value());
}

TEST(EventChannel, DrainsAfterClose) {
  EventChannel channel;
  channel.push(Event::result("answer"));
  channel.push(Event::end("--- END OF STREAM ---"));
  channel.close();
  channel.close();

  EXPECT_TRUE(channel.closed());
  EXPECT_FALSE(channel.push(Event::error("late")));
  EXPECT_EQ(channel.pop()->kind, EventKind::result);
  EXPECT_EQ(channel.pop()->kind, EventKind::end);
  EXPECT_FALSE(channel.pop().has_value());
}

TEST(EventKind, ToString) {
  EXPECT_EQ(to_string(EventKind::progress), "progress");
  EXPECT_EQ(to_string(EventKind::result), "result");
  EXPECT_EQ(to_string(EventKind::error), "error");
  EXPECT_EQ(to_string(EventKind::end), "end");
}
