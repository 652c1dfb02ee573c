#include <gtest/gtest.h>
#include <agentflow/config.hpp>
#include <stdexcept>
#include <vector>

using namespace agentflow;
using namespace std::chrono_literals;

namespace {

ServerConfig parse(std::vector<const char*> args) {
  args.insert(args.begin(), "agentflow_server");
  return parse_args(static_cast<int>(args.size()), args.data());
}

}  // namespace

TEST(ParseArgs, Defaults) {
  auto config = parse({});
  EXPECT_EQ(config.server.host, "0.0.0.0");
  EXPECT_EQ(config.server.port, 8000);
  EXPECT_EQ(config.workers, 0u);
  EXPECT_EQ(config.stream.channel_capacity, 16u);
  EXPECT_EQ(config.stream.progress_delay, 500ms);
  EXPECT_EQ(config.stream.executor.node_timeout, 0ms);
  EXPECT_EQ(config.agent.execute_latency, 3000ms);
  EXPECT_EQ(config.log_level, spdlog::level::info);
  EXPECT_FALSE(config.show_help);
}

TEST(ParseArgs, AllFlags) {
  auto config = parse({"--host", "127.0.0.1", "--port", "9090", "--workers", "3",
                       "--channel-capacity", "4", "--progress-delay-ms", "0",
                       "--node-timeout-ms", "5000", "--log-level", "debug"});
  EXPECT_EQ(config.server.host, "127.0.0.1");
  EXPECT_EQ(config.server.port, 9090);
  EXPECT_EQ(config.workers, 3u);
  EXPECT_EQ(config.stream.channel_capacity, 4u);
  EXPECT_EQ(config.stream.progress_delay, 0ms);
  EXPECT_EQ(config.stream.executor.node_timeout, 5000ms);
  EXPECT_EQ(config.log_level, spdlog::level::debug);
}

TEST(ParseArgs, Help) {
  EXPECT_TRUE(parse({"--help"}).show_help);
  EXPECT_TRUE(parse({"-h"}).show_help);
  EXPECT_NE(usage("agentflow_server").find("--port"), std::string::npos);
}

TEST(ParseArgs, RejectsUnknownFlag) {
  EXPECT_THROW(parse({"--verbose"}), std::invalid_argument);
  EXPECT_THROW(parse({"stream"}), std::invalid_argument);
}

TEST(ParseArgs, RejectsMissingValue) {
  EXPECT_THROW(parse({"--port"}), std::invalid_argument);
}

TEST(ParseArgs, RejectsBadNumbers) {
  EXPECT_THROW(parse({"--port", "http"}), std::invalid_argument);
  EXPECT_THROW(parse({"--port", "70000"}), std::invalid_argument);
  EXPECT_THROW(parse({"--port", "80x"}), std::invalid_argument);
  EXPECT_THROW(parse({"--workers", "0"}), std::invalid_argument);
  EXPECT_THROW(parse({"--channel-capacity", "0"}), std::invalid_argument);
  EXPECT_THROW(parse({"--progress-delay-ms", "-1"}), std::invalid_argument);
}

TEST(ParseArgs, LogLevels) {
  EXPECT_EQ(parse({"--log-level", "off"}).log_level, spdlog::level::off);
  EXPECT_EQ(parse({"--log-level", "warning"}).log_level, spdlog::level::warn);
  EXPECT_THROW(parse({"--log-level", "loud"}), std::invalid_argument);
}
