// agentflow_server: serves the agent workflow as a text/event-stream
//
//   GET /stream?prompt=<text>

#include <agentflow/agent.hpp>
#include <agentflow/config.hpp>
#include <agentflow/sse_server.hpp>
#include <agentflow/stream_bridge.hpp>
#include <spdlog/spdlog.h>
#include <taskflow/taskflow.hpp>
#include <algorithm>
#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <thread>

int main(int argc, char* argv[]) {
  namespace af = agentflow;

  af::ServerConfig config;
  try {
    config = af::parse_args(argc, argv);
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << "\n\n" << af::usage(argv[0]);
    return 2;
  }
  if (config.show_help) {
    std::cout << af::usage(argv[0]);
    return 0;
  }
  spdlog::set_level(config.log_level);

  // The graph is built once and shared read-only by every request
  std::optional<af::Graph> graph;
  try {
    graph.emplace(af::build_agent_graph(config.agent));
  } catch (const af::ValidationError& e) {
    spdlog::critical("invalid workflow graph: {}", e.what());
    return 1;
  }

  std::size_t workers = config.workers != 0 ? config.workers
                                            : std::max(1u, std::thread::hardware_concurrency());
  tf::Executor executor(workers);
  af::StreamBridge bridge(*graph, executor, config.stream);

  try {
    af::SseServer server(bridge, config.server);
    spdlog::info("agentflow server: {} workers, channel capacity {}", workers,
                 config.stream.channel_capacity);
    server.run();
  } catch (const std::exception& e) {
    spdlog::critical("server error: {}", e.what());
    return 1;
  }
  executor.wait_for_all();
  return 0;
}
