// Streams one prompt through the agent workflow and prints the event-stream
// frames, exactly as GET /stream would send them.
//
//   agentflow_cli simular carga
//   agentflow_cli hola
//   agentflow_cli --dot          (print the graph in DOT format)

#include <agentflow/agent.hpp>
#include <agentflow/sse_server.hpp>
#include <agentflow/stream_bridge.hpp>
#include <taskflow/taskflow.hpp>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
  namespace af = agentflow;

  tf::Executor executor;
  const af::Graph graph = af::build_agent_graph();

  if (argc == 2 && std::string(argv[1]) == "--dot") {
    graph.dump(std::cout);
    return 0;
  }

  std::string prompt;
  for (int i = 1; i < argc; ++i) {
    if (i > 1) prompt += ' ';
    prompt += argv[i];
  }

  af::StreamBridge bridge(graph, executor);
  auto stream = bridge.start(prompt);
  while (auto event = stream.channel().pop()) {
    std::cout << af::format_frame(event->text) << std::flush;
  }
  stream.join();
  return 0;
}
