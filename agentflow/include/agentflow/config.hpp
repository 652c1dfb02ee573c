// Process configuration from command-line flags

#ifndef AGENTFLOW_CONFIG_HPP
#define AGENTFLOW_CONFIG_HPP

#include <agentflow/agent.hpp>
#include <agentflow/sse_server.hpp>
#include <agentflow/stream_bridge.hpp>
#include <spdlog/common.h>
#include <cstddef>
#include <string>

namespace agentflow {

struct ServerConfig {
  ServerOptions server;
  StreamOptions stream;
  AgentOptions agent;
  std::size_t workers = 0;  // 0: one per hardware thread
  spdlog::level::level_enum log_level = spdlog::level::info;
  bool show_help = false;
};

/**
 * @brief Parse command-line flags
 * @throws std::invalid_argument on unknown flags, missing or malformed values
 */
ServerConfig parse_args(int argc, const char* const argv[]);

std::string usage(const std::string& program);

}  // namespace agentflow

#endif  // AGENTFLOW_CONFIG_HPP
