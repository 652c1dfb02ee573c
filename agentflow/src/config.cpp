// Implementation file for config.hpp

#include <agentflow/config.hpp>
#include <charconv>
#include <limits>
#include <stdexcept>
#include <string_view>

namespace agentflow {

namespace {

template <typename T>
T parse_number(std::string_view flag, std::string_view text, T min, T max) {
  T value{};
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size() || value < min || value > max) {
    throw std::invalid_argument("Invalid value for " + std::string(flag) + ": '" + std::string(text) + "'");
  }
  return value;
}

spdlog::level::level_enum parse_level(std::string_view text) {
  auto level = spdlog::level::from_str(std::string(text));
  // from_str maps unknown names to "off"
  if (level == spdlog::level::off && text != "off") {
    throw std::invalid_argument("Invalid log level: '" + std::string(text) + "'");
  }
  return level;
}

}  // namespace

ServerConfig parse_args(int argc, const char* const argv[]) {
  ServerConfig config;
  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    auto value = [&]() -> std::string_view {
      if (i + 1 >= argc) {
        throw std::invalid_argument("Missing value for " + std::string(arg));
      }
      return argv[++i];
    };

    if (arg == "--help" || arg == "-h") {
      config.show_help = true;
    } else if (arg == "--host") {
      config.server.host = std::string(value());
    } else if (arg == "--port") {
      config.server.port = parse_number<unsigned short>(arg, value(), 0, std::numeric_limits<unsigned short>::max());
    } else if (arg == "--workers") {
      config.workers = parse_number<std::size_t>(arg, value(), 1, 1024);
    } else if (arg == "--channel-capacity") {
      config.stream.channel_capacity = parse_number<std::size_t>(arg, value(), 1, 1 << 16);
    } else if (arg == "--progress-delay-ms") {
      config.stream.progress_delay = std::chrono::milliseconds(parse_number<long>(arg, value(), 0, 60'000));
    } else if (arg == "--node-timeout-ms") {
      config.stream.executor.node_timeout = std::chrono::milliseconds(parse_number<long>(arg, value(), 0, 3'600'000));
    } else if (arg == "--log-level") {
      config.log_level = parse_level(value());
    } else {
      throw std::invalid_argument("Unknown option: " + std::string(arg));
    }
  }
  return config;
}

std::string usage(const std::string& program) {
  return "Usage: " + program + " [options]\n"
         "\n"
         "Serves GET /stream?prompt=<text> as a text/event-stream.\n"
         "\n"
         "Options:\n"
         "  --host <addr>              Listen address (default 0.0.0.0)\n"
         "  --port <n>                 Listen port (default 8000)\n"
         "  --workers <n>              Workflow worker threads (default: hardware threads)\n"
         "  --channel-capacity <n>     Buffered events per stream (default 16)\n"
         "  --progress-delay-ms <n>    Pause after each progress event (default 500)\n"
         "  --node-timeout-ms <n>      Per-node execution budget, 0 = off (default 0)\n"
         "  --log-level <level>        trace|debug|info|warn|error|critical|off (default info)\n"
         "  -h, --help                 Show this help\n";
}

}  // namespace agentflow
