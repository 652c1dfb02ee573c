// HTTP transport: GET /stream?prompt=<text> answered as a text/event-stream,
// one "data:" frame per stream event. Built on Boost.Beast, one thread per
// connection; the workflow itself runs on the StreamBridge's executor.

#ifndef AGENTFLOW_SSE_SERVER_HPP
#define AGENTFLOW_SSE_SERVER_HPP

#include <agentflow/stream_bridge.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace agentflow {

// ============================================================================
// Wire helpers
// ============================================================================

/**
 * @brief Encode a message as one event-stream frame
 * @details "data: <message>\n\n". Line breaks (CR, LF or CRLF) inside the message start a new
 *          "data:" line, so a frame never contains a blank line before its end.
 */
std::string format_frame(std::string_view message);

// Percent-decoding of a query component; '+' decodes to a space
std::string url_decode(std::string_view text);

// Path part of a request target
std::string_view target_path(std::string_view target);

// First value of @p key in the query string of @p target
std::optional<std::string> query_param(std::string_view target, std::string_view key);

// ============================================================================
// SseServer
// ============================================================================

class SessionRegistry;

struct ServerOptions {
  std::string host = "0.0.0.0";
  unsigned short port = 8000;
  // Stop on SIGINT/SIGTERM
  bool handle_signals = true;
};

class SseServer {
 public:
  /**
   * @brief Bind and listen
   * @throws boost::system::system_error if the address cannot be bound
   */
  SseServer(StreamBridge& bridge, ServerOptions options);

  SseServer(const SseServer&) = delete;
  SseServer& operator=(const SseServer&) = delete;

  // Accept connections until stop(); blocks the calling thread
  void run();

  // Thread-safe; makes run() return
  void stop();

  // Bound port (useful when constructed with port 0)
  unsigned short port() const;

  // Connections currently being served
  std::size_t active_sessions() const;

 private:
  void do_accept();

  StreamBridge& bridge_;
  ServerOptions options_;
  boost::asio::io_context ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::shared_ptr<SessionRegistry> sessions_;
};

}  // namespace agentflow

#endif  // AGENTFLOW_SSE_SERVER_HPP
