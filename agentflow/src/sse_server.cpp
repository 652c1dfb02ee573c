// Implementation file for sse_server.hpp

#include <agentflow/sse_server.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <spdlog/spdlog.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace agentflow {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

// ============================================================================
// Wire helpers
// ============================================================================

std::string format_frame(std::string_view message) {
  std::string frame;
  frame.reserve(message.size() + 8);
  frame += "data: ";
  for (std::size_t i = 0; i < message.size(); ++i) {
    char c = message[i];
    // CR, LF and CRLF all end a line on the client side
    if (c == '\r' || c == '\n') {
      if (c == '\r' && i + 1 < message.size() && message[i + 1] == '\n') {
        ++i;
      }
      frame += "\ndata: ";
    } else {
      frame += c;
    }
  }
  frame += "\n\n";
  return frame;
}

namespace {

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

std::string url_decode(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '+') {
      out += ' ';
    } else if (c == '%' && i + 2 < text.size()) {
      int hi = hex_value(text[i + 1]);
      int lo = hex_value(text[i + 2]);
      if (hi < 0 || lo < 0) {
        out += c;  // malformed escape kept as is
        continue;
      }
      out += static_cast<char>(hi * 16 + lo);
      i += 2;
    } else {
      out += c;
    }
  }
  return out;
}

std::string_view target_path(std::string_view target) {
  auto q = target.find('?');
  return q == std::string_view::npos ? target : target.substr(0, q);
}

std::optional<std::string> query_param(std::string_view target, std::string_view key) {
  auto q = target.find('?');
  if (q == std::string_view::npos) {
    return std::nullopt;
  }
  auto query = target.substr(q + 1);
  if (auto hash = query.find('#'); hash != std::string_view::npos) {
    query = query.substr(0, hash);
  }
  while (!query.empty()) {
    auto amp = query.find('&');
    auto pair = query.substr(0, amp);
    auto eq = pair.find('=');
    auto name = url_decode(pair.substr(0, eq));
    if (name == key) {
      return eq == std::string_view::npos ? std::string{} : url_decode(pair.substr(eq + 1));
    }
    if (amp == std::string_view::npos) {
      break;
    }
    query = query.substr(amp + 1);
  }
  return std::nullopt;
}

// ============================================================================
// Sessions: live connections, shut down when the server stops
// ============================================================================

class SessionRegistry {
 public:
  using Handle = tcp::socket::native_handle_type;

  // Returns the id the session deregisters with
  std::uint64_t add(Handle fd) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = next_id_++;
    fds_.emplace(id, fd);
    return id;
  }

  void remove(std::uint64_t id) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      fds_.erase(id);
    }
    cv_.notify_all();
  }

  // Unblocks every session waiting on its socket
  void shutdown_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, fd] : fds_) {
      ::shutdown(fd, SHUT_RDWR);
    }
  }

  void wait_empty() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return fds_.empty(); });
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fds_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::unordered_map<std::uint64_t, Handle> fds_;
  std::uint64_t next_id_ = 0;
};

namespace {

// ============================================================================
// HangupWatch: notices a client leaving while its stream is idle
// ============================================================================

/**
 * @brief Polls a streaming connection for the peer hanging up
 * @details A node may stay suspended for seconds without a frame being
 *          written, so a write error alone would notice a departed client
 *          late. On hangup the stream is cancelled and its channel closed.
 */
class HangupWatch {
 public:
  HangupWatch(SessionRegistry::Handle fd, StreamTask& stream)
      : thread_([this, fd, &stream] { watch(fd, stream); }) {}

  ~HangupWatch() {
    done_ = true;
    thread_.join();
  }

  HangupWatch(const HangupWatch&) = delete;
  HangupWatch& operator=(const HangupWatch&) = delete;

 private:
  void watch(SessionRegistry::Handle fd, StreamTask& stream) {
    pollfd pfd{fd, POLLRDHUP, 0};
    while (!done_) {
      int n = ::poll(&pfd, 1, 100);
      if (n < 0) {
        if (errno == EINTR) continue;
        spdlog::debug("hangup watch stopped: {}", std::strerror(errno));
        return;
      }
      if (n > 0 && (pfd.revents & (POLLRDHUP | POLLHUP | POLLERR)) != 0) {
        spdlog::info("client hung up, cancelling stream");
        stream.token().cancel();
        stream.channel().close();
        return;
      }
    }
  }

  std::atomic<bool> done_{false};
  std::thread thread_;
};

template <class Body>
void set_cors_headers(http::response<Body>& res) {
  res.set(http::field::access_control_allow_origin, "*");
  res.set(http::field::access_control_allow_methods, "*");
  res.set(http::field::access_control_allow_headers, "*");
}

std::string_view to_std(beast::string_view sv) {
  return std::string_view(sv.data(), sv.size());
}

bool write_plain(tcp::socket& socket, const http::request<http::string_body>& req,
                 http::status status, const std::string& body, beast::error_code& ec) {
  http::response<http::string_body> res{status, req.version()};
  res.set(http::field::content_type, "text/plain; charset=utf-8");
  set_cors_headers(res);
  res.keep_alive(req.keep_alive());
  res.body() = body;
  res.prepare_payload();
  http::write(socket, res, ec);
  return req.keep_alive();
}

// Streams one run as chunked text/event-stream; returns whether to keep the connection
bool write_event_stream(tcp::socket& socket, const http::request<http::string_body>& req,
                        StreamBridge& bridge, beast::error_code& ec) {
  auto prompt = query_param(to_std(req.target()), "prompt").value_or("");

  http::response<http::empty_body> res{http::status::ok, req.version()};
  res.set(http::field::content_type, "text/event-stream");
  res.set(http::field::cache_control, "no-cache");
  if (req.keep_alive()) {
    res.set(http::field::connection, "keep-alive");
  } else {
    res.keep_alive(false);
  }
  set_cors_headers(res);
  res.chunked(true);

  http::response_serializer<http::empty_body> sr{res};
  http::write_header(socket, sr, ec);
  if (ec) {
    return false;
  }

  auto stream = bridge.start(std::move(prompt));
  HangupWatch watch(socket.native_handle(), stream);
  std::size_t frames = 0;
  while (auto event = stream.channel().pop()) {
    auto frame = format_frame(event->text);
    net::write(socket, http::make_chunk(net::buffer(frame)), ec);
    if (ec) {
      spdlog::info("client went away after {} frames: {}", frames, ec.message());
      stream.token().cancel();
      stream.channel().close();
      return false;
    }
    ++frames;
  }
  if (stream.token().cancelled()) {
    spdlog::info("stream abandoned after {} frames", frames);
    return false;
  }
  net::write(socket, http::make_chunk_last(), ec);
  spdlog::debug("event stream complete: {} frames", frames);
  return !ec && req.keep_alive();
}

bool handle_request(tcp::socket& socket, const http::request<http::string_body>& req,
                    StreamBridge& bridge, beast::error_code& ec) {
  if (req.method() == http::verb::options) {
    http::response<http::empty_body> res{http::status::no_content, req.version()};
    set_cors_headers(res);
    res.keep_alive(req.keep_alive());
    res.prepare_payload();
    http::write(socket, res, ec);
    return req.keep_alive();
  }
  if (target_path(to_std(req.target())) != "/stream") {
    return write_plain(socket, req, http::status::not_found, "Not found\n", ec);
  }
  if (req.method() != http::verb::get) {
    return write_plain(socket, req, http::status::method_not_allowed, "Method not allowed\n", ec);
  }
  return write_event_stream(socket, req, bridge, ec);
}

void serve_connection(tcp::socket& socket, StreamBridge& bridge) {
  beast::error_code ec;
  auto remote = socket.remote_endpoint(ec);
  spdlog::debug("session opened from {}:{}", remote.address().to_string(), remote.port());

  beast::flat_buffer buffer;
  for (;;) {
    http::request<http::string_body> req;
    http::read(socket, buffer, req, ec);
    if (ec == http::error::end_of_stream) {
      break;
    }
    if (ec) {
      spdlog::debug("read failed: {}", ec.message());
      break;
    }
    spdlog::info("{} {}", to_std(req.method_string()), to_std(req.target()));
    bool keep_alive = handle_request(socket, req, bridge, ec);
    if (ec) {
      spdlog::debug("write failed: {}", ec.message());
      break;
    }
    if (!keep_alive) {
      break;
    }
  }
  socket.shutdown(tcp::socket::shutdown_send, ec);
  spdlog::debug("session closed");
}

// Session thread body. The socket lives on the session's own io_context and
// is destroyed before the session deregisters, so nothing here outlives the
// server once wait_empty() returns.
void serve_session(SessionRegistry::Handle fd, tcp protocol, StreamBridge& bridge,
                   std::shared_ptr<SessionRegistry> sessions, std::uint64_t id) {
  {
    net::io_context ioc;
    tcp::socket socket(ioc);
    beast::error_code ec;
    socket.assign(protocol, fd, ec);
    if (ec) {
      spdlog::warn("cannot adopt accepted connection: {}", ec.message());
      ::close(fd);
    } else {
      serve_connection(socket, bridge);
    }
  }
  sessions->remove(id);
}

}  // namespace

// ============================================================================
// SseServer implementation
// ============================================================================

SseServer::SseServer(StreamBridge& bridge, ServerOptions options)
    : bridge_(bridge), options_(std::move(options)), ioc_(1),
      acceptor_(ioc_, tcp::endpoint(net::ip::make_address(options_.host), options_.port)),
      sessions_(std::make_shared<SessionRegistry>()) {}

unsigned short SseServer::port() const {
  return acceptor_.local_endpoint().port();
}

std::size_t SseServer::active_sessions() const {
  return sessions_->size();
}

void SseServer::do_accept() {
  acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
    if (ec) {
      if (ec != net::error::operation_aborted) {
        spdlog::warn("accept failed: {}", ec.message());
      }
    } else {
      auto protocol = acceptor_.local_endpoint(ec).protocol();
      auto fd = socket.release(ec);
      if (ec) {
        spdlog::warn("cannot hand off connection: {}", ec.message());
      } else {
        auto id = sessions_->add(fd);
        std::thread(serve_session, fd, protocol, std::ref(bridge_), sessions_, id).detach();
      }
    }
    if (acceptor_.is_open()) {
      do_accept();
    }
  });
}

void SseServer::run() {
  do_accept();

  std::optional<net::signal_set> signals;
  if (options_.handle_signals) {
    signals.emplace(ioc_, SIGINT, SIGTERM);
    signals->async_wait([this](const beast::error_code& ec, int signo) {
      if (!ec) {
        spdlog::info("signal {} received, shutting down", signo);
        ioc_.stop();
      }
    });
  }

  spdlog::info("listening on http://{}:{}/stream", options_.host, port());
  ioc_.run();

  beast::error_code ec;
  acceptor_.close(ec);
  sessions_->shutdown_all();
  sessions_->wait_empty();
  spdlog::info("server stopped");
}

void SseServer::stop() {
  net::post(ioc_, [this]() { ioc_.stop(); });
}

}  // namespace agentflow
