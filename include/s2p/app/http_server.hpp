#pragma once

#include <s2p/app/config.hpp>
#include <s2p/app/pipeline_state.hpp>
#include <s2p/core/error.hpp>
#include <atomic>
#include <expected>
#include <memory>

namespace httplib {
class Server;
}

namespace s2p::app {

/// HTTP front end: GET /, POST /predict/, GET /result/ over cpp-httplib.
/// Request threads only touch the mailbox and the result store (and the model
/// mutex for GET /), so uploads never wait on a running inference.
class HttpServer {
 public:
  HttpServer(PipelineState& state, ServerConfig config);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  /// Binds the listening socket. Port 0 picks a free port. Returns the bound port.
  [[nodiscard]] std::expected<int, s2p::core::ServiceError> bind();

  /// Serves until stop(). Requires a successful bind(). Returns false at once
  /// if stop() was already called.
  bool listen();

  /// Thread-safe and idempotent; makes a running or starting listen() return
  /// and any later listen() refuse to start.
  void stop();

  /// True while the accept loop is running.
  [[nodiscard]] bool running() const;

  [[nodiscard]] int port() const noexcept { return port_; }

 private:
  void register_routes();

  PipelineState& state_;
  ServerConfig config_;
  std::unique_ptr<httplib::Server> server_;
  int port_{-1};
  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> listening_{false};
};

}  // namespace s2p::app
