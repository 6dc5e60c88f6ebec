#include <s2p/app/http_server.hpp>
#include <s2p/app/json_codec.hpp>
#include <s2p/app/request_handlers.hpp>
#include <s2p/core/logger.hpp>

#include <httplib.h>

#include <chrono>
#include <optional>
#include <string_view>
#include <thread>
#include <utility>

namespace s2p::app {

namespace {

constexpr const char* kJson = "application/json";

void write(httplib::Response& res, const HandlerResponse& response) {
  res.status = response.status;
  res.set_content(response.body.dump(), kJson);
}

}  // namespace

HttpServer::HttpServer(PipelineState& state, ServerConfig config)
    : state_(state), config_(std::move(config)), server_(std::make_unique<httplib::Server>()) {
  server_->set_read_timeout(static_cast<time_t>(config_.read_timeout_sec), 0);
  server_->set_write_timeout(static_cast<time_t>(config_.write_timeout_sec), 0);
  server_->set_payload_max_length(config_.payload_max_bytes);

  const std::size_t threads = config_.threads;
  server_->new_task_queue = [threads] { return new httplib::ThreadPool(threads); };

  server_->set_logger([](const httplib::Request& req, const httplib::Response& res) {
    s2p::core::logger()->info("{} {} -> {} ({} bytes in)", req.method, req.path, res.status,
                              req.body.size());
  });

  register_routes();
}

HttpServer::~HttpServer() { stop(); }

void HttpServer::register_routes() {
  server_->Get("/", [this](const httplib::Request&, httplib::Response& res) {
    write(res, handle_root(state_));
  });

  server_->Post(R"(/predict/?)", [this](const httplib::Request& req, httplib::Response& res) {
    std::optional<std::string_view> field;
    if (req.has_file("image")) {
      const auto& file = req.get_file_value("image");
      field = std::string_view(file.content);
    }
    write(res, handle_predict(state_, field));
  });

  server_->Get(R"(/result/?)", [this](const httplib::Request&, httplib::Response& res) {
    write(res, handle_result(state_));
  });

  // Routed handlers already set a body; this fills in 404, 413 and the like.
  server_->set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (!res.body.empty()) {
      return;
    }
    const char* reason = httplib::status_message(res.status);
    res.set_content(error_to_json(reason).dump(), kJson);
  });
}

std::expected<int, s2p::core::ServiceError> HttpServer::bind() {
  if (config_.port == 0) {
    port_ = server_->bind_to_any_port(config_.host);
  } else if (server_->bind_to_port(config_.host, config_.port)) {
    port_ = config_.port;
  } else {
    port_ = -1;
  }
  if (port_ < 0) {
    s2p::core::logger()->error("cannot bind {}:{}", config_.host, config_.port);
    return std::unexpected(s2p::core::ServiceError::InvalidConfig);
  }
  s2p::core::logger()->info("listening on {}:{}", config_.host, port_);
  return port_;
}

bool HttpServer::listen() {
  if (port_ < 0) {
    return false;
  }
  // Publish listening_ before reading stop_requested_; stop() does the reverse.
  listening_.store(true);
  if (stop_requested_.load()) {
    listening_.store(false);
    return false;
  }
  const bool ok = server_->listen_after_bind();
  listening_.store(false);
  return ok;
}

bool HttpServer::running() const {
  return server_->is_running();
}

void HttpServer::stop() {
  if (stop_requested_.exchange(true)) {
    return;
  }
  // httplib ignores stop() until its accept loop is up, so wait for that or
  // for listen() to give up.
  while (server_ && listening_.load()) {
    if (server_->is_running()) {
      server_->stop();
      return;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
}

}  // namespace s2p::app
