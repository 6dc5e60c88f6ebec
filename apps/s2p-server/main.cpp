/**
 * s2p-server: latest-wins object detection over HTTP.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/s2p_server [--config path] [--backend mock|onnx|tensorrt] [--model path]
 *
 * POST /predict/ (multipart field "image") queues an image; GET /result/ returns
 * the detections of the most recently completed inference.
 */

#include <s2p/app/config.hpp>
#include <s2p/app/http_server.hpp>
#include <s2p/app/pipeline_state.hpp>
#include <s2p/core/logger.hpp>
#include <s2p/vision/detection_model.hpp>

#include <pthread.h>
#include <signal.h>

#include <atomic>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace {

void print_usage() {
  std::cout << "Usage: s2p_server [options]\n"
            << "  --config <path>     Service config (key=value file); default: built-in (mock)\n"
            << "  --backend <type>    Override backend: mock | onnx | tensorrt\n"
            << "  --model <path>      Override model path (required for onnx or tensorrt)\n"
            << "  --host <addr>       Override listen address (default 0.0.0.0)\n"
            << "  --port <n>          Override listen port (default 8000)\n"
            << "  --log-level <lvl>   trace | debug | info | warn | error | critical | off\n";
}

/// Waits for SIGINT/SIGTERM on a dedicated thread. The signals must already be
/// blocked in every thread so only sigtimedwait sees them. A second signal
/// exits immediately.
class SignalWatcher {
 public:
  template <typename F>
  explicit SignalWatcher(F on_signal)
      : thread_([this, on_signal = std::move(on_signal)] {
          sigset_t set;
          sigemptyset(&set);
          sigaddset(&set, SIGINT);
          sigaddset(&set, SIGTERM);
          const timespec tick{0, 200'000'000};
          bool signalled = false;
          while (!done_.load()) {
            const int sig = sigtimedwait(&set, nullptr, &tick);
            if (sig != SIGINT && sig != SIGTERM) {
              continue;
            }
            if (signalled) {
              s2p::core::logger()->warn("received signal {} again, exiting now", sig);
              s2p::core::logger()->flush();
              std::_Exit(130);
            }
            signalled = true;
            s2p::core::logger()->info("received signal {}, shutting down", sig);
            on_signal();
          }
        }) {}

  ~SignalWatcher() {
    done_.store(true);
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  SignalWatcher(const SignalWatcher&) = delete;
  SignalWatcher& operator=(const SignalWatcher&) = delete;

 private:
  std::atomic<bool> done_{false};
  std::thread thread_;
};

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::vector<std::pair<std::string, std::string>> overrides;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    }
    if (i + 1 >= argc) {
      std::cerr << "Missing value for " << arg << "\n";
      print_usage();
      return 2;
    }
    if (arg == "--config") {
      config_path = argv[++i];
    } else if (arg == "--backend") {
      overrides.emplace_back("backend_type", argv[++i]);
    } else if (arg == "--model") {
      overrides.emplace_back("model_path", argv[++i]);
    } else if (arg == "--host") {
      overrides.emplace_back("host", argv[++i]);
    } else if (arg == "--port") {
      overrides.emplace_back("port", argv[++i]);
    } else if (arg == "--log-level") {
      overrides.emplace_back("log_level", argv[++i]);
    } else {
      std::cerr << "Unknown option " << arg << "\n";
      print_usage();
      return 2;
    }
  }

  auto loaded = config_path.empty()
                    ? std::expected<s2p::app::ServiceConfig, s2p::core::ServiceError>(
                          s2p::app::default_config())
                    : s2p::app::load_config(config_path);
  if (!loaded) {
    std::cerr << "Failed to load config " << config_path << ": "
              << s2p::core::to_string(loaded.error()) << "\n";
    return 1;
  }
  s2p::app::ServiceConfig cfg = std::move(*loaded);

  for (const auto& [key, value] : overrides) {
    if (auto applied = s2p::app::apply_setting(cfg, key, value); !applied) {
      std::cerr << "Invalid value for " << key << ": " << value << "\n";
      return 1;
    }
  }
  if (auto valid = s2p::app::validate_config(cfg); !valid) {
    std::cerr << "Invalid configuration: " << s2p::core::to_string(valid.error()) << "\n";
    return 1;
  }
  if (auto logging = s2p::core::configure_logging(cfg.logging); !logging) {
    std::cerr << "Invalid logging options (level=" << cfg.logging.level << ")\n";
    return 1;
  }

  auto log = s2p::core::logger();
  log->info("backend={} model='{}' conf={} iou={}",
            s2p::vision::to_string(cfg.model.backend_type), cfg.model.model_path,
            cfg.model.confidence_threshold, cfg.model.iou_threshold);

  // Block before any thread exists so workers and HTTP threads inherit the mask.
  sigset_t blocked;
  sigemptyset(&blocked);
  sigaddset(&blocked, SIGINT);
  sigaddset(&blocked, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &blocked, nullptr);

  auto state = s2p::app::PipelineState::create(
      std::make_unique<s2p::vision::PipelineDetectionModel>(cfg.model));
  if (!state) {
    log->critical("startup failed: {}", s2p::core::to_string(state.error()));
    return 1;
  }

  s2p::app::HttpServer server(**state, cfg.server);
  if (!server.bind()) {
    return 1;
  }

  std::atomic<bool> fatal{false};
  (*state)->start_worker([&](s2p::core::ServiceError error) {
    log->critical("inference worker stopped on {}; shutting down",
                  s2p::core::to_string(error));
    fatal.store(true);
    server.stop();
  });

  {
    SignalWatcher watcher([&] { server.stop(); });
    server.listen();
  }

  (*state)->stop();
  log->info("server stopped");
  return fatal.load() ? 1 : 0;
}
