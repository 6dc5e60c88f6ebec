#include <s2p/core/logger.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>
#include <vector>

namespace s2p::core {

namespace {

constexpr const char* kLoggerName = "s2p";
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [t%t] %v";

std::mutex g_logger_mutex;
std::shared_ptr<spdlog::logger> g_logger;

std::shared_ptr<spdlog::logger> make_console_logger() {
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto lg = std::make_shared<spdlog::logger>(kLoggerName, console_sink);
  lg->set_pattern(kPattern);
  lg->set_level(spdlog::level::info);
  lg->flush_on(spdlog::level::info);
  return lg;
}

}  // namespace

std::shared_ptr<spdlog::logger> logger() {
  std::lock_guard lock(g_logger_mutex);
  if (!g_logger) g_logger = make_console_logger();
  return g_logger;
}

std::expected<void, ServiceError> configure_logging(const LogOptions& options) {
  const auto level = spdlog::level::from_str(options.level);
  // from_str maps unknown names to off; only accept "off" when asked for.
  if (level == spdlog::level::off && options.level != "off") {
    return std::unexpected(ServiceError::InvalidConfig);
  }

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (!options.file.empty()) {
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.file, true));
    } catch (const spdlog::spdlog_ex& e) {
      logger()->error("cannot open log file {}: {}", options.file, e.what());
      return std::unexpected(ServiceError::InvalidConfig);
    }
  }

  auto lg = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  lg->set_pattern(kPattern);
  lg->set_level(level);
  lg->flush_on(spdlog::level::info);

  std::lock_guard lock(g_logger_mutex);
  g_logger = std::move(lg);
  return {};
}

}  // namespace s2p::core
