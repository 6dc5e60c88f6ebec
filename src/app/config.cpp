#include <s2p/app/config.hpp>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace s2p::app {

namespace {

using s2p::core::ServiceError;

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

std::vector<std::string> split_names(const std::string& value) {
  std::vector<std::string> names;
  std::stringstream ss(value);
  std::string item;
  while (std::getline(ss, item, ',')) {
    trim(item);
    names.push_back(item);
  }
  return names;
}

std::expected<std::vector<std::string>, ServiceError> read_names_file(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::unexpected(ServiceError::InvalidConfig);
  std::vector<std::string> names;
  std::string line;
  while (std::getline(f, line)) {
    trim(line);
    if (!line.empty()) names.push_back(line);
  }
  return names;
}

/// std::stoul accepts leading '-' and wraps; reject it explicitly.
std::uint64_t to_unsigned(const std::string& value, std::uint64_t max) {
  if (!value.empty() && value.front() == '-') throw std::out_of_range(value);
  std::size_t used = 0;
  const unsigned long long v = std::stoull(value, &used);
  if (used != value.size() || v > max) throw std::out_of_range(value);
  return v;
}

float to_float(const std::string& value) {
  std::size_t used = 0;
  const float v = std::stof(value, &used);
  if (used != value.size()) throw std::invalid_argument(value);
  return v;
}

}  // namespace

ServiceConfig default_config() {
  return ServiceConfig{};
}

std::expected<void, ServiceError>
apply_setting(ServiceConfig& c, const std::string& key, const std::string& value) {
  constexpr auto u32 = std::numeric_limits<std::uint32_t>::max();
  try {
    if (key == "host") c.server.host = value;
    else if (key == "port") c.server.port = static_cast<std::uint16_t>(to_unsigned(value, 65535));
    else if (key == "read_timeout_sec") c.server.read_timeout_sec = static_cast<std::uint32_t>(to_unsigned(value, u32));
    else if (key == "write_timeout_sec") c.server.write_timeout_sec = static_cast<std::uint32_t>(to_unsigned(value, u32));
    else if (key == "payload_max_bytes") c.server.payload_max_bytes = static_cast<std::size_t>(to_unsigned(value, std::numeric_limits<std::size_t>::max()));
    else if (key == "server_threads") c.server.threads = static_cast<std::size_t>(to_unsigned(value, 1024));
    else if (key == "backend_type") {
      auto type = s2p::vision::parse_backend_type(value);
      if (!type) return std::unexpected(ServiceError::InvalidConfig);
      c.model.backend_type = *type;
    }
    else if (key == "model_path") c.model.model_path = value;
    else if (key == "input_width") c.model.input_width = static_cast<std::uint32_t>(to_unsigned(value, u32));
    else if (key == "input_height") c.model.input_height = static_cast<std::uint32_t>(to_unsigned(value, u32));
    else if (key == "confidence_threshold") c.model.confidence_threshold = to_float(value);
    else if (key == "iou_threshold") c.model.iou_threshold = to_float(value);
    else if (key == "class_names") c.model.class_names = split_names(value);
    else if (key == "class_names_path") {
      auto names = read_names_file(value);
      if (!names) return std::unexpected(names.error());
      c.model.class_names = std::move(*names);
    }
    else if (key == "warmup_image_path") c.model.warmup_image_path = value;
    else if (key == "warmup_width") c.model.warmup_width = static_cast<std::uint32_t>(to_unsigned(value, u32));
    else if (key == "warmup_height") c.model.warmup_height = static_cast<std::uint32_t>(to_unsigned(value, u32));
    else if (key == "mock_latency_ms") c.model.mock_latency = std::chrono::milliseconds(to_unsigned(value, u32));
    else if (key == "log_level") c.logging.level = value;
    else if (key == "log_file") c.logging.file = value;
  } catch (const std::logic_error&) {
    // std::invalid_argument / std::out_of_range from the numeric parsers
    return std::unexpected(ServiceError::InvalidConfig);
  }
  return {};
}

std::expected<ServiceConfig, ServiceError> load_config(const std::string& path) {
  ServiceConfig c = default_config();
  std::ifstream f(path);
  if (!f) return std::unexpected(ServiceError::InvalidConfig);

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;
    if (auto applied = apply_setting(c, key, value); !applied) {
      s2p::core::logger()->error("config {}: bad value for '{}': '{}'", path, key, value);
      return std::unexpected(applied.error());
    }
  }
  return c;
}

std::expected<void, ServiceError> validate_config(const ServiceConfig& c) {
  const auto& m = c.model;
  if (c.server.port == 0 || c.server.threads == 0 || c.server.payload_max_bytes == 0) {
    return std::unexpected(ServiceError::InvalidConfig);
  }
  if (m.input_width == 0 || m.input_height == 0 || m.warmup_width == 0 || m.warmup_height == 0) {
    return std::unexpected(ServiceError::InvalidConfig);
  }
  if (m.confidence_threshold < 0.f || m.confidence_threshold > 1.f ||
      m.iou_threshold < 0.f || m.iou_threshold > 1.f) {
    return std::unexpected(ServiceError::InvalidConfig);
  }
  if (m.backend_type != s2p::vision::BackendType::Mock && m.model_path.empty()) {
    return std::unexpected(ServiceError::InvalidConfig);
  }
  return {};
}

}  // namespace s2p::app
