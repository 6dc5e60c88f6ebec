#include <s2p/app/config.hpp>
#include <gtest/gtest.h>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

namespace sa = s2p::app;
namespace sv = s2p::vision;
namespace sc = s2p::core;

namespace {

class ConfigFile {
 public:
  explicit ConfigFile(const std::string& content)
      : path_(std::filesystem::temp_directory_path() /
              ("s2p_config_test_" + std::to_string(counter_++) + ".conf")) {
    std::ofstream(path_) << content;
  }
  ~ConfigFile() { std::filesystem::remove(path_); }
  std::string path() const { return path_.string(); }

 private:
  static inline int counter_ = 0;
  std::filesystem::path path_;
};

}  // namespace

TEST(Config, Defaults) {
  const auto c = sa::default_config();
  EXPECT_EQ(c.server.host, "0.0.0.0");
  EXPECT_EQ(c.server.port, 8000);
  EXPECT_EQ(c.model.backend_type, sv::BackendType::Mock);
  EXPECT_FLOAT_EQ(c.model.confidence_threshold, 0.25f);
  EXPECT_EQ(c.logging.level, "info");
  EXPECT_TRUE(sa::validate_config(c).has_value());
}

TEST(Config, LoadsKeyValueFile) {
  ConfigFile file(
      "# service\n"
      "host = 127.0.0.1\n"
      "port=9000\n"
      "\n"
      "backend_type=onnx\n"
      "model_path=/models/yolov8n.onnx\n"
      "confidence_threshold=0.4\n"
      "class_names=person, car ,dog\n"
      "mock_latency_ms=25\n"
      "log_level=debug\n"
      "some_future_key=ignored\n");
  auto c = sa::load_config(file.path());
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(c->server.host, "127.0.0.1");
  EXPECT_EQ(c->server.port, 9000);
  EXPECT_EQ(c->model.backend_type, sv::BackendType::Onnx);
  EXPECT_EQ(c->model.model_path, "/models/yolov8n.onnx");
  EXPECT_FLOAT_EQ(c->model.confidence_threshold, 0.4f);
  ASSERT_EQ(c->model.class_names.size(), 3u);
  EXPECT_EQ(c->model.class_names[1], "car");
  EXPECT_EQ(c->model.mock_latency, std::chrono::milliseconds(25));
  EXPECT_EQ(c->logging.level, "debug");
  EXPECT_TRUE(sa::validate_config(*c).has_value());
}

TEST(Config, ClassNamesFromFile) {
  ConfigFile names("person\n\nbicycle\n");
  sa::ServiceConfig c = sa::default_config();
  ASSERT_TRUE(sa::apply_setting(c, "class_names_path", names.path()).has_value());
  ASSERT_EQ(c.model.class_names.size(), 2u);
  EXPECT_EQ(c.model.class_names[1], "bicycle");
}

TEST(Config, MissingFileIsError) {
  auto c = sa::load_config("/nonexistent/s2p.conf");
  ASSERT_FALSE(c.has_value());
  EXPECT_EQ(c.error(), sc::ServiceError::InvalidConfig);
}

TEST(Config, MalformedNumberIsError) {
  ConfigFile file("port=eighty\n");
  auto c = sa::load_config(file.path());
  ASSERT_FALSE(c.has_value());
  EXPECT_EQ(c.error(), sc::ServiceError::InvalidConfig);
}

TEST(Config, RejectsOutOfRangeValues) {
  sa::ServiceConfig c = sa::default_config();
  EXPECT_FALSE(sa::apply_setting(c, "port", "70000").has_value());
  EXPECT_FALSE(sa::apply_setting(c, "input_width", "-1").has_value());
  EXPECT_FALSE(sa::apply_setting(c, "backend_type", "caffe").has_value());
  EXPECT_FALSE(sa::apply_setting(c, "confidence_threshold", "0.5x").has_value());
}

TEST(Config, ValidateRejectsRealBackendWithoutModel) {
  sa::ServiceConfig c = sa::default_config();
  c.model.backend_type = sv::BackendType::Onnx;
  EXPECT_FALSE(sa::validate_config(c).has_value());
  c.model.model_path = "model.onnx";
  EXPECT_TRUE(sa::validate_config(c).has_value());
}

TEST(Config, ValidateRejectsBadThresholds) {
  sa::ServiceConfig c = sa::default_config();
  c.model.confidence_threshold = 1.5f;
  EXPECT_FALSE(sa::validate_config(c).has_value());
  c = sa::default_config();
  c.model.iou_threshold = -0.1f;
  EXPECT_FALSE(sa::validate_config(c).has_value());
  c = sa::default_config();
  c.server.threads = 0;
  EXPECT_FALSE(sa::validate_config(c).has_value());
}
