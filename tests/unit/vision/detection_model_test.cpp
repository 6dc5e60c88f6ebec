#include <s2p/core/error.hpp>
#include <s2p/core/image.hpp>
#include <s2p/vision/detection_model.hpp>
#include <s2p/vision/image_codec.hpp>
#include <s2p/vision/mock_inference_backend.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <vector>

namespace sv = s2p::vision;
namespace sc = s2p::core;

namespace {

sv::ModelOptions mock_options(std::uint32_t w = 640, std::uint32_t h = 640) {
  sv::ModelOptions options;
  options.backend_type = sv::BackendType::Mock;
  options.input_width = w;
  options.input_height = h;
  return options;
}

}  // namespace

TEST(DetectionModel, ParseBackendType) {
  EXPECT_EQ(sv::parse_backend_type("mock"), sv::BackendType::Mock);
  EXPECT_EQ(sv::parse_backend_type("onnx"), sv::BackendType::Onnx);
  EXPECT_EQ(sv::parse_backend_type("tensorrt"), sv::BackendType::TensorRT);
  EXPECT_FALSE(sv::parse_backend_type("caffe").has_value());
  EXPECT_EQ(sv::to_string(sv::BackendType::Onnx), "onnx");
}

TEST(DetectionModel, InferBeforeLoadIsNotLoaded) {
  sv::PipelineDetectionModel model(mock_options());
  auto out = model.infer(sv::make_warmup_image(8, 8));
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error(), sc::ServiceError::NotLoaded);
}

TEST(DetectionModel, DemoMockDetectsPersonInSourceCoordinates) {
  sv::PipelineDetectionModel model(mock_options());
  ASSERT_TRUE(model.load().has_value());
  EXPECT_TRUE(model.loaded());
  ASSERT_EQ(model.class_names().size(), 1u);

  auto out = model.infer(sv::make_warmup_image(400, 400));
  ASSERT_TRUE(out.has_value());
  ASSERT_EQ(out->size(), 1u);
  const auto& d = (*out)[0];
  EXPECT_EQ(d.class_name, "person");
  EXPECT_FLOAT_EQ(d.confidence, 0.95f);
  EXPECT_FLOAT_EQ(d.bbox.x1, 100.f);
  EXPECT_FLOAT_EQ(d.bbox.y1, 50.f);
  EXPECT_FLOAT_EQ(d.bbox.x2, 200.f);
  EXPECT_FLOAT_EQ(d.bbox.y2, 300.f);
}

TEST(DetectionModel, WarmupUsesBuiltInImage) {
  auto options = mock_options();
  options.warmup_width = 128;
  options.warmup_height = 64;
  sv::PipelineDetectionModel model(options);
  ASSERT_TRUE(model.load().has_value());
  EXPECT_EQ(model.warmup_image().width(), 128u);
  EXPECT_EQ(model.warmup_image().height(), 64u);
  auto out = model.warmup();
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->size(), 1u);
}

TEST(DetectionModel, MissingWarmupImageFailsLoad) {
  auto options = mock_options();
  options.warmup_image_path = "no_such_warmup_image_for_s2p_tests.jpg";
  sv::PipelineDetectionModel model(options);
  auto loaded = model.load();
  ASSERT_FALSE(loaded.has_value());
  EXPECT_EQ(loaded.error(), sc::ServiceError::LoadFailed);
}

TEST(DetectionModel, InconsistentImageRejected) {
  sv::PipelineDetectionModel model(mock_options());
  ASSERT_TRUE(model.load().has_value());
  std::vector<std::byte> buf(3);
  auto out = model.infer(sc::Image(10, 10, sc::PixelFormat::BGR8, std::move(buf)));
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error(), sc::ServiceError::InvalidImage);
}

TEST(DetectionModel, BackendFailurePropagates) {
  sv::MockInferenceBackend* raw = nullptr;
  sv::BackendFactory factory = [&raw](const sv::ModelOptions&)
      -> std::expected<std::unique_ptr<sv::IInferenceBackend>, sc::ServiceError> {
    auto mock = std::make_unique<sv::MockInferenceBackend>(32, 32);
    raw = mock.get();
    return mock;
  };
  sv::PipelineDetectionModel model(mock_options(), factory);
  ASSERT_TRUE(model.load().has_value());
  ASSERT_NE(raw, nullptr);

  raw->set_failure(sc::ServiceError::DeviceLost);
  auto out = model.infer(sv::make_warmup_image(32, 32));
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error(), sc::ServiceError::DeviceLost);
}

TEST(DetectionModel, ConfiguredClassNamesOverrideBackend) {
  auto options = mock_options();
  options.class_names = {"pedestrian"};
  sv::PipelineDetectionModel model(options);
  ASSERT_TRUE(model.load().has_value());
  auto out = model.infer(sv::make_warmup_image(64, 64));
  ASSERT_TRUE(out.has_value());
  ASSERT_EQ(out->size(), 1u);
  EXPECT_EQ((*out)[0].class_name, "pedestrian");
}

TEST(DetectionModel, FactoryErrorFailsLoad) {
  sv::BackendFactory factory = [](const sv::ModelOptions&)
      -> std::expected<std::unique_ptr<sv::IInferenceBackend>, sc::ServiceError> {
    return std::unexpected(sc::ServiceError::LoadFailed);
  };
  sv::PipelineDetectionModel model(mock_options(), factory);
  auto loaded = model.load();
  ASSERT_FALSE(loaded.has_value());
  EXPECT_EQ(loaded.error(), sc::ServiceError::LoadFailed);
}

#ifndef S2P_HAS_TENSORRT
TEST(DetectionModel, TensorRTUnavailableWithoutBuildFlag) {
  auto options = mock_options();
  options.backend_type = sv::BackendType::TensorRT;
  options.model_path = "model.engine";
  auto backend = sv::make_backend(options);
  ASSERT_FALSE(backend.has_value());
  EXPECT_EQ(backend.error(), sc::ServiceError::LoadFailed);
}
#endif
