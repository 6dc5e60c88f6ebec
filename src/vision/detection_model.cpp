#include <s2p/vision/detection_model.hpp>
#include <s2p/core/logger.hpp>
#include <s2p/vision/color_convert_stage.hpp>
#include <s2p/vision/detection_decoder.hpp>
#include <s2p/vision/detection_stage.hpp>
#include <s2p/vision/image_codec.hpp>
#include <s2p/vision/mock_inference_backend.hpp>
#include <s2p/vision/normalize_stage.hpp>
#include <s2p/vision/onnx_inference_backend.hpp>
#include <s2p/vision/resize_stage.hpp>
#ifdef S2P_HAS_TENSORRT
#include <s2p/vision/tensorrt_inference_backend.hpp>
#endif
#include <exception>
#include <utility>

namespace s2p::vision {

namespace sc = s2p::core;

namespace {

/// What the mock backend reports when no model is configured: one person,
/// placed relative to the backend input size.
std::unique_ptr<MockInferenceBackend> make_demo_mock(const ModelOptions& options) {
  auto mock = std::make_unique<MockInferenceBackend>(
      options.input_width, options.input_height, std::vector<std::string>{"person"});
  const float w = static_cast<float>(options.input_width);
  const float h = static_cast<float>(options.input_height);
  sc::Detection person;
  person.class_id = 0;
  person.confidence = 0.95f;
  person.bbox = {0.25f * w, 0.125f * h, 0.5f * w, 0.75f * h};
  mock->set_detections({person});
  mock->set_latency(options.mock_latency);
  return mock;
}

}  // namespace

std::optional<BackendType> parse_backend_type(std::string_view name) noexcept {
  if (name == "mock") return BackendType::Mock;
  if (name == "onnx") return BackendType::Onnx;
  if (name == "tensorrt") return BackendType::TensorRT;
  return std::nullopt;
}

std::string_view to_string(BackendType type) noexcept {
  switch (type) {
    case BackendType::Mock:
      return "mock";
    case BackendType::Onnx:
      return "onnx";
    case BackendType::TensorRT:
      return "tensorrt";
  }
  return "unknown";
}

std::expected<std::unique_ptr<IInferenceBackend>, sc::ServiceError>
make_backend(const ModelOptions& options) {
  const YoloDecodeOptions decode{options.confidence_threshold, options.iou_threshold};
  try {
    switch (options.backend_type) {
      case BackendType::Mock:
        return make_demo_mock(options);
      case BackendType::Onnx:
        return std::make_unique<OnnxInferenceBackend>(options.model_path, decode,
                                                      options.input_width, options.input_height);
      case BackendType::TensorRT:
#ifdef S2P_HAS_TENSORRT
        return std::make_unique<TensorRTInferenceBackend>(options.model_path, decode);
#else
        sc::logger()->error("tensorrt backend not available (build with -DS2P_USE_TENSORRT=ON)");
        return std::unexpected(sc::ServiceError::LoadFailed);
#endif
    }
  } catch (const std::exception& e) {
    sc::logger()->error("cannot load {} model '{}': {}", to_string(options.backend_type),
                        options.model_path, e.what());
    return std::unexpected(sc::ServiceError::LoadFailed);
  }
  return std::unexpected(sc::ServiceError::InvalidConfig);
}

PipelineDetectionModel::PipelineDetectionModel(ModelOptions options, BackendFactory factory)
    : options_(std::move(options)), factory_(std::move(factory)) {}

std::expected<void, sc::ServiceError> PipelineDetectionModel::load() {
  if (loaded_) return {};

  auto backend = factory_(options_);
  if (!backend) {
    return std::unexpected(backend.error());
  }
  if (!*backend) {
    return std::unexpected(sc::ServiceError::LoadFailed);
  }

  if (auto warm = (*backend)->warmup(); !warm) {
    sc::logger()->error("backend warmup failed: {}", sc::to_string(warm.error()));
    return std::unexpected(sc::ServiceError::LoadFailed);
  }

  if (options_.warmup_image_path.empty()) {
    warmup_image_ = make_warmup_image(options_.warmup_width, options_.warmup_height);
  } else {
    auto image = load_image_file(options_.warmup_image_path);
    if (!image) {
      sc::logger()->error("cannot load warmup image '{}': {}", options_.warmup_image_path,
                          sc::to_string(image.error()));
      return std::unexpected(sc::ServiceError::LoadFailed);
    }
    warmup_image_ = std::move(*image);
  }

  input_width_ = (*backend)->input_width();
  input_height_ = (*backend)->input_height();
  class_names_ = options_.class_names.empty() ? (*backend)->class_names() : options_.class_names;

  pipeline_ = sc::Pipeline();
  pipeline_.add_stage(std::make_unique<ColorConvertStage>(sc::PixelFormat::RGB8));
  pipeline_.add_stage(std::make_unique<ResizeStage>(input_width_, input_height_));
  pipeline_.add_stage(std::make_unique<NormalizeStage>(0.f, 1.f / 255.f));
  pipeline_.add_stage(std::make_unique<DetectionStage>(
      std::move(*backend), DetectionDecoder(options_.confidence_threshold, class_names_)));

  loaded_ = true;
  sc::logger()->info("{} model ready: input {}x{}, {} classes, threshold {:.2f}",
                     to_string(options_.backend_type), input_width_, input_height_,
                     class_names_.size(), options_.confidence_threshold);
  return {};
}

std::expected<sc::DetectionList, sc::ServiceError> PipelineDetectionModel::warmup() {
  return infer(warmup_image_);
}

std::expected<sc::DetectionList, sc::ServiceError>
PipelineDetectionModel::infer(const sc::Image& image) {
  if (!loaded_) {
    return std::unexpected(sc::ServiceError::NotLoaded);
  }
  if (!image.is_consistent()) {
    return std::unexpected(sc::ServiceError::InvalidImage);
  }

  auto detections = pipeline_.run(image);
  if (!detections) {
    return std::unexpected(detections.error());
  }
  rescale_detections(*detections, input_width_, input_height_, image.width(), image.height());
  return std::move(*detections);
}

}  // namespace s2p::vision
