#pragma once

#include <s2p/core/detection.hpp>
#include <s2p/core/error.hpp>
#include <s2p/core/image.hpp>
#include <s2p/core/pipeline.hpp>
#include <s2p/vision/inference_backend.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace s2p::vision {

/// Inference backend type: mock (synthetic), onnx, or tensorrt (real model).
enum class BackendType {
  Mock,
  Onnx,
  TensorRT,
};

[[nodiscard]] std::optional<BackendType> parse_backend_type(std::string_view name) noexcept;
[[nodiscard]] std::string_view to_string(BackendType type) noexcept;

/// Everything needed to build and warm up the detection model.
struct ModelOptions {
  BackendType backend_type{BackendType::Mock};
  std::string model_path;
  std::uint32_t input_width{640};   // used by mock and for dynamic-shape models
  std::uint32_t input_height{640};
  float confidence_threshold{0.25f};
  float iou_threshold{0.7f};
  std::vector<std::string> class_names;  // overrides names embedded in the model
  std::string warmup_image_path;         // empty: built-in synthetic image
  std::uint32_t warmup_width{256};
  std::uint32_t warmup_height{256};
  std::chrono::milliseconds mock_latency{0};
};

/// The Model Adapter: the opaque, expensive, single-caller detection engine.
///
/// load() must succeed before warmup()/infer(). Implementations are not
/// thread-safe; callers serialize every call.
class IDetectionModel {
 public:
  virtual ~IDetectionModel() = default;

  [[nodiscard]] virtual std::expected<void, s2p::core::ServiceError> load() = 0;

  /// Detections for the adapter's fixed warmup image.
  [[nodiscard]] virtual std::expected<s2p::core::DetectionList, s2p::core::ServiceError>
  warmup() = 0;

  /// Detections in source-image pixel coordinates, in model output order.
  [[nodiscard]] virtual std::expected<s2p::core::DetectionList, s2p::core::ServiceError>
  infer(const s2p::core::Image& image) = 0;

  /// Class names in use after load() (index = class id). Default: none.
  [[nodiscard]] virtual std::vector<std::string> class_names() const { return {}; }
};

using BackendFactory = std::function<
    std::expected<std::unique_ptr<IInferenceBackend>, s2p::core::ServiceError>(
        const ModelOptions&)>;

/// Builds the backend named by options.backend_type. Construction exceptions
/// are logged and reported as LoadFailed.
[[nodiscard]] std::expected<std::unique_ptr<IInferenceBackend>, s2p::core::ServiceError>
make_backend(const ModelOptions& options);

/// Production adapter: preprocessing pipeline (BGR->RGB, resize to the backend
/// input, scale to [0,1]) feeding a DetectionStage; boxes are mapped back to
/// the source image.
class PipelineDetectionModel : public IDetectionModel {
 public:
  explicit PipelineDetectionModel(ModelOptions options, BackendFactory factory = make_backend);

  [[nodiscard]] std::expected<void, s2p::core::ServiceError> load() override;

  [[nodiscard]] std::expected<s2p::core::DetectionList, s2p::core::ServiceError>
  warmup() override;

  [[nodiscard]] std::expected<s2p::core::DetectionList, s2p::core::ServiceError>
  infer(const s2p::core::Image& image) override;

  [[nodiscard]] bool loaded() const noexcept { return loaded_; }
  [[nodiscard]] const s2p::core::Image& warmup_image() const noexcept { return warmup_image_; }
  [[nodiscard]] std::vector<std::string> class_names() const override { return class_names_; }

 private:
  ModelOptions options_;
  BackendFactory factory_;
  s2p::core::Pipeline pipeline_;
  s2p::core::Image warmup_image_;
  std::vector<std::string> class_names_;
  std::uint32_t input_width_{0};
  std::uint32_t input_height_{0};
  bool loaded_{false};
};

}  // namespace s2p::vision
