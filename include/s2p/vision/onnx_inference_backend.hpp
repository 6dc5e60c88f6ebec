#pragma once

#include <s2p/core/error.hpp>
#include <s2p/core/image.hpp>
#include <s2p/vision/inference_backend.hpp>
#include <s2p/vision/inference_result.hpp>
#include <s2p/vision/yolo_output.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace s2p::vision {

/// ONNX Runtime inference backend: loads a YOLO-style ONNX detector and
/// implements IInferenceBackend.
///
/// Expected model: one float image input, NCHW [1,3,H,W] or NHWC [1,H,W,3], and
/// one output decoded by decode_yolo_output() (end-to-end [1,N,6] or raw head
/// [1,4+C,N]). If the input size is dynamic, \p fallback_width x \p fallback_height
/// is used. Class names are read from the model's "names" metadata when present.
///
/// Input contract: Image must be Float32Planar, HWC, with the model input size.
/// The backend transposes HWC -> NCHW when the model expects NCHW.
/// Throws Ort::Exception or std::runtime_error when the model cannot be loaded.
class OnnxInferenceBackend : public IInferenceBackend {
 public:
  OnnxInferenceBackend(const std::string& model_path,
                       YoloDecodeOptions decode_options = {},
                       std::uint32_t fallback_width = 640,
                       std::uint32_t fallback_height = 640);

  ~OnnxInferenceBackend() override;

  OnnxInferenceBackend(const OnnxInferenceBackend&) = delete;
  OnnxInferenceBackend& operator=(const OnnxInferenceBackend&) = delete;

  [[nodiscard]] std::expected<InferenceResult, s2p::core::ServiceError>
  infer(const s2p::core::Image& input) override;

  [[nodiscard]] std::expected<void, s2p::core::ServiceError>
  validate_input(const s2p::core::Image& input) const override;

  [[nodiscard]] std::uint32_t input_width() const noexcept override;
  [[nodiscard]] std::uint32_t input_height() const noexcept override;

  [[nodiscard]] std::vector<std::string> class_names() const override;

  [[nodiscard]] std::expected<void, s2p::core::ServiceError> warmup() override;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace s2p::vision
