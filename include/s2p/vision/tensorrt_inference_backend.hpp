#pragma once

#include <s2p/core/error.hpp>
#include <s2p/core/image.hpp>
#include <s2p/vision/inference_backend.hpp>
#include <s2p/vision/inference_result.hpp>
#include <s2p/vision/yolo_output.hpp>
#include <memory>
#include <string>

#ifdef S2P_HAS_TENSORRT

namespace s2p::vision {

/// TensorRT inference backend: loads a serialized engine (.engine) and implements IInferenceBackend.
///
/// Expected engine: one float NCHW input and one YOLO-style output, decoded by
/// decode_yolo_output(). Input contract: Image must be Float32Planar, HWC, with
/// the engine input size; the backend copies HWC to NCHW and to the GPU.
///
/// CUDA errors that leave the context unusable (illegal address, launch failure,
/// no device) are reported as DeviceLost; everything else as InferenceFailed.
/// Requires CUDA and TensorRT at build time (-DS2P_USE_TENSORRT=ON) and a GPU at runtime.
class TensorRTInferenceBackend : public IInferenceBackend {
 public:
  /// \param engine_path Path to the serialized TensorRT engine file (.engine).
  explicit TensorRTInferenceBackend(const std::string& engine_path,
                                    YoloDecodeOptions decode_options = {});

  ~TensorRTInferenceBackend() override;

  TensorRTInferenceBackend(const TensorRTInferenceBackend&) = delete;
  TensorRTInferenceBackend& operator=(const TensorRTInferenceBackend&) = delete;

  [[nodiscard]] std::expected<InferenceResult, s2p::core::ServiceError>
  infer(const s2p::core::Image& input) override;

  [[nodiscard]] std::expected<void, s2p::core::ServiceError>
  validate_input(const s2p::core::Image& input) const override;

  [[nodiscard]] std::uint32_t input_width() const noexcept override;
  [[nodiscard]] std::uint32_t input_height() const noexcept override;

  [[nodiscard]] std::expected<void, s2p::core::ServiceError> warmup() override;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace s2p::vision

#endif  // S2P_HAS_TENSORRT
