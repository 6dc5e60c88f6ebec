#pragma once

#include <s2p/core/error.hpp>
#include <s2p/core/image.hpp>
#include <s2p/vision/inference_result.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <vector>

namespace s2p::vision {

/// Abstract inference backend: preprocessed Image -> InferenceResult.
///
/// Backends hold engine state and are not safe to call from two threads at
/// once; the pipeline serializes every call. Implement infer() and the input
/// geometry; optionally override validate_input, class_names, warmup.
class IInferenceBackend {
 public:
  virtual ~IInferenceBackend() = default;

  /// Single-image inference on a Float32Planar image of input_width() x input_height().
  [[nodiscard]] virtual std::expected<InferenceResult, s2p::core::ServiceError>
  infer(const s2p::core::Image& input) = 0;

  /// Optional: validate image format/dimensions before infer. Default: accept.
  [[nodiscard]] virtual std::expected<void, s2p::core::ServiceError>
  validate_input(const s2p::core::Image& /*input*/) const {
    return {};
  }

  /// Geometry the preprocessing stages resize to.
  [[nodiscard]] virtual std::uint32_t input_width() const noexcept = 0;
  [[nodiscard]] virtual std::uint32_t input_height() const noexcept = 0;

  /// Class names embedded in the model (index = class id). Default: none.
  [[nodiscard]] virtual std::vector<std::string> class_names() const { return {}; }

  /// Optional: one dummy inference to allocate buffers / JIT kernels. Default: no-op.
  [[nodiscard]] virtual std::expected<void, s2p::core::ServiceError> warmup() { return {}; }
};

}  // namespace s2p::vision
