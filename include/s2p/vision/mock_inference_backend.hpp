#pragma once

#include <s2p/core/detection.hpp>
#include <s2p/vision/inference_backend.hpp>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace s2p::vision {

/// Mock backend that returns configurable synthetic detections (for tests/demo).
/// Detection boxes are given in model-input coordinates. Setters may be called
/// while another thread runs infer().
class MockInferenceBackend : public IInferenceBackend {
 public:
  explicit MockInferenceBackend(std::uint32_t input_width = 640,
                                std::uint32_t input_height = 640,
                                std::vector<std::string> class_names = {});

  /// Set detections to return on the next infer() call(s).
  void set_detections(std::vector<s2p::core::Detection> detections);

  /// Make infer() fail with the given error until cleared with std::nullopt.
  void set_failure(std::optional<s2p::core::ServiceError> error);

  /// Artificial inference time, to emulate a slow model.
  void set_latency(std::chrono::milliseconds latency);

  [[nodiscard]] std::uint64_t call_count() const;

  [[nodiscard]] std::expected<InferenceResult, s2p::core::ServiceError>
  infer(const s2p::core::Image& input) override;

  [[nodiscard]] std::expected<void, s2p::core::ServiceError>
  validate_input(const s2p::core::Image& input) const override;

  [[nodiscard]] std::uint32_t input_width() const noexcept override { return input_width_; }
  [[nodiscard]] std::uint32_t input_height() const noexcept override { return input_height_; }

  [[nodiscard]] std::vector<std::string> class_names() const override { return class_names_; }

 private:
  std::uint32_t input_width_;
  std::uint32_t input_height_;
  std::vector<std::string> class_names_;

  mutable std::mutex mutex_;
  std::vector<s2p::core::Detection> detections_to_return_;
  std::optional<s2p::core::ServiceError> failure_;
  std::chrono::milliseconds latency_{0};
  std::uint64_t calls_{0};
};

}  // namespace s2p::vision
