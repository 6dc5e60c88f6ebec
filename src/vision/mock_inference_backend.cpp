#include <s2p/vision/mock_inference_backend.hpp>
#include <s2p/core/detection.hpp>
#include <s2p/core/error.hpp>
#include <cstdint>
#include <thread>
#include <vector>

namespace s2p::vision {

namespace {

InferenceResult mock_to_result(const std::vector<s2p::core::Detection>& detections) {
  InferenceResult r;
  r.num_detections = static_cast<std::uint32_t>(detections.size());
  for (const auto& d : detections) {
    r.boxes.push_back(d.bbox.x1);
    r.boxes.push_back(d.bbox.y1);
    r.boxes.push_back(d.bbox.x2);
    r.boxes.push_back(d.bbox.y2);
    r.scores.push_back(d.confidence);
    r.class_ids.push_back(d.class_id);
  }
  return r;
}

}  // namespace

MockInferenceBackend::MockInferenceBackend(std::uint32_t input_width,
                                           std::uint32_t input_height,
                                           std::vector<std::string> class_names)
    : input_width_(input_width),
      input_height_(input_height),
      class_names_(std::move(class_names)) {}

void MockInferenceBackend::set_detections(std::vector<s2p::core::Detection> detections) {
  std::lock_guard lock(mutex_);
  detections_to_return_ = std::move(detections);
}

void MockInferenceBackend::set_failure(std::optional<s2p::core::ServiceError> error) {
  std::lock_guard lock(mutex_);
  failure_ = error;
}

void MockInferenceBackend::set_latency(std::chrono::milliseconds latency) {
  std::lock_guard lock(mutex_);
  latency_ = latency;
}

std::uint64_t MockInferenceBackend::call_count() const {
  std::lock_guard lock(mutex_);
  return calls_;
}

std::expected<InferenceResult, s2p::core::ServiceError>
MockInferenceBackend::infer(const s2p::core::Image& input) {
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }

  std::chrono::milliseconds latency{0};
  std::optional<s2p::core::ServiceError> failure;
  InferenceResult result;
  {
    std::lock_guard lock(mutex_);
    ++calls_;
    latency = latency_;
    failure = failure_;
    result = mock_to_result(detections_to_return_);
  }

  if (latency.count() > 0) {
    std::this_thread::sleep_for(latency);
  }
  if (failure) {
    return std::unexpected(*failure);
  }
  return result;
}

std::expected<void, s2p::core::ServiceError>
MockInferenceBackend::validate_input(const s2p::core::Image& input) const {
  if (input.empty()) {
    return std::unexpected(s2p::core::ServiceError::InvalidImage);
  }
  return {};
}

}  // namespace s2p::vision
