#pragma once

#include <s2p/core/error.hpp>
#include <s2p/core/image.hpp>
#include <s2p/core/pipeline_stage.hpp>
#include <s2p/vision/detection_decoder.hpp>
#include <s2p/vision/inference_backend.hpp>
#include <expected>
#include <memory>

namespace s2p::vision {

/// Pipeline stage: run inference backend + decoder -> DetectionList
/// (boxes in backend input coordinates).
class DetectionStage : public s2p::core::IPipelineStage {
 public:
  DetectionStage(std::unique_ptr<IInferenceBackend> backend, DetectionDecoder decoder);

  [[nodiscard]] std::expected<s2p::core::StageOutput, s2p::core::ServiceError>
  process(const s2p::core::Image& input) override;

  [[nodiscard]] IInferenceBackend& backend() noexcept { return *backend_; }

 private:
  std::unique_ptr<IInferenceBackend> backend_;
  DetectionDecoder decoder_;
};

}  // namespace s2p::vision
