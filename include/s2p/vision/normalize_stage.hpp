#pragma once

#include <s2p/core/error.hpp>
#include <s2p/core/image.hpp>
#include <s2p/core/pipeline_stage.hpp>
#include <expected>

namespace s2p::vision {

/// Converts a 3-channel 8-bit image to Float32Planar: out = (in - mean) * scale.
class NormalizeStage : public s2p::core::IPipelineStage {
 public:
  NormalizeStage(float mean, float scale);

  [[nodiscard]] std::expected<s2p::core::StageOutput, s2p::core::ServiceError>
  process(const s2p::core::Image& input) override;

 private:
  float mean_;
  float scale_;
};

}  // namespace s2p::vision
