#pragma once

#include <s2p/core/error.hpp>
#include <s2p/core/image.hpp>
#include <s2p/core/pipeline_stage.hpp>
#include <cstdint>
#include <expected>

namespace s2p::vision {

/// Resizes input image to a fixed size (the backend input size).
class ResizeStage : public s2p::core::IPipelineStage {
 public:
  ResizeStage(std::uint32_t target_width, std::uint32_t target_height);

  [[nodiscard]] std::expected<s2p::core::StageOutput, s2p::core::ServiceError>
  process(const s2p::core::Image& input) override;

 private:
  std::uint32_t target_width_;
  std::uint32_t target_height_;
};

}  // namespace s2p::vision
