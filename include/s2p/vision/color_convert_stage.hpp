#pragma once

#include <s2p/core/error.hpp>
#include <s2p/core/image.hpp>
#include <s2p/core/pipeline_stage.hpp>
#include <expected>

namespace s2p::vision {

/// Converts the image to the channel order the model expects (e.g. BGR8 -> RGB8).
class ColorConvertStage : public s2p::core::IPipelineStage {
 public:
  explicit ColorConvertStage(s2p::core::PixelFormat output_format);

  [[nodiscard]] std::expected<s2p::core::StageOutput, s2p::core::ServiceError>
  process(const s2p::core::Image& input) override;

 private:
  s2p::core::PixelFormat output_format_;
};

}  // namespace s2p::vision
