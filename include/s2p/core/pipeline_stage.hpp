#pragma once

#include <s2p/core/detection.hpp>
#include <s2p/core/error.hpp>
#include <s2p/core/image.hpp>
#include <expected>
#include <variant>

namespace s2p::core {

/// Output of a pipeline stage: either a transformed Image or final detections.
using StageOutput = std::variant<Image, DetectionList>;

/// Abstract pipeline stage: process one Image, return Image (continue) or
/// DetectionList (done).
class IPipelineStage {
 public:
  virtual ~IPipelineStage() = default;

  [[nodiscard]] virtual std::expected<StageOutput, ServiceError> process(
      const Image& input) = 0;
};

}  // namespace s2p::core
