#include <s2p/vision/detection_stage.hpp>

namespace s2p::vision {

DetectionStage::DetectionStage(std::unique_ptr<IInferenceBackend> backend,
                               DetectionDecoder decoder)
    : backend_(std::move(backend)), decoder_(std::move(decoder)) {}

std::expected<s2p::core::StageOutput, s2p::core::ServiceError>
DetectionStage::process(const s2p::core::Image& input) {
  auto valid = backend_->validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  auto result = backend_->infer(input);
  if (!result) {
    return std::unexpected(result.error());
  }
  return s2p::core::StageOutput{decoder_.decode(*result)};
}

}  // namespace s2p::vision
