#include <s2p/app/request_handlers.hpp>
#include <s2p/app/json_codec.hpp>
#include <s2p/core/logger.hpp>
#include <s2p/core/result_view.hpp>
#include <s2p/vision/image_codec.hpp>

namespace s2p::app {

namespace sc = s2p::core;

HandlerResponse handle_root(PipelineState& state) {
  auto detections = state.run_warmup();
  if (!detections) {
    sc::logger()->error("warmup inference failed: {}", sc::to_string(detections.error()));
    return {503, error_to_json("model unavailable")};
  }
  return {200, warmup_to_json(*detections)};
}

HandlerResponse handle_predict(PipelineState& state,
                               std::optional<std::string_view> image_field) {
  if (!image_field) {
    return {400, error_to_json("missing multipart field 'image'")};
  }

  auto image = s2p::vision::decode_image(*image_field);
  if (!image) {
    sc::logger()->info("rejected upload of {} bytes: {}", image_field->size(),
                       sc::to_string(image.error()));
    return {415, error_to_json("image must be a decodable JPEG, PNG, BMP or TIFF")};
  }

  state.submit(std::move(*image));
  return {200, ack_to_json()};
}

HandlerResponse handle_result(const PipelineState& state) {
  return {200, result_to_json(sc::view_of(state.snapshot()))};
}

}  // namespace s2p::app
