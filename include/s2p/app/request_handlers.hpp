#pragma once

#include <s2p/app/pipeline_state.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string_view>

namespace s2p::app {

/// Transport-independent response: HTTP status and JSON body.
struct HandlerResponse {
  int status{200};
  nlohmann::json body;
};

/// GET /: detections for the built-in warmup image (recomputed per call).
/// 503 if the model fails on it.
[[nodiscard]] HandlerResponse handle_root(PipelineState& state);

/// POST /predict/: decode the uploaded image and hand it to the worker.
/// \p image_field is the content of the multipart field "image", if present.
/// 400 when the field is missing, 415 when the payload is not a supported image.
[[nodiscard]] HandlerResponse handle_predict(PipelineState& state,
                                             std::optional<std::string_view> image_field);

/// GET /result/: the latest published batch in one of three shapes.
[[nodiscard]] HandlerResponse handle_result(const PipelineState& state);

}  // namespace s2p::app
