#pragma once

#include <s2p/core/detection.hpp>
#include <s2p/core/result_view.hpp>
#include <nlohmann/json.hpp>
#include <string_view>

namespace s2p::app {

inline constexpr std::string_view kImageReceived = "Image received for prediction";
inline constexpr std::string_view kNoPredictionYet = "No prediction available yet";
inline constexpr std::string_view kNoObjectsDetected = "No objects detected in the image";

/// {class_name, confidence, bbox: [x1, y1, x2, y2]}; bbox omitted when with_bbox is false.
[[nodiscard]] nlohmann::json detection_to_json(const s2p::core::Detection& detection,
                                               bool with_bbox = true);

/// GET / body: {detections: [{class_name, confidence}]}, highest confidence first.
[[nodiscard]] nlohmann::json warmup_to_json(const s2p::core::DetectionList& detections);

/// GET /result/ body, one shape per ResultView alternative:
///   Result      -> {detections, timestamp, total_objects}
///   EmptyResult -> {detections: [], timestamp, total_objects: 0, message}
///   NoResultYet -> {detections: [], timestamp: null, message}
[[nodiscard]] nlohmann::json result_to_json(const s2p::core::ResultView& view);

/// POST /predict/ acknowledgement.
[[nodiscard]] nlohmann::json ack_to_json();

/// Error body: {detail}.
[[nodiscard]] nlohmann::json error_to_json(std::string_view detail);

}  // namespace s2p::app
