#pragma once

#include <s2p/core/error.hpp>
#include <s2p/vision/inference_result.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace s2p::vision {

/// Thresholds applied when the model emits a raw detection head.
struct YoloDecodeOptions {
  float confidence_threshold{0.25f};
  float iou_threshold{0.7f};
  std::size_t max_detections{300};
};

/// Decodes a single YOLO output tensor of shape \p shape into an InferenceResult.
///
/// Supported layouts:
/// - **End-to-end** [1, N, 6]: (x1, y1, x2, y2, score, class_id) per row,
///   e.g. YOLOv10 or models exported with NMS. Rows pass through unchanged;
///   a non-finite or out-of-range class field becomes -1.
/// - **Raw head** [1, 4 + C, N] or [1, N, 4 + C], the short axis holding the
///   fields; [1, 6, N] is always a two-class head: (cx, cy, w, h, score_0 .. score_C-1),
///   e.g. YOLOv8 / YOLO11. Candidates below the confidence threshold are dropped,
///   then greedy per-class NMS is applied; the result is ordered by score.
[[nodiscard]] std::expected<InferenceResult, s2p::core::ServiceError>
decode_yolo_output(const float* data,
                   std::span<const std::int64_t> shape,
                   const YoloDecodeOptions& options);

/// Intersection over union of two [x1,y1,x2,y2] boxes.
[[nodiscard]] float box_iou(const float* a, const float* b) noexcept;

/// Greedy per-class non-maximum suppression. Returns kept indices ordered by
/// descending score.
[[nodiscard]] std::vector<std::size_t> non_max_suppression(const InferenceResult& candidates,
                                                           float iou_threshold,
                                                           std::size_t max_detections);

/// Parses the class-name table exporters embed in model metadata, formatted
/// like a Python dict: "{0: 'person', 1: 'bicycle'}". Missing ids stay empty.
[[nodiscard]] std::vector<std::string> parse_names_metadata(std::string_view text);

}  // namespace s2p::vision
