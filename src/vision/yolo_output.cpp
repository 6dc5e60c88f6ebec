#include <s2p/vision/yolo_output.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <numeric>

namespace s2p::vision {

namespace {

constexpr std::int64_t kEndToEndFields = 6;
constexpr std::int64_t kBoxFields = 4;
constexpr float kMaxClassId = 1e6f;

// Non-finite or out-of-range class fields map to -1.
std::int64_t to_class_id(float v) noexcept {
  if (!std::isfinite(v) || v < 0.f || v > kMaxClassId) return -1;
  return static_cast<std::int64_t>(v);
}

InferenceResult decode_end_to_end(const float* data, std::int64_t n) {
  InferenceResult result;
  result.num_detections = static_cast<std::uint32_t>(n);
  result.boxes.reserve(static_cast<std::size_t>(n) * 4u);
  result.scores.reserve(static_cast<std::size_t>(n));
  result.class_ids.reserve(static_cast<std::size_t>(n));
  auto at = [&](std::int64_t field, std::int64_t i) { return data[i * kEndToEndFields + field]; };
  for (std::int64_t i = 0; i < n; ++i) {
    for (std::int64_t f = 0; f < kBoxFields; ++f) {
      result.boxes.push_back(at(f, i));
    }
    result.scores.push_back(at(4, i));
    result.class_ids.push_back(to_class_id(at(5, i)));
  }
  return result;
}

InferenceResult decode_raw_head(const float* data,
                                std::int64_t n,
                                std::int64_t fields,
                                bool fields_first,
                                const YoloDecodeOptions& options) {
  const std::int64_t num_classes = fields - kBoxFields;
  auto at = [&](std::int64_t field, std::int64_t i) {
    return fields_first ? data[field * n + i] : data[i * fields + field];
  };

  InferenceResult candidates;
  for (std::int64_t i = 0; i < n; ++i) {
    std::int64_t best_class = 0;
    float best_score = at(kBoxFields, i);
    for (std::int64_t c = 1; c < num_classes; ++c) {
      const float s = at(kBoxFields + c, i);
      if (s > best_score) {
        best_score = s;
        best_class = c;
      }
    }
    if (best_score < options.confidence_threshold) continue;

    const float cx = at(0, i);
    const float cy = at(1, i);
    const float w = at(2, i);
    const float h = at(3, i);
    candidates.boxes.push_back(cx - w / 2.f);
    candidates.boxes.push_back(cy - h / 2.f);
    candidates.boxes.push_back(cx + w / 2.f);
    candidates.boxes.push_back(cy + h / 2.f);
    candidates.scores.push_back(best_score);
    candidates.class_ids.push_back(best_class);
  }
  candidates.num_detections = static_cast<std::uint32_t>(candidates.scores.size());

  const auto keep = non_max_suppression(candidates, options.iou_threshold, options.max_detections);
  InferenceResult result;
  result.num_detections = static_cast<std::uint32_t>(keep.size());
  for (std::size_t k : keep) {
    result.boxes.insert(result.boxes.end(),
                        candidates.boxes.begin() + static_cast<std::ptrdiff_t>(k * 4),
                        candidates.boxes.begin() + static_cast<std::ptrdiff_t>(k * 4 + 4));
    result.scores.push_back(candidates.scores[k]);
    result.class_ids.push_back(candidates.class_ids[k]);
  }
  return result;
}

}  // namespace

float box_iou(const float* a, const float* b) noexcept {
  const float ix1 = std::max(a[0], b[0]);
  const float iy1 = std::max(a[1], b[1]);
  const float ix2 = std::min(a[2], b[2]);
  const float iy2 = std::min(a[3], b[3]);
  const float inter = std::max(0.f, ix2 - ix1) * std::max(0.f, iy2 - iy1);
  const float area_a = std::max(0.f, a[2] - a[0]) * std::max(0.f, a[3] - a[1]);
  const float area_b = std::max(0.f, b[2] - b[0]) * std::max(0.f, b[3] - b[1]);
  const float uni = area_a + area_b - inter;
  return uni > 0.f ? inter / uni : 0.f;
}

std::vector<std::size_t> non_max_suppression(const InferenceResult& candidates,
                                             float iou_threshold,
                                             std::size_t max_detections) {
  const std::size_t n = candidates.scores.size();
  std::vector<std::size_t> order(n);
  std::iota(order.begin(), order.end(), std::size_t{0});
  std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
    return candidates.scores[a] > candidates.scores[b];
  });

  std::vector<std::size_t> keep;
  std::vector<char> suppressed(n, 0);
  for (std::size_t oi = 0; oi < n && keep.size() < max_detections; ++oi) {
    const std::size_t i = order[oi];
    if (suppressed[i]) continue;
    keep.push_back(i);
    for (std::size_t oj = oi + 1; oj < n; ++oj) {
      const std::size_t j = order[oj];
      if (suppressed[j] || candidates.class_ids[j] != candidates.class_ids[i]) continue;
      if (box_iou(&candidates.boxes[i * 4], &candidates.boxes[j * 4]) > iou_threshold) {
        suppressed[j] = 1;
      }
    }
  }
  return keep;
}

std::expected<InferenceResult, s2p::core::ServiceError>
decode_yolo_output(const float* data,
                   std::span<const std::int64_t> shape,
                   const YoloDecodeOptions& options) {
  if (data == nullptr || shape.size() != 3u || shape[0] != 1) {
    return std::unexpected(s2p::core::ServiceError::InferenceFailed);
  }
  const std::int64_t a = shape[1];
  const std::int64_t b = shape[2];
  if (a <= 0 || b <= 0) {
    // Zero rows: nothing detected.
    if (a == 0 || b == 0) return InferenceResult{};
    return std::unexpected(s2p::core::ServiceError::InferenceFailed);
  }

  // Only row-major [1,N,6] is end-to-end; [1,6,N] is a two-class raw head.
  if (b == kEndToEndFields) {
    return decode_end_to_end(data, a);
  }
  // Raw head: the short axis holds 4 box fields plus class scores.
  if (a == kEndToEndFields || (a > kBoxFields && a < b)) {
    return decode_raw_head(data, b, a, true, options);
  }
  if (b > kBoxFields && b < a) {
    return decode_raw_head(data, a, b, false, options);
  }
  return std::unexpected(s2p::core::ServiceError::InferenceFailed);
}

std::vector<std::string> parse_names_metadata(std::string_view text) {
  std::map<std::size_t, std::string> names;
  std::size_t pos = 0;
  while (pos < text.size()) {
    while (pos < text.size() && !std::isdigit(static_cast<unsigned char>(text[pos]))) ++pos;
    if (pos >= text.size()) break;

    std::size_t id = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
      id = id * 10 + static_cast<std::size_t>(text[pos] - '0');
      ++pos;
    }
    while (pos < text.size() && (text[pos] == ' ' || text[pos] == ':')) ++pos;
    if (pos >= text.size() || (text[pos] != '\'' && text[pos] != '"')) continue;

    const char quote = text[pos++];
    const std::size_t end = text.find(quote, pos);
    if (end == std::string_view::npos) break;
    names[id] = std::string(text.substr(pos, end - pos));
    pos = end + 1;
  }

  std::vector<std::string> out;
  if (names.empty()) return out;
  out.resize(names.rbegin()->first + 1);
  for (auto& [id, name] : names) out[id] = std::move(name);
  return out;
}

}  // namespace s2p::vision
