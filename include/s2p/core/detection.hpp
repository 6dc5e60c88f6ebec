#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace s2p::core {

/// Axis-aligned bounding box in pixel coordinates of the source image.
struct BBox {
  float x1{0.f};
  float y1{0.f};
  float x2{0.f};
  float y2{0.f};

  /// Non-degenerate: x1 < x2 and y1 < y2.
  [[nodiscard]] bool valid() const noexcept { return x1 < x2 && y1 < y2; }
  [[nodiscard]] float area() const noexcept {
    return valid() ? (x2 - x1) * (y2 - y1) : 0.f;
  }
};

/// Single detected object: class, confidence in [0, 1], location.
struct Detection {
  std::string class_name;
  float confidence{0.f};
  BBox bbox{};
  std::int64_t class_id{-1};
};

using DetectionList = std::vector<Detection>;

}  // namespace s2p::core
