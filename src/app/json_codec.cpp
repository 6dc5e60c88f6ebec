#include <s2p/app/json_codec.hpp>
#include <s2p/core/detection_batch.hpp>
#include <string>
#include <type_traits>
#include <variant>

namespace s2p::app {

namespace sc = s2p::core;

nlohmann::json detection_to_json(const sc::Detection& detection, bool with_bbox) {
  nlohmann::json j;
  j["class_name"] = detection.class_name;
  j["confidence"] = detection.confidence;
  if (with_bbox) {
    const auto& b = detection.bbox;
    j["bbox"] = nlohmann::json::array({b.x1, b.y1, b.x2, b.y2});
  }
  return j;
}

nlohmann::json warmup_to_json(const sc::DetectionList& detections) {
  sc::DetectionList sorted = detections;
  sc::sort_by_confidence(sorted);
  nlohmann::json list = nlohmann::json::array();
  for (const auto& d : sorted) {
    list.push_back(detection_to_json(d, false));
  }
  return nlohmann::json{{"detections", std::move(list)}};
}

nlohmann::json result_to_json(const sc::ResultView& view) {
  return std::visit(
      [](const auto& v) -> nlohmann::json {
        using T = std::decay_t<decltype(v)>;
        nlohmann::json j;
        if constexpr (std::is_same_v<T, sc::NoResultYet>) {
          j["detections"] = nlohmann::json::array();
          j["timestamp"] = nullptr;
          j["message"] = std::string(kNoPredictionYet);
        } else if constexpr (std::is_same_v<T, sc::EmptyResult>) {
          j["detections"] = nlohmann::json::array();
          j["timestamp"] = sc::to_unix_seconds(v.timestamp);
          j["total_objects"] = 0;
          j["message"] = std::string(kNoObjectsDetected);
        } else {
          nlohmann::json list = nlohmann::json::array();
          for (const auto& d : v.detections) {
            list.push_back(detection_to_json(d));
          }
          j["detections"] = std::move(list);
          j["timestamp"] = sc::to_unix_seconds(v.timestamp);
          j["total_objects"] = v.detections.size();
        }
        return j;
      },
      view);
}

nlohmann::json ack_to_json() {
  return nlohmann::json{{"status", std::string(kImageReceived)}};
}

nlohmann::json error_to_json(std::string_view detail) {
  return nlohmann::json{{"detail", std::string(detail)}};
}

}  // namespace s2p::app
