#include <s2p/app/json_codec.hpp>
#include <s2p/core/detection_batch.hpp>
#include <s2p/core/result_view.hpp>
#include <gtest/gtest.h>
#include <chrono>

namespace sa = s2p::app;
namespace sc = s2p::core;

namespace {

sc::Detection person() {
  sc::Detection d;
  d.class_name = "person";
  d.confidence = 0.95f;
  d.bbox = {100.f, 50.f, 200.f, 300.f};
  return d;
}

const sc::Clock::time_point kT{std::chrono::seconds(1'700'000'000) +
                               std::chrono::milliseconds(500)};

}  // namespace

TEST(JsonCodec, DetectionWithBbox) {
  auto j = sa::detection_to_json(person());
  EXPECT_EQ(j["class_name"], "person");
  EXPECT_NEAR(j["confidence"].get<double>(), 0.95, 1e-6);
  ASSERT_TRUE(j["bbox"].is_array());
  EXPECT_EQ(j["bbox"], nlohmann::json::array({100.0, 50.0, 200.0, 300.0}));
}

TEST(JsonCodec, DetectionWithoutBbox) {
  auto j = sa::detection_to_json(person(), false);
  EXPECT_FALSE(j.contains("bbox"));
  EXPECT_EQ(j.size(), 2u);
}

TEST(JsonCodec, NoResultYetShape) {
  auto j = sa::result_to_json(sc::NoResultYet{});
  EXPECT_TRUE(j["detections"].is_array());
  EXPECT_TRUE(j["detections"].empty());
  EXPECT_TRUE(j["timestamp"].is_null());
  EXPECT_EQ(j["message"], "No prediction available yet");
  EXPECT_FALSE(j.contains("total_objects"));
}

TEST(JsonCodec, EmptyResultShape) {
  auto j = sa::result_to_json(sc::EmptyResult{kT});
  EXPECT_TRUE(j["detections"].empty());
  EXPECT_DOUBLE_EQ(j["timestamp"].get<double>(), 1'700'000'000.5);
  EXPECT_EQ(j["total_objects"], 0);
  EXPECT_EQ(j["message"], "No objects detected in the image");
}

TEST(JsonCodec, ResultShape) {
  auto j = sa::result_to_json(sc::Result{kT, {person()}});
  ASSERT_EQ(j["detections"].size(), 1u);
  EXPECT_EQ(j["detections"][0]["class_name"], "person");
  EXPECT_EQ(j["total_objects"], 1);
  EXPECT_DOUBLE_EQ(j["timestamp"].get<double>(), 1'700'000'000.5);
  EXPECT_FALSE(j.contains("message"));
}

TEST(JsonCodec, WarmupSortedByConfidence) {
  sc::Detection low = person();
  low.class_name = "cat";
  low.confidence = 0.3f;
  auto j = sa::warmup_to_json({low, person()});
  ASSERT_EQ(j["detections"].size(), 2u);
  EXPECT_EQ(j["detections"][0]["class_name"], "person");
  EXPECT_EQ(j["detections"][1]["class_name"], "cat");
  EXPECT_FALSE(j["detections"][0].contains("bbox"));
}

TEST(JsonCodec, AckAndError) {
  EXPECT_EQ(sa::ack_to_json()["status"], "Image received for prediction");
  EXPECT_EQ(sa::error_to_json("bad")["detail"], "bad");
}
