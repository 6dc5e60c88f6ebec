#include <s2p/app/pipeline_state.hpp>
#include <gtest/gtest.h>
#include "fake_detection_model.hpp"
#include <atomic>
#include <memory>
#include <thread>
#include <type_traits>
#include <vector>

namespace sa = s2p::app;
namespace sc = s2p::core;
namespace st = s2p::test;

TEST(PipelineState, CreateLoadsAndWarmsUp) {
  auto probe = std::make_shared<st::Probe>();
  auto state = sa::PipelineState::create(std::make_unique<st::FakeDetectionModel>(probe));
  ASSERT_TRUE(state.has_value());
  EXPECT_EQ(probe->warmup_calls, 1);
  EXPECT_EQ((*state)->startup_detections().size(), 2u);
  EXPECT_EQ((*state)->snapshot(), nullptr);
}

TEST(PipelineState, OnlyCreateConstructs) {
  static_assert(
      !std::is_constructible_v<sa::PipelineState, std::unique_ptr<s2p::vision::IDetectionModel>>);
  static_assert(!std::is_copy_constructible_v<sa::PipelineState>);
  auto probe = std::make_shared<st::Probe>();
  auto state = sa::PipelineState::create(std::make_unique<st::FakeDetectionModel>(probe));
  ASSERT_TRUE(state.has_value());
  EXPECT_NE(state->get(), nullptr);
}

TEST(PipelineState, LoadFailureIsStartupFailure) {
  auto probe = std::make_shared<st::Probe>();
  probe->load_error = sc::ServiceError::LoadFailed;
  auto state = sa::PipelineState::create(std::make_unique<st::FakeDetectionModel>(probe));
  ASSERT_FALSE(state.has_value());
  EXPECT_EQ(state.error(), sc::ServiceError::LoadFailed);
}

TEST(PipelineState, WarmupFailureIsStartupFailure) {
  auto probe = std::make_shared<st::Probe>();
  probe->warmup_error = sc::ServiceError::InferenceFailed;
  auto state = sa::PipelineState::create(std::make_unique<st::FakeDetectionModel>(probe));
  ASSERT_FALSE(state.has_value());
  EXPECT_EQ(state.error(), sc::ServiceError::InferenceFailed);
}

TEST(PipelineState, NullModelRejected) {
  auto state = sa::PipelineState::create(nullptr);
  ASSERT_FALSE(state.has_value());
  EXPECT_EQ(state.error(), sc::ServiceError::InvalidConfig);
}

TEST(PipelineState, SubmitIsProcessedByWorker) {
  auto probe = std::make_shared<st::Probe>();
  auto state = sa::PipelineState::create(std::make_unique<st::FakeDetectionModel>(probe));
  ASSERT_TRUE(state.has_value());
  (*state)->start_worker();
  EXPECT_FALSE((*state)->submit(st::make_image(250)));
  ASSERT_TRUE(st::wait_until([&] { return (*state)->snapshot() != nullptr; }));
  EXPECT_FLOAT_EQ((*state)->snapshot()->detections[0].confidence, 0.25f);
}

TEST(PipelineState, WarmupCallsAndWorkerNeverOverlap) {
  auto probe = std::make_shared<st::Probe>();
  probe->respond = [](const sc::Image& image) -> st::InferResult {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
    return st::Probe::width_response(image);
  };
  auto created = sa::PipelineState::create(std::make_unique<st::FakeDetectionModel>(probe));
  ASSERT_TRUE(created.has_value());
  auto& state = **created;
  state.start_worker();

  std::atomic<bool> stop{false};
  std::vector<std::thread> threads;
  for (int t = 0; t < 3; ++t) {
    threads.emplace_back([&] {
      while (!stop) {
        auto warm = state.run_warmup();
        EXPECT_TRUE(warm.has_value());
      }
    });
  }
  for (std::uint32_t i = 1; i <= 40; ++i) {
    state.submit(st::make_image(i));
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  stop = true;
  for (auto& t : threads) t.join();
  state.stop();

  std::lock_guard lock(probe->mutex);
  EXPECT_EQ(probe->max_active, 1);
  EXPECT_GT(probe->warmup_calls, 1);
}

TEST(PipelineState, StopIsIdempotent) {
  auto probe = std::make_shared<st::Probe>();
  auto state = sa::PipelineState::create(std::make_unique<st::FakeDetectionModel>(probe));
  ASSERT_TRUE(state.has_value());
  (*state)->start_worker();
  (*state)->stop();
  (*state)->stop();
  EXPECT_TRUE((*state)->mailbox().closed());
}
