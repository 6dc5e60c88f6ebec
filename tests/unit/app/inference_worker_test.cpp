#include <s2p/app/inference_worker.hpp>
#include <s2p/core/detection_batch.hpp>
#include <s2p/core/ingestion_mailbox.hpp>
#include <s2p/core/result_store.hpp>
#include <gtest/gtest.h>
#include "fake_detection_model.hpp"
#include <atomic>
#include <memory>
#include <stdexcept>

namespace sa = s2p::app;
namespace sc = s2p::core;
namespace st = s2p::test;

namespace {

class InferenceWorkerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    probe = std::make_shared<st::Probe>();
    model = std::make_unique<st::FakeDetectionModel>(probe);
    ASSERT_TRUE(model->load().has_value());
  }

  sa::InferFn infer_fn() {
    return [this](const sc::Image& image) { return model->infer(image); };
  }

  std::shared_ptr<st::Probe> probe;
  std::unique_ptr<st::FakeDetectionModel> model;
  sc::IngestionMailbox mailbox;
  sc::ResultStore store;
};

}  // namespace

TEST_F(InferenceWorkerTest, PublishesSortedBatch) {
  probe->respond = [](const sc::Image&) -> st::InferResult {
    return sc::DetectionList{st::make_detection("a", 0.3f), st::make_detection("b", 0.9f),
                             st::make_detection("c", 0.5f)};
  };
  sa::InferenceWorker worker(mailbox, store, infer_fn());
  worker.start();
  mailbox.submit(st::make_image(10));
  ASSERT_TRUE(st::wait_until([&] { return store.version() == 1; }));

  auto snap = store.snapshot();
  ASSERT_NE(snap, nullptr);
  ASSERT_EQ(snap->detections.size(), 3u);
  EXPECT_EQ(snap->detections[0].class_name, "b");
  EXPECT_EQ(snap->detections[1].class_name, "c");
  EXPECT_EQ(snap->detections[2].class_name, "a");
  EXPECT_EQ(worker.published_count(), 1u);
}

TEST_F(InferenceWorkerTest, LatestSubmissionWinsWhileBusy) {
  probe->close_gate();
  sa::InferenceWorker worker(mailbox, store, infer_fn());
  worker.start();

  mailbox.submit(st::make_image(100));
  ASSERT_TRUE(probe->wait_for_waiting(1));  // image 100 is in flight
  mailbox.submit(st::make_image(200));
  mailbox.submit(st::make_image(300));
  mailbox.submit(st::make_image(400));
  probe->open_gate();

  ASSERT_TRUE(st::wait_until([&] { return store.version() == 2; }));
  EXPECT_EQ(probe->widths(), (std::vector<std::uint32_t>{100, 400}));
  auto snap = store.snapshot();
  ASSERT_NE(snap, nullptr);
  EXPECT_FLOAT_EQ(snap->detections[0].confidence, 0.4f);
  EXPECT_EQ(mailbox.discarded_count(), 2u);
}

TEST_F(InferenceWorkerTest, NeverRunsTwoInferencesAtOnce) {
  probe->respond = [](const sc::Image& image) -> st::InferResult {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
    return st::Probe::width_response(image);
  };
  sa::InferenceWorker worker(mailbox, store, infer_fn());
  worker.start();

  std::vector<std::thread> submitters;
  for (int t = 0; t < 4; ++t) {
    submitters.emplace_back([&, t] {
      for (std::uint32_t i = 1; i <= 50; ++i) mailbox.submit(st::make_image(i + 100 * t));
    });
  }
  for (auto& s : submitters) s.join();
  ASSERT_TRUE(st::wait_until([&] { return !mailbox.has_pending() && probe->widths().size() ==
                                                                      worker.claimed_count(); }));
  worker.stop();

  std::lock_guard lock(probe->mutex);
  EXPECT_EQ(probe->max_active, 1);
  EXPECT_EQ(mailbox.submitted_count(), 200u);
  EXPECT_EQ(worker.claimed_count() + mailbox.discarded_count(), 200u);
}

TEST_F(InferenceWorkerTest, FailureKeepsPreviousBatch) {
  sa::InferenceWorker worker(mailbox, store, infer_fn());
  worker.start();
  mailbox.submit(st::make_image(500));
  ASSERT_TRUE(st::wait_until([&] { return store.version() == 1; }));

  probe->respond = [](const sc::Image&) -> st::InferResult {
    return std::unexpected(sc::ServiceError::InferenceFailed);
  };
  mailbox.submit(st::make_image(600));
  ASSERT_TRUE(st::wait_until([&] { return worker.failed_count() == 1; }));

  EXPECT_TRUE(worker.running());
  EXPECT_EQ(store.version(), 1u);
  EXPECT_FLOAT_EQ(store.snapshot()->detections[0].confidence, 0.5f);

  probe->respond = nullptr;
  mailbox.submit(st::make_image(700));
  ASSERT_TRUE(st::wait_until([&] { return store.version() == 2; }));
  EXPECT_FLOAT_EQ(store.snapshot()->detections[0].confidence, 0.7f);
}

TEST_F(InferenceWorkerTest, ExceptionIsTreatedAsFailure) {
  probe->respond = [](const sc::Image&) -> st::InferResult {
    throw std::runtime_error("backend exploded");
  };
  sa::InferenceWorker worker(mailbox, store, infer_fn());
  worker.start();
  mailbox.submit(st::make_image(1));
  ASSERT_TRUE(st::wait_until([&] { return worker.failed_count() == 1; }));
  EXPECT_TRUE(worker.running());
  EXPECT_EQ(store.snapshot(), nullptr);
}

TEST_F(InferenceWorkerTest, EmptyDetectionsArePublished) {
  probe->respond = [](const sc::Image&) -> st::InferResult { return sc::DetectionList{}; };
  sa::InferenceWorker worker(mailbox, store, infer_fn());
  worker.start();
  EXPECT_EQ(store.snapshot(), nullptr);
  mailbox.submit(st::make_image(1));
  ASSERT_TRUE(st::wait_until([&] { return store.version() == 1; }));
  auto snap = store.snapshot();
  ASSERT_NE(snap, nullptr);
  EXPECT_TRUE(snap->detections.empty());
}

TEST_F(InferenceWorkerTest, FatalErrorStopsWorkerAndNotifies) {
  std::atomic<int> fatal_calls{0};
  std::atomic<sc::ServiceError> seen{sc::ServiceError::None};
  probe->respond = [](const sc::Image&) -> st::InferResult {
    return std::unexpected(sc::ServiceError::DeviceLost);
  };
  sa::InferenceWorker worker(mailbox, store, infer_fn(), [&](sc::ServiceError e) {
    seen = e;
    ++fatal_calls;
  });
  worker.start();
  mailbox.submit(st::make_image(1));
  ASSERT_TRUE(st::wait_until([&] { return fatal_calls.load() == 1; }));
  ASSERT_TRUE(st::wait_until([&] { return !worker.running(); }));
  EXPECT_EQ(seen.load(), sc::ServiceError::DeviceLost);

  mailbox.submit(st::make_image(2));
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  EXPECT_EQ(worker.claimed_count(), 1u);
  EXPECT_EQ(fatal_calls.load(), 1);
}

TEST_F(InferenceWorkerTest, StopWhileIdleReturns) {
  sa::InferenceWorker worker(mailbox, store, infer_fn());
  worker.start();
  EXPECT_TRUE(worker.running());
  worker.stop();
  EXPECT_FALSE(worker.running());
  EXPECT_TRUE(mailbox.closed());
}
