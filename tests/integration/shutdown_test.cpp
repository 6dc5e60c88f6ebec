// Shutdown ordering: a stop requested before or while the accept loop starts
// must still end listen().
#include <s2p/app/config.hpp>
#include <s2p/app/http_server.hpp>
#include <s2p/app/pipeline_state.hpp>
#include <s2p/core/error.hpp>
#include <gtest/gtest.h>
#include "fake_detection_model.hpp"
#include <atomic>
#include <memory>
#include <thread>

namespace sa = s2p::app;
namespace sc = s2p::core;
namespace st = s2p::test;

namespace {

class ShutdownTest : public ::testing::Test {
 protected:
  void SetUp() override {
    probe = std::make_shared<st::Probe>();
    auto created = sa::PipelineState::create(std::make_unique<st::FakeDetectionModel>(probe));
    ASSERT_TRUE(created.has_value());
    state = std::move(*created);

    sa::ServerConfig config;
    config.host = "127.0.0.1";
    config.port = 0;
    server = std::make_unique<sa::HttpServer>(*state, config);
    ASSERT_TRUE(server->bind().has_value());
  }

  void TearDown() override {
    if (listener.joinable()) {
      server->stop();
      listener.join();
    }
    state->stop();
  }

  void listen_in_background() {
    listener = std::thread([this] {
      server->listen();
      returned.store(true);
    });
  }

  std::shared_ptr<st::Probe> probe;
  std::unique_ptr<sa::PipelineState> state;
  std::unique_ptr<sa::HttpServer> server;
  std::thread listener;
  std::atomic<bool> returned{false};
};

}  // namespace

TEST_F(ShutdownTest, StopBeforeListenMakesListenReturn) {
  server->stop();
  EXPECT_FALSE(server->listen());
  EXPECT_FALSE(server->running());
}

TEST_F(ShutdownTest, StopIsIdempotent) {
  listen_in_background();
  ASSERT_TRUE(st::wait_until([&] { return server->running(); }));
  server->stop();
  server->stop();
  EXPECT_TRUE(st::wait_until([&] { return returned.load(); }));
}

TEST_F(ShutdownTest, StopWhileListenIsStartingEndsIt) {
  sa::ServerConfig config;
  config.host = "127.0.0.1";
  config.port = 0;
  for (int i = 0; i < 20; ++i) {
    sa::HttpServer local(*state, config);
    ASSERT_TRUE(local.bind().has_value());
    std::atomic<bool> done{false};
    std::thread t([&] {
      local.listen();
      done.store(true);
    });
    local.stop();
    const bool ended = st::wait_until([&] { return done.load(); });
    if (!ended) local.stop();
    t.join();
    ASSERT_TRUE(ended) << "iteration " << i;
  }
}

TEST_F(ShutdownTest, FatalWorkerErrorRightAfterBindEndsListen) {
  probe->respond = [](const sc::Image&) -> st::InferResult {
    return std::unexpected(sc::ServiceError::DeviceLost);
  };
  std::atomic<bool> fatal{false};
  state->start_worker([&](sc::ServiceError) {
    fatal.store(true);
    server->stop();
  });
  state->submit(st::make_image(4));
  ASSERT_TRUE(st::wait_until([&] { return fatal.load(); }));

  listen_in_background();
  EXPECT_TRUE(st::wait_until([&] { return returned.load(); }));
  EXPECT_FALSE(server->running());
}
