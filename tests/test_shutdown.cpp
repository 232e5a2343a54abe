/**
 * @file test_shutdown.cpp
 * @brief Tests for shutdown.hpp
 */

#include "hookq/shutdown.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <csignal>
#include <thread>
#include <utility>
#include <vector>

namespace {

void NoopStep(int /*signo*/, void* /*ctx*/) {}

void RecordStep(int /*signo*/, void* ctx) {
  auto* slot = static_cast<std::pair<std::vector<int>*, int>*>(ctx);
  slot->first->push_back(slot->second);
}

void CaptureSignal(int signo, void* ctx) { *static_cast<int*>(ctx) = signo; }

}  // namespace

TEST_CASE("ShutdownManager Register up to the step limit", "[shutdown]") {
  hookq::ShutdownManager mgr;
  REQUIRE(mgr.IsValid());

  for (uint32_t i = 0; i < hookq::ShutdownManager::kMaxSteps; ++i) {
    REQUIRE(mgr.Register(&NoopStep).has_value());
  }
  REQUIRE(mgr.StepCount() == hookq::ShutdownManager::kMaxSteps);

  auto rn = mgr.Register(&NoopStep);
  REQUIRE(!rn.has_value());
  REQUIRE(rn.get_error() == hookq::ShutdownError::kStepsFull);
}

TEST_CASE("ShutdownManager null step rejected", "[shutdown]") {
  hookq::ShutdownManager mgr;
  auto r = mgr.Register(nullptr);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == hookq::ShutdownError::kNullStep);
}

TEST_CASE("ShutdownManager allows a single live instance", "[shutdown]") {
  hookq::ShutdownManager first;
  hookq::ShutdownManager second;
  REQUIRE(first.IsValid());
  REQUIRE(!second.IsValid());
  REQUIRE(second.Register(&NoopStep).get_error() == hookq::ShutdownError::kAlreadyInstantiated);
  REQUIRE(second.InstallSignalHandlers().get_error() ==
          hookq::ShutdownError::kAlreadyInstantiated);
}

TEST_CASE("ShutdownManager runs steps in LIFO order exactly once", "[shutdown]") {
  hookq::ShutdownManager mgr;

  std::vector<int> order;
  std::pair<std::vector<int>*, int> queue_step{&order, 1};
  std::pair<std::vector<int>*, int> consumer_step{&order, 2};
  std::pair<std::vector<int>*, int> http_step{&order, 3};
  REQUIRE(mgr.Register(&RecordStep, &queue_step, "queue").has_value());
  REQUIRE(mgr.Register(&RecordStep, &consumer_step, "consumer").has_value());
  REQUIRE(mgr.Register(&RecordStep, &http_step, "http").has_value());

  REQUIRE(!mgr.IsShutdownRequested());
  mgr.Quit(0);
  REQUIRE(mgr.IsShutdownRequested());
  mgr.WaitForShutdown();
  REQUIRE(order == std::vector<int>({3, 2, 1}));

  mgr.Quit(0);
  mgr.WaitForShutdown();
  REQUIRE(order.size() == 3U);
}

TEST_CASE("ShutdownManager keeps the first Quit signal", "[shutdown]") {
  hookq::ShutdownManager mgr;
  int seen = -1;
  REQUIRE(mgr.Register(&CaptureSignal, &seen).has_value());

  mgr.Quit(SIGTERM);
  mgr.Quit(SIGINT);
  REQUIRE(mgr.Signal() == SIGTERM);
  REQUIRE(mgr.WaitForShutdownFor(1000U));
  REQUIRE(seen == SIGTERM);
}

TEST_CASE("ShutdownManager WaitForShutdownFor times out", "[shutdown]") {
  hookq::ShutdownManager mgr;
  int seen = -1;
  REQUIRE(mgr.Register(&CaptureSignal, &seen).has_value());

  const auto t0 = std::chrono::steady_clock::now();
  REQUIRE(!mgr.WaitForShutdownFor(30U));
  REQUIRE(std::chrono::steady_clock::now() - t0 >= std::chrono::milliseconds(25));
  REQUIRE(seen == -1);
}

TEST_CASE("ShutdownManager wakes on Quit from another thread", "[shutdown]") {
  hookq::ShutdownManager mgr;
  int seen = -1;
  REQUIRE(mgr.Register(&CaptureSignal, &seen).has_value());

  std::thread quitter([&mgr] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    mgr.Quit(7);
  });
  mgr.WaitForShutdown();
  quitter.join();
  REQUIRE(seen == 7);
}

TEST_CASE("ShutdownManager handles a raised SIGTERM", "[shutdown]") {
  hookq::ShutdownManager mgr;
  int seen = -1;
  REQUIRE(mgr.Register(&CaptureSignal, &seen, "capture").has_value());
  REQUIRE(mgr.InstallSignalHandlers().has_value());

  REQUIRE(::raise(SIGTERM) == 0);
  REQUIRE(mgr.WaitForShutdownFor(1000U));
  REQUIRE(seen == SIGTERM);

  (void)std::signal(SIGTERM, SIG_DFL);
  (void)std::signal(SIGINT, SIG_DFL);
}
