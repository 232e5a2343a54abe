/**
 * @file test_processor.cpp
 * @brief Tests for processor.hpp: retry behaviour and the simulated workload.
 */

#include "hookq/processor.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <utility>
#include <vector>

using hookq::ProcessError;
using hookq::RetryingProcessor;
using hookq::RetryPolicy;
using hookq::SimulatedWork;
using hookq::SimulatedWorkConfig;

namespace {

/// WorkUnit whose attempt outcomes are scripted in advance.
class ScriptedWork final : public hookq::WorkUnit<int> {
 public:
  explicit ScriptedWork(std::vector<bool> outcomes) : outcomes_(std::move(outcomes)) {}

  hookq::expected<void, ProcessError> Attempt(const int& /*item*/, uint32_t attempt) noexcept override {
    attempts_seen.push_back(attempt);
    const size_t i = attempts_seen.size() - 1U;
    const bool ok = i < outcomes_.size() ? outcomes_[i] : false;
    if (ok) {
      return hookq::expected<void, ProcessError>::success();
    }
    return hookq::expected<void, ProcessError>::error(ProcessError::kAttemptFailed);
  }

  std::vector<uint32_t> attempts_seen;

 private:
  std::vector<bool> outcomes_;
};

struct DelayLog {
  std::vector<uint32_t> calls;
};

void RecordDelay(uint32_t delay_ms, void* ctx) {
  static_cast<DelayLog*>(ctx)->calls.push_back(delay_ms);
}

RetryPolicy RecordingPolicy(DelayLog& log, uint32_t delay_ms = 200U) {
  RetryPolicy p;
  p.retry_delay_ms = delay_ms;
  p.delay = &RecordDelay;
  p.delay_context = &log;
  return p;
}

}  // namespace

// ============================================================================
// RetryingProcessor
// ============================================================================

TEST_CASE("RetryingProcessor succeeds on first attempt without delay", "[processor]") {
  ScriptedWork work({true});
  DelayLog delays;
  RetryingProcessor<int> proc(work, RecordingPolicy(delays));

  REQUIRE(proc.Process(1).has_value());
  REQUIRE(work.attempts_seen == std::vector<uint32_t>({1U}));
  REQUIRE(delays.calls.empty());

  const auto s = proc.Stats();
  REQUIRE(s.attempts == 1U);
  REQUIRE(s.retries == 0U);
  REQUIRE(s.successes == 1U);
  REQUIRE(s.failures == 0U);
}

TEST_CASE("RetryingProcessor retries once after a failed attempt", "[processor]") {
  ScriptedWork work({false, true});
  DelayLog delays;
  RetryingProcessor<int> proc(work, RecordingPolicy(delays, 250U));

  REQUIRE(proc.Process(1).has_value());
  REQUIRE(work.attempts_seen == std::vector<uint32_t>({1U, 2U}));
  REQUIRE(delays.calls == std::vector<uint32_t>({250U}));

  const auto s = proc.Stats();
  REQUIRE(s.attempts == 2U);
  REQUIRE(s.retries == 1U);
  REQUIRE(s.successes == 1U);
}

TEST_CASE("RetryingProcessor fails after two failed attempts", "[processor]") {
  ScriptedWork work({false, false, true});
  DelayLog delays;
  RetryingProcessor<int> proc(work, RecordingPolicy(delays));

  auto r = proc.Process(1);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == ProcessError::kRetriesExhausted);
  // Never a third attempt, even though the script would succeed.
  REQUIRE(work.attempts_seen == std::vector<uint32_t>({1U, 2U}));
  REQUIRE(delays.calls.size() == 1U);

  const auto s = proc.Stats();
  REQUIRE(s.failures == 1U);
  REQUIRE(s.successes == 0U);
}

TEST_CASE("RetryingProcessor default delay really waits", "[processor]") {
  ScriptedWork work({false, true});
  RetryPolicy policy;
  policy.retry_delay_ms = 30U;
  RetryingProcessor<int> proc(work, policy);

  const auto t0 = std::chrono::steady_clock::now();
  REQUIRE(proc.Process(1).has_value());
  REQUIRE(std::chrono::steady_clock::now() - t0 >= std::chrono::milliseconds(30));
}

TEST_CASE("RetryingProcessor replaces a null delay function", "[processor]") {
  ScriptedWork work({true});
  RetryPolicy policy;
  policy.delay = nullptr;
  RetryingProcessor<int> proc(work, policy);
  REQUIRE(proc.Policy().delay == &hookq::SleepDelay);
  REQUIRE(proc.Policy().retry_delay_ms == hookq::kDefaultRetryDelayMs);
}

// ============================================================================
// SimulatedWork
// ============================================================================

TEST_CASE("SimulatedWork with zero failure rate always succeeds", "[processor]") {
  DelayLog delays;
  SimulatedWorkConfig cfg;
  cfg.min_delay_ms = 100U;
  cfg.max_delay_ms = 300U;
  cfg.failure_rate = 0.0;
  cfg.seed = 42U;
  cfg.delay = &RecordDelay;
  cfg.delay_context = &delays;
  SimulatedWork<int> work(cfg);

  for (uint32_t i = 0; i < 200U; ++i) {
    REQUIRE(work.Attempt(static_cast<int>(i), 1U).has_value());
  }
  REQUIRE(delays.calls.size() == 200U);
  for (uint32_t d : delays.calls) {
    REQUIRE(d >= 100U);
    REQUIRE(d <= 300U);
  }
}

TEST_CASE("SimulatedWork with failure rate one always fails", "[processor]") {
  DelayLog delays;
  SimulatedWorkConfig cfg;
  cfg.failure_rate = 1.0;
  cfg.seed = 7U;
  cfg.delay = &RecordDelay;
  cfg.delay_context = &delays;
  SimulatedWork<int> work(cfg);

  for (int i = 0; i < 50; ++i) {
    auto r = work.Attempt(i, 1U);
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == ProcessError::kAttemptFailed);
  }
}

TEST_CASE("SimulatedWork normalizes its config", "[processor]") {
  SimulatedWorkConfig cfg;
  cfg.min_delay_ms = 50U;
  cfg.max_delay_ms = 10U;
  cfg.failure_rate = 3.0;
  cfg.delay = nullptr;
  SimulatedWork<int> work(cfg);

  REQUIRE(work.Config().max_delay_ms == 50U);
  REQUIRE(work.Config().failure_rate == 1.0);
  REQUIRE(work.Config().delay == &hookq::SleepDelay);

  cfg.failure_rate = -0.5;
  SimulatedWork<int> work2(cfg);
  REQUIRE(work2.Config().failure_rate == 0.0);
}

TEST_CASE("SimulatedWork behind RetryingProcessor gives up on permanent failure", "[processor]") {
  DelayLog work_delays;
  SimulatedWorkConfig cfg;
  cfg.failure_rate = 1.0;
  cfg.seed = 1U;
  cfg.delay = &RecordDelay;
  cfg.delay_context = &work_delays;
  SimulatedWork<int> work(cfg);

  DelayLog retry_delays;
  RetryingProcessor<int> proc(work, RecordingPolicy(retry_delays));

  REQUIRE(proc.Process(1).get_error() == ProcessError::kRetriesExhausted);
  REQUIRE(work_delays.calls.size() == 2U);
  REQUIRE(retry_delays.calls.size() == 1U);
}
