/**
 * @file processor.hpp
 * @brief Processing capability driven by the admission queue.
 *
 *   Processor<Payload>          abstract: Process(item) -> expected<void, ProcessError>
 *     RetryingProcessor<Payload>  at most kMaxAttempts calls into a WorkUnit,
 *                                 one retry_delay_ms pause between them
 *   WorkUnit<Payload>           abstract: one attempt
 *     SimulatedWork<Payload>      random latency + random failure
 *
 * The retry pause goes through a DelayFn so tests can observe or skip it.
 */

#ifndef HOOKQ_PROCESSOR_HPP_
#define HOOKQ_PROCESSOR_HPP_

#include "hookq/log.hpp"
#include "hookq/platform.hpp"
#include "hookq/vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <chrono>
#include <mutex>
#include <random>
#include <thread>

namespace hookq {

// ============================================================================
// Errors
// ============================================================================

enum class ProcessError : uint8_t {
  kAttemptFailed = 0,  ///< A single attempt failed (WorkUnit result).
  kRetriesExhausted,   ///< Every attempt failed (Processor result).
};

// ============================================================================
// Interfaces
// ============================================================================

template <typename Payload>
class Processor {
 public:
  virtual ~Processor() = default;

  /// @brief Resolve one item. Success or a final failure; never throws.
  virtual expected<void, ProcessError> Process(const Payload& item) noexcept = 0;
};

template <typename Payload>
class WorkUnit {
 public:
  virtual ~WorkUnit() = default;

  /**
   * @brief Perform one attempt.
   * @param attempt 1-based attempt number.
   */
  virtual expected<void, ProcessError> Attempt(const Payload& item, uint32_t attempt) noexcept = 0;
};

// ============================================================================
// Delay function
// ============================================================================

using DelayFn = void (*)(uint32_t delay_ms, void* context);

inline void SleepDelay(uint32_t delay_ms, void* /*context*/) noexcept {
  if (delay_ms > 0U) {
    std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
  }
}

// ============================================================================
// RetryingProcessor
// ============================================================================

static constexpr uint32_t kMaxAttempts = 2;
static constexpr uint32_t kDefaultRetryDelayMs = 200;

struct RetryPolicy {
  uint32_t retry_delay_ms = kDefaultRetryDelayMs;
  DelayFn delay = &SleepDelay;
  void* delay_context = nullptr;
};

struct ProcessorStats {
  uint64_t attempts;
  uint64_t retries;
  uint64_t successes;
  uint64_t failures;
};

/**
 * @brief Runs a WorkUnit, retrying once after a fixed pause.
 *
 * Attempt 1 succeeds: done, no pause. Attempt 1 fails: pause once, run
 * attempt 2. Attempt 2 fails: kRetriesExhausted. Thread-safe as long as the
 * WorkUnit is.
 */
template <typename Payload>
class RetryingProcessor final : public Processor<Payload> {
 public:
  explicit RetryingProcessor(WorkUnit<Payload>& work, const RetryPolicy& policy = {}) noexcept
      : work_(work), policy_(policy) {
    if (policy_.delay == nullptr) {
      policy_.delay = &SleepDelay;
    }
  }

  RetryingProcessor(const RetryingProcessor&) = delete;
  RetryingProcessor& operator=(const RetryingProcessor&) = delete;

  expected<void, ProcessError> Process(const Payload& item) noexcept override {
    for (uint32_t attempt = 1U; attempt <= kMaxAttempts; ++attempt) {
      if (attempt > 1U) {
        retries_.fetch_add(1U, std::memory_order_relaxed);
        HOOKQ_LOG_INFO("processor", "attempt %u failed, retrying in %u ms", attempt - 1U,
                       policy_.retry_delay_ms);
        policy_.delay(policy_.retry_delay_ms, policy_.delay_context);
      }
      attempts_.fetch_add(1U, std::memory_order_relaxed);
      auto r = work_.Attempt(item, attempt);
      if (r.has_value()) {
        successes_.fetch_add(1U, std::memory_order_relaxed);
        return expected<void, ProcessError>::success();
      }
    }
    failures_.fetch_add(1U, std::memory_order_relaxed);
    HOOKQ_LOG_ERROR("processor", "giving up after %u attempts", kMaxAttempts);
    return expected<void, ProcessError>::error(ProcessError::kRetriesExhausted);
  }

  ProcessorStats Stats() const noexcept {
    return ProcessorStats{attempts_.load(std::memory_order_relaxed),
                          retries_.load(std::memory_order_relaxed),
                          successes_.load(std::memory_order_relaxed),
                          failures_.load(std::memory_order_relaxed)};
  }

  const RetryPolicy& Policy() const noexcept { return policy_; }

 private:
  WorkUnit<Payload>& work_;
  RetryPolicy policy_;

  std::atomic<uint64_t> attempts_{0U};
  std::atomic<uint64_t> retries_{0U};
  std::atomic<uint64_t> successes_{0U};
  std::atomic<uint64_t> failures_{0U};
};

// ============================================================================
// SimulatedWork
// ============================================================================

struct SimulatedWorkConfig {
  uint32_t min_delay_ms = 100;
  uint32_t max_delay_ms = 300;
  double failure_rate = 0.1;  ///< Probability in [0, 1] that an attempt fails.
  uint32_t seed = 0;          ///< 0 seeds from std::random_device.
  DelayFn delay = &SleepDelay;
  void* delay_context = nullptr;
};

/**
 * @brief Stand-in workload: sleeps a uniform [min, max] ms, then fails
 * with probability failure_rate.
 */
template <typename Payload>
class SimulatedWork final : public WorkUnit<Payload> {
 public:
  explicit SimulatedWork(const SimulatedWorkConfig& cfg = {}) noexcept : cfg_(cfg) {
    if (cfg_.max_delay_ms < cfg_.min_delay_ms) {
      cfg_.max_delay_ms = cfg_.min_delay_ms;
    }
    if (cfg_.failure_rate < 0.0) cfg_.failure_rate = 0.0;
    if (cfg_.failure_rate > 1.0) cfg_.failure_rate = 1.0;
    if (cfg_.delay == nullptr) cfg_.delay = &SleepDelay;
    rng_.seed(cfg_.seed != 0U ? cfg_.seed : std::random_device{}());
  }

  expected<void, ProcessError> Attempt(const Payload& /*item*/, uint32_t attempt) noexcept override {
    uint32_t delay_ms;
    bool fail;
    {
      std::lock_guard<std::mutex> lock(rng_mtx_);
      std::uniform_int_distribution<uint32_t> delay_dist(cfg_.min_delay_ms, cfg_.max_delay_ms);
      std::uniform_real_distribution<double> fail_dist(0.0, 1.0);
      delay_ms = delay_dist(rng_);
      fail = fail_dist(rng_) < cfg_.failure_rate;
    }
    cfg_.delay(delay_ms, cfg_.delay_context);
    if (fail) {
      HOOKQ_LOG_DEBUG("work", "attempt %u failed after %u ms", attempt, delay_ms);
      return expected<void, ProcessError>::error(ProcessError::kAttemptFailed);
    }
    return expected<void, ProcessError>::success();
  }

  const SimulatedWorkConfig& Config() const noexcept { return cfg_; }

 private:
  SimulatedWorkConfig cfg_;
  std::mutex rng_mtx_;
  std::mt19937 rng_;
};

}  // namespace hookq

#endif  // HOOKQ_PROCESSOR_HPP_
