/**
 * @file consumer.hpp
 * @brief ExternalConsumer - polling loops over an external-pull queue.
 *
 * Start() spawns ConcurrencyLimit() loops. Each loop calls ProcessNext();
 * when the queue is empty it sleeps poll_interval_ms (woken early by
 * Stop()). A loop finishes its current item before it exits.
 */

#ifndef HOOKQ_CONSUMER_HPP_
#define HOOKQ_CONSUMER_HPP_

#include "hookq/admission_queue.hpp"
#include "hookq/log.hpp"
#include "hookq/vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

namespace hookq {

enum class ConsumerError : uint8_t {
  kWrongMode = 0,   ///< Queue is not in kExternalPull mode.
  kAlreadyRunning,
};

static constexpr uint32_t kDefaultPollIntervalMs = 100;

struct ConsumerConfig {
  uint32_t poll_interval_ms = kDefaultPollIntervalMs;
};

template <typename Payload>
class ExternalConsumer {
 public:
  explicit ExternalConsumer(AdmissionQueue<Payload>& queue,
                            const ConsumerConfig& cfg = {}) noexcept
      : queue_(queue), poll_interval_ms_(cfg.poll_interval_ms > 0U ? cfg.poll_interval_ms : 1U) {}

  ~ExternalConsumer() { Stop(); }

  ExternalConsumer(const ExternalConsumer&) = delete;
  ExternalConsumer& operator=(const ExternalConsumer&) = delete;
  ExternalConsumer(ExternalConsumer&&) = delete;
  ExternalConsumer& operator=(ExternalConsumer&&) = delete;

  expected<void, ConsumerError> Start() noexcept {
    if (queue_.Mode() != DispatchMode::kExternalPull) {
      HOOKQ_LOG_ERROR("consumer", "queue '%s' is not in external-pull mode", queue_.Name());
      return expected<void, ConsumerError>::error(ConsumerError::kWrongMode);
    }
    if (running_.load(std::memory_order_acquire)) {
      return expected<void, ConsumerError>::error(ConsumerError::kAlreadyRunning);
    }
    {
      std::lock_guard<std::mutex> lk(mtx_);
      stop_requested_ = false;
    }
    running_.store(true, std::memory_order_release);
    const uint32_t n = queue_.ConcurrencyLimit();
    loops_.reserve(n);
    for (uint32_t i = 0U; i < n; ++i) {
      loops_.emplace_back(&ExternalConsumer::Loop, this, i);
    }
    HOOKQ_LOG_INFO("consumer", "started %u loops, poll %u ms", n, poll_interval_ms_);
    return expected<void, ConsumerError>::success();
  }

  /// @brief Ask every loop to exit after its current item, then join. Idempotent.
  void Stop() noexcept {
    if (!running_.load(std::memory_order_acquire)) {
      return;
    }
    {
      std::lock_guard<std::mutex> lk(mtx_);
      stop_requested_ = true;
    }
    cv_.notify_all();
    for (auto& t : loops_) {
      if (t.joinable()) {
        t.join();
      }
    }
    loops_.clear();
    running_.store(false, std::memory_order_release);
    HOOKQ_LOG_INFO("consumer", "stopped (%llu processed, %llu failed)",
                   static_cast<unsigned long long>(processed_.load()),
                   static_cast<unsigned long long>(failed_.load()));
  }

  bool IsRunning() const noexcept { return running_.load(std::memory_order_acquire); }

  uint64_t ProcessedCount() const noexcept { return processed_.load(std::memory_order_relaxed); }
  uint64_t FailedCount() const noexcept { return failed_.load(std::memory_order_relaxed); }
  uint64_t IdlePolls() const noexcept { return idle_polls_.load(std::memory_order_relaxed); }

 private:
  bool StopRequested() noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    return stop_requested_;
  }

  void Loop(uint32_t loop_id) noexcept {
    while (!StopRequested()) {
      auto r = queue_.ProcessNext();
      if (r.has_value()) {
        processed_.fetch_add(1U, std::memory_order_relaxed);
        continue;
      }
      switch (r.get_error()) {
        case QueueError::kEmpty: {
          idle_polls_.fetch_add(1U, std::memory_order_relaxed);
          std::unique_lock<std::mutex> lk(mtx_);
          cv_.wait_for(lk, std::chrono::milliseconds(poll_interval_ms_),
                       [this] { return stop_requested_; });
          break;
        }
        case QueueError::kProcessingFailed:
          failed_.fetch_add(1U, std::memory_order_relaxed);
          HOOKQ_LOG_WARN("consumer", "loop %u: item failed, continuing", loop_id);
          break;
        default:
          HOOKQ_LOG_ERROR("consumer", "loop %u: %s, exiting", loop_id,
                          QueueErrorToString(r.get_error()));
          return;
      }
    }
  }

  AdmissionQueue<Payload>& queue_;
  const uint32_t poll_interval_ms_;

  std::mutex mtx_;
  std::condition_variable cv_;
  bool stop_requested_{false};
  std::atomic<bool> running_{false};
  std::vector<std::thread> loops_;

  std::atomic<uint64_t> processed_{0U};
  std::atomic<uint64_t> failed_{0U};
  std::atomic<uint64_t> idle_polls_{0U};
};

}  // namespace hookq

#endif  // HOOKQ_CONSUMER_HPP_
