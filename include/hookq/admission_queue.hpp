/**
 * MIT License
 *
 * Copyright (c) 2026 hookq contributors
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file hookq/admission_queue.hpp
 * @brief AdmissionQueue - bounded FIFO with concurrency-limited dispatch.
 *
 * Architecture (kInternalPush):
 *   Enqueue() --admission check--> pending FIFO
 *                                     | pump (in_flight < concurrency)
 *                                 handoff + token
 *                                     |
 *                 Slot[0..N-1] thread -> Processor::Process() -> MetricsSink
 *                                     | settle: release token, pump again
 *
 * kExternalPull: no slot threads. A consumer (see consumer.hpp) drives the
 * queue through Dequeue() / ProcessItem() / ProcessNext().
 *
 * Features:
 * - Admission refuses once pending + in_flight + 1 reaches the threshold
 * - At most `concurrency` Processor invocations at once, one token each
 * - Depth is recounted from the containers on every report
 * - Drain() / DrainFor() wait on a condition variable, no polling
 *
 * Usage:
 *   hookq::QueueConfig cfg;
 *   cfg.concurrency = 4;
 *   cfg.overload_threshold = 100;
 *
 *   hookq::AdmissionQueue<Event> queue(cfg, processor, metrics);
 *   if (!queue.Enqueue(Event{...})) { reply 429 }
 *   ...
 *   queue.Shutdown();  // waits for pending and in-flight work
 */

#ifndef HOOKQ_ADMISSION_QUEUE_HPP_
#define HOOKQ_ADMISSION_QUEUE_HPP_

#include "hookq/log.hpp"
#include "hookq/metrics_sink.hpp"
#include "hookq/platform.hpp"
#include "hookq/processor.hpp"
#include "hookq/vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <unordered_set>
#include <utility>
#include <vector>

namespace hookq {

// ============================================================================
// Configuration
// ============================================================================

enum class QueueError : uint8_t {
  kOverloaded = 0,    ///< Admission refused; caller should retry later.
  kEmpty,             ///< Nothing pending.
  kWrongMode,         ///< Primitive not available in this dispatch mode.
  kProcessingFailed,  ///< Processor reported a final failure.
};

inline const char* QueueErrorToString(QueueError err) noexcept {
  switch (err) {
    case QueueError::kOverloaded:
      return "overloaded";
    case QueueError::kEmpty:
      return "empty";
    case QueueError::kWrongMode:
      return "wrong dispatch mode";
    case QueueError::kProcessingFailed:
      return "processing failed";
  }
  return "unknown";
}

enum class DispatchMode : uint8_t {
  kInternalPush = 0,  ///< Queue-owned slot threads pull from pending.
  kExternalPull,      ///< An external consumer drives the primitives.
};

static constexpr uint32_t kDefaultConcurrency = 10;
static constexpr uint32_t kDefaultOverloadThreshold = 100;

struct QueueConfig {
  FixedString<32> name{"webhook"};
  uint32_t concurrency = kDefaultConcurrency;              ///< 0 is clamped to 1.
  uint32_t overload_threshold = kDefaultOverloadThreshold;  ///< 0 is clamped to 1.
  DispatchMode mode = DispatchMode::kInternalPush;
};

// ============================================================================
// AdmissionQueue
// ============================================================================

template <typename Payload>
class AdmissionQueue {
 public:
  AdmissionQueue(const QueueConfig& cfg, Processor<Payload>& processor,
                 MetricsSink& metrics) noexcept
      : name_(cfg.name),
        concurrency_(cfg.concurrency > 0U ? cfg.concurrency : 1U),
        threshold_(cfg.overload_threshold > 0U ? cfg.overload_threshold : 1U),
        mode_(cfg.mode),
        processor_(processor),
        metrics_(metrics) {
    if (mode_ == DispatchMode::kInternalPush) {
      slots_.reserve(concurrency_);
      for (uint32_t i = 0U; i < concurrency_; ++i) {
        slots_.emplace_back(&AdmissionQueue::SlotLoop, this);
      }
    }
    HOOKQ_LOG_INFO(name_.c_str(), "queue ready: mode=%s concurrency=%u threshold=%u",
                   mode_ == DispatchMode::kInternalPush ? "internal" : "external", concurrency_,
                   threshold_);
  }

  /**
   * @brief Internal mode: drain, then join the slot threads.
   *
   * External mode: waits only for in-flight invocations; items still
   * pending without a consumer are dropped with a warning.
   */
  ~AdmissionQueue() {
    size_t unconsumed = 0U;
    {
      std::unique_lock<std::mutex> lk(mtx_);
      if (mode_ == DispatchMode::kInternalPush) {
        state_cv_.wait(lk, [this] { return pending_.empty() && in_flight_.empty(); });
      } else {
        state_cv_.wait(lk, [this] { return in_flight_.empty(); });
        unconsumed = pending_.size();
      }
      stopping_ = true;
    }
    if (unconsumed != 0U) {
      HOOKQ_LOG_WARN(name_.c_str(), "destroyed with %zu unconsumed items", unconsumed);
    }
    slot_cv_.notify_all();
    for (auto& t : slots_) {
      if (t.joinable()) {
        t.join();
      }
    }
  }

  AdmissionQueue(const AdmissionQueue&) = delete;
  AdmissionQueue& operator=(const AdmissionQueue&) = delete;
  AdmissionQueue(AdmissionQueue&&) = delete;
  AdmissionQueue& operator=(AdmissionQueue&&) = delete;

  // ======================== Admission ========================

  /**
   * @brief Admit @p item or refuse it with kOverloaded.
   *
   * Admission holds while pending + in_flight + 1 < threshold, so at most
   * threshold - 1 items are ever resident. A refused item is not stored.
   */
  expected<void, QueueError> Enqueue(Payload item) noexcept {
    uint32_t total = 0U;
    bool admitted = false;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      total = TotalLocked();
      if (total + 1U < threshold_) {
        pending_.push_back(Entry{std::move(item), SteadyNowNs()});
        admitted = true;
        total = TotalLocked();
        metrics_.OnReceived();
        metrics_.OnDepthChanged(total);
        state_cv_.notify_all();
        PumpLocked();
      }
    }
    // Rejection bookkeeping and logging run unlocked.
    if (!admitted) {
      metrics_.OnRejected();
      HOOKQ_LOG_WARN(name_.c_str(), "overloaded: %u items resident, threshold %u", total,
                     threshold_);
      return expected<void, QueueError>::error(QueueError::kOverloaded);
    }
    HOOKQ_LOG_DEBUG(name_.c_str(), "enqueued, depth %u", total);
    return expected<void, QueueError>::success();
  }

  // ======================== External-pull primitives ========================

  /**
   * @brief Remove the head of the pending FIFO.
   *
   * The returned item holds no in-flight token; pass it to ProcessItem().
   */
  expected<Payload, QueueError> Dequeue() noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    if (mode_ != DispatchMode::kExternalPull) {
      return expected<Payload, QueueError>::error(QueueError::kWrongMode);
    }
    if (pending_.empty()) {
      return expected<Payload, QueueError>::error(QueueError::kEmpty);
    }
    Payload item = PopHeadLocked();
    state_cv_.notify_all();
    return expected<Payload, QueueError>::success(std::move(item));
  }

  /**
   * @brief Run one Processor invocation for an already dequeued item.
   *
   * Blocks until an in-flight slot is free, holds it for the invocation.
   */
  expected<void, QueueError> ProcessItem(const Payload& item) noexcept {
    uint64_t token;
    {
      std::unique_lock<std::mutex> lk(mtx_);
      if (mode_ != DispatchMode::kExternalPull) {
        return expected<void, QueueError>::error(QueueError::kWrongMode);
      }
      state_cv_.wait(lk, [this] { return in_flight_.size() < concurrency_; });
      token = AcquireTokenLocked();
    }
    const bool ok = RunProcessor(item);
    {
      std::lock_guard<std::mutex> lk(mtx_);
      ReleaseTokenLocked(token);
    }
    if (!ok) {
      return expected<void, QueueError>::error(QueueError::kProcessingFailed);
    }
    return expected<void, QueueError>::success();
  }

  /**
   * @brief Dequeue the head and claim a slot in one critical section, then
   * process it.
   * @return kEmpty if nothing was pending.
   */
  expected<void, QueueError> ProcessNext() noexcept {
    uint64_t token;
    optional<Payload> item;
    {
      std::unique_lock<std::mutex> lk(mtx_);
      if (mode_ != DispatchMode::kExternalPull) {
        return expected<void, QueueError>::error(QueueError::kWrongMode);
      }
      state_cv_.wait(lk,
                     [this] { return pending_.empty() || in_flight_.size() < concurrency_; });
      if (pending_.empty()) {
        return expected<void, QueueError>::error(QueueError::kEmpty);
      }
      item = PopHeadLocked();
      token = AcquireTokenLocked();
    }
    const bool ok = RunProcessor(item.value());
    {
      std::lock_guard<std::mutex> lk(mtx_);
      ReleaseTokenLocked(token);
    }
    if (!ok) {
      return expected<void, QueueError>::error(QueueError::kProcessingFailed);
    }
    return expected<void, QueueError>::success();
  }

  // ======================== Drain / Shutdown ========================

  /// @brief Block until nothing is pending and nothing is in flight.
  void Drain() noexcept {
    std::unique_lock<std::mutex> lk(mtx_);
    state_cv_.wait(lk, [this] { return pending_.empty() && in_flight_.empty(); });
  }

  /// @return true if the queue became idle before @p timeout elapsed.
  template <typename Rep, typename Period>
  bool DrainFor(std::chrono::duration<Rep, Period> timeout) noexcept {
    std::unique_lock<std::mutex> lk(mtx_);
    return state_cv_.wait_for(lk, timeout,
                              [this] { return pending_.empty() && in_flight_.empty(); });
  }

  /**
   * @brief Log the outstanding work and Drain(). Does not refuse new items;
   * stop the producers first.
   */
  void Shutdown() noexcept {
    size_t pending = 0U;
    size_t in_flight = 0U;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      pending = pending_.size();
      in_flight = in_flight_.size();
    }
    HOOKQ_LOG_INFO(name_.c_str(), "shutting down: %zu pending, %zu in flight", pending,
                   in_flight);
    Drain();
    HOOKQ_LOG_INFO(name_.c_str(), "all queued items processed");
  }

  // ======================== Query ========================

  /// @brief pending + in_flight, recounted.
  uint32_t TotalItems() const noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    return TotalLocked();
  }

  uint32_t Size() const noexcept { return TotalItems(); }

  uint32_t PendingCount() const noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    return static_cast<uint32_t>(pending_.size());
  }

  uint32_t InFlightCount() const noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    return static_cast<uint32_t>(in_flight_.size());
  }

  uint32_t ConcurrencyLimit() const noexcept { return concurrency_; }
  uint32_t CapacityThreshold() const noexcept { return threshold_; }
  DispatchMode Mode() const noexcept { return mode_; }
  const char* Name() const noexcept { return name_.c_str(); }

 private:
  struct Entry {
    Payload payload;
    uint64_t enqueued_ns;
  };

  struct Job {
    Payload payload;
    uint64_t token;
  };

  // ======================== Locked helpers (mtx_ held) ========================

  uint32_t TotalLocked() const noexcept {
    return static_cast<uint32_t>(pending_.size() + in_flight_.size());
  }

  Payload PopHeadLocked() noexcept {
    Entry entry = std::move(pending_.front());
    pending_.pop_front();
    metrics_.OnQueueWait(ElapsedMs(entry.enqueued_ns));
    metrics_.OnDepthChanged(TotalLocked());
    return std::move(entry.payload);
  }

  uint64_t AcquireTokenLocked() noexcept {
    const uint64_t token = next_token_++;
    in_flight_.insert(token);
    metrics_.OnDepthChanged(TotalLocked());
    return token;
  }

  void ReleaseTokenLocked(uint64_t token) noexcept {
    in_flight_.erase(token);
    metrics_.OnDepthChanged(TotalLocked());
    state_cv_.notify_all();
    PumpLocked();
  }

  /// Internal mode only: move items into free slots.
  void PumpLocked() noexcept {
    if (mode_ != DispatchMode::kInternalPush) {
      return;
    }
    while (in_flight_.size() < concurrency_ && !pending_.empty()) {
      Payload item = PopHeadLocked();
      const uint64_t token = AcquireTokenLocked();
      handoff_.push_back(Job{std::move(item), token});
      slot_cv_.notify_one();
    }
  }

  // ======================== Processing ========================

  /// @return true on success. Runs without mtx_.
  bool RunProcessor(const Payload& item) noexcept {
    const uint64_t start = SteadyNowNs();
    auto r = processor_.Process(item);
    const double ms = ElapsedMs(start);
    if (r.has_value()) {
      metrics_.OnProcessed();
      metrics_.OnProcessingDuration(ms);
      HOOKQ_LOG_INFO(name_.c_str(), "item processed in %.1f ms", ms);
      return true;
    }
    metrics_.OnFailed();
    HOOKQ_LOG_ERROR(name_.c_str(), "item failed after %.1f ms", ms);
    return false;
  }

  void SlotLoop() noexcept {
    std::unique_lock<std::mutex> lk(mtx_);
    while (true) {
      slot_cv_.wait(lk, [this] { return !handoff_.empty() || stopping_; });
      if (handoff_.empty()) {
        return;
      }
      Job job = std::move(handoff_.front());
      handoff_.pop_front();
      lk.unlock();
      (void)RunProcessor(job.payload);
      lk.lock();
      ReleaseTokenLocked(job.token);
    }
  }

  // ======================== Data members ========================

  FixedString<32> name_;
  const uint32_t concurrency_;
  const uint32_t threshold_;
  const DispatchMode mode_;
  Processor<Payload>& processor_;
  MetricsSink& metrics_;

  mutable std::mutex mtx_;
  std::condition_variable state_cv_;  ///< Any pending/in-flight transition.
  std::condition_variable slot_cv_;   ///< Handoff available or stopping.

  std::deque<Entry> pending_;
  std::unordered_set<uint64_t> in_flight_;
  std::deque<Job> handoff_;
  uint64_t next_token_{0U};
  bool stopping_{false};

  std::vector<std::thread> slots_;
};

}  // namespace hookq

#endif  // HOOKQ_ADMISSION_QUEUE_HPP_
