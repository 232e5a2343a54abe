/**
 * @file test_admission_queue.cpp
 * @brief Tests for admission_queue.hpp: admission, bounded dispatch, drain.
 */

#include "hookq/admission_queue.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using hookq::AdmissionQueue;
using hookq::DispatchMode;
using hookq::ProcessError;
using hookq::QueueConfig;
using hookq::QueueError;

namespace {

// ============================================================================
// Test doubles
// ============================================================================

/// Processor whose invocations block until released (or the gate is opened).
class GatedProcessor final : public hookq::Processor<int> {
 public:
  explicit GatedProcessor(bool open = false) : open_(open) {}

  hookq::expected<void, ProcessError> Process(const int& item) noexcept override {
    std::unique_lock<std::mutex> lk(mtx_);
    started_.push_back(item);
    ++active_;
    max_active_ = std::max(max_active_, active_);
    cv_.notify_all();
    cv_.wait(lk, [this] { return open_ || releases_ > 0U; });
    if (!open_) {
      --releases_;
    }
    if (work_ms_ > 0U) {
      lk.unlock();
      std::this_thread::sleep_for(std::chrono::milliseconds(work_ms_));
      lk.lock();
    }
    --active_;
    finished_.push_back(item);
    cv_.notify_all();
    if (fail_.count(item) != 0U) {
      return hookq::expected<void, ProcessError>::error(ProcessError::kRetriesExhausted);
    }
    return hookq::expected<void, ProcessError>::success();
  }

  void Release(uint32_t n = 1U) {
    std::lock_guard<std::mutex> lk(mtx_);
    releases_ += n;
    cv_.notify_all();
  }

  void Open() {
    std::lock_guard<std::mutex> lk(mtx_);
    open_ = true;
    cv_.notify_all();
  }

  void FailItem(int item) {
    std::lock_guard<std::mutex> lk(mtx_);
    fail_.insert(item);
  }

  void SetWorkMs(uint32_t ms) {
    std::lock_guard<std::mutex> lk(mtx_);
    work_ms_ = ms;
  }

  bool WaitStarted(size_t n, uint32_t timeout_ms = 2000U) {
    std::unique_lock<std::mutex> lk(mtx_);
    return cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms),
                        [&] { return started_.size() >= n; });
  }

  size_t StartedCount() {
    std::lock_guard<std::mutex> lk(mtx_);
    return started_.size();
  }

  size_t FinishedCount() {
    std::lock_guard<std::mutex> lk(mtx_);
    return finished_.size();
  }

  std::vector<int> Finished() {
    std::lock_guard<std::mutex> lk(mtx_);
    return finished_;
  }

  uint32_t MaxActive() {
    std::lock_guard<std::mutex> lk(mtx_);
    return max_active_;
  }

 private:
  std::mutex mtx_;
  std::condition_variable cv_;
  bool open_;
  uint32_t releases_ = 0U;
  uint32_t work_ms_ = 0U;
  uint32_t active_ = 0U;
  uint32_t max_active_ = 0U;
  std::vector<int> started_;
  std::vector<int> finished_;
  std::set<int> fail_;
};

/// Sink that counts every event.
class CountingSink final : public hookq::MetricsSink {
 public:
  void OnReceived() noexcept override { ++received; }
  void OnProcessed() noexcept override { ++processed; }
  void OnRejected() noexcept override { ++rejected; }
  void OnFailed() noexcept override { ++failed; }
  void OnDepthChanged(uint32_t depth) noexcept override {
    last_depth.store(depth);
    uint32_t prev = max_depth.load();
    while (depth > prev && !max_depth.compare_exchange_weak(prev, depth)) {
    }
  }
  void OnQueueWait(double) noexcept override { ++queue_waits; }
  void OnProcessingDuration(double) noexcept override { ++durations; }

  std::atomic<uint32_t> received{0};
  std::atomic<uint32_t> processed{0};
  std::atomic<uint32_t> rejected{0};
  std::atomic<uint32_t> failed{0};
  std::atomic<uint32_t> queue_waits{0};
  std::atomic<uint32_t> durations{0};
  std::atomic<uint32_t> last_depth{0};
  std::atomic<uint32_t> max_depth{0};
};

/// Sink that, on each rejection, reads the queue from another thread.
/// The read only completes if the queue lock is free at that point.
class LockObservingSink final : public hookq::MetricsSink {
 public:
  void OnReceived() noexcept override {}
  void OnProcessed() noexcept override {}
  void OnRejected() noexcept override {
    auto* queue = queue_;
    if (queue == nullptr) return;
    auto reader = std::async(std::launch::async, [queue] { return queue->TotalItems(); });
    if (reader.wait_for(std::chrono::seconds(1)) == std::future_status::ready) {
      ++unlocked_rejections;
      last_seen_total.store(reader.get());
    } else {
      ++locked_rejections;
    }
  }
  void OnFailed() noexcept override {}
  void OnDepthChanged(uint32_t) noexcept override {}
  void OnQueueWait(double) noexcept override {}
  void OnProcessingDuration(double) noexcept override {}

  void Observe(AdmissionQueue<int>* queue) { queue_ = queue; }

  std::atomic<uint32_t> unlocked_rejections{0};
  std::atomic<uint32_t> locked_rejections{0};
  std::atomic<uint32_t> last_seen_total{0};

 private:
  AdmissionQueue<int>* queue_ = nullptr;
};

QueueConfig MakeConfig(uint32_t concurrency, uint32_t threshold,
                       DispatchMode mode = DispatchMode::kInternalPush) {
  QueueConfig cfg;
  cfg.name = "test";
  cfg.concurrency = concurrency;
  cfg.overload_threshold = threshold;
  cfg.mode = mode;
  return cfg;
}

}  // namespace

// ============================================================================
// Admission
// ============================================================================

TEST_CASE("AdmissionQueue admits threshold-1 items then rejects", "[admission_queue]") {
  GatedProcessor proc;
  CountingSink sink;
  AdmissionQueue<int> queue(MakeConfig(1, 5), proc, sink);

  for (int i = 1; i <= 4; ++i) {
    REQUIRE(queue.Enqueue(i).has_value());
  }
  auto fifth = queue.Enqueue(5);
  REQUIRE(!fifth.has_value());
  REQUIRE(fifth.get_error() == QueueError::kOverloaded);

  REQUIRE(sink.rejected.load() == 1U);
  REQUIRE(sink.received.load() == 4U);
  REQUIRE(queue.TotalItems() == 4U);

  proc.Open();
  queue.Drain();
  REQUIRE(sink.processed.load() == 4U);
  REQUIRE(proc.Finished() == std::vector<int>({1, 2, 3, 4}));
}

TEST_CASE("AdmissionQueue reports a rejection after releasing its lock",
          "[admission_queue]") {
  GatedProcessor proc;
  LockObservingSink sink;
  AdmissionQueue<int> queue(MakeConfig(1, 3), proc, sink);
  sink.Observe(&queue);

  REQUIRE(queue.Enqueue(1).has_value());
  REQUIRE(queue.Enqueue(2).has_value());
  for (int i = 0; i < 3; ++i) {
    auto r = queue.Enqueue(100 + i);
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == QueueError::kOverloaded);
  }

  REQUIRE(sink.locked_rejections.load() == 0U);
  REQUIRE(sink.unlocked_rejections.load() == 3U);
  REQUIRE(sink.last_seen_total.load() == 2U);

  sink.Observe(nullptr);
  proc.Open();
  queue.Drain();
  REQUIRE(proc.FinishedCount() == 2U);
}

TEST_CASE("AdmissionQueue rejection leaves the queue untouched", "[admission_queue]") {
  GatedProcessor proc;
  CountingSink sink;
  AdmissionQueue<int> queue(MakeConfig(1, 3), proc, sink);

  REQUIRE(queue.Enqueue(1).has_value());
  REQUIRE(queue.Enqueue(2).has_value());
  REQUIRE(proc.WaitStarted(1));
  const uint32_t depth_before = sink.last_depth.load();

  REQUIRE(queue.Enqueue(3).get_error() == QueueError::kOverloaded);
  REQUIRE(queue.Enqueue(4).get_error() == QueueError::kOverloaded);
  REQUIRE(sink.rejected.load() == 2U);
  REQUIRE(queue.PendingCount() == 1U);
  REQUIRE(queue.InFlightCount() == 1U);
  REQUIRE(sink.last_depth.load() == depth_before);

  proc.Open();
  queue.Drain();
  REQUIRE(proc.Finished() == std::vector<int>({1, 2}));
}

TEST_CASE("AdmissionQueue admits again once capacity frees up", "[admission_queue]") {
  GatedProcessor proc;
  CountingSink sink;
  AdmissionQueue<int> queue(MakeConfig(1, 2), proc, sink);

  REQUIRE(queue.Enqueue(1).has_value());
  REQUIRE(!queue.Enqueue(2).has_value());
  proc.Release(1);
  queue.Drain();
  REQUIRE(queue.Enqueue(3).has_value());

  proc.Open();
  queue.Drain();
  REQUIRE(sink.received.load() == 2U);
  REQUIRE(sink.rejected.load() == 1U);
}

TEST_CASE("AdmissionQueue clamps zero limits to one", "[admission_queue]") {
  GatedProcessor proc(true);
  CountingSink sink;
  AdmissionQueue<int> queue(MakeConfig(0, 0), proc, sink);

  REQUIRE(queue.ConcurrencyLimit() == 1U);
  REQUIRE(queue.CapacityThreshold() == 1U);
  // pending + in_flight + 1 >= 1 always holds, so nothing is admitted.
  REQUIRE(queue.Enqueue(1).get_error() == QueueError::kOverloaded);
  REQUIRE(sink.received.load() == 0U);
}

// ============================================================================
// Dispatch
// ============================================================================

TEST_CASE("AdmissionQueue starts a pending item when a slot frees", "[admission_queue]") {
  GatedProcessor proc;
  CountingSink sink;
  AdmissionQueue<int> queue(MakeConfig(2, 10), proc, sink);

  REQUIRE(queue.Enqueue(1).has_value());
  REQUIRE(queue.Enqueue(2).has_value());
  REQUIRE(queue.Enqueue(3).has_value());
  REQUIRE(proc.WaitStarted(2));

  REQUIRE(queue.InFlightCount() == 2U);
  REQUIRE(queue.PendingCount() == 1U);
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  REQUIRE(proc.StartedCount() == 2U);

  proc.Release(1);
  REQUIRE(proc.WaitStarted(3));
  REQUIRE(proc.StartedCount() == 3U);

  proc.Open();
  queue.Drain();
  REQUIRE(sink.processed.load() == 3U);
}

TEST_CASE("AdmissionQueue never exceeds the concurrency limit", "[admission_queue]") {
  GatedProcessor proc(true);
  proc.SetWorkMs(2);
  CountingSink sink;
  AdmissionQueue<int> queue(MakeConfig(3, 200), proc, sink);

  for (int i = 0; i < 60; ++i) {
    REQUIRE(queue.Enqueue(i).has_value());
  }
  queue.Drain();

  REQUIRE(proc.MaxActive() <= 3U);
  REQUIRE(proc.MaxActive() >= 1U);
  REQUIRE(sink.processed.load() == 60U);
  REQUIRE(sink.durations.load() == 60U);
  REQUIRE(sink.queue_waits.load() == 60U);
}

TEST_CASE("AdmissionQueue with concurrency 1 completes in FIFO order", "[admission_queue]") {
  GatedProcessor proc(true);
  CountingSink sink;
  AdmissionQueue<int> queue(MakeConfig(1, 100), proc, sink);

  std::vector<int> expected_order;
  for (int i = 1; i <= 20; ++i) {
    REQUIRE(queue.Enqueue(i).has_value());
    expected_order.push_back(i);
  }
  queue.Drain();
  REQUIRE(proc.Finished() == expected_order);
}

TEST_CASE("AdmissionQueue counts final failures separately", "[admission_queue]") {
  GatedProcessor proc(true);
  proc.FailItem(3);
  proc.FailItem(5);
  CountingSink sink;
  AdmissionQueue<int> queue(MakeConfig(2, 100), proc, sink);

  for (int i = 1; i <= 6; ++i) {
    REQUIRE(queue.Enqueue(i).has_value());
  }
  queue.Drain();

  REQUIRE(sink.failed.load() == 2U);
  REQUIRE(sink.processed.load() == 4U);
  REQUIRE(sink.durations.load() == 4U);
  REQUIRE(queue.TotalItems() == 0U);
}

// ============================================================================
// Depth
// ============================================================================

TEST_CASE("AdmissionQueue depth is pending plus in flight", "[admission_queue]") {
  GatedProcessor proc;
  CountingSink sink;
  AdmissionQueue<int> queue(MakeConfig(2, 50), proc, sink);

  for (int i = 0; i < 5; ++i) {
    REQUIRE(queue.Enqueue(i).has_value());
  }
  REQUIRE(proc.WaitStarted(2));
  REQUIRE(queue.PendingCount() == 3U);
  REQUIRE(queue.InFlightCount() == 2U);
  REQUIRE(queue.TotalItems() == 5U);
  REQUIRE(queue.Size() == queue.TotalItems());
  REQUIRE(sink.last_depth.load() == 5U);

  proc.Open();
  queue.Drain();
  REQUIRE(queue.TotalItems() == 0U);
  REQUIRE(sink.last_depth.load() == 0U);
  REQUIRE(sink.max_depth.load() == 5U);
}

// ============================================================================
// Drain
// ============================================================================

TEST_CASE("AdmissionQueue Drain returns at once when idle", "[admission_queue]") {
  GatedProcessor proc(true);
  CountingSink sink;
  AdmissionQueue<int> queue(MakeConfig(2, 10), proc, sink);

  const auto t0 = std::chrono::steady_clock::now();
  queue.Drain();
  REQUIRE(queue.DrainFor(std::chrono::milliseconds(0)));
  REQUIRE(std::chrono::steady_clock::now() - t0 < std::chrono::milliseconds(100));
}

TEST_CASE("AdmissionQueue Drain waits for every item to complete", "[admission_queue]") {
  GatedProcessor proc;
  CountingSink sink;
  AdmissionQueue<int> queue(MakeConfig(1, 10), proc, sink);

  REQUIRE(queue.Enqueue(1).has_value());
  REQUIRE(queue.Enqueue(2).has_value());

  std::atomic<bool> drained{false};
  std::atomic<size_t> finished_at_drain{0};
  std::thread waiter([&] {
    queue.Drain();
    finished_at_drain.store(proc.FinishedCount());
    drained.store(true);
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  REQUIRE(!drained.load());

  proc.Release(1);
  REQUIRE(proc.WaitStarted(2));
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  REQUIRE(!drained.load());

  proc.Release(1);
  waiter.join();
  REQUIRE(drained.load());
  REQUIRE(finished_at_drain.load() == 2U);
}

TEST_CASE("AdmissionQueue DrainFor times out while work is in flight", "[admission_queue]") {
  GatedProcessor proc;
  CountingSink sink;
  AdmissionQueue<int> queue(MakeConfig(1, 10), proc, sink);

  REQUIRE(queue.Enqueue(1).has_value());
  REQUIRE(proc.WaitStarted(1));
  REQUIRE(!queue.DrainFor(std::chrono::milliseconds(30)));

  proc.Open();
  REQUIRE(queue.DrainFor(std::chrono::seconds(2)));
}

TEST_CASE("AdmissionQueue Shutdown drains outstanding work", "[admission_queue]") {
  GatedProcessor proc(true);
  proc.SetWorkMs(5);
  CountingSink sink;
  AdmissionQueue<int> queue(MakeConfig(2, 20), proc, sink);

  for (int i = 0; i < 8; ++i) {
    REQUIRE(queue.Enqueue(i).has_value());
  }
  queue.Shutdown();
  REQUIRE(queue.TotalItems() == 0U);
  REQUIRE(sink.processed.load() == 8U);
}

// ============================================================================
// Dispatch mode
// ============================================================================

TEST_CASE("AdmissionQueue internal mode refuses pull primitives", "[admission_queue]") {
  GatedProcessor proc(true);
  CountingSink sink;
  AdmissionQueue<int> queue(MakeConfig(1, 10), proc, sink);

  REQUIRE(queue.Mode() == DispatchMode::kInternalPush);
  REQUIRE(queue.Dequeue().get_error() == QueueError::kWrongMode);
  REQUIRE(queue.ProcessNext().get_error() == QueueError::kWrongMode);
  REQUIRE(queue.ProcessItem(1).get_error() == QueueError::kWrongMode);
}

TEST_CASE("AdmissionQueue external mode holds items until pulled", "[admission_queue]") {
  GatedProcessor proc(true);
  CountingSink sink;
  AdmissionQueue<int> queue(MakeConfig(2, 10, DispatchMode::kExternalPull), proc, sink);

  REQUIRE(queue.Dequeue().get_error() == QueueError::kEmpty);
  REQUIRE(queue.ProcessNext().get_error() == QueueError::kEmpty);

  REQUIRE(queue.Enqueue(1).has_value());
  REQUIRE(queue.Enqueue(2).has_value());
  REQUIRE(queue.Enqueue(3).has_value());
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  REQUIRE(proc.StartedCount() == 0U);
  REQUIRE(queue.PendingCount() == 3U);

  auto head = queue.Dequeue();
  REQUIRE(head.has_value());
  REQUIRE(head.value() == 1);
  REQUIRE(sink.queue_waits.load() == 1U);
  REQUIRE(queue.ProcessItem(head.value()).has_value());
  REQUIRE(sink.processed.load() == 1U);

  REQUIRE(queue.ProcessNext().has_value());
  REQUIRE(proc.Finished() == std::vector<int>({1, 2}));
  REQUIRE(queue.TotalItems() == 1U);

  REQUIRE(queue.ProcessNext().has_value());
  REQUIRE(queue.ProcessNext().get_error() == QueueError::kEmpty);
  REQUIRE(queue.TotalItems() == 0U);
}

TEST_CASE("AdmissionQueue external ProcessNext reports final failure", "[admission_queue]") {
  GatedProcessor proc(true);
  proc.FailItem(7);
  CountingSink sink;
  AdmissionQueue<int> queue(MakeConfig(1, 10, DispatchMode::kExternalPull), proc, sink);

  REQUIRE(queue.Enqueue(7).has_value());
  auto r = queue.ProcessNext();
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == QueueError::kProcessingFailed);
  REQUIRE(sink.failed.load() == 1U);
  REQUIRE(sink.processed.load() == 0U);
  REQUIRE(queue.InFlightCount() == 0U);
}

TEST_CASE("QueueErrorToString names every error", "[admission_queue]") {
  REQUIRE(std::string(hookq::QueueErrorToString(QueueError::kOverloaded)) == "overloaded");
  REQUIRE(std::string(hookq::QueueErrorToString(QueueError::kEmpty)) == "empty");
  REQUIRE(std::string(hookq::QueueErrorToString(QueueError::kWrongMode)) == "wrong dispatch mode");
  REQUIRE(std::string(hookq::QueueErrorToString(QueueError::kProcessingFailed)) ==
          "processing failed");
}
