/**
 * @file metrics.hpp
 * @brief Lock-free counters, gauge and fixed-bucket histograms with
 *        Prometheus text exposition; WebhookMetrics implements MetricsSink.
 *
 * Exposed series:
 *   webhook_total_received        counter
 *   webhook_total_processed       counter
 *   webhook_total_failed          counter
 *   webhook_too_many_requests     counter
 *   webhook_queue_length          gauge
 *   webhook_processing_time_ms    histogram (10..5000)
 *   webhook_queue_time_ms         histogram (10..1000)
 */

#ifndef HOOKQ_METRICS_HPP_
#define HOOKQ_METRICS_HPP_

#include "hookq/metrics_sink.hpp"

#include <cstdint>
#include <cstdio>

#include <array>
#include <atomic>
#include <string>

namespace hookq {

// ============================================================================
// Primitives
// ============================================================================

class Counter {
 public:
  void Inc(uint64_t n = 1U) noexcept { value_.fetch_add(n, std::memory_order_relaxed); }
  uint64_t Value() const noexcept { return value_.load(std::memory_order_relaxed); }

 private:
  std::atomic<uint64_t> value_{0U};
};

class Gauge {
 public:
  void Set(int64_t v) noexcept { value_.store(v, std::memory_order_relaxed); }
  int64_t Value() const noexcept { return value_.load(std::memory_order_relaxed); }

 private:
  std::atomic<int64_t> value_{0};
};

/**
 * @brief Histogram over N upper bounds plus +Inf.
 *
 * Buckets are stored non-cumulatively and summed at render time.
 */
template <size_t N>
class Histogram {
 public:
  explicit Histogram(const std::array<double, N>& bounds) noexcept : bounds_(bounds) {}

  void Observe(double v) noexcept {
    size_t i = 0;
    while (i < N && v > bounds_[i]) {
      ++i;
    }
    buckets_[i].fetch_add(1U, std::memory_order_relaxed);
    count_.fetch_add(1U, std::memory_order_relaxed);
    double cur = sum_.load(std::memory_order_relaxed);
    while (!sum_.compare_exchange_weak(cur, cur + v, std::memory_order_relaxed)) {
    }
  }

  uint64_t Count() const noexcept { return count_.load(std::memory_order_relaxed); }
  double Sum() const noexcept { return sum_.load(std::memory_order_relaxed); }

  /// @brief Cumulative count of observations <= bounds[i] (i == N means +Inf).
  uint64_t CumulativeBucket(size_t i) const noexcept {
    uint64_t total = 0;
    for (size_t k = 0; k <= i && k <= N; ++k) {
      total += buckets_[k].load(std::memory_order_relaxed);
    }
    return total;
  }

  const std::array<double, N>& Bounds() const noexcept { return bounds_; }

 private:
  std::array<double, N> bounds_;
  std::array<std::atomic<uint64_t>, N + 1> buckets_{};
  std::atomic<uint64_t> count_{0U};
  std::atomic<double> sum_{0.0};
};

// ============================================================================
// Exposition helpers
// ============================================================================

namespace detail {

inline void AppendHeader(std::string& out, const char* name, const char* help,
                         const char* type) {
  out += "# HELP ";
  out += name;
  out += ' ';
  out += help;
  out += "\n# TYPE ";
  out += name;
  out += ' ';
  out += type;
  out += '\n';
}

inline void AppendSample(std::string& out, const char* name, const char* suffix,
                         const char* labels, double value) {
  char buf[192];
  int n = std::snprintf(buf, sizeof(buf), "%s%s%s %.17g\n", name, suffix, labels, value);
  if (n > 0) out.append(buf, static_cast<size_t>(n) < sizeof(buf) ? n : sizeof(buf) - 1);
}

inline void AppendSample(std::string& out, const char* name, const char* suffix,
                         const char* labels, uint64_t value) {
  char buf[192];
  int n = std::snprintf(buf, sizeof(buf), "%s%s%s %llu\n", name, suffix, labels,
                        static_cast<unsigned long long>(value));
  if (n > 0) out.append(buf, static_cast<size_t>(n) < sizeof(buf) ? n : sizeof(buf) - 1);
}

template <size_t N>
void AppendHistogram(std::string& out, const char* name, const char* help,
                     const Histogram<N>& h) {
  AppendHeader(out, name, help, "histogram");
  char labels[48];
  for (size_t i = 0; i < N; ++i) {
    std::snprintf(labels, sizeof(labels), "{le=\"%g\"}", h.Bounds()[i]);
    AppendSample(out, name, "_bucket", labels, h.CumulativeBucket(i));
  }
  AppendSample(out, name, "_bucket", "{le=\"+Inf\"}", h.CumulativeBucket(N));
  AppendSample(out, name, "_sum", "", h.Sum());
  AppendSample(out, name, "_count", "", h.Count());
}

}  // namespace detail

// ============================================================================
// WebhookMetrics
// ============================================================================

struct MetricsSnapshot {
  uint64_t received;
  uint64_t processed;
  uint64_t failed;
  uint64_t rejected;
  int64_t queue_length;
  uint64_t processing_count;
  double processing_sum_ms;
  uint64_t queue_wait_count;
  double queue_wait_sum_ms;
};

class WebhookMetrics final : public MetricsSink {
 public:
  static constexpr std::array<double, 8> kProcessingBucketsMs{
      {10, 50, 100, 200, 500, 1000, 2000, 5000}};
  static constexpr std::array<double, 6> kQueueBucketsMs{{10, 50, 100, 200, 500, 1000}};

  WebhookMetrics() noexcept
      : processing_time_(kProcessingBucketsMs), queue_time_(kQueueBucketsMs) {}

  WebhookMetrics(const WebhookMetrics&) = delete;
  WebhookMetrics& operator=(const WebhookMetrics&) = delete;

  // --- MetricsSink ---

  void OnReceived() noexcept override { received_.Inc(); }
  void OnProcessed() noexcept override { processed_.Inc(); }
  void OnRejected() noexcept override { rejected_.Inc(); }
  void OnFailed() noexcept override { failed_.Inc(); }
  void OnDepthChanged(uint32_t depth) noexcept override {
    queue_length_.Set(static_cast<int64_t>(depth));
  }
  void OnQueueWait(double ms) noexcept override { queue_time_.Observe(ms); }
  void OnProcessingDuration(double ms) noexcept override { processing_time_.Observe(ms); }

  // --- Export ---

  /// @brief Append the Prometheus text exposition to @p out.
  void Render(std::string& out) const {
    detail::AppendHeader(out, "webhook_total_received", "Total webhooks admitted", "counter");
    detail::AppendSample(out, "webhook_total_received", "", "", received_.Value());
    detail::AppendHeader(out, "webhook_total_processed", "Total webhooks processed successfully",
                         "counter");
    detail::AppendSample(out, "webhook_total_processed", "", "", processed_.Value());
    detail::AppendHeader(out, "webhook_total_failed", "Total webhooks that failed after retry",
                         "counter");
    detail::AppendSample(out, "webhook_total_failed", "", "", failed_.Value());
    detail::AppendHeader(out, "webhook_too_many_requests",
                         "Total webhooks rejected because the queue was full", "counter");
    detail::AppendSample(out, "webhook_too_many_requests", "", "", rejected_.Value());
    detail::AppendHeader(out, "webhook_queue_length", "Items pending or in flight", "gauge");
    detail::AppendSample(out, "webhook_queue_length", "", "",
                         static_cast<double>(queue_length_.Value()));
    detail::AppendHistogram(out, "webhook_processing_time_ms",
                            "Webhook processing time in milliseconds", processing_time_);
    detail::AppendHistogram(out, "webhook_queue_time_ms",
                            "Time webhooks spend waiting in the queue in milliseconds",
                            queue_time_);
  }

  MetricsSnapshot Snapshot() const noexcept {
    return MetricsSnapshot{received_.Value(),        processed_.Value(),
                           failed_.Value(),          rejected_.Value(),
                           queue_length_.Value(),    processing_time_.Count(),
                           processing_time_.Sum(),   queue_time_.Count(),
                           queue_time_.Sum()};
  }

  const Histogram<8>& ProcessingTime() const noexcept { return processing_time_; }
  const Histogram<6>& QueueTime() const noexcept { return queue_time_; }

 private:
  Counter received_;
  Counter processed_;
  Counter failed_;
  Counter rejected_;
  Gauge queue_length_;
  Histogram<8> processing_time_;
  Histogram<6> queue_time_;
};

}  // namespace hookq

#endif  // HOOKQ_METRICS_HPP_
