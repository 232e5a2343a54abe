/**
 * @file metrics_sink.hpp
 * @brief Event sink the admission queue reports into.
 *
 * The queue calls these hooks; a sink never calls back into the queue.
 * Implementations must tolerate concurrent calls from any thread.
 */

#ifndef HOOKQ_METRICS_SINK_HPP_
#define HOOKQ_METRICS_SINK_HPP_

#include <cstdint>

namespace hookq {

class MetricsSink {
 public:
  virtual ~MetricsSink() = default;

  /// An item was admitted.
  virtual void OnReceived() noexcept = 0;
  /// An item settled successfully.
  virtual void OnProcessed() noexcept = 0;
  /// An item was refused by the admission check.
  virtual void OnRejected() noexcept = 0;
  /// An item settled with a final failure (never also counted as processed).
  virtual void OnFailed() noexcept = 0;
  /// Pending + in-flight after a state change.
  virtual void OnDepthChanged(uint32_t depth) noexcept = 0;
  /// Time between admission and dispatch.
  virtual void OnQueueWait(double ms) noexcept = 0;
  /// Duration of one successful processing invocation, retries included.
  virtual void OnProcessingDuration(double ms) noexcept = 0;
};

/// @brief Sink that discards everything.
class NullMetricsSink final : public MetricsSink {
 public:
  void OnReceived() noexcept override {}
  void OnProcessed() noexcept override {}
  void OnRejected() noexcept override {}
  void OnFailed() noexcept override {}
  void OnDepthChanged(uint32_t) noexcept override {}
  void OnQueueWait(double) noexcept override {}
  void OnProcessingDuration(double) noexcept override {}
};

}  // namespace hookq

#endif  // HOOKQ_METRICS_SINK_HPP_
