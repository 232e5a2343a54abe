/**
 * @file service_config.hpp
 * @brief Webhook service settings: defaults, then config file, then environment.
 *
 *   env                  section.key                  default
 *   PORT                 server.port                  3000
 *   HOST                 server.host                  0.0.0.0
 *   CONCURRENCY          queue.concurrency            10
 *   OVERLOAD_THRESHOLD   queue.overload_threshold     100
 *   DISPATCH_MODE        queue.dispatch_mode          internal
 *   POLL_INTERVAL_MS     queue.poll_interval_ms       100
 *   RETRY_DELAY_MS       processor.retry_delay_ms     200
 *   MIN_DELAY_MS         processor.min_delay_ms       100
 *   MAX_DELAY_MS         processor.max_delay_ms       300
 *   FAILURE_RATE         processor.failure_rate       0.1
 *   LOG_LEVEL            log.level                    info
 *
 * A value that does not parse keeps whatever the previous layer set.
 */

#ifndef HOOKQ_SERVICE_CONFIG_HPP_
#define HOOKQ_SERVICE_CONFIG_HPP_

#include "hookq/admission_queue.hpp"
#include "hookq/config.hpp"
#include "hookq/consumer.hpp"
#include "hookq/http.hpp"
#include "hookq/log.hpp"
#include "hookq/processor.hpp"
#include "hookq/vocabulary.hpp"

#include <cstdint>

namespace hookq {

struct ServiceConfig {
  FixedString<63> host{"0.0.0.0"};
  uint16_t port = 3000;
  uint32_t concurrency = kDefaultConcurrency;
  uint32_t overload_threshold = kDefaultOverloadThreshold;
  DispatchMode mode = DispatchMode::kInternalPush;
  uint32_t poll_interval_ms = kDefaultPollIntervalMs;
  uint32_t retry_delay_ms = kDefaultRetryDelayMs;
  uint32_t min_delay_ms = 100;
  uint32_t max_delay_ms = 300;
  double failure_rate = 0.1;
  log::Level log_level = log::Level::kInfo;
};

/// @brief "internal" / "external" (case-insensitive). Empty on anything else.
inline optional<DispatchMode> ParseDispatchMode(const char* text) noexcept {
  if (text == nullptr) return {};
  if (detail::CaseEqual(text, "internal")) return optional<DispatchMode>(DispatchMode::kInternalPush);
  if (detail::CaseEqual(text, "external")) return optional<DispatchMode>(DispatchMode::kExternalPull);
  return {};
}

inline const char* DispatchModeName(DispatchMode mode) noexcept {
  return mode == DispatchMode::kInternalPush ? "internal" : "external";
}

/**
 * @brief Overlay every key present in @p store onto @p cfg.
 *
 * Keys that are absent or malformed leave the corresponding field as is.
 */
inline void ApplyConfigStore(const ConfigStore& store, ServiceConfig& cfg) noexcept {
  if (store.HasKey("server", "host")) {
    cfg.host.assign(store.GetString("server", "host", cfg.host.c_str()));
  }
  cfg.port = store.GetPort("server", "port", cfg.port);
  cfg.concurrency = store.GetUint("queue", "concurrency", cfg.concurrency);
  cfg.overload_threshold = store.GetUint("queue", "overload_threshold", cfg.overload_threshold);
  if (store.HasKey("queue", "dispatch_mode")) {
    auto mode = ParseDispatchMode(store.GetString("queue", "dispatch_mode"));
    if (mode.has_value()) {
      cfg.mode = mode.value();
    } else {
      HOOKQ_LOG_WARN("config", "unknown dispatch_mode '%s', keeping '%s'",
                     store.GetString("queue", "dispatch_mode"), DispatchModeName(cfg.mode));
    }
  }
  cfg.poll_interval_ms = store.GetUint("queue", "poll_interval_ms", cfg.poll_interval_ms);
  cfg.retry_delay_ms = store.GetUint("processor", "retry_delay_ms", cfg.retry_delay_ms);
  cfg.min_delay_ms = store.GetUint("processor", "min_delay_ms", cfg.min_delay_ms);
  cfg.max_delay_ms = store.GetUint("processor", "max_delay_ms", cfg.max_delay_ms);
  const double rate = store.GetDouble("processor", "failure_rate", cfg.failure_rate);
  if (rate >= 0.0 && rate <= 1.0) {
    cfg.failure_rate = rate;
  } else {
    HOOKQ_LOG_WARN("config", "failure_rate %g out of [0, 1], keeping %g", rate, cfg.failure_rate);
  }
  if (store.HasKey("log", "level")) {
    auto level = log::ParseLevel(store.GetString("log", "level"));
    if (level.has_value()) cfg.log_level = level.value();
  }
}

/// @brief Overlay the process environment (PORT, CONCURRENCY, ...) onto @p cfg.
inline void ApplyEnvironment(ServiceConfig& cfg) noexcept {
  ConfigStore env;
  (void)env.SetFromEnv("HOST", "server", "host");
  (void)env.SetFromEnv("PORT", "server", "port");
  (void)env.SetFromEnv("CONCURRENCY", "queue", "concurrency");
  (void)env.SetFromEnv("OVERLOAD_THRESHOLD", "queue", "overload_threshold");
  (void)env.SetFromEnv("DISPATCH_MODE", "queue", "dispatch_mode");
  (void)env.SetFromEnv("POLL_INTERVAL_MS", "queue", "poll_interval_ms");
  (void)env.SetFromEnv("RETRY_DELAY_MS", "processor", "retry_delay_ms");
  (void)env.SetFromEnv("MIN_DELAY_MS", "processor", "min_delay_ms");
  (void)env.SetFromEnv("MAX_DELAY_MS", "processor", "max_delay_ms");
  (void)env.SetFromEnv("FAILURE_RATE", "processor", "failure_rate");
  (void)env.SetFromEnv("LOG_LEVEL", "log", "level");
  ApplyConfigStore(env, cfg);
}

/**
 * @brief Defaults, then @p path (if non-null), then the environment.
 * @return kFileNotFound / kParseError / kFormatNotSupported from the file layer.
 */
inline expected<ServiceConfig, ConfigError> LoadServiceConfig(const char* path) noexcept {
  ServiceConfig cfg;
  if (path != nullptr && path[0] != '\0') {
    MultiConfig file;
    auto r = file.LoadFile(path);
    if (!r.has_value()) {
      return expected<ServiceConfig, ConfigError>::error(r.get_error());
    }
    ApplyConfigStore(file, cfg);
  }
  ApplyEnvironment(cfg);
  if (cfg.max_delay_ms < cfg.min_delay_ms) {
    HOOKQ_LOG_WARN("config", "max_delay_ms %u < min_delay_ms %u, using %u for both",
                   cfg.max_delay_ms, cfg.min_delay_ms, cfg.min_delay_ms);
    cfg.max_delay_ms = cfg.min_delay_ms;
  }
  return expected<ServiceConfig, ConfigError>::success(cfg);
}

// ============================================================================
// Projections onto component configs
// ============================================================================

inline QueueConfig ToQueueConfig(const ServiceConfig& cfg) noexcept {
  QueueConfig q;
  q.concurrency = cfg.concurrency;
  q.overload_threshold = cfg.overload_threshold;
  q.mode = cfg.mode;
  return q;
}

inline RetryPolicy ToRetryPolicy(const ServiceConfig& cfg) noexcept {
  RetryPolicy p;
  p.retry_delay_ms = cfg.retry_delay_ms;
  return p;
}

inline SimulatedWorkConfig ToSimulatedWorkConfig(const ServiceConfig& cfg) noexcept {
  SimulatedWorkConfig w;
  w.min_delay_ms = cfg.min_delay_ms;
  w.max_delay_ms = cfg.max_delay_ms;
  w.failure_rate = cfg.failure_rate;
  return w;
}

inline ConsumerConfig ToConsumerConfig(const ServiceConfig& cfg) noexcept {
  ConsumerConfig c;
  c.poll_interval_ms = cfg.poll_interval_ms;
  return c;
}

inline HttpServerConfig ToHttpServerConfig(const ServiceConfig& cfg) noexcept {
  HttpServerConfig h;
  h.host.assign(cfg.host.c_str());
  h.port = cfg.port;
  return h;
}

}  // namespace hookq

#endif  // HOOKQ_SERVICE_CONFIG_HPP_
