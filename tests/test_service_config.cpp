/**
 * @file test_service_config.cpp
 * @brief Tests for service_config.hpp: layering of defaults, file and environment.
 */

#include "hookq/service_config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <cstdlib>
#include <cstring>

using hookq::DispatchMode;
using hookq::ServiceConfig;

namespace {

const char* const kServiceEnv[] = {
    "HOST",           "PORT",         "CONCURRENCY",  "OVERLOAD_THRESHOLD",
    "DISPATCH_MODE",  "POLL_INTERVAL_MS", "RETRY_DELAY_MS", "MIN_DELAY_MS",
    "MAX_DELAY_MS",   "FAILURE_RATE", "LOG_LEVEL",
};

/// Clears every service variable on entry and exit.
class CleanEnv {
 public:
  CleanEnv() { Clear(); }
  ~CleanEnv() { Clear(); }

  void Set(const char* name, const char* value) { ::setenv(name, value, 1); }

 private:
  static void Clear() {
    for (const char* name : kServiceEnv) {
      ::unsetenv(name);
    }
  }
};

}  // namespace

TEST_CASE("ServiceConfig defaults", "[service_config]") {
  CleanEnv env;
  auto loaded = hookq::LoadServiceConfig(nullptr);
  REQUIRE(loaded.has_value());
  const ServiceConfig& cfg = loaded.value();
  REQUIRE(cfg.host == "0.0.0.0");
  REQUIRE(cfg.port == 3000);
  REQUIRE(cfg.concurrency == 10U);
  REQUIRE(cfg.overload_threshold == 100U);
  REQUIRE(cfg.mode == DispatchMode::kInternalPush);
  REQUIRE(cfg.poll_interval_ms == 100U);
  REQUIRE(cfg.retry_delay_ms == 200U);
  REQUIRE(cfg.min_delay_ms == 100U);
  REQUIRE(cfg.max_delay_ms == 300U);
  REQUIRE(cfg.failure_rate == 0.1);
  REQUIRE(cfg.log_level == hookq::log::Level::kInfo);
}

TEST_CASE("ParseDispatchMode accepts both modes case-insensitively", "[service_config]") {
  REQUIRE(hookq::ParseDispatchMode("internal").value() == DispatchMode::kInternalPush);
  REQUIRE(hookq::ParseDispatchMode("EXTERNAL").value() == DispatchMode::kExternalPull);
  REQUIRE(!hookq::ParseDispatchMode("pull").has_value());
  REQUIRE(!hookq::ParseDispatchMode(nullptr).has_value());
  REQUIRE(std::strcmp(hookq::DispatchModeName(DispatchMode::kExternalPull), "external") == 0);
}

TEST_CASE("ApplyConfigStore overlays present keys only", "[service_config]") {
  hookq::ConfigStore store;
  REQUIRE(store.Set("server", "port", "8081").has_value());
  REQUIRE(store.Set("queue", "dispatch_mode", "external").has_value());
  REQUIRE(store.Set("processor", "failure_rate", "0").has_value());
  REQUIRE(store.Set("log", "level", "warn").has_value());

  ServiceConfig cfg;
  cfg.concurrency = 3U;
  hookq::ApplyConfigStore(store, cfg);
  REQUIRE(cfg.port == 8081);
  REQUIRE(cfg.mode == DispatchMode::kExternalPull);
  REQUIRE(cfg.failure_rate == 0.0);
  REQUIRE(cfg.log_level == hookq::log::Level::kWarn);
  REQUIRE(cfg.concurrency == 3U);
  REQUIRE(cfg.overload_threshold == 100U);
}

TEST_CASE("ApplyConfigStore keeps values that do not parse", "[service_config]") {
  hookq::ConfigStore store;
  REQUIRE(store.Set("queue", "concurrency", "many").has_value());
  REQUIRE(store.Set("queue", "dispatch_mode", "sideways").has_value());
  REQUIRE(store.Set("processor", "failure_rate", "1.5").has_value());
  REQUIRE(store.Set("log", "level", "loud").has_value());

  ServiceConfig cfg;
  hookq::ApplyConfigStore(store, cfg);
  REQUIRE(cfg.concurrency == 10U);
  REQUIRE(cfg.mode == DispatchMode::kInternalPush);
  REQUIRE(cfg.failure_rate == 0.1);
  REQUIRE(cfg.log_level == hookq::log::Level::kInfo);
}

TEST_CASE("Environment overrides defaults", "[service_config]") {
  CleanEnv env;
  env.Set("PORT", "4000");
  env.Set("CONCURRENCY", "2");
  env.Set("OVERLOAD_THRESHOLD", "5");
  env.Set("DISPATCH_MODE", "external");
  env.Set("RETRY_DELAY_MS", "50");
  env.Set("FAILURE_RATE", "0.5");

  auto loaded = hookq::LoadServiceConfig(nullptr);
  REQUIRE(loaded.has_value());
  const ServiceConfig& cfg = loaded.value();
  REQUIRE(cfg.port == 4000);
  REQUIRE(cfg.concurrency == 2U);
  REQUIRE(cfg.overload_threshold == 5U);
  REQUIRE(cfg.mode == DispatchMode::kExternalPull);
  REQUIRE(cfg.retry_delay_ms == 50U);
  REQUIRE(cfg.failure_rate == 0.5);
}

TEST_CASE("MAX_DELAY_MS below MIN_DELAY_MS is raised", "[service_config]") {
  CleanEnv env;
  env.Set("MIN_DELAY_MS", "400");
  env.Set("MAX_DELAY_MS", "50");
  auto loaded = hookq::LoadServiceConfig(nullptr);
  REQUIRE(loaded.has_value());
  REQUIRE(loaded.value().min_delay_ms == 400U);
  REQUIRE(loaded.value().max_delay_ms == 400U);
}

#ifdef HOOKQ_CONFIG_INI_ENABLED

TEST_CASE("Environment wins over the config file", "[service_config]") {
  const char* path = "/tmp/hookq_test_service.ini";
  FILE* f = std::fopen(path, "w");
  REQUIRE(f != nullptr);
  std::fprintf(f,
               "[server]\nport = 5000\n"
               "[queue]\nconcurrency = 4\noverload_threshold = 20\n");
  std::fclose(f);

  CleanEnv env;
  env.Set("CONCURRENCY", "6");
  env.Set("OVERLOAD_THRESHOLD", "not-a-number");

  auto loaded = hookq::LoadServiceConfig(path);
  std::remove(path);
  REQUIRE(loaded.has_value());
  const ServiceConfig& cfg = loaded.value();
  REQUIRE(cfg.port == 5000);
  REQUIRE(cfg.concurrency == 6U);
  // Malformed environment value keeps what the file said.
  REQUIRE(cfg.overload_threshold == 20U);
}

TEST_CASE("LoadServiceConfig reports a missing file", "[service_config]") {
  CleanEnv env;
  auto loaded = hookq::LoadServiceConfig("/nonexistent/hookq.ini");
  REQUIRE(!loaded.has_value());
  REQUIRE(loaded.get_error() == hookq::ConfigError::kFileNotFound);
}

#endif  // HOOKQ_CONFIG_INI_ENABLED

TEST_CASE("ServiceConfig projects onto component configs", "[service_config]") {
  ServiceConfig cfg;
  cfg.host = "127.0.0.1";
  cfg.port = 0;
  cfg.concurrency = 4U;
  cfg.overload_threshold = 12U;
  cfg.mode = DispatchMode::kExternalPull;
  cfg.poll_interval_ms = 25U;
  cfg.retry_delay_ms = 75U;
  cfg.min_delay_ms = 1U;
  cfg.max_delay_ms = 2U;
  cfg.failure_rate = 0.3;

  const hookq::QueueConfig q = hookq::ToQueueConfig(cfg);
  REQUIRE(q.concurrency == 4U);
  REQUIRE(q.overload_threshold == 12U);
  REQUIRE(q.mode == DispatchMode::kExternalPull);

  REQUIRE(hookq::ToRetryPolicy(cfg).retry_delay_ms == 75U);
  REQUIRE(hookq::ToConsumerConfig(cfg).poll_interval_ms == 25U);

  const hookq::SimulatedWorkConfig w = hookq::ToSimulatedWorkConfig(cfg);
  REQUIRE(w.min_delay_ms == 1U);
  REQUIRE(w.max_delay_ms == 2U);
  REQUIRE(w.failure_rate == 0.3);

  const hookq::HttpServerConfig h = hookq::ToHttpServerConfig(cfg);
  REQUIRE(h.host == "127.0.0.1");
  REQUIRE(h.port == 0);
}
