/**
 * @file main.cpp
 * @brief hookq_server - webhook ingestion service.
 *
 * Usage: hookq_server [--config <file.ini|file.json|file.yaml>]
 *
 * Settings come from the optional config file, then the environment
 * (PORT, CONCURRENCY, OVERLOAD_THRESHOLD, DISPATCH_MODE, ...). SIGINT or
 * SIGTERM closes the listener, stops the consumer, drains the queue and
 * exits 0.
 */

#include "hookq/admission_queue.hpp"
#include "hookq/consumer.hpp"
#include "hookq/http.hpp"
#include "hookq/log.hpp"
#include "hookq/metrics.hpp"
#include "hookq/processor.hpp"
#include "hookq/service_config.hpp"
#include "hookq/shutdown.hpp"
#include "hookq/webhook_service.hpp"

#include <cstdio>
#include <cstring>

namespace {

const char* FindConfigArg(int argc, char* argv[]) {
  for (int i = 1; i < argc - 1; ++i) {
    if (std::strcmp(argv[i], "--config") == 0) {
      return argv[i + 1];
    }
  }
  // A lone positional argument is also accepted as the config path.
  if (argc == 2 && argv[1][0] != '-') {
    return argv[1];
  }
  return nullptr;
}

// ---------------------------------------------------------------------------
// Shutdown steps (run in reverse registration order)
// ---------------------------------------------------------------------------

void StopHttp(int /*signo*/, void* ctx) {
  HOOKQ_LOG_INFO("main", "closing HTTP server");
  static_cast<hookq::HttpServer*>(ctx)->Stop();
}

void StopConsumer(int /*signo*/, void* ctx) {
  HOOKQ_LOG_INFO("main", "stopping external consumer");
  static_cast<hookq::ExternalConsumer<hookq::WebhookEvent>*>(ctx)->Stop();
}

void DrainQueue(int /*signo*/, void* ctx) {
  auto* queue = static_cast<hookq::WebhookQueue*>(ctx);
  if (queue->Mode() == hookq::DispatchMode::kExternalPull) {
    // Nothing consumes pending items once the consumer is gone; finish them here.
    while (true) {
      auto r = queue->ProcessNext();
      if (!r.has_value() && r.get_error() == hookq::QueueError::kEmpty) break;
    }
  }
  queue->Shutdown();
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc > 1 && (std::strcmp(argv[1], "--help") == 0 || std::strcmp(argv[1], "-h") == 0)) {
    std::printf("Usage: %s [--config <file>]\n", argv[0]);
    return 0;
  }

  hookq::log::Init();

  auto loaded = hookq::LoadServiceConfig(FindConfigArg(argc, argv));
  if (!loaded.has_value()) {
    HOOKQ_LOG_ERROR("main", "failed to load configuration (error %u)",
                    static_cast<unsigned>(loaded.get_error()));
    return 1;
  }
  const hookq::ServiceConfig& cfg = loaded.value();
  hookq::log::SetLevel(cfg.log_level);

  HOOKQ_LOG_INFO("main", "port=%u concurrency=%u threshold=%u mode=%s retry_delay=%ums",
                 static_cast<unsigned>(cfg.port), cfg.concurrency, cfg.overload_threshold,
                 hookq::DispatchModeName(cfg.mode), cfg.retry_delay_ms);

  // --- Core ---
  hookq::WebhookMetrics metrics;
  hookq::SimulatedWork<hookq::WebhookEvent> work(hookq::ToSimulatedWorkConfig(cfg));
  hookq::RetryingProcessor<hookq::WebhookEvent> processor(work, hookq::ToRetryPolicy(cfg));
  hookq::WebhookQueue queue(hookq::ToQueueConfig(cfg), processor, metrics);

  hookq::ExternalConsumer<hookq::WebhookEvent> consumer(queue, hookq::ToConsumerConfig(cfg));
  if (cfg.mode == hookq::DispatchMode::kExternalPull) {
    auto started = consumer.Start();
    if (!started.has_value()) {
      HOOKQ_LOG_ERROR("main", "consumer failed to start");
      return 1;
    }
  }

  // --- HTTP ---
  hookq::WebhookService service(queue, metrics);
  hookq::HttpServer server(hookq::ToHttpServerConfig(cfg), &hookq::WebhookService::Dispatch,
                           &service);
  auto listening = server.Start();
  if (!listening.has_value()) {
    HOOKQ_LOG_ERROR("main", "HTTP server failed to start");
    return 1;
  }

  // --- Shutdown ---
  hookq::ShutdownManager shutdown;
  if (!shutdown.Register(&DrainQueue, &queue, "queue").has_value() ||
      !shutdown.Register(&StopConsumer, &consumer, "consumer").has_value() ||
      !shutdown.Register(&StopHttp, &server, "http").has_value()) {
    HOOKQ_LOG_ERROR("main", "cannot register shutdown steps");
    return 1;
  }
  auto installed = shutdown.InstallSignalHandlers();
  if (!installed.has_value()) {
    HOOKQ_LOG_ERROR("main", "cannot install signal handlers");
    return 1;
  }

  shutdown.WaitForShutdown();

  const auto stats = processor.Stats();
  HOOKQ_LOG_INFO("main", "attempts=%llu retries=%llu successes=%llu failures=%llu",
                 static_cast<unsigned long long>(stats.attempts),
                 static_cast<unsigned long long>(stats.retries),
                 static_cast<unsigned long long>(stats.successes),
                 static_cast<unsigned long long>(stats.failures));
  std::printf("All queued items processed, exiting now\n");
  std::fflush(stdout);
  hookq::log::Shutdown();
  return 0;
}
