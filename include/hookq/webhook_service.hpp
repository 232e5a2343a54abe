/**
 * @file webhook_service.hpp
 * @brief HTTP routes of the webhook service.
 *
 *   POST /webhook   JSON object body -> Enqueue -> 202 / 429 / 500, else 400
 *   GET  /health    {"status":"ok","uptime":<s>,"timestamp":"<ISO-8601>"}
 *   GET  /metrics   Prometheus text exposition
 *   *               404
 */

#ifndef HOOKQ_WEBHOOK_SERVICE_HPP_
#define HOOKQ_WEBHOOK_SERVICE_HPP_

#include "hookq/admission_queue.hpp"
#include "hookq/http.hpp"
#include "hookq/log.hpp"
#include "hookq/metrics.hpp"
#include "hookq/platform.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <cstdio>
#include <ctime>

#include <atomic>
#include <string>
#include <utility>

namespace hookq {

/// @brief One admitted webhook: the raw JSON body and a sequence number.
struct WebhookEvent {
  uint64_t id = 0;
  std::string body;
};

using WebhookQueue = AdmissionQueue<WebhookEvent>;

namespace detail {

/// @brief Current UTC time as "YYYY-MM-DDTHH:MM:SS.mmmZ".
inline std::string IsoTimestampUtc() {
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  struct tm tm_utc;
  gmtime_r(&ts.tv_sec, &tm_utc);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03ldZ", tm_utc.tm_year + 1900,
                tm_utc.tm_mon + 1, tm_utc.tm_mday, tm_utc.tm_hour, tm_utc.tm_min, tm_utc.tm_sec,
                static_cast<long>(ts.tv_nsec / 1000000L));
  return std::string(buf);
}

/// @brief Media type is application/json, parameters such as charset allowed.
inline bool IsJsonContentType(const std::string* value) noexcept {
  if (value == nullptr) return false;
  static constexpr char kJson[] = "application/json";
  const size_t n = sizeof(kJson) - 1U;
  if (value->size() < n) return false;
  if (!CaseEqual(value->data(), n, kJson)) return false;
  return value->size() == n || (*value)[n] == ';' || (*value)[n] == ' ';
}

}  // namespace detail

class WebhookService {
 public:
  WebhookService(WebhookQueue& queue, const WebhookMetrics& metrics) noexcept
      : queue_(queue), metrics_(metrics), started_ns_(SteadyNowNs()) {}

  WebhookService(const WebhookService&) = delete;
  WebhookService& operator=(const WebhookService&) = delete;

  /// @brief HttpHandlerFn entry point; @p context is the WebhookService.
  static HttpResponse Dispatch(const HttpRequest& req, void* context) {
    return static_cast<WebhookService*>(context)->Handle(req);
  }

  HttpResponse Handle(const HttpRequest& req) {
    if (req.path == "/webhook" || req.path == "/webhook/") {
      if (req.method == "POST") return HandleWebhook(req);
    } else if (req.path == "/health") {
      if (req.method == "GET") return HandleHealth();
    } else if (req.path == "/metrics") {
      if (req.method == "GET") return HandleMetrics();
    }
    return HttpResponse::Json(404, "{\"error\":\"Not Found\"}");
  }

  HttpResponse HandleWebhook(const HttpRequest& req) {
    if (!detail::IsJsonContentType(req.Header("Content-Type"))) {
      return HttpResponse::Json(400, "{\"error\":\"Invalid JSON payload\"}");
    }
    auto doc = nlohmann::json::parse(req.body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
      return HttpResponse::Json(400, "{\"error\":\"Invalid JSON payload\"}");
    }

    WebhookEvent event;
    event.id = next_id_.fetch_add(1U, std::memory_order_relaxed) + 1U;
    event.body = req.body;
    auto r = queue_.Enqueue(std::move(event));
    if (r.has_value()) {
      return HttpResponse::Json(202, "{\"status\":\"Accepted\"}");
    }
    if (r.get_error() == QueueError::kOverloaded) {
      return HttpResponse::Json(429, "{\"error\":\"Too Many Requests\"}");
    }
    HOOKQ_LOG_ERROR("webhook", "enqueue failed: %s", QueueErrorToString(r.get_error()));
    return HttpResponse::Json(500, "{\"error\":\"Internal server error\"}");
  }

  HttpResponse HandleHealth() const {
    nlohmann::json body;
    body["status"] = "ok";
    body["uptime"] = UptimeSeconds();
    body["timestamp"] = detail::IsoTimestampUtc();
    return HttpResponse::Json(200, body.dump());
  }

  HttpResponse HandleMetrics() const {
    std::string text;
    metrics_.Render(text);
    return HttpResponse::Text(200, std::move(text));
  }

  double UptimeSeconds() const noexcept { return ElapsedMs(started_ns_) / 1000.0; }

 private:
  WebhookQueue& queue_;
  const WebhookMetrics& metrics_;
  const uint64_t started_ns_;
  std::atomic<uint64_t> next_id_{0U};
};

}  // namespace hookq

#endif  // HOOKQ_WEBHOOK_SERVICE_HPP_
