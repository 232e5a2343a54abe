/**
 * @file main.cpp
 * @brief hookq_load - HTTP load generator for hookq_server.
 *
 * Sends JSON POSTs in batches of --concurrency threads, pausing --delay ms
 * between launches inside a batch, and prints a latency / status summary.
 */

#include "hookq/http.hpp"
#include "hookq/log.hpp"
#include "hookq/platform.hpp"
#include "hookq/socket.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {

struct LoadOptions {
  const char* host = "localhost";
  uint16_t port = 3000;
  const char* path = "/webhook";
  uint32_t requests = 10000;
  uint32_t delay_ms = 5;
  uint32_t concurrency = 1;
  bool verbose = false;
};

struct LoadStats {
  std::mutex mtx;
  uint32_t completed = 0;
  std::map<uint16_t, uint32_t> status_codes;
  std::map<std::string, uint32_t> errors;
  double min_ms = -1.0;
  double max_ms = 0.0;
  double total_ms = 0.0;
};

const char* ArgValue(int argc, char* argv[], const char* flag, const char* fallback) {
  for (int i = 1; i < argc - 1; ++i) {
    if (std::strcmp(argv[i], flag) == 0) return argv[i + 1];
  }
  return fallback;
}

bool HasFlag(int argc, char* argv[], const char* flag) {
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], flag) == 0) return true;
  }
  return false;
}

uint32_t ParseUint(const char* text, uint32_t fallback) {
  char* end = nullptr;
  long v = std::strtol(text, &end, 10);
  return (end == text || v < 0) ? fallback : static_cast<uint32_t>(v);
}

void PrintUsage() {
  std::printf(
      "Usage: hookq_load [options]\n\n"
      "Options:\n"
      "  --host <hostname>       Server hostname (default: localhost)\n"
      "  --port <port>           Server port (default: 3000)\n"
      "  --path <path>           Webhook path (default: /webhook)\n"
      "  --requests <number>     Total number of requests to send (default: 10000)\n"
      "  --delay <ms>            Delay between requests in milliseconds (default: 5)\n"
      "  --concurrency <number>  Number of concurrent requests (default: 1)\n"
      "  --verbose               Show detailed output for each request\n"
      "  --help                  Show this help message\n");
}

const char* HttpErrorText(hookq::HttpError err) {
  switch (err) {
    case hookq::HttpError::kConnectFailed:
      return "connect failed";
    case hookq::HttpError::kSendFailed:
      return "send failed";
    case hookq::HttpError::kRecvFailed:
      return "recv failed";
    case hookq::HttpError::kTimeout:
      return "timeout";
    case hookq::HttpError::kMalformed:
      return "malformed response";
    default:
      return "unknown error";
  }
}

void SendOne(const LoadOptions& opt, const hookq::SocketAddress& addr, uint32_t id,
             LoadStats& stats) {
  nlohmann::json payload;
  payload["id"] = id;
  payload["timestamp"] = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());

  const uint64_t start = hookq::SteadyNowNs();
  auto r = hookq::HttpRequestOnce(addr, "POST", opt.path, "application/json", payload.dump());
  const double ms = hookq::ElapsedMs(start);

  std::lock_guard<std::mutex> lk(stats.mtx);
  if (!r.has_value()) {
    const char* what = HttpErrorText(r.get_error());
    ++stats.errors[what];
    if (opt.verbose) std::fprintf(stderr, "Request %u failed: %s\n", id, what);
    return;
  }
  const uint16_t status = r.value().status;
  ++stats.completed;
  ++stats.status_codes[status];
  if (stats.min_ms < 0.0 || ms < stats.min_ms) stats.min_ms = ms;
  if (ms > stats.max_ms) stats.max_ms = ms;
  stats.total_ms += ms;

  if (opt.verbose) {
    std::printf("Request %u/%u - Status: %u (%.0fms)\n", id, opt.requests,
                static_cast<unsigned>(status), ms);
  } else if (id % 100U == 0U || id == opt.requests) {
    std::printf("Progress: %u%% (%u/%u)\n", static_cast<unsigned>(100ULL * id / opt.requests), id,
                opt.requests);
  }
}

void PrintSummary(const LoadOptions& opt, LoadStats& stats, double seconds) {
  const double avg = stats.completed > 0U ? stats.total_ms / stats.completed : 0.0;
  std::printf("\n=== Load Test Summary ===\n");
  std::printf("Total time: %.2f seconds\n", seconds);
  std::printf("Completed requests: %u/%u\n", stats.completed, opt.requests);
  std::printf("Requests per second: %.2f\n", seconds > 0.0 ? stats.completed / seconds : 0.0);

  std::printf("\nResponse times:\n");
  if (stats.min_ms < 0.0) {
    std::printf("  Min: N/A\n");
  } else {
    std::printf("  Min: %.0fms\n", stats.min_ms);
  }
  std::printf("  Max: %.0fms\n", stats.max_ms);
  std::printf("  Avg: %.2fms\n", avg);

  std::printf("\nStatus code distribution:\n");
  for (const auto& kv : stats.status_codes) {
    std::printf("  %u: %u (%.2f%%)\n", static_cast<unsigned>(kv.first), kv.second,
                100.0 * kv.second / (stats.completed > 0U ? stats.completed : 1U));
  }
  if (!stats.errors.empty()) {
    std::printf("\nErrors:\n");
    for (const auto& kv : stats.errors) {
      std::printf("  %s: %u\n", kv.first.c_str(), kv.second);
    }
  }
  std::printf("\nLoad test completed.\n");
}

}  // namespace

int main(int argc, char* argv[]) {
  if (HasFlag(argc, argv, "--help")) {
    PrintUsage();
    return 0;
  }

  LoadOptions opt;
  opt.host = ArgValue(argc, argv, "--host", opt.host);
  opt.port = static_cast<uint16_t>(ParseUint(ArgValue(argc, argv, "--port", "3000"), 3000));
  opt.path = ArgValue(argc, argv, "--path", opt.path);
  opt.requests = ParseUint(ArgValue(argc, argv, "--requests", "10000"), 10000);
  opt.delay_ms = ParseUint(ArgValue(argc, argv, "--delay", "5"), 5);
  opt.concurrency = ParseUint(ArgValue(argc, argv, "--concurrency", "1"), 1);
  if (opt.concurrency == 0U) opt.concurrency = 1U;
  opt.verbose = HasFlag(argc, argv, "--verbose");
  hookq::log::SetLevel(opt.verbose ? hookq::log::Level::kDebug : hookq::log::Level::kWarn);

  auto addr = hookq::SocketAddress::Resolve(opt.host, opt.port);
  if (!addr.has_value()) {
    HOOKQ_LOG_ERROR("load", "cannot resolve host '%s'", opt.host);
    return 1;
  }

  std::printf("Starting load test: %u requests to http://%s:%u%s\n", opt.requests, opt.host,
              static_cast<unsigned>(opt.port), opt.path);
  std::printf("Concurrency: %u, Delay between requests: %ums\n", opt.concurrency, opt.delay_ms);

  LoadStats stats;
  const uint64_t start = hookq::SteadyNowNs();
  for (uint32_t i = 0U; i < opt.requests; i += opt.concurrency) {
    std::vector<std::thread> batch;
    for (uint32_t j = 0U; j < opt.concurrency && i + j < opt.requests; ++j) {
      const uint32_t id = i + j + 1U;
      batch.emplace_back(&SendOne, std::cref(opt), std::cref(addr.value()), id, std::ref(stats));
      if (opt.delay_ms > 0U) {
        std::this_thread::sleep_for(std::chrono::milliseconds(opt.delay_ms));
      }
    }
    for (auto& t : batch) {
      t.join();
    }
  }
  PrintSummary(opt, stats, hookq::ElapsedMs(start) / 1000.0);
  return 0;
}
