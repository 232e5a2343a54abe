/**
 * @file http.hpp
 * @brief Minimal HTTP/1.1 server and client over hookq::TcpSocket.
 *
 * One request per connection (responses carry "Connection: close"). The
 * server accepts on its own thread with a 100 ms poll tick so Stop() is
 * prompt, and hands sockets to a fixed worker pool; past max_connections
 * open sockets it answers 503 from the accept thread. Requests are
 * request line + headers + optional Content-Length body; bodies above
 * max_body_bytes get 413, anything unparsable gets 400.
 */

#ifndef HOOKQ_HTTP_HPP_
#define HOOKQ_HTTP_HPP_

#include "hookq/log.hpp"
#include "hookq/platform.hpp"
#include "hookq/socket.hpp"
#include "hookq/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace hookq {

// ============================================================================
// Types
// ============================================================================

enum class HttpError : uint8_t {
  kIncomplete = 0,  ///< More bytes needed.
  kMalformed,
  kTooLarge,
  kBindFailed,
  kAlreadyRunning,
  kConnectFailed,
  kSendFailed,
  kRecvFailed,
  kTimeout,
  kThreadsUnavailable,  ///< Start() could not create its threads.
};

static constexpr uint32_t kDefaultMaxBodyBytes = 64U * 1024U;
static constexpr uint32_t kMaxHeaderBytes = 8U * 1024U;

struct HttpHeader {
  std::string name;
  std::string value;
};

struct HttpRequest {
  std::string method;
  std::string path;  ///< Without the query string.
  std::string query;
  std::vector<HttpHeader> headers;
  std::string body;

  /// @brief Case-insensitive header lookup; nullptr if absent.
  const std::string* Header(const char* name) const noexcept;
};

struct HttpResponse {
  uint16_t status = 200;
  std::string content_type = "application/json";
  std::string body;

  static HttpResponse Json(uint16_t status, std::string body) {
    HttpResponse r;
    r.status = status;
    r.body = std::move(body);
    return r;
  }

  static HttpResponse Text(uint16_t status, std::string body) {
    HttpResponse r;
    r.status = status;
    r.content_type = "text/plain; version=0.0.4; charset=utf-8";
    r.body = std::move(body);
    return r;
  }
};

namespace detail {

inline bool CaseEqual(const char* a, size_t alen, const char* b) noexcept {
  size_t i = 0;
  for (; i < alen && b[i] != '\0'; ++i) {
    char la = (a[i] >= 'A' && a[i] <= 'Z') ? static_cast<char>(a[i] + 32) : a[i];
    char lb = (b[i] >= 'A' && b[i] <= 'Z') ? static_cast<char>(b[i] + 32) : b[i];
    if (la != lb) return false;
  }
  return i == alen && b[i] == '\0';
}

inline std::string Trim(const char* begin, const char* end) {
  while (begin < end && (*begin == ' ' || *begin == '\t')) ++begin;
  while (end > begin && (end[-1] == ' ' || end[-1] == '\t' || end[-1] == '\r')) --end;
  return std::string(begin, static_cast<size_t>(end - begin));
}

/// @return Offset of "\r\n\r\n" + 4, or 0 if not found.
inline size_t FindHeaderEnd(const std::string& buf) noexcept {
  size_t pos = buf.find("\r\n\r\n");
  return (pos == std::string::npos) ? 0U : pos + 4U;
}

/// @brief Parse "name: value" lines between @p begin and @p end.
inline bool ParseHeaderLines(const char* begin, const char* end,
                             std::vector<HttpHeader>& headers) {
  const char* line = begin;
  while (line < end) {
    const char* eol = static_cast<const char*>(
        std::memchr(line, '\n', static_cast<size_t>(end - line)));
    if (eol == nullptr) eol = end;
    const char* line_end = (eol > line && eol[-1] == '\r') ? eol - 1 : eol;
    if (line_end > line) {
      const char* colon = static_cast<const char*>(
          std::memchr(line, ':', static_cast<size_t>(line_end - line)));
      if (colon == nullptr || colon == line) return false;
      headers.push_back(HttpHeader{Trim(line, colon), Trim(colon + 1, line_end)});
    }
    line = eol + 1;
  }
  return true;
}

inline const std::string* FindHeader(const std::vector<HttpHeader>& headers,
                                     const char* name) noexcept {
  for (const auto& h : headers) {
    if (CaseEqual(h.name.data(), h.name.size(), name)) return &h.value;
  }
  return nullptr;
}

/// @brief Parse a Content-Length value. Returns false on garbage.
inline bool ParseContentLength(const std::string& v, uint64_t& out) noexcept {
  if (v.empty()) return false;
  uint64_t n = 0;
  for (char c : v) {
    if (c < '0' || c > '9') return false;
    n = n * 10U + static_cast<uint64_t>(c - '0');
    if (n > 0xFFFFFFFFULL) return false;
  }
  out = n;
  return true;
}

}  // namespace detail

inline const std::string* HttpRequest::Header(const char* name) const noexcept {
  return detail::FindHeader(headers, name);
}

inline const char* HttpStatusText(uint16_t status) noexcept {
  switch (status) {
    case 200:
      return "OK";
    case 202:
      return "Accepted";
    case 400:
      return "Bad Request";
    case 404:
      return "Not Found";
    case 405:
      return "Method Not Allowed";
    case 413:
      return "Payload Too Large";
    case 429:
      return "Too Many Requests";
    case 500:
      return "Internal Server Error";
    case 503:
      return "Service Unavailable";
    default:
      return "Unknown";
  }
}

// ============================================================================
// Request parsing / response encoding
// ============================================================================

/**
 * @brief Parse one request from @p buf.
 *
 * @return Bytes consumed on success; kIncomplete if more data is needed,
 *         kTooLarge if the headers or declared body exceed the limits,
 *         kMalformed otherwise.
 */
inline expected<size_t, HttpError> ParseHttpRequest(const std::string& buf, HttpRequest& req,
                                                    uint32_t max_body_bytes = kDefaultMaxBodyBytes) {
  const size_t header_end = detail::FindHeaderEnd(buf);
  if (header_end == 0U) {
    if (buf.size() > kMaxHeaderBytes) {
      return expected<size_t, HttpError>::error(HttpError::kTooLarge);
    }
    return expected<size_t, HttpError>::error(HttpError::kIncomplete);
  }

  const char* begin = buf.data();
  const char* head_end = begin + header_end - 4U;
  const char* eol = static_cast<const char*>(
      std::memchr(begin, '\n', static_cast<size_t>(head_end - begin)));
  const char* line_end = (eol != nullptr) ? eol : head_end;
  if (line_end > begin && line_end[-1] == '\r') --line_end;

  // Request line: METHOD SP TARGET SP HTTP/x.y
  const char* sp1 = static_cast<const char*>(
      std::memchr(begin, ' ', static_cast<size_t>(line_end - begin)));
  if (sp1 == nullptr || sp1 == begin) {
    return expected<size_t, HttpError>::error(HttpError::kMalformed);
  }
  const char* sp2 = static_cast<const char*>(
      std::memchr(sp1 + 1, ' ', static_cast<size_t>(line_end - sp1 - 1)));
  if (sp2 == nullptr || sp2 == sp1 + 1) {
    return expected<size_t, HttpError>::error(HttpError::kMalformed);
  }
  if (static_cast<size_t>(line_end - sp2 - 1) < 8U || std::strncmp(sp2 + 1, "HTTP/1.", 7) != 0) {
    return expected<size_t, HttpError>::error(HttpError::kMalformed);
  }

  req.method.assign(begin, sp1);
  std::string target(sp1 + 1, sp2);
  if (target.empty() || target[0] != '/') {
    return expected<size_t, HttpError>::error(HttpError::kMalformed);
  }
  size_t q = target.find('?');
  if (q != std::string::npos) {
    req.query = target.substr(q + 1U);
    target.resize(q);
  }
  req.path = std::move(target);

  req.headers.clear();
  if (eol != nullptr) {
    if (!detail::ParseHeaderLines(eol + 1, head_end, req.headers)) {
      return expected<size_t, HttpError>::error(HttpError::kMalformed);
    }
  }

  uint64_t content_length = 0;
  const std::string* cl = detail::FindHeader(req.headers, "Content-Length");
  if (cl != nullptr && !detail::ParseContentLength(*cl, content_length)) {
    return expected<size_t, HttpError>::error(HttpError::kMalformed);
  }
  if (content_length > max_body_bytes) {
    return expected<size_t, HttpError>::error(HttpError::kTooLarge);
  }
  if (buf.size() < header_end + content_length) {
    return expected<size_t, HttpError>::error(HttpError::kIncomplete);
  }
  req.body.assign(buf, header_end, static_cast<size_t>(content_length));
  return expected<size_t, HttpError>::success(header_end + static_cast<size_t>(content_length));
}

inline std::string EncodeHttpResponse(const HttpResponse& resp) {
  char head[256];
  int n = std::snprintf(head, sizeof(head),
                        "HTTP/1.1 %u %s\r\n"
                        "Content-Type: %s\r\n"
                        "Content-Length: %zu\r\n"
                        "Connection: close\r\n\r\n",
                        static_cast<unsigned>(resp.status), HttpStatusText(resp.status),
                        resp.content_type.c_str(), resp.body.size());
  std::string out;
  if (n > 0) out.assign(head, static_cast<size_t>(n) < sizeof(head) ? n : sizeof(head) - 1);
  out += resp.body;
  return out;
}

// ============================================================================
// HttpServer
// ============================================================================

/// @brief Route handler. Runs on one of the server's worker threads.
using HttpHandlerFn = HttpResponse (*)(const HttpRequest& req, void* context);

struct HttpServerConfig {
  FixedString<63> host{"0.0.0.0"};
  uint16_t port = 3000;  ///< 0 picks an ephemeral port.
  uint32_t max_body_bytes = kDefaultMaxBodyBytes;
  uint32_t accept_poll_ms = 100;
  uint32_t read_timeout_ms = 5000;
  uint32_t worker_threads = 16;    ///< Connection-serving threads, made in Start().
  uint32_t max_connections = 256;  ///< Queued + in-service; beyond it, 503.
};

/**
 * @brief Accept thread plus a fixed pool of connection workers.
 *
 * Accepted sockets go into a handoff deque that the workers drain. At most
 * max_connections sockets are open at once (waiting in the deque or being
 * served); a connection arriving beyond that gets an inline 503 and is
 * closed. No thread is created after Start().
 */
class HttpServer {
 public:
  HttpServer(const HttpServerConfig& cfg, HttpHandlerFn handler, void* context) noexcept
      : cfg_(cfg), handler_(handler), context_(context) {
    if (cfg_.worker_threads == 0U) cfg_.worker_threads = 1U;
    if (cfg_.max_connections < cfg_.worker_threads) cfg_.max_connections = cfg_.worker_threads;
  }

  ~HttpServer() { Stop(); }

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  /// @brief Bind, listen, start the workers and the accept thread.
  expected<void, HttpError> Start() noexcept {
    if (running_.load(std::memory_order_acquire)) {
      return expected<void, HttpError>::error(HttpError::kAlreadyRunning);
    }
    auto addr = SocketAddress::FromIpv4(cfg_.host.c_str(), cfg_.port);
    if (!addr.has_value()) {
      HOOKQ_LOG_ERROR("http", "invalid listen address '%s'", cfg_.host.c_str());
      return expected<void, HttpError>::error(HttpError::kBindFailed);
    }
    auto listener = TcpListener::Open(addr.value());
    if (!listener.has_value()) {
      HOOKQ_LOG_ERROR("http", "cannot listen on %s:%u: %s", cfg_.host.c_str(),
                      static_cast<unsigned>(cfg_.port), SocketErrorToString(listener.get_error()));
      return expected<void, HttpError>::error(HttpError::kBindFailed);
    }
    listener_ = std::move(listener.value());
    port_ = listener_.LocalPort();
    stop_.store(false, std::memory_order_release);

    try {
      workers_.reserve(cfg_.worker_threads);
      for (uint32_t i = 0U; i < cfg_.worker_threads; ++i) {
        workers_.emplace_back(&HttpServer::WorkerLoop, this);
      }
      accept_thread_ = std::thread(&HttpServer::AcceptLoop, this);
    } catch (const std::system_error& e) {
      HOOKQ_LOG_ERROR("http", "cannot start worker threads: %s", e.what());
      JoinAll();
      listener_.Close();
      return expected<void, HttpError>::error(HttpError::kThreadsUnavailable);
    }
    running_.store(true, std::memory_order_release);
    HOOKQ_LOG_INFO("http", "listening on %s:%u (%u workers, max %u connections)",
                   cfg_.host.c_str(), static_cast<unsigned>(port_),
                   cfg_.worker_threads, cfg_.max_connections);
    return expected<void, HttpError>::success();
  }

  /**
   * @brief Stop accepting, serve what was already accepted, join all threads.
   * Idempotent.
   */
  void Stop() noexcept {
    if (!running_.load(std::memory_order_acquire)) {
      return;
    }
    JoinAll();
    listener_.Close();
    running_.store(false, std::memory_order_release);
    HOOKQ_LOG_INFO("http", "server stopped (%llu requests served, %llu refused)",
                   static_cast<unsigned long long>(requests_.load()),
                   static_cast<unsigned long long>(refused_.load()));
  }

  bool IsRunning() const noexcept { return running_.load(std::memory_order_acquire); }

  /// @brief Bound port (meaningful after Start()).
  uint16_t Port() const noexcept { return port_; }

  uint64_t RequestCount() const noexcept { return requests_.load(std::memory_order_relaxed); }

  /// @brief Connections turned away with 503 because the server was full.
  uint64_t RefusedCount() const noexcept { return refused_.load(std::memory_order_relaxed); }

  /// @brief Sockets currently queued or being served.
  uint32_t OpenConnections() const noexcept {
    std::lock_guard<std::mutex> lk(conn_mtx_);
    return static_cast<uint32_t>(handoff_.size()) + busy_;
  }

  /// @brief Read one request from @p sock, dispatch it, write the response.
  void ServeConnection(TcpSocket& sock) {
    HttpResponse resp;
    HttpRequest req;
    std::string buf;
    char chunk[4096];
    while (true) {
      auto parsed = ParseHttpRequest(buf, req, cfg_.max_body_bytes);
      if (parsed.has_value()) {
        resp = handler_(req, context_);
        break;
      }
      if (parsed.get_error() == HttpError::kTooLarge) {
        resp = HttpResponse::Json(413, "{\"error\":\"Payload Too Large\"}");
        break;
      }
      if (parsed.get_error() == HttpError::kMalformed) {
        resp = HttpResponse::Json(400, "{\"error\":\"Bad Request\"}");
        break;
      }
      auto r = sock.RecvFor(chunk, sizeof(chunk), static_cast<int32_t>(cfg_.read_timeout_ms));
      if (!r.has_value() || r.value() == 0) {
        if (!buf.empty()) {
          HOOKQ_LOG_DEBUG("http", "connection closed mid-request (%zu bytes)", buf.size());
        }
        return;
      }
      buf.append(chunk, static_cast<size_t>(r.value()));
    }
    requests_.fetch_add(1U, std::memory_order_relaxed);
    HOOKQ_LOG_DEBUG("http", "%s %s -> %u", req.method.c_str(), req.path.c_str(),
                    static_cast<unsigned>(resp.status));
    WriteResponse(sock, resp);
  }

 private:
  static void WriteResponse(TcpSocket& sock, const HttpResponse& resp) noexcept {
    const std::string wire = EncodeHttpResponse(resp);
    auto sent = sock.SendAll(wire.data(), wire.size());
    if (!sent.has_value()) {
      HOOKQ_LOG_WARN("http", "response write failed: %s", SocketErrorToString(sent.get_error()));
    }
    sock.ShutdownWrite();
  }

  /// Read off whatever the peer already sent so close() does not reset it.
  static void DiscardInput(TcpSocket& sock) noexcept {
    char sink[1024];
    for (int i = 0; i < 16; ++i) {
      auto r = sock.RecvFor(sink, sizeof(sink), 0);
      if (!r.has_value() || r.value() == 0) return;
    }
  }

  void AcceptLoop() noexcept {
    while (!stop_.load(std::memory_order_acquire)) {
      auto conn = listener_.AcceptFor(static_cast<int32_t>(cfg_.accept_poll_ms));
      if (!conn.has_value()) {
        if (conn.get_error() != SocketError::kTimeout) {
          HOOKQ_LOG_WARN("http", "accept: %s", SocketErrorToString(conn.get_error()));
        }
        continue;
      }
      bool queued = false;
      {
        std::lock_guard<std::mutex> lk(conn_mtx_);
        if (handoff_.size() + busy_ < cfg_.max_connections) {
          handoff_.push_back(std::move(conn.value()));
          queued = true;
        }
      }
      if (queued) {
        conn_cv_.notify_one();
        continue;
      }
      refused_.fetch_add(1U, std::memory_order_relaxed);
      HOOKQ_LOG_DEBUG("http", "connection limit %u reached, refusing", cfg_.max_connections);
      TcpSocket& refused = conn.value();
      WriteResponse(refused, HttpResponse::Json(503, "{\"error\":\"Service Unavailable\"}"));
      DiscardInput(refused);
    }
  }

  void WorkerLoop() noexcept {
    while (true) {
      TcpSocket sock;
      {
        std::unique_lock<std::mutex> lk(conn_mtx_);
        conn_cv_.wait(lk, [this] {
          return !handoff_.empty() || stop_.load(std::memory_order_acquire);
        });
        if (handoff_.empty()) return;
        sock = std::move(handoff_.front());
        handoff_.pop_front();
        ++busy_;
      }
      ServeConnection(sock);
      sock.Close();
      std::lock_guard<std::mutex> lk(conn_mtx_);
      --busy_;
    }
  }

  /// Stop flag, then accept thread, then workers (they empty the deque first).
  void JoinAll() noexcept {
    stop_.store(true, std::memory_order_release);
    if (accept_thread_.joinable()) {
      accept_thread_.join();
    }
    {
      std::lock_guard<std::mutex> lk(conn_mtx_);
    }
    conn_cv_.notify_all();
    for (auto& t : workers_) {
      if (t.joinable()) t.join();
    }
    workers_.clear();
  }

  HttpServerConfig cfg_;
  HttpHandlerFn handler_;
  void* context_;

  TcpListener listener_;
  uint16_t port_{0};
  std::thread accept_thread_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stop_{false};

  mutable std::mutex conn_mtx_;
  std::condition_variable conn_cv_;
  std::deque<TcpSocket> handoff_;
  uint32_t busy_{0U};

  std::atomic<uint64_t> requests_{0U};
  std::atomic<uint64_t> refused_{0U};
};

// ============================================================================
// Client
// ============================================================================

struct HttpClientResponse {
  uint16_t status;
  std::vector<HttpHeader> headers;
  std::string body;
};

/**
 * @brief Parse a complete response (status line, headers, body).
 *
 * The body is everything after the header block, cut to Content-Length
 * when present.
 */
inline expected<HttpClientResponse, HttpError> ParseHttpResponse(const std::string& buf) {
  const size_t header_end = detail::FindHeaderEnd(buf);
  if (header_end == 0U || buf.compare(0, 7, "HTTP/1.") != 0 || buf.size() < 12U) {
    return expected<HttpClientResponse, HttpError>::error(HttpError::kMalformed);
  }
  HttpClientResponse resp;
  resp.status = static_cast<uint16_t>(std::strtoul(buf.c_str() + 9, nullptr, 10));
  if (resp.status < 100U || resp.status > 599U) {
    return expected<HttpClientResponse, HttpError>::error(HttpError::kMalformed);
  }
  const char* begin = buf.data();
  const char* eol = static_cast<const char*>(std::memchr(begin, '\n', header_end));
  if (eol != nullptr && !detail::ParseHeaderLines(eol + 1, begin + header_end - 4U, resp.headers)) {
    return expected<HttpClientResponse, HttpError>::error(HttpError::kMalformed);
  }
  resp.body = buf.substr(header_end);
  uint64_t cl = 0;
  const std::string* clh = detail::FindHeader(resp.headers, "Content-Length");
  if (clh != nullptr && detail::ParseContentLength(*clh, cl) && cl < resp.body.size()) {
    resp.body.resize(static_cast<size_t>(cl));
  }
  return expected<HttpClientResponse, HttpError>::success(std::move(resp));
}

/**
 * @brief Send one request and read the response until the server closes.
 *
 * @param method  "GET", "POST", ...
 * @param content_type May be nullptr for requests without a body.
 */
inline expected<HttpClientResponse, HttpError> HttpRequestOnce(
    const SocketAddress& addr, const char* method, const char* path, const char* content_type,
    const std::string& body, uint32_t timeout_ms = 5000) {
  auto sock = TcpSocket::Create();
  if (!sock.has_value()) {
    return expected<HttpClientResponse, HttpError>::error(HttpError::kConnectFailed);
  }
  TcpSocket s = std::move(sock.value());
  if (!s.Connect(addr).has_value()) {
    return expected<HttpClientResponse, HttpError>::error(HttpError::kConnectFailed);
  }
  (void)s.SetNoDelay(true);

  std::string req;
  char head[512];
  int n = std::snprintf(head, sizeof(head),
                        "%s %s HTTP/1.1\r\nHost: localhost\r\nConnection: close\r\n", method, path);
  if (n <= 0 || static_cast<size_t>(n) >= sizeof(head)) {
    return expected<HttpClientResponse, HttpError>::error(HttpError::kMalformed);
  }
  req.assign(head, static_cast<size_t>(n));
  if (content_type != nullptr) {
    req += "Content-Type: ";
    req += content_type;
    req += "\r\n";
  }
  req += "Content-Length: ";
  req += std::to_string(body.size());
  req += "\r\n\r\n";
  req += body;

  if (!s.SendAll(req.data(), req.size()).has_value()) {
    return expected<HttpClientResponse, HttpError>::error(HttpError::kSendFailed);
  }

  std::string buf;
  char chunk[4096];
  while (true) {
    auto r = s.RecvFor(chunk, sizeof(chunk), static_cast<int32_t>(timeout_ms));
    if (!r.has_value()) {
      if (r.get_error() == SocketError::kTimeout) {
        return expected<HttpClientResponse, HttpError>::error(HttpError::kTimeout);
      }
      return expected<HttpClientResponse, HttpError>::error(HttpError::kRecvFailed);
    }
    if (r.value() == 0) break;
    buf.append(chunk, static_cast<size_t>(r.value()));
  }
  return ParseHttpResponse(buf);
}

}  // namespace hookq

#endif  // HOOKQ_HTTP_HPP_
