/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
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
 * @file socket.hpp
 * @brief RAII IPv4 TCP sockets for the HTTP front end and the load generator.
 *
 * TcpListener accepts connections, TcpSocket carries one HTTP exchange.
 * Both own their fd, are move-only, and report failures through
 * hookq::expected<V, SocketError>. Readiness waits use poll(2) with a
 * millisecond timeout so accept loops can observe a stop flag.
 */

#ifndef HOOKQ_SOCKET_HPP_
#define HOOKQ_SOCKET_HPP_

#include "hookq/platform.hpp"
#include "hookq/vocabulary.hpp"

#if HOOKQ_HAS_NETWORK

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include <utility>

namespace hookq {

constexpr int32_t kDefaultBacklog = 128;

enum class SocketError : uint8_t {
  kInvalidFd = 0,
  kInvalidAddress,
  kBindFailed,
  kListenFailed,
  kConnectFailed,
  kSendFailed,
  kRecvFailed,
  kAcceptFailed,
  kSetOptFailed,
  kTimeout,
  kWouldBlock  ///< EAGAIN/EWOULDBLOCK, caller may retry.
};

inline const char* SocketErrorToString(SocketError err) noexcept {
  switch (err) {
    case SocketError::kInvalidFd:
      return "invalid fd";
    case SocketError::kInvalidAddress:
      return "invalid address";
    case SocketError::kBindFailed:
      return "bind failed";
    case SocketError::kListenFailed:
      return "listen failed";
    case SocketError::kConnectFailed:
      return "connect failed";
    case SocketError::kSendFailed:
      return "send failed";
    case SocketError::kRecvFailed:
      return "recv failed";
    case SocketError::kAcceptFailed:
      return "accept failed";
    case SocketError::kSetOptFailed:
      return "setsockopt failed";
    case SocketError::kTimeout:
      return "timeout";
    case SocketError::kWouldBlock:
      return "would block";
  }
  return "unknown";
}

namespace detail {

/// @brief poll(2) one fd for @p events. Returns 1 ready, 0 timeout, -1 error.
inline int32_t PollFd(int32_t fd, int16_t events, int32_t timeout_ms) noexcept {
  struct pollfd pfd;
  pfd.fd = fd;
  pfd.events = events;
  pfd.revents = 0;
  int rc;
  do {
    rc = ::poll(&pfd, 1, timeout_ms);
  } while (rc < 0 && errno == EINTR);
  if (rc < 0) return -1;
  return (rc == 0) ? 0 : 1;
}

template <typename V>
inline expected<V, SocketError> SockFail(SocketError e) noexcept {
  return expected<V, SocketError>::error(e);
}

inline expected<void, SocketError> SockOk() noexcept {
  return expected<void, SocketError>::success();
}

inline expected<void, SocketError> SetIntOpt(int32_t fd, int level, int name,
                                             int32_t value) noexcept {
  if (fd < 0) return SockFail<void>(SocketError::kInvalidFd);
  if (::setsockopt(fd, level, name, &value, static_cast<socklen_t>(sizeof(value))) < 0) {
    return SockFail<void>(SocketError::kSetOptFailed);
  }
  return SockOk();
}

/**
 * @brief Sole owner of one descriptor; closes it on reset or destruction.
 *
 * TcpSocket and TcpListener hold one of these, so they are move-only
 * without writing their own move members.
 */
class OwnedFd {
 public:
  OwnedFd() noexcept = default;
  explicit OwnedFd(int32_t fd) noexcept : fd_(fd) {}
  ~OwnedFd() { Reset(); }

  OwnedFd(OwnedFd&& other) noexcept : fd_(other.Release()) {}
  OwnedFd& operator=(OwnedFd&& other) noexcept {
    if (this != &other) {
      Reset();
      fd_ = other.Release();
    }
    return *this;
  }
  OwnedFd(const OwnedFd&) = delete;
  OwnedFd& operator=(const OwnedFd&) = delete;

  int32_t Get() const noexcept { return fd_; }
  bool Valid() const noexcept { return fd_ >= 0; }

  int32_t Release() noexcept {
    const int32_t fd = fd_;
    fd_ = -1;
    return fd;
  }

  void Reset() noexcept {
    if (fd_ >= 0) (void)::close(Release());
  }

 private:
  int32_t fd_ = -1;
};

inline expected<OwnedFd, SocketError> OpenStreamFd() noexcept {
  const int32_t fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) return SockFail<OwnedFd>(SocketError::kInvalidFd);
  return expected<OwnedFd, SocketError>::success(OwnedFd(fd));
}

}  // namespace detail

// ============================================================================
// SocketAddress
// ============================================================================

/// IPv4 address + port in network byte order.
class SocketAddress {
 public:
  SocketAddress() noexcept { std::memset(&addr_, 0, sizeof(addr_)); }

  /// @param ip Dotted-decimal IPv4 ("0.0.0.0" binds all interfaces).
  static expected<SocketAddress, SocketError> FromIpv4(const char* ip, uint16_t port) noexcept {
    SocketAddress out;
    out.addr_.sin_family = AF_INET;
    out.addr_.sin_port = htons(port);
    if (ip == nullptr || ::inet_pton(AF_INET, ip, &out.addr_.sin_addr) != 1) {
      return detail::SockFail<SocketAddress>(SocketError::kInvalidAddress);
    }
    return expected<SocketAddress, SocketError>::success(out);
  }

  /**
   * @brief Resolve a host name ("localhost", "example.org") or IPv4 literal.
   *
   * Uses the first AF_INET result of getaddrinfo(3).
   */
  static expected<SocketAddress, SocketError> Resolve(const char* host, uint16_t port) noexcept {
    if (host == nullptr) return detail::SockFail<SocketAddress>(SocketError::kInvalidAddress);
    auto literal = FromIpv4(host, port);
    if (literal.has_value()) return literal;

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo* found = nullptr;
    if (::getaddrinfo(host, nullptr, &hints, &found) != 0 || found == nullptr) {
      return detail::SockFail<SocketAddress>(SocketError::kInvalidAddress);
    }
    SocketAddress out;
    std::memcpy(&out.addr_, found->ai_addr, sizeof(out.addr_));
    ::freeaddrinfo(found);
    out.addr_.sin_port = htons(port);
    return expected<SocketAddress, SocketError>::success(out);
  }

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast) -- POSIX sockaddr cast
  const sockaddr* Raw() const noexcept { return reinterpret_cast<const sockaddr*>(&addr_); }

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast) -- POSIX sockaddr cast
  sockaddr* RawMut() noexcept { return reinterpret_cast<sockaddr*>(&addr_); }

  socklen_t Size() const noexcept { return static_cast<socklen_t>(sizeof(addr_)); }

  uint16_t Port() const noexcept { return ntohs(addr_.sin_port); }

  /// @brief Dotted-decimal form of the address (without port).
  void FormatIp(char* buf, uint32_t buf_size) const noexcept {
    if (::inet_ntop(AF_INET, &addr_.sin_addr, buf, buf_size) == nullptr && buf_size > 0) {
      buf[0] = '\0';
    }
  }

 private:
  sockaddr_in addr_;
};

// ============================================================================
// TcpSocket
// ============================================================================

/// One connected TCP stream. Move-only; the fd closes on destruction.
class TcpSocket {
 public:
  TcpSocket() noexcept = default;

  static expected<TcpSocket, SocketError> Create() noexcept {
    auto fd = detail::OpenStreamFd();
    if (!fd.has_value()) return detail::SockFail<TcpSocket>(fd.get_error());
    return expected<TcpSocket, SocketError>::success(TcpSocket(std::move(fd.value())));
  }

  expected<void, SocketError> Connect(const SocketAddress& addr) noexcept {
    if (!fd_.Valid()) return detail::SockFail<void>(SocketError::kInvalidFd);
    int rc;
    do {
      rc = ::connect(fd_.Get(), addr.Raw(), addr.Size());
    } while (rc < 0 && errno == EINTR);
    return (rc < 0) ? detail::SockFail<void>(SocketError::kConnectFailed) : detail::SockOk();
  }

  /// @return Bytes accepted by the kernel; kWouldBlock on a full buffer.
  expected<int32_t, SocketError> Send(const void* data, size_t len) noexcept {
    if (!fd_.Valid()) return detail::SockFail<int32_t>(SocketError::kInvalidFd);
    ssize_t n;
    do {
      n = ::send(fd_.Get(), data, len, MSG_NOSIGNAL);
    } while (n < 0 && errno == EINTR);
    if (n >= 0) return expected<int32_t, SocketError>::success(static_cast<int32_t>(n));
    return detail::SockFail<int32_t>((errno == EAGAIN || errno == EWOULDBLOCK)
                                         ? SocketError::kWouldBlock
                                         : SocketError::kSendFailed);
  }

  /// @brief Send until all @p len bytes are written; waits up to 1 s per stall.
  expected<void, SocketError> SendAll(const void* data, size_t len) noexcept {
    const auto* cursor = static_cast<const uint8_t*>(data);
    size_t left = len;
    while (left > 0) {
      auto r = Send(cursor, left);
      if (r.has_value()) {
        cursor += r.value();
        left -= static_cast<size_t>(r.value());
      } else if (r.get_error() != SocketError::kWouldBlock) {
        return detail::SockFail<void>(r.get_error());
      } else if (detail::PollFd(fd_.Get(), POLLOUT, 1000) <= 0) {
        return detail::SockFail<void>(SocketError::kTimeout);
      }
    }
    return detail::SockOk();
  }

  /// @return Bytes read; 0 means the peer closed the connection.
  expected<int32_t, SocketError> Recv(void* buf, size_t len) noexcept {
    if (!fd_.Valid()) return detail::SockFail<int32_t>(SocketError::kInvalidFd);
    ssize_t n;
    do {
      n = ::recv(fd_.Get(), buf, len, 0);
    } while (n < 0 && errno == EINTR);
    if (n >= 0) return expected<int32_t, SocketError>::success(static_cast<int32_t>(n));
    return detail::SockFail<int32_t>((errno == EAGAIN || errno == EWOULDBLOCK)
                                         ? SocketError::kWouldBlock
                                         : SocketError::kRecvFailed);
  }

  /// @brief Recv() after waiting at most @p timeout_ms for readability.
  expected<int32_t, SocketError> RecvFor(void* buf, size_t len, int32_t timeout_ms) noexcept {
    if (!fd_.Valid()) return detail::SockFail<int32_t>(SocketError::kInvalidFd);
    switch (detail::PollFd(fd_.Get(), POLLIN, timeout_ms)) {
      case 0:
        return detail::SockFail<int32_t>(SocketError::kTimeout);
      case 1:
        return Recv(buf, len);
      default:
        return detail::SockFail<int32_t>(SocketError::kRecvFailed);
    }
  }

  expected<void, SocketError> SetNoDelay(bool enable) noexcept {
    return detail::SetIntOpt(fd_.Get(), IPPROTO_TCP, TCP_NODELAY, enable ? 1 : 0);
  }

  /// @brief Half-close the write side so the peer sees EOF.
  void ShutdownWrite() noexcept {
    if (fd_.Valid()) (void)::shutdown(fd_.Get(), SHUT_WR);
  }

  void Close() noexcept { fd_.Reset(); }

  int32_t Fd() const noexcept { return fd_.Get(); }
  bool IsValid() const noexcept { return fd_.Valid(); }

 private:
  friend class TcpListener;

  explicit TcpSocket(detail::OwnedFd fd) noexcept : fd_(std::move(fd)) {}

  detail::OwnedFd fd_;
};

// ============================================================================
// TcpListener
// ============================================================================

/**
 * @brief Bound, listening TCP socket.
 *
 * Port 0 binds an ephemeral port; LocalPort() reports the one chosen.
 */
class TcpListener {
 public:
  TcpListener() noexcept = default;

  /// @brief socket + SO_REUSEADDR + bind + listen.
  static expected<TcpListener, SocketError> Open(const SocketAddress& addr,
                                                 int32_t backlog = kDefaultBacklog) noexcept {
    auto fd = detail::OpenStreamFd();
    if (!fd.has_value()) return detail::SockFail<TcpListener>(fd.get_error());
    detail::OwnedFd owned = std::move(fd.value());

    auto reuse = detail::SetIntOpt(owned.Get(), SOL_SOCKET, SO_REUSEADDR, 1);
    if (!reuse.has_value()) return detail::SockFail<TcpListener>(reuse.get_error());
    if (::bind(owned.Get(), addr.Raw(), addr.Size()) < 0) {
      return detail::SockFail<TcpListener>(SocketError::kBindFailed);
    }
    if (::listen(owned.Get(), backlog) < 0) {
      return detail::SockFail<TcpListener>(SocketError::kListenFailed);
    }
    return expected<TcpListener, SocketError>::success(TcpListener(std::move(owned)));
  }

  /**
   * @brief Wait up to @p timeout_ms for a pending connection and accept it.
   * @return kTimeout when nothing arrived in time.
   */
  expected<TcpSocket, SocketError> AcceptFor(int32_t timeout_ms,
                                             SocketAddress* peer = nullptr) noexcept {
    if (!fd_.Valid()) return detail::SockFail<TcpSocket>(SocketError::kInvalidFd);
    const int32_t ready = detail::PollFd(fd_.Get(), POLLIN, timeout_ms);
    if (ready == 0) return detail::SockFail<TcpSocket>(SocketError::kTimeout);
    if (ready < 0) return detail::SockFail<TcpSocket>(SocketError::kAcceptFailed);

    SocketAddress from;
    socklen_t from_len = from.Size();
    const int32_t conn = ::accept(fd_.Get(), from.RawMut(), &from_len);
    if (conn < 0) return detail::SockFail<TcpSocket>(SocketError::kAcceptFailed);
    if (peer != nullptr) *peer = from;
    return expected<TcpSocket, SocketError>::success(TcpSocket(detail::OwnedFd(conn)));
  }

  /// @brief Port actually bound (0 if unknown).
  uint16_t LocalPort() const noexcept {
    if (!fd_.Valid()) return 0;
    SocketAddress local;
    socklen_t len = local.Size();
    return (::getsockname(fd_.Get(), local.RawMut(), &len) == 0) ? local.Port() : 0;
  }

  void Close() noexcept { fd_.Reset(); }

  int32_t Fd() const noexcept { return fd_.Get(); }
  bool IsValid() const noexcept { return fd_.Valid(); }

 private:
  explicit TcpListener(detail::OwnedFd fd) noexcept : fd_(std::move(fd)) {}

  detail::OwnedFd fd_;
};

}  // namespace hookq

#endif  // HOOKQ_HAS_NETWORK

#endif  // HOOKQ_SOCKET_HPP_
