/**
 * @file shutdown.hpp
 * @brief Signal-driven graceful shutdown for the webhook service (POSIX).
 *
 * SIGINT/SIGTERM are installed with sigaction(2); the handler only sets a
 * flag and writes one byte to a self-pipe, which wakes WaitForShutdown().
 * Registered steps then run in LIFO order, so a service registers them in
 * start-up order (queue, consumer, HTTP) and they are torn down in reverse
 * (HTTP, consumer, queue drain).
 */

#ifndef HOOKQ_SHUTDOWN_HPP_
#define HOOKQ_SHUTDOWN_HPP_

#include "hookq/log.hpp"
#include "hookq/platform.hpp"
#include "hookq/vocabulary.hpp"

#include <atomic>
#include <csignal>
#include <cstdint>

#include <poll.h>
#include <unistd.h>

namespace hookq {

enum class ShutdownError : uint8_t {
  kStepsFull = 0,
  kNullStep,
  kPipeCreationFailed,
  kSignalInstallFailed,
  kAlreadyInstantiated
};

/// @brief Shutdown step. Receives the signal number (0 for manual) and its context.
using ShutdownFn = void (*)(int signo, void* context);

class ShutdownManager;

namespace detail {

/// Exactly one ShutdownManager is reachable from the signal handler.
inline ShutdownManager*& GetShutdownInstance() noexcept {
  static ShutdownManager* ptr = nullptr;
  return ptr;
}

}  // namespace detail

/**
 * @brief Process-wide shutdown coordinator.
 *
 * @code
 *   hookq::ShutdownManager mgr;
 *   mgr.Register(&DrainQueue, &queue, "queue");
 *   mgr.Register(&StopHttp, &server, "http");
 *   mgr.InstallSignalHandlers();
 *   mgr.WaitForShutdown();   // runs "http" then "queue"
 * @endcode
 */
class ShutdownManager final {
 public:
  static constexpr uint32_t kMaxSteps = 16;

  ShutdownManager() noexcept {
    pipe_fd_[0] = -1;
    pipe_fd_[1] = -1;
    if (detail::GetShutdownInstance() != nullptr) {
      return;
    }
    detail::GetShutdownInstance() = this;
    if (::pipe(pipe_fd_) != 0) {
      pipe_fd_[0] = -1;
      pipe_fd_[1] = -1;
      return;
    }
    valid_ = true;
  }

  ~ShutdownManager() {
    if (pipe_fd_[0] >= 0) ::close(pipe_fd_[0]);
    if (pipe_fd_[1] >= 0) ::close(pipe_fd_[1]);
    if (detail::GetShutdownInstance() == this) {
      detail::GetShutdownInstance() = nullptr;
    }
  }

  ShutdownManager(const ShutdownManager&) = delete;
  ShutdownManager& operator=(const ShutdownManager&) = delete;
  ShutdownManager(ShutdownManager&&) = delete;
  ShutdownManager& operator=(ShutdownManager&&) = delete;

  /// False if another instance already existed or the pipe could not be created.
  bool IsValid() const noexcept { return valid_; }

  /**
   * @brief Register a teardown step. Steps run in reverse registration order.
   * @param name Label used in the shutdown log (may be nullptr).
   */
  expected<void, ShutdownError> Register(ShutdownFn fn, void* context = nullptr,
                                         const char* name = nullptr) noexcept {
    if (!valid_) {
      return expected<void, ShutdownError>::error(ShutdownError::kAlreadyInstantiated);
    }
    if (fn == nullptr) {
      return expected<void, ShutdownError>::error(ShutdownError::kNullStep);
    }
    if (step_count_ >= kMaxSteps) {
      return expected<void, ShutdownError>::error(ShutdownError::kStepsFull);
    }
    Step& s = steps_[step_count_];
    s.fn = fn;
    s.context = context;
    s.name.assign(name != nullptr ? name : "step");
    ++step_count_;
    return expected<void, ShutdownError>::success();
  }

  uint32_t StepCount() const noexcept { return step_count_; }

  expected<void, ShutdownError> InstallSignalHandlers() noexcept {
    if (!valid_) {
      return expected<void, ShutdownError>::error(ShutdownError::kAlreadyInstantiated);
    }
    struct sigaction sa;
    sa.sa_handler = &ShutdownManager::SignalHandler;
    ::sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    if (::sigaction(SIGINT, &sa, nullptr) != 0 || ::sigaction(SIGTERM, &sa, nullptr) != 0) {
      return expected<void, ShutdownError>::error(ShutdownError::kSignalInstallFailed);
    }
    return expected<void, ShutdownError>::success();
  }

  /// @brief Request shutdown from code. Only the first request is recorded.
  void Quit(int signo = 0) noexcept {
    bool expected_val = false;
    if (shutdown_flag_.compare_exchange_strong(expected_val, true)) {
      signo_.store(signo, std::memory_order_relaxed);
      Wake();
    }
  }

  bool IsShutdownRequested() const noexcept { return shutdown_flag_.load(); }

  int Signal() const noexcept { return signo_.load(std::memory_order_relaxed); }

  /**
   * @brief Block until a signal or Quit(), then run every step once (LIFO).
   *
   * Later calls return immediately without re-running the steps.
   */
  void WaitForShutdown() noexcept {
    if (pipe_fd_[0] >= 0 && !shutdown_flag_.load()) {
      uint8_t buf = 0;
      (void)::read(pipe_fd_[0], &buf, 1);
    }
    RunSteps();
  }

  /**
   * @brief Like WaitForShutdown() but gives up after @p timeout_ms.
   * @return true if shutdown was requested (steps have run), false on timeout.
   */
  bool WaitForShutdownFor(uint32_t timeout_ms) noexcept {
    if (pipe_fd_[0] >= 0 && !shutdown_flag_.load()) {
      struct pollfd pfd;
      pfd.fd = pipe_fd_[0];
      pfd.events = POLLIN;
      pfd.revents = 0;
      int rc = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
      if (rc > 0) {
        uint8_t buf = 0;
        (void)::read(pipe_fd_[0], &buf, 1);
      }
    }
    if (!shutdown_flag_.load()) return false;
    RunSteps();
    return true;
  }

 private:
  struct Step {
    ShutdownFn fn = nullptr;
    void* context = nullptr;
    FixedString<31> name;
  };

  void RunSteps() noexcept {
    bool expected_val = false;
    if (!steps_ran_.compare_exchange_strong(expected_val, true)) return;
    const int signo = signo_.load(std::memory_order_relaxed);
    HOOKQ_LOG_INFO("shutdown", "shutdown requested (signal %d), running %u steps", signo,
                   step_count_);
    for (uint32_t i = step_count_; i > 0U; --i) {
      Step& s = steps_[i - 1U];
      HOOKQ_LOG_DEBUG("shutdown", "step '%s'", s.name.c_str());
      s.fn(signo, s.context);
    }
  }

  void Wake() noexcept {
    if (pipe_fd_[1] >= 0) {
      const uint8_t byte = 1;
      (void)::write(pipe_fd_[1], &byte, 1);
    }
  }

  /// Async-signal-safe: atomic stores and write(2) only.
  static void SignalHandler(int signo) {
    ShutdownManager* self = detail::GetShutdownInstance();
    if (self != nullptr) {
      self->shutdown_flag_.store(true);
      self->signo_.store(signo, std::memory_order_relaxed);
      self->Wake();
    }
  }

  Step steps_[kMaxSteps];
  uint32_t step_count_ = 0;
  std::atomic<bool> shutdown_flag_{false};
  std::atomic<bool> steps_ran_{false};
  std::atomic<int> signo_{0};
  int pipe_fd_[2];
  bool valid_ = false;
};

}  // namespace hookq

#endif  // HOOKQ_SHUTDOWN_HPP_
