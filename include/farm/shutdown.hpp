/**
 * @file shutdown.hpp
 * @brief SIGINT/SIGTERM watcher for POSIX processes.
 *
 * The signal handler only writes one byte to a self-pipe. A thread blocked
 * in WaitForShutdown() wakes up and runs the registered callbacks (LIFO)
 * in normal thread context, where they may take locks or log.
 *
 * Usage:
 * @code
 *   farm::ShutdownManager mgr;
 *   mgr.Register([](void* ctx, int) { static_cast<Runner*>(ctx)->Interrupt(); }, &runner);
 *   mgr.InstallSignalHandlers();
 *   std::thread watcher([&] { mgr.WaitForShutdown(); });
 *   runner.Run();
 *   mgr.Dismiss();  // run finished: wake the watcher without callbacks
 *   watcher.join();
 * @endcode
 */

#ifndef FARM_SHUTDOWN_HPP_
#define FARM_SHUTDOWN_HPP_

#include "farm/platform.hpp"
#include "farm/vocabulary.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdint>

#include <fcntl.h>
#include <unistd.h>

namespace farm {

enum class ShutdownError : uint8_t {
  kCallbacksFull = 0,
  kPipeCreationFailed,
  kSignalInstallFailed,
  kAlreadyInstantiated
};

/// @brief Cleanup callback: user context and the signal number (0 for Quit()).
using ShutdownFn = void (*)(void* ctx, int signo);

class ShutdownManager;

namespace detail {

/// One ShutdownManager per process; the signal handler reaches it through here.
inline std::atomic<ShutdownManager*>& ShutdownInstance() noexcept {
  static std::atomic<ShutdownManager*> ptr{nullptr};
  return ptr;
}

}  // namespace detail

// ============================================================================
// ShutdownManager
// ============================================================================

class ShutdownManager final {
 public:
  static constexpr uint32_t kMaxCallbacks = 8;

  ShutdownManager() noexcept {
    ShutdownManager* none = nullptr;
    if (!detail::ShutdownInstance().compare_exchange_strong(none, this)) {
      return;  // a second instance stays invalid
    }
    if (::pipe(pipe_fd_) != 0) {
      pipe_fd_[0] = -1;
      pipe_fd_[1] = -1;
      return;
    }
    (void)::fcntl(pipe_fd_[0], F_SETFD, FD_CLOEXEC);
    (void)::fcntl(pipe_fd_[1], F_SETFD, FD_CLOEXEC);
    valid_ = true;
  }

  ~ShutdownManager() {
    ShutdownManager* self = this;
    if (detail::ShutdownInstance().compare_exchange_strong(self, nullptr)) {
      RestoreSignalHandlers();
    }
    if (pipe_fd_[0] >= 0) ::close(pipe_fd_[0]);
    if (pipe_fd_[1] >= 0) ::close(pipe_fd_[1]);
  }

  ShutdownManager(const ShutdownManager&) = delete;
  ShutdownManager& operator=(const ShutdownManager&) = delete;
  ShutdownManager(ShutdownManager&&) = delete;
  ShutdownManager& operator=(ShutdownManager&&) = delete;

  bool IsValid() const noexcept { return valid_; }

  expected<void, ShutdownError> Register(ShutdownFn fn, void* ctx) noexcept {
    if (!valid_) return expected<void, ShutdownError>::error(ShutdownError::kAlreadyInstantiated);
    if (fn == nullptr || count_ >= kMaxCallbacks) {
      return expected<void, ShutdownError>::error(ShutdownError::kCallbacksFull);
    }
    callbacks_[count_] = Entry{fn, ctx};
    ++count_;
    return expected<void, ShutdownError>::success();
  }

  /// @brief Route SIGINT and SIGTERM to this manager (restored on destruction).
  expected<void, ShutdownError> InstallSignalHandlers() noexcept {
    if (!valid_) return expected<void, ShutdownError>::error(ShutdownError::kAlreadyInstantiated);
    struct sigaction sa {};
    sa.sa_handler = &ShutdownManager::OnSignal;
    ::sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    if (::sigaction(SIGINT, &sa, &old_int_) != 0 || ::sigaction(SIGTERM, &sa, &old_term_) != 0) {
      return expected<void, ShutdownError>::error(ShutdownError::kSignalInstallFailed);
    }
    installed_ = true;
    return expected<void, ShutdownError>::success();
  }

  /// @brief Request shutdown as if signal @p signo arrived.
  void Quit(int signo = 0) noexcept { Trigger(signo); }

  /// @brief Wake WaitForShutdown() without running the callbacks.
  void Dismiss() noexcept {
    dismissed_.store(true, std::memory_order_release);
    Wake();
  }

  /**
   * @brief Block until a signal, Quit() or Dismiss().
   * @return true if shutdown was requested and the callbacks ran.
   */
  bool WaitForShutdown() noexcept {
    while (!requested_.load(std::memory_order_acquire) &&
           !dismissed_.load(std::memory_order_acquire) && pipe_fd_[0] >= 0) {
      uint8_t byte = 0;
      const ssize_t n = ::read(pipe_fd_[0], &byte, 1);
      if (n < 0 && errno != EINTR) break;
    }
    if (!requested_.load(std::memory_order_acquire)) return false;

    const int signo = signo_.load(std::memory_order_relaxed);
    for (uint32_t i = count_; i > 0U; --i) {
      callbacks_[i - 1U].fn(callbacks_[i - 1U].ctx, signo);
    }
    return true;
  }

  bool IsShutdownRequested() const noexcept { return requested_.load(std::memory_order_acquire); }

 private:
  struct Entry {
    ShutdownFn fn;
    void* ctx;
  };

  static void OnSignal(int signo) {
    ShutdownManager* self = detail::ShutdownInstance().load(std::memory_order_acquire);
    if (self != nullptr) self->Trigger(signo);
  }

  // Async-signal-safe.
  void Trigger(int signo) noexcept {
    bool expected_val = false;
    if (requested_.compare_exchange_strong(expected_val, true)) {
      signo_.store(signo, std::memory_order_relaxed);
      Wake();
    }
  }

  void Wake() noexcept {
    if (pipe_fd_[1] >= 0) {
      const uint8_t byte = 1;
      (void)::write(pipe_fd_[1], &byte, 1);
    }
  }

  void RestoreSignalHandlers() noexcept {
    if (!installed_) return;
    (void)::sigaction(SIGINT, &old_int_, nullptr);
    (void)::sigaction(SIGTERM, &old_term_, nullptr);
    installed_ = false;
  }

  Entry callbacks_[kMaxCallbacks] = {};
  uint32_t count_ = 0;
  int pipe_fd_[2] = {-1, -1};
  std::atomic<bool> requested_{false};
  std::atomic<bool> dismissed_{false};
  std::atomic<int> signo_{0};
  struct sigaction old_int_ {};
  struct sigaction old_term_ {};
  bool installed_ = false;
  bool valid_ = false;
};

}  // namespace farm

#endif  // FARM_SHUTDOWN_HPP_
