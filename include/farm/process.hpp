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
 * @file process.hpp
 * @brief Forked child process running a function of the parent image.
 *
 * The child shares the parent's address-space snapshot (no exec), runs the
 * given body and leaves through _exit() with the body's return value, so
 * parent stdio buffers and atexit handlers are never run twice.
 *
 * Usage:
 * @code
 *   farm::ChildProcess child;
 *   auto body = [&]() -> int { return DoWork(); };
 *   if (child.Spawn(body).has_value()) {
 *     farm::WaitResult wr = child.Wait(1000);
 *     if (wr.timed_out) child.Kill();
 *   }
 * @endcode
 */

#ifndef FARM_PROCESS_HPP_
#define FARM_PROCESS_HPP_

#include "farm/platform.hpp"
#include "farm/vocabulary.hpp"

#if !defined(FARM_PLATFORM_POSIX)
#error "ChildProcess requires POSIX fork(2)"
#endif

#include <cerrno>
#include <cstdint>
#include <cstdio>

#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>

namespace farm {

enum class ProcessError : uint8_t {
  kForkFailed = 0,
  kAlreadyRunning,
  kNotRunning,
  kSignalFailed
};

/// @brief Outcome of ChildProcess::Wait().
struct WaitResult {
  bool exited = false;     ///< normal exit, exit_code valid
  int exit_code = -1;
  bool signaled = false;   ///< killed by a signal, term_signal valid
  int term_signal = 0;
  bool timed_out = false;  ///< child still running after the timeout
};

namespace detail {

inline void SleepMs(uint32_t ms) noexcept {
  struct timespec ts;
  ts.tv_sec = static_cast<time_t>(ms / 1000U);
  ts.tv_nsec = static_cast<long>(ms % 1000U) * 1000000L;  // NOLINT
  while (::nanosleep(&ts, &ts) != 0 && errno == EINTR) {
  }
}

}  // namespace detail

// ============================================================================
// ChildProcess
// ============================================================================

/**
 * @brief Handle to one forked child. RAII: a child still running when the
 * handle is destroyed is killed and reaped.
 */
class ChildProcess final {
 public:
  using Body = function_ref<int()>;

  ChildProcess() noexcept = default;

  ~ChildProcess() {
    if (pid_ > 0) {
      (void)::kill(pid_, SIGKILL);
      int status = 0;
      while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
      }
    }
  }

  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  ChildProcess(ChildProcess&& other) noexcept : pid_(other.pid_), last_(other.last_) {
    other.pid_ = -1;
  }

  /**
   * @brief Fork and run @p body in the child.
   *
   * The child never returns from Spawn(): it flushes stdout/stderr and
   * calls _exit(body()).
   */
  expected<void, ProcessError> Spawn(Body body) {
    if (pid_ > 0) return expected<void, ProcessError>::error(ProcessError::kAlreadyRunning);

    const pid_t child = ::fork();
    if (child < 0) return expected<void, ProcessError>::error(ProcessError::kForkFailed);

    if (child == 0) {
      const int code = body();
      (void)std::fflush(stderr);
      ::_exit(code);
    }

    pid_ = child;
    last_ = WaitResult{};
    return expected<void, ProcessError>::success();
  }

  /**
   * @brief Wait for the child to exit.
   * @param timeout_ms 0 blocks until exit; otherwise polls for at most this long.
   */
  WaitResult Wait(uint32_t timeout_ms = 0) {
    if (pid_ <= 0) return last_;

    if (timeout_ms == 0U) {
      int status = 0;
      pid_t w;
      do {
        w = ::waitpid(pid_, &status, 0);
      } while (w < 0 && errno == EINTR);
      Reaped(w, status);
      return last_;
    }

    constexpr uint32_t kPollIntervalMs = 2;
    const uint64_t deadline = SteadyNowMs() + timeout_ms;
    for (;;) {
      int status = 0;
      const pid_t w = ::waitpid(pid_, &status, WNOHANG);
      if (w != 0) {
        Reaped(w, status);
        return last_;
      }
      if (SteadyNowMs() >= deadline) break;
      detail::SleepMs(kPollIntervalMs);
    }
    WaitResult wr;
    wr.timed_out = true;
    return wr;
  }

  expected<void, ProcessError> Signal(int signo) noexcept {
    if (pid_ <= 0) return expected<void, ProcessError>::error(ProcessError::kNotRunning);
    if (::kill(pid_, signo) != 0) {
      return expected<void, ProcessError>::error(ProcessError::kSignalFailed);
    }
    return expected<void, ProcessError>::success();
  }

  /// @brief SIGKILL and reap.
  WaitResult Kill() {
    if (pid_ <= 0) return last_;
    (void)::kill(pid_, SIGKILL);
    return Wait();
  }

  /// @brief True until the child has been reaped. Reaps a child that already exited.
  bool IsRunning() {
    if (pid_ <= 0) return false;
    int status = 0;
    const pid_t w = ::waitpid(pid_, &status, WNOHANG);
    if (w == 0) return true;
    Reaped(w, status);
    return false;
  }

  pid_t Pid() const noexcept { return pid_; }

 private:
  void Reaped(pid_t w, int status) noexcept {
    last_ = WaitResult{};
    if (w > 0) {
      if (WIFEXITED(status)) {
        last_.exited = true;
        last_.exit_code = WEXITSTATUS(status);
      } else if (WIFSIGNALED(status)) {
        last_.signaled = true;
        last_.term_signal = WTERMSIG(status);
      }
    }
    // w < 0 (ECHILD): already reaped elsewhere, nothing left to wait for.
    pid_ = -1;
  }

  pid_t pid_ = -1;
  WaitResult last_{};
};

}  // namespace farm

#endif  // FARM_PROCESS_HPP_
