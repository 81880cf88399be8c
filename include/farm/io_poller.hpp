/**
 * @file io_poller.hpp
 * @brief Level-triggered epoll wrapper for "wait until any of these fds is readable".
 *
 * Linux only. Level-triggered so that a frame left unread by one wait is
 * reported again by the next.
 */

#ifndef FARM_IO_POLLER_HPP_
#define FARM_IO_POLLER_HPP_

#include "farm/platform.hpp"
#include "farm/vocabulary.hpp"

#include <cerrno>
#include <cstdint>

#include <array>

#if defined(FARM_PLATFORM_LINUX)
#include <sys/epoll.h>
#include <unistd.h>
#else
#error "IoPoller requires Linux epoll"
#endif

namespace farm {

enum class PollerError : uint8_t {
  kCreateFailed = 0,
  kAddFailed,
  kRemoveFailed,
  kWaitFailed
};

/// Readiness bits reported per fd.
enum class IoEvent : uint8_t {
  kReadable = 0x01,
  kError = 0x02,
  kHangup = 0x04
};

inline bool HasEvent(uint8_t events, IoEvent e) noexcept {
  return (events & static_cast<uint8_t>(e)) != 0U;
}

struct PollResult {
  int32_t fd;
  uint8_t events;
};

#ifndef FARM_IO_POLLER_MAX_EVENTS
#define FARM_IO_POLLER_MAX_EVENTS 64U
#endif

// ============================================================================
// IoPoller
// ============================================================================

class IoPoller final {
 public:
  IoPoller() noexcept : epfd_(::epoll_create1(EPOLL_CLOEXEC)) {}

  ~IoPoller() {
    if (epfd_ >= 0) ::close(epfd_);
  }

  IoPoller(const IoPoller&) = delete;
  IoPoller& operator=(const IoPoller&) = delete;

  IoPoller(IoPoller&& other) noexcept : epfd_(other.epfd_), count_(0) { other.epfd_ = -1; }

  IoPoller& operator=(IoPoller&& other) noexcept {
    if (this != &other) {
      if (epfd_ >= 0) ::close(epfd_);
      epfd_ = other.epfd_;
      count_ = 0;
      other.epfd_ = -1;
    }
    return *this;
  }

  bool IsValid() const noexcept { return epfd_ >= 0; }

  /// @brief Watch @p fd for readability (errors and hangups are always reported).
  expected<void, PollerError> Watch(int32_t fd) noexcept {
    if (epfd_ < 0) return expected<void, PollerError>::error(PollerError::kCreateFailed);
    struct epoll_event ev {};
    ev.events = EPOLLIN | EPOLLRDHUP;
    ev.data.fd = fd;
    if (::epoll_ctl(epfd_, EPOLL_CTL_ADD, fd, &ev) != 0) {
      return expected<void, PollerError>::error(PollerError::kAddFailed);
    }
    return expected<void, PollerError>::success();
  }

  expected<void, PollerError> Unwatch(int32_t fd) noexcept {
    if (::epoll_ctl(epfd_, EPOLL_CTL_DEL, fd, nullptr) != 0) {
      return expected<void, PollerError>::error(PollerError::kRemoveFailed);
    }
    return expected<void, PollerError>::success();
  }

  /**
   * @brief Wait for readiness.
   * @param timeout_ms -1 blocks, 0 polls.
   * @return Number of entries now available through Results(). EINTR yields 0.
   */
  expected<uint32_t, PollerError> Wait(int32_t timeout_ms = -1) noexcept {
    struct epoll_event raw[FARM_IO_POLLER_MAX_EVENTS];
    const int n = ::epoll_wait(epfd_, raw, static_cast<int>(FARM_IO_POLLER_MAX_EVENTS), timeout_ms);
    if (n < 0) {
      count_ = 0;
      if (errno == EINTR) return expected<uint32_t, PollerError>::success(0U);
      return expected<uint32_t, PollerError>::error(PollerError::kWaitFailed);
    }
    count_ = static_cast<uint32_t>(n);
    for (uint32_t i = 0; i < count_; ++i) {
      results_[i].fd = raw[i].data.fd;
      results_[i].events = Translate(raw[i].events);
    }
    return expected<uint32_t, PollerError>::success(count_);
  }

  const PollResult* Results() const noexcept { return results_.data(); }
  uint32_t ResultCount() const noexcept { return count_; }

 private:
  static uint8_t Translate(uint32_t ep) noexcept {
    uint8_t ev = 0;
    if ((ep & EPOLLIN) != 0U) ev |= static_cast<uint8_t>(IoEvent::kReadable);
    if ((ep & EPOLLERR) != 0U) ev |= static_cast<uint8_t>(IoEvent::kError);
    if ((ep & (EPOLLHUP | EPOLLRDHUP)) != 0U) ev |= static_cast<uint8_t>(IoEvent::kHangup);
    return ev;
  }

  int32_t epfd_;
  std::array<PollResult, FARM_IO_POLLER_MAX_EVENTS> results_{};
  uint32_t count_ = 0;
};

}  // namespace farm

#endif  // FARM_IO_POLLER_HPP_
