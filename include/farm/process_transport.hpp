/**
 * @file process_transport.hpp
 * @brief Transport for workers running as forked child processes.
 *
 * One AF_UNIX SOCK_STREAM socket pair per worker carries wire.hpp frames.
 * The dispatcher multiplexes the parent ends (plus a self-pipe used by
 * Interrupt()) with a level-triggered IoPoller.
 *
 * Rendezvous: every worker sends kExited after leaving its loop and blocks
 * until the dispatcher, having collected all of them, answers kRelease. The
 * children are then reaped with a bounded wait and SIGKILLed past it.
 *
 * Abort: a best-effort kAbort goes to every reachable child, then the parent
 * ends are shut down so a child blocked in send() fails with EPIPE. Children
 * are reaped the same bounded way.
 *
 * Usage:
 * @code
 *   farm::ProcessTransport transport(4);
 *   auto worker_main = [](farm::WorkerChannel& ch) -> int { return RunWorker(ch); };
 *   if (transport.Start(worker_main).has_value()) {
 *     RunDispatcher(transport.Dispatcher());
 *   }
 * @endcode
 */

#ifndef FARM_PROCESS_TRANSPORT_HPP_
#define FARM_PROCESS_TRANSPORT_HPP_

#include "farm/io_poller.hpp"
#include "farm/log.hpp"
#include "farm/messages.hpp"
#include "farm/process.hpp"
#include "farm/transport.hpp"
#include "farm/vocabulary.hpp"
#include "farm/wire.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdint>

#include <fcntl.h>
#include <memory>
#include <sys/socket.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace farm {

// ============================================================================
// SocketWorkerChannel - child side of one socket pair
// ============================================================================

class SocketWorkerChannel final : public WorkerChannel {
 public:
  SocketWorkerChannel(int fd, WorkerId self) noexcept : fd_(fd), self_(self) {}

  ~SocketWorkerChannel() override { Close(); }

  SocketWorkerChannel(const SocketWorkerChannel&) = delete;
  SocketWorkerChannel& operator=(const SocketWorkerChannel&) = delete;

  WorkerId Self() const noexcept override { return self_; }

  expected<WorkUnit, FarmError> Receive() override {
    if (fd_ < 0) return expected<WorkUnit, FarmError>::error(FarmError::kTransportFailure);
    wire::FrameHeader hdr{};
    auto r = wire::RecvFrame(fd_, hdr, payload_);
    if (!r.has_value()) return expected<WorkUnit, FarmError>::error(r.get_error());
    return wire::DecodeUnit(hdr, payload_);
  }

  expected<void, FarmError> Send(ResultBatch&& batch) override {
    if (fd_ < 0) return expected<void, FarmError>::error(FarmError::kTransportFailure);
    batch.producer = self_;
    return wire::SendBatch(fd_, batch);
  }

  /// kExited out, then wait for kRelease. kAbort while waiting is kAborted.
  expected<void, FarmError> Barrier() override {
    if (fd_ < 0) return expected<void, FarmError>::error(FarmError::kTransportFailure);
    auto r = wire::SendFrame(fd_, wire::FrameType::kExited, self_.value(), nullptr, 0U);
    if (!r.has_value()) return r;

    wire::FrameHeader hdr{};
    r = wire::RecvFrame(fd_, hdr, payload_);
    if (!r.has_value()) return r;
    switch (static_cast<wire::FrameType>(hdr.type)) {
      case wire::FrameType::kRelease:
        return expected<void, FarmError>::success();
      case wire::FrameType::kAbort:
        return expected<void, FarmError>::error(FarmError::kAborted);
      default:
        return expected<void, FarmError>::error(FarmError::kProtocolViolation);
    }
  }

  void Close() noexcept override {
    if (fd_ >= 0) {
      (void)::shutdown(fd_, SHUT_RDWR);
      (void)::close(fd_);
      fd_ = -1;
    }
  }

 private:
  int fd_;
  WorkerId self_;
  std::vector<uint8_t> payload_;
};

// ============================================================================
// ProcessTransport
// ============================================================================

class ProcessTransport final {
 public:
  /// Body of every child; its return value becomes the child's exit code.
  using WorkerMain = function_ref<int(WorkerChannel&)>;

  static constexpr uint32_t kDefaultReapTimeoutMs = 2000;

  explicit ProcessTransport(uint32_t worker_count,
                            uint32_t reap_timeout_ms = kDefaultReapTimeoutMs)
      : worker_count_(worker_count), reap_timeout_ms_(reap_timeout_ms), dispatcher_end_(*this) {}

  ~ProcessTransport() {
    Teardown(false);
    for (int& fd : wake_fd_) {
      if (fd >= 0) (void)::close(fd);
    }
  }

  ProcessTransport(const ProcessTransport&) = delete;
  ProcessTransport& operator=(const ProcessTransport&) = delete;

  uint32_t WorkerCount() const noexcept { return worker_count_; }

  DispatcherChannel& Dispatcher() noexcept { return dispatcher_end_; }

  /// Child pid of worker @p id, -1 once reaped.
  pid_t WorkerPid(WorkerId id) const noexcept {
    return (id.value() < peers_.size()) ? peers_[id.value()]->child.Pid() : -1;
  }

  /**
   * @brief Create the socket pairs and fork one child per worker.
   *
   * Each child keeps only its own socket end, ignores SIGINT (the parent
   * owns interruption), takes the default SIGTERM action in place of any
   * handler inherited from the parent and runs @p main. On failure every child already
   * forked is torn down.
   */
  expected<void, FarmError> Start(WorkerMain main) {
    if (!peers_.empty()) return expected<void, FarmError>::error(FarmError::kInvalidArgument);
    if (worker_count_ == 0U) return expected<void, FarmError>::error(FarmError::kInvalidArgument);

    if (::pipe2(wake_fd_, O_CLOEXEC | O_NONBLOCK) != 0) {
      FARM_LOG_ERROR("PROC", "pipe2 failed: errno=%d", errno);
      return expected<void, FarmError>::error(FarmError::kTransportFailure);
    }

    std::vector<int> child_ends(worker_count_, -1);
    peers_.reserve(worker_count_);
    for (uint32_t i = 0; i < worker_count_; ++i) {
      int sv[2];
      if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sv) != 0) {
        FARM_LOG_ERROR("PROC", "socketpair failed: errno=%d", errno);
        CloseAll(child_ends);
        Teardown(false);
        return expected<void, FarmError>::error(FarmError::kTransportFailure);
      }
      peers_.push_back(std::make_unique<Peer>());
      peers_.back()->fd = sv[0];
      child_ends[i] = sv[1];
    }

    for (uint32_t i = 0; i < worker_count_; ++i) {
      auto body = [&, i]() -> int {
        (void)std::signal(SIGINT, SIG_IGN);
        (void)std::signal(SIGPIPE, SIG_IGN);
        (void)std::signal(SIGTERM, SIG_DFL);
        for (uint32_t j = 0; j < worker_count_; ++j) {
          (void)::close(peers_[j]->fd);
          if (j != i) (void)::close(child_ends[j]);
        }
        (void)::close(wake_fd_[0]);
        (void)::close(wake_fd_[1]);
        SocketWorkerChannel channel(child_ends[i], WorkerId(i));
        return main(channel);
      };
      auto r = peers_[i]->child.Spawn(body);
      if (!r.has_value()) {
        FARM_LOG_ERROR("PROC", "fork of worker %u failed: errno=%d", i, errno);
        CloseAll(child_ends);
        Teardown(false);
        return expected<void, FarmError>::error(FarmError::kTransportFailure);
      }
      FARM_LOG_DEBUG("PROC", "worker %u started as pid %d", i,
                     static_cast<int>(peers_[i]->child.Pid()));
    }
    CloseAll(child_ends);

    bool watched = poller_.Watch(wake_fd_[0]).has_value();
    for (const auto& p : peers_) watched = watched && poller_.Watch(p->fd).has_value();
    if (!watched) {
      FARM_LOG_ERROR("PROC", "epoll registration failed");
      Teardown(false);
      return expected<void, FarmError>::error(FarmError::kTransportFailure);
    }
    return expected<void, FarmError>::success();
  }

 private:
  struct Peer {
    int fd = -1;
    ChildProcess child;
    bool exited = false;  ///< kExited received during the rendezvous
  };

  // ======================== Dispatcher side ========================

  class DispatcherEnd final : public DispatcherChannel {
   public:
    explicit DispatcherEnd(ProcessTransport& t) noexcept : t_(t) {}

    uint32_t WorkerCount() const noexcept override { return t_.worker_count_; }

    expected<void, FarmError> Send(WorkerId to, const WorkUnit& unit) override {
      if (t_.aborted_) return expected<void, FarmError>::error(FarmError::kAborted);
      if (to.value() >= t_.peers_.size()) {
        return expected<void, FarmError>::error(FarmError::kProtocolViolation);
      }
      const int fd = t_.peers_[to.value()]->fd;
      if (fd < 0) return expected<void, FarmError>::error(FarmError::kTransportFailure);
      return wire::SendUnit(fd, unit);
    }

    expected<ResultBatch, FarmError> ReceiveAny() override {
      uint32_t index = 0;
      wire::FrameHeader hdr{};
      auto r = t_.NextFrame(index, hdr);
      if (!r.has_value()) return expected<ResultBatch, FarmError>::error(r.get_error());

      if (static_cast<wire::FrameType>(hdr.type) != wire::FrameType::kBatch ||
          hdr.sender != index) {
        FARM_LOG_ERROR("PROC", "unexpected frame type=%u sender=%u on worker %u socket",
                       static_cast<unsigned>(hdr.type), hdr.sender, index);
        return expected<ResultBatch, FarmError>::error(FarmError::kProtocolViolation);
      }
      return wire::DecodeBatch(hdr, t_.payload_);
    }

    expected<void, FarmError> Barrier() override {
      if (t_.aborted_) return expected<void, FarmError>::error(FarmError::kAborted);
      uint32_t pending = 0;
      for (const auto& p : t_.peers_) {
        if (!p->exited) ++pending;
      }
      while (pending > 0U) {
        uint32_t index = 0;
        wire::FrameHeader hdr{};
        auto r = t_.NextFrame(index, hdr);
        if (!r.has_value()) return r;
        if (static_cast<wire::FrameType>(hdr.type) != wire::FrameType::kExited ||
            t_.peers_[index]->exited) {
          FARM_LOG_ERROR("PROC", "worker %u: unexpected frame type=%u in rendezvous", index,
                         static_cast<unsigned>(hdr.type));
          return expected<void, FarmError>::error(FarmError::kProtocolViolation);
        }
        t_.peers_[index]->exited = true;
        --pending;
      }

      for (uint32_t i = 0; i < t_.peers_.size(); ++i) {
        auto r = wire::SendFrame(t_.peers_[i]->fd, wire::FrameType::kRelease,
                                 wire::kDispatcherSender, nullptr, 0U);
        if (!r.has_value()) {
          FARM_LOG_ERROR("PROC", "release of worker %u failed", i);
          return r;
        }
      }
      t_.Teardown(false);
      return expected<void, FarmError>::success();
    }

    void Abort() noexcept override {
      if (t_.aborted_) return;
      t_.aborted_ = true;
      t_.Teardown(true);
    }

    void Interrupt() noexcept override {
      t_.interrupted_.store(true, std::memory_order_release);
      if (t_.wake_fd_[1] >= 0) {
        const uint8_t byte = 1;
        (void)::write(t_.wake_fd_[1], &byte, 1);
      }
    }

   private:
    ProcessTransport& t_;
  };

  // ======================== Helpers ========================

  /**
   * @brief Block until one worker socket yields a whole frame.
   *
   * A readable socket that hits EOF or a read error marks the worker as
   * lost (kTransportFailure). The wake pipe yields kAborted.
   */
  expected<void, FarmError> NextFrame(uint32_t& index, wire::FrameHeader& hdr) {
    for (;;) {
      if (interrupted_.load(std::memory_order_acquire) || aborted_) {
        return expected<void, FarmError>::error(FarmError::kAborted);
      }
      auto w = poller_.Wait(-1);
      if (!w.has_value()) {
        FARM_LOG_ERROR("PROC", "epoll_wait failed: errno=%d", errno);
        return expected<void, FarmError>::error(FarmError::kTransportFailure);
      }
      for (uint32_t k = 0; k < w.value(); ++k) {
        const PollResult& ev = poller_.Results()[k];
        if (ev.fd == wake_fd_[0]) continue;  // flag checked at loop top
        const uint32_t i = IndexOf(ev.fd);
        if (i >= peers_.size()) continue;

        auto r = wire::RecvFrame(ev.fd, hdr, payload_);
        if (!r.has_value()) {
          if (r.get_error() == FarmError::kTransportFailure) {
            FARM_LOG_ERROR("PROC", "worker %u (pid %d) is unreachable", i,
                           static_cast<int>(peers_[i]->child.Pid()));
            (void)poller_.Unwatch(ev.fd);
            (void)::close(peers_[i]->fd);
            peers_[i]->fd = -1;
          }
          return r;
        }
        index = i;
        return expected<void, FarmError>::success();
      }
    }
  }

  uint32_t IndexOf(int fd) const noexcept {
    for (uint32_t i = 0; i < peers_.size(); ++i) {
      if (peers_[i]->fd == fd) return i;
    }
    return static_cast<uint32_t>(peers_.size());
  }

  static void CloseAll(std::vector<int>& fds) noexcept {
    for (int& fd : fds) {
      if (fd >= 0) (void)::close(fd);
      fd = -1;
    }
  }

  /**
   * @brief Close every socket and reap every child, killing stragglers.
   * @param send_abort Send kAbort before closing.
   *
   * The wake pipe stays open until destruction: Interrupt() may still be
   * called from another thread.
   */
  void Teardown(bool send_abort) noexcept {
    for (auto& p : peers_) {
      if (p->fd < 0) continue;
      if (send_abort) (void)wire::TrySendControl(p->fd, wire::FrameType::kAbort,
                                                 wire::kDispatcherSender);
      (void)::shutdown(p->fd, SHUT_RDWR);
      (void)::close(p->fd);
      p->fd = -1;
    }
    for (uint32_t i = 0; i < peers_.size(); ++i) {
      ChildProcess& child = peers_[i]->child;
      if (child.Pid() <= 0) continue;
      const pid_t pid = child.Pid();
      WaitResult wr = child.Wait(reap_timeout_ms_);
      if (wr.timed_out) {
        FARM_LOG_WARN("PROC", "worker %u (pid %d) did not exit, killing", i, static_cast<int>(pid));
        wr = child.Kill();
      }
      if (wr.signaled) {
        FARM_LOG_DEBUG("PROC", "worker %u (pid %d) ended by signal %d", i, static_cast<int>(pid),
                       wr.term_signal);
      } else if (wr.exited && wr.exit_code != 0) {
        FARM_LOG_DEBUG("PROC", "worker %u (pid %d) exited with code %d", i,
                       static_cast<int>(pid), wr.exit_code);
      }
    }
  }

  // ======================== Data members ========================

  const uint32_t worker_count_;
  const uint32_t reap_timeout_ms_;

  std::vector<std::unique_ptr<Peer>> peers_;
  IoPoller poller_;
  int wake_fd_[2] = {-1, -1};
  std::vector<uint8_t> payload_;

  bool aborted_ = false;
  std::atomic<bool> interrupted_{false};

  DispatcherEnd dispatcher_end_;
};

}  // namespace farm

#endif  // FARM_PROCESS_TRANSPORT_HPP_
