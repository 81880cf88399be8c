/**
 * @file dispatcher.hpp
 * @brief Coordinator of a dynamic task farm.
 *
 * Run() alternates two phases until `target` values have been delivered:
 *
 *   fill  : while a worker is idle and requested < target, send it a job of
 *           min(batch_size, target - requested) values.
 *   drain : block on ReceiveAny(); the producer becomes idle again and its
 *           values go to the sink.
 *
 * It then sends exactly one stop unit to every worker (all idle by then),
 * and meets them at the transport barrier.
 *
 * The dispatcher keeps one state per worker. A job can only go to an Idle
 * worker and a stop unit can only go to an Idle worker, which it moves to
 * Terminated in the same step, so no worker ever sees two stop units.
 *
 * Any failure (transport, protocol, sink, interrupt) aborts the run through
 * DispatcherChannel::Abort() and is returned as is.
 */

#ifndef FARM_DISPATCHER_HPP_
#define FARM_DISPATCHER_HPP_

#include "farm/log.hpp"
#include "farm/messages.hpp"
#include "farm/sink.hpp"
#include "farm/transport.hpp"
#include "farm/vocabulary.hpp"

#include <algorithm>
#include <cstdint>

#include <vector>

namespace farm {

struct RunParams {
  uint64_t target = 0;
  uint32_t batch_size = 0;
  double parameter = 0.0;
};

/// requested <= target always; delivered only grows.
struct Accounting {
  uint64_t requested = 0;
  uint64_t delivered = 0;
  uint64_t target = 0;
};

struct WorkerCounters {
  uint64_t batches = 0;
  uint64_t values = 0;
};

struct DispatcherStats {
  uint64_t batches_dispatched = 0;
  uint64_t batches_received = 0;
  uint64_t terminations_sent = 0;
  std::vector<WorkerCounters> per_worker;
};

class Dispatcher final {
 public:
  Dispatcher(DispatcherChannel& channel, Sink& sink) noexcept : channel_(channel), sink_(sink) {}

  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  /**
   * @brief Distribute @p params.target values over the channel's workers.
   * @return Final accounting, with delivered == target.
   */
  expected<Accounting, FarmError> Run(const RunParams& params) {
    const uint32_t n = channel_.WorkerCount();
    if (params.batch_size == 0U || n == 0U) {
      FARM_LOG_ERROR("DISPATCH", "invalid run: batch_size=%u workers=%u", params.batch_size, n);
      return expected<Accounting, FarmError>::error(FarmError::kInvalidArgument);
    }
    Reset(params, n);

    while (acct_.delivered < acct_.target || busy_ > 0U) {
      auto f = Fill(params);
      if (!f.has_value()) return Fail(f.get_error());

      if (busy_ == 0U) {
        // Nothing in flight yet delivered < target: every requested value
        // came back, so requested == target and delivered must match.
        FARM_LOG_ERROR("DISPATCH", "no job in flight with %llu of %llu values delivered",
                       static_cast<unsigned long long>(acct_.delivered),
                       static_cast<unsigned long long>(acct_.target));
        return Fail(FarmError::kProtocolViolation);
      }

      auto d = Drain();
      if (!d.has_value()) return Fail(d.get_error());
    }

    auto t = Terminate();
    if (!t.has_value()) return Fail(t.get_error());

    auto b = channel_.Barrier();
    if (!b.has_value()) {
      FARM_LOG_ERROR("DISPATCH", "rendezvous failed: %s", FarmErrorName(b.get_error()));
      return Fail(b.get_error());
    }

    LogStats();
    return expected<Accounting, FarmError>::success(acct_);
  }

  /// @brief Make a running (or the next) Run() fail with kAborted. Thread-safe.
  void Interrupt() noexcept { channel_.Interrupt(); }

  const DispatcherStats& Stats() const noexcept { return stats_; }
  const Accounting& Progress() const noexcept { return acct_; }

  WorkerState StateOf(WorkerId id) const noexcept {
    FARM_ASSERT(id.value() < states_.size());
    return states_[id.value()];
  }

 private:
  void Reset(const RunParams& params, uint32_t n) {
    acct_ = Accounting{};
    acct_.target = params.target;
    stats_ = DispatcherStats{};
    stats_.per_worker.assign(n, WorkerCounters{});
    states_.assign(n, WorkerState::kIdle);
    outstanding_.assign(n, 0U);
    busy_ = 0;
    // Reverse order so that worker 0 is handed the first job.
    idle_.clear();
    for (uint32_t i = n; i > 0U; --i) idle_.push_back(WorkerId(i - 1U));
  }

  expected<void, FarmError> Fill(const RunParams& params) {
    while (!idle_.empty() && acct_.requested < acct_.target) {
      const uint64_t remaining = acct_.target - acct_.requested;
      const auto count = static_cast<uint32_t>(
          std::min<uint64_t>(static_cast<uint64_t>(params.batch_size), remaining));
      const WorkerId w = idle_.back();
      idle_.pop_back();

      auto r = Assign(w, WorkUnit::Job(params.parameter, count));
      if (!r.has_value()) return r;
      outstanding_[w.value()] = count;
      ++busy_;
      acct_.requested += count;
      ++stats_.batches_dispatched;
    }
    return expected<void, FarmError>::success();
  }

  expected<void, FarmError> Drain() {
    auto r = channel_.ReceiveAny();
    if (!r.has_value()) {
      FARM_LOG_ERROR("DISPATCH", "receive failed: %s", FarmErrorName(r.get_error()));
      return expected<void, FarmError>::error(r.get_error());
    }
    const ResultBatch& batch = r.value();
    const uint32_t id = batch.producer.value();

    if (id >= states_.size() || states_[id] != WorkerState::kBusy) {
      FARM_LOG_ERROR("DISPATCH", "batch from worker %u which has no job in flight", id);
      return expected<void, FarmError>::error(FarmError::kProtocolViolation);
    }
    const auto size = static_cast<uint64_t>(batch.values.size());
    if (size != outstanding_[id]) {
      FARM_LOG_ERROR("DISPATCH", "worker %u sent %llu values for a job of %u", id,
                     static_cast<unsigned long long>(size), outstanding_[id]);
      return expected<void, FarmError>::error(FarmError::kProtocolViolation);
    }
    FARM_LOG_INFO("DISPATCH", "Worker %u sent me %u numbers", id, outstanding_[id]);

    states_[id] = WorkerState::kIdle;
    outstanding_[id] = 0U;
    --busy_;
    idle_.push_back(batch.producer);

    auto s = sink_.Append(batch.values.data(), static_cast<uint32_t>(size));
    if (!s.has_value()) {
      FARM_LOG_ERROR("DISPATCH", "sink rejected %llu values from worker %u",
                     static_cast<unsigned long long>(size), id);
      return s;
    }
    acct_.delivered += size;
    ++stats_.batches_received;
    ++stats_.per_worker[id].batches;
    stats_.per_worker[id].values += size;
    return expected<void, FarmError>::success();
  }

  /// Stop units go to Idle workers only; each one ends Terminated.
  expected<void, FarmError> Terminate() {
    for (uint32_t i = 0; i < states_.size(); ++i) {
      if (states_[i] != WorkerState::kIdle) continue;
      auto r = Assign(WorkerId(i), WorkUnit::Stop());
      if (!r.has_value()) return r;
      ++stats_.terminations_sent;
    }
    idle_.clear();
    return expected<void, FarmError>::success();
  }

  /// @brief Send @p unit to an Idle worker and apply the matching transition.
  expected<void, FarmError> Assign(WorkerId w, const WorkUnit& unit) {
    const WorkerState next = unit.IsSentinel() ? WorkerState::kTerminated : WorkerState::kBusy;
    if (!IsLegalTransition(states_[w.value()], next)) {
      FARM_LOG_ERROR("DISPATCH", "worker %u: illegal transition %s -> %s", w.value(),
                     WorkerStateName(states_[w.value()]), WorkerStateName(next));
      return expected<void, FarmError>::error(FarmError::kProtocolViolation);
    }
    auto r = channel_.Send(w, unit);
    if (!r.has_value()) {
      FARM_LOG_ERROR("DISPATCH", "send to worker %u failed: %s", w.value(),
                     FarmErrorName(r.get_error()));
      return r;
    }
    states_[w.value()] = next;
    return expected<void, FarmError>::success();
  }

  expected<Accounting, FarmError> Fail(FarmError e) noexcept {
    FARM_LOG_ERROR("DISPATCH", "run aborted (%s) after %llu of %llu values", FarmErrorName(e),
                   static_cast<unsigned long long>(acct_.delivered),
                   static_cast<unsigned long long>(acct_.target));
    channel_.Abort();
    return expected<Accounting, FarmError>::error(e);
  }

  void LogStats() const {
    FARM_LOG_DEBUG("DISPATCH", "%llu jobs sent, %llu batches received, %llu stops sent",
                   static_cast<unsigned long long>(stats_.batches_dispatched),
                   static_cast<unsigned long long>(stats_.batches_received),
                   static_cast<unsigned long long>(stats_.terminations_sent));
    for (uint32_t i = 0; i < stats_.per_worker.size(); ++i) {
      FARM_LOG_DEBUG("DISPATCH", "  worker %u: %llu batches, %llu values", i,
                     static_cast<unsigned long long>(stats_.per_worker[i].batches),
                     static_cast<unsigned long long>(stats_.per_worker[i].values));
    }
  }

  DispatcherChannel& channel_;
  Sink& sink_;

  Accounting acct_{};
  DispatcherStats stats_{};
  std::vector<WorkerState> states_;
  std::vector<uint32_t> outstanding_;
  std::vector<WorkerId> idle_;  ///< stack, most recently freed on top
  uint32_t busy_ = 0;
};

}  // namespace farm

#endif  // FARM_DISPATCHER_HPP_
