/**
 * @file worker.hpp
 * @brief Worker loop: receive a unit, produce its values, report, repeat.
 *
 * State machine (own copy, mirrored by the dispatcher):
 *
 *   Idle --kJob--> Busy --batch sent--> Idle --kStop--> Terminated --Barrier()
 *
 * kAbort in any state ends the loop at once: no further sends and no
 * rendezvous.
 */

#ifndef FARM_WORKER_HPP_
#define FARM_WORKER_HPP_

#include "farm/generator.hpp"
#include "farm/log.hpp"
#include "farm/messages.hpp"
#include "farm/transport.hpp"
#include "farm/vocabulary.hpp"

#include <cstdint>

#include <utility>
#include <vector>

namespace farm {

struct WorkerReport {
  uint64_t units = 0;   ///< jobs completed
  uint64_t values = 0;  ///< values sent
};

class Worker final {
 public:
  Worker(WorkerChannel& channel, GenerateFn generate) noexcept
      : channel_(channel), generate_(generate) {}

  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;

  /**
   * @brief Run until a termination sentinel has been followed by the
   * rendezvous, or until failure.
   *
   * @return kAborted on an abort unit; kGenerationFailure (after closing the
   *         channel) when production fails; transport errors as received.
   */
  expected<WorkerReport, FarmError> Run() {
    const uint32_t id = channel_.Self().value();
    for (;;) {
      auto unit = channel_.Receive();
      if (!unit.has_value()) {
        FARM_LOG_ERROR("WORKER", "worker %u: receive failed: %s", id,
                       FarmErrorName(unit.get_error()));
        return Fail(unit.get_error());
      }

      switch (unit.value().kind) {
        case UnitKind::kStop: {
          auto t = Transition(WorkerState::kTerminated);
          if (!t.has_value()) return Fail(t.get_error());
          FARM_LOG_DEBUG("WORKER", "worker %u: stop after %llu units", id,
                         static_cast<unsigned long long>(report_.units));
          auto b = channel_.Barrier();
          if (!b.has_value()) return Fail(b.get_error());
          return expected<WorkerReport, FarmError>::success(report_);
        }
        case UnitKind::kAbort:
          FARM_LOG_DEBUG("WORKER", "worker %u: abort received", id);
          return Fail(FarmError::kAborted);
        case UnitKind::kJob: {
          auto r = Process(unit.value());
          if (!r.has_value()) return Fail(r.get_error());
          break;
        }
      }
    }
  }

  WorkerState State() const noexcept { return state_; }
  const WorkerReport& Report() const noexcept { return report_; }

 private:
  expected<void, FarmError> Process(const WorkUnit& unit) {
    if (unit.count == 0U) {
      FARM_LOG_ERROR("WORKER", "worker %u: job with zero count", channel_.Self().value());
      return expected<void, FarmError>::error(FarmError::kProtocolViolation);
    }
    auto t = Transition(WorkerState::kBusy);
    if (!t.has_value()) return t;

    std::vector<double> values;
    auto g = generate_(unit.parameter, unit.count, values);
    if (!g.has_value() || values.size() != unit.count) {
      FARM_LOG_ERROR("WORKER", "worker %u: generation of %u values failed, disconnecting",
                     channel_.Self().value(), unit.count);
      channel_.Close();
      return expected<void, FarmError>::error(FarmError::kGenerationFailure);
    }

    ResultBatch batch;
    batch.producer = channel_.Self();
    batch.values = std::move(values);
    auto s = channel_.Send(std::move(batch));
    if (!s.has_value()) return s;

    ++report_.units;
    report_.values += unit.count;
    return Transition(WorkerState::kIdle);
  }

  expected<void, FarmError> Transition(WorkerState to) noexcept {
    if (!IsLegalTransition(state_, to)) {
      FARM_LOG_ERROR("WORKER", "worker %u: illegal transition %s -> %s", channel_.Self().value(),
                     WorkerStateName(state_), WorkerStateName(to));
      return expected<void, FarmError>::error(FarmError::kProtocolViolation);
    }
    state_ = to;
    return expected<void, FarmError>::success();
  }

  expected<WorkerReport, FarmError> Fail(FarmError e) noexcept {
    state_ = WorkerState::kTerminated;
    return expected<WorkerReport, FarmError>::error(e);
  }

  WorkerChannel& channel_;
  GenerateFn generate_;
  WorkerState state_ = WorkerState::kIdle;
  WorkerReport report_{};
};

}  // namespace farm

#endif  // FARM_WORKER_HPP_
