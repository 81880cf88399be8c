/**
 * @file messages.hpp
 * @brief Messages exchanged between the dispatcher and its workers.
 */

#ifndef FARM_MESSAGES_HPP_
#define FARM_MESSAGES_HPP_

#include "farm/vocabulary.hpp"

#include <cstdint>

#include <vector>

namespace farm {

// ============================================================================
// WorkUnit
// ============================================================================

enum class UnitKind : uint8_t {
  kJob = 0,  ///< produce `count` values about `parameter`
  kStop,     ///< termination sentinel, count is always 0
  kAbort     ///< run aborted, leave without rendezvous
};

/**
 * @brief One unit of work, dispatcher -> worker.
 *
 * Built only through the factories so that kStop / kAbort always carry a zero
 * count and a job never does.
 */
struct WorkUnit {
  UnitKind kind = UnitKind::kStop;
  double parameter = 0.0;
  uint32_t count = 0;

  static WorkUnit Job(double parameter, uint32_t count) noexcept {
    FARM_ASSERT(count > 0U);
    return WorkUnit{UnitKind::kJob, parameter, count};
  }
  static WorkUnit Stop() noexcept { return WorkUnit{UnitKind::kStop, 0.0, 0U}; }
  static WorkUnit Abort() noexcept { return WorkUnit{UnitKind::kAbort, 0.0, 0U}; }

  bool IsSentinel() const noexcept { return kind == UnitKind::kStop; }
};

// ============================================================================
// ResultBatch
// ============================================================================

/// @brief Values produced for one WorkUnit, worker -> dispatcher.
struct ResultBatch {
  WorkerId producer;
  std::vector<double> values;
};

// ============================================================================
// WorkerState
// ============================================================================

/// Idle -> Busy -> Idle -> ... -> Terminated. Terminated is final.
enum class WorkerState : uint8_t {
  kIdle = 0,
  kBusy,
  kTerminated
};

inline const char* WorkerStateName(WorkerState s) noexcept {
  switch (s) {
    case WorkerState::kIdle:
      return "Idle";
    case WorkerState::kBusy:
      return "Busy";
    case WorkerState::kTerminated:
      return "Terminated";
  }
  return "Unknown";
}

/**
 * @brief Whether @p from -> @p to is a legal lifecycle step.
 *
 * Busy -> Terminated is not: a sentinel only ever reaches an idle worker.
 */
inline bool IsLegalTransition(WorkerState from, WorkerState to) noexcept {
  switch (from) {
    case WorkerState::kIdle:
      return to == WorkerState::kBusy || to == WorkerState::kTerminated;
    case WorkerState::kBusy:
      return to == WorkerState::kIdle;
    case WorkerState::kTerminated:
      return false;
  }
  return false;
}

}  // namespace farm

#endif  // FARM_MESSAGES_HPP_
