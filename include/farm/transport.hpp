/**
 * @file transport.hpp
 * @brief Message-passing seams between the dispatcher and its workers.
 *
 * A transport hands out one DispatcherChannel and one WorkerChannel per
 * worker. Participants share nothing but these channels. Implementations:
 *   - InProcTransport   (inproc_transport.hpp): worker threads, mailboxes.
 *   - ProcessTransport  (process_transport.hpp): forked workers, socket pairs.
 *
 * Every fallible call returns expected<..., FarmError>. A peer that becomes
 * unreachable surfaces as FarmError::kTransportFailure; a run torn down by
 * Abort() surfaces as FarmError::kAborted.
 */

#ifndef FARM_TRANSPORT_HPP_
#define FARM_TRANSPORT_HPP_

#include "farm/messages.hpp"
#include "farm/vocabulary.hpp"

#include <cstdint>

namespace farm {

// ============================================================================
// DispatcherChannel
// ============================================================================

class DispatcherChannel {
 public:
  virtual ~DispatcherChannel() = default;

  /// Workers are identified 0 .. WorkerCount() - 1.
  virtual uint32_t WorkerCount() const noexcept = 0;

  virtual expected<void, FarmError> Send(WorkerId to, const WorkUnit& unit) = 0;

  /// @brief Block until any worker delivers a batch. Arrival order is not defined.
  virtual expected<ResultBatch, FarmError> ReceiveAny() = 0;

  /// @brief Rendezvous with every worker after termination.
  virtual expected<void, FarmError> Barrier() = 0;

  /**
   * @brief Tear the run down: signal abort to every worker still reachable
   * and release any participant blocked in the transport. Idempotent.
   */
  virtual void Abort() noexcept = 0;

  /**
   * @brief Make a blocked (or the next) ReceiveAny()/Barrier() return
   * kAborted. Callable from any thread.
   */
  virtual void Interrupt() noexcept = 0;
};

// ============================================================================
// WorkerChannel
// ============================================================================

class WorkerChannel {
 public:
  virtual ~WorkerChannel() = default;

  virtual WorkerId Self() const noexcept = 0;

  virtual expected<WorkUnit, FarmError> Receive() = 0;

  virtual expected<void, FarmError> Send(ResultBatch&& batch) = 0;

  virtual expected<void, FarmError> Barrier() = 0;

  /// @brief Disconnect; the dispatcher observes this worker as unreachable.
  virtual void Close() noexcept = 0;
};

}  // namespace farm

#endif  // FARM_TRANSPORT_HPP_
