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
 * @file inproc_transport.hpp
 * @brief Transport for workers running as threads of the dispatcher's process.
 *
 * Architecture:
 *   Dispatcher --Send(id)--> Mailbox[id] --Receive--> worker thread id
 *   worker thread --Send--> Inbox (WorkerId, batch | disconnect) --ReceiveAny--> Dispatcher
 *   all M+1 participants --Barrier--> one generation barrier
 *
 * The transport owns only queues; the caller owns the worker threads and
 * must keep the transport alive until every thread has been joined.
 *
 * Usage:
 * @code
 *   farm::InProcTransport transport(4);
 *   std::vector<std::thread> threads;
 *   for (uint32_t i = 0; i < 4; ++i) {
 *     threads.emplace_back([&, i] { RunWorker(transport.Worker(farm::WorkerId(i))); });
 *   }
 *   RunDispatcher(transport.Dispatcher());
 *   for (auto& t : threads) t.join();
 * @endcode
 */

#ifndef FARM_INPROC_TRANSPORT_HPP_
#define FARM_INPROC_TRANSPORT_HPP_

#include "farm/log.hpp"
#include "farm/messages.hpp"
#include "farm/transport.hpp"
#include "farm/vocabulary.hpp"

#include <cstdint>

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace farm {

class InProcTransport final {
 public:
  explicit InProcTransport(uint32_t worker_count)
      : worker_count_(worker_count), dispatcher_end_(*this) {
    mailboxes_.reserve(worker_count);
    worker_ends_.reserve(worker_count);
    for (uint32_t i = 0; i < worker_count; ++i) {
      mailboxes_.push_back(std::make_unique<Mailbox>());
      worker_ends_.push_back(std::make_unique<WorkerEnd>(*this, WorkerId(i)));
    }
  }

  InProcTransport(const InProcTransport&) = delete;
  InProcTransport& operator=(const InProcTransport&) = delete;

  uint32_t WorkerCount() const noexcept { return worker_count_; }

  DispatcherChannel& Dispatcher() noexcept { return dispatcher_end_; }

  WorkerChannel& Worker(WorkerId id) noexcept {
    FARM_ASSERT(id.value() < worker_count_);
    return *worker_ends_[id.value()];
  }

 private:
  // ======================== Queues ========================

  struct Mailbox {
    std::condition_variable cv;
    std::deque<WorkUnit> units;
    bool disconnected = false;  ///< worker called Close()
  };

  /// Dispatcher inbox entry; an empty `batch` with `disconnect` set reports a lost worker.
  struct Event {
    ResultBatch batch;
    bool disconnect;
  };

  // ======================== Dispatcher side ========================

  class DispatcherEnd final : public DispatcherChannel {
   public:
    explicit DispatcherEnd(InProcTransport& t) noexcept : t_(t) {}

    uint32_t WorkerCount() const noexcept override { return t_.worker_count_; }

    expected<void, FarmError> Send(WorkerId to, const WorkUnit& unit) override {
      if (to.value() >= t_.worker_count_) {
        return expected<void, FarmError>::error(FarmError::kProtocolViolation);
      }
      std::lock_guard<std::mutex> lk(t_.mtx_);
      if (t_.aborted_) return expected<void, FarmError>::error(FarmError::kAborted);
      Mailbox& box = *t_.mailboxes_[to.value()];
      if (box.disconnected) {
        return expected<void, FarmError>::error(FarmError::kTransportFailure);
      }
      box.units.push_back(unit);
      box.cv.notify_one();
      return expected<void, FarmError>::success();
    }

    expected<ResultBatch, FarmError> ReceiveAny() override {
      std::unique_lock<std::mutex> lk(t_.mtx_);
      t_.inbox_cv_.wait(lk, [this] { return t_.interrupted_ || t_.aborted_ || !t_.inbox_.empty(); });
      if (t_.interrupted_ || t_.aborted_) {
        return expected<ResultBatch, FarmError>::error(FarmError::kAborted);
      }
      Event ev = std::move(t_.inbox_.front());
      t_.inbox_.pop_front();
      if (ev.disconnect) {
        FARM_LOG_WARN("INPROC", "worker %u disconnected", ev.batch.producer.value());
        return expected<ResultBatch, FarmError>::error(FarmError::kTransportFailure);
      }
      return expected<ResultBatch, FarmError>::success(std::move(ev.batch));
    }

    expected<void, FarmError> Barrier() override { return t_.ArriveAndWait(); }

    void Abort() noexcept override {
      std::lock_guard<std::mutex> lk(t_.mtx_);
      if (t_.aborted_) return;
      t_.aborted_ = true;
      for (auto& box : t_.mailboxes_) box->cv.notify_all();
      t_.inbox_cv_.notify_all();
      t_.barrier_cv_.notify_all();
    }

    void Interrupt() noexcept override {
      std::lock_guard<std::mutex> lk(t_.mtx_);
      t_.interrupted_ = true;
      t_.inbox_cv_.notify_all();
      t_.barrier_cv_.notify_all();
    }

   private:
    InProcTransport& t_;
  };

  // ======================== Worker side ========================

  class WorkerEnd final : public WorkerChannel {
   public:
    WorkerEnd(InProcTransport& t, WorkerId self) noexcept : t_(t), self_(self) {}

    WorkerId Self() const noexcept override { return self_; }

    /// After Abort() every Receive() yields an abort unit, whatever is still queued.
    expected<WorkUnit, FarmError> Receive() override {
      Mailbox& box = *t_.mailboxes_[self_.value()];
      std::unique_lock<std::mutex> lk(t_.mtx_);
      if (box.disconnected) return expected<WorkUnit, FarmError>::error(FarmError::kTransportFailure);
      box.cv.wait(lk, [&] { return t_.aborted_ || !box.units.empty(); });
      if (t_.aborted_) return expected<WorkUnit, FarmError>::success(WorkUnit::Abort());
      WorkUnit unit = box.units.front();
      box.units.pop_front();
      return expected<WorkUnit, FarmError>::success(unit);
    }

    expected<void, FarmError> Send(ResultBatch&& batch) override {
      std::lock_guard<std::mutex> lk(t_.mtx_);
      if (t_.aborted_) return expected<void, FarmError>::error(FarmError::kAborted);
      if (t_.mailboxes_[self_.value()]->disconnected) {
        return expected<void, FarmError>::error(FarmError::kTransportFailure);
      }
      batch.producer = self_;
      t_.inbox_.push_back(Event{std::move(batch), false});
      t_.inbox_cv_.notify_one();
      return expected<void, FarmError>::success();
    }

    expected<void, FarmError> Barrier() override { return t_.ArriveAndWait(); }

    void Close() noexcept override {
      std::lock_guard<std::mutex> lk(t_.mtx_);
      Mailbox& box = *t_.mailboxes_[self_.value()];
      if (box.disconnected) return;
      box.disconnected = true;
      ResultBatch tomb;
      tomb.producer = self_;
      t_.inbox_.push_back(Event{std::move(tomb), true});
      t_.barrier_broken_ = true;
      t_.inbox_cv_.notify_all();
      t_.barrier_cv_.notify_all();
    }

   private:
    InProcTransport& t_;
    WorkerId self_;
  };

  // ======================== Barrier ========================

  /**
   * M + 1 parties. A disconnected worker breaks the barrier for good
   * (kTransportFailure); Abort() or Interrupt() release it with kAborted.
   */
  expected<void, FarmError> ArriveAndWait() {
    std::unique_lock<std::mutex> lk(mtx_);
    if (aborted_ || interrupted_) return expected<void, FarmError>::error(FarmError::kAborted);
    if (barrier_broken_) return expected<void, FarmError>::error(FarmError::kTransportFailure);

    const uint64_t gen = barrier_generation_;
    if (++barrier_arrived_ == worker_count_ + 1U) {
      barrier_arrived_ = 0;
      ++barrier_generation_;
      barrier_cv_.notify_all();
      return expected<void, FarmError>::success();
    }
    barrier_cv_.wait(lk, [&] {
      return barrier_generation_ != gen || aborted_ || interrupted_ || barrier_broken_;
    });
    if (barrier_generation_ != gen) return expected<void, FarmError>::success();
    return expected<void, FarmError>::error(barrier_broken_ ? FarmError::kTransportFailure
                                                            : FarmError::kAborted);
  }

  // ======================== Data members ========================

  const uint32_t worker_count_;

  std::mutex mtx_;
  std::vector<std::unique_ptr<Mailbox>> mailboxes_;
  std::deque<Event> inbox_;
  std::condition_variable inbox_cv_;

  std::condition_variable barrier_cv_;
  uint32_t barrier_arrived_ = 0;
  uint64_t barrier_generation_ = 0;
  bool barrier_broken_ = false;

  bool aborted_ = false;
  bool interrupted_ = false;

  DispatcherEnd dispatcher_end_;
  std::vector<std::unique_ptr<WorkerEnd>> worker_ends_;
};

}  // namespace farm

#endif  // FARM_INPROC_TRANSPORT_HPP_
