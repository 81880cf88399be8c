/**
 * @file test_worker.cpp
 * @brief Tests for worker.hpp against a scripted WorkerChannel.
 */

#include "farm/worker.hpp"

#include <catch2/catch_test_macros.hpp>

#include <deque>
#include <utility>
#include <vector>

namespace {

/// Replays queued units and records what the worker sends.
class ScriptedChannel final : public farm::WorkerChannel {
 public:
  explicit ScriptedChannel(uint32_t self = 0U) : self_(self) {}

  void Push(const farm::WorkUnit& u) { units_.push_back(u); }

  farm::WorkerId Self() const noexcept override { return self_; }

  farm::expected<farm::WorkUnit, farm::FarmError> Receive() override {
    if (units_.empty()) {
      return farm::expected<farm::WorkUnit, farm::FarmError>::error(
          farm::FarmError::kTransportFailure);
    }
    farm::WorkUnit u = units_.front();
    units_.pop_front();
    return farm::expected<farm::WorkUnit, farm::FarmError>::success(u);
  }

  farm::expected<void, farm::FarmError> Send(farm::ResultBatch&& batch) override {
    sent.push_back(std::move(batch));
    return farm::expected<void, farm::FarmError>::success();
  }

  farm::expected<void, farm::FarmError> Barrier() override {
    ++barriers;
    return farm::expected<void, farm::FarmError>::success();
  }

  void Close() noexcept override { closed = true; }

  std::vector<farm::ResultBatch> sent;
  int barriers = 0;
  bool closed = false;

 private:
  farm::WorkerId self_;
  std::deque<farm::WorkUnit> units_;
};

farm::expected<void, farm::FarmError> Ramp(double p, uint32_t count, std::vector<double>& out) {
  out.resize(count);
  for (uint32_t i = 0; i < count; ++i) out[i] = p + static_cast<double>(i);
  return farm::expected<void, farm::FarmError>::success();
}

farm::expected<void, farm::FarmError> Broken(double, uint32_t, std::vector<double>&) {
  return farm::expected<void, farm::FarmError>::error(farm::FarmError::kGenerationFailure);
}

farm::expected<void, farm::FarmError> ShortBy1(double, uint32_t count, std::vector<double>& out) {
  out.assign(count - 1U, 0.0);
  return farm::expected<void, farm::FarmError>::success();
}

}  // namespace

// ============================================================================
// Normal lifecycle
// ============================================================================

TEST_CASE("Worker answers each job and stops at the sentinel", "[worker]") {
  ScriptedChannel ch(4U);
  ch.Push(farm::WorkUnit::Job(10.0, 3U));
  ch.Push(farm::WorkUnit::Job(20.0, 2U));
  ch.Push(farm::WorkUnit::Stop());

  farm::Worker worker(ch, &Ramp);
  REQUIRE(worker.State() == farm::WorkerState::kIdle);
  auto r = worker.Run();
  REQUIRE(r.has_value());
  REQUIRE(r.value().units == 2U);
  REQUIRE(r.value().values == 5U);
  REQUIRE(worker.State() == farm::WorkerState::kTerminated);

  REQUIRE(ch.sent.size() == 2U);
  REQUIRE(ch.sent[0].producer == farm::WorkerId(4U));
  REQUIRE(ch.sent[0].values == std::vector<double>{10.0, 11.0, 12.0});
  REQUIRE(ch.sent[1].values == std::vector<double>{20.0, 21.0});
  REQUIRE(ch.barriers == 1);
  REQUIRE_FALSE(ch.closed);
}

TEST_CASE("Worker stopped without work still meets the barrier", "[worker]") {
  ScriptedChannel ch;
  ch.Push(farm::WorkUnit::Stop());
  farm::Worker worker(ch, &Ramp);
  auto r = worker.Run();
  REQUIRE(r.has_value());
  REQUIRE(r.value().units == 0U);
  REQUIRE(ch.sent.empty());
  REQUIRE(ch.barriers == 1);
}

TEST_CASE("Worker ignores units queued after the sentinel", "[worker]") {
  ScriptedChannel ch;
  ch.Push(farm::WorkUnit::Stop());
  ch.Push(farm::WorkUnit::Job(1.0, 1U));
  farm::Worker worker(ch, &Ramp);
  REQUIRE(worker.Run().has_value());
  REQUIRE(ch.sent.empty());
}

// ============================================================================
// Abort and failures
// ============================================================================

TEST_CASE("Worker leaves on abort without rendezvous", "[worker]") {
  ScriptedChannel ch;
  ch.Push(farm::WorkUnit::Job(1.0, 1U));
  ch.Push(farm::WorkUnit::Abort());
  farm::Worker worker(ch, &Ramp);
  auto r = worker.Run();
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == farm::FarmError::kAborted);
  REQUIRE(ch.sent.size() == 1U);
  REQUIRE(ch.barriers == 0);
}

TEST_CASE("Worker rejects a job with zero count", "[worker]") {
  ScriptedChannel ch;
  farm::WorkUnit bad;
  bad.kind = farm::UnitKind::kJob;
  bad.count = 0U;
  ch.Push(bad);
  farm::Worker worker(ch, &Ramp);
  auto r = worker.Run();
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == farm::FarmError::kProtocolViolation);
  REQUIRE(ch.sent.empty());
}

TEST_CASE("Worker generation failure closes the channel", "[worker]") {
  SECTION("generator error") {
    ScriptedChannel ch;
    ch.Push(farm::WorkUnit::Job(1.0, 4U));
    farm::Worker worker(ch, &Broken);
    auto r = worker.Run();
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.get_error() == farm::FarmError::kGenerationFailure);
    REQUIRE(ch.closed);
    REQUIRE(ch.sent.empty());
  }

  SECTION("wrong number of values") {
    ScriptedChannel ch;
    ch.Push(farm::WorkUnit::Job(1.0, 4U));
    farm::Worker worker(ch, &ShortBy1);
    auto r = worker.Run();
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.get_error() == farm::FarmError::kGenerationFailure);
    REQUIRE(ch.closed);
  }
}

TEST_CASE("Worker propagates receive failure", "[worker]") {
  ScriptedChannel ch;  // empty script: Receive fails
  farm::Worker worker(ch, &Ramp);
  auto r = worker.Run();
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == farm::FarmError::kTransportFailure);
  REQUIRE(worker.State() == farm::WorkerState::kTerminated);
}

// ============================================================================
// Lifecycle table
// ============================================================================

TEST_CASE("WorkerState transitions", "[worker]") {
  using farm::IsLegalTransition;
  using S = farm::WorkerState;
  REQUIRE(IsLegalTransition(S::kIdle, S::kBusy));
  REQUIRE(IsLegalTransition(S::kBusy, S::kIdle));
  REQUIRE(IsLegalTransition(S::kIdle, S::kTerminated));
  REQUIRE_FALSE(IsLegalTransition(S::kBusy, S::kTerminated));
  REQUIRE_FALSE(IsLegalTransition(S::kTerminated, S::kIdle));
  REQUIRE_FALSE(IsLegalTransition(S::kTerminated, S::kTerminated));
  REQUIRE_FALSE(IsLegalTransition(S::kIdle, S::kIdle));
}
