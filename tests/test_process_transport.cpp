/**
 * @file test_process_transport.cpp
 * @brief Tests for process_transport.hpp with real forked workers.
 *
 * Child bodies never use REQUIRE: a failure there is reported through the
 * frames (or their absence) the parent observes.
 */

#include "farm/process_transport.hpp"
#include "farm/shutdown.hpp"

#include <catch2/catch_test_macros.hpp>

#include <signal.h>
#include <unistd.h>

#include <utility>
#include <vector>

namespace {

/// Answers every job with `count` copies of its parameter, then meets the barrier.
int EchoWorker(farm::WorkerChannel& ch) {
  for (;;) {
    auto u = ch.Receive();
    if (!u.has_value()) return 10;
    if (u.value().kind == farm::UnitKind::kAbort) return 11;
    if (u.value().IsSentinel()) return ch.Barrier().has_value() ? 0 : 12;
    farm::ResultBatch b;
    b.values.assign(u.value().count, u.value().parameter);
    if (!ch.Send(std::move(b)).has_value()) return 13;
  }
}

int BlockForever(farm::WorkerChannel&) {
  for (;;) ::pause();
}

/// Sleeps until a caught signal, then reports one value.
int PauseThenReport(farm::WorkerChannel& ch) {
  ::pause();
  farm::ResultBatch b;
  b.values.push_back(1.0);
  return ch.Send(std::move(b)).has_value() ? 0 : 13;
}

}  // namespace

// ============================================================================
// Start
// ============================================================================

TEST_CASE("ProcessTransport - Start preconditions", "[process_transport]") {
  auto main_fn = [](farm::WorkerChannel& ch) -> int { return EchoWorker(ch); };

  SECTION("zero workers") {
    farm::ProcessTransport t(0);
    auto r = t.Start(main_fn);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.get_error() == farm::FarmError::kInvalidArgument);
  }

  SECTION("started twice") {
    farm::ProcessTransport t(1);
    REQUIRE(t.Start(main_fn).has_value());
    REQUIRE(t.WorkerPid(farm::WorkerId(0U)) > 0);
    auto r = t.Start(main_fn);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.get_error() == farm::FarmError::kInvalidArgument);
    t.Dispatcher().Abort();
  }
}

// ============================================================================
// Full exchange
// ============================================================================

TEST_CASE("ProcessTransport - jobs, batches, stop and rendezvous", "[process_transport]") {
  constexpr uint32_t kWorkers = 3;
  farm::ProcessTransport t(kWorkers);
  auto main_fn = [](farm::WorkerChannel& ch) -> int { return EchoWorker(ch); };
  REQUIRE(t.Start(main_fn).has_value());
  farm::DispatcherChannel& d = t.Dispatcher();
  REQUIRE(d.WorkerCount() == kWorkers);

  for (uint32_t i = 0; i < kWorkers; ++i) {
    REQUIRE(d.Send(farm::WorkerId(i), farm::WorkUnit::Job(static_cast<double>(i), i + 1U)).has_value());
  }

  std::vector<bool> seen(kWorkers, false);
  for (uint32_t n = 0; n < kWorkers; ++n) {
    auto r = d.ReceiveAny();
    REQUIRE(r.has_value());
    const uint32_t id = r.value().producer.value();
    REQUIRE(id < kWorkers);
    REQUIRE_FALSE(seen[id]);
    seen[id] = true;
    REQUIRE(r.value().values.size() == id + 1U);
    REQUIRE(r.value().values[0] == static_cast<double>(id));
  }

  for (uint32_t i = 0; i < kWorkers; ++i) {
    REQUIRE(d.Send(farm::WorkerId(i), farm::WorkUnit::Stop()).has_value());
  }
  REQUIRE(d.Barrier().has_value());
  for (uint32_t i = 0; i < kWorkers; ++i) REQUIRE(t.WorkerPid(farm::WorkerId(i)) == -1);
}

// ============================================================================
// Failures
// ============================================================================

TEST_CASE("ProcessTransport - worker exit is a transport failure", "[process_transport]") {
  farm::ProcessTransport t(2);
  auto main_fn = [](farm::WorkerChannel& ch) -> int {
    if (ch.Self().value() == 1U) {
      ch.Close();
      return 3;
    }
    return EchoWorker(ch);
  };
  REQUIRE(t.Start(main_fn).has_value());

  auto r = t.Dispatcher().ReceiveAny();
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == farm::FarmError::kTransportFailure);

  auto s = t.Dispatcher().Send(farm::WorkerId(1U), farm::WorkUnit::Stop());
  REQUIRE_FALSE(s.has_value());
  REQUIRE(s.get_error() == farm::FarmError::kTransportFailure);

  t.Dispatcher().Abort();
  REQUIRE(t.WorkerPid(farm::WorkerId(0U)) == -1);
  REQUIRE(t.WorkerPid(farm::WorkerId(1U)) == -1);
}

TEST_CASE("ProcessTransport - rendezvous frame before stop is a protocol violation",
          "[process_transport]") {
  farm::ProcessTransport t(1);
  auto main_fn = [](farm::WorkerChannel& ch) -> int { return ch.Barrier().has_value() ? 0 : 1; };
  REQUIRE(t.Start(main_fn).has_value());

  auto r = t.Dispatcher().ReceiveAny();
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == farm::FarmError::kProtocolViolation);
  t.Dispatcher().Abort();
}

TEST_CASE("ProcessTransport - Abort reaches workers blocked in Receive", "[process_transport]") {
  farm::ProcessTransport t(2);
  auto main_fn = [](farm::WorkerChannel& ch) -> int { return EchoWorker(ch); };
  REQUIRE(t.Start(main_fn).has_value());

  t.Dispatcher().Abort();
  t.Dispatcher().Abort();
  REQUIRE(t.WorkerPid(farm::WorkerId(0U)) == -1);

  auto s = t.Dispatcher().Send(farm::WorkerId(0U), farm::WorkUnit::Stop());
  REQUIRE_FALSE(s.has_value());
  REQUIRE(s.get_error() == farm::FarmError::kAborted);
  auto b = t.Dispatcher().Barrier();
  REQUIRE_FALSE(b.has_value());
  REQUIRE(b.get_error() == farm::FarmError::kAborted);
}

TEST_CASE("ProcessTransport - unresponsive worker is killed", "[process_transport]") {
  farm::ProcessTransport t(1, 50U);
  auto main_fn = [](farm::WorkerChannel& ch) -> int { return BlockForever(ch); };
  REQUIRE(t.Start(main_fn).has_value());
  const pid_t pid = t.WorkerPid(farm::WorkerId(0U));
  REQUIRE(pid > 0);

  t.Dispatcher().Abort();
  REQUIRE(t.WorkerPid(farm::WorkerId(0U)) == -1);
  REQUIRE(::kill(pid, 0) == -1);
}

TEST_CASE("ProcessTransport - Interrupt makes ReceiveAny return", "[process_transport]") {
  farm::ProcessTransport t(1);
  auto main_fn = [](farm::WorkerChannel& ch) -> int { return EchoWorker(ch); };
  REQUIRE(t.Start(main_fn).has_value());

  t.Dispatcher().Interrupt();
  auto r = t.Dispatcher().ReceiveAny();
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == farm::FarmError::kAborted);
  t.Dispatcher().Abort();
}

TEST_CASE("ProcessTransport - SIGTERM ends a worker despite the parent's handler",
          "[process_transport]") {
  farm::ShutdownManager mgr;
  REQUIRE(mgr.InstallSignalHandlers().has_value());

  farm::ProcessTransport t(1);
  auto main_fn = [](farm::WorkerChannel& ch) -> int { return PauseThenReport(ch); };
  REQUIRE(t.Start(main_fn).has_value());
  const pid_t pid = t.WorkerPid(farm::WorkerId(0U));
  REQUIRE(pid > 0);

  REQUIRE(::kill(pid, SIGTERM) == 0);
  auto r = t.Dispatcher().ReceiveAny();
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == farm::FarmError::kTransportFailure);
  REQUIRE_FALSE(mgr.IsShutdownRequested());

  t.Dispatcher().Abort();
  REQUIRE(t.WorkerPid(farm::WorkerId(0U)) == -1);
}
