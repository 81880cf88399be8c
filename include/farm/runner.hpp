/**
 * @file runner.hpp
 * @brief One farm run end to end: settings, transport, workers, dispatcher.
 *
 * FarmConfig holds every run setting. LoadFarmConfig() fills it from a file:
 *
 *   [farm]
 *   target     = 1000064
 *   batch_size = 10000
 *   mean       = 18
 *   workers    = 8
 *   mode       = process      ; or thread
 *   seed       = 0            ; 0 = nondeterministic
 *   output     = random.txt   ; default random_<target>_nums.txt
 *
 *   [log]
 *   level      = info
 *
 * FarmRunner builds the transport the mode asks for, starts one Worker per
 * participant with its own NormalGenerator, and drives a Dispatcher into
 * the given sink.
 */

#ifndef FARM_RUNNER_HPP_
#define FARM_RUNNER_HPP_

#include "farm/config.hpp"
#include "farm/dispatcher.hpp"
#include "farm/generator.hpp"
#include "farm/inproc_transport.hpp"
#include "farm/log.hpp"
#include "farm/process_transport.hpp"
#include "farm/sink.hpp"
#include "farm/vocabulary.hpp"
#include "farm/wire.hpp"
#include "farm/worker.hpp"

#include <cstdint>
#include <cstring>

#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace farm {

// ============================================================================
// FarmConfig
// ============================================================================

enum class RunMode : uint8_t {
  kThread = 0,
  kProcess
};

inline const char* RunModeName(RunMode m) noexcept {
  return (m == RunMode::kThread) ? "thread" : "process";
}

inline bool ParseRunMode(const char* name, RunMode& out) noexcept {
  if (name == nullptr) return false;
  if (std::strcmp(name, "thread") == 0) {
    out = RunMode::kThread;
    return true;
  }
  if (std::strcmp(name, "process") == 0) {
    out = RunMode::kProcess;
    return true;
  }
  return false;
}

struct FarmConfig {
  static constexpr uint64_t kDefaultTarget = 1000064;
  static constexpr uint32_t kDefaultBatchSize = 10000;

  uint64_t target = kDefaultTarget;
  uint32_t batch_size = kDefaultBatchSize;
  double mean = 0.0;
  uint32_t workers = 1;
  RunMode mode = RunMode::kProcess;
  uint64_t seed = 0;
  std::string output;  ///< empty: FileSink::DefaultPath(target)
  log::Level log_level = log::Level::kInfo;
};

/**
 * @brief Overlay the keys present in @p path onto @p cfg.
 *
 * The format follows the extension (.ini/.conf, .json, .yaml/.yml); formats
 * not compiled in yield kFormatNotSupported. A key with an unusable value
 * yields kInvalidValue and leaves the remaining keys unapplied.
 */
inline expected<void, ConfigError> LoadFarmConfig(const char* path, FarmConfig& cfg) {
  Config<IniBackend, JsonBackend, YamlBackend> file;
  auto r = file.LoadFile(path);
  if (!r.has_value()) return r;

  auto invalid = [path](const char* key) {
    FARM_LOG_ERROR("CONFIG", "%s: bad value for %s", path, key);
    return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
  };

  if (file.HasKey("farm", "target")) {
    const int64_t v = file.GetInt64("farm", "target", -1);
    if (v < 0) return invalid("target");
    cfg.target = static_cast<uint64_t>(v);
  }
  if (file.HasKey("farm", "batch_size")) {
    const uint32_t v = file.GetUint32("farm", "batch_size", 0U);
    if (v == 0U) return invalid("batch_size");
    cfg.batch_size = v;
  }
  if (file.HasKey("farm", "workers")) {
    const uint32_t v = file.GetUint32("farm", "workers", 0U);
    if (v == 0U) return invalid("workers");
    cfg.workers = v;
  }
  if (file.HasKey("farm", "mean") && !file.TryGetDouble("farm", "mean", cfg.mean)) {
    return invalid("mean");
  }
  if (file.HasKey("farm", "seed")) {
    const int64_t v = file.GetInt64("farm", "seed", -1);
    if (v < 0) return invalid("seed");
    cfg.seed = static_cast<uint64_t>(v);
  }
  if (file.HasKey("farm", "mode") && !ParseRunMode(file.GetString("farm", "mode"), cfg.mode)) {
    return invalid("mode");
  }
  if (file.HasKey("farm", "output")) {
    cfg.output = file.GetString("farm", "output");
  }
  if (file.HasKey("log", "level") && !log::ParseLevel(file.GetString("log", "level"), cfg.log_level)) {
    return invalid("level");
  }
  return expected<void, ConfigError>::success();
}

/// @brief Run preconditions: batch_size >= 1, workers >= 1, batches fit one frame.
inline expected<void, FarmError> ValidateFarmConfig(const FarmConfig& cfg) noexcept {
  if (cfg.batch_size == 0U || cfg.workers == 0U) {
    return expected<void, FarmError>::error(FarmError::kInvalidArgument);
  }
  if (cfg.mode == RunMode::kProcess && cfg.batch_size > wire::kMaxBatchValues) {
    return expected<void, FarmError>::error(FarmError::kInvalidArgument);
  }
  return expected<void, FarmError>::success();
}

// ============================================================================
// FarmRunner
// ============================================================================

struct FarmOutcome {
  Accounting accounting;
  DispatcherStats stats;
};

class FarmRunner final {
 public:
  FarmRunner(const FarmConfig& cfg, Sink& sink) : cfg_(cfg), sink_(sink) {}

  FarmRunner(const FarmRunner&) = delete;
  FarmRunner& operator=(const FarmRunner&) = delete;

  expected<FarmOutcome, FarmError> Run() {
    auto v = ValidateFarmConfig(cfg_);
    if (!v.has_value()) {
      FARM_LOG_ERROR("RUNNER", "invalid settings: batch_size=%u workers=%u mode=%s",
                     cfg_.batch_size, cfg_.workers, RunModeName(cfg_.mode));
      return expected<FarmOutcome, FarmError>::error(v.get_error());
    }
    FARM_LOG_INFO("RUNNER", "%u %s workers, batches of %u", cfg_.workers, RunModeName(cfg_.mode),
                  cfg_.batch_size);
    return (cfg_.mode == RunMode::kThread) ? RunThreads() : RunProcesses();
  }

  /**
   * @brief Abort the run in progress, or the next one. Thread-safe; not
   * async-signal-safe (call it from a watcher thread, not a handler).
   */
  void Interrupt() noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    interrupted_ = true;
    if (active_ != nullptr) active_->Interrupt();
  }

 private:
  expected<FarmOutcome, FarmError> RunThreads() {
    InProcTransport transport(cfg_.workers);
    std::vector<std::thread> threads;
    threads.reserve(cfg_.workers);
    for (uint32_t i = 0; i < cfg_.workers; ++i) {
      threads.emplace_back([this, &transport, i] {
        NormalGenerator gen(cfg_.seed, WorkerId(i));
        Worker worker(transport.Worker(WorkerId(i)), gen);
        auto r = worker.Run();
        if (!r.has_value() && r.get_error() != FarmError::kAborted) {
          FARM_LOG_WARN("RUNNER", "worker %u ended with %s", i, FarmErrorName(r.get_error()));
        }
      });
    }

    FARM_SCOPE_EXIT(for (auto& t : threads) t.join());
    return Dispatch(transport.Dispatcher());
  }

  expected<FarmOutcome, FarmError> RunProcesses() {
    ProcessTransport transport(cfg_.workers);
    const uint64_t seed = cfg_.seed;
    auto worker_main = [seed](WorkerChannel& channel) -> int {
      NormalGenerator gen(seed, channel.Self());
      Worker worker(channel, gen);
      auto r = worker.Run();
      if (r.has_value()) return 0;
      return 1 + static_cast<int>(r.get_error());
    };
    auto s = transport.Start(worker_main);
    if (!s.has_value()) return expected<FarmOutcome, FarmError>::error(s.get_error());
    return Dispatch(transport.Dispatcher());
  }

  expected<FarmOutcome, FarmError> Dispatch(DispatcherChannel& channel) {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      active_ = &channel;
      if (interrupted_) channel.Interrupt();
    }
    Dispatcher dispatcher(channel, sink_);
    RunParams params;
    params.target = cfg_.target;
    params.batch_size = cfg_.batch_size;
    params.parameter = cfg_.mean;
    auto r = dispatcher.Run(params);
    {
      std::lock_guard<std::mutex> lk(mtx_);
      active_ = nullptr;
    }
    if (!r.has_value()) return expected<FarmOutcome, FarmError>::error(r.get_error());
    FarmOutcome out;
    out.accounting = r.value();
    out.stats = dispatcher.Stats();
    return expected<FarmOutcome, FarmError>::success(out);
  }

  const FarmConfig cfg_;
  Sink& sink_;

  std::mutex mtx_;
  DispatcherChannel* active_ = nullptr;
  bool interrupted_ = false;
};

}  // namespace farm

#endif  // FARM_RUNNER_HPP_
