// Copyright (c) 2024 liudegui. MIT License.
//
// farm_random -- draws normally distributed numbers with a pool of workers
// and streams them into a text file, one value per line.
//
// Usage:
//   ./farm_random [--config farm.ini] [--mode thread|process] [--workers N]
//                 [--target N] [--batch N] [--mean X] [--seed S]
//                 [--output FILE] [--log-level debug|info|warn|error] [MEAN]
//
// Settings are layered: built-in defaults, then the config file, then flags.
// MEAN (or --mean) defaults to the current day of the month.
// Ctrl+C aborts the run; values already written stay in the file.
//
// farm components used:
//   - farm::Config (IniBackend)  -- optional settings file
//   - farm::FarmRunner           -- transport + workers + dispatcher
//   - farm::FileSink             -- output file
//   - farm::ShutdownManager      -- SIGINT/SIGTERM -> FarmRunner::Interrupt
//   - farm::log                  -- logging

#include "farm/log.hpp"
#include "farm/runner.hpp"
#include "farm/shutdown.hpp"
#include "farm/sink.hpp"

#include <cerrno>
#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <string>
#include <thread>

// ============================================================================
// Argument parsing
// ============================================================================

static void PrintUsage(const char* prog) {
  std::printf(
      "Usage: %s [options] [MEAN]\n"
      "\n"
      "  --config FILE       settings file (.ini, .json, .yaml)\n"
      "  --mode MODE         thread | process (default: process)\n"
      "  --workers N         worker count (default: hardware concurrency)\n"
      "  --target N          numbers to draw (default: %" PRIu64 ")\n"
      "  --batch N           numbers per job (default: %u)\n"
      "  --mean X            distribution mean (default: day of month)\n"
      "  --seed S            base seed, 0 = random (default: 0)\n"
      "  --output FILE       output file (default: random_<target>_nums.txt)\n"
      "  --log-level LEVEL   debug | info | warn | error\n"
      "  --help              show this help\n",
      prog, farm::FarmConfig::kDefaultTarget, farm::FarmConfig::kDefaultBatchSize);
}

/// Scan argv for "--config <path>" and return the path, or nullptr.
static const char* FindConfigArg(int argc, char* argv[]) {
  for (int i = 1; i < argc - 1; ++i) {
    if (std::strcmp(argv[i], "--config") == 0) return argv[i + 1];
  }
  return nullptr;
}

static bool ParseU64(const char* s, uint64_t& out) {
  if (s == nullptr || *s == '\0' || *s == '-') return false;
  char* end = nullptr;
  errno = 0;
  const unsigned long long v = std::strtoull(s, &end, 10);
  if (*end != '\0' || errno == ERANGE) return false;
  out = static_cast<uint64_t>(v);
  return true;
}

static bool ParseU32(const char* s, uint32_t& out) {
  uint64_t v = 0;
  if (!ParseU64(s, v) || v > UINT32_MAX) return false;
  out = static_cast<uint32_t>(v);
  return true;
}

static bool ParseDouble(const char* s, double& out) {
  if (s == nullptr || *s == '\0') return false;
  char* end = nullptr;
  const double v = std::strtod(s, &end);
  if (*end != '\0') return false;
  out = v;
  return true;
}

static uint32_t DayOfMonth() {
  const std::time_t now = std::time(nullptr);
  struct tm tm_buf;
  if (localtime_r(&now, &tm_buf) == nullptr) return 1U;
  return static_cast<uint32_t>(tm_buf.tm_mday);
}

/// @return 0 to run, 1 on a usage error, 2 after --help.
static int ParseFlags(int argc, char* argv[], farm::FarmConfig& cfg) {
  bool have_positional = false;
  for (int i = 1; i < argc; ++i) {
    const char* arg = argv[i];
    if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
      PrintUsage(argv[0]);
      return 2;
    }
    if (std::strncmp(arg, "--", 2) != 0) {
      if (have_positional || !ParseDouble(arg, cfg.mean)) {
        std::fprintf(stderr, "unexpected argument: %s\n", arg);
        return 1;
      }
      have_positional = true;
      continue;
    }
    if (i + 1 >= argc) {
      std::fprintf(stderr, "%s needs a value\n", arg);
      return 1;
    }
    const char* value = argv[++i];
    bool ok = true;
    if (std::strcmp(arg, "--config") == 0) {
      // loaded before flag parsing
    } else if (std::strcmp(arg, "--mode") == 0) {
      ok = farm::ParseRunMode(value, cfg.mode);
    } else if (std::strcmp(arg, "--workers") == 0) {
      ok = ParseU32(value, cfg.workers) && cfg.workers >= 1U;
    } else if (std::strcmp(arg, "--target") == 0) {
      ok = ParseU64(value, cfg.target);
    } else if (std::strcmp(arg, "--batch") == 0) {
      ok = ParseU32(value, cfg.batch_size) && cfg.batch_size >= 1U;
    } else if (std::strcmp(arg, "--mean") == 0) {
      ok = ParseDouble(value, cfg.mean);
    } else if (std::strcmp(arg, "--seed") == 0) {
      ok = ParseU64(value, cfg.seed);
    } else if (std::strcmp(arg, "--output") == 0) {
      cfg.output = value;
    } else if (std::strcmp(arg, "--log-level") == 0) {
      ok = farm::log::ParseLevel(value, cfg.log_level);
    } else {
      std::fprintf(stderr, "unknown option: %s\n", arg);
      return 1;
    }
    if (!ok) {
      std::fprintf(stderr, "bad value for %s: %s\n", arg, value);
      return 1;
    }
  }
  return 0;
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
  farm::log::Init();
  farm::log::SetLevel(farm::log::Level::kInfo);

  farm::FarmConfig cfg;
  const uint32_t hw = std::thread::hardware_concurrency();
  cfg.workers = (hw > 0U) ? hw : 1U;
  cfg.mean = static_cast<double>(DayOfMonth());

  const char* config_path = FindConfigArg(argc, argv);
  if (config_path != nullptr) {
    auto r = farm::LoadFarmConfig(config_path, cfg);
    if (!r.has_value()) {
      FARM_LOG_ERROR("CLI", "cannot load %s: %s", config_path, farm::ConfigErrorName(r.get_error()));
      return EXIT_FAILURE;
    }
  }

  const int rc = ParseFlags(argc, argv, cfg);
  if (rc == 2) return EXIT_SUCCESS;
  if (rc != 0) {
    PrintUsage(argv[0]);
    return EXIT_FAILURE;
  }
  farm::log::SetLevel(cfg.log_level);

  const std::string path = cfg.output.empty() ? farm::FileSink::DefaultPath(cfg.target) : cfg.output;
  farm::FileSink sink;
  if (!sink.Open(path.c_str()).has_value()) return EXIT_FAILURE;

  FARM_LOG_INFO("CLI", "Picking %" PRIu64 " numbers with mean %g into %s", cfg.target, cfg.mean,
                path.c_str());

  farm::FarmRunner runner(cfg, sink);

  farm::ShutdownManager shutdown;
  if (shutdown.IsValid()) {
    (void)shutdown.Register(
        [](void* ctx, int signo) {
          FARM_LOG_WARN("CLI", "signal %d, aborting", signo);
          static_cast<farm::FarmRunner*>(ctx)->Interrupt();
        },
        &runner);
    auto s = shutdown.InstallSignalHandlers();
    if (!s.has_value()) FARM_LOG_WARN("CLI", "signal handlers not installed");
  }
  std::thread watcher([&shutdown] { (void)shutdown.WaitForShutdown(); });

  auto result = runner.Run();

  shutdown.Dismiss();
  watcher.join();

  if (!result.has_value()) {
    FARM_LOG_ERROR("CLI", "run failed: %s (partial output kept in %s)",
                   farm::FarmErrorName(result.get_error()), path.c_str());
    (void)sink.Close();
    return EXIT_FAILURE;
  }

  FARM_LOG_INFO("CLI", "Got %" PRIu64 " numbers.", result.value().accounting.delivered);
  FARM_LOG_INFO("CLI", "Done. Closing file");
  if (!sink.Close().has_value()) {
    FARM_LOG_ERROR("CLI", "closing %s failed", path.c_str());
    return EXIT_FAILURE;
  }
  farm::log::Shutdown();
  return EXIT_SUCCESS;
}
